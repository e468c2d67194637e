// =============================================================================
// mas-segmenter - Array Element Structure
// =============================================================================
// The structural template a read is split against: an ordered list of array
// elements, each an ordered list of the segment labels expected inside it.
//
// The template is an immutable value passed explicitly to both matchers.
// The built-in default describes the 16-element MAS-seq array; a template
// may also be loaded from a text file:
//
//   # one element per line, labels separated by commas and/or whitespace
//   A, 10x_Adapter, random, Poly_A, 3p_Adapter
//   B, 10x_Adapter, random, Poly_A, 3p_Adapter
// =============================================================================

#ifndef MASSEG_MODEL_ARRAY_STRUCTURE_H
#define MASSEG_MODEL_ARRAY_STRUCTURE_H

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "masseg/common/error.h"

namespace masseg::model {

/// @brief Ordered segment labels expected inside one array element.
using ElementTemplate = std::vector<std::string>;

/// @brief Ordered labels of one simple-mode delimiter window.
using DelimiterWindow = std::vector<std::string>;

/// @brief Immutable array element structure.
class ArrayElementStructure {
public:
    /// @brief Create a validated structure.
    /// @param elements Element templates in array order.
    /// @return FormatError if there are no elements, an element is empty,
    ///         or a label is empty or contains a tag separator ('|' or ',').
    [[nodiscard]] static Result<ArrayElementStructure> create(
        std::vector<ElementTemplate> elements);

    /// @brief The built-in 16-element MAS-seq structure.
    [[nodiscard]] static ArrayElementStructure masSeqDefault();

    /// @brief Parse a structure from template file text.
    /// @param text One element per line, labels separated by commas and/or
    ///        whitespace; '#' starts a comment.
    /// @return FormatError under the same rules as create().
    [[nodiscard]] static Result<ArrayElementStructure> parse(std::string_view text);

    /// @brief Load a structure from a template file.
    /// @param path Template file, in the format accepted by parse().
    /// @return IOError if the file cannot be read, FormatError if it is malformed.
    [[nodiscard]] static Result<ArrayElementStructure> fromFile(const std::filesystem::path& path);

    /// @brief Validate a raw element list.
    [[nodiscard]] static VoidResult validate(const std::vector<ElementTemplate>& elements);

    /// @brief Number of element templates.
    [[nodiscard]] std::size_t size() const noexcept { return elements_.size(); }

    /// @brief All element templates in order.
    [[nodiscard]] const std::vector<ElementTemplate>& elements() const noexcept {
        return elements_;
    }

    /// @brief Element template at index.
    [[nodiscard]] const ElementTemplate& element(std::size_t index) const {
        return elements_.at(index);
    }

    /// @brief Build the simple-mode delimiter windows.
    /// @note Window 0 is the last two labels of element 0 followed by the
    ///       first two labels of element 1. Window k (k >= 1) is the first
    ///       two labels of element k + 1. Elements shorter than two labels
    ///       contribute all their labels.
    [[nodiscard]] std::vector<DelimiterWindow> simpleDelimiters() const;

    /// @brief One-line rendering for log output ("A,B,C | D,E").
    [[nodiscard]] std::string describe() const;

    friend bool operator==(const ArrayElementStructure&, const ArrayElementStructure&) = default;

private:
    explicit ArrayElementStructure(std::vector<ElementTemplate> elements)
        : elements_(std::move(elements)) {}

    std::vector<ElementTemplate> elements_;
};

}  // namespace masseg::model

#endif  // MASSEG_MODEL_ARRAY_STRUCTURE_H
