// =============================================================================
// mas-segmenter - Delimiter Matcher
// =============================================================================
// Locates array elements inside a read from its segment list.
//
// Two policies are provided:
// - SimpleDelimiterMatcher: matches only the short label windows between
//   elements and slices the read at every window found. Interior content
//   of an element is not inspected.
// - BoundedRegionMatcher: matches every element template in full, tolerating
//   missing labels at a lower score. A template is reported only when its
//   last label has been reached.
//
// Both matchers are pure functions of (template, segments, read length);
// every call builds its own match state.
// =============================================================================

#ifndef MASSEG_ALGO_DELIMITER_MATCHER_H
#define MASSEG_ALGO_DELIMITER_MATCHER_H

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "masseg/common/types.h"
#include "masseg/format/segment_tag.h"
#include "masseg/model/array_structure.h"

namespace masseg::algo {

// =============================================================================
// Match Output
// =============================================================================

/// @brief One array element located inside a read.
struct ElementSpan {
    /// @brief First emitted base (inclusive, delimiter-adjusted).
    Coordinate start = 0;

    /// @brief Last emitted base (inclusive, delimiter-adjusted).
    Coordinate end = 0;

    /// @brief Lower bound used to select the element's segments.
    Coordinate segStart = 0;

    /// @brief Upper bound used to select the element's segments.
    Coordinate segEnd = 0;

    /// @brief Name of the delimiter preceding the element.
    std::string prevDelimiter;

    /// @brief Name of the delimiter closing the element.
    std::string delimiter;

    /// @brief Match score (bounded-region mode only, 0 otherwise).
    MatchScore score = 0;

    /// @brief Number of emitted bases.
    [[nodiscard]] Coordinate length() const noexcept { return end - start + 1; }

    /// @brief True when the span covers no bases.
    [[nodiscard]] bool isEmpty() const noexcept { return start > end; }

    friend bool operator==(const ElementSpan&, const ElementSpan&) = default;
};

/// @brief Result of matching one read.
struct MatchResult {
    /// @brief Boundaries found (simple) or templates completed (bounded).
    std::size_t count = 0;

    /// @brief Non-empty element spans, in read order.
    std::vector<ElementSpan> elements;
};

// =============================================================================
// Matcher Interface
// =============================================================================

/// @brief Interface for delimiter matching policies.
class IDelimiterMatcher {
public:
    virtual ~IDelimiterMatcher() = default;

    /// @brief Locate array elements in one read.
    /// @param segments The read's segments, ordered by position.
    /// @param readLength Length of the read's sequence.
    [[nodiscard]] virtual MatchResult match(std::span<const format::Segment> segments,
                                            Coordinate readLength) const = 0;

    /// @brief The policy this matcher implements.
    [[nodiscard]] virtual SplitMode mode() const noexcept = 0;
};

// =============================================================================
// Simple Mode
// =============================================================================

/// @brief Splits a read at every delimiter window matched contiguously.
///
/// Each window keeps its own counter over a single scan of the segments.
/// A mismatch resets the window without re-testing the mismatching segment
/// against the window's first label. A completed window is frozen.
/// Boundaries are applied in order of their start segment. The returned
/// count is the number of boundaries; the read is cut into count + 1 pieces,
/// of which only non-empty ones are emitted.
class SimpleDelimiterMatcher final : public IDelimiterMatcher {
public:
    /// @brief Build windows from an array structure.
    SimpleDelimiterMatcher(const model::ArrayElementStructure& structure, bool keepDelimiters);

    /// @brief Use explicit delimiter windows.
    SimpleDelimiterMatcher(std::vector<model::DelimiterWindow> windows, bool keepDelimiters);

    [[nodiscard]] MatchResult match(std::span<const format::Segment> segments,
                                    Coordinate readLength) const override;

    [[nodiscard]] SplitMode mode() const noexcept override { return SplitMode::kSimple; }

private:
    std::vector<model::DelimiterWindow> windows_;
    std::vector<std::string> windowNames_;
    bool keepDelimiters_;
};

// =============================================================================
// Bounded-Region Mode
// =============================================================================

/// @brief Matches each element template in full with skip tolerance.
///
/// Per segment and per incomplete template: the next expected label scores
/// kExactMatchScore. With a match in progress, a label found further ahead
/// in the template jumps over the missing labels and scores kIndelMatchScore.
/// Anything else discards the template's progress. A template completes
/// when all its positions are consumed and is then frozen.
class BoundedRegionMatcher final : public IDelimiterMatcher {
public:
    BoundedRegionMatcher(model::ArrayElementStructure structure, bool keepDelimiters);

    [[nodiscard]] MatchResult match(std::span<const format::Segment> segments,
                                    Coordinate readLength) const override;

    [[nodiscard]] SplitMode mode() const noexcept override { return SplitMode::kBounded; }

private:
    model::ArrayElementStructure structure_;
    bool keepDelimiters_;
};

// =============================================================================
// Factory
// =============================================================================

/// @brief Create the matcher for a split mode.
[[nodiscard]] std::unique_ptr<IDelimiterMatcher> createDelimiterMatcher(
    SplitMode mode, const model::ArrayElementStructure& structure, bool keepDelimiters);

}  // namespace masseg::algo

#endif  // MASSEG_ALGO_DELIMITER_MATCHER_H
