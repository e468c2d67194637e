// =============================================================================
// mas-segmenter - Array Element Structure Implementation
// =============================================================================

#include "masseg/model/array_structure.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "masseg/common/types.h"

namespace masseg::model {

namespace {

/// @brief Labels shared by every MAS-seq array element after its own adapter.
constexpr std::string_view kMasSeqElementBody[] = {"10x_Adapter", "random", "Poly_A",
                                                   "3p_Adapter"};

/// @brief MAS-seq elements are keyed by adapters A through P.
constexpr char kMasSeqFirstAdapter = 'A';
constexpr char kMasSeqLastAdapter = 'P';

/// @brief Adapter closing the final MAS-seq element.
constexpr std::string_view kMasSeqTrailingAdapter = "Q";

bool isLabelSeparator(char c) noexcept {
    return c == ',' || std::isspace(static_cast<unsigned char>(c)) != 0;
}

/// @brief Split one template line into labels.
ElementTemplate splitLabels(std::string_view line) {
    ElementTemplate labels;
    std::size_t pos = 0;
    while (pos < line.size()) {
        while (pos < line.size() && isLabelSeparator(line[pos])) {
            ++pos;
        }
        std::size_t end = pos;
        while (end < line.size() && !isLabelSeparator(line[end])) {
            ++end;
        }
        if (end > pos) {
            labels.emplace_back(line.substr(pos, end - pos));
        }
        pos = end;
    }
    return labels;
}

}  // namespace

Result<ArrayElementStructure> ArrayElementStructure::create(
    std::vector<ElementTemplate> elements) {
    if (auto valid = validate(elements); !valid) {
        return std::unexpected(valid.error());
    }
    return ArrayElementStructure(std::move(elements));
}

VoidResult ArrayElementStructure::validate(const std::vector<ElementTemplate>& elements) {
    if (elements.empty()) {
        return makeError(ErrorCode::kFormatError, "array structure defines no elements");
    }
    for (std::size_t i = 0; i < elements.size(); ++i) {
        if (elements[i].empty()) {
            return makeError(ErrorCode::kFormatError, "array element {} has no labels", i);
        }
        for (const auto& label : elements[i]) {
            if (label.empty()) {
                return makeError(ErrorCode::kFormatError, "array element {} has an empty label",
                                 i);
            }
            if (label.find_first_of("|,") != std::string::npos) {
                return makeError(ErrorCode::kFormatError,
                                 "label '{}' in array element {} contains a tag separator",
                                 label, i);
            }
        }
    }
    return makeVoidSuccess();
}

ArrayElementStructure ArrayElementStructure::masSeqDefault() {
    std::vector<ElementTemplate> elements;
    for (char adapter = kMasSeqFirstAdapter; adapter <= kMasSeqLastAdapter; ++adapter) {
        ElementTemplate element;
        element.emplace_back(1, adapter);
        for (auto label : kMasSeqElementBody) {
            element.emplace_back(label);
        }
        elements.push_back(std::move(element));
    }
    elements.back().emplace_back(kMasSeqTrailingAdapter);
    return ArrayElementStructure(std::move(elements));
}

Result<ArrayElementStructure> ArrayElementStructure::parse(std::string_view text) {
    std::vector<ElementTemplate> elements;
    std::size_t lineStart = 0;
    while (lineStart <= text.size()) {
        std::size_t lineEnd = text.find('\n', lineStart);
        if (lineEnd == std::string_view::npos) {
            lineEnd = text.size();
        }
        std::string_view line = text.substr(lineStart, lineEnd - lineStart);
        if (auto comment = line.find('#'); comment != std::string_view::npos) {
            line = line.substr(0, comment);
        }

        auto labels = splitLabels(line);
        if (!labels.empty()) {
            elements.push_back(std::move(labels));
        }
        lineStart = lineEnd + 1;
    }
    return create(std::move(elements));
}

Result<ArrayElementStructure> ArrayElementStructure::fromFile(
    const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return makeError(ErrorCode::kFileOpenFailed, "cannot open template file: {}",
                         path.string());
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        return makeError(ErrorCode::kIOError, "failed reading template file: {}", path.string());
    }

    auto parsed = parse(contents.str());
    if (!parsed) {
        return makeError(parsed.error().code(), "{}: {}", path.string(),
                         parsed.error().message());
    }
    return parsed;
}

std::vector<DelimiterWindow> ArrayElementStructure::simpleDelimiters() const {
    std::vector<DelimiterWindow> windows;

    const auto& first = elements_.front();
    const std::size_t tail = std::min(kSimpleDelimiterWidth, first.size());
    windows.emplace_back(first.end() - static_cast<std::ptrdiff_t>(tail), first.end());

    for (std::size_t i = 1; i < elements_.size(); ++i) {
        const auto& element = elements_[i];
        const std::size_t head = std::min(kSimpleDelimiterWidth, element.size());
        if (i == 1) {
            windows.front().insert(windows.front().end(), element.begin(),
                                   element.begin() + static_cast<std::ptrdiff_t>(head));
        } else {
            windows.emplace_back(element.begin(),
                                 element.begin() + static_cast<std::ptrdiff_t>(head));
        }
    }
    return windows;
}

std::string ArrayElementStructure::describe() const {
    std::vector<std::string> rendered;
    rendered.reserve(elements_.size());
    for (const auto& element : elements_) {
        rendered.push_back(fmt::format("{}", fmt::join(element, ",")));
    }
    return fmt::format("{}", fmt::join(rendered, " | "));
}

}  // namespace masseg::model
