// =============================================================================
// mas-segmenter - Segment Annotation Tag Codec Implementation
// =============================================================================

#include "masseg/format/segment_tag.h"

#include <charconv>

#include <fmt/format.h>

namespace masseg::format {

namespace {

bool isSegmentSeparator(char c) noexcept {
    return c == '|' || c == ',';
}

/// @brief Parse a non-negative decimal coordinate spanning the whole input.
bool parseCoordinate(std::string_view text, Coordinate& out) noexcept {
    if (text.empty()) {
        return false;
    }
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last && out >= 0;
}

}  // namespace

std::string Segment::toTag() const {
    return fmt::format("{}:{}-{}", name, start, end);
}

Result<Segment> decodeSegmentToken(std::string_view token) {
    const auto colon = token.rfind(':');
    if (colon == std::string_view::npos || colon == 0) {
        return makeError(ErrorCode::kFormatError,
                         "malformed segment token '{}': expected label:start-end", token);
    }

    const std::string_view range = token.substr(colon + 1);
    const auto dash = range.find('-');
    if (dash == std::string_view::npos) {
        return makeError(ErrorCode::kFormatError, "malformed segment token '{}': missing range",
                         token);
    }

    Segment segment;
    segment.name = std::string(token.substr(0, colon));
    if (!parseCoordinate(range.substr(0, dash), segment.start) ||
        !parseCoordinate(range.substr(dash + 1), segment.end)) {
        return makeError(ErrorCode::kFormatError,
                         "malformed segment token '{}': invalid coordinates", token);
    }
    if (segment.start > segment.end) {
        return makeError(ErrorCode::kFormatError, "malformed segment token '{}': start after end",
                         token);
    }
    return segment;
}

Result<SegmentList> decodeSegments(std::string_view value) {
    SegmentList segments;
    if (value.empty()) {
        return segments;
    }

    std::size_t pos = 0;
    while (true) {
        std::size_t next = pos;
        while (next < value.size() && !isSegmentSeparator(value[next])) {
            ++next;
        }

        auto segment = decodeSegmentToken(value.substr(pos, next - pos));
        if (!segment) {
            return std::unexpected(segment.error());
        }
        segments.push_back(std::move(*segment));

        if (next == value.size()) {
            break;
        }
        pos = next + 1;
    }
    return segments;
}

std::string encodeSegments(std::span<const Segment> segments) {
    std::string encoded;
    for (const auto& segment : segments) {
        if (!encoded.empty()) {
            encoded.push_back(kSegmentSeparator);
        }
        encoded += segment.toTag();
    }
    return encoded;
}

Result<SegmentList> segmentsFromRecord(const bam1_t* record, std::string_view tag) {
    if (tag.size() != 2) {
        return makeError(ErrorCode::kInvalidArgument, "aux tag name must be two characters: '{}'",
                         tag);
    }
    const char tagName[3] = {tag[0], tag[1], '\0'};

    uint8_t* aux = bam_aux_get(record, tagName);
    if (aux == nullptr) {
        return makeError(ErrorCode::kMissingAnnotation, "read {} has no {} segment annotation",
                         bam_get_qname(record), tag);
    }

    const char* value = bam_aux2Z(aux);
    if (value == nullptr) {
        return makeError(ErrorCode::kFormatError, "{} tag of read {} is not a string (type {})",
                         tag, bam_get_qname(record), static_cast<char>(*aux));
    }

    auto segments = decodeSegments(value);
    if (!segments) {
        return makeError(ErrorCode::kFormatError, "read {}: {}", bam_get_qname(record),
                         segments.error().message());
    }
    return segments;
}

SegmentList filterSegments(std::span<const Segment> segments, Coordinate segStart,
                           Coordinate segEnd) {
    SegmentList filtered;
    for (const auto& segment : segments) {
        if (segStart <= segment.start && segment.start <= segEnd) {
            filtered.push_back(segment);
        }
    }
    return filtered;
}

}  // namespace masseg::format
