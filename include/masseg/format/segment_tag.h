// =============================================================================
// mas-segmenter - Segment Annotation Tag Codec
// =============================================================================
// Decodes and encodes the per-read segment annotation stored in a BAM aux
// tag (default "SG", type Z).
//
// Grammar:
//   annotation := token ( SEP token )*
//   SEP        := '|' | ','
//   token      := label ':' start '-' end
//   start, end := non-negative decimal integers, start <= end
//
// The label is everything before the last ':' of a token. Encoding always
// joins tokens with '|', so decode(encode(x)) == x.
// =============================================================================

#ifndef MASSEG_FORMAT_SEGMENT_TAG_H
#define MASSEG_FORMAT_SEGMENT_TAG_H

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <htslib/sam.h>

#include "masseg/common/error.h"
#include "masseg/common/types.h"

namespace masseg::format {

/// @brief Separator written between encoded segment tokens.
inline constexpr char kSegmentSeparator = '|';

/// @brief A labeled, inclusive, 0-based sub-range of a read's sequence.
struct Segment {
    /// @brief Segment label assigned by the annotation model.
    std::string name;

    /// @brief First base of the segment (inclusive).
    Coordinate start = 0;

    /// @brief Last base of the segment (inclusive).
    Coordinate end = 0;

    /// @brief Encode as a "label:start-end" token.
    [[nodiscard]] std::string toTag() const;

    friend bool operator==(const Segment&, const Segment&) = default;
};

/// @brief Ordered segments of one read.
using SegmentList = std::vector<Segment>;

/// @brief Decode one "label:start-end" token.
/// @param token Token without separators; the last ':' splits label and range.
/// @return FormatError naming the token when it does not match the grammar.
[[nodiscard]] Result<Segment> decodeSegmentToken(std::string_view token);

/// @brief Decode a full annotation value.
/// @param value Tokens separated by '|' or ','.
/// @return The segments in tag order, or the FormatError of the first
///         malformed token.
/// @note An empty value decodes to an empty list.
[[nodiscard]] Result<SegmentList> decodeSegments(std::string_view value);

/// @brief Encode segments as a '|'-joined annotation value.
/// @param segments Segments in output order.
/// @return The tag value; empty for an empty list.
[[nodiscard]] std::string encodeSegments(std::span<const Segment> segments);

/// @brief Read and decode the annotation tag of a BAM record.
/// @param record Source record.
/// @param tag Two-character aux tag name.
/// @return PreconditionError if the tag is absent, FormatError if it is not
///         of type Z or fails to decode.
[[nodiscard]] Result<SegmentList> segmentsFromRecord(const bam1_t* record, std::string_view tag);

/// @brief Select the segments starting inside [segStart, segEnd].
/// @param segments Segments of the source read.
/// @param segStart Inclusive lower bound on a segment's start.
/// @param segEnd Inclusive upper bound on a segment's start.
/// @return Matching segments with their source coordinates unchanged.
[[nodiscard]] SegmentList filterSegments(std::span<const Segment> segments, Coordinate segStart,
                                         Coordinate segEnd);

}  // namespace masseg::format

#endif  // MASSEG_FORMAT_SEGMENT_TAG_H
