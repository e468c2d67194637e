// =============================================================================
// mas-segmenter - Common Type Definitions
// =============================================================================
// Core type definitions for the mas-segmenter library.
//
// This module defines:
// - ReadIndex, Coordinate: Type aliases for read counters and base offsets
// - SplitMode: Enum selecting the delimiter matching policy
// - Segmentation constants (scores, tag name, delimiter names)
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef MASSEG_COMMON_TYPES_H
#define MASSEG_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace masseg {

// =============================================================================
// Version
// =============================================================================

/// @brief Program name, used in the @PG header line.
inline constexpr std::string_view kProgramName = "mas-segmenter";

/// @brief Program version string.
inline constexpr std::string_view kVersion = "0.1.0";

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief 0-based index of a read in the input stream.
using ReadIndex = std::uint64_t;

/// @brief 0-based inclusive base offset within a read's sequence.
/// @note Signed: a dropped delimiter at offset 0 yields an end coordinate of -1.
using Coordinate = std::int64_t;

/// @brief Match score accumulated by the bounded-region matcher.
using MatchScore = std::int32_t;

// =============================================================================
// Constants
// =============================================================================

/// @brief Default BAM aux tag holding the segment annotation.
inline constexpr std::string_view kDefaultSegmentsTag = "SG";

/// @brief Score awarded when a segment matches the next expected label.
inline constexpr MatchScore kExactMatchScore = 2;

/// @brief Score awarded when a segment matches after skipping missing labels.
inline constexpr MatchScore kIndelMatchScore = 1;

/// @brief Number of labels taken from each side of an element boundary in simple mode.
inline constexpr std::size_t kSimpleDelimiterWidth = 2;

/// @brief Previous-delimiter name of the first element in simple mode.
inline constexpr std::string_view kStartDelimiterName = "START";

/// @brief Delimiter name of the trailing remainder element in simple mode.
inline constexpr std::string_view kEndDelimiterName = "END";

/// @brief Joiner between labels of a simple-mode delimiter name.
inline constexpr std::string_view kDelimiterLabelJoiner = "/";

/// @brief Mapping quality assigned to every emitted array element.
inline constexpr std::uint8_t kElementMappingQuality = 255;

/// @brief Default progress reporting interval (milliseconds).
inline constexpr std::uint32_t kDefaultProgressIntervalMs = 1000;

// =============================================================================
// Split Mode Enumeration
// =============================================================================

/// @brief Delimiter matching policy.
enum class SplitMode : std::uint8_t {
    /// @brief Full-template matching per element, scored, with skip tolerance.
    kBounded = 0,

    /// @brief Boundary-only matching on two-label windows between elements.
    kSimple = 1
};

/// @brief Convert SplitMode to string representation.
[[nodiscard]] constexpr std::string_view splitModeToString(SplitMode mode) noexcept {
    switch (mode) {
        case SplitMode::kBounded:
            return "bounded";
        case SplitMode::kSimple:
            return "simple";
    }
    return "unknown";
}

// =============================================================================
// Static Assertions
// =============================================================================

static_assert(sizeof(SplitMode) == 1, "SplitMode must be 1 byte");
static_assert(sizeof(ReadIndex) == 8, "ReadIndex must be 8 bytes");
static_assert(kExactMatchScore > kIndelMatchScore, "exact matches must outscore skips");

}  // namespace masseg

#endif  // MASSEG_COMMON_TYPES_H
