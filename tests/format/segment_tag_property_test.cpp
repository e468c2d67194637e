// =============================================================================
// mas-segmenter - Segment Tag Codec Property Tests
// =============================================================================
// Property-based tests for decoding, encoding and filtering segment lists.
//
// **Property: Encoded annotations decode to the same segment list**
// **Property: Filtering keeps exactly the segments starting inside the bounds**
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <string>
#include <vector>

#include "masseg/format/segment_tag.h"

#include "test_support.h"

namespace masseg::format::test {

// =============================================================================
// Generators
// =============================================================================

namespace gen {

/// @brief Generate a segment label without tag separators.
rc::Gen<std::string> label() {
    return rc::gen::nonEmpty(rc::gen::container<std::string>(
        rc::gen::elementOf('A', 'B', 'Q', 'x', '_', '0', '3', 'p', ':', '-')));
}

/// @brief Generate a segment list laid out left to right.
rc::Gen<SegmentList> segmentList() {
    return rc::gen::map(
        rc::gen::container<std::vector<std::tuple<std::string, int, int>>>(
            rc::gen::tuple(label(), rc::gen::inRange(0, 50), rc::gen::inRange(1, 200))),
        [](const std::vector<std::tuple<std::string, int, int>>& parts) {
            SegmentList segments;
            Coordinate cursor = 0;
            for (const auto& [name, gap, width] : parts) {
                Segment segment;
                segment.name = name;
                segment.start = cursor + gap;
                segment.end = segment.start + width - 1;
                cursor = segment.end + 1;
                segments.push_back(segment);
            }
            return segments;
        });
}

}  // namespace gen

// =============================================================================
// Decoding
// =============================================================================

TEST(SegmentTagTest, DecodesPipeSeparatedList) {
    auto segments = decodeSegments("A:0-15|10x_Adapter:16-38|random:39-1200");
    ASSERT_TRUE(segments.has_value());
    ASSERT_EQ(segments->size(), 3U);
    EXPECT_EQ((*segments)[0], (Segment{"A", 0, 15}));
    EXPECT_EQ((*segments)[1], (Segment{"10x_Adapter", 16, 38}));
    EXPECT_EQ((*segments)[2], (Segment{"random", 39, 1200}));
}

TEST(SegmentTagTest, AcceptsCommaSeparator) {
    auto segments = decodeSegments("A:0-15,B:16-20");
    ASSERT_TRUE(segments.has_value());
    ASSERT_EQ(segments->size(), 2U);
    EXPECT_EQ((*segments)[1].name, "B");
}

TEST(SegmentTagTest, LabelMaySpanColons) {
    auto segment = decodeSegmentToken("ns:label:5-9");
    ASSERT_TRUE(segment.has_value());
    EXPECT_EQ(segment->name, "ns:label");
    EXPECT_EQ(segment->start, 5);
    EXPECT_EQ(segment->end, 9);
}

TEST(SegmentTagTest, EmptyValueDecodesToEmptyList) {
    auto segments = decodeSegments("");
    ASSERT_TRUE(segments.has_value());
    EXPECT_TRUE(segments->empty());
}

TEST(SegmentTagTest, MalformedTokensAreFormatErrors) {
    for (const char* bad : {"A0-15", ":0-15", "A:015", "A:x-15", "A:0-", "A:-3-4", "A:9-3",
                            "A:0-15|", "A:0-15||B:16-20"}) {
        auto segments = decodeSegments(bad);
        ASSERT_FALSE(segments.has_value()) << bad;
        EXPECT_EQ(segments.error().code(), ErrorCode::kFormatError) << bad;
    }
}

TEST(SegmentTagTest, ErrorNamesOffendingToken) {
    auto segments = decodeSegments("A:0-15|B:oops");
    ASSERT_FALSE(segments.has_value());
    EXPECT_NE(segments.error().message().find("B:oops"), std::string::npos);
}

TEST(SegmentTagTest, EncodesWithPipes) {
    const SegmentList segments{{"A", 0, 15}, {"B", 16, 20}};
    EXPECT_EQ(encodeSegments(segments), "A:0-15|B:16-20");
    EXPECT_EQ(encodeSegments({}), "");
}

// =============================================================================
// Record Access
// =============================================================================

TEST(SegmentTagRecordTest, ReadsAnnotationFromRecord) {
    auto record = masseg::test::makeAnnotatedRecord(
        {"read1", "ACGTACGTAC", "", std::string("A:0-4|B:5-9")});
    auto segments = segmentsFromRecord(record.get(), "SG");
    ASSERT_TRUE(segments.has_value());
    EXPECT_EQ(segments->size(), 2U);
}

TEST(SegmentTagRecordTest, HonoursCustomTag) {
    auto record = masseg::test::makeAnnotatedRecord(
        {"read1", "ACGTACGTAC", "", std::string("A:0-9")}, "XS");
    EXPECT_TRUE(segmentsFromRecord(record.get(), "XS").has_value());
    EXPECT_EQ(segmentsFromRecord(record.get(), "SG").error().code(),
              ErrorCode::kMissingAnnotation);
}

TEST(SegmentTagRecordTest, MissingTagIsPreconditionFailure) {
    auto record = masseg::test::makeAnnotatedRecord({"read7", "ACGT", "", std::nullopt});
    auto segments = segmentsFromRecord(record.get(), "SG");
    ASSERT_FALSE(segments.has_value());
    EXPECT_EQ(segments.error().code(), ErrorCode::kMissingAnnotation);
    EXPECT_NE(segments.error().message().find("read7"), std::string::npos);
}

TEST(SegmentTagRecordTest, NonStringTagIsFormatError) {
    auto record = masseg::test::makeAnnotatedRecord({"read1", "ACGT", "", std::nullopt});
    const std::int32_t value = 3;
    ASSERT_EQ(bam_aux_append(record.get(), "SG", 'i', sizeof(value),
                             reinterpret_cast<const std::uint8_t*>(&value)),
              0);
    auto segments = segmentsFromRecord(record.get(), "SG");
    ASSERT_FALSE(segments.has_value());
    EXPECT_EQ(segments.error().code(), ErrorCode::kFormatError);
}

TEST(SegmentTagRecordTest, InvalidTagNameIsRejected) {
    auto record = masseg::test::makeAnnotatedRecord({"read1", "ACGT", "", std::string("A:0-3")});
    EXPECT_EQ(segmentsFromRecord(record.get(), "SEG").error().code(),
              ErrorCode::kInvalidArgument);
}

// =============================================================================
// Properties
// =============================================================================

RC_GTEST_PROP(SegmentTagProperty, EncodeThenDecodeIsIdentity, ()) {
    const auto segments = *gen::segmentList();
    auto decoded = decodeSegments(encodeSegments(segments));
    RC_ASSERT(decoded.has_value());
    RC_ASSERT(*decoded == segments);
}

RC_GTEST_PROP(SegmentTagProperty, FilterKeepsSegmentsStartingInBounds, ()) {
    const auto segments = *gen::segmentList();
    const auto segStart = *rc::gen::inRange<Coordinate>(0, 2000);
    const auto segEnd = *rc::gen::inRange<Coordinate>(segStart, 4000);

    const auto filtered = filterSegments(segments, segStart, segEnd);

    std::size_t expected = 0;
    for (const auto& segment : segments) {
        if (segStart <= segment.start && segment.start <= segEnd) {
            ++expected;
        }
    }
    RC_ASSERT(filtered.size() == expected);
    for (const auto& segment : filtered) {
        RC_ASSERT(segStart <= segment.start);
        RC_ASSERT(segment.start <= segEnd);
    }
}

RC_GTEST_PROP(SegmentTagProperty, FilteringTwiceChangesNothing, ()) {
    const auto segments = *gen::segmentList();
    const auto segStart = *rc::gen::inRange<Coordinate>(0, 2000);
    const auto segEnd = *rc::gen::inRange<Coordinate>(segStart, 4000);

    const auto once = filterSegments(segments, segStart, segEnd);
    RC_ASSERT(filterSegments(once, segStart, segEnd) == once);
}

}  // namespace masseg::format::test
