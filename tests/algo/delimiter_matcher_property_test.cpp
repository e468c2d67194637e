// =============================================================================
// mas-segmenter - Delimiter Matcher Property Tests
// =============================================================================
// Unit and property-based tests for simple and bounded-region matching.
//
// **Property: Matching is a pure function of (template, segments, length)**
// **Property: Every emitted span lies inside the read and is non-empty**
// **Property: A contiguous template run is always completed**
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <string>
#include <vector>

#include "masseg/algo/delimiter_matcher.h"

namespace masseg::algo::test {

using format::Segment;
using format::SegmentList;
using model::ArrayElementStructure;

namespace {

/// @brief Lay labels out as consecutive 10-base segments.
SegmentList tile(const std::vector<std::string>& labels, Coordinate width = 10) {
    SegmentList segments;
    Coordinate cursor = 0;
    for (const auto& label : labels) {
        segments.push_back(Segment{label, cursor, cursor + width - 1});
        cursor += width;
    }
    return segments;
}

ArrayElementStructure structureOf(std::vector<model::ElementTemplate> elements) {
    auto structure = ArrayElementStructure::create(std::move(elements));
    EXPECT_TRUE(structure.has_value());
    return std::move(*structure);
}

}  // namespace

// =============================================================================
// Simple Mode
// =============================================================================

TEST(SimpleMatcherTest, SplitsBetweenDelimiterWindows) {
    SimpleDelimiterMatcher matcher({{"A", "B"}, {"Y", "Z"}}, false);
    const auto segments = tile({"A", "B", "x", "x", "Y", "Z"});

    const auto result = matcher.match(segments, 60);

    EXPECT_EQ(result.count, 2U);
    ASSERT_EQ(result.elements.size(), 1U);
    const auto& element = result.elements[0];
    EXPECT_EQ(element.start, 20);  // B.end + 1
    EXPECT_EQ(element.end, 39);    // Y.start - 1
    EXPECT_EQ(element.prevDelimiter, "A/B");
    EXPECT_EQ(element.delimiter, "Y/Z");
}

TEST(SimpleMatcherTest, KeepDelimitersExtendsToWindowEdges) {
    SimpleDelimiterMatcher matcher({{"A", "B"}, {"Y", "Z"}}, true);
    const auto segments = tile({"A", "B", "x", "x", "Y", "Z"});

    const auto result = matcher.match(segments, 60);

    // [0, B.end], [A.start, Z.end], and the remainder from Y.start.
    ASSERT_EQ(result.elements.size(), 3U);
    EXPECT_EQ(result.elements[0].start, 0);
    EXPECT_EQ(result.elements[0].end, 19);
    EXPECT_EQ(result.elements[0].prevDelimiter, "START");
    EXPECT_EQ(result.elements[1].start, 0);
    EXPECT_EQ(result.elements[1].end, 59);
    EXPECT_EQ(result.elements[2].start, 40);
    EXPECT_EQ(result.elements[2].end, 59);
    EXPECT_EQ(result.elements[2].delimiter, "END");
}

TEST(SimpleMatcherTest, NoWindowYieldsWholeRead) {
    SimpleDelimiterMatcher matcher({{"A", "B"}}, false);
    const auto result = matcher.match(tile({"x", "A", "x", "B"}), 40);

    EXPECT_EQ(result.count, 0U);
    ASSERT_EQ(result.elements.size(), 1U);
    EXPECT_EQ(result.elements[0].start, 0);
    EXPECT_EQ(result.elements[0].end, 39);
    EXPECT_EQ(result.elements[0].prevDelimiter, "START");
    EXPECT_EQ(result.elements[0].delimiter, "END");
}

TEST(SimpleMatcherTest, MismatchIsNotRetestedAsWindowStart) {
    // "A","A","B": the second A resets the window and is not re-used as a start.
    SimpleDelimiterMatcher matcher({{"A", "B"}}, false);
    const auto result = matcher.match(tile({"A", "A", "B"}), 30);
    EXPECT_EQ(result.count, 0U);
}

TEST(SimpleMatcherTest, CompletedWindowIsFrozen) {
    SimpleDelimiterMatcher matcher({{"A", "B"}}, false);
    const auto result = matcher.match(tile({"A", "B", "x", "A", "B"}), 50);

    // Only the first occurrence counts; the rest of the read is one piece.
    EXPECT_EQ(result.count, 1U);
    ASSERT_EQ(result.elements.size(), 1U);
    EXPECT_EQ(result.elements[0].start, 20);
    EXPECT_EQ(result.elements[0].end, 49);
}

TEST(SimpleMatcherTest, EmptySegmentListYieldsWholeRead) {
    SimpleDelimiterMatcher matcher(ArrayElementStructure::masSeqDefault(), false);
    const auto result = matcher.match({}, 25);
    EXPECT_EQ(result.count, 0U);
    ASSERT_EQ(result.elements.size(), 1U);
    EXPECT_EQ(result.elements[0].length(), 25);
}

TEST(SimpleMatcherTest, EmptyReadYieldsNothing) {
    SimpleDelimiterMatcher matcher({{"A", "B"}}, false);
    EXPECT_TRUE(matcher.match({}, 0).elements.empty());
}

TEST(SimpleMatcherTest, PieceReachingPastReadEndIsDropped) {
    // With delimiters kept the first piece ends at B.end = 29, beyond a 25-base read.
    SimpleDelimiterMatcher matcher({{"A", "B"}}, true);
    const auto result = matcher.match(tile({"x", "A", "B"}), 25);

    EXPECT_EQ(result.count, 1U);
    ASSERT_EQ(result.elements.size(), 1U);
    EXPECT_EQ(result.elements[0].start, 10);
    EXPECT_EQ(result.elements[0].end, 24);
    EXPECT_EQ(result.elements[0].delimiter, "END");
}

TEST(SimpleMatcherTest, MasSeqWindowsSplitConsecutiveElements) {
    SimpleDelimiterMatcher matcher(ArrayElementStructure::masSeqDefault(), false);
    const auto segments = tile({"A", "10x_Adapter", "random", "Poly_A", "3p_Adapter", "B",
                                "10x_Adapter", "random", "Poly_A", "3p_Adapter", "C",
                                "10x_Adapter", "random"});

    const auto result = matcher.match(segments, 130);

    EXPECT_EQ(result.count, 2U);
    ASSERT_EQ(result.elements.size(), 3U);
    EXPECT_EQ(result.elements[0].start, 0);
    EXPECT_EQ(result.elements[0].end, 29);
    EXPECT_EQ(result.elements[0].delimiter, "Poly_A/3p_Adapter/B/10x_Adapter");
    EXPECT_EQ(result.elements[1].start, 70);
    EXPECT_EQ(result.elements[1].end, 99);
    EXPECT_EQ(result.elements[1].delimiter, "C/10x_Adapter");
    EXPECT_EQ(result.elements[2].start, 120);
    EXPECT_EQ(result.elements[2].end, 129);
}

// =============================================================================
// Bounded-Region Mode
// =============================================================================

TEST(BoundedMatcherTest, FullTemplateScoresExactMatches) {
    BoundedRegionMatcher matcher(structureOf({{"L1", "L2", "L3"}}), false);
    const auto result = matcher.match(tile({"L1", "L2", "L3"}), 30);

    EXPECT_EQ(result.count, 1U);
    ASSERT_EQ(result.elements.size(), 1U);
    const auto& element = result.elements[0];
    EXPECT_EQ(element.score, 3 * kExactMatchScore);
    EXPECT_EQ(element.start, 10);
    EXPECT_EQ(element.end, 19);
    EXPECT_EQ(element.segStart, 0);
    EXPECT_EQ(element.segEnd, 29);
    EXPECT_EQ(element.prevDelimiter, "L1");
    EXPECT_EQ(element.delimiter, "L3");
}

TEST(BoundedMatcherTest, FullTemplateScoreIsSix) {
    BoundedRegionMatcher matcher(structureOf({{"L1", "L2", "L3"}}), true);
    const auto result = matcher.match(tile({"L1", "L2", "L3"}), 30);
    ASSERT_EQ(result.elements.size(), 1U);
    EXPECT_EQ(result.elements[0].score, 6);
    EXPECT_EQ(result.elements[0].start, 0);
    EXPECT_EQ(result.elements[0].end, 29);
}

TEST(BoundedMatcherTest, MissingLabelIsSkippedAtIndelScore) {
    BoundedRegionMatcher matcher(structureOf({{"L1", "L2", "L3"}}), true);
    const auto result = matcher.match(tile({"L1", "L3"}), 20);

    EXPECT_EQ(result.count, 1U);
    ASSERT_EQ(result.elements.size(), 1U);
    EXPECT_EQ(result.elements[0].score, kExactMatchScore + kIndelMatchScore);
    EXPECT_EQ(result.elements[0].score, 3);
}

TEST(BoundedMatcherTest, TwoCapturedSegmentsWithoutDelimitersAreCountedNotEmitted) {
    BoundedRegionMatcher matcher(structureOf({{"L1", "L2", "L3"}}), false);
    const auto result = matcher.match(tile({"L1", "L3"}), 20);
    EXPECT_EQ(result.count, 1U);
    EXPECT_TRUE(result.elements.empty());
}

TEST(BoundedMatcherTest, FirstLabelCannotBeSkipped) {
    BoundedRegionMatcher matcher(structureOf({{"L1", "L2", "L3"}}), true);
    const auto result = matcher.match(tile({"L2", "L3"}), 20);
    EXPECT_EQ(result.count, 0U);
    EXPECT_TRUE(result.elements.empty());
}

TEST(BoundedMatcherTest, UnknownLabelResetsProgress) {
    BoundedRegionMatcher matcher(structureOf({{"L1", "L2", "L3"}}), true);
    const auto result = matcher.match(tile({"L1", "x", "L2", "L3"}), 40);
    EXPECT_EQ(result.count, 0U);
}

TEST(BoundedMatcherTest, ElementsAreReportedInReadOrder) {
    // Template order is (B, A); the read carries A's element first.
    BoundedRegionMatcher matcher(structureOf({{"B", "b", "B2"}, {"A", "a", "A2"}}), false);
    const auto result = matcher.match(tile({"A", "a", "A2", "B", "b", "B2"}), 60);

    EXPECT_EQ(result.count, 2U);
    ASSERT_EQ(result.elements.size(), 2U);
    EXPECT_EQ(result.elements[0].prevDelimiter, "A");
    EXPECT_EQ(result.elements[0].start, 10);
    EXPECT_EQ(result.elements[1].prevDelimiter, "B");
    EXPECT_EQ(result.elements[1].start, 40);
}

TEST(BoundedMatcherTest, SpanPastReadEndIsCountedNotEmitted) {
    // Segment coordinates of a previously written element still refer to its
    // source read: L1..L3 sit at 20-49 while the element itself is 30 bases.
    BoundedRegionMatcher matcher(structureOf({{"L1", "L2", "L3"}}), true);
    const SegmentList segments{{"L1", 20, 29}, {"L2", 30, 39}, {"L3", 40, 49}};

    const auto result = matcher.match(segments, 30);
    EXPECT_EQ(result.count, 1U);
    EXPECT_TRUE(result.elements.empty());

    const auto inside = matcher.match(segments, 50);
    ASSERT_EQ(inside.elements.size(), 1U);
    EXPECT_EQ(inside.elements[0].start, 20);
    EXPECT_EQ(inside.elements[0].end, 49);
}

TEST(BoundedMatcherTest, EmptySegmentListMatchesNothing) {
    BoundedRegionMatcher matcher(ArrayElementStructure::masSeqDefault(), false);
    const auto result = matcher.match({}, 100);
    EXPECT_EQ(result.count, 0U);
    EXPECT_TRUE(result.elements.empty());
}

TEST(MatcherFactoryTest, CreatesMatcherForMode) {
    const auto structure = ArrayElementStructure::masSeqDefault();
    EXPECT_EQ(createDelimiterMatcher(SplitMode::kSimple, structure, false)->mode(),
              SplitMode::kSimple);
    EXPECT_EQ(createDelimiterMatcher(SplitMode::kBounded, structure, true)->mode(),
              SplitMode::kBounded);
}

// =============================================================================
// Properties
// =============================================================================

namespace gen {

/// @brief Labels drawn from the MAS-seq vocabulary plus noise.
rc::Gen<std::vector<std::string>> labelSequence() {
    return rc::gen::container<std::vector<std::string>>(rc::gen::elementOf(
        std::string("A"), std::string("B"), std::string("C"), std::string("10x_Adapter"),
        std::string("random"), std::string("Poly_A"), std::string("3p_Adapter"),
        std::string("unknown")));
}

}  // namespace gen

RC_GTEST_PROP(DelimiterMatcherProperty, MatchingIsDeterministic, (bool simple, bool keep)) {
    const auto segments = tile(*gen::labelSequence());
    const Coordinate readLength = static_cast<Coordinate>(segments.size()) * 10 +
                                  *rc::gen::inRange<Coordinate>(0, 30);
    const auto matcher = createDelimiterMatcher(simple ? SplitMode::kSimple : SplitMode::kBounded,
                                                ArrayElementStructure::masSeqDefault(), keep);

    const auto first = matcher->match(segments, readLength);
    const auto second = matcher->match(segments, readLength);
    RC_ASSERT(first.count == second.count);
    RC_ASSERT(first.elements == second.elements);
}

RC_GTEST_PROP(DelimiterMatcherProperty, SpansAreNonEmptyAndInsideRead, (bool simple, bool keep)) {
    const auto segments = tile(*gen::labelSequence());
    const Coordinate readLength = static_cast<Coordinate>(segments.size()) * 10 +
                                  *rc::gen::inRange<Coordinate>(0, 30);
    const auto matcher = createDelimiterMatcher(simple ? SplitMode::kSimple : SplitMode::kBounded,
                                                ArrayElementStructure::masSeqDefault(), keep);

    const auto result = matcher->match(segments, readLength);
    for (const auto& element : result.elements) {
        RC_ASSERT(element.start >= 0);
        RC_ASSERT(element.start <= element.end);
        RC_ASSERT(element.end < readLength);
    }
    for (std::size_t i = 1; i < result.elements.size(); ++i) {
        RC_ASSERT(result.elements[i - 1].segStart <= result.elements[i].segStart);
    }
}

RC_GTEST_PROP(DelimiterMatcherProperty, SimplePiecesAreDisjointWithoutDelimiters, ()) {
    const auto segments = tile(*gen::labelSequence());
    const Coordinate readLength = static_cast<Coordinate>(segments.size()) * 10 + 5;
    SimpleDelimiterMatcher matcher(ArrayElementStructure::masSeqDefault(), false);

    const auto result = matcher.match(segments, readLength);
    RC_ASSERT(result.elements.size() <= result.count + 1);
    for (std::size_t i = 1; i < result.elements.size(); ++i) {
        RC_ASSERT(result.elements[i - 1].end < result.elements[i].start);
    }
}

RC_GTEST_PROP(DelimiterMatcherProperty, ContiguousTemplateAlwaysCompletes, ()) {
    const auto structure = ArrayElementStructure::masSeqDefault();
    const auto index = *rc::gen::inRange<std::size_t>(0, structure.size());
    const auto& element = structure.element(index);

    const auto segments = tile(element);
    BoundedRegionMatcher matcher(structure, true);
    const auto result = matcher.match(segments, static_cast<Coordinate>(segments.size()) * 10);

    RC_ASSERT(result.count >= 1U);
    RC_ASSERT(!result.elements.empty());
    const auto expectedScore =
        static_cast<MatchScore>(element.size()) * kExactMatchScore;
    RC_ASSERT(result.elements.front().score == expectedScore);
    RC_ASSERT(result.elements.front().start == 0);
}

}  // namespace masseg::algo::test
