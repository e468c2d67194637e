// =============================================================================
// mas-segmenter - BAM I/O Tests
// =============================================================================
// Tests for record helpers, header construction, and the atomic writer.
// =============================================================================

#include "masseg/io/bam_io.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "test_support.h"

namespace masseg::io {
namespace {

using masseg::test::FixtureRead;
using masseg::test::makeAnnotatedRecord;

// =============================================================================
// Record Helpers
// =============================================================================

TEST(BamRecordTest, DecodesSequenceAndSubsequence) {
    auto record = makeAnnotatedRecord({"read1", "ACGTNACGTT", "IIIIIIIIII", std::nullopt});
    EXPECT_EQ(recordName(record.get()), "read1");
    EXPECT_EQ(decodeSequence(record.get()), "ACGTNACGTT");
    EXPECT_EQ(decodeSubsequence(record.get(), 3, 4), "TNAC");
    EXPECT_EQ(decodeSubsequence(record.get(), 8, 10), "TT");
    EXPECT_EQ(decodeSubsequence(record.get(), 10, 1), "");
}

TEST(BamRecordTest, QualitiesPresentOrMissing) {
    auto withQual = makeAnnotatedRecord({"r", "ACG", "!+I", std::nullopt});
    ASSERT_TRUE(hasQualities(withQual.get()));
    EXPECT_EQ(copyQualities(withQual.get()), (std::vector<std::uint8_t>{0, 10, 40}));

    auto withoutQual = makeAnnotatedRecord({"r", "ACG", "", std::nullopt});
    EXPECT_FALSE(hasQualities(withoutQual.get()));
    EXPECT_TRUE(copyQualities(withoutQual.get()).empty());
}

// =============================================================================
// Reader / Writer
// =============================================================================

class BamIoTest : public masseg::test::TempDirTest {};

TEST_F(BamIoTest, ReaderMissingFileThrowsIOError) {
    EXPECT_THROW(BamReader{path("missing.bam")}, IOError);
}

TEST_F(BamIoTest, ReaderStreamsRecordsThenSignalsEnd) {
    const auto input = path("in.sam");
    masseg::test::writeSamFixture(input, {{"r1", "ACGT", "IIII", std::string("A:0-3")},
                                          {"r2", "GGCC", "", std::nullopt}});

    BamReader reader(input);
    auto first = reader.next();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(*first);
    EXPECT_EQ(recordName(first->get()), "r1");

    auto second = reader.next();
    ASSERT_TRUE(second.has_value());
    ASSERT_TRUE(*second);

    auto end = reader.next();
    ASSERT_TRUE(end.has_value());
    EXPECT_FALSE(*end);
    EXPECT_EQ(reader.recordsRead(), 2U);
}

TEST_F(BamIoTest, OutputHeaderGainsProgramLine) {
    const auto input = path("in.sam");
    masseg::test::writeSamFixture(input, {});
    BamReader reader(input);

    ProgramRecord program{"mas-segmenter-segment-0.1.0", "mas-segmenter", "0.1.0",
                          "Segment reads.", "mas-segmenter segment\tin.sam"};
    auto header = makeOutputHeader(reader.header(), program);
    const std::string text = sam_hdr_str(header.get());

    EXPECT_NE(text.find("@RG\tID:rg1"), std::string::npos);
    EXPECT_NE(text.find("@PG\tID:mas-segmenter-segment-0.1.0\tPN:mas-segmenter\tVN:0.1.0"),
              std::string::npos);
    // Tabs inside header values would split the line into fields.
    EXPECT_EQ(text.find("segment\tin.sam"), std::string::npos);

    // A second @PG with the same ID is made unique.
    auto again = makeOutputHeader(header.get(), program);
    EXPECT_EQ(sam_hdr_count_lines(again.get(), "PG"), 2);
}

TEST_F(BamIoTest, WriterRenamesTemporaryOnFinalize) {
    const auto input = path("in.sam");
    const auto output = path("out.bam");
    masseg::test::writeSamFixture(input, {});
    BamReader reader(input);

    {
        BamWriter writer(output, reader.header());
        EXPECT_EQ(writer.writePath(), path("out.bam.tmp"));
        EXPECT_TRUE(std::filesystem::exists(writer.writePath()));
        EXPECT_FALSE(std::filesystem::exists(output));

        auto record = makeAnnotatedRecord({"r1", "ACGT", "IIII", std::string("A:0-3")});
        writer.write(record.get());
        writer.finalize();
        EXPECT_TRUE(writer.isFinalized());
        EXPECT_EQ(writer.recordsWritten(), 1U);
    }

    EXPECT_TRUE(std::filesystem::exists(output));
    EXPECT_FALSE(std::filesystem::exists(path("out.bam.tmp")));

    auto records = masseg::test::readAll(output);
    ASSERT_EQ(records.size(), 1U);
    EXPECT_EQ(decodeSequence(records[0].get()), "ACGT");
    EXPECT_EQ(masseg::test::auxString(records[0].get(), "SG"), "A:0-3");
}

TEST_F(BamIoTest, UnfinalizedWriterRemovesPartialOutput) {
    const auto input = path("in.sam");
    const auto output = path("out.bam");
    masseg::test::writeSamFixture(input, {});
    BamReader reader(input);

    {
        BamWriter writer(output, reader.header());
        auto record = makeAnnotatedRecord({"r1", "ACGT", "IIII", std::nullopt});
        writer.write(record.get());
    }

    EXPECT_FALSE(std::filesystem::exists(output));
    EXPECT_FALSE(std::filesystem::exists(path("out.bam.tmp")));
}

TEST_F(BamIoTest, AbortedWriterRejectsFurtherUse) {
    const auto input = path("in.sam");
    masseg::test::writeSamFixture(input, {});
    BamReader reader(input);

    BamWriter writer(path("out.sam"), reader.header(), BamWriterOptions{.atomicWrite = false});
    EXPECT_EQ(writer.writePath(), path("out.sam"));
    writer.abort();
    EXPECT_FALSE(std::filesystem::exists(path("out.sam")));

    auto record = makeAnnotatedRecord({"r1", "ACGT", "", std::nullopt});
    try {
        writer.write(record.get());
        FAIL() << "write after abort should throw";
    } catch (const MasSegException& e) {
        EXPECT_EQ(e.code(), ErrorCode::kInvalidState);
    }
    EXPECT_THROW(writer.finalize(), MasSegException);
}

TEST_F(BamIoTest, WriterFailsForUnwritableDirectory) {
    const auto input = path("in.sam");
    masseg::test::writeSamFixture(input, {});
    BamReader reader(input);

    EXPECT_THROW((BamWriter{path("no/such/dir/out.bam"), reader.header()}), IOError);
}

TEST_F(BamIoTest, InterruptCleanupUnlinksTemporaryFile) {
    const auto input = path("in.sam");
    const auto output = path("out.bam");
    masseg::test::writeSamFixture(input, {});
    BamReader reader(input);

    BamWriter writer(output, reader.header());
    ASSERT_TRUE(std::filesystem::exists(writer.writePath()));

    // Same routine the SIGINT/SIGTERM handler runs.
    unlinkRegisteredPaths();
    EXPECT_FALSE(std::filesystem::exists(writer.writePath()));
    EXPECT_FALSE(interruptReceived());

    EXPECT_THROW(writer.finalize(), IOError);
    EXPECT_FALSE(std::filesystem::exists(output));
}

TEST_F(BamIoTest, FinalizedWriterIsNoLongerCleanedUp) {
    const auto input = path("in.sam");
    const auto output = path("out.sam");
    masseg::test::writeSamFixture(input, {});
    BamReader reader(input);

    BamWriter writer(output, reader.header(), BamWriterOptions{.atomicWrite = false});
    writer.finalize();

    unlinkRegisteredPaths();
    EXPECT_TRUE(std::filesystem::exists(output));
}

TEST(CleanupRegistryTest, RejectsPathsBeyondCapacity) {
    std::vector<std::string> paths;
    for (std::size_t i = 0; i <= kMaxCleanupPaths; ++i) {
        paths.push_back("/nonexistent/masseg_cleanup_" + std::to_string(i));
    }

    std::size_t accepted = 0;
    for (const auto& p : paths) {
        if (registerCleanupPath(p.c_str())) {
            ++accepted;
        }
    }
    EXPECT_EQ(accepted, kMaxCleanupPaths);

    for (const auto& p : paths) {
        unregisterCleanupPath(p.c_str());
    }
    EXPECT_TRUE(registerCleanupPath(paths.back().c_str()));
    unregisterCleanupPath(paths.back().c_str());
}

}  // namespace
}  // namespace masseg::io
