// =============================================================================
// mas-segmenter - Segment Command Implementation
// =============================================================================

#include "segment_command.h"

#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "masseg/common/logger.h"

namespace masseg::commands {

namespace {

constexpr const char* kSegmentDescription =
    "Segment pre-annotated reads from an input BAM file.";

}  // namespace

// =============================================================================
// Helpers
// =============================================================================

std::string programId() {
    return fmt::format("{}-segment-{}", kProgramName, kVersion);
}

std::string joinCommandLine(int argc, char* argv[]) {
    std::vector<std::string_view> args;
    args.reserve(static_cast<std::size_t>(argc));
    for (int i = 0; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return fmt::format("{}", fmt::join(args, " "));
}

// =============================================================================
// SegmentCommand Implementation
// =============================================================================

SegmentCommand::SegmentCommand(SegmentOptions options) : options_(std::move(options)) {}

SegmentCommand::~SegmentCommand() = default;

SegmentCommand::SegmentCommand(SegmentCommand&&) noexcept = default;
SegmentCommand& SegmentCommand::operator=(SegmentCommand&&) noexcept = default;

int SegmentCommand::execute() {
    try {
        validateOptions();

        auto structure = loadStructure();
        MASSEG_LOG_DEBUG("Array element structure: {}", structure.describe());

        MASSEG_LOG_INFO("Segmenting {} -> {} ({} mode, delimiters {})",
                        options_.inputPath.string(), options_.outputPath.string(),
                        splitModeToString(options_.splitMode),
                        options_.keepDelimiters ? "kept" : "trimmed");

        pipeline::SegmentationPipeline segmenter(std::move(structure), buildPipelineConfig());
        auto result = segmenter.run(options_.inputPath, options_.outputPath);
        stats_ = segmenter.stats();

        if (!result) {
            MASSEG_LOG_ERROR("Segmentation failed: {}", result.error().message());
            return result.error().exitCode();
        }

        printSummary();
        return 0;

    } catch (const MasSegException& e) {
        MASSEG_LOG_ERROR("Segment command failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        MASSEG_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kInternalError);
    }
}

void SegmentCommand::validateOptions() const {
    if (!std::filesystem::exists(options_.inputPath)) {
        throw MasSegException(ErrorCode::kFileNotFound,
                              "Input file not found: " + options_.inputPath.string());
    }

    if (options_.outputPath.empty()) {
        throw UsageError("Output path is required");
    }

    if (std::filesystem::exists(options_.outputPath) && !options_.forceOverwrite) {
        throw MasSegException(
            ErrorCode::kFileExists,
            "Output file exists: " + options_.outputPath.string() + " (use -f to overwrite)");
    }

    if (options_.segmentsTag.size() != 2) {
        throw UsageError("Segments tag must be exactly two characters: '" +
                         options_.segmentsTag + "'");
    }
}

model::ArrayElementStructure SegmentCommand::loadStructure() const {
    if (options_.templatePath.empty()) {
        return model::ArrayElementStructure::masSeqDefault();
    }
    MASSEG_LOG_INFO("Loading array element template from {}", options_.templatePath.string());
    return unwrapOrThrow(model::ArrayElementStructure::fromFile(options_.templatePath));
}

pipeline::SegmentationPipelineConfig SegmentCommand::buildPipelineConfig() const {
    pipeline::SegmentationPipelineConfig config;
    config.numThreads = options_.threads;
    config.splitMode = options_.splitMode;
    config.keepDelimiters = options_.keepDelimiters;
    config.segmentsTag = options_.segmentsTag;
    config.skipUnannotated = options_.skipUnannotated;

    config.program.id = programId();
    config.program.name = kProgramName;
    config.program.version = kVersion;
    config.program.description = kSegmentDescription;
    config.program.commandLine = options_.commandLine;

    if (options_.showProgress) {
        config.progressCallback = [](const pipeline::ProgressInfo& info) {
            MASSEG_LOG_INFO("Progress: {} reads, {} elements, {:.1f}s elapsed",
                            info.readsProcessed, info.elementsWritten,
                            static_cast<double>(info.elapsedMs) / 1000.0);
        };
    }

    return config;
}

void SegmentCommand::printSummary() const {
    MASSEG_LOG_INFO("Segmentation complete:");
    MASSEG_LOG_INFO("  Reads read:       {}", stats_.readsRead);
    MASSEG_LOG_INFO("  Reads processed:  {}", stats_.readsProcessed);
    if (stats_.readsSkipped > 0) {
        MASSEG_LOG_INFO("  Reads skipped:    {}", stats_.readsSkipped);
    }
    MASSEG_LOG_INFO("  Segments found:   {}", stats_.segmentsFound);
    MASSEG_LOG_INFO("  Elements written: {}", stats_.elementsWritten);
    MASSEG_LOG_INFO("  Elements/read:    {:.2f}", stats_.elementsPerRead());
    MASSEG_LOG_INFO("  Threads:          {}", stats_.threadsUsed);
    MASSEG_LOG_INFO("  Time:             {:.2f}s ({:.0f} reads/s)",
                    static_cast<double>(stats_.processingTimeMs) / 1000.0,
                    stats_.readsPerSecond());
}

}  // namespace masseg::commands
