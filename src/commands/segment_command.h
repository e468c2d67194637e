// =============================================================================
// mas-segmenter - Segment Command
// =============================================================================
// Command handler for splitting annotated array reads into array elements.
//
// This module provides:
// - SegmentOptions: Configuration for the segment command
// - SegmentCommand: Template loading, output checks, pipeline dispatch
// =============================================================================

#ifndef MASSEG_COMMANDS_SEGMENT_COMMAND_H
#define MASSEG_COMMANDS_SEGMENT_COMMAND_H

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

#include "masseg/common/error.h"
#include "masseg/common/types.h"
#include "masseg/model/array_structure.h"
#include "masseg/pipeline/pipeline.h"

namespace masseg::commands {

// =============================================================================
// Segment Options
// =============================================================================

/// @brief Configuration options for the segment command.
struct SegmentOptions {
    /// @brief Annotated input BAM/SAM file.
    std::filesystem::path inputPath;

    /// @brief Output BAM file (".sam" suffix selects SAM text).
    std::filesystem::path outputPath;

    /// @brief Optional template file; the MAS-seq default is used when empty.
    std::filesystem::path templatePath;

    /// @brief Delimiter matching policy.
    SplitMode splitMode = SplitMode::kBounded;

    /// @brief Keep delimiter bases in the emitted elements.
    bool keepDelimiters = false;

    /// @brief Aux tag holding the segment annotation.
    std::string segmentsTag = std::string(kDefaultSegmentsTag);

    /// @brief Drop unannotated reads with a warning instead of failing.
    bool skipUnannotated = false;

    /// @brief Requested worker threads (0 = all cores).
    std::size_t threads = 0;

    /// @brief Overwrite an existing output file.
    bool forceOverwrite = false;

    /// @brief Log periodic progress.
    bool showProgress = true;

    /// @brief Full command line, recorded in the @PG header line.
    std::string commandLine;
};

// =============================================================================
// SegmentCommand Class
// =============================================================================

/// @brief Command handler for the segment subcommand.
class SegmentCommand {
public:
    /// @brief Construct with options.
    explicit SegmentCommand(SegmentOptions options);

    /// @brief Destructor.
    ~SegmentCommand();

    // Non-copyable, movable
    SegmentCommand(const SegmentCommand&) = delete;
    SegmentCommand& operator=(const SegmentCommand&) = delete;
    SegmentCommand(SegmentCommand&&) noexcept;
    SegmentCommand& operator=(SegmentCommand&&) noexcept;

    /// @brief Execute the segment command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    /// @brief Get the options.
    [[nodiscard]] const SegmentOptions& options() const noexcept { return options_; }

    /// @brief Get statistics of the last run.
    [[nodiscard]] const pipeline::PipelineStats& stats() const noexcept { return stats_; }

private:
    /// @brief Check input existence and output overwrite rules.
    void validateOptions() const;

    /// @brief Load the array element structure from the template option.
    [[nodiscard]] model::ArrayElementStructure loadStructure() const;

    /// @brief Build the pipeline configuration from the options.
    [[nodiscard]] pipeline::SegmentationPipelineConfig buildPipelineConfig() const;

    /// @brief Log the final summary.
    void printSummary() const;

    SegmentOptions options_;
    pipeline::PipelineStats stats_;
};

// =============================================================================
// Helpers
// =============================================================================

/// @brief @PG ID used for output headers.
[[nodiscard]] std::string programId();

/// @brief Join argv into a single command-line string.
[[nodiscard]] std::string joinCommandLine(int argc, char* argv[]);

}  // namespace masseg::commands

#endif  // MASSEG_COMMANDS_SEGMENT_COMMAND_H
