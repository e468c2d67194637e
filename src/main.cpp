// =============================================================================
// mas-segmenter - MAS-seq Array Read Segmenter
// =============================================================================
// Main entry point for the mas-segmenter command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: segment
// - Global options: threads, verbosity, log file, progress
// - TTY detection for progress display
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include <unistd.h>

#include "masseg/common/error.h"
#include "masseg/common/logger.h"
#include "masseg/common/types.h"
#include "masseg/io/bam_io.h"
#include "masseg/pipeline/pipeline.h"

#include "commands/segment_command.h"

namespace masseg::commands {
int runSegment(CLI::App* app);
}  // namespace masseg::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kDescription =
    "mas-segmenter: Split MAS-seq array reads into array elements\n"
    "Reads must carry a segment annotation tag (default SG) produced by an\n"
    "upstream annotation step; each detected element is written as an\n"
    "unaligned record named {read}_{start}-{end}_{prev}-{delimiter}.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int threads = 0;      // <= 0 or more than the core count = all cores
    int verbosity = 0;    // 0 = info, 1 = debug, 2 = trace
    bool quiet = false;
    bool noProgress = false;
    std::string logFile;
    std::string commandLine;
};

GlobalOptions gOptions;

// =============================================================================
// TTY Detection
// =============================================================================

/// @brief Check if stdout is a TTY.
[[nodiscard]] bool isStdoutTty() noexcept {
    return isatty(fileno(stdout)) != 0;
}

// =============================================================================
// Segment Command Options
// =============================================================================

struct CliSegmentOptions {
    std::string input;
    std::string output;
    std::string templateFile;
    std::string segmentsTag = std::string(masseg::kDefaultSegmentsTag);
    bool simpleSplitting = false;
    bool keepDelimiters = false;
    bool skipUnannotated = false;
    bool force = false;
};

CliSegmentOptions gSegmentOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupSegmentCommand(CLI::App& app) {
    auto* segment = app.add_subcommand(
        "segment", "Segment pre-annotated reads from an input BAM file");
    segment->alias("seg");

    segment->add_option("input", gSegmentOpts.input, "Annotated input BAM/SAM file")
        ->required()
        ->check(CLI::ExistingFile);

    segment->add_option("-o,--output-bam", gSegmentOpts.output,
                        "Output BAM file (a .sam suffix writes SAM text)")
        ->required();

    segment->add_flag("-s,--do-simple-splitting", gSegmentOpts.simpleSplitting,
                      "Split on adjacent delimiter pairs instead of full element templates");

    segment->add_flag("-k,--keep-delimiters", gSegmentOpts.keepDelimiters,
                      "Keep delimiter sequences in the emitted elements");

    segment->add_option("--template", gSegmentOpts.templateFile,
                        "Array element template file (one element per line)")
        ->check(CLI::ExistingFile);

    segment->add_option("--segments-tag", gSegmentOpts.segmentsTag,
                        "Aux tag holding the segment annotation")
        ->default_val(std::string(masseg::kDefaultSegmentsTag));

    segment->add_flag("--skip-unannotated", gSegmentOpts.skipUnannotated,
                      "Skip reads without a segment annotation instead of failing");

    segment->add_flag("-f,--force", gSegmentOpts.force, "Overwrite existing output file");
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", std::string(masseg::kVersion));

    gOptions.commandLine = masseg::commands::joinCommandLine(argc, argv);

    // Global options
    app.add_option("-t,--threads", gOptions.threads,
                   "Number of worker threads (<= 0 = all cores)")
        ->default_val(static_cast<int>(masseg::pipeline::recommendedThreadCount()));

    app.add_flag("-v,--verbose", gOptions.verbosity,
                 "Increase verbosity (-v debug, -vv trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");

    app.add_option("--log-file", gOptions.logFile, "Also write log messages to this file");

    app.add_flag("--no-progress", gOptions.noProgress, "Disable progress display");

    // Setup subcommands
    setupSegmentCommand(app);

    // Require a subcommand
    app.require_subcommand(1);

    // Parse arguments
    CLI11_PARSE(app, argc, argv);

    // Initialize logger
    try {
        auto logLevel = masseg::log::levelFromVerbosity(gOptions.verbosity, gOptions.quiet);
        masseg::log::init(gOptions.logFile, logLevel);
        masseg::io::syncHtsLogLevel(logLevel);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    // Auto-disable progress on non-TTY
    if (!isStdoutTty() && !gOptions.noProgress) {
        gOptions.noProgress = true;
        MASSEG_LOG_DEBUG("stdout is not a TTY, disabling progress display");
    }

    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("segment")) {
            exitCode = masseg::commands::runSegment(app.get_subcommand("segment"));
        }
    } catch (const masseg::MasSegException& ex) {
        MASSEG_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        MASSEG_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    masseg::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace masseg::commands {

int runSegment([[maybe_unused]] CLI::App* app) {
    SegmentOptions opts;
    opts.inputPath = gSegmentOpts.input;
    opts.outputPath = gSegmentOpts.output;
    opts.templatePath = gSegmentOpts.templateFile;
    opts.splitMode = gSegmentOpts.simpleSplitting ? SplitMode::kSimple : SplitMode::kBounded;
    opts.keepDelimiters = gSegmentOpts.keepDelimiters;
    opts.segmentsTag = gSegmentOpts.segmentsTag;
    opts.skipUnannotated = gSegmentOpts.skipUnannotated;
    opts.threads = gOptions.threads > 0 ? static_cast<std::size_t>(gOptions.threads) : 0;
    opts.forceOverwrite = gSegmentOpts.force;
    opts.showProgress = !gOptions.noProgress;
    opts.commandLine = gOptions.commandLine;

    auto cmd = std::make_unique<SegmentCommand>(std::move(opts));
    return cmd->execute();
}

}  // namespace masseg::commands
