// =============================================================================
// mas-segmenter - Segmentation Pipeline
// =============================================================================
// Splits every read of an input BAM into array elements.
//
// Threads and channels:
// 1. Producer (calling thread) - reads records, pushes them to the input queue
// 2. Workers (N threads) - decode each read's segment annotation
// 3. Writer (1 thread) - matches delimiters and writes element records
//
// The input queue is bounded to N entries so a slow writer throttles the
// producer; the result queue is unbounded. Shutdown is driven by typed stop
// tokens: one per worker on the input queue, then one on the result queue
// after every worker has joined.
//
// The first failure in any thread stops the producer; the other threads
// drain their queues until their stop token arrives, the partial output is
// removed, and run() returns that first error.
// =============================================================================

#ifndef MASSEG_PIPELINE_PIPELINE_H
#define MASSEG_PIPELINE_PIPELINE_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "masseg/common/error.h"
#include "masseg/common/types.h"
#include "masseg/io/bam_io.h"
#include "masseg/model/array_structure.h"

namespace masseg::pipeline {

// =============================================================================
// Forward Declarations
// =============================================================================

class SegmentationPipelineImpl;

// =============================================================================
// Pipeline Statistics
// =============================================================================

/// @brief Statistics for a pipeline run
struct PipelineStats {
    /// @brief Records read from the input
    std::uint64_t readsRead = 0;

    /// @brief Reads matched and written by the writer
    std::uint64_t readsProcessed = 0;

    /// @brief Reads dropped for lacking an annotation (--skip-unannotated)
    std::uint64_t readsSkipped = 0;

    /// @brief Boundaries (simple) or completed templates (bounded) found
    std::uint64_t segmentsFound = 0;

    /// @brief Element records written
    std::uint64_t elementsWritten = 0;

    /// @brief Wall time of the run (milliseconds)
    std::uint64_t processingTimeMs = 0;

    /// @brief Number of worker threads used
    std::size_t threadsUsed = 0;

    /// @brief Mean elements written per processed read
    [[nodiscard]] double elementsPerRead() const noexcept {
        if (readsProcessed == 0) return 0.0;
        return static_cast<double>(elementsWritten) / static_cast<double>(readsProcessed);
    }

    /// @brief Reads per second
    [[nodiscard]] double readsPerSecond() const noexcept {
        if (processingTimeMs == 0) return 0.0;
        return static_cast<double>(readsProcessed) * 1000.0 /
               static_cast<double>(processingTimeMs);
    }
};

// =============================================================================
// Progress Callback
// =============================================================================

/// @brief Progress information for callbacks
struct ProgressInfo {
    /// @brief Reads processed by the writer so far
    std::uint64_t readsProcessed = 0;

    /// @brief Element records written so far
    std::uint64_t elementsWritten = 0;

    /// @brief Elapsed time (milliseconds)
    std::uint64_t elapsedMs = 0;
};

/// @brief Progress callback type
/// @note Invoked on the writer thread.
using ProgressCallback = std::function<void(const ProgressInfo& info)>;

// =============================================================================
// Pipeline Configuration
// =============================================================================

/// @brief Configuration for the segmentation pipeline
struct SegmentationPipelineConfig {
    /// @brief Number of worker threads (0 or more than the core count = all cores)
    std::size_t numThreads = 0;

    /// @brief Delimiter matching policy
    SplitMode splitMode = SplitMode::kBounded;

    /// @brief Keep delimiter bases in the emitted elements
    bool keepDelimiters = false;

    /// @brief Aux tag holding the segment annotation
    std::string segmentsTag = std::string(kDefaultSegmentsTag);

    /// @brief Drop reads without an annotation instead of failing the run
    bool skipUnannotated = false;

    /// @brief Write through "<output>.tmp" and rename on success
    bool atomicWrite = true;

    /// @brief Fields of the @PG line added to the output header
    io::ProgramRecord program;

    /// @brief Progress callback
    ProgressCallback progressCallback;

    /// @brief Progress callback interval (milliseconds)
    std::uint32_t progressIntervalMs = kDefaultProgressIntervalMs;

    /// @brief Validate configuration
    [[nodiscard]] VoidResult validate() const;

    /// @brief Get effective number of worker threads
    [[nodiscard]] std::size_t effectiveThreads() const noexcept;
};

// =============================================================================
// Segmentation Pipeline
// =============================================================================

/// @brief Main segmentation pipeline class
///
/// Usage:
/// @code
/// SegmentationPipelineConfig config;
/// config.numThreads = 4;
/// config.splitMode = SplitMode::kSimple;
///
/// SegmentationPipeline pipeline(model::ArrayElementStructure::masSeqDefault(), config);
/// auto result = pipeline.run("annotated.bam", "segmented.bam");
/// if (result) {
///     auto stats = pipeline.stats();
/// }
/// @endcode
class SegmentationPipeline {
public:
    /// @brief Construct with a template and configuration
    SegmentationPipeline(model::ArrayElementStructure structure,
                         SegmentationPipelineConfig config = {});

    /// @brief Destructor
    ~SegmentationPipeline();

    // Non-copyable, movable
    SegmentationPipeline(const SegmentationPipeline&) = delete;
    SegmentationPipeline& operator=(const SegmentationPipeline&) = delete;
    SegmentationPipeline(SegmentationPipeline&&) noexcept;
    SegmentationPipeline& operator=(SegmentationPipeline&&) noexcept;

    /// @brief Run the pipeline to completion
    /// @param inputPath Annotated input BAM/SAM
    /// @param outputPath Output BAM (SAM if the name ends in ".sam")
    /// @return VoidResult with the first error of any thread
    [[nodiscard]] VoidResult run(const std::filesystem::path& inputPath,
                                 const std::filesystem::path& outputPath);

    /// @brief Check if pipeline is running
    [[nodiscard]] bool isRunning() const noexcept;

    /// @brief Get statistics of the last run
    [[nodiscard]] const PipelineStats& stats() const noexcept;

    /// @brief Get current configuration
    [[nodiscard]] const SegmentationPipelineConfig& config() const noexcept;

    /// @brief Get the array structure reads are split against
    [[nodiscard]] const model::ArrayElementStructure& structure() const noexcept;

private:
    std::unique_ptr<SegmentationPipelineImpl> impl_;
};

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Number of cores available to this process (at least 1)
[[nodiscard]] std::size_t availableCores() noexcept;

/// @brief Default worker count: one less than the core count, at least 1
[[nodiscard]] std::size_t recommendedThreadCount() noexcept;

/// @brief Resolve a requested worker count
/// @return All cores for 0 or a count above the core count, else the request
[[nodiscard]] std::size_t resolveThreadCount(std::size_t requested) noexcept;

}  // namespace masseg::pipeline

#endif  // MASSEG_PIPELINE_PIPELINE_H
