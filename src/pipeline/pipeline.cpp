// =============================================================================
// mas-segmenter - Segmentation Pipeline Implementation
// =============================================================================

#include "masseg/pipeline/pipeline.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <thread>
#include <utility>
#include <vector>

#include "masseg/common/logger.h"
#include "masseg/pipeline/pipeline_node.h"

namespace masseg::pipeline {

// =============================================================================
// Utility Function Implementations
// =============================================================================

std::size_t availableCores() noexcept {
    const auto hwThreads = std::thread::hardware_concurrency();
    return hwThreads == 0 ? 1 : static_cast<std::size_t>(hwThreads);
}

std::size_t recommendedThreadCount() noexcept {
    return std::max<std::size_t>(1, availableCores() - 1);
}

std::size_t resolveThreadCount(std::size_t requested) noexcept {
    const std::size_t cores = availableCores();
    if (requested == 0 || requested > cores) {
        return cores;
    }
    return requested;
}

// =============================================================================
// SegmentationPipelineConfig Implementation
// =============================================================================

VoidResult SegmentationPipelineConfig::validate() const {
    if (segmentsTag.size() != 2) {
        return makeError(ErrorCode::kInvalidArgument,
                         "Segments tag must be exactly two characters, got '{}'", segmentsTag);
    }
    if (progressCallback && progressIntervalMs == 0) {
        return makeError(ErrorCode::kInvalidArgument, "Progress interval must be > 0");
    }
    return makeVoidSuccess();
}

std::size_t SegmentationPipelineConfig::effectiveThreads() const noexcept {
    return resolveThreadCount(numThreads);
}

// =============================================================================
// SegmentationPipelineImpl
// =============================================================================

class SegmentationPipelineImpl {
public:
    SegmentationPipelineImpl(model::ArrayElementStructure structure,
                             SegmentationPipelineConfig config)
        : structure_(std::move(structure)), config_(std::move(config)) {}

    VoidResult run(const std::filesystem::path& inputPath,
                   const std::filesystem::path& outputPath) {
        if (auto valid = config_.validate(); !valid) {
            return valid;
        }

        running_ = true;
        stats_ = PipelineStats{};
        const auto startTime = std::chrono::steady_clock::now();

        VoidResult result = makeVoidSuccess();
        try {
            result = execute(inputPath, outputPath);
        } catch (const MasSegException& e) {
            result = makeError(e);
        } catch (const std::exception& e) {
            result = makeError(ErrorCode::kInternalError, "Pipeline failed: {}", e.what());
        }

        stats_.processingTimeMs = static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - startTime)
                .count());
        running_ = false;
        return result;
    }

    [[nodiscard]] bool isRunning() const noexcept { return running_; }
    [[nodiscard]] const PipelineStats& stats() const noexcept { return stats_; }
    [[nodiscard]] const SegmentationPipelineConfig& config() const noexcept { return config_; }
    [[nodiscard]] const model::ArrayElementStructure& structure() const noexcept {
        return structure_;
    }

private:
    /// @brief Run all threads; returns the first error raised by any of them.
    /// @throws IOError if the input or output cannot be opened.
    VoidResult execute(const std::filesystem::path& inputPath,
                       const std::filesystem::path& outputPath) {
        const std::size_t threads = config_.effectiveThreads();
        stats_.threadsUsed = threads;

        MASSEG_LOG_INFO("Running with {} worker thread(s)", threads);
        MASSEG_LOG_INFO("Using {} splitting mode", splitModeToString(config_.splitMode));

        io::BamReader reader(inputPath);
        auto header = io::makeOutputHeader(reader.header(), config_.program);
        io::BamWriter output(outputPath, header.get(),
                             io::BamWriterOptions{.atomicWrite = config_.atomicWrite});

        InputQueue input;
        input.set_capacity(static_cast<InputQueue::size_type>(threads));
        ResultQueue results;
        PipelineFailure failure;

        WriterNode writer(structure_, WriterNodeConfig{
                                          .splitMode = config_.splitMode,
                                          .keepDelimiters = config_.keepDelimiters,
                                          .segmentsTag = config_.segmentsTag,
                                          .progressCallback = config_.progressCallback,
                                          .progressIntervalMs = config_.progressIntervalMs,
                                      });
        std::vector<WorkerNode> workers;
        workers.reserve(threads);
        for (std::size_t i = 0; i < threads; ++i) {
            workers.emplace_back(WorkerNodeConfig{.segmentsTag = config_.segmentsTag,
                                                  .skipUnannotated = config_.skipUnannotated});
        }

        std::thread writerThread([&] { writer.run(results, output, failure); });

        std::vector<std::thread> workerThreads;
        workerThreads.reserve(threads);
        try {
            for (auto& worker : workers) {
                workerThreads.emplace_back(
                    [&input, &results, &failure, node = &worker] {
                        node->run(input, results, failure);
                    });
            }
        } catch (const std::exception& e) {
            failure.record(Error{ErrorCode::kInternalError,
                                 fmt::format("Failed to start worker thread: {}", e.what())});
        }

        produce(reader, input, failure);

        // One stop token per started worker, then one for the writer once
        // no worker can push another result.
        for (std::size_t i = 0; i < workerThreads.size(); ++i) {
            input.push(InputMessage{StopToken{}});
        }
        for (auto& thread : workerThreads) {
            thread.join();
        }
        results.push(ResultMessage{StopToken{}});
        writerThread.join();

        stats_.readsRead = reader.recordsRead();
        stats_.readsProcessed = writer.readsProcessed();
        stats_.segmentsFound = writer.segmentsFound();
        stats_.elementsWritten = writer.elementsWritten();
        for (const auto& worker : workers) {
            stats_.readsSkipped += worker.readsSkipped();
        }

        if (auto error = failure.error(); error.has_value()) {
            output.abort();
            return std::unexpected(std::move(*error));
        }

        MASSEG_LOG_INFO("Segmentation finished: {} reads read, {} skipped, {} elements written",
                        stats_.readsRead, stats_.readsSkipped, stats_.elementsWritten);
        return makeVoidSuccess();
    }

    /// @brief Feed records to the workers until the input ends or a thread fails.
    void produce(io::BamReader& reader, InputQueue& input, PipelineFailure& failure) noexcept {
        try {
            ReadIndex index = 0;
            while (!failure.failed()) {
                auto record = reader.next();
                if (!record) {
                    failure.record(std::move(record.error()));
                    break;
                }
                if (!*record) {
                    break;
                }
                input.push(InputMessage{ReadPayload{index++, std::move(*record)}});
            }
        } catch (const MasSegException& e) {
            failure.record(Error{e});
        } catch (const std::exception& e) {
            failure.record(Error{ErrorCode::kInternalError,
                                 fmt::format("Reader failed: {}", e.what())});
        }
    }

    model::ArrayElementStructure structure_;
    SegmentationPipelineConfig config_;
    PipelineStats stats_;
    std::atomic<bool> running_{false};
};

// =============================================================================
// SegmentationPipeline Public Interface
// =============================================================================

SegmentationPipeline::SegmentationPipeline(model::ArrayElementStructure structure,
                                           SegmentationPipelineConfig config)
    : impl_(std::make_unique<SegmentationPipelineImpl>(std::move(structure), std::move(config))) {}

SegmentationPipeline::~SegmentationPipeline() = default;

SegmentationPipeline::SegmentationPipeline(SegmentationPipeline&&) noexcept = default;
SegmentationPipeline& SegmentationPipeline::operator=(SegmentationPipeline&&) noexcept = default;

VoidResult SegmentationPipeline::run(const std::filesystem::path& inputPath,
                                     const std::filesystem::path& outputPath) {
    return impl_->run(inputPath, outputPath);
}

bool SegmentationPipeline::isRunning() const noexcept {
    return impl_->isRunning();
}

const PipelineStats& SegmentationPipeline::stats() const noexcept {
    return impl_->stats();
}

const SegmentationPipelineConfig& SegmentationPipeline::config() const noexcept {
    return impl_->config();
}

const model::ArrayElementStructure& SegmentationPipeline::structure() const noexcept {
    return impl_->structure();
}

}  // namespace masseg::pipeline
