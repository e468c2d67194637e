// =============================================================================
// mas-segmenter - Pipeline Node Implementation
// =============================================================================

#include "masseg/pipeline/pipeline_node.h"

#include <chrono>
#include <exception>
#include <utility>

#include "masseg/algo/delimiter_matcher.h"
#include "masseg/common/logger.h"
#include "masseg/pipeline/element_writer.h"

namespace masseg::pipeline {

// =============================================================================
// PipelineFailure
// =============================================================================

void PipelineFailure::record(Error error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (error_.has_value()) {
        MASSEG_LOG_DEBUG("Suppressed follow-up pipeline error: {}", error.message());
        return;
    }
    MASSEG_LOG_ERROR("Pipeline failure: {}", error.message());
    error_ = std::move(error);
    failed_.store(true, std::memory_order_release);
}

std::optional<Error> PipelineFailure::error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

// =============================================================================
// WorkerNodeImpl
// =============================================================================

class WorkerNodeImpl {
public:
    explicit WorkerNodeImpl(WorkerNodeConfig config) : config_(std::move(config)) {}

    Result<std::optional<SegmentedRead>> process(ReadPayload payload) {
        const bam1_t* record = payload.record.get();
        auto segments = format::segmentsFromRecord(record, config_.segmentsTag);
        if (!segments) {
            if (segments.error().code() == ErrorCode::kMissingAnnotation &&
                config_.skipUnannotated) {
                MASSEG_LOG_WARNING("Skipping read {} without {} annotation",
                                   std::string(io::recordName(record)), config_.segmentsTag);
                ++readsSkipped_;
                return std::optional<SegmentedRead>{};
            }

            ErrorContext context;
            context.withRead(std::string(io::recordName(record))).withReadIndex(payload.index);
            return std::unexpected(Error{MasSegException(segments.error().code(),
                                                         segments.error().message(), context)});
        }

        ++readsForwarded_;
        return std::optional<SegmentedRead>{
            SegmentedRead{payload.index, std::move(payload.record), std::move(*segments)}};
    }

    void run(InputQueue& input, ResultQueue& results, PipelineFailure& failure) {
        while (true) {
            InputMessage message;
            input.pop(message);
            if (std::holds_alternative<StopToken>(message)) {
                break;
            }
            if (failure.failed()) {
                continue;
            }

            try {
                auto result = process(std::move(std::get<ReadPayload>(message)));
                if (!result) {
                    failure.record(std::move(result.error()));
                    continue;
                }
                if (result->has_value()) {
                    results.push(ResultMessage{std::move(**result)});
                }
            } catch (const MasSegException& e) {
                failure.record(Error{e});
            } catch (const std::exception& e) {
                failure.record(Error{ErrorCode::kInternalError,
                                     fmt::format("Worker failed: {}", e.what())});
            }
        }
    }

    [[nodiscard]] std::uint64_t readsForwarded() const noexcept { return readsForwarded_; }
    [[nodiscard]] std::uint64_t readsSkipped() const noexcept { return readsSkipped_; }

private:
    WorkerNodeConfig config_;
    std::uint64_t readsForwarded_ = 0;
    std::uint64_t readsSkipped_ = 0;
};

// =============================================================================
// WriterNodeImpl
// =============================================================================

class WriterNodeImpl {
public:
    WriterNodeImpl(const model::ArrayElementStructure& structure, WriterNodeConfig config)
        : config_(std::move(config)),
          matcher_(algo::createDelimiterMatcher(config_.splitMode, structure,
                                                config_.keepDelimiters)) {}

    std::size_t process(const SegmentedRead& read, io::BamWriter& output) {
        const bam1_t* record = read.record.get();

        MASSEG_LOG_DEBUG("Segments for read {}: {}", std::string(io::recordName(record)),
                         format::encodeSegments(read.segments));

        const auto match = matcher_->match(read.segments, record->core.l_qseq);

        ArrayElementWriter writer(output, config_.segmentsTag);
        for (const auto& span : match.elements) {
            writer.write(record, read.segments, span);
        }

        ++readsProcessed_;
        segmentsFound_ += match.count;
        elementsWritten_ += writer.elementsWritten();
        return match.count;
    }

    void run(ResultQueue& results, io::BamWriter& output, PipelineFailure& failure) {
        const auto start = std::chrono::steady_clock::now();
        auto lastReport = start;

        while (true) {
            ResultMessage message;
            results.pop(message);
            if (std::holds_alternative<StopToken>(message)) {
                break;
            }
            if (failure.failed()) {
                continue;
            }

            try {
                process(std::get<SegmentedRead>(message), output);

                const auto now = std::chrono::steady_clock::now();
                if (config_.progressCallback &&
                    now - lastReport >= std::chrono::milliseconds(config_.progressIntervalMs)) {
                    reportProgress(start, now);
                    lastReport = now;
                }
            } catch (const MasSegException& e) {
                failure.record(Error{e});
            } catch (const std::exception& e) {
                failure.record(Error{ErrorCode::kInternalError,
                                     fmt::format("Writer failed: {}", e.what())});
            }
        }

        closeOutput(output, failure);
        if (config_.progressCallback && !failure.failed()) {
            try {
                reportProgress(start, std::chrono::steady_clock::now());
            } catch (const std::exception& e) {
                MASSEG_LOG_WARNING("Progress callback failed: {}", std::string(e.what()));
            }
        }

        MASSEG_LOG_INFO("Segmented {} reads with {} total segments ({} elements written)",
                        readsProcessed_, segmentsFound_, elementsWritten_);
    }

    [[nodiscard]] std::uint64_t readsProcessed() const noexcept { return readsProcessed_; }
    [[nodiscard]] std::uint64_t segmentsFound() const noexcept { return segmentsFound_; }
    [[nodiscard]] std::uint64_t elementsWritten() const noexcept { return elementsWritten_; }

private:
    void closeOutput(io::BamWriter& output, PipelineFailure& failure) {
        if (failure.failed()) {
            output.abort();
            return;
        }

        try {
            output.finalize();
        } catch (const MasSegException& e) {
            failure.record(Error{e});
        } catch (const std::exception& e) {
            failure.record(Error{ErrorCode::kIOError,
                                 fmt::format("Failed to finalize output: {}", e.what())});
        }
    }

    void reportProgress(std::chrono::steady_clock::time_point start,
                        std::chrono::steady_clock::time_point now) const {
        ProgressInfo info;
        info.readsProcessed = readsProcessed_;
        info.elementsWritten = elementsWritten_;
        info.elapsedMs = static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(now - start).count());
        config_.progressCallback(info);
    }

    WriterNodeConfig config_;
    std::unique_ptr<algo::IDelimiterMatcher> matcher_;
    std::uint64_t readsProcessed_ = 0;
    std::uint64_t segmentsFound_ = 0;
    std::uint64_t elementsWritten_ = 0;
};

// =============================================================================
// WorkerNode Public Interface
// =============================================================================

WorkerNode::WorkerNode(WorkerNodeConfig config)
    : impl_(std::make_unique<WorkerNodeImpl>(std::move(config))) {}

WorkerNode::~WorkerNode() = default;

WorkerNode::WorkerNode(WorkerNode&&) noexcept = default;
WorkerNode& WorkerNode::operator=(WorkerNode&&) noexcept = default;

Result<std::optional<SegmentedRead>> WorkerNode::process(ReadPayload payload) {
    return impl_->process(std::move(payload));
}

void WorkerNode::run(InputQueue& input, ResultQueue& results, PipelineFailure& failure) {
    impl_->run(input, results, failure);
}

std::uint64_t WorkerNode::readsForwarded() const noexcept {
    return impl_->readsForwarded();
}

std::uint64_t WorkerNode::readsSkipped() const noexcept {
    return impl_->readsSkipped();
}

// =============================================================================
// WriterNode Public Interface
// =============================================================================

WriterNode::WriterNode(const model::ArrayElementStructure& structure, WriterNodeConfig config)
    : impl_(std::make_unique<WriterNodeImpl>(structure, std::move(config))) {}

WriterNode::~WriterNode() = default;

WriterNode::WriterNode(WriterNode&&) noexcept = default;
WriterNode& WriterNode::operator=(WriterNode&&) noexcept = default;

std::size_t WriterNode::process(const SegmentedRead& read, io::BamWriter& output) {
    return impl_->process(read, output);
}

void WriterNode::run(ResultQueue& results, io::BamWriter& output, PipelineFailure& failure) {
    impl_->run(results, output, failure);
}

std::uint64_t WriterNode::readsProcessed() const noexcept {
    return impl_->readsProcessed();
}

std::uint64_t WriterNode::segmentsFound() const noexcept {
    return impl_->segmentsFound();
}

std::uint64_t WriterNode::elementsWritten() const noexcept {
    return impl_->elementsWritten();
}

}  // namespace masseg::pipeline
