// =============================================================================
// mas-segmenter - Pipeline Node Abstractions
// =============================================================================
// Defines the messages, channels and thread bodies of the segmentation
// pipeline.
//
// Pipeline stages:
// - WorkerNode: decodes the segment annotation of each read (N threads)
// - WriterNode: matches delimiters and writes element records (1 thread)
//
// Every channel message is either a payload or a StopToken. A node leaves
// its loop exactly when it pops a StopToken, whether or not the run failed.
// =============================================================================

#ifndef MASSEG_PIPELINE_PIPELINE_NODE_H
#define MASSEG_PIPELINE_PIPELINE_NODE_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

#include <tbb/concurrent_queue.h>

#include "masseg/common/error.h"
#include "masseg/common/types.h"
#include "masseg/format/segment_tag.h"
#include "masseg/io/bam_io.h"
#include "masseg/model/array_structure.h"
#include "masseg/pipeline/pipeline.h"

namespace masseg::pipeline {

// =============================================================================
// Forward Declarations
// =============================================================================

class WorkerNodeImpl;
class WriterNodeImpl;

// =============================================================================
// Messages and Channels
// =============================================================================

/// @brief Terminates the node that pops it
struct StopToken {};

/// @brief An input record on its way to a worker
struct ReadPayload {
    /// @brief 0-based position in the input
    ReadIndex index = 0;

    /// @brief The record
    io::BamRecordPtr record;
};

/// @brief A record with its decoded segments, on its way to the writer
struct SegmentedRead {
    /// @brief 0-based position in the input
    ReadIndex index = 0;

    /// @brief The unchanged input record
    io::BamRecordPtr record;

    /// @brief Decoded segments, in read order
    format::SegmentList segments;
};

using InputMessage = std::variant<StopToken, ReadPayload>;
using ResultMessage = std::variant<StopToken, SegmentedRead>;

/// @brief Producer to workers; capacity is set to the worker count
using InputQueue = tbb::concurrent_bounded_queue<InputMessage>;

/// @brief Workers to writer; unbounded
using ResultQueue = tbb::concurrent_bounded_queue<ResultMessage>;

// =============================================================================
// Failure Slot
// =============================================================================

/// @brief First error raised by any pipeline thread
/// @note Thread-safe. Later errors are logged and dropped.
class PipelineFailure {
public:
    PipelineFailure() = default;

    PipelineFailure(const PipelineFailure&) = delete;
    PipelineFailure& operator=(const PipelineFailure&) = delete;

    /// @brief Record an error; only the first one is kept
    void record(Error error);

    /// @brief Whether any error has been recorded
    [[nodiscard]] bool failed() const noexcept { return failed_.load(std::memory_order_acquire); }

    /// @brief The first recorded error
    [[nodiscard]] std::optional<Error> error() const;

private:
    mutable std::mutex mutex_;
    std::optional<Error> error_;
    std::atomic<bool> failed_{false};
};

// =============================================================================
// Worker Node
// =============================================================================

/// @brief Configuration for worker node
struct WorkerNodeConfig {
    /// @brief Aux tag holding the segment annotation
    std::string segmentsTag = std::string(kDefaultSegmentsTag);

    /// @brief Drop reads without an annotation instead of failing
    bool skipUnannotated = false;
};

/// @brief Worker node
///
/// Stateless with respect to reads: each payload is decoded on its own.
class WorkerNode {
public:
    /// @brief Construct with configuration
    explicit WorkerNode(WorkerNodeConfig config = {});

    /// @brief Destructor
    ~WorkerNode();

    // Non-copyable, movable
    WorkerNode(const WorkerNode&) = delete;
    WorkerNode& operator=(const WorkerNode&) = delete;
    WorkerNode(WorkerNode&&) noexcept;
    WorkerNode& operator=(WorkerNode&&) noexcept;

    /// @brief Decode one read
    /// @return The segmented read, std::nullopt if it was skipped, or the
    ///         decode error (PreconditionError code for a missing tag)
    [[nodiscard]] Result<std::optional<SegmentedRead>> process(ReadPayload payload);

    /// @brief Thread body: pop until a StopToken arrives
    void run(InputQueue& input, ResultQueue& results, PipelineFailure& failure);

    /// @brief Reads decoded and forwarded
    [[nodiscard]] std::uint64_t readsForwarded() const noexcept;

    /// @brief Reads dropped for lacking an annotation
    [[nodiscard]] std::uint64_t readsSkipped() const noexcept;

private:
    std::unique_ptr<WorkerNodeImpl> impl_;
};

// =============================================================================
// Writer Node
// =============================================================================

/// @brief Configuration for writer node
struct WriterNodeConfig {
    /// @brief Delimiter matching policy
    SplitMode splitMode = SplitMode::kBounded;

    /// @brief Keep delimiter bases in emitted elements
    bool keepDelimiters = false;

    /// @brief Aux tag receiving each element's segments
    std::string segmentsTag = std::string(kDefaultSegmentsTag);

    /// @brief Progress callback
    ProgressCallback progressCallback;

    /// @brief Progress callback interval (milliseconds)
    std::uint32_t progressIntervalMs = kDefaultProgressIntervalMs;
};

/// @brief Writer node
///
/// The only thread that touches the output file. On its stop token it
/// finalizes the output when the run succeeded and discards it otherwise.
class WriterNode {
public:
    /// @brief Construct with the array structure and configuration
    WriterNode(const model::ArrayElementStructure& structure, WriterNodeConfig config = {});

    /// @brief Destructor
    ~WriterNode();

    // Non-copyable, movable
    WriterNode(const WriterNode&) = delete;
    WriterNode& operator=(const WriterNode&) = delete;
    WriterNode(WriterNode&&) noexcept;
    WriterNode& operator=(WriterNode&&) noexcept;

    /// @brief Match one read and write its elements
    /// @return Segments found (boundaries or completed templates)
    /// @throws IOError on write failure
    std::size_t process(const SegmentedRead& read, io::BamWriter& output);

    /// @brief Thread body: pop until a StopToken arrives, then close the output
    void run(ResultQueue& results, io::BamWriter& output, PipelineFailure& failure);

    /// @brief Reads matched and written
    [[nodiscard]] std::uint64_t readsProcessed() const noexcept;

    /// @brief Sum of segments found over all reads
    [[nodiscard]] std::uint64_t segmentsFound() const noexcept;

    /// @brief Element records written
    [[nodiscard]] std::uint64_t elementsWritten() const noexcept;

private:
    std::unique_ptr<WriterNodeImpl> impl_;
};

}  // namespace masseg::pipeline

#endif  // MASSEG_PIPELINE_PIPELINE_NODE_H
