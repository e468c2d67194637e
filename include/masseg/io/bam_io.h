// =============================================================================
// mas-segmenter - BAM I/O
// =============================================================================
// htslib-backed record input and output.
//
// This module provides:
// - RAII handles for htslib records, headers and files
// - BamReader: sequential record reader for BAM/SAM input
// - BamWriter: record writer with temporary file + atomic rename
// - Output header construction with an @PG line for this program
// - Record accessors for name, sequence and qualities
//
// Thread Safety:
// - BamReader and BamWriter are not thread-safe; each is owned by exactly
//   one pipeline thread.
// =============================================================================

#ifndef MASSEG_IO_BAM_IO_H
#define MASSEG_IO_BAM_IO_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <htslib/hts.h>
#include <htslib/sam.h>

#include "masseg/common/error.h"
#include "masseg/common/logger.h"

namespace masseg::io {

// =============================================================================
// RAII Handles
// =============================================================================

struct BamRecordDeleter {
    void operator()(bam1_t* record) const noexcept {
        if (record != nullptr) {
            bam_destroy1(record);
        }
    }
};

struct SamHeaderDeleter {
    void operator()(sam_hdr_t* header) const noexcept {
        if (header != nullptr) {
            sam_hdr_destroy(header);
        }
    }
};

struct HtsFileDeleter {
    void operator()(htsFile* file) const noexcept {
        if (file != nullptr) {
            hts_close(file);
        }
    }
};

using BamRecordPtr = std::unique_ptr<bam1_t, BamRecordDeleter>;
using SamHeaderPtr = std::unique_ptr<sam_hdr_t, SamHeaderDeleter>;
using HtsFilePtr = std::unique_ptr<htsFile, HtsFileDeleter>;

/// @brief Allocate an empty record.
/// @throws std::bad_alloc if htslib cannot allocate.
[[nodiscard]] BamRecordPtr makeRecord();

// =============================================================================
// Record Accessors
// =============================================================================

/// @brief Query name of a record.
[[nodiscard]] std::string_view recordName(const bam1_t* record) noexcept;

/// @brief Decode the record's sequence to ASCII bases.
/// @param record Source record.
/// @return Upper-case IUPAC bases, empty for a record without sequence.
[[nodiscard]] std::string decodeSequence(const bam1_t* record);

/// @brief Decode only [start, start + length) of the record's sequence.
/// @param record Source record.
/// @param start First base to decode.
/// @param length Number of bases requested.
/// @note The range is clipped to the sequence.
[[nodiscard]] std::string decodeSubsequence(const bam1_t* record, std::size_t start,
                                            std::size_t length);

/// @brief Copy the record's raw base qualities (Phred, no offset).
/// @param record Source record.
/// @return Empty vector when the record carries no qualities.
[[nodiscard]] std::vector<std::uint8_t> copyQualities(const bam1_t* record);

/// @brief True when the record stores base qualities.
[[nodiscard]] bool hasQualities(const bam1_t* record) noexcept;

// =============================================================================
// Header Construction
// =============================================================================

/// @brief Fields of the @PG line added to output headers.
struct ProgramRecord {
    /// @brief Requested PG ID; made unique against existing lines.
    std::string id;

    /// @brief Program name (PN).
    std::string name;

    /// @brief Program version (VN).
    std::string version;

    /// @brief Description (DS).
    std::string description;

    /// @brief Command line (CL).
    std::string commandLine;
};

/// @brief Copy an input header and append a @PG line.
/// @param input Header of the input file.
/// @param program Fields of the new @PG line.
/// @return A new header; the input is not modified.
/// @throws IOError if htslib rejects the header update.
[[nodiscard]] SamHeaderPtr makeOutputHeader(const sam_hdr_t* input, const ProgramRecord& program);

/// @brief Align htslib's own log verbosity with ours.
/// @param level Level passed to log::init().
void syncHtsLogLevel(log::Level level) noexcept;

// =============================================================================
// BamReader
// =============================================================================

/// @brief Sequential reader for BAM/SAM files.
class BamReader {
public:
    /// @brief Open a file and read its header.
    /// @param path Input BAM/SAM path.
    /// @throws IOError if the file or header cannot be read.
    explicit BamReader(std::filesystem::path path);

    BamReader(const BamReader&) = delete;
    BamReader& operator=(const BamReader&) = delete;
    BamReader(BamReader&&) noexcept = default;
    BamReader& operator=(BamReader&&) noexcept = default;
    ~BamReader() = default;

    /// @brief Read the next record.
    /// @return The record, an empty pointer at end of input, or IOError on
    ///         a truncated or corrupt file.
    [[nodiscard]] Result<BamRecordPtr> next();

    /// @brief The file header.
    [[nodiscard]] const sam_hdr_t* header() const noexcept { return header_.get(); }

    /// @brief Records returned so far.
    [[nodiscard]] std::uint64_t recordsRead() const noexcept { return recordsRead_; }

private:
    std::filesystem::path path_;
    HtsFilePtr file_;
    SamHeaderPtr header_;
    std::uint64_t recordsRead_ = 0;
};

// =============================================================================
// BamWriter
// =============================================================================

/// @brief Options for BamWriter.
struct BamWriterOptions {
    /// @brief Write to "<output>.tmp" and rename on finalize().
    bool atomicWrite = true;
};

/// @brief Writer for BAM output (SAM when the path ends in ".sam").
/// @note With atomic writes, a writer that is destroyed or interrupted by
///       SIGINT/SIGTERM before finalize() removes its temporary file.
class BamWriter {
public:
    /// @brief Open the output and write the header.
    /// @param outputPath Final output path; ".sam" selects SAM text.
    /// @param header Header to copy into the output.
    /// @param options Atomic-write behaviour.
    /// @throws IOError if the file cannot be created or the header written.
    BamWriter(std::filesystem::path outputPath, const sam_hdr_t* header,
              BamWriterOptions options = {});

    /// @brief Destructor - removes the temporary file if not finalized.
    ~BamWriter();

    // Non-copyable, non-movable (the signal handler holds writePath_'s buffer)
    BamWriter(const BamWriter&) = delete;
    BamWriter& operator=(const BamWriter&) = delete;
    BamWriter(BamWriter&&) = delete;
    BamWriter& operator=(BamWriter&&) = delete;

    /// @brief Write one record.
    /// @param record Record to append; not retained.
    /// @throws IOError on write failure.
    /// @throws MasSegException (kInvalidState) after finalize(), abort() or
    ///         an interrupt that removed the output.
    void write(const bam1_t* record);

    /// @brief Close the file and move it to its final path.
    /// @throws IOError on close or rename failure.
    void finalize();

    /// @brief Close the file and remove partial output.
    void abort() noexcept;

    /// @brief Records written so far.
    [[nodiscard]] std::uint64_t recordsWritten() const noexcept { return recordsWritten_; }

    /// @brief Final output path.
    [[nodiscard]] const std::filesystem::path& outputPath() const noexcept { return outputPath_; }

    /// @brief Path currently being written.
    [[nodiscard]] const std::filesystem::path& writePath() const noexcept { return writePath_; }

    [[nodiscard]] bool isFinalized() const noexcept { return finalized_; }

private:
    void cleanupPartialFile() noexcept;

    std::filesystem::path outputPath_;
    std::filesystem::path writePath_;
    HtsFilePtr file_;
    SamHeaderPtr header_;
    BamWriterOptions options_;
    std::uint64_t recordsWritten_ = 0;
    bool finalized_ = false;
    std::atomic<bool> aborted_{false};
};

// =============================================================================
// Signal Handler Management
// =============================================================================

/// @brief Maximum number of files removed on SIGINT/SIGTERM at one time.
inline constexpr std::size_t kMaxCleanupPaths = 16;

/// @brief Register a file to unlink when the process is interrupted.
/// @param path NUL-terminated path; must stay valid until unregistered.
/// @return false when all kMaxCleanupPaths slots are taken.
bool registerCleanupPath(const char* path) noexcept;

/// @brief Remove a path registered with registerCleanupPath().
void unregisterCleanupPath(const char* path) noexcept;

/// @brief Unlink every registered path.
/// @note Async-signal-safe; this is what the SIGINT/SIGTERM handler runs.
void unlinkRegisteredPaths() noexcept;

/// @brief True once SIGINT or SIGTERM has been received.
[[nodiscard]] bool interruptReceived() noexcept;

/// @brief Install SIGINT/SIGTERM handlers that unlink registered paths.
/// @note Idempotent; called by the first BamWriter.
void installSignalHandlers();

}  // namespace masseg::io

#endif  // MASSEG_IO_BAM_IO_H
