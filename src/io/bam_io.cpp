// =============================================================================
// mas-segmenter - BAM I/O Implementation
// =============================================================================

#include "masseg/io/bam_io.h"

#include <algorithm>
#include <array>
#include <csignal>
#include <new>
#include <system_error>
#include <utility>

#include <unistd.h>

#include <fmt/format.h>

namespace masseg::io {

namespace {

/// @brief 4-bit BAM base code to ASCII.
constexpr char kBamSeqChars[] = "=ACMGRSVTWYHKDBN";

/// @brief Quality byte htslib stores when a record has no qualities.
constexpr std::uint8_t kMissingQuality = 0xff;

/// @brief Header text fields cannot contain tabs or line breaks.
std::string sanitizeHeaderValue(std::string_view value) {
    std::string sanitized(value);
    std::replace_if(
        sanitized.begin(), sanitized.end(),
        [](char c) { return c == '\t' || c == '\n' || c == '\r'; }, ' ');
    return sanitized;
}

// =============================================================================
// Signal Handler State
// =============================================================================
// The handler only touches lock-free atomics, a sig_atomic_t and unlink(),
// all of which are async-signal-safe.

static_assert(std::atomic<const char*>::is_always_lock_free);

std::array<std::atomic<const char*>, kMaxCleanupPaths> gCleanupPaths{};
volatile std::sig_atomic_t gInterrupted = 0;
std::atomic<bool> gSignalHandlersInstalled{false};
void (*gPreviousSigintHandler)(int) = nullptr;
void (*gPreviousSigtermHandler)(int) = nullptr;

bool isChainable(void (*handler)(int)) noexcept {
    return handler != nullptr && handler != SIG_DFL && handler != SIG_IGN;
}

void signalHandler(int signum) {
    gInterrupted = 1;
    unlinkRegisteredPaths();

    if (signum == SIGINT && isChainable(gPreviousSigintHandler)) {
        gPreviousSigintHandler(signum);
    } else if (signum == SIGTERM && isChainable(gPreviousSigtermHandler)) {
        gPreviousSigtermHandler(signum);
    } else {
        std::signal(signum, SIG_DFL);
        std::raise(signum);
    }
}

}  // namespace

// =============================================================================
// Signal Handler Management
// =============================================================================

bool registerCleanupPath(const char* path) noexcept {
    for (auto& slot : gCleanupPaths) {
        const char* expected = nullptr;
        if (slot.compare_exchange_strong(expected, path, std::memory_order_acq_rel)) {
            return true;
        }
    }
    return false;
}

void unregisterCleanupPath(const char* path) noexcept {
    for (auto& slot : gCleanupPaths) {
        const char* expected = path;
        if (slot.compare_exchange_strong(expected, nullptr, std::memory_order_acq_rel)) {
            return;
        }
    }
}

void unlinkRegisteredPaths() noexcept {
    for (auto& slot : gCleanupPaths) {
        if (const char* path = slot.load(std::memory_order_acquire); path != nullptr) {
            ::unlink(path);
        }
    }
}

bool interruptReceived() noexcept {
    return gInterrupted != 0;
}

void installSignalHandlers() {
    bool expected = false;
    if (!gSignalHandlersInstalled.compare_exchange_strong(expected, true)) {
        return;
    }

    gPreviousSigintHandler = std::signal(SIGINT, signalHandler);
    if (gPreviousSigintHandler == SIG_ERR) {
        MASSEG_LOG_WARNING("Failed to install SIGINT handler");
        gPreviousSigintHandler = nullptr;
    }

    gPreviousSigtermHandler = std::signal(SIGTERM, signalHandler);
    if (gPreviousSigtermHandler == SIG_ERR) {
        MASSEG_LOG_WARNING("Failed to install SIGTERM handler");
        gPreviousSigtermHandler = nullptr;
    }

    MASSEG_LOG_DEBUG("Signal handlers installed for SIGINT and SIGTERM");
}

// =============================================================================
// Records
// =============================================================================

BamRecordPtr makeRecord() {
    BamRecordPtr record(bam_init1());
    if (!record) {
        throw std::bad_alloc();
    }
    return record;
}

std::string_view recordName(const bam1_t* record) noexcept {
    return {bam_get_qname(record)};
}

std::string decodeSequence(const bam1_t* record) {
    return decodeSubsequence(record, 0, static_cast<std::size_t>(record->core.l_qseq));
}

std::string decodeSubsequence(const bam1_t* record, std::size_t start, std::size_t length) {
    const auto total = static_cast<std::size_t>(record->core.l_qseq);
    if (start >= total) {
        return {};
    }
    length = std::min(length, total - start);

    const std::uint8_t* encoded = bam_get_seq(record);
    std::string sequence(length, 'N');
    for (std::size_t i = 0; i < length; ++i) {
        sequence[i] = kBamSeqChars[bam_seqi(encoded, start + i)];
    }
    return sequence;
}

bool hasQualities(const bam1_t* record) noexcept {
    return record->core.l_qseq > 0 && bam_get_qual(record)[0] != kMissingQuality;
}

std::vector<std::uint8_t> copyQualities(const bam1_t* record) {
    if (!hasQualities(record)) {
        return {};
    }
    const std::uint8_t* qual = bam_get_qual(record);
    return std::vector<std::uint8_t>(qual, qual + record->core.l_qseq);
}

// =============================================================================
// Header Construction
// =============================================================================

SamHeaderPtr makeOutputHeader(const sam_hdr_t* input, const ProgramRecord& program) {
    SamHeaderPtr header(sam_hdr_dup(input));
    if (!header) {
        throw IOError("Failed to copy input header");
    }

    const char* safeId = sam_hdr_pg_id(header.get(), program.id.c_str());
    if (safeId == nullptr) {
        throw IOError(fmt::format("Failed to allocate @PG ID for '{}'", program.id));
    }
    const std::string id(safeId);
    const std::string description = sanitizeHeaderValue(program.description);
    const std::string commandLine = sanitizeHeaderValue(program.commandLine);

    if (sam_hdr_add_line(header.get(), "PG", "ID", id.c_str(), "PN", program.name.c_str(), "VN",
                         program.version.c_str(), "DS", description.c_str(), "CL",
                         commandLine.c_str(), nullptr) != 0) {
        throw IOError(fmt::format("Failed to add @PG line '{}' to output header", id));
    }
    return header;
}

void syncHtsLogLevel(log::Level level) noexcept {
    switch (level) {
        case log::Level::kTrace:
            hts_set_log_level(HTS_LOG_DEBUG);
            break;
        case log::Level::kDebug:
            hts_set_log_level(HTS_LOG_INFO);
            break;
        case log::Level::kInfo:
        case log::Level::kWarning:
            hts_set_log_level(HTS_LOG_WARNING);
            break;
        case log::Level::kError:
        case log::Level::kCritical:
            hts_set_log_level(HTS_LOG_ERROR);
            break;
    }
}

// =============================================================================
// BamReader Implementation
// =============================================================================

BamReader::BamReader(std::filesystem::path path) : path_(std::move(path)) {
    file_.reset(hts_open(path_.c_str(), "r"));
    if (!file_) {
        throw IOError("Failed to open input file", ErrorContext(path_.string()));
    }

    header_.reset(sam_hdr_read(file_.get()));
    if (!header_) {
        throw IOError("Failed to read header", ErrorContext(path_.string()));
    }

    MASSEG_LOG_DEBUG("BamReader opened: {}", path_.string());
}

Result<BamRecordPtr> BamReader::next() {
    auto record = makeRecord();
    const int rc = sam_read1(file_.get(), header_.get(), record.get());
    if (rc == -1) {
        return BamRecordPtr{};
    }
    if (rc < -1) {
        return makeError(ErrorCode::kIOError, "Failed to read record {} from {} (htslib code {})",
                         recordsRead_, path_.string(), rc);
    }
    ++recordsRead_;
    return record;
}

// =============================================================================
// BamWriter Implementation
// =============================================================================

BamWriter::BamWriter(std::filesystem::path outputPath, const sam_hdr_t* header,
                     BamWriterOptions options)
    : outputPath_(std::move(outputPath)),
      writePath_(options.atomicWrite ? std::filesystem::path(outputPath_.string() + ".tmp")
                                     : outputPath_),
      options_(options) {
    installSignalHandlers();

    const char* mode = outputPath_.extension() == ".sam" ? "w" : "wb";
    file_.reset(hts_open(writePath_.c_str(), mode));
    if (!file_) {
        throw IOError("Failed to create output file", ErrorContext(writePath_.string()));
    }

    header_.reset(sam_hdr_dup(header));
    if (!header_ || sam_hdr_write(file_.get(), header_.get()) < 0) {
        cleanupPartialFile();
        throw IOError("Failed to write output header", ErrorContext(writePath_.string()));
    }

    if (!registerCleanupPath(writePath_.c_str())) {
        MASSEG_LOG_WARNING("Too many open writers; {} is not removed on interrupt",
                           writePath_.string());
    }

    MASSEG_LOG_DEBUG("BamWriter created: output={}, write={}", outputPath_.string(),
                     writePath_.string());
}

BamWriter::~BamWriter() {
    unregisterCleanupPath(writePath_.c_str());

    if (!finalized_ && !aborted_) {
        abort();
    }
}

void BamWriter::write(const bam1_t* record) {
    if (finalized_ || aborted_) {
        throw MasSegException(ErrorCode::kInvalidState, "Writer is finalized or aborted");
    }
    if (interruptReceived()) {
        throw MasSegException(ErrorCode::kInvalidState,
                              "Interrupted; partial output has been removed");
    }

    if (sam_write1(file_.get(), header_.get(), record) < 0) {
        throw IOError(fmt::format("Failed to write record {}", recordName(record)),
                      ErrorContext(writePath_.string()));
    }
    ++recordsWritten_;
}

void BamWriter::finalize() {
    if (finalized_) {
        return;
    }
    if (aborted_) {
        throw MasSegException(ErrorCode::kInvalidState, "Cannot finalize aborted writer");
    }

    if (hts_close(file_.release()) != 0) {
        abort();
        throw IOError("Failed to close output file", ErrorContext(writePath_.string()));
    }

    if (options_.atomicWrite) {
        std::error_code ec;
        std::filesystem::rename(writePath_, outputPath_, ec);
        if (ec) {
            abort();
            throw IOError("Failed to rename temporary file to final output", ec,
                          ErrorContext(outputPath_.string()));
        }
    }

    finalized_ = true;
    unregisterCleanupPath(writePath_.c_str());

    MASSEG_LOG_INFO("Output finalized: {}, records={}", outputPath_.string(), recordsWritten_);
}

void BamWriter::abort() noexcept {
    bool expected = false;
    if (!aborted_.compare_exchange_strong(expected, true)) {
        return;
    }

    cleanupPartialFile();
    unregisterCleanupPath(writePath_.c_str());

    MASSEG_LOG_DEBUG("BamWriter aborted: {}", writePath_.string());
}

void BamWriter::cleanupPartialFile() noexcept {
    file_.reset();

    std::error_code ec;
    if (std::filesystem::exists(writePath_, ec)) {
        std::filesystem::remove(writePath_, ec);
        if (ec) {
            MASSEG_LOG_WARNING("Failed to remove partial output file: {}", writePath_.string());
        }
    }
}

}  // namespace masseg::io
