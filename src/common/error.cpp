// =============================================================================
// mas-segmenter - Error Handling Framework Implementation
// =============================================================================

#include "masseg/common/error.h"

#include <iterator>
#include <vector>

#include <fmt/ranges.h>

namespace masseg {

std::string ErrorContext::format() const {
    std::vector<std::string> parts;
    if (!filePath.empty()) {
        parts.push_back(fmt::format("file: {}", filePath));
    }
    if (!readName.empty()) {
        parts.push_back(fmt::format("read: {}", readName));
    }
    if (readIndex.has_value()) {
        parts.push_back(fmt::format("index: {}", *readIndex));
    }
    if (parts.empty()) {
        return {};
    }

    std::string out = fmt::format("{}", fmt::join(parts, ", "));
#ifndef NDEBUG
    fmt::format_to(std::back_inserter(out), " (at {}:{})", location.file_name(), location.line());
#endif
    return out;
}

void MasSegException::formatWhat() {
    what_ = fmt::format("[{}] {}", errorCodeToString(code_), message_);
    if (context_.has_value()) {
        if (const auto where = context_->format(); !where.empty()) {
            fmt::format_to(std::back_inserter(what_), " ({})", where);
        }
    }
}

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

// The message already carries the formatted context of the original
// exception, so the rethrown one is built without a context of its own.
[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
        case ErrorCode::kInvalidArgument:
            throw UsageError(message_);
        case ErrorCode::kIOError:
        case ErrorCode::kFileNotFound:
        case ErrorCode::kFileExists:
        case ErrorCode::kFileOpenFailed:
            throw IOError(message_);
        case ErrorCode::kFormatError:
            throw FormatError(message_);
        case ErrorCode::kMissingAnnotation:
            throw PreconditionError(message_);
        default:
            throw MasSegException(code_, message_);
    }
}

}  // namespace masseg
