// =============================================================================
// mas-segmenter - Error Handling Framework
// =============================================================================
// Error handling for the mas-segmenter library.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - MasSegException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context and message support
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (file not found, read/write failure)
// - 3: Format error (malformed annotation tag, malformed template)
// - 4: Missing segment annotation on a read
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef MASSEG_COMMON_ERROR_H
#define MASSEG_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

#include <fmt/format.h>

namespace masseg {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    kUsageError = 1,

    /// @brief I/O error.
    /// @note File not found, read/write failure, permission denied, etc.
    kIOError = 2,

    /// @brief Format error.
    /// @note Malformed segment annotation, malformed template file, etc.
    kFormatError = 3,

    /// @brief A read carries no segment annotation tag.
    kMissingAnnotation = 4,

    /// @brief Invalid argument value.
    kInvalidArgument = 5,

    /// @brief File not found.
    kFileNotFound = 6,

    /// @brief File already exists.
    kFileExists = 7,

    /// @brief Failed to open file.
    kFileOpenFailed = 8,

    /// @brief Invalid state for operation.
    kInvalidState = 9,

    /// @brief Unexpected failure inside a pipeline stage.
    kInternalError = 10
};

/// @brief Convert ErrorCode to its integer exit code value.
/// @param code The error code.
/// @return Integer exit code suitable for process exit.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kMissingAnnotation:
            return "missing annotation";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kFileNotFound:
            return "file not found";
        case ErrorCode::kFileExists:
            return "file exists";
        case ErrorCode::kFileOpenFailed:
            return "file open failed";
        case ErrorCode::kInvalidState:
            return "invalid state";
        case ErrorCode::kInternalError:
            return "internal error";
    }
    return "unknown error";
}

/// @brief Check if an error code represents success.
/// @param code The error code.
/// @return true if the code represents success.
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief File path associated with the error (if applicable).
    std::string filePath;

    /// @brief Name of the read being processed (if applicable).
    std::string readName;

    /// @brief 0-based index of the read in the input stream (if applicable).
    std::optional<std::uint64_t> readIndex;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with file path.
    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    /// @brief Set the file path.
    /// @return Reference to this for method chaining.
    ErrorContext& withFile(std::string path) {
        filePath = std::move(path);
        return *this;
    }

    /// @brief Set the read name.
    /// @return Reference to this for method chaining.
    ErrorContext& withRead(std::string name) {
        readName = std::move(name);
        return *this;
    }

    /// @brief Set the read index.
    /// @return Reference to this for method chaining.
    ErrorContext& withReadIndex(std::uint64_t index) {
        readIndex = index;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    /// @return "file: ..., read: ..., index: ..." with absent fields left out,
    ///         or an empty string when no field is set.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all mas-segmenter errors.
/// @note Provides error code, message, and optional context.
class MasSegException : public std::exception {
public:
    /// @brief Construct with error code and message.
    /// @param code The error code.
    /// @param message Descriptive error message.
    MasSegException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    /// @brief Construct with error code, message, and context.
    /// @param code The error code.
    /// @param message Descriptive error message.
    /// @param context Additional error context.
    MasSegException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~MasSegException() override = default;

    MasSegException(const MasSegException&) = default;
    MasSegException(MasSegException&&) noexcept = default;
    MasSegException& operator=(const MasSegException&) = default;
    MasSegException& operator=(MasSegException&&) noexcept = default;

    /// @brief Get the formatted error message.
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    /// @brief Check if this exception has context information.
    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for usage and argument errors (exit code 1).
class UsageError : public MasSegException {
public:
    explicit UsageError(std::string message)
        : MasSegException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : MasSegException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for I/O errors (exit code 2).
/// @note Thrown for open, read, write, and rename failures of BAM files.
class IOError : public MasSegException {
public:
    explicit IOError(std::string message)
        : MasSegException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : MasSegException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct from system error code.
    /// @param message Descriptive error message.
    /// @param ec System error appended to the message.
    IOError(std::string message, std::error_code ec)
        : MasSegException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    /// @brief Construct from system error code with context.
    /// @param message Descriptive error message.
    /// @param ec System error appended to the message.
    /// @param context Additional error context.
    IOError(std::string message, std::error_code ec, ErrorContext context)
        : MasSegException(ErrorCode::kIOError, formatWithSystemError(message, ec),
                          std::move(context)),
          systemError_(ec) {}

    /// @brief Get the system error code (if available).
    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Exception for format errors (exit code 3).
/// @note Thrown for malformed segment annotation tags and template files.
class FormatError : public MasSegException {
public:
    explicit FormatError(std::string message)
        : MasSegException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(std::string message, ErrorContext context)
        : MasSegException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}
};

/// @brief Exception for a read that violates a pipeline precondition (exit code 4).
/// @note Upstream annotation is required to populate the segment tag on every read.
class PreconditionError : public MasSegException {
public:
    explicit PreconditionError(std::string message)
        : MasSegException(ErrorCode::kMissingAnnotation, std::move(message)) {}

    PreconditionError(std::string message, ErrorContext context)
        : MasSegException(ErrorCode::kMissingAnnotation, std::move(message),
                          std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    /// @brief Construct with error code and message.
    Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    /// @brief Construct from a MasSegException.
    /// @param ex Source exception; its formatted what() becomes the message.
    explicit Error(const MasSegException& ex) : code_(ex.code()), message_(ex.what()) {}

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the error message.
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the exit code.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Throw the exception matching the error code.
    /// @throws UsageError, IOError, FormatError, PreconditionError, or
    ///         MasSegException for codes without a dedicated type.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

/// @brief Create an unexpected error value with a formatted message.
/// @param code The error code.
/// @param format {fmt} format string.
/// @param args Format arguments.
/// @return Unexpected value convertible to any Result<T>.
template <typename... Args>
[[nodiscard]] std::unexpected<Error> makeError(ErrorCode code,
                                               fmt::format_string<Args...> format,
                                               Args&&... args) {
    return std::unexpected(Error{code, fmt::format(format, std::forward<Args>(args)...)});
}

/// @brief Create an unexpected error value from an exception.
[[nodiscard]] inline std::unexpected<Error> makeError(const MasSegException& ex) {
    return std::unexpected(Error{ex});
}

/// @brief Create a success void result.
[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Unwrap a Result, throwing the matching exception on error.
/// @param result Result to unwrap.
/// @return The contained value.
/// @throws The exception type matching the error code.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Throw the matching exception if a VoidResult holds an error.
inline void unwrapOrThrow(const VoidResult& result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

}  // namespace masseg

#endif  // MASSEG_COMMON_ERROR_H
