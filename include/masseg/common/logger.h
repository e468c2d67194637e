// =============================================================================
// mas-segmenter - Logger Module
// =============================================================================
// Low-latency asynchronous logging using Quill library.
//
// This module provides a global logger instance with support for:
// - Multiple log levels (trace, debug, info, warning, error, critical)
// - Console and file output
// - Thread-safe logging from reader, worker, and writer threads
//
// Usage:
//   masseg::log::init("segment.log", masseg::log::Level::kInfo);
//   MASSEG_LOG_INFO("segmented {} reads", count);
// =============================================================================

#ifndef MASSEG_COMMON_LOGGER_H
#define MASSEG_COMMON_LOGGER_H

#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace masseg::log {

// =============================================================================
// Log Level Enumeration
// =============================================================================

/// @brief Log level enumeration matching Quill's log levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

// =============================================================================
// Logger Lifetime
// =============================================================================

/// @brief Start the quill backend and create the global logger.
/// @param logFile Also write to this file (truncated); empty for console only.
/// @param level Minimum level that reaches the sinks.
/// @note Call once from main() before spawning pipeline threads.
///       Repeated calls are ignored until shutdown().
void init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief Get the global logger instance.
/// @return Pointer to the global Quill logger, nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Flush all pending log messages.
/// @note Blocks until all messages are written.
void flush();

/// @brief Flush and stop the backend thread.
void shutdown();

/// @brief Map the CLI verbosity flags to a log level.
/// @param verbosity Number of -v flags given.
/// @param quiet Whether -q was given (wins over -v).
/// @return kError when quiet, otherwise kInfo, kDebug or kTrace.
[[nodiscard]] Level levelFromVerbosity(int verbosity, bool quiet) noexcept;

}  // namespace masseg::log

// =============================================================================
// Convenience Macros
// =============================================================================
// Messages are dropped silently when the logger has not been initialized,
// so library code stays usable from tests that never call init().

#define MASSEG_LOG_IMPL_(macro, fmt, ...)                                   \
    do {                                                                    \
        if (quill::Logger* masseg_logger_ = masseg::log::logger()) {        \
            macro(masseg_logger_, fmt __VA_OPT__(, ) __VA_ARGS__);          \
        }                                                                   \
    } while (false)

/// @brief Log a trace message.
#define MASSEG_LOG_TRACE(fmt, ...) MASSEG_LOG_IMPL_(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define MASSEG_LOG_DEBUG(fmt, ...) MASSEG_LOG_IMPL_(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define MASSEG_LOG_INFO(fmt, ...) MASSEG_LOG_IMPL_(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define MASSEG_LOG_WARNING(fmt, ...) MASSEG_LOG_IMPL_(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define MASSEG_LOG_ERROR(fmt, ...) MASSEG_LOG_IMPL_(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define MASSEG_LOG_CRITICAL(fmt, ...) \
    MASSEG_LOG_IMPL_(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // MASSEG_COMMON_LOGGER_H
