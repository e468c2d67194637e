// =============================================================================
// mas-segmenter - Logger Module Implementation
// =============================================================================

#include "masseg/common/logger.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace masseg::log {

namespace {

std::atomic<quill::Logger*> gLogger{nullptr};
std::mutex gInitMutex;

constexpr const char* kLoggerName = "masseg";

quill::LogLevel toQuillLevel(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return quill::LogLevel::TraceL1;
        case Level::kDebug:
            return quill::LogLevel::Debug;
        case Level::kInfo:
            return quill::LogLevel::Info;
        case Level::kWarning:
            return quill::LogLevel::Warning;
        case Level::kError:
            return quill::LogLevel::Error;
        case Level::kCritical:
            return quill::LogLevel::Critical;
    }
    return quill::LogLevel::Info;
}

}  // namespace

Level levelFromVerbosity(int verbosity, bool quiet) noexcept {
    if (quiet) {
        return Level::kError;
    }
    switch (verbosity) {
        case 0:
            return Level::kInfo;
        case 1:
            return Level::kDebug;
        default:
            return verbosity < 0 ? Level::kInfo : Level::kTrace;
    }
}

// =============================================================================
// Lifetime
// =============================================================================

void init(std::string_view logFile, Level level) {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::Backend::start(quill::BackendOptions{});

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("masseg_console"));

    if (!logFile.empty()) {
        quill::FileSinkConfig fileConfig;
        fileConfig.set_open_mode('w');
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
            std::string(logFile), fileConfig, quill::FileEventNotifier{}));
    }

    quill::Logger* created = quill::Frontend::create_or_get_logger(kLoggerName, std::move(sinks));
    created->set_log_level(toQuillLevel(level));
    gLogger.store(created, std::memory_order_release);
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

void flush() {
    if (quill::Logger* current = logger(); current != nullptr) {
        current->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);
    quill::Logger* current = gLogger.exchange(nullptr, std::memory_order_acq_rel);
    if (current == nullptr) {
        return;
    }
    current->flush_log();
    quill::Backend::stop();
}

}  // namespace masseg::log
