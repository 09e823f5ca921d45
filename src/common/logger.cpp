// =============================================================================
// qzbulk - Logger Module Implementation
// =============================================================================

#include "qzb/common/logger.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace qzb::log {

namespace {

constexpr const char* kLoggerName = "qzbulk";
constexpr const char* kDefaultContext = "main";

std::atomic<quill::Logger*> gLogger{nullptr};
std::mutex gLifecycleMutex;

thread_local std::string tContext = kDefaultContext;

quill::LogLevel quillLevel(Level level) noexcept {
    switch (level) {
        case Level::kDebug:
            return quill::LogLevel::Debug;
        case Level::kInfo:
            return quill::LogLevel::Info;
        case Level::kWarning:
            return quill::LogLevel::Warning;
        case Level::kError:
            return quill::LogLevel::Error;
    }
    return quill::LogLevel::Warning;
}

std::shared_ptr<quill::Sink> appendingFileSink(const std::string& path) {
    quill::FileSinkConfig config;
    config.set_open_mode('a');
    return quill::Frontend::create_or_get_sink<quill::FileSink>(path, config,
                                                                quill::FileEventNotifier{});
}

}  // namespace

// =============================================================================
// Lifecycle
// =============================================================================

void init(const Options& options) {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::Backend::start(quill::BackendOptions{});

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
    if (!options.logFile.empty()) {
        sinks.push_back(appendingFileSink(options.logFile));
    }

    quill::Logger* logger = quill::Frontend::create_or_get_logger(kLoggerName, std::move(sinks));
    logger->set_log_level(quillLevel(options.level));
    gLogger.store(logger, std::memory_order_release);
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

void flush() {
    if (quill::Logger* current = logger()) {
        current->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    quill::Logger* current = gLogger.exchange(nullptr, std::memory_order_acq_rel);
    if (current == nullptr) {
        return;
    }
    current->flush_log();
    quill::Backend::stop();
}

// =============================================================================
// Thread Context
// =============================================================================

std::string_view threadContext() noexcept {
    return tContext;
}

std::string workerContext(std::size_t index) {
    return fmt::format("worker {}", index);
}

ThreadContext::ThreadContext(std::string label)
    : previous_(std::exchange(tContext, std::move(label))) {}

ThreadContext::~ThreadContext() {
    tContext = std::move(previous_);
}

}  // namespace qzb::log
