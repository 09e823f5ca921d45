// =============================================================================
// qzbulk - Logger Module
// =============================================================================
// Asynchronous logging through Quill, shared by the controller, the workers
// and the archive writer.
//
// Every message is prefixed with the context of the thread that logged it:
//   [main]      controller and enumeration
//   [worker 3]  a transfer worker
//   [writer]    the tar archive writer
// Threads name themselves with a ThreadContext for their lifetime.
//
// Usage:
//   qzb::log::init({.level = qzb::log::levelFor(verbose, debug)});
//   qzb::log::ThreadContext context(qzb::log::workerContext(3));
//   QZB_LOG_INFO("Dumped {} documents", count);
//
// The QZB_LOG_* macros are no-ops until init() has been called, so library
// code may log unconditionally (unit tests never initialize the backend).
// =============================================================================

#ifndef QZB_COMMON_LOGGER_H
#define QZB_COMMON_LOGGER_H

#include <cstddef>
#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace qzb::log {

/// @brief Verbosity of a run.
enum class Level {
    kDebug = 0,    ///< --debug: every transferred item
    kInfo,         ///< --verbose: progress and the run summary
    kWarning,      ///< default: failed items and fatal errors
    kError
};

/// @brief Level selected by the --verbose and --debug flags (debug wins).
[[nodiscard]] constexpr Level levelFor(bool verbose, bool debug) noexcept {
    if (debug) {
        return Level::kDebug;
    }
    return verbose ? Level::kInfo : Level::kWarning;
}

/// @brief Logging setup of one qzbulk process.
struct Options {
    Level level = Level::kWarning;

    /// @brief Also append the log to this file. Empty: stderr only.
    std::string logFile;
};

/// @brief Start the backend and create the process logger.
/// @note Called once from main() before any worker thread is started;
///       later calls are ignored.
void init(const Options& options);

/// @brief The process logger, nullptr before init() and after shutdown().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Write out every message logged so far. Safe before init().
void flush();

/// @brief Flush and stop the backend.
void shutdown();

// =============================================================================
// Thread Context
// =============================================================================

/// @brief Context label of the calling thread ("main" unless set).
[[nodiscard]] std::string_view threadContext() noexcept;

/// @brief "worker <index>".
[[nodiscard]] std::string workerContext(std::size_t index);

/// @brief Labels the calling thread's messages until destroyed.
class ThreadContext {
public:
    explicit ThreadContext(std::string label);
    ~ThreadContext();

    ThreadContext(const ThreadContext&) = delete;
    ThreadContext& operator=(const ThreadContext&) = delete;

private:
    std::string previous_;
};

}  // namespace qzb::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define QZB_LOG_IMPL_(macro, fmt, ...)                                              \
    do {                                                                            \
        if (quill::Logger* qzbLogger_ = qzb::log::logger()) {                       \
            macro(qzbLogger_, "[{}] " fmt, qzb::log::threadContext() __VA_OPT__(, ) \
                      __VA_ARGS__);                                                 \
        }                                                                           \
    } while (false)

#define QZB_LOG_TRACE(fmt, ...) QZB_LOG_IMPL_(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)
#define QZB_LOG_DEBUG(fmt, ...) QZB_LOG_IMPL_(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define QZB_LOG_INFO(fmt, ...) QZB_LOG_IMPL_(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define QZB_LOG_WARNING(fmt, ...) QZB_LOG_IMPL_(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define QZB_LOG_ERROR(fmt, ...) QZB_LOG_IMPL_(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
#define QZB_LOG_CRITICAL(fmt, ...) QZB_LOG_IMPL_(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // QZB_COMMON_LOGGER_H
