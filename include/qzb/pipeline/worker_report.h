// =============================================================================
// qzbulk - Worker Reports and Pipeline Hooks
// =============================================================================
// Failures never cross a thread boundary as exceptions. Every worker and the
// archive writer return a WorkerReport; the controller aggregates them.
//
// PipelineHooks let an observer follow the shutdown sequence (worker start,
// sentinel receipt, join, writer sentinel receipt). Hooks run on the thread
// that triggers them and must be thread-safe.
// =============================================================================

#ifndef QZB_PIPELINE_WORKER_REPORT_H
#define QZB_PIPELINE_WORKER_REPORT_H

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "qzb/common/types.h"

namespace qzb::pipeline {

/// @brief Outcome of one worker or of the archive writer.
struct WorkerReport {
    ExitStatus status = ExitStatus::kSuccess;

    /// @brief Jobs (or archive writes, for the writer) completed.
    std::size_t transferred = 0;

    /// @brief "<library>:<path>" of every job that failed.
    std::vector<std::string> failedPaths;

    /// @brief Message of the error that ended the worker, if any.
    std::optional<std::string> fatalMessage;

    /// @brief Whether the worker stopped on its Shutdown sentinel.
    bool sawShutdown = false;

    /// @brief Record a failed job and raise the status to at least 1.
    void recordFailure(std::string failedPath) {
        failedPaths.push_back(std::move(failedPath));
        status = aggregate(status, ExitStatus::kTransferFailed);
    }

    /// @brief Record a fatal error and raise the status accordingly.
    void recordFatal(ExitStatus fatalStatus, std::string message) {
        fatalMessage = std::move(message);
        status = aggregate(status, fatalStatus);
    }
};

/// @brief Optional observers of the run. Unset hooks are skipped.
struct PipelineHooks {
    /// @brief A worker thread started (worker index).
    std::function<void(std::size_t)> onWorkerStart;

    /// @brief A worker dequeued its Shutdown sentinel.
    std::function<void(std::size_t)> onWorkerShutdown;

    /// @brief The controller joined a worker thread.
    std::function<void(std::size_t, const WorkerReport&)> onWorkerJoined;

    /// @brief The archive writer dequeued its Shutdown sentinel.
    std::function<void()> onWriterShutdown;
};

}  // namespace qzb::pipeline

#endif  // QZB_PIPELINE_WORKER_REPORT_H
