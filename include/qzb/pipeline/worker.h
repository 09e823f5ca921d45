// =============================================================================
// qzbulk - Transfer Workers
// =============================================================================
// TransferWorker moves one job between the remote store and the archive.
// WorkerPool runs J of them on their own threads, each consuming the shared
// job queue with its own RemoteStore.
//
// Worker loop:
// - Job      -> transfer; a QZBException fails the job (status >= 1) and
//               the loop continues
// - Shutdown -> stop, reporting the current status
// - queue interrupted -> stop silently
//
// A worker that cannot create its RemoteStore (status 100) or that hits an
// unexpected exception of any type (status 2) exits at once; its siblings
// keep consuming. When the last worker exits the pool interrupts the job
// queue, so a producer never blocks on a queue nobody drains. Jobs still
// queued at that point are left for the controller to count as failed.
// =============================================================================

#ifndef QZB_PIPELINE_WORKER_H
#define QZB_PIPELINE_WORKER_H

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "qzb/archive/archiver.h"
#include "qzb/common/types.h"
#include "qzb/pipeline/message_queue.h"
#include "qzb/pipeline/worker_report.h"
#include "qzb/remote/remote_store.h"

namespace qzb::pipeline {

// =============================================================================
// TransferWorker
// =============================================================================

/// @brief Transfers jobs through one RemoteStore and one Archiver.
///
/// Dump:    document body -> <library>/content<path>
///          property set  -> <library>/properties<path>/.properties
/// Restore: the reverse. A document job stores the body first, then its
///          companion property set; the "nature" property selects XML or
///          non-XML storage.
class TransferWorker {
public:
    /// @param archiver May be null for restore jobs that carry their payloads
    TransferWorker(TransferDirection direction, remote::RemoteStore& store,
                   archive::Archiver* archiver) noexcept
        : direction_(direction), store_(store), archiver_(archiver) {}

    /// @brief Transfer one job.
    /// @throws QZBException on any transfer failure
    void transfer(const Job& job);

    /// @brief Transfer one job, recording a QZBException in the report.
    /// @note Other exceptions propagate.
    void process(const Job& job, WorkerReport& report);

private:
    void dump(const Job& job);
    void restore(const Job& job);
    Payload load(const std::optional<Payload>& prefetched, const std::string& entry);
    archive::Archiver& archiver();

    TransferDirection direction_;
    remote::RemoteStore& store_;
    archive::Archiver* archiver_;
};

/// @brief "<library>:<path>" as recorded in failure lists.
[[nodiscard]] std::string jobLabel(const Job& job);

// =============================================================================
// WorkerPool
// =============================================================================

/// @brief Parameters shared by all workers of a pool.
struct WorkerPoolConfig {
    TransferDirection direction = TransferDirection::kDump;

    /// @brief Number of worker threads (J).
    std::size_t workers = 1;

    remote::RemoteStoreFactory storeFactory;

    /// @brief Archiver shared by all workers (thread-safe archivers only).
    archive::Archiver* archiver = nullptr;

    /// @brief When set, each worker writes through a QueuedTarArchiver
    ///        feeding this queue instead of using archiver.
    ArchiveQueue* archiveQueue = nullptr;

    PipelineHooks hooks;
};

/// @brief Fixed set of worker threads consuming one job queue.
class WorkerPool {
public:
    WorkerPool(WorkerPoolConfig config, JobQueue& queue);

    /// @brief Interrupts the queue and joins threads still running.
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// @brief Start all worker threads.
    void start();

    /// @brief Wait for every worker and collect their reports (worker order).
    /// @note The caller must have queued one Shutdown per alive() worker, or
    ///       interrupted the queue.
    [[nodiscard]] std::vector<WorkerReport> join();

    [[nodiscard]] std::size_t size() const noexcept { return config_.workers; }

    /// @brief Workers still consuming the queue.
    [[nodiscard]] std::size_t alive() const noexcept { return alive_.load(); }

private:
    void run(std::size_t index);
    void consume(std::size_t index, WorkerReport& report);

    WorkerPoolConfig config_;
    JobQueue& queue_;
    std::vector<std::thread> threads_;
    std::vector<WorkerReport> reports_;
    std::atomic<std::size_t> alive_{0};
};

}  // namespace qzb::pipeline

#endif  // QZB_PIPELINE_WORKER_H
