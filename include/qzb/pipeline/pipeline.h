// =============================================================================
// qzbulk - Pipeline Controller
// =============================================================================
// Runs one dump or restore end to end.
//
// Multi-job mode (jobs > 1):
//   controller  --JobMessage-->  J workers  --WriteRequest-->  archive writer
//
//   J = jobs - 1 when an archive writer is needed (dump to a tar archive),
//   J = jobs otherwise. Shutdown order: one sentinel per worker, join all
//   workers, then the writer sentinel, then close.
//
// Single-job mode (jobs == 1): no threads and no queues; every job is
// transferred inline by the controller, through the same enumeration and
// transfer code.
//
// States: kInit -> kEnumerating -> kRunning -> kDraining -> kClosed
// =============================================================================

#ifndef QZB_PIPELINE_PIPELINE_H
#define QZB_PIPELINE_PIPELINE_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "qzb/archive/archiver.h"
#include "qzb/common/error.h"
#include "qzb/common/types.h"
#include "qzb/pipeline/worker_report.h"
#include "qzb/remote/remote_store.h"

namespace qzb::pipeline {

// =============================================================================
// Forward Declarations
// =============================================================================

class PipelineControllerImpl;

// =============================================================================
// Pipeline State
// =============================================================================

enum class PipelineState : std::uint8_t {
    kInit = 0,
    kEnumerating,
    kRunning,
    kDraining,
    kClosed
};

[[nodiscard]] constexpr std::string_view pipelineStateToString(PipelineState state) noexcept {
    switch (state) {
        case PipelineState::kInit: return "init";
        case PipelineState::kEnumerating: return "enumerating";
        case PipelineState::kRunning: return "running";
        case PipelineState::kDraining: return "draining";
        case PipelineState::kClosed: return "closed";
    }
    return "unknown";
}

// =============================================================================
// Pipeline Configuration
// =============================================================================

/// @brief Creates the archiver of a run (not yet opened).
using ArchiverFactory = std::function<std::unique_ptr<archive::Archiver>()>;

/// @brief Everything one run needs. Passed explicitly, never read from
///        globals.
struct PipelineConfig {
    TransferDirection direction = TransferDirection::kDump;

    /// @brief Concurrent jobs, archive writer included (>= 1).
    std::size_t jobs = kDefaultJobs;

    /// @brief Dump: the only library to dump. Restore: library override.
    std::optional<std::string> library;

    /// @brief Job queue capacity (0 = kDefaultJobQueueDepthPerWorker per worker).
    std::size_t jobQueueCapacity = 0;

    /// @brief Archive write queue capacity.
    std::size_t archiveQueueCapacity = kDefaultArchiveQueueCapacity;

    archive::ArchiveConfig archive;

    /// @brief Creates the controller's and every worker's RemoteStore.
    remote::RemoteStoreFactory storeFactory;

    /// @brief Replaces makeArchiver(archive) when set.
    ArchiverFactory archiverFactory;

    PipelineHooks hooks;

    /// @brief Validate configuration
    [[nodiscard]] VoidResult validate() const;

    /// @brief Job queue capacity for a number of workers.
    [[nodiscard]] std::size_t effectiveJobQueueCapacity(std::size_t workers) const noexcept;
};

// =============================================================================
// Pipeline Statistics
// =============================================================================

/// @brief Statistics collected during a run.
struct PipelineStats {
    /// @brief Jobs handed to workers (or transferred inline).
    std::size_t jobsQueued = 0;

    std::size_t jobsTransferred = 0;

    /// @brief "<library>:<path>" of every failed job.
    std::vector<std::string> failedPaths;

    /// @brief Entries written by the archive writer.
    std::size_t archiveWrites = 0;

    /// @brief Worker threads used (0 in single-job mode).
    std::size_t workers = 0;

    bool archiveWriterUsed = false;

    std::uint64_t elapsedMs = 0;

    /// @brief Per-worker reports, in worker order.
    std::vector<WorkerReport> workerReports;

    std::optional<WorkerReport> writerReport;
};

// =============================================================================
// PipelineController
// =============================================================================

/// @brief Orchestrates one run.
///
/// Usage:
/// @code
/// PipelineConfig config;
/// config.direction = TransferDirection::kDump;
/// config.archive.format = archive::ArchiveFormat::kTar;
/// config.archive.path = "backup.tar.gz";
/// config.archive.compression = io::CompressionFormat::kGzip;
/// config.storeFactory = remote::makeHttpRemoteStoreFactory(client);
///
/// PipelineController controller(std::move(config));
/// ExitStatus status = controller.run();
/// @endcode
class PipelineController {
public:
    explicit PipelineController(PipelineConfig config);

    ~PipelineController();

    PipelineController(const PipelineController&) = delete;
    PipelineController& operator=(const PipelineController&) = delete;

    /// @brief Run to completion.
    /// @return Aggregated status of the controller, every worker and the
    ///         archive writer
    [[nodiscard]] ExitStatus run();

    /// @brief Interrupt the run from another thread.
    ///
    /// Stops enqueuing, wakes blocked workers and makes run() return
    /// kInterrupted. The archive is still shut down and closed. Safe to call
    /// before, during or after run().
    void cancel() noexcept;

    [[nodiscard]] bool isCancelled() const noexcept;

    [[nodiscard]] PipelineState state() const noexcept;

    [[nodiscard]] const PipelineStats& stats() const noexcept;

    [[nodiscard]] const PipelineConfig& config() const noexcept;

private:
    std::unique_ptr<PipelineControllerImpl> impl_;
};

}  // namespace qzb::pipeline

#endif  // QZB_PIPELINE_PIPELINE_H
