// =============================================================================
// qzbulk - Pipeline Controller Implementation
// =============================================================================

#include "qzb/pipeline/pipeline.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <variant>
#include <utility>

#include <fmt/format.h>

#include "qzb/archive/archive_layout.h"
#include "qzb/common/logger.h"
#include "qzb/pipeline/archive_writer.h"
#include "qzb/pipeline/job_enumerator.h"
#include "qzb/pipeline/message_queue.h"
#include "qzb/pipeline/worker.h"

namespace qzb::pipeline {

// =============================================================================
// PipelineConfig Implementation
// =============================================================================

VoidResult PipelineConfig::validate() const {
    if (jobs == 0) {
        return makeVoidError(ErrorCode::kInvalidArgument, "Number of jobs must be >= 1");
    }

    if (!storeFactory) {
        return makeVoidError(ErrorCode::kInvalidArgument, "No database client configured");
    }

    if (library && !archive::layout::isValidLibraryName(*library)) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("Invalid library name '{}'", *library));
    }

    if (archiveQueueCapacity == 0) {
        return makeVoidError(ErrorCode::kInvalidArgument, "Archive queue capacity must be > 0");
    }

    if (!archiverFactory) {
        if (auto result = archive.validate(); !result) {
            return result;
        }
    }

    return {};
}

std::size_t PipelineConfig::effectiveJobQueueCapacity(std::size_t workers) const noexcept {
    if (jobQueueCapacity > 0) {
        return jobQueueCapacity;
    }
    return std::max<std::size_t>(workers, 1) * kDefaultJobQueueDepthPerWorker;
}

// =============================================================================
// PipelineControllerImpl
// =============================================================================

class PipelineControllerImpl {
public:
    explicit PipelineControllerImpl(PipelineConfig config) : config_(std::move(config)) {}

    ExitStatus run() {
        stats_ = PipelineStats{};
        setState(PipelineState::kInit);
        auto startTime = std::chrono::steady_clock::now();

        ExitStatus status = ExitStatus::kSuccess;
        if (auto result = config_.validate(); !result) {
            QZB_LOG_ERROR("Invalid configuration: {}", result.error().message());
            status = ExitStatus::kFatal;
        } else {
            try {
                status = execute();
            } catch (const std::exception& e) {
                QZB_LOG_ERROR("Stopped: {}", e.what());
                status = ExitStatus::kFatal;
            }
        }

        if (cancelled_.load()) {
            status = aggregate(status, ExitStatus::kInterrupted);
        }

        auto endTime = std::chrono::steady_clock::now();
        stats_.elapsedMs = static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(endTime - startTime).count());
        setState(PipelineState::kClosed);

        QZB_LOG_INFO("{} finished in {} ms: {} of {} jobs transferred, {} failed, status {} ({})",
                     directionToString(config_.direction), stats_.elapsedMs,
                     stats_.jobsTransferred, stats_.jobsQueued, stats_.failedPaths.size(),
                     toExitCode(status), exitStatusToString(status));
        return status;
    }

    void cancel() noexcept {
        cancelled_.store(true);
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (activeQueue_ != nullptr) {
            activeQueue_->interrupt();
        }
    }

    [[nodiscard]] bool isCancelled() const noexcept { return cancelled_.load(); }

    [[nodiscard]] PipelineState state() const noexcept { return state_.load(); }

    [[nodiscard]] const PipelineStats& stats() const noexcept { return stats_; }

    [[nodiscard]] const PipelineConfig& config() const noexcept { return config_; }

private:
    /// Publishes the job queue to cancel() for the lifetime of a scope.
    class ActiveQueue {
    public:
        ActiveQueue(PipelineControllerImpl& owner, JobQueue& queue) : owner_(owner) {
            std::lock_guard<std::mutex> lock(owner_.queueMutex_);
            owner_.activeQueue_ = &queue;
            if (owner_.cancelled_.load()) {
                queue.interrupt();
            }
        }

        ~ActiveQueue() {
            std::lock_guard<std::mutex> lock(owner_.queueMutex_);
            owner_.activeQueue_ = nullptr;
        }

        ActiveQueue(const ActiveQueue&) = delete;
        ActiveQueue& operator=(const ActiveQueue&) = delete;

    private:
        PipelineControllerImpl& owner_;
    };

    void setState(PipelineState state) noexcept {
        state_.store(state);
        QZB_LOG_TRACE("Pipeline state: {}", pipelineStateToString(state));
    }

    ExitStatus execute() {
        std::unique_ptr<remote::RemoteStore> store;
        try {
            store = config_.storeFactory();
            if (!store) {
                throw ConnectionError("No client was created");
            }
        } catch (const std::exception& e) {
            QZB_LOG_ERROR("Cannot connect to the database: {}", e.what());
            return ExitStatus::kNoClient;
        } catch (...) {
            QZB_LOG_ERROR("Cannot connect to the database: unknown exception");
            return ExitStatus::kNoClient;
        }

        const archive::ArchiveMode mode = config_.direction == TransferDirection::kDump
                                              ? archive::ArchiveMode::kWrite
                                              : archive::ArchiveMode::kRead;
        std::unique_ptr<archive::Archiver> archiver;
        try {
            archiver = config_.archiverFactory ? config_.archiverFactory()
                                               : archive::makeArchiver(config_.archive);
            archiver->open(mode);
        } catch (const std::exception& e) {
            QZB_LOG_ERROR("Cannot open the archive {}: {}", config_.archive.path.string(),
                          e.what());
            return ExitStatus::kFatal;
        }

        archive::ArchiveCloser closer(archiver.get());
        ExitStatus status = config_.jobs == 1 ? runSingle(*store, *archiver)
                                              : runMulti(*store, *archiver, closer);

        try {
            closer.close();
        } catch (const std::exception& e) {
            QZB_LOG_ERROR("Failed to close the archive: {}", e.what());
            status = aggregate(status, ExitStatus::kFatal);
        }
        return status;
    }

    ExitStatus runSingle(remote::RemoteStore& store, archive::Archiver& archiver) {
        setState(PipelineState::kEnumerating);

        TransferWorker worker(config_.direction, store, &archiver);
        WorkerReport report;
        JobSink sink = [&](Job job) {
            if (cancelled_.load()) {
                return false;
            }
            ++stats_.jobsQueued;
            try {
                worker.process(job, report);
            } catch (const std::exception& e) {
                QZB_LOG_ERROR("Stopped on {}: {}", jobLabel(job), e.what());
                report.recordFailure(jobLabel(job));
                report.recordFatal(ExitStatus::kFatal, e.what());
                return false;
            } catch (...) {
                QZB_LOG_ERROR("Stopped on {}: unknown exception", jobLabel(job));
                report.recordFailure(jobLabel(job));
                report.recordFatal(ExitStatus::kFatal, "unknown exception");
                return false;
            }
            return true;
        };

        setState(PipelineState::kRunning);
        ExitStatus status = enumerate(store, archiver, false, sink);
        setState(PipelineState::kDraining);

        collect(report);
        return aggregate(status, report.status);
    }

    ExitStatus runMulti(remote::RemoteStore& store, archive::Archiver& archiver,
                        archive::ArchiveCloser& closer) {
        setState(PipelineState::kEnumerating);

        const bool sharedArchiver = archiver.supportsConcurrentWrites();
        const bool useWriter = config_.direction == TransferDirection::kDump && !sharedArchiver;
        const bool prefetch = config_.direction == TransferDirection::kRestore && !sharedArchiver;
        const std::size_t workers = useWriter ? config_.jobs - 1 : config_.jobs;

        std::optional<ArchiveQueue> archiveQueue;
        std::optional<ArchiveWriter> writer;
        if (useWriter) {
            archiveQueue.emplace(config_.archiveQueueCapacity);
            writer.emplace(archiver, *archiveQueue, config_.hooks);
            writer->start();
            closer.release();
        }

        JobQueue jobQueue(config_.effectiveJobQueueCapacity(workers));

        WorkerPoolConfig poolConfig;
        poolConfig.direction = config_.direction;
        poolConfig.workers = workers;
        poolConfig.storeFactory = config_.storeFactory;
        poolConfig.archiver = sharedArchiver ? &archiver : nullptr;
        poolConfig.archiveQueue = useWriter ? &*archiveQueue : nullptr;
        poolConfig.hooks = config_.hooks;

        WorkerPool pool(std::move(poolConfig), jobQueue);
        ActiveQueue active(*this, jobQueue);

        stats_.workers = workers;
        stats_.archiveWriterUsed = useWriter;
        QZB_LOG_INFO("Starting {} with {} workers{}", directionToString(config_.direction),
                     workers, useWriter ? " and an archive writer" : "");
        pool.start();
        setState(PipelineState::kRunning);

        JobSink sink = [&](Job job) {
            if (cancelled_.load() || !jobQueue.push(JobMessage{std::move(job)})) {
                return false;
            }
            ++stats_.jobsQueued;
            return true;
        };
        ExitStatus status = enumerate(store, archiver, prefetch, sink);

        setState(PipelineState::kDraining);
        // Workers that already stopped on a fatal error take no sentinel.
        const std::size_t alive = pool.alive();
        for (std::size_t i = 0; i < alive; ++i) {
            if (!jobQueue.push(JobMessage{Shutdown{}})) {
                break;
            }
        }
        stats_.workerReports = pool.join();
        for (const WorkerReport& report : stats_.workerReports) {
            collect(report);
            status = aggregate(status, report.status);
        }

        // Left behind when every worker stopped early or the run was cancelled.
        for (JobMessage& message : jobQueue.drain()) {
            if (const Job* job = std::get_if<Job>(&message)) {
                stats_.failedPaths.push_back(jobLabel(*job));
                status = aggregate(status, ExitStatus::kTransferFailed);
            }
        }

        if (writer) {
            WorkerReport report = writer->shutdown();
            stats_.archiveWrites = report.transferred;
            // A worker counts a dump job once its write is queued.
            stats_.jobsTransferred -= std::min(stats_.jobsTransferred, report.failedPaths.size());
            stats_.failedPaths.insert(stats_.failedPaths.end(), report.failedPaths.begin(),
                                      report.failedPaths.end());
            status = aggregate(status, report.status);
            stats_.writerReport = std::move(report);
        }
        return status;
    }

    ExitStatus enumerate(remote::RemoteStore& store, archive::Archiver& archiver, bool prefetch,
                         const JobSink& sink) {
        try {
            if (config_.direction == TransferDirection::kDump) {
                DumpEnumerator enumerator(store);
                for (const std::string& library : enumerator.resolveLibraries(config_.library)) {
                    if (!enumerator.enumerate(library, sink)) {
                        break;
                    }
                }
            } else {
                RestoreEnumerator enumerator(archiver, store, {config_.library, prefetch});
                static_cast<void>(enumerator.enumerate(sink));
            }
        } catch (const std::exception& e) {
            QZB_LOG_ERROR("Enumeration failed: {}", e.what());
            return ExitStatus::kFatal;
        } catch (...) {
            QZB_LOG_ERROR("Enumeration failed: unknown exception");
            return ExitStatus::kFatal;
        }
        return ExitStatus::kSuccess;
    }

    void collect(const WorkerReport& report) {
        stats_.jobsTransferred += report.transferred;
        stats_.failedPaths.insert(stats_.failedPaths.end(), report.failedPaths.begin(),
                                  report.failedPaths.end());
    }

    PipelineConfig config_;
    PipelineStats stats_;
    std::atomic<PipelineState> state_{PipelineState::kInit};
    std::atomic<bool> cancelled_{false};
    std::mutex queueMutex_;
    JobQueue* activeQueue_ = nullptr;
};

// =============================================================================
// PipelineController Implementation
// =============================================================================

PipelineController::PipelineController(PipelineConfig config)
    : impl_(std::make_unique<PipelineControllerImpl>(std::move(config))) {}

PipelineController::~PipelineController() = default;

ExitStatus PipelineController::run() {
    return impl_->run();
}

void PipelineController::cancel() noexcept {
    impl_->cancel();
}

bool PipelineController::isCancelled() const noexcept {
    return impl_->isCancelled();
}

PipelineState PipelineController::state() const noexcept {
    return impl_->state();
}

const PipelineStats& PipelineController::stats() const noexcept {
    return impl_->stats();
}

const PipelineConfig& PipelineController::config() const noexcept {
    return impl_->config();
}

}  // namespace qzb::pipeline
