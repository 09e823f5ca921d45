// =============================================================================
// qzbulk - Transfer Worker Implementation
// =============================================================================

#include "qzb/pipeline/worker.h"

#include <utility>
#include <variant>

#include <fmt/format.h>

#include "qzb/archive/archive_layout.h"
#include "qzb/archive/queued_tar_archiver.h"
#include "qzb/common/error.h"
#include "qzb/common/logger.h"
#include "qzb/remote/property_codec.h"

namespace qzb::pipeline {

std::string jobLabel(const Job& job) {
    return fmt::format("{}:{}", job.library, job.path);
}

// =============================================================================
// TransferWorker
// =============================================================================

void TransferWorker::transfer(const Job& job) {
    if (direction_ == TransferDirection::kDump) {
        dump(job);
    } else {
        restore(job);
    }
}

void TransferWorker::process(const Job& job, WorkerReport& report) {
    try {
        transfer(job);
        ++report.transferred;
        QZB_LOG_DEBUG("{} {} {}", directionToString(direction_), jobKindToString(job.kind),
                      jobLabel(job));
    } catch (const QZBException& e) {
        QZB_LOG_WARNING("Failed to {} {} {}: {}", directionToString(direction_),
                        jobKindToString(job.kind), jobLabel(job), e.what());
        report.recordFailure(jobLabel(job));
    }
}

void TransferWorker::dump(const Job& job) {
    if (job.kind == JobKind::kDocument) {
        Payload body = store_.getDocument(job.library, job.path);
        archiver().write(archive::layout::contentEntry(job.library, job.path), std::move(body));
        return;
    }

    remote::PropertySet properties = store_.getProperties(job.library, job.path);
    if (properties.path.empty()) {
        properties.path = job.path;
    }
    archiver().write(archive::layout::propertiesEntry(job.library, job.path),
                     remote::encodeProperties(properties));
}

void TransferWorker::restore(const Job& job) {
    if (job.prefetchError) {
        throw IOError(fmt::format("Cannot read {}: {}", job.entryName, *job.prefetchError));
    }

    if (job.kind == JobKind::kProperties) {
        remote::PropertySet properties =
            remote::decodeProperties(load(job.payload, job.entryName));
        store_.putProperties(job.library, job.path, properties);
        return;
    }

    Payload body = load(job.payload, job.entryName);

    DocumentKind kind = job.documentKind;
    std::optional<remote::PropertySet> properties;
    if (job.propertiesEntry) {
        properties = remote::decodeProperties(load(job.propertiesPayload, *job.propertiesEntry));
        if (const remote::Property* nature = properties->find(remote::kNatureProperty)) {
            kind = remote::parseNature(nature->value) == remote::MemberNature::kNonXmlDocument
                       ? DocumentKind::kNonXml
                       : DocumentKind::kXml;
        }
    }

    store_.putDocument(job.library, job.path, body, kind);
    if (properties) {
        store_.putProperties(job.library, job.path, *properties);
    }
}

Payload TransferWorker::load(const std::optional<Payload>& prefetched, const std::string& entry) {
    if (prefetched) {
        return *prefetched;
    }
    return archiver().read(entry);
}

archive::Archiver& TransferWorker::archiver() {
    if (archiver_ == nullptr) {
        throw QZBException(ErrorCode::kInvalidState, "No archive is available to this worker");
    }
    return *archiver_;
}

// =============================================================================
// WorkerPool
// =============================================================================

WorkerPool::WorkerPool(WorkerPoolConfig config, JobQueue& queue)
    : config_(std::move(config)), queue_(queue) {}

WorkerPool::~WorkerPool() {
    bool running = false;
    for (const auto& thread : threads_) {
        running = running || thread.joinable();
    }
    if (!running) {
        return;
    }

    queue_.interrupt();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void WorkerPool::start() {
    reports_.assign(config_.workers, WorkerReport{});
    alive_.store(config_.workers);
    threads_.reserve(config_.workers);
    for (std::size_t i = 0; i < config_.workers; ++i) {
        threads_.emplace_back([this, i] { run(i); });
    }
    QZB_LOG_DEBUG("Started {} workers", config_.workers);
}

std::vector<WorkerReport> WorkerPool::join() {
    for (std::size_t i = 0; i < threads_.size(); ++i) {
        if (threads_[i].joinable()) {
            threads_[i].join();
        }
        if (config_.hooks.onWorkerJoined) {
            config_.hooks.onWorkerJoined(i, reports_[i]);
        }
    }
    threads_.clear();
    return reports_;
}

void WorkerPool::run(std::size_t index) {
    log::ThreadContext context(log::workerContext(index));
    WorkerReport& report = reports_[index];

    try {
        consume(index, report);
    } catch (const std::exception& e) {
        QZB_LOG_ERROR("Stopped: {}", e.what());
        report.recordFatal(ExitStatus::kFatal, e.what());
    } catch (...) {
        QZB_LOG_ERROR("Stopped by an unknown exception");
        report.recordFatal(ExitStatus::kFatal, "unknown exception");
    }

    // The last worker out closes the queue so no producer waits on it.
    if (alive_.fetch_sub(1) == 1) {
        queue_.interrupt();
    }

    QZB_LOG_DEBUG("Done: {} transferred, {} failed, status {}", report.transferred,
                  report.failedPaths.size(), toExitCode(report.status));
}

void WorkerPool::consume(std::size_t index, WorkerReport& report) {
    if (config_.hooks.onWorkerStart) {
        config_.hooks.onWorkerStart(index);
    }

    std::unique_ptr<remote::RemoteStore> store;
    try {
        store = config_.storeFactory();
        if (!store) {
            throw ConnectionError("No client was created");
        }
    } catch (const std::exception& e) {
        QZB_LOG_ERROR("Cannot connect to the database: {}", e.what());
        report.recordFatal(ExitStatus::kNoClient, e.what());
        return;
    } catch (...) {
        QZB_LOG_ERROR("Cannot connect to the database: unknown exception");
        report.recordFatal(ExitStatus::kNoClient, "unknown exception");
        return;
    }

    std::unique_ptr<archive::QueuedTarArchiver> queued;
    archive::Archiver* archiver = config_.archiver;
    if (config_.archiveQueue != nullptr) {
        queued = std::make_unique<archive::QueuedTarArchiver>(*config_.archiveQueue);
        queued->open(archive::ArchiveMode::kWrite);
        archiver = queued.get();
    }
    TransferWorker worker(config_.direction, *store, archiver);

    while (true) {
        std::optional<JobMessage> message = queue_.pop();
        if (!message) {
            QZB_LOG_DEBUG("Interrupted");
            return;
        }
        if (std::holds_alternative<Shutdown>(*message)) {
            report.sawShutdown = true;
            if (config_.hooks.onWorkerShutdown) {
                config_.hooks.onWorkerShutdown(index);
            }
            return;
        }

        const Job& job = std::get<Job>(*message);
        try {
            worker.process(job, report);
        } catch (const std::exception& e) {
            QZB_LOG_ERROR("Stopped on {}: {}", jobLabel(job), e.what());
            report.recordFailure(jobLabel(job));
            report.recordFatal(ExitStatus::kFatal, e.what());
            return;
        } catch (...) {
            QZB_LOG_ERROR("Stopped on {}: unknown exception", jobLabel(job));
            report.recordFailure(jobLabel(job));
            report.recordFatal(ExitStatus::kFatal, "unknown exception");
            return;
        }
    }
}

}  // namespace qzb::pipeline
