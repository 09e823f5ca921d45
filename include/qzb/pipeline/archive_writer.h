// =============================================================================
// qzbulk - Archive Writer
// =============================================================================
// Sole user of an archiver that cannot take concurrent writes (tar). Runs on
// its own thread, applies WriteRequests in queue order and closes the
// archive when it dequeues its Shutdown. Once started, the writer alone
// closes the archive, also when its loop ends on an exception.
//
// The controller sends that Shutdown only after every worker has been
// joined, so no write can arrive after the archive is closed.
// =============================================================================

#ifndef QZB_PIPELINE_ARCHIVE_WRITER_H
#define QZB_PIPELINE_ARCHIVE_WRITER_H

#include <string>
#include <thread>

#include "qzb/archive/archiver.h"
#include "qzb/pipeline/message_queue.h"
#include "qzb/pipeline/worker_report.h"

namespace qzb::pipeline {

class ArchiveWriter {
public:
    /// @param archiver Opened for writing; used by this writer only
    ArchiveWriter(archive::Archiver& archiver, ArchiveQueue& queue, PipelineHooks hooks = {});

    /// @brief Shuts the writer down if shutdown() was not called.
    ~ArchiveWriter();

    ArchiveWriter(const ArchiveWriter&) = delete;
    ArchiveWriter& operator=(const ArchiveWriter&) = delete;

    void start();

    /// @brief Queue the Shutdown sentinel and wait for the writer thread.
    /// @return Status 2 if any write or the close failed, else 0. Failed
    ///         writes are listed as "<library>:<path>".
    [[nodiscard]] WorkerReport shutdown();

    [[nodiscard]] bool running() const noexcept { return thread_.joinable(); }

private:
    void run();
    void consume();

    archive::Archiver& archiver_;
    ArchiveQueue& queue_;
    PipelineHooks hooks_;
    std::thread thread_;
    WorkerReport report_;
};

/// @brief "<library>:<path>" of the job an entry was written for; the
///        entry name itself if it does not follow the archive layout.
[[nodiscard]] std::string entryLabel(const std::string& entryName);

}  // namespace qzb::pipeline

#endif  // QZB_PIPELINE_ARCHIVE_WRITER_H
