// =============================================================================
// qzbulk - Queued Tar Archiver
// =============================================================================

#ifndef QZB_ARCHIVE_QUEUED_TAR_ARCHIVER_H
#define QZB_ARCHIVE_QUEUED_TAR_ARCHIVER_H

#include "qzb/archive/archiver.h"
#include "qzb/pipeline/message_queue.h"

namespace qzb::archive {

/// @brief Worker-side proxy of a tar archive owned by the archive writer.
///
/// write() enqueues a WriteRequest on the archive queue and returns once it
/// is queued; the bounded queue throttles workers when the writer lags.
/// read() and listEntries() are not supported. close() does nothing: the
/// archive writer closes the real archive.
class QueuedTarArchiver final : public Archiver {
public:
    explicit QueuedTarArchiver(pipeline::ArchiveQueue& queue) noexcept : queue_(queue) {}

    void open(ArchiveMode mode) override;
    void write(const std::string& name, Payload payload) override;
    [[nodiscard]] Payload read(const std::string& name) override;
    [[nodiscard]] std::vector<std::string> listEntries() override;
    void close() override {}

    [[nodiscard]] bool supportsConcurrentWrites() const noexcept override { return true; }
    [[nodiscard]] bool supportsRandomAccess() const noexcept override { return false; }

private:
    pipeline::ArchiveQueue& queue_;
};

}  // namespace qzb::archive

#endif  // QZB_ARCHIVE_QUEUED_TAR_ARCHIVER_H
