// =============================================================================
// qzbulk - Queued Tar Archiver Implementation
// =============================================================================

#include "qzb/archive/queued_tar_archiver.h"

#include <utility>

namespace qzb::archive {

void QueuedTarArchiver::open(ArchiveMode mode) {
    if (mode != ArchiveMode::kWrite) {
        throw QZBException(ErrorCode::kInvalidState, "Queued tar archive is write-only");
    }
}

void QueuedTarArchiver::write(const std::string& name, Payload payload) {
    validateEntryName(name);
    if (!queue_.push(WriteRequest{name, std::move(payload)})) {
        throw IOError("Archive writer is no longer accepting entries",
                      ErrorContext{}.withEntry(name));
    }
}

Payload QueuedTarArchiver::read(const std::string& name) {
    throw QZBException(ErrorCode::kInvalidState, "Queued tar archive is write-only",
                       ErrorContext{}.withEntry(name));
}

std::vector<std::string> QueuedTarArchiver::listEntries() {
    throw QZBException(ErrorCode::kInvalidState, "Queued tar archive is write-only");
}

}  // namespace qzb::archive
