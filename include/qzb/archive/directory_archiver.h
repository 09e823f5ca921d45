// =============================================================================
// qzbulk - Directory Archiver
// =============================================================================

#ifndef QZB_ARCHIVE_DIRECTORY_ARCHIVER_H
#define QZB_ARCHIVE_DIRECTORY_ARCHIVER_H

#include <atomic>
#include <filesystem>

#include "qzb/archive/archiver.h"

namespace qzb::archive {

/// @brief Archive stored as one file per entry below a root directory.
/// @note write() and read() are safe from several threads as long as they
///       address distinct entries.
class DirectoryArchiver final : public Archiver {
public:
    explicit DirectoryArchiver(std::filesystem::path root);

    ~DirectoryArchiver() override = default;

    void open(ArchiveMode mode) override;
    void write(const std::string& name, Payload payload) override;
    [[nodiscard]] Payload read(const std::string& name) override;

    /// @brief Every regular file below the root, sorted.
    [[nodiscard]] std::vector<std::string> listEntries() override;

    void close() override;

    [[nodiscard]] bool supportsConcurrentWrites() const noexcept override { return true; }
    [[nodiscard]] bool supportsRandomAccess() const noexcept override { return true; }

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    void requireOpen(ArchiveMode mode) const;

    std::filesystem::path root_;
    ArchiveMode mode_ = ArchiveMode::kRead;
    std::atomic<bool> open_{false};
};

}  // namespace qzb::archive

#endif  // QZB_ARCHIVE_DIRECTORY_ARCHIVER_H
