// =============================================================================
// qzbulk - Archiver Interface
// =============================================================================
// Local container of dumped documents and property sets.
//
// Variants (closed set, selected from ArchiveConfig):
// - DirectoryArchiver: one file per entry, safe for concurrent writers
// - TarArchiver: single tar stream, optionally compressed, single writer
// - QueuedTarArchiver: worker-side proxy forwarding writes to the
//   archive writer thread
//
// Entry names are relative '/'-separated paths. Absolute names, empty
// components and ".." components are rejected with FormatError.
// =============================================================================

#ifndef QZB_ARCHIVE_ARCHIVER_H
#define QZB_ARCHIVE_ARCHIVER_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "qzb/common/error.h"
#include "qzb/common/types.h"
#include "qzb/io/compression_format.h"

namespace qzb::archive {

// =============================================================================
// Configuration
// =============================================================================

/// @brief Access mode an archive is opened in.
enum class ArchiveMode : std::uint8_t {
    kRead = 0,
    kWrite = 1
};

/// @brief Container format.
enum class ArchiveFormat : std::uint8_t {
    kDirectory = 0,
    kTar = 1
};

[[nodiscard]] constexpr std::string_view archiveFormatToString(ArchiveFormat format) noexcept {
    switch (format) {
        case ArchiveFormat::kDirectory: return "directory";
        case ArchiveFormat::kTar: return "tar";
    }
    return "unknown";
}

/// @brief Selects and parameterizes the archiver of a run.
struct ArchiveConfig {
    ArchiveFormat format = ArchiveFormat::kDirectory;

    /// @brief Directory root or tar file path.
    std::filesystem::path path = ".";

    /// @brief Stream compression (tar only; detected from magic bytes on read).
    io::CompressionFormat compression = io::CompressionFormat::kNone;

    /// @brief Codec level (1-9).
    int compressionLevel = io::kDefaultCompressionLevel;

    /// @brief Validate the configuration.
    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Archiver Interface
// =============================================================================

/// @brief Abstract archive container.
class Archiver {
public:
    virtual ~Archiver() = default;

    /// @brief Open the underlying resource.
    /// @throws IOError if the resource cannot be opened
    virtual void open(ArchiveMode mode) = 0;

    /// @brief Store an entry.
    /// @throws FormatError for an invalid entry name
    /// @throws IOError on write failure
    virtual void write(const std::string& name, Payload payload) = 0;

    /// @brief Read an entry.
    /// @throws IOError if the entry does not exist or cannot be read
    [[nodiscard]] virtual Payload read(const std::string& name) = 0;

    /// @brief List entry names.
    /// @note Sorted for directories, stream order for tar files.
    [[nodiscard]] virtual std::vector<std::string> listEntries() = 0;

    /// @brief Release the underlying resource. Idempotent.
    /// @throws IOError if buffered data cannot be flushed
    virtual void close() = 0;

    /// @brief Whether several threads may write (and read) at the same time.
    /// @note When false, only one thread at a time may use the archiver.
    [[nodiscard]] virtual bool supportsConcurrentWrites() const noexcept = 0;

    /// @brief Whether read() is cheap in any order.
    [[nodiscard]] virtual bool supportsRandomAccess() const noexcept = 0;
};

/// @brief Create the archiver selected by a configuration (not yet opened).
/// @throws UsageError or QZBException if the configuration is invalid
[[nodiscard]] std::unique_ptr<Archiver> makeArchiver(const ArchiveConfig& config);

/// @brief Validate an archive entry name.
/// @throws FormatError if the name is empty, absolute, or has empty, "." or
///         ".." components
void validateEntryName(std::string_view name);

// =============================================================================
// ArchiveCloser
// =============================================================================

/// @brief Closes an archiver when leaving scope.
///
/// Call close() on the normal path to observe flush errors; the destructor
/// closes on every other exit path and logs failures.
class ArchiveCloser {
public:
    explicit ArchiveCloser(Archiver* archiver) noexcept : archiver_(archiver) {}

    ~ArchiveCloser();

    ArchiveCloser(const ArchiveCloser&) = delete;
    ArchiveCloser& operator=(const ArchiveCloser&) = delete;

    /// @brief Close now.
    /// @throws IOError from Archiver::close()
    void close();

    /// @brief Stop managing the archiver (ownership handed elsewhere).
    void release() noexcept { archiver_ = nullptr; }

private:
    Archiver* archiver_;
};

}  // namespace qzb::archive

#endif  // QZB_ARCHIVE_ARCHIVER_H
