// =============================================================================
// qzbulk - Tar Archiver
// =============================================================================
// Tar archive read and written through libarchive, optionally wrapped in a
// gzip, bzip2, xz or zstd filter.
//
// Writing:
// - pax (restricted) format: plain ustar headers, with pax extended records
//   only for entries ustar cannot describe (long or non-ASCII names)
// - close() finishes the archive and the compression filter
//
// Reading:
// - the tar format and every compression filter libarchive knows are enabled
// - open() scans the archive once and indexes regular file entries
// - read() moves a forward cursor; reading an earlier entry reopens the file
//
// A TarArchiver is not thread-safe: in multi-worker dumps only the archive
// writer thread touches it.
// =============================================================================

#ifndef QZB_ARCHIVE_TAR_ARCHIVER_H
#define QZB_ARCHIVE_TAR_ARCHIVER_H

#include <ctime>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "qzb/archive/archiver.h"
#include "qzb/io/compression_format.h"

struct archive;

namespace qzb::archive {

class TarArchiver final : public Archiver {
public:
    /// @param compression Compression used when writing; reading detects it.
    TarArchiver(std::filesystem::path path, io::CompressionFormat compression,
                int compressionLevel = io::kDefaultCompressionLevel);

    ~TarArchiver() override;

    TarArchiver(const TarArchiver&) = delete;
    TarArchiver& operator=(const TarArchiver&) = delete;

    void open(ArchiveMode mode) override;
    void write(const std::string& name, Payload payload) override;
    [[nodiscard]] Payload read(const std::string& name) override;
    [[nodiscard]] std::vector<std::string> listEntries() override;
    void close() override;

    [[nodiscard]] bool supportsConcurrentWrites() const noexcept override { return false; }
    [[nodiscard]] bool supportsRandomAccess() const noexcept override { return false; }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    /// @brief Compression filter found on the archive being read.
    /// @note kNone before open(ArchiveMode::kRead).
    [[nodiscard]] io::CompressionFormat detectedCompression() const noexcept {
        return detected_;
    }

private:
    struct WriteHandleDeleter {
        void operator()(struct ::archive* handle) const noexcept;
    };
    struct ReadHandleDeleter {
        void operator()(struct ::archive* handle) const noexcept;
    };
    using WriteHandle = std::unique_ptr<struct ::archive, WriteHandleDeleter>;
    using ReadHandle = std::unique_ptr<struct ::archive, ReadHandleDeleter>;

    void openWriter();
    void buildIndex();
    void rewind();

    /// @brief Advance to the next regular file entry of the read handle.
    /// @return Its name, or std::nullopt at the end of the archive
    std::optional<std::string> nextEntry();

    std::filesystem::path path_;
    io::CompressionFormat compression_;
    int compressionLevel_;
    std::time_t mtime_ = 0;

    std::optional<ArchiveMode> mode_;
    bool closed_ = false;

    // write side
    WriteHandle writer_;
    std::vector<std::string> written_;

    // read side
    ReadHandle reader_;
    io::CompressionFormat detected_ = io::CompressionFormat::kNone;
    std::vector<std::string> index_;
    std::unordered_map<std::string, std::size_t> positions_;
    std::size_t cursor_ = 0;
};

}  // namespace qzb::archive

#endif  // QZB_ARCHIVE_TAR_ARCHIVER_H
