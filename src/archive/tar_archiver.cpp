// =============================================================================
// qzbulk - Tar Archiver Implementation
// =============================================================================

#include "qzb/archive/tar_archiver.h"

#include <archive.h>
#include <archive_entry.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "qzb/common/logger.h"

namespace qzb::archive {

namespace {

constexpr std::size_t kReadBlockSize = 64 * 1024;

std::string archiveError(struct ::archive* handle) {
    const char* message = archive_error_string(handle);
    return message ? message : "unknown libarchive error";
}

/// Owns one archive_entry for the duration of a write.
class EntryHolder {
public:
    EntryHolder() : entry_(archive_entry_new()) {
        if (!entry_) {
            throw IOError("Out of memory allocating a tar entry");
        }
    }
    ~EntryHolder() { archive_entry_free(entry_); }

    EntryHolder(const EntryHolder&) = delete;
    EntryHolder& operator=(const EntryHolder&) = delete;

    [[nodiscard]] archive_entry* get() const noexcept { return entry_; }

private:
    archive_entry* entry_;
};

}  // namespace

void TarArchiver::WriteHandleDeleter::operator()(struct ::archive* handle) const noexcept {
    archive_write_free(handle);
}

void TarArchiver::ReadHandleDeleter::operator()(struct ::archive* handle) const noexcept {
    archive_read_free(handle);
}

// =============================================================================
// TarArchiver
// =============================================================================

TarArchiver::TarArchiver(std::filesystem::path path, io::CompressionFormat compression,
                         int compressionLevel)
    : path_(std::move(path)), compression_(compression), compressionLevel_(compressionLevel) {}

TarArchiver::~TarArchiver() {
    if (mode_ == ArchiveMode::kWrite && !closed_) {
        try {
            close();
        } catch (const std::exception& e) {
            QZB_LOG_ERROR("Failed to close tar archive {}: {}", path_.string(), e.what());
        }
    }
}

void TarArchiver::open(ArchiveMode mode) {
    if (mode_) {
        throw QZBException(ErrorCode::kInvalidState,
                           fmt::format("Tar archive {} is already open", path_.string()));
    }

    if (mode == ArchiveMode::kWrite) {
        openWriter();
        mtime_ = std::time(nullptr);
        QZB_LOG_DEBUG("Opened tar archive {} for writing ({})", path_.string(),
                      io::compressionFormatName(compression_));
    } else {
        buildIndex();
        QZB_LOG_DEBUG("Opened tar archive {} for reading ({}): {} entries", path_.string(),
                      io::compressionFormatName(detected_), index_.size());
    }
    mode_ = mode;
}

void TarArchiver::openWriter() {
    WriteHandle handle(archive_write_new());
    if (!handle) {
        throw IOError("Out of memory allocating a tar writer",
                      ErrorContext{}.withPath(path_.string()));
    }

    auto check = [&](int status, std::string_view what) {
        if (status < ARCHIVE_WARN) {
            throw IOError(fmt::format("Failed to {}: {}", what, archiveError(handle.get())),
                          ErrorContext{}.withPath(path_.string()));
        }
        if (status == ARCHIVE_WARN) {
            QZB_LOG_WARNING("Tar archive {}: {}", path_.string(), archiveError(handle.get()));
        }
    };

    check(archive_write_set_format_pax_restricted(handle.get()), "select the tar format");
    if (compression_ != io::CompressionFormat::kNone) {
        const std::string filter(io::compressionFormatName(compression_));
        check(archive_write_add_filter_by_name(handle.get(), filter.c_str()),
              fmt::format("enable {} compression", filter));
        const std::string level = std::to_string(compressionLevel_);
        check(archive_write_set_filter_option(handle.get(), nullptr, "compression-level",
                                              level.c_str()),
              "set the compression level");
    }
    check(archive_write_open_filename(handle.get(), path_.c_str()), "create the tar archive");

    writer_ = std::move(handle);
}

void TarArchiver::rewind() {
    ReadHandle handle(archive_read_new());
    if (!handle) {
        throw IOError("Out of memory allocating a tar reader",
                      ErrorContext{}.withPath(path_.string()));
    }
    archive_read_support_format_tar(handle.get());
    archive_read_support_filter_all(handle.get());

    if (archive_read_open_filename(handle.get(), path_.c_str(), kReadBlockSize) != ARCHIVE_OK) {
        throw IOError(fmt::format("Failed to open tar archive: {}", archiveError(handle.get())),
                      ErrorContext{}.withPath(path_.string()));
    }
    reader_ = std::move(handle);
    cursor_ = 0;
}

std::optional<std::string> TarArchiver::nextEntry() {
    for (;;) {
        archive_entry* entry = nullptr;
        const int status = archive_read_next_header(reader_.get(), &entry);
        if (status == ARCHIVE_EOF) {
            return std::nullopt;
        }
        if (status == ARCHIVE_RETRY) {
            continue;
        }
        if (status < ARCHIVE_WARN) {
            throw FormatError(fmt::format("Corrupt tar archive: {}", archiveError(reader_.get())),
                              ErrorContext{}.withPath(path_.string()));
        }
        if (status == ARCHIVE_WARN) {
            QZB_LOG_WARNING("Tar archive {}: {}", path_.string(), archiveError(reader_.get()));
        }

        // directories, links, devices: no content of interest
        if (archive_entry_filetype(entry) != AE_IFREG) {
            continue;
        }

        const char* utf8 = archive_entry_pathname_utf8(entry);
        std::string name = utf8 ? utf8 : "";
        if (name.starts_with("./")) {
            name.erase(0, 2);
        }
        return name;
    }
}

void TarArchiver::buildIndex() {
    rewind();
    index_.clear();
    positions_.clear();

    try {
        while (auto name = nextEntry()) {
            validateEntryName(*name);
            positions_[*name] = index_.size();
            index_.push_back(std::move(*name));
        }
    } catch (const FormatError& e) {
        throw FormatError(e.message(), ErrorContext{}.withEntry(path_.string()));
    }

    // filter 0 is the one closest to the tar format, "none" when uncompressed
    const char* filter = archive_filter_name(reader_.get(), 0);
    detected_ = io::compressionFormatFromName(filter ? filter : "none");
    if (detected_ == io::CompressionFormat::kUnknown) {
        QZB_LOG_DEBUG("Tar archive {} uses filter {}", path_.string(), filter);
    }

    rewind();
}

void TarArchiver::write(const std::string& name, Payload payload) {
    validateEntryName(name);
    if (mode_ != ArchiveMode::kWrite || closed_) {
        throw QZBException(ErrorCode::kInvalidState,
                           fmt::format("Tar archive {} is not open for writing", path_.string()));
    }

    EntryHolder entry;
    archive_entry_set_pathname_utf8(entry.get(), name.c_str());
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(payload.size()));
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), 0644);
    archive_entry_set_mtime(entry.get(), mtime_, 0);

    const int status = archive_write_header(writer_.get(), entry.get());
    if (status < ARCHIVE_WARN) {
        throw IOError(fmt::format("Failed to write tar header: {}", archiveError(writer_.get())),
                      ErrorContext{}.withEntry(name));
    }
    if (status == ARCHIVE_WARN) {
        QZB_LOG_WARNING("Tar entry {}: {}", name, archiveError(writer_.get()));
    }

    if (!payload.empty()) {
        const la_ssize_t written = archive_write_data(writer_.get(), payload.data(), payload.size());
        if (written < 0 || static_cast<std::size_t>(written) != payload.size()) {
            throw IOError(fmt::format("Failed to write tar entry: {}", archiveError(writer_.get())),
                          ErrorContext{}.withEntry(name));
        }
    }
    written_.push_back(name);
}

Payload TarArchiver::read(const std::string& name) {
    if (mode_ != ArchiveMode::kRead || closed_) {
        throw QZBException(ErrorCode::kInvalidState,
                           fmt::format("Tar archive {} is not open for reading", path_.string()));
    }

    auto it = positions_.find(name);
    if (it == positions_.end()) {
        throw IOError("No such archive entry", ErrorContext{}.withEntry(name));
    }
    const std::size_t target = it->second;

    if (target < cursor_) {
        QZB_LOG_TRACE("Rewinding tar archive {} to read {}", path_.string(), name);
        rewind();
    }

    std::optional<std::string> found;
    try {
        while (cursor_ <= target) {
            found = nextEntry();
            if (!found) {
                throw FormatError("Tar archive ended early");
            }
            ++cursor_;
        }
    } catch (const FormatError& e) {
        // the read handle is unusable after a fatal error
        reader_.reset();
        rewind();
        throw FormatError(e.message(), ErrorContext{}.withEntry(name));
    }
    if (*found != name) {
        throw FormatError("Tar archive changed while reading", ErrorContext{}.withEntry(name));
    }

    Payload payload;
    std::vector<std::uint8_t> block(kReadBlockSize);
    for (;;) {
        const la_ssize_t got = archive_read_data(reader_.get(), block.data(), block.size());
        if (got == 0) {
            break;
        }
        if (got < 0) {
            const std::string message = archiveError(reader_.get());
            reader_.reset();
            rewind();
            throw IOError(fmt::format("Failed to read tar entry: {}", message),
                          ErrorContext{}.withEntry(name));
        }
        payload.insert(payload.end(), block.begin(), block.begin() + got);
    }
    return payload;
}

std::vector<std::string> TarArchiver::listEntries() {
    if (mode_ == ArchiveMode::kWrite) {
        return written_;
    }
    if (mode_ != ArchiveMode::kRead) {
        throw QZBException(ErrorCode::kInvalidState,
                           fmt::format("Tar archive {} is not open", path_.string()));
    }
    return index_;
}

void TarArchiver::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    if (mode_ == ArchiveMode::kWrite) {
        WriteHandle handle = std::move(writer_);
        if (archive_write_close(handle.get()) != ARCHIVE_OK) {
            throw IOError(fmt::format("Failed to finish tar archive: {}",
                                      archiveError(handle.get())),
                          ErrorContext{}.withEntry(path_.string()));
        }
        QZB_LOG_DEBUG("Closed tar archive {} ({} entries)", path_.string(), written_.size());
    }
    reader_.reset();
}

}  // namespace qzb::archive
