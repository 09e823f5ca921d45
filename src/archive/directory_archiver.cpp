// =============================================================================
// qzbulk - Directory Archiver Implementation
// =============================================================================

#include "qzb/archive/directory_archiver.h"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <fstream>
#include <system_error>

#include <fmt/format.h>

#include "qzb/common/logger.h"

namespace qzb::archive {

namespace fs = std::filesystem;

DirectoryArchiver::DirectoryArchiver(fs::path root) : root_(std::move(root)) {}

void DirectoryArchiver::open(ArchiveMode mode) {
    std::error_code ec;
    if (mode == ArchiveMode::kWrite) {
        fs::create_directories(root_, ec);
        std::error_code statEc;
        if (ec && !fs::is_directory(root_, statEc)) {
            throw IOError("Failed to create archive directory", ec,
                          ErrorContext{}.withEntry(root_.string()));
        }
    } else if (!fs::is_directory(root_, ec)) {
        throw IOError("Archive directory does not exist",
                      ErrorContext{}.withEntry(root_.string()));
    }

    mode_ = mode;
    open_.store(true, std::memory_order_release);
    QZB_LOG_DEBUG("Opened directory archive {} for {}", root_.string(),
                  mode == ArchiveMode::kWrite ? "writing" : "reading");
}

void DirectoryArchiver::requireOpen(ArchiveMode mode) const {
    if (!open_.load(std::memory_order_acquire) || mode_ != mode) {
        throw QZBException(ErrorCode::kInvalidState,
                           fmt::format("Directory archive {} is not open for {}", root_.string(),
                                       mode == ArchiveMode::kWrite ? "writing" : "reading"));
    }
}

void DirectoryArchiver::write(const std::string& name, Payload payload) {
    validateEntryName(name);
    requireOpen(ArchiveMode::kWrite);

    const fs::path target = root_ / fs::path(name);

    // Several workers may create the same parent concurrently.
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    std::error_code statEc;
    if (ec && !fs::is_directory(target.parent_path(), statEc)) {
        throw IOError("Failed to create directory", ec,
                      ErrorContext{}.withEntry(target.parent_path().string()));
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw IOError("Failed to create file", std::error_code(errno, std::generic_category()),
                      ErrorContext{}.withEntry(target.string()));
    }
    out.write(reinterpret_cast<const char*>(payload.data()),
              static_cast<std::streamsize>(payload.size()));
    out.close();
    if (out.fail()) {
        throw IOError("Failed to write file", ErrorContext{}.withEntry(target.string()));
    }
}

Payload DirectoryArchiver::read(const std::string& name) {
    validateEntryName(name);
    requireOpen(ArchiveMode::kRead);

    const fs::path source = root_ / fs::path(name);
    std::ifstream in(source, std::ios::binary);
    if (!in.is_open()) {
        throw IOError("Failed to open file", std::error_code(errno, std::generic_category()),
                      ErrorContext{}.withEntry(source.string()));
    }

    std::error_code ec;
    const auto size = fs::file_size(source, ec);
    if (ec) {
        throw IOError("Failed to stat file", ec, ErrorContext{}.withEntry(source.string()));
    }

    Payload payload(static_cast<std::size_t>(size));
    in.read(reinterpret_cast<char*>(payload.data()), static_cast<std::streamsize>(size));
    if (static_cast<std::uintmax_t>(in.gcount()) != size) {
        throw IOError("Short read", ErrorContext{}.withEntry(source.string()));
    }
    return payload;
}

std::vector<std::string> DirectoryArchiver::listEntries() {
    requireOpen(ArchiveMode::kRead);

    std::vector<std::string> entries;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            entries.push_back(it->path().lexically_relative(root_).generic_string());
        }
    }
    if (ec) {
        throw IOError("Failed to list archive directory", ec,
                      ErrorContext{}.withEntry(root_.string()));
    }

    std::sort(entries.begin(), entries.end());
    return entries;
}

void DirectoryArchiver::close() {
    if (open_.exchange(false, std::memory_order_acq_rel)) {
        QZB_LOG_DEBUG("Closed directory archive {}", root_.string());
    }
}

}  // namespace qzb::archive
