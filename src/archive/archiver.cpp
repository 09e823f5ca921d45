// =============================================================================
// qzbulk - Archiver Factory and Helpers
// =============================================================================

#include "qzb/archive/archiver.h"

#include <fmt/format.h>

#include "qzb/archive/directory_archiver.h"
#include "qzb/archive/tar_archiver.h"
#include "qzb/common/logger.h"

namespace qzb::archive {

VoidResult ArchiveConfig::validate() const {
    if (path.empty()) {
        return makeVoidError(ErrorCode::kUsageError, "Archive path must not be empty");
    }
    if (compression == io::CompressionFormat::kUnknown) {
        return makeVoidError(ErrorCode::kUnsupportedFormat, "Unknown compression format");
    }
    if (format == ArchiveFormat::kDirectory && compression != io::CompressionFormat::kNone) {
        return makeVoidError(ErrorCode::kUsageError,
                             "Compression requires a tar archive (use --tar)");
    }
    if (compressionLevel < 1 || compressionLevel > 9) {
        return makeVoidError(ErrorCode::kInvalidArgument,
                             fmt::format("Compression level must be 1-9, got {}",
                                         compressionLevel));
    }
    return makeVoidSuccess();
}

std::unique_ptr<Archiver> makeArchiver(const ArchiveConfig& config) {
    if (auto result = config.validate(); !result) {
        result.error().throwException();
    }
    switch (config.format) {
        case ArchiveFormat::kDirectory:
            return std::make_unique<DirectoryArchiver>(config.path);
        case ArchiveFormat::kTar:
            return std::make_unique<TarArchiver>(config.path, config.compression,
                                                 config.compressionLevel);
    }
    throw UsageError("Unknown archive format");
}

void validateEntryName(std::string_view name) {
    if (name.empty()) {
        throw FormatError("Empty archive entry name");
    }
    if (name.front() == '/') {
        throw FormatError("Absolute archive entry name", ErrorContext{}.withEntry(std::string(name)));
    }

    std::size_t start = 0;
    while (start <= name.size()) {
        std::size_t end = name.find('/', start);
        if (end == std::string_view::npos) {
            end = name.size();
        }
        std::string_view component = name.substr(start, end - start);
        if (component.empty() || component == "." || component == "..") {
            throw FormatError(fmt::format("Invalid component '{}' in archive entry name", component),
                              ErrorContext{}.withEntry(std::string(name)));
        }
        start = end + 1;
    }
}

// =============================================================================
// ArchiveCloser
// =============================================================================

ArchiveCloser::~ArchiveCloser() {
    if (archiver_ == nullptr) {
        return;
    }
    try {
        archiver_->close();
    } catch (const std::exception& e) {
        QZB_LOG_ERROR("Failed to close archive: {}", e.what());
    }
}

void ArchiveCloser::close() {
    Archiver* archiver = archiver_;
    archiver_ = nullptr;
    if (archiver != nullptr) {
        archiver->close();
    }
}

}  // namespace qzb::archive
