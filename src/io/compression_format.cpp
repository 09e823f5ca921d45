// =============================================================================
// qzbulk - Tar Compression Formats Implementation
// =============================================================================

#include "qzb/io/compression_format.h"

#include <algorithm>
#include <cctype>
#include <string>

namespace qzb::io {

namespace {

constexpr CompressionFormat kNamedFormats[] = {
    CompressionFormat::kNone, CompressionFormat::kGzip, CompressionFormat::kBzip2,
    CompressionFormat::kXz, CompressionFormat::kZstd};

}  // namespace

CompressionFormat detectCompressionFormatFromExtension(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == ".gz" || ext == ".tgz") {
        return CompressionFormat::kGzip;
    }
    if (ext == ".bz2" || ext == ".tbz" || ext == ".tbz2") {
        return CompressionFormat::kBzip2;
    }
    if (ext == ".xz" || ext == ".txz") {
        return CompressionFormat::kXz;
    }
    if (ext == ".zst" || ext == ".tzst") {
        return CompressionFormat::kZstd;
    }
    return CompressionFormat::kNone;
}

std::string_view compressionFormatName(CompressionFormat format) {
    switch (format) {
        case CompressionFormat::kGzip:
            return "gzip";
        case CompressionFormat::kBzip2:
            return "bzip2";
        case CompressionFormat::kXz:
            return "xz";
        case CompressionFormat::kZstd:
            return "zstd";
        case CompressionFormat::kNone:
            return "none";
        case CompressionFormat::kUnknown:
            break;
    }
    return "unknown";
}

CompressionFormat compressionFormatFromName(std::string_view name) {
    for (CompressionFormat format : kNamedFormats) {
        if (compressionFormatName(format) == name) {
            return format;
        }
    }
    return CompressionFormat::kUnknown;
}

}  // namespace qzb::io
