// =============================================================================
// qzbulk - Tar Compression Formats
// =============================================================================
// Compression filters a tar archive may be wrapped in. The codecs themselves
// are libarchive's; this module only names them:
// - selection from a file extension (.tar.gz, .tbz2, .txz, .tar.zst, ...)
// - libarchive filter names ("gzip", "bzip2", "xz", "zstd") in both
//   directions
// =============================================================================

#ifndef QZB_IO_COMPRESSION_FORMAT_H
#define QZB_IO_COMPRESSION_FORMAT_H

#include <cstdint>
#include <filesystem>
#include <string_view>

namespace qzb::io {

/// @brief Supported compression formats.
enum class CompressionFormat : std::uint8_t {
    kNone = 0,   ///< Uncompressed
    kGzip = 1,   ///< gzip (.gz)
    kBzip2 = 2,  ///< bzip2 (.bz2)
    kXz = 3,     ///< xz/lzma (.xz)
    kZstd = 4,   ///< zstd (.zst)
    kUnknown = 255
};

/// @brief Default codec level used when none is configured.
inline constexpr int kDefaultCompressionLevel = 6;

/// @brief Detect compression format from file extension (.gz, .tgz, .bz2, ...).
[[nodiscard]] CompressionFormat detectCompressionFormatFromExtension(
    const std::filesystem::path& path);

/// @brief libarchive filter name of a format ("gzip"); "none" for kNone.
[[nodiscard]] std::string_view compressionFormatName(CompressionFormat format);

/// @brief Format of a libarchive filter name; kUnknown for any other filter.
[[nodiscard]] CompressionFormat compressionFormatFromName(std::string_view name);

}  // namespace qzb::io

#endif  // QZB_IO_COMPRESSION_FORMAT_H
