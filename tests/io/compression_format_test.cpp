// =============================================================================
// qzbulk - Compression Format Tests
// =============================================================================

#include "qzb/io/compression_format.h"

#include <gtest/gtest.h>

namespace qzb::io::test {

TEST(CompressionFormatTest, DetectFromExtension) {
    EXPECT_EQ(detectCompressionFormatFromExtension("dump.tar.gz"), CompressionFormat::kGzip);
    EXPECT_EQ(detectCompressionFormatFromExtension("dump.tgz"), CompressionFormat::kGzip);
    EXPECT_EQ(detectCompressionFormatFromExtension("dump.tar.bz2"), CompressionFormat::kBzip2);
    EXPECT_EQ(detectCompressionFormatFromExtension("dump.TXZ"), CompressionFormat::kXz);
    EXPECT_EQ(detectCompressionFormatFromExtension("dump.tar.zst"), CompressionFormat::kZstd);
    EXPECT_EQ(detectCompressionFormatFromExtension("dump.tar"), CompressionFormat::kNone);
    EXPECT_EQ(detectCompressionFormatFromExtension("dump"), CompressionFormat::kNone);
}

TEST(CompressionFormatTest, FilterNamesMapBothWays) {
    for (CompressionFormat format : {CompressionFormat::kNone, CompressionFormat::kGzip,
                                     CompressionFormat::kBzip2, CompressionFormat::kXz,
                                     CompressionFormat::kZstd}) {
        EXPECT_EQ(compressionFormatFromName(compressionFormatName(format)), format);
    }
    EXPECT_EQ(compressionFormatName(CompressionFormat::kXz), "xz");
    EXPECT_EQ(compressionFormatFromName("lz4"), CompressionFormat::kUnknown);
    EXPECT_EQ(compressionFormatFromName("unknown"), CompressionFormat::kUnknown);
}

}  // namespace qzb::io::test
