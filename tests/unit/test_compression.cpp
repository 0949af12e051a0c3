#include "Compression.h"
#include "TestSupport.h"

#include <gtest/gtest.h>

using namespace Chunkwise;

TEST(CompressionTest, RoundTripCompressibleData) {
    std::vector<uint8_t> data(64 * 1024, 'a');
    auto compressed = Compression::compress(data, 6);
    ASSERT_TRUE(compressed.ok());
    EXPECT_LT(compressed->size(), data.size());

    auto restored = Compression::decompress(*compressed);
    ASSERT_TRUE(restored.ok());
    EXPECT_EQ(*restored, data);
}

TEST(CompressionTest, IncompressibleDataStillCompressed) {
    auto data = Testing::randomBytes(4096, 11);
    auto compressed = Compression::compress(data, 9);
    ASSERT_TRUE(compressed.ok());
    EXPECT_GE(compressed->size(), Compression::HEADER_SIZE);

    auto restored = Compression::decompress(*compressed);
    ASSERT_TRUE(restored.ok());
    EXPECT_EQ(*restored, data);
}

TEST(CompressionTest, HeaderCarriesMagicAndLittleEndianLength) {
    std::vector<uint8_t> data(0x0102, 'z');
    auto compressed = Compression::compress(data, 1);
    ASSERT_TRUE(compressed.ok());
    ASSERT_GE(compressed->size(), 8u);

    const auto& block = *compressed;
    EXPECT_EQ(block[0], 0x42);
    EXPECT_EQ(block[1], 0x49);
    EXPECT_EQ(block[2], 0x4C);
    EXPECT_EQ(block[3], 0x5A);
    EXPECT_EQ(block[4], 0x02);
    EXPECT_EQ(block[5], 0x01);
    EXPECT_EQ(block[6], 0x00);
    EXPECT_EQ(block[7], 0x00);
}

TEST(CompressionTest, EmptyInput) {
    auto compressed = Compression::compress({}, 6);
    ASSERT_TRUE(compressed.ok());
    auto restored = Compression::decompress(*compressed);
    ASSERT_TRUE(restored.ok());
    EXPECT_TRUE(restored->empty());
}

TEST(CompressionTest, RejectsInvalidLevel) {
    auto result = Compression::compress({1, 2, 3}, 10);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::CompressionFailed);
}

TEST(CompressionTest, RejectsCorruptBlocks) {
    auto compressed = Compression::compress(std::vector<uint8_t>(1000, 'q'), 6);
    ASSERT_TRUE(compressed.ok());

    auto shortBlock = Compression::decompress({0x42, 0x49});
    ASSERT_FALSE(shortBlock.ok());
    EXPECT_EQ(shortBlock.error().code, ErrorCode::DecompressionFailed);

    auto badMagic = *compressed;
    badMagic[0] ^= 0xFF;
    EXPECT_FALSE(Compression::decompress(badMagic).ok());

    auto badStream = *compressed;
    badStream.resize(badStream.size() - 4);
    EXPECT_FALSE(Compression::decompress(badStream).ok());

    auto badLength = *compressed;
    badLength[4] ^= 0x01;
    EXPECT_FALSE(Compression::decompress(badLength).ok());
}
