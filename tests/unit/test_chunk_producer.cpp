#include "ChunkProducer.h"
#include "KeyProvider.h"
#include "Logger.h"
#include "SHA256.h"
#include "TestSupport.h"

#include <gtest/gtest.h>
#include <filesystem>

using namespace Chunkwise;
using namespace Chunkwise::Testing;

class ChunkProducerTest : public ::testing::Test {
protected:
    void SetUp() override {
        silence(logger_);
        source_ = dir_.file("input.bin");
        outDir_ = dir_.file("chunks");
    }

    ProduceOptions options(size_t chunkSize) const {
        ProduceOptions opts;
        opts.chunkSizeBytes = chunkSize;
        return opts;
    }

    TempDir dir_;
    Logger logger_;
    StaticKeyProvider keys_{testKey()};
    std::string source_;
    std::string outDir_;
};

TEST_F(ChunkProducerTest, SplitsIntoChunksAndWritesManifest) {
    auto data = randomBytes(2500, 9);
    writeBytes(source_, data);

    ChunkProducer producer(logger_, &keys_);
    auto manifest = producer.produce(source_, outDir_, options(1000));
    ASSERT_TRUE(manifest.ok()) << manifest.error().message;

    EXPECT_EQ(manifest->originalFilename, "input.bin");
    EXPECT_EQ(manifest->originalSize, 2500u);
    EXPECT_EQ(manifest->originalHash, SHA256::hashBytes(data));
    EXPECT_EQ(manifest->chunkSize, 1000u);
    ASSERT_EQ(manifest->chunks.size(), 3u);

    for (const auto& chunk : manifest->chunks) {
        auto path = outDir_ + "/" + chunk.name;
        ASSERT_TRUE(std::filesystem::exists(path)) << chunk.name;
        auto stored = readBytes(path);
        EXPECT_EQ(stored.size(), chunk.size);
        EXPECT_EQ(SHA256::hashBytes(stored), chunk.hash);
        EXPECT_EQ(chunk.priority, Manifest::DEFAULT_PRIORITY);
    }

    auto onDisk = Manifest::loadFromFile(outDir_ + "/manifest.json");
    ASSERT_TRUE(onDisk.ok());
    EXPECT_EQ(onDisk->originalHash, manifest->originalHash);
    EXPECT_TRUE(onDisk->validate().ok());
}

TEST_F(ChunkProducerTest, ExactMultipleHasNoEmptyTrailingChunk) {
    writeBytes(source_, randomBytes(3000, 2));

    ChunkProducer producer(logger_, &keys_);
    auto manifest = producer.produce(source_, outDir_, options(1000));
    ASSERT_TRUE(manifest.ok());
    EXPECT_EQ(manifest->chunks.size(), 3u);
}

TEST_F(ChunkProducerTest, EmptySourceProducesNoChunks) {
    writeBytes(source_, {});

    ChunkProducer producer(logger_, &keys_);
    auto manifest = producer.produce(source_, outDir_, options(1000));
    ASSERT_TRUE(manifest.ok());
    EXPECT_TRUE(manifest->chunks.empty());
    EXPECT_EQ(manifest->originalSize, 0u);
    EXPECT_EQ(manifest->originalHash, SHA256::hash(""));
    EXPECT_TRUE(std::filesystem::exists(outDir_ + "/manifest.json"));
}

TEST_F(ChunkProducerTest, PlainChunksWhenTransformsDisabled) {
    auto data = randomBytes(1500, 4);
    writeBytes(source_, data);

    ProduceOptions opts = options(1000);
    opts.compressionEnabled = false;
    opts.encryptionEnabled = false;

    ChunkProducer producer(logger_, nullptr);
    auto manifest = producer.produce(source_, outDir_, opts);
    ASSERT_TRUE(manifest.ok());
    ASSERT_EQ(manifest->chunks.size(), 2u);
    EXPECT_FALSE(manifest->compressionEnabled);
    EXPECT_FALSE(manifest->encryptionEnabled);

    auto first = readBytes(outDir_ + "/echunk_0.bin");
    EXPECT_EQ(first, std::vector<uint8_t>(data.begin(), data.begin() + 1000));
}

TEST_F(ChunkProducerTest, InvalidPriorityFallsBackToDefault) {
    writeBytes(source_, randomBytes(10, 1));

    ProduceOptions opts = options(1000);
    opts.priority = 7;
    opts.defaultPriority = 2;

    ChunkProducer producer(logger_, &keys_);
    auto manifest = producer.produce(source_, outDir_, opts);
    ASSERT_TRUE(manifest.ok());
    EXPECT_EQ(manifest->priority, 2);
    EXPECT_EQ(manifest->priorityName, "HIGH");
    EXPECT_EQ(manifest->chunks[0].priority, 2);
}

TEST_F(ChunkProducerTest, MissingSourceIsUnreadable) {
    ChunkProducer producer(logger_, &keys_);
    auto manifest = producer.produce(dir_.file("absent.bin"), outDir_, options(1000));
    ASSERT_FALSE(manifest.ok());
    EXPECT_EQ(manifest.error().code, ErrorCode::SourceUnreadable);
}

TEST_F(ChunkProducerTest, MissingKeyLeavesNothingBehind) {
    writeBytes(source_, randomBytes(2000, 1));

    FileKeyProvider missingKey(dir_.file("absent.key"));
    ChunkProducer producer(logger_, &missingKey);
    auto manifest = producer.produce(source_, outDir_, options(1000));
    ASSERT_FALSE(manifest.ok());
    EXPECT_EQ(manifest.error().code, ErrorCode::KeyUnavailable);
    EXPECT_FALSE(std::filesystem::exists(outDir_ + "/manifest.json"));
    EXPECT_FALSE(std::filesystem::exists(outDir_ + "/echunk_0.bin"));
}
