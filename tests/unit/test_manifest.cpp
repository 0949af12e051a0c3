#include "Manifest.h"
#include "SHA256.h"
#include "TestSupport.h"

#include <gtest/gtest.h>

using namespace Chunkwise;
using Chunkwise::Testing::TempDir;

namespace {

Manifest sampleManifest(size_t chunkCount) {
    Manifest m;
    m.originalFilename = "video.mp4";
    m.originalSize = 3000;
    m.originalHash = SHA256::hash("original");
    m.chunkSize = 1024;
    m.priority = 2;
    m.priorityName = "HIGH";
    for (size_t i = 0; i < chunkCount; ++i) {
        ChunkDescriptor chunk;
        chunk.index = i;
        chunk.name = Manifest::chunkName(i);
        chunk.size = 1000 + i;
        chunk.hash = SHA256::hash("chunk" + std::to_string(i));
        chunk.priority = 2;
        m.chunks.push_back(chunk);
    }
    return m;
}

}

TEST(ManifestTest, SerializeParseRoundTrip) {
    Manifest m = sampleManifest(3);
    auto parsed = Manifest::deserialize(m.serialize());
    ASSERT_TRUE(parsed.ok()) << parsed.error().message;

    EXPECT_EQ(parsed->originalFilename, "video.mp4");
    EXPECT_EQ(parsed->originalSize, 3000u);
    EXPECT_EQ(parsed->originalHash, m.originalHash);
    EXPECT_EQ(parsed->chunkSize, 1024u);
    EXPECT_EQ(parsed->priority, 2);
    EXPECT_EQ(parsed->priorityName, "HIGH");
    ASSERT_EQ(parsed->chunks.size(), 3u);
    EXPECT_EQ(parsed->chunks[1].name, "echunk_1.bin");
    EXPECT_EQ(parsed->chunks[1].size, 1001u);
    EXPECT_EQ(parsed->chunks[1].hash, m.chunks[1].hash);
    EXPECT_TRUE(parsed->validate().ok());
}

TEST(ManifestTest, OptionalKeysTakeDefaults) {
    const std::string text = R"({
        "original_filename": "a.bin",
        "original_size": 5,
        "original_hash": ")" + SHA256::hash("a") + R"(",
        "chunk_size": 1048576,
        "chunks": [
            {"index": 0, "name": "echunk_0.bin", "size": 40, "hash": ")" + SHA256::hash("c") + R"("}
        ]
    })";

    auto parsed = Manifest::deserialize(text, 4);
    ASSERT_TRUE(parsed.ok()) << parsed.error().message;
    EXPECT_EQ(parsed->hashAlgorithm, "sha256");
    EXPECT_EQ(parsed->priority, 4);
    EXPECT_EQ(parsed->priorityName, "LOW");
    EXPECT_TRUE(parsed->compressionEnabled);
    EXPECT_TRUE(parsed->encryptionEnabled);
    EXPECT_EQ(parsed->chunks[0].priority, 4);
}

TEST(ManifestTest, UnknownKeysSurviveRoundTrip) {
    Manifest m = sampleManifest(1);
    auto root = m.toJson();
    root["created_by"] = "producer-7";
    root["chunks"][0]["note"] = "first";

    auto parsed = Manifest::fromJson(root);
    ASSERT_TRUE(parsed.ok());
    auto again = parsed->toJson();
    EXPECT_EQ(again["created_by"].asString(), "producer-7");
    EXPECT_EQ(again["chunks"][0]["note"].asString(), "first");
}

TEST(ManifestTest, MissingRequiredKeysAreMalformed) {
    auto root = sampleManifest(1).toJson();
    root.removeMember("original_hash");
    auto parsed = Manifest::fromJson(root);
    ASSERT_FALSE(parsed.ok());
    EXPECT_EQ(parsed.error().code, ErrorCode::MalformedManifest);

    auto notJson = Manifest::deserialize("{not json");
    ASSERT_FALSE(notJson.ok());
    EXPECT_EQ(notJson.error().code, ErrorCode::MalformedManifest);

    auto negative = sampleManifest(1).toJson();
    negative["chunks"][0]["size"] = -3;
    EXPECT_FALSE(Manifest::fromJson(negative).ok());
}

TEST(ManifestTest, MistypedOptionalKeysAreMalformed) {
    auto quotedPriority = sampleManifest(1).toJson();
    quotedPriority["priority"] = "2";
    auto parsed = Manifest::fromJson(quotedPriority);
    ASSERT_FALSE(parsed.ok());
    EXPECT_EQ(parsed.error().code, ErrorCode::MalformedManifest);
    EXPECT_NE(parsed.error().message.find("priority"), std::string::npos);

    auto chunkPriority = sampleManifest(1).toJson();
    chunkPriority["chunks"][0]["priority"] = 1.5;
    EXPECT_FALSE(Manifest::fromJson(chunkPriority).ok());

    auto flag = sampleManifest(1).toJson();
    flag["encryption_enabled"] = "yes";
    EXPECT_FALSE(Manifest::fromJson(flag).ok());

    auto label = sampleManifest(1).toJson();
    label["priority_name"] = 2;
    EXPECT_FALSE(Manifest::fromJson(label).ok());

    // Out-of-range integers still parse; validate() normalizes them
    auto outOfRange = sampleManifest(1).toJson();
    outOfRange["priority"] = 9;
    EXPECT_TRUE(Manifest::fromJson(outOfRange).ok());
}

TEST(ManifestTest, ValidateRejectsStructuralProblems) {
    {
        Manifest m = sampleManifest(3);
        m.chunks[2].index = 5;
        EXPECT_FALSE(m.validate().ok());
    }
    {
        Manifest m = sampleManifest(2);
        m.chunks[1].name = m.chunks[0].name;
        EXPECT_FALSE(m.validate().ok());
    }
    {
        Manifest m = sampleManifest(1);
        m.chunks[0].name = "../escape.bin";
        EXPECT_FALSE(m.validate().ok());
    }
    {
        Manifest m = sampleManifest(1);
        m.chunks[0].hash = "deadbeef";
        EXPECT_FALSE(m.validate().ok());
    }
    {
        Manifest m = sampleManifest(1);
        m.chunkSize = 0;
        EXPECT_FALSE(m.validate().ok());
    }
    {
        Manifest m = sampleManifest(1);
        m.hashAlgorithm = "md5";
        auto result = m.validate();
        ASSERT_FALSE(result.ok());
        EXPECT_EQ(result.error().code, ErrorCode::MalformedManifest);
    }
}

TEST(ManifestTest, ValidateNormalizesPriorities) {
    Manifest m = sampleManifest(2);
    m.priority = 9;
    m.chunks[1].priority = 0;

    ASSERT_TRUE(m.validate(3).ok());
    EXPECT_EQ(m.priority, 3);
    EXPECT_EQ(m.priorityName, "NORMAL");
    EXPECT_EQ(m.chunks[0].priority, 2);
    EXPECT_EQ(m.chunks[1].priority, 3);
}

TEST(ManifestTest, EmptyChunkListIsValid) {
    Manifest m = sampleManifest(0);
    m.originalSize = 0;
    EXPECT_TRUE(m.validate().ok());
}

TEST(ManifestTest, LookupAndOrdering) {
    Manifest m = sampleManifest(3);
    std::swap(m.chunks[0], m.chunks[2]);

    auto ordered = m.chunksByIndex();
    ASSERT_EQ(ordered.size(), 3u);
    EXPECT_EQ(ordered[0].index, 0u);
    EXPECT_EQ(ordered[2].index, 2u);

    ASSERT_NE(m.findChunk("echunk_1.bin"), nullptr);
    EXPECT_EQ(m.findChunk("echunk_1.bin")->size, 1001u);
    EXPECT_EQ(m.findChunk("echunk_9.bin"), nullptr);
}

TEST(ManifestTest, ChunkNameRules) {
    EXPECT_EQ(Manifest::chunkName(12), "echunk_12.bin");
    EXPECT_TRUE(Manifest::isValidChunkName("echunk_0.bin"));
    EXPECT_FALSE(Manifest::isValidChunkName(""));
    EXPECT_FALSE(Manifest::isValidChunkName(".."));
    EXPECT_FALSE(Manifest::isValidChunkName("a/b"));
    EXPECT_FALSE(Manifest::isValidChunkName("a|b"));
    EXPECT_FALSE(Manifest::isValidChunkName(Manifest::UNIT_NAME));
}

TEST(ManifestTest, FileRoundTrip) {
    TempDir dir;
    Manifest m = sampleManifest(2);
    ASSERT_TRUE(m.saveToFile(dir.file("manifest.json")).ok());

    auto loaded = Manifest::loadFromFile(dir.file("manifest.json"));
    ASSERT_TRUE(loaded.ok());
    EXPECT_EQ(loaded->chunks.size(), 2u);

    auto missing = Manifest::loadFromFile(dir.file("absent.json"));
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error().code, ErrorCode::FileReadError);
}
