#include "ChunkProducer.h"
#include "KeyProvider.h"
#include "Logger.h"
#include "Reassembler.h"
#include "SHA256.h"
#include "TestSupport.h"

#include <gtest/gtest.h>
#include <filesystem>

using namespace Chunkwise;
using namespace Chunkwise::Testing;

class ReassemblerTest : public ::testing::Test {
protected:
    void SetUp() override {
        silence(logger_);
        chunkDir_ = dir_.file("chunks");
        data_ = randomBytes(5000, 21);
        writeBytes(dir_.file("report.pdf"), data_);

        ProduceOptions opts;
        opts.chunkSizeBytes = 1024;
        ChunkProducer producer(logger_, &keys_);
        auto produced = producer.produce(dir_.file("report.pdf"), chunkDir_, opts);
        ASSERT_TRUE(produced.ok()) << produced.error().message;
        manifest_ = *produced;
    }

    TempDir dir_;
    Logger logger_;
    StaticKeyProvider keys_{testKey()};
    std::string chunkDir_;
    std::vector<uint8_t> data_;
    Manifest manifest_;
};

TEST_F(ReassemblerTest, RebuildsIdenticalFile) {
    Reassembler reassembler(logger_, &keys_);

    auto verified = reassembler.verify(manifest_, chunkDir_);
    EXPECT_TRUE(verified.allOk());
    EXPECT_EQ(verified.okCount, manifest_.chunks.size());

    auto report = reassembler.reassemble(manifest_, chunkDir_, dir_.file("out/rebuilt.pdf"));
    ASSERT_TRUE(report.ok()) << report.error().message;
    EXPECT_EQ(report->outcome, IntegrityOutcome::VerifiedIdentical);
    EXPECT_EQ(report->actualSize, data_.size());
    EXPECT_EQ(readBytes(dir_.file("out/rebuilt.pdf")), data_);
    EXPECT_FALSE(std::filesystem::exists(dir_.file("out/rebuilt.pdf.part")));
}

TEST_F(ReassemblerTest, ReportsMissingAndCorruptedChunks) {
    std::filesystem::remove(chunkDir_ + "/echunk_1.bin");
    auto stored = readBytes(chunkDir_ + "/echunk_3.bin");
    stored[0] ^= 0xFF;
    writeBytes(chunkDir_ + "/echunk_3.bin", stored);

    Reassembler reassembler(logger_, &keys_);
    auto verified = reassembler.verify(manifest_, chunkDir_);
    EXPECT_FALSE(verified.allOk());
    EXPECT_EQ(verified.missingCount, 1u);
    EXPECT_EQ(verified.badCount, 1u);
    EXPECT_EQ(verified.chunks[1].status, ChunkStatus::Missing);
    EXPECT_EQ(verified.chunks[3].status, ChunkStatus::Bad);

    auto report = reassembler.reassemble(manifest_, chunkDir_, dir_.file("rebuilt.pdf"));
    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.error().code, ErrorCode::ChunkMissing);
    EXPECT_FALSE(std::filesystem::exists(dir_.file("rebuilt.pdf")));
}

TEST_F(ReassemblerTest, CorruptionAloneRefusesWithHashMismatch) {
    auto stored = readBytes(chunkDir_ + "/echunk_0.bin");
    stored.back() ^= 0x01;
    writeBytes(chunkDir_ + "/echunk_0.bin", stored);

    Reassembler reassembler(logger_, &keys_);
    auto report = reassembler.reassemble(manifest_, chunkDir_, dir_.file("rebuilt.pdf"));
    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.error().code, ErrorCode::HashMismatch);
}

TEST_F(ReassemblerTest, DetectsIntegrityMismatch) {
    Manifest tampered = manifest_;
    tampered.originalHash = SHA256::hash("something else");

    Reassembler reassembler(logger_, &keys_);
    auto report = reassembler.reassemble(tampered, chunkDir_, dir_.file("rebuilt.pdf"));
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report->outcome, IntegrityOutcome::IntegrityMismatch);
    EXPECT_EQ(report->actualHash, SHA256::hashBytes(data_));
    EXPECT_TRUE(std::filesystem::exists(dir_.file("rebuilt.pdf")));
}

TEST_F(ReassemblerTest, WrongKeyRemovesPartialOutput) {
    StaticKeyProvider wrongKey(testKey(0x07));
    Reassembler reassembler(logger_, &wrongKey);

    auto report = reassembler.reassemble(manifest_, chunkDir_, dir_.file("rebuilt.pdf"));
    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.error().code, ErrorCode::DecryptionFailed);
    EXPECT_FALSE(std::filesystem::exists(dir_.file("rebuilt.pdf")));
    EXPECT_FALSE(std::filesystem::exists(dir_.file("rebuilt.pdf.part")));
}

TEST_F(ReassemblerTest, RefusesToOverwriteUnlessForced) {
    writeBytes(dir_.file("rebuilt.pdf"), {1, 2, 3});
    Reassembler reassembler(logger_, &keys_);

    auto refused = reassembler.reassemble(manifest_, chunkDir_, dir_.file("rebuilt.pdf"));
    ASSERT_FALSE(refused.ok());
    EXPECT_EQ(refused.error().code, ErrorCode::FileWriteError);

    auto forced = reassembler.reassemble(manifest_, chunkDir_, dir_.file("rebuilt.pdf"), true);
    ASSERT_TRUE(forced.ok());
    EXPECT_EQ(forced->outcome, IntegrityOutcome::VerifiedIdentical);
}

TEST_F(ReassemblerTest, EmptyManifestRebuildsEmptyFile) {
    writeBytes(dir_.file("empty.txt"), {});
    ChunkProducer producer(logger_, &keys_);
    auto produced = producer.produce(dir_.file("empty.txt"), dir_.file("empty_chunks"), ProduceOptions{});
    ASSERT_TRUE(produced.ok());

    Reassembler reassembler(logger_, &keys_);
    auto report = reassembler.reassemble(*produced, dir_.file("empty_chunks"), dir_.file("empty_out.txt"));
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report->outcome, IntegrityOutcome::VerifiedIdentical);
    EXPECT_EQ(std::filesystem::file_size(dir_.file("empty_out.txt")), 0u);
}
