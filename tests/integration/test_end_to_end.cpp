/**
 * @file test_end_to_end.cpp
 * @brief Produce, deliver, receive and reassemble a file over loopback
 */

#include <gtest/gtest.h>
#include <filesystem>
#include <set>
#include <utility>

#include "ChunkProducer.h"
#include "DeliveryScheduler.h"
#include "KeyProvider.h"
#include "Logger.h"
#include "Reassembler.h"
#include "ReceiverSession.h"
#include "TcpConnection.h"
#include "TestSupport.h"
#include "TransferState.h"

using namespace Chunkwise;
using namespace Chunkwise::Testing;

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        silence(logger_);
        workDir_ = dir_.file("encrypted_chunks");
        storageDir_ = dir_.file("received_chunks");
        stateFile_ = dir_.file("transfer_state.json");

        // Half compressible, half random
        original_ = std::vector<uint8_t>(150 * 1024, 'c');
        auto noise = randomBytes(150 * 1024 + 123, 99);
        original_.insert(original_.end(), noise.begin(), noise.end());
        writeBytes(dir_.file("dataset.bin"), original_);

        ProduceOptions opts;
        opts.chunkSizeBytes = 64 * 1024;
        opts.priority = 2;
        ChunkProducer producer(logger_, &keys_);
        auto produced = producer.produce(dir_.file("dataset.bin"), workDir_, opts);
        ASSERT_TRUE(produced.ok()) << produced.error().message;
        manifest_ = *produced;

        delivery_.timeoutSeconds = 5;
        delivery_.bufferSize = 4096;
        delivery_.maxRetries = 3;
    }

    ReceiverOptions receiverOptions() const {
        ReceiverOptions opts;
        opts.host = "127.0.0.1";
        opts.port = 0;
        opts.timeoutSeconds = 5;
        opts.storageDir = storageDir_;
        return opts;
    }

    /// One sender run against a fresh receiver session
    std::pair<SendReport, ReceiveReport> transfer(TransferState& state) {
        ReceiverSession session(receiverOptions(), logger_, receiverStatus_);
        auto bound = session.bind();
        EXPECT_TRUE(bound.ok());
        ReceiverRunner runner(session);

        DeliveryScheduler scheduler(delivery_, state, logger_, senderStatus_);
        SendReport sent = scheduler.run(manifest_, workDir_, "127.0.0.1", session.boundPort());
        ReceiveReport received = runner.wait();
        return {sent, received};
    }

    TempDir dir_;
    Logger logger_;
    StaticKeyProvider keys_{testKey(0x3C)};
    RecordingStatusSink senderStatus_;
    RecordingStatusSink receiverStatus_;
    DeliveryOptions delivery_;
    std::string workDir_;
    std::string storageDir_;
    std::string stateFile_;
    std::vector<uint8_t> original_;
    Manifest manifest_;
};

TEST_F(EndToEndTest, TransferredFileReassemblesIdentically) {
    TransferState state(stateFile_, logger_);
    state.load();

    auto [sent, received] = transfer(state);
    ASSERT_EQ(sent.state, SenderState::Completed);
    EXPECT_EQ(sent.unitsSent, manifest_.chunks.size() + 1);
    EXPECT_EQ(received.state, ReceiverState::Completed);
    EXPECT_EQ(received.unitsAccepted, manifest_.chunks.size() + 1);
    EXPECT_EQ(received.unitsRejected, 0u);

    auto receivedManifest = Manifest::loadFromFile(storageDir_ + "/manifest.json");
    ASSERT_TRUE(receivedManifest.ok());
    EXPECT_EQ(receivedManifest->originalHash, manifest_.originalHash);

    Reassembler reassembler(logger_, &keys_);
    EXPECT_TRUE(reassembler.verify(*receivedManifest, storageDir_).allOk());

    auto report = reassembler.reassemble(*receivedManifest, storageDir_, dir_.file("restored/dataset.bin"));
    ASSERT_TRUE(report.ok()) << report.error().message;
    EXPECT_EQ(report->outcome, IntegrityOutcome::VerifiedIdentical);
    EXPECT_EQ(readBytes(dir_.file("restored/dataset.bin")), original_);

    EXPECT_EQ(senderStatus_.states(),
              (std::vector<std::string>{"CONNECTING", "CONNECTED", "SENDING", "COMPLETED"}));
    EXPECT_EQ(receiverStatus_.states().back(), "COMPLETED");
}

TEST_F(EndToEndTest, SecondRunSkipsEverything) {
    TransferState state(stateFile_, logger_);
    state.load();
    auto first = transfer(state);
    ASSERT_EQ(first.first.state, SenderState::Completed);

    TransferState resumed(stateFile_, logger_);
    resumed.load();
    EXPECT_EQ(resumed.size(), manifest_.chunks.size() + 1);

    auto [sent, received] = transfer(resumed);
    EXPECT_EQ(sent.state, SenderState::Completed);
    EXPECT_EQ(sent.unitsSent, 0u);
    EXPECT_EQ(sent.unitsSkipped, manifest_.chunks.size() + 1);
    EXPECT_EQ(received.state, ReceiverState::Completed);
    EXPECT_EQ(received.unitsReceived, 0u);
}

TEST_F(EndToEndTest, ResumeResendsOnlyUnconfirmedChunks) {
    TransferState state(stateFile_, logger_);
    state.load();
    ASSERT_EQ(transfer(state).first.state, SenderState::Completed);

    // Lose one chunk on the receiving side and forget its confirmation
    const std::string lost = Manifest::chunkName(2);
    std::filesystem::remove(storageDir_ + "/" + lost);
    {
        TransferState edited(stateFile_, logger_);
        edited.load();
        std::set<std::string> keep = edited.completed();
        keep.erase(lost);
        TransferState rewritten(stateFile_, logger_);
        for (const auto& unit : keep) {
            ASSERT_TRUE(rewritten.markCompleted(unit).ok());
        }
    }

    TransferState resumed(stateFile_, logger_);
    resumed.load();
    ASSERT_FALSE(resumed.isCompleted(lost));

    auto [sent, received] = transfer(resumed);
    EXPECT_EQ(sent.state, SenderState::Completed);
    EXPECT_EQ(sent.unitsSent, 1u);
    EXPECT_EQ(received.unitsAccepted, 1u);
    // Verified against the manifest already in storage
    ASSERT_TRUE(received.manifest.has_value());
    EXPECT_NE(received.manifest->findChunk(lost), nullptr);

    Reassembler reassembler(logger_, &keys_);
    auto report = reassembler.reassemble(manifest_, storageDir_, dir_.file("restored.bin"));
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report->outcome, IntegrityOutcome::VerifiedIdentical);
}

TEST_F(EndToEndTest, UnreachableReceiverLeavesStateUntouched) {
    TcpListener unused;
    ASSERT_TRUE(unused.listen("127.0.0.1", 0).ok());
    const uint16_t port = unused.port();
    unused.close();

    TransferState state(stateFile_, logger_);
    state.load();
    DeliveryScheduler scheduler(delivery_, state, logger_, senderStatus_);
    auto report = scheduler.run(manifest_, workDir_, "127.0.0.1", port);

    EXPECT_EQ(report.state, SenderState::Error);
    ASSERT_TRUE(report.error.has_value());
    EXPECT_EQ(report.error->code, ErrorCode::ConnectionFailed);
    EXPECT_EQ(state.size(), 0u);
    EXPECT_FALSE(std::filesystem::exists(stateFile_));
}
