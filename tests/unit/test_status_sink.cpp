#include "FileUtils.h"
#include "Logger.h"
#include "StatusSink.h"
#include "TestSupport.h"

#include <gtest/gtest.h>

using namespace Chunkwise;
using namespace Chunkwise::Testing;

TEST(StatusSinkTest, WritesSnapshotFile) {
    TempDir dir;
    Logger logger;
    silence(logger);

    JsonFileStatusSink sink(dir.file("sender_status.json"), logger);

    StatusReport report;
    report.currentUnit = "echunk_2.bin";
    report.currentIndex = 3;
    report.totalUnits = 6;
    report.unitsDone = 2;
    report.bytesCurrent = 512;
    report.currentSize = 1024;
    sink.publish("sender", "SENDING", report);

    auto root = FileUtils::readJson(sink.path());
    ASSERT_TRUE(root.ok());
    EXPECT_EQ((*root)["role"].asString(), "sender");
    EXPECT_EQ((*root)["state"].asString(), "SENDING");
    EXPECT_EQ((*root)["current_unit"].asString(), "echunk_2.bin");
    EXPECT_EQ((*root)["total_units"].asUInt64(), 6u);
    EXPECT_EQ((*root)["units_done"].asUInt64(), 2u);
    EXPECT_EQ((*root)["bytes_current"].asUInt64(), 512u);
    EXPECT_FALSE((*root)["last_update"].asString().empty());

    report.errorMessage = "Connection lost";
    sink.publish("sender", "ERROR", report);
    auto updated = FileUtils::readJson(sink.path());
    ASSERT_TRUE(updated.ok());
    EXPECT_EQ((*updated)["state"].asString(), "ERROR");
    EXPECT_EQ((*updated)["error_message"].asString(), "Connection lost");
}

TEST(StatusSinkTest, WriteFailureDoesNotThrow) {
    Logger logger;
    silence(logger);

    JsonFileStatusSink sink("/proc/chunkwise/nope/status.json", logger);
    EXPECT_NO_THROW(sink.publish("receiver", "WAITING", StatusReport{}));
}
