#include "Logger.h"
#include "TestSupport.h"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace Chunkwise;
using Chunkwise::Testing::TempDir;

namespace {

std::vector<std::string> readLines(const std::string& path) {
    std::ifstream file(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

}

TEST(LoggerTest, WritesFormattedLinesToFile) {
    TempDir dir;
    const std::string logFile = dir.file("logs/test.log");

    Logger logger;
    logger.setConsoleOutput(false);
    ASSERT_TRUE(logger.setLogFile(logFile));
    logger.setLevel(LogLevel::DEBUG);

    logger.info("Test info message", "Producer");
    logger.error("Test error message", "Sender");

    auto lines = readLines(logFile);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find("[INFO] [Producer] Test info message"), std::string::npos);
    EXPECT_NE(lines[1].find("[ERROR] [Sender] Test error message"), std::string::npos);
    EXPECT_EQ(lines[0].front(), '[');
}

TEST(LoggerTest, FiltersBelowLevel) {
    TempDir dir;
    const std::string logFile = dir.file("level.log");

    Logger logger;
    logger.setConsoleOutput(false);
    ASSERT_TRUE(logger.setLogFile(logFile));
    logger.setLevel(LogLevel::WARN);

    logger.debug("hidden debug");
    logger.info("hidden info");
    logger.warn("visible warn");
    EXPECT_FALSE(logger.isDebugEnabled());

    auto lines = readLines(logFile);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("visible warn"), std::string::npos);
}

TEST(LoggerTest, DefaultComponentUsedWhenNoneGiven) {
    TempDir dir;
    const std::string logFile = dir.file("component.log");

    Logger logger;
    logger.setConsoleOutput(false);
    ASSERT_TRUE(logger.setLogFile(logFile));
    logger.setComponent("Chunkwise");
    logger.info("hello");

    auto lines = readLines(logFile);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("[Chunkwise] hello"), std::string::npos);
}

TEST(LoggerTest, RotatesWhenFileGrowsPastLimit) {
    TempDir dir;
    const std::string logFile = dir.file("rotate.log");

    Logger logger;
    logger.setConsoleOutput(false);
    ASSERT_TRUE(logger.setLogFile(logFile));
    logger.setMaxFileSize(1);

    const std::string big(64 * 1024, 'x');
    for (int i = 0; i < 20; ++i) {
        logger.info(big);
    }

    size_t rotated = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir.path())) {
        if (entry.path().filename().string().rfind("rotate.log.", 0) == 0) {
            ++rotated;
        }
    }
    EXPECT_GE(rotated, 1u);
    EXPECT_LT(std::filesystem::file_size(logFile), 1024u * 1024u);
}

TEST(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("WARNING"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel("Error"), LogLevel::ERROR);
    EXPECT_EQ(parseLogLevel("critical"), LogLevel::CRITICAL);
    EXPECT_EQ(parseLogLevel("bogus"), LogLevel::INFO);
}
