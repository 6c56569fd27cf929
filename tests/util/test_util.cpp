// ARENA - Logging and Time Utility Tests
// Copyright (c) 2024 ARENA Developers
// MIT License

#include <gtest/gtest.h>

#include "arena/util/logging.h"
#include "arena/util/time.h"

#include <cstdio>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h>

namespace arena {
namespace util {
namespace test {

// ============================================================================
// Logging
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = Logger::Instance();
        logger.ClearSinks();
        logger.EnableAllCategories();
        logger.SetLevel(LogLevel::Trace);
        logger.AddSink(std::make_shared<CallbackSink>(
            [this](const LogEntry& entry) { entries_.push_back(entry); }, LogLevel::Trace));
    }

    void TearDown() override {
        auto& logger = Logger::Instance();
        logger.ClearSinks();
        logger.EnableAllCategories();
        logger.SetLevel(LogLevel::Info);
    }

    std::vector<LogEntry> entries_;
};

TEST(LogLevelTest, RoundTripsNames) {
    EXPECT_EQ(LogLevelFromString("trace"), LogLevel::Trace);
    EXPECT_EQ(LogLevelFromString("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("Warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("off"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("nonsense"), LogLevel::Info);
    EXPECT_STREQ(LogLevelToString(LogLevel::Error), "ERROR");
}

TEST_F(LoggingTest, StreamMacroReachesSink) {
    LOG_INFO(LogCategory::BATTLE) << "pair " << 3 << " decided";
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
    EXPECT_EQ(entries_[0].category, LogCategory::BATTLE);
    EXPECT_EQ(entries_[0].message, "pair 3 decided");
}

TEST_F(LoggingTest, FormatMacroReachesSink) {
    LogDebugF(LogCategory::REWARD, "%d shares to %s", 42, "voter");
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "42 shares to voter");
}

TEST_F(LoggingTest, LevelFiltersEntries) {
    Logger::Instance().SetLevel(LogLevel::Warn);
    LOG_INFO(LogCategory::STAGE) << "hidden";
    LOG_WARN(LogCategory::STAGE) << "shown";
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "shown");
}

TEST_F(LoggingTest, CategoryFilter) {
    auto& logger = Logger::Instance();
    logger.EnableCategory(LogCategory::VAULT);
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::VAULT));
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::LEDGER));

    LOG_INFO(LogCategory::LEDGER) << "hidden";
    LOG_INFO(LogCategory::VAULT) << "shown";
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].category, LogCategory::VAULT);
}

TEST_F(LoggingTest, ScopedTimerLogsAtDebug) {
    {
        ARENA_LOG_TIMER(LogCategory::SIM, "epoch");
    }
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Debug);
    EXPECT_NE(entries_[0].message.find("epoch took"), std::string::npos);
}

TEST_F(LoggingTest, RemovedSinkStopsReceiving) {
    auto& logger = Logger::Instance();
    size_t before = logger.SinkCount();
    auto extra = std::make_shared<CallbackSink>([](const LogEntry&) {});
    logger.AddSink(extra);
    EXPECT_EQ(logger.SinkCount(), before + 1);
    logger.RemoveSink(extra);
    EXPECT_EQ(logger.SinkCount(), before);
}

TEST(FileSinkTest, RotatesPastMaxSize) {
    char path[] = "/tmp/arena_log_XXXXXX";
    int fd = mkstemp(path);
    ASSERT_NE(fd, -1);
    close(fd);
    const std::string current = path;
    const std::string rotated = current + ".1";

    FileSink::Config config;
    config.path = current;
    config.maxSize = 64;
    config.maxFiles = 2;

    LogEntry entry;
    entry.level = LogLevel::Info;
    entry.category = LogCategory::BATTLE;
    entry.message = std::string(80, 'x');
    entry.timestamp = std::chrono::system_clock::now();
    {
        FileSink sink(config);
        sink.Write(entry);
        entry.message = "second";
        sink.Write(entry);
        sink.Flush();
    }

    std::ifstream old(rotated);
    std::string line;
    ASSERT_TRUE(std::getline(old, line));
    EXPECT_NE(line.find(std::string(80, 'x')), std::string::npos);

    std::ifstream fresh(current);
    ASSERT_TRUE(std::getline(fresh, line));
    EXPECT_NE(line.find("[battle] second"), std::string::npos);

    std::remove(current.c_str());
    std::remove(rotated.c_str());
}

// ============================================================================
// Time
// ============================================================================

class MockTimeTest : public ::testing::Test {
protected:
    void TearDown() override {
        DisableMockTime();
    }
};

TEST_F(MockTimeTest, SetAndAdvance) {
    EnableMockTime();
    SetMockTime(1000);
    EXPECT_TRUE(IsMockTimeEnabled());
    EXPECT_EQ(GetTime(), 1000);

    AdvanceMockTime(Seconds{259200});
    EXPECT_EQ(GetTime(), 1000 + 259200);
    EXPECT_EQ(GetMockTime(), GetTime());
}

TEST_F(MockTimeTest, DisabledUsesWallClock) {
    EnableMockTime();
    SetMockTime(5);
    DisableMockTime();
    EXPECT_FALSE(IsMockTimeEnabled());
    EXPECT_GT(GetTime(), 1600000000);
}

TEST(FormatDurationTest, Units) {
    EXPECT_EQ(FormatDuration(Seconds{0}), "0s");
    EXPECT_EQ(FormatDuration(Seconds{59}), "59s");
    EXPECT_EQ(FormatDuration(Seconds{3 * 86400}), "3d");
    EXPECT_EQ(FormatDuration(Seconds{86400 + 3600 + 61}), "1d 1h 1m 1s");
    EXPECT_EQ(FormatDuration(Seconds{-90}), "-1m 30s");
}

} // namespace test
} // namespace util
} // namespace arena
