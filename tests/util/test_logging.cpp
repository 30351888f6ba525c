// POLITY - Logging Tests
// Copyright (c) 2024 POLITY Developers
// MIT License

#include <gtest/gtest.h>

#include "polity/util/logging.h"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

namespace polity {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        savedLevel_ = POLITY_LOGGER.GetLevel();
        POLITY_LOGGER.SetLevel(LogLevel::Trace);
        sink_ = std::make_shared<CallbackSink>(
            [this](const LogEntry& entry) { entries_.push_back(entry); });
        POLITY_LOGGER.AddSink(sink_);
    }

    void TearDown() override {
        POLITY_LOGGER.RemoveSink(sink_);
        POLITY_LOGGER.SetLevel(savedLevel_);
    }

    LogLevel savedLevel_{LogLevel::Info};
    std::shared_ptr<CallbackSink> sink_;
    std::vector<LogEntry> entries_;
};

// ============================================================================
// Levels
// ============================================================================

TEST(LogLevelTest, FromString) {
    EXPECT_EQ(LogLevelFromString("debug"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("WARNING"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("none"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("garbage"), LogLevel::Info);
}

TEST(LogLevelTest, ToString) {
    EXPECT_STRNE(LogLevelToString(LogLevel::Error), "");
    EXPECT_STRNE(LogLevelToString(LogLevel::Trace), LogLevelToString(LogLevel::Debug));
}

// ============================================================================
// Logger
// ============================================================================

TEST_F(LoggingTest, StreamMacroDeliversEntry) {
    LOG_INFO(LogCategory::REGISTRY) << "registered org " << 42;

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Info);
    EXPECT_EQ(entries_[0].category, LogCategory::REGISTRY);
    EXPECT_EQ(entries_[0].message, "registered org 42");
    EXPECT_GT(entries_[0].line, 0);
}

TEST_F(LoggingTest, LoggerLevelFilters) {
    POLITY_LOGGER.SetLevel(LogLevel::Warn);
    LOG_DEBUG(LogCategory::AUTHZ) << "dropped";
    LOG_ERROR(LogCategory::AUTHZ) << "kept";

    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "kept");
}

TEST_F(LoggingTest, SinkLevelFilters) {
    sink_->SetLevel(LogLevel::Error);
    LOG_WARN(LogCategory::DB) << "below sink level";
    EXPECT_TRUE(entries_.empty());
}

TEST_F(LoggingTest, OffSilencesEverything) {
    POLITY_LOGGER.SetLevel(LogLevel::Off);
    LOG_ERROR(LogCategory::DEFAULT) << "nothing";
    EXPECT_TRUE(entries_.empty());
    EXPECT_FALSE(POLITY_LOGGER.WillLog(LogLevel::Error));
}

TEST_F(LoggingTest, RemovedSinkStopsReceiving) {
    size_t before = POLITY_LOGGER.SinkCount();
    POLITY_LOGGER.RemoveSink(sink_);
    EXPECT_EQ(POLITY_LOGGER.SinkCount(), before - 1);

    LOG_INFO(LogCategory::CLI) << "after removal";
    EXPECT_TRUE(entries_.empty());
    POLITY_LOGGER.AddSink(sink_);
}

TEST_F(LoggingTest, ScopedTimerLogsAtDebug) {
    {
        ScopedLogTimer timer(LogCategory::REGISTRY, "load");
    }
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Debug);
    EXPECT_EQ(entries_[0].message.rfind("load took ", 0), 0u);
}

// ============================================================================
// FileSink
// ============================================================================

TEST_F(LoggingTest, FileSinkWritesLines) {
    char filename[] = "/tmp/polity_log_test_XXXXXX";
    int fd = mkstemp(filename);
    if (fd < 0) {
        throw std::runtime_error("Failed to create temp file");
    }
    close(fd);

    {
        FileSink::Config config;
        config.path = filename;
        config.autoFlush = true;
        config.level = LogLevel::Info;
        auto fileSink = std::make_shared<FileSink>(config);
        ASSERT_TRUE(fileSink->IsOpen());

        POLITY_LOGGER.AddSink(fileSink);
        LOG_DEBUG(LogCategory::DB) << "not written";
        LOG_INFO(LogCategory::DB) << "written to file";
        POLITY_LOGGER.RemoveSink(fileSink);
    }

    std::ifstream in(filename);
    std::stringstream content;
    content << in.rdbuf();
    std::remove(filename);

    EXPECT_NE(content.str().find("written to file"), std::string::npos);
    EXPECT_NE(content.str().find("[db]"), std::string::npos);
    EXPECT_EQ(content.str().find("not written"), std::string::npos);
}

} // namespace test
} // namespace util
} // namespace polity
