// STAKELEDGER - Logging Tests
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include <gtest/gtest.h>

#include "stakeledger/util/logging.h"

#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>
#include <unistd.h>
#include <vector>

namespace stakeledger {
namespace util {
namespace test {

// ============================================================================
// Test Fixture
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger& logger = Logger::Instance();
        logger.ClearSinks();
        logger.SetLevel(LogLevel::Trace);
        logger.EnableAllCategories();
        logger.AddSink(std::make_shared<CallbackSink>(
            [this](const LogEntry& entry) { entries_.push_back(entry); }));
    }
    
    void TearDown() override {
        Logger& logger = Logger::Instance();
        logger.ClearSinks();
        logger.SetLevel(LogLevel::Info);
        logger.EnableAllCategories();
    }
    
    std::vector<LogEntry> entries_;
};

// ============================================================================
// Level Tests
// ============================================================================

TEST(LogLevelTest, ToStringAndBack) {
    EXPECT_STREQ(LogLevelToString(LogLevel::Warn), "WARN");
    EXPECT_EQ(LogLevelFromString("debug"), LogLevel::Debug);
    EXPECT_EQ(LogLevelFromString("Warning"), LogLevel::Warn);
    EXPECT_EQ(LogLevelFromString("none"), LogLevel::Off);
    EXPECT_EQ(LogLevelFromString("bogus"), LogLevel::Info);
}

TEST_F(LoggingTest, StreamMacroCarriesLevelCategoryAndLocation) {
    LOG_WARN(LogCategory::STAKING) << "position " << 42 << " locked";
    
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].level, LogLevel::Warn);
    EXPECT_EQ(entries_[0].category, "staking");
    EXPECT_EQ(entries_[0].message, "position 42 locked");
    EXPECT_EQ(GetBasename(entries_[0].file), "test_logging.cpp");
    EXPECT_GT(entries_[0].line, 0);
}

TEST_F(LoggingTest, BelowThresholdIsDropped) {
    Logger::Instance().SetLevel(LogLevel::Info);
    LOG_DEBUG(LogCategory::DB) << "dropped";
    LOG_INFO(LogCategory::DB) << "kept";
    
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "kept");
}

TEST_F(LoggingTest, DisabledStreamIsNotEvaluated) {
    Logger::Instance().SetLevel(LogLevel::Error);
    int evaluations = 0;
    auto count = [&evaluations]() { return ++evaluations; };
    LOG_INFO(LogCategory::DEFAULT) << count();
    
    EXPECT_EQ(evaluations, 0);
    EXPECT_TRUE(entries_.empty());
}

TEST_F(LoggingTest, CategoryFilter) {
    Logger& logger = Logger::Instance();
    logger.EnableCategory(LogCategory::ADMIN);
    EXPECT_TRUE(logger.IsCategoryEnabled(LogCategory::ADMIN));
    EXPECT_FALSE(logger.IsCategoryEnabled(LogCategory::EVENTS));
    
    LOG_INFO(LogCategory::EVENTS) << "filtered";
    LOG_INFO(LogCategory::ADMIN) << "shown";
    
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].category, "admin");
}

TEST_F(LoggingTest, FormattedLogging) {
    LogInfoF(LogCategory::STAKING, "staked %d for %s", 1000, "30d");
    
    ASSERT_EQ(entries_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "staked 1000 for 30d");
}

TEST_F(LoggingTest, SinkLevelFiltersIndependently) {
    std::vector<std::string> errors;
    Logger::Instance().AddSink(std::make_shared<CallbackSink>(
        [&errors](const LogEntry& entry) { errors.push_back(entry.message); },
        LogLevel::Error));
    EXPECT_EQ(Logger::Instance().SinkCount(), 2u);
    
    LOG_INFO(LogCategory::DB) << "info";
    LOG_ERROR(LogCategory::DB) << "error";
    
    EXPECT_EQ(entries_.size(), 2u);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "error");
}

// ============================================================================
// Setup Tests
// ============================================================================

TEST_F(LoggingTest, InitLoggingWritesFile) {
    char filename[] = "/tmp/stakeledger_log_test_XXXXXX";
    int fd = mkstemp(filename);
    ASSERT_GE(fd, 0);
    close(fd);
    
    ASSERT_TRUE(InitLogging(LogLevel::Info, false, filename));
    EXPECT_EQ(Logger::Instance().SinkCount(), 1u);
    LOG_INFO(LogCategory::EVENTS) << "pool initialized";
    LOG_DEBUG(LogCategory::EVENTS) << "not written";
    Logger::Instance().Flush();
    
    std::ifstream in(filename);
    std::stringstream content;
    content << in.rdbuf();
    EXPECT_NE(content.str().find("[INFO] [events] test_logging.cpp:"), std::string::npos);
    EXPECT_NE(content.str().find("pool initialized"), std::string::npos);
    EXPECT_EQ(content.str().find("not written"), std::string::npos);
    
    std::remove(filename);
}

TEST_F(LoggingTest, InitLoggingUnwritableFile) {
    EXPECT_FALSE(InitLogging(LogLevel::Info, false, "/nonexistent/dir/debug.log"));
}

} // namespace test
} // namespace util
} // namespace stakeledger
