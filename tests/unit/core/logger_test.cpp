// Tickwise Unit Tests
// logger_test.cpp - Tests for the category logger

#include <gtest/gtest.h>

#include <tickwise/core/logger.hpp>

namespace tickwise::core {
namespace {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        LoggerConfig config;
        config.enable_file = false;
        config.console_level = LogLevel::Warn;
        Logger::initialize(config);
    }

    void TearDown() override { Logger::shutdown(); }
};

TEST_F(LoggerTest, InitializeAndShutdown) {
    EXPECT_TRUE(Logger::is_initialized());
    Logger::shutdown();
    EXPECT_FALSE(Logger::is_initialized());
}

TEST_F(LoggerTest, LevelFromConfig) {
    EXPECT_EQ(Logger::get_level(), LogLevel::Warn);

    Logger::set_level(LogLevel::Error);
    EXPECT_EQ(Logger::get_level(), LogLevel::Error);
}

TEST_F(LoggerTest, LevelFiltersMessages) {
    EXPECT_FALSE(Logger::is_enabled(LogLevel::Debug));
    EXPECT_TRUE(Logger::is_enabled(LogLevel::Warn));

    Logger::set_level(LogLevel::Trace);
    EXPECT_TRUE(Logger::is_enabled(LogLevel::Trace));

    Logger::set_level(LogLevel::Off);
    EXPECT_FALSE(Logger::is_enabled(LogLevel::Critical));
}

TEST_F(LoggerTest, MacrosDoNotThrow) {
    EXPECT_NO_THROW(TICKWISE_LOG_DEBUG(log_category::ENGINE, "filtered {}", 1));
    EXPECT_NO_THROW(TICKWISE_LOG_WARN(log_category::SCHEDULER, "shown {} {}", "a", 2.5));
    EXPECT_NO_THROW(Logger::flush());
}

TEST(LogLevelTest, ParsesNames) {
    EXPECT_EQ(parse_log_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_log_level("info"), LogLevel::Info);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("off"), LogLevel::Off);
    EXPECT_FALSE(parse_log_level("loud").has_value());
}

}  // namespace
}  // namespace tickwise::core
