#include <gtest/gtest.h>
#include "logger.h"
#include "time_utils.h"
#include <regex>

using namespace netlaunch;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level_ = Logger::getInstance().get_log_level();
    }

    void TearDown() override {
        Logger::getInstance().set_log_level(saved_level_);
    }

    LogLevel saved_level_;
};

TEST_F(LoggerTest, ParseLogLevelTest) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("INFO"), LogLevel::INFO);
    EXPECT_EQ(parse_log_level("Warn"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("WARNING"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("error"), LogLevel::ERROR);

    EXPECT_EQ(parse_log_level("verbose"), LogLevel::INFO);
    EXPECT_EQ(parse_log_level("", LogLevel::ERROR), LogLevel::ERROR);
}

TEST_F(LoggerTest, LevelFilteringTest) {
    Logger& logger = Logger::getInstance();

    logger.set_log_level(LogLevel::WARN);
    EXPECT_EQ(logger.get_log_level(), LogLevel::WARN);
    EXPECT_FALSE(logger.is_enabled(LogLevel::DEBUG));
    EXPECT_FALSE(logger.is_enabled(LogLevel::INFO));
    EXPECT_TRUE(logger.is_enabled(LogLevel::WARN));
    EXPECT_TRUE(logger.is_enabled(LogLevel::ERROR));

    logger.set_log_level(LogLevel::DEBUG);
    EXPECT_TRUE(logger.is_enabled(LogLevel::DEBUG));
}

// Macros accept stream expressions
TEST_F(LoggerTest, StreamMacrosTest) {
    Logger::getInstance().set_log_level(LogLevel::DEBUG);
    int port = 445;
    LOG_DEBUG("test", "probing port " << port);
    LOG_INFO("test", "found " << 2 << " shares");
    LOG_WARN("test", "slow host " << "nas.local");
    SUCCEED();
}

TEST_F(LoggerTest, Iso8601TimestampTest) {
    std::chrono::system_clock::time_point epoch_plus{std::chrono::milliseconds(1500)};
    EXPECT_EQ(to_iso8601(epoch_plus), "1970-01-01T00:00:01.500Z");

    std::regex pattern(R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z)");
    EXPECT_TRUE(std::regex_match(now_iso8601(), pattern));
}
