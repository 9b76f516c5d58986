#include <gtest/gtest.h>
#include "logger.h"

#include <string>
#include <vector>

using namespace peerlink;

class LoggerTest : public ::testing::Test {
protected:
    struct Captured {
        LogLevel level;
        std::string module;
        std::string line;
    };

    void SetUp() override {
        Logger& logger = Logger::getInstance();
        logger.set_log_level(LogLevel::DEBUG);
        logger.set_timestamps_enabled(false);
        logger.set_sink([this](LogLevel level, const std::string& module, const std::string& line) {
            lines_.push_back(Captured{level, module, line});
        });
    }

    void TearDown() override {
        Logger& logger = Logger::getInstance();
        logger.set_sink(nullptr);
        logger.set_timestamps_enabled(true);
        logger.set_log_level(LogLevel::INFO);
    }

    std::vector<Captured> lines_;
};

TEST_F(LoggerTest, SinkReceivesTaggedLines) {
    LOG_INFO("mesh", "peer " << "bob" << " joined with " << 2 << " links");
    LOG_ERROR("", "bare");

    ASSERT_EQ(lines_.size(), 2u);
    EXPECT_EQ(lines_[0].level, LogLevel::INFO);
    EXPECT_EQ(lines_[0].module, "mesh");
    EXPECT_EQ(lines_[0].line, "[INFO ] [mesh] peer bob joined with 2 links");
    EXPECT_EQ(lines_[1].line, "[ERROR] bare");
}

TEST_F(LoggerTest, LevelFiltersLines) {
    Logger::getInstance().set_log_level(LogLevel::WARN);
    LOG_DEBUG("transfer", "hidden");
    LOG_INFO("transfer", "hidden");
    LOG_WARN("transfer", "shown");
    LOG_ERROR("transfer", "shown");

    ASSERT_EQ(lines_.size(), 2u);
    EXPECT_EQ(lines_[0].level, LogLevel::WARN);
    EXPECT_EQ(lines_[1].level, LogLevel::ERROR);
    EXPECT_EQ(Logger::getInstance().get_log_level(), LogLevel::WARN);
}

TEST_F(LoggerTest, ParsesLevelNames) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(Logger::parse_log_level("DEBUG", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(Logger::parse_log_level("warning", level));
    EXPECT_EQ(level, LogLevel::WARN);
    EXPECT_TRUE(Logger::parse_log_level("Error", level));
    EXPECT_EQ(level, LogLevel::ERROR);

    EXPECT_FALSE(Logger::parse_log_level("loud", level));
    EXPECT_EQ(level, LogLevel::ERROR);
}
