#include <gtest/gtest.h>
#include "config.h"
#include "fs.h"
#include "logger.h"

#include <string>

using namespace peerlink;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().set_log_level(LogLevel::ERROR);
        path_ = "test_peerlink_config.json";
        delete_file(path_);
    }

    void TearDown() override {
        delete_file(path_);
        Logger::getInstance().set_log_level(LogLevel::INFO);
    }

    std::string path_;
};

TEST_F(ConfigTest, MissingFileYieldsDefaults) {
    PeerlinkConfig config;
    config.chunk_size = 1;
    ASSERT_TRUE(load_config(path_, config));
    EXPECT_EQ(config.chunk_size, 256u * 1024);
    EXPECT_EQ(config.max_file_size, 2ULL * 1024 * 1024 * 1024);
    EXPECT_EQ(config.connect_timeout_ms, 30000);
    EXPECT_EQ(config.buffer_capacity, 100u);
    EXPECT_EQ(config.max_participants, 8);
    EXPECT_EQ(config.log_level, LogLevel::INFO);
}

TEST_F(ConfigTest, FileOverlaysDefaults) {
    ASSERT_TRUE(create_file(path_, R"({"chunk_size": 4096, "log_level": "debug", "listen_port": 9000})"));
    PeerlinkConfig config;
    ASSERT_TRUE(load_config(path_, config));
    EXPECT_EQ(config.chunk_size, 4096u);
    EXPECT_EQ(config.log_level, LogLevel::DEBUG);
    EXPECT_EQ(config.listen_port, 9000);
    EXPECT_EQ(config.stall_timeout_ms, 60000);
}

TEST_F(ConfigTest, SaveThenLoadKeepsValues) {
    PeerlinkConfig saved;
    saved.chunk_size = 65536;
    saved.auto_reply_delay_ms = 2500;
    saved.log_level = LogLevel::WARN;
    ASSERT_TRUE(save_config(path_, saved));

    PeerlinkConfig loaded;
    ASSERT_TRUE(load_config(path_, loaded));
    EXPECT_EQ(loaded.chunk_size, 65536u);
    EXPECT_EQ(loaded.auto_reply_delay_ms, 2500);
    EXPECT_EQ(loaded.log_level, LogLevel::WARN);
}

TEST_F(ConfigTest, RejectsMalformedJson) {
    ASSERT_TRUE(create_file(path_, "{ chunk_size: "));
    PeerlinkConfig config;
    EXPECT_FALSE(load_config(path_, config));
}

TEST_F(ConfigTest, RejectsWrongTypes) {
    ASSERT_TRUE(create_file(path_, R"({"chunk_size": "big"})"));
    PeerlinkConfig config;
    EXPECT_FALSE(load_config(path_, config));
}

TEST_F(ConfigTest, RejectsInvalidValues) {
    ASSERT_TRUE(create_file(path_, R"({"chunk_size": 0})"));
    PeerlinkConfig config;
    EXPECT_FALSE(load_config(path_, config));

    ASSERT_TRUE(create_file(path_, R"({"connect_timeout_ms": -5})"));
    EXPECT_FALSE(load_config(path_, config));

    ASSERT_TRUE(create_file(path_, R"({"log_level": "chatty"})"));
    EXPECT_FALSE(load_config(path_, config));
}
