#include <gtest/gtest.h>
#include "fs.h"
#include "logger.h"

#include <string>
#include <vector>

using namespace peerlink;

class FsTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().set_log_level(LogLevel::ERROR);
        path_ = "test_fs_file.bin";
        delete_file(path_);
    }

    void TearDown() override {
        delete_file(path_);
        Logger::getInstance().set_log_level(LogLevel::INFO);
    }

    std::string path_;
};

TEST_F(FsTest, MissingFile) {
    EXPECT_FALSE(file_exists(path_));
    EXPECT_FALSE(is_file(path_));
    EXPECT_EQ(get_file_size(path_), -1);
    std::string text;
    EXPECT_FALSE(read_file_text(path_, text));
}

TEST_F(FsTest, TextRoundTrip) {
    ASSERT_TRUE(create_file(path_, "hello\nworld"));
    EXPECT_TRUE(file_exists(path_));
    EXPECT_TRUE(is_file(path_));
    EXPECT_EQ(get_file_size(path_), 11);

    std::string text;
    ASSERT_TRUE(read_file_text(path_, text));
    EXPECT_EQ(text, "hello\nworld");

    EXPECT_TRUE(delete_file(path_));
    EXPECT_FALSE(file_exists(path_));
}

TEST_F(FsTest, ChunkReadsExactRange) {
    std::vector<uint8_t> data(1000);
    for (size_t i = 0; i < data.size(); ++i) data[i] = static_cast<uint8_t>(i);
    ASSERT_TRUE(create_file_binary(path_, data.data(), data.size()));

    uint8_t buffer[10];
    ASSERT_TRUE(read_file_chunk(path_, 500, buffer, sizeof(buffer)));
    EXPECT_EQ(buffer[0], static_cast<uint8_t>(500));
    EXPECT_EQ(buffer[9], static_cast<uint8_t>(509));

    EXPECT_FALSE(read_file_chunk(path_, 995, buffer, sizeof(buffer)));
}

TEST_F(FsTest, PathHelpers) {
    EXPECT_EQ(get_filename_from_path("/tmp/dir/report.pdf"), "report.pdf");
    EXPECT_EQ(get_filename_from_path("C:\\files\\a.txt"), "a.txt");
    EXPECT_EQ(get_filename_from_path("plain"), "plain");

    EXPECT_EQ(get_file_extension("archive.tar.gz"), ".gz");
    EXPECT_EQ(get_file_extension("/a.b/noext"), "");
    EXPECT_EQ(get_file_extension(".bashrc"), "");
}
