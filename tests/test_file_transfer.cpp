#include <gtest/gtest.h>
#include "auth.h"
#include "event_loop.h"
#include "file_transfer.h"
#include "fs.h"
#include "logger.h"
#include "loopback_transport.h"

#include <memory>
#include <string>
#include <vector>

using namespace peerlink;

class FileTransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().set_log_level(LogLevel::ERROR);
        config_.chunk_size = 4096;

        hub_ = std::make_unique<LoopbackHub>(loop_);
        uploader_transport_ = hub_->create_transport("uploader");
        downloader_transport_ = hub_->create_transport("downloader");
        raw_transport_ = hub_->create_transport("raw");
    }

    void TearDown() override {
        raw_connection_.reset();
        downloader_.reset();
        uploader_.reset();
        raw_transport_.reset();
        downloader_transport_.reset();
        uploader_transport_.reset();
        hub_.reset();
        delete_file("test_download_output.bin");
        Logger::getInstance().set_log_level(LogLevel::INFO);
    }

    static std::vector<uint8_t> make_data(size_t size) {
        std::vector<uint8_t> data(size);
        for (size_t i = 0; i < size; ++i) {
            data[i] = static_cast<uint8_t>(i % 251);
        }
        return data;
    }

    void start_uploader(const std::vector<uint8_t>& data, const std::string& password) {
        auto source = std::make_shared<MemoryFileSource>("notes.bin", "application/octet-stream", data);
        uploader_ = std::make_shared<TransferUploader>(loop_, source, password, config_);
        uploader_->serve(*uploader_transport_);
    }

    void start_downloader(const PeerlinkConfig& config) {
        downloader_ = std::make_shared<TransferDownloader>(loop_, *downloader_transport_, "uploader", config);
        ASSERT_TRUE(downloader_->connect());
    }

    UploadSession only_session() const {
        auto sessions = uploader_->sessions();
        EXPECT_EQ(sessions.size(), 1u);
        return sessions.empty() ? UploadSession{} : sessions.front();
    }

    /// Hand-driven downloader: records every frame the uploader sends
    void open_raw_connection() {
        raw_connection_ = raw_transport_->connect("uploader");
        ASSERT_NE(raw_connection_, nullptr);
        raw_connection_->on_text([this](const std::string& text) {
            auto message = decode_transfer_message(text);
            ASSERT_TRUE(message.has_value());
            raw_events_.push_back(transfer_message_type(*message));
            raw_messages_.push_back(*message);
        });
        raw_connection_->on_binary([this](const std::vector<uint8_t>& data) {
            raw_events_.push_back("binary:" + std::to_string(data.size()));
        });
        loop_.run_until_idle();
        ASSERT_TRUE(raw_connection_->is_open());
    }

    void raw_send(const TransferMessage& message) {
        ASSERT_TRUE(raw_connection_->send_text(encode_transfer_message(message)));
        loop_.run_until_idle();
    }

    template <typename T>
    const T& last_raw_message() const {
        return std::get<T>(raw_messages_.back());
    }

    EventLoop loop_;
    PeerlinkConfig config_;
    std::unique_ptr<LoopbackHub> hub_;
    std::shared_ptr<LoopbackTransport> uploader_transport_;
    std::shared_ptr<LoopbackTransport> downloader_transport_;
    std::shared_ptr<LoopbackTransport> raw_transport_;

    std::shared_ptr<TransferUploader> uploader_;
    std::shared_ptr<TransferDownloader> downloader_;

    std::shared_ptr<Connection> raw_connection_;
    std::vector<std::string> raw_events_;
    std::vector<TransferMessage> raw_messages_;
};

//=============================================================================
// Downloader against uploader
//=============================================================================

TEST_F(FileTransferTest, UnprotectedFileGoesStraightToReady) {
    start_uploader(make_data(100), "");
    start_downloader(config_);
    loop_.run_until_idle();

    EXPECT_EQ(downloader_->status(), DownloadStatus::READY);
    ASSERT_TRUE(downloader_->file_info().has_value());
    EXPECT_EQ(downloader_->file_info()->name, "notes.bin");
    EXPECT_EQ(downloader_->file_info()->size, 100u);
    EXPECT_EQ(only_session().status, UploadStatus::READY);
}

TEST_F(FileTransferTest, WrongPasswordThenRightPassword) {
    start_uploader(make_data(1000), "hunter2");
    start_downloader(config_);
    loop_.run_until_idle();

    ASSERT_EQ(downloader_->status(), DownloadStatus::PASSWORD_REQUIRED);
    EXPECT_FALSE(downloader_->file_info().has_value());
    auto first_challenge = only_session().challenge;
    ASSERT_TRUE(first_challenge.has_value());

    ASSERT_TRUE(downloader_->submit_password("wrong"));
    loop_.run_until_idle();
    EXPECT_EQ(downloader_->status(), DownloadStatus::PASSWORD_ERROR);
    EXPECT_EQ(downloader_->error(), "Invalid password");

    UploadSession session = only_session();
    ASSERT_TRUE(session.challenge.has_value());
    EXPECT_NE(*session.challenge, *first_challenge);
    EXPECT_EQ(session.failed_password_attempts, 1u);
    EXPECT_EQ(session.status, UploadStatus::AUTHENTICATING);

    ASSERT_TRUE(downloader_->submit_password("hunter2"));
    loop_.run_until_idle();
    EXPECT_EQ(downloader_->status(), DownloadStatus::READY);
    ASSERT_TRUE(downloader_->file_info().has_value());
    EXPECT_EQ(downloader_->file_info()->size, 1000u);
    EXPECT_EQ(only_session().status, UploadStatus::READY);
}

TEST_F(FileTransferTest, SubmitPasswordWithoutChallengeIsRejected) {
    start_uploader(make_data(10), "");
    start_downloader(config_);
    loop_.run_until_idle();
    EXPECT_FALSE(downloader_->submit_password("hunter2"));
}

TEST_F(FileTransferTest, DownloadsInChunks) {
    std::vector<uint8_t> data = make_data(10 * 1024);
    start_uploader(data, "");
    start_downloader(config_);

    std::vector<uint64_t> progress;
    bool completed = false;
    downloader_->on_progress([&](uint64_t received, uint64_t total) {
        EXPECT_EQ(total, data.size());
        progress.push_back(received);
    });
    downloader_->on_complete([&](const FileInfo& info, const std::vector<uint8_t>& bytes) {
        EXPECT_EQ(info.name, "notes.bin");
        EXPECT_EQ(bytes, data);
        completed = true;
    });

    loop_.run_until_idle();
    ASSERT_TRUE(downloader_->start());
    loop_.run_until_idle();

    EXPECT_TRUE(completed);
    EXPECT_EQ(downloader_->status(), DownloadStatus::COMPLETE);
    EXPECT_EQ(progress, (std::vector<uint64_t>{4096, 8192, 10240}));
    EXPECT_EQ(uploader_->completed_downloads(), 1u);
    EXPECT_EQ(only_session().status, UploadStatus::DONE);

    ASSERT_TRUE(downloader_->save_to("test_download_output.bin"));
    EXPECT_EQ(get_file_size("test_download_output.bin"), 10 * 1024);
}

TEST_F(FileTransferTest, EmptyFileCompletesWithOneFinalChunk) {
    start_uploader({}, "");
    start_downloader(config_);
    loop_.run_until_idle();
    ASSERT_TRUE(downloader_->start());
    loop_.run_until_idle();

    EXPECT_EQ(downloader_->status(), DownloadStatus::COMPLETE);
    EXPECT_TRUE(downloader_->data().empty());
}

TEST_F(FileTransferTest, PauseThenResumeFromCommittedOffset) {
    std::vector<uint8_t> data = make_data(10 * 1024);
    start_uploader(data, "");
    start_downloader(config_);
    downloader_->on_progress([&](uint64_t received, uint64_t) {
        if (received == 4096) {
            downloader_->pause();
        }
    });
    loop_.run_until_idle();
    ASSERT_TRUE(downloader_->start());
    loop_.run_until_idle();

    EXPECT_EQ(downloader_->status(), DownloadStatus::PAUSED);
    EXPECT_LT(downloader_->bytes_received(), data.size());
    EXPECT_EQ(downloader_->bytes_received() % 4096, 0u);
    EXPECT_EQ(only_session().status, UploadStatus::PAUSED);

    ASSERT_TRUE(downloader_->resume());
    loop_.run_until_idle();
    EXPECT_EQ(downloader_->status(), DownloadStatus::COMPLETE);
    EXPECT_EQ(downloader_->data(), data);
}

TEST_F(FileTransferTest, ReconnectKeepsCommittedBytes) {
    std::vector<uint8_t> data = make_data(10 * 1024);
    start_uploader(data, "");
    start_downloader(config_);
    downloader_->on_progress([&](uint64_t received, uint64_t) {
        if (received == 4096) {
            downloader_->pause();
        }
    });
    loop_.run_until_idle();
    ASSERT_TRUE(downloader_->start());
    loop_.run_until_idle();
    uint64_t kept = downloader_->bytes_received();
    ASSERT_GT(kept, 0u);

    downloader_->close();
    loop_.run_until_idle();
    EXPECT_EQ(downloader_->status(), DownloadStatus::CLOSED);
    EXPECT_TRUE(uploader_->sessions().empty());

    ASSERT_TRUE(downloader_->reconnect());
    loop_.run_until_idle();
    ASSERT_EQ(downloader_->status(), DownloadStatus::READY);
    EXPECT_EQ(downloader_->bytes_received(), kept);

    ASSERT_TRUE(downloader_->start());
    loop_.run_until_idle();
    EXPECT_EQ(downloader_->status(), DownloadStatus::COMPLETE);
    EXPECT_EQ(downloader_->data(), data);
}

TEST_F(FileTransferTest, OversizeFileIsRefused) {
    start_uploader(make_data(2000), "");
    PeerlinkConfig small = config_;
    small.max_file_size = 1000;
    start_downloader(small);
    loop_.run_until_idle();

    EXPECT_EQ(downloader_->status(), DownloadStatus::ERROR);
    EXPECT_EQ(downloader_->error(), "File exceeds maximum size");
    EXPECT_FALSE(downloader_->start());
}

TEST_F(FileTransferTest, UnknownUploaderIsAnError) {
    downloader_ = std::make_shared<TransferDownloader>(loop_, *downloader_transport_, "nobody", config_);
    ASSERT_TRUE(downloader_->connect());
    loop_.run_until_idle();
    EXPECT_EQ(downloader_->status(), DownloadStatus::ERROR);
    EXPECT_EQ(downloader_->error(), "Could not connect to peer nobody");
}

TEST_F(FileTransferTest, UnresponsiveUploaderTimesOut) {
    hub_->set_unresponsive("uploader", true);
    start_uploader(make_data(10), "");
    PeerlinkConfig quick = config_;
    quick.connect_timeout_ms = 20;
    start_downloader(quick);

    EXPECT_TRUE(loop_.run_until([&]() { return downloader_->status() == DownloadStatus::ERROR; }, 2000));
    EXPECT_NE(downloader_->error().find("timed out"), std::string::npos);
}

TEST_F(FileTransferTest, SilentUploaderFailsAfterOpen) {
    auto silent_transport = hub_->create_transport("silent");
    std::vector<std::shared_ptr<Connection>> accepted;
    silent_transport->on_incoming_connection([&](std::shared_ptr<Connection> connection) {
        accepted.push_back(connection);
    });

    PeerlinkConfig quick = config_;
    quick.connect_timeout_ms = 20;
    downloader_ = std::make_shared<TransferDownloader>(loop_, *downloader_transport_, "silent", quick);
    ASSERT_TRUE(downloader_->connect());
    loop_.run_until_idle();

    ASSERT_EQ(accepted.size(), 1u);
    EXPECT_TRUE(accepted[0]->is_open());
    EXPECT_EQ(downloader_->status(), DownloadStatus::CONNECTING);

    EXPECT_TRUE(loop_.run_until([&]() { return downloader_->status() == DownloadStatus::ERROR; }, 2000));
    EXPECT_EQ(downloader_->error(), "No response from uploader");
}

TEST_F(FileTransferTest, AnsweredPasswordPromptIsNotTimedOut) {
    start_uploader(make_data(10), "hunter2");
    PeerlinkConfig quick = config_;
    quick.connect_timeout_ms = 20;
    start_downloader(quick);
    loop_.run_until_idle();
    ASSERT_EQ(downloader_->status(), DownloadStatus::PASSWORD_REQUIRED);

    // waiting on the user is not waiting on the uploader
    loop_.run_for(60);
    EXPECT_EQ(downloader_->status(), DownloadStatus::PASSWORD_REQUIRED);

    ASSERT_TRUE(downloader_->submit_password("hunter2"));
    loop_.run_until_idle();
    EXPECT_EQ(downloader_->status(), DownloadStatus::READY);
    loop_.run_for(60);
    EXPECT_EQ(downloader_->status(), DownloadStatus::READY);
}

TEST_F(FileTransferTest, FileNameThatIsNotUtf8StillTransfers) {
    auto source = std::make_shared<MemoryFileSource>("caf\xe9.txt", "text/plain", make_data(10));
    uploader_ = std::make_shared<TransferUploader>(loop_, source, "", config_);
    uploader_->serve(*uploader_transport_);
    start_downloader(config_);
    loop_.run_until_idle();

    ASSERT_EQ(downloader_->status(), DownloadStatus::READY);
    EXPECT_EQ(downloader_->file_info()->name, "caf\xef\xbf\xbd.txt");

    ASSERT_TRUE(downloader_->start());
    loop_.run_until_idle();
    EXPECT_EQ(downloader_->status(), DownloadStatus::COMPLETE);
    EXPECT_EQ(downloader_->data(), make_data(10));
    EXPECT_EQ(only_session().status, UploadStatus::DONE);
}

//=============================================================================
// Uploader driven frame by frame
//=============================================================================

TEST_F(FileTransferTest, PayloadPrecedesItsChunkRecord) {
    start_uploader(make_data(10 * 1024), "");
    open_raw_connection();
    raw_send(transfer::RequestInfo{});
    raw_send(transfer::Start{0});

    EXPECT_EQ(raw_events_, (std::vector<std::string>{
        "Info", "binary:4096", "Chunk", "binary:4096", "Chunk", "binary:2048", "Chunk"}));

    std::vector<bool> finals;
    std::vector<uint64_t> offsets;
    for (const auto& message : raw_messages_) {
        if (const auto* chunk = std::get_if<transfer::Chunk>(&message)) {
            finals.push_back(chunk->final);
            offsets.push_back(chunk->offset);
        }
    }
    EXPECT_EQ(finals, (std::vector<bool>{false, false, true}));
    EXPECT_EQ(offsets, (std::vector<uint64_t>{0, 4096, 8192}));
}

TEST_F(FileTransferTest, StartBeforeAuthenticationIsRefused) {
    start_uploader(make_data(100), "hunter2");
    open_raw_connection();
    raw_send(transfer::Start{0});

    ASSERT_FALSE(raw_messages_.empty());
    EXPECT_EQ(last_raw_message<transfer::Error>().message, "Not authorized");
    EXPECT_EQ(only_session().status, UploadStatus::PENDING);
}

TEST_F(FileTransferTest, StartBeyondEndIsRefused) {
    start_uploader(make_data(100), "");
    open_raw_connection();
    raw_send(transfer::RequestInfo{});
    raw_send(transfer::Start{101});

    EXPECT_EQ(last_raw_message<transfer::Error>().message, "Invalid offset");
}

TEST_F(FileTransferTest, ChallengeCannotBeReplayed) {
    start_uploader(make_data(100), "hunter2");
    open_raw_connection();
    raw_send(transfer::RequestInfo{});
    std::string first = last_raw_message<transfer::PasswordRequired>().challenge;
    EXPECT_FALSE(last_raw_message<transfer::PasswordRequired>().error.has_value());

    raw_send(transfer::UsePassword{compute_challenge_response("wrong", first)});
    EXPECT_EQ(last_raw_message<transfer::PasswordRequired>().error.value_or(""), "Invalid password");
    std::string second = last_raw_message<transfer::PasswordRequired>().challenge;
    EXPECT_NE(first, second);

    // the right password bound to the consumed challenge is stale
    raw_send(transfer::UsePassword{compute_challenge_response("hunter2", first)});
    EXPECT_EQ(raw_events_.back(), "PasswordRequired");
    std::string third = last_raw_message<transfer::PasswordRequired>().challenge;

    raw_send(transfer::UsePassword{compute_challenge_response("hunter2", third)});
    EXPECT_EQ(raw_events_.back(), "Info");
    EXPECT_EQ(only_session().failed_password_attempts, 2u);
    EXPECT_EQ(only_session().status, UploadStatus::READY);
}

TEST_F(FileTransferTest, DownloaderErrorEndsSession) {
    start_uploader(make_data(100), "");
    open_raw_connection();
    raw_send(transfer::RequestInfo{});
    raw_send(transfer::Error{"disk full"});

    UploadSession session = only_session();
    EXPECT_EQ(session.status, UploadStatus::ERROR);
    EXPECT_EQ(session.error, "disk full");
}
