#pragma once

/**
 * @file file_transfer.h
 * @brief Chunked, resumable, optionally password-protected file transfer
 *
 * One TransferUploader serves a single file to any number of downloader
 * connections. One TransferDownloader fetches the file from one uploader.
 *
 * Per chunk the uploader sends the raw bytes as a binary frame and then a
 * Chunk {offset, final} record. The record commits the payload: the
 * downloader never counts bytes as received before their record arrives.
 *
 * Both classes hand weak references to themselves to connection handlers
 * and timers, so they must be owned by a std::shared_ptr.
 */

#include "config.h"
#include "event_loop.h"
#include "file_source.h"
#include "transfer_messages.h"
#include "transport.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace peerlink {

/**
 * Uploader state per connection
 */
enum class UploadStatus {
    PENDING,        // connection open, no info requested yet
    AUTHENTICATING, // challenge outstanding
    READY,          // file info sent
    UPLOADING,      // streaming chunks
    PAUSED,
    DONE,           // downloader confirmed completion
    ERROR,
    CLOSED
};

enum class DownloadStatus {
    CONNECTING,
    PASSWORD_REQUIRED,
    PASSWORD_ERROR,     // previous password was rejected
    READY,              // file info received
    DOWNLOADING,
    PAUSED,
    COMPLETE,
    ERROR,
    CLOSED
};

const char* upload_status_to_string(UploadStatus status);
const char* download_status_to_string(DownloadStatus status);

/**
 * Snapshot of one uploader-side transfer session
 */
struct UploadSession {
    std::string connection_id;
    std::string peer_id;
    UploadStatus status = UploadStatus::PENDING;
    uint64_t offset = 0;                // next byte to send
    uint64_t total_size = 0;
    std::optional<std::string> challenge;
    uint64_t bytes_acknowledged = 0;    // advisory, from ChunkAck
    uint32_t failed_password_attempts = 0;
    std::string error;
};

class TransferUploader : public std::enable_shared_from_this<TransferUploader> {
public:
    using StatusCallback = std::function<void(const UploadSession& session)>;

    /**
     * @param password Empty string disables the password gate
     */
    TransferUploader(EventLoop& loop, std::shared_ptr<const FileSource> source, std::string password,
                     const PeerlinkConfig& config);
    ~TransferUploader();

    TransferUploader(const TransferUploader&) = delete;
    TransferUploader& operator=(const TransferUploader&) = delete;

    // Accept every inbound connection of the transport as a downloader
    void serve(PeerTransport& transport);

    // Take ownership of one downloader connection (open or about to open)
    void add_connection(std::shared_ptr<Connection> connection);

    // Close every connection and forget all sessions
    void stop();

    std::optional<UploadSession> session(const std::string& connection_id) const;
    std::vector<UploadSession> sessions() const;

    size_t completed_downloads() const { return completed_downloads_; }
    const FileInfo& file_info() const { return file_info_; }
    bool password_protected() const { return !password_.empty(); }

    // Fired on every status change and on progress (ChunkAck)
    void on_session_update(StatusCallback callback) { update_callback_ = std::move(callback); }

private:
    struct Session {
        UploadSession state;
        std::shared_ptr<Connection> connection;
        uint64_t stream_generation = 0;  // bumped to cancel a scheduled chunk
    };

    void handle_open(const std::string& connection_id);
    void handle_text(const std::string& connection_id, const std::string& text);
    void handle_binary(const std::string& connection_id);
    void handle_closed(const std::string& connection_id, UploadStatus status, const std::string& error);

    void handle(Session& session, const transfer::RequestInfo& message);
    void handle(Session& session, const transfer::UsePassword& message);
    void handle(Session& session, const transfer::Start& message);
    void handle(Session& session, const transfer::ChunkAck& message);
    void handle(Session& session, const transfer::Pause& message);
    void handle(Session& session, const transfer::Done& message);
    void handle(Session& session, const transfer::Error& message);
    template <typename T>
    void handle(Session& session, const T& message);

    void issue_challenge(Session& session, const std::optional<std::string>& error);
    void send_info(Session& session);
    void schedule_next_chunk(Session& session);
    void send_next_chunk(const std::string& connection_id, uint64_t generation);
    bool send(Session& session, const TransferMessage& message);
    void set_status(Session& session, UploadStatus status);
    void notify(const Session& session);
    Session* find_session(const std::string& connection_id);

    EventLoop& loop_;
    std::shared_ptr<const FileSource> source_;
    FileInfo file_info_;
    std::string password_;
    PeerlinkConfig config_;

    std::unordered_map<std::string, Session> sessions_;
    size_t completed_downloads_ = 0;
    StatusCallback update_callback_;
};

class TransferDownloader : public std::enable_shared_from_this<TransferDownloader> {
public:
    using StatusCallback = std::function<void(DownloadStatus status)>;
    using ProgressCallback = std::function<void(uint64_t bytes_received, uint64_t total_bytes)>;
    using CompleteCallback = std::function<void(const FileInfo& info, const std::vector<uint8_t>& data)>;

    TransferDownloader(EventLoop& loop, PeerTransport& transport, std::string uploader_peer_id,
                       const PeerlinkConfig& config);
    ~TransferDownloader();

    TransferDownloader(const TransferDownloader&) = delete;
    TransferDownloader& operator=(const TransferDownloader&) = delete;

    // Reported in RequestInfo
    void set_client_info(const std::string& browser_name, const std::string& os_name);

    /**
     * @brief Dial the uploader and request file info
     * @return false if the dial could not be started
     */
    bool connect();

    // Answer the outstanding challenge
    bool submit_password(const std::string& password);

    // Request the bytes from the committed offset onwards
    bool start();
    bool pause();
    bool resume();

    /**
     * @brief Start a fresh connection attempt after close or error
     *
     * Bytes already committed are kept if the uploader reports the same file.
     */
    bool reconnect();

    void close();

    DownloadStatus status() const { return status_; }
    const std::optional<FileInfo>& file_info() const { return file_info_; }
    uint64_t bytes_received() const { return data_.size(); }
    const std::vector<uint8_t>& data() const { return data_; }
    const std::string& error() const { return error_; }
    const std::string& uploader_peer_id() const { return uploader_peer_id_; }

    bool save_to(const std::string& path) const;

    void on_status(StatusCallback callback) { status_callback_ = std::move(callback); }
    void on_progress(ProgressCallback callback) { progress_callback_ = std::move(callback); }
    void on_complete(CompleteCallback callback) { complete_callback_ = std::move(callback); }

private:
    void handle_open();
    void handle_text(const std::string& text);
    void handle_binary(const std::vector<uint8_t>& data);
    void handle_closed(bool is_error, const std::string& error);

    void handle(const transfer::PasswordRequired& message);
    void handle(const transfer::Info& message);
    void handle(const transfer::Chunk& message);
    void handle(const transfer::Error& message);
    template <typename T>
    void handle(const T& message);

    bool send(const TransferMessage& message);
    void fail(const std::string& error, bool notify_peer);
    void set_status(DownloadStatus status);
    void arm_stall_timer();
    void check_stall();
    void arm_response_timer();
    void cancel_response_timer();
    void cancel_timers();
    void drop_connection();
    bool accepting_chunks() const;

    EventLoop& loop_;
    PeerTransport& transport_;
    std::string uploader_peer_id_;
    PeerlinkConfig config_;
    std::optional<std::string> browser_name_;
    std::optional<std::string> os_name_;

    std::shared_ptr<Connection> connection_;
    DownloadStatus status_ = DownloadStatus::CONNECTING;
    std::optional<std::string> challenge_;
    std::optional<FileInfo> file_info_;
    std::vector<uint8_t> data_;                     // committed bytes
    std::optional<std::vector<uint8_t>> pending_;   // payload awaiting its Chunk record
    std::string error_;

    EventLoop::TimerId connect_timer_ = EventLoop::kInvalidTimer;
    EventLoop::TimerId stall_timer_ = EventLoop::kInvalidTimer;
    EventLoop::TimerId response_timer_ = EventLoop::kInvalidTimer;  // awaiting PasswordRequired or Info
    int64_t last_activity_ = 0;

    StatusCallback status_callback_;
    ProgressCallback progress_callback_;
    CompleteCallback complete_callback_;
};

} // namespace peerlink
