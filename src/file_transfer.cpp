#include "file_transfer.h"
#include "auth.h"
#include "fs.h"
#include "logger.h"

#include <algorithm>

#define LOG_TRANSFER_DEBUG(message) LOG_DEBUG("transfer", message)
#define LOG_TRANSFER_INFO(message)  LOG_INFO("transfer", message)
#define LOG_TRANSFER_WARN(message)  LOG_WARN("transfer", message)
#define LOG_TRANSFER_ERROR(message) LOG_ERROR("transfer", message)

namespace peerlink {

const char* upload_status_to_string(UploadStatus status) {
    switch (status) {
        case UploadStatus::PENDING:        return "pending";
        case UploadStatus::AUTHENTICATING: return "authenticating";
        case UploadStatus::READY:          return "ready";
        case UploadStatus::UPLOADING:      return "uploading";
        case UploadStatus::PAUSED:         return "paused";
        case UploadStatus::DONE:           return "done";
        case UploadStatus::ERROR:          return "error";
        case UploadStatus::CLOSED:         return "closed";
    }
    return "unknown";
}

const char* download_status_to_string(DownloadStatus status) {
    switch (status) {
        case DownloadStatus::CONNECTING:        return "connecting";
        case DownloadStatus::PASSWORD_REQUIRED: return "password_required";
        case DownloadStatus::PASSWORD_ERROR:    return "password_error";
        case DownloadStatus::READY:             return "ready";
        case DownloadStatus::DOWNLOADING:       return "downloading";
        case DownloadStatus::PAUSED:            return "paused";
        case DownloadStatus::COMPLETE:          return "complete";
        case DownloadStatus::ERROR:             return "error";
        case DownloadStatus::CLOSED:            return "closed";
    }
    return "unknown";
}

//=============================================================================
// TransferUploader
//=============================================================================

TransferUploader::TransferUploader(EventLoop& loop, std::shared_ptr<const FileSource> source,
                                   std::string password, const PeerlinkConfig& config)
    : loop_(loop), source_(std::move(source)), password_(std::move(password)), config_(config) {
    file_info_ = source_->info();
    LOG_TRANSFER_INFO("Serving " << file_info_.name << " (" << file_info_.size << " bytes, "
                      << file_info_.type << ")" << (password_.empty() ? "" : " with password"));
}

TransferUploader::~TransferUploader() {
    stop();
}

void TransferUploader::serve(PeerTransport& transport) {
    std::weak_ptr<TransferUploader> weak = weak_from_this();
    transport.on_incoming_connection([weak](std::shared_ptr<Connection> connection) {
        if (auto self = weak.lock()) {
            self->add_connection(std::move(connection));
        } else {
            connection->close();
        }
    });
}

void TransferUploader::add_connection(std::shared_ptr<Connection> connection) {
    const std::string connection_id = connection->connection_id();
    if (sessions_.count(connection_id)) {
        LOG_TRANSFER_WARN("Connection " << connection_id << " is already being served");
        return;
    }

    Session session;
    session.state.connection_id = connection_id;
    session.state.peer_id = connection->peer_id();
    session.state.total_size = file_info_.size;
    session.connection = connection;
    sessions_.emplace(connection_id, std::move(session));

    std::weak_ptr<TransferUploader> weak = weak_from_this();
    EventLoop& loop = loop_;

    connection->on_open([weak, connection_id]() {
        if (auto self = weak.lock()) self->handle_open(connection_id);
    });
    connection->on_text([weak, connection_id](const std::string& text) {
        if (auto self = weak.lock()) self->handle_text(connection_id, text);
    });
    connection->on_binary([weak, connection_id](const std::vector<uint8_t>&) {
        if (auto self = weak.lock()) self->handle_binary(connection_id);
    });
    // teardown is deferred so it never runs inside another handler of this session
    connection->on_close([weak, connection_id, &loop]() {
        loop.post([weak, connection_id]() {
            if (auto self = weak.lock()) self->handle_closed(connection_id, UploadStatus::CLOSED, "");
        });
    });
    connection->on_error([weak, connection_id, &loop](const std::string& error) {
        loop.post([weak, connection_id, error]() {
            if (auto self = weak.lock()) self->handle_closed(connection_id, UploadStatus::ERROR, error);
        });
    });

    LOG_TRANSFER_INFO("New downloader connection " << connection_id << " from " << connection->peer_id());
}

void TransferUploader::stop() {
    for (auto& entry : sessions_) {
        entry.second.stream_generation++;
        entry.second.connection->release_handlers();
        entry.second.connection->close();
    }
    sessions_.clear();
}

std::optional<UploadSession> TransferUploader::session(const std::string& connection_id) const {
    auto it = sessions_.find(connection_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second.state;
}

std::vector<UploadSession> TransferUploader::sessions() const {
    std::vector<UploadSession> result;
    result.reserve(sessions_.size());
    for (const auto& entry : sessions_) {
        result.push_back(entry.second.state);
    }
    return result;
}

void TransferUploader::handle_open(const std::string& connection_id) {
    LOG_TRANSFER_DEBUG("Downloader connection " << connection_id << " open");
}

void TransferUploader::handle_text(const std::string& connection_id, const std::string& text) {
    Session* session = find_session(connection_id);
    if (!session) {
        return;
    }
    auto message = decode_transfer_message(text);
    if (!message) {
        return;
    }
    LOG_TRANSFER_DEBUG("Received " << transfer_message_type(*message) << " on " << connection_id);
    std::visit([this, session](const auto& m) { handle(*session, m); }, *message);
}

void TransferUploader::handle_binary(const std::string& connection_id) {
    LOG_TRANSFER_WARN("Ignoring binary frame from downloader on " << connection_id);
}

void TransferUploader::handle_closed(const std::string& connection_id, UploadStatus status,
                                     const std::string& error) {
    auto it = sessions_.find(connection_id);
    if (it == sessions_.end()) {
        return;
    }
    Session& session = it->second;
    session.stream_generation++;

    UploadStatus current = session.state.status;
    if (current != UploadStatus::DONE && current != UploadStatus::ERROR) {
        if (status == UploadStatus::ERROR) {
            session.state.error = error;
            LOG_TRANSFER_WARN("Connection " << connection_id << " failed: " << error);
        } else {
            LOG_TRANSFER_INFO("Connection " << connection_id << " closed in state "
                              << upload_status_to_string(current));
        }
        set_status(session, status);
    }

    session.connection->release_handlers();
    sessions_.erase(it);
}

void TransferUploader::handle(Session& session, const transfer::RequestInfo& message) {
    LOG_TRANSFER_INFO("Info requested on " << session.state.connection_id
                      << " (browser: " << message.browser_name.value_or("unknown")
                      << ", os: " << message.os_name.value_or("unknown") << ")");

    UploadStatus status = session.state.status;
    if (status != UploadStatus::PENDING && status != UploadStatus::AUTHENTICATING) {
        // already authenticated
        send_info(session);
        return;
    }

    if (password_.empty()) {
        send_info(session);
        set_status(session, UploadStatus::READY);
        return;
    }

    issue_challenge(session, std::nullopt);
    set_status(session, UploadStatus::AUTHENTICATING);
}

void TransferUploader::handle(Session& session, const transfer::UsePassword& message) {
    if (password_.empty()) {
        LOG_TRANSFER_WARN("Password submitted for unprotected transfer on " << session.state.connection_id);
        send_info(session);
        if (session.state.status == UploadStatus::PENDING) {
            set_status(session, UploadStatus::READY);
        }
        return;
    }

    if (session.state.status != UploadStatus::AUTHENTICATING && session.state.status != UploadStatus::PENDING) {
        LOG_TRANSFER_WARN("Ignoring password on already authenticated connection " << session.state.connection_id);
        return;
    }

    if (!session.state.challenge) {
        LOG_TRANSFER_WARN("Password response without outstanding challenge on " << session.state.connection_id);
        issue_challenge(session, std::string("Authentication error"));
        set_status(session, UploadStatus::AUTHENTICATING);
        return;
    }

    // single use: the challenge is gone whatever the outcome
    std::string challenge = *session.state.challenge;
    session.state.challenge.reset();

    if (verify_challenge_response(password_, challenge, message.response)) {
        LOG_TRANSFER_INFO("Password accepted on " << session.state.connection_id);
        send_info(session);
        set_status(session, UploadStatus::READY);
        return;
    }

    session.state.failed_password_attempts++;
    LOG_TRANSFER_WARN("Invalid password on " << session.state.connection_id << " (attempt "
                      << session.state.failed_password_attempts << ")");
    issue_challenge(session, std::string("Invalid password"));
    notify(session);
}

void TransferUploader::handle(Session& session, const transfer::Start& message) {
    UploadStatus status = session.state.status;
    if (status == UploadStatus::PENDING || status == UploadStatus::AUTHENTICATING) {
        LOG_TRANSFER_WARN("Start before authentication on " << session.state.connection_id);
        send(session, transfer::Error{"Not authorized"});
        return;
    }
    if (status == UploadStatus::DONE) {
        LOG_TRANSFER_WARN("Start after completion on " << session.state.connection_id);
        return;
    }
    if (message.offset > session.state.total_size) {
        LOG_TRANSFER_WARN("Start offset " << message.offset << " beyond file size on "
                          << session.state.connection_id);
        send(session, transfer::Error{"Invalid offset"});
        return;
    }

    LOG_TRANSFER_INFO("Streaming " << file_info_.name << " from offset " << message.offset
                      << " on " << session.state.connection_id);
    session.state.offset = message.offset;
    session.stream_generation++;
    set_status(session, UploadStatus::UPLOADING);
    schedule_next_chunk(session);
}

void TransferUploader::handle(Session& session, const transfer::ChunkAck& message) {
    session.state.bytes_acknowledged = std::max(session.state.bytes_acknowledged, message.bytes_received);
    notify(session);
}

void TransferUploader::handle(Session& session, const transfer::Pause&) {
    if (session.state.status != UploadStatus::UPLOADING) {
        return;
    }
    LOG_TRANSFER_INFO("Paused at offset " << session.state.offset << " on " << session.state.connection_id);
    session.stream_generation++;
    set_status(session, UploadStatus::PAUSED);
}

void TransferUploader::handle(Session& session, const transfer::Done&) {
    if (session.state.status == UploadStatus::DONE) {
        return;
    }
    if (session.state.offset != session.state.total_size) {
        LOG_TRANSFER_WARN("Done received at offset " << session.state.offset << " of "
                          << session.state.total_size << " on " << session.state.connection_id);
    }
    session.stream_generation++;
    completed_downloads_++;
    LOG_TRANSFER_INFO("Download complete on " << session.state.connection_id
                      << " (" << completed_downloads_ << " total)");
    set_status(session, UploadStatus::DONE);
}

void TransferUploader::handle(Session& session, const transfer::Error& message) {
    LOG_TRANSFER_WARN("Downloader reported error on " << session.state.connection_id << ": " << message.message);
    session.stream_generation++;
    session.state.error = message.message;
    set_status(session, UploadStatus::ERROR);
}

template <typename T>
void TransferUploader::handle(Session& session, const T& message) {
    LOG_TRANSFER_WARN("Unexpected " << transfer_message_type(TransferMessage(message))
                      << " from downloader on " << session.state.connection_id);
}

void TransferUploader::issue_challenge(Session& session, const std::optional<std::string>& error) {
    std::string challenge = generate_challenge();
    session.state.challenge = challenge;

    transfer::PasswordRequired request;
    request.challenge = challenge;
    request.error = error;
    send(session, request);
}

void TransferUploader::send_info(Session& session) {
    send(session, transfer::Info{file_info_});
}

void TransferUploader::schedule_next_chunk(Session& session) {
    std::weak_ptr<TransferUploader> weak = weak_from_this();
    std::string connection_id = session.state.connection_id;
    uint64_t generation = session.stream_generation;

    auto task = [weak, connection_id, generation]() {
        if (auto self = weak.lock()) {
            self->send_next_chunk(connection_id, generation);
        }
    };

    if (config_.yield_interval_ms > 0) {
        loop_.call_later(config_.yield_interval_ms, task);
    } else {
        loop_.post(task);
    }
}

void TransferUploader::send_next_chunk(const std::string& connection_id, uint64_t generation) {
    Session* session = find_session(connection_id);
    if (!session || session->stream_generation != generation ||
        session->state.status != UploadStatus::UPLOADING) {
        return;
    }

    uint64_t offset = session->state.offset;
    uint64_t total = session->state.total_size;
    if (offset > total) {
        return;
    }
    size_t length = static_cast<size_t>(std::min<uint64_t>(config_.chunk_size, total - offset));

    std::vector<uint8_t> chunk;
    if (!source_->read(offset, length, chunk)) {
        LOG_TRANSFER_ERROR("Failed to read " << length << " bytes at offset " << offset << " of " << file_info_.name);
        send(*session, transfer::Error{"Failed to read file"});
        session->state.error = "Failed to read file";
        set_status(*session, UploadStatus::ERROR);
        return;
    }

    bool final = offset + length >= total;
    // payload first, then the record that commits it
    if (!session->connection->send_binary(chunk) ||
        !send(*session, transfer::Chunk{offset, final})) {
        LOG_TRANSFER_WARN("Connection " << connection_id << " closed while streaming");
        return;
    }

    session->state.offset = offset + length;
    LOG_TRANSFER_DEBUG("Sent chunk at " << offset << " (" << length << " bytes" << (final ? ", final" : "")
                       << ") on " << connection_id);

    if (!final) {
        schedule_next_chunk(*session);
    }
}

bool TransferUploader::send(Session& session, const TransferMessage& message) {
    if (!session.connection->send_text(encode_transfer_message(message))) {
        LOG_TRANSFER_WARN("Failed to send " << transfer_message_type(message) << " on "
                          << session.state.connection_id);
        return false;
    }
    return true;
}

void TransferUploader::set_status(Session& session, UploadStatus status) {
    if (session.state.status == status) {
        return;
    }
    LOG_TRANSFER_DEBUG("Session " << session.state.connection_id << ": "
                       << upload_status_to_string(session.state.status) << " -> "
                       << upload_status_to_string(status));
    session.state.status = status;
    notify(session);
}

void TransferUploader::notify(const Session& session) {
    StatusCallback callback = update_callback_;
    if (callback) {
        callback(session.state);
    }
}

TransferUploader::Session* TransferUploader::find_session(const std::string& connection_id) {
    auto it = sessions_.find(connection_id);
    return it == sessions_.end() ? nullptr : &it->second;
}

//=============================================================================
// TransferDownloader
//=============================================================================

TransferDownloader::TransferDownloader(EventLoop& loop, PeerTransport& transport, std::string uploader_peer_id,
                                       const PeerlinkConfig& config)
    : loop_(loop), transport_(transport), uploader_peer_id_(std::move(uploader_peer_id)), config_(config) {
}

TransferDownloader::~TransferDownloader() {
    cancel_timers();
    drop_connection();
}

void TransferDownloader::set_client_info(const std::string& browser_name, const std::string& os_name) {
    browser_name_ = browser_name;
    os_name_ = os_name;
}

bool TransferDownloader::connect() {
    if (connection_) {
        LOG_TRANSFER_WARN("Downloader already connected to " << uploader_peer_id_);
        return false;
    }

    error_.clear();
    challenge_.reset();
    pending_.reset();
    set_status(DownloadStatus::CONNECTING);

    connection_ = transport_.connect(uploader_peer_id_);
    if (!connection_) {
        fail("Could not connect to " + uploader_peer_id_, false);
        return false;
    }

    std::weak_ptr<TransferDownloader> weak = weak_from_this();
    EventLoop& loop = loop_;
    connection_->on_open([weak]() {
        if (auto self = weak.lock()) self->handle_open();
    });
    connection_->on_text([weak](const std::string& text) {
        if (auto self = weak.lock()) self->handle_text(text);
    });
    connection_->on_binary([weak](const std::vector<uint8_t>& data) {
        if (auto self = weak.lock()) self->handle_binary(data);
    });
    connection_->on_close([weak, &loop]() {
        loop.post([weak]() {
            if (auto self = weak.lock()) self->handle_closed(false, "");
        });
    });
    connection_->on_error([weak, &loop](const std::string& error) {
        loop.post([weak, error]() {
            if (auto self = weak.lock()) self->handle_closed(true, error);
        });
    });

    connect_timer_ = loop_.call_later(config_.connect_timeout_ms, [weak]() {
        auto self = weak.lock();
        if (self && self->status_ == DownloadStatus::CONNECTING) {
            self->connect_timer_ = EventLoop::kInvalidTimer;
            self->fail("Connection to " + self->uploader_peer_id_ + " timed out", false);
        }
    });

    LOG_TRANSFER_INFO("Connecting to uploader " << uploader_peer_id_);
    return true;
}

bool TransferDownloader::submit_password(const std::string& password) {
    if (status_ != DownloadStatus::PASSWORD_REQUIRED && status_ != DownloadStatus::PASSWORD_ERROR) {
        LOG_TRANSFER_WARN("No password requested in state " << download_status_to_string(status_));
        return false;
    }
    if (!challenge_) {
        LOG_TRANSFER_WARN("No challenge outstanding");
        return false;
    }

    std::string response = compute_challenge_response(password, *challenge_);
    challenge_.reset();
    if (!send(transfer::UsePassword{response})) {
        return false;
    }
    arm_response_timer();
    return true;
}

bool TransferDownloader::start() {
    if (status_ != DownloadStatus::READY && status_ != DownloadStatus::PAUSED) {
        LOG_TRANSFER_WARN("Cannot start download in state " << download_status_to_string(status_));
        return false;
    }
    if (!send(transfer::Start{data_.size()})) {
        return false;
    }
    LOG_TRANSFER_INFO("Requesting " << file_info_->name << " from offset " << data_.size());
    set_status(DownloadStatus::DOWNLOADING);
    arm_stall_timer();
    return true;
}

bool TransferDownloader::pause() {
    if (status_ != DownloadStatus::DOWNLOADING) {
        return false;
    }
    if (!send(transfer::Pause{})) {
        return false;
    }
    LOG_TRANSFER_INFO("Paused at " << data_.size() << " bytes");
    if (stall_timer_ != EventLoop::kInvalidTimer) {
        loop_.cancel_timer(stall_timer_);
        stall_timer_ = EventLoop::kInvalidTimer;
    }
    set_status(DownloadStatus::PAUSED);
    return true;
}

bool TransferDownloader::resume() {
    if (status_ != DownloadStatus::PAUSED) {
        return false;
    }
    return start();
}

bool TransferDownloader::reconnect() {
    if (status_ != DownloadStatus::ERROR && status_ != DownloadStatus::CLOSED) {
        LOG_TRANSFER_WARN("Reconnect only allowed after close or error");
        return false;
    }
    cancel_timers();
    drop_connection();
    LOG_TRANSFER_INFO("Reconnecting to " << uploader_peer_id_ << " with " << data_.size() << " bytes kept");
    return connect();
}

void TransferDownloader::close() {
    cancel_timers();
    drop_connection();
    if (status_ != DownloadStatus::COMPLETE && status_ != DownloadStatus::ERROR) {
        set_status(DownloadStatus::CLOSED);
    }
}

bool TransferDownloader::save_to(const std::string& path) const {
    if (status_ != DownloadStatus::COMPLETE) {
        LOG_TRANSFER_ERROR("Download is not complete");
        return false;
    }
    return create_file_binary(path, data_.data(), data_.size());
}

void TransferDownloader::handle_open() {
    if (connect_timer_ != EventLoop::kInvalidTimer) {
        loop_.cancel_timer(connect_timer_);
        connect_timer_ = EventLoop::kInvalidTimer;
    }
    LOG_TRANSFER_INFO("Connected to uploader " << uploader_peer_id_);
    if (send(transfer::RequestInfo{browser_name_, os_name_})) {
        arm_response_timer();
    }
}

void TransferDownloader::handle_text(const std::string& text) {
    auto message = decode_transfer_message(text);
    if (!message) {
        return;
    }
    LOG_TRANSFER_DEBUG("Received " << transfer_message_type(*message) << " from " << uploader_peer_id_);
    std::visit([this](const auto& m) { handle(m); }, *message);
}

void TransferDownloader::handle_binary(const std::vector<uint8_t>& data) {
    if (!accepting_chunks()) {
        LOG_TRANSFER_WARN("Dropping " << data.size() << " byte payload in state "
                          << download_status_to_string(status_));
        return;
    }
    if (pending_) {
        LOG_TRANSFER_WARN("Payload of " << pending_->size() << " bytes was never committed, discarding");
    }
    pending_ = data;
    last_activity_ = loop_.now();
}

void TransferDownloader::handle_closed(bool is_error, const std::string& error) {
    if (!connection_) {
        return;
    }
    cancel_timers();
    drop_connection();

    if (status_ == DownloadStatus::COMPLETE || status_ == DownloadStatus::ERROR) {
        return;
    }
    if (is_error) {
        error_ = error;
        LOG_TRANSFER_WARN("Connection to uploader failed: " << error);
        set_status(DownloadStatus::ERROR);
    } else {
        LOG_TRANSFER_INFO("Uploader closed the connection");
        set_status(DownloadStatus::CLOSED);
    }
}

void TransferDownloader::handle(const transfer::PasswordRequired& message) {
    if (status_ != DownloadStatus::CONNECTING && status_ != DownloadStatus::PASSWORD_REQUIRED &&
        status_ != DownloadStatus::PASSWORD_ERROR) {
        LOG_TRANSFER_WARN("Unexpected password challenge in state " << download_status_to_string(status_));
        return;
    }
    cancel_response_timer();
    challenge_ = message.challenge;
    if (message.error) {
        error_ = *message.error;
        set_status(DownloadStatus::PASSWORD_ERROR);
    } else {
        set_status(DownloadStatus::PASSWORD_REQUIRED);
    }
}

void TransferDownloader::handle(const transfer::Info& message) {
    cancel_response_timer();
    if (message.file.size > config_.max_file_size) {
        LOG_TRANSFER_ERROR("Rejecting " << message.file.name << ": " << message.file.size
                           << " bytes exceeds the limit of " << config_.max_file_size);
        fail("File exceeds maximum size", true);
        return;
    }

    bool same_file = file_info_ && file_info_->name == message.file.name && file_info_->size == message.file.size;
    if (!same_file && !data_.empty()) {
        LOG_TRANSFER_INFO("Uploader offers a different file, discarding " << data_.size() << " bytes");
        data_.clear();
    }
    pending_.reset();
    file_info_ = message.file;
    error_.clear();

    LOG_TRANSFER_INFO("File info: " << message.file.name << " (" << message.file.size << " bytes, "
                      << message.file.type << ")");
    if (status_ != DownloadStatus::DOWNLOADING && status_ != DownloadStatus::PAUSED) {
        set_status(DownloadStatus::READY);
    }
}

void TransferDownloader::handle(const transfer::Chunk& message) {
    if (!accepting_chunks()) {
        LOG_TRANSFER_WARN("Dropping Chunk record in state " << download_status_to_string(status_));
        return;
    }
    if (!pending_) {
        LOG_TRANSFER_WARN("Chunk record at " << message.offset << " without payload, dropped");
        return;
    }
    if (message.offset != data_.size()) {
        LOG_TRANSFER_WARN("Chunk record offset " << message.offset << " does not match committed length "
                          << data_.size() << ", dropped");
        pending_.reset();
        return;
    }

    uint64_t total = file_info_->size;
    if (data_.size() + pending_->size() > total) {
        LOG_TRANSFER_WARN("Chunk at " << message.offset << " overruns declared size " << total << ", dropped");
        pending_.reset();
        return;
    }

    data_.insert(data_.end(), pending_->begin(), pending_->end());
    pending_.reset();
    last_activity_ = loop_.now();

    send(transfer::ChunkAck{data_.size()});
    ProgressCallback progress = progress_callback_;
    if (progress) {
        progress(data_.size(), total);
    }

    if (!message.final) {
        return;
    }
    if (data_.size() != total) {
        fail("Final chunk arrived with " + std::to_string(data_.size()) + " of " +
             std::to_string(total) + " bytes", true);
        return;
    }

    if (stall_timer_ != EventLoop::kInvalidTimer) {
        loop_.cancel_timer(stall_timer_);
        stall_timer_ = EventLoop::kInvalidTimer;
    }
    send(transfer::Done{});
    LOG_TRANSFER_INFO("Download of " << file_info_->name << " complete (" << total << " bytes)");
    set_status(DownloadStatus::COMPLETE);

    CompleteCallback complete = complete_callback_;
    if (complete) {
        complete(*file_info_, data_);
    }
}

void TransferDownloader::handle(const transfer::Error& message) {
    LOG_TRANSFER_WARN("Uploader reported error: " << message.message);
    error_ = message.message;
    cancel_timers();
    set_status(DownloadStatus::ERROR);
}

template <typename T>
void TransferDownloader::handle(const T& message) {
    LOG_TRANSFER_WARN("Unexpected " << transfer_message_type(TransferMessage(message)) << " from uploader");
}

bool TransferDownloader::send(const TransferMessage& message) {
    if (!connection_ || !connection_->send_text(encode_transfer_message(message))) {
        LOG_TRANSFER_WARN("Failed to send " << transfer_message_type(message) << " to " << uploader_peer_id_);
        return false;
    }
    return true;
}

void TransferDownloader::fail(const std::string& error, bool notify_peer) {
    LOG_TRANSFER_ERROR(error);
    if (notify_peer) {
        send(transfer::Error{error});
    }
    error_ = error;
    cancel_timers();
    drop_connection();
    set_status(DownloadStatus::ERROR);
}

void TransferDownloader::set_status(DownloadStatus status) {
    if (status_ == status) {
        return;
    }
    LOG_TRANSFER_DEBUG("Download " << download_status_to_string(status_) << " -> "
                       << download_status_to_string(status));
    status_ = status;
    StatusCallback callback = status_callback_;
    if (callback) {
        callback(status);
    }
}

void TransferDownloader::arm_stall_timer() {
    last_activity_ = loop_.now();
    if (stall_timer_ != EventLoop::kInvalidTimer) {
        loop_.cancel_timer(stall_timer_);
    }
    std::weak_ptr<TransferDownloader> weak = weak_from_this();
    stall_timer_ = loop_.call_later(config_.stall_timeout_ms, [weak]() {
        if (auto self = weak.lock()) {
            self->stall_timer_ = EventLoop::kInvalidTimer;
            self->check_stall();
        }
    });
}

void TransferDownloader::check_stall() {
    if (status_ != DownloadStatus::DOWNLOADING) {
        return;
    }
    int64_t idle = loop_.now() - last_activity_;
    if (idle >= config_.stall_timeout_ms) {
        fail("Transfer stalled (no data for " + std::to_string(idle) + " ms)", false);
        return;
    }

    std::weak_ptr<TransferDownloader> weak = weak_from_this();
    stall_timer_ = loop_.call_later(config_.stall_timeout_ms - idle, [weak]() {
        if (auto self = weak.lock()) {
            self->stall_timer_ = EventLoop::kInvalidTimer;
            self->check_stall();
        }
    });
}

void TransferDownloader::arm_response_timer() {
    cancel_response_timer();
    std::weak_ptr<TransferDownloader> weak = weak_from_this();
    response_timer_ = loop_.call_later(config_.connect_timeout_ms, [weak]() {
        if (auto self = weak.lock()) {
            self->response_timer_ = EventLoop::kInvalidTimer;
            self->fail("No response from uploader", false);
        }
    });
}

void TransferDownloader::cancel_response_timer() {
    if (response_timer_ != EventLoop::kInvalidTimer) {
        loop_.cancel_timer(response_timer_);
        response_timer_ = EventLoop::kInvalidTimer;
    }
}

void TransferDownloader::cancel_timers() {
    cancel_response_timer();
    if (connect_timer_ != EventLoop::kInvalidTimer) {
        loop_.cancel_timer(connect_timer_);
        connect_timer_ = EventLoop::kInvalidTimer;
    }
    if (stall_timer_ != EventLoop::kInvalidTimer) {
        loop_.cancel_timer(stall_timer_);
        stall_timer_ = EventLoop::kInvalidTimer;
    }
}

void TransferDownloader::drop_connection() {
    if (!connection_) {
        return;
    }
    std::shared_ptr<Connection> connection = std::move(connection_);
    connection_.reset();
    connection->release_handlers();
    connection->close();
}

bool TransferDownloader::accepting_chunks() const {
    // chunks already in flight when Pause was sent still commit
    return (status_ == DownloadStatus::DOWNLOADING || status_ == DownloadStatus::PAUSED) && file_info_;
}

} // namespace peerlink
