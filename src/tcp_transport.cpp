#include "tcp_transport.h"
#include "logger.h"

#include <cstring>
#include <errno.h>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

#define LOG_TCP_DEBUG(message) LOG_DEBUG("tcp", message)
#define LOG_TCP_INFO(message)  LOG_INFO("tcp", message)
#define LOG_TCP_WARN(message)  LOG_WARN("tcp", message)
#define LOG_TCP_ERROR(message) LOG_ERROR("tcp", message)

namespace peerlink {

namespace {
constexpr size_t kFrameHeaderSize = 4;
constexpr size_t kReadChunk = 64 * 1024;
constexpr int kMaxReadsPerEvent = 16;
}

std::vector<uint8_t> encode_frame(FrameKind kind, const uint8_t* payload, size_t length) {
    uint32_t frame_length = static_cast<uint32_t>(length + 1);
    std::vector<uint8_t> frame;
    frame.reserve(kFrameHeaderSize + 1 + length);
    frame.push_back(static_cast<uint8_t>(frame_length >> 24));
    frame.push_back(static_cast<uint8_t>(frame_length >> 16));
    frame.push_back(static_cast<uint8_t>(frame_length >> 8));
    frame.push_back(static_cast<uint8_t>(frame_length));
    frame.push_back(static_cast<uint8_t>(kind));
    if (length > 0) {
        frame.insert(frame.end(), payload, payload + length);
    }
    return frame;
}

//=============================================================================
// TcpConnection
//=============================================================================

TcpConnection::TcpConnection(EventLoop& loop, TcpTransport* owner, socket_t socket,
                             std::string connection_id, std::string peer_id, State initial_state)
    : loop_(loop), owner_(owner), socket_(socket), connection_id_(std::move(connection_id)),
      peer_id_(std::move(peer_id)), state_(initial_state) {
}

TcpConnection::~TcpConnection() {
    if (is_valid_socket(socket_)) {
        loop_.unwatch_fd(socket_);
        close_socket(socket_);
    }
}

bool TcpConnection::send_text(const std::string& text) {
    if (state_ != State::OPEN) {
        return false;
    }
    auto self = shared_from_this();
    queue_frame(FrameKind::TEXT, reinterpret_cast<const uint8_t*>(text.data()), text.size());
    return flush();
}

bool TcpConnection::send_binary(const std::vector<uint8_t>& data) {
    if (state_ != State::OPEN) {
        return false;
    }
    auto self = shared_from_this();
    queue_frame(FrameKind::BINARY, data.data(), data.size());
    return flush();
}

void TcpConnection::close() {
    if (state_ == State::CLOSED || state_ == State::CLOSING) {
        return;
    }
    auto self = shared_from_this();
    if (state_ == State::OPEN && !send_queue_.empty()) {
        LOG_TCP_DEBUG("Draining " << send_queue_.size() << " frames before closing " << connection_id_);
        state_ = State::CLOSING;
        update_interest();
        return;
    }
    finish_close(false);
}

bool TcpConnection::start_watching() {
    std::weak_ptr<TcpConnection> weak = shared_from_this();
    watching_output_ = (state_ == State::CONNECTING);
    uint32_t events = watching_output_ ? (PollIn | PollOut) : static_cast<uint32_t>(PollIn);
    return loop_.watch_fd(socket_, events, [weak](uint32_t ready) {
        if (auto connection = weak.lock()) {
            connection->handle_events(ready);
        }
    });
}

void TcpConnection::handle_events(uint32_t events) {
    auto self = shared_from_this();

    if (state_ == State::CONNECTING) {
        if (events & (PollOut | PollErr | PollHup)) {
            handle_connect_complete();
        }
        return;
    }

    if (events & PollErr) {
        fail("Socket error on connection to " + peer_id_ + ": " + strerror(get_socket_error(socket_)));
        return;
    }

    if (events & (PollIn | PollHup)) {
        handle_readable();
        if (state_ == State::CLOSED) {
            return;
        }
    }

    if (events & PollOut) {
        flush();
    }
}

void TcpConnection::handle_connect_complete() {
    int error = get_socket_error(socket_);
    if (error != 0) {
        fail("Connection to " + peer_id_ + " failed: " + strerror(error));
        return;
    }
    if (!owner_) {
        fail("Transport shut down during connect");
        return;
    }

    std::string local_id = owner_->local_id();
    LOG_TCP_INFO("Connected to " << peer_id_ << " as " << local_id);
    state_ = State::OPEN;
    queue_frame(FrameKind::HELLO, reinterpret_cast<const uint8_t*>(local_id.data()), local_id.size());
    if (!flush()) {
        return;
    }
    emit_open();
}

void TcpConnection::handle_readable() {
    uint8_t chunk[kReadChunk];
    for (int reads = 0; reads < kMaxReadsPerEvent; ++reads) {
        ssize_t n = ::recv(socket_, chunk, sizeof(chunk), 0);
        if (n > 0) {
            if (state_ == State::CLOSING) {
                continue;  // discarded while draining
            }
            recv_buffer_.insert(recv_buffer_.end(), chunk, chunk + n);
            if (!process_frames()) {
                return;
            }
            continue;
        }
        if (n == 0) {
            LOG_TCP_DEBUG("Peer " << peer_id_ << " closed connection " << connection_id_);
            bool notify = (state_ == State::OPEN);
            finish_close(notify);
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        fail("Receive failed from " + peer_id_ + ": " + strerror(errno));
        return;
    }
}

bool TcpConnection::process_frames() {
    while (state_ == State::OPEN || state_ == State::AWAITING_HELLO) {
        size_t available = recv_buffer_.size() - recv_start_;
        if (available < kFrameHeaderSize) {
            break;
        }
        const uint8_t* header = recv_buffer_.data() + recv_start_;
        size_t frame_length = (static_cast<size_t>(header[0]) << 24) |
                              (static_cast<size_t>(header[1]) << 16) |
                              (static_cast<size_t>(header[2]) << 8) |
                              static_cast<size_t>(header[3]);
        if (frame_length == 0 || frame_length > kMaxFrameSize) {
            fail("Invalid frame length " + std::to_string(frame_length) + " from " + peer_id_);
            return false;
        }
        if (available < kFrameHeaderSize + frame_length) {
            break;
        }

        FrameKind kind = static_cast<FrameKind>(header[kFrameHeaderSize]);
        const uint8_t* payload = header + kFrameHeaderSize + 1;
        size_t payload_length = frame_length - 1;
        recv_start_ += kFrameHeaderSize + frame_length;

        if (!handle_frame(kind, payload, payload_length)) {
            return false;
        }
    }

    if (state_ == State::CLOSED) {
        return false;
    }

    // compact consumed bytes
    if (recv_start_ > 0) {
        recv_buffer_.erase(recv_buffer_.begin(), recv_buffer_.begin() + static_cast<std::ptrdiff_t>(recv_start_));
        recv_start_ = 0;
    }
    return true;
}

bool TcpConnection::handle_frame(FrameKind kind, const uint8_t* payload, size_t length) {
    switch (kind) {
        case FrameKind::HELLO: {
            if (state_ != State::AWAITING_HELLO) {
                LOG_TCP_WARN("Ignoring duplicate hello from " << peer_id_);
                return true;
            }
            peer_id_.assign(reinterpret_cast<const char*>(payload), length);
            if (peer_id_.empty() || !owner_) {
                fail("Invalid hello on " + connection_id_);
                return false;
            }
            LOG_TCP_INFO("Accepted connection " << connection_id_ << " from " << peer_id_);
            state_ = State::OPEN;
            owner_->deliver_incoming(shared_from_this());
            if (state_ == State::OPEN) {
                emit_open();
            }
            return true;
        }
        case FrameKind::TEXT:
        case FrameKind::BINARY: {
            if (state_ == State::AWAITING_HELLO) {
                fail("Data frame before hello on " + connection_id_);
                return false;
            }
            if (kind == FrameKind::TEXT) {
                emit_text(std::string(reinterpret_cast<const char*>(payload), length));
            } else {
                emit_binary(std::vector<uint8_t>(payload, payload + length));
            }
            return true;
        }
    }

    LOG_TCP_WARN("Dropping frame of unknown kind " << static_cast<int>(kind) << " from " << peer_id_);
    return true;
}

void TcpConnection::queue_frame(FrameKind kind, const uint8_t* payload, size_t length) {
    send_queue_.push_back(encode_frame(kind, payload, length));
}

bool TcpConnection::flush() {
    while (!send_queue_.empty()) {
        const std::vector<uint8_t>& front = send_queue_.front();
        ssize_t n = ::send(socket_, front.data() + send_offset_, front.size() - send_offset_, MSG_NOSIGNAL);
        if (n > 0) {
            send_offset_ += static_cast<size_t>(n);
            if (send_offset_ == front.size()) {
                send_queue_.pop_front();
                send_offset_ = 0;
            }
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            break;
        }
        fail("Send failed to " + peer_id_ + ": " + strerror(errno));
        return false;
    }

    if (state_ == State::CLOSING && send_queue_.empty()) {
        finish_close(false);
        return true;
    }
    update_interest();
    return true;
}

void TcpConnection::update_interest() {
    if (state_ == State::CLOSED) {
        return;
    }
    bool want_output = !send_queue_.empty() || state_ == State::CONNECTING;
    if (want_output == watching_output_) {
        return;
    }
    watching_output_ = want_output;
    loop_.update_fd(socket_, want_output ? (PollIn | PollOut) : static_cast<uint32_t>(PollIn));
}

void TcpConnection::fail(const std::string& error) {
    if (state_ == State::CLOSED) {
        return;
    }
    bool silent = (state_ == State::AWAITING_HELLO);
    LOG_TCP_WARN(error);
    finish_close(false);
    if (!silent) {
        emit_error(error);
    }
}

void TcpConnection::finish_close(bool notify) {
    if (state_ == State::CLOSED) {
        return;
    }
    state_ = State::CLOSED;
    loop_.unwatch_fd(socket_);
    close_socket(socket_);
    socket_ = INVALID_SOCKET_VALUE;
    send_queue_.clear();
    recv_buffer_.clear();
    recv_start_ = 0;

    TcpTransport* owner = owner_;
    owner_ = nullptr;
    if (owner) {
        owner->forget_connection(this);
    }
    if (notify) {
        emit_close();
    }
}

//=============================================================================
// TcpTransport
//=============================================================================

TcpTransport::TcpTransport(EventLoop& loop, std::string advertised_host)
    : loop_(loop), advertised_host_(std::move(advertised_host)) {
}

TcpTransport::~TcpTransport() {
    shutdown();
}

bool TcpTransport::listen(int port, const std::string& bind_host) {
    if (is_valid_socket(listen_socket_)) {
        LOG_TCP_WARN("Transport is already listening on port " << listen_port_);
        return false;
    }

    socket_t server = create_tcp_server_v4(port, 16, bind_host);
    if (!is_valid_socket(server)) {
        return false;
    }
    if (!set_socket_nonblocking(server)) {
        close_socket(server);
        return false;
    }

    int bound_port = get_ephemeral_port(server);
    if (bound_port <= 0 || !loop_.watch_fd(server, PollIn, [this](uint32_t) { handle_accept(); })) {
        close_socket(server);
        return false;
    }

    listen_socket_ = server;
    listen_port_ = bound_port;
    LOG_TCP_INFO("Listening as " << local_id());
    return true;
}

std::string TcpTransport::local_id() const {
    return advertised_host_ + ":" + std::to_string(listen_port_);
}

std::shared_ptr<Connection> TcpTransport::connect(const std::string& peer_id) {
    std::string host;
    int port = 0;
    if (!parse_host_port(peer_id, host, port)) {
        LOG_TCP_ERROR("Peer id is not a host:port address: " << peer_id);
        return nullptr;
    }

    socket_t socket = start_tcp_connect_v4(host, port);
    if (!is_valid_socket(socket)) {
        return nullptr;
    }

    auto connection = std::make_shared<TcpConnection>(loop_, this, socket, next_connection_id(), peer_id,
                                                      TcpConnection::State::CONNECTING);
    register_connection(connection);
    if (!connection->start_watching()) {
        connection->finish_close(false);
        return nullptr;
    }
    return connection;
}

void TcpTransport::shutdown() {
    if (is_valid_socket(listen_socket_)) {
        loop_.unwatch_fd(listen_socket_);
        close_socket(listen_socket_);
        listen_socket_ = INVALID_SOCKET_VALUE;
    }

    auto connections = std::move(connections_);
    connections_.clear();
    for (auto& entry : connections) {
        entry.second->detach();
        entry.second->finish_close(false);
    }
}

void TcpTransport::handle_accept() {
    while (true) {
        std::string address;
        socket_t client = accept_client(listen_socket_, &address);
        if (!is_valid_socket(client)) {
            return;
        }
        if (!set_socket_nonblocking(client)) {
            close_socket(client);
            continue;
        }

        auto connection = std::make_shared<TcpConnection>(loop_, this, client, next_connection_id(), "",
                                                          TcpConnection::State::AWAITING_HELLO);
        register_connection(connection);
        if (!connection->start_watching()) {
            connection->finish_close(false);
            continue;
        }
        LOG_TCP_DEBUG("Awaiting hello from " << address << " on " << connection->connection_id());
    }
}

void TcpTransport::register_connection(const std::shared_ptr<TcpConnection>& connection) {
    connections_[connection.get()] = connection;
}

void TcpTransport::forget_connection(TcpConnection* connection) {
    connections_.erase(connection);
}

void TcpTransport::deliver_incoming(const std::shared_ptr<TcpConnection>& connection) {
    emit_incoming(connection);
}

std::string TcpTransport::next_connection_id() {
    return "tcp-" + std::to_string(listen_port_) + "-" + std::to_string(next_connection_++);
}

} // namespace peerlink
