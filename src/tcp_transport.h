#pragma once

/**
 * @file tcp_transport.h
 * @brief PeerTransport over plain TCP
 *
 * A peer id is the peer's dialable listen address "host:port". Frames are
 *
 *   [u32 big-endian length of kind + payload][u8 kind][payload]
 *
 * with kind 0 = text, 1 = binary, 2 = hello. The dialer sends a hello
 * carrying its own peer id as the first frame; the acceptor reports the
 * connection only after the hello arrives. Frames above kMaxFrameSize are a
 * transport error and close the connection.
 */

#include "transport.h"
#include "event_loop.h"
#include "socket.h"

#include <deque>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace peerlink {

class TcpTransport;

enum class FrameKind : uint8_t {
    TEXT = 0,
    BINARY = 1,
    HELLO = 2
};

constexpr size_t kMaxFrameSize = 16 * 1024 * 1024;

// Serialize one frame (header + payload)
std::vector<uint8_t> encode_frame(FrameKind kind, const uint8_t* payload, size_t length);

class TcpConnection : public Connection,
                      public std::enable_shared_from_this<TcpConnection> {
public:
    enum class State {
        CONNECTING,     ///< outbound connect() in flight
        AWAITING_HELLO, ///< inbound, peer id unknown yet
        OPEN,
        CLOSING,        ///< draining queued output before closing the socket
        CLOSED
    };

    TcpConnection(EventLoop& loop, TcpTransport* owner, socket_t socket,
                  std::string connection_id, std::string peer_id, State initial_state);
    ~TcpConnection() override;

    const std::string& connection_id() const override { return connection_id_; }
    const std::string& peer_id() const override { return peer_id_; }
    bool is_open() const override { return state_ == State::OPEN; }

    bool send_text(const std::string& text) override;
    bool send_binary(const std::vector<uint8_t>& data) override;
    void close() override;

    State state() const { return state_; }

private:
    friend class TcpTransport;

    bool start_watching();
    void handle_events(uint32_t events);
    void handle_connect_complete();
    void handle_readable();
    bool process_frames();
    bool handle_frame(FrameKind kind, const uint8_t* payload, size_t length);
    void queue_frame(FrameKind kind, const uint8_t* payload, size_t length);
    bool flush();
    void update_interest();
    void fail(const std::string& error);
    void finish_close(bool notify);
    void detach() { owner_ = nullptr; }

    EventLoop& loop_;
    TcpTransport* owner_;
    socket_t socket_;
    std::string connection_id_;
    std::string peer_id_;
    State state_;

    std::vector<uint8_t> recv_buffer_;
    size_t recv_start_ = 0;

    std::deque<std::vector<uint8_t>> send_queue_;
    size_t send_offset_ = 0;
    bool watching_output_ = false;
};

class TcpTransport : public PeerTransport {
public:
    /**
     * @param advertised_host Host part of this transport's peer id
     */
    TcpTransport(EventLoop& loop, std::string advertised_host = "127.0.0.1");
    ~TcpTransport() override;

    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    /**
     * @brief Start accepting connections
     * @param port Port to listen on, 0 picks an ephemeral port
     */
    bool listen(int port, const std::string& bind_host = "");

    int listen_port() const { return listen_port_; }

    std::string local_id() const override;
    std::shared_ptr<Connection> connect(const std::string& peer_id) override;
    void shutdown() override;

    size_t connection_count() const { return connections_.size(); }

private:
    friend class TcpConnection;

    void handle_accept();
    void register_connection(const std::shared_ptr<TcpConnection>& connection);
    void forget_connection(TcpConnection* connection);
    void deliver_incoming(const std::shared_ptr<TcpConnection>& connection);
    std::string next_connection_id();

    EventLoop& loop_;
    std::string advertised_host_;
    socket_t listen_socket_ = INVALID_SOCKET_VALUE;
    int listen_port_ = 0;
    uint64_t next_connection_ = 1;
    std::unordered_map<TcpConnection*, std::shared_ptr<TcpConnection>> connections_;
};

} // namespace peerlink
