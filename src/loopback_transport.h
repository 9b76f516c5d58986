#pragma once

/**
 * @file loopback_transport.h
 * @brief In-process transport
 *
 * Transports created from one LoopbackHub can dial each other by peer id.
 * Every event is posted to the EventLoop, so delivery is asynchronous and
 * ordered per connection exactly like a real data channel.
 */

#include "transport.h"
#include "event_loop.h"

#include <unordered_map>
#include <unordered_set>
#include <memory>
#include <string>
#include <vector>

namespace peerlink {

class LoopbackTransport;

class LoopbackConnection : public Connection,
                           public std::enable_shared_from_this<LoopbackConnection> {
public:
    LoopbackConnection(EventLoop& loop, std::string connection_id, std::string peer_id);

    const std::string& connection_id() const override { return connection_id_; }
    const std::string& peer_id() const override { return peer_id_; }
    bool is_open() const override { return state_ == State::OPEN; }

    bool send_text(const std::string& text) override;
    bool send_binary(const std::vector<uint8_t>& data) override;
    void close() override;

private:
    friend class LoopbackTransport;
    friend class LoopbackHub;

    enum class State { CONNECTING, OPEN, CLOSED };

    void pair_with(const std::shared_ptr<LoopbackConnection>& remote) { remote_ = remote; }
    void handle_open();
    void handle_remote_close();
    void fail(const std::string& error);

    EventLoop& loop_;
    std::string connection_id_;
    std::string peer_id_;
    State state_;
    std::weak_ptr<LoopbackConnection> remote_;
};

class LoopbackHub {
public:
    explicit LoopbackHub(EventLoop& loop);

    LoopbackHub(const LoopbackHub&) = delete;
    LoopbackHub& operator=(const LoopbackHub&) = delete;

    /**
     * @brief Create a transport registered under peer_id
     * @return nullptr if the id is already taken
     */
    std::shared_ptr<LoopbackTransport> create_transport(const std::string& peer_id);

    // Dials to an unresponsive peer never open (nor fail)
    void set_unresponsive(const std::string& peer_id, bool unresponsive);

    EventLoop& loop() { return loop_; }

private:
    friend class LoopbackTransport;

    std::shared_ptr<Connection> dial(LoopbackTransport& from, const std::string& peer_id);
    void unregister(const std::string& peer_id);
    std::string next_connection_id(const std::string& owner);

    EventLoop& loop_;
    std::unordered_map<std::string, std::weak_ptr<LoopbackTransport>> transports_;
    std::unordered_set<std::string> unresponsive_;
    uint64_t next_connection_ = 1;
};

class LoopbackTransport : public PeerTransport,
                          public std::enable_shared_from_this<LoopbackTransport> {
public:
    LoopbackTransport(LoopbackHub& hub, std::string peer_id);
    ~LoopbackTransport() override;

    std::string local_id() const override { return peer_id_; }
    std::shared_ptr<Connection> connect(const std::string& peer_id) override;
    void shutdown() override;

    // Connections created by this transport that are still open
    size_t open_connection_count() const;

private:
    friend class LoopbackHub;

    void track(const std::shared_ptr<LoopbackConnection>& connection);
    void accept(const std::shared_ptr<LoopbackConnection>& connection);

    LoopbackHub& hub_;
    std::string peer_id_;
    bool shut_down_ = false;
    std::vector<std::weak_ptr<LoopbackConnection>> connections_;
};

} // namespace peerlink
