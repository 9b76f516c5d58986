#include "loopback_transport.h"
#include "logger.h"

#include <algorithm>

#define LOG_LOOPBACK_DEBUG(message) LOG_DEBUG("loopback", message)
#define LOG_LOOPBACK_WARN(message)  LOG_WARN("loopback", message)

namespace peerlink {

//=============================================================================
// LoopbackConnection
//=============================================================================

LoopbackConnection::LoopbackConnection(EventLoop& loop, std::string connection_id, std::string peer_id)
    : loop_(loop), connection_id_(std::move(connection_id)), peer_id_(std::move(peer_id)),
      state_(State::CONNECTING) {
}

bool LoopbackConnection::send_text(const std::string& text) {
    if (state_ != State::OPEN) {
        return false;
    }
    std::weak_ptr<LoopbackConnection> remote = remote_;
    loop_.post([remote, text]() {
        auto target = remote.lock();
        if (target && target->state_ == State::OPEN) {
            target->emit_text(text);
        }
    });
    return true;
}

bool LoopbackConnection::send_binary(const std::vector<uint8_t>& data) {
    if (state_ != State::OPEN) {
        return false;
    }
    std::weak_ptr<LoopbackConnection> remote = remote_;
    loop_.post([remote, data]() {
        auto target = remote.lock();
        if (target && target->state_ == State::OPEN) {
            target->emit_binary(data);
        }
    });
    return true;
}

void LoopbackConnection::close() {
    if (state_ == State::CLOSED) {
        return;
    }
    state_ = State::CLOSED;
    LOG_LOOPBACK_DEBUG("Closing connection " << connection_id_ << " to " << peer_id_);

    std::weak_ptr<LoopbackConnection> remote = remote_;
    loop_.post([remote]() {
        auto target = remote.lock();
        if (target) {
            target->handle_remote_close();
        }
    });
}

void LoopbackConnection::handle_open() {
    if (state_ != State::CONNECTING) {
        return;
    }
    state_ = State::OPEN;
    emit_open();
}

void LoopbackConnection::handle_remote_close() {
    if (state_ == State::CLOSED) {
        return;
    }
    state_ = State::CLOSED;
    emit_close();
}

void LoopbackConnection::fail(const std::string& error) {
    if (state_ == State::CLOSED) {
        return;
    }
    state_ = State::CLOSED;
    emit_error(error);
}

//=============================================================================
// LoopbackHub
//=============================================================================

LoopbackHub::LoopbackHub(EventLoop& loop) : loop_(loop) {
}

std::shared_ptr<LoopbackTransport> LoopbackHub::create_transport(const std::string& peer_id) {
    auto it = transports_.find(peer_id);
    if (it != transports_.end() && !it->second.expired()) {
        LOG_LOOPBACK_WARN("Peer id already registered: " << peer_id);
        return nullptr;
    }
    auto transport = std::make_shared<LoopbackTransport>(*this, peer_id);
    transports_[peer_id] = transport;
    return transport;
}

void LoopbackHub::set_unresponsive(const std::string& peer_id, bool unresponsive) {
    if (unresponsive) {
        unresponsive_.insert(peer_id);
    } else {
        unresponsive_.erase(peer_id);
    }
}

std::shared_ptr<Connection> LoopbackHub::dial(LoopbackTransport& from, const std::string& peer_id) {
    auto local = std::make_shared<LoopbackConnection>(loop_, next_connection_id(from.peer_id_), peer_id);
    from.track(local);

    std::shared_ptr<LoopbackTransport> target;
    auto it = transports_.find(peer_id);
    if (it != transports_.end()) {
        target = it->second.lock();
    }

    if (!target || target->shut_down_) {
        LOG_LOOPBACK_DEBUG("Dial from " << from.peer_id_ << " to unknown peer " << peer_id);
        loop_.post([local, peer_id]() { local->fail("Could not connect to peer " + peer_id); });
        return local;
    }

    if (unresponsive_.count(peer_id)) {
        LOG_LOOPBACK_DEBUG("Dial from " << from.peer_id_ << " to unresponsive peer " << peer_id);
        return local;
    }

    auto remote = std::make_shared<LoopbackConnection>(loop_, next_connection_id(peer_id), from.peer_id_);
    local->pair_with(remote);
    remote->pair_with(local);
    target->track(remote);

    std::weak_ptr<LoopbackTransport> weak_target = target;
    EventLoop& loop = loop_;
    loop_.post([&loop, local, remote, weak_target]() {
        auto acceptor = weak_target.lock();
        if (!acceptor || acceptor->shut_down_ || local->state_ != LoopbackConnection::State::CONNECTING) {
            remote->state_ = LoopbackConnection::State::CLOSED;
            local->fail("Peer went away during connect");
            return;
        }
        acceptor->accept(remote);
        loop.post([local, remote]() {
            remote->handle_open();
            local->handle_open();
        });
    });
    return local;
}

void LoopbackHub::unregister(const std::string& peer_id) {
    transports_.erase(peer_id);
}

std::string LoopbackHub::next_connection_id(const std::string& owner) {
    return owner + "#" + std::to_string(next_connection_++);
}

//=============================================================================
// LoopbackTransport
//=============================================================================

LoopbackTransport::LoopbackTransport(LoopbackHub& hub, std::string peer_id)
    : hub_(hub), peer_id_(std::move(peer_id)) {
}

LoopbackTransport::~LoopbackTransport() {
    shutdown();
}

std::shared_ptr<Connection> LoopbackTransport::connect(const std::string& peer_id) {
    if (shut_down_) {
        LOG_LOOPBACK_WARN("connect() on shut down transport " << peer_id_);
        return nullptr;
    }
    return hub_.dial(*this, peer_id);
}

void LoopbackTransport::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;
    for (auto& weak : connections_) {
        if (auto connection = weak.lock()) {
            connection->close();
        }
    }
    connections_.clear();
    hub_.unregister(peer_id_);
}

size_t LoopbackTransport::open_connection_count() const {
    return static_cast<size_t>(std::count_if(connections_.begin(), connections_.end(),
        [](const std::weak_ptr<LoopbackConnection>& weak) {
            auto connection = weak.lock();
            return connection && connection->is_open();
        }));
}

void LoopbackTransport::track(const std::shared_ptr<LoopbackConnection>& connection) {
    connections_.erase(std::remove_if(connections_.begin(), connections_.end(),
        [](const std::weak_ptr<LoopbackConnection>& weak) { return weak.expired(); }),
        connections_.end());
    connections_.push_back(connection);
}

void LoopbackTransport::accept(const std::shared_ptr<LoopbackConnection>& connection) {
    LOG_LOOPBACK_DEBUG(peer_id_ << " accepted connection from " << connection->peer_id());
    emit_incoming(connection);
}

} // namespace peerlink
