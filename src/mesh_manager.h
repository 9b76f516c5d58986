#pragma once

/**
 * @file mesh_manager.h
 * @brief Full-mesh connection management for a chat session
 *
 * The manager owns the session's PeerTransport. Every inbound or outbound
 * connection is registered in the SessionStore and gets the same dispatch
 * handler. Roster messages (ParticipantList, SessionInfo) make every peer
 * dial the peers it does not know yet, which closes the mesh without a
 * relay. When two peers dial each other at once, the link dialed by the
 * peer with the smaller id is kept on both sides.
 *
 * Must be owned by a std::shared_ptr.
 */

#include "config.h"
#include "event_loop.h"
#include "mesh_messages.h"
#include "session_store.h"
#include "transport.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace peerlink {

enum class MeshState {
    IDLE,
    ACTIVE,
    HOST_LEFT,  // terminal for a guest: the host's link is gone
    LEFT
};

const char* mesh_state_to_string(MeshState state);

class MeshConnectionManager : public std::enable_shared_from_this<MeshConnectionManager> {
public:
    using StateCallback = std::function<void(MeshState state)>;
    using TypingCallback = std::function<void(const mesh::Typing& typing)>;
    using ChatCallback = std::function<void(const ChatMessage& message)>;
    using ThinkingCallback = std::function<void(const mesh::Thinking& thinking)>;

    MeshConnectionManager(EventLoop& loop, std::shared_ptr<PeerTransport> transport, SessionStore& store,
                          const PeerlinkConfig& config);
    ~MeshConnectionManager();

    MeshConnectionManager(const MeshConnectionManager&) = delete;
    MeshConnectionManager& operator=(const MeshConnectionManager&) = delete;

    /**
     * @brief Run the session as host and accept guests
     * @return false if a session is already running
     */
    bool start_host(const SessionDetails& details);

    // Run the session as guest and dial the host
    bool start_guest(const SessionDetails& details);

    // Broadcast PeerLeft, close every connection and clear the store
    void leave();

    //=========================================================================
    // Local actions
    //=========================================================================

    std::optional<ChatMessage> send_chat_message(const std::string& content, bool is_human);
    void send_typing(bool is_typing);
    void send_thinking(bool is_thinking);
    void set_auto_reply(bool enabled);
    void set_character(const CharacterInfo& character);

    //=========================================================================
    // Sending
    //=========================================================================

    // Serialize once, send to every open connection; returns the number of sends
    size_t broadcast(const MeshMessage& message, const std::string& except_peer = "");

    // No-op (false) when the peer has no open connection
    bool send_to(const std::string& peer_id, const MeshMessage& message);

    // Dial a peer unless already connected or dialing
    bool connect_to_peer(const std::string& peer_id);

    MeshState state() const { return state_; }
    const std::string& local_peer_id() const { return local_peer_id_; }
    bool is_host() const { return is_host_; }
    SessionStore& store() { return store_; }

    void on_state_change(StateCallback callback) { state_callback_ = std::move(callback); }
    void on_typing(TypingCallback callback) { typing_callback_ = std::move(callback); }

    // Live chat messages from other peers (not history replays)
    void on_chat_message(ChatCallback callback) { chat_callback_ = std::move(callback); }
    void on_thinking(ThinkingCallback callback) { thinking_callback_ = std::move(callback); }

private:
    bool start(const SessionDetails& details);
    void handle_incoming(std::shared_ptr<Connection> connection);
    void register_connection(const std::shared_ptr<Connection>& connection, bool outbound);
    bool is_current(const std::string& peer_id, const Connection* connection) const;

    void handle_open(const std::string& peer_id, const Connection* connection);
    void handle_text(const std::string& peer_id, const Connection* connection, const std::string& text);
    void handle_closed(const std::string& peer_id, const Connection* connection, const std::string& reason);

    void handle(const std::string& from, const mesh::CharacterSync& message);
    void handle(const std::string& from, const ChatMessage& message);
    void handle(const std::string& from, const SystemMessage& message);
    void handle(const std::string& from, const mesh::Typing& message);
    void handle(const std::string& from, const mesh::Thinking& message);
    void handle(const std::string& from, const mesh::PeerState& message);
    void handle(const std::string& from, const mesh::PeerConnecting& message);
    void handle(const std::string& from, const mesh::ParticipantList& message);
    void handle(const std::string& from, const mesh::SessionInfo& message);
    void handle(const std::string& from, const mesh::RequestSync& message);
    void handle(const std::string& from, const mesh::PeerLeft& message);
    void handle(const std::string& from, const mesh::Heartbeat& message);

    void apply_roster(const std::vector<ParticipantInfo>& participants);
    std::vector<ParticipantInfo> ready_roster() const;
    std::string joined_message_id(const std::string& peer_id) const;
    std::optional<mesh::CharacterSync> my_character_sync() const;
    std::string my_character_name() const;

    // SystemMessage{left} when a name is known, then disconnect
    void remove_peer(const std::string& peer_id, const std::optional<std::string>& character_name);
    void disconnect_peer(const std::string& peer_id, const Connection* expected);

    void start_heartbeat();
    void send_heartbeat();
    void check_liveness();
    void cancel_timers();
    void set_state(MeshState state);

    EventLoop& loop_;
    std::shared_ptr<PeerTransport> transport_;
    SessionStore& store_;
    PeerlinkConfig config_;

    MeshState state_ = MeshState::IDLE;
    std::string local_peer_id_;
    std::string host_peer_id_;
    bool is_host_ = false;

    std::unordered_map<std::string, bool> outbound_;                 // peer -> dialed by us
    std::unordered_map<std::string, EventLoop::TimerId> connect_timers_;
    std::unordered_map<std::string, int64_t> last_seen_;
    EventLoop::TimerId heartbeat_timer_ = EventLoop::kInvalidTimer;

    StateCallback state_callback_;
    TypingCallback typing_callback_;
    ChatCallback chat_callback_;
    ThinkingCallback thinking_callback_;
};

} // namespace peerlink
