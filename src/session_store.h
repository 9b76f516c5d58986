#pragma once

/**
 * @file session_store.h
 * @brief Authoritative in-memory state of one mesh chat session
 *
 * Holds the participant roster, the open connections, the deduplicated and
 * timestamp-ordered chat history, the offline buffer and the thinking set.
 * The store is owned by whoever runs the session and injected into the
 * MeshConnectionManager; it is mutated only from the event loop.
 */

#include "mesh_messages.h"
#include "transport.h"

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace peerlink {

enum class ParticipantStatus {
    CONNECTING,     // link requested, not open yet
    PENDING,        // link open, character not exchanged
    READY,          // character exchanged
    DISCONNECTED
};

const char* participant_status_to_string(ParticipantStatus status);

struct Participant {
    std::string peer_id;
    ParticipantStatus status = ParticipantStatus::CONNECTING;
    std::optional<CharacterInfo> character;
    std::weak_ptr<Connection> connection;
    bool auto_reply_enabled = false;
};

struct SessionDetails {
    std::string session_id;
    std::string slug;
    std::string host_peer_id;
    bool is_host = false;
    std::string my_peer_id;
    std::optional<CharacterInfo> my_character;
    int64_t created_at = 0;
    int64_t updated_at = 0;
};

enum class StoreChange {
    SESSION,
    PARTICIPANTS,
    CONNECTIONS,
    HISTORY,
    THINKING
};

class SessionStore {
public:
    using Listener = std::function<void(StoreChange change)>;
    using SubscriptionId = uint64_t;

    explicit SessionStore(size_t buffer_capacity = 100);

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    //=========================================================================
    // Session
    //=========================================================================

    void set_session(const SessionDetails& details);
    const std::optional<SessionDetails>& session() const { return session_; }
    void set_my_character(const CharacterInfo& character);

    // Bump updated_at
    void touch(int64_t now_ms);

    //=========================================================================
    // Participants
    //=========================================================================

    // Creates the participant with the given status if unknown; returns it either way
    Participant& upsert_participant(const std::string& peer_id, ParticipantStatus initial_status);

    Participant* find_participant(const std::string& peer_id);
    const Participant* find_participant(const std::string& peer_id) const;

    bool set_participant_status(const std::string& peer_id, ParticipantStatus status);
    bool set_participant_character(const std::string& peer_id, const CharacterInfo& character);
    bool set_participant_auto_reply(const std::string& peer_id, bool enabled);

    // Roster in first-seen order
    std::vector<Participant> participants() const;
    std::vector<Participant> participants_with_status(ParticipantStatus status) const;

    //=========================================================================
    // Connections
    //=========================================================================

    // Registers the connection and links it to the participant
    void add_connection(const std::string& peer_id, std::shared_ptr<Connection> connection);

    std::shared_ptr<Connection> connection(const std::string& peer_id) const;

    // Unregisters and returns the connection (nullptr if none)
    std::shared_ptr<Connection> remove_connection(const std::string& peer_id);

    std::vector<std::shared_ptr<Connection>> open_connections() const;
    std::vector<std::string> connected_peer_ids() const;
    size_t connection_count() const { return connections_.size(); }

    //=========================================================================
    // Chat history
    //=========================================================================

    /**
     * @brief Insert a chat item unless its id is already known
     * @return false for a duplicate (the store is unchanged)
     */
    bool add_chat_item(const ChatItem& item);

    bool has_chat_item(const std::string& id) const { return known_ids_.count(id) > 0; }

    // Ordered by timestamp, ties in insertion order
    const std::vector<ChatItem>& history() const { return history_; }
    std::vector<ChatMessage> chat_messages() const;

    //=========================================================================
    // Thinking set
    //=========================================================================

    void set_thinking(const std::string& peer_id, bool thinking);
    bool is_thinking(const std::string& peer_id) const { return thinking_.count(peer_id) > 0; }
    std::vector<std::string> thinking_peers() const;

    //=========================================================================
    // UI attachment and offline buffer
    //=========================================================================

    void detach_ui();

    /**
     * @brief Mark the UI attached again
     * @return Items buffered while detached, deduplicated and timestamp
     *         ordered; the buffer is cleared
     */
    std::vector<ChatItem> attach_ui();

    bool ui_attached() const { return ui_attached_; }
    size_t buffered_count() const { return buffer_.size(); }
    size_t buffer_capacity() const { return buffer_capacity_; }

    //=========================================================================
    // Subscriptions
    //=========================================================================

    SubscriptionId subscribe(Listener listener);
    void unsubscribe(SubscriptionId id);

    // Drop all session state; subscriptions survive
    void clear();

private:
    void notify(StoreChange change);

    size_t buffer_capacity_;
    std::optional<SessionDetails> session_;

    std::unordered_map<std::string, Participant> participants_;
    std::vector<std::string> participant_order_;

    std::unordered_map<std::string, std::shared_ptr<Connection>> connections_;

    std::vector<ChatItem> history_;
    std::unordered_set<std::string> known_ids_;

    std::unordered_set<std::string> thinking_;

    bool ui_attached_ = true;
    std::deque<ChatItem> buffer_;

    SubscriptionId next_subscription_ = 1;
    std::map<SubscriptionId, Listener> listeners_;
};

} // namespace peerlink
