#include "session_store.h"
#include "logger.h"

#include <algorithm>

#define LOG_STORE_DEBUG(message) LOG_DEBUG("store", message)
#define LOG_STORE_INFO(message)  LOG_INFO("store", message)

namespace peerlink {

const char* participant_status_to_string(ParticipantStatus status) {
    switch (status) {
        case ParticipantStatus::CONNECTING:   return "connecting";
        case ParticipantStatus::PENDING:      return "pending";
        case ParticipantStatus::READY:        return "ready";
        case ParticipantStatus::DISCONNECTED: return "disconnected";
    }
    return "unknown";
}

SessionStore::SessionStore(size_t buffer_capacity)
    : buffer_capacity_(buffer_capacity == 0 ? 1 : buffer_capacity) {
}

void SessionStore::set_session(const SessionDetails& details) {
    session_ = details;
    LOG_STORE_INFO("Session " << details.slug << " (" << (details.is_host ? "host" : "guest")
                   << ", host " << details.host_peer_id << ")");
    notify(StoreChange::SESSION);
}

void SessionStore::set_my_character(const CharacterInfo& character) {
    if (!session_) {
        return;
    }
    session_->my_character = character;
    notify(StoreChange::SESSION);
}

void SessionStore::touch(int64_t now_ms) {
    if (session_) {
        session_->updated_at = now_ms;
    }
}

Participant& SessionStore::upsert_participant(const std::string& peer_id, ParticipantStatus initial_status) {
    auto it = participants_.find(peer_id);
    if (it != participants_.end()) {
        return it->second;
    }
    Participant participant;
    participant.peer_id = peer_id;
    participant.status = initial_status;
    participant_order_.push_back(peer_id);
    LOG_STORE_DEBUG("Participant " << peer_id << " added as " << participant_status_to_string(initial_status));
    Participant& added = participants_.emplace(peer_id, std::move(participant)).first->second;
    notify(StoreChange::PARTICIPANTS);
    return added;
}

Participant* SessionStore::find_participant(const std::string& peer_id) {
    auto it = participants_.find(peer_id);
    return it == participants_.end() ? nullptr : &it->second;
}

const Participant* SessionStore::find_participant(const std::string& peer_id) const {
    auto it = participants_.find(peer_id);
    return it == participants_.end() ? nullptr : &it->second;
}

bool SessionStore::set_participant_status(const std::string& peer_id, ParticipantStatus status) {
    Participant* participant = find_participant(peer_id);
    if (!participant) {
        return false;
    }
    if (participant->status != status) {
        LOG_STORE_DEBUG("Participant " << peer_id << ": " << participant_status_to_string(participant->status)
                        << " -> " << participant_status_to_string(status));
        participant->status = status;
        notify(StoreChange::PARTICIPANTS);
    }
    return true;
}

bool SessionStore::set_participant_character(const std::string& peer_id, const CharacterInfo& character) {
    Participant* participant = find_participant(peer_id);
    if (!participant) {
        return false;
    }
    participant->character = character;
    notify(StoreChange::PARTICIPANTS);
    return true;
}

bool SessionStore::set_participant_auto_reply(const std::string& peer_id, bool enabled) {
    Participant* participant = find_participant(peer_id);
    if (!participant) {
        return false;
    }
    if (participant->auto_reply_enabled != enabled) {
        participant->auto_reply_enabled = enabled;
        notify(StoreChange::PARTICIPANTS);
    }
    return true;
}

std::vector<Participant> SessionStore::participants() const {
    std::vector<Participant> result;
    result.reserve(participant_order_.size());
    for (const auto& peer_id : participant_order_) {
        result.push_back(participants_.at(peer_id));
    }
    return result;
}

std::vector<Participant> SessionStore::participants_with_status(ParticipantStatus status) const {
    std::vector<Participant> result;
    for (const auto& peer_id : participant_order_) {
        const Participant& participant = participants_.at(peer_id);
        if (participant.status == status) {
            result.push_back(participant);
        }
    }
    return result;
}

void SessionStore::add_connection(const std::string& peer_id, std::shared_ptr<Connection> connection) {
    Participant& participant = upsert_participant(peer_id, ParticipantStatus::CONNECTING);
    participant.connection = connection;
    connections_[peer_id] = std::move(connection);
    notify(StoreChange::CONNECTIONS);
}

std::shared_ptr<Connection> SessionStore::connection(const std::string& peer_id) const {
    auto it = connections_.find(peer_id);
    return it == connections_.end() ? nullptr : it->second;
}

std::shared_ptr<Connection> SessionStore::remove_connection(const std::string& peer_id) {
    auto it = connections_.find(peer_id);
    if (it == connections_.end()) {
        return nullptr;
    }
    std::shared_ptr<Connection> connection = std::move(it->second);
    connections_.erase(it);

    Participant* participant = find_participant(peer_id);
    if (participant) {
        participant->connection.reset();
    }
    notify(StoreChange::CONNECTIONS);
    return connection;
}

std::vector<std::shared_ptr<Connection>> SessionStore::open_connections() const {
    std::vector<std::shared_ptr<Connection>> result;
    for (const auto& peer_id : participant_order_) {
        auto it = connections_.find(peer_id);
        if (it != connections_.end() && it->second->is_open()) {
            result.push_back(it->second);
        }
    }
    return result;
}

std::vector<std::string> SessionStore::connected_peer_ids() const {
    std::vector<std::string> result;
    for (const auto& peer_id : participant_order_) {
        auto it = connections_.find(peer_id);
        if (it != connections_.end() && it->second->is_open()) {
            result.push_back(peer_id);
        }
    }
    return result;
}

bool SessionStore::add_chat_item(const ChatItem& item) {
    const std::string& id = chat_item_id(item);
    if (!known_ids_.insert(id).second) {
        LOG_STORE_DEBUG("Duplicate chat item " << id << " ignored");
        return false;
    }

    int64_t timestamp = chat_item_timestamp(item);
    auto position = std::upper_bound(history_.begin(), history_.end(), timestamp,
        [](int64_t ts, const ChatItem& existing) { return ts < chat_item_timestamp(existing); });
    history_.insert(position, item);

    if (!ui_attached_) {
        buffer_.push_back(item);
        while (buffer_.size() > buffer_capacity_) {
            buffer_.pop_front();
        }
    }

    notify(StoreChange::HISTORY);
    return true;
}

std::vector<ChatMessage> SessionStore::chat_messages() const {
    std::vector<ChatMessage> result;
    for (const auto& item : history_) {
        if (const auto* chat = std::get_if<ChatMessage>(&item)) {
            result.push_back(*chat);
        }
    }
    return result;
}

void SessionStore::set_thinking(const std::string& peer_id, bool thinking) {
    bool changed = thinking ? thinking_.insert(peer_id).second : thinking_.erase(peer_id) > 0;
    if (changed) {
        notify(StoreChange::THINKING);
    }
}

std::vector<std::string> SessionStore::thinking_peers() const {
    std::vector<std::string> result(thinking_.begin(), thinking_.end());
    std::sort(result.begin(), result.end());
    return result;
}

void SessionStore::detach_ui() {
    ui_attached_ = false;
}

std::vector<ChatItem> SessionStore::attach_ui() {
    ui_attached_ = true;

    std::vector<ChatItem> items;
    std::unordered_set<std::string> seen;
    for (const auto& item : buffer_) {
        if (seen.insert(chat_item_id(item)).second) {
            items.push_back(item);
        }
    }
    buffer_.clear();

    std::stable_sort(items.begin(), items.end(), [](const ChatItem& a, const ChatItem& b) {
        return chat_item_timestamp(a) < chat_item_timestamp(b);
    });
    return items;
}

SessionStore::SubscriptionId SessionStore::subscribe(Listener listener) {
    SubscriptionId id = next_subscription_++;
    listeners_[id] = std::move(listener);
    return id;
}

void SessionStore::unsubscribe(SubscriptionId id) {
    listeners_.erase(id);
}

void SessionStore::clear() {
    session_.reset();
    participants_.clear();
    participant_order_.clear();
    connections_.clear();
    history_.clear();
    known_ids_.clear();
    thinking_.clear();
    buffer_.clear();
    LOG_STORE_INFO("Session state cleared");
    notify(StoreChange::SESSION);
}

void SessionStore::notify(StoreChange change) {
    // listeners may unsubscribe while being notified
    std::vector<Listener> listeners;
    listeners.reserve(listeners_.size());
    for (const auto& entry : listeners_) {
        listeners.push_back(entry.second);
    }
    for (const auto& listener : listeners) {
        listener(change);
    }
}

} // namespace peerlink
