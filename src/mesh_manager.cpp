#include "mesh_manager.h"
#include "json_fields.h"
#include "logger.h"
#include "util.h"

#define LOG_MESH_DEBUG(message) LOG_DEBUG("mesh", message)
#define LOG_MESH_INFO(message)  LOG_INFO("mesh", message)
#define LOG_MESH_WARN(message)  LOG_WARN("mesh", message)
#define LOG_MESH_ERROR(message) LOG_ERROR("mesh", message)

namespace peerlink {

const char* mesh_state_to_string(MeshState state) {
    switch (state) {
        case MeshState::IDLE:      return "idle";
        case MeshState::ACTIVE:    return "active";
        case MeshState::HOST_LEFT: return "host_left";
        case MeshState::LEFT:      return "left";
    }
    return "unknown";
}

MeshConnectionManager::MeshConnectionManager(EventLoop& loop, std::shared_ptr<PeerTransport> transport,
                                             SessionStore& store, const PeerlinkConfig& config)
    : loop_(loop), transport_(std::move(transport)), store_(store), config_(config) {
    local_peer_id_ = transport_->local_id();
}

MeshConnectionManager::~MeshConnectionManager() {
    cancel_timers();
    transport_->on_incoming_connection(nullptr);
    for (const auto& connection : store_.open_connections()) {
        connection->release_handlers();
    }
}

bool MeshConnectionManager::start_host(const SessionDetails& details) {
    SessionDetails host_details = details;
    host_details.is_host = true;
    host_details.host_peer_id = local_peer_id_;
    host_details.my_peer_id = local_peer_id_;
    return start(host_details);
}

bool MeshConnectionManager::start_guest(const SessionDetails& details) {
    if (details.host_peer_id.empty() || details.host_peer_id == local_peer_id_) {
        LOG_MESH_ERROR("Guest session needs a remote host peer id");
        return false;
    }
    SessionDetails guest_details = details;
    guest_details.is_host = false;
    guest_details.my_peer_id = local_peer_id_;
    if (!start(guest_details)) {
        return false;
    }
    return connect_to_peer(host_peer_id_);
}

bool MeshConnectionManager::start(const SessionDetails& details) {
    if (state_ == MeshState::ACTIVE) {
        LOG_MESH_WARN("Session already running");
        return false;
    }

    is_host_ = details.is_host;
    host_peer_id_ = details.host_peer_id;

    SessionDetails stored = details;
    int64_t now = now_ms();
    if (stored.created_at == 0) stored.created_at = now;
    stored.updated_at = now;
    store_.set_session(stored);

    Participant& self = store_.upsert_participant(local_peer_id_, ParticipantStatus::PENDING);
    if (details.my_character) {
        store_.set_participant_character(self.peer_id, *details.my_character);
        store_.set_participant_status(self.peer_id, ParticipantStatus::READY);
    }

    std::weak_ptr<MeshConnectionManager> weak = weak_from_this();
    transport_->on_incoming_connection([weak](std::shared_ptr<Connection> connection) {
        if (auto self = weak.lock()) {
            self->handle_incoming(std::move(connection));
        } else {
            connection->close();
        }
    });

    set_state(MeshState::ACTIVE);
    start_heartbeat();
    LOG_MESH_INFO("Started session " << details.slug << " as " << (is_host_ ? "host" : "guest")
                  << " (" << local_peer_id_ << ")");
    return true;
}

void MeshConnectionManager::leave() {
    if (state_ == MeshState::IDLE || state_ == MeshState::LEFT) {
        return;
    }
    LOG_MESH_INFO("Leaving session");

    mesh::PeerLeft left;
    left.peer_id = local_peer_id_;
    std::string name = my_character_name();
    if (!name.empty()) left.character_name = name;
    broadcast(left);

    cancel_timers();
    transport_->on_incoming_connection(nullptr);
    for (const auto& peer_id : store_.connected_peer_ids()) {
        std::shared_ptr<Connection> connection = store_.remove_connection(peer_id);
        if (connection) {
            connection->release_handlers();
            connection->close();
        }
    }
    // links still dialing
    for (const auto& participant : store_.participants()) {
        std::shared_ptr<Connection> connection = store_.remove_connection(participant.peer_id);
        if (connection) {
            connection->release_handlers();
            connection->close();
        }
    }
    outbound_.clear();
    last_seen_.clear();
    store_.clear();
    set_state(MeshState::LEFT);
}

std::optional<ChatMessage> MeshConnectionManager::send_chat_message(const std::string& content, bool is_human) {
    if (state_ != MeshState::ACTIVE) {
        LOG_MESH_WARN("Cannot send chat message in state " << mesh_state_to_string(state_));
        return std::nullopt;
    }
    if (!json_fields::is_valid_utf8(content)) {
        LOG_MESH_WARN("Refusing chat message that is not valid UTF-8");
        return std::nullopt;
    }
    ChatMessage message;
    message.id = generate_uuid();
    message.sender_id = local_peer_id_;
    message.character_name = my_character_name();
    message.content = content;
    message.is_human = is_human;
    message.timestamp = now_ms();

    store_.add_chat_item(message);
    broadcast(message);
    return message;
}

void MeshConnectionManager::send_typing(bool is_typing) {
    if (state_ != MeshState::ACTIVE) return;
    broadcast(mesh::Typing{local_peer_id_, my_character_name(), is_typing});
}

void MeshConnectionManager::send_thinking(bool is_thinking) {
    if (state_ != MeshState::ACTIVE) return;
    store_.set_thinking(local_peer_id_, is_thinking);

    mesh::Thinking thinking;
    thinking.peer_id = local_peer_id_;
    std::string name = my_character_name();
    if (!name.empty()) thinking.character_name = name;
    thinking.is_thinking = is_thinking;
    broadcast(thinking);
}

void MeshConnectionManager::set_auto_reply(bool enabled) {
    if (state_ != MeshState::ACTIVE) return;
    store_.set_participant_auto_reply(local_peer_id_, enabled);
    broadcast(mesh::PeerState{local_peer_id_, enabled});
}

void MeshConnectionManager::set_character(const CharacterInfo& character) {
    if (state_ != MeshState::ACTIVE) return;
    store_.set_my_character(character);
    store_.set_participant_character(local_peer_id_, character);
    store_.set_participant_status(local_peer_id_, ParticipantStatus::READY);
    broadcast(mesh::CharacterSync{character, local_peer_id_});
}

size_t MeshConnectionManager::broadcast(const MeshMessage& message, const std::string& except_peer) {
    std::string encoded = encode_mesh_message(message);
    size_t sent = 0;
    for (const auto& connection : store_.open_connections()) {
        if (!except_peer.empty() && connection->peer_id() == except_peer) {
            continue;
        }
        if (connection->send_text(encoded)) {
            sent++;
        }
    }
    LOG_MESH_DEBUG("Broadcast " << mesh_message_type(message) << " to " << sent << " peers");
    return sent;
}

bool MeshConnectionManager::send_to(const std::string& peer_id, const MeshMessage& message) {
    std::shared_ptr<Connection> connection = store_.connection(peer_id);
    if (!connection || !connection->is_open()) {
        return false;
    }
    return connection->send_text(encode_mesh_message(message));
}

bool MeshConnectionManager::connect_to_peer(const std::string& peer_id) {
    if (state_ != MeshState::ACTIVE || peer_id == local_peer_id_) {
        return false;
    }
    if (store_.connection(peer_id)) {
        return false;  // connected or dialing
    }

    std::shared_ptr<Connection> connection = transport_->connect(peer_id);
    if (!connection) {
        LOG_MESH_WARN("Could not dial " << peer_id);
        store_.upsert_participant(peer_id, ParticipantStatus::DISCONNECTED);
        store_.set_participant_status(peer_id, ParticipantStatus::DISCONNECTED);
        if (!is_host_ && peer_id == host_peer_id_) {
            set_state(MeshState::HOST_LEFT);
        }
        return false;
    }

    LOG_MESH_INFO("Dialing " << peer_id);
    register_connection(connection, true);
    return true;
}

void MeshConnectionManager::handle_incoming(std::shared_ptr<Connection> connection) {
    const std::string peer_id = connection->peer_id();
    if (state_ != MeshState::ACTIVE) {
        LOG_MESH_WARN("Rejecting connection from " << peer_id << " in state " << mesh_state_to_string(state_));
        connection->close();
        return;
    }

    std::shared_ptr<Connection> existing = store_.connection(peer_id);
    if (existing) {
        auto it = outbound_.find(peer_id);
        bool existing_outbound = it != outbound_.end() && it->second;
        if (existing_outbound && local_peer_id_ < peer_id) {
            LOG_MESH_DEBUG("Keeping own link to " << peer_id << ", closing the duplicate");
            connection->close();
            return;
        }
        LOG_MESH_DEBUG("Replacing link to " << peer_id << " with the inbound one");
        store_.remove_connection(peer_id);
        auto timer = connect_timers_.find(peer_id);
        if (timer != connect_timers_.end()) {
            loop_.cancel_timer(timer->second);
            connect_timers_.erase(timer);
        }
        existing->release_handlers();
        existing->close();
    }

    LOG_MESH_INFO("Incoming connection from " << peer_id);
    register_connection(connection, false);
}

void MeshConnectionManager::register_connection(const std::shared_ptr<Connection>& connection, bool outbound) {
    const std::string peer_id = connection->peer_id();
    store_.add_connection(peer_id, connection);
    outbound_[peer_id] = outbound;

    Participant* participant = store_.find_participant(peer_id);
    if (participant && participant->status == ParticipantStatus::DISCONNECTED) {
        store_.set_participant_status(peer_id, ParticipantStatus::CONNECTING);
    }

    std::weak_ptr<MeshConnectionManager> weak = weak_from_this();
    const Connection* key = connection.get();
    EventLoop& loop = loop_;

    connection->on_open([weak, peer_id, key]() {
        if (auto self = weak.lock()) self->handle_open(peer_id, key);
    });
    connection->on_text([weak, peer_id, key](const std::string& text) {
        if (auto self = weak.lock()) self->handle_text(peer_id, key, text);
    });
    connection->on_binary([peer_id](const std::vector<uint8_t>& data) {
        LOG_MESH_WARN("Ignoring " << data.size() << " byte binary frame from " << peer_id);
    });
    // teardown is deferred so it never runs inside another handler
    connection->on_close([weak, peer_id, key, &loop]() {
        loop.post([weak, peer_id, key]() {
            if (auto self = weak.lock()) self->handle_closed(peer_id, key, "closed");
        });
    });
    connection->on_error([weak, peer_id, key, &loop](const std::string& error) {
        loop.post([weak, peer_id, key, error]() {
            if (auto self = weak.lock()) self->handle_closed(peer_id, key, error);
        });
    });

    if (outbound) {
        connect_timers_[peer_id] = loop_.call_later(config_.connect_timeout_ms, [weak, peer_id, key]() {
            auto self = weak.lock();
            if (!self) return;
            self->connect_timers_.erase(peer_id);
            if (self->is_current(peer_id, key) && !self->store_.connection(peer_id)->is_open()) {
                LOG_MESH_WARN("Connection to " << peer_id << " timed out");
                self->disconnect_peer(peer_id, key);
            }
        });
    }
}

bool MeshConnectionManager::is_current(const std::string& peer_id, const Connection* connection) const {
    std::shared_ptr<Connection> registered = store_.connection(peer_id);
    return registered && registered.get() == connection;
}

void MeshConnectionManager::handle_open(const std::string& peer_id, const Connection* connection) {
    if (!is_current(peer_id, connection)) {
        return;
    }
    auto timer = connect_timers_.find(peer_id);
    if (timer != connect_timers_.end()) {
        loop_.cancel_timer(timer->second);
        connect_timers_.erase(timer);
    }

    Participant* participant = store_.find_participant(peer_id);
    if (participant && participant->status != ParticipantStatus::READY) {
        store_.set_participant_status(peer_id, ParticipantStatus::PENDING);
    }
    last_seen_[peer_id] = loop_.now();
    LOG_MESH_INFO("Link to " << peer_id << " open");

    auto sync = my_character_sync();
    if (outbound_[peer_id]) {
        send_to(peer_id, mesh::PeerConnecting{local_peer_id_});
        if (sync) send_to(peer_id, *sync);
        send_to(peer_id, mesh::RequestSync{local_peer_id_});
    } else {
        if (sync) send_to(peer_id, *sync);
        broadcast(mesh::PeerConnecting{peer_id}, peer_id);
    }
}

void MeshConnectionManager::handle_text(const std::string& peer_id, const Connection* connection,
                                        const std::string& text) {
    if (!is_current(peer_id, connection)) {
        return;
    }
    auto message = decode_mesh_message(text);
    if (!message) {
        return;  // dropped, the link stays up
    }
    last_seen_[peer_id] = loop_.now();
    LOG_MESH_DEBUG("Received " << mesh_message_type(*message) << " from " << peer_id);
    std::visit([this, &peer_id](const auto& m) { handle(peer_id, m); }, *message);
}

void MeshConnectionManager::handle_closed(const std::string& peer_id, const Connection* connection,
                                          const std::string& reason) {
    if (!is_current(peer_id, connection)) {
        return;
    }
    LOG_MESH_INFO("Link to " << peer_id << " lost: " << reason);
    disconnect_peer(peer_id, connection);
}

std::string MeshConnectionManager::joined_message_id(const std::string& peer_id) const {
    const auto& session = store_.session();
    return "joined:" + (session ? session->session_id : std::string()) + ":" + peer_id;
}

void MeshConnectionManager::handle(const std::string& from, const mesh::CharacterSync& message) {
    if (message.peer_id != from) {
        LOG_MESH_WARN("CharacterSync for " << message.peer_id << " arrived on link to " << from);
    }
    Participant& participant = store_.upsert_participant(from, ParticipantStatus::PENDING);
    bool rejoin = participant.status == ParticipantStatus::DISCONNECTED;
    bool first_sync = !participant.character || rejoin;

    store_.set_participant_character(from, message.character);
    store_.set_participant_status(from, ParticipantStatus::READY);

    if (!first_sync) {
        return;
    }
    LOG_MESH_INFO(message.character.name << " (" << from << ") joined");

    // Every peer that links with the newcomer announces the join. A shared id
    // lets dedup keep one notice per peer; a rejoin gets a fresh one.
    SystemMessage joined;
    joined.id = rejoin ? generate_uuid() : joined_message_id(from);
    joined.event = SystemEvent::JOINED;
    joined.character_name = message.character.name;
    joined.timestamp = now_ms();
    store_.add_chat_item(joined);
    broadcast(joined);

    if (is_host_) {
        broadcast(mesh::ParticipantList{ready_roster()});
    }
}

void MeshConnectionManager::handle(const std::string& from, const ChatMessage& message) {
    if (!store_.add_chat_item(message)) {
        return;
    }
    LOG_MESH_DEBUG("Chat from " << message.character_name << " via " << from);
    if (message.sender_id != local_peer_id_) {
        ChatCallback callback = chat_callback_;
        if (callback) callback(message);
    }
}

void MeshConnectionManager::handle(const std::string&, const SystemMessage& message) {
    store_.add_chat_item(message);
}

void MeshConnectionManager::handle(const std::string&, const mesh::Typing& message) {
    TypingCallback callback = typing_callback_;
    if (callback) callback(message);
}

void MeshConnectionManager::handle(const std::string&, const mesh::Thinking& message) {
    store_.set_thinking(message.peer_id, message.is_thinking);
    ThinkingCallback callback = thinking_callback_;
    if (callback) callback(message);
}

void MeshConnectionManager::handle(const std::string&, const mesh::PeerState& message) {
    store_.set_participant_auto_reply(message.peer_id, message.auto_reply_enabled);
}

void MeshConnectionManager::handle(const std::string&, const mesh::PeerConnecting& message) {
    if (message.peer_id == local_peer_id_) {
        return;
    }
    if (!store_.find_participant(message.peer_id)) {
        store_.upsert_participant(message.peer_id, ParticipantStatus::PENDING);
    }
}

void MeshConnectionManager::handle(const std::string&, const mesh::ParticipantList& message) {
    apply_roster(message.participants);
}

void MeshConnectionManager::handle(const std::string&, const mesh::SessionInfo& message) {
    apply_roster(message.participants);
    size_t added = 0;
    for (const auto& chat : message.chat_history) {
        if (store_.add_chat_item(chat)) added++;
    }
    LOG_MESH_INFO("Session info: " << message.participants.size() << " participants, "
                  << added << " new history items");
}

void MeshConnectionManager::handle(const std::string& from, const mesh::RequestSync&) {
    auto sync = my_character_sync();
    if (sync) {
        send_to(from, *sync);
    }
    if (is_host_) {
        mesh::SessionInfo info;
        info.participants = ready_roster();
        info.chat_history = store_.chat_messages();
        send_to(from, info);
    }
}

void MeshConnectionManager::handle(const std::string&, const mesh::PeerLeft& message) {
    if (message.peer_id == local_peer_id_) {
        return;
    }
    remove_peer(message.peer_id, message.character_name);
}

void MeshConnectionManager::handle(const std::string& from, const mesh::Heartbeat& message) {
    last_seen_[from] = loop_.now();
    LOG_MESH_DEBUG("Heartbeat from " << message.peer_id);
}

void MeshConnectionManager::apply_roster(const std::vector<ParticipantInfo>& participants) {
    for (const auto& info : participants) {
        if (info.peer_id == local_peer_id_) {
            continue;
        }
        Participant* known = store_.find_participant(info.peer_id);
        if (!known) {
            store_.upsert_participant(info.peer_id, ParticipantStatus::READY);
            store_.set_participant_character(info.peer_id, info.character);
        } else if (!known->character) {
            store_.set_participant_character(info.peer_id, info.character);
        }
        store_.set_participant_auto_reply(info.peer_id, info.auto_reply_enabled);

        if (!store_.connection(info.peer_id)) {
            connect_to_peer(info.peer_id);
        }
    }
}

std::vector<ParticipantInfo> MeshConnectionManager::ready_roster() const {
    std::vector<ParticipantInfo> roster;
    for (const auto& participant : store_.participants_with_status(ParticipantStatus::READY)) {
        if (!participant.character) {
            continue;
        }
        roster.push_back(ParticipantInfo{participant.peer_id, *participant.character,
                                         participant.auto_reply_enabled});
    }
    return roster;
}

std::optional<mesh::CharacterSync> MeshConnectionManager::my_character_sync() const {
    const auto& session = store_.session();
    if (!session || !session->my_character) {
        return std::nullopt;
    }
    return mesh::CharacterSync{*session->my_character, local_peer_id_};
}

std::string MeshConnectionManager::my_character_name() const {
    const auto& session = store_.session();
    if (!session || !session->my_character) {
        return "";
    }
    return session->my_character->name;
}

void MeshConnectionManager::remove_peer(const std::string& peer_id,
                                        const std::optional<std::string>& character_name) {
    std::string name = character_name.value_or("");
    if (name.empty()) {
        const Participant* participant = store_.find_participant(peer_id);
        if (participant && participant->character) {
            name = participant->character->name;
        }
    }

    const Participant* participant = store_.find_participant(peer_id);
    bool already_gone = !participant || participant->status == ParticipantStatus::DISCONNECTED;
    if (!name.empty() && !already_gone) {
        SystemMessage left;
        left.id = generate_uuid();
        left.event = SystemEvent::LEFT;
        left.character_name = name;
        left.timestamp = now_ms();
        store_.add_chat_item(left);
    }
    LOG_MESH_INFO((name.empty() ? peer_id : name) << " left the session");
    disconnect_peer(peer_id, nullptr);
}

void MeshConnectionManager::disconnect_peer(const std::string& peer_id, const Connection* expected) {
    std::shared_ptr<Connection> connection = store_.connection(peer_id);
    if (connection && (!expected || connection.get() == expected)) {
        store_.remove_connection(peer_id);
        connection->release_handlers();
        connection->close();
    }
    outbound_.erase(peer_id);
    last_seen_.erase(peer_id);

    auto timer = connect_timers_.find(peer_id);
    if (timer != connect_timers_.end()) {
        loop_.cancel_timer(timer->second);
        connect_timers_.erase(timer);
    }

    store_.set_participant_status(peer_id, ParticipantStatus::DISCONNECTED);
    store_.set_thinking(peer_id, false);

    if (!is_host_ && peer_id == host_peer_id_ && state_ == MeshState::ACTIVE) {
        LOG_MESH_WARN("Host " << peer_id << " left the session");
        if (heartbeat_timer_ != EventLoop::kInvalidTimer) {
            loop_.cancel_timer(heartbeat_timer_);
            heartbeat_timer_ = EventLoop::kInvalidTimer;
        }
        set_state(MeshState::HOST_LEFT);
    }
}

void MeshConnectionManager::start_heartbeat() {
    std::weak_ptr<MeshConnectionManager> weak = weak_from_this();
    heartbeat_timer_ = loop_.call_later(config_.peer_heartbeat_interval_ms, [weak]() {
        auto self = weak.lock();
        if (!self || self->state_ != MeshState::ACTIVE) return;
        if (self->is_host_) {
            self->check_liveness();
        } else {
            self->send_heartbeat();
        }
        self->start_heartbeat();
    });
}

void MeshConnectionManager::send_heartbeat() {
    send_to(host_peer_id_, mesh::Heartbeat{local_peer_id_, now_ms()});
}

void MeshConnectionManager::check_liveness() {
    int64_t now = loop_.now();
    std::vector<Participant> silent;
    for (const auto& participant : store_.participants_with_status(ParticipantStatus::READY)) {
        if (participant.peer_id == local_peer_id_) continue;
        auto it = last_seen_.find(participant.peer_id);
        if (it != last_seen_.end() && now - it->second > config_.peer_heartbeat_timeout_ms) {
            silent.push_back(participant);
        }
    }

    for (const auto& participant : silent) {
        LOG_MESH_WARN("Dropping silent peer " << participant.peer_id);
        mesh::PeerLeft left;
        left.peer_id = participant.peer_id;
        if (participant.character) left.character_name = participant.character->name;
        remove_peer(participant.peer_id, left.character_name);
        broadcast(left);
    }
    if (!silent.empty()) {
        broadcast(mesh::ParticipantList{ready_roster()});
    }
}

void MeshConnectionManager::cancel_timers() {
    if (heartbeat_timer_ != EventLoop::kInvalidTimer) {
        loop_.cancel_timer(heartbeat_timer_);
        heartbeat_timer_ = EventLoop::kInvalidTimer;
    }
    for (const auto& entry : connect_timers_) {
        loop_.cancel_timer(entry.second);
    }
    connect_timers_.clear();
}

void MeshConnectionManager::set_state(MeshState state) {
    if (state_ == state) {
        return;
    }
    LOG_MESH_INFO("Session state " << mesh_state_to_string(state_) << " -> " << mesh_state_to_string(state));
    state_ = state;
    StateCallback callback = state_callback_;
    if (callback) callback(state);
}

} // namespace peerlink
