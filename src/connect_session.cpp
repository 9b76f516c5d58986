#include "connect_session.h"
#include "logger.h"

#define LOG_SESSION_INFO(message)  LOG_INFO("session", message)
#define LOG_SESSION_WARN(message)  LOG_WARN("session", message)

namespace peerlink {

ConnectSession::ConnectSession(EventLoop& loop, std::shared_ptr<PeerTransport> transport,
                               SessionDirectory& directory, const PeerlinkConfig& config)
    : loop_(loop), directory_(directory), config_(config), store_(config.buffer_capacity) {
    manager_ = std::make_shared<MeshConnectionManager>(loop, std::move(transport), store_, config_);
}

ConnectSession::~ConnectSession() {
    if (heartbeat_timer_ != EventLoop::kInvalidTimer) {
        loop_.cancel_timer(heartbeat_timer_);
    }
}

std::optional<CreatedSession> ConnectSession::host(const CharacterInfo& character, const HostOptions& options) {
    if (active()) {
        LOG_SESSION_WARN("Already in session " << slug_);
        return std::nullopt;
    }
    wire_manager();

    int max_participants = options.max_participants > 0 ? options.max_participants : config_.max_participants;
    auto created = directory_.create_session(manager_->local_peer_id(), character, max_participants,
                                             options.password, options.slug_style);
    if (!created) {
        LOG_SESSION_WARN("Directory refused to create a session");
        return std::nullopt;
    }

    SessionDetails details;
    details.session_id = created->session_id;
    details.slug = created->slug;
    details.my_character = character;
    if (!manager_->start_host(details)) {
        directory_.destroy_session(created->slug, created->host_peer_id);
        return std::nullopt;
    }

    slug_ = created->slug;
    is_host_ = true;
    start_directory_heartbeat();
    LOG_SESSION_INFO("Hosting session " << slug_ << " (max " << max_participants << " participants)");
    return created;
}

JoinResult ConnectSession::join(const std::string& slug, const CharacterInfo& character,
                                const std::optional<std::string>& password) {
    JoinResult result;
    if (active()) {
        LOG_SESSION_WARN("Already in session " << slug_);
        result.rejection = JoinRejection::ALREADY_JOINED;
        return result;
    }
    wire_manager();

    result = directory_.join_session(slug, manager_->local_peer_id(), character, password);
    if (!result.accepted()) {
        LOG_SESSION_WARN("Join of " << slug << " rejected: " << join_rejection_to_string(result.rejection));
        return result;
    }

    SessionDetails details;
    details.session_id = result.session_id;
    details.slug = slug;
    details.host_peer_id = result.host_peer_id;
    details.my_character = character;
    slug_ = slug;
    is_host_ = false;
    if (!manager_->start_guest(details)) {
        LOG_SESSION_WARN("Could not reach host " << result.host_peer_id);
    }
    return result;
}

bool ConnectSession::join_host(const std::string& host_peer_id, const CharacterInfo& character) {
    if (active()) {
        LOG_SESSION_WARN("Already in session " << slug_);
        return false;
    }
    wire_manager();

    SessionDetails details;
    details.slug = host_peer_id;
    details.host_peer_id = host_peer_id;
    details.my_character = character;
    slug_ = host_peer_id;
    is_host_ = false;
    return manager_->start_guest(details);
}

void ConnectSession::leave() {
    if (heartbeat_timer_ != EventLoop::kInvalidTimer) {
        loop_.cancel_timer(heartbeat_timer_);
        heartbeat_timer_ = EventLoop::kInvalidTimer;
    }
    if (auto_reply_) {
        auto_reply_->cancel();
    }
    manager_->leave();
    if (is_host_ && !slug_.empty()) {
        directory_.destroy_session(slug_, manager_->local_peer_id());
    }
    LOG_SESSION_INFO("Left session " << slug_);
    slug_.clear();
    is_host_ = false;
}

bool ConnectSession::active() const {
    return manager_->state() == MeshState::ACTIVE;
}

void ConnectSession::set_reply_generator(std::shared_ptr<ReplyGenerator> generator) {
    if (auto_reply_) {
        auto_reply_->cancel();
    }
    auto_reply_ = std::make_shared<AutoReplyScheduler>(loop_, manager_, std::move(generator),
                                                       config_.auto_reply_delay_ms);
}

bool ConnectSession::set_auto_reply(bool enabled) {
    if (!auto_reply_) {
        LOG_SESSION_WARN("Auto reply needs a reply generator");
        return false;
    }
    auto_reply_->set_enabled(enabled);
    return true;
}

void ConnectSession::wire_manager() {
    if (wired_) {
        return;
    }
    wired_ = true;

    std::weak_ptr<ConnectSession> weak = weak_from_this();
    manager_->on_chat_message([weak](const ChatMessage& message) {
        auto self = weak.lock();
        if (!self) return;
        if (self->auto_reply_) self->auto_reply_->handle_chat_message(message);
        if (self->chat_callback_) self->chat_callback_(message);
    });
    manager_->on_thinking([weak](const mesh::Thinking& thinking) {
        auto self = weak.lock();
        if (self && self->auto_reply_) self->auto_reply_->handle_thinking(thinking);
    });
    manager_->on_typing([weak](const mesh::Typing& typing) {
        auto self = weak.lock();
        if (self && self->typing_callback_) self->typing_callback_(typing);
    });
    manager_->on_state_change([weak](MeshState state) {
        auto self = weak.lock();
        if (!self) return;
        if (state != MeshState::ACTIVE && self->heartbeat_timer_ != EventLoop::kInvalidTimer) {
            self->loop_.cancel_timer(self->heartbeat_timer_);
            self->heartbeat_timer_ = EventLoop::kInvalidTimer;
        }
        if (self->state_callback_) self->state_callback_(state);
    });
}

void ConnectSession::start_directory_heartbeat() {
    std::weak_ptr<ConnectSession> weak = weak_from_this();
    heartbeat_timer_ = loop_.call_later(config_.heartbeat_interval_ms, [weak]() {
        auto self = weak.lock();
        if (!self) return;
        self->heartbeat_timer_ = EventLoop::kInvalidTimer;
        if (!self->active()) return;
        if (!self->directory_.heartbeat(self->slug_)) {
            LOG_SESSION_WARN("Directory lost session " << self->slug_);
        }
        self->start_directory_heartbeat();
    });
}

} // namespace peerlink
