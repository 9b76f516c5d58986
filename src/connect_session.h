#pragma once

/**
 * @file connect_session.h
 * @brief Host / join / leave orchestration for a mesh chat session
 *
 * Ties the session directory to the mesh: the host registers a slug and
 * keeps it alive with a heartbeat timer, guests resolve the slug to the
 * host's peer id and dial it. Directory rejections are reported before any
 * connection is made.
 */

#include "auto_reply.h"
#include "config.h"
#include "event_loop.h"
#include "mesh_manager.h"
#include "session_directory.h"
#include "session_store.h"
#include "transport.h"

#include <memory>
#include <optional>
#include <string>

namespace peerlink {

struct HostOptions {
    int max_participants = 0;               // 0 uses the configured default
    std::optional<std::string> password;
    SlugStyle slug_style = SlugStyle::SHORT;
};

class ConnectSession : public std::enable_shared_from_this<ConnectSession> {
public:
    ConnectSession(EventLoop& loop, std::shared_ptr<PeerTransport> transport, SessionDirectory& directory,
                   const PeerlinkConfig& config);
    ~ConnectSession();

    ConnectSession(const ConnectSession&) = delete;
    ConnectSession& operator=(const ConnectSession&) = delete;

    // nullopt if the directory refused or the mesh could not start
    std::optional<CreatedSession> host(const CharacterInfo& character, const HostOptions& options);

    JoinResult join(const std::string& slug, const CharacterInfo& character,
                    const std::optional<std::string>& password);

    // Dial a known host address without a directory lookup
    bool join_host(const std::string& host_peer_id, const CharacterInfo& character);

    void leave();

    bool active() const;
    const std::string& slug() const { return slug_; }
    bool is_host() const { return is_host_; }

    SessionStore& store() { return store_; }
    MeshConnectionManager& mesh() { return *manager_; }

    // Installs the generator used by auto reply
    void set_reply_generator(std::shared_ptr<ReplyGenerator> generator);
    bool set_auto_reply(bool enabled);
    AutoReplyScheduler* auto_reply() { return auto_reply_.get(); }

    void on_state_change(MeshConnectionManager::StateCallback callback) { state_callback_ = std::move(callback); }
    void on_typing(MeshConnectionManager::TypingCallback callback) { typing_callback_ = std::move(callback); }
    void on_chat_message(MeshConnectionManager::ChatCallback callback) { chat_callback_ = std::move(callback); }

private:
    void wire_manager();
    void start_directory_heartbeat();

    EventLoop& loop_;
    SessionDirectory& directory_;
    PeerlinkConfig config_;

    SessionStore store_;
    std::shared_ptr<MeshConnectionManager> manager_;
    std::shared_ptr<AutoReplyScheduler> auto_reply_;

    std::string slug_;
    bool is_host_ = false;
    bool wired_ = false;
    EventLoop::TimerId heartbeat_timer_ = EventLoop::kInvalidTimer;

    MeshConnectionManager::StateCallback state_callback_;
    MeshConnectionManager::TypingCallback typing_callback_;
    MeshConnectionManager::ChatCallback chat_callback_;
};

} // namespace peerlink
