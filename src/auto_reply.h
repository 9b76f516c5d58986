#pragma once

/**
 * @file auto_reply.h
 * @brief Debounced automatic chat replies on behalf of the local character
 */

#include "event_loop.h"
#include "mesh_messages.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace peerlink {

class MeshConnectionManager;

class GenerationError : public std::runtime_error {
public:
    explicit GenerationError(const std::string& message) : std::runtime_error(message) {}
};

struct ReplyContext {
    std::string my_peer_id;
    CharacterInfo character;
    std::vector<std::string> participant_names;  // other characters in the session
    std::vector<ChatMessage> recent_messages;    // oldest first
};

/**
 * Text generation backend. Returns the reply text (may be empty) or throws
 * GenerationError.
 */
class ReplyGenerator {
public:
    virtual ~ReplyGenerator() = default;
    virtual std::string generate_reply(const ReplyContext& context) = 0;
};

class AutoReplyScheduler : public std::enable_shared_from_this<AutoReplyScheduler> {
public:
    static constexpr int64_t kMinDelayMs = 1000;
    static constexpr int64_t kMaxDelayMs = 30000;
    static constexpr int64_t kDebounceWindowMs = 5000;
    static constexpr size_t kContextMessages = 20;

    AutoReplyScheduler(EventLoop& loop, std::weak_ptr<MeshConnectionManager> manager,
                       std::shared_ptr<ReplyGenerator> generator, int64_t delay_ms);
    ~AutoReplyScheduler();

    AutoReplyScheduler(const AutoReplyScheduler&) = delete;
    AutoReplyScheduler& operator=(const AutoReplyScheduler&) = delete;

    /**
     * @brief Toggle auto reply and announce it to the session
     *
     * Enabling schedules a reply right away when the newest chat message
     * came from another peer.
     */
    void set_enabled(bool enabled);
    bool enabled() const { return enabled_; }

    void set_delay_ms(int64_t delay_ms) { delay_ms_ = clamp_delay(delay_ms); }
    int64_t delay_ms() const { return delay_ms_; }

    // Feed live chat messages here; each one restarts the delay
    void handle_chat_message(const ChatMessage& message);

    // Another peer starting to think shortly after ours was scheduled cancels it
    void handle_thinking(const mesh::Thinking& thinking);

    void cancel();
    bool pending() const { return timer_ != EventLoop::kInvalidTimer; }
    bool generating() const { return generating_; }

    static int64_t clamp_delay(int64_t delay_ms);

private:
    void schedule();
    void fire();

    EventLoop& loop_;
    std::weak_ptr<MeshConnectionManager> manager_;
    std::shared_ptr<ReplyGenerator> generator_;
    int64_t delay_ms_;
    bool enabled_ = false;
    bool generating_ = false;

    EventLoop::TimerId timer_ = EventLoop::kInvalidTimer;
    int64_t scheduled_at_ = 0;
};

} // namespace peerlink
