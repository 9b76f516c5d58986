#include "auto_reply.h"
#include "logger.h"
#include "mesh_manager.h"

#include <algorithm>

#define LOG_AUTOREPLY_DEBUG(message) LOG_DEBUG("autoreply", message)
#define LOG_AUTOREPLY_INFO(message)  LOG_INFO("autoreply", message)
#define LOG_AUTOREPLY_WARN(message)  LOG_WARN("autoreply", message)
#define LOG_AUTOREPLY_ERROR(message) LOG_ERROR("autoreply", message)

namespace peerlink {

namespace {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

} // anonymous namespace

AutoReplyScheduler::AutoReplyScheduler(EventLoop& loop, std::weak_ptr<MeshConnectionManager> manager,
                                       std::shared_ptr<ReplyGenerator> generator, int64_t delay_ms)
    : loop_(loop), manager_(std::move(manager)), generator_(std::move(generator)),
      delay_ms_(clamp_delay(delay_ms)) {
}

AutoReplyScheduler::~AutoReplyScheduler() {
    cancel();
}

int64_t AutoReplyScheduler::clamp_delay(int64_t delay_ms) {
    return std::min(std::max(delay_ms, kMinDelayMs), kMaxDelayMs);
}

void AutoReplyScheduler::set_enabled(bool enabled) {
    enabled_ = enabled;
    auto manager = manager_.lock();
    if (manager) {
        manager->set_auto_reply(enabled);
    }
    if (!enabled) {
        cancel();
        return;
    }
    if (!manager) {
        return;
    }

    std::vector<ChatMessage> messages = manager->store().chat_messages();
    if (!messages.empty() && messages.back().sender_id != manager->local_peer_id()) {
        schedule();
    }
}

void AutoReplyScheduler::handle_chat_message(const ChatMessage& message) {
    if (!enabled_) {
        return;
    }
    auto manager = manager_.lock();
    if (!manager || message.sender_id == manager->local_peer_id()) {
        return;
    }
    schedule();
}

void AutoReplyScheduler::handle_thinking(const mesh::Thinking& thinking) {
    if (!thinking.is_thinking || !pending()) {
        return;
    }
    auto manager = manager_.lock();
    if (manager && thinking.peer_id == manager->local_peer_id()) {
        return;
    }
    int64_t since_scheduled = loop_.now() - scheduled_at_;
    if (since_scheduled >= 0 && since_scheduled < kDebounceWindowMs) {
        LOG_AUTOREPLY_INFO("Pending reply cancelled, " << thinking.peer_id << " started thinking");
        cancel();
    }
}

void AutoReplyScheduler::cancel() {
    if (timer_ != EventLoop::kInvalidTimer) {
        loop_.cancel_timer(timer_);
        timer_ = EventLoop::kInvalidTimer;
    }
}

void AutoReplyScheduler::schedule() {
    if (generating_) {
        LOG_AUTOREPLY_DEBUG("Already generating, not rescheduling");
        return;
    }
    cancel();
    scheduled_at_ = loop_.now();

    std::weak_ptr<AutoReplyScheduler> weak = weak_from_this();
    timer_ = loop_.call_later(delay_ms_, [weak]() {
        if (auto self = weak.lock()) {
            self->timer_ = EventLoop::kInvalidTimer;
            self->fire();
        }
    });
    LOG_AUTOREPLY_DEBUG("Reply scheduled in " << delay_ms_ << "ms");
}

void AutoReplyScheduler::fire() {
    auto manager = manager_.lock();
    if (!enabled_ || !manager || manager->state() != MeshState::ACTIVE) {
        return;
    }
    const auto& session = manager->store().session();
    if (!session || !session->my_character) {
        LOG_AUTOREPLY_WARN("No character selected, skipping reply");
        return;
    }

    ReplyContext context;
    context.my_peer_id = manager->local_peer_id();
    context.character = *session->my_character;
    for (const auto& participant : manager->store().participants_with_status(ParticipantStatus::READY)) {
        if (participant.peer_id != context.my_peer_id && participant.character) {
            context.participant_names.push_back(participant.character->name);
        }
    }
    std::vector<ChatMessage> messages = manager->store().chat_messages();
    size_t first = messages.size() > kContextMessages ? messages.size() - kContextMessages : 0;
    context.recent_messages.assign(messages.begin() + first, messages.end());

    manager->send_thinking(true);
    generating_ = true;

    std::string reply;
    try {
        reply = trim(generator_->generate_reply(context));
    } catch (const GenerationError& e) {
        LOG_AUTOREPLY_WARN("Reply generation failed: " << e.what());
    } catch (const std::exception& e) {
        LOG_AUTOREPLY_ERROR("Reply generator threw: " << e.what());
    }

    generating_ = false;
    manager->send_thinking(false);

    if (reply.empty()) {
        LOG_AUTOREPLY_INFO("No reply produced");
        return;
    }
    if (!manager->send_chat_message(reply, false)) {
        LOG_AUTOREPLY_WARN("Reply could not be sent");
    }
}

} // namespace peerlink
