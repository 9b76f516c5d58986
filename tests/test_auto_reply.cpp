#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "auto_reply.h"
#include "event_loop.h"
#include "logger.h"
#include "loopback_transport.h"
#include "mesh_manager.h"

#include <memory>
#include <string>
#include <vector>

using namespace peerlink;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

namespace {

class MockReplyGenerator : public ReplyGenerator {
public:
    MOCK_METHOD(std::string, generate_reply, (const ReplyContext& context), (override));
};

} // namespace

class AutoReplyTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().set_log_level(LogLevel::ERROR);
        hub_ = std::make_unique<LoopbackHub>(loop_);

        alice_store_ = std::make_unique<SessionStore>();
        bob_store_ = std::make_unique<SessionStore>();
        alice_ = std::make_shared<MeshConnectionManager>(loop_, hub_->create_transport("alice"), *alice_store_, config_);
        bob_ = std::make_shared<MeshConnectionManager>(loop_, hub_->create_transport("bob"), *bob_store_, config_);

        generator_ = std::make_shared<MockReplyGenerator>();
        scheduler_ = std::make_shared<AutoReplyScheduler>(loop_, alice_, generator_, 1000);

        alice_->on_chat_message([this](const ChatMessage& message) { scheduler_->handle_chat_message(message); });
        alice_->on_thinking([this](const mesh::Thinking& thinking) { scheduler_->handle_thinking(thinking); });
        bob_->on_chat_message([this](const ChatMessage& message) { bob_received_.push_back(message); });
        bob_->on_thinking([this](const mesh::Thinking& thinking) { bob_saw_thinking_.push_back(thinking.is_thinking); });

        SessionDetails details;
        details.session_id = "session-1";
        details.slug = "quiet-harbor";
        details.host_peer_id = "alice";
        details.my_character = CharacterInfo{"Alice", std::nullopt};
        ASSERT_TRUE(alice_->start_host(details));
        details.my_character = CharacterInfo{"Bob", std::nullopt};
        ASSERT_TRUE(bob_->start_guest(details));
        loop_.run_until_idle();
        ASSERT_EQ(alice_store_->participants_with_status(ParticipantStatus::READY).size(), 2u);
    }

    void TearDown() override {
        scheduler_.reset();
        alice_.reset();
        bob_.reset();
        alice_store_.reset();
        bob_store_.reset();
        hub_.reset();
        Logger::getInstance().set_log_level(LogLevel::INFO);
    }

    void bob_says(const std::string& text) {
        ASSERT_TRUE(bob_->send_chat_message(text, true).has_value());
        loop_.run_until_idle();
    }

    EventLoop loop_;
    PeerlinkConfig config_;
    std::unique_ptr<LoopbackHub> hub_;
    std::unique_ptr<SessionStore> alice_store_;
    std::unique_ptr<SessionStore> bob_store_;
    std::shared_ptr<MeshConnectionManager> alice_;
    std::shared_ptr<MeshConnectionManager> bob_;

    std::shared_ptr<MockReplyGenerator> generator_;
    std::shared_ptr<AutoReplyScheduler> scheduler_;

    std::vector<ChatMessage> bob_received_;
    std::vector<bool> bob_saw_thinking_;
};

TEST_F(AutoReplyTest, DelayIsClamped) {
    EXPECT_EQ(AutoReplyScheduler::clamp_delay(0), AutoReplyScheduler::kMinDelayMs);
    EXPECT_EQ(AutoReplyScheduler::clamp_delay(5000), 5000);
    EXPECT_EQ(AutoReplyScheduler::clamp_delay(600000), AutoReplyScheduler::kMaxDelayMs);

    scheduler_->set_delay_ms(-3);
    EXPECT_EQ(scheduler_->delay_ms(), 1000);
    scheduler_->set_delay_ms(45000);
    EXPECT_EQ(scheduler_->delay_ms(), 30000);
}

TEST_F(AutoReplyTest, DisabledSchedulerIgnoresMessages) {
    EXPECT_CALL(*generator_, generate_reply(_)).Times(0);
    bob_says("anyone?");
    EXPECT_FALSE(scheduler_->pending());
}

TEST_F(AutoReplyTest, EnablingIsAnnounced) {
    scheduler_->set_enabled(true);
    loop_.run_until_idle();
    EXPECT_TRUE(scheduler_->enabled());
    EXPECT_TRUE(bob_store_->find_participant("alice")->auto_reply_enabled);

    // nothing to answer yet
    EXPECT_FALSE(scheduler_->pending());
}

TEST_F(AutoReplyTest, RepliesAfterDelayWithContext) {
    ReplyContext seen;
    EXPECT_CALL(*generator_, generate_reply(_))
        .WillOnce(Invoke([&](const ReplyContext& context) {
            seen = context;
            return std::string("  nice to meet you, Bob \n");
        }));

    scheduler_->set_enabled(true);
    bob_says("hello Alice");
    EXPECT_TRUE(scheduler_->pending());

    ASSERT_TRUE(loop_.run_until([&]() { return !bob_received_.empty(); }, 3000));
    loop_.run_until_idle();

    EXPECT_EQ(seen.my_peer_id, "alice");
    EXPECT_EQ(seen.character.name, "Alice");
    EXPECT_EQ(seen.participant_names, (std::vector<std::string>{"Bob"}));
    ASSERT_EQ(seen.recent_messages.size(), 1u);
    EXPECT_EQ(seen.recent_messages[0].content, "hello Alice");

    ASSERT_EQ(bob_received_.size(), 1u);
    EXPECT_EQ(bob_received_[0].content, "nice to meet you, Bob");
    EXPECT_FALSE(bob_received_[0].is_human);
    EXPECT_EQ(bob_received_[0].character_name, "Alice");
    EXPECT_EQ(bob_saw_thinking_, (std::vector<bool>{true, false}));
    EXPECT_FALSE(bob_store_->is_thinking("alice"));
}

TEST_F(AutoReplyTest, EnablingAnswersPendingForeignMessage) {
    bool called = false;
    EXPECT_CALL(*generator_, generate_reply(_))
        .WillOnce(Invoke([&](const ReplyContext&) {
            called = true;
            return std::string("sorry, I was away");
        }));

    bob_says("are you there?");
    EXPECT_FALSE(scheduler_->pending());
    scheduler_->set_enabled(true);
    EXPECT_TRUE(scheduler_->pending());

    EXPECT_TRUE(loop_.run_until([&]() { return called; }, 3000));
}

TEST_F(AutoReplyTest, ContextHoldsRecentMessagesOnly) {
    size_t context_size = 0;
    std::string newest;
    EXPECT_CALL(*generator_, generate_reply(_))
        .WillOnce(Invoke([&](const ReplyContext& context) {
            context_size = context.recent_messages.size();
            newest = context.recent_messages.back().content;
            return std::string();
        }));

    for (int i = 0; i < 25; ++i) {
        bob_says("message " + std::to_string(i));
    }
    scheduler_->set_enabled(true);

    EXPECT_TRUE(loop_.run_until([&]() { return context_size > 0; }, 3000));
    EXPECT_EQ(context_size, AutoReplyScheduler::kContextMessages);
    EXPECT_EQ(newest, "message 24");
}

TEST_F(AutoReplyTest, GenerationErrorSendsNothing) {
    bool called = false;
    EXPECT_CALL(*generator_, generate_reply(_))
        .WillOnce(Invoke([&](const ReplyContext&) -> std::string {
            called = true;
            throw GenerationError("quota exceeded");
        }));

    scheduler_->set_enabled(true);
    bob_says("tell me a story");
    ASSERT_TRUE(loop_.run_until([&]() { return called; }, 3000));
    loop_.run_until_idle();

    EXPECT_TRUE(bob_received_.empty());
    EXPECT_FALSE(scheduler_->generating());
    EXPECT_FALSE(alice_store_->is_thinking("alice"));
    EXPECT_FALSE(bob_store_->is_thinking("alice"));
    EXPECT_EQ(alice_store_->chat_messages().size(), 1u);
}

TEST_F(AutoReplyTest, BlankReplySendsNothing) {
    bool called = false;
    EXPECT_CALL(*generator_, generate_reply(_))
        .WillOnce(Invoke([&](const ReplyContext&) {
            called = true;
            return std::string(" \n\t ");
        }));

    scheduler_->set_enabled(true);
    bob_says("hm");
    ASSERT_TRUE(loop_.run_until([&]() { return called; }, 3000));
    loop_.run_until_idle();
    EXPECT_TRUE(bob_received_.empty());
}

TEST_F(AutoReplyTest, OtherPeerThinkingCancelsPendingReply) {
    EXPECT_CALL(*generator_, generate_reply(_)).Times(0);

    scheduler_->set_enabled(true);
    bob_says("who wants to answer?");
    ASSERT_TRUE(scheduler_->pending());

    bob_->send_thinking(true);
    loop_.run_until_idle();
    EXPECT_FALSE(scheduler_->pending());
    loop_.run_for(1200);
}

TEST_F(AutoReplyTest, DisablingCancelsPendingReply) {
    EXPECT_CALL(*generator_, generate_reply(_)).Times(0);

    scheduler_->set_enabled(true);
    bob_says("ping");
    ASSERT_TRUE(scheduler_->pending());
    scheduler_->set_enabled(false);
    EXPECT_FALSE(scheduler_->pending());
    loop_.run_until_idle();
    EXPECT_FALSE(bob_store_->find_participant("alice")->auto_reply_enabled);
}
