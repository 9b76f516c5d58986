#include <gtest/gtest.h>
#include "connect_session.h"
#include "event_loop.h"
#include "logger.h"
#include "loopback_transport.h"

#include <memory>
#include <string>
#include <vector>

using namespace peerlink;

namespace {

class CannedReplyGenerator : public ReplyGenerator {
public:
    std::string generate_reply(const ReplyContext& context) override {
        calls++;
        return "Hi from " + context.character.name;
    }

    int calls = 0;
};

} // namespace

class ConnectSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().set_log_level(LogLevel::ERROR);
        hub_ = std::make_unique<LoopbackHub>(loop_);
        directory_ = std::make_unique<LocalSessionDirectory>();
        config_.max_participants = 3;
        config_.auto_reply_delay_ms = 1000;
    }

    void TearDown() override {
        sessions_.clear();
        directory_.reset();
        hub_.reset();
        Logger::getInstance().set_log_level(LogLevel::INFO);
    }

    std::shared_ptr<ConnectSession> make_session(const std::string& peer_id) {
        auto transport = hub_->create_transport(peer_id);
        auto session = std::make_shared<ConnectSession>(loop_, transport, *directory_, config_);
        sessions_.push_back(session);
        return session;
    }

    std::shared_ptr<ConnectSession> hosted(HostOptions options = HostOptions()) {
        auto host = make_session("host");
        auto created = host->host(CharacterInfo{"Hana", std::nullopt}, options);
        EXPECT_TRUE(created.has_value());
        slug_ = created ? created->slug : "";
        return host;
    }

    EventLoop loop_;
    PeerlinkConfig config_;
    std::unique_ptr<LoopbackHub> hub_;
    std::unique_ptr<LocalSessionDirectory> directory_;
    std::vector<std::shared_ptr<ConnectSession>> sessions_;
    std::string slug_;
};

TEST_F(ConnectSessionTest, HostRegistersSlug) {
    auto host = hosted();
    EXPECT_TRUE(host->active());
    EXPECT_TRUE(host->is_host());
    EXPECT_EQ(host->slug(), slug_);

    auto roster = directory_->get_session(slug_);
    ASSERT_TRUE(roster.has_value());
    EXPECT_EQ(roster->host_peer_id, "host");
    EXPECT_EQ(roster->max_participants, 3);
}

TEST_F(ConnectSessionTest, GuestJoinsBySlug) {
    auto host = hosted();
    auto guest = make_session("guest");

    std::vector<ChatMessage> host_received;
    host->on_chat_message([&](const ChatMessage& message) { host_received.push_back(message); });

    JoinResult result = guest->join(slug_, CharacterInfo{"Gus", std::nullopt}, std::nullopt);
    ASSERT_TRUE(result.accepted());
    EXPECT_EQ(result.host_peer_id, "host");
    loop_.run_until_idle();

    EXPECT_TRUE(guest->active());
    EXPECT_FALSE(guest->is_host());
    EXPECT_EQ(guest->store().participants_with_status(ParticipantStatus::READY).size(), 2u);
    EXPECT_EQ(host->store().participants_with_status(ParticipantStatus::READY).size(), 2u);

    ASSERT_TRUE(guest->mesh().send_chat_message("hi host", true).has_value());
    loop_.run_until_idle();
    ASSERT_EQ(host_received.size(), 1u);
    EXPECT_EQ(host_received[0].character_name, "Gus");
}

TEST_F(ConnectSessionTest, RejectionsHappenBeforeAnyConnection) {
    HostOptions options;
    options.password = "hunter2";
    options.max_participants = 2;
    auto host = hosted(options);

    auto stranger = make_session("stranger");
    EXPECT_EQ(stranger->join("zzzzzz", CharacterInfo{"S", std::nullopt}, std::nullopt).rejection,
              JoinRejection::NOT_FOUND);
    EXPECT_EQ(stranger->join(slug_, CharacterInfo{"S", std::nullopt}, std::string("guess")).rejection,
              JoinRejection::BAD_PASSWORD);
    loop_.run_until_idle();
    EXPECT_FALSE(stranger->active());
    EXPECT_EQ(stranger->store().connection_count(), 0u);
    EXPECT_EQ(host->store().connection_count(), 0u);

    auto guest = make_session("guest");
    ASSERT_TRUE(guest->join(slug_, CharacterInfo{"Gus", std::nullopt}, std::string("hunter2")).accepted());
    loop_.run_until_idle();

    EXPECT_EQ(stranger->join(slug_, CharacterInfo{"S", std::nullopt}, std::string("hunter2")).rejection,
              JoinRejection::FULL);
    loop_.run_until_idle();
    EXPECT_EQ(host->store().connection_count(), 1u);
}

TEST_F(ConnectSessionTest, JoinWhileActiveIsRefused) {
    auto host = hosted();
    auto guest = make_session("guest");
    ASSERT_TRUE(guest->join(slug_, CharacterInfo{"Gus", std::nullopt}, std::nullopt).accepted());
    loop_.run_until_idle();

    JoinResult again = guest->join(slug_, CharacterInfo{"Gus", std::nullopt}, std::nullopt);
    EXPECT_EQ(again.rejection, JoinRejection::ALREADY_JOINED);
    EXPECT_STREQ(join_rejection_to_string(again.rejection), "already-joined");
    EXPECT_TRUE(guest->active());
    EXPECT_EQ(guest->slug(), slug_);

    EXPECT_EQ(host->join(slug_, CharacterInfo{"Hana", std::nullopt}, std::nullopt).rejection,
              JoinRejection::ALREADY_JOINED);
    EXPECT_TRUE(host->is_host());
}

TEST_F(ConnectSessionTest, JoinHostDialsDirectly) {
    auto host = hosted();
    auto guest = make_session("guest");
    ASSERT_TRUE(guest->join_host("host", CharacterInfo{"Gus", std::nullopt}));
    loop_.run_until_idle();
    EXPECT_EQ(host->store().participants_with_status(ParticipantStatus::READY).size(), 2u);
    EXPECT_FALSE(guest->join_host("host", CharacterInfo{"Gus", std::nullopt}));
}

TEST_F(ConnectSessionTest, HostLeaveDestroysSlug) {
    auto host = hosted();
    auto guest = make_session("guest");
    std::vector<MeshState> guest_states;
    guest->on_state_change([&](MeshState state) { guest_states.push_back(state); });
    ASSERT_TRUE(guest->join(slug_, CharacterInfo{"Gus", std::nullopt}, std::nullopt).accepted());
    loop_.run_until_idle();

    host->leave();
    loop_.run_until_idle();

    EXPECT_FALSE(host->active());
    EXPECT_TRUE(host->slug().empty());
    EXPECT_FALSE(directory_->get_session(slug_).has_value());
    ASSERT_FALSE(guest_states.empty());
    EXPECT_EQ(guest_states.back(), MeshState::HOST_LEFT);
}

TEST_F(ConnectSessionTest, AutoReplyNeedsGenerator) {
    auto host = hosted();
    EXPECT_FALSE(host->set_auto_reply(true));
    EXPECT_EQ(host->auto_reply(), nullptr);
}

TEST_F(ConnectSessionTest, AutoReplyAnswersGuest) {
    auto host = hosted();
    auto generator = std::make_shared<CannedReplyGenerator>();
    host->set_reply_generator(generator);
    ASSERT_TRUE(host->set_auto_reply(true));
    ASSERT_NE(host->auto_reply(), nullptr);
    EXPECT_TRUE(host->auto_reply()->enabled());

    auto guest = make_session("guest");
    std::vector<ChatMessage> guest_received;
    guest->on_chat_message([&](const ChatMessage& message) { guest_received.push_back(message); });
    ASSERT_TRUE(guest->join(slug_, CharacterInfo{"Gus", std::nullopt}, std::nullopt).accepted());
    loop_.run_until_idle();

    ASSERT_TRUE(guest->mesh().send_chat_message("hello?", true).has_value());
    ASSERT_TRUE(loop_.run_until([&]() { return !guest_received.empty(); }, 3000));
    EXPECT_EQ(guest_received[0].content, "Hi from Hana");
    EXPECT_FALSE(guest_received[0].is_human);
    EXPECT_EQ(generator->calls, 1);
}
