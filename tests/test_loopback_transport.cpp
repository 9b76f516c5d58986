#include <gtest/gtest.h>
#include "event_loop.h"
#include "logger.h"
#include "loopback_transport.h"

#include <memory>
#include <string>
#include <vector>

using namespace peerlink;

class LoopbackTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().set_log_level(LogLevel::ERROR);
        hub_ = std::make_unique<LoopbackHub>(loop_);
        alice_ = hub_->create_transport("alice");
        bob_ = hub_->create_transport("bob");
        ASSERT_NE(alice_, nullptr);
        ASSERT_NE(bob_, nullptr);

        bob_->on_incoming_connection([this](std::shared_ptr<Connection> connection) {
            accepted_ = connection;
            connection->on_text([this](const std::string& text) { bob_texts_.push_back(text); });
            connection->on_binary([this](const std::vector<uint8_t>& data) { bob_binary_ += data.size(); });
            connection->on_close([this]() { bob_closed_ = true; });
        });
    }

    void TearDown() override {
        accepted_.reset();
        alice_.reset();
        bob_.reset();
        hub_.reset();
        Logger::getInstance().set_log_level(LogLevel::INFO);
    }

    EventLoop loop_;
    std::unique_ptr<LoopbackHub> hub_;
    std::shared_ptr<LoopbackTransport> alice_;
    std::shared_ptr<LoopbackTransport> bob_;

    std::shared_ptr<Connection> accepted_;
    std::vector<std::string> bob_texts_;
    size_t bob_binary_ = 0;
    bool bob_closed_ = false;
};

TEST_F(LoopbackTransportTest, DuplicatePeerIdRejected) {
    EXPECT_EQ(hub_->create_transport("alice"), nullptr);
}

TEST_F(LoopbackTransportTest, ConnectOpensBothEnds) {
    bool opened = false;
    auto connection = alice_->connect("bob");
    ASSERT_NE(connection, nullptr);
    EXPECT_FALSE(connection->is_open());
    connection->on_open([&]() { opened = true; });

    loop_.run_until_idle();
    EXPECT_TRUE(opened);
    ASSERT_NE(accepted_, nullptr);
    EXPECT_TRUE(accepted_->is_open());
    EXPECT_EQ(accepted_->peer_id(), "alice");
    EXPECT_EQ(connection->peer_id(), "bob");
    EXPECT_EQ(alice_->open_connection_count(), 1u);
    EXPECT_EQ(bob_->open_connection_count(), 1u);
}

TEST_F(LoopbackTransportTest, DeliversFramesInOrder) {
    auto connection = alice_->connect("bob");
    connection->on_open([&]() {
        connection->send_text("one");
        connection->send_binary(std::vector<uint8_t>(100, 0x7f));
        connection->send_text("two");
    });
    loop_.run_until_idle();

    EXPECT_EQ(bob_texts_, (std::vector<std::string>{"one", "two"}));
    EXPECT_EQ(bob_binary_, 100u);
}

TEST_F(LoopbackTransportTest, SendBeforeOpenFails) {
    auto connection = alice_->connect("bob");
    EXPECT_FALSE(connection->send_text("early"));
    loop_.run_until_idle();
    EXPECT_TRUE(bob_texts_.empty());
}

TEST_F(LoopbackTransportTest, UnknownPeerFails) {
    std::string error;
    auto connection = alice_->connect("carol");
    ASSERT_NE(connection, nullptr);
    connection->on_error([&](const std::string& e) { error = e; });
    loop_.run_until_idle();
    EXPECT_EQ(error, "Could not connect to peer carol");
    EXPECT_FALSE(connection->is_open());
}

TEST_F(LoopbackTransportTest, UnresponsivePeerNeverOpens) {
    hub_->set_unresponsive("bob", true);
    bool opened = false;
    auto connection = alice_->connect("bob");
    connection->on_open([&]() { opened = true; });
    loop_.run_until_idle();
    EXPECT_FALSE(opened);
    EXPECT_EQ(accepted_, nullptr);
}

TEST_F(LoopbackTransportTest, CloseNotifiesRemoteOnly) {
    bool local_closed = false;
    auto connection = alice_->connect("bob");
    connection->on_close([&]() { local_closed = true; });
    loop_.run_until_idle();
    ASSERT_TRUE(connection->is_open());

    connection->close();
    connection->close();
    loop_.run_until_idle();
    EXPECT_TRUE(bob_closed_);
    EXPECT_FALSE(local_closed);
    EXPECT_FALSE(accepted_->is_open());
    EXPECT_FALSE(connection->send_text("late"));
}

TEST_F(LoopbackTransportTest, ShutdownClosesConnections) {
    auto connection = alice_->connect("bob");
    loop_.run_until_idle();
    ASSERT_TRUE(connection->is_open());

    alice_->shutdown();
    loop_.run_until_idle();
    EXPECT_TRUE(bob_closed_);
    EXPECT_EQ(alice_->connect("bob"), nullptr);
}
