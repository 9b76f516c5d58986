#include <gtest/gtest.h>
#include "io_poller.h"
#include "logger.h"
#include "socket.h"

#include <string>

using namespace peerlink;

class SocketTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().set_log_level(LogLevel::ERROR);
    }

    void TearDown() override {
        Logger::getInstance().set_log_level(LogLevel::INFO);
    }
};

TEST_F(SocketTest, ParseHostPort) {
    std::string host;
    int port = 0;
    ASSERT_TRUE(parse_host_port("127.0.0.1:8080", host, port));
    EXPECT_EQ(host, "127.0.0.1");
    EXPECT_EQ(port, 8080);

    ASSERT_TRUE(parse_host_port("example.org:1", host, port));
    EXPECT_EQ(host, "example.org");
    EXPECT_EQ(port, 1);

    EXPECT_FALSE(parse_host_port("127.0.0.1", host, port));
    EXPECT_FALSE(parse_host_port(":8080", host, port));
    EXPECT_FALSE(parse_host_port("host:", host, port));
    EXPECT_FALSE(parse_host_port("host:80a", host, port));
    EXPECT_FALSE(parse_host_port("host:0", host, port));
    EXPECT_FALSE(parse_host_port("host:65536", host, port));
    EXPECT_FALSE(parse_host_port("host:1234567", host, port));
}

TEST_F(SocketTest, ServerPicksEphemeralPort) {
    socket_t server = create_tcp_server_v4(0, 4, "127.0.0.1");
    ASSERT_TRUE(is_valid_socket(server));
    EXPECT_GT(get_ephemeral_port(server), 0);
    close_socket(server);

    EXPECT_FALSE(is_valid_socket(INVALID_SOCKET_VALUE));
}

TEST_F(SocketTest, NonLocalBindAddressFails) {
    EXPECT_FALSE(is_valid_socket(create_tcp_server_v4(0, 4, "203.0.113.1")));
    EXPECT_FALSE(is_valid_socket(create_tcp_server_v4(70000)));
}

TEST_F(SocketTest, NonBlockingConnectCompletes) {
    socket_t server = create_tcp_server_v4(0, 4, "127.0.0.1");
    ASSERT_TRUE(is_valid_socket(server));
    int port = get_ephemeral_port(server);

    socket_t client = start_tcp_connect_v4("127.0.0.1", port);
    ASSERT_TRUE(is_valid_socket(client));

    auto poller = IOPoller::create();
    ASSERT_TRUE(poller->add(client, PollOut));
    PollResult results[4];
    ASSERT_EQ(poller->wait(results, 4, 2000), 1);
    EXPECT_TRUE(results[0].events & PollOut);
    EXPECT_EQ(get_socket_error(client), 0);

    std::string peer_address;
    socket_t accepted = accept_client(server, &peer_address);
    ASSERT_TRUE(is_valid_socket(accepted));
    EXPECT_EQ(peer_address.rfind("127.0.0.1:", 0), 0u);

    poller->remove(client);
    close_socket(accepted);
    close_socket(client);
    close_socket(server);
}
