#pragma once

#include <string>
#include <cstdint>

#include <sys/socket.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <unistd.h>

typedef int socket_t;
#define INVALID_SOCKET_VALUE -1
#define SOCKET_ERROR_VALUE -1

namespace peerlink {

/**
 * Create an IPv4 TCP listening socket
 * @param port Port to bind (0 picks an ephemeral port)
 * @param backlog Listen backlog
 * @param bind_host Interface address, empty binds to all interfaces
 * @return Listening socket, or INVALID_SOCKET_VALUE on failure
 */
socket_t create_tcp_server_v4(int port, int backlog = 16, const std::string& bind_host = "");

/**
 * Accept a pending connection on a listening socket
 * @param server_socket Listening socket
 * @param peer_address Receives "ip:port" of the remote side when non-null
 * @return Accepted socket, or INVALID_SOCKET_VALUE
 */
socket_t accept_client(socket_t server_socket, std::string* peer_address = nullptr);

/**
 * Start a non-blocking IPv4 connect
 *
 * The returned socket is already non-blocking; completion is signalled by
 * writability, after which get_socket_error() reports the outcome.
 * @return Socket with the connect in flight, or INVALID_SOCKET_VALUE
 */
socket_t start_tcp_connect_v4(const std::string& host, int port);

// Pending SO_ERROR for the socket (0 when connected)
int get_socket_error(socket_t socket);

void close_socket(socket_t socket);
bool is_valid_socket(socket_t socket);
bool set_socket_nonblocking(socket_t socket);

/**
 * Port the socket is bound to
 * @return Port number, or -1 on failure
 */
int get_ephemeral_port(socket_t socket);

// Split "host:port"; false when the port is missing or out of range
bool parse_host_port(const std::string& address, std::string& host, int& port);

} // namespace peerlink
