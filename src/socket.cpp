#include "socket.h"
#include "logger.h"
#include <cstring>
#include <cstdlib>
#include <fcntl.h>
#include <errno.h>
#include <netdb.h>
#include <netinet/tcp.h>

// Socket module logging macros
#define LOG_SOCKET_DEBUG(message) LOG_DEBUG("socket", message)
#define LOG_SOCKET_INFO(message)  LOG_INFO("socket", message)
#define LOG_SOCKET_WARN(message)  LOG_WARN("socket", message)
#define LOG_SOCKET_ERROR(message) LOG_ERROR("socket", message)

namespace peerlink {

namespace {

bool resolve_ipv4(const std::string& host, in_addr& out) {
    if (inet_pton(AF_INET, host.c_str(), &out) == 1) {
        return true;
    }

    addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &result);
    if (rc != 0 || result == nullptr) {
        LOG_SOCKET_ERROR("Failed to resolve hostname " << host << ": " << gai_strerror(rc));
        return false;
    }
    out = reinterpret_cast<sockaddr_in*>(result->ai_addr)->sin_addr;
    freeaddrinfo(result);
    return true;
}

std::string format_address(const sockaddr_in& addr) {
    char ip_str[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &addr.sin_addr, ip_str, INET_ADDRSTRLEN);
    return std::string(ip_str) + ":" + std::to_string(ntohs(addr.sin_port));
}

} // namespace

socket_t create_tcp_server_v4(int port, int backlog, const std::string& bind_host) {
    LOG_SOCKET_DEBUG("Creating TCP server socket on port " << port);

    if (port < 0 || port > 65535) {
        LOG_SOCKET_ERROR("Invalid port number: " << port << " (must be 0-65535)");
        return INVALID_SOCKET_VALUE;
    }

    socket_t server_socket = socket(AF_INET, SOCK_STREAM, 0);
    if (server_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_ERROR("Failed to create server socket: " << strerror(errno));
        return INVALID_SOCKET_VALUE;
    }

    int opt = 1;
    if (setsockopt(server_socket, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to set socket options");
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    sockaddr_in server_addr;
    memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin_family = AF_INET;
    server_addr.sin_port = htons(static_cast<uint16_t>(port));
    if (bind_host.empty()) {
        server_addr.sin_addr.s_addr = INADDR_ANY;
    } else if (!resolve_ipv4(bind_host, server_addr.sin_addr)) {
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    if (bind(server_socket, reinterpret_cast<sockaddr*>(&server_addr), sizeof(server_addr)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to bind server socket to port " << port << ": " << strerror(errno));
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    if (listen(server_socket, backlog) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to listen on server socket: " << strerror(errno));
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_INFO("Server listening on port " << get_ephemeral_port(server_socket)
                    << " (backlog: " << backlog << ")");
    return server_socket;
}

socket_t accept_client(socket_t server_socket, std::string* peer_address) {
    sockaddr_in client_addr;
    socklen_t client_addr_len = sizeof(client_addr);

    socket_t client_socket = accept(server_socket, reinterpret_cast<sockaddr*>(&client_addr), &client_addr_len);
    if (client_socket == INVALID_SOCKET_VALUE) {
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_SOCKET_ERROR("Failed to accept client connection: " << strerror(errno));
        }
        return INVALID_SOCKET_VALUE;
    }

    std::string address = format_address(client_addr);
    LOG_SOCKET_INFO("Client connected from " << address);
    if (peer_address) {
        *peer_address = address;
    }
    return client_socket;
}

socket_t start_tcp_connect_v4(const std::string& host, int port) {
    LOG_SOCKET_DEBUG("Connecting to " << host << ":" << port);

    if (port <= 0 || port > 65535) {
        LOG_SOCKET_ERROR("Invalid port number: " << port);
        return INVALID_SOCKET_VALUE;
    }

    sockaddr_in server_addr;
    memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin_family = AF_INET;
    server_addr.sin_port = htons(static_cast<uint16_t>(port));
    if (!resolve_ipv4(host, server_addr.sin_addr)) {
        return INVALID_SOCKET_VALUE;
    }

    socket_t client_socket = socket(AF_INET, SOCK_STREAM, 0);
    if (client_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_ERROR("Failed to create client socket: " << strerror(errno));
        return INVALID_SOCKET_VALUE;
    }

    if (!set_socket_nonblocking(client_socket)) {
        close_socket(client_socket);
        return INVALID_SOCKET_VALUE;
    }

    int nodelay = 1;
    setsockopt(client_socket, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));

    int rc = connect(client_socket, reinterpret_cast<sockaddr*>(&server_addr), sizeof(server_addr));
    if (rc == SOCKET_ERROR_VALUE && errno != EINPROGRESS) {
        LOG_SOCKET_ERROR("Connection to " << host << ":" << port << " failed: " << strerror(errno));
        close_socket(client_socket);
        return INVALID_SOCKET_VALUE;
    }

    return client_socket;
}

int get_socket_error(socket_t socket) {
    int error = 0;
    socklen_t len = sizeof(error);
    if (getsockopt(socket, SOL_SOCKET, SO_ERROR, &error, &len) == SOCKET_ERROR_VALUE) {
        return errno;
    }
    return error;
}

void close_socket(socket_t socket) {
    if (is_valid_socket(socket)) {
        LOG_SOCKET_DEBUG("Closing socket " << socket);
        ::close(socket);
    }
}

bool is_valid_socket(socket_t socket) {
    return socket != INVALID_SOCKET_VALUE;
}

bool set_socket_nonblocking(socket_t socket) {
    int flags = fcntl(socket, F_GETFL, 0);
    if (flags == -1) {
        LOG_SOCKET_ERROR("Failed to get socket flags");
        return false;
    }

    if (fcntl(socket, F_SETFL, flags | O_NONBLOCK) == -1) {
        LOG_SOCKET_ERROR("Failed to set socket to non-blocking mode");
        return false;
    }
    return true;
}

int get_ephemeral_port(socket_t socket) {
    sockaddr_in addr;
    socklen_t addr_len = sizeof(addr);
    if (getsockname(socket, reinterpret_cast<sockaddr*>(&addr), &addr_len) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to get socket name");
        return -1;
    }
    return ntohs(addr.sin_port);
}

bool parse_host_port(const std::string& address, std::string& host, int& port) {
    size_t colon = address.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= address.size()) {
        return false;
    }
    std::string port_str = address.substr(colon + 1);
    for (char c : port_str) {
        if (c < '0' || c > '9') return false;
    }
    if (port_str.size() > 5) return false;
    int value = std::atoi(port_str.c_str());
    if (value <= 0 || value > 65535) return false;
    host = address.substr(0, colon);
    port = value;
    return true;
}

} // namespace peerlink
