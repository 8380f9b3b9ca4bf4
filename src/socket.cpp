#include "socket.h"
#include "logger.h"
#include <chrono>
#include <cstring>
#include <csignal>
#include <fcntl.h>
#include <errno.h>
#include <netdb.h>
#include <poll.h>

// Socket module logging macros
#define LOG_SOCKET_DEBUG(message) LOG_DEBUG("socket", message)
#define LOG_SOCKET_INFO(message)  LOG_INFO("socket", message)
#define LOG_SOCKET_WARN(message)  LOG_WARN("socket", message)
#define LOG_SOCKET_ERROR(message) LOG_ERROR("socket", message)

namespace netlaunch {

bool init_socket_library() {
    std::signal(SIGPIPE, SIG_IGN);
    LOG_SOCKET_DEBUG("Socket library initialized");
    return true;
}

void cleanup_socket_library() {
    LOG_SOCKET_DEBUG("Socket library cleaned up");
}

socket_t create_tcp_client(const std::string& host, int port, int timeout_ms) {
    if (port <= 0 || port > 65535) {
        LOG_SOCKET_ERROR("Invalid port number: " << port << " (must be 1-65535)");
        return INVALID_SOCKET_VALUE;
    }

    if (host.empty()) {
        LOG_SOCKET_ERROR("Cannot connect: empty host");
        return INVALID_SOCKET_VALUE;
    }

    // Strip brackets from IPv6 literals such as "[fe80::1]"
    std::string bare_host = host;
    if (bare_host.size() > 2 && bare_host.front() == '[' && bare_host.back() == ']') {
        bare_host = bare_host.substr(1, bare_host.size() - 2);
    }

    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* result = nullptr;
    std::string port_str = std::to_string(port);
    int status = getaddrinfo(bare_host.c_str(), port_str.c_str(), &hints, &result);
    if (status != 0) {
        LOG_SOCKET_DEBUG("Failed to resolve " << bare_host << ": " << gai_strerror(status));
        return INVALID_SOCKET_VALUE;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    socket_t connected = INVALID_SOCKET_VALUE;

    for (struct addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            break;
        }

        // CLOEXEC so discovery subprocesses never inherit an open probe connection
        socket_t sock = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (sock == INVALID_SOCKET_VALUE) {
            continue;
        }

        if (!set_socket_nonblocking(sock)) {
            close_socket(sock);
            continue;
        }

        if (connect_with_timeout(sock, ai->ai_addr, ai->ai_addrlen, static_cast<int>(remaining))) {
            connected = sock;
            break;
        }

        close_socket(sock);
    }

    freeaddrinfo(result);

    if (connected == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_DEBUG("Connection to " << bare_host << ":" << port << " failed");
    }
    return connected;
}

bool connect_with_timeout(socket_t socket, const struct sockaddr* addr, socklen_t addr_len, int timeout_ms) {
    int rc = connect(socket, addr, addr_len);
    if (rc == 0) {
        return true;
    }
    if (errno != EINPROGRESS) {
        return false;
    }

    struct pollfd pfd;
    pfd.fd = socket;
    pfd.events = POLLOUT;
    pfd.revents = 0;

    do {
        rc = poll(&pfd, 1, timeout_ms);
    } while (rc < 0 && errno == EINTR);

    if (rc <= 0) {
        // 0 is a timeout, negative is a poll failure
        return false;
    }

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (getsockopt(socket, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0) {
        return false;
    }
    return so_error == 0;
}

socket_t create_tcp_server_v4(int port, int backlog) {
    if (port < 0 || port > 65535) {
        LOG_SOCKET_ERROR("Invalid port number: " << port << " (must be 0-65535)");
        return INVALID_SOCKET_VALUE;
    }

    socket_t server_socket = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_ERROR("Failed to create server socket");
        return INVALID_SOCKET_VALUE;
    }

    int opt = 1;
    if (setsockopt(server_socket, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_WARN("Failed to set SO_REUSEADDR");
    }

    sockaddr_in server_addr;
    memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin_family = AF_INET;
    server_addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    server_addr.sin_port = htons(static_cast<uint16_t>(port));

    if (bind(server_socket, reinterpret_cast<struct sockaddr*>(&server_addr), sizeof(server_addr)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to bind server socket to port " << port);
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    if (listen(server_socket, backlog) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to listen on server socket");
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_DEBUG("Server listening on 127.0.0.1:" << get_bound_port(server_socket));
    return server_socket;
}

socket_t accept_client(socket_t server_socket) {
    sockaddr_storage client_addr;
    socklen_t client_len = sizeof(client_addr);
    socket_t client_socket = accept4(server_socket, reinterpret_cast<struct sockaddr*>(&client_addr),
                                     &client_len, SOCK_CLOEXEC);
    if (client_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_DEBUG("accept4() failed: " << strerror(errno));
    }
    return client_socket;
}

void close_socket(socket_t socket) {
    if (is_valid_socket(socket)) {
        close(socket);
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

int get_bound_port(socket_t socket) {
    sockaddr_storage addr;
    socklen_t len = sizeof(addr);
    if (getsockname(socket, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) {
        return 0;
    }
    if (addr.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
    }
    return 0;
}

} // namespace netlaunch
