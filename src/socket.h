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

namespace netlaunch {

// Socket Library Initialization
/**
 * Initialize the socket library (ignores SIGPIPE so writes to closed peers fail with EPIPE)
 * @return true if successful, false otherwise
 */
bool init_socket_library();

/**
 * Cleanup the socket library
 */
void cleanup_socket_library();

// TCP Socket Functions
/**
 * Connect to host:port, trying every address the resolver returns until one
 * connects or the deadline passes
 * @param host The hostname or IP address (IPv4 or IPv6) to connect to
 * @param port The port number to connect to
 * @param timeout_ms Overall connection deadline in milliseconds
 * @return Connected socket handle, or INVALID_SOCKET_VALUE on timeout or error
 */
socket_t create_tcp_client(const std::string& host, int port, int timeout_ms);

/**
 * Create an IPv4 TCP server socket bound to the loopback interface
 * @param port The port number to bind to (0 for an ephemeral port)
 * @param backlog The maximum number of pending connections
 * @return Socket handle, or INVALID_SOCKET_VALUE on error
 */
socket_t create_tcp_server_v4(int port, int backlog = 16);

/**
 * Accept a client connection on a server socket
 * @param server_socket The server socket handle
 * @return Client socket handle, or INVALID_SOCKET_VALUE on error
 */
socket_t accept_client(socket_t server_socket);

/**
 * Connect to a socket address with timeout
 * @param socket The socket handle (must be non-blocking)
 * @param addr The socket address structure
 * @param addr_len Length of the address structure
 * @param timeout_ms Connection timeout in milliseconds
 * @return true if connected successfully, false on timeout or error
 */
bool connect_with_timeout(socket_t socket, const struct sockaddr* addr, socklen_t addr_len, int timeout_ms);

// Common Socket Functions
void close_socket(socket_t socket);

bool is_valid_socket(socket_t socket);

bool set_socket_nonblocking(socket_t socket);

/**
 * Get the local port a socket is bound to
 * @return The bound port, or 0 on error
 */
int get_bound_port(socket_t socket);

} // namespace netlaunch
