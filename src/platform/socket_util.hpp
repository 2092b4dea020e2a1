#pragma once

// Socket utilities shared by direct connections and gateway tunnels.

#include <poll.h>
#include <string>

using socket_t = int;
#define FLEETSH_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Resolve host and open a non-blocking TCP connection to host:port.
// Returns FLEETSH_INVALID_SOCKET and fills error on failure.
socket_t connect_tcp(const std::string& host, int port, int timeout_ms,
                     std::string& error);

// Connected AF_UNIX stream pair. Returns false on failure.
bool make_socket_pair(socket_t& a, socket_t& b);

// Enable TCP keepalive probing on an established connection.
void enable_keepalive(socket_t sock);

} // namespace platform
