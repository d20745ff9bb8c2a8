#pragma once

// Socket helpers for the libssh2 transport.

#include <poll.h>
#include <string>

using socket_t = int;
#define HOSTMUX_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Resolve host:port and start a non-blocking TCP connect to the first
// address that accepts it, waiting at most timeout_ms for completion.
// Returns the connected socket, or HOSTMUX_INVALID_SOCKET with err filled.
socket_t connect_tcp(const std::string& host, int port, int timeout_ms,
                     std::string& err, bool& timed_out);

// Enable TCP keepalive probing on a connected socket.
void enable_tcp_keepalive(socket_t sock);

} // namespace platform
