#pragma once

// Socket helpers for the libssh2 transport.

#include <poll.h>

using socket_t = int;
#define SHELLCAST_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Pending socket error (SO_ERROR), 0 when the socket is healthy.
int socket_error(socket_t sock);

// TCP keepalive: idle seconds, probe interval, probe count.
void enable_keepalive(socket_t sock, int idle_secs, int interval_secs, int count);

} // namespace platform
