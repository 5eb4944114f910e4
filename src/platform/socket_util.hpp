#pragma once

// Cross-platform socket utilities.

#include <string>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <winsock2.h>
#  include <ws2tcpip.h>
   using socket_t = SOCKET;
#  define SSHEXPECT_INVALID_SOCKET INVALID_SOCKET
   // WSAPoll uses the same constants as POSIX poll
#else
#  include <poll.h>
   using socket_t = int;
#  define SSHEXPECT_INVALID_SOCKET (-1)
#endif

namespace platform {

// Initialize networking (WSAStartup on Windows, no-op on Unix).
void init_networking();

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Resolve `host` (IPv4/IPv6 literal or name) and connect to `port` without
// blocking longer than timeout_ms. The returned socket is non-blocking.
// On failure returns SSHEXPECT_INVALID_SOCKET and sets `error`.
socket_t connect_tcp(const std::string& host, int port, int timeout_ms,
                     std::string& error);

// Turn on TCP keepalive probing (idle/interval/count where supported).
void enable_keepalive(socket_t sock, int idle_secs, int interval_secs, int count);

} // namespace platform
