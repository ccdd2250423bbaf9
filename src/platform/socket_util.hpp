#pragma once

// Cross-platform socket utilities.

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <winsock2.h>
#  include <ws2tcpip.h>
   using socket_t = SOCKET;
#  define SFTPOOL_INVALID_SOCKET INVALID_SOCKET
   // WSAPoll uses the same constants as POSIX poll
#else
#  include <poll.h>
   using socket_t = int;
#  define SFTPOOL_INVALID_SOCKET (-1)
#endif

#include <cstdint>
#include <string>

namespace platform {

// Initialize networking (WSAStartup on Windows, no-op on Unix).
void init_networking();

// Set a socket to non-blocking / blocking mode.
void set_nonblocking(socket_t sock);
void set_blocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Resolve host:port and connect a TCP socket, waiting at most timeout_ms.
// Returns SFTPOOL_INVALID_SOCKET and fills err on failure.
socket_t connect_tcp(const std::string& host, std::uint16_t port,
                     int timeout_ms, std::string& err);

// Enable TCP keepalive (idle 60s, interval 15s, 4 probes where supported).
void enable_keepalive(socket_t sock);

} // namespace platform
