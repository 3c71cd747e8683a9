#pragma once

// Cross-platform socket utilities.

#include <string>
#include <chrono>
#include <memory>
#include <core/types.hpp>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <winsock2.h>
#  include <ws2tcpip.h>
   using socket_t = SOCKET;
#  define SSHRELAY_INVALID_SOCKET INVALID_SOCKET
   // WSAPoll uses the same constants as POSIX poll
#else
#  include <poll.h>
#  include <netdb.h>
   using socket_t = int;
#  define SSHRELAY_INVALID_SOCKET (-1)
#endif

namespace platform {

// Initialize networking (WSAStartup on Windows, no-op on Unix).
void init_networking();

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc. timeout_ms < 0 waits forever.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Text for the last socket error (errno / WSAGetLastError).
std::string socket_error_string(int err);
int last_socket_error();

// getaddrinfo result, released with freeaddrinfo.
using AddrInfoList = std::shared_ptr<struct addrinfo>;

// Resolve host:port, giving up when the deadline passes. The lookup runs on
// a detached thread, so an abandoned lookup never blocks the caller.
Result<AddrInfoList> resolve_host(const std::string& host, int port,
                                  std::chrono::steady_clock::time_point deadline);

// Resolve host and open a non-blocking TCP connection to host:port.
// Resolution and every resolved address share the deadline; addresses are
// tried in order until one connects. On success the socket is left in non-blocking mode.
Result<socket_t> connect_tcp(const std::string& host, int port,
                             std::chrono::steady_clock::time_point deadline);

} // namespace platform
