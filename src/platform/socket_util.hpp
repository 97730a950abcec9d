#pragma once

// Socket utilities (POSIX).

#include <poll.h>
#include <cstddef>
#include <string>

using socket_t = int;
#define SSHFLEET_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Shut down both directions; wakes any thread blocked in recv() on the socket.
void shutdown_socket(socket_t sock);

// TCP connect to host:port, waiting at most timeout_ms. The returned socket
// is left non-blocking. On failure returns SSHFLEET_INVALID_SOCKET and fills err.
socket_t connect_tcp(const std::string& host, int port, int timeout_ms, std::string& err);

// Bind and listen on 127.0.0.1:port (0 = ephemeral).
// Returns SSHFLEET_INVALID_SOCKET and fills err on failure.
socket_t listen_loopback(int port, int backlog, std::string& err);

// Local port a bound socket is using, or -1.
int local_port(socket_t sock);

// Write the whole buffer. Returns false on error or peer close.
bool send_all(socket_t sock, const char* data, size_t len);

} // namespace platform
