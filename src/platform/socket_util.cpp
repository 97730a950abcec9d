#include "socket_util.hpp"

#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>

namespace platform {

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

void close_socket(socket_t sock) {
    close(sock);
}

void shutdown_socket(socket_t sock) {
    // ENOTCONN after the peer already went away is expected
    shutdown(sock, SHUT_RDWR);
}

socket_t connect_tcp(const std::string& host, int port, int timeout_ms, std::string& err) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0 || !res) {
        err = fmt::format("Failed to resolve host {}: {}", host, gai_strerror(gai));
        return SSHFLEET_INVALID_SOCKET;
    }

    socket_t sock = SSHFLEET_INVALID_SOCKET;
    err.clear();
    for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) {
            err = fmt::format("Failed to create socket: {}", std::strerror(errno));
            continue;
        }
        set_nonblocking(sock);

        int ret = connect(sock, ai->ai_addr, ai->ai_addrlen);
        if (ret < 0 && errno != EINPROGRESS) {
            err = fmt::format("Failed to connect to {}:{}: {}", host, port, std::strerror(errno));
            close_socket(sock);
            sock = SSHFLEET_INVALID_SOCKET;
            continue;
        }

        // Wait for non-blocking connect to complete
        if (ret < 0) {
            int revents = poll_socket(sock, POLLOUT, timeout_ms);
            if (revents == 0) {
                err = fmt::format("Connection to {}:{} timed out after {}ms", host, port, timeout_ms);
                close_socket(sock);
                sock = SSHFLEET_INVALID_SOCKET;
                continue;
            }
            int sock_err = 0;
            socklen_t err_len = sizeof(sock_err);
            getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
            if (sock_err != 0) {
                err = fmt::format("Connection to {}:{} failed: {}", host, port, std::strerror(sock_err));
                close_socket(sock);
                sock = SSHFLEET_INVALID_SOCKET;
                continue;
            }
        }
        break;
    }
    freeaddrinfo(res);

    if (sock != SSHFLEET_INVALID_SOCKET) {
        int one = 1;
        setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &one, sizeof(one));
        setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    }
    return sock;
}

socket_t listen_loopback(int port, int backlog, std::string& err) {
    socket_t fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        err = fmt::format("socket() failed: {}", std::strerror(errno));
        return SSHFLEET_INVALID_SOCKET;
    }

    int reuse = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        err = fmt::format("bind() failed for port {}: {}", port, std::strerror(errno));
        close_socket(fd);
        return SSHFLEET_INVALID_SOCKET;
    }

    if (listen(fd, backlog) < 0) {
        err = fmt::format("listen() failed for port {}: {}", port, std::strerror(errno));
        close_socket(fd);
        return SSHFLEET_INVALID_SOCKET;
    }
    return fd;
}

int local_port(socket_t sock) {
    struct sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(sock, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) return -1;
    return ntohs(addr.sin_port);
}

bool send_all(socket_t sock, const char* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t w = send(sock, data + sent, len - sent, MSG_NOSIGNAL);
        if (w < 0 && errno == EINTR) continue;
        if (w <= 0) return false;
        sent += static_cast<size_t>(w);
    }
    return true;
}

} // namespace platform
