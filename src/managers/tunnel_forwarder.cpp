#include "tunnel_forwarder.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <system_error>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <poll.h>

const char* tunnel_state_name(TunnelState state) {
    switch (state) {
        case TunnelState::IDLE:      return "idle";
        case TunnelState::LISTENING: return "listening";
        case TunnelState::RELAYING:  return "relaying";
        case TunnelState::STOPPED:   return "stopped";
    }
    return "unknown";
}

std::string TunnelSpec::key() const {
    return fmt::format("{}:{}:{}", local_port, remote_host, remote_port);
}

// ── Relay pair ────────────────────────────────────────────

// Local socket + remote channel of one forwarded connection. Either relay
// direction may close both ends; closing twice is a no-op.
struct TunnelBinding::RelayPair {
    socket_t client_fd;
    std::unique_ptr<ByteChannel> channel;
    std::string label;
    std::atomic<bool> closed{false};
    std::atomic<int> running{2};

    RelayPair(socket_t fd, std::unique_ptr<ByteChannel> ch, std::string lbl)
        : client_fd(fd), channel(std::move(ch)), label(std::move(lbl)) {}

    ~RelayPair() {
        close_both();
        platform::close_socket(client_fd);
    }

    void close_both() {
        if (closed.exchange(true)) return;
        // Wakes the thread blocked in recv(); the fd itself is closed in the destructor
        platform::shutdown_socket(client_fd);
        try {
            channel->close();
        } catch (const std::exception& e) {
            log_debug(fmt::format("{}: channel close: {}", label, e.what()));
        }
    }
};

struct TunnelBinding::Connection {
    std::shared_ptr<RelayPair> pair;
    std::thread upstream;     // local → remote
    std::thread downstream;   // remote → local

    bool finished() const { return pair->running.load() == 0; }

    void join() {
        if (upstream.joinable()) upstream.join();
        if (downstream.joinable()) downstream.join();
    }
};

namespace {

template <typename Pair>
void relay_upstream(std::shared_ptr<Pair> pair) {
    char buf[TUNNEL_RELAY_BUF_SIZE];
    try {
        for (;;) {
            ssize_t n = recv(pair->client_fd, buf, sizeof(buf), 0);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) break;  // client closed
            pair->channel->write_all(buf, static_cast<size_t>(n));
        }
    } catch (const std::exception& e) {
        if (!pair->closed) {
            log_warn(fmt::format("{}: forward error (local -> remote): {}", pair->label, e.what()));
        }
    }
    pair->close_both();
    pair->running--;
}

template <typename Pair>
void relay_downstream(std::shared_ptr<Pair> pair) {
    char buf[TUNNEL_RELAY_BUF_SIZE];
    try {
        for (;;) {
            size_t n = pair->channel->read(buf, sizeof(buf));
            if (n == 0) break;  // remote closed
            if (!platform::send_all(pair->client_fd, buf, n)) break;
        }
    } catch (const std::exception& e) {
        if (!pair->closed) {
            log_warn(fmt::format("{}: forward error (remote -> local): {}", pair->label, e.what()));
        }
    }
    pair->close_both();
    pair->running--;
}

} // namespace

// ── TunnelBinding ─────────────────────────────────────────

TunnelBinding::TunnelBinding(TransportPool& pool, HostIdentity host, TunnelSpec spec,
                             int max_connections)
    : pool_(pool), host_(std::move(host)), spec_(std::move(spec)),
      max_connections_(max_connections) {
    label_ = fmt::format("tunnel {} via {}", spec_.key(), host_.key());
}

TunnelBinding::~TunnelBinding() {
    stop();
}

Result<void> TunnelBinding::start() {
    TunnelState expected = TunnelState::IDLE;
    if (!state_.compare_exchange_strong(expected, TunnelState::LISTENING)) {
        return Result<void>::Err(fmt::format("{} already started", label_));
    }

    try {
        session_ = pool_.acquire(host_);
    } catch (const std::exception& e) {
        state_ = TunnelState::STOPPED;
        log_error(fmt::format("Error in SSH tunnel {}: {}", label_, e.what()));
        return Result<void>::Err(e.what());
    }

    std::string err;
    listen_fd_ = platform::listen_loopback(spec_.local_port, TUNNEL_LISTEN_BACKLOG, err);
    if (listen_fd_ == SSHFLEET_INVALID_SOCKET) {
        state_ = TunnelState::STOPPED;
        session_.reset();
        log_error(fmt::format("Error in SSH tunnel {}: {}", label_, err));
        return Result<void>::Err(fmt::format("Cannot listen on localhost:{}: {}",
                                             spec_.local_port, err));
    }
    bound_port_ = platform::local_port(listen_fd_);

    accept_thread_ = std::thread(&TunnelBinding::accept_loop, this);
    log_info(fmt::format("SSH tunnel active: localhost:{} -> {}:{} via {}",
                         bound_port_.load(), spec_.remote_host, spec_.remote_port,
                         host_.hostname()));
    return Result<void>::Ok();
}

void TunnelBinding::accept_loop() {
    try {
        accept_connections();
    } catch (const std::exception& e) {
        log_error(fmt::format("{}: accept loop failed: {}", label_, e.what()));
    } catch (...) {
        log_error(fmt::format("{}: accept loop failed: unknown error", label_));
    }

    platform::close_socket(listen_fd_);
    listen_fd_ = SSHFLEET_INVALID_SOCKET;
    state_ = TunnelState::STOPPED;
}

void TunnelBinding::accept_connections() {
    while (!stop_) {
        struct pollfd pfd{};
        pfd.fd = listen_fd_;
        pfd.events = POLLIN;
        int rc = poll(&pfd, 1, ACCEPT_POLL_MS);

        reap_finished();

        if (rc < 0) {
            if (errno == EINTR) continue;
            log_error(fmt::format("{}: poll failed: {}", label_, strerror(errno)));
            break;
        }
        if (rc == 0) continue;
        if (pfd.revents & (POLLERR | POLLNVAL)) {
            log_error(fmt::format("{}: listener failed", label_));
            break;
        }

        struct sockaddr_in addr{};
        socklen_t len = sizeof(addr);
        socket_t client = accept(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), &len);
        if (client == SSHFLEET_INVALID_SOCKET) {
            if (errno == EINTR || errno == ECONNABORTED) continue;
            // e.g. EMFILE: the pending client stays queued, so back off one slice
            log_warn(fmt::format("{}: accept failed: {}", label_, strerror(errno)));
            std::this_thread::sleep_for(std::chrono::milliseconds(ACCEPT_POLL_MS));
            continue;
        }
        if (stop_) {
            platform::close_socket(client);
            break;
        }

        if (max_connections_ > 0 &&
            active_connections() >= static_cast<size_t>(max_connections_)) {
            log_warn(fmt::format("{}: connection limit {} reached, refusing client",
                                 label_, max_connections_));
            platform::close_socket(client);
            continue;
        }

        char ip[INET_ADDRSTRLEN] = "127.0.0.1";
        inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
        open_relay(client, ip, ntohs(addr.sin_port));

        // A dead transport cannot carry new channels; the binding is done
        if (!session_->is_active()) {
            log_error(fmt::format("{}: SSH transport lost, tunnel stopped", label_));
            break;
        }
    }
}

void TunnelBinding::open_relay(socket_t client, const std::string& src_host, int src_port) {
    std::unique_ptr<ByteChannel> channel;
    try {
        channel = session_->transport().open_direct_channel(
            spec_.remote_host, spec_.remote_port, src_host, src_port);
    } catch (const std::exception& e) {
        log_error(fmt::format("{}: cannot open channel to {}:{}: {}",
                              label_, spec_.remote_host, spec_.remote_port, e.what()));
        platform::close_socket(client);
        return;
    }

    auto conn = std::make_unique<Connection>();
    conn->pair = std::make_shared<RelayPair>(client, std::move(channel), label_);
    try {
        conn->upstream = std::thread(relay_upstream<RelayPair>, conn->pair);
        conn->downstream = std::thread(relay_downstream<RelayPair>, conn->pair);
    } catch (const std::system_error& e) {
        // Only this connection is lost; the pair's destructor closes the client
        log_error(fmt::format("{}: cannot start relay for {}:{}: {}",
                              label_, src_host, src_port, e.what()));
        conn->pair->close_both();
        conn->join();
        return;
    }

    accepted_++;
    log_debug(fmt::format("{}: relaying {}:{}", label_, src_host, src_port));

    std::lock_guard<std::mutex> lock(conns_mutex_);
    conns_.push_back(std::move(conn));
}

void TunnelBinding::reap_finished() {
    std::list<std::unique_ptr<Connection>> done;
    {
        std::lock_guard<std::mutex> lock(conns_mutex_);
        for (auto it = conns_.begin(); it != conns_.end();) {
            if ((*it)->finished()) {
                done.push_back(std::move(*it));
                it = conns_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& conn : done) conn->join();
}

void TunnelBinding::stop() {
    stop_ = true;
    if (accept_thread_.joinable()) accept_thread_.join();

    // The accept thread was the only producer; the list is ours now
    std::list<std::unique_ptr<Connection>> remaining;
    {
        std::lock_guard<std::mutex> lock(conns_mutex_);
        remaining.swap(conns_);
    }
    for (auto& conn : remaining) conn->pair->close_both();
    for (auto& conn : remaining) conn->join();

    state_ = TunnelState::STOPPED;
    if (session_ && !remaining.empty()) {
        log_info(fmt::format("{}: closed {} relay(s)", label_, remaining.size()));
    }
    session_.reset();
}

TunnelState TunnelBinding::state() const {
    TunnelState s = state_;
    if (s == TunnelState::LISTENING && active_connections() > 0) {
        return TunnelState::RELAYING;
    }
    return s;
}

size_t TunnelBinding::active_connections() const {
    std::lock_guard<std::mutex> lock(conns_mutex_);
    size_t n = 0;
    for (const auto& conn : conns_) {
        if (!conn->finished()) n++;
    }
    return n;
}
