#pragma once

#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "transport_pool.hpp"

enum class TunnelState {
    IDLE,
    LISTENING,
    RELAYING,     // LISTENING with at least one live relay pair
    STOPPED,
};

const char* tunnel_state_name(TunnelState state);

// One forwarding rule: localhost:local_port → remote_host:remote_port as seen
// from the SSH host.
struct TunnelSpec {
    int local_port = 0;           // 0 = pick an ephemeral port
    std::string remote_host;
    int remote_port = 0;

    std::string key() const;
};

// Local listener + one direct-tcpip channel per accepted connection, relayed
// by two threads (one per direction). Every relay thread is owned by the
// binding, so stop() can close and join all of them.
class TunnelBinding {
public:
    // max_connections == 0 means unlimited concurrent relay pairs.
    TunnelBinding(TransportPool& pool, HostIdentity host, TunnelSpec spec,
                  int max_connections = 0);
    ~TunnelBinding();

    TunnelBinding(const TunnelBinding&) = delete;
    TunnelBinding& operator=(const TunnelBinding&) = delete;

    // Acquire the pooled session, bind the listener, start accepting.
    // A connect failure here leaves the binding STOPPED.
    Result<void> start();

    // Stop accepting, close every relay pair, join all threads. Idempotent.
    void stop();

    TunnelState state() const;
    const TunnelSpec& spec() const { return spec_; }
    const HostIdentity& host() const { return host_; }

    // Port actually bound (resolves local_port 0), or -1 before start().
    int local_port() const { return bound_port_; }

    size_t active_connections() const;
    size_t accepted_connections() const { return accepted_; }

private:
    struct RelayPair;
    struct Connection;

    void accept_loop();
    void accept_connections();
    void open_relay(socket_t client, const std::string& src_host, int src_port);
    void reap_finished();

    TransportPool& pool_;
    HostIdentity host_;
    TunnelSpec spec_;
    int max_connections_;
    std::string label_;

    std::shared_ptr<PooledSession> session_;
    socket_t listen_fd_ = SSHFLEET_INVALID_SOCKET;
    std::atomic<int> bound_port_{-1};
    std::atomic<TunnelState> state_{TunnelState::IDLE};
    std::atomic<bool> stop_{false};
    std::atomic<size_t> accepted_{0};
    std::thread accept_thread_;

    mutable std::mutex conns_mutex_;
    std::list<std::unique_ptr<Connection>> conns_;
};
