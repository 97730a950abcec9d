#include "transport_pool.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

// ── PooledSession ─────────────────────────────────────────

PooledSession::PooledSession(std::string key, std::unique_ptr<Transport> transport)
    : key_(std::move(key)), transport_(std::move(transport)),
      created_(std::chrono::steady_clock::now()) {}

void PooledSession::close() {
    try {
        transport_->close();
    } catch (const std::exception& e) {
        log_warn(fmt::format("pool: error closing {}: {}", key_, e.what()));
    }
}

// ── TransportPool ─────────────────────────────────────────

TransportPool::TransportPool(TransportConnector& connector)
    : connector_(connector) {}

TransportPool::~TransportPool() {
    release_all();
}

std::shared_ptr<PooledSession> TransportPool::acquire(const HostIdentity& host) {
    const std::string key = host.key();

    // Evicted dead session; closed only after the map mutex is released
    std::shared_ptr<PooledSession> stale;

    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        auto it = sessions_.find(key);
        if (it != sessions_.end()) {
            if (it->second->is_active()) {
                std::shared_ptr<PooledSession> live = it->second;
                lock.unlock();
                if (stale) stale->close();
                return live;
            }
            // Dead connection: drop it and reconnect below
            log_info(fmt::format("pool: {} is no longer active, reconnecting", key));
            stale = std::move(it->second);
            sessions_.erase(it);
        }
        if (connecting_.count(key) == 0) break;
        connect_done_.wait(lock);
    }
    connecting_.insert(key);
    lock.unlock();

    // Clears the in-flight marker however the connect ends
    struct ConnectingMark {
        TransportPool& pool;
        const std::string& key;
        ~ConnectingMark() {
            std::lock_guard<std::mutex> guard(pool.mutex_);
            pool.connecting_.erase(key);
            pool.connect_done_.notify_all();
        }
    };

    std::shared_ptr<PooledSession> session;
    {
        ConnectingMark mark{*this, key};
        if (stale) {
            stale->close();
            stale.reset();
        }
        try {
            session = std::make_shared<PooledSession>(key, connector_.connect(host));
        } catch (const std::exception& e) {
            log_error(fmt::format("Error connecting to {}: {}", key, e.what()));
            throw;
        }

        std::lock_guard<std::mutex> guard(mutex_);
        sessions_[key] = session;
    }
    return session;
}

void TransportPool::release_all() {
    std::map<std::string, std::shared_ptr<PooledSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
    }
    for (auto& [key, session] : sessions) {
        session->close();
    }
    if (!sessions.empty()) {
        log_info(fmt::format("pool: closed {} session(s)", sessions.size()));
    }
}

size_t TransportPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

bool TransportPool::contains(const HostIdentity& host) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(host.key()) > 0;
}
