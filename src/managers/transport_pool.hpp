#pragma once

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <core/types.hpp>
#include <ssh/transport.hpp>

// One pooled, authenticated transport. Owned by the pool; callers borrow it
// for one operation and must not close it.
class PooledSession {
public:
    PooledSession(std::string key, std::unique_ptr<Transport> transport);

    PooledSession(const PooledSession&) = delete;
    PooledSession& operator=(const PooledSession&) = delete;

    const std::string& key() const { return key_; }
    std::chrono::steady_clock::time_point created() const { return created_; }

    bool is_active() const { return transport_->is_active(); }
    Transport& transport() { return *transport_; }

private:
    friend class TransportPool;

    // Best effort; logs and swallows errors.
    void close();

    std::string key_;
    std::unique_ptr<Transport> transport_;
    std::chrono::steady_clock::time_point created_;
};

// Cache of live sessions keyed by user@host:port. At most one live session
// per key: concurrent acquirers of a key that is mid-connect wait for that
// connect instead of opening a second one. Connects for different keys run
// in parallel; the map mutex is never held across network I/O.
class TransportPool {
public:
    explicit TransportPool(TransportConnector& connector);
    ~TransportPool();

    TransportPool(const TransportPool&) = delete;
    TransportPool& operator=(const TransportPool&) = delete;

    // Returns the live session for host, creating it on a miss or after a
    // failed liveness check. Throws ConnectionError; no retries.
    std::shared_ptr<PooledSession> acquire(const HostIdentity& host);

    // Close and forget every session. Never throws.
    void release_all();

    size_t size() const;
    bool contains(const HostIdentity& host) const;

private:
    TransportConnector& connector_;

    mutable std::mutex mutex_;
    std::condition_variable connect_done_;
    std::map<std::string, std::shared_ptr<PooledSession>> sessions_;
    std::set<std::string> connecting_;
};
