#pragma once

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// ── Errors ─────────────────────────────────────────────────
// Thrown inside the transport layer; the executor and the tunnel relays
// catch them at the per-host / per-connection boundary.

// Authentication or network failure while opening a session.
class ConnectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Channel open / read / write failure on an established session.
class ChannelError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// File subsystem or local file I/O failure.
class TransferError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ── Channels ───────────────────────────────────────────────

// One raw byte stream multiplexed over a transport (direct-tcpip).
class ByteChannel {
public:
    virtual ~ByteChannel() = default;

    // Blocks until data arrives. Returns 0 once the peer closed or close()
    // was called. Throws ChannelError on failure.
    virtual size_t read(char* buf, size_t len) = 0;

    // Writes the whole buffer or throws ChannelError.
    virtual void write_all(const char* data, size_t len) = 0;

    // Idempotent; safe to call from another thread while read() blocks.
    virtual void close() = 0;
};

// SFTP-style file subsystem opened on one transport.
class FileSubsystem {
public:
    virtual ~FileSubsystem() = default;

    // Upload; progress is reported as the remote side acknowledges writes.
    virtual void put(const fs::path& local, const std::string& remote,
                     const TransferProgress& progress) = 0;

    // Download; the local file is written once the remote file is fully read.
    virtual void get(const std::string& remote, const fs::path& local) = 0;

    virtual void close() = 0;
};

// ── Transport ──────────────────────────────────────────────

// An authenticated session to one host capable of multiplexing channels.
// Implementations serialize their own channel operations, so one Transport
// can be shared by a command caller and a tunnel at the same time.
class Transport {
public:
    virtual ~Transport() = default;

    virtual bool is_active() const = 0;

    // Run a command on a fresh exec channel; reads stdout and stderr to
    // completion and returns the remote exit status. timeout_secs == 0 waits
    // indefinitely. Throws ChannelError.
    virtual SSHResult exec(const std::string& command, int timeout_secs) = 0;

    // direct-tcpip channel to dest_host:dest_port seen from the remote host.
    virtual std::unique_ptr<ByteChannel> open_direct_channel(
        const std::string& dest_host, int dest_port,
        const std::string& src_host, int src_port) = 0;

    virtual std::unique_ptr<FileSubsystem> open_file_subsystem() = 0;

    // Best effort; never throws.
    virtual void close() = 0;
};

// Opens authenticated transports. Throws ConnectionError.
class TransportConnector {
public:
    virtual ~TransportConnector() = default;

    virtual std::unique_ptr<Transport> connect(const HostIdentity& host) = 0;
};
