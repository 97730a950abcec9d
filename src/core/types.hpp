#pragma once

#include <string>
#include <optional>
#include <variant>
#include <vector>
#include <functional>
#include <map>
#include <chrono>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Raw outcome of one remote command channel
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;
};

// ── Authentication ──────────────────────────────────────────

struct PasswordAuth {
    std::string secret;
};

struct KeyFileAuth {
    std::string path;
    std::string passphrase;
};

using AuthMethod = std::variant<PasswordAuth, KeyFileAuth>;

// ── Host identity ───────────────────────────────────────────
// Immutable description of one remote endpoint. Build through
// make_host_identity() (core/host.hpp) so the auth method is resolved once.

class HostIdentity {
public:
    HostIdentity() = default;
    HostIdentity(std::string hostname, int port, std::string username,
                 AuthMethod auth, int timeout_secs,
                 std::vector<std::string> tags = {});

    const std::string& hostname() const { return hostname_; }
    int port() const { return port_; }
    const std::string& username() const { return username_; }
    const AuthMethod& auth() const { return auth_; }
    int timeout_secs() const { return timeout_secs_; }
    const std::vector<std::string>& tags() const { return tags_; }

    bool uses_key_file() const { return std::holds_alternative<KeyFileAuth>(auth_); }

    // Pool key: user@host:port
    std::string key() const;

private:
    std::string hostname_;
    int port_ = 22;
    std::string username_;
    AuthMethod auth_;
    int timeout_secs_ = 30;
    std::vector<std::string> tags_;
};

// Inventory: host label → identity
using Inventory = std::map<std::string, HostIdentity>;

// ── Task results ────────────────────────────────────────────

constexpr int NO_EXIT_STATUS = -1;

struct TaskResult {
    std::string host_label;
    std::string hostname;
    std::string command;
    std::string stdout_data;
    std::string stderr_data;
    int exit_code = NO_EXIT_STATUS;
    std::chrono::milliseconds elapsed{0};
    std::string error;              // empty unless the command never ran

    bool success() const { return exit_code == 0 && error.empty(); }

    double elapsed_secs() const { return elapsed.count() / 1000.0; }
};

enum class TransferDirection {
    UPLOAD,
    DOWNLOAD,
};

// Called with (bytes_transferred, total_bytes)
using TransferProgress = std::function<void(uint64_t, uint64_t)>;

// Called once per completed dispatcher unit with (result, completed, total)
using ResultCallback = std::function<void(const TaskResult&, size_t, size_t)>;
