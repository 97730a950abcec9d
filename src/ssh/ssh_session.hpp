#pragma once

// Internal to the libssh2 backend: the raw session shared by a transport,
// its channels and its SFTP subsystem. Channels hold a shared_ptr so the
// LIBSSH2_SESSION is freed only after the last channel is gone.

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <libssh2.h>
#include <platform/socket_util.hpp>

using Deadline = std::chrono::steady_clock::time_point;

inline Deadline deadline_after(int timeout_secs) {
    if (timeout_secs <= 0) return Deadline::max();
    return std::chrono::steady_clock::now() + std::chrono::seconds(timeout_secs);
}

inline bool past(Deadline deadline) {
    return deadline != Deadline::max() && std::chrono::steady_clock::now() >= deadline;
}

struct SshSession {
    LIBSSH2_SESSION* session = nullptr;
    socket_t sock = SSHFLEET_INVALID_SOCKET;
    std::atomic<bool> active{false};
    std::string target;             // user@host:port, for logs

    // libssh2 is not thread-safe per session: every call goes through this.
    std::mutex io_mutex;

    SshSession() = default;
    ~SshSession();

    SshSession(const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    // Sleep until the socket is ready in the direction libssh2 is blocked on,
    // or timeout_ms elapses. Must be called without io_mutex held.
    void wait_socket(int timeout_ms);

    // Send disconnect and mark inactive. The session object stays allocated
    // until destruction so live channels can still be freed.
    void disconnect(const char* reason);

    // Last libssh2 error message (call with io_mutex held).
    std::string last_error() const;

    // Run op under io_mutex until it stops returning LIBSSH2_ERROR_EAGAIN.
    // Returns LIBSSH2_ERROR_TIMEOUT once the deadline passes.
    template <typename Op>
    int retry(Op op, Deadline deadline, int slice_ms) {
        for (;;) {
            int rc;
            {
                std::lock_guard<std::mutex> lock(io_mutex);
                rc = static_cast<int>(op());
            }
            if (rc != LIBSSH2_ERROR_EAGAIN) return rc;
            if (past(deadline)) return LIBSSH2_ERROR_TIMEOUT;
            wait_socket(slice_ms);
        }
    }

    // Same for calls that return a pointer and signal EAGAIN via last_errno.
    // Returns nullptr on failure or timeout; err receives the reason.
    template <typename T, typename Op>
    T* retry_ptr(Op op, Deadline deadline, int slice_ms, std::string& err) {
        for (;;) {
            T* p = nullptr;
            bool again = false;
            {
                std::lock_guard<std::mutex> lock(io_mutex);
                p = op();
                if (!p) {
                    again = libssh2_session_last_errno(session) == LIBSSH2_ERROR_EAGAIN;
                    if (!again) err = last_error();
                }
            }
            if (p) return p;
            if (!again) return nullptr;
            if (past(deadline)) {
                err = "timed out";
                return nullptr;
            }
            wait_socket(slice_ms);
        }
    }
};
