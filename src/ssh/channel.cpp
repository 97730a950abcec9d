#include "channel.hpp"
#include "ssh_session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <mutex>

SshDirectChannel::SshDirectChannel(std::shared_ptr<SshSession> session, LIBSSH2_CHANNEL* channel)
    : session_(std::move(session)), channel_(channel) {}

SshDirectChannel::~SshDirectChannel() {
    close();
    session_->retry([&] { return libssh2_channel_free(channel_); },
                    deadline_after(2), CHANNEL_POLL_MS);
}

size_t SshDirectChannel::read(char* buf, size_t len) {
    SshSession& s = *session_;
    for (;;) {
        if (closed_) return 0;

        ssize_t n;
        bool eof;
        {
            std::lock_guard<std::mutex> lock(s.io_mutex);
            if (!s.active) throw ChannelError(fmt::format("Session {} closed under channel", s.target));
            n = libssh2_channel_read(channel_, buf, len);
            eof = libssh2_channel_eof(channel_) != 0;
        }

        if (n > 0) return static_cast<size_t>(n);
        if (n == 0 || n == LIBSSH2_ERROR_EAGAIN) {
            if (eof) return 0;
            s.wait_socket(CHANNEL_POLL_MS);
            continue;
        }
        if (closed_) return 0;
        throw ChannelError(fmt::format("Channel read failed on {} ({})", s.target, n));
    }
}

void SshDirectChannel::write_all(const char* data, size_t len) {
    SshSession& s = *session_;
    size_t sent = 0;
    while (sent < len) {
        if (closed_) throw ChannelError("Channel already closed");

        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(s.io_mutex);
            if (!s.active) throw ChannelError(fmt::format("Session {} closed under channel", s.target));
            w = libssh2_channel_write(channel_, data + sent, len - sent);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            s.wait_socket(CHANNEL_POLL_MS);
            continue;
        }
        if (w < 0) {
            throw ChannelError(fmt::format("Channel write failed on {} ({})", s.target, w));
        }
        sent += static_cast<size_t>(w);
    }
}

void SshDirectChannel::close() {
    if (closed_.exchange(true)) return;

    SshSession& s = *session_;
    if (!s.active) return;

    // Don't wait for the remote close ack; libssh2_channel_free finishes it.
    int rc = s.retry([&] { return libssh2_channel_close(channel_); },
                     deadline_after(1), CHANNEL_POLL_MS);
    if (rc != 0) {
        log_debug(fmt::format("channel close on {} returned {}", s.target, rc));
    }
}
