#include "sftp.hpp"
#include "ssh_session.hpp"
#include <libssh2_sftp.h>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <fstream>
#include <mutex>
#include <vector>

namespace {

// Closes an SFTP handle on scope exit.
struct HandleGuard {
    SshSession& s;
    LIBSSH2_SFTP_HANDLE* fh;

    ~HandleGuard() {
        if (!fh) return;
        s.retry([&] { return libssh2_sftp_close_handle(fh); },
                deadline_after(CHANNEL_OPEN_TIMEOUT_SECS), CHANNEL_POLL_MS);
    }
};

std::string sftp_error(SshSession& s, LIBSSH2_SFTP* sftp) {
    std::lock_guard<std::mutex> lock(s.io_mutex);
    return fmt::format("{} (sftp status {})", s.last_error(), libssh2_sftp_last_error(sftp));
}

} // namespace

SshFileSubsystem::SshFileSubsystem(std::shared_ptr<SshSession> session, LIBSSH2_SFTP* sftp)
    : session_(std::move(session)), sftp_(sftp) {}

SshFileSubsystem::~SshFileSubsystem() {
    close();
}

void SshFileSubsystem::put(const fs::path& local, const std::string& remote,
                           const TransferProgress& progress) {
    SshSession& s = *session_;
    if (!sftp_) throw TransferError("SFTP subsystem already closed");

    std::error_code ec;
    uint64_t total = fs::file_size(local, ec);
    if (ec) throw TransferError(fmt::format("Cannot stat {}: {}", local.string(), ec.message()));

    std::ifstream file(local, std::ios::binary);
    if (!file) throw TransferError("Cannot read file: " + local.string());

    std::string err;
    LIBSSH2_SFTP_HANDLE* fh = s.retry_ptr<LIBSSH2_SFTP_HANDLE>([&] {
        return libssh2_sftp_open(sftp_, remote.c_str(),
            LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
            LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR |
            LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IROTH);
    }, deadline_after(CHANNEL_OPEN_TIMEOUT_SECS), CHANNEL_POLL_MS, err);
    if (!fh) throw TransferError(fmt::format("Cannot open remote {} for writing: {}", remote, err));
    HandleGuard guard{s, fh};

    if (progress) progress(0, total);

    std::vector<char> buf(SFTP_CHUNK_SIZE);
    uint64_t done = 0;
    while (file) {
        file.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        size_t n = static_cast<size_t>(file.gcount());
        if (n == 0) break;

        size_t sent = 0;
        while (sent < n) {
            int w = s.retry([&] { return libssh2_sftp_write(fh, buf.data() + sent, n - sent); },
                            Deadline::max(), CHANNEL_POLL_MS);
            if (w < 0) {
                throw TransferError(fmt::format("Write to {} failed: {}", remote, sftp_error(s, sftp_)));
            }
            sent += static_cast<size_t>(w);
            done += static_cast<uint64_t>(w);
            if (progress) progress(done, total);
        }
    }
    if (file.bad()) throw TransferError("Read error on " + local.string());
}

void SshFileSubsystem::get(const std::string& remote, const fs::path& local) {
    SshSession& s = *session_;
    if (!sftp_) throw TransferError("SFTP subsystem already closed");

    std::string err;
    LIBSSH2_SFTP_HANDLE* fh = s.retry_ptr<LIBSSH2_SFTP_HANDLE>([&] {
        return libssh2_sftp_open(sftp_, remote.c_str(), LIBSSH2_FXF_READ, 0);
    }, deadline_after(CHANNEL_OPEN_TIMEOUT_SECS), CHANNEL_POLL_MS, err);
    if (!fh) throw TransferError(fmt::format("Cannot open remote {} for reading: {}", remote, err));
    HandleGuard guard{s, fh};

    std::string content;
    std::vector<char> buf(SFTP_CHUNK_SIZE);
    for (;;) {
        int n = s.retry([&] { return libssh2_sftp_read(fh, buf.data(), buf.size()); },
                        Deadline::max(), CHANNEL_POLL_MS);
        if (n == 0) break;
        if (n < 0) {
            throw TransferError(fmt::format("Read from {} failed: {}", remote, sftp_error(s, sftp_)));
        }
        content.append(buf.data(), static_cast<size_t>(n));
    }

    if (local.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(local.parent_path(), ec);
    }
    std::ofstream out(local, std::ios::binary | std::ios::trunc);
    if (!out) throw TransferError("Cannot write file: " + local.string());
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out) throw TransferError("Write error on " + local.string());
}

void SshFileSubsystem::close() {
    if (!sftp_) return;
    int rc = session_->retry([&] { return libssh2_sftp_shutdown(sftp_); },
                             deadline_after(CHANNEL_OPEN_TIMEOUT_SECS), CHANNEL_POLL_MS);
    if (rc != 0) log_debug(fmt::format("sftp shutdown on {} returned {}", session_->target, rc));
    sftp_ = nullptr;
}
