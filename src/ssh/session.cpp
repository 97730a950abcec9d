#include "session.hpp"
#include "ssh_session.hpp"
#include <libssh2_sftp.h>
#include "channel.hpp"
#include "sftp.hpp"
#include <core/constants.hpp>
#include <core/host.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <fmt/format.h>
#include <cstdlib>
#include <cstring>
#include <mutex>

// ── SshSession ─────────────────────────────────────────────

SshSession::~SshSession() {
    if (session) {
        if (active.exchange(false)) {
            libssh2_session_disconnect(session, "Normal disconnection");
        }
        libssh2_session_free(session);
        session = nullptr;
    }
    if (sock != SSHFLEET_INVALID_SOCKET) {
        platform::close_socket(sock);
        sock = SSHFLEET_INVALID_SOCKET;
    }
}

void SshSession::wait_socket(int timeout_ms) {
    short events = 0;
    {
        std::lock_guard<std::mutex> lock(io_mutex);
        if (!session) return;
        int dir = libssh2_session_block_directions(session);
        if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
        if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    }
    if (events == 0) events = POLLIN;
    platform::poll_socket(sock, events, timeout_ms);
}

void SshSession::disconnect(const char* reason) {
    std::lock_guard<std::mutex> lock(io_mutex);
    if (session && active.exchange(false)) {
        libssh2_session_disconnect(session, reason);
    }
}

std::string SshSession::last_error() const {
    char* msg = nullptr;
    int len = 0;
    int code = libssh2_session_last_error(session, &msg, &len, 0);
    if (!msg || len == 0) return fmt::format("libssh2 error {}", code);
    return fmt::format("{} ({})", std::string(msg, len), code);
}

// ── Authentication ─────────────────────────────────────────

namespace {

std::once_flag g_libssh2_init;

void init_libssh2() {
    std::call_once(g_libssh2_init, [] {
        if (libssh2_init(0) != 0) {
            throw ConnectionError("Failed to initialize libssh2");
        }
    });
}

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
};

// Servers that only offer keyboard-interactive get the password for every prompt.
void kbd_callback(const char* /*name*/, int /*name_len*/,
                  const char* /*instruction*/, int /*instruction_len*/,
                  int num_prompts,
                  const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                  LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                  void** abstract) {
    auto* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
}

void authenticate(SshSession& s, const HostIdentity& host, Deadline deadline) {
    const std::string& user = host.username();

    std::string list_err;
    char* auth_list = s.retry_ptr<char>([&] {
        return libssh2_userauth_list(s.session, user.c_str(),
                                     static_cast<unsigned int>(user.length()));
    }, deadline, SOCKET_WAIT_SLICE_MS, list_err);
    std::string methods = auth_list ? auth_list : "";
    log_debug(fmt::format("{}: auth methods: {}", s.target, methods.empty() ? "?" : methods));

    if (const auto* key = std::get_if<KeyFileAuth>(&host.auth())) {
        std::string path = platform::expand_user(key->path).string();
        const char* passphrase = key->passphrase.empty() ? nullptr : key->passphrase.c_str();
        int rc = s.retry([&] {
            return libssh2_userauth_publickey_fromfile_ex(
                s.session, user.c_str(), static_cast<unsigned int>(user.length()),
                nullptr, path.c_str(), passphrase);
        }, deadline, SOCKET_WAIT_SLICE_MS);
        if (rc != 0) {
            std::lock_guard<std::mutex> lock(s.io_mutex);
            throw ConnectionError(fmt::format("Public key authentication failed for {} with {}: {}",
                                              s.target, path, s.last_error()));
        }
        return;
    }

    const auto& password = std::get<PasswordAuth>(host.auth()).secret;

    if (methods.empty() || methods.find("password") != std::string::npos) {
        int rc = s.retry([&] {
            return libssh2_userauth_password(s.session, user.c_str(), password.c_str());
        }, deadline, SOCKET_WAIT_SLICE_MS);
        if (rc == 0) return;
    }

    if (methods.find("keyboard-interactive") != std::string::npos) {
        KbdAuthData kbd_data{password};
        {
            std::lock_guard<std::mutex> lock(s.io_mutex);
            *libssh2_session_abstract(s.session) = &kbd_data;
        }
        int rc = s.retry([&] {
            return libssh2_userauth_keyboard_interactive(s.session, user.c_str(), kbd_callback);
        }, deadline, SOCKET_WAIT_SLICE_MS);
        {
            std::lock_guard<std::mutex> lock(s.io_mutex);
            *libssh2_session_abstract(s.session) = nullptr;
        }
        if (rc == 0) return;
    }

    throw ConnectionError(fmt::format("Authentication failed for {} (check username/password)", s.target));
}

// Frees an exec channel on scope exit.
struct ChannelGuard {
    SshSession& s;
    LIBSSH2_CHANNEL* ch;

    ~ChannelGuard() {
        if (!ch) return;
        s.retry([&] { return libssh2_channel_free(ch); },
                deadline_after(2), CHANNEL_POLL_MS);
    }
};

} // namespace

// ── SshTransport ───────────────────────────────────────────

SshTransport::SshTransport(std::shared_ptr<SshSession> session)
    : session_(std::move(session)), target_(session_->target) {}

SshTransport::~SshTransport() {
    close();
}

std::unique_ptr<SshTransport> SshTransport::establish(const HostIdentity& host) {
    init_libssh2();

    auto s = std::make_shared<SshSession>();
    s->target = host.key();
    Deadline deadline = deadline_after(host.timeout_secs());

    log_debug(fmt::format("Connecting to {} ({} auth)", s->target, auth_kind(host.auth())));

    std::string err;
    s->sock = platform::connect_tcp(host.hostname(), host.port(), host.timeout_secs() * 1000, err);
    if (s->sock == SSHFLEET_INVALID_SOCKET) {
        throw ConnectionError(err);
    }

    s->session = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!s->session) {
        throw ConnectionError("Failed to create SSH session");
    }
    libssh2_session_set_blocking(s->session, 0);

    // SSH handshake (key exchange)
    int rc = s->retry([&] { return libssh2_session_handshake(s->session, s->sock); },
                      deadline, SOCKET_WAIT_SLICE_MS);
    if (rc != 0) {
        std::lock_guard<std::mutex> lock(s->io_mutex);
        throw ConnectionError(rc == LIBSSH2_ERROR_TIMEOUT
            ? fmt::format("SSH handshake with {} timed out", s->target)
            : fmt::format("SSH handshake with {} failed: {}", s->target, s->last_error()));
    }
    s->active = true;

    try {
        authenticate(*s, host, deadline);
    } catch (const ConnectionError&) {
        s->disconnect("Authentication failed");
        throw;
    }

    libssh2_keepalive_config(s->session, 1, SSH_KEEPALIVE_INTERVAL_SECS);

    log_info(fmt::format("Connected to {}", s->target));
    return std::unique_ptr<SshTransport>(new SshTransport(std::move(s)));
}

bool SshTransport::is_active() const {
    if (!session_->active) return false;

    int revents = platform::poll_socket(session_->sock, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        session_->active = false;
        return false;
    }

    std::lock_guard<std::mutex> lock(session_->io_mutex);
    int seconds_to_next = 0;
    int rc = libssh2_keepalive_send(session_->session, &seconds_to_next);
    if (rc != 0 && rc != LIBSSH2_ERROR_EAGAIN) {
        session_->active = false;
        return false;
    }
    return true;
}

SSHResult SshTransport::exec(const std::string& command, int timeout_secs) {
    SshSession& s = *session_;
    if (!s.active) throw ChannelError(fmt::format("Session {} is closed", target_));

    Deadline deadline = deadline_after(timeout_secs);
    Deadline open_deadline = timeout_secs > 0 ? deadline : deadline_after(CHANNEL_OPEN_TIMEOUT_SECS);

    std::string err;
    LIBSSH2_CHANNEL* ch = s.retry_ptr<LIBSSH2_CHANNEL>(
        [&] { return libssh2_channel_open_session(s.session); },
        open_deadline, CHANNEL_POLL_MS, err);
    if (!ch) throw ChannelError(fmt::format("Failed to open exec channel on {}: {}", target_, err));
    ChannelGuard guard{s, ch};

    int rc = s.retry([&] { return libssh2_channel_exec(ch, command.c_str()); },
                     open_deadline, CHANNEL_POLL_MS);
    if (rc != 0) {
        throw ChannelError(fmt::format("Failed to exec command on {} ({})", target_, rc));
    }

    SSHResult result{NO_EXIT_STATUS, "", ""};
    char out_buf[SSH_READ_BUF_SIZE];
    char err_buf[SSH_READ_BUF_SIZE];

    for (;;) {
        if (past(deadline)) {
            s.retry([&] { return libssh2_channel_close(ch); }, deadline_after(1), CHANNEL_POLL_MS);
            throw ChannelError(fmt::format("Command timed out after {}s", timeout_secs));
        }

        ssize_t n_out, n_err;
        bool eof;
        {
            std::lock_guard<std::mutex> lock(s.io_mutex);
            n_out = libssh2_channel_read(ch, out_buf, sizeof(out_buf));
            n_err = libssh2_channel_read_stderr(ch, err_buf, sizeof(err_buf));
            eof = libssh2_channel_eof(ch) != 0;
        }
        if (n_out > 0) result.stdout_data.append(out_buf, static_cast<size_t>(n_out));
        if (n_err > 0) result.stderr_data.append(err_buf, static_cast<size_t>(n_err));

        if (n_out < 0 && n_out != LIBSSH2_ERROR_EAGAIN) {
            throw ChannelError(fmt::format("SSH channel read error on {} ({})", target_, n_out));
        }
        if (n_err < 0 && n_err != LIBSSH2_ERROR_EAGAIN) {
            throw ChannelError(fmt::format("SSH channel stderr read error on {} ({})", target_, n_err));
        }

        if (n_out > 0 || n_err > 0) continue;
        if (eof) break;
        s.wait_socket(CHANNEL_POLL_MS);
    }

    rc = s.retry([&] { return libssh2_channel_close(ch); }, deadline_after(CHANNEL_OPEN_TIMEOUT_SECS), CHANNEL_POLL_MS);
    if (rc == 0) {
        s.retry([&] { return libssh2_channel_wait_closed(ch); }, deadline_after(CHANNEL_OPEN_TIMEOUT_SECS), CHANNEL_POLL_MS);
        std::lock_guard<std::mutex> lock(s.io_mutex);
        result.exit_code = libssh2_channel_get_exit_status(ch);
    } else {
        throw ChannelError(fmt::format("Could not read exit status on {} ({})", target_, rc));
    }

    return result;
}

std::unique_ptr<ByteChannel> SshTransport::open_direct_channel(
    const std::string& dest_host, int dest_port,
    const std::string& src_host, int src_port) {
    SshSession& s = *session_;
    if (!s.active) throw ChannelError(fmt::format("Session {} is closed", target_));

    std::string err;
    LIBSSH2_CHANNEL* ch = s.retry_ptr<LIBSSH2_CHANNEL>([&] {
        return libssh2_channel_direct_tcpip_ex(s.session, dest_host.c_str(), dest_port,
                                               src_host.c_str(), src_port);
    }, deadline_after(CHANNEL_OPEN_TIMEOUT_SECS), CHANNEL_POLL_MS, err);
    if (!ch) {
        throw ChannelError(fmt::format("direct-tcpip to {}:{} via {} failed: {}",
                                       dest_host, dest_port, target_, err));
    }
    return std::make_unique<SshDirectChannel>(session_, ch);
}

std::unique_ptr<FileSubsystem> SshTransport::open_file_subsystem() {
    SshSession& s = *session_;
    if (!s.active) throw TransferError(fmt::format("Session {} is closed", target_));

    std::string err;
    LIBSSH2_SFTP* sftp = s.retry_ptr<LIBSSH2_SFTP>(
        [&] { return libssh2_sftp_init(s.session); },
        deadline_after(CHANNEL_OPEN_TIMEOUT_SECS), CHANNEL_POLL_MS, err);
    if (!sftp) {
        throw TransferError(fmt::format("Failed to start SFTP subsystem on {}: {}", target_, err));
    }
    return std::make_unique<SshFileSubsystem>(session_, sftp);
}

void SshTransport::close() {
    if (session_) session_->disconnect("Normal disconnection");
}

// ── SshConnector ───────────────────────────────────────────

std::unique_ptr<Transport> SshConnector::connect(const HostIdentity& host) {
    return SshTransport::establish(host);
}
