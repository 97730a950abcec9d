#pragma once

#include <cstdint>

// ── Connection defaults ─────────────────────────────────────
constexpr int DEFAULT_SSH_PORT              = 22;
constexpr int DEFAULT_CONNECT_TIMEOUT_SECS  = 30;    // Per-host connect + auth budget
constexpr int SSH_KEEPALIVE_INTERVAL_SECS   = 30;

// ── Dispatcher ──────────────────────────────────────────────
constexpr int DEFAULT_MAX_CONCURRENT        = 10;

// ── Timeouts ────────────────────────────────────────────────
constexpr int NO_COMMAND_TIMEOUT            = 0;     // Commands run until the channel closes
constexpr int CHANNEL_OPEN_TIMEOUT_SECS     = 30;
constexpr int SOCKET_WAIT_SLICE_MS          = 100;   // poll() slice while libssh2 reports EAGAIN
constexpr int CHANNEL_POLL_MS               = 10;    // Shorter slice for channel reads sharing one socket
constexpr int ACCEPT_POLL_MS                = 500;   // Tunnel accept loop wakeup for stop checks

// ── Monitoring ──────────────────────────────────────────────
constexpr int DEFAULT_MONITOR_INTERVAL_SECS = 5;
constexpr int DEFAULT_MONITOR_DURATION_SECS = 60;

// ── Tunnels ─────────────────────────────────────────────────
constexpr int UNLIMITED_TUNNEL_CONNECTIONS  = 0;
constexpr int TUNNEL_LISTEN_BACKLOG         = 8;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE             = 4096;
constexpr int SFTP_CHUNK_SIZE               = 32768;
constexpr int TUNNEL_RELAY_BUF_SIZE         = 4096;
