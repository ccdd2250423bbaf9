#pragma once

#include <cstddef>

// ── SFTP options ────────────────────────────────────────────
constexpr int SFTP_PROTOCOL_VERSION      = 8;     // requested on every connect
constexpr std::size_t SFTP_CHUNK_SIZE    = 32768; // bytes per read-chunk
constexpr int SFTP_DEFAULT_PORT          = 22;

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_CONNECT_TIMEOUT_SECS   = 30;    // TCP connect + libssh2 blocking calls
constexpr int SSH_MAX_TIMEOUT_SECS       = 86400; // keeps timeout * 1000 within int
constexpr int REQUEST_TIMEOUT_SECS       = 120;   // caller wait on a session reply
constexpr int SUPERVISOR_TICK_MS         = 100;   // supervisor wakeup granularity

// ── Restart backoff ─────────────────────────────────────────
constexpr int RESTART_MAX_ATTEMPTS       = 10;
constexpr int RESTART_INITIAL_BACKOFF_MS = 200;
constexpr int RESTART_MAX_BACKOFF_MS     = 5000;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SFTP_NAME_BUF_SIZE         = 512;
constexpr int SFTP_LONGENTRY_BUF_SIZE    = 1024;
