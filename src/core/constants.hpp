#pragma once

#include <cstddef>
#include <cstdint>

// ── Connection defaults ─────────────────────────────────────
constexpr int DEFAULT_SSH_PORT           = 22;
constexpr const char* DEFAULT_USER       = "root";
constexpr const char* DEFAULT_TERM       = "xterm-256color";
constexpr int DEFAULT_ROWS               = 24;
constexpr int DEFAULT_COLS               = 80;
constexpr int PTY_BAUD                   = 115200;

// ── Timeouts ────────────────────────────────────────────────
constexpr int CONNECT_TIMEOUT_SECS       = 30;    // TCP connect + handshake + auth
constexpr int CHANNEL_OPEN_TIMEOUT_SECS  = 30;    // exec/shell channel setup
constexpr int SESSION_READ_TIMEOUT_MS    = 50;    // bridge output polling
constexpr int SESSION_WRITE_WAIT_MS      = 2000;  // single write attempt bound
constexpr int IDLE_TIMEOUT_SECS          = 1800;  // sessions idle longer are reaped
constexpr int REAP_INTERVAL_SECS         = 60;
constexpr int EAGAIN_BACKOFF_MS          = 10;
constexpr int CHANNEL_CLOSE_WAIT_MS      = 1000;  // close + free of a torn-down channel
constexpr int KEEPALIVE_INTERVAL_SECS    = 30;
constexpr int SFTP_OP_TIMEOUT_SECS       = 30;    // each sftp request (open, stat, read chunk)
constexpr int PROCESS_CMD_TIMEOUT_SECS   = 15;    // ps / kill round trip

// ── Scanner ─────────────────────────────────────────────────
constexpr std::size_t SCAN_MAX_ADDRESSES = 65536;
constexpr int SCAN_TIMEOUT_SECS          = 5;
constexpr int SCAN_MAX_CONCURRENCY       = 64;
constexpr const char* SCAN_CLIENT_BANNER = "SSH-2.0-remops-scanner";
constexpr const char* SCAN_PROBE_USER    = "scan";

// ── Processes ───────────────────────────────────────────────
constexpr std::size_t PROCESS_LIST_LIMIT = 50;
constexpr int DEFAULT_KILL_SIGNAL        = 15;    // SIGTERM

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;
constexpr std::size_t TRANSFER_CHUNK_SIZE = 32 * 1024;
constexpr std::size_t SESSION_BUFFER_CAP = 4 * 1024 * 1024;  // reader backlog before it pauses
