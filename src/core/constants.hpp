#pragma once

#include <cstdint>
#include <cstddef>

// ── Timeouts ────────────────────────────────────────────────
constexpr int CONNECT_TIMEOUT_SECS        = 20;    // TCP connect + handshake budget
constexpr int CHANNEL_OPEN_TIMEOUT_SECS   = 30;    // Max wait for a channel grant
constexpr int KEEPALIVE_INTERVAL_SECS     = 30;    // SSH keepalive cadence
constexpr int EAGAIN_POLL_MS              = 10;    // Socket poll between EAGAIN retries
constexpr int SHELL_POLL_MS               = 50;    // Reader thread poll interval

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE           = 4096;
constexpr int SHELL_READ_BUF_SIZE         = 16384;
constexpr int SFTP_IO_BUF_SIZE            = 32768;
constexpr int SFTP_NAME_BUF_SIZE          = 1024;

// ── Terminal defaults ───────────────────────────────────────
constexpr int DEFAULT_TERM_ROWS           = 24;
constexpr int DEFAULT_TERM_COLS           = 80;
constexpr const char* DEFAULT_TERM_TYPE   = "xterm-256color";

// ── POSIX mode bits ─────────────────────────────────────────
constexpr std::uint32_t MODE_TYPE_MASK    = 0170000;
constexpr std::uint32_t MODE_DIRECTORY    = 0040000;
constexpr std::uint32_t MODE_PERM_MASK    = 07777;
constexpr std::uint32_t DEFAULT_DIR_MODE  = 0755;
constexpr std::uint32_t DEFAULT_FILE_MODE = 0644;

// ── Naming ──────────────────────────────────────────────────
constexpr const char* COPY_SUFFIX         = " copy";
constexpr int MAX_COPY_NAME_ATTEMPTS      = 1000;

// ── Logging ─────────────────────────────────────────────────
constexpr std::size_t LOG_OUTPUT_TRUNCATE = 500;

// ── Attach ──────────────────────────────────────────────────
constexpr char DETACH_KEY                 = 0x1d;  // Ctrl-]
