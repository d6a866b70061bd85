#pragma once

#include <cstddef>

constexpr const char* SHELLCAST_VERSION = "0.1.0";

// ── Timeouts ────────────────────────────────────────────────
constexpr int CONNECT_TIMEOUT_SECS       = 10;    // TCP connect + SSH handshake
constexpr int SHELL_INIT_TIMEOUT_SECS    = 15;    // PS1 injection until first prompt
constexpr int CMD_TIMEOUT_SECS           = 15;    // Default exec deadline
constexpr int DRAIN_TIMEOUT_SECS         = 5;     // Closing waits this long for in-flight work
constexpr int READER_POLL_MS             = 50;    // Reader thread wait per channel read
constexpr int SSH_KEEPALIVE_SECS         = 30;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;
constexpr std::size_t MAX_OUTPUT_BYTES   = 16u * 1024 * 1024;  // per-command prompt search budget

// ── Session history ─────────────────────────────────────────
constexpr int MAX_COMMAND_RECORDS        = 100;
constexpr int MAX_CWD_LENGTH             = 255;

// ── Shell prompt defaults ───────────────────────────────────
// PS1 forced at connect time, and the template the matcher instantiates
// from it once the remote user/host are known.
constexpr const char* DEFAULT_PS1            = "[\\u@\\h \\W]$ ";
constexpr const char* DEFAULT_PROMPT_TEMPLATE = "[{user}@{host} {cwd}]$ ";

// ── PTY ─────────────────────────────────────────────────────
constexpr const char* DEFAULT_TERM       = "xterm";
constexpr int DEFAULT_PTY_COLS           = 80;
constexpr int DEFAULT_PTY_ROWS           = 24;
