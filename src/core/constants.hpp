#pragma once

#include <cstddef>

// ── Timeouts ────────────────────────────────────────────────
constexpr int DEFAULT_CMD_TIMEOUT_SECS    = 30;    // Read-until budget for send_command
constexpr int DEFAULT_PROMPT_TIMEOUT_SECS = 3;     // Initial prompt wait after open
constexpr int DEFAULT_POLL_MS             = 250;   // Idle quantum between drain attempts
constexpr int SSH_CONNECT_RETRY_MS        = 100;   // Sleep between EAGAIN retries during setup
constexpr int SSH_IO_SLICE_MS             = 50;    // Socket poll slice inside a blocking read
constexpr int SSH_WRITE_STALL_RETRIES     = 500;   // EAGAIN retries before a write is abandoned
constexpr int SSH_KEEPALIVE_SECS          = 30;

// ── Ports / terminal ────────────────────────────────────────
constexpr int DEFAULT_SSH_PORT            = 22;
constexpr const char* DEFAULT_TERM_TYPE   = "vt220";
constexpr int DEFAULT_TERM_WIDTH          = 500;
constexpr int DEFAULT_TERM_HEIGHT         = 40;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_CHUNK_SIZE         = 1024;  // One StreamReader read
constexpr size_t HANDOFF_CAPACITY         = 256;   // Chunks queued before the reader blocks

// ── Logging ─────────────────────────────────────────────────
constexpr size_t LOG_PREVIEW_CHARS        = 200;
