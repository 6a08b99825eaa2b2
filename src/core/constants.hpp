#pragma once

#include <array>

// ── Reconnection ────────────────────────────────────────────
// Delay before attempt n (n >= 2) is RECONNECT_BACKOFF_MS[min(n - 2, size - 1)].
constexpr std::array<int, 7> RECONNECT_BACKOFF_MS{1000, 1000, 2000, 3000, 5000, 5000, 10000};
constexpr int RECONNECT_UNLIMITED            = -1;
constexpr int RECONNECT_DISABLED             = 0;
constexpr int DEFAULT_MAX_RECONNECT_ATTEMPTS = 0;
constexpr int DISPOSE_WAIT_MS                = 5000;  // Bounded wait for the loop on dispose

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_CONNECT_TIMEOUT_SECS   = 30;
constexpr int SSH_KEEPALIVE_SECS         = 3;     // Liveness probe interval
constexpr int SSH_EAGAIN_SLEEP_MS        = 10;
constexpr int SSH_HANDSHAKE_POLL_MS      = 100;
constexpr int CMD_COMPLETION_TIMEOUT_MS  = 15000; // Default wait_for_command_completion timeout
constexpr int CMD_COMPLETION_POLL_MS     = 100;
constexpr int CANCEL_POLL_MS             = 50;    // Slice size for cancel-aware waits

// ── Terminal geometry ───────────────────────────────────────
constexpr const char* TERMINAL_TYPE      = "xterm";
constexpr int TERMINAL_COLUMNS           = 80;
constexpr int TERMINAL_ROWS              = 24;
constexpr int TERMINAL_WIDTH_PX          = 800;
constexpr int TERMINAL_HEIGHT_PX         = 600;
constexpr int TERMINAL_BUFFER_SIZE       = 1024;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SFTP_TRANSFER_BUF_SIZE     = 32768;
constexpr int SFTP_DIR_ENTRY_BUF_SIZE    = 1024;

// ── Default ports and key locations ─────────────────────────
constexpr int DEFAULT_SSH_PORT           = 22;
constexpr const char* DEFAULT_KEY_FILES[] = {"id_rsa", "id_ed25519"};
