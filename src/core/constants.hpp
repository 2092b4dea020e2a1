#pragma once

// ── Exit codes ──────────────────────────────────────────────
constexpr int EXIT_NO_TARGETS            = 10;    // Resolution yielded no usable hosts
constexpr int EXIT_FATAL                 = 1;
constexpr int EXIT_INTERRUPTED           = 130;

// ── Sudo interception ───────────────────────────────────────
// sudo is rewritten to print this exact prompt, which we watch for.
constexpr const char* SUDO_PROMPT_MARKER = "fleetsh sudo password: ";

// ── Attribute resolution ────────────────────────────────────
constexpr const char* DEFAULT_SSH_ATTRIBUTE = "fqdn";
constexpr const char* CLOUD_HOSTNAME_ATTRIBUTE = "cloud.public_hostname";

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_CONNECT_TIMEOUT_SECS   = 30;    // TCP connect + handshake + auth
constexpr int SSH_CHANNEL_TIMEOUT_SECS   = 30;    // Channel open / exec request
constexpr int EVENT_LOOP_POLL_MS         = 100;   // Max wait per loop iteration
constexpr int TUNNEL_POLL_MS             = 10;    // Gateway forwarder poll interval

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;
constexpr int TUNNEL_BUF_SIZE            = 16384;

// ── PTY ─────────────────────────────────────────────────────
constexpr const char* PTY_TERM_TYPE      = "xterm";

// ── Prompts ─────────────────────────────────────────────────
constexpr const char* INTERACTIVE_PROMPT = "fleetsh> ";
constexpr const char* SUDO_PASSWORD_PROMPT = "Enter your password: ";
