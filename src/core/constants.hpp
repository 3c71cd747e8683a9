#pragma once

constexpr const char* SSHRELAY_VERSION = "0.2.1";

// ── SSH defaults ────────────────────────────────────────────
constexpr int SSH_DEFAULT_PORT           = 22;
constexpr int SSH_CONNECT_TIMEOUT_SECS   = 15;    // Bounds resolve + connect + handshake + auth
constexpr int SSH_MAX_TIMEOUT_SECS       = 3600;

// ── Exit codes ──────────────────────────────────────────────
constexpr int EXIT_USAGE                 = 1;     // Bad arguments, nothing was attempted
constexpr int EXIT_TARGET_FAILED         = 2;     // Key installer: a required target was not written
constexpr int EXIT_SSH_FAILURE           = 255;   // Auth, protocol or connection failure
constexpr int EXIT_SIGNAL_BASE           = 128;   // Remote command killed by signal N → 128 + N, unknown signal → 128

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 16384;

// ── Logging ─────────────────────────────────────────────────
constexpr int LOG_OUTPUT_PREVIEW_CHARS   = 500;

// ── Key installer defaults (Asuswrt-style router layout) ────
constexpr const char* DEFAULT_KEY_CHECK_COMMAND = "nvram get sshd_authkeys";
constexpr const char* DEFAULT_KEY_TARGET_JFFS   = "/jffs/.ssh/authorized_keys";
constexpr const char* DEFAULT_KEY_TARGET_DROPBEAR = "/etc/dropbear/authorized_keys";
constexpr const char* DEFAULT_PUBLIC_KEY_FILE   = "~/.ssh/id_rsa.pub";
constexpr const char* DEFAULT_KNOWN_HOSTS_FILE  = "~/.ssh/known_hosts";
