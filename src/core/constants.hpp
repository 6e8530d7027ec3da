#pragma once

constexpr const char* FLEETCTL_VERSION   = "0.1.0";

// ── Remote API ──────────────────────────────────────────────
constexpr const char* API_PREFIX         = "/api";
constexpr const char* API_KEY_PARAM      = "apikey";
constexpr const char* DEFAULT_PANEL_URL  = "http://127.0.0.1:23333";
constexpr const char* DEFAULT_LAYOUT     = "v10";

// ── Timeouts ────────────────────────────────────────────────
constexpr int REQUEST_TIMEOUT_SECS       = 30;    // Max time for a single API call
constexpr int COOLDOWN_SECS              = 10;    // Min interval between start/stop per instance
constexpr int OUTPUT_LOG_DELAY_MS        = 1000;  // Wait after a console command before reading the log

// ── Inventory ───────────────────────────────────────────────
constexpr int INSTANCE_PAGE_SIZE         = 100;   // Larger than any realistic node
constexpr int INSTANCE_MAX_PAGES         = 50;    // Hard cap when following maxPage

// ── Output shaping ──────────────────────────────────────────
constexpr int ERROR_BODY_PREVIEW_CHARS   = 100;   // Body excerpt kept in synthesized errors
constexpr int OUTPUT_TAIL_CHARS          = 500;   // Console log tail returned by send_command

// ── Placeholders ────────────────────────────────────────────
constexpr const char* UNNAMED_INSTANCE   = "Unnamed";
constexpr const char* UNNAMED_NODE       = "Unnamed Node";
