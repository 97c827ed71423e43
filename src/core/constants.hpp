#pragma once

#include <cstdint>

// ── Session lifetime ────────────────────────────────────────
constexpr int DEFAULT_IDLE_TIMEOUT_MINUTES   = 30;    // Max gap between uses of a sandbox
constexpr int DEFAULT_MAX_LIFETIME_MINUTES   = 60;    // Max total age of a sandbox
constexpr int DEFAULT_SWEEP_INTERVAL_MINUTES = 5;     // Background cleanup period

// ── Timeouts ────────────────────────────────────────────────
constexpr int DEFAULT_SANDBOX_TIMEOUT_MS     = 120000;  // Sandbox creation bound
constexpr int DEFAULT_EXECUTION_TIMEOUT_MS   = 120000;  // Single code run bound
constexpr int DEFAULT_CONNECT_TIMEOUT_SECS   = 30;
constexpr int DEFAULT_SSH_PORT               = 22;
constexpr int SCHEDULER_TICK_MS              = 100;   // Stop-responsiveness of the sweep thread

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE              = 4096;
constexpr int SSH_WRITE_MAX_RETRIES          = 100;

// ── Kernel frame markers ────────────────────────────────────
inline constexpr const char* FRAME_READY = "__SANDCACHE_READY__";
inline constexpr const char* FRAME_RUN   = "__SANDCACHE_RUN__";
inline constexpr const char* FRAME_OUT   = "__SANDCACHE_OUT__";
inline constexpr const char* FRAME_ERR   = "__SANDCACHE_ERR__";
inline constexpr const char* FRAME_ART   = "__SANDCACHE_ART__";
inline constexpr const char* FRAME_EXC   = "__SANDCACHE_EXC__";
inline constexpr const char* FRAME_DONE  = "__SANDCACHE_DONE__";

// ── Local paths ─────────────────────────────────────────────
constexpr const char* CONFIG_DIR_NAME  = ".sandcache";
constexpr const char* CONFIG_FILE_NAME = "config.yaml";
constexpr const char* DEBUG_LOG_NAME   = "sandcache_debug.log";
constexpr const char* DEFAULT_PYTHON   = "python3";
