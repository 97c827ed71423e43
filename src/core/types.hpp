#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>
#include "constants.hpp"

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// SSH command / handshake result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }
};

// Configuration structures
struct ProviderConfig {
    std::string host;
    int port = DEFAULT_SSH_PORT;
    std::string user;
    std::string password;
    std::optional<std::string> ssh_key_path;
    std::string python = DEFAULT_PYTHON;         // interpreter command on the remote host
    int connect_timeout = DEFAULT_CONNECT_TIMEOUT_SECS;
};

struct PoolConfig {
    int idle_timeout_minutes = DEFAULT_IDLE_TIMEOUT_MINUTES;
    int max_lifetime_minutes = DEFAULT_MAX_LIFETIME_MINUTES;
    int sweep_interval_minutes = DEFAULT_SWEEP_INTERVAL_MINUTES;
    int sandbox_timeout_ms = DEFAULT_SANDBOX_TIMEOUT_MS;        // bound on sandbox creation
    int execution_timeout_ms = DEFAULT_EXECUTION_TIMEOUT_MS;    // bound on a single code run
};

// ── Execution results ───────────────────────────────────────

enum class ImageFormat { PNG, JPEG };

inline const char* image_format_name(ImageFormat f) {
    return f == ImageFormat::PNG ? "png" : "jpeg";
}

struct ExecutionImage {
    ImageFormat format;
    std::string base64;            // payload exactly as the provider returned it
};

// What the caller of SandboxPool::execute() gets back. Always well-formed.
struct ExecutionResult {
    std::string stdout_text;                 // stdout then stderr, trimmed
    std::vector<ExecutionImage> images;      // provider order
    std::optional<std::string> error;        // set only when something failed
    int64_t execution_time_ms = 0;
    std::string sandbox_id;                  // "" if no sandbox was reached

    bool failed() const { return error.has_value(); }
};

// ── Pool reporting ──────────────────────────────────────────

struct PoolStats {
    size_t total_sessions = 0;
    size_t active_sessions = 0;
    uint64_t total_executions = 0;
};

struct SessionSummary {
    std::string session_id;
    std::string sandbox_id;
    int64_t age_ms = 0;
    int64_t idle_ms = 0;
    uint64_t execution_count = 0;
    bool active = false;      // passes the expiry policy right now
    bool broken = false;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
