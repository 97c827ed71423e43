#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <mutex>
#include <cstdio>
#include <platform/platform.hpp>
#include "constants.hpp"

namespace detail {

inline std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

inline std::string& log_path_storage() {
    static std::string path = (platform::temp_dir() / DEBUG_LOG_NAME).string();
    return path;
}

} // namespace detail

inline std::string sandcache_log_path() {
    std::lock_guard<std::mutex> lock(detail::log_mutex());
    return detail::log_path_storage();
}

// Redirect the debug log (e.g. from config's log_file).
inline void set_sandcache_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(detail::log_mutex());
    detail::log_path_storage() = path;
}

// Append a "[HH:MM:SS.mmm] msg" line to the debug log. Lines from concurrent
// threads never interleave.
inline void sandcache_log(const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));

    std::lock_guard<std::mutex> lock(detail::log_mutex());
    std::ofstream out(detail::log_path_storage(), std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << msg << "\n";
}
