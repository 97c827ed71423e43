#include "time_utils.hpp"
#include <fmt/format.h>

std::string format_duration_ms(int64_t ms) {
    if (ms < 0) return "-";
    if (ms < 1000) return fmt::format("{}ms", ms);

    int64_t seconds = ms / 1000;
    int64_t hours = seconds / 3600;
    int64_t mins = (seconds % 3600) / 60;
    int64_t secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}

std::string format_elapsed(int64_t ms) {
    if (ms < 0) return "-";
    if (ms < 10000) return fmt::format("{}ms", ms);
    return fmt::format("{:.1f}s", ms / 1000.0);
}
