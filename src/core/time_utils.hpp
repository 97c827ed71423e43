#pragma once

#include <string>
#include <cstdint>

// Format a millisecond duration for listings.
// Returns human-readable string like "2h35m", "14m22s", "8s", "350ms", or "-" if negative.
std::string format_duration_ms(int64_t ms);

// Format an execution time for result footers: "842ms" below 10s, "12.4s" above.
std::string format_elapsed(int64_t ms);
