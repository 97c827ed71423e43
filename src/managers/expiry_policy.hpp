#pragma once

#include <chrono>
#include <core/types.hpp>

using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;

enum class ExpiryReason { NONE, IDLE_TIMEOUT, MAX_LIFETIME };

const char* expiry_reason_name(ExpiryReason reason);

// Timestamps the policy looks at; a snapshot of a cache entry.
struct EntryTimes {
    TimePoint created_at;
    TimePoint last_used_at;
};

// Pure evaluation of the two independent time bounds. An entry is expired
// once idle time or total age strictly exceeds its bound.
class ExpiryPolicy {
public:
    ExpiryPolicy(std::chrono::milliseconds idle_timeout,
                 std::chrono::milliseconds max_lifetime);

    static ExpiryPolicy from_config(const PoolConfig& pool);

    ExpiryReason evaluate(const EntryTimes& entry, TimePoint now) const;

    bool is_valid(const EntryTimes& entry, TimePoint now) const {
        return evaluate(entry, now) == ExpiryReason::NONE;
    }

    std::chrono::milliseconds idle_timeout() const { return idle_timeout_; }
    std::chrono::milliseconds max_lifetime() const { return max_lifetime_; }

private:
    std::chrono::milliseconds idle_timeout_;
    std::chrono::milliseconds max_lifetime_;
};
