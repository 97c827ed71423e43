#include "expiry_policy.hpp"

const char* expiry_reason_name(ExpiryReason reason) {
    switch (reason) {
        case ExpiryReason::IDLE_TIMEOUT: return "idle timeout";
        case ExpiryReason::MAX_LIFETIME: return "max lifetime";
        case ExpiryReason::NONE: break;
    }
    return "valid";
}

ExpiryPolicy::ExpiryPolicy(std::chrono::milliseconds idle_timeout,
                           std::chrono::milliseconds max_lifetime)
    : idle_timeout_(idle_timeout), max_lifetime_(max_lifetime) {}

ExpiryPolicy ExpiryPolicy::from_config(const PoolConfig& pool) {
    return ExpiryPolicy(std::chrono::minutes(pool.idle_timeout_minutes),
                        std::chrono::minutes(pool.max_lifetime_minutes));
}

ExpiryReason ExpiryPolicy::evaluate(const EntryTimes& entry, TimePoint now) const {
    // Idle is checked first: an entry past both bounds reports idle timeout.
    if (now - entry.last_used_at > idle_timeout_) {
        return ExpiryReason::IDLE_TIMEOUT;
    }
    if (now - entry.created_at > max_lifetime_) {
        return ExpiryReason::MAX_LIFETIME;
    }
    return ExpiryReason::NONE;
}
