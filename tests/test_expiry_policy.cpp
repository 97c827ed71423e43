#include <gtest/gtest.h>
#include <managers/expiry_policy.hpp>

using namespace std::chrono;

static ExpiryPolicy default_policy() {
    return ExpiryPolicy(minutes(30), minutes(60));
}

TEST(ExpiryPolicy, FreshEntryIsValid) {
    auto t0 = SteadyClock::now();
    EXPECT_EQ(default_policy().evaluate({t0, t0}, t0), ExpiryReason::NONE);
}

TEST(ExpiryPolicy, IdleJustUnderLimit) {
    auto t0 = SteadyClock::now();
    EXPECT_TRUE(default_policy().is_valid({t0, t0}, t0 + minutes(29)));
}

TEST(ExpiryPolicy, IdleExactlyAtLimitIsValid) {
    // Expiry requires strictly exceeding the bound
    auto t0 = SteadyClock::now();
    EXPECT_TRUE(default_policy().is_valid({t0, t0}, t0 + minutes(30)));
}

TEST(ExpiryPolicy, IdlePastLimit) {
    auto t0 = SteadyClock::now();
    EXPECT_EQ(default_policy().evaluate({t0, t0}, t0 + minutes(30) + milliseconds(1)),
              ExpiryReason::IDLE_TIMEOUT);
}

TEST(ExpiryPolicy, LifetimeExceededWhileActive) {
    // Used a minute ago, but created 61 minutes ago
    auto t0 = SteadyClock::now();
    auto now = t0 + minutes(61);
    EXPECT_EQ(default_policy().evaluate({t0, now - minutes(1)}, now),
              ExpiryReason::MAX_LIFETIME);
}

TEST(ExpiryPolicy, LifetimeExactlyAtLimitIsValid) {
    auto t0 = SteadyClock::now();
    auto now = t0 + minutes(60);
    EXPECT_TRUE(default_policy().is_valid({t0, now}, now));
}

TEST(ExpiryPolicy, IdleReportedBeforeLifetime) {
    auto t0 = SteadyClock::now();
    EXPECT_EQ(default_policy().evaluate({t0, t0}, t0 + minutes(90)),
              ExpiryReason::IDLE_TIMEOUT);
}

TEST(ExpiryPolicy, FromConfig) {
    PoolConfig cfg;
    cfg.idle_timeout_minutes = 5;
    cfg.max_lifetime_minutes = 10;
    auto policy = ExpiryPolicy::from_config(cfg);
    EXPECT_EQ(policy.idle_timeout(), minutes(5));
    EXPECT_EQ(policy.max_lifetime(), minutes(10));
}

TEST(ExpiryPolicy, ReasonNames) {
    EXPECT_STREQ(expiry_reason_name(ExpiryReason::IDLE_TIMEOUT), "idle timeout");
    EXPECT_STREQ(expiry_reason_name(ExpiryReason::MAX_LIFETIME), "max lifetime");
    EXPECT_STREQ(expiry_reason_name(ExpiryReason::NONE), "valid");
}
