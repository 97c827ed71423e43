#include <gtest/gtest.h>
#include <managers/cleanup_scheduler.hpp>
#include "fake_provider.hpp"
#include <thread>

using namespace std::chrono;

class CleanupSchedulerTest : public ::testing::Test {
protected:
    FakeProvider provider;
    ManualClock clock;
    SessionStore store{provider, ExpiryPolicy(minutes(30), minutes(60)), 1000, clock.fn()};

    void touch(const std::string& id) {
        ASSERT_TRUE(store.resolve(id).is_ok());
    }
};

TEST_F(CleanupSchedulerTest, RunOnceEvictsExpired) {
    CleanupScheduler scheduler(store, 60000);
    touch("a");
    touch("b");
    clock.advance(minutes(31));
    touch("c");

    EXPECT_EQ(scheduler.run_once(), 2u);
    EXPECT_EQ(store.stats().total_sessions, 1u);
    EXPECT_EQ(provider.release_calls.load(), 2);
}

TEST_F(CleanupSchedulerTest, RunOnceWithNothingExpired) {
    CleanupScheduler scheduler(store, 60000);
    touch("a");
    EXPECT_EQ(scheduler.run_once(), 0u);
    EXPECT_EQ(store.stats().total_sessions, 1u);
}

TEST_F(CleanupSchedulerTest, ReleaseFailureDoesNotAbortSweep) {
    CleanupScheduler scheduler(store, 60000);
    touch("a");
    touch("b");
    provider.fail_release = true;
    clock.advance(minutes(31));

    EXPECT_EQ(scheduler.run_once(), 2u);
    EXPECT_EQ(store.stats().total_sessions, 0u);
}

TEST_F(CleanupSchedulerTest, SkipsLeasedEntry) {
    CleanupScheduler scheduler(store, 60000);
    auto held = store.resolve("busy");
    ASSERT_TRUE(held.is_ok());
    touch("idle");
    clock.advance(minutes(31));

    size_t evicted = 0;
    std::thread t([&] { evicted = scheduler.run_once(); });
    t.join();
    EXPECT_EQ(evicted, 1u);

    auto sessions = store.sessions();
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0].session_id, "busy");
}

TEST_F(CleanupSchedulerTest, StartStopIdempotent) {
    CleanupScheduler scheduler(store, 60000);
    EXPECT_FALSE(scheduler.is_running());

    scheduler.start();
    scheduler.start();
    EXPECT_TRUE(scheduler.is_running());

    scheduler.stop();
    scheduler.stop();
    EXPECT_FALSE(scheduler.is_running());
}

TEST_F(CleanupSchedulerTest, StopIsPrompt) {
    CleanupScheduler scheduler(store, 10 * 60 * 1000);
    scheduler.start();
    std::this_thread::sleep_for(milliseconds(20));

    auto before = steady_clock::now();
    scheduler.stop();
    auto took = duration_cast<milliseconds>(steady_clock::now() - before);
    EXPECT_LT(took.count(), 1000);
}

TEST_F(CleanupSchedulerTest, BackgroundSweepEvicts) {
    touch("a");
    clock.advance(minutes(31));

    CleanupScheduler scheduler(store, 20);
    scheduler.start();

    auto deadline = steady_clock::now() + seconds(5);
    while (store.stats().total_sessions > 0 && steady_clock::now() < deadline) {
        std::this_thread::sleep_for(milliseconds(10));
    }
    scheduler.stop();

    EXPECT_EQ(store.stats().total_sessions, 0u);
    EXPECT_TRUE(provider.handle(0)->released());
}

TEST_F(CleanupSchedulerTest, DestructorStopsThread) {
    {
        CleanupScheduler scheduler(store, 20);
        scheduler.start();
        std::this_thread::sleep_for(milliseconds(50));
    }
    SUCCEED();
}
