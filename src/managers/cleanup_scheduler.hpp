#pragma once

#include <atomic>
#include <cstdint>
#include <thread>
#include <mutex>
#include "session_store.hpp"

// Background thread that sweeps the store for expired sessions at a fixed
// interval. stop() returns within one tick of being called.
class CleanupScheduler {
public:
    CleanupScheduler(SessionStore& store, int64_t interval_ms);
    ~CleanupScheduler();

    CleanupScheduler(const CleanupScheduler&) = delete;
    CleanupScheduler& operator=(const CleanupScheduler&) = delete;

    // Idempotent.
    void start();
    void stop();
    bool is_running() const { return running_; }

    // One sweep on the calling thread. Returns the number evicted.
    size_t run_once();

    int64_t interval_ms() const { return interval_ms_; }

private:
    void scheduler_loop();

    SessionStore& store_;
    int64_t interval_ms_;
    std::atomic<bool> running_{false};
    std::thread thread_;
    std::mutex lifecycle_mutex_;
    std::mutex sweep_mutex_;    // one sweep at a time
};
