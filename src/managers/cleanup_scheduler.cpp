#include "cleanup_scheduler.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <exception>

// ── Construction / Destruction ──────────────────────────────

CleanupScheduler::CleanupScheduler(SessionStore& store, int64_t interval_ms)
    : store_(store), interval_ms_(std::max<int64_t>(interval_ms, 1)) {}

CleanupScheduler::~CleanupScheduler() {
    stop();
}

// ── Lifecycle ───────────────────────────────────────────────

void CleanupScheduler::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_) return;

    running_ = true;
    thread_ = std::thread(&CleanupScheduler::scheduler_loop, this);
    sandcache_log(fmt::format("sweep: background job started (every {}ms)", interval_ms_));
}

void CleanupScheduler::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_ && !thread_.joinable()) return;

    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    sandcache_log("sweep: background job stopped");
}

// ── Sweep ───────────────────────────────────────────────────

size_t CleanupScheduler::run_once() {
    std::lock_guard<std::mutex> lock(sweep_mutex_);
    sandcache_log("sweep: running sweep");

    size_t evicted = 0;
    try {
        evicted = store_.sweep_expired();
    } catch (const std::exception& e) {
        sandcache_log(fmt::format("sweep: sweep error: {}", e.what()));
        return 0;
    }

    sandcache_log(fmt::format("sweep: complete, terminated {} expired session(s)", evicted));
    return evicted;
}

void CleanupScheduler::scheduler_loop() {
    while (running_) {
        // Sleep the interval in ticks for responsive shutdown
        int64_t waited = 0;
        while (running_ && waited < interval_ms_) {
            int64_t step = std::min<int64_t>(SCHEDULER_TICK_MS, interval_ms_ - waited);
            std::this_thread::sleep_for(std::chrono::milliseconds(step));
            waited += step;
        }
        if (!running_) break;

        run_once();
    }
}
