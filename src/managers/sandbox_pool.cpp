#include "sandbox_pool.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <chrono>

static int64_t minutes_to_ms(int minutes) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::minutes(minutes)).count();
}

SandboxPool::SandboxPool(std::shared_ptr<SandboxProvider> provider, const PoolConfig& config,
                         SessionStore::NowFn now)
    : provider_(std::move(provider)),
      config_(config),
      store_(*provider_, ExpiryPolicy::from_config(config_), config_.sandbox_timeout_ms,
             std::move(now)),
      executor_(store_, *provider_, config_.execution_timeout_ms),
      scheduler_(store_, minutes_to_ms(config_.sweep_interval_minutes)) {
    std::string cfg_err = provider_->configuration_error();
    if (!cfg_err.empty()) {
        sandcache_log(fmt::format("pool: WARNING provider not configured ({}). "
                                  "Execution will fail.", cfg_err));
    }
    sandcache_log(fmt::format("pool: idle timeout {}m, max lifetime {}m, sweep every {}m",
                              config_.idle_timeout_minutes, config_.max_lifetime_minutes,
                              config_.sweep_interval_minutes));
}

SandboxPool::~SandboxPool() {
    shutdown();
}

ExecutionResult SandboxPool::execute(const std::string& session_id, const std::string& code) {
    return executor_.execute(session_id, code);
}

void SandboxPool::terminate(const std::string& session_id) {
    store_.terminate(session_id);
}

PoolStats SandboxPool::stats() const {
    return store_.stats();
}

std::vector<SessionSummary> SandboxPool::sessions() const {
    return store_.sessions();
}

size_t SandboxPool::sweep_now() {
    return scheduler_.run_once();
}

void SandboxPool::start() {
    scheduler_.start();
}

void SandboxPool::shutdown() {
    std::lock_guard<std::mutex> lock(shutdown_mutex_);
    scheduler_.stop();
    size_t n = store_.terminate_all();
    if (n > 0) {
        sandcache_log(fmt::format("pool: shutdown released {} sandbox(es)", n));
    }
}

void SandboxPool::set_failure_hook(SessionStore::FailureHook hook) {
    store_.set_failure_hook(std::move(hook));
}
