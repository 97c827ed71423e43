#pragma once

#include <memory>
#include <string>
#include <vector>
#include <mutex>
#include <core/types.hpp>
#include <provider/sandbox_provider.hpp>
#include "session_store.hpp"
#include "code_executor.hpp"
#include "cleanup_scheduler.hpp"

// Lifecycle API: owns the session store, executor and cleanup scheduler for
// one provider. Several pools may coexist; nothing here is global.
class SandboxPool {
public:
    SandboxPool(std::shared_ptr<SandboxProvider> provider, const PoolConfig& config,
                SessionStore::NowFn now = nullptr);

    // Runs shutdown().
    ~SandboxPool();

    SandboxPool(const SandboxPool&) = delete;
    SandboxPool& operator=(const SandboxPool&) = delete;

    // Never throws. Failures come back in ExecutionResult::error.
    ExecutionResult execute(const std::string& session_id, const std::string& code);

    // Idempotent.
    void terminate(const std::string& session_id);

    PoolStats stats() const;
    std::vector<SessionSummary> sessions() const;

    // Run one cleanup sweep now. Returns the number of sessions evicted.
    size_t sweep_now();

    // Start the background cleanup job.
    void start();

    // Stop the cleanup job and release every sandbox. Idempotent.
    void shutdown();

    bool scheduler_running() const { return scheduler_.is_running(); }
    int64_t sweep_interval_ms() const { return scheduler_.interval_ms(); }

    void set_failure_hook(SessionStore::FailureHook hook);

    const PoolConfig& config() const { return config_; }
    SandboxProvider& provider() { return *provider_; }

private:
    // Declaration order is destruction order in reverse: the scheduler stops
    // before the store goes, and the store releases before the provider goes.
    std::shared_ptr<SandboxProvider> provider_;
    PoolConfig config_;
    SessionStore store_;
    CodeExecutor executor_;
    CleanupScheduler scheduler_;
    std::mutex shutdown_mutex_;
};
