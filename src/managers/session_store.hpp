#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <functional>
#include <unordered_map>
#include <core/types.hpp>
#include <provider/sandbox_provider.hpp>
#include "expiry_policy.hpp"

// One live remote sandbox bound to a session.
struct CacheEntry {
    std::shared_ptr<SandboxHandle> sandbox;   // exclusively owned; released once
    std::string sandbox_id;
    TimePoint created_at;
    TimePoint last_used_at;
    uint64_t execution_count = 0;
    bool broken = false;                      // transport failure seen; replace on next use

    EntryTimes times() const { return {created_at, last_used_at}; }
};

// Per-session slot. use_mutex is held by a lease for the whole foreground
// call; state_mutex guards entry/retired and is only ever held briefly.
// A retired slot has been removed from the map and must not be reused.
struct SessionSlot {
    std::mutex use_mutex;
    std::mutex state_mutex;
    std::unique_ptr<CacheEntry> entry;
    bool retired = false;
};

// Exclusive hold on a session's sandbox for one call. While a lease is alive
// the sweep skips the session and other callers for it wait.
class SessionLease {
public:
    SessionLease() = default;
    ~SessionLease() = default;

    SessionLease(SessionLease&& other) noexcept = default;
    SessionLease& operator=(SessionLease&& other) noexcept;
    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;

    explicit operator bool() const { return sandbox_ != nullptr; }

    SandboxHandle& sandbox() const { return *sandbox_; }
    const std::string& sandbox_id() const { return sandbox_id_; }

    // Entry's execution count including this call.
    uint64_t execution_count() const { return execution_count_; }

    // True if this resolve created the sandbox (false on reuse).
    bool created() const { return created_; }

    // Flag the entry so the next resolve replaces it.
    void mark_broken();

private:
    friend class SessionStore;

    // Declaration order matters: the lock must be released before the slot.
    std::shared_ptr<SessionSlot> slot_;
    std::unique_lock<std::mutex> use_lock_;
    std::shared_ptr<SandboxHandle> sandbox_;
    std::string sandbox_id_;
    uint64_t execution_count_ = 0;
    bool created_ = false;
};

// Session id -> cache entry, with single-flight creation per session.
// The map lock is never held across a provider call.
class SessionStore {
public:
    using NowFn = std::function<TimePoint()>;
    using FailureHook = std::function<void(const std::string& session_id,
                                           const std::string& sandbox_id,
                                           const std::string& error)>;

    SessionStore(SandboxProvider& provider, ExpiryPolicy policy,
                 int sandbox_timeout_ms, NowFn now = nullptr);

    // Releases every remaining sandbox.
    ~SessionStore();

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    // Reuse the session's valid entry or create one. Concurrent calls for the
    // same id that find no valid entry create exactly one sandbox.
    Result<SessionLease> resolve(const std::string& session_id);

    // Idempotent. Waits for an in-flight lease on the same session.
    void terminate(const std::string& session_id);

    // Release everything. Returns how many sessions were terminated.
    size_t terminate_all();

    // Evict expired or broken entries not currently leased. Returns the count.
    size_t sweep_expired();

    PoolStats stats() const;
    std::vector<SessionSummary> sessions() const;

    // Called for every failed release (eviction, termination, replacement),
    // with no store lock held.
    void set_failure_hook(FailureHook hook);

    const ExpiryPolicy& policy() const { return policy_; }
    TimePoint now() const { return now_(); }

private:
    SandboxProvider& provider_;
    ExpiryPolicy policy_;
    int sandbox_timeout_ms_;
    NowFn now_;

    mutable std::mutex map_mutex_;
    std::unordered_map<std::string, std::shared_ptr<SessionSlot>> slots_;

    std::mutex hook_mutex_;
    FailureHook failure_hook_;

    using SlotSnapshot = std::vector<std::pair<std::string, std::shared_ptr<SessionSlot>>>;
    SlotSnapshot snapshot_slots() const;

    // Remove the slot from the map if it is still the one registered for id.
    void erase_slot(const std::string& session_id, const std::shared_ptr<SessionSlot>& slot);

    // Release the remote sandbox, logging and reporting any failure.
    void release_entry(const std::string& session_id, CacheEntry& entry);

    static SessionLease make_lease(std::shared_ptr<SessionSlot> slot,
                                   std::unique_lock<std::mutex> use_lock,
                                   const CacheEntry& entry, bool created);
};
