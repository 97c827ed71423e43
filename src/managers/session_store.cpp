#include "session_store.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <exception>

// ── SessionLease ───────────────────────────────────────────

SessionLease& SessionLease::operator=(SessionLease&& other) noexcept {
    if (this != &other) {
        // Unlock before dropping our reference to the slot that owns the mutex.
        if (use_lock_.owns_lock()) use_lock_.unlock();
        use_lock_ = std::move(other.use_lock_);
        slot_ = std::move(other.slot_);
        sandbox_ = std::move(other.sandbox_);
        sandbox_id_ = std::move(other.sandbox_id_);
        execution_count_ = other.execution_count_;
        created_ = other.created_;
    }
    return *this;
}

void SessionLease::mark_broken() {
    if (!slot_) return;
    std::lock_guard<std::mutex> lock(slot_->state_mutex);
    if (slot_->entry && slot_->entry->sandbox == sandbox_) {
        slot_->entry->broken = true;
    }
}

// ── SessionStore ───────────────────────────────────────────

SessionStore::SessionStore(SandboxProvider& provider, ExpiryPolicy policy,
                           int sandbox_timeout_ms, NowFn now)
    : provider_(provider),
      policy_(policy),
      sandbox_timeout_ms_(sandbox_timeout_ms),
      now_(now ? std::move(now) : NowFn([] { return SteadyClock::now(); })) {}

SessionStore::~SessionStore() {
    size_t n = terminate_all();
    if (n > 0) {
        sandcache_log(fmt::format("store: released {} sandbox(es) on shutdown", n));
    }
}

void SessionStore::set_failure_hook(FailureHook hook) {
    std::lock_guard<std::mutex> lock(hook_mutex_);
    failure_hook_ = std::move(hook);
}

SessionStore::SlotSnapshot SessionStore::snapshot_slots() const {
    std::lock_guard<std::mutex> lock(map_mutex_);
    SlotSnapshot out(slots_.begin(), slots_.end());
    return out;
}

void SessionStore::erase_slot(const std::string& session_id,
                              const std::shared_ptr<SessionSlot>& slot) {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto it = slots_.find(session_id);
    if (it != slots_.end() && it->second == slot) {
        slots_.erase(it);
    }
}

void SessionStore::release_entry(const std::string& session_id, CacheEntry& entry) {
    std::string error;
    try {
        auto r = provider_.release_sandbox(*entry.sandbox);
        if (r.is_err()) error = r.error;
    } catch (const std::exception& e) {
        error = e.what();
    }

    if (error.empty()) {
        sandcache_log(fmt::format("store: released sandbox {} (session {})",
                                  entry.sandbox_id, session_id));
        return;
    }

    sandcache_log(fmt::format("store: failed to release sandbox {} (session {}): {}",
                              entry.sandbox_id, session_id, error));
    FailureHook hook;
    {
        std::lock_guard<std::mutex> lock(hook_mutex_);
        hook = failure_hook_;
    }
    if (hook) hook(session_id, entry.sandbox_id, error);
}

SessionLease SessionStore::make_lease(std::shared_ptr<SessionSlot> slot,
                                      std::unique_lock<std::mutex> use_lock,
                                      const CacheEntry& entry, bool created) {
    SessionLease lease;
    lease.slot_ = std::move(slot);
    lease.use_lock_ = std::move(use_lock);
    lease.sandbox_ = entry.sandbox;
    lease.sandbox_id_ = entry.sandbox_id;
    lease.execution_count_ = entry.execution_count;
    lease.created_ = created;
    return lease;
}

Result<SessionLease> SessionStore::resolve(const std::string& session_id) {
    for (;;) {
        std::shared_ptr<SessionSlot> slot;
        {
            std::lock_guard<std::mutex> lock(map_mutex_);
            auto& s = slots_[session_id];
            if (!s) s = std::make_shared<SessionSlot>();
            slot = s;
        }

        // Per-session lock: concurrent resolvers of this id queue here, so
        // only the first one that finds no valid entry creates a sandbox.
        std::unique_lock<std::mutex> use(slot->use_mutex);

        std::unique_ptr<CacheEntry> stale;
        std::string stale_reason;
        {
            std::lock_guard<std::mutex> state(slot->state_mutex);
            if (slot->retired) continue;  // evicted while we waited

            auto now = now_();
            if (slot->entry) {
                auto& entry = *slot->entry;
                ExpiryReason reason = policy_.evaluate(entry.times(), now);
                if (!entry.broken && reason == ExpiryReason::NONE) {
                    entry.last_used_at = std::max(now, entry.created_at);
                    entry.execution_count++;
                    return Result<SessionLease>::Ok(
                        make_lease(slot, std::move(use), entry, false));
                }
                stale_reason = entry.broken ? "broken" : expiry_reason_name(reason);
                stale = std::move(slot->entry);
            }
        }

        if (stale) {
            // Released without the use lock so the failure hook may call back
            // into the store. The slot is re-checked before creating.
            use.unlock();
            sandcache_log(fmt::format("store: replacing sandbox {} for session {} ({})",
                                      stale->sandbox_id, session_id, stale_reason));
            release_entry(session_id, *stale);
            continue;
        }

        auto created = provider_.create_sandbox(sandbox_timeout_ms_);
        if (created.is_err() || !created.value) {
            std::string err = created.is_err() ? created.error : "provider returned no sandbox";
            sandcache_log(fmt::format("store: create failed for session {}: {}",
                                      session_id, err));
            // No partial entry survives. Waiters on this slot retry on a fresh one.
            {
                std::lock_guard<std::mutex> state(slot->state_mutex);
                slot->retired = true;
            }
            erase_slot(session_id, slot);
            return Result<SessionLease>::Err("Failed to create sandbox: " + err);
        }

        auto entry = std::make_unique<CacheEntry>();
        entry->sandbox = created.value;
        entry->sandbox_id = created.value->id();
        entry->created_at = now_();
        entry->last_used_at = entry->created_at;
        entry->execution_count = 1;

        sandcache_log(fmt::format("store: created sandbox {} for session {}",
                                  entry->sandbox_id, session_id));

        std::lock_guard<std::mutex> state(slot->state_mutex);
        slot->entry = std::move(entry);
        return Result<SessionLease>::Ok(
            make_lease(slot, std::move(use), *slot->entry, true));
    }
}

void SessionStore::terminate(const std::string& session_id) {
    std::shared_ptr<SessionSlot> slot;
    {
        std::lock_guard<std::mutex> lock(map_mutex_);
        auto it = slots_.find(session_id);
        if (it == slots_.end()) {
            sandcache_log("store: terminate " + session_id + ": no sandbox");
            return;
        }
        slot = it->second;
    }

    std::unique_lock<std::mutex> use(slot->use_mutex);
    std::unique_ptr<CacheEntry> entry;
    {
        std::lock_guard<std::mutex> state(slot->state_mutex);
        if (slot->retired) return;  // already terminated or evicted
        entry = std::move(slot->entry);
        slot->retired = true;
    }
    erase_slot(session_id, slot);
    use.unlock();

    // The entry is gone from the store whether or not the release succeeds.
    if (entry) {
        sandcache_log(fmt::format("store: terminating sandbox {} for session {}",
                                  entry->sandbox_id, session_id));
        release_entry(session_id, *entry);
    }
}

size_t SessionStore::terminate_all() {
    size_t count = 0;
    for (const auto& kv : snapshot_slots()) {
        bool has_entry = false;
        {
            std::lock_guard<std::mutex> state(kv.second->state_mutex);
            has_entry = kv.second->entry != nullptr;
        }
        terminate(kv.first);
        if (has_entry) count++;
    }
    return count;
}

size_t SessionStore::sweep_expired() {
    size_t evicted = 0;
    size_t skipped = 0;

    for (const auto& kv : snapshot_slots()) {
        const std::string& session_id = kv.first;
        const auto& slot = kv.second;

        std::unique_lock<std::mutex> use(slot->use_mutex, std::try_to_lock);
        if (!use.owns_lock()) {
            skipped++;
            continue;
        }

        std::unique_ptr<CacheEntry> entry;
        std::string reason;
        {
            std::lock_guard<std::mutex> state(slot->state_mutex);
            if (slot->retired) continue;
            if (slot->entry) {
                // Re-evaluated under the slot lock: a use between snapshot and
                // now keeps the entry alive.
                ExpiryReason r = policy_.evaluate(slot->entry->times(), now_());
                if (!slot->entry->broken && r == ExpiryReason::NONE) continue;
                reason = slot->entry->broken ? "broken" : expiry_reason_name(r);
                entry = std::move(slot->entry);
            }
            slot->retired = true;
        }
        erase_slot(session_id, slot);
        use.unlock();

        if (!entry) continue;
        sandcache_log(fmt::format("store: evicting sandbox {} for session {} ({})",
                                  entry->sandbox_id, session_id, reason));
        release_entry(session_id, *entry);
        evicted++;
    }

    if (skipped > 0) {
        sandcache_log(fmt::format("store: sweep skipped {} busy session(s)", skipped));
    }
    return evicted;
}

PoolStats SessionStore::stats() const {
    PoolStats st;
    auto now = now_();
    for (const auto& kv : snapshot_slots()) {
        std::lock_guard<std::mutex> state(kv.second->state_mutex);
        const auto& entry = kv.second->entry;
        if (!entry) continue;
        st.total_sessions++;
        st.total_executions += entry->execution_count;
        if (!entry->broken && policy_.is_valid(entry->times(), now)) {
            st.active_sessions++;
        }
    }
    return st;
}

std::vector<SessionSummary> SessionStore::sessions() const {
    std::vector<SessionSummary> out;
    auto now = now_();
    for (const auto& kv : snapshot_slots()) {
        std::lock_guard<std::mutex> state(kv.second->state_mutex);
        const auto& entry = kv.second->entry;
        if (!entry) continue;

        SessionSummary s;
        s.session_id = kv.first;
        s.sandbox_id = entry->sandbox_id;
        s.age_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now - entry->created_at).count();
        s.idle_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now - entry->last_used_at).count();
        s.execution_count = entry->execution_count;
        s.broken = entry->broken;
        s.active = !entry->broken && policy_.is_valid(entry->times(), now);
        out.push_back(std::move(s));
    }
    std::sort(out.begin(), out.end(), [](const SessionSummary& a, const SessionSummary& b) {
        return a.session_id < b.session_id;
    });
    return out;
}
