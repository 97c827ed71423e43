#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include <ssh/session.hpp>
#include <ssh/exec_channel.hpp>
#include "sandbox_provider.hpp"

// A Python kernel process behind one exec channel.
class SshSandboxHandle : public SandboxHandle {
public:
    SshSandboxHandle(std::string id, std::shared_ptr<SshSession> session,
                     std::unique_ptr<ExecChannel> channel);

    const std::string& id() const override { return id_; }
    bool released() const override { return released_; }

private:
    friend class SshSandboxProvider;

    std::string id_;
    std::shared_ptr<SshSession> session_;    // outlives the channel
    std::unique_ptr<ExecChannel> channel_;
    std::mutex mutex_;                        // one run or release at a time
    std::atomic<bool> released_{false};
};

// Runs sandboxes as kernel processes on a remote host over SSH. The
// connection is made on first use and re-made if it drops; sandboxes opened
// on a dropped connection fail their next run and get replaced.
class SshSandboxProvider : public SandboxProvider {
public:
    explicit SshSandboxProvider(const ProviderConfig& config);
    ~SshSandboxProvider() override;

    std::string configuration_error() const override;

    Result<std::shared_ptr<SandboxHandle>> create_sandbox(int timeout_ms) override;
    Result<RunOutput> run_code(SandboxHandle& handle, const std::string& code,
                               int timeout_ms, OutputCallback on_output = nullptr) override;
    Result<void> release_sandbox(SandboxHandle& handle) override;

private:
    ProviderConfig config_;
    std::mutex session_mutex_;
    std::shared_ptr<SshSession> session_;

    Result<std::shared_ptr<SshSession>> ensure_session();
};
