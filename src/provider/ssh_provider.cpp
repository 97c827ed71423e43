#include "ssh_provider.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <ssh/frame_protocol.hpp>
#include <environments/kernel_template.hpp>
#include <fmt/format.h>

SshSandboxHandle::SshSandboxHandle(std::string id, std::shared_ptr<SshSession> session,
                                   std::unique_ptr<ExecChannel> channel)
    : id_(std::move(id)), session_(std::move(session)), channel_(std::move(channel)) {}

// ── SshSandboxProvider ──────────────────────────────────────

SshSandboxProvider::SshSandboxProvider(const ProviderConfig& config)
    : config_(config) {}

SshSandboxProvider::~SshSandboxProvider() {
    std::lock_guard<std::mutex> lock(session_mutex_);
    session_.reset();
}

std::string SshSandboxProvider::configuration_error() const {
    if (config_.host.empty()) {
        return "no host configured (set provider.host or SANDCACHE_HOST)";
    }
    if (config_.user.empty()) {
        return "no user configured (set provider.user or SANDCACHE_USER)";
    }
    if (!config_.ssh_key_path && config_.password.empty()) {
        return "no credential configured (set provider.ssh_key_path, SANDCACHE_SSH_KEY "
               "or SANDCACHE_PASSWORD)";
    }
    return "";
}

Result<std::shared_ptr<SshSession>> SshSandboxProvider::ensure_session() {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (session_ && session_->check_alive()) {
        return Result<std::shared_ptr<SshSession>>::Ok(session_);
    }

    if (session_) {
        sandcache_log("ssh: connection to " + session_->get_target() + " lost, reconnecting");
    }

    SessionTarget target;
    target.host = config_.host;
    target.port = config_.port;
    target.user = config_.user;
    target.password = config_.password;
    target.ssh_key_path = config_.ssh_key_path;
    target.timeout = config_.connect_timeout;

    // Older sessions stay alive as long as a handle still references them
    auto session = std::make_shared<SshSession>(target);
    auto result = session->establish([](const std::string& msg) {
        sandcache_log("ssh: " + msg);
    });
    if (result.failed()) {
        return Result<std::shared_ptr<SshSession>>::Err(result.stderr_data);
    }

    session_ = session;
    return Result<std::shared_ptr<SshSession>>::Ok(session_);
}

Result<std::shared_ptr<SandboxHandle>> SshSandboxProvider::create_sandbox(int timeout_ms) {
    std::string cfg_err = configuration_error();
    if (!cfg_err.empty()) {
        return Result<std::shared_ptr<SandboxHandle>>::Err(cfg_err);
    }

    auto session = ensure_session();
    if (session.is_err()) {
        return Result<std::shared_ptr<SandboxHandle>>::Err(session.error);
    }

    auto channel = std::make_unique<ExecChannel>(session.value->get_raw_session(),
                                                 session.value->io_mutex());
    auto opened = channel->open(kernel_launch_command(config_.python), timeout_ms);
    if (opened.failed()) {
        return Result<std::shared_ptr<SandboxHandle>>::Err(opened.stderr_data);
    }

    // Wait for the kernel to announce itself
    std::string kernel_id;
    auto status = channel->read_lines([&](const std::string& line) {
        Frame frame = parse_frame_line(line);
        if (frame.type != FrameType::READY) return false;
        kernel_id = frame.fields[0];
        return true;
    }, timeout_ms);

    if (status != ReadStatus::COMPLETE || kernel_id.empty()) {
        std::string detail = channel->stderr_tail();
        trim(detail);
        channel->close();
        std::string err = (status == ReadStatus::TIMED_OUT)
            ? fmt::format("kernel did not start within {} ms", timeout_ms)
            : "kernel exited during startup";
        if (!detail.empty()) err += ": " + detail;
        return Result<std::shared_ptr<SandboxHandle>>::Err(err);
    }

    sandcache_log(fmt::format("ssh: kernel {} ready on {}", kernel_id,
                              session.value->get_target()));
    std::shared_ptr<SandboxHandle> handle = std::make_shared<SshSandboxHandle>(
        kernel_id, session.value, std::move(channel));
    return Result<std::shared_ptr<SandboxHandle>>::Ok(handle);
}

Result<RunOutput> SshSandboxProvider::run_code(SandboxHandle& handle, const std::string& code,
                                               int timeout_ms, OutputCallback on_output) {
    auto* ssh_handle = dynamic_cast<SshSandboxHandle*>(&handle);
    if (!ssh_handle) {
        return Result<RunOutput>::Err("Sandbox " + handle.id() + " does not belong to this provider");
    }

    std::lock_guard<std::mutex> lock(ssh_handle->mutex_);
    if (ssh_handle->released_ || !ssh_handle->channel_->is_open()) {
        return Result<RunOutput>::Err("Sandbox " + handle.id() + " has been released");
    }

    auto sent = ssh_handle->channel_->write_all(build_run_frame(code));
    if (sent.failed()) {
        return Result<RunOutput>::Err(sent.stderr_data);
    }

    FrameCollector collector(std::move(on_output));
    auto status = ssh_handle->channel_->read_lines([&](const std::string& line) {
        return collector.feed(line);
    }, timeout_ms);

    switch (status) {
        case ReadStatus::COMPLETE:
            return Result<RunOutput>::Ok(collector.take());
        case ReadStatus::TIMED_OUT:
            return Result<RunOutput>::Err(
                fmt::format("Execution timed out after {} ms", timeout_ms));
        case ReadStatus::CLOSED: {
            std::string detail = ssh_handle->channel_->stderr_tail();
            trim(detail);
            return Result<RunOutput>::Err(detail.empty()
                ? "Sandbox kernel exited"
                : "Sandbox kernel exited: " + detail);
        }
        case ReadStatus::READ_ERROR:
            break;
    }
    return Result<RunOutput>::Err("SSH channel read error");
}

Result<void> SshSandboxProvider::release_sandbox(SandboxHandle& handle) {
    auto* ssh_handle = dynamic_cast<SshSandboxHandle*>(&handle);
    if (!ssh_handle) {
        return Result<void>::Err("Sandbox " + handle.id() + " does not belong to this provider");
    }

    std::lock_guard<std::mutex> lock(ssh_handle->mutex_);
    if (ssh_handle->released_.exchange(true)) {
        return Result<void>::Ok();
    }

    ssh_handle->channel_->close();
    sandcache_log("ssh: kernel " + handle.id() + " released");
    return Result<void>::Ok();
}
