#include "exec_channel.hpp"
#include <core/constants.hpp>
#include <libssh2.h>
#include <chrono>
#include <thread>

static constexpr size_t STDERR_TAIL_MAX = 4096;

static std::chrono::steady_clock::time_point deadline_after(int timeout_ms) {
    return std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
}

ExecChannel::ExecChannel(LIBSSH2_SESSION* session, std::shared_ptr<std::mutex> io_mutex)
    : session_(session), io_mutex_(std::move(io_mutex)) {}

ExecChannel::~ExecChannel() {
    close();
}

SSHResult ExecChannel::open(const std::string& command, int timeout_ms) {
    if (!session_) {
        return SSHResult{-1, "", "No session available"};
    }
    if (channel_) {
        return SSHResult{-1, "", "Channel already open"};
    }

    auto deadline = deadline_after(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            channel_ = libssh2_channel_open_session(session_);
            if (!channel_ && libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
                return SSHResult{-1, "", "Failed to open exec channel"};
            }
        }
        if (channel_) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (!channel_) {
        return SSHResult{-1, "", "Timed out opening exec channel"};
    }

    int rc = LIBSSH2_ERROR_EAGAIN;
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_exec(channel_, command.c_str());
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (rc != 0) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_channel_free(channel_);
        }
        channel_ = nullptr;
        return SSHResult{-1, "", rc == LIBSSH2_ERROR_EAGAIN
                                     ? "Timed out starting remote command"
                                     : "Failed to exec command on channel"};
    }

    return SSHResult{0, "", ""};
}

SSHResult ExecChannel::write_all(const std::string& data) {
    if (!channel_) {
        return SSHResult{-1, "", "No channel available"};
    }

    size_t sent = 0;
    int write_retries = 0;
    while (sent < data.size()) {
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            w = libssh2_channel_write(channel_, data.data() + sent, data.size() - sent);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            if (++write_retries > SSH_WRITE_MAX_RETRIES) {
                return SSHResult{-1, "", "Write stalled (EAGAIN for too long)"};
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }
        if (w < 0) {
            return SSHResult{-1, "", "Channel write error"};
        }
        write_retries = 0;
        sent += static_cast<size_t>(w);
    }
    return SSHResult{0, "", ""};
}

void ExecChannel::drain_stderr() {
    char buf[SSH_READ_BUF_SIZE];
    while (true) {
        ssize_t n;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            n = libssh2_channel_read_stderr(channel_, buf, sizeof(buf));
        }
        if (n <= 0) break;
        stderr_tail_.append(buf, static_cast<size_t>(n));
    }
    if (stderr_tail_.size() > STDERR_TAIL_MAX) {
        stderr_tail_.erase(0, stderr_tail_.size() - STDERR_TAIL_MAX);
    }
}

ReadStatus ExecChannel::read_lines(const std::function<bool(const std::string&)>& on_line,
                                   int timeout_ms) {
    if (!channel_) return ReadStatus::READ_ERROR;

    // Lines left over from the previous read come first
    size_t nl;
    while ((nl = pending_.find('\n')) != std::string::npos) {
        std::string line = pending_.substr(0, nl);
        pending_.erase(0, nl + 1);
        if (on_line(line)) return ReadStatus::COMPLETE;
    }

    char buf[SSH_READ_BUF_SIZE];
    auto deadline = deadline_after(timeout_ms);

    while (std::chrono::steady_clock::now() < deadline) {
        ssize_t n;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            n = libssh2_channel_read(channel_, buf, sizeof(buf));
        }
        if (n > 0) {
            pending_.append(buf, static_cast<size_t>(n));
            while ((nl = pending_.find('\n')) != std::string::npos) {
                std::string line = pending_.substr(0, nl);
                pending_.erase(0, nl + 1);
                if (on_line(line)) return ReadStatus::COMPLETE;
            }
        } else if (n == 0 || n == LIBSSH2_ERROR_EAGAIN) {
            // Keep the stderr window from filling up and stalling the process
            drain_stderr();
            bool eof;
            {
                std::lock_guard<std::mutex> lock(*io_mutex_);
                eof = libssh2_channel_eof(channel_);
            }
            if (eof) return ReadStatus::CLOSED;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        } else {
            return ReadStatus::READ_ERROR;
        }
    }

    return ReadStatus::TIMED_OUT;
}

void ExecChannel::close() {
    if (!channel_) return;

    int rc;
    int retries = 0;
    do {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_send_eof(channel_);
        }
        if (rc == LIBSSH2_ERROR_EAGAIN) std::this_thread::sleep_for(std::chrono::milliseconds(10));
    } while (rc == LIBSSH2_ERROR_EAGAIN && ++retries < SSH_WRITE_MAX_RETRIES);

    retries = 0;
    do {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            rc = libssh2_channel_close(channel_);
        }
        if (rc == LIBSSH2_ERROR_EAGAIN) std::this_thread::sleep_for(std::chrono::milliseconds(10));
    } while (rc == LIBSSH2_ERROR_EAGAIN && ++retries < SSH_WRITE_MAX_RETRIES);

    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        libssh2_channel_free(channel_);
    }
    channel_ = nullptr;
    pending_.clear();
}
