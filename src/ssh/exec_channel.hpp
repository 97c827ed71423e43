#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>

typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

enum class ReadStatus {
    COMPLETE,        // on_line asked to stop
    TIMED_OUT,
    CLOSED,          // remote process exited
    READ_ERROR,
};

// A long-lived exec channel (no PTY) carrying a line-oriented conversation
// with one remote process. Not thread-safe: one caller at a time.
class ExecChannel {
public:
    ExecChannel(LIBSSH2_SESSION* session, std::shared_ptr<std::mutex> io_mutex);
    ~ExecChannel();

    ExecChannel(const ExecChannel&) = delete;
    ExecChannel& operator=(const ExecChannel&) = delete;

    // Open the channel and exec the command.
    SSHResult open(const std::string& command, int timeout_ms);

    SSHResult write_all(const std::string& data);

    // Feed complete stdout lines to on_line until it returns true, the
    // deadline passes, or the channel closes. Partial lines carry over.
    ReadStatus read_lines(const std::function<bool(const std::string&)>& on_line,
                          int timeout_ms);

    // EOF, close and free. Idempotent.
    void close();

    bool is_open() const { return channel_ != nullptr; }

    // Last bytes the remote process wrote to stderr (diagnostics only).
    const std::string& stderr_tail() const { return stderr_tail_; }

private:
    LIBSSH2_SESSION* session_;
    LIBSSH2_CHANNEL* channel_ = nullptr;
    std::shared_ptr<std::mutex> io_mutex_;
    std::string pending_;
    std::string stderr_tail_;

    void drain_stderr();
};
