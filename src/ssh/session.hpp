#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <core/types.hpp>
#include <platform/socket_util.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

struct SessionTarget {
    std::string host;
    int port = DEFAULT_SSH_PORT;
    std::string user;
    std::string password;                       // also the key passphrase
    std::optional<std::string> ssh_key_path;
    int timeout = DEFAULT_CONNECT_TIMEOUT_SECS;
};

// One authenticated libssh2 transport in non-blocking mode. Channels opened
// on it share io_mutex(); every libssh2 call takes it briefly.
class SshSession {
public:
    explicit SshSession(const SessionTarget& target);
    ~SshSession();

    SshSession(const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    SSHResult establish(StatusCallback callback = nullptr);
    void close();
    bool is_active() const;

    // Keepalive probe; marks the session inactive if the peer is gone.
    bool check_alive();

    LIBSSH2_SESSION* get_raw_session() { return session_; }
    const std::string& get_target() const { return target_str_; }
    std::shared_ptr<std::mutex> io_mutex() { return io_mutex_; }

private:
    SessionTarget target_;
    LIBSSH2_SESSION* session_;
    socket_t sock_;
    std::atomic<bool> active_;
    std::string target_str_;
    std::shared_ptr<std::mutex> io_mutex_;

    SSHResult ssh_userauth(StatusCallback callback);
};
