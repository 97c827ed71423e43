#include "session.hpp"
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <mutex>

static bool init_libssh2() {
    static std::once_flag once;
    static int rc = -1;
    std::call_once(once, [] { rc = libssh2_init(0); });
    return rc == 0;
}

SshSession::SshSession(const SessionTarget& target)
    : target_(target), session_(nullptr), sock_(SANDCACHE_INVALID_SOCKET), active_(false),
      io_mutex_(std::make_shared<std::mutex>()) {
}

SshSession::~SshSession() {
    close();
}

SSHResult SshSession::establish(StatusCallback callback) {
    if (callback) {
        callback(fmt::format("Connecting to {}:{}...", target_.host, target_.port));
    }

    if (!init_libssh2()) {
        return SSHResult{-1, "", "Failed to initialize libssh2"};
    }

    auto conn = platform::connect_tcp(target_.host, target_.port, target_.timeout * 1000);
    if (conn.is_err()) {
        return SSHResult{-1, "", conn.error};
    }
    sock_ = conn.value;

    if (callback) callback("TCP connected, starting SSH handshake...");

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        platform::close_socket(sock_);
        sock_ = SANDCACHE_INVALID_SOCKET;
        return SSHResult{-1, "", "Failed to create SSH session"};
    }

    libssh2_session_set_blocking(session_, 0);

    // SSH handshake (key exchange)
    int ret;
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(100);
    }

    if (ret != 0) {
        libssh2_session_disconnect(session_, "Handshake failed");
        libssh2_session_free(session_);
        session_ = nullptr;
        platform::close_socket(sock_);
        sock_ = SANDCACHE_INVALID_SOCKET;
        return SSHResult{-1, "", "SSH handshake failed"};
    }

    // Send SSH keepalive every 30s
    libssh2_keepalive_config(session_, 1, 30);

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth_result = ssh_userauth(callback);
    if (auth_result.failed()) {
        libssh2_session_disconnect(session_, "Authentication failed");
        libssh2_session_free(session_);
        session_ = nullptr;
        platform::close_socket(sock_);
        sock_ = SANDCACHE_INVALID_SOCKET;
        return auth_result;
    }

    active_ = true;
    target_str_ = target_.user + "@" + target_.host;

    if (callback) {
        callback("Connected to " + target_str_);
    }

    return SSHResult{0, "", ""};
}

SSHResult SshSession::ssh_userauth(StatusCallback callback) {
    int ret;

    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, target_.user.c_str(),
                                              target_.user.length())) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            break;
        }
        platform::sleep_ms(100);
    }

    std::string methods = auth_list ? auth_list : "";
    if (callback && !methods.empty()) {
        callback("Auth methods: " + methods);
    }

    if (target_.ssh_key_path && methods.find("publickey") != std::string::npos) {
        if (callback) callback("Using public key " + *target_.ssh_key_path + "...");

        const char* passphrase = target_.password.empty() ? nullptr : target_.password.c_str();
        while ((ret = libssh2_userauth_publickey_fromfile(session_, target_.user.c_str(),
                nullptr, target_.ssh_key_path->c_str(), passphrase)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(100);
        }

        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }

        if (callback) callback("Public key rejected, trying password...");
    }

    if (!target_.password.empty() &&
        (methods.empty() || methods.find("password") != std::string::npos)) {
        if (callback) callback("Using password auth...");

        while ((ret = libssh2_userauth_password(session_,
                target_.user.c_str(), target_.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(100);
        }

        if (ret == 0) {
            if (callback) callback("Authentication successful");
            return SSHResult{0, "", ""};
        }
    }

    return SSHResult{-1, "", "Authentication failed (check user, key or password)"};
}

void SshSession::close() {
    // Mark inactive first so concurrent operations bail out early
    active_ = false;

    // Each libssh2 call gets its own brief lock
    if (session_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_disconnect(session_, "Normal disconnection");
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_free(session_);
        }
        session_ = nullptr;
    }

    if (sock_ != SANDCACHE_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = SANDCACHE_INVALID_SOCKET;
    }
}

bool SshSession::is_active() const {
    return active_;
}

bool SshSession::check_alive() {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!active_ || !session_ || sock_ == SANDCACHE_INVALID_SOCKET) return false;

    int seconds_to_next = 0;
    int ret = libssh2_keepalive_send(session_, &seconds_to_next);
    if (ret != 0 && ret != LIBSSH2_ERROR_EAGAIN) {
        active_ = false;
        return false;
    }

    int revents = platform::poll_socket(sock_, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        active_ = false;
        return false;
    }

    return true;
}
