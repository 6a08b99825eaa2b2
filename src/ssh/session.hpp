#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include <core/cancel_token.hpp>
#include <platform/socket_util.hpp>
#include "target.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// One authenticated SSH session over one TCP socket. Channels (shell, SFTP)
// are opened on top of it by their clients. All libssh2 calls on the
// session go through io_mutex().
class SessionManager {
public:
    SessionManager(const ConnectionTarget& target, const ConnectionSettings& settings);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // TCP connect, handshake and authentication. Leaves the session in
    // non-blocking mode. The cancel token aborts between polling slices.
    Result<void> establish(const CancelToken& cancel, StatusCallback callback = nullptr);
    void close();
    bool is_active() const;

    // Send a keepalive and check the socket. Marks the session inactive on failure.
    bool check_alive();

    // Blocking mode with a per-call timeout (used by the SFTP client).
    void set_blocking(bool blocking);

    LIBSSH2_SESSION* raw() { return session_; }
    socket_t socket() const { return sock_; }
    const std::string& target_str() const { return target_str_; }
    std::shared_ptr<std::mutex> io_mutex() { return io_mutex_; }

    // Human readable description of the last libssh2 error on this session.
    std::string last_error();

private:
    ConnectionTarget target_;
    ConnectionSettings settings_;
    LIBSSH2_SESSION* session_;
    socket_t sock_;
    std::atomic<bool> active_{false};
    std::string target_str_;
    std::shared_ptr<std::mutex> io_mutex_;

    Result<void> authenticate(const CancelToken& cancel, StatusCallback callback);
    Result<void> auth_with_key(const PrivateKeyAuth& key, const CancelToken& cancel);
    Result<void> auth_with_password(const PasswordAuth& pw, const CancelToken& cancel,
                                    StatusCallback callback);
    void teardown(const char* reason);
};
