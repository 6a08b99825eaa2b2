#include "session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <cstring>
#include <cstdlib>

// libssh2_init is process-wide; run it once.
static bool init_libssh2() {
    static const int rc = [] {
        platform::init_networking();
        return libssh2_init(0);
    }();
    return rc == 0;
}

// Data passed to the keyboard-interactive callback via the session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

// Device firmware prompts for the password once; answer every prompt with it.
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);

    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

SessionManager::SessionManager(const ConnectionTarget& target, const ConnectionSettings& settings)
    : target_(target), settings_(settings), session_(nullptr), sock_(AVLINK_INVALID_SOCKET),
      target_str_(target.display()), io_mutex_(std::make_shared<std::mutex>()) {
}

SessionManager::~SessionManager() {
    close();
}

Result<void> SessionManager::establish(const CancelToken& cancel, StatusCallback callback) {
    if (callback) {
        callback("Connecting to " + target_str_ + "...");
    }

    if (!init_libssh2()) {
        return Result<void>::Err("Failed to initialize libssh2", ErrorKind::CONNECT_FAILED);
    }

    std::string error;
    sock_ = platform::tcp_connect(target_.host(), target_.port(),
                                  settings_.connect_timeout * 1000,
                                  [&cancel] { return cancel.is_cancelled(); }, error);
    if (sock_ == AVLINK_INVALID_SOCKET) {
        if (cancel.is_cancelled()) {
            return Result<void>::Err("Connect cancelled", ErrorKind::CANCELLED);
        }
        return Result<void>::Err(error, ErrorKind::CONNECT_FAILED);
    }

    if (callback) callback("TCP connected, starting SSH handshake...");

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        teardown("Session init failed");
        return Result<void>::Err("Failed to create SSH session", ErrorKind::CONNECT_FAILED);
    }

    libssh2_session_set_blocking(session_, 0);

    int ret;
    while ((ret = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (cancel.wait_for(std::chrono::milliseconds(SSH_HANDSHAKE_POLL_MS))) {
            teardown("Cancelled");
            return Result<void>::Err("Connect cancelled", ErrorKind::CANCELLED);
        }
    }

    if (ret != 0) {
        std::string detail = last_error();
        teardown("Handshake failed");
        return Result<void>::Err("SSH handshake failed: " + detail, ErrorKind::CONNECT_FAILED);
    }

    platform::enable_tcp_keepalive(sock_);

    if (settings_.keepalive_interval > 0) {
        libssh2_keepalive_config(session_, 1, settings_.keepalive_interval);
    }

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth_result = authenticate(cancel, callback);
    if (auth_result.is_err()) {
        teardown("Authentication failed");
        return auth_result;
    }

    active_ = true;
    avlink_log(fmt::format("session: established {}", target_str_));

    if (callback) {
        callback("Connected to " + target_str_);
    }

    return Result<void>::Ok();
}

Result<void> SessionManager::authenticate(const CancelToken& cancel, StatusCallback callback) {
    if (auto* key = std::get_if<PrivateKeyAuth>(&target_.identity())) {
        if (callback) callback("Using public key auth...");
        return auth_with_key(*key, cancel);
    }
    return auth_with_password(std::get<PasswordAuth>(target_.identity()), cancel, callback);
}

Result<void> SessionManager::auth_with_key(const PrivateKeyAuth& key, const CancelToken& cancel) {
    int ret;
    const char* passphrase = key.passphrase.empty() ? nullptr : key.passphrase.c_str();
    while ((ret = libssh2_userauth_publickey_fromfile_ex(
                session_, key.user.c_str(), static_cast<unsigned int>(key.user.length()),
                nullptr, key.key_path.c_str(), passphrase)) == LIBSSH2_ERROR_EAGAIN) {
        if (cancel.wait_for(std::chrono::milliseconds(SSH_HANDSHAKE_POLL_MS))) {
            return Result<void>::Err("Connect cancelled", ErrorKind::CANCELLED);
        }
    }

    if (ret != 0) {
        return Result<void>::Err(
            fmt::format("Public key authentication failed for {} ({})", key.user, last_error()),
            ErrorKind::CONNECT_FAILED);
    }
    return Result<void>::Ok();
}

Result<void> SessionManager::auth_with_password(const PasswordAuth& pw, const CancelToken& cancel,
                                                StatusCallback callback) {
    int ret;

    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, pw.user.c_str(),
                                              static_cast<unsigned int>(pw.user.length()))) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            break;
        }
        if (cancel.wait_for(std::chrono::milliseconds(SSH_HANDSHAKE_POLL_MS))) {
            return Result<void>::Err("Connect cancelled", ErrorKind::CANCELLED);
        }
    }

    std::string methods = auth_list ? auth_list : "";
    avlink_log(fmt::format("session: {} offers auth methods [{}]", target_str_, methods));

    if (methods.find("keyboard-interactive") != std::string::npos) {
        if (callback) callback("Using keyboard-interactive auth...");

        KbdAuthData kbd_data{pw.password, 0};
        *libssh2_session_abstract(session_) = &kbd_data;

        while ((ret = libssh2_userauth_keyboard_interactive(session_,
                pw.user.c_str(), kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            if (cancel.wait_for(std::chrono::milliseconds(SSH_HANDSHAKE_POLL_MS))) {
                *libssh2_session_abstract(session_) = nullptr;
                return Result<void>::Err("Connect cancelled", ErrorKind::CANCELLED);
            }
        }
        *libssh2_session_abstract(session_) = nullptr;

        if (ret == 0) {
            return Result<void>::Ok();
        }

        if (callback) callback("Keyboard-interactive failed, trying password...");
    }

    if (methods.empty() || methods.find("password") != std::string::npos) {
        if (callback) callback("Using password auth...");

        while ((ret = libssh2_userauth_password(session_,
                pw.user.c_str(), pw.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            if (cancel.wait_for(std::chrono::milliseconds(SSH_HANDSHAKE_POLL_MS))) {
                return Result<void>::Err("Connect cancelled", ErrorKind::CANCELLED);
            }
        }

        if (ret == 0) {
            return Result<void>::Ok();
        }
    }

    return Result<void>::Err(
        fmt::format("Authentication failed for {} (check username/password)", pw.user),
        ErrorKind::CONNECT_FAILED);
}

void SessionManager::teardown(const char* reason) {
    if (session_) {
        libssh2_session_disconnect(session_, reason);
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != AVLINK_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = AVLINK_INVALID_SOCKET;
    }
}

void SessionManager::close() {
    // Mark inactive first so concurrent operations bail out early
    active_ = false;

    // Each libssh2 call gets its own brief lock so a stuck disconnect
    // doesn't hold up the liveness probe for the whole sequence.
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

    if (sock_ != AVLINK_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = AVLINK_INVALID_SOCKET;
    }
}

bool SessionManager::is_active() const {
    return active_;
}

bool SessionManager::check_alive() {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!active_ || !session_ || sock_ == AVLINK_INVALID_SOCKET) return false;

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

void SessionManager::set_blocking(bool blocking) {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!session_) return;
    libssh2_session_set_blocking(session_, blocking ? 1 : 0);
    if (blocking) {
        libssh2_session_set_timeout(session_, static_cast<long>(settings_.connect_timeout) * 1000);
    }
}

std::string SessionManager::last_error() {
    if (!session_) return "no session";
    char* msg = nullptr;
    int len = 0;
    int code = libssh2_session_last_error(session_, &msg, &len, 0);
    if (msg && len > 0) {
        return fmt::format("{} ({})", std::string(msg, len), code);
    }
    return fmt::format("libssh2 error {}", code);
}
