#include "shell_channel.hpp"
#include "session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <vector>

Result<std::shared_ptr<ShellChannel>> ShellChannel::open(std::shared_ptr<SessionManager> session,
                                                         const TerminalGeometry& geometry) {
    using R = Result<std::shared_ptr<ShellChannel>>;
    if (!session || !session->is_active()) {
        return R::Err("Shell session is not connected", ErrorKind::CONNECT_FAILED);
    }

    auto io_mtx = session->io_mutex();
    LIBSSH2_SESSION* ssh = session->raw();
    LIBSSH2_CHANNEL* ch = nullptr;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(SSH_CONNECT_TIMEOUT_SECS);
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(*io_mtx);
            ch = libssh2_channel_open_session(ssh);
            if (!ch && libssh2_session_last_errno(ssh) != LIBSSH2_ERROR_EAGAIN)
                return R::Err("Failed to open SSH channel: " + session->last_error(),
                              ErrorKind::CONNECT_FAILED);
        }
        if (ch) break;
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
    if (!ch) {
        return R::Err("Timed out opening SSH channel", ErrorKind::TIMEOUT);
    }

    // From here on the channel is owned and freed by the handle
    auto channel = std::make_shared<ShellChannel>(ch, session, geometry.buffer_size);

    int ret;
    do {
        {
            std::lock_guard<std::mutex> lock(*io_mtx);
            ret = libssh2_channel_request_pty_ex(
                ch, geometry.type.c_str(), static_cast<unsigned int>(geometry.type.length()),
                nullptr, 0, geometry.columns, geometry.rows,
                geometry.width_px, geometry.height_px);
        }
        if (ret == LIBSSH2_ERROR_EAGAIN) platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    } while (ret == LIBSSH2_ERROR_EAGAIN);
    if (ret != 0) {
        return R::Err("Failed to request PTY: " + session->last_error(), ErrorKind::CONNECT_FAILED);
    }

    do {
        {
            std::lock_guard<std::mutex> lock(*io_mtx);
            ret = libssh2_channel_shell(ch);
        }
        if (ret == LIBSSH2_ERROR_EAGAIN) platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    } while (ret == LIBSSH2_ERROR_EAGAIN);
    if (ret != 0) {
        return R::Err("Failed to request shell: " + session->last_error(), ErrorKind::CONNECT_FAILED);
    }

    avlink_log(fmt::format("shell: opened {}x{} {} on {}", geometry.columns, geometry.rows,
                           geometry.type, session->target_str()));
    return R::Ok(channel);
}

ShellChannel::ShellChannel(LIBSSH2_CHANNEL* ch, std::shared_ptr<SessionManager> session,
                           int buffer_size)
    : ch_(ch), session_(std::move(session)), io_mutex_(session_->io_mutex()),
      buffer_size_(buffer_size > 0 ? buffer_size : TERMINAL_BUFFER_SIZE) {}

ShellChannel::~ShellChannel() {
    close_channel();
}

void ShellChannel::close_channel() {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!ch_) return;
    libssh2_channel_close(ch_);
    libssh2_channel_free(ch_);
    ch_ = nullptr;
}

void ShellChannel::close() {
    close_channel();
}

bool ShellChannel::can_write() const {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    return ch_ && !failed_ && session_->is_active() && !libssh2_channel_eof(ch_);
}

bool ShellChannel::at_eof() {
    std::lock_guard<std::mutex> lock(*io_mutex_);
    return !ch_ || libssh2_channel_eof(ch_) != 0;
}

bool ShellChannel::fill_pending() {
    std::vector<char> buf(buffer_size_);
    while (true) {
        ssize_t n;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            if (!ch_) return false;
            n = libssh2_channel_read(ch_, buf.data(), buf.size());
        }
        if (n > 0) {
            pending_.append(buf.data(), static_cast<size_t>(n));
            continue;
        }
        if (n == 0 || n == LIBSSH2_ERROR_EAGAIN) return true;
        failed_ = true;
        return false;
    }
}

bool ShellChannel::data_available() {
    fill_pending();
    return !pending_.empty();
}

Result<std::string> ShellChannel::read() {
    if (!fill_pending() && pending_.empty()) {
        return Result<std::string>::Err("SSH channel read error");
    }
    std::string out;
    out.swap(pending_);
    return Result<std::string>::Ok(out);
}

Result<void> ShellChannel::write(const std::string& data) {
    size_t total = data.length();
    size_t sent = 0;
    int write_retries = 0;
    while (sent < total) {
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            if (!ch_) return Result<void>::Err("Shell channel is closed");
            w = libssh2_channel_write(ch_, data.c_str() + sent, total - sent);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            if (++write_retries > 100) {
                return Result<void>::Err("Write stalled (EAGAIN for too long)", ErrorKind::TIMEOUT);
            }
            platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
            continue;
        }
        if (w < 0) {
            failed_ = true;
            return Result<void>::Err("Failed to send data (channel write error)");
        }
        write_retries = 0;
        sent += static_cast<size_t>(w);
    }
    return Result<void>::Ok();
}
