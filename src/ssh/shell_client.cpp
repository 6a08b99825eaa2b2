#include "shell_client.hpp"
#include "session.hpp"
#include "shell_channel.hpp"
#include "liveness_monitor.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

SshShellClient::SshShellClient(const ConnectionTarget& target, const ConnectionSettings& settings)
    : target_(target), settings_(settings) {}

SshShellClient::~SshShellClient() {
    disconnect();
}

Result<void> SshShellClient::connect(const CancelToken& cancel) {
    disconnect();

    auto session = std::make_shared<SessionManager>(target_, settings_);
    auto result = session->establish(cancel, [](const std::string& msg) {
        avlink_log("ssh: " + msg);
    });
    if (result.is_err()) {
        return result;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    session_ = session;
    monitor_ = std::make_unique<LivenessMonitor>(
        "SSH", settings_.keepalive_interval,
        [this] { return probe(); },
        [this](const std::string& msg) { report_error(msg); });
    monitor_->start();
    return Result<void>::Ok();
}

bool SshShellClient::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_ && session_->is_active();
}

Result<std::shared_ptr<ShellStream>> SshShellClient::create_shell_stream(
    const TerminalGeometry& geometry) {
    std::shared_ptr<SessionManager> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = session_;
    }

    auto opened = ShellChannel::open(session, geometry);
    if (opened.is_err()) {
        return forward_error<std::shared_ptr<ShellStream>>(opened);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    channel_ = opened.value;
    return Result<std::shared_ptr<ShellStream>>::Ok(opened.value);
}

void SshShellClient::set_error_handler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_error_ = std::move(handler);
}

void SshShellClient::disconnect() {
    std::unique_ptr<LivenessMonitor> monitor;
    std::shared_ptr<SessionManager> session;
    std::shared_ptr<ShellChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        monitor = std::move(monitor_);
        session = std::move(session_);
        channel = channel_.lock();
        channel_.reset();
    }

    if (monitor) monitor->stop();
    if (channel) channel->close();
    if (session) {
        session->close();
        avlink_log(fmt::format("ssh: disconnected {}", target_.display()));
    }
}

bool SshShellClient::probe() {
    std::shared_ptr<SessionManager> session;
    std::shared_ptr<ShellChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = session_;
        channel = channel_.lock();
    }
    if (!session || !session->check_alive()) return false;
    return !channel || !channel->at_eof();
}

void SshShellClient::report_error(const std::string& message) {
    ErrorHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = on_error_;
    }
    avlink_log(fmt::format("ssh: {} ({})", message, target_.display()));
    if (handler) handler(message);
}
