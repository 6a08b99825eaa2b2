#pragma once

#include <memory>
#include <mutex>
#include <core/types.hpp>
#include "transport.hpp"

class SessionManager;
class ShellChannel;
class LivenessMonitor;

// Shell transport over its own libssh2 session. A liveness monitor probes
// the session (and the open shell channel for EOF) and reports loss
// through the registered error handler.
class SshShellClient : public ShellClient {
public:
    SshShellClient(const ConnectionTarget& target, const ConnectionSettings& settings);
    ~SshShellClient() override;

    Result<void> connect(const CancelToken& cancel) override;
    bool is_connected() const override;
    Result<std::shared_ptr<ShellStream>> create_shell_stream(
        const TerminalGeometry& geometry) override;
    void set_error_handler(ErrorHandler handler) override;
    void disconnect() override;

private:
    ConnectionTarget target_;
    ConnectionSettings settings_;
    std::shared_ptr<SessionManager> session_;
    std::weak_ptr<ShellChannel> channel_;
    std::unique_ptr<LivenessMonitor> monitor_;

    mutable std::mutex mutex_;
    ErrorHandler on_error_;

    bool probe();
    void report_error(const std::string& message);
};
