#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include "transport.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

class SessionManager;

// RAII handle for an interactive PTY shell channel.
// Owns the channel and closes+frees it on destruction. Keeps the session
// alive for as long as the channel exists. All libssh2 calls are protected
// by brief io_mutex holds.
class ShellChannel : public ShellStream {
public:
    // Open a session channel, request a PTY with the given geometry and start a shell.
    static Result<std::shared_ptr<ShellChannel>> open(std::shared_ptr<SessionManager> session,
                                                      const TerminalGeometry& geometry);

    ShellChannel(LIBSSH2_CHANNEL* ch, std::shared_ptr<SessionManager> session, int buffer_size);
    ~ShellChannel() override;

    ShellChannel(const ShellChannel&) = delete;
    ShellChannel& operator=(const ShellChannel&) = delete;

    bool can_write() const override;
    bool data_available() override;
    Result<std::string> read() override;
    Result<void> write(const std::string& data) override;
    void close() override;

    // True once the remote end has sent EOF.
    bool at_eof();

private:
    LIBSSH2_CHANNEL* ch_;
    std::shared_ptr<SessionManager> session_;
    std::shared_ptr<std::mutex> io_mutex_;
    int buffer_size_;
    std::string pending_;
    std::atomic<bool> failed_{false};

    // Pull whatever the channel has into pending_. Returns false on a read error.
    bool fill_pending();
    void close_channel();
};
