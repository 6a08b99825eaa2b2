#pragma once

#include <ctime>
#include <functional>
#include <iosfwd>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <core/cancel_token.hpp>
#include "target.hpp"
#include "transport.hpp"
#include "connection_status.hpp"

using ShellHandle = std::shared_ptr<ShellStream>;
using FileTransferHandle = std::shared_ptr<FileTransferClient>;

// Lifecycle notifications. Always delivered with no Connection lock held,
// so implementations may call back into the Connection.
class ConnectionObserver {
public:
    virtual ~ConnectionObserver() = default;

    virtual void on_status_changed(const ConnectionStatusModel& /*model*/) {}
    virtual void on_shell_disconnected() {}
    virtual void on_shell_reconnected() {}
    virtual void on_file_transfer_disconnected() {}
    virtual void on_file_transfer_reconnected() {}
    virtual void on_reconnection_failed(const std::string& /*message*/) {}
};

// Resilient connection to one target: a lazily connected interactive shell
// and a lazily connected file-transfer channel, each reconnected in the
// background when it drops.
//
//   auto conn = Connection::create(target, transport, settings);
//   auto shell = conn->ensure_shell(cancel);
//   if (shell.is_err()) { ... }
//
// At most one reconnection loop runs at a time. While it runs it is the only
// source of status changes and lifecycle events (the ensure paths stay quiet).
class Connection : public std::enable_shared_from_this<Connection> {
public:
    // Sleeps `ms` unless the token fires first. Returns true if cancelled.
    using SleepFn = std::function<bool(int ms, const CancelToken& cancel)>;

    static std::shared_ptr<Connection> create(const ConnectionTarget& target,
                                              std::shared_ptr<Transport> transport,
                                              const ConnectionSettings& settings = {},
                                              const TerminalGeometry& geometry = {});
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // ── Ensure ──────────────────────────────────────────────────

    // Live shell stream, connecting (and reconnecting) as needed.
    Result<ShellHandle> ensure_shell(const CancelToken& cancel = CancelToken::none());
    Result<FileTransferHandle> ensure_file_transfer(const CancelToken& cancel = CancelToken::none());

    // Establish the channel now. True if it ended up connected.
    bool connect_shell(const CancelToken& cancel = CancelToken::none());
    bool connect_file_transfer(const CancelToken& cancel = CancelToken::none());

    // ── Shell ───────────────────────────────────────────────────

    Result<std::string> read(const CancelToken& cancel = CancelToken::none());
    Result<void> write_line(const std::string& line, const CancelToken& cancel = CancelToken::none());
    bool data_available();

    // Watch shell output for any of the markers (case-insensitive substrings).
    // Ok(true) on a success marker, Ok(false) on a failure marker or timeout.
    // Failure markers win when both appear. Received output is echoed to
    // stdout unless echo is false.
    Result<bool> wait_for_command_completion(const std::vector<std::string>& success_patterns,
                                             const std::vector<std::string>& failure_patterns,
                                             const CancelToken& cancel = CancelToken::none(),
                                             int timeout_ms = CMD_COMPLETION_TIMEOUT_MS,
                                             bool echo = true);

    // ── File transfer ───────────────────────────────────────────

    Result<bool> exists(const std::string& path, const CancelToken& cancel = CancelToken::none());
    Result<std::vector<RemoteFile>> list_directory(const std::string& path,
                                                   const CancelToken& cancel = CancelToken::none());
    Result<void> create_directory(const std::string& path,
                                  const CancelToken& cancel = CancelToken::none());
    Result<void> upload(std::istream& source, const std::string& remote_path, bool overwrite,
                        const ProgressCallback& progress = nullptr,
                        const CancelToken& cancel = CancelToken::none());
    Result<void> download(const std::string& remote_path, std::ostream& destination,
                          const CancelToken& cancel = CancelToken::none());
    Result<void> set_last_write_time(const std::string& remote_path, std::time_t mtime,
                                     const CancelToken& cancel = CancelToken::none());

    // Files (not directories) whose path matches the glob. Patterns containing
    // "**" are listed recursively from the directory before the first "**".
    Result<std::vector<RemoteFile>> list_files_by_glob(const std::string& pattern,
                                                       const CancelToken& cancel = CancelToken::none());
    // Returns the number of files deleted.
    Result<int> delete_files_by_glob(const std::string& pattern,
                                     const CancelToken& cancel = CancelToken::none());
    // Downloads every match into local_dir, keeping remote mtimes. With
    // preserve_structure the path below the pattern's base directory is kept.
    Result<int> download_files_by_glob(const std::string& pattern, const std::string& local_dir,
                                       bool preserve_structure = true,
                                       const CancelToken& cancel = CancelToken::none());

    // ── Status ──────────────────────────────────────────────────

    bool is_connected() const;
    bool is_shell_connected() const;
    bool is_file_transfer_connected() const;
    bool is_reconnecting() const;
    bool is_disposed() const;

    ConnectionStatusModel status() const;
    const ConnectionTarget& target() const { return target_; }

    // 0 disables automatic reconnection, -1 retries until disposed.
    int max_reconnection_attempts() const;
    void set_max_reconnection_attempts(int attempts);

    void add_observer(ConnectionObserver* observer);
    void remove_observer(ConnectionObserver* observer);

    // Replace the backoff sleep (tests record delays instead of sleeping).
    void set_sleep_function(SleepFn sleep);

    // Tear down both channels and stop any reconnection loop, waiting at
    // most DISPOSE_WAIT_MS for it. Later calls fail with ErrorKind::DISPOSED.
    void dispose();

private:
    Connection(const ConnectionTarget& target, std::shared_ptr<Transport> transport,
               const ConnectionSettings& settings, const TerminalGeometry& geometry);

    using Notification = std::function<void(ConnectionObserver&)>;
    using Notifications = std::vector<Notification>;

    ConnectionTarget target_;
    std::shared_ptr<Transport> transport_;
    ConnectionSettings settings_;
    TerminalGeometry geometry_;

    mutable std::mutex mutex_;
    std::shared_ptr<ShellClient> shell_client_;
    ShellHandle shell_stream_;
    FileTransferHandle sftp_client_;
    ConnectionStatusModel status_;
    int max_attempts_;
    bool disposed_ = false;
    bool reconnecting_ = false;
    bool shell_needed_ = false;
    bool sftp_needed_ = false;
    bool shell_was_connected_ = false;
    bool sftp_was_connected_ = false;
    bool shell_lost_ = false;   // handle dropped since last success
    bool sftp_lost_ = false;
    std::shared_future<bool> reconnect_done_;
    std::string last_failure_;  // message from the last exhausted loop
    std::vector<ConnectionObserver*> observers_;
    SleepFn sleep_;

    // Cancelled on dispose: interrupts backoff waits and in-loop connects.
    CancelToken dispose_token_;

    // Under mutex_: update the model and queue a snapshot for observers.
    void set_state(Notifications& out, Channel channel, ChannelState state,
                   int attempt = 0, int max_attempts = 0);
    // Outside mutex_: deliver queued notifications in order.
    void emit(const Notifications& notes);

    bool shell_live_locked() const;
    bool sftp_live_locked() const;

    // Connect a fresh client and store it. Quiet: callers narrate.
    Result<void> open_shell(const CancelToken& cancel);
    Result<void> open_file_transfer(const CancelToken& cancel);

    void on_shell_error(const ShellClient* client, const std::string& message);
    void on_file_transfer_error(const FileTransferClient* client, const std::string& message);

    // Under mutex_: start a loop unless one is running, the connection is
    // disposed or retries are disabled. Returns the promise the new loop must
    // fulfil (the caller launches it after unlocking), or nullptr.
    std::shared_ptr<std::promise<bool>> start_reconnection_locked();
    void launch_reconnection(std::shared_ptr<std::promise<bool>> done);
    void reconnection_loop(const std::shared_ptr<std::promise<bool>>& done);

    // Wait until `channel` is live again or the loop ends.
    Result<void> await_reconnection(std::shared_future<bool> done, Channel channel,
                                    const CancelToken& cancel);

    static void close_shell(std::shared_ptr<ShellClient> client, ShellHandle stream);
    static void close_file_transfer(FileTransferHandle client);
};
