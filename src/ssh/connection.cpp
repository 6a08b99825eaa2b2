#include "connection.hpp"
#include "expect.hpp"
#include <core/glob.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <thread>

namespace fs = std::filesystem;

// ── Lifecycle ──────────────────────────────────────────────────

std::shared_ptr<Connection> Connection::create(const ConnectionTarget& target,
                                               std::shared_ptr<Transport> transport,
                                               const ConnectionSettings& settings,
                                               const TerminalGeometry& geometry) {
    if (!transport) {
        throw std::invalid_argument("transport must not be null");
    }
    return std::shared_ptr<Connection>(new Connection(target, std::move(transport), settings, geometry));
}

Connection::Connection(const ConnectionTarget& target, std::shared_ptr<Transport> transport,
                       const ConnectionSettings& settings, const TerminalGeometry& geometry)
    : target_(target), transport_(std::move(transport)), settings_(settings),
      geometry_(geometry), status_(target.host()),
      max_attempts_(settings.max_reconnect_attempts),
      sleep_([](int ms, const CancelToken& cancel) {
          return cancel.wait_for(std::chrono::milliseconds(ms));
      }) {
    if (max_attempts_ < RECONNECT_UNLIMITED) {
        throw std::invalid_argument("max reconnect attempts must be -1, 0 or positive");
    }
}

Connection::~Connection() {
    dispose();
}

void Connection::dispose() {
    Notifications notes;
    std::shared_ptr<ShellClient> shell_client;
    ShellHandle shell_stream;
    FileTransferHandle sftp_client;
    std::shared_future<bool> loop;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) return;
        disposed_ = true;

        set_state(notes, Channel::SHELL, ChannelState::DISCONNECTING);
        set_state(notes, Channel::FILE_TRANSFER, ChannelState::DISCONNECTING);
        shell_client = std::move(shell_client_);
        shell_stream = std::move(shell_stream_);
        sftp_client = std::move(sftp_client_);
        if (reconnecting_) loop = reconnect_done_;
    }

    dispose_token_.cancel();
    emit(notes);

    close_shell(std::move(shell_client), std::move(shell_stream));
    close_file_transfer(std::move(sftp_client));

    if (loop.valid() &&
        loop.wait_for(std::chrono::milliseconds(DISPOSE_WAIT_MS)) != std::future_status::ready) {
        avlink_log(fmt::format("connection {}: reconnection loop still running after {}ms",
                               target_.display(), DISPOSE_WAIT_MS));
    }

    notes.clear();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        set_state(notes, Channel::SHELL, ChannelState::NOT_CONNECTED);
        set_state(notes, Channel::FILE_TRANSFER, ChannelState::NOT_CONNECTED);
    }
    emit(notes);
    avlink_log(fmt::format("connection {}: disposed", target_.display()));
}

// ── Notifications ──────────────────────────────────────────────

void Connection::set_state(Notifications& out, Channel channel, ChannelState state,
                           int attempt, int max_attempts) {
    status_.update(channel, state, attempt, max_attempts);
    avlink_log(fmt::format("connection {}: {} -> {} ({}/{})", target_.display(),
                           to_string(channel), to_string(state), attempt, max_attempts));

    ConnectionStatusModel snapshot = status_;
    out.push_back([snapshot](ConnectionObserver& o) { o.on_status_changed(snapshot); });
}

void Connection::emit(const Notifications& notes) {
    if (notes.empty()) return;

    std::vector<ConnectionObserver*> observers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        observers = observers_;
    }
    for (const auto& note : notes) {
        for (auto* observer : observers) {
            note(*observer);
        }
    }
}

void Connection::add_observer(ConnectionObserver* observer) {
    if (!observer) return;
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end()) {
        observers_.push_back(observer);
    }
}

void Connection::remove_observer(ConnectionObserver* observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

void Connection::set_sleep_function(SleepFn sleep) {
    std::lock_guard<std::mutex> lock(mutex_);
    sleep_ = std::move(sleep);
}

// ── Status ─────────────────────────────────────────────────────

bool Connection::shell_live_locked() const {
    return shell_client_ && shell_stream_ &&
           shell_client_->is_connected() && shell_stream_->can_write();
}

bool Connection::sftp_live_locked() const {
    return sftp_client_ && sftp_client_->is_connected();
}

bool Connection::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shell_live_locked() || sftp_live_locked();
}

bool Connection::is_shell_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shell_client_ && shell_client_->is_connected();
}

bool Connection::is_file_transfer_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sftp_live_locked();
}

bool Connection::is_reconnecting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reconnecting_;
}

bool Connection::is_disposed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disposed_;
}

ConnectionStatusModel Connection::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

int Connection::max_reconnection_attempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_attempts_;
}

void Connection::set_max_reconnection_attempts(int attempts) {
    if (attempts < RECONNECT_UNLIMITED) {
        throw std::invalid_argument("max reconnect attempts must be -1, 0 or positive");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    max_attempts_ = attempts;
}

// ── Channel setup ──────────────────────────────────────────────

void Connection::close_shell(std::shared_ptr<ShellClient> client, ShellHandle stream) {
    if (stream) stream->close();
    if (client) {
        client->set_error_handler(nullptr);
        client->disconnect();
    }
}

void Connection::close_file_transfer(FileTransferHandle client) {
    if (client) {
        client->set_error_handler(nullptr);
        client->disconnect();
    }
}

Result<void> Connection::open_shell(const CancelToken& cancel) {
    std::shared_ptr<ShellClient> client = transport_->create_shell_client(target_, settings_);
    if (!client) {
        return Result<void>::Err("Transport returned no shell client", ErrorKind::CONNECT_FAILED);
    }

    std::weak_ptr<Connection> weak = shared_from_this();
    const ShellClient* raw = client.get();
    client->set_error_handler([weak, raw](const std::string& message) {
        if (auto self = weak.lock()) self->on_shell_error(raw, message);
    });

    auto connected = client->connect(cancel);
    if (connected.is_err()) {
        close_shell(client, nullptr);
        return connected;
    }

    auto stream = client->create_shell_stream(geometry_);
    if (stream.is_err()) {
        close_shell(client, nullptr);
        return Result<void>::Err(stream.error, ErrorKind::CONNECT_FAILED);
    }

    std::shared_ptr<ShellClient> old_client;
    ShellHandle old_stream;
    bool disposed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        disposed = disposed_;
        if (disposed) {
            old_client = client;
            old_stream = stream.value;
        } else {
            old_client = std::move(shell_client_);
            old_stream = std::move(shell_stream_);
            shell_client_ = client;
            shell_stream_ = stream.value;
            shell_was_connected_ = true;
        }
    }
    close_shell(std::move(old_client), std::move(old_stream));

    if (disposed) {
        return Result<void>::Err("Connection was disposed while connecting", ErrorKind::DISPOSED);
    }
    return Result<void>::Ok();
}

Result<void> Connection::open_file_transfer(const CancelToken& cancel) {
    std::shared_ptr<FileTransferClient> client =
        transport_->create_file_transfer_client(target_, settings_);
    if (!client) {
        return Result<void>::Err("Transport returned no file transfer client",
                                 ErrorKind::CONNECT_FAILED);
    }

    std::weak_ptr<Connection> weak = shared_from_this();
    const FileTransferClient* raw = client.get();
    client->set_error_handler([weak, raw](const std::string& message) {
        if (auto self = weak.lock()) self->on_file_transfer_error(raw, message);
    });

    auto connected = client->connect(cancel);
    if (connected.is_err()) {
        close_file_transfer(client);
        return connected;
    }

    FileTransferHandle old_client;
    bool disposed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        disposed = disposed_;
        if (disposed) {
            old_client = client;
        } else {
            old_client = std::move(sftp_client_);
            sftp_client_ = client;
            sftp_was_connected_ = true;
        }
    }
    close_file_transfer(std::move(old_client));

    if (disposed) {
        return Result<void>::Err("Connection was disposed while connecting", ErrorKind::DISPOSED);
    }
    return Result<void>::Ok();
}

// ── Ensure ─────────────────────────────────────────────────────

Result<ShellHandle> Connection::ensure_shell(const CancelToken& cancel) {
    using R = Result<ShellHandle>;
    Notifications notes;
    std::shared_ptr<ShellClient> dead_client;
    ShellHandle dead_stream;
    std::shared_future<bool> in_flight;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return R::Err("Connection to " + target_.display() + " has been disposed",
                          ErrorKind::DISPOSED);
        }
        shell_needed_ = true;
        if (shell_live_locked()) {
            return R::Ok(shell_stream_);
        }

        if (shell_client_ || shell_stream_) {
            dead_client = std::move(shell_client_);
            dead_stream = std::move(shell_stream_);
            shell_lost_ = shell_was_connected_;
            if (!reconnecting_) {
                set_state(notes, Channel::SHELL, shell_was_connected_
                              ? ChannelState::LOST_CONNECTION : ChannelState::CONNECTION_FAILED);
                notes.push_back([](ConnectionObserver& o) { o.on_shell_disconnected(); });
            }
        }

        if (reconnecting_) {
            in_flight = reconnect_done_;
        } else {
            set_state(notes, Channel::SHELL, ChannelState::CONNECTING);
        }
    }
    close_shell(std::move(dead_client), std::move(dead_stream));
    emit(notes);

    if (!in_flight.valid()) {
        auto opened = open_shell(cancel);
        notes.clear();

        if (opened.is_ok()) {
            ShellHandle stream;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                stream = shell_stream_;
                if (!reconnecting_) {
                    set_state(notes, Channel::SHELL, ChannelState::CONNECTED);
                    if (shell_lost_) {
                        notes.push_back([](ConnectionObserver& o) { o.on_shell_reconnected(); });
                    }
                    shell_lost_ = false;
                }
            }
            emit(notes);
            if (!stream) {
                return R::Err("Shell channel dropped right after connecting");
            }
            return R::Ok(stream);
        }

        if (opened.kind == ErrorKind::DISPOSED) {
            return forward_error<ShellHandle>(opened);
        }

        std::shared_ptr<std::promise<bool>> loop;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (opened.kind == ErrorKind::CANCELLED) {
                if (!reconnecting_) set_state(notes, Channel::SHELL, ChannelState::NOT_CONNECTED);
            } else {
                if (!reconnecting_) set_state(notes, Channel::SHELL, ChannelState::CONNECTION_FAILED);
                loop = start_reconnection_locked();
                if (reconnecting_) in_flight = reconnect_done_;
            }
        }
        emit(notes);
        if (loop) launch_reconnection(loop);

        avlink_log(fmt::format("connection {}: shell connect failed: {}", target_.display(),
                               opened.error));
        if (!in_flight.valid()) {
            return R::Err(opened.error, opened.kind == ErrorKind::CANCELLED
                                            ? ErrorKind::CANCELLED : ErrorKind::CONNECT_FAILED);
        }
    }

    auto waited = await_reconnection(in_flight, Channel::SHELL, cancel);
    if (waited.is_err()) {
        return forward_error<ShellHandle>(waited);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shell_live_locked()) return R::Ok(shell_stream_);
    }
    // The loop recovered without this channel; connect it directly.
    return ensure_shell(cancel);
}

Result<FileTransferHandle> Connection::ensure_file_transfer(const CancelToken& cancel) {
    using R = Result<FileTransferHandle>;
    Notifications notes;
    FileTransferHandle dead_client;
    std::shared_future<bool> in_flight;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_) {
            return R::Err("Connection to " + target_.display() + " has been disposed",
                          ErrorKind::DISPOSED);
        }
        sftp_needed_ = true;
        if (sftp_live_locked()) {
            return R::Ok(sftp_client_);
        }

        if (sftp_client_) {
            dead_client = std::move(sftp_client_);
            sftp_lost_ = sftp_was_connected_;
            if (!reconnecting_) {
                set_state(notes, Channel::FILE_TRANSFER, sftp_was_connected_
                              ? ChannelState::LOST_CONNECTION : ChannelState::CONNECTION_FAILED);
                notes.push_back([](ConnectionObserver& o) { o.on_file_transfer_disconnected(); });
            }
        }

        if (reconnecting_) {
            in_flight = reconnect_done_;
        } else {
            set_state(notes, Channel::FILE_TRANSFER, ChannelState::CONNECTING);
        }
    }
    close_file_transfer(std::move(dead_client));
    emit(notes);

    if (!in_flight.valid()) {
        auto opened = open_file_transfer(cancel);
        notes.clear();

        if (opened.is_ok()) {
            FileTransferHandle client;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                client = sftp_client_;
                if (!reconnecting_) {
                    set_state(notes, Channel::FILE_TRANSFER, ChannelState::CONNECTED);
                    if (sftp_lost_) {
                        notes.push_back([](ConnectionObserver& o) { o.on_file_transfer_reconnected(); });
                    }
                    sftp_lost_ = false;
                }
            }
            emit(notes);
            if (!client) {
                return R::Err("File transfer channel dropped right after connecting");
            }
            return R::Ok(client);
        }

        if (opened.kind == ErrorKind::DISPOSED) {
            return forward_error<FileTransferHandle>(opened);
        }

        std::shared_ptr<std::promise<bool>> loop;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (opened.kind == ErrorKind::CANCELLED) {
                if (!reconnecting_) set_state(notes, Channel::FILE_TRANSFER, ChannelState::NOT_CONNECTED);
            } else {
                if (!reconnecting_) set_state(notes, Channel::FILE_TRANSFER, ChannelState::CONNECTION_FAILED);
                loop = start_reconnection_locked();
                if (reconnecting_) in_flight = reconnect_done_;
            }
        }
        emit(notes);
        if (loop) launch_reconnection(loop);

        avlink_log(fmt::format("connection {}: sftp connect failed: {}", target_.display(),
                               opened.error));
        if (!in_flight.valid()) {
            return R::Err(opened.error, opened.kind == ErrorKind::CANCELLED
                                            ? ErrorKind::CANCELLED : ErrorKind::CONNECT_FAILED);
        }
    }

    auto waited = await_reconnection(in_flight, Channel::FILE_TRANSFER, cancel);
    if (waited.is_err()) {
        return forward_error<FileTransferHandle>(waited);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (sftp_live_locked()) return R::Ok(sftp_client_);
    }
    return ensure_file_transfer(cancel);
}

bool Connection::connect_shell(const CancelToken& cancel) {
    auto shell = ensure_shell(cancel);
    if (shell.is_err()) {
        avlink_log(fmt::format("connection {}: connect_shell: {}", target_.display(), shell.error));
        return false;
    }
    return is_shell_connected();
}

bool Connection::connect_file_transfer(const CancelToken& cancel) {
    auto client = ensure_file_transfer(cancel);
    if (client.is_err()) {
        avlink_log(fmt::format("connection {}: connect_file_transfer: {}", target_.display(),
                               client.error));
        return false;
    }
    return is_file_transfer_connected();
}

// ── Loss detection ─────────────────────────────────────────────

void Connection::on_shell_error(const ShellClient* client, const std::string& message) {
    Notifications notes;
    std::shared_ptr<ShellClient> dead_client;
    ShellHandle dead_stream;
    std::shared_ptr<std::promise<bool>> loop;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_ || !shell_client_ || shell_client_.get() != client) return;

        avlink_log(fmt::format("connection {}: shell error: {}", target_.display(), message));
        dead_client = std::move(shell_client_);
        dead_stream = std::move(shell_stream_);
        shell_lost_ = true;
        if (!reconnecting_) set_state(notes, Channel::SHELL, ChannelState::LOST_CONNECTION);
        notes.push_back([](ConnectionObserver& o) { o.on_shell_disconnected(); });
        loop = start_reconnection_locked();
    }
    close_shell(std::move(dead_client), std::move(dead_stream));
    emit(notes);
    if (loop) launch_reconnection(loop);
}

void Connection::on_file_transfer_error(const FileTransferClient* client, const std::string& message) {
    Notifications notes;
    FileTransferHandle dead_client;
    std::shared_ptr<std::promise<bool>> loop;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_ || !sftp_client_ || sftp_client_.get() != client) return;

        avlink_log(fmt::format("connection {}: sftp error: {}", target_.display(), message));
        dead_client = std::move(sftp_client_);
        sftp_lost_ = true;
        if (!reconnecting_) set_state(notes, Channel::FILE_TRANSFER, ChannelState::LOST_CONNECTION);
        notes.push_back([](ConnectionObserver& o) { o.on_file_transfer_disconnected(); });
        loop = start_reconnection_locked();
    }
    close_file_transfer(std::move(dead_client));
    emit(notes);
    if (loop) launch_reconnection(loop);
}

// ── Reconnection ───────────────────────────────────────────────

std::shared_ptr<std::promise<bool>> Connection::start_reconnection_locked() {
    if (reconnecting_ || disposed_ || max_attempts_ == RECONNECT_DISABLED) {
        return nullptr;
    }
    reconnecting_ = true;
    auto done = std::make_shared<std::promise<bool>>();
    reconnect_done_ = done->get_future().share();
    return done;
}

void Connection::launch_reconnection(std::shared_ptr<std::promise<bool>> done) {
    auto self = shared_from_this();
    std::thread([self, done] {
        try {
            self->reconnection_loop(done);
        } catch (const std::exception& e) {
            avlink_log(fmt::format("connection {}: reconnection loop aborted: {}",
                                   self->target_.display(), e.what()));
            {
                std::lock_guard<std::mutex> lock(self->mutex_);
                self->reconnecting_ = false;
                self->last_failure_ = e.what();
            }
            done->set_value(false);
        }
    }).detach();
}

void Connection::reconnection_loop(const std::shared_ptr<std::promise<bool>>& done) {
    int max_attempts;
    SleepFn sleep;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        max_attempts = max_attempts_;
        sleep = sleep_;
    }
    const bool unlimited = max_attempts < 0;
    avlink_log(fmt::format("connection {}: reconnecting (max attempts {})",
                           target_.display(), max_attempts));

    int attempt = 0;
    bool recovered = false;

    while ((unlimited || attempt < max_attempts) && !dispose_token_.is_cancelled()) {
        ++attempt;

        bool retry_shell = false;
        bool retry_sftp = false;
        Notifications notes;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (disposed_) break;
            retry_shell = shell_needed_ && !shell_live_locked();
            retry_sftp = sftp_needed_ && !sftp_live_locked();
            if (retry_shell) {
                set_state(notes, Channel::SHELL, shell_was_connected_
                              ? ChannelState::RECONNECTING : ChannelState::CONNECTING,
                          attempt, max_attempts);
            }
            if (retry_sftp) {
                set_state(notes, Channel::FILE_TRANSFER, sftp_was_connected_
                              ? ChannelState::RECONNECTING : ChannelState::CONNECTING,
                          attempt, max_attempts);
            }
        }
        emit(notes);

        if (attempt > 1) {
            size_t index = std::min(static_cast<size_t>(attempt - 2), RECONNECT_BACKOFF_MS.size() - 1);
            if (sleep(RECONNECT_BACKOFF_MS[index], dispose_token_)) break;
        }

        // Both channels are retried at the same time
        std::future<Result<void>> shell_attempt;
        std::future<Result<void>> sftp_attempt;
        if (retry_shell) {
            shell_attempt = std::async(std::launch::async, [this] { return open_shell(dispose_token_); });
        }
        if (retry_sftp) {
            sftp_attempt = std::async(std::launch::async, [this] { return open_file_transfer(dispose_token_); });
        }
        Result<void> shell_result = retry_shell ? shell_attempt.get() : Result<void>::Ok();
        Result<void> sftp_result = retry_sftp ? sftp_attempt.get() : Result<void>::Ok();

        notes.clear();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (disposed_) break;

            // A channel reports recovery as soon as it is back, even while
            // the other one keeps retrying.
            if (retry_shell) {
                if (shell_result.is_ok()) {
                    set_state(notes, Channel::SHELL, ChannelState::CONNECTED);
                    if (shell_lost_) {
                        notes.push_back([](ConnectionObserver& o) { o.on_shell_reconnected(); });
                    }
                    shell_lost_ = false;
                } else {
                    set_state(notes, Channel::SHELL, ChannelState::CONNECTION_FAILED,
                              attempt, max_attempts);
                }
            }
            if (retry_sftp) {
                if (sftp_result.is_ok()) {
                    set_state(notes, Channel::FILE_TRANSFER, ChannelState::CONNECTED);
                    if (sftp_lost_) {
                        notes.push_back([](ConnectionObserver& o) { o.on_file_transfer_reconnected(); });
                    }
                    sftp_lost_ = false;
                } else {
                    set_state(notes, Channel::FILE_TRANSFER, ChannelState::CONNECTION_FAILED,
                              attempt, max_attempts);
                }
            }

            // A loss reported during this attempt keeps the loop going.
            recovered = (!shell_needed_ || shell_live_locked()) &&
                        (!sftp_needed_ || sftp_live_locked());
            if (recovered) reconnecting_ = false;
        }
        emit(notes);

        if (recovered) {
            avlink_log(fmt::format("connection {}: reconnected on attempt {}",
                                   target_.display(), attempt));
            break;
        }
        if (shell_result.is_err()) {
            avlink_log(fmt::format("connection {}: attempt {} shell: {}",
                                   target_.display(), attempt, shell_result.error));
        }
        if (sftp_result.is_err()) {
            avlink_log(fmt::format("connection {}: attempt {} sftp: {}",
                                   target_.display(), attempt, sftp_result.error));
        }
    }

    if (!recovered) {
        std::string message = fmt::format("Failed to connect to {} after {} attempts.",
                                          target_.host(), attempt);
        bool disposed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            reconnecting_ = false;
            disposed = disposed_;
            last_failure_ = disposed ? "Connection was disposed" : message;
        }

        if (disposed) {
            avlink_log(fmt::format("connection {}: reconnection stopped by dispose",
                                   target_.display()));
        } else {
            avlink_log(fmt::format("connection {}: {}", target_.display(), message));
            emit({[message](ConnectionObserver& o) { o.on_reconnection_failed(message); }});
        }
    }

    done->set_value(recovered);
}

Result<void> Connection::await_reconnection(std::shared_future<bool> done, Channel channel,
                                            const CancelToken& cancel) {
    // The loop may still be working on the other channel; return as soon
    // as ours is back and the loop has marked it CONNECTED.
    auto live = [this, channel] {
        std::lock_guard<std::mutex> lock(mutex_);
        bool up = channel == Channel::SHELL ? shell_live_locked() : sftp_live_locked();
        return up && status_.get(channel).state == ChannelState::CONNECTED;
    };

    while (done.wait_for(std::chrono::milliseconds(CANCEL_POLL_MS)) != std::future_status::ready) {
        if (live()) {
            return Result<void>::Ok();
        }
        if (cancel.is_cancelled()) {
            return Result<void>::Err("Cancelled while waiting for reconnection", ErrorKind::CANCELLED);
        }
    }
    if (done.get()) {
        return Result<void>::Ok();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_) {
        return Result<void>::Err("Connection to " + target_.display() + " has been disposed",
                                 ErrorKind::DISPOSED);
    }
    if (channel == Channel::SHELL ? shell_live_locked() : sftp_live_locked()) {
        return Result<void>::Ok();
    }
    return Result<void>::Err(last_failure_, ErrorKind::RETRIES_EXHAUSTED);
}

// ── Shell operations ───────────────────────────────────────────

Result<std::string> Connection::read(const CancelToken& cancel) {
    auto shell = ensure_shell(cancel);
    if (shell.is_err()) return forward_error<std::string>(shell);
    return shell.value->read();
}

Result<void> Connection::write_line(const std::string& line, const CancelToken& cancel) {
    auto shell = ensure_shell(cancel);
    if (shell.is_err()) return forward_error<void>(shell);
    return shell.value->write_line(line);
}

bool Connection::data_available() {
    ShellHandle stream;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stream = shell_stream_;
    }
    return stream && stream->data_available();
}

Result<bool> Connection::wait_for_command_completion(const std::vector<std::string>& success_patterns,
                                                     const std::vector<std::string>& failure_patterns,
                                                     const CancelToken& cancel,
                                                     int timeout_ms,
                                                     bool echo) {
    auto shell = ensure_shell(cancel);
    if (shell.is_err()) return forward_error<bool>(shell);

    ExpectMatcher matcher(success_patterns, failure_patterns);
    std::function<void(const std::string&)> on_data;
    if (echo) {
        on_data = [](const std::string& data) {
            fmt::print("{}", data);
            std::fflush(stdout);
        };
    }

    auto match = matcher.expect(*shell.value, cancel, std::chrono::milliseconds(timeout_ms),
                                std::chrono::milliseconds(CMD_COMPLETION_POLL_MS), on_data);
    switch (match.status) {
        case MatchStatus::SUCCESS:
            return Result<bool>::Ok(true);
        case MatchStatus::FAILURE:
            avlink_log(fmt::format("connection {}: failure marker '{}' seen",
                                   target_.display(), match.matched_text));
            return Result<bool>::Ok(false);
        case MatchStatus::TIMED_OUT:
            avlink_log(fmt::format("connection {}: no completion marker after {}ms",
                                   target_.display(), timeout_ms));
            return Result<bool>::Ok(false);
        case MatchStatus::CANCELLED:
            return Result<bool>::Err("Cancelled while waiting for command output", ErrorKind::CANCELLED);
        case MatchStatus::STREAM_ERROR:
            break;
    }
    return Result<bool>::Err("Shell stream failed while waiting for command output");
}

// ── File operations ────────────────────────────────────────────

Result<bool> Connection::exists(const std::string& path, const CancelToken& cancel) {
    auto client = ensure_file_transfer(cancel);
    if (client.is_err()) return forward_error<bool>(client);
    return client.value->exists(path);
}

Result<std::vector<RemoteFile>> Connection::list_directory(const std::string& path,
                                                           const CancelToken& cancel) {
    auto client = ensure_file_transfer(cancel);
    if (client.is_err()) return forward_error<std::vector<RemoteFile>>(client);
    return client.value->list_directory(path);
}

Result<void> Connection::create_directory(const std::string& path, const CancelToken& cancel) {
    auto client = ensure_file_transfer(cancel);
    if (client.is_err()) return forward_error<void>(client);
    return client.value->create_directory(path);
}

Result<void> Connection::upload(std::istream& source, const std::string& remote_path, bool overwrite,
                                const ProgressCallback& progress, const CancelToken& cancel) {
    auto client = ensure_file_transfer(cancel);
    if (client.is_err()) return forward_error<void>(client);
    return client.value->upload(source, remote_path, overwrite, progress);
}

Result<void> Connection::download(const std::string& remote_path, std::ostream& destination,
                                  const CancelToken& cancel) {
    auto client = ensure_file_transfer(cancel);
    if (client.is_err()) return forward_error<void>(client);
    return client.value->download(remote_path, destination);
}

Result<void> Connection::set_last_write_time(const std::string& remote_path, std::time_t mtime,
                                             const CancelToken& cancel) {
    auto client = ensure_file_transfer(cancel);
    if (client.is_err()) return forward_error<void>(client);
    return client.value->set_last_write_time(remote_path, mtime);
}

// ── Glob operations ────────────────────────────────────────────

// Listing "." yields "./name"; globs are written against "name".
static void strip_dot_prefix(RemoteFile& file) {
    if (file.full_name.rfind("./", 0) == 0) {
        file.full_name.erase(0, 2);
    }
}

// Files below `dir`. Subdirectories that cannot be listed are skipped.
static Result<void> collect_files(FileTransferClient& client, const std::string& dir,
                                  bool recursive, std::vector<RemoteFile>& out,
                                  const CancelToken& cancel, bool top_level) {
    if (cancel.is_cancelled()) {
        return Result<void>::Err("Listing cancelled", ErrorKind::CANCELLED);
    }

    auto listed = client.list_directory(dir);
    if (listed.is_err()) {
        if (top_level) return forward_error<void>(listed);
        avlink_log(fmt::format("glob: skipping {}: {}", dir, listed.error));
        return Result<void>::Ok();
    }

    for (auto& entry : listed.value) {
        if (entry.name == "." || entry.name == "..") continue;
        if (entry.is_directory) {
            if (!recursive) continue;
            auto nested = collect_files(client, entry.full_name, true, out, cancel, false);
            if (nested.is_err()) return nested;
        } else {
            strip_dot_prefix(entry);
            out.push_back(std::move(entry));
        }
    }
    return Result<void>::Ok();
}

static fs::file_time_type to_file_time(std::time_t t) {
    auto target = std::chrono::system_clock::from_time_t(t);
    return fs::file_time_type::clock::now() +
           std::chrono::duration_cast<fs::file_time_type::duration>(
               target - std::chrono::system_clock::now());
}

Result<std::vector<RemoteFile>> Connection::list_files_by_glob(const std::string& pattern,
                                                               const CancelToken& cancel) {
    using R = Result<std::vector<RemoteFile>>;
    if (pattern.empty()) {
        return R::Err("Glob pattern must not be empty", ErrorKind::INVALID_ARGUMENT);
    }

    auto client = ensure_file_transfer(cancel);
    if (client.is_err()) return forward_error<std::vector<RemoteFile>>(client);

    std::string normalized = normalize_slashes(pattern);
    bool recursive = normalized.find("**") != std::string::npos;

    // Directory to start listing from
    std::string base = ".";
    size_t cut = recursive ? normalized.find("**") : normalized.size();
    if (cut > 0) {
        size_t slash = normalized.rfind('/', cut - 1);
        if (slash == 0) {
            base = "/";
        } else if (slash != std::string::npos) {
            base = normalized.substr(0, slash);
        }
    }

    std::vector<RemoteFile> candidates;
    auto collected = collect_files(*client.value, base, recursive, candidates, cancel, true);
    if (collected.is_err()) return forward_error<std::vector<RemoteFile>>(collected);

    std::vector<RemoteFile> matches;
    for (auto& file : candidates) {
        if (glob_match(normalized, file.full_name)) {
            matches.push_back(std::move(file));
        }
    }
    return R::Ok(std::move(matches));
}

Result<int> Connection::delete_files_by_glob(const std::string& pattern, const CancelToken& cancel) {
    auto matches = list_files_by_glob(pattern, cancel);
    if (matches.is_err()) return forward_error<int>(matches);

    auto client = ensure_file_transfer(cancel);
    if (client.is_err()) return forward_error<int>(client);

    int deleted = 0;
    for (const auto& file : matches.value) {
        if (cancel.is_cancelled()) {
            return Result<int>::Err(fmt::format("Cancelled after deleting {} files", deleted),
                                    ErrorKind::CANCELLED);
        }
        auto removed = client.value->remove_file(file.full_name);
        if (removed.is_err()) return forward_error<int>(removed);
        deleted++;
    }
    return Result<int>::Ok(deleted);
}

Result<int> Connection::download_files_by_glob(const std::string& pattern, const std::string& local_dir,
                                               bool preserve_structure, const CancelToken& cancel) {
    auto matches = list_files_by_glob(pattern, cancel);
    if (matches.is_err()) return forward_error<int>(matches);

    std::error_code ec;
    fs::create_directories(local_dir, ec);
    if (ec) {
        return Result<int>::Err(fmt::format("Cannot create {}: {}", local_dir, ec.message()),
                                ErrorKind::INVALID_ARGUMENT);
    }

    auto client = ensure_file_transfer(cancel);
    if (client.is_err()) return forward_error<int>(client);

    std::string base = glob_base_path(normalize_slashes(pattern));
    int downloaded = 0;

    for (const auto& file : matches.value) {
        if (cancel.is_cancelled()) {
            return Result<int>::Err(fmt::format("Cancelled after downloading {} files", downloaded),
                                    ErrorKind::CANCELLED);
        }

        fs::path local_path;
        if (preserve_structure && !base.empty()) {
            std::string relative = file.name;
            if (file.full_name.rfind(base, 0) == 0) {
                relative = file.full_name.substr(base.size());
                relative.erase(0, relative.find_first_not_of('/'));
            }
            local_path = fs::path(local_dir) / fs::path(relative).make_preferred();
            fs::create_directories(local_path.parent_path(), ec);
            if (ec) {
                return Result<int>::Err(fmt::format("Cannot create {}: {}",
                                                    local_path.parent_path().string(), ec.message()),
                                        ErrorKind::INVALID_ARGUMENT);
            }
        } else {
            local_path = fs::path(local_dir) / file.name;
        }

        {
            std::ofstream out(local_path, std::ios::binary | std::ios::trunc);
            if (!out) {
                return Result<int>::Err("Cannot write " + local_path.string(),
                                        ErrorKind::INVALID_ARGUMENT);
            }
            auto fetched = client.value->download(file.full_name, out);
            if (fetched.is_err()) return forward_error<int>(fetched);
        }

        if (file.last_write_time != 0) {
            fs::last_write_time(local_path, to_file_time(file.last_write_time), ec);
            if (ec) {
                avlink_log(fmt::format("glob: could not set mtime on {}: {}",
                                       local_path.string(), ec.message()));
            }
        }
        downloaded++;
    }
    return Result<int>::Ok(downloaded);
}
