#pragma once

// In-memory transport for Connection tests. Connect outcomes are scripted
// per channel kind, every client created is recorded, and file-transfer
// clients share one fake remote filesystem so data survives reconnects.

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <istream>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <set>
#include <string>
#include <vector>
#include <ssh/connection.hpp>
#include <ssh/transport.hpp>

// Script and counters for one kind of client (shell or file transfer).
struct FakeEndpoint {
    std::mutex mutex;
    int fail_next = 0;           // fail this many connects, then succeed
    bool always_fail = false;
    bool block_until_cancel = false;
    int connects = 0;            // connect() calls, successful or not
    int successes = 0;

    void set_always_fail(bool fail) {
        std::lock_guard<std::mutex> lock(mutex);
        always_fail = fail;
    }

    void fail_next_connects(int n) {
        std::lock_guard<std::mutex> lock(mutex);
        fail_next = n;
    }

    void set_block_until_cancel(bool block) {
        std::lock_guard<std::mutex> lock(mutex);
        block_until_cancel = block;
    }

    int connect_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return connects;
    }

    int success_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return successes;
    }

    Result<void> attempt(const CancelToken& cancel) {
        bool block;
        {
            std::lock_guard<std::mutex> lock(mutex);
            connects++;
            block = block_until_cancel;
        }
        if (block) {
            while (!cancel.wait_for(std::chrono::milliseconds(5))) {}
            return Result<void>::Err("connect cancelled", ErrorKind::CANCELLED);
        }

        std::lock_guard<std::mutex> lock(mutex);
        if (always_fail) {
            return Result<void>::Err("connection refused", ErrorKind::CONNECT_FAILED);
        }
        if (fail_next > 0) {
            fail_next--;
            return Result<void>::Err("connection refused", ErrorKind::CONNECT_FAILED);
        }
        successes++;
        return Result<void>::Ok();
    }
};

class FakeShellStream : public ShellStream {
public:
    bool can_write() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }

    bool data_available() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return !pending_.empty();
    }

    Result<std::string> read() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) return Result<std::string>::Err("stream closed");
        std::string out;
        out.swap(pending_);
        return Result<std::string>::Ok(out);
    }

    Result<void> write(const std::string& data) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) return Result<void>::Err("stream closed");
        written_.push_back(data);
        return Result<void>::Ok();
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = false;
    }

    // Make output appear as if the device printed it.
    void push_output(const std::string& data) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_ += data;
    }

    std::vector<std::string> written() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return written_;
    }

private:
    mutable std::mutex mutex_;
    bool open_ = true;
    std::string pending_;
    std::vector<std::string> written_;
};

class FakeShellClient : public ShellClient {
public:
    explicit FakeShellClient(FakeEndpoint& endpoint) : endpoint_(endpoint) {}

    Result<void> connect(const CancelToken& cancel) override {
        auto result = endpoint_.attempt(cancel);
        std::lock_guard<std::mutex> lock(mutex_);
        connected_ = result.is_ok();
        return result;
    }

    bool is_connected() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return connected_;
    }

    Result<std::shared_ptr<ShellStream>> create_shell_stream(const TerminalGeometry& geometry) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!connected_) {
            return Result<std::shared_ptr<ShellStream>>::Err("not connected");
        }
        geometry_ = geometry;
        stream_ = std::make_shared<FakeShellStream>();
        return Result<std::shared_ptr<ShellStream>>::Ok(stream_);
    }

    void set_error_handler(ErrorHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    void disconnect() override {
        std::lock_guard<std::mutex> lock(mutex_);
        connected_ = false;
        disconnects_++;
    }

    // Simulate the liveness monitor noticing a dead link.
    void fire_error(const std::string& message) {
        ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            connected_ = false;
            if (stream_) stream_->close();
            handler = handler_;
        }
        if (handler) handler(message);
    }

    std::shared_ptr<FakeShellStream> stream() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stream_;
    }

    int disconnects() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return disconnects_;
    }

    TerminalGeometry geometry() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return geometry_;
    }

private:
    FakeEndpoint& endpoint_;
    mutable std::mutex mutex_;
    bool connected_ = false;
    int disconnects_ = 0;
    ErrorHandler handler_;
    std::shared_ptr<FakeShellStream> stream_;
    TerminalGeometry geometry_;
};

// Remote filesystem shared by every FakeFileTransferClient of a transport.
// Paths are stored without a leading "./".
struct FakeRemoteFs {
    struct File {
        std::string content;
        std::time_t mtime = 0;
    };

    std::mutex mutex;
    std::map<std::string, File> files;
    std::set<std::string> dirs;

    static std::string clean(std::string path) {
        while (path.rfind("./", 0) == 0) path.erase(0, 2);
        if (path.empty()) path = ".";
        return path;
    }

    static std::string parent_of(const std::string& path) {
        auto slash = path.rfind('/');
        if (slash == std::string::npos) return ".";
        if (slash == 0) return "/";
        return path.substr(0, slash);
    }

    static std::string join(const std::string& dir, const std::string& name) {
        if (dir == ".") return "./" + name;
        if (!dir.empty() && dir.back() == '/') return dir + name;
        return dir + "/" + name;
    }

    void add_file(const std::string& path, const std::string& content, std::time_t mtime = 0) {
        std::lock_guard<std::mutex> lock(mutex);
        std::string p = clean(path);
        files[p] = File{content, mtime};
        for (auto dir = parent_of(p); dir != "." && dir != "/"; dir = parent_of(dir)) {
            dirs.insert(dir);
        }
    }

    bool has_file(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex);
        return files.count(clean(path)) > 0;
    }

    std::string content_of(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = files.find(clean(path));
        return it == files.end() ? "" : it->second.content;
    }
};

class FakeFileTransferClient : public FileTransferClient {
public:
    FakeFileTransferClient(FakeEndpoint& endpoint, FakeRemoteFs& fs)
        : endpoint_(endpoint), fs_(fs) {}

    Result<void> connect(const CancelToken& cancel) override {
        auto result = endpoint_.attempt(cancel);
        std::lock_guard<std::mutex> lock(mutex_);
        connected_ = result.is_ok();
        return result;
    }

    bool is_connected() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return connected_;
    }

    void set_error_handler(ErrorHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = std::move(handler);
    }

    void disconnect() override {
        std::lock_guard<std::mutex> lock(mutex_);
        connected_ = false;
    }

    void fire_error(const std::string& message) {
        ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            connected_ = false;
            handler = handler_;
        }
        if (handler) handler(message);
    }

    Result<bool> exists(const std::string& path) override {
        if (!is_connected()) return Result<bool>::Err("not connected");
        std::lock_guard<std::mutex> lock(fs_.mutex);
        std::string p = FakeRemoteFs::clean(path);
        return Result<bool>::Ok(fs_.files.count(p) > 0 || fs_.dirs.count(p) > 0);
    }

    Result<std::vector<RemoteFile>> list_directory(const std::string& path) override {
        using R = Result<std::vector<RemoteFile>>;
        if (!is_connected()) return R::Err("not connected");

        std::lock_guard<std::mutex> lock(fs_.mutex);
        std::string dir = FakeRemoteFs::clean(path);
        if (dir != "." && dir != "/" && fs_.dirs.count(dir) == 0) {
            return R::Err("No such file: " + path);
        }

        std::vector<RemoteFile> out;
        for (const auto& d : fs_.dirs) {
            if (FakeRemoteFs::parent_of(d) != dir) continue;
            RemoteFile entry;
            entry.name = d.substr(d.rfind('/') == std::string::npos ? 0 : d.rfind('/') + 1);
            entry.full_name = FakeRemoteFs::join(path, entry.name);
            entry.is_directory = true;
            out.push_back(entry);
        }
        for (const auto& [p, file] : fs_.files) {
            if (FakeRemoteFs::parent_of(p) != dir) continue;
            RemoteFile entry;
            entry.name = p.substr(p.rfind('/') == std::string::npos ? 0 : p.rfind('/') + 1);
            entry.full_name = FakeRemoteFs::join(path, entry.name);
            entry.size = file.content.size();
            entry.last_write_time = file.mtime;
            out.push_back(entry);
        }
        return R::Ok(out);
    }

    Result<void> create_directory(const std::string& path) override {
        if (!is_connected()) return Result<void>::Err("not connected");
        std::lock_guard<std::mutex> lock(fs_.mutex);
        fs_.dirs.insert(FakeRemoteFs::clean(path));
        return Result<void>::Ok();
    }

    Result<void> upload(std::istream& source, const std::string& remote_path,
                        bool overwrite, const ProgressCallback& progress) override {
        if (!is_connected()) return Result<void>::Err("not connected");
        std::string data((std::istreambuf_iterator<char>(source)), std::istreambuf_iterator<char>());

        std::lock_guard<std::mutex> lock(fs_.mutex);
        std::string p = FakeRemoteFs::clean(remote_path);
        if (!overwrite && fs_.files.count(p)) {
            return Result<void>::Err("File exists: " + remote_path);
        }
        fs_.files[p] = FakeRemoteFs::File{data, 0};
        if (progress) progress(data.size());
        return Result<void>::Ok();
    }

    Result<void> download(const std::string& remote_path, std::ostream& destination) override {
        if (!is_connected()) return Result<void>::Err("not connected");
        std::lock_guard<std::mutex> lock(fs_.mutex);
        auto it = fs_.files.find(FakeRemoteFs::clean(remote_path));
        if (it == fs_.files.end()) return Result<void>::Err("No such file: " + remote_path);
        destination << it->second.content;
        return Result<void>::Ok();
    }

    Result<void> set_last_write_time(const std::string& remote_path, std::time_t mtime) override {
        if (!is_connected()) return Result<void>::Err("not connected");
        std::lock_guard<std::mutex> lock(fs_.mutex);
        auto it = fs_.files.find(FakeRemoteFs::clean(remote_path));
        if (it == fs_.files.end()) return Result<void>::Err("No such file: " + remote_path);
        it->second.mtime = mtime;
        return Result<void>::Ok();
    }

    Result<void> remove_file(const std::string& remote_path) override {
        if (!is_connected()) return Result<void>::Err("not connected");
        std::lock_guard<std::mutex> lock(fs_.mutex);
        if (fs_.files.erase(FakeRemoteFs::clean(remote_path)) == 0) {
            return Result<void>::Err("No such file: " + remote_path);
        }
        return Result<void>::Ok();
    }

private:
    FakeEndpoint& endpoint_;
    FakeRemoteFs& fs_;
    mutable std::mutex mutex_;
    bool connected_ = false;
    ErrorHandler handler_;
};

class FakeTransport : public Transport {
public:
    FakeEndpoint shell;
    FakeEndpoint sftp;
    FakeRemoteFs remote;

    std::unique_ptr<ShellClient> create_shell_client(const ConnectionTarget&,
                                                     const ConnectionSettings&) override {
        auto client = std::make_unique<FakeShellClient>(shell);
        std::lock_guard<std::mutex> lock(mutex_);
        shell_clients_.push_back(client.get());
        return client;
    }

    std::unique_ptr<FileTransferClient> create_file_transfer_client(const ConnectionTarget&,
                                                                    const ConnectionSettings&) override {
        auto client = std::make_unique<FakeFileTransferClient>(sftp, remote);
        std::lock_guard<std::mutex> lock(mutex_);
        sftp_clients_.push_back(client.get());
        return client;
    }

    // Most recently created clients. Only valid while the Connection holds them.
    FakeShellClient* last_shell_client() {
        std::lock_guard<std::mutex> lock(mutex_);
        return shell_clients_.empty() ? nullptr : shell_clients_.back();
    }

    FakeFileTransferClient* last_file_transfer_client() {
        std::lock_guard<std::mutex> lock(mutex_);
        return sftp_clients_.empty() ? nullptr : sftp_clients_.back();
    }

    size_t shell_clients_created() {
        std::lock_guard<std::mutex> lock(mutex_);
        return shell_clients_.size();
    }

private:
    std::mutex mutex_;
    std::vector<FakeShellClient*> shell_clients_;
    std::vector<FakeFileTransferClient*> sftp_clients_;
};

// Records every notification and lets tests block until one arrives.
class RecordingObserver : public ConnectionObserver {
public:
    void on_status_changed(const ConnectionStatusModel& model) override {
        record([&] { statuses_.push_back(model); });
    }
    void on_shell_disconnected() override { record([&] { events_.push_back("shell_disconnected"); }); }
    void on_shell_reconnected() override { record([&] { events_.push_back("shell_reconnected"); }); }
    void on_file_transfer_disconnected() override {
        record([&] { events_.push_back("sftp_disconnected"); });
    }
    void on_file_transfer_reconnected() override {
        record([&] { events_.push_back("sftp_reconnected"); });
    }
    void on_reconnection_failed(const std::string& message) override {
        record([&] { failures_.push_back(message); });
    }

    // Distinct consecutive states of one channel, in order.
    std::vector<ChannelStatus> states(Channel channel) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ChannelStatus> out;
        for (const auto& model : statuses_) {
            const auto& s = model.get(channel);
            if (!out.empty() && out.back().state == s.state && out.back().attempt == s.attempt &&
                out.back().max_attempts == s.max_attempts) {
                continue;
            }
            out.push_back(s);
        }
        return out;
    }

    int count_events(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(std::count(events_.begin(), events_.end(), name));
    }

    std::vector<std::string> failures() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return failures_;
    }

    ChannelStatus last(Channel channel) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return statuses_.empty() ? ChannelStatus{} : statuses_.back().get(channel);
    }

    bool wait_for_event(const std::string& name, int count = 1,
                        std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] {
            return std::count(events_.begin(), events_.end(), name) >= count;
        });
    }

    bool wait_for_failure(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return !failures_.empty(); });
    }

    bool wait_for_state(Channel channel, ChannelState state,
                        std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] {
            return !statuses_.empty() && statuses_.back().get(channel).state == state;
        });
    }

private:
    template <typename F>
    void record(F&& f) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            f();
        }
        cv_.notify_all();
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<ConnectionStatusModel> statuses_;
    std::vector<std::string> events_;
    std::vector<std::string> failures_;
};

// Backoff hook that records delays instead of sleeping.
class RecordingSleep {
public:
    Connection::SleepFn fn() {
        return [this](int ms, const CancelToken& cancel) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                delays_.push_back(ms);
            }
            return cancel.wait_for(std::chrono::milliseconds(1));
        };
    }

    std::vector<int> delays() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return delays_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<int> delays_;
};
