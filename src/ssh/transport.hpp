#pragma once

#include <cstdint>
#include <ctime>
#include <functional>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/cancel_token.hpp>
#include "target.hpp"

// Transport primitives consumed by Connection. The production
// implementation lives in libssh2_transport; tests substitute fakes.

struct RemoteFile {
    std::string name;        // last path component
    std::string full_name;   // absolute or pattern-relative remote path
    bool is_directory = false;
    uint64_t size = 0;
    std::time_t last_write_time = 0;
};

// Fired (from any thread) when the transport notices the link is gone.
using ErrorHandler = std::function<void(const std::string& error)>;

// Cumulative bytes transferred so far.
using ProgressCallback = std::function<void(uint64_t bytes)>;

class ShellStream {
public:
    virtual ~ShellStream() = default;

    // False once the channel or its session is gone.
    virtual bool can_write() const = 0;
    virtual bool data_available() = 0;

    // Whatever output is buffered right now; empty when nothing arrived.
    virtual Result<std::string> read() = 0;
    virtual Result<void> write(const std::string& data) = 0;

    // Device consoles expect a bare carriage return as the line terminator.
    Result<void> write_line(const std::string& line) { return write(line + "\r"); }

    virtual void close() = 0;
};

class ShellClient {
public:
    virtual ~ShellClient() = default;

    virtual Result<void> connect(const CancelToken& cancel) = 0;
    virtual bool is_connected() const = 0;
    virtual Result<std::shared_ptr<ShellStream>> create_shell_stream(
        const TerminalGeometry& geometry) = 0;
    virtual void set_error_handler(ErrorHandler handler) = 0;
    virtual void disconnect() = 0;
};

class FileTransferClient {
public:
    virtual ~FileTransferClient() = default;

    virtual Result<void> connect(const CancelToken& cancel) = 0;
    virtual bool is_connected() const = 0;
    virtual void set_error_handler(ErrorHandler handler) = 0;
    virtual void disconnect() = 0;

    virtual Result<bool> exists(const std::string& path) = 0;
    virtual Result<std::vector<RemoteFile>> list_directory(const std::string& path) = 0;
    virtual Result<void> create_directory(const std::string& path) = 0;
    virtual Result<void> upload(std::istream& source, const std::string& remote_path,
                                bool overwrite, const ProgressCallback& progress) = 0;
    virtual Result<void> download(const std::string& remote_path, std::ostream& destination) = 0;
    virtual Result<void> set_last_write_time(const std::string& remote_path,
                                             std::time_t mtime) = 0;
    virtual Result<void> remove_file(const std::string& remote_path) = 0;
};

// Creates unconnected clients for a target. Each call returns a fresh client.
class Transport {
public:
    virtual ~Transport() = default;

    virtual std::unique_ptr<ShellClient> create_shell_client(
        const ConnectionTarget& target, const ConnectionSettings& settings) = 0;
    virtual std::unique_ptr<FileTransferClient> create_file_transfer_client(
        const ConnectionTarget& target, const ConnectionSettings& settings) = 0;
};
