#pragma once

#include <string>
#include <functional>

// Failure categories carried by Result. NONE on success.
enum class ErrorKind {
    NONE,
    INVALID_ARGUMENT,   // bad host/identity/path, never retried
    CONNECT_FAILED,     // could not establish the channel
    CHANNEL_ERROR,      // operation failed on an established channel
    DISPOSED,           // connection was disposed
    RETRIES_EXHAUSTED,  // reconnection loop gave up
    CANCELLED,          // caller's cancel token fired
    TIMEOUT,
};

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::NONE;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::NONE};
    }

    static Result<T> Err(const std::string& err,
                         ErrorKind kind = ErrorKind::CHANNEL_ERROR) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::NONE;

    static Result<void> Ok() {
        return {true, "", ErrorKind::NONE};
    }

    static Result<void> Err(const std::string& err,
                            ErrorKind kind = ErrorKind::CHANNEL_ERROR) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Re-tag a failed result of one type as another (error text and kind kept).
template <typename T, typename U>
Result<T> forward_error(const Result<U>& r) {
    return Result<T>::Err(r.error, r.kind);
}

// Configuration structures
struct ConnectionSettings {
    int max_reconnect_attempts = 0;  // 0 disables, -1 unlimited
    int connect_timeout = 30;        // seconds
    int keepalive_interval = 3;      // seconds, 0 disables the liveness monitor
};

// PTY requested for the interactive shell channel.
struct TerminalGeometry {
    std::string type = "xterm";
    int columns = 80;
    int rows = 24;
    int width_px = 800;
    int height_px = 600;
    int buffer_size = 1024;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
