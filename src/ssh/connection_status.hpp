#pragma once

#include <string>

enum class ChannelState {
    NOT_CONNECTED,
    CONNECTING,
    CONNECTED,
    LOST_CONNECTION,
    RECONNECTING,
    CONNECTION_FAILED,
    DISCONNECTING,
};

enum class Channel {
    SHELL,
    FILE_TRANSFER,
};

struct ChannelStatus {
    ChannelState state = ChannelState::NOT_CONNECTED;
    int attempt = 0;
    int max_attempts = 0;  // 0 = retries disabled, -1 = unlimited
};

// Per-channel status for one target. Owned and updated by Connection;
// observers receive copies.
class ConnectionStatusModel {
public:
    explicit ConnectionStatusModel(std::string host = "") : host_(std::move(host)) {}

    void update(Channel channel, ChannelState state, int attempt = 0, int max_attempts = 0);

    const std::string& host() const { return host_; }
    const ChannelStatus& shell() const { return shell_; }
    const ChannelStatus& file_transfer() const { return file_transfer_; }
    const ChannelStatus& get(Channel channel) const;

private:
    std::string host_;
    ChannelStatus shell_;
    ChannelStatus file_transfer_;
};

const char* to_string(ChannelState state);
const char* to_string(Channel channel);

// "SSH   (host): Connection Failed...Reconnecting (2 of 5)"
std::string format_status_line(const ConnectionStatusModel& model, Channel channel);
