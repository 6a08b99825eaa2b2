#include "connection_status.hpp"
#include <fmt/format.h>

void ConnectionStatusModel::update(Channel channel, ChannelState state, int attempt,
                                   int max_attempts) {
    ChannelStatus& s = (channel == Channel::SHELL) ? shell_ : file_transfer_;
    s.state = state;
    s.attempt = attempt;
    s.max_attempts = max_attempts;
}

const ChannelStatus& ConnectionStatusModel::get(Channel channel) const {
    return (channel == Channel::SHELL) ? shell_ : file_transfer_;
}

const char* to_string(ChannelState state) {
    switch (state) {
        case ChannelState::NOT_CONNECTED:     return "NOT_CONNECTED";
        case ChannelState::CONNECTING:        return "CONNECTING";
        case ChannelState::CONNECTED:         return "CONNECTED";
        case ChannelState::LOST_CONNECTION:   return "LOST_CONNECTION";
        case ChannelState::RECONNECTING:      return "RECONNECTING";
        case ChannelState::CONNECTION_FAILED: return "CONNECTION_FAILED";
        case ChannelState::DISCONNECTING:     return "DISCONNECTING";
    }
    return "UNKNOWN";
}

const char* to_string(Channel channel) {
    return channel == Channel::SHELL ? "SSH" : "SFTP";
}

static std::string status_text(const ChannelStatus& s) {
    switch (s.state) {
        case ChannelState::NOT_CONNECTED:
            return "Not Connected";
        case ChannelState::CONNECTING:
            return "Connecting...";
        case ChannelState::CONNECTED:
            return "Connected";
        case ChannelState::LOST_CONNECTION:
            return "Lost Connection...Reconnecting";
        case ChannelState::RECONNECTING:
            if (s.max_attempts > 0)
                return fmt::format("Connection Failed...Reconnecting ({} of {})", s.attempt, s.max_attempts);
            return fmt::format("Connection Failed...Reconnecting ({})", s.attempt);
        case ChannelState::CONNECTION_FAILED:
            if (s.max_attempts > 0)
                return fmt::format("Connection Failed ({} of {})", s.attempt, s.max_attempts);
            return "Connection Failed";
        case ChannelState::DISCONNECTING:
            return "Disconnecting...";
    }
    return "Unknown";
}

std::string format_status_line(const ConnectionStatusModel& model, Channel channel) {
    return fmt::format("{:<5} ({}): {}", to_string(channel), model.host(),
                       status_text(model.get(channel)));
}
