#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

// Background probe for one transport client. Calls `probe` every interval;
// the first time it returns false the monitor reports `reason` through the
// error handler and stops. Each monitor fires at most once.
class LivenessMonitor {
public:
    using Probe = std::function<bool()>;
    using ErrorSink = std::function<void(const std::string&)>;

    LivenessMonitor(std::string name, int interval_secs, Probe probe, ErrorSink on_error);
    ~LivenessMonitor();

    LivenessMonitor(const LivenessMonitor&) = delete;
    LivenessMonitor& operator=(const LivenessMonitor&) = delete;

    void start();
    void stop();

private:
    void monitor_loop();

    std::string name_;
    int interval_secs_;
    Probe probe_;
    ErrorSink on_error_;
    std::atomic<bool> running_{false};
    std::thread thread_;
};
