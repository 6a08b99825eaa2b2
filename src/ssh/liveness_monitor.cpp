#include "liveness_monitor.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

// ── Construction / Destruction ──────────────────────────────

LivenessMonitor::LivenessMonitor(std::string name, int interval_secs, Probe probe,
                                 ErrorSink on_error)
    : name_(std::move(name)), interval_secs_(interval_secs),
      probe_(std::move(probe)), on_error_(std::move(on_error)) {}

LivenessMonitor::~LivenessMonitor() {
    stop();
}

// ── Lifecycle ───────────────────────────────────────────────

void LivenessMonitor::start() {
    if (running_ || interval_secs_ <= 0) return;

    running_ = true;
    thread_ = std::thread(&LivenessMonitor::monitor_loop, this);
    avlink_log(fmt::format("liveness[{}]: started ({}s interval)", name_, interval_secs_));
}

void LivenessMonitor::stop() {
    running_ = false;
    if (!thread_.joinable()) return;

    // The error sink may tear the client down from inside the loop.
    if (thread_.get_id() == std::this_thread::get_id()) {
        thread_.detach();
    } else {
        thread_.join();
    }
}

// ── Monitor loop ────────────────────────────────────────────

void LivenessMonitor::monitor_loop() {
    while (running_) {
        // Sleep in short slices so stop() returns promptly
        for (int waited = 0; waited < interval_secs_ * 1000 && running_;
             waited += CANCEL_POLL_MS) {
            platform::sleep_ms(CANCEL_POLL_MS);
        }
        if (!running_) break;

        if (!probe_()) {
            running_ = false;
            avlink_log(fmt::format("liveness[{}]: probe failed", name_));
            // Copies: the sink may destroy this monitor
            auto sink = on_error_;
            auto message = fmt::format("{} connection lost", name_);
            if (sink) sink(message);
            return;
        }
    }
}
