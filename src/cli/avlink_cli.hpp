#pragma once

#include "base_cli.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <thread>

// Forward declarations for command registration
void register_connection_commands(BaseCLI& cli);
void register_file_commands(BaseCLI& cli);

class AvlinkCLI : public BaseCLI, private ConnectionObserver {
public:
    AvlinkCLI(const Config& config, std::shared_ptr<Transport> transport);
    ~AvlinkCLI() override;

    // Open the shell on `target` and run the REPL until :quit or EOF.
    int run_repl(const ConnectionTarget& target);

private:
    void register_all_commands();

    // ── Shell output pump (background thread) ──────────────────
    // Copies remote shell output to stdout while the user sits at the
    // prompt. Only this thread reads from the shell stream.
    void start_pump();
    void stop_pump();
    void pump_loop();

    // ── ConnectionObserver ─────────────────────────────────────
    void on_status_changed(const ConnectionStatusModel& model) override;
    void on_reconnection_failed(const std::string& message) override;

    void print_async(const std::string& text);

    std::thread pump_thread_;
    std::atomic<bool> pump_running_{false};
    std::atomic<bool> quit_requested_{false};

    std::mutex print_mutex_;
    ConnectionStatusModel last_status_;
};
