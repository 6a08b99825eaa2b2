#include "avlink_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <readline/readline.h>
#include <readline/history.h>

static constexpr int PUMP_POLL_MS = 50;

AvlinkCLI::AvlinkCLI(const Config& config, std::shared_ptr<Transport> transport)
    : BaseCLI(config, std::move(transport)) {
    register_all_commands();
}

AvlinkCLI::~AvlinkCLI() {
    stop_pump();
    if (conn) conn->remove_observer(this);
    pool.release_all();
}

void AvlinkCLI::register_all_commands() {
    add_command("help", [this](BaseCLI&, const std::string&) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [this](BaseCLI&, const std::string&) {
        std::cout << theme::dim("    Disconnecting...") << "\n";
        quit_requested_ = true;
    }, "Disconnect and exit");

    register_connection_commands(*this);
    register_file_commands(*this);
}

// ── REPL ───────────────────────────────────────────────────────

int AvlinkCLI::run_repl(const ConnectionTarget& target) {
    conn = pool.get(target);
    last_status_ = conn->status();
    conn->add_observer(this);

    std::cout << theme::section("avlink");
    std::cout << theme::step("Connecting to " + target.display());

    auto shell = conn->ensure_shell(cancel);
    if (shell.is_err()) {
        std::cout << theme::fail(shell.error);
        return 1;
    }
    std::cout << theme::ok("Shell ready. Type ':help' for commands.");
    start_pump();

    std::string line;
    while (!quit_requested_) {
        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        if (line[0] != ':') {
            auto sent = conn->write_line(line, cancel);
            if (sent.is_err()) {
                std::lock_guard<std::mutex> lock(print_mutex_);
                std::cout << theme::fail(sent.error);
            }
            continue;
        }

        std::istringstream iss(line.substr(1));
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        if (!args.empty() && args[0] == ' ') {
            args = args.substr(1);
        }

        execute_command(command, args);
    }

    stop_pump();
    conn->remove_observer(this);
    pool.release_all();
    return 0;
}

// ── Output pump ────────────────────────────────────────────────

void AvlinkCLI::start_pump() {
    if (pump_running_) return;
    pump_running_ = true;
    pump_thread_ = std::thread(&AvlinkCLI::pump_loop, this);
}

void AvlinkCLI::stop_pump() {
    pump_running_ = false;
    if (pump_thread_.joinable()) {
        pump_thread_.join();
    }
}

void AvlinkCLI::pump_loop() {
    while (pump_running_) {
        // data_available never connects; reconnection is left to the engine
        if (conn && conn->is_shell_connected() && conn->data_available()) {
            auto output = conn->read(cancel);
            if (output.is_ok() && !output.value.empty()) {
                std::lock_guard<std::mutex> lock(print_mutex_);
                std::cout << output.value << std::flush;
            } else if (output.is_err()) {
                avlink_log("cli: shell read failed: " + output.error);
            }
        }
        platform::sleep_ms(PUMP_POLL_MS);
    }
}

// ── Status notifications ───────────────────────────────────────

void AvlinkCLI::print_async(const std::string& text) {
    std::lock_guard<std::mutex> lock(print_mutex_);
    std::cout << "\n" << text << std::flush;
}

void AvlinkCLI::on_status_changed(const ConnectionStatusModel& model) {
    std::string lines;
    {
        std::lock_guard<std::mutex> lock(print_mutex_);
        for (Channel channel : {Channel::SHELL, Channel::FILE_TRANSFER}) {
            const auto& now = model.get(channel);
            const auto& before = last_status_.get(channel);
            if (now.state == before.state && now.attempt == before.attempt) continue;
            lines += theme::log(format_status_line(model, channel));
        }
        last_status_ = model;
    }
    if (!lines.empty()) print_async(lines);
}

void AvlinkCLI::on_reconnection_failed(const std::string& message) {
    print_async(theme::fail(message));
}
