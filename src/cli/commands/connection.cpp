#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/config.hpp>
#include <core/log.hpp>

static void do_status(BaseCLI& cli, const std::string& arg) {
    std::cout << theme::section("Status");

    if (global_config_exists()) {
        std::cout << theme::kv("Config", get_global_config_path().string());
    } else {
        std::cout << theme::kv("Config", "defaults");
    }
    std::cout << theme::kv("Log", avlink_log_path());

    if (!cli.conn) {
        std::cout << theme::fail("No connection");
        std::cout << "\n";
        return;
    }

    std::cout << theme::kv("Target", cli.conn->target().display());
    int max_attempts = cli.conn->max_reconnection_attempts();
    std::cout << theme::kv("Retries", max_attempts < 0 ? std::string("unlimited")
                                                       : std::to_string(max_attempts));
    std::cout << "\n";

    auto model = cli.conn->status();
    std::cout << "    " << format_status_line(model, Channel::SHELL) << "\n";
    std::cout << "    " << format_status_line(model, Channel::FILE_TRANSFER) << "\n";
    if (cli.conn->is_reconnecting()) {
        std::cout << theme::step("Reconnection in progress");
    }
    std::cout << "\n";
}

void register_connection_commands(BaseCLI& cli) {
    cli.add_command("status", do_status, "Show connection status for both channels");
}
