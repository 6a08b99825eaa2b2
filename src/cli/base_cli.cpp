#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <vector>
#include <fmt/format.h>

BaseCLI::BaseCLI(const Config& config, std::shared_ptr<Transport> transport)
    : config(config),
      pool(std::move(transport), config.connection(), config.terminal()) {}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_connection() {
    if (!conn || conn->is_disposed()) {
        std::cout << theme::fail("No connection. Restart avlink to connect again.");
        return false;
    }
    return true;
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: :" + command);
        std::cout << theme::step("Type ':help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Connection", {"status"}},
        {"Files",      {"ls", "put", "get", "mget"}},
        {"General",    {"help", "quit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        std::cout << "\n" << theme::color::BROWN << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::BLUE
                          << fmt::format("    :{:<13}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n" << theme::dim("    Any other line is sent to the remote shell.") << "\n\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    if (!conn) {
        return rl_esc(theme::color::BROWN) + "avlink"
             + rl_esc(theme::color::RESET) + "> ";
    }

    std::string host_color = conn->is_shell_connected() ? theme::color::GREEN
                           : conn->is_reconnecting()    ? theme::color::YELLOW
                                                        : theme::color::RED;
    return rl_esc(theme::color::BROWN) + "avlink"
         + rl_esc(theme::color::RESET) + ":"
         + rl_esc(host_color) + conn->target().host()
         + rl_esc(theme::color::RESET) + "> ";
}
