#include <iostream>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include "cli/avlink_cli.hpp"
#include "cli/theme.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <ssh/libssh2_transport.hpp>

static void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    avlink "
              << theme::color::RESET << theme::color::BROWN << "<host>"
              << theme::color::RESET << theme::color::DIM
              << "             Open a resilient shell on a device" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    -p <port>             SSH port (default 22)\n"
              << "    -u <user>             Login name (default: current user)\n"
              << "    -i <key>              Private key file\n"
              << "    -r <attempts>         Reconnect attempts (0 off, -1 unlimited)\n"
              << "    --help                Show this help\n\n"
              << "    Without -i the password is read from AVLINK_PASSWORD."
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::string host;
        int port = DEFAULT_SSH_PORT;
        std::string user = platform::user_name();
        std::string key_path;
        std::optional<int> attempts;

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) throw std::invalid_argument("Missing value for " + arg);
                return argv[++i];
            };

            if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            } else if (arg == "-p") {
                port = safe_stoi(next(), -1);
            } else if (arg == "-u") {
                user = next();
            } else if (arg == "-i") {
                key_path = next();
            } else if (arg == "-r") {
                attempts = safe_stoi(next(), -2);
            } else if (host.empty() && arg[0] != '-') {
                host = arg;
            } else {
                std::cout << theme::fail("Unknown argument: " + arg);
                print_usage();
                return 1;
            }
        }

        if (host.empty()) {
            print_usage();
            return 1;
        }

        auto config_result = Config::load_global();
        if (config_result.is_err()) {
            std::cout << theme::fail(config_result.error);
            return 1;
        }
        Config config = config_result.value;
        if (config.log_file()) {
            set_avlink_log_path(*config.log_file());
        }

        Identity identity;
        if (!key_path.empty()) {
            identity = PrivateKeyAuth{user, key_path, ""};
        } else {
            const char* password = std::getenv("AVLINK_PASSWORD");
            if (!password) {
                std::cout << theme::fail("Set AVLINK_PASSWORD or pass -i <key>.");
                return 1;
            }
            identity = PasswordAuth{user, password};
        }
        ConnectionTarget target(host, port, identity);

        AvlinkCLI cli(config, std::make_shared<Libssh2Transport>());
        if (attempts) {
            cli.pool.set_default_max_reconnection_attempts(*attempts);
        }
        return cli.run_repl(target);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
