#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <core/config.hpp>
#include <core/cancel_token.hpp>
#include <ssh/connection.hpp>
#include <ssh/connection_factory.hpp>

class BaseCLI {
public:
    BaseCLI(const Config& config, std::shared_ptr<Transport> transport);
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    bool require_connection();

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Public state
    Config config;
    ConnectionFactory pool;
    std::shared_ptr<Connection> conn;
    CancelToken cancel;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
