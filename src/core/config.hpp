#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace YAML { class Node; }

namespace fs = std::filesystem;

class Config {
public:
    // Load global config from ~/.avlink/config.yaml. A missing file yields defaults.
    static Result<Config> load_global();

    // Load config from an explicit YAML file. The file must exist.
    static Result<Config> load_file(const fs::path& path);

    // Parse config from YAML text.
    static Result<Config> parse(const std::string& yaml);

    // Accessors
    const ConnectionSettings& connection() const { return connection_; }
    const TerminalGeometry& terminal() const { return terminal_; }
    std::optional<std::string> log_file() const { return log_file_; }

public:
    Config() = default;

private:
    ConnectionSettings connection_;
    TerminalGeometry terminal_;
    std::optional<std::string> log_file_;

    static Result<Config> from_yaml(const YAML::Node& root);
};

// Helper to check if the global config exists
bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Create default global config (no-op if one exists)
Result<void> create_default_global_config();
