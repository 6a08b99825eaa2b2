#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace fs = std::filesystem;

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".avlink";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    fs::create_directories(config_path.parent_path());

    const char* default_config = R"(# avlink configuration

connection:
  max_reconnect_attempts: 5        # 0 disables, -1 retries forever
  connect_timeout: 30              # seconds
  keepalive_interval: 3            # seconds, 0 disables liveness probes

terminal:
  width: 80
  height: 24

# Optional: debug log location (default: $TMPDIR/avlink_debug.log)
# log_file: "/tmp/avlink_debug.log"
)";

    try {
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string(),
                                     ErrorKind::INVALID_ARGUMENT);
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()),
                                 ErrorKind::INVALID_ARGUMENT);
    }
}

static ConnectionSettings parse_connection_settings(const YAML::Node& node) {
    ConnectionSettings s;
    s.max_reconnect_attempts = node["max_reconnect_attempts"].as<int>(s.max_reconnect_attempts);
    s.connect_timeout = node["connect_timeout"].as<int>(s.connect_timeout);
    s.keepalive_interval = node["keepalive_interval"].as<int>(s.keepalive_interval);
    return s;
}

static TerminalGeometry parse_terminal_geometry(const YAML::Node& node) {
    TerminalGeometry g;
    g.type = node["type"].as<std::string>(g.type);
    g.columns = node["width"].as<int>(g.columns);
    g.rows = node["height"].as<int>(g.rows);
    g.width_px = node["width_px"].as<int>(g.width_px);
    g.height_px = node["height_px"].as<int>(g.height_px);
    g.buffer_size = node["buffer_size"].as<int>(g.buffer_size);
    return g;
}

static Result<void> validate(const ConnectionSettings& c, const TerminalGeometry& t) {
    if (c.max_reconnect_attempts < -1)
        return Result<void>::Err("connection.max_reconnect_attempts must be -1, 0 or positive",
                                 ErrorKind::INVALID_ARGUMENT);
    if (c.connect_timeout <= 0)
        return Result<void>::Err("connection.connect_timeout must be positive",
                                 ErrorKind::INVALID_ARGUMENT);
    if (c.keepalive_interval < 0)
        return Result<void>::Err("connection.keepalive_interval must not be negative",
                                 ErrorKind::INVALID_ARGUMENT);
    if (t.columns <= 0 || t.rows <= 0 || t.buffer_size <= 0)
        return Result<void>::Err("terminal dimensions must be positive",
                                 ErrorKind::INVALID_ARGUMENT);
    return Result<void>::Ok();
}

Result<Config> Config::parse(const std::string& yaml) {
    try {
        return from_yaml(YAML::Load(yaml));
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what(),
                                   ErrorKind::INVALID_ARGUMENT);
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string(),
                                   ErrorKind::INVALID_ARGUMENT);
    }

    try {
        return from_yaml(YAML::LoadFile(path.string()));
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what(),
                                   ErrorKind::INVALID_ARGUMENT);
    }
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Ok(Config());
    }
    return load_file(get_global_config_path());
}

Result<Config> Config::from_yaml(const YAML::Node& root) {
    Config config;
    config.connection_ = parse_connection_settings(root["connection"] ? root["connection"] : YAML::Node());
    config.terminal_ = parse_terminal_geometry(root["terminal"] ? root["terminal"] : YAML::Node());
    if (root["log_file"]) {
        config.log_file_ = root["log_file"].as<std::string>();
    }

    auto valid = validate(config.connection_, config.terminal_);
    if (valid.is_err()) {
        return forward_error<Config>(valid);
    }
    return Result<Config>::Ok(config);
}
