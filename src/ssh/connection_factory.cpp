#include "connection_factory.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <filesystem>
#include <stdexcept>
#include <vector>

// ── Lifecycle ──────────────────────────────────────────────────

ConnectionFactory::ConnectionFactory(std::shared_ptr<Transport> transport,
                                     const ConnectionSettings& settings,
                                     const TerminalGeometry& geometry)
    : transport_(std::move(transport)), settings_(settings), geometry_(geometry) {
    if (!transport_) {
        throw std::invalid_argument("transport must not be null");
    }
}

ConnectionFactory::~ConnectionFactory() {
    release_all();
}

// ── Connection grants ──────────────────────────────────────────

std::shared_ptr<Connection> ConnectionFactory::get(const ConnectionTarget& target) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto key = target.key();
    auto it = pool_.find(key);
    if (it != pool_.end()) return it->second;

    auto conn = Connection::create(target, transport_, settings_, geometry_);
    pool_.emplace(key, conn);
    avlink_log(fmt::format("pool: new connection {} (max attempts {})",
                           target.display(), settings_.max_reconnect_attempts));
    return conn;
}

std::shared_ptr<Connection> ConnectionFactory::get(const std::string& host, int port,
                                                   const std::string& user) {
    std::string key_path = find_default_private_key();
    if (key_path.empty()) {
        throw std::invalid_argument("No default private key found in ~/.ssh (id_rsa, id_ed25519)");
    }
    return get(ConnectionTarget(host, port, PrivateKeyAuth{user, key_path, ""}));
}

// ── Pool ───────────────────────────────────────────────────────

void ConnectionFactory::release_all() {
    std::map<std::string, std::shared_ptr<Connection>> released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        released.swap(pool_);
    }

    for (auto& [key, conn] : released) {
        try {
            conn->dispose();
        } catch (const std::exception& e) {
            avlink_log(fmt::format("pool: error disposing {}: {}", key, e.what()));
        }
    }
    if (!released.empty()) {
        avlink_log(fmt::format("pool: released {} connection(s)", released.size()));
    }
}

size_t ConnectionFactory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_.size();
}

int ConnectionFactory::default_max_reconnection_attempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_.max_reconnect_attempts;
}

void ConnectionFactory::set_default_max_reconnection_attempts(int attempts) {
    if (attempts < RECONNECT_UNLIMITED) {
        throw std::invalid_argument("max reconnect attempts must be -1, 0 or positive");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.max_reconnect_attempts = attempts;
}

std::string find_default_private_key() {
    auto ssh_dir = platform::home_dir() / ".ssh";
    for (const char* name : DEFAULT_KEY_FILES) {
        auto path = ssh_dir / name;
        std::error_code ec;
        if (std::filesystem::exists(path, ec)) return path.string();
    }
    return "";
}
