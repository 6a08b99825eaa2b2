#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include "connection.hpp"
#include "transport.hpp"

// ConnectionFactory: one Connection per target, shared by every caller.
//
// Targets are pooled by ConnectionTarget::key(), so "Device.local" and
// "device.local" share a Connection while a different port does not.
// Handing out a Connection never connects it; channels connect lazily on
// first use.
//
//   ConnectionFactory pool(std::make_shared<Libssh2Transport>(), config.connection());
//   auto conn = pool.get(ConnectionTarget("10.0.0.5", 22, PasswordAuth{"admin", pw}));
//   ...
//   pool.release_all();

class ConnectionFactory {
public:
    ConnectionFactory(std::shared_ptr<Transport> transport,
                      const ConnectionSettings& settings = {},
                      const TerminalGeometry& geometry = {});
    ~ConnectionFactory();

    ConnectionFactory(const ConnectionFactory&) = delete;
    ConnectionFactory& operator=(const ConnectionFactory&) = delete;

    // ── Connection grants ──────────────────────────────────────

    std::shared_ptr<Connection> get(const ConnectionTarget& target);

    // Key-based login with the user's default key (~/.ssh/id_rsa, then
    // ~/.ssh/id_ed25519). Throws std::invalid_argument when neither exists.
    std::shared_ptr<Connection> get(const std::string& host, int port, const std::string& user);

    // ── Pool ───────────────────────────────────────────────────

    // Dispose every pooled Connection and empty the pool.
    void release_all();
    size_t size() const;

    // Ceiling handed to Connections created from now on.
    int default_max_reconnection_attempts() const;
    void set_default_max_reconnection_attempts(int attempts);

private:
    std::shared_ptr<Transport> transport_;
    ConnectionSettings settings_;
    TerminalGeometry geometry_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Connection>> pool_;
};

// Path of the first default private key that exists, or "" if none.
std::string find_default_private_key();
