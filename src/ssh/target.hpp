#pragma once

#include <string>
#include <variant>

// Password (or keyboard-interactive) login.
struct PasswordAuth {
    std::string user;
    std::string password;
};

// Public-key login with a private key file on disk.
struct PrivateKeyAuth {
    std::string user;
    std::string key_path;
    std::string passphrase;
};

using Identity = std::variant<PasswordAuth, PrivateKeyAuth>;

// Immutable description of one remote device: where it is and who we log in as.
// Validated on construction; throws std::invalid_argument on a missing host,
// an out-of-range port, an empty user, or an empty password / key path.
class ConnectionTarget {
public:
    ConnectionTarget(std::string host, int port, Identity identity);

    const std::string& host() const { return host_; }
    int port() const { return port_; }
    const Identity& identity() const { return identity_; }
    const std::string& user() const;
    bool uses_private_key() const;

    // Pool key: lower-cased "host:port:user".
    std::string key() const;

    // "user@host:port" for logs and status lines.
    std::string display() const;

private:
    std::string host_;
    int port_;
    Identity identity_;
};
