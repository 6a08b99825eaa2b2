#include "target.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <stdexcept>

ConnectionTarget::ConnectionTarget(std::string host, int port, Identity identity)
    : host_(std::move(host)), port_(port), identity_(std::move(identity)) {
    trim(host_);
    if (host_.empty()) {
        throw std::invalid_argument("host address must not be empty");
    }
    if (port_ <= 0 || port_ > 65535) {
        throw std::invalid_argument(fmt::format("port {} is out of range", port_));
    }
    if (user().empty()) {
        throw std::invalid_argument("username must not be empty");
    }

    if (auto* pw = std::get_if<PasswordAuth>(&identity_)) {
        if (pw->password.empty())
            throw std::invalid_argument("password must not be empty");
    } else if (std::get<PrivateKeyAuth>(identity_).key_path.empty()) {
        throw std::invalid_argument("private key path must not be empty");
    }
}

const std::string& ConnectionTarget::user() const {
    if (auto* pw = std::get_if<PasswordAuth>(&identity_)) return pw->user;
    return std::get<PrivateKeyAuth>(identity_).user;
}

bool ConnectionTarget::uses_private_key() const {
    return std::holds_alternative<PrivateKeyAuth>(identity_);
}

std::string ConnectionTarget::key() const {
    return to_lower(fmt::format("{}:{}:{}", host_, port_, user()));
}

std::string ConnectionTarget::display() const {
    return fmt::format("{}@{}:{}", user(), host_, port_);
}
