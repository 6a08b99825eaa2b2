#pragma once

#include "transport.hpp"

// Production transport: each client gets its own libssh2 session.
class Libssh2Transport : public Transport {
public:
    std::unique_ptr<ShellClient> create_shell_client(
        const ConnectionTarget& target, const ConnectionSettings& settings) override;
    std::unique_ptr<FileTransferClient> create_file_transfer_client(
        const ConnectionTarget& target, const ConnectionSettings& settings) override;
};
