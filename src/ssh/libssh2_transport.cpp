#include "libssh2_transport.hpp"
#include "shell_client.hpp"
#include "sftp_client.hpp"

std::unique_ptr<ShellClient> Libssh2Transport::create_shell_client(
    const ConnectionTarget& target, const ConnectionSettings& settings) {
    return std::make_unique<SshShellClient>(target, settings);
}

std::unique_ptr<FileTransferClient> Libssh2Transport::create_file_transfer_client(
    const ConnectionTarget& target, const ConnectionSettings& settings) {
    return std::make_unique<SftpClient>(target, settings);
}
