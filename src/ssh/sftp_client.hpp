#pragma once

#include <memory>
#include <mutex>
#include <core/types.hpp>
#include "transport.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;

class SessionManager;
class LivenessMonitor;

// SFTP transport over its own libssh2 session. The session runs in
// blocking mode with the configured connect timeout as the per-call limit;
// every SFTP call holds the session's io_mutex for its duration.
class SftpClient : public FileTransferClient {
public:
    SftpClient(const ConnectionTarget& target, const ConnectionSettings& settings);
    ~SftpClient() override;

    Result<void> connect(const CancelToken& cancel) override;
    bool is_connected() const override;
    void set_error_handler(ErrorHandler handler) override;
    void disconnect() override;

    Result<bool> exists(const std::string& path) override;
    Result<std::vector<RemoteFile>> list_directory(const std::string& path) override;
    Result<void> create_directory(const std::string& path) override;
    Result<void> upload(std::istream& source, const std::string& remote_path,
                        bool overwrite, const ProgressCallback& progress) override;
    Result<void> download(const std::string& remote_path, std::ostream& destination) override;
    Result<void> set_last_write_time(const std::string& remote_path, std::time_t mtime) override;
    Result<void> remove_file(const std::string& remote_path) override;

private:
    ConnectionTarget target_;
    ConnectionSettings settings_;
    std::shared_ptr<SessionManager> session_;
    LIBSSH2_SFTP* sftp_ = nullptr;
    std::unique_ptr<LivenessMonitor> monitor_;

    mutable std::mutex mutex_;
    ErrorHandler on_error_;

    // Session and its io_mutex, or nullptr when not connected. The caller
    // locks the io_mutex before touching sftp_.
    std::shared_ptr<SessionManager> active_session() const;
    std::string sftp_error(SessionManager& session, const std::string& what,
                           const std::string& path);
    void report_error(const std::string& message);
};
