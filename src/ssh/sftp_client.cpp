#include "sftp_client.hpp"
#include "session.hpp"
#include "liveness_monitor.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <istream>
#include <ostream>

static std::string join_remote(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

static const char* sftp_status_text(unsigned long code) {
    switch (code) {
        case LIBSSH2_FX_NO_SUCH_FILE:       return "no such file";
        case LIBSSH2_FX_NO_SUCH_PATH:       return "no such path";
        case LIBSSH2_FX_PERMISSION_DENIED:  return "permission denied";
        case LIBSSH2_FX_FILE_ALREADY_EXISTS: return "file already exists";
        case LIBSSH2_FX_FAILURE:            return "failure";
        case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM: return "no space on filesystem";
        case LIBSSH2_FX_NOT_A_DIRECTORY:    return "not a directory";
        case LIBSSH2_FX_DIR_NOT_EMPTY:      return "directory not empty";
        default:                            return "sftp error";
    }
}

// ── Lifecycle ───────────────────────────────────────────────

SftpClient::SftpClient(const ConnectionTarget& target, const ConnectionSettings& settings)
    : target_(target), settings_(settings) {}

SftpClient::~SftpClient() {
    disconnect();
}

Result<void> SftpClient::connect(const CancelToken& cancel) {
    disconnect();

    auto session = std::make_shared<SessionManager>(target_, settings_);
    auto result = session->establish(cancel, [](const std::string& msg) {
        avlink_log("sftp: " + msg);
    });
    if (result.is_err()) {
        return result;
    }

    session->set_blocking(true);

    LIBSSH2_SFTP* sftp = nullptr;
    {
        std::lock_guard<std::mutex> lock(*session->io_mutex());
        sftp = libssh2_sftp_init(session->raw());
    }
    if (!sftp) {
        std::string detail = session->last_error();
        session->close();
        return Result<void>::Err("Failed to start SFTP subsystem: " + detail,
                                 ErrorKind::CONNECT_FAILED);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    session_ = session;
    {
        std::lock_guard<std::mutex> io_lock(*session->io_mutex());
        sftp_ = sftp;
    }
    monitor_ = std::make_unique<LivenessMonitor>(
        "SFTP", settings_.keepalive_interval,
        [session] { return session->check_alive(); },
        [this](const std::string& msg) { report_error(msg); });
    monitor_->start();
    avlink_log(fmt::format("sftp: subsystem ready on {}", target_.display()));
    return Result<void>::Ok();
}

bool SftpClient::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_ && sftp_ && session_->is_active();
}

void SftpClient::set_error_handler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_error_ = std::move(handler);
}

void SftpClient::disconnect() {
    std::unique_ptr<LivenessMonitor> monitor;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        monitor = std::move(monitor_);
    }
    // Outside mutex_: the monitor thread takes it to report errors
    if (monitor) monitor->stop();

    std::shared_ptr<SessionManager> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = std::move(session_);
        if (session && sftp_) {
            std::lock_guard<std::mutex> io_lock(*session->io_mutex());
            if (session->is_active()) libssh2_sftp_shutdown(sftp_);
        }
        sftp_ = nullptr;
    }

    if (session) {
        session->close();
        avlink_log(fmt::format("sftp: disconnected {}", target_.display()));
    }
}

std::shared_ptr<SessionManager> SftpClient::active_session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!session_ || !sftp_ || !session_->is_active()) return nullptr;
    return session_;
}

std::string SftpClient::sftp_error(SessionManager& session, const std::string& what,
                                   const std::string& path) {
    int code = libssh2_session_last_errno(session.raw());
    if (code == LIBSSH2_ERROR_SFTP_PROTOCOL) {
        return fmt::format("{} '{}': {}", what, path, sftp_status_text(libssh2_sftp_last_error(sftp_)));
    }
    return fmt::format("{} '{}': {}", what, path, session.last_error());
}

void SftpClient::report_error(const std::string& message) {
    ErrorHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = on_error_;
    }
    avlink_log(fmt::format("sftp: {} ({})", message, target_.display()));
    if (handler) handler(message);
}

// ── File operations ─────────────────────────────────────────

Result<bool> SftpClient::exists(const std::string& path) {
    auto session = active_session();
    if (!session) return Result<bool>::Err("SFTP is not connected");

    std::lock_guard<std::mutex> lock(*session->io_mutex());
    if (!sftp_) return Result<bool>::Err("SFTP is not connected");
    LIBSSH2_SFTP_ATTRIBUTES attrs{};
    if (libssh2_sftp_stat(sftp_, path.c_str(), &attrs) == 0) {
        return Result<bool>::Ok(true);
    }
    if (libssh2_session_last_errno(session->raw()) == LIBSSH2_ERROR_SFTP_PROTOCOL) {
        unsigned long code = libssh2_sftp_last_error(sftp_);
        if (code == LIBSSH2_FX_NO_SUCH_FILE || code == LIBSSH2_FX_NO_SUCH_PATH) {
            return Result<bool>::Ok(false);
        }
    }
    return Result<bool>::Err(sftp_error(*session, "Failed to stat", path));
}

Result<std::vector<RemoteFile>> SftpClient::list_directory(const std::string& path) {
    using R = Result<std::vector<RemoteFile>>;
    auto session = active_session();
    if (!session) return R::Err("SFTP is not connected");

    std::lock_guard<std::mutex> lock(*session->io_mutex());
    if (!sftp_) return R::Err("SFTP is not connected");
    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        return R::Err(sftp_error(*session, "Failed to open directory", path));
    }

    std::vector<RemoteFile> entries;
    char name[SFTP_DIR_ENTRY_BUF_SIZE];
    char longentry[SFTP_DIR_ENTRY_BUF_SIZE];
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    while (true) {
        int rc = libssh2_sftp_readdir_ex(dir, name, sizeof(name),
                                         longentry, sizeof(longentry), &attrs);
        if (rc == 0) break;
        if (rc < 0) {
            std::string err = sftp_error(*session, "Failed to read directory", path);
            libssh2_sftp_closedir(dir);
            return R::Err(err);
        }

        std::string entry_name(name, static_cast<size_t>(rc));
        if (entry_name == "." || entry_name == "..") continue;

        RemoteFile file;
        file.name = entry_name;
        file.full_name = join_remote(path, entry_name);
        if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
            file.is_directory = (attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR;
        if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) file.size = attrs.filesize;
        if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
            file.last_write_time = static_cast<std::time_t>(attrs.mtime);
        entries.push_back(std::move(file));
    }
    libssh2_sftp_closedir(dir);
    return R::Ok(std::move(entries));
}

Result<void> SftpClient::create_directory(const std::string& path) {
    auto session = active_session();
    if (!session) return Result<void>::Err("SFTP is not connected");

    std::lock_guard<std::mutex> lock(*session->io_mutex());
    if (!sftp_) return Result<void>::Err("SFTP is not connected");
    int rc = libssh2_sftp_mkdir(sftp_, path.c_str(),
                                LIBSSH2_SFTP_S_IRWXU | LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IXGRP |
                                LIBSSH2_SFTP_S_IROTH | LIBSSH2_SFTP_S_IXOTH);
    if (rc != 0) {
        return Result<void>::Err(sftp_error(*session, "Failed to create directory", path));
    }
    return Result<void>::Ok();
}

Result<void> SftpClient::upload(std::istream& source, const std::string& remote_path,
                                bool overwrite, const ProgressCallback& progress) {
    auto session = active_session();
    if (!session) return Result<void>::Err("SFTP is not connected");

    unsigned long flags = LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT |
                          (overwrite ? LIBSSH2_FXF_TRUNC : LIBSSH2_FXF_EXCL);

    std::lock_guard<std::mutex> lock(*session->io_mutex());
    if (!sftp_) return Result<void>::Err("SFTP is not connected");
    LIBSSH2_SFTP_HANDLE* fh = libssh2_sftp_open(
        sftp_, remote_path.c_str(), flags,
        LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR | LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IROTH);
    if (!fh) {
        return Result<void>::Err(sftp_error(*session, "Failed to open for writing", remote_path));
    }

    char buf[SFTP_TRANSFER_BUF_SIZE];
    uint64_t total = 0;
    while (source) {
        source.read(buf, sizeof(buf));
        std::streamsize got = source.gcount();
        if (got <= 0) break;

        const char* p = buf;
        size_t remain = static_cast<size_t>(got);
        while (remain > 0) {
            ssize_t w = libssh2_sftp_write(fh, p, remain);
            if (w < 0) {
                std::string err = sftp_error(*session, "Failed to write", remote_path);
                libssh2_sftp_close(fh);
                return Result<void>::Err(err);
            }
            p += w;
            remain -= static_cast<size_t>(w);
            total += static_cast<uint64_t>(w);
        }
        if (progress) progress(total);
    }

    libssh2_sftp_close(fh);
    if (source.bad()) {
        return Result<void>::Err("Failed to read local source for " + remote_path);
    }
    return Result<void>::Ok();
}

Result<void> SftpClient::download(const std::string& remote_path, std::ostream& destination) {
    auto session = active_session();
    if (!session) return Result<void>::Err("SFTP is not connected");

    std::lock_guard<std::mutex> lock(*session->io_mutex());
    if (!sftp_) return Result<void>::Err("SFTP is not connected");
    LIBSSH2_SFTP_HANDLE* fh = libssh2_sftp_open(sftp_, remote_path.c_str(), LIBSSH2_FXF_READ, 0);
    if (!fh) {
        return Result<void>::Err(sftp_error(*session, "Failed to open for reading", remote_path));
    }

    char buf[SFTP_TRANSFER_BUF_SIZE];
    while (true) {
        ssize_t n = libssh2_sftp_read(fh, buf, sizeof(buf));
        if (n == 0) break;
        if (n < 0) {
            std::string err = sftp_error(*session, "Failed to read", remote_path);
            libssh2_sftp_close(fh);
            return Result<void>::Err(err);
        }
        destination.write(buf, n);
        if (!destination) {
            libssh2_sftp_close(fh);
            return Result<void>::Err("Failed to write local copy of " + remote_path);
        }
    }

    libssh2_sftp_close(fh);
    return Result<void>::Ok();
}

Result<void> SftpClient::set_last_write_time(const std::string& remote_path, std::time_t mtime) {
    auto session = active_session();
    if (!session) return Result<void>::Err("SFTP is not connected");

    std::lock_guard<std::mutex> lock(*session->io_mutex());
    if (!sftp_) return Result<void>::Err("SFTP is not connected");
    LIBSSH2_SFTP_ATTRIBUTES attrs{};
    if (libssh2_sftp_stat(sftp_, remote_path.c_str(), &attrs) != 0) {
        return Result<void>::Err(sftp_error(*session, "Failed to stat", remote_path));
    }

    unsigned long atime = (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
                              ? attrs.atime : static_cast<unsigned long>(mtime);
    LIBSSH2_SFTP_ATTRIBUTES update{};
    update.flags = LIBSSH2_SFTP_ATTR_ACMODTIME;
    update.atime = atime;
    update.mtime = static_cast<unsigned long>(mtime);
    if (libssh2_sftp_setstat(sftp_, remote_path.c_str(), &update) != 0) {
        return Result<void>::Err(sftp_error(*session, "Failed to set modification time", remote_path));
    }
    return Result<void>::Ok();
}

Result<void> SftpClient::remove_file(const std::string& remote_path) {
    auto session = active_session();
    if (!session) return Result<void>::Err("SFTP is not connected");

    std::lock_guard<std::mutex> lock(*session->io_mutex());
    if (!sftp_) return Result<void>::Err("SFTP is not connected");
    if (libssh2_sftp_unlink(sftp_, remote_path.c_str()) != 0) {
        return Result<void>::Err(sftp_error(*session, "Failed to delete", remote_path));
    }
    return Result<void>::Ok();
}
