#include "sftp_session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <fstream>
#include <system_error>

SftpSession::SftpSession(std::shared_ptr<SshLink> link, LIBSSH2_SFTP* sftp)
    : link_(std::move(link)), sftp_(sftp) {}

SftpSession::~SftpSession() {
    close();
}

// ── Helpers ────────────────────────────────────────────────────

static std::string sftp_status_text(unsigned long code) {
    switch (code) {
        case LIBSSH2_FX_NO_SUCH_FILE:           return "No such file or directory";
        case LIBSSH2_FX_NO_SUCH_PATH:           return "No such path";
        case LIBSSH2_FX_PERMISSION_DENIED:      return "Permission denied";
        case LIBSSH2_FX_FILE_ALREADY_EXISTS:    return "File already exists";
        case LIBSSH2_FX_DIR_NOT_EMPTY:          return "Directory not empty";
        case LIBSSH2_FX_NOT_A_DIRECTORY:        return "Not a directory";
        case LIBSSH2_FX_WRITE_PROTECT:          return "Write protected";
        case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM: return "No space left on device";
        case LIBSSH2_FX_QUOTA_EXCEEDED:         return "Quota exceeded";
        case LIBSSH2_FX_INVALID_FILENAME:       return "Invalid filename";
        case LIBSSH2_FX_OP_UNSUPPORTED:         return "Operation unsupported";
        case LIBSSH2_FX_FAILURE:                return "Failure";
        default:                                return fmt::format("SFTP status {}", code);
    }
}

std::string SftpSession::last_error_locked(int rc) {
    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL && sftp_) {
        return sftp_status_text(libssh2_sftp_last_error(sftp_));
    }
    char* msg = nullptr;
    int len = 0;
    if (link_->session) libssh2_session_last_error(link_->session, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, len) : fmt::format("libssh2 error {}", rc);
}

int SftpSession::call(const std::function<int()>& fn, std::string* err) {
    while (true) {
        int rc;
        {
            std::lock_guard<std::mutex> lock(link_->io);
            if (!link_->session || !sftp_) return kLinkGone;
            rc = fn();
            if (rc < 0 && rc != LIBSSH2_ERROR_EAGAIN && err) *err = last_error_locked(rc);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) return rc;
        link_->wait(EAGAIN_POLL_MS);
    }
}

LIBSSH2_SFTP_HANDLE* SftpSession::open_handle(
        const std::function<LIBSSH2_SFTP_HANDLE*()>& fn, std::string& err, bool& gone) {
    gone = false;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(link_->io);
            if (!link_->session || !sftp_) {
                gone = true;
                return nullptr;
            }
            LIBSSH2_SFTP_HANDLE* h = fn();
            if (h) return h;
            int rc = libssh2_session_last_errno(link_->session);
            if (rc != LIBSSH2_ERROR_EAGAIN) {
                err = last_error_locked(rc);
                return nullptr;
            }
        }
        link_->wait(EAGAIN_POLL_MS);
    }
}

void SftpSession::close_handle(LIBSSH2_SFTP_HANDLE* handle) {
    call([&] { return libssh2_sftp_close_handle(handle); });
}

template <typename T>
Result<T> SftpSession::fail(int rc, const std::string& what, const std::string& err) {
    if (rc == kLinkGone) {
        return Result<T>::Err(ErrorKind::SessionClosed, what + ": session closed");
    }
    hostmux_log(fmt::format("sftp {}: {}", what, err));
    return Result<T>::Err(ErrorKind::RemoteIO, what + ": " + err);
}

static FileEntry entry_from_attrs(const std::string& name, const LIBSSH2_SFTP_ATTRIBUTES& attrs) {
    FileEntry e;
    e.name = name;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        e.mode = static_cast<std::uint32_t>(attrs.permissions);
        e.is_directory = (e.mode & MODE_TYPE_MASK) == MODE_DIRECTORY;
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) e.size = attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) e.modified_at = static_cast<std::int64_t>(attrs.mtime);
    return e;
}

// ── Queries ────────────────────────────────────────────────────

Result<std::vector<FileEntry>> SftpSession::list(const std::string& dir) {
    using R = Result<std::vector<FileEntry>>;
    std::string err;
    bool gone = false;
    LIBSSH2_SFTP_HANDLE* handle = open_handle([&] {
        return libssh2_sftp_open_ex(sftp_, dir.c_str(), static_cast<unsigned>(dir.size()),
                                    0, 0, LIBSSH2_SFTP_OPENDIR);
    }, err, gone);
    if (!handle) return fail<std::vector<FileEntry>>(gone ? kLinkGone : -1, "list " + dir, err);

    std::vector<FileEntry> entries;
    char name[SFTP_NAME_BUF_SIZE];
    while (true) {
        LIBSSH2_SFTP_ATTRIBUTES attrs;
        int rc = call([&] {
            return libssh2_sftp_readdir_ex(handle, name, sizeof(name), nullptr, 0, &attrs);
        }, &err);
        if (rc == 0) break;  // end of directory
        if (rc < 0) {
            if (rc != kLinkGone) close_handle(handle);
            return fail<std::vector<FileEntry>>(rc, "list " + dir, err);
        }
        std::string entry_name(name, static_cast<size_t>(rc));
        if (entry_name == "." || entry_name == "..") continue;
        entries.push_back(entry_from_attrs(entry_name, attrs));
    }
    close_handle(handle);
    return R::Ok(std::move(entries));
}

Result<FileEntry> SftpSession::stat(const std::string& path) {
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    std::string err;
    int rc = call([&] {
        return libssh2_sftp_stat_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()),
                                    LIBSSH2_SFTP_STAT, &attrs);
    }, &err);
    if (rc != 0) return fail<FileEntry>(rc, "stat " + path, err);

    auto slash = path.find_last_of('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    return Result<FileEntry>::Ok(entry_from_attrs(name, attrs));
}

// ── File contents ──────────────────────────────────────────────

Result<std::string> SftpSession::read_file(const std::string& path) {
    std::string err;
    bool gone = false;
    LIBSSH2_SFTP_HANDLE* handle = open_handle([&] {
        return libssh2_sftp_open_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()),
                                    LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    }, err, gone);
    if (!handle) return fail<std::string>(gone ? kLinkGone : -1, "read " + path, err);

    std::string content;
    char buf[SFTP_IO_BUF_SIZE];
    while (true) {
        ssize_t n = 0;
        int rc = call([&] {
            n = libssh2_sftp_read(handle, buf, sizeof(buf));
            return static_cast<int>(n < 0 ? n : 0);
        }, &err);
        if (rc < 0) {
            if (rc != kLinkGone) close_handle(handle);
            return fail<std::string>(rc, "read " + path, err);
        }
        if (n == 0) break;
        content.append(buf, static_cast<size_t>(n));
    }
    close_handle(handle);
    return Result<std::string>::Ok(std::move(content));
}

Result<void> SftpSession::write_file(const std::string& path, const std::string& content) {
    std::string err;
    bool gone = false;
    LIBSSH2_SFTP_HANDLE* handle = open_handle([&] {
        return libssh2_sftp_open_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()),
                                    LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                                    DEFAULT_FILE_MODE, LIBSSH2_SFTP_OPENFILE);
    }, err, gone);
    if (!handle) return fail<void>(gone ? kLinkGone : -1, "write " + path, err);

    size_t sent = 0;
    while (sent < content.size()) {
        ssize_t w = 0;
        int rc = call([&] {
            w = libssh2_sftp_write(handle, content.data() + sent, content.size() - sent);
            return static_cast<int>(w < 0 ? w : 0);
        }, &err);
        if (rc < 0) {
            if (rc != kLinkGone) close_handle(handle);
            return fail<void>(rc, "write " + path, err);
        }
        sent += static_cast<size_t>(w);
    }
    close_handle(handle);
    return Result<void>::Ok();
}

// ── Mutations ──────────────────────────────────────────────────

Result<void> SftpSession::mkdir(const std::string& path, std::uint32_t mode) {
    std::string err;
    int rc = call([&] {
        return libssh2_sftp_mkdir_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()),
                                     static_cast<long>(mode));
    }, &err);
    if (rc != 0) return fail<void>(rc, "mkdir " + path, err);
    return Result<void>::Ok();
}

Result<void> SftpSession::remove(const std::string& path, bool is_directory) {
    std::string err;
    int rc = call([&] {
        return is_directory
            ? libssh2_sftp_rmdir_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()))
            : libssh2_sftp_unlink_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()));
    }, &err);
    if (rc != 0) return fail<void>(rc, "delete " + path, err);
    return Result<void>::Ok();
}

Result<void> SftpSession::rename(const std::string& from, const std::string& to) {
    std::string err;
    int rc = call([&] {
        return libssh2_sftp_rename_ex(sftp_, from.c_str(), static_cast<unsigned>(from.size()),
                                      to.c_str(), static_cast<unsigned>(to.size()),
                                      LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE);
    }, &err);
    if (rc != 0) return fail<void>(rc, "rename " + from, err);
    return Result<void>::Ok();
}

Result<void> SftpSession::chmod(const std::string& path, std::uint32_t mode) {
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    attrs.flags = LIBSSH2_SFTP_ATTR_PERMISSIONS;
    attrs.permissions = mode & MODE_PERM_MASK;
    std::string err;
    int rc = call([&] {
        return libssh2_sftp_stat_ex(sftp_, path.c_str(), static_cast<unsigned>(path.size()),
                                    LIBSSH2_SFTP_SETSTAT, &attrs);
    }, &err);
    if (rc != 0) return fail<void>(rc, "chmod " + path, err);
    return Result<void>::Ok();
}

// ── Transfers ──────────────────────────────────────────────────

Result<void> SftpSession::download(const std::string& remote, const std::filesystem::path& local) {
    std::string err;
    bool gone = false;
    LIBSSH2_SFTP_HANDLE* handle = open_handle([&] {
        return libssh2_sftp_open_ex(sftp_, remote.c_str(), static_cast<unsigned>(remote.size()),
                                    LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    }, err, gone);
    if (!handle) return fail<void>(gone ? kLinkGone : -1, "download " + remote, err);

    std::ofstream out(local, std::ios::binary | std::ios::trunc);
    if (!out) {
        close_handle(handle);
        return Result<void>::Err(ErrorKind::Other, "Cannot write " + local.string());
    }

    // A partial local file is removed on any failure.
    auto abandon = [&] {
        out.close();
        std::error_code ec;
        std::filesystem::remove(local, ec);
    };

    char buf[SFTP_IO_BUF_SIZE];
    while (true) {
        ssize_t n = 0;
        int rc = call([&] {
            n = libssh2_sftp_read(handle, buf, sizeof(buf));
            return static_cast<int>(n < 0 ? n : 0);
        }, &err);
        if (rc < 0) {
            if (rc != kLinkGone) close_handle(handle);
            abandon();
            return fail<void>(rc, "download " + remote, err);
        }
        if (n == 0) break;
        out.write(buf, static_cast<std::streamsize>(n));
        if (!out) {
            close_handle(handle);
            abandon();
            return Result<void>::Err(ErrorKind::Other, "Short write to " + local.string());
        }
    }
    close_handle(handle);
    return Result<void>::Ok();
}

Result<void> SftpSession::upload(const std::filesystem::path& local, const std::string& remote) {
    std::ifstream in(local, std::ios::binary);
    if (!in) {
        return Result<void>::Err(ErrorKind::Other, "Cannot read " + local.string());
    }

    std::string err;
    bool gone = false;
    LIBSSH2_SFTP_HANDLE* handle = open_handle([&] {
        return libssh2_sftp_open_ex(sftp_, remote.c_str(), static_cast<unsigned>(remote.size()),
                                    LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                                    DEFAULT_FILE_MODE, LIBSSH2_SFTP_OPENFILE);
    }, err, gone);
    if (!handle) return fail<void>(gone ? kLinkGone : -1, "upload " + remote, err);

    char buf[SFTP_IO_BUF_SIZE];
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize got = in.gcount();
        if (got <= 0) break;

        size_t sent = 0;
        while (sent < static_cast<size_t>(got)) {
            ssize_t w = 0;
            int rc = call([&] {
                w = libssh2_sftp_write(handle, buf + sent, static_cast<size_t>(got) - sent);
                return static_cast<int>(w < 0 ? w : 0);
            }, &err);
            if (rc < 0) {
                if (rc != kLinkGone) close_handle(handle);
                return fail<void>(rc, "upload " + remote, err);
            }
            sent += static_cast<size_t>(w);
        }
    }
    if (in.bad()) {
        close_handle(handle);
        return Result<void>::Err(ErrorKind::Other, "Cannot read " + local.string());
    }
    close_handle(handle);
    return Result<void>::Ok();
}

void SftpSession::close() {
    if (!sftp_) return;
    call([&] { return libssh2_sftp_shutdown(sftp_); });
    sftp_ = nullptr;
}
