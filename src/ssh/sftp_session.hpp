#pragma once

#include <functional>
#include <memory>
#include <ssh/transport.hpp>
#include <ssh/ssh_transport.hpp>

typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;
typedef struct _LIBSSH2_SFTP_HANDLE LIBSSH2_SFTP_HANDLE;
typedef struct _LIBSSH2_SFTP_ATTRIBUTES LIBSSH2_SFTP_ATTRIBUTES;

// SFTP sub-session over a shared libssh2 link. Opened per request and shut
// down by the caller once the result is in hand.
class SftpSession : public FileTransfer {
public:
    SftpSession(std::shared_ptr<SshLink> link, LIBSSH2_SFTP* sftp);
    ~SftpSession() override;

    SftpSession(const SftpSession&) = delete;
    SftpSession& operator=(const SftpSession&) = delete;

    Result<std::vector<FileEntry>> list(const std::string& dir) override;
    Result<FileEntry> stat(const std::string& path) override;
    Result<std::string> read_file(const std::string& path) override;
    Result<void> write_file(const std::string& path, const std::string& content) override;
    Result<void> mkdir(const std::string& path, std::uint32_t mode) override;
    Result<void> remove(const std::string& path, bool is_directory) override;
    Result<void> rename(const std::string& from, const std::string& to) override;
    Result<void> chmod(const std::string& path, std::uint32_t mode) override;
    Result<void> download(const std::string& remote,
                          const std::filesystem::path& local) override;
    Result<void> upload(const std::filesystem::path& local,
                        const std::string& remote) override;
    void close() override;

private:
    // Returned by call() when the transport went away mid-operation.
    static constexpr int kLinkGone = -10000;

    // Run one libssh2_sftp call under the I/O lock, retrying on EAGAIN.
    // Failures also capture the error text while the lock is still held.
    int call(const std::function<int()>& fn, std::string* err = nullptr);
    LIBSSH2_SFTP_HANDLE* open_handle(const std::function<LIBSSH2_SFTP_HANDLE*()>& fn,
                                     std::string& err, bool& gone);
    void close_handle(LIBSSH2_SFTP_HANDLE* handle);

    // Error text for the last failed call; io must be held.
    std::string last_error_locked(int rc);

    template <typename T>
    Result<T> fail(int rc, const std::string& what, const std::string& err);

    std::shared_ptr<SshLink> link_;
    LIBSSH2_SFTP* sftp_;
};
