#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

// Seams between the session layer and the wire. The libssh2 implementations
// live in ssh_transport / ssh_shell_channel / sftp_session; tests substitute
// in-memory fakes.

// Long-lived interactive shell bound to one transport.
class ShellChannel {
public:
    using DataCallback = std::function<void(const std::string& bytes)>;
    using ClosedCallback = std::function<void()>;

    virtual ~ShellChannel() = default;

    // Begin delivering output. on_data runs on the channel's reader thread in
    // transport order; on_closed fires exactly once, after the last on_data.
    virtual void start(DataCallback on_data, ClosedCallback on_closed) = 0;

    virtual Result<void> write(const std::string& bytes) = 0;
    virtual Result<void> resize(int rows, int cols) = 0;

    // Idempotent. Does not fire on_closed when called by the owner.
    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

// Request-scoped SFTP sub-session.
class FileTransfer {
public:
    virtual ~FileTransfer() = default;

    virtual Result<std::vector<FileEntry>> list(const std::string& dir) = 0;
    virtual Result<FileEntry> stat(const std::string& path) = 0;
    virtual Result<std::string> read_file(const std::string& path) = 0;
    virtual Result<void> write_file(const std::string& path, const std::string& content) = 0;
    virtual Result<void> mkdir(const std::string& path, std::uint32_t mode) = 0;
    virtual Result<void> remove(const std::string& path, bool is_directory) = 0;
    virtual Result<void> rename(const std::string& from, const std::string& to) = 0;
    virtual Result<void> chmod(const std::string& path, std::uint32_t mode) = 0;
    virtual Result<void> download(const std::string& remote,
                                  const std::filesystem::path& local) = 0;
    virtual Result<void> upload(const std::filesystem::path& local,
                                const std::string& remote) = 0;

    virtual void close() = 0;
};

// One authenticated connection to a host.
class Transport {
public:
    virtual ~Transport() = default;

    // Fails with Authentication, Unreachable or Protocol.
    virtual Result<void> connect(const HostConfig& host, StatusCallback callback) = 0;

    virtual Result<std::unique_ptr<ShellChannel>> open_shell(const TerminalSize& size) = 0;

    // Runs one command on a fresh exec channel, blocking until it exits.
    virtual Result<SSHResult> exec(const std::string& command_line) = 0;

    virtual Result<std::unique_ptr<FileTransfer>> open_file_transfer() = 0;

    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>()>;
