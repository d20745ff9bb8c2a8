#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include <ssh/transport.hpp>

enum class SessionStatus { Connecting, Connected, Disconnected };

const char* session_status_name(SessionStatus status);

// One tab's connection: a transport plus at most one shell channel. Exec and
// SFTP channels are opened per request. Owned by ConnectionRegistry; other
// components hold it only for the duration of one call.
class Session {
public:
    Session(SessionId id, std::unique_ptr<Transport> transport);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const SessionId& id() const { return id_; }
    SessionStatus status() const { return status_; }
    bool is_closed() const;
    bool has_shell() const;

    // Serializes connection setup; held by ConnectionRegistry::ensure.
    std::mutex& connect_mutex() { return connect_mutex_; }

    Result<void> connect(const HostConfig& host, StatusCallback callback);
    Result<void> open_shell(const TerminalSize& size,
                            ShellChannel::DataCallback on_data,
                            ShellChannel::ClosedCallback on_closed);
    void mark_connected();

    Result<void> write(const std::string& bytes);
    Result<void> resize(int rows, int cols);
    Result<SSHResult> exec(const std::string& command_line);
    Result<std::unique_ptr<FileTransfer>> open_file_transfer();

    // DataRelay lifetime of the current shell channel (0 = none yet).
    std::uint64_t relay_generation() const { return relay_generation_; }
    void set_relay_generation(std::uint64_t gen) { relay_generation_ = gen; }

    // Tear down shell and transport. Returns true only for the call that
    // moved the session out of Connecting/Connected.
    bool close();

private:
    std::shared_ptr<ShellChannel> current_shell() const;

    SessionId id_;
    std::unique_ptr<Transport> transport_;
    std::shared_ptr<ShellChannel> shell_;
    std::atomic<SessionStatus> status_{SessionStatus::Connecting};
    std::atomic<std::uint64_t> relay_generation_{0};
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::mutex connect_mutex_;
};
