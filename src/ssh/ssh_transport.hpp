#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <ssh/transport.hpp>
#include <platform/socket_util.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// State shared by a transport and every channel opened on it. libssh2 is not
// thread-safe per session, so each libssh2 call happens under a brief hold of
// `io`. `session` is nulled when the transport closes; channels check it
// under the lock before touching their own handles, which libssh2 frees
// together with the session.
struct SshLink {
    std::mutex io;
    LIBSSH2_SESSION* session = nullptr;
    socket_t sock = HOSTMUX_INVALID_SOCKET;

    // Block briefly on the socket without holding `io`.
    void wait(int timeout_ms) const;
};

class SshTransport : public Transport {
public:
    SshTransport();
    ~SshTransport() override;

    SshTransport(const SshTransport&) = delete;
    SshTransport& operator=(const SshTransport&) = delete;

    Result<void> connect(const HostConfig& host, StatusCallback callback) override;
    Result<std::unique_ptr<ShellChannel>> open_shell(const TerminalSize& size) override;
    Result<SSHResult> exec(const std::string& command_line) override;
    Result<std::unique_ptr<FileTransfer>> open_file_transfer() override;
    void close() override;
    bool is_open() const override;

    // Factory for ConnectionRegistry.
    static TransportFactory factory();

private:
    Result<void> authenticate(LIBSSH2_SESSION* session, StatusCallback callback);
    Result<LIBSSH2_CHANNEL*> open_channel();
    void free_channel(LIBSSH2_CHANNEL* ch);

    std::shared_ptr<SshLink> link_;
    HostConfig host_;
    std::string target_str_;
};
