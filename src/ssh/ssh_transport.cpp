#include "ssh_transport.hpp"
#include "ssh_shell_channel.hpp"
#include "sftp_session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <chrono>
#include <cstring>

// ── libssh2 global init ────────────────────────────────────────

static int ensure_libssh2_init() {
    static std::once_flag once;
    static int rc = 0;
    std::call_once(once, [] { rc = libssh2_init(0); });
    return rc;
}

void SshLink::wait(int timeout_ms) const {
    if (sock == HOSTMUX_INVALID_SOCKET) {
        platform::sleep_ms(timeout_ms);
        return;
    }
    platform::poll_socket(sock, POLLIN, timeout_ms);
}

// Password handed to the keyboard-interactive callback through the session
// abstract pointer.
struct KbdAuthData {
    std::string password;
    StatusCallback callback;
};

static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        std::string prompt_text(reinterpret_cast<const char*>(prompts[i].text),
                                prompts[i].length);
        if (data->callback) data->callback("Answering prompt: " + prompt_text);
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
}

static std::string last_session_error(LIBSSH2_SESSION* session) {
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, len) : std::string("unknown error");
}

// ── Lifecycle ──────────────────────────────────────────────────

SshTransport::SshTransport() : link_(std::make_shared<SshLink>()) {}

SshTransport::~SshTransport() {
    close();
}

TransportFactory SshTransport::factory() {
    return [] { return std::unique_ptr<Transport>(new SshTransport()); };
}

Result<void> SshTransport::connect(const HostConfig& host, StatusCallback callback) {
    if (is_open()) {
        return Result<void>::Err(ErrorKind::Protocol, "Transport already connected");
    }
    host_ = host;
    target_str_ = host.user + "@" + host.host;

    if (ensure_libssh2_init() != 0) {
        return Result<void>::Err(ErrorKind::Protocol, "Failed to initialize libssh2");
    }

    int timeout_secs = host.timeout > 0 ? host.timeout : CONNECT_TIMEOUT_SECS;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_secs);

    if (callback) callback(fmt::format("Connecting to {}:{}...", host.host, host.port));

    std::string err;
    bool timed_out = false;
    socket_t sock = platform::connect_tcp(host.host, host.port, timeout_secs * 1000,
                                          err, timed_out);
    if (sock == HOSTMUX_INVALID_SOCKET) {
        hostmux_log(fmt::format("[{}] connect failed: {}", target_str_, err));
        return Result<void>::Err(ErrorKind::Unreachable,
            fmt::format("{}: {}", host.host, timed_out ? "connection timed out" : err));
    }

    if (callback) callback("TCP connected, starting SSH handshake...");

    LIBSSH2_SESSION* session = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session) {
        platform::close_socket(sock);
        return Result<void>::Err(ErrorKind::Protocol, "Failed to create SSH session");
    }
    libssh2_session_set_blocking(session, 0);

    auto abandon = [&](const char* reason) {
        libssh2_session_disconnect(session, reason);
        libssh2_session_free(session);
        platform::close_socket(sock);
    };

    // SSH handshake (key exchange)
    int rc;
    while ((rc = libssh2_session_handshake(session, sock)) == LIBSSH2_ERROR_EAGAIN) {
        if (std::chrono::steady_clock::now() > deadline) {
            abandon("Handshake timed out");
            return Result<void>::Err(ErrorKind::Unreachable,
                                     host.host + ": SSH handshake timed out");
        }
        platform::poll_socket(sock, POLLIN, EAGAIN_POLL_MS);
    }
    if (rc != 0) {
        std::string detail = last_session_error(session);
        abandon("Handshake failed");
        return Result<void>::Err(ErrorKind::Protocol, "SSH handshake failed: " + detail);
    }

    platform::enable_tcp_keepalive(sock);
    if (host.keepalive_interval > 0) {
        libssh2_keepalive_config(session, 1, static_cast<unsigned>(host.keepalive_interval));
    }

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth = authenticate(session, callback);
    if (auth.is_err()) {
        abandon("Authentication failed");
        hostmux_log(fmt::format("[{}] auth failed: {}", target_str_, auth.error));
        return auth;
    }

    {
        std::lock_guard<std::mutex> lock(link_->io);
        link_->session = session;
        link_->sock = sock;
    }

    hostmux_log(fmt::format("[{}] connected", target_str_));
    if (callback) callback("Connected to " + host.host);
    return Result<void>::Ok();
}

Result<void> SshTransport::authenticate(LIBSSH2_SESSION* session, StatusCallback callback) {
    const std::string& user = host_.user;
    int rc;

    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session, user.c_str(),
                                              static_cast<unsigned>(user.length()))) == nullptr) {
        if (libssh2_userauth_authenticated(session)) return Result<void>::Ok();
        if (libssh2_session_last_errno(session) != LIBSSH2_ERROR_EAGAIN) break;
        platform::sleep_ms(EAGAIN_POLL_MS);
    }
    std::string methods = auth_list ? auth_list : "";
    if (callback && !methods.empty()) callback("Auth methods: " + methods);

    auto offers = [&](const char* method) {
        return methods.empty() || methods.find(method) != std::string::npos;
    };

    if (host_.ssh_key_path && offers("publickey")) {
        if (callback) callback("Using key " + *host_.ssh_key_path + "...");
        const char* passphrase = host_.passphrase ? host_.passphrase->c_str() : nullptr;
        while ((rc = libssh2_userauth_publickey_fromfile(session, user.c_str(), nullptr,
                    host_.ssh_key_path->c_str(), passphrase)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(EAGAIN_POLL_MS);
        }
        if (rc == 0) return Result<void>::Ok();
        hostmux_log(fmt::format("[{}] publickey rejected: {}", target_str_,
                                last_session_error(session)));
    }

    if (host_.password && offers("password")) {
        if (callback) callback("Using password auth...");
        while ((rc = libssh2_userauth_password(session, user.c_str(),
                    host_.password->c_str())) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(EAGAIN_POLL_MS);
        }
        if (rc == 0) return Result<void>::Ok();
    }

    if (host_.password && offers("keyboard-interactive")) {
        if (callback) callback("Using keyboard-interactive auth...");
        KbdAuthData kbd_data{*host_.password, callback};
        *libssh2_session_abstract(session) = &kbd_data;
        while ((rc = libssh2_userauth_keyboard_interactive(session, user.c_str(),
                    kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(EAGAIN_POLL_MS);
        }
        *libssh2_session_abstract(session) = nullptr;
        if (rc == 0) return Result<void>::Ok();
    }

    if (!host_.password && !host_.ssh_key_path) {
        return Result<void>::Err(ErrorKind::Authentication,
                                 "No password or key configured for " + target_str_);
    }
    return Result<void>::Err(ErrorKind::Authentication,
                             "Authentication failed for " + target_str_);
}

void SshTransport::close() {
    LIBSSH2_SESSION* session = nullptr;
    socket_t sock = HOSTMUX_INVALID_SOCKET;
    {
        std::lock_guard<std::mutex> lock(link_->io);
        session = link_->session;
        sock = link_->sock;
        link_->session = nullptr;
        link_->sock = HOSTMUX_INVALID_SOCKET;
        if (session) {
            libssh2_session_disconnect(session, "Normal disconnection");
            libssh2_session_free(session);
        }
    }
    if (sock != HOSTMUX_INVALID_SOCKET) {
        platform::close_socket(sock);
    }
    if (session) hostmux_log(fmt::format("[{}] closed", target_str_));
}

bool SshTransport::is_open() const {
    std::lock_guard<std::mutex> lock(link_->io);
    return link_->session != nullptr;
}

// ── Channels ───────────────────────────────────────────────────

Result<LIBSSH2_CHANNEL*> SshTransport::open_channel() {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::seconds(CHANNEL_OPEN_TIMEOUT_SECS);
    while (true) {
        LIBSSH2_CHANNEL* ch = nullptr;
        {
            std::lock_guard<std::mutex> lock(link_->io);
            if (!link_->session) {
                return Result<LIBSSH2_CHANNEL*>::Err(ErrorKind::SessionClosed, "Session closed");
            }
            ch = libssh2_channel_open_session(link_->session);
            if (!ch && libssh2_session_last_errno(link_->session) != LIBSSH2_ERROR_EAGAIN) {
                return Result<LIBSSH2_CHANNEL*>::Err(ErrorKind::Protocol,
                    "Failed to open channel: " + last_session_error(link_->session));
            }
        }
        if (ch) return Result<LIBSSH2_CHANNEL*>::Ok(ch);
        if (std::chrono::steady_clock::now() > deadline) {
            return Result<LIBSSH2_CHANNEL*>::Err(ErrorKind::Protocol, "Timed out opening channel");
        }
        link_->wait(EAGAIN_POLL_MS);
    }
}

void SshTransport::free_channel(LIBSSH2_CHANNEL* ch) {
    std::lock_guard<std::mutex> lock(link_->io);
    if (!link_->session) return;  // freed with the session
    libssh2_channel_free(ch);
}

Result<std::unique_ptr<ShellChannel>> SshTransport::open_shell(const TerminalSize& size) {
    using R = Result<std::unique_ptr<ShellChannel>>;

    auto opened = open_channel();
    if (opened.is_err()) return R::Err(opened.kind, opened.error);
    LIBSSH2_CHANNEL* ch = opened.value;

    // Request PTY with the configured dimensions, then the login shell.
    int rc;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(link_->io);
            if (!link_->session) return R::Err(ErrorKind::SessionClosed, "Session closed");
            rc = libssh2_channel_request_pty_ex(ch, size.type.c_str(),
                     static_cast<unsigned>(size.type.size()), nullptr, 0,
                     size.cols, size.rows, 0, 0);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        link_->wait(EAGAIN_POLL_MS);
    }
    if (rc != 0) {
        free_channel(ch);
        return R::Err(ErrorKind::Protocol, "Failed to request PTY");
    }

    while (true) {
        {
            std::lock_guard<std::mutex> lock(link_->io);
            if (!link_->session) return R::Err(ErrorKind::SessionClosed, "Session closed");
            rc = libssh2_channel_shell(ch);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        link_->wait(EAGAIN_POLL_MS);
    }
    if (rc != 0) {
        free_channel(ch);
        return R::Err(ErrorKind::Protocol, "Failed to request shell");
    }

    hostmux_log(fmt::format("[{}] shell opened {}x{}", target_str_, size.cols, size.rows));
    return R::Ok(std::unique_ptr<ShellChannel>(new SshShellChannel(link_, ch)));
}

Result<SSHResult> SshTransport::exec(const std::string& command_line) {
    using R = Result<SSHResult>;
    const auto closed = [] { return R::Err(ErrorKind::SessionClosed, "Session closed"); };

    // Fresh exec channel per command (no PTY, binary-clean)
    auto opened = open_channel();
    if (opened.is_err()) return R::Err(opened.kind, opened.error);
    LIBSSH2_CHANNEL* ch = opened.value;

    int rc;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(link_->io);
            if (!link_->session) return closed();
            rc = libssh2_channel_exec(ch, command_line.c_str());
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        link_->wait(EAGAIN_POLL_MS);
    }
    if (rc != 0) {
        free_channel(ch);
        return R::Err(ErrorKind::Protocol, "Failed to exec command on channel");
    }

    // No stdin for remote commands
    while (true) {
        {
            std::lock_guard<std::mutex> lock(link_->io);
            if (!link_->session) return closed();
            rc = libssh2_channel_send_eof(ch);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        link_->wait(EAGAIN_POLL_MS);
    }

    // Read stdout and stderr until the channel reports EOF
    std::string out, err;
    char buf[SSH_READ_BUF_SIZE];
    while (true) {
        ssize_t n_out, n_err;
        bool eof = false;
        {
            std::lock_guard<std::mutex> lock(link_->io);
            if (!link_->session) return closed();
            n_out = libssh2_channel_read(ch, buf, sizeof(buf));
            if (n_out > 0) out.append(buf, static_cast<size_t>(n_out));
            n_err = libssh2_channel_read_stderr(ch, buf, sizeof(buf));
            if (n_err > 0) err.append(buf, static_cast<size_t>(n_err));
            if (n_out <= 0 && n_err <= 0) eof = libssh2_channel_eof(ch) != 0;
        }
        if ((n_out < 0 && n_out != LIBSSH2_ERROR_EAGAIN) ||
            (n_err < 0 && n_err != LIBSSH2_ERROR_EAGAIN)) {
            free_channel(ch);
            return R::Err(ErrorKind::RemoteIO, "SSH channel read error");
        }
        if (n_out > 0 || n_err > 0) continue;
        if (eof) break;
        link_->wait(EAGAIN_POLL_MS);
    }

    // Exit status is available once the channel is closed
    while (true) {
        {
            std::lock_guard<std::mutex> lock(link_->io);
            if (!link_->session) return closed();
            rc = libssh2_channel_close(ch);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        link_->wait(EAGAIN_POLL_MS);
    }
    int exit_status = -1;
    if (rc == 0) {
        while (true) {
            {
                std::lock_guard<std::mutex> lock(link_->io);
                if (!link_->session) return closed();
                rc = libssh2_channel_wait_closed(ch);
            }
            if (rc != LIBSSH2_ERROR_EAGAIN) break;
            link_->wait(EAGAIN_POLL_MS);
        }
        std::lock_guard<std::mutex> lock(link_->io);
        if (!link_->session) return closed();
        exit_status = libssh2_channel_get_exit_status(ch);
    }
    free_channel(ch);

    SSHResult result{exit_status, out, err};
    hostmux_log_ssh("[" + target_str_ + "]", command_line, result);
    return R::Ok(result);
}

Result<std::unique_ptr<FileTransfer>> SshTransport::open_file_transfer() {
    using R = Result<std::unique_ptr<FileTransfer>>;
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::seconds(CHANNEL_OPEN_TIMEOUT_SECS);
    while (true) {
        LIBSSH2_SFTP* sftp = nullptr;
        {
            std::lock_guard<std::mutex> lock(link_->io);
            if (!link_->session) return R::Err(ErrorKind::SessionClosed, "Session closed");
            sftp = libssh2_sftp_init(link_->session);
            if (!sftp && libssh2_session_last_errno(link_->session) != LIBSSH2_ERROR_EAGAIN) {
                return R::Err(ErrorKind::Protocol,
                    "Failed to start SFTP: " + last_session_error(link_->session));
            }
        }
        if (sftp) return R::Ok(std::unique_ptr<FileTransfer>(new SftpSession(link_, sftp)));
        if (std::chrono::steady_clock::now() > deadline) {
            return R::Err(ErrorKind::Protocol, "Timed out starting SFTP");
        }
        link_->wait(EAGAIN_POLL_MS);
    }
}
