#include "session.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

const char* session_status_name(SessionStatus status) {
    switch (status) {
        case SessionStatus::Connecting:   return "connecting";
        case SessionStatus::Connected:    return "connected";
        case SessionStatus::Disconnected: return "disconnected";
    }
    return "unknown";
}

Session::Session(SessionId id, std::unique_ptr<Transport> transport)
    : id_(std::move(id)), transport_(std::move(transport)) {}

Session::~Session() {
    close();
}

bool Session::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool Session::has_shell() const {
    return current_shell() != nullptr;
}

std::shared_ptr<ShellChannel> Session::current_shell() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shell_;
}

// ── Setup ──────────────────────────────────────────────────────

Result<void> Session::connect(const HostConfig& host, StatusCallback callback) {
    if (is_closed()) {
        return Result<void>::Err(ErrorKind::SessionClosed, "Session " + id_ + " closed");
    }
    status_ = SessionStatus::Connecting;

    auto result = transport_->connect(host, callback);
    if (result.is_err()) {
        status_ = SessionStatus::Disconnected;
        return result;
    }

    // Torn down while the handshake was in flight
    if (is_closed()) {
        transport_->close();
        return Result<void>::Err(ErrorKind::SessionClosed, "Session " + id_ + " closed");
    }
    return Result<void>::Ok();
}

Result<void> Session::open_shell(const TerminalSize& size,
                                 ShellChannel::DataCallback on_data,
                                 ShellChannel::ClosedCallback on_closed) {
    auto opened = transport_->open_shell(size);
    if (opened.is_err()) {
        return Result<void>::Err(opened.kind, opened.error);
    }

    std::shared_ptr<ShellChannel> shell(std::move(opened.value));
    bool adopted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!closed_) {
            shell_ = shell;
            adopted = true;
        }
    }
    if (!adopted) {
        shell->close();
        return Result<void>::Err(ErrorKind::SessionClosed, "Session " + id_ + " closed");
    }

    shell->start(std::move(on_data), std::move(on_closed));
    return Result<void>::Ok();
}

void Session::mark_connected() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closed_) status_ = SessionStatus::Connected;
}

// ── Shell I/O ──────────────────────────────────────────────────

Result<void> Session::write(const std::string& bytes) {
    auto shell = current_shell();
    if (!shell) {
        return Result<void>::Err(ErrorKind::NotConnected, "No shell on session " + id_);
    }
    return shell->write(bytes);
}

Result<void> Session::resize(int rows, int cols) {
    auto shell = current_shell();
    if (!shell) return Result<void>::Ok();
    return shell->resize(rows, cols);
}

// ── Request-scoped channels ────────────────────────────────────

Result<SSHResult> Session::exec(const std::string& command_line) {
    if (is_closed()) {
        return Result<SSHResult>::Err(ErrorKind::SessionClosed, "Session " + id_ + " closed");
    }
    auto result = transport_->exec(command_line);
    if (result.is_err() && is_closed()) {
        return Result<SSHResult>::Err(ErrorKind::SessionClosed, "Session " + id_ + " closed");
    }
    return result;
}

Result<std::unique_ptr<FileTransfer>> Session::open_file_transfer() {
    using R = Result<std::unique_ptr<FileTransfer>>;
    if (is_closed()) {
        return R::Err(ErrorKind::SessionClosed, "Session " + id_ + " closed");
    }
    auto result = transport_->open_file_transfer();
    if (result.is_err() && is_closed()) {
        return R::Err(ErrorKind::SessionClosed, "Session " + id_ + " closed");
    }
    return result;
}

// ── Teardown ───────────────────────────────────────────────────

bool Session::close() {
    std::shared_ptr<ShellChannel> shell;
    bool was_live = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return false;
        closed_ = true;
        shell = std::move(shell_);
        was_live = status_ != SessionStatus::Disconnected;
        status_ = SessionStatus::Disconnected;
    }

    // Each close takes the transport's I/O lock briefly; never under mutex_.
    if (shell) shell->close();
    if (transport_) transport_->close();
    hostmux_log(fmt::format("session {} closed", id_));
    return was_live;
}
