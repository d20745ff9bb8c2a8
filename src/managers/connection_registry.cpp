#include "connection_registry.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

ConnectionRegistry::ConnectionRegistry(TransportFactory factory, DataRelay& relay,
                                       TerminalSize terminal)
    : factory_(std::move(factory)), relay_(relay), terminal_(std::move(terminal)) {}

ConnectionRegistry::~ConnectionRegistry() {
    disconnect_all();
}

void ConnectionRegistry::set_status_listener(StatusListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

void ConnectionRegistry::set_terminal(const TerminalSize& terminal) {
    std::lock_guard<std::mutex> lock(mutex_);
    terminal_ = terminal;
}

void ConnectionRegistry::notify(const SessionId& id, SessionStatus status) {
    StatusListener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = listener_;
    }
    hostmux_log(fmt::format("session {} -> {}", id, session_status_name(status)));
    if (listener) listener(id, status);
}

// ── Lookup ─────────────────────────────────────────────────────

std::shared_ptr<Session> ConnectionRegistry::find(const SessionId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::vector<SessionId> ConnectionRegistry::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionId> out;
    for (const auto& kv : sessions_) out.push_back(kv.first);
    return out;
}

bool ConnectionRegistry::is_current(const SessionId& id,
                                    const std::shared_ptr<Session>& session) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    return it != sessions_.end() && it->second == session;
}

void ConnectionRegistry::drop_if_current(const SessionId& id,
                                         const std::shared_ptr<Session>& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it != sessions_.end() && it->second == session) sessions_.erase(it);
}

// ── ensure ─────────────────────────────────────────────────────

Result<std::shared_ptr<Session>> ConnectionRegistry::ensure(const SessionId& id,
                                                            const HostConfig& host,
                                                            StatusCallback callback) {
    using R = Result<std::shared_ptr<Session>>;

    std::shared_ptr<Session> session;
    std::shared_ptr<Session> stale;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it != sessions_.end() && !it->second->is_closed() &&
            it->second->status() != SessionStatus::Disconnected) {
            session = it->second;
        } else {
            if (it != sessions_.end()) stale = it->second;
            session = std::make_shared<Session>(id, factory_());
            sessions_[id] = session;
        }
    }

    // A replaced session is already Disconnected; closing it only frees it.
    if (stale) stale->close();

    std::lock_guard<std::mutex> setup(session->connect_mutex());
    if (session->status() == SessionStatus::Connected && !session->is_closed()) {
        return R::Ok(session);
    }
    if (session->is_closed()) {
        return R::Err(ErrorKind::SessionClosed, "Session " + id + " was closed while connecting");
    }

    auto result = establish(session, host, callback);
    if (result.is_err()) {
        drop_if_current(id, session);
        session->close();
        // A concurrent disconnect() already reported its own transition.
        if (result.kind != ErrorKind::SessionClosed) notify(id, SessionStatus::Disconnected);
        return R::Err(result.kind, result.error);
    }
    return R::Ok(session);
}

Result<void> ConnectionRegistry::establish(const std::shared_ptr<Session>& session,
                                           const HostConfig& host, StatusCallback callback) {
    const SessionId& id = session->id();
    notify(id, SessionStatus::Connecting);

    auto connected = session->connect(host, callback);
    if (connected.is_err()) return connected;

    TerminalSize terminal;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        terminal = terminal_;
    }

    std::uint64_t gen = relay_.open_channel(id);
    session->set_relay_generation(gen);
    std::weak_ptr<Session> weak = session;

    auto shell = session->open_shell(
        terminal,
        [this, id, gen](const std::string& bytes) { relay_.publish_data(id, gen, bytes); },
        [this, id, weak, gen]() { on_shell_closed(id, weak, gen); });
    if (shell.is_err()) {
        relay_.publish_closed(id, gen);
        return shell;
    }

    session->mark_connected();
    if (session->is_closed()) {
        return Result<void>::Err(ErrorKind::SessionClosed,
                                 "Session " + id + " was closed while connecting");
    }
    notify(id, SessionStatus::Connected);
    return Result<void>::Ok();
}

// Runs on the shell's reader thread when the remote side hangs up.
void ConnectionRegistry::on_shell_closed(const SessionId& id,
                                         const std::weak_ptr<Session>& weak,
                                         std::uint64_t generation) {
    relay_.publish_closed(id, generation);

    auto session = weak.lock();
    if (!session || !is_current(id, session)) return;  // already discarded

    if (session->close()) {
        notify(id, SessionStatus::Disconnected);
    }
}

// ── disconnect ─────────────────────────────────────────────────

void ConnectionRegistry::disconnect(const SessionId& id) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return;
        session = it->second;
        sessions_.erase(it);
    }

    bool was_live = session->close();
    if (session->relay_generation() != 0) {
        relay_.publish_closed(id, session->relay_generation());
    }
    if (was_live) notify(id, SessionStatus::Disconnected);
}

void ConnectionRegistry::disconnect_all() {
    for (const auto& id : ids()) disconnect(id);
}

// ── Per-id operations ──────────────────────────────────────────

Result<void> ConnectionRegistry::write(const SessionId& id, const std::string& bytes) {
    auto session = find(id);
    if (!session || session->status() != SessionStatus::Connected) {
        return Result<void>::Err(ErrorKind::NotConnected, "No live session " + id);
    }
    return session->write(bytes);
}

Result<void> ConnectionRegistry::resize(const SessionId& id, int rows, int cols) {
    auto session = find(id);
    if (!session) return Result<void>::Ok();
    return session->resize(rows, cols);
}

Result<SSHResult> ConnectionRegistry::exec(const SessionId& id, const std::string& command_line) {
    auto session = find(id);
    if (!session || session->status() != SessionStatus::Connected) {
        return Result<SSHResult>::Err(ErrorKind::NotConnected, "No live session " + id);
    }
    return session->exec(command_line);
}
