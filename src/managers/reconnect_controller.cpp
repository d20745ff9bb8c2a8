#include "reconnect_controller.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

const char* link_state_name(LinkState state) {
    switch (state) {
        case LinkState::Connecting:   return "connecting";
        case LinkState::Connected:    return "connected";
        case LinkState::Disconnected: return "disconnected";
    }
    return "unknown";
}

ReconnectController::ReconnectController(ConnectionRegistry& registry)
    : registry_(registry) {}

void ReconnectController::set_transition_listener(TransitionListener listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

void ReconnectController::move_to(const SessionId& id, Entry& entry, LinkState to,
                                  std::vector<Transition>& out) {
    if (entry.state == to) return;
    out.push_back({id, entry.state, to});
    entry.state = to;
}

void ReconnectController::emit(const std::vector<Transition>& transitions) {
    if (transitions.empty()) return;
    TransitionListener listener;
    {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener = listener_;
    }
    for (const auto& t : transitions) {
        hostmux_log(fmt::format("tab {}: {} -> {}", t.id,
                                link_state_name(t.from), link_state_name(t.to)));
        if (listener) listener(t.id, t.from, t.to);
    }
}

// ── Queries ────────────────────────────────────────────────────

std::optional<LinkState> ReconnectController::state(const SessionId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    return it->second.state;
}

std::optional<HostConfig> ReconnectController::host(const SessionId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    return it->second.host;
}

std::vector<SessionId> ReconnectController::ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionId> out;
    for (const auto& kv : entries_) out.push_back(kv.first);
    return out;
}

// ── Attempts ───────────────────────────────────────────────────

Result<std::shared_ptr<Session>> ReconnectController::open(const SessionId& id,
                                                           const HostConfig& host,
                                                           StatusCallback callback) {
    using R = Result<std::shared_ptr<Session>>;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it != entries_.end()) {
            if (it->second.attempting) {
                return R::Err(ErrorKind::UnsupportedOperation,
                              "Tab " + id + " is already connecting");
            }
            if (it->second.state == LinkState::Disconnected) {
                return R::Err(ErrorKind::UnsupportedOperation,
                              "Tab " + id + " is disconnected; use reconnect");
            }
        }
    }

    auto existing = registry_.find(id);
    if (existing && existing->status() == SessionStatus::Connected) {
        return R::Ok(existing);
    }
    return attempt(id, host, false, callback);
}

Result<std::shared_ptr<Session>> ReconnectController::reconnect(const SessionId& id,
                                                                StatusCallback callback) {
    using R = Result<std::shared_ptr<Session>>;
    HostConfig host;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return R::Err(ErrorKind::NotConnected, "Unknown tab " + id);
        }
        if (it->second.attempting) {
            return R::Err(ErrorKind::UnsupportedOperation,
                          "Tab " + id + " is already connecting");
        }
        host = it->second.host;
    }
    return attempt(id, host, true, callback);
}

Result<std::shared_ptr<Session>> ReconnectController::attempt(const SessionId& id,
                                                              const HostConfig& host,
                                                              bool discard_old,
                                                              StatusCallback callback) {
    using R = Result<std::shared_ptr<Session>>;
    std::vector<Transition> transitions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& entry = entries_[id];
        if (entry.attempting) {
            return R::Err(ErrorKind::UnsupportedOperation,
                          "Tab " + id + " is already connecting");
        }
        entry.host = host;
        entry.attempting = true;
        // A fresh entry starts Disconnected; every attempt passes Connecting.
        if (entry.state == LinkState::Connected) {
            move_to(id, entry, LinkState::Disconnected, transitions);
        }
        move_to(id, entry, LinkState::Connecting, transitions);
    }
    emit(transitions);
    transitions.clear();

    // In-flight work against the old session observes SessionClosed.
    if (discard_old) registry_.disconnect(id);

    auto result = registry_.ensure(id, host, callback);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it != entries_.end()) {  // close() during the attempt wins
            it->second.attempting = false;
            bool live = result.is_ok() && result.value->status() == SessionStatus::Connected;
            move_to(id, it->second, live ? LinkState::Connected : LinkState::Disconnected,
                    transitions);
        }
    }
    emit(transitions);
    return result;
}

void ReconnectController::close(const SessionId& id) {
    std::vector<Transition> transitions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it != entries_.end()) {
            move_to(id, it->second, LinkState::Disconnected, transitions);
            entries_.erase(it);
        }
    }
    registry_.disconnect(id);
    emit(transitions);
}

// ── Registry feed ──────────────────────────────────────────────

void ReconnectController::on_session_status(const SessionId& id, SessionStatus status) {
    std::vector<Transition> transitions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end() || it->second.attempting) return;
        // Outside an attempt only the hang-up transition can arrive.
        if (status == SessionStatus::Disconnected) {
            move_to(id, it->second, LinkState::Disconnected, transitions);
        }
    }
    emit(transitions);
}
