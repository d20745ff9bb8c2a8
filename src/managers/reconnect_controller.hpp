#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include <core/types.hpp>
#include "connection_registry.hpp"

enum class LinkState { Connecting, Connected, Disconnected };

const char* link_state_name(LinkState state);

// Per-tab connection state machine on top of ConnectionRegistry.
//
//   Connecting   -> Connected | Disconnected   (attempt finished)
//   Connected    -> Disconnected               (transport closed, teardown)
//   Disconnected -> Connecting                 (reconnect() only)
//
// Nothing here retries on its own. The controller's mutex is never held
// while calling into the registry or the transition listener.
class ReconnectController {
public:
    using TransitionListener =
        std::function<void(const SessionId&, LinkState from, LinkState to)>;

    explicit ReconnectController(ConnectionRegistry& registry);

    ReconnectController(const ReconnectController&) = delete;
    ReconnectController& operator=(const ReconnectController&) = delete;

    // First connection of a tab; remembers the host for later reconnects.
    Result<std::shared_ptr<Session>> open(const SessionId& id, const HostConfig& host,
                                          StatusCallback callback = nullptr);

    // Discard the tab's session and build a fresh one. Rejected while an
    // attempt is already in progress.
    Result<std::shared_ptr<Session>> reconnect(const SessionId& id,
                                               StatusCallback callback = nullptr);

    // Tear the tab down for good.
    void close(const SessionId& id);

    std::optional<LinkState> state(const SessionId& id) const;
    std::optional<HostConfig> host(const SessionId& id) const;
    std::vector<SessionId> ids() const;

    void set_transition_listener(TransitionListener listener);

    // Registry status feed; installed by the owner.
    void on_session_status(const SessionId& id, SessionStatus status);

private:
    struct Entry {
        HostConfig host;
        LinkState state = LinkState::Disconnected;
        bool attempting = false;
    };

    struct Transition {
        SessionId id;
        LinkState from;
        LinkState to;
    };

    Result<std::shared_ptr<Session>> attempt(const SessionId& id, const HostConfig& host,
                                             bool discard_old, StatusCallback callback);
    // mutex_ must be held. Queues a transition when the state changes.
    void move_to(const SessionId& id, Entry& entry, LinkState to,
                 std::vector<Transition>& out);
    void emit(const std::vector<Transition>& transitions);

    ConnectionRegistry& registry_;

    mutable std::mutex mutex_;
    std::map<SessionId, Entry> entries_;

    std::mutex listener_mutex_;
    TransitionListener listener_;
};
