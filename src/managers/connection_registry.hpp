#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>
#include <core/types.hpp>
#include <ssh/transport.hpp>
#include "session.hpp"
#include "data_relay.hpp"

// SessionId -> Session. Sessions are created lazily by ensure() and torn down
// by disconnect(); callers always look a session up at the moment of use.
//
// Locking: mutex_ guards the map only and is never held across network I/O
// or listener calls. Session::connect_mutex() serializes setup per session so
// concurrent ensure() calls for one id share a single transport.
class ConnectionRegistry {
public:
    using StatusListener = std::function<void(const SessionId&, SessionStatus)>;

    ConnectionRegistry(TransportFactory factory, DataRelay& relay,
                       TerminalSize terminal = TerminalSize{});
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    Result<std::shared_ptr<Session>> ensure(const SessionId& id, const HostConfig& host,
                                            StatusCallback callback = nullptr);
    void disconnect(const SessionId& id);
    void disconnect_all();

    std::shared_ptr<Session> find(const SessionId& id) const;
    std::vector<SessionId> ids() const;

    Result<void> write(const SessionId& id, const std::string& bytes);
    Result<void> resize(const SessionId& id, int rows, int cols);
    Result<SSHResult> exec(const SessionId& id, const std::string& command_line);

    // Observes every status change; called without registry locks held.
    void set_status_listener(StatusListener listener);

    void set_terminal(const TerminalSize& terminal);

private:
    Result<void> establish(const std::shared_ptr<Session>& session, const HostConfig& host,
                           StatusCallback callback);
    void on_shell_closed(const SessionId& id, const std::weak_ptr<Session>& weak,
                         std::uint64_t generation);
    bool is_current(const SessionId& id, const std::shared_ptr<Session>& session) const;
    void drop_if_current(const SessionId& id, const std::shared_ptr<Session>& session);
    void notify(const SessionId& id, SessionStatus status);

    TransportFactory factory_;
    DataRelay& relay_;
    TerminalSize terminal_;

    mutable std::mutex mutex_;
    std::map<SessionId, std::shared_ptr<Session>> sessions_;

    std::mutex listener_mutex_;
    StatusListener listener_;
};
