#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>

enum class OperationState { Prompting, Running, Succeeded, Failed };

const char* operation_state_name(OperationState state);

// A file operation parked on an external decision, currently only "install
// the missing remote tool?". The orchestrator blocks in wait() until the
// front end resolves it exactly once.
class PendingOperation {
public:
    using LogListener = std::function<void(const std::string& line)>;

    PendingOperation(std::string kind, std::string tool, SessionId target_session_id,
                     std::string working_directory, std::vector<RemoteItem> items);

    PendingOperation(const PendingOperation&) = delete;
    PendingOperation& operator=(const PendingOperation&) = delete;

    const std::string& kind() const { return kind_; }
    const std::string& tool() const { return tool_; }
    const SessionId& target_session_id() const { return target_session_id_; }
    const std::string& working_directory() const { return working_directory_; }
    const std::vector<RemoteItem>& items() const { return items_; }

    OperationState state() const;
    std::vector<std::string> log() const;
    bool is_resolved() const;

    // Live log feed, replayed with the lines already recorded.
    void set_log_listener(LogListener listener);

    // Prompting -> Running. False once resolved or already running.
    bool begin_running();
    void append_log(const std::string& line);

    // Running/Prompting -> Succeeded/Failed. False on a second resolution.
    bool resolve(bool succeeded);
    bool decline();

    // Blocks until resolved, then returns the final state.
    OperationState wait();

private:
    std::string kind_;
    std::string tool_;
    SessionId target_session_id_;
    std::string working_directory_;
    std::vector<RemoteItem> items_;

    mutable std::mutex mutex_;
    std::condition_variable resolved_cv_;
    OperationState state_ = OperationState::Prompting;
    std::vector<std::string> log_;
    LogListener listener_;
};
