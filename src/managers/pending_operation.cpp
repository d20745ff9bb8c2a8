#include "pending_operation.hpp"

const char* operation_state_name(OperationState state) {
    switch (state) {
        case OperationState::Prompting: return "prompting";
        case OperationState::Running:   return "running";
        case OperationState::Succeeded: return "succeeded";
        case OperationState::Failed:    return "failed";
    }
    return "unknown";
}

static bool is_final(OperationState state) {
    return state == OperationState::Succeeded || state == OperationState::Failed;
}

PendingOperation::PendingOperation(std::string kind, std::string tool,
                                   SessionId target_session_id,
                                   std::string working_directory,
                                   std::vector<RemoteItem> items)
    : kind_(std::move(kind)), tool_(std::move(tool)),
      target_session_id_(std::move(target_session_id)),
      working_directory_(std::move(working_directory)), items_(std::move(items)) {}

OperationState PendingOperation::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::vector<std::string> PendingOperation::log() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_;
}

bool PendingOperation::is_resolved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_final(state_);
}

void PendingOperation::set_log_listener(LogListener listener) {
    std::vector<std::string> backlog;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener_ = listener;
        backlog = log_;
    }
    if (listener) {
        for (const auto& line : backlog) listener(line);
    }
}

bool PendingOperation::begin_running() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != OperationState::Prompting) return false;
    state_ = OperationState::Running;
    return true;
}

void PendingOperation::append_log(const std::string& line) {
    LogListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        log_.push_back(line);
        listener = listener_;
    }
    if (listener) listener(line);
}

bool PendingOperation::resolve(bool succeeded) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_final(state_)) return false;
        state_ = succeeded ? OperationState::Succeeded : OperationState::Failed;
    }
    resolved_cv_.notify_all();
    return true;
}

bool PendingOperation::decline() {
    const std::string line = "> Declined by user";
    LogListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != OperationState::Prompting) return false;
        state_ = OperationState::Failed;
        log_.push_back(line);
        listener = listener_;
    }
    if (listener) listener(line);
    resolved_cv_.notify_all();
    return true;
}

OperationState PendingOperation::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    resolved_cv_.wait(lock, [this] { return is_final(state_); });
    return state_;
}
