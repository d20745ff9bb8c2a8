#pragma once

#include <string>
#include <core/types.hpp>
#include "connection_registry.hpp"
#include "pending_operation.hpp"

// Installs a missing remote tool with the host's package manager. Every
// step is appended to the PendingOperation log as "> ..." lines.
class DependencyInstaller {
public:
    explicit DependencyInstaller(ConnectionRegistry& registry);

    // True when `tool` resolves on the remote PATH.
    Result<bool> is_available(const SessionId& id, const std::string& tool);

    // "apt", "dnf", "yum" or "apk".
    Result<std::string> detect_package_manager(const SessionId& id);

    static std::string install_command(const std::string& package_manager,
                                       const std::string& tool);

    // Runs the install for op.tool() on op.target_session_id() and resolves
    // the operation. Returns the same outcome as a Result.
    Result<void> install(PendingOperation& op);

private:
    ConnectionRegistry& registry_;
};
