#include "dependency_installer.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

static const char* DETECT_PM_SCRIPT =
    "if command -v apt-get >/dev/null 2>&1; then echo apt; "
    "elif command -v dnf >/dev/null 2>&1; then echo dnf; "
    "elif command -v yum >/dev/null 2>&1; then echo yum; "
    "elif command -v apk >/dev/null 2>&1; then echo apk; "
    "else echo unknown; fi";

DependencyInstaller::DependencyInstaller(ConnectionRegistry& registry)
    : registry_(registry) {}

Result<bool> DependencyInstaller::is_available(const SessionId& id, const std::string& tool) {
    auto r = registry_.exec(id, "command -v " + shell_quote(tool));
    if (r.is_err()) return Result<bool>::Err(r.kind, r.error);
    std::string out = r.value.stdout_data;
    trim(out);
    return Result<bool>::Ok(r.value.exit_code == 0 && !out.empty());
}

Result<std::string> DependencyInstaller::detect_package_manager(const SessionId& id) {
    auto r = registry_.exec(id, DETECT_PM_SCRIPT);
    if (r.is_err()) return Result<std::string>::Err(r.kind, r.error);
    std::string pm = r.value.stdout_data;
    trim(pm);
    if (pm.empty() || pm == "unknown") {
        return Result<std::string>::Err(ErrorKind::MissingDependency,
            "Could not detect a supported package manager (apt, dnf, yum, apk)");
    }
    return Result<std::string>::Ok(pm);
}

std::string DependencyInstaller::install_command(const std::string& package_manager,
                                                 const std::string& tool) {
    std::string pkg = shell_quote(tool);
    if (package_manager == "apt") {
        return "export DEBIAN_FRONTEND=noninteractive && sudo -n apt-get update && "
               "sudo -n apt-get install -y " + pkg;
    }
    if (package_manager == "dnf") return "sudo -n dnf install -y " + pkg;
    if (package_manager == "yum") return "sudo -n yum install -y " + pkg;
    if (package_manager == "apk") return "sudo -n apk add " + pkg;
    return "";
}

Result<void> DependencyInstaller::install(PendingOperation& op) {
    const SessionId& id = op.target_session_id();
    const std::string& tool = op.tool();

    auto fail = [&](ErrorKind kind, const std::string& msg) {
        op.append_log("> ERROR: " + msg);
        op.resolve(false);
        hostmux_log(fmt::format("install {} on {} failed: {}", tool, id, msg));
        return Result<void>::Err(kind, msg);
    };

    if (!op.begin_running()) {
        return Result<void>::Err(ErrorKind::UnsupportedOperation,
                                 "Install of " + tool + " already resolved");
    }

    op.append_log("> Detecting package manager...");
    auto pm = detect_package_manager(id);
    if (pm.is_err()) return fail(pm.kind, pm.error);
    op.append_log("> Detected package manager: " + pm.value);

    std::string cmd = install_command(pm.value, tool);
    op.append_log("> Installing " + tool + "...");
    op.append_log("> Running: " + cmd);

    auto r = registry_.exec(id, cmd);
    if (r.is_err()) return fail(r.kind, r.error);
    if (r.value.exit_code != 0) {
        op.append_log(fmt::format("> Exit Code: {}", r.value.exit_code));
        std::string err = r.value.stderr_data;
        trim(err);
        if (!err.empty()) op.append_log("> Error: " + err);
        return fail(ErrorKind::MissingDependency, "Installation command failed");
    }

    op.append_log("> Successfully installed " + tool + "!");
    op.resolve(true);
    return Result<void>::Ok();
}
