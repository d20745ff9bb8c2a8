#include "hostmux_service.hpp"
#include <core/log.hpp>
#include <ssh/ssh_transport.hpp>
#include <fmt/format.h>

HostmuxService::HostmuxService(Config config, TransportFactory factory)
    : config_(std::move(config)) {
    set_hostmux_log_path(config_.settings().log_file);

    if (!factory) factory = SshTransport::factory();
    registry_ = std::make_unique<ConnectionRegistry>(std::move(factory), relay_,
                                                     config_.settings().terminal);
    links_ = std::make_unique<ReconnectController>(*registry_);
    installer_ = std::make_unique<DependencyInstaller>(*registry_);
    files_ = std::make_unique<FileOperationOrchestrator>(*registry_, *installer_);
    clipboard_ = std::make_unique<ClipboardCoordinator>(*files_);

    ReconnectController* links = links_.get();
    registry_->set_status_listener([links](const SessionId& id, SessionStatus status) {
        links->on_session_status(id, status);
    });
}

HostmuxService::~HostmuxService() {
    close_all();
    registry_->set_status_listener(nullptr);
}

// ── Tabs ──────────────────────────────────────────────────────

Result<void> HostmuxService::open_tab(const SessionId& id, const std::string& host_name,
                                      StatusCallback cb) {
    auto host = config_.find_host(host_name);
    if (!host) {
        return Result<void>::Err(ErrorKind::Other, "Unknown host profile: " + host_name);
    }
    return open_tab(id, *host, cb);
}

Result<void> HostmuxService::open_tab(const SessionId& id, const HostConfig& host,
                                      StatusCallback cb) {
    auto r = links_->open(id, host, cb);
    if (r.is_err()) return Result<void>::Err(r.kind, r.error);
    return Result<void>::Ok();
}

Result<void> HostmuxService::reconnect_tab(const SessionId& id, StatusCallback cb) {
    auto r = links_->reconnect(id, cb);
    if (r.is_err()) return Result<void>::Err(r.kind, r.error);
    return Result<void>::Ok();
}

void HostmuxService::close_tab(const SessionId& id) {
    links_->close(id);
    relay_.forget(id);
}

void HostmuxService::close_all() {
    for (const auto& t : tabs()) close_tab(t.id);
    registry_->disconnect_all();
}

std::vector<TabSummary> HostmuxService::tabs() const {
    std::vector<TabSummary> out;
    for (const auto& id : links_->ids()) {
        TabSummary t;
        t.id = id;
        auto host = links_->host(id);
        auto state = links_->state(id);
        if (host) {
            t.host_name = host->name;
            t.target = fmt::format("{}@{}:{}", host->user, host->host, host->port);
        }
        t.state = state ? link_state_name(*state) : "closed";
        out.push_back(t);
    }
    return out;
}
