#pragma once

#include <memory>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <ssh/transport.hpp>
#include "data_relay.hpp"
#include "connection_registry.hpp"
#include "reconnect_controller.hpp"
#include "dependency_installer.hpp"
#include "file_operation_orchestrator.hpp"
#include "clipboard_coordinator.hpp"

// Pure data struct for UI consumption.
struct TabSummary {
    SessionId id;
    std::string host_name;       // profile name from config.yaml
    std::string target;          // user@host:port
    std::string state;           // "connecting", "connected", "disconnected"
};

// Headless service facade: owns every manager, usable by any front end.
class HostmuxService {
public:
    explicit HostmuxService(Config config, TransportFactory factory = nullptr);
    ~HostmuxService();

    HostmuxService(const HostmuxService&) = delete;
    HostmuxService& operator=(const HostmuxService&) = delete;

    const Config& config() const { return config_; }

    // ── Tabs ──────────────────────────────────────────────────

    // Open a tab against a host profile.
    Result<void> open_tab(const SessionId& id, const std::string& host_name,
                          StatusCallback cb = nullptr);
    // Open a tab against an ad-hoc host (no profile).
    Result<void> open_tab(const SessionId& id, const HostConfig& host,
                          StatusCallback cb = nullptr);
    Result<void> reconnect_tab(const SessionId& id, StatusCallback cb = nullptr);
    void close_tab(const SessionId& id);
    void close_all();

    std::vector<TabSummary> tabs() const;

    // ── Components ────────────────────────────────────────────

    DataRelay& relay() { return relay_; }
    ConnectionRegistry& registry() { return *registry_; }
    ReconnectController& links() { return *links_; }
    DependencyInstaller& installer() { return *installer_; }
    FileOperationOrchestrator& files() { return *files_; }
    ClipboardCoordinator& clipboard() { return *clipboard_; }

private:
    Config config_;
    DataRelay relay_;
    std::unique_ptr<ConnectionRegistry> registry_;
    std::unique_ptr<ReconnectController> links_;
    std::unique_ptr<DependencyInstaller> installer_;
    std::unique_ptr<FileOperationOrchestrator> files_;
    std::unique_ptr<ClipboardCoordinator> clipboard_;
};
