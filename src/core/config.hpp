#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <map>
#include "types.hpp"

namespace fs = std::filesystem;

struct Settings {
    int connect_timeout = 20;
    int keepalive_interval = 30;
    TerminalSize terminal;
    std::string log_file;                        // empty = temp dir default
};

class Config {
public:
    // Load global config from ~/.hostmux/config.yaml
    static Result<Config> load_global();

    // Load from an explicit path
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text (used by load_file and tests)
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const Settings& settings() const { return settings_; }
    const std::map<std::string, HostConfig>& hosts() const { return hosts_; }

    // Look up a host profile. Settings-level timeouts are already applied.
    std::optional<HostConfig> find_host(const std::string& name) const;

public:
    Config() = default;

private:
    Settings settings_;
    std::map<std::string, HostConfig> hosts_;
};

// Helper to check if config exists
bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Create default global config
Result<void> create_default_global_config();
