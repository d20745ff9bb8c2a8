#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".hostmux";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    // Ensure directory exists
    fs::create_directories(config_path.parent_path());

    // Default config content
    const char* default_config = R"(# hostmux configuration

settings:
  connect_timeout: 20              # seconds before a host counts as unreachable
  keepalive_interval: 30           # seconds, 0 disables SSH keepalives
  terminal:
    rows: 24
    cols: 80
    type: "xterm-256color"
  log_file: ""                     # empty = <tmp>/hostmux_debug.log

# Host profiles. Each tab opened against a profile gets its own connection.
hosts:
  example:
    host: "example.org"
    port: 22
    user: "deploy"
    # password: ""
    # ssh_key_path: "~/.ssh/id_ed25519"
    # passphrase: ""
)";

    try {
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

static Settings parse_settings(const YAML::Node& node) {
    Settings s;
    s.connect_timeout = node["connect_timeout"].as<int>(CONNECT_TIMEOUT_SECS);
    s.keepalive_interval = node["keepalive_interval"].as<int>(KEEPALIVE_INTERVAL_SECS);
    s.log_file = expand_home(node["log_file"].as<std::string>(""));

    if (node["terminal"] && node["terminal"].IsMap()) {
        const auto& term = node["terminal"];
        s.terminal.rows = term["rows"].as<int>(DEFAULT_TERM_ROWS);
        s.terminal.cols = term["cols"].as<int>(DEFAULT_TERM_COLS);
        s.terminal.type = term["type"].as<std::string>(DEFAULT_TERM_TYPE);
    }
    return s;
}

static HostConfig parse_host_config(const std::string& name, const YAML::Node& node,
                                    const Settings& settings) {
    HostConfig host;
    host.name = name;
    host.host = node["host"].as<std::string>("");
    host.port = node["port"].as<int>(22);
    host.user = node["user"].as<std::string>("");
    host.timeout = node["timeout"].as<int>(settings.connect_timeout);
    host.keepalive_interval = settings.keepalive_interval;

    if (node["password"]) {
        host.password = node["password"].as<std::string>();
    }
    if (node["ssh_key_path"]) {
        host.ssh_key_path = expand_home(node["ssh_key_path"].as<std::string>());
    }
    if (node["passphrase"]) {
        host.passphrase = node["passphrase"].as<std::string>();
    }

    return host;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    Config config;
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (!root || root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err("Config root must be a mapping");
        }

        if (root["settings"] && root["settings"].IsMap()) {
            config.settings_ = parse_settings(root["settings"]);
        }

        if (root["hosts"] && root["hosts"].IsMap()) {
            for (const auto& kv : root["hosts"]) {
                std::string name = kv.first.as<std::string>();
                if (!kv.second.IsMap()) {
                    return Result<Config>::Err(
                        fmt::format("Host '{}' must be a mapping", name));
                }
                HostConfig host = parse_host_config(name, kv.second, config.settings_);
                if (host.host.empty()) {
                    return Result<Config>::Err(
                        fmt::format("Host '{}' is missing 'host'", name));
                }
                config.hosts_[name] = host;
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err("Failed to parse config: " + std::string(e.what()));
    }

    return Result<Config>::Ok(config);
}

Result<Config> Config::load_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read config file: " + path.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse(buffer.str());
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Err("No config at " + get_global_config_path().string() +
                                   ". Run 'hostmux setup' first.");
    }
    return load_file(get_global_config_path());
}

std::optional<HostConfig> Config::find_host(const std::string& name) const {
    auto it = hosts_.find(name);
    if (it == hosts_.end()) return std::nullopt;
    return it->second;
}
