#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/utils.hpp>
#include <managers/remote_paths.hpp>

BaseCLI::BaseCLI() {
    auto config_result = Config::load_global();
    if (config_result.is_ok()) {
        config = config_result.value;
    } else if (global_config_exists()) {
        config_error = config_result.error;
    }
    service = std::make_unique<HostmuxService>(config.value_or(Config()));
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_tab() {
    if (current_tab.empty()) {
        std::cout << theme::fail("No tab selected. Run 'open <tab> <host>' first.");
        return false;
    }
    auto state = service->links().state(current_tab);
    if (!state || *state != LinkState::Connected) {
        std::cout << theme::fail("Tab " + current_tab + " is not connected.");
        std::cout << theme::step("Run 'reconnect' to bring it back.");
        return false;
    }
    return true;
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Tabs",      {"open", "close", "reconnect", "tabs", "use", "hosts", "status"}},
        {"Shell",     {"attach", "send", "exec"}},
        {"Files",     {"cd", "pwd", "ls", "stat", "cat", "write", "mkdir", "touch",
                       "rm", "mv", "cp", "chmod"}},
        {"Clipboard", {"copy", "cut", "paste", "clipboard"}},
        {"Archives",  {"zip", "extract"}},
        {"Transfer",  {"get", "put"}},
        {"General",   {"help", "clear", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::BROWN << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::BLUE
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

// ── Remote working directory ────────────────────────────────────

std::string BaseCLI::remote_cwd() {
    auto it = cwd_by_tab.find(current_tab);
    if (it != cwd_by_tab.end()) return it->second;

    std::string dir = ".";
    auto r = service->registry().exec(current_tab, "pwd");
    if (r.is_ok() && r.value.exit_code == 0) {
        std::string out = r.value.stdout_data;
        trim(out);
        if (!out.empty()) dir = out;
    }
    cwd_by_tab[current_tab] = dir;
    return dir;
}

void BaseCLI::set_remote_cwd(const std::string& dir) {
    cwd_by_tab[current_tab] = dir;
}

std::string BaseCLI::resolve_remote(const std::string& path) {
    if (path.empty()) return remote_cwd();
    if (path[0] == '/') return path;
    if (path == ".") return remote_cwd();
    if (path == "..") return remote_dirname(remote_cwd());
    return join_remote_path(remote_cwd(), path);
}

// ── Events ──────────────────────────────────────────────────────

void BaseCLI::post_event(const std::string& line) {
    std::lock_guard<std::mutex> lock(events_mutex_);
    events_.push_back(line);
}

void BaseCLI::drain_events() {
    std::vector<std::string> pending;
    {
        std::lock_guard<std::mutex> lock(events_mutex_);
        pending.swap(events_);
    }
    for (const auto& line : pending) std::cout << line;
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    if (current_tab.empty()) {
        return rl_esc(theme::color::BROWN) + "hostmux"
             + rl_esc(theme::color::RESET) + "> ";
    }

    auto state = service->links().state(current_tab);
    auto host = service->links().host(current_tab);
    bool connected = state && *state == LinkState::Connected;
    std::string host_name = host ? (host->name.empty() ? host->host : host->name) : "?";

    return rl_esc(theme::color::BROWN) + "hostmux"
         + rl_esc(theme::color::RESET) + ":"
         + rl_esc(theme::color::BLUE) + current_tab
         + rl_esc(theme::color::RESET) + "@"
         + rl_esc(connected ? theme::color::GREEN : theme::color::RED) + host_name
         + rl_esc(theme::color::RESET) + "> ";
}
