#pragma once

#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <functional>
#include <optional>
#include <vector>
#include <core/config.hpp>
#include <managers/hostmux_service.hpp>

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    // Current tab selected and connected
    bool require_tab();

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Remote working directory of the current tab (resolved lazily via pwd)
    std::string remote_cwd();
    void set_remote_cwd(const std::string& dir);
    // Absolute paths pass through; relative ones join the remote cwd.
    std::string resolve_remote(const std::string& path);

    // Notifications raised on background threads, printed before the next prompt
    void post_event(const std::string& line);
    void drain_events();

    // Public state
    std::optional<Config> config;
    std::string config_error;          // set when config.yaml exists but is invalid
    std::unique_ptr<HostmuxService> service;
    std::string current_tab;
    std::map<SessionId, std::string> cwd_by_tab;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;

private:
    std::mutex events_mutex_;
    std::vector<std::string> events_;
};
