#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_session_commands(BaseCLI& cli);
void register_file_commands(BaseCLI& cli);

class HostmuxCLI : public BaseCLI {
public:
    HostmuxCLI();

    // Open a tab per host profile, then enter the REPL.
    void run_repl(const std::vector<std::string>& hosts = {});
    void run_setup();
    void run_command(const std::string& command, const std::vector<std::string>& args);

private:
    void register_all_commands();
    void install_hooks();

    bool quit_ = false;
};
