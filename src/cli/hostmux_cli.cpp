#include "hostmux_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <unistd.h>
#include <fmt/format.h>
#include <core/config.hpp>
#include <platform/terminal.hpp>
#include <readline/readline.h>
#include <readline/history.h>

// Single-key y/N prompt.
static bool confirm(const std::string& question) {
    std::cout << theme::color::BROWN << "    " << question << " [y/N] "
              << theme::color::RESET << std::flush;
    char c = 0;
    {
        platform::RawModeGuard guard(platform::RawModeGuard::kNoEcho);
        if (read(STDIN_FILENO, &c, 1) != 1) c = 0;
    }
    std::cout << (c == 'y' || c == 'Y' ? "y" : "n") << "\n";
    return c == 'y' || c == 'Y';
}

HostmuxCLI::HostmuxCLI() : BaseCLI() {
    register_all_commands();
    install_hooks();
}

void HostmuxCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [this](BaseCLI& cli, const std::string& arg) {
        std::cout << theme::dim("    Closing tabs...") << "\n";
        quit_ = true;
    }, "Close every tab and exit");

    add_command("exit", [this](BaseCLI& cli, const std::string& arg) {
        std::cout << theme::dim("    Closing tabs...") << "\n";
        quit_ = true;
    }, "Close every tab and exit");

    add_command("clear", [](BaseCLI& cli, const std::string& arg) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    register_session_commands(*this);
    register_file_commands(*this);
}

void HostmuxCLI::install_hooks() {
    service->links().set_transition_listener(
        [this](const SessionId& id, LinkState from, LinkState to) {
            if (to == LinkState::Disconnected) {
                post_event(theme::tab_event(id, theme::red("disconnected")));
            } else if (to == LinkState::Connected && from == LinkState::Connecting) {
                post_event(theme::tab_event(id, theme::green("connected")));
            }
        });

    // Runs on the thread that issued the file operation, i.e. the REPL.
    service->files().set_prompt_handler([this](std::shared_ptr<PendingOperation> op) {
        std::cout << theme::fail(fmt::format("'{}' is not installed on tab {}.",
                                             op->tool(), op->target_session_id()));
        if (!confirm(fmt::format("Install {} now?", op->tool()))) {
            op->decline();
            std::cout << theme::dim("    Skipped.") << "\n";
            return;
        }
        op->set_log_listener([](const std::string& line) {
            std::cout << theme::log(line) << std::flush;
        });
        auto r = service->installer().install(*op);
        op->set_log_listener(nullptr);
        if (r.is_err()) {
            std::cout << theme::fail("Install failed: " + r.error);
        } else {
            std::cout << theme::ok(op->tool() + " installed");
        }
    });
}

void HostmuxCLI::run_repl(const std::vector<std::string>& hosts) {
    std::cout << theme::banner();

    std::cout << theme::section("Config");
    if (config.has_value()) {
        std::cout << theme::ok("Loaded " + get_global_config_path().string());
        std::cout << theme::kv("Hosts", std::to_string(config->hosts().size()));
    } else if (!config_error.empty()) {
        std::cout << theme::fail(config_error);
    } else {
        std::cout << theme::info("No config at " + get_global_config_path().string());
        std::cout << theme::step("Run 'hostmux setup' to create one.");
    }

    for (const auto& host : hosts) {
        execute_command("open", host + " " + host);
    }

    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    std::string line;
    while (!quit_) {
        drain_events();

        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        if (!args.empty() && args[0] == ' ') {
            args = args.substr(1);
        }

        execute_command(command, args);
    }

    service->close_all();
}

void HostmuxCLI::run_setup() {
    std::cout << theme::banner();
    std::cout << theme::section("Setup");

    if (global_config_exists()) {
        std::cout << theme::info("Config already exists at " + get_global_config_path().string());
        return;
    }

    auto r = create_default_global_config();
    if (r.is_err()) {
        std::cout << theme::fail("Failed to create config file: " + r.error);
        return;
    }

    std::cout << theme::ok("Config file ready at " + get_global_config_path().string());
    std::cout << theme::step("Add your hosts under 'hosts:', then run 'hostmux <host>'.");
    std::cout << "\n";
}

void HostmuxCLI::run_command(const std::string& command, const std::vector<std::string>& args) {
    std::string args_str;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) args_str += " ";
        args_str += args[i];
    }
    execute_command(command, args_str);
}
