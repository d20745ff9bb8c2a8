#include <iostream>
#include <vector>
#include <string>
#include "cli/hostmux_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    hostmux"
              << theme::color::RESET << theme::color::DIM
              << "                       Enter the REPL" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    hostmux "
              << theme::color::RESET << theme::color::BROWN << "<host>..."
              << theme::color::RESET << theme::color::DIM
              << "             Open a tab per host profile, then the REPL" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    hostmux run "
              << theme::color::RESET << theme::color::BROWN << "<host> <cmd>"
              << theme::color::RESET << theme::color::DIM
              << "       Run one command and exit" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    hostmux setup"
              << theme::color::RESET << theme::color::DIM
              << "                 Write ~/.hostmux/config.yaml" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    hostmux --version             Show version\n"
              << "    hostmux --help                Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc == 1) {
            HostmuxCLI cli;
            cli.run_repl();
            return 0;
        }

        std::string cmd = argv[1];

        if (cmd == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "hostmux"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << theme::HOSTMUX_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        }

        HostmuxCLI cli;
        if (cmd == "setup") {
            cli.run_setup();
        } else if (cmd == "run") {
            if (argc < 4) {
                std::cout << theme::fail("Missing host or command.");
                std::cout << theme::step("Usage: hostmux run <host> <command>");
                return 1;
            }
            std::string host = argv[2];
            cli.run_command("open", {host, host});
            if (cli.current_tab != host || !cli.require_tab()) return 1;
            std::vector<std::string> rest(argv + 3, argv + argc);
            cli.run_command("exec", rest);
            cli.service->close_all();
        } else {
            std::vector<std::string> hosts(argv + 1, argv + argc);
            cli.run_repl(hosts);
        }

        return 0;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
