#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <atomic>
#include <cstdio>
#include <termios.h>
#include <unistd.h>
#include <fmt/format.h>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/terminal.hpp>
#include <util/string_utils.hpp>

static std::string read_password(const std::string& prompt) {
    std::cout << prompt;
    std::cout.flush();

    struct termios oldt, newt;
    tcgetattr(STDIN_FILENO, &oldt);
    newt = oldt;
    newt.c_lflag &= ~ECHO;
    tcsetattr(STDIN_FILENO, TCSANOW, &newt);

    std::string password;
    std::getline(std::cin, password);

    tcsetattr(STDIN_FILENO, TCSANOW, &oldt);
    std::cout << "\n";
    return password;
}

// "user@host[:port]" for hosts without a profile.
static std::optional<HostConfig> parse_target(const std::string& target) {
    auto at = target.find('@');
    if (at == std::string::npos || at == 0 || at + 1 == target.size()) return std::nullopt;

    HostConfig host;
    host.name = target;
    host.user = target.substr(0, at);
    std::string rest = target.substr(at + 1);
    auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        host.port = safe_stoi(rest.substr(colon + 1), -1);
        rest = rest.substr(0, colon);
        if (host.port <= 0 || host.port > 65535) return std::nullopt;
    }
    host.host = rest;
    return host;
}

static std::string tab_or_current(BaseCLI& cli, const std::string& arg) {
    std::string tab = StringUtils::trim(arg);
    return tab.empty() ? cli.current_tab : tab;
}

static void report_connect(BaseCLI& cli, const SessionId& tab, const Result<void>& r) {
    if (r.is_err()) {
        std::cout << theme::fail(fmt::format("{} ({})", r.error, error_kind_name(r.kind)));
        return;
    }
    std::cout << theme::ok("Tab " + tab + " connected");
}

static StatusCallback progress() {
    return [](const std::string& msg) {
        std::cout << theme::dim("    " + msg) << "\n";
    };
}

// ── Tabs ────────────────────────────────────────────────────────

static void do_open(BaseCLI& cli, const std::string& arg) {
    auto words = StringUtils::tokenize(arg);
    if (words.size() != 2) {
        std::cout << "Usage: open <tab> <host-profile | user@host[:port]>\n";
        return;
    }
    const std::string& tab = words[0];
    const std::string& target = words[1];

    Result<void> r = Result<void>::Ok();
    if (cli.service->config().find_host(target)) {
        r = cli.service->open_tab(tab, target, progress());
    } else {
        auto host = parse_target(target);
        if (!host) {
            std::cout << theme::fail("Unknown host profile: " + target);
            std::cout << theme::step("Use a name from 'hosts' or user@host[:port].");
            return;
        }
        host->timeout = cli.service->config().settings().connect_timeout;
        host->keepalive_interval = cli.service->config().settings().keepalive_interval;
        std::string password = read_password(
            theme::color::BROWN + "    Password for " + target + ": " + theme::color::RESET);
        if (!password.empty()) host->password = password;
        r = cli.service->open_tab(tab, *host, progress());
    }

    report_connect(cli, tab, r);
    if (r.is_ok() || cli.service->links().state(tab)) {
        cli.current_tab = tab;
    }
}

static void do_close(BaseCLI& cli, const std::string& arg) {
    std::string tab = tab_or_current(cli, arg);
    if (tab.empty() || !cli.service->links().state(tab)) {
        std::cout << theme::fail("No such tab: " + tab);
        return;
    }
    cli.service->close_tab(tab);
    cli.cwd_by_tab.erase(tab);
    std::cout << theme::ok("Closed " + tab);
    if (tab == cli.current_tab) {
        auto remaining = cli.service->tabs();
        cli.current_tab = remaining.empty() ? "" : remaining.front().id;
    }
}

static void do_reconnect(BaseCLI& cli, const std::string& arg) {
    std::string tab = tab_or_current(cli, arg);
    if (tab.empty()) {
        std::cout << "Usage: reconnect [tab]\n";
        return;
    }
    auto r = cli.service->reconnect_tab(tab, progress());
    report_connect(cli, tab, r);
}

static void do_tabs(BaseCLI& cli, const std::string& arg) {
    auto tabs = cli.service->tabs();
    std::cout << theme::section("Tabs");
    if (tabs.empty()) {
        std::cout << theme::dim("    No tabs open.") << "\n\n";
        return;
    }
    for (const auto& t : tabs) {
        std::string marker = t.id == cli.current_tab ? "*" : " ";
        std::string state = t.state == "connected" ? theme::green(t.state)
                          : t.state == "connecting" ? theme::yellow(t.state)
                          : theme::red(t.state);
        std::cout << fmt::format("  {} ", marker)
                  << theme::color::BLUE << fmt::format("{:<12}", t.id) << theme::color::RESET
                  << fmt::format("{:<28}", t.target) << state << "\n";
    }
    std::cout << "\n";
}

static void do_use(BaseCLI& cli, const std::string& arg) {
    std::string tab = StringUtils::trim(arg);
    if (tab.empty()) {
        std::cout << "Usage: use <tab>\n";
        return;
    }
    if (!cli.service->links().state(tab)) {
        std::cout << theme::fail("No such tab: " + tab);
        return;
    }
    cli.current_tab = tab;
}

static void do_hosts(BaseCLI& cli, const std::string& arg) {
    std::cout << theme::section("Hosts");
    const auto& hosts = cli.service->config().hosts();
    if (hosts.empty()) {
        std::cout << theme::dim("    No host profiles in " + get_global_config_path().string()) << "\n\n";
        return;
    }
    for (const auto& [name, h] : hosts) {
        std::cout << theme::kv(name, fmt::format("{}@{}:{}", h.user, h.host, h.port));
    }
    std::cout << "\n";
}

static void do_status(BaseCLI& cli, const std::string& arg) {
    std::cout << theme::section("Status");

    if (global_config_exists()) {
        std::cout << theme::kv("Config", get_global_config_path().string());
    } else {
        std::cout << theme::fail("Config not found");
    }
    std::cout << theme::kv("Tabs", std::to_string(cli.service->tabs().size()));
    std::cout << theme::kv("Current", cli.current_tab.empty() ? "-" : cli.current_tab);

    auto clip = cli.service->clipboard().current();
    if (clip) {
        std::cout << theme::kv("Clipboard", fmt::format("{} item(s) from {}",
                                                        clip->items.size(),
                                                        clip->source_session_id));
    }
    std::cout << "\n";
}

// ── Shell ───────────────────────────────────────────────────────

static void do_attach(BaseCLI& cli, const std::string& arg) {
    std::string tab = tab_or_current(cli, arg);
    if (!tab.empty()) cli.current_tab = tab;
    if (!cli.require_tab()) return;

    auto& registry = cli.service->registry();
    auto closed = std::make_shared<std::atomic<bool>>(false);
    auto unsubscribe = cli.service->relay().subscribe(tab,
        [](const std::string& bytes) {
            fwrite(bytes.data(), 1, bytes.size(), stdout);
            fflush(stdout);
        },
        [closed]() { *closed = true; });

    std::cout << theme::step("Attached to " + tab + ". Ctrl-] detaches.") << std::flush;

    bool detached = false;
    {
        platform::RawModeGuard raw(platform::RawModeGuard::kFullRaw);
        platform::watch_terminal_resize();
        auto follow_terminal = [&]() {
            auto r = registry.resize(tab, platform::term_height(), platform::term_width());
            if (r.is_err()) hostmux_log("attach " + tab + ": resize failed: " + r.error);
        };
        follow_terminal();

        char buf[1024];
        while (!*closed) {
            if (platform::consume_terminal_resize()) follow_terminal();
            if (!platform::poll_stdin(SHELL_POLL_MS)) continue;

            ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
            if (n <= 0) break;

            std::string input(buf, static_cast<size_t>(n));
            auto key = input.find(DETACH_KEY);
            if (key != std::string::npos) {
                input.resize(key);
                detached = true;
            }
            if (!input.empty() && registry.write(tab, input).is_err()) break;
            if (detached) break;
        }
        platform::unwatch_terminal_resize();
    }
    unsubscribe();

    std::cout << "\r\n";
    if (detached) {
        std::cout << theme::info("Detached from " + tab);
    } else {
        std::cout << theme::fail("Shell on " + tab + " closed.");
        std::cout << theme::step("Run 'reconnect' to open a new session.");
    }
}

static void do_send(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_tab()) return;
    auto r = cli.service->registry().write(cli.current_tab, arg + "\n");
    if (r.is_err()) std::cout << theme::fail(r.error);
}

static void do_exec(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_tab()) return;
    if (arg.empty()) {
        std::cout << "Usage: exec <command>\n";
        return;
    }
    auto r = cli.service->registry().exec(cli.current_tab, arg);
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return;
    }
    std::cout << r.value.stdout_data;
    if (!r.value.stderr_data.empty()) {
        std::cerr << r.value.stderr_data;
    }
    if (r.value.failed()) {
        std::cout << theme::dim(fmt::format("    exit {}", r.value.exit_code)) << "\n";
    }
}

void register_session_commands(BaseCLI& cli) {
    cli.add_command("open", do_open, "Open a tab: open <tab> <host>");
    cli.add_command("close", do_close, "Close a tab and its session");
    cli.add_command("reconnect", do_reconnect, "Replace the tab's session with a fresh one");
    cli.add_command("tabs", do_tabs, "List tabs and their link state");
    cli.add_command("use", do_use, "Switch the current tab");
    cli.add_command("hosts", do_hosts, "List host profiles from config");
    cli.add_command("status", do_status, "Show config, tabs and clipboard");
    cli.add_command("attach", do_attach, "Attach the terminal to the tab's shell");
    cli.add_command("send", do_send, "Send a line to the tab's shell");
    cli.add_command("exec", do_exec, "Run a one-shot command on the tab's host");
}
