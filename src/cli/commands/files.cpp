#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <ctime>
#include <filesystem>
#include <fmt/format.h>
#include <core/utils.hpp>
#include <managers/remote_paths.hpp>
#include <util/string_utils.hpp>

namespace fs = std::filesystem;

// ── Helpers ─────────────────────────────────────────────────────

static void print_error(const std::string& error, ErrorKind kind) {
    std::cout << theme::fail(fmt::format("{} ({})", error, error_kind_name(kind)));
}

static void print_report(const BatchReport& report) {
    if (report.cancelled) {
        std::cout << theme::dim("    Nothing selected.") << "\n";
        return;
    }
    for (const auto& o : report.items) {
        switch (o.status) {
            case ItemStatus::Completed:
                std::cout << theme::ok(o.item.name);
                break;
            case ItemStatus::Skipped:
                std::cout << theme::info(o.item.name + " (already there)");
                break;
            case ItemStatus::Failed:
                std::cout << theme::fail(o.item.name + ": " + o.error);
                break;
            case ItemStatus::NotAttempted:
                std::cout << theme::dim("    - " + o.item.name + " not attempted") << "\n";
                break;
        }
    }
    std::cout << theme::dim("    " + report.summary()) << "\n";
}

// Stat every path so items carry their directory flag. Prints the first failure.
static std::optional<std::vector<RemoteItem>> stat_items(BaseCLI& cli,
                                                         const std::vector<std::string>& paths) {
    std::vector<RemoteItem> items;
    for (const auto& p : paths) {
        auto r = cli.service->files().stat(cli.current_tab, cli.resolve_remote(p));
        if (r.is_err()) {
            print_error(r.error, r.kind);
            return std::nullopt;
        }
        items.push_back(r.value);
    }
    return items;
}

static std::string format_time(std::int64_t epoch) {
    std::time_t t = static_cast<std::time_t>(epoch);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tm);
    return buf;
}

// ── Navigation ──────────────────────────────────────────────────

static void do_cd(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_tab()) return;
    std::string target = cli.resolve_remote(StringUtils::trim(arg));
    auto r = cli.service->files().stat(cli.current_tab, target);
    if (r.is_err()) {
        print_error(r.error, r.kind);
        return;
    }
    if (!r.value.is_directory) {
        std::cout << theme::fail("Not a directory: " + target);
        return;
    }
    cli.set_remote_cwd(target);
}

static void do_pwd(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_tab()) return;
    std::cout << "    " << cli.remote_cwd() << "\n";
}

static void do_ls(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_tab()) return;

    SortKey key = SortKey::Name;
    bool ascending = true;
    std::string dir;
    for (const auto& w : StringUtils::tokenize(arg)) {
        if (w == "-S") { key = SortKey::Size; ascending = false; }
        else if (w == "-t") { key = SortKey::Modified; ascending = false; }
        else if (w == "-r") { ascending = !ascending; }
        else dir = w;
    }
    dir = cli.resolve_remote(dir);

    auto r = cli.service->files().list(cli.current_tab, dir);
    if (r.is_err()) {
        print_error(r.error, r.kind);
        return;
    }
    auto entries = r.value;
    sort_listing(entries, key, ascending);

    for (const auto& e : entries) {
        std::string name = e.is_directory ? theme::blue(e.name + "/") : e.name;
        std::cout << "    " << theme::dim(format_mode(e.mode))
                  << fmt::format("  {:>9}  ", e.is_directory ? "-" : format_size(e.size))
                  << theme::dim(format_time(e.modified_at)) << "  " << name << "\n";
    }
}

static void do_stat(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_tab()) return;
    std::string path = cli.resolve_remote(StringUtils::trim(arg));
    auto r = cli.service->files().describe(cli.current_tab, path);
    if (r.is_err()) {
        print_error(r.error, r.kind);
        return;
    }
    std::cout << theme::kv("Path", path);
    std::cout << theme::kv("Type", r.value.is_directory ? "directory" : "file");
    std::cout << theme::kv("Size", format_size(r.value.size));
    std::cout << theme::kv("Mode", fmt::format("{} ({:o})", format_mode(r.value.mode),
                                               r.value.mode & 07777));
    std::cout << theme::kv("Modified", format_time(r.value.modified_at));
}

static void do_cat(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_tab()) return;
    auto r = cli.service->files().read_file(cli.current_tab,
                                            cli.resolve_remote(StringUtils::trim(arg)));
    if (r.is_err()) {
        print_error(r.error, r.kind);
        return;
    }
    std::cout << r.value;
    if (!r.value.empty() && r.value.back() != '\n') std::cout << "\n";
}

// ── Mutations ───────────────────────────────────────────────────

static void do_write(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_tab()) return;
    auto space = arg.find(' ');
    if (arg.empty() || space == std::string::npos) {
        std::cout << "Usage: write <path> <text>\n";
        return;
    }
    std::string path = cli.resolve_remote(arg.substr(0, space));
    auto r = cli.service->files().write_file(cli.current_tab, path, arg.substr(space + 1) + "\n");
    if (r.is_err()) print_error(r.error, r.kind);
    else std::cout << theme::ok("Wrote " + path);
}

static void do_mkdir(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_tab()) return;
    for (const auto& p : StringUtils::tokenize(arg)) {
        auto r = cli.service->files().create_folder(cli.current_tab, cli.resolve_remote(p));
        if (r.is_err()) {
            print_error(r.error, r.kind);
            return;
        }
    }
}

static void do_touch(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_tab()) return;
    for (const auto& p : StringUtils::tokenize(arg)) {
        auto r = cli.service->files().create_file(cli.current_tab, cli.resolve_remote(p));
        if (r.is_err()) {
            print_error(r.error, r.kind);
            return;
        }
    }
}

static void do_rm(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_tab()) return;
    auto paths = StringUtils::tokenize(arg);
    if (paths.empty()) {
        std::cout << "Usage: rm <path>...\n";
        return;
    }
    auto items = stat_items(cli, paths);
    if (!items) return;
    print_report(cli.service->files().batch_delete(cli.current_tab, *items));
}

static void do_mv(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_tab()) return;
    auto words = StringUtils::tokenize(arg);
    if (words.size() != 2) {
        std::cout << "Usage: mv <from> <to>\n";
        return;
    }
    auto r = cli.service->files().move(cli.current_tab, cli.resolve_remote(words[0]),
                                       cli.resolve_remote(words[1]));
    if (r.is_err()) print_error(r.error, r.kind);
}

static void do_cp(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_tab()) return;
    auto words = StringUtils::tokenize(arg);
    if (words.empty() || words.size() > 2) {
        std::cout << "Usage: cp <from> [to]\n";
        return;
    }
    auto items = stat_items(cli, {words[0]});
    if (!items) return;
    const RemoteItem& from = items->front();
    // Without a destination the item is duplicated beside itself.
    std::string to = words.size() == 2 ? cli.resolve_remote(words[1]) : from.path;

    auto r = cli.service->files().copy(cli.current_tab, from.path, to, from.is_directory);
    if (r.is_err()) print_error(r.error, r.kind);
    else std::cout << theme::ok("Copied to " + r.value);
}

static void do_chmod(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_tab()) return;
    auto words = StringUtils::tokenize(arg);
    bool recursive = !words.empty() && words[0] == "-R";
    if (recursive) words.erase(words.begin());
    if (words.size() != 2) {
        std::cout << "Usage: chmod [-R] <octal> <path>\n";
        return;
    }
    std::uint32_t mode = 0;
    try {
        mode = static_cast<std::uint32_t>(std::stoul(words[0], nullptr, 8));
    } catch (const std::exception&) {
        std::cout << theme::fail("Invalid mode: " + words[0]);
        return;
    }
    auto r = cli.service->files().chmod(cli.current_tab, cli.resolve_remote(words[1]),
                                        mode, recursive);
    if (r.is_err()) print_error(r.error, r.kind);
}

// ── Clipboard ───────────────────────────────────────────────────

static void set_clipboard(BaseCLI& cli, const std::string& arg, ClipboardOperation op) {
    if (!cli.require_tab()) return;
    auto paths = StringUtils::tokenize(arg);
    if (paths.empty()) {
        std::cout << "Usage: " << (op == ClipboardOperation::Copy ? "copy" : "cut")
                  << " <path>...\n";
        return;
    }
    auto items = stat_items(cli, paths);
    if (!items) return;
    size_t n = items->size();
    if (op == ClipboardOperation::Copy) {
        cli.service->clipboard().set_copy(cli.current_tab, std::move(*items));
    } else {
        cli.service->clipboard().set_cut(cli.current_tab, std::move(*items));
    }
    std::cout << theme::ok(fmt::format("{} item(s) on the clipboard", n));
}

static void do_copy(BaseCLI& cli, const std::string& arg) {
    set_clipboard(cli, arg, ClipboardOperation::Copy);
}

static void do_cut(BaseCLI& cli, const std::string& arg) {
    set_clipboard(cli, arg, ClipboardOperation::Cut);
}

static void do_paste(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_tab()) return;
    std::string dir = cli.resolve_remote(StringUtils::trim(arg));
    auto r = cli.service->clipboard().paste(cli.current_tab, dir);
    if (r.is_err()) {
        print_error(r.error, r.kind);
        return;
    }
    print_report(r.value);
}

static void do_clipboard(BaseCLI& cli, const std::string& arg) {
    auto entry = cli.service->clipboard().current();
    std::cout << theme::section("Clipboard");
    if (!entry) {
        std::cout << theme::dim("    Empty.") << "\n\n";
        return;
    }
    std::cout << theme::kv("Operation", entry->operation == ClipboardOperation::Copy ? "copy" : "cut");
    std::cout << theme::kv("Tab", entry->source_session_id);
    for (const auto& item : entry->items) {
        std::cout << "    " << (item.is_directory ? theme::blue(item.path + "/") : item.path) << "\n";
    }
    std::cout << "\n";
}

// ── Archives ────────────────────────────────────────────────────

static void do_zip(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_tab()) return;
    auto words = StringUtils::tokenize(arg);
    if (words.size() < 2) {
        std::cout << "Usage: zip <archive-name> <item>...\n";
        return;
    }
    std::string name = words[0];
    words.erase(words.begin());
    auto items = stat_items(cli, words);
    if (!items) return;

    auto r = cli.service->files().archive_create(cli.current_tab, cli.remote_cwd(), *items, name);
    if (r.is_err()) print_error(r.error, r.kind);
    else std::cout << theme::ok("Created " + r.value);
}

static void do_extract(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_tab()) return;
    std::string file = StringUtils::trim(arg);
    if (file.empty()) {
        std::cout << "Usage: extract <archive>\n";
        return;
    }
    auto r = cli.service->files().archive_extract(cli.current_tab, cli.remote_cwd(),
                                                  cli.resolve_remote(file));
    if (r.is_err()) print_error(r.error, r.kind);
    else std::cout << theme::ok("Extracted " + file);
}

// ── Transfers ───────────────────────────────────────────────────

static void do_get(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_tab()) return;
    auto words = StringUtils::tokenize(arg);
    if (words.size() < 2) {
        std::cout << "Usage: get <remote>... <local-dir>\n";
        return;
    }
    fs::path local_dir = expand_home(words.back());
    words.pop_back();
    auto items = stat_items(cli, words);
    if (!items) return;

    auto r = cli.service->files().download_batch(cli.current_tab, *items, local_dir);
    if (r.is_err()) {
        print_error(r.error, r.kind);
        return;
    }
    print_report(r.value);
}

static void do_put(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_tab()) return;
    std::vector<fs::path> locals;
    for (const auto& w : StringUtils::tokenize(arg)) locals.push_back(expand_home(w));

    auto r = cli.service->files().upload_batch(cli.current_tab, locals, cli.remote_cwd());
    if (r.is_err()) {
        print_error(r.error, r.kind);
        return;
    }
    print_report(r.value);
}

void register_file_commands(BaseCLI& cli) {
    cli.add_command("cd", do_cd, "Change the tab's remote directory");
    cli.add_command("pwd", do_pwd, "Show the tab's remote directory");
    cli.add_command("ls", do_ls, "List a directory (-S size, -t time, -r reverse)");
    cli.add_command("stat", do_stat, "Show details of a remote path");
    cli.add_command("cat", do_cat, "Print a remote file");
    cli.add_command("write", do_write, "Replace a remote file with a line of text");
    cli.add_command("mkdir", do_mkdir, "Create remote directories");
    cli.add_command("touch", do_touch, "Create empty remote files");
    cli.add_command("rm", do_rm, "Delete remote files and directories");
    cli.add_command("mv", do_mv, "Move or rename a remote path");
    cli.add_command("cp", do_cp, "Copy a remote path (duplicate without a target)");
    cli.add_command("chmod", do_chmod, "Change permissions: chmod [-R] <octal> <path>");
    cli.add_command("copy", do_copy, "Put paths on the clipboard for copying");
    cli.add_command("cut", do_cut, "Put paths on the clipboard for moving");
    cli.add_command("paste", do_paste, "Paste the clipboard into a directory");
    cli.add_command("clipboard", do_clipboard, "Show the clipboard");
    cli.add_command("zip", do_zip, "Zip items in the current directory");
    cli.add_command("extract", do_extract, "Extract a zip or tar archive");
    cli.add_command("get", do_get, "Download remote files into a local directory");
    cli.add_command("put", do_put, "Upload local files into the remote directory");
}
