#pragma once

// In-memory stand-ins for the libssh2 transport. A FakeHost is one remote
// machine: a tiny filesystem, a set of installed tools and a log of every
// command run against it. Each FakeTransport is one session to that host.

#include <atomic>
#include <functional>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include <filesystem>
#include <ssh/transport.hpp>
#include <core/constants.hpp>
#include <managers/remote_paths.hpp>
#include <util/string_utils.hpp>

struct FakeNode {
    bool is_directory = false;
    std::string content;
    std::uint32_t mode = 0644;
    std::int64_t modified_at = 1700000000;
};

struct FakeShellState {
    std::mutex mutex;
    ShellChannel::DataCallback on_data;
    ShellChannel::ClosedCallback on_closed;
    bool started = false;
    bool open = true;
    bool closed_by_owner = false;
    std::string written;
    int rows = 0;
    int cols = 0;

    // Remote output; delivered on the calling thread like a reader thread would.
    void emit(const std::string& bytes) {
        ShellChannel::DataCallback cb;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!open || !started) return;
            cb = on_data;
        }
        if (cb) cb(bytes);
    }

    // Remote side ends the shell.
    void hangup() {
        ShellChannel::ClosedCallback cb;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!open) return;
            open = false;
            if (!closed_by_owner) cb = on_closed;
        }
        if (cb) cb();
    }

    std::string input() {
        std::lock_guard<std::mutex> lock(mutex);
        return written;
    }
};

class FakeHost {
public:
    FakeHost() {
        nodes_["/"] = dir_node();
        nodes_["/home"] = dir_node();
        nodes_["/home/user"] = dir_node();
        tools_ = {"cp", "mv", "chmod", "zip", "unzip", "tar"};
    }

    // ── Fixture setup ──────────────────────────────────────────
    void add_dir(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        nodes_[path] = dir_node();
    }
    void add_file(const std::string& path, const std::string& content = "") {
        std::lock_guard<std::mutex> lock(mutex_);
        FakeNode n;
        n.content = content;
        n.modified_at = next_mtime_++;
        nodes_[path] = n;
    }
    void uninstall(const std::string& tool) {
        std::lock_guard<std::mutex> lock(mutex_);
        tools_.erase(tool);
    }
    void fail_remove_of(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_remove_.insert(path);
    }

    std::string password = "secret";
    std::atomic<bool> unreachable{false};
    std::atomic<bool> shell_refused{false};
    std::atomic<bool> install_fails{false};
    std::string package_manager = "apt";
    // Runs inside connect(); tests block here to hold an attempt open.
    std::function<void()> on_connect;

    // ── Inspection ─────────────────────────────────────────────
    bool exists(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        return nodes_.count(path) > 0;
    }
    bool is_dir(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = nodes_.find(path);
        return it != nodes_.end() && it->second.is_directory;
    }
    std::string content(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = nodes_.find(path);
        return it == nodes_.end() ? "" : it->second.content;
    }
    std::uint32_t mode(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = nodes_.find(path);
        return it == nodes_.end() ? 0 : it->second.mode;
    }
    bool has_tool(const std::string& tool) {
        std::lock_guard<std::mutex> lock(mutex_);
        return tools_.count(tool) > 0;
    }
    std::vector<std::string> commands() {
        std::lock_guard<std::mutex> lock(mutex_);
        return commands_;
    }
    bool ran(const std::string& needle) {
        for (const auto& c : commands()) {
            if (c.find(needle) != std::string::npos) return true;
        }
        return false;
    }
    std::shared_ptr<FakeShellState> last_shell() {
        std::lock_guard<std::mutex> lock(mutex_);
        return shells_.empty() ? nullptr : shells_.back();
    }
    size_t shell_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return shells_.size();
    }

    std::atomic<int> live_transports{0};
    std::atomic<int> connect_calls{0};

    // ── Filesystem operations (FakeFileTransfer) ───────────────
    Result<std::vector<FileEntry>> list(const std::string& dir) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = nodes_.find(dir);
        if (it == nodes_.end() || !it->second.is_directory) {
            return Result<std::vector<FileEntry>>::Err(ErrorKind::RemoteIO,
                                                       "opendir " + dir + ": No such file");
        }
        std::vector<FileEntry> out;
        for (const auto& [path, node] : nodes_) {
            if (path == dir || path == "/") continue;
            if (remote_dirname(path) == dir) out.push_back(entry(path, node));
        }
        return Result<std::vector<FileEntry>>::Ok(out);
    }

    Result<FileEntry> stat(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = nodes_.find(path);
        if (it == nodes_.end()) {
            return Result<FileEntry>::Err(ErrorKind::RemoteIO, "stat " + path + ": No such file");
        }
        return Result<FileEntry>::Ok(entry(path, it->second));
    }

    Result<std::string> read(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = nodes_.find(path);
        if (it == nodes_.end() || it->second.is_directory) {
            return Result<std::string>::Err(ErrorKind::RemoteIO, "open " + path + ": No such file");
        }
        return Result<std::string>::Ok(it->second.content);
    }

    Result<void> write(const std::string& path, const std::string& content) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!parent_is_dir(path)) {
            return Result<void>::Err(ErrorKind::RemoteIO, "open " + path + ": No such file");
        }
        auto& n = nodes_[path];
        if (n.is_directory) {
            return Result<void>::Err(ErrorKind::RemoteIO, "open " + path + ": Is a directory");
        }
        n.content = content;
        n.modified_at = next_mtime_++;
        return Result<void>::Ok();
    }

    Result<void> mkdir(const std::string& path, std::uint32_t mode) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (nodes_.count(path) || !parent_is_dir(path)) {
            return Result<void>::Err(ErrorKind::RemoteIO, "mkdir " + path + ": Failure");
        }
        FakeNode n = dir_node();
        n.mode = mode;
        nodes_[path] = n;
        return Result<void>::Ok();
    }

    Result<void> remove(const std::string& path, bool is_directory) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = nodes_.find(path);
        if (fail_remove_.count(path) || it == nodes_.end() ||
            it->second.is_directory != is_directory) {
            return Result<void>::Err(ErrorKind::RemoteIO, "remove " + path + ": Permission denied");
        }
        if (is_directory && has_children(path)) {
            return Result<void>::Err(ErrorKind::RemoteIO, "rmdir " + path + ": Failure");
        }
        nodes_.erase(it);
        return Result<void>::Ok();
    }

    Result<void> rename(const std::string& from, const std::string& to) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!nodes_.count(from) || nodes_.count(to) || !parent_is_dir(to)) {
            return Result<void>::Err(ErrorKind::RemoteIO, "rename " + from + ": Failure");
        }
        move_tree(from, to, false);
        return Result<void>::Ok();
    }

    Result<void> set_mode(const std::string& path, std::uint32_t mode) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = nodes_.find(path);
        if (it == nodes_.end()) {
            return Result<void>::Err(ErrorKind::RemoteIO, "setstat " + path + ": No such file");
        }
        it->second.mode = mode & MODE_PERM_MASK;
        return Result<void>::Ok();
    }

    // ── Command interpreter (FakeTransport::exec) ──────────────
    SSHResult run(const std::string& cmd) {
        std::lock_guard<std::mutex> lock(mutex_);
        commands_.push_back(cmd);

        if (cmd.rfind("if command -v apt-get", 0) == 0) {
            return {0, package_manager + "\n", ""};
        }
        if (cmd.find("install -y") != std::string::npos || cmd.find("apk add") != std::string::npos) {
            auto words = StringUtils::tokenize(cmd);
            if (install_fails) return {100, "", "E: Unable to locate package " + words.back()};
            tools_.insert(words.back());
            return {0, "installed\n", ""};
        }

        auto words = StringUtils::tokenize(cmd);
        if (words.empty()) return {0, "", ""};

        if (words[0] == "pwd") return {0, "/home/user\n", ""};

        if (words.size() == 3 && words[0] == "command" && words[1] == "-v") {
            if (tools_.count(words[2])) return {0, "/usr/bin/" + words[2] + "\n", ""};
            return {1, "", ""};
        }

        if (words.size() == 5 && words[0] == "cp" && words[1] == "-r" && words[2] == "--") {
            const std::string& from = words[3];
            const std::string& to = words[4];
            if (!tools_.count("cp")) return {127, "", "cp: command not found"};
            if (!nodes_.count(from)) {
                return {1, "", "cp: cannot stat '" + from + "': No such file or directory"};
            }
            if (!parent_is_dir(to)) {
                return {1, "", "cp: cannot create '" + to + "': No such file or directory"};
            }
            move_tree(from, to, true);
            return {0, "", ""};
        }

        if (words.size() == 5 && words[0] == "chmod" && words[1] == "-R" && words[3] == "--") {
            std::uint32_t mode = static_cast<std::uint32_t>(std::stoul(words[2], nullptr, 8));
            const std::string& root = words[4];
            if (!nodes_.count(root)) return {1, "", "chmod: cannot access '" + root + "'"};
            for (auto& [path, node] : nodes_) {
                if (path == root || path.rfind(root + "/", 0) == 0) node.mode = mode;
            }
            return {0, "", ""};
        }

        // cd '<dir>' && <tool> ...
        if (words.size() >= 4 && words[0] == "cd" && words[2] == "&&") {
            const std::string& dir = words[1];
            const std::string& tool = words[3];
            if (!tools_.count(tool)) return {127, "", tool + ": command not found"};
            if (tool == "zip" && words.size() >= 7 && words[4] == "-r") {
                std::string members;
                for (size_t i = 6; i < words.size(); i++) {
                    std::string name = words[i].substr(2);
                    if (!nodes_.count(join_remote_path(dir, name))) {
                        return {12, "", "zip error: Nothing to do! (" + name + ")"};
                    }
                    members += name + "\n";
                }
                FakeNode archive;
                archive.content = members;
                archive.modified_at = next_mtime_++;
                nodes_[join_remote_path(dir, words[5].substr(2))] = archive;
                return {0, "  adding: ...\n", ""};
            }
            if (tool == "unzip" || tool == "tar") {
                std::string archive = join_remote_path(dir, words.back().substr(2));
                auto it = nodes_.find(archive);
                if (it == nodes_.end()) return {9, "", "cannot find " + archive};
                // Each member line of the archive becomes an extracted file.
                std::istringstream members(it->second.content);
                std::string name;
                while (std::getline(members, name)) {
                    if (name.empty()) continue;
                    FakeNode n;
                    n.content = "extracted";
                    nodes_[join_remote_path(dir, name)] = n;
                }
                return {0, "", ""};
            }
        }

        return {127, "", "sh: command not found: " + words[0]};
    }

    void add_shell(const std::shared_ptr<FakeShellState>& shell) {
        std::lock_guard<std::mutex> lock(mutex_);
        shells_.push_back(shell);
    }

private:
    static FakeNode dir_node() {
        FakeNode n;
        n.is_directory = true;
        n.mode = 0755;
        return n;
    }

    static FileEntry entry(const std::string& path, const FakeNode& node) {
        FileEntry e;
        e.name = remote_basename(path);
        e.is_directory = node.is_directory;
        e.size = node.content.size();
        e.mode = (node.is_directory ? MODE_DIRECTORY : 0100000) | node.mode;
        e.modified_at = node.modified_at;
        return e;
    }

    bool parent_is_dir(const std::string& path) const {
        auto it = nodes_.find(remote_dirname(path));
        return it != nodes_.end() && it->second.is_directory;
    }

    bool has_children(const std::string& dir) const {
        for (const auto& kv : nodes_) {
            if (kv.first.rfind(dir + "/", 0) == 0) return true;
        }
        return false;
    }

    // Move or copy `from` and everything under it to `to`.
    void move_tree(const std::string& from, const std::string& to, bool keep_source) {
        std::vector<std::pair<std::string, FakeNode>> moved;
        for (const auto& [path, node] : nodes_) {
            if (path == from) moved.push_back({to, node});
            else if (path.rfind(from + "/", 0) == 0) moved.push_back({to + path.substr(from.size()), node});
        }
        if (!keep_source) {
            for (auto it = nodes_.begin(); it != nodes_.end();) {
                if (it->first == from || it->first.rfind(from + "/", 0) == 0) it = nodes_.erase(it);
                else ++it;
            }
        }
        for (auto& [path, node] : moved) nodes_[path] = node;
    }

    std::mutex mutex_;
    std::map<std::string, FakeNode> nodes_;
    std::set<std::string> tools_;
    std::set<std::string> fail_remove_;
    std::vector<std::string> commands_;
    std::vector<std::shared_ptr<FakeShellState>> shells_;
    std::int64_t next_mtime_ = 1700000001;
};

class FakeShellChannel : public ShellChannel {
public:
    explicit FakeShellChannel(std::shared_ptr<FakeShellState> state) : state_(std::move(state)) {}
    ~FakeShellChannel() override { close(); }

    void start(DataCallback on_data, ClosedCallback on_closed) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->on_data = std::move(on_data);
        state_->on_closed = std::move(on_closed);
        state_->started = true;
    }

    Result<void> write(const std::string& bytes) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->open) return Result<void>::Err(ErrorKind::SessionClosed, "Shell closed");
        state_->written += bytes;
        return Result<void>::Ok();
    }

    Result<void> resize(int rows, int cols) override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->rows = rows;
        state_->cols = cols;
        return Result<void>::Ok();
    }

    void close() override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (!state_->open) return;
        state_->open = false;
        state_->closed_by_owner = true;
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->open;
    }

private:
    std::shared_ptr<FakeShellState> state_;
};

class FakeFileTransfer : public FileTransfer {
public:
    FakeFileTransfer(FakeHost& host, std::shared_ptr<std::atomic<bool>> alive)
        : host_(host), alive_(std::move(alive)) {}

    Result<std::vector<FileEntry>> list(const std::string& dir) override {
        if (!*alive_) return Result<std::vector<FileEntry>>::Err(ErrorKind::SessionClosed, "gone");
        return host_.list(dir);
    }
    Result<FileEntry> stat(const std::string& path) override {
        if (!*alive_) return Result<FileEntry>::Err(ErrorKind::SessionClosed, "gone");
        return host_.stat(path);
    }
    Result<std::string> read_file(const std::string& path) override {
        if (!*alive_) return Result<std::string>::Err(ErrorKind::SessionClosed, "gone");
        return host_.read(path);
    }
    Result<void> write_file(const std::string& path, const std::string& content) override {
        if (!*alive_) return Result<void>::Err(ErrorKind::SessionClosed, "gone");
        return host_.write(path, content);
    }
    Result<void> mkdir(const std::string& path, std::uint32_t mode) override {
        if (!*alive_) return Result<void>::Err(ErrorKind::SessionClosed, "gone");
        return host_.mkdir(path, mode);
    }
    Result<void> remove(const std::string& path, bool is_directory) override {
        if (!*alive_) return Result<void>::Err(ErrorKind::SessionClosed, "gone");
        if (before_remove) before_remove(path);
        return host_.remove(path, is_directory);
    }
    Result<void> rename(const std::string& from, const std::string& to) override {
        if (!*alive_) return Result<void>::Err(ErrorKind::SessionClosed, "gone");
        return host_.rename(from, to);
    }
    Result<void> chmod(const std::string& path, std::uint32_t mode) override {
        if (!*alive_) return Result<void>::Err(ErrorKind::SessionClosed, "gone");
        return host_.set_mode(path, mode);
    }
    Result<void> download(const std::string& remote, const std::filesystem::path& local) override {
        auto data = read_file(remote);
        if (data.is_err()) return Result<void>::Err(data.kind, data.error);
        std::ofstream out(local, std::ios::binary | std::ios::trunc);
        if (!out) return Result<void>::Err(ErrorKind::Other, "Cannot write " + local.string());
        out << data.value;
        if (after_transfer) after_transfer(remote);
        return Result<void>::Ok();
    }
    Result<void> upload(const std::filesystem::path& local, const std::string& remote) override {
        std::ifstream in(local, std::ios::binary);
        if (!in) return Result<void>::Err(ErrorKind::Other, "Cannot read " + local.string());
        std::stringstream ss;
        ss << in.rdbuf();
        auto r = write_file(remote, ss.str());
        if (r.is_ok() && after_transfer) after_transfer(remote);
        return r;
    }

    void close() override {}

    std::function<void(const std::string&)> before_remove;
    std::function<void(const std::string&)> after_transfer;   // remote path

private:
    FakeHost& host_;
    std::shared_ptr<std::atomic<bool>> alive_;
};

class FakeTransport : public Transport {
public:
    explicit FakeTransport(FakeHost& host) : host_(host) {}
    ~FakeTransport() override { close(); }

    Result<void> connect(const HostConfig& host, StatusCallback callback) override {
        host_.connect_calls++;
        if (callback) callback("Connecting to " + host.host + "...");
        if (host_.on_connect) host_.on_connect();
        if (host_.unreachable) {
            return Result<void>::Err(ErrorKind::Unreachable, "Cannot reach " + host.host);
        }
        if (!host.password || *host.password != host_.password) {
            return Result<void>::Err(ErrorKind::Authentication, "Authentication failed");
        }
        *alive_ = true;
        counted_ = true;
        host_.live_transports++;
        return Result<void>::Ok();
    }

    Result<std::unique_ptr<ShellChannel>> open_shell(const TerminalSize& size) override {
        using R = Result<std::unique_ptr<ShellChannel>>;
        if (!*alive_) return R::Err(ErrorKind::SessionClosed, "Transport closed");
        if (host_.shell_refused) return R::Err(ErrorKind::Protocol, "Shell request refused");
        auto state = std::make_shared<FakeShellState>();
        state->rows = size.rows;
        state->cols = size.cols;
        host_.add_shell(state);
        return R::Ok(std::make_unique<FakeShellChannel>(state));
    }

    Result<SSHResult> exec(const std::string& command_line) override {
        if (!*alive_) return Result<SSHResult>::Err(ErrorKind::SessionClosed, "Transport closed");
        return Result<SSHResult>::Ok(host_.run(command_line));
    }

    Result<std::unique_ptr<FileTransfer>> open_file_transfer() override {
        using R = Result<std::unique_ptr<FileTransfer>>;
        if (!*alive_) return R::Err(ErrorKind::SessionClosed, "Transport closed");
        auto ft = std::make_unique<FakeFileTransfer>(host_, alive_);
        ft->before_remove = before_remove;
        ft->after_transfer = after_transfer;
        return R::Ok(std::move(ft));
    }

    void close() override {
        *alive_ = false;
        if (counted_.exchange(false)) host_.live_transports--;
    }

    bool is_open() const override { return *alive_; }

    std::function<void(const std::string&)> before_remove;
    std::function<void(const std::string&)> after_transfer;

private:
    FakeHost& host_;
    std::shared_ptr<std::atomic<bool>> alive_ = std::make_shared<std::atomic<bool>>(false);
    std::atomic<bool> counted_{false};
};

inline TransportFactory fake_factory(FakeHost& host,
                                     std::function<void(FakeTransport&)> customize = nullptr) {
    return [&host, customize]() {
        auto t = std::make_unique<FakeTransport>(host);
        if (customize) customize(*t);
        return std::unique_ptr<Transport>(std::move(t));
    };
}

inline HostConfig fake_host_config(const std::string& name = "web") {
    HostConfig h;
    h.name = name;
    h.host = name + ".example.org";
    h.user = "deploy";
    h.password = std::string("secret");
    return h;
}
