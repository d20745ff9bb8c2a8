#include "file_operation_orchestrator.hpp"
#include "remote_paths.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <set>

// ── BatchReport ─────────────────────────────────────────────────

const char* item_status_name(ItemStatus status) {
    switch (status) {
        case ItemStatus::Completed:    return "completed";
        case ItemStatus::Failed:       return "failed";
        case ItemStatus::NotAttempted: return "not attempted";
        case ItemStatus::Skipped:      return "skipped";
    }
    return "unknown";
}

bool BatchReport::ok() const {
    for (const auto& o : items) {
        if (o.status == ItemStatus::Failed || o.status == ItemStatus::NotAttempted) return false;
    }
    return true;
}

const ItemOutcome* BatchReport::first_failure() const {
    for (const auto& o : items) {
        if (o.status == ItemStatus::Failed) return &o;
    }
    for (const auto& o : items) {
        if (o.status == ItemStatus::NotAttempted) return &o;
    }
    return nullptr;
}

std::vector<RemoteItem> BatchReport::completed() const {
    std::vector<RemoteItem> out;
    for (const auto& o : items) {
        if (o.status == ItemStatus::Completed) out.push_back(o.item);
    }
    return out;
}

std::vector<RemoteItem> BatchReport::unfinished() const {
    std::vector<RemoteItem> out;
    for (const auto& o : items) {
        if (o.status == ItemStatus::Failed || o.status == ItemStatus::NotAttempted) {
            out.push_back(o.item);
        }
    }
    return out;
}

std::string BatchReport::summary() const {
    if (cancelled) return "cancelled";
    int done = 0, failed = 0, skipped = 0, pending = 0;
    for (const auto& o : items) {
        switch (o.status) {
            case ItemStatus::Completed:    done++; break;
            case ItemStatus::Failed:       failed++; break;
            case ItemStatus::Skipped:      skipped++; break;
            case ItemStatus::NotAttempted: pending++; break;
        }
    }
    std::string s = fmt::format("{} completed", done);
    if (skipped) s += fmt::format(", {} skipped", skipped);
    if (failed) s += fmt::format(", {} failed", failed);
    if (pending) s += fmt::format(", {} not attempted", pending);
    return s;
}

void BatchReport::abandon_from(size_t from, ErrorKind kind, const std::string& reason) {
    for (size_t i = from; i < items.size(); i++) {
        items[i].status = ItemStatus::NotAttempted;
        items[i].kind = kind;
        items[i].error = reason;
    }
}

static BatchReport report_for(const std::vector<RemoteItem>& items) {
    BatchReport report;
    for (const auto& item : items) {
        ItemOutcome o;
        o.item = item;
        report.items.push_back(o);
    }
    return report;
}

// ── Setup ───────────────────────────────────────────────────────

FileOperationOrchestrator::FileOperationOrchestrator(ConnectionRegistry& registry,
                                                     DependencyInstaller& installer)
    : registry_(registry), installer_(installer) {}

void FileOperationOrchestrator::set_listing_observer(ListingObserver observer) {
    std::lock_guard<std::mutex> lock(hooks_mutex_);
    listing_observer_ = std::move(observer);
}

void FileOperationOrchestrator::set_prompt_handler(PromptHandler handler) {
    std::lock_guard<std::mutex> lock(hooks_mutex_);
    prompt_handler_ = std::move(handler);
}

// ── Session access ──────────────────────────────────────────────

Result<std::shared_ptr<Session>> FileOperationOrchestrator::live_session(const SessionId& id) {
    using R = Result<std::shared_ptr<Session>>;
    auto session = registry_.find(id);
    if (!session || session->is_closed() ||
        session->status() != SessionStatus::Connected) {
        return R::Err(ErrorKind::NotConnected, "Tab " + id + " is not connected");
    }
    return R::Ok(session);
}

bool FileOperationOrchestrator::still_current(const SessionId& id,
                                              const std::shared_ptr<Session>& session) {
    return registry_.find(id) == session && !session->is_closed();
}

Result<std::unique_ptr<FileTransfer>> FileOperationOrchestrator::open_transfer(const SessionId& id) {
    auto session = live_session(id);
    if (session.is_err()) {
        return Result<std::unique_ptr<FileTransfer>>::Err(session.kind, session.error);
    }
    return session.value->open_file_transfer();
}

template <typename T>
Result<T> FileOperationOrchestrator::with_transfer(
        const SessionId& id, const std::function<Result<T>(FileTransfer&)>& fn) {
    auto ft = open_transfer(id);
    if (ft.is_err()) return Result<T>::Err(ft.kind, ft.error);
    auto result = fn(*ft.value);
    ft.value->close();
    return result;
}

Result<SSHResult> FileOperationOrchestrator::run(const SessionId& id, const std::string& label,
                                                 const std::string& cmd) {
    auto session = live_session(id);
    if (session.is_err()) return Result<SSHResult>::Err(session.kind, session.error);

    auto r = session.value->exec(cmd);
    if (r.is_err()) {
        return Result<SSHResult>::Err(r.kind, label + ": " + r.error);
    }
    if (r.value.exit_code != 0) {
        std::string err = r.value.stderr_data;
        trim(err);
        if (err.empty()) err = fmt::format("exit code {}", r.value.exit_code);
        return Result<SSHResult>::Err(ErrorKind::RemoteIO, label + ": " + err);
    }
    return r;
}

void FileOperationOrchestrator::refresh(const SessionId& id, const std::string& dir) {
    ListingObserver observer;
    {
        std::lock_guard<std::mutex> lock(hooks_mutex_);
        observer = listing_observer_;
    }
    auto listing = list(id, dir);
    if (listing.is_err()) {
        hostmux_log(fmt::format("refresh {} on {} failed: {}", dir, id, listing.error));
    }
    if (observer) observer(id, dir, listing);
}

// ── Queries ─────────────────────────────────────────────────────

Result<std::vector<FileEntry>> FileOperationOrchestrator::list(const SessionId& id,
                                                               const std::string& dir) {
    return with_transfer<std::vector<FileEntry>>(id, [&](FileTransfer& ft) {
        return ft.list(dir);
    });
}

Result<FileEntry> FileOperationOrchestrator::describe(const SessionId& id,
                                                      const std::string& path) {
    return with_transfer<FileEntry>(id, [&](FileTransfer& ft) {
        return ft.stat(path);
    });
}

Result<RemoteItem> FileOperationOrchestrator::stat(const SessionId& id, const std::string& path) {
    auto entry = describe(id, path);
    if (entry.is_err()) return Result<RemoteItem>::Err(entry.kind, entry.error);
    RemoteItem item;
    item.path = path;
    item.name = remote_basename(path);
    item.is_directory = entry.value.is_directory;
    return Result<RemoteItem>::Ok(item);
}

Result<std::string> FileOperationOrchestrator::read_file(const SessionId& id,
                                                         const std::string& path) {
    return with_transfer<std::string>(id, [&](FileTransfer& ft) {
        return ft.read_file(path);
    });
}

// ── Batch delete ────────────────────────────────────────────────

BatchReport FileOperationOrchestrator::batch_delete(const SessionId& id,
                                                    const std::vector<RemoteItem>& items) {
    BatchReport report = report_for(items);
    if (items.empty()) return report;

    auto session = live_session(id);
    if (session.is_err()) {
        report.abandon_from(0, session.kind, session.error);
        return report;
    }
    auto ft = session.value->open_file_transfer();
    if (ft.is_err()) {
        report.abandon_from(0, ft.kind, ft.error);
        return report;
    }

    std::set<std::string> touched;
    for (size_t i = 0; i < report.items.size(); i++) {
        auto& outcome = report.items[i];
        if (!still_current(id, session.value)) {
            report.abandon_from(i, ErrorKind::SessionClosed, "Session closed");
            break;
        }

        touched.insert(remote_dirname(outcome.item.path));
        auto r = ft.value->remove(outcome.item.path, outcome.item.is_directory);
        if (r.is_err()) {
            outcome.status = ItemStatus::Failed;
            outcome.kind = r.kind;
            outcome.error = r.error;
            // Stop here; nothing already deleted is restored.
            report.abandon_from(i + 1, r.kind, "Not attempted after " + outcome.item.name + " failed");
            break;
        }
        outcome.status = ItemStatus::Completed;
    }
    ft.value->close();

    hostmux_log(fmt::format("delete on {}: {}", id, report.summary()));
    for (const auto& dir : touched) refresh(id, dir);
    return report;
}

// ── Move / copy ─────────────────────────────────────────────────

Result<void> FileOperationOrchestrator::move(const SessionId& id, const std::string& from,
                                             const std::string& to) {
    auto result = with_transfer<void>(id, [&](FileTransfer& ft) {
        return ft.rename(from, to);
    });

    std::string src_dir = remote_dirname(from);
    std::string dst_dir = remote_dirname(to);
    refresh(id, dst_dir);
    if (src_dir != dst_dir) refresh(id, src_dir);
    return result;
}

Result<std::string> FileOperationOrchestrator::copy(const SessionId& id, const std::string& from,
                                                    const std::string& to, bool is_directory) {
    std::string dest = to;
    std::string dest_dir = remote_dirname(to);

    if (dest == from) {
        auto listing = list(id, dest_dir);
        if (listing.is_err()) {
            return Result<std::string>::Err(listing.kind, "copy " + from + ": " + listing.error);
        }
        auto name = unique_copy_name(remote_basename(from), is_directory, listing.value);
        if (name.is_err()) return Result<std::string>::Err(name.kind, name.error);
        dest = join_remote_path(dest_dir, name.value);
    }

    std::string cmd = fmt::format("cp -r -- {} {}", shell_quote(from), shell_quote(dest));
    auto r = run(id, "copy " + from, cmd);
    refresh(id, dest_dir);
    if (r.is_err()) return Result<std::string>::Err(r.kind, r.error);
    return Result<std::string>::Ok(dest);
}

// ── Dependencies ────────────────────────────────────────────────

Result<void> FileOperationOrchestrator::ensure_tool(const SessionId& id, const std::string& tool,
                                                    const std::string& dir,
                                                    const std::vector<RemoteItem>& items) {
    auto available = installer_.is_available(id, tool);
    if (available.is_err()) return Result<void>::Err(available.kind, available.error);
    if (available.value) return Result<void>::Ok();

    PromptHandler handler;
    {
        std::lock_guard<std::mutex> lock(hooks_mutex_);
        handler = prompt_handler_;
    }
    std::string missing = fmt::format("'{}' is not installed on the remote host", tool);
    if (!handler) return Result<void>::Err(ErrorKind::MissingDependency, missing);

    auto op = std::make_shared<PendingOperation>("install-dependency", tool, id, dir, items);
    hostmux_log(fmt::format("{} on {}: prompting for install", missing, id));
    handler(op);

    if (op->wait() != OperationState::Succeeded) {
        return Result<void>::Err(ErrorKind::MissingDependency,
                                 missing + " (install declined or failed)");
    }
    return Result<void>::Ok();
}

// ── Archives ────────────────────────────────────────────────────

Result<std::string> FileOperationOrchestrator::archive_create(const SessionId& id,
                                                              const std::string& dir,
                                                              const std::vector<RemoteItem>& items,
                                                              const std::string& archive_name) {
    using R = Result<std::string>;
    if (items.empty()) return R::Err(ErrorKind::UnsupportedOperation, "Nothing to archive");
    if (archive_name.empty()) return R::Err(ErrorKind::UnsupportedOperation, "Archive name is empty");

    auto tool = ensure_tool(id, "zip", dir, items);
    if (tool.is_err()) return R::Err(tool.kind, tool.error);

    std::string filename = with_zip_extension(archive_name);
    std::vector<std::string> names;
    for (const auto& item : items) names.push_back(item.name);

    auto r = run(id, "zip " + filename, zip_command(dir, filename, names));
    refresh(id, dir);
    if (r.is_err()) return R::Err(r.kind, r.error);
    return R::Ok(join_remote_path(dir, filename));
}

Result<void> FileOperationOrchestrator::archive_extract(const SessionId& id,
                                                        const std::string& dir,
                                                        const std::string& archive_file) {
    std::string work_dir = dir;
    std::string name = archive_file;
    if (archive_file.find('/') != std::string::npos) {
        work_dir = remote_dirname(archive_file);
        name = remote_basename(archive_file);
    }

    ArchiveFormat format = detect_archive_format(name);
    if (format == ArchiveFormat::Unknown) {
        return Result<void>::Err(ErrorKind::UnsupportedOperation,
                                 "Unsupported archive format: " + name);
    }

    RemoteItem item{join_remote_path(work_dir, name), name, false};
    auto tool = ensure_tool(id, archive_tool(format), work_dir, {item});
    if (tool.is_err()) return tool;

    auto r = run(id, "extract " + name, extract_command(format, work_dir, name));
    refresh(id, work_dir);
    if (r.is_err()) return Result<void>::Err(r.kind, r.error);
    return Result<void>::Ok();
}

// ── Create / write / chmod ──────────────────────────────────────

Result<void> FileOperationOrchestrator::create_folder(const SessionId& id, const std::string& path) {
    auto result = with_transfer<void>(id, [&](FileTransfer& ft) {
        return ft.mkdir(path, DEFAULT_DIR_MODE);
    });
    refresh(id, remote_dirname(path));
    return result;
}

Result<void> FileOperationOrchestrator::create_file(const SessionId& id, const std::string& path) {
    return write_file(id, path, "");
}

Result<void> FileOperationOrchestrator::write_file(const SessionId& id, const std::string& path,
                                                   const std::string& content) {
    auto result = with_transfer<void>(id, [&](FileTransfer& ft) {
        return ft.write_file(path, content);
    });
    refresh(id, remote_dirname(path));
    return result;
}

Result<void> FileOperationOrchestrator::chmod(const SessionId& id, const std::string& path,
                                              std::uint32_t mode, bool recursive) {
    mode &= MODE_PERM_MASK;
    Result<void> result = Result<void>::Ok();
    if (recursive) {
        std::string cmd = fmt::format("chmod -R {:o} -- {}", mode, shell_quote(path));
        auto r = run(id, "chmod " + path, cmd);
        if (r.is_err()) result = Result<void>::Err(r.kind, r.error);
    } else {
        result = with_transfer<void>(id, [&](FileTransfer& ft) {
            return ft.chmod(path, mode);
        });
    }
    refresh(id, remote_dirname(path));
    return result;
}

// ── Transfers ───────────────────────────────────────────────────

Result<BatchReport> FileOperationOrchestrator::download_batch(const SessionId& id,
                                                              const std::vector<RemoteItem>& items,
                                                              const fs::path& local_dir) {
    using R = Result<BatchReport>;
    BatchReport report = report_for(items);
    if (items.empty() || local_dir.empty()) {
        report.cancelled = true;
        return R::Ok(report);
    }
    for (const auto& item : items) {
        if (item.is_directory) {
            return R::Err(ErrorKind::UnsupportedOperation,
                          "Folder download is not supported in batch mode: " + item.name);
        }
    }
    std::error_code ec;
    if (!fs::is_directory(local_dir, ec)) {
        return R::Err(ErrorKind::Other, "Not a local directory: " + local_dir.string());
    }

    auto session = live_session(id);
    if (session.is_err()) return R::Err(session.kind, session.error);
    auto ft = session.value->open_file_transfer();
    if (ft.is_err()) return R::Err(ft.kind, ft.error);

    for (size_t i = 0; i < report.items.size(); i++) {
        auto& outcome = report.items[i];
        if (!still_current(id, session.value)) {
            report.abandon_from(i, ErrorKind::SessionClosed, "Session closed");
            break;
        }
        auto r = ft.value->download(outcome.item.path, local_dir / outcome.item.name);
        if (r.is_err()) {
            outcome.status = ItemStatus::Failed;
            outcome.kind = r.kind;
            outcome.error = r.error;
            report.abandon_from(i + 1, r.kind, "Not attempted after " + outcome.item.name + " failed");
            break;
        }
        outcome.status = ItemStatus::Completed;
    }
    ft.value->close();

    hostmux_log(fmt::format("download on {}: {}", id, report.summary()));
    return R::Ok(report);
}

Result<BatchReport> FileOperationOrchestrator::upload_batch(const SessionId& id,
                                                            const std::vector<fs::path>& local_paths,
                                                            const std::string& remote_dir) {
    using R = Result<BatchReport>;
    BatchReport report;
    if (local_paths.empty()) {
        report.cancelled = true;
        return R::Ok(report);
    }
    for (const auto& p : local_paths) {
        std::error_code ec;
        if (fs::is_directory(p, ec)) {
            return R::Err(ErrorKind::UnsupportedOperation,
                          "Folder upload is not supported: " + p.string());
        }
        ItemOutcome o;
        o.item.name = p.filename().string();
        o.item.path = join_remote_path(remote_dir, o.item.name);
        report.items.push_back(o);
    }

    auto session = live_session(id);
    if (session.is_err()) return R::Err(session.kind, session.error);
    auto ft = session.value->open_file_transfer();
    if (ft.is_err()) return R::Err(ft.kind, ft.error);

    for (size_t i = 0; i < report.items.size(); i++) {
        auto& outcome = report.items[i];
        if (!still_current(id, session.value)) {
            report.abandon_from(i, ErrorKind::SessionClosed, "Session closed");
            break;
        }
        auto r = ft.value->upload(local_paths[i], outcome.item.path);
        if (r.is_err()) {
            outcome.status = ItemStatus::Failed;
            outcome.kind = r.kind;
            outcome.error = r.error;
            report.abandon_from(i + 1, r.kind, "Not attempted after " + outcome.item.name + " failed");
            break;
        }
        outcome.status = ItemStatus::Completed;
    }
    ft.value->close();

    hostmux_log(fmt::format("upload on {}: {}", id, report.summary()));
    refresh(id, remote_dir);
    return R::Ok(report);
}

Result<void> FileOperationOrchestrator::download(const SessionId& id, const std::string& remote,
                                                 const fs::path& local) {
    return with_transfer<void>(id, [&](FileTransfer& ft) {
        return ft.download(remote, local);
    });
}
