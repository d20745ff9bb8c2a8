#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "connection_registry.hpp"
#include "dependency_installer.hpp"
#include "pending_operation.hpp"

namespace fs = std::filesystem;

// ── Batch reports ───────────────────────────────────────────────

enum class ItemStatus { Completed, Failed, NotAttempted, Skipped };

const char* item_status_name(ItemStatus status);

struct ItemOutcome {
    RemoteItem item;
    ItemStatus status = ItemStatus::NotAttempted;
    ErrorKind kind = ErrorKind::None;
    std::string error;
};

// Per-item result of a sequential batch. Items stop at the first failure;
// whatever follows is NotAttempted.
struct BatchReport {
    std::vector<ItemOutcome> items;
    bool cancelled = false;          // user picked nothing; not an error

    bool ok() const;
    const ItemOutcome* first_failure() const;
    std::vector<RemoteItem> completed() const;
    std::vector<RemoteItem> unfinished() const;   // Failed + NotAttempted
    std::string summary() const;

    // Mark every item from `from` on as NotAttempted with the given reason.
    void abandon_from(size_t from, ErrorKind kind, const std::string& reason);
};

// Remote file operations on top of ConnectionRegistry. Sessions are looked
// up per call and re-checked before every batch item; a tab closed mid-batch
// turns the rest of the batch into SessionClosed.
class FileOperationOrchestrator {
public:
    using ListingObserver = std::function<void(const SessionId&, const std::string& dir,
                                               const Result<std::vector<FileEntry>>&)>;
    using PromptHandler = std::function<void(std::shared_ptr<PendingOperation>)>;

    FileOperationOrchestrator(ConnectionRegistry& registry, DependencyInstaller& installer);

    // Receives the refreshed listing of every directory a mutation touched.
    void set_listing_observer(ListingObserver observer);

    // Receives MissingDependency prompts. Without one, a missing tool fails
    // the operation with MissingDependency.
    void set_prompt_handler(PromptHandler handler);

    // ── Queries ────────────────────────────────────────────────
    Result<std::vector<FileEntry>> list(const SessionId& id, const std::string& dir);
    Result<RemoteItem> stat(const SessionId& id, const std::string& path);
    Result<FileEntry> describe(const SessionId& id, const std::string& path);
    Result<std::string> read_file(const SessionId& id, const std::string& path);

    // ── Mutations (each refreshes the affected directory) ──────
    BatchReport batch_delete(const SessionId& id, const std::vector<RemoteItem>& items);
    Result<void> move(const SessionId& id, const std::string& from, const std::string& to);
    // Returns the destination actually written; `to == from` picks a copy name.
    Result<std::string> copy(const SessionId& id, const std::string& from,
                             const std::string& to, bool is_directory);
    Result<std::string> archive_create(const SessionId& id, const std::string& dir,
                                       const std::vector<RemoteItem>& items,
                                       const std::string& archive_name);
    Result<void> archive_extract(const SessionId& id, const std::string& dir,
                                 const std::string& archive_file);
    Result<void> create_folder(const SessionId& id, const std::string& path);
    Result<void> create_file(const SessionId& id, const std::string& path);
    Result<void> write_file(const SessionId& id, const std::string& path,
                            const std::string& content);
    Result<void> chmod(const SessionId& id, const std::string& path,
                       std::uint32_t mode, bool recursive);

    // ── Transfers ──────────────────────────────────────────────
    Result<BatchReport> download_batch(const SessionId& id, const std::vector<RemoteItem>& items,
                                       const fs::path& local_dir);
    Result<BatchReport> upload_batch(const SessionId& id, const std::vector<fs::path>& local_paths,
                                     const std::string& remote_dir);
    Result<void> download(const SessionId& id, const std::string& remote, const fs::path& local);

    // Refresh `dir` and publish it to the listing observer.
    void refresh(const SessionId& id, const std::string& dir);

    // Batches pin the session once and re-check it before every item.
    Result<std::shared_ptr<Session>> live_session(const SessionId& id);
    bool still_current(const SessionId& id, const std::shared_ptr<Session>& session);

private:
    Result<std::unique_ptr<FileTransfer>> open_transfer(const SessionId& id);
    Result<SSHResult> run(const SessionId& id, const std::string& label, const std::string& cmd);

    template <typename T>
    Result<T> with_transfer(const SessionId& id,
                            const std::function<Result<T>(FileTransfer&)>& fn);

    // Probe for `tool`; raise a PendingOperation when it is missing.
    Result<void> ensure_tool(const SessionId& id, const std::string& tool,
                             const std::string& dir, const std::vector<RemoteItem>& items);

    ConnectionRegistry& registry_;
    DependencyInstaller& installer_;

    std::mutex hooks_mutex_;
    ListingObserver listing_observer_;
    PromptHandler prompt_handler_;
};
