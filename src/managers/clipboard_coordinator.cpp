#include "clipboard_coordinator.hpp"
#include "remote_paths.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

ClipboardCoordinator::ClipboardCoordinator(FileOperationOrchestrator& files)
    : files_(files) {}

void ClipboardCoordinator::replace(ClipboardOperation op, const SessionId& id,
                                   std::vector<RemoteItem> items) {
    std::lock_guard<std::mutex> lock(mutex_);
    generation_++;
    if (items.empty()) {
        entry_.reset();
        return;
    }
    entry_ = ClipboardEntry{op, id, std::move(items)};
}

void ClipboardCoordinator::set_copy(const SessionId& id, std::vector<RemoteItem> items) {
    replace(ClipboardOperation::Copy, id, std::move(items));
}

void ClipboardCoordinator::set_cut(const SessionId& id, std::vector<RemoteItem> items) {
    replace(ClipboardOperation::Cut, id, std::move(items));
}

std::optional<ClipboardEntry> ClipboardCoordinator::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entry_;
}

Result<BatchReport> ClipboardCoordinator::paste(const SessionId& target_id,
                                                const std::string& target_dir) {
    using R = Result<BatchReport>;

    ClipboardEntry entry;
    std::uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!entry_ || entry_->items.empty()) {
            return R::Err(ErrorKind::UnsupportedOperation, "Nothing to paste");
        }
        entry = *entry_;
        generation = generation_;
    }

    if (entry.source_session_id != target_id) {
        return R::Err(ErrorKind::CrossSessionPasteUnsupported,
            fmt::format("Cannot paste items from tab {} into tab {}",
                        entry.source_session_id, target_id));
    }

    auto session = files_.live_session(target_id);
    if (session.is_err()) return R::Err(session.kind, session.error);

    const bool cut = entry.operation == ClipboardOperation::Cut;
    BatchReport report;
    for (const auto& item : entry.items) {
        ItemOutcome o;
        o.item = item;
        report.items.push_back(o);
    }

    for (size_t i = 0; i < report.items.size(); i++) {
        auto& outcome = report.items[i];
        const RemoteItem& item = outcome.item;
        std::string dest = join_remote_path(target_dir, item.name);

        if (!files_.still_current(target_id, session.value)) {
            report.abandon_from(i, ErrorKind::SessionClosed, "Session closed");
            break;
        }

        if (cut && dest == item.path) {
            outcome.status = ItemStatus::Skipped;
            continue;
        }

        Result<void> r = Result<void>::Ok();
        if (cut) {
            r = files_.move(target_id, item.path, dest);
        } else {
            auto copied = files_.copy(target_id, item.path, dest, item.is_directory);
            if (copied.is_err()) r = Result<void>::Err(copied.kind, copied.error);
        }

        if (r.is_err()) {
            outcome.status = ItemStatus::Failed;
            outcome.kind = r.kind;
            outcome.error = r.error;
            report.abandon_from(i + 1, r.kind, "Not attempted after " + item.name + " failed");
            break;
        }
        outcome.status = ItemStatus::Completed;
    }

    hostmux_log(fmt::format("paste {} into {}:{}: {}", cut ? "cut" : "copy",
                            target_id, target_dir, report.summary()));

    if (cut) {
        std::lock_guard<std::mutex> lock(mutex_);
        // A newer copy/cut replaced the entry while we were pasting.
        if (generation_ == generation) {
            auto remaining = report.unfinished();
            if (remaining.empty()) {
                entry_.reset();
            } else {
                entry_->items = std::move(remaining);
            }
        }
    }
    return R::Ok(report);
}
