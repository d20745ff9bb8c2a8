#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include "file_operation_orchestrator.hpp"

enum class ClipboardOperation { Copy, Cut };

struct ClipboardEntry {
    ClipboardOperation operation = ClipboardOperation::Copy;
    SessionId source_session_id;
    std::vector<RemoteItem> items;
};

// The single process-wide copy/cut slot. Mutated only through set_copy,
// set_cut and paste.
class ClipboardCoordinator {
public:
    explicit ClipboardCoordinator(FileOperationOrchestrator& files);

    void set_copy(const SessionId& id, std::vector<RemoteItem> items);
    void set_cut(const SessionId& id, std::vector<RemoteItem> items);

    std::optional<ClipboardEntry> current() const;

    // Copy: duplicate each item into target_dir, entry kept.
    // Cut: move each item into target_dir, entry cleared on full success and
    // trimmed to the unmoved items on partial failure.
    Result<BatchReport> paste(const SessionId& target_id, const std::string& target_dir);

private:
    void replace(ClipboardOperation op, const SessionId& id, std::vector<RemoteItem> items);

    FileOperationOrchestrator& files_;

    mutable std::mutex mutex_;
    std::optional<ClipboardEntry> entry_;
    std::uint64_t generation_ = 0;      // bumped by every set_copy/set_cut
};
