#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <system_error>

namespace cvault::transfer {

struct SyncStats {
    uint64_t files_copied    = 0;
    uint64_t files_linked    = 0;   // hard-linked to the base tree
    uint64_t files_unchanged = 0;   // already identical at the destination
    uint64_t bytes_copied    = 0;
    uint64_t entries_deleted = 0;   // destination entries absent from the source

    SyncStats& operator+=(const SyncStats& other) {
        files_copied    += other.files_copied;
        files_linked    += other.files_linked;
        files_unchanged += other.files_unchanged;
        bytes_copied    += other.bytes_copied;
        entries_deleted += other.entries_deleted;
        return *this;
    }
};

// ── TreeSync ─────────────────────────────────────────────────────────────────
//
// Makes one directory tree an exact mirror of another: file content, modes,
// ownership, modification times, symlinks and hard links within the tree.
// Entries at the destination that the source does not have are deleted.
//
// When `base` is given (the same tree in the previous generation), a regular
// file whose size, mtime, mode and ownership match the base copy is
// hard-linked to it instead of copied, so unchanged data costs no space.
//
// Implementations must be safe to call concurrently for disjoint trees.

class TreeSync {
public:
    virtual ~TreeSync() = default;

    [[nodiscard]] virtual std::error_code sync(const std::filesystem::path& src,
                                               const std::filesystem::path& dst,
                                               const std::optional<std::filesystem::path>& base,
                                               SyncStats& stats) = 0;
};

} // namespace cvault::transfer
