#pragma once

#include "transfer/tree_sync.hpp"

#include <memory>

#include <spdlog/spdlog.h>

namespace cvault::transfer {

// ── LinkDestSync ─────────────────────────────────────────────────────────────
//
// In-process TreeSync built on POSIX calls.  New or changed files are
// written to a temporary name in the destination directory and renamed over
// the old entry, so a reader never observes a half-written file.  Files that
// already match at the destination (same size and mtime) are left alone.
//
// Ownership is only preserved when the process is allowed to chown; EPERM is
// ignored.  Device nodes are skipped with a warning when mknod is refused,
// sockets are always skipped.

class LinkDestSync final : public TreeSync {
public:
    explicit LinkDestSync(std::shared_ptr<spdlog::logger> logger);

    [[nodiscard]] std::error_code sync(const std::filesystem::path& src,
                                       const std::filesystem::path& dst,
                                       const std::optional<std::filesystem::path>& base,
                                       SyncStats& stats) override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace cvault::transfer
