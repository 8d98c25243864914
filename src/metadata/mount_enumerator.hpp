#pragma once

#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "cvault.pb.h"

namespace cvault::metadata {

// ── MountEnumerator ──────────────────────────────────────────────────────────
//
// Selects the persistent host paths of a workload that a backup transfers.
// From the mounts in the captured metadata it keeps bind mounts and named
// volumes whose host path is an existing directory, drops duplicate host
// paths and host paths nested inside another selected one, and returns the
// rest sorted by host path.
//
// Throws VaultError(Errc::no_mounts_found) when nothing is left.

class MountEnumerator {
public:
    explicit MountEnumerator(std::shared_ptr<spdlog::logger> logger);

    [[nodiscard]] std::vector<MountPoint> enumerate(const WorkloadMetadata& metadata) const;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace cvault::metadata
