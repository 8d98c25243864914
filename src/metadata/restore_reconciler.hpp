#pragma once

#include "runtime/quiescence_coordinator.hpp"
#include "runtime/workload_runtime.hpp"

#include <map>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "cvault.pb.h"

namespace cvault::metadata {

// containerPath → hostPath to restore onto instead of the original host path.
using HostPathOverrides = std::map<std::string, std::string>;

// ── RestoreReconciler ────────────────────────────────────────────────────────
//
// Turns a generation's recorded metadata into creation parameters for a
// fresh workload and clears the way for it:
//
//   - ports without a host port are dropped with a warning
//   - each mount becomes a MountBinding; its restore host path is the
//     override for its container path, or the original host path
//   - env, command, entrypoint, working dir, user, restart policy carry over
//
// An existing workload with the same ref is stopped through a
// QuiescenceCoordinator and removed before the new one is created.

class RestoreReconciler {
public:
    RestoreReconciler(runtime::WorkloadRuntime& runtime,
                      std::shared_ptr<spdlog::logger> logger);

    // Throws VaultError(Errc::incomplete_metadata) if no image is recorded.
    [[nodiscard]] CreationSpec derive(const WorkloadMetadata& metadata,
                                      const HostPathOverrides& overrides) const;

    // Stop and remove an existing workload named `ref`.  Returns false when
    // there was none.
    bool retire_existing(const std::string& ref,
                         const runtime::QuiescenceCoordinator::Options& options);

    // Create the workload and optionally start it.  Returns the runtime id.
    std::string recreate(const std::string& ref, const CreationSpec& spec, bool start);

private:
    runtime::WorkloadRuntime& runtime_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace cvault::metadata
