#pragma once

#include "common/cancellation.hpp"
#include "common/clock.hpp"
#include "persistence/generation_store.hpp"
#include "persistence/retention_pruner.hpp"
#include "runtime/quiescence_coordinator.hpp"
#include "runtime/workload_runtime.hpp"
#include "transfer/archive_codec.hpp"
#include "transfer/tree_sync.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>

#include <spdlog/spdlog.h>

namespace cvault::pipeline {

struct BackupOptions {
    unsigned jobs = 0;                                   // 0 = hardware concurrency
    std::chrono::hours retention{24 * 7};                // zero disables pruning
    runtime::QuiescenceCoordinator::Options quiesce;
    bool snapshot_image = false;
};

struct BackupResult {
    persistence::Generation generation;
    transfer::SyncStats stats;
    std::optional<std::filesystem::path> archive;
    persistence::PruneReport prune;
};

// ── BackupPipeline ───────────────────────────────────────────────────────────
//
// One backup run of one workload:
//
//   capture metadata → enumerate mounts → create generation → stop workload
//   → transfer mounts (incremental against LATEST) → restart workload
//   → record metadata → seal → package → advance LATEST → prune
//
// The workload is restarted on every path out of the transfer, including
// failures.  A run that fails before sealing discards its generation; LATEST
// only moves once everything before it succeeded.

class BackupPipeline {
public:
    BackupPipeline(runtime::WorkloadRuntime& runtime,
                   transfer::TreeSync& sync,
                   transfer::ArchiveCodec* codec,
                   const Clock& clock,
                   const CancellationToken& cancel,
                   BackupOptions options);

    // `store` must be open.  Throws VaultError.
    BackupResult run(persistence::GenerationStore& store);

private:
    void record_metadata(const persistence::Generation& generation,
                         const std::string& raw_inspect,
                         const WorkloadMetadata& metadata);

    void discard(persistence::GenerationStore& store,
                 const persistence::Generation& generation) noexcept;

    runtime::WorkloadRuntime& runtime_;
    transfer::TreeSync& sync_;
    transfer::ArchiveCodec* codec_;
    const Clock& clock_;
    const CancellationToken& cancel_;
    BackupOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
};

// Image name a snapshot of `workload` taken at `timestamp` is committed to.
[[nodiscard]] std::string snapshot_image_name(const std::string& workload,
                                              const std::string& timestamp);

} // namespace cvault::pipeline
