#pragma once

#include "common/cancellation.hpp"
#include "metadata/restore_reconciler.hpp"
#include "persistence/generation_store.hpp"
#include "runtime/quiescence_coordinator.hpp"
#include "runtime/workload_runtime.hpp"
#include "transfer/archive_codec.hpp"
#include "transfer/transfer_engine.hpp"
#include "transfer/tree_sync.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace cvault::pipeline {

struct RestoreOptions {
    std::optional<std::string> generation;         // default: LATEST
    std::optional<std::filesystem::path> archive;  // restore from a packaged archive
    metadata::HostPathOverrides overrides;
    bool start = true;
    unsigned jobs = 0;
    runtime::QuiescenceCoordinator::Options quiesce;
};

struct RestoreResult {
    std::string generation;                        // timestamp, or archive path
    CreationSpec spec;
    transfer::RestoreTransferEngine::Report transfer;
    std::string workload_id;
    bool replaced_existing = false;
};

// ── RestorePipeline ──────────────────────────────────────────────────────────
//
//   resolve generation (or unpack archive) → load metadata → reconcile
//   → load saved image → retire existing workload → mirror data onto the
//   host → create → start
//
// Restoring the same generation twice leaves the host trees identical.

class RestorePipeline {
public:
    RestorePipeline(runtime::WorkloadRuntime& runtime,
                    transfer::TreeSync& sync,
                    transfer::ArchiveCodec* codec,
                    const CancellationToken& cancel,
                    RestoreOptions options);

    // `store` must be open.  Throws VaultError.
    RestoreResult run(persistence::GenerationStore& store);

private:
    // Directory holding metadata.json and data/ for the selected source.
    std::filesystem::path resolve_source(persistence::GenerationStore& store,
                                         RestoreResult& result);

    std::filesystem::path unpack(const std::filesystem::path& archive,
                                 const std::filesystem::path& work_dir);

    WorkloadMetadata load_recorded_metadata(const std::filesystem::path& source);

    runtime::WorkloadRuntime& runtime_;
    transfer::TreeSync& sync_;
    transfer::ArchiveCodec* codec_;
    const CancellationToken& cancel_;
    RestoreOptions options_;
    std::shared_ptr<spdlog::logger> logger_;
    std::optional<std::filesystem::path> work_dir_;
};

} // namespace cvault::pipeline
