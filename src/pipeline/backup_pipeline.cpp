#include "pipeline/backup_pipeline.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/timestamp.hpp"
#include "metadata/metadata_snapshotter.hpp"
#include "metadata/mount_enumerator.hpp"
#include "transfer/transfer_engine.hpp"

#include <algorithm>
#include <cctype>

namespace cvault::pipeline {

std::string snapshot_image_name(const std::string& workload, const std::string& timestamp) {
    std::string name = workload + "_backup_" + timestamp;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

BackupPipeline::BackupPipeline(runtime::WorkloadRuntime& runtime,
                               transfer::TreeSync& sync,
                               transfer::ArchiveCodec* codec,
                               const Clock& clock,
                               const CancellationToken& cancel,
                               BackupOptions options)
    : runtime_{runtime}
    , sync_{sync}
    , codec_{codec}
    , clock_{clock}
    , cancel_{cancel}
    , options_{options}
    , logger_{make_component_logger("backup")}
{}

BackupResult BackupPipeline::run(persistence::GenerationStore& store) {
    const auto& workload = store.workload();
    BackupResult result;

    // ── Capture (workload still in its original state) ───────────────────────
    metadata::MetadataSnapshotter snapshotter(runtime_, make_component_logger("metadata"));
    auto snapshot = snapshotter.capture(workload);

    metadata::MountEnumerator enumerator(make_component_logger("mounts"));
    const auto mounts = enumerator.enumerate(snapshot.metadata);

    if (cancel_.cancelled()) {
        throw VaultError(Errc::cancelled, "backup " + workload);
    }

    const auto timestamp = format_timestamp(clock_.now());
    persistence::Generation generation;
    if (auto ec = store.create(timestamp, generation)) {
        throw VaultError(ec, "create generation " + timestamp);
    }
    snapshot.metadata.set_captured_at(timestamp);

    try {
        std::string image;
        if (options_.snapshot_image) {
            image = snapshot_image_name(workload, timestamp);
            logger_->info("Committing {} to image {}", workload, image);
            runtime_.commit(workload, image);
            snapshot.metadata.set_snapshot_image(image);
        }

        // ── Quiesce, transfer, restart ───────────────────────────────────────
        const auto base = store.latest();
        {
            runtime::QuiescenceCoordinator quiesce(runtime_, workload, options_.quiesce,
                                                   make_component_logger("quiesce"));
            quiesce.quiesce(snapshot.metadata.running());
            quiesce.begin_transfer();

            transfer::IncrementalTransferEngine engine(sync_, options_.jobs, cancel_,
                                                       make_component_logger("transfer"));
            result.stats = engine.run(mounts, generation, base);
            quiesce.resume();
        }
        generation.transfer_recorded = true;

        if (!image.empty()) {
            runtime_.save_image(image, generation.image_path());
        }
        record_metadata(generation, snapshot.raw_json, snapshot.metadata);
        generation.metadata_recorded = true;

        if (auto ec = store.seal(generation)) {
            throw VaultError(ec, "seal generation " + timestamp);
        }
    } catch (...) {
        discard(store, generation);
        throw;
    }

    // ── Package, commit, prune ───────────────────────────────────────────────
    if (codec_ != nullptr) {
        const auto artifact = store.archive_path(timestamp, codec_->extension());
        if (auto ec = codec_->pack(generation.path, artifact)) {
            logger_->error("Packaging of {} failed; LATEST stays put", timestamp);
            throw VaultError(Errc::packaging_failed, artifact.string() + ": " + ec.message());
        }
        result.archive = artifact;
    }

    if (auto ec = store.advance_latest(generation)) {
        throw VaultError(ec, "advance LATEST to " + timestamp);
    }

    if (options_.retention.count() > 0) {
        persistence::RetentionPruner pruner(options_.retention, make_component_logger("retention"));
        result.prune = pruner.prune(store, clock_.now());
    }

    logger_->info("Backup of {} complete: generation {} ({} copied, {} linked, {} bytes)",
                  workload, timestamp, result.stats.files_copied,
                  result.stats.files_linked, result.stats.bytes_copied);
    result.generation = generation;
    return result;
}

void BackupPipeline::record_metadata(const persistence::Generation& generation,
                                     const std::string& raw_inspect,
                                     const WorkloadMetadata& metadata) {
    if (auto ec = metadata::save_text(generation.inspect_path(), raw_inspect)) {
        throw VaultError(ec, "write " + generation.inspect_path().string());
    }
    if (auto ec = metadata::save_metadata(generation.metadata_path(), metadata)) {
        throw VaultError(ec, "write " + generation.metadata_path().string());
    }
}

void BackupPipeline::discard(persistence::GenerationStore& store,
                             const persistence::Generation& generation) noexcept {
    if (generation.sealed) {
        return;
    }
    logger_->warn("Discarding incomplete generation {}", generation.timestamp);
    if (auto ec = store.remove(generation)) {
        logger_->error("Cannot discard generation {}: {}; the next prune removes it",
                       generation.timestamp, ec.message());
    }
}

} // namespace cvault::pipeline
