#include "pipeline/restore_pipeline.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "metadata/metadata_snapshotter.hpp"

#include <exception>

namespace cvault::pipeline {

namespace fs = std::filesystem;

namespace {

constexpr const char* kWorkDir = "restore.work";

// Removes the archive extraction directory when the run ends.
class WorkDirCleanup {
public:
    WorkDirCleanup(std::optional<fs::path>& dir, spdlog::logger& logger)
        : dir_{dir}, logger_{logger} {}

    ~WorkDirCleanup() {
        if (!dir_) {
            return;
        }
        std::error_code ec;
        fs::remove_all(*dir_, ec);
        if (ec) {
            logger_.warn("Cannot remove {}: {}", dir_->string(), ec.message());
        }
        dir_.reset();
    }

    WorkDirCleanup(const WorkDirCleanup&) = delete;
    WorkDirCleanup& operator=(const WorkDirCleanup&) = delete;

private:
    std::optional<fs::path>& dir_;
    spdlog::logger& logger_;
};

} // anonymous namespace

RestorePipeline::RestorePipeline(runtime::WorkloadRuntime& runtime,
                                 transfer::TreeSync& sync,
                                 transfer::ArchiveCodec* codec,
                                 const CancellationToken& cancel,
                                 RestoreOptions options)
    : runtime_{runtime}
    , sync_{sync}
    , codec_{codec}
    , cancel_{cancel}
    , options_{std::move(options)}
    , logger_{make_component_logger("restore")}
{}

RestoreResult RestorePipeline::run(persistence::GenerationStore& store) {
    const auto& workload = store.workload();
    RestoreResult result;
    WorkDirCleanup cleanup(work_dir_, *logger_);

    const auto source = resolve_source(store, result);
    const auto recorded = load_recorded_metadata(source);

    metadata::RestoreReconciler reconciler(runtime_, make_component_logger("reconcile"));
    result.spec = reconciler.derive(recorded, options_.overrides);

    const auto image_archive = source / persistence::Generation::kImageFile;
    std::error_code probe;
    if (fs::is_regular_file(image_archive, probe)) {
        logger_->info("Loading saved image {}", image_archive.string());
        auto loaded = runtime_.load_image(image_archive);
        if (!loaded.empty()) {
            result.spec.set_image_ref(loaded);
        }
    }

    if (cancel_.cancelled()) {
        throw VaultError(Errc::cancelled, "restore " + workload);
    }

    result.replaced_existing = reconciler.retire_existing(workload, options_.quiesce);

    std::vector<MountBinding> bindings(result.spec.mounts().begin(), result.spec.mounts().end());
    transfer::RestoreTransferEngine engine(sync_, options_.jobs, cancel_,
                                           make_component_logger("transfer"));
    try {
        result.transfer = engine.run(bindings, source / persistence::Generation::kDataDir);
        result.workload_id = reconciler.recreate(workload, result.spec, options_.start);
    } catch (const std::exception& e) {
        if (result.replaced_existing) {
            logger_->error("Restore of {} from {} failed after the existing workload was "
                           "removed; {} does not exist until a restore succeeds: {}",
                           workload, result.generation, workload, e.what());
        }
        throw;
    }

    logger_->info("Restore of {} from {} complete: {} mounts restored, {} skipped",
                  workload, result.generation, result.transfer.restored.size(),
                  result.transfer.skipped.size());
    return result;
}

// ── Source resolution ────────────────────────────────────────────────────────

fs::path RestorePipeline::resolve_source(persistence::GenerationStore& store,
                                         RestoreResult& result) {
    const auto work_dir = store.workload_dir() / kWorkDir;

    if (options_.archive) {
        std::error_code ec;
        if (!fs::is_regular_file(*options_.archive, ec)) {
            throw VaultError(Errc::not_found, "archive " + options_.archive->string());
        }
        result.generation = options_.archive->string();
        return unpack(*options_.archive, work_dir);
    }

    std::optional<persistence::Generation> generation;
    if (options_.generation) {
        generation = store.find(*options_.generation);
        if (!generation || !generation->sealed) {
            throw VaultError(Errc::not_found, "sealed generation " + *options_.generation);
        }
    } else {
        generation = store.latest();
        if (!generation) {
            throw VaultError(Errc::not_found, "no backup of " + store.workload());
        }
    }
    result.generation = generation->timestamp;

    std::error_code ec;
    if (fs::is_directory(generation->path, ec)) {
        logger_->info("Restoring {} from generation {}", store.workload(), generation->timestamp);
        return generation->path;
    }

    // Directory gone but the packaged copy survived.
    const auto archives = store.archives_for(generation->timestamp);
    if (archives.empty()) {
        throw VaultError(Errc::not_found, "data of generation " + generation->timestamp);
    }
    return unpack(archives.front(), work_dir);
}

fs::path RestorePipeline::unpack(const fs::path& archive, const fs::path& work_dir) {
    if (codec_ == nullptr) {
        throw VaultError(Errc::packaging_failed, "no archive codec for " + archive.string());
    }

    std::error_code ec;
    fs::remove_all(work_dir, ec);
    work_dir_ = work_dir;

    logger_->info("Unpacking {} into {}", archive.string(), work_dir.string());
    if (auto unpack_ec = codec_->unpack(archive, work_dir)) {
        throw VaultError(Errc::packaging_failed, archive.string() + ": " + unpack_ec.message());
    }
    return work_dir;
}

WorkloadMetadata RestorePipeline::load_recorded_metadata(const fs::path& source) {
    WorkloadMetadata recorded;
    const auto path = source / persistence::Generation::kMetadataFile;
    auto ec = metadata::load_metadata(path, recorded);
    if (!ec) {
        return recorded;
    }

    // Fall back to the raw inspect output kept next to it.
    std::string raw;
    const auto inspect_path = source / persistence::Generation::kInspectFile;
    if (ec == Errc::not_found && !metadata::load_text(inspect_path, raw)) {
        logger_->warn("{} missing; using {}", path.string(), inspect_path.string());
        return metadata::parse_inspect(raw);
    }
    throw VaultError(Errc::incomplete_metadata, path.string() + ": " + ec.message());
}

} // namespace cvault::pipeline
