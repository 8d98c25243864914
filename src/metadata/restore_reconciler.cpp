#include "metadata/restore_reconciler.hpp"
#include "common/errors.hpp"

#include <set>

namespace cvault::metadata {

RestoreReconciler::RestoreReconciler(runtime::WorkloadRuntime& runtime,
                                     std::shared_ptr<spdlog::logger> logger)
    : runtime_{runtime}
    , logger_{std::move(logger)}
{}

// ── derive ───────────────────────────────────────────────────────────────────

CreationSpec RestoreReconciler::derive(const WorkloadMetadata& metadata,
                                       const HostPathOverrides& overrides) const {
    if (metadata.image_ref().empty()) {
        throw VaultError(Errc::incomplete_metadata,
                         "no image recorded for " + metadata.name());
    }

    CreationSpec spec;
    spec.set_image_ref(metadata.snapshot_image().empty() ? metadata.image_ref()
                                                         : metadata.snapshot_image());

    for (const auto& port : metadata.ports()) {
        if (port.host_port().empty()) {
            logger_->warn("Dropping port {}/{}: no host port recorded",
                          port.container_port(), port.protocol());
            continue;
        }
        *spec.add_ports() = port;
    }

    *spec.mutable_env()        = metadata.env();
    *spec.mutable_command()    = metadata.command();
    *spec.mutable_entrypoint() = metadata.entrypoint();
    spec.set_working_dir(metadata.working_dir());
    spec.set_user(metadata.user());
    spec.set_restart_policy(metadata.restart_policy());

    std::set<std::string> used_overrides;
    for (const auto& mount : metadata.mounts()) {
        if (mount.container_path().empty() || mount.host_path().empty()) {
            logger_->warn("Dropping mount with missing paths ('{}' -> '{}')",
                          mount.host_path(), mount.container_path());
            continue;
        }

        MountBinding binding;
        binding.set_container_path(mount.container_path());
        binding.set_source_host_path(mount.host_path());
        binding.set_read_only(mount.read_only());
        binding.set_kind(mount.kind());

        auto it = overrides.find(mount.container_path());
        if (it != overrides.end()) {
            binding.set_restore_host_path(it->second);
            used_overrides.insert(it->first);
            logger_->info("Mount {} restored onto {} (was {})",
                          mount.container_path(), it->second, mount.host_path());
        } else {
            binding.set_restore_host_path(mount.host_path());
        }
        *spec.add_mounts() = std::move(binding);
    }

    for (const auto& [container_path, host_path] : overrides) {
        if (!used_overrides.count(container_path)) {
            logger_->warn("Override {}={} matches no recorded mount", container_path, host_path);
        }
    }
    return spec;
}

// ── retire_existing / recreate ───────────────────────────────────────────────

bool RestoreReconciler::retire_existing(const std::string& ref,
                                        const runtime::QuiescenceCoordinator::Options& options) {
    if (!runtime_.exists(ref)) {
        return false;
    }

    logger_->info("Workload {} exists; replacing it", ref);
    runtime::QuiescenceCoordinator quiesce(runtime_, ref, options, logger_);
    quiesce.quiesce(runtime_.is_running(ref));
    quiesce.release();
    runtime_.remove(ref);
    return true;
}

std::string RestoreReconciler::recreate(const std::string& ref, const CreationSpec& spec,
                                        bool start) {
    auto id = runtime_.create(ref, spec);
    logger_->info("Created workload {} ({}) from {}", ref, id, spec.image_ref());
    if (start) {
        runtime_.start(ref);
        logger_->info("Started workload {}", ref);
    }
    return id;
}

} // namespace cvault::metadata
