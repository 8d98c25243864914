#include "metadata/mount_enumerator.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace cvault::metadata {

namespace fs = std::filesystem;

namespace {

// "/srv/app/" and "/srv//app" → "/srv/app".
std::string normalize(const std::string& path) {
    auto normal = fs::path(path).lexically_normal().string();
    while (normal.size() > 1 && normal.back() == '/') {
        normal.pop_back();
    }
    return normal;
}

bool is_within(const std::string& inner, const std::string& outer) {
    if (outer == "/") {
        return true;
    }
    return inner.size() > outer.size() &&
           inner.compare(0, outer.size(), outer) == 0 &&
           inner[outer.size()] == '/';
}

} // anonymous namespace

MountEnumerator::MountEnumerator(std::shared_ptr<spdlog::logger> logger)
    : logger_{std::move(logger)}
{}

std::vector<MountPoint> MountEnumerator::enumerate(const WorkloadMetadata& metadata) const {
    std::vector<MountPoint> candidates;

    for (const auto& mount : metadata.mounts()) {
        if (mount.kind() == MountPoint::KIND_UNSPECIFIED) {
            logger_->debug("Skipping non-persistent mount at {}", mount.container_path());
            continue;
        }
        if (mount.host_path().empty() || mount.host_path().front() != '/') {
            logger_->warn("Skipping mount {} with unusable host path '{}'",
                          mount.container_path(), mount.host_path());
            continue;
        }

        std::error_code ec;
        if (!fs::is_directory(mount.host_path(), ec)) {
            logger_->warn("Skipping mount {}: host path {} is not a directory",
                          mount.container_path(), mount.host_path());
            continue;
        }

        MountPoint normalized = mount;
        normalized.set_host_path(normalize(mount.host_path()));
        candidates.push_back(std::move(normalized));
    }

    std::sort(candidates.begin(), candidates.end(),
              [](const MountPoint& a, const MountPoint& b) { return a.host_path() < b.host_path(); });

    // Sorted order puts every parent before the paths nested in it.
    std::vector<MountPoint> selected;
    for (auto& candidate : candidates) {
        bool covered = false;
        for (const auto& kept : selected) {
            if (candidate.host_path() == kept.host_path()) {
                logger_->debug("Host path {} mounted more than once", candidate.host_path());
                covered = true;
                break;
            }
            if (is_within(candidate.host_path(), kept.host_path())) {
                logger_->info("Host path {} is inside {}; transferred with it",
                              candidate.host_path(), kept.host_path());
                covered = true;
                break;
            }
        }
        if (!covered) {
            selected.push_back(std::move(candidate));
        }
    }

    if (selected.empty()) {
        throw VaultError(Errc::no_mounts_found, "workload " + metadata.name());
    }

    for (const auto& mount : selected) {
        logger_->info("Mount {} -> {}{}", mount.host_path(), mount.container_path(),
                      mount.read_only() ? " (ro)" : "");
    }
    return selected;
}

} // namespace cvault::metadata
