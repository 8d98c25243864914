#pragma once

#include "persistence/generation_store.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace cvault::persistence {

struct PruneReport {
    std::vector<std::string> removed;   // timestamps deleted
    std::vector<std::string> failed;    // timestamps whose deletion failed
    std::vector<std::string> kept;      // timestamps left in place
};

// ── RetentionPruner ──────────────────────────────────────────────────────────
//
// Deletes every sealed generation (and its archives) older than the retention
// horizon, except the one behind LATEST, which is kept whatever its age.
// Unsealed and orphaned generations are deleted regardless of age.
//
// Best effort: a generation that cannot be deleted is logged and reported in
// `failed`; pruning continues with the rest.  Runs under the store's
// workload lock, so no backup or restore of the same workload is in flight.

class RetentionPruner {
public:
    RetentionPruner(std::chrono::hours horizon,
                    std::shared_ptr<spdlog::logger> logger);

    PruneReport prune(GenerationStore& store,
                      std::chrono::system_clock::time_point now) const;

private:
    std::chrono::hours horizon_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace cvault::persistence
