#include "persistence/retention_pruner.hpp"
#include "common/timestamp.hpp"

namespace cvault::persistence {

RetentionPruner::RetentionPruner(std::chrono::hours horizon,
                                 std::shared_ptr<spdlog::logger> logger)
    : horizon_{horizon}
    , logger_{std::move(logger)}
{}

PruneReport RetentionPruner::prune(GenerationStore& store,
                                   std::chrono::system_clock::time_point now) const {
    PruneReport report;
    const auto latest = store.latest();
    const auto cutoff = now - horizon_;

    for (const auto& generation : store.list()) {
        if (latest && latest->timestamp == generation.timestamp) {
            report.kept.push_back(generation.timestamp);
            continue;
        }

        bool expired = !generation.sealed;
        if (generation.sealed) {
            auto created = parse_timestamp(generation.timestamp);
            expired = created && *created < cutoff;
        }
        if (!expired) {
            report.kept.push_back(generation.timestamp);
            continue;
        }

        logger_->info("Pruning {} generation {}",
                      generation.sealed ? "expired" : "unsealed",
                      generation.timestamp);
        if (auto ec = store.remove(generation)) {
            logger_->error("Failed to prune generation {}: {}",
                           generation.timestamp, ec.message());
            report.failed.push_back(generation.timestamp);
            continue;
        }
        report.removed.push_back(generation.timestamp);
    }

    logger_->info("Retention: removed {}, kept {}, failed {}",
                  report.removed.size(), report.kept.size(), report.failed.size());
    return report;
}

} // namespace cvault::persistence
