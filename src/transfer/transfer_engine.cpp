#include "transfer/transfer_engine.hpp"

#include <algorithm>
#include <filesystem>
#include <thread>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace cvault::transfer {

namespace asio = boost::asio;
namespace fs = std::filesystem;

namespace {

struct MountOutcome {
    std::string mount;
    std::error_code ec;
    bool cancelled = false;
    bool skipped = false;
    SyncStats stats;
};

// Run `job(i)` for every index on a pool of `workers` threads.
template <typename Job>
void run_parallel(std::size_t count, unsigned workers, Job job) {
    asio::thread_pool pool(workers);
    for (std::size_t i = 0; i < count; ++i) {
        asio::post(pool, [&job, i] { job(i); });
    }
    pool.join();
}

// Log every failure and throw for the first one.
void raise_first_failure(const std::vector<MountOutcome>& outcomes, spdlog::logger& logger) {
    const MountOutcome* first = nullptr;
    bool cancelled = false;
    for (const auto& outcome : outcomes) {
        if (outcome.ec) {
            logger.error("Transfer of {} failed: {}", outcome.mount, outcome.ec.message());
            if (first == nullptr) {
                first = &outcome;
            }
        }
        cancelled = cancelled || outcome.cancelled;
    }
    if (first != nullptr) {
        throw TransferError(first->mount, first->ec);
    }
    if (cancelled) {
        throw VaultError(Errc::cancelled, "transfer interrupted");
    }
}

// True if `inner` lies strictly below `outer`.
bool is_below(const fs::path& inner, const fs::path& outer) {
    auto rel = inner.lexically_normal().lexically_relative(outer.lexically_normal());
    return !rel.empty() && rel != "." && *rel.begin() != "..";
}

// A binding is covered when another binding's mirror already writes its data
// to the same place: it repeats an earlier binding, or its source lies below
// the other's source with its target at the same relative position.
std::vector<bool> find_covered(const std::vector<MountBinding>& bindings) {
    std::vector<bool> covered(bindings.size(), false);
    for (std::size_t i = 0; i < bindings.size(); ++i) {
        const fs::path src(bindings[i].source_host_path());
        const fs::path dst(bindings[i].restore_host_path());
        for (std::size_t j = 0; j < bindings.size(); ++j) {
            if (i == j) {
                continue;
            }
            const fs::path outer_src(bindings[j].source_host_path());
            const fs::path outer_dst(bindings[j].restore_host_path());
            const bool duplicate = j < i &&
                src.lexically_normal() == outer_src.lexically_normal() &&
                dst.lexically_normal() == outer_dst.lexically_normal();
            if (duplicate ||
                (is_below(src, outer_src) &&
                (outer_dst / src.lexically_relative(outer_src)).lexically_normal() ==
                    dst.lexically_normal())) {
                covered[i] = true;
                break;
            }
        }
    }
    return covered;
}

// Wave in which each binding is mirrored.  A binding whose target lies
// inside another active binding's target (or repeats an earlier one's) runs
// after it, so the enclosing mirror cannot delete what it writes.
std::vector<std::size_t> restore_waves(const std::vector<MountBinding>& bindings,
                                       const std::vector<bool>& covered) {
    std::vector<std::size_t> wave(bindings.size(), 0);
    for (std::size_t i = 0; i < bindings.size(); ++i) {
        if (covered[i]) {
            continue;
        }
        const fs::path dst = fs::path(bindings[i].restore_host_path()).lexically_normal();
        for (std::size_t j = 0; j < bindings.size(); ++j) {
            if (i == j || covered[j]) {
                continue;
            }
            const fs::path outer = fs::path(bindings[j].restore_host_path()).lexically_normal();
            if (is_below(dst, outer) || (j < i && dst == outer)) {
                ++wave[i];
            }
        }
    }
    return wave;
}

} // anonymous namespace

unsigned effective_jobs(unsigned jobs, std::size_t work) {
    unsigned n = jobs != 0 ? jobs : std::max(1u, std::thread::hardware_concurrency());
    if (work < n) {
        n = static_cast<unsigned>(std::max<std::size_t>(work, 1));
    }
    return n;
}

// ── IncrementalTransferEngine ────────────────────────────────────────────────

IncrementalTransferEngine::IncrementalTransferEngine(TreeSync& sync,
                                                     unsigned jobs,
                                                     const CancellationToken& cancel,
                                                     std::shared_ptr<spdlog::logger> logger)
    : sync_{sync}
    , jobs_{jobs}
    , cancel_{cancel}
    , logger_{std::move(logger)}
{}

SyncStats IncrementalTransferEngine::run(const std::vector<MountPoint>& mounts,
                                         const persistence::Generation& target,
                                         const std::optional<persistence::Generation>& base) {
    std::error_code ec;
    fs::create_directories(target.staging_root(), ec);
    if (!ec) {
        fs::create_directories(target.data_root(), ec);
    }
    if (ec) {
        throw TransferError(target.path.string(), ec);
    }

    if (base) {
        logger_->info("Incremental against generation {}", base->timestamp);
    } else {
        logger_->info("No previous generation; full copy");
    }

    std::vector<MountOutcome> outcomes(mounts.size());
    const unsigned workers = effective_jobs(jobs_, mounts.size());

    run_parallel(mounts.size(), workers, [&](std::size_t i) {
        const auto& mount = mounts[i];
        auto& outcome = outcomes[i];
        outcome.mount = mount.host_path();

        if (cancel_.cancelled()) {
            outcome.cancelled = true;
            return;
        }

        const auto staging = target.staging_root() / std::to_string(i);
        const auto final_dir = persistence::data_path_for(target.data_root(), mount.host_path());
        std::optional<fs::path> base_dir;
        if (base) {
            auto candidate = persistence::data_path_for(base->data_root(), mount.host_path());
            std::error_code probe;
            if (fs::is_directory(candidate, probe)) {
                base_dir = std::move(candidate);
            }
        }

        logger_->info("Transferring {} ({}/{})", mount.host_path(), i + 1, mounts.size());
        outcome.ec = sync_.sync(mount.host_path(), staging, base_dir, outcome.stats);
        if (!outcome.ec) {
            fs::create_directories(final_dir.parent_path(), outcome.ec);
        }
        if (!outcome.ec) {
            fs::rename(staging, final_dir, outcome.ec);
        }
        if (outcome.ec) {
            std::error_code rm_ec;
            fs::remove_all(staging, rm_ec);
            return;
        }
        logger_->info("Transferred {}: {} copied, {} linked, {} unchanged, {} bytes",
                      mount.host_path(), outcome.stats.files_copied, outcome.stats.files_linked,
                      outcome.stats.files_unchanged, outcome.stats.bytes_copied);
    });

    fs::remove_all(target.staging_root(), ec);
    if (ec) {
        logger_->warn("Cannot remove {}: {}", target.staging_root().string(), ec.message());
    }

    raise_first_failure(outcomes, *logger_);

    SyncStats total;
    for (const auto& outcome : outcomes) {
        total += outcome.stats;
    }
    return total;
}

// ── RestoreTransferEngine ────────────────────────────────────────────────────

RestoreTransferEngine::RestoreTransferEngine(TreeSync& sync,
                                             unsigned jobs,
                                             const CancellationToken& cancel,
                                             std::shared_ptr<spdlog::logger> logger)
    : sync_{sync}
    , jobs_{jobs}
    , cancel_{cancel}
    , logger_{std::move(logger)}
{}

RestoreTransferEngine::Report RestoreTransferEngine::run(const std::vector<MountBinding>& bindings,
                                                         const fs::path& data_root) {
    std::vector<MountOutcome> outcomes(bindings.size());
    const auto covered = find_covered(bindings);
    const auto waves = restore_waves(bindings, covered);
    const std::size_t last_wave =
        waves.empty() ? 0 : *std::max_element(waves.begin(), waves.end());

    auto restore_one = [&](std::size_t i) {
        const auto& binding = bindings[i];
        auto& outcome = outcomes[i];
        outcome.mount = binding.container_path();

        if (covered[i]) {
            logger_->debug("{} is restored as part of an enclosing mount",
                           binding.container_path());
            return;
        }
        if (cancel_.cancelled()) {
            outcome.cancelled = true;
            return;
        }

        const auto src = persistence::data_path_for(data_root, binding.source_host_path());
        std::error_code probe;
        if (!fs::is_directory(src, probe)) {
            logger_->warn("No data recorded for {} ({}); skipping",
                          binding.container_path(), binding.source_host_path());
            outcome.skipped = true;
            return;
        }

        const fs::path target(binding.restore_host_path());
        fs::create_directories(target.parent_path(), outcome.ec);
        if (outcome.ec) {
            return;
        }

        logger_->info("Restoring {} onto {}", binding.container_path(), binding.restore_host_path());
        outcome.ec = sync_.sync(src, target, std::nullopt, outcome.stats);
    };

    for (std::size_t wave = 0; wave <= last_wave; ++wave) {
        std::vector<std::size_t> batch;
        for (std::size_t i = 0; i < bindings.size(); ++i) {
            if (waves[i] == wave) {
                batch.push_back(i);
            }
        }
        run_parallel(batch.size(), effective_jobs(jobs_, batch.size()),
                     [&](std::size_t k) { restore_one(batch[k]); });

        const bool failed = std::any_of(outcomes.begin(), outcomes.end(),
                                        [](const MountOutcome& o) { return bool(o.ec); });
        if (failed) {
            break;
        }
    }

    raise_first_failure(outcomes, *logger_);

    Report report;
    for (std::size_t i = 0; i < bindings.size(); ++i) {
        if (outcomes[i].skipped) {
            report.skipped.push_back(bindings[i].container_path());
        } else {
            report.restored.push_back(bindings[i].restore_host_path());
        }
        report.stats += outcomes[i].stats;
    }
    return report;
}

} // namespace cvault::transfer
