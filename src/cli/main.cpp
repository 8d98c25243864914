#include "common/cancellation.hpp"
#include "common/clock.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/vault_config.hpp"
#include "persistence/generation_store.hpp"
#include "persistence/retention_pruner.hpp"
#include "pipeline/backup_pipeline.hpp"
#include "pipeline/restore_pipeline.hpp"
#include "runtime/docker_cli_runtime.hpp"
#include "transfer/link_dest_sync.hpp"
#include "transfer/rsync_sync.hpp"
#include "transfer/tar_codec.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <csignal>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>

namespace asio = boost::asio;

namespace {

// ── Component factories ──────────────────────────────────────────────────────

std::unique_ptr<cvault::transfer::TreeSync> make_tree_sync(const cvault::VaultConfig& cfg) {
    if (cfg.transfer == cvault::TransferMode::Rsync) {
        return std::make_unique<cvault::transfer::RsyncSync>(
            "rsync", cvault::make_component_logger("rsync"));
    }
    return std::make_unique<cvault::transfer::LinkDestSync>(
        cvault::make_component_logger("sync"));
}

std::unique_ptr<cvault::transfer::ArchiveCodec> make_codec(cvault::PackageFormat format) {
    using Compression = cvault::transfer::TarCodec::Compression;
    Compression compression = Compression::None;
    switch (format) {
        case cvault::PackageFormat::None: compression = Compression::None; break;
        case cvault::PackageFormat::Gzip: compression = Compression::Gzip; break;
        case cvault::PackageFormat::Zstd: compression = Compression::Zstd; break;
    }
    return std::make_unique<cvault::transfer::TarCodec>(
        compression, "tar", cvault::make_component_logger("package"));
}

cvault::runtime::QuiescenceCoordinator::Options quiesce_options(const cvault::VaultConfig& cfg) {
    cvault::runtime::QuiescenceCoordinator::Options options;
    options.stop_timeout = std::chrono::seconds{cfg.stop_timeout};
    options.kill_timeout = std::chrono::seconds{cfg.kill_timeout};
    return options;
}

std::chrono::hours retention_horizon(const cvault::VaultConfig& cfg) {
    return std::chrono::hours{24 * static_cast<int64_t>(cfg.retention_days)};
}

// ── Commands ─────────────────────────────────────────────────────────────────

int run_backup(const cvault::VaultConfig& cfg, cvault::persistence::GenerationStore& store,
               const cvault::CancellationToken& cancel) {
    cvault::runtime::DockerCliRuntime runtime(cfg.docker_binary,
                                              cvault::make_component_logger("runtime"));
    auto sync = make_tree_sync(cfg);
    std::unique_ptr<cvault::transfer::ArchiveCodec> codec;
    if (cfg.package != cvault::PackageFormat::None) {
        codec = make_codec(cfg.package);
    }
    cvault::SystemClock clock;

    cvault::pipeline::BackupOptions options;
    options.jobs           = cfg.jobs;
    options.retention      = retention_horizon(cfg);
    options.quiesce        = quiesce_options(cfg);
    options.snapshot_image = cfg.snapshot_image;

    cvault::pipeline::BackupPipeline pipeline(runtime, *sync, codec.get(), clock, cancel, options);
    const auto result = pipeline.run(store);

    fmt::print("{}\n", result.generation.path.string());
    if (result.archive) {
        fmt::print("{}\n", result.archive->string());
    }
    return cvault::kExitOk;
}

int run_restore(const cvault::VaultConfig& cfg, cvault::persistence::GenerationStore& store,
                const cvault::CancellationToken& cancel) {
    cvault::runtime::DockerCliRuntime runtime(cfg.docker_binary,
                                              cvault::make_component_logger("runtime"));
    auto sync = make_tree_sync(cfg);
    auto codec = make_codec(cvault::PackageFormat::None);

    cvault::pipeline::RestoreOptions options;
    options.generation = cfg.generation;
    if (!cfg.archive.empty()) {
        options.archive = cfg.archive;
    }
    options.overrides = cfg.host_path_overrides;
    options.start     = cfg.start_after_restore;
    options.jobs      = cfg.jobs;
    options.quiesce   = quiesce_options(cfg);

    cvault::pipeline::RestorePipeline pipeline(runtime, *sync, codec.get(), cancel, options);
    const auto result = pipeline.run(store);

    fmt::print("{} {}\n", result.generation, result.workload_id);
    return cvault::kExitOk;
}

int run_list(cvault::persistence::GenerationStore& store) {
    const auto latest = store.latest();
    for (const auto& generation : store.list()) {
        std::string line = generation.timestamp;
        line += generation.sealed ? "  sealed  " : (generation.orphan ? "  orphan  " : "  unsealed");
        if (latest && latest->timestamp == generation.timestamp) {
            line += "  latest";
        }
        for (const auto& archive : store.archives_for(generation.timestamp)) {
            line += "  ";
            line += archive.string();
        }
        fmt::print("{}\n", line);
    }
    return cvault::kExitOk;
}

int run_prune(const cvault::VaultConfig& cfg, cvault::persistence::GenerationStore& store,
              spdlog::logger& logger) {
    if (cfg.retention_days == 0) {
        logger.info("Retention disabled; nothing to prune");
        return cvault::kExitOk;
    }
    cvault::persistence::RetentionPruner pruner(retention_horizon(cfg),
                                                cvault::make_component_logger("retention"));
    const auto report = pruner.prune(store, std::chrono::system_clock::now());
    for (const auto& timestamp : report.removed) {
        fmt::print("{}\n", timestamp);
    }
    return cvault::kExitOk;
}

const char* command_name(cvault::Command command) {
    switch (command) {
        case cvault::Command::Backup:  return "backup";
        case cvault::Command::Restore: return "restore";
        case cvault::Command::List:    return "list";
        case cvault::Command::Prune:   return "prune";
    }
    return "?";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    cvault::VaultConfig cfg;
    try {
        cfg = cvault::parse_config(argc, argv);
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return cvault::kExitUsage;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    try {
        cvault::init_default_logger(cvault::parse_log_level(cfg.log_level), cfg.log_file);
    } catch (const spdlog::spdlog_ex& e) {
        fprintf(stderr, "Cannot open log file: %s\n", e.what());
        return cvault::kExitUsage;
    }
    auto logger = cvault::make_component_logger("main");
    logger->info("cvault {} {} (backup root {})",
                 command_name(cfg.command), cfg.workload, cfg.backup_root);

    // ── Signal handling ──────────────────────────────────────────────────────
    // SIGINT/SIGTERM only flag cancellation; the pipeline stops at the next
    // mount boundary, restarts the workload and exits non-zero.
    cvault::CancellationToken cancel;
    asio::io_context ioc;
    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            logger->warn("Received signal {}, cancelling...", signo);
            cancel.cancel();
        }
    });
    std::thread signal_thread([&ioc] { ioc.run(); });

    // ── Run the command ──────────────────────────────────────────────────────
    int rc = cvault::kExitOk;
    try {
        cvault::persistence::GenerationStore store(cfg.backup_root, cfg.workload,
                                                   cvault::make_component_logger("store"));
        if (auto ec = store.open()) {
            throw cvault::VaultError(ec, "open store for " + cfg.workload);
        }

        switch (cfg.command) {
            case cvault::Command::Backup:
                rc = run_backup(cfg, store, cancel);
                break;
            case cvault::Command::Restore:
                rc = run_restore(cfg, store, cancel);
                break;
            case cvault::Command::List:
                rc = run_list(store);
                break;
            case cvault::Command::Prune:
                rc = run_prune(cfg, store, *logger);
                break;
        }
    } catch (const cvault::VaultError& e) {
        logger->error("{} of {} failed: {}", command_name(cfg.command), cfg.workload, e.what());
        rc = cvault::exit_code_for(e.code());
    } catch (const std::exception& e) {
        logger->error("{} of {} failed: {}", command_name(cfg.command), cfg.workload, e.what());
        rc = cvault::kExitFailure;
    }

    boost::system::error_code ignored;
    signals.cancel(ignored);
    ioc.stop();
    signal_thread.join();

    logger->info("cvault {} finished with exit code {}", command_name(cfg.command), rc);
    spdlog::shutdown();
    return rc;
}
