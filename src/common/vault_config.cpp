#include "common/vault_config.hpp"
#include "common/timestamp.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/program_options.hpp>
#include <fmt/format.h>

namespace po = boost::program_options;

namespace cvault {

namespace {

// ── Helpers ───────────────────────────────────────────────────────────────────

[[nodiscard]] Command parse_command(const std::string& s) {
    if (s == "backup")  return Command::Backup;
    if (s == "restore") return Command::Restore;
    if (s == "list")    return Command::List;
    if (s == "prune")   return Command::Prune;
    throw std::runtime_error(
        fmt::format("Unknown command '{}' (expected backup|restore|list|prune)", s));
}

[[nodiscard]] TransferMode parse_transfer(const std::string& s) {
    if (s == "native") return TransferMode::Native;
    if (s == "rsync")  return TransferMode::Rsync;
    throw std::runtime_error(
        fmt::format("--transfer must be 'native' or 'rsync', got '{}'", s));
}

[[nodiscard]] PackageFormat parse_package(const std::string& s) {
    if (s == "none") return PackageFormat::None;
    if (s == "gzip") return PackageFormat::Gzip;
    if (s == "zstd") return PackageFormat::Zstd;
    throw std::runtime_error(
        fmt::format("--package must be 'none', 'gzip' or 'zstd', got '{}'", s));
}

// Split the trailing positional arguments of `restore` into an optional
// generation id followed by containerPath=hostPath overrides.
void apply_restore_args(const std::vector<std::string>& args, VaultConfig& cfg) {
    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg.find('=') == std::string::npos) {
            if (i != 0 || cfg.generation) {
                throw std::runtime_error(
                    fmt::format("Unexpected argument '{}' (expected containerPath=hostPath)", arg));
            }
            cfg.generation = arg;
            continue;
        }
        auto [container_path, host_path] = parse_override(arg);
        cfg.host_path_overrides[container_path] = host_path;
    }
}

// Validate the fully populated VaultConfig.
void validate(const VaultConfig& cfg) {
    if (cfg.workload.empty()) {
        throw std::runtime_error("Workload name must not be empty");
    }
    if (cfg.workload.find('/') != std::string::npos ||
        cfg.workload == "." || cfg.workload == "..") {
        throw std::runtime_error(
            fmt::format("Invalid workload name '{}'", cfg.workload));
    }
    if (cfg.backup_root.empty()) {
        throw std::runtime_error("--backup-root must not be empty");
    }
    if (cfg.stop_timeout == 0) {
        throw std::runtime_error("--stop-timeout must be > 0");
    }
    if (cfg.generation && !is_timestamp_token(*cfg.generation)) {
        throw std::runtime_error(
            fmt::format("Generation id must look like YYYYMMDD_HHMMSS, got '{}'",
                        *cfg.generation));
    }
    if (cfg.command != Command::Restore) {
        if (cfg.generation || !cfg.host_path_overrides.empty() || !cfg.archive.empty()) {
            throw std::runtime_error(
                "Generation ids, --map and --archive only apply to 'restore'");
        }
    }
    if (!cfg.archive.empty() && cfg.generation) {
        throw std::runtime_error("--archive and a generation id are mutually exclusive");
    }
}

} // anonymous namespace

// ── parse_override ────────────────────────────────────────────────────────────

std::pair<std::string, std::string> parse_override(const std::string& entry) {
    auto eq = entry.find('=');
    if (eq == std::string::npos) {
        throw std::runtime_error(
            fmt::format("Malformed override (expected containerPath=hostPath): '{}'", entry));
    }
    std::string container_path = entry.substr(0, eq);
    std::string host_path      = entry.substr(eq + 1);
    if (container_path.empty() || container_path.front() != '/' ||
        host_path.empty() || host_path.front() != '/') {
        throw std::runtime_error(
            fmt::format("Override paths must be absolute: '{}'", entry));
    }
    return {std::move(container_path), std::move(host_path)};
}

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("config",
            po::value<std::string>(),
            "Read further options from an INI-style file")
        ("backup-root",
            po::value<std::string>()->default_value("/var/backups/docker"),
            "Root directory holding one generation store per workload")
        ("retention-days",
            po::value<uint32_t>()->default_value(7),
            "Delete sealed generations older than this many days (0 = keep all)")
        ("stop-timeout",
            po::value<uint32_t>()->default_value(30),
            "Seconds to wait for a graceful stop before forcing it")
        ("kill-timeout",
            po::value<uint32_t>()->default_value(10),
            "Seconds to wait after a forced stop before giving up")
        ("jobs,j",
            po::value<uint32_t>()->default_value(0),
            "Parallel mount transfers (0 = number of CPUs)")
        ("transfer",
            po::value<std::string>()->default_value("native"),
            "Transfer strategy: native (default) or rsync")
        ("package",
            po::value<std::string>()->default_value("none"),
            "Archive each generation after backup: none|gzip|zstd")
        ("snapshot-image",
            po::bool_switch(),
            "Commit the workload filesystem to an image and save it with the generation")
        ("map",
            po::value<std::vector<std::string>>()->composing(),
            "Restore-time host path override: containerPath=hostPath (repeatable)")
        ("archive",
            po::value<std::string>(),
            "Restore from this packaged archive instead of a generation directory")
        ("no-start",
            po::bool_switch(),
            "Do not start the workload after a restore")
        ("docker",
            po::value<std::string>()->default_value("docker"),
            "Workload runtime CLI binary")
        ("log-level",
            po::value<std::string>()->default_value("info"),
            "Log level: trace|debug|info|warn|error|critical")
        ("log-file",
            po::value<std::string>()->default_value(""),
            "Also append log lines to this file");
}

// ── parse_config ──────────────────────────────────────────────────────────────

VaultConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("cvault options");
    add_options(desc);

    po::options_description hidden;
    hidden.add_options()
        ("command",  po::value<std::string>())
        ("workload", po::value<std::string>())
        ("args",     po::value<std::vector<std::string>>());

    po::options_description all;
    all.add(desc).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1).add("workload", 1).add("args", -1);

    po::variables_map vm;
    try {
        po::store(
            po::command_line_parser(argc, argv)
                .options(all)
                .positional(positional)
                .run(),
            vm);

        // Handle --help before notify() so missing arguments don't error.
        if (vm.count("help")) {
            std::ostringstream oss;
            oss << "Usage: cvault backup <workload>\n"
                << "       cvault restore <workload> [generation-id] [containerPath=hostPath ...]\n"
                << "       cvault list <workload>\n"
                << "       cvault prune <workload>\n\n"
                << desc;
            throw std::runtime_error(oss.str());
        }

        if (vm.count("config")) {
            const auto path = vm["config"].as<std::string>();
            std::ifstream in(path);
            if (!in) {
                throw std::runtime_error(
                    fmt::format("Cannot open config file '{}'", path));
            }
            // Values already given on the command line take precedence.
            po::store(po::parse_config_file(in, desc), vm);
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    if (!vm.count("command")) {
        throw std::runtime_error("Missing command (backup|restore|list|prune)");
    }
    if (!vm.count("workload")) {
        throw std::runtime_error("Missing workload name");
    }

    VaultConfig cfg;
    cfg.command             = parse_command(vm["command"].as<std::string>());
    cfg.workload            = vm["workload"].as<std::string>();
    cfg.backup_root         = vm["backup-root"].as<std::string>();
    cfg.retention_days      = vm["retention-days"].as<uint32_t>();
    cfg.stop_timeout        = vm["stop-timeout"].as<uint32_t>();
    cfg.kill_timeout        = vm["kill-timeout"].as<uint32_t>();
    cfg.jobs                = vm["jobs"].as<uint32_t>();
    cfg.transfer            = parse_transfer(vm["transfer"].as<std::string>());
    cfg.package             = parse_package(vm["package"].as<std::string>());
    cfg.snapshot_image      = vm["snapshot-image"].as<bool>();
    cfg.start_after_restore = !vm["no-start"].as<bool>();
    cfg.docker_binary       = vm["docker"].as<std::string>();
    cfg.log_level           = vm["log-level"].as<std::string>();
    cfg.log_file            = vm["log-file"].as<std::string>();
    if (vm.count("archive")) {
        cfg.archive = vm["archive"].as<std::string>();
    }

    std::vector<std::string> rest;
    if (vm.count("args")) {
        rest = vm["args"].as<std::vector<std::string>>();
    }
    if (cfg.command == Command::Restore) {
        apply_restore_args(rest, cfg);
    } else if (!rest.empty()) {
        throw std::runtime_error(
            fmt::format("Unexpected argument '{}' for this command", rest.front()));
    }

    if (vm.count("map")) {
        for (const auto& entry : vm["map"].as<std::vector<std::string>>()) {
            auto [container_path, host_path] = parse_override(entry);
            cfg.host_path_overrides[container_path] = host_path;
        }
    }

    validate(cfg);
    return cfg;
}

} // namespace cvault
