#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

namespace cvault {

// ── Command ───────────────────────────────────────────────────────────────────

enum class Command {
    Backup,
    Restore,
    List,
    Prune,
};

enum class TransferMode {
    Native,   // in-process link-dest sync
    Rsync,    // external rsync
};

enum class PackageFormat {
    None,
    Gzip,
    Zstd,
};

// ── VaultConfig ───────────────────────────────────────────────────────────────
// Full configuration for one cvault invocation.
// Populated by parse_config() from CLI arguments and an optional config file.

struct VaultConfig {
    Command     command = Command::Backup;
    std::string workload;                    // WorkloadRef (name or id)
    std::optional<std::string> generation;   // restore: timestamp token, default latest
    std::map<std::string, std::string> host_path_overrides;  // containerPath → hostPath

    std::string backup_root;                 // root directory of all generation stores
    uint32_t    retention_days = 7;          // 0 disables pruning
    uint32_t    stop_timeout   = 30;         // grace seconds for a stop
    uint32_t    kill_timeout   = 10;         // seconds to wait after a forced stop
    uint32_t    jobs           = 0;          // parallel mount transfers (0 = hardware)
    TransferMode  transfer     = TransferMode::Native;
    PackageFormat package      = PackageFormat::None;
    bool        snapshot_image = false;      // commit + save the workload image
    std::string archive;                     // restore: packaged archive to restore from
    bool        start_after_restore = true;
    std::string docker_binary;               // runtime CLI
    std::string log_level;                   // spdlog level string
    std::string log_file;                    // extra log sink, empty = stdout only
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a VaultConfig.
//
// On success: returns a fully validated VaultConfig.
// On error  : throws std::runtime_error with a human-readable message.
//
// Positional arguments: <command> <workload> [args...]
//   restore: [generation-id] [containerPath=hostPath ...]
//
// Validates:
//   - command is one of backup|restore|list|prune
//   - workload is non-empty and contains no '/'
//   - generation id (when given) is a YYYYMMDD_HHMMSS token
//   - every override is containerPath=hostPath with absolute paths
//   - --transfer and --package values

[[nodiscard]] VaultConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate a boost::program_options::options_description with cvault options.
// Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

// Parse one "containerPath=hostPath" override.
// Throws std::runtime_error on malformed input.
[[nodiscard]] std::pair<std::string, std::string> parse_override(const std::string& entry);

} // namespace cvault
