#pragma once

#include "runtime/workload_runtime.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <system_error>

#include <spdlog/spdlog.h>

#include "cvault.pb.h"

namespace cvault::metadata {

// Parse runtime inspect output (a JSON array whose first element describes
// the workload, or a bare object) into normalized metadata.  Missing or
// wrongly-typed fields degrade to empty values.
// Throws VaultError(Errc::incomplete_metadata) if `raw_json` is not JSON.
[[nodiscard]] WorkloadMetadata parse_inspect(const std::string& raw_json);

// ── MetadataSnapshotter ──────────────────────────────────────────────────────
//
// Captures a workload's configuration from the runtime.  Always called
// before the workload is stopped, so the captured `running` flag and port
// bindings describe the live workload.

class MetadataSnapshotter {
public:
    struct Snapshot {
        std::string raw_json;        // inspect output, verbatim
        WorkloadMetadata metadata;   // normalized view of raw_json
    };

    MetadataSnapshotter(runtime::WorkloadRuntime& runtime,
                        std::shared_ptr<spdlog::logger> logger);

    // Throws VaultError (Errc::not_found when the workload does not exist).
    [[nodiscard]] Snapshot capture(const std::string& ref);

private:
    runtime::WorkloadRuntime& runtime_;
    std::shared_ptr<spdlog::logger> logger_;
};

// ── metadata.json / inspect.json ─────────────────────────────────────────────
//
// Both files are written to `<path>.tmp`, fsynced and renamed into place.

[[nodiscard]] std::error_code save_metadata(const std::filesystem::path& path,
                                            const WorkloadMetadata& metadata);

// Errc::not_found if the file is missing, Errc::incomplete_metadata if it
// does not parse.
[[nodiscard]] std::error_code load_metadata(const std::filesystem::path& path,
                                            WorkloadMetadata& out);

[[nodiscard]] std::error_code save_text(const std::filesystem::path& path,
                                        const std::string& content);

[[nodiscard]] std::error_code load_text(const std::filesystem::path& path,
                                        std::string& out);

} // namespace cvault::metadata
