#pragma once

#include "runtime/workload_runtime.hpp"
#include "common/subprocess.hpp"

#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace cvault::runtime {

// ── DockerCliRuntime ─────────────────────────────────────────────────────────
//
// WorkloadRuntime backed by the `docker` command-line client.  Every call
// runs one docker subcommand with an explicit argv (no shell), so values
// taken from a backup (env entries, commands, paths) are never re-parsed.

class DockerCliRuntime final : public WorkloadRuntime {
public:
    DockerCliRuntime(std::string binary, std::shared_ptr<spdlog::logger> logger);

    [[nodiscard]] std::string inspect(const std::string& ref) override;
    [[nodiscard]] bool exists(const std::string& ref) override;
    [[nodiscard]] bool is_running(const std::string& ref) override;
    void stop(const std::string& ref, std::chrono::seconds grace) override;
    void kill(const std::string& ref) override;
    void start(const std::string& ref) override;
    void remove(const std::string& ref) override;
    [[nodiscard]] std::string create(const std::string& ref,
                                     const CreationSpec& spec) override;
    void commit(const std::string& ref, const std::string& image) override;
    void save_image(const std::string& image,
                    const std::filesystem::path& path) override;
    [[nodiscard]] std::string load_image(const std::filesystem::path& path) override;

private:
    // Run `docker <args...>`; throws VaultError on spawn failure or a
    // non-zero exit (Errc::not_found when docker reports "No such ...").
    ProcessResult run(std::vector<std::string> args, const std::string& what);

    std::string binary_;
    std::shared_ptr<spdlog::logger> logger_;
};

// Build the argv of `docker create` for a creation spec.
// Exposed for testing.
[[nodiscard]] std::vector<std::string> build_create_args(const std::string& binary,
                                                         const std::string& ref,
                                                         const CreationSpec& spec);

// Extract the image reference from `docker load` output
// ("Loaded image: name:tag" or "Loaded image ID: sha256:...").
// Returns an empty string if none is found.
[[nodiscard]] std::string parse_loaded_image(const std::string& output);

} // namespace cvault::runtime
