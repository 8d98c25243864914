#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include "cvault.pb.h"

namespace cvault::runtime {

// ── WorkloadRuntime ──────────────────────────────────────────────────────────
//
// Abstract interface to the runtime that owns the managed workload (container
// engine).  The backup and restore pipelines only ever talk to the runtime
// through this interface; the concrete backend (Docker CLI, or a scripted
// double in tests) is selected at startup.
//
// Error reporting: every call throws cvault::VaultError.  Errc::not_found
// means the workload (or image) does not exist; any other failure of the
// runtime is Errc::runtime_failed.

class WorkloadRuntime {
public:
    virtual ~WorkloadRuntime() = default;

    // Raw inspect output (JSON) describing the workload.
    [[nodiscard]] virtual std::string inspect(const std::string& ref) = 0;

    // True if a workload with this ref exists (running or not).
    [[nodiscard]] virtual bool exists(const std::string& ref) = 0;

    [[nodiscard]] virtual bool is_running(const std::string& ref) = 0;

    // Ask the workload to stop, allowing `grace` before the runtime may
    // force it.  Returns when the runtime has processed the request.
    virtual void stop(const std::string& ref, std::chrono::seconds grace) = 0;

    // Forced stop.
    virtual void kill(const std::string& ref) = 0;

    virtual void start(const std::string& ref) = 0;

    virtual void remove(const std::string& ref) = 0;

    // Create a workload named `ref` from structured creation parameters.
    // Returns the runtime's id for the new workload.
    [[nodiscard]] virtual std::string create(const std::string& ref,
                                             const CreationSpec& spec) = 0;

    // Commit the workload's filesystem to a new image.
    virtual void commit(const std::string& ref, const std::string& image) = 0;

    virtual void save_image(const std::string& image,
                            const std::filesystem::path& path) = 0;

    // Load an image archive; returns the loaded image reference.
    [[nodiscard]] virtual std::string load_image(const std::filesystem::path& path) = 0;
};

} // namespace cvault::runtime
