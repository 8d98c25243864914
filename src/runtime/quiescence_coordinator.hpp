#pragma once

#include "runtime/workload_runtime.hpp"

#include <chrono>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace cvault::runtime {

// ── QuiesceState ─────────────────────────────────────────────────────────────
//
//   Running → Stopping → Stopped → Transferring → Restarting → Running
//
// A workload that was already stopped goes straight to Transferring and ends
// in Stopped.

enum class QuiesceState {
    Running,
    Stopping,
    Stopped,
    Transferring,
    Restarting,
};

[[nodiscard]] const char* to_string(QuiesceState state) noexcept;

// ── QuiescenceCoordinator ────────────────────────────────────────────────────
//
// Stops one workload for the duration of a transfer and restarts it
// afterwards.  The stop is graceful first; if the runtime still reports the
// workload alive once the grace timeout has elapsed, one forced stop is
// issued, and if that is not confirmed within kill_timeout the coordinator
// fails with Errc::quiesce_timeout.
//
// RAII: a coordinator that stopped its workload and is destroyed without a
// successful resume() (an exception unwound the pipeline) makes one
// best-effort restart attempt from its destructor.  release() disarms this
// for restore, where the stopped workload is removed rather than restarted.

class QuiescenceCoordinator {
public:
    struct Options {
        std::chrono::milliseconds stop_timeout{std::chrono::seconds{30}};
        std::chrono::milliseconds kill_timeout{std::chrono::seconds{10}};
        std::chrono::milliseconds poll_interval{std::chrono::milliseconds{250}};
    };

    QuiescenceCoordinator(WorkloadRuntime& runtime,
                          std::string ref,
                          Options options,
                          std::shared_ptr<spdlog::logger> logger);
    ~QuiescenceCoordinator();

    QuiescenceCoordinator(const QuiescenceCoordinator&) = delete;
    QuiescenceCoordinator& operator=(const QuiescenceCoordinator&) = delete;

    // Bring the workload to Stopped.  `was_running` is the state captured in
    // the metadata snapshot; a stopped workload is left alone.
    // Throws VaultError(Errc::quiesce_timeout).
    void quiesce(bool was_running);

    // Stopped → Transferring.
    void begin_transfer();

    // Restart the workload if this coordinator stopped it and wait until the
    // runtime reports it running.  Throws VaultError(Errc::quiesce_timeout).
    void resume();

    // Forget the stop; the destructor will not restart the workload.
    void release() noexcept { armed_ = false; }

    [[nodiscard]] QuiesceState state() const noexcept { return state_; }
    [[nodiscard]] bool stopped_by_us() const noexcept { return stopped_by_us_; }

private:
    // Poll is_running() until it matches `running` or `deadline` passes.
    bool wait_for(bool running, std::chrono::steady_clock::time_point deadline);

    void restart_after_failure() noexcept;

    WorkloadRuntime& runtime_;
    std::string ref_;
    Options options_;
    std::shared_ptr<spdlog::logger> logger_;

    QuiesceState state_ = QuiesceState::Running;
    bool stopped_by_us_ = false;
    bool armed_ = false;
};

} // namespace cvault::runtime
