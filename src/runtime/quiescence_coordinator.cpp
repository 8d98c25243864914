#include "runtime/quiescence_coordinator.hpp"
#include "common/errors.hpp"

#include <thread>
#include <utility>

namespace cvault::runtime {

const char* to_string(QuiesceState state) noexcept {
    switch (state) {
        case QuiesceState::Running:      return "running";
        case QuiesceState::Stopping:     return "stopping";
        case QuiesceState::Stopped:      return "stopped";
        case QuiesceState::Transferring: return "transferring";
        case QuiesceState::Restarting:   return "restarting";
    }
    return "unknown";
}

QuiescenceCoordinator::QuiescenceCoordinator(WorkloadRuntime& runtime,
                                             std::string ref,
                                             Options options,
                                             std::shared_ptr<spdlog::logger> logger)
    : runtime_{runtime}
    , ref_{std::move(ref)}
    , options_{options}
    , logger_{std::move(logger)}
{}

QuiescenceCoordinator::~QuiescenceCoordinator() {
    if (armed_) {
        restart_after_failure();
    }
}

// ── quiesce ──────────────────────────────────────────────────────────────────

void QuiescenceCoordinator::quiesce(bool was_running) {
    if (!was_running) {
        logger_->info("Workload {} is not running; no stop needed", ref_);
        state_ = QuiesceState::Stopped;
        return;
    }

    state_ = QuiesceState::Stopping;
    stopped_by_us_ = true;
    armed_ = true;

    const auto grace = std::chrono::ceil<std::chrono::seconds>(options_.stop_timeout);
    const auto deadline = std::chrono::steady_clock::now() + options_.stop_timeout;
    logger_->info("Stopping workload {} (grace {}s)", ref_, grace.count());
    try {
        runtime_.stop(ref_, grace);
    } catch (const VaultError& e) {
        logger_->warn("Stop of {} reported: {}", ref_, e.what());
    }

    if (wait_for(false, deadline)) {
        state_ = QuiesceState::Stopped;
        logger_->info("Workload {} stopped", ref_);
        return;
    }

    logger_->warn("Workload {} still running after {}ms; forcing stop",
                  ref_, options_.stop_timeout.count());
    try {
        runtime_.kill(ref_);
    } catch (const VaultError& e) {
        logger_->warn("Kill of {} reported: {}", ref_, e.what());
    }

    if (wait_for(false, std::chrono::steady_clock::now() + options_.kill_timeout)) {
        state_ = QuiesceState::Stopped;
        logger_->info("Workload {} stopped after forced stop", ref_);
        return;
    }

    logger_->error("Workload {} did not stop", ref_);
    throw VaultError(Errc::quiesce_timeout, "stop " + ref_);
}

void QuiescenceCoordinator::begin_transfer() {
    state_ = QuiesceState::Transferring;
}

// ── resume ───────────────────────────────────────────────────────────────────

void QuiescenceCoordinator::resume() {
    if (!stopped_by_us_) {
        state_ = QuiesceState::Stopped;
        return;
    }

    armed_ = false;
    state_ = QuiesceState::Restarting;
    logger_->info("Restarting workload {}", ref_);
    try {
        runtime_.start(ref_);
    } catch (const VaultError& e) {
        logger_->error("Restart of {} failed: {}", ref_, e.what());
        throw VaultError(Errc::quiesce_timeout, "restart " + ref_ + ": " + e.what());
    }

    if (!wait_for(true, std::chrono::steady_clock::now() + options_.stop_timeout)) {
        logger_->error("Workload {} not running after restart", ref_);
        throw VaultError(Errc::quiesce_timeout, "restart " + ref_);
    }
    state_ = QuiesceState::Running;
    logger_->info("Workload {} running again", ref_);
}

// ── helpers ──────────────────────────────────────────────────────────────────

bool QuiescenceCoordinator::wait_for(bool running,
                                     std::chrono::steady_clock::time_point deadline) {
    for (;;) {
        bool now_running = !running;
        try {
            now_running = runtime_.is_running(ref_);
        } catch (const VaultError& e) {
            logger_->warn("State query for {} failed: {}", ref_, e.what());
        }
        if (now_running == running) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(options_.poll_interval);
    }
}

void QuiescenceCoordinator::restart_after_failure() noexcept {
    armed_ = false;
    state_ = QuiesceState::Restarting;
    try {
        logger_->warn("Restarting workload {} after failed run", ref_);
        runtime_.start(ref_);
        state_ = QuiesceState::Running;
    } catch (const std::exception& e) {
        logger_->error("Best-effort restart of {} failed: {}", ref_, e.what());
    }
}

} // namespace cvault::runtime
