#pragma once

#include <filesystem>
#include <system_error>

namespace cvault::persistence {

// ── WorkloadLock ─────────────────────────────────────────────────────────────
//
// Exclusive advisory lock (flock) on <workload_dir>/.lock, held for the whole
// backup, restore or prune run.  A second run for the same workload fails
// immediately with Errc::busy instead of waiting.  Released by the destructor.

class WorkloadLock {
public:
    static constexpr const char* kFilename = ".lock";

    explicit WorkloadLock(std::filesystem::path path);
    ~WorkloadLock();

    WorkloadLock(const WorkloadLock&) = delete;
    WorkloadLock& operator=(const WorkloadLock&) = delete;
    WorkloadLock(WorkloadLock&&) = delete;
    WorkloadLock& operator=(WorkloadLock&&) = delete;

    // Try to take the lock without blocking.
    [[nodiscard]] std::error_code try_lock();

    void unlock();

    [[nodiscard]] bool locked() const noexcept { return fd_ != -1; }

private:
    std::filesystem::path path_;
    int fd_ = -1;
};

} // namespace cvault::persistence
