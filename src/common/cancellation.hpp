#pragma once

#include <atomic>

namespace cvault {

// ── CancellationToken ────────────────────────────────────────────────────────
//
// Set once by the signal handler (or a test); polled by the transfer engines
// between mounts.  Thread-safe.

class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    [[nodiscard]] bool cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace cvault
