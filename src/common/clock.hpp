#pragma once

#include <chrono>

namespace cvault {

// ── Clock abstraction ────────────────────────────────────────────────────────
//
// Wall-clock time source for generation naming and retention ages.
// Generation names are UTC calendar times (YYYYMMDD_HHMMSS) compared against
// file ages across runs and reboots, so this is system_clock rather than a
// monotonic clock; QuiescenceCoordinator keeps steady_clock for its
// deadlines.  Tests inject a ManualClock so that successive backups get
// distinct, predictable timestamps.

class Clock {
public:
    using time_point = std::chrono::system_clock::time_point;

    virtual ~Clock() = default;

    [[nodiscard]] virtual time_point now() const = 0;
};

// ── SystemClock ──────────────────────────────────────────────────────────────
//
// Production implementation: delegates to std::chrono::system_clock.

class SystemClock final : public Clock {
public:
    [[nodiscard]] time_point now() const override {
        return std::chrono::system_clock::now();
    }
};

// ── ManualClock ──────────────────────────────────────────────────────────────
//
// Test implementation: time only advances via explicit advance() calls.

class ManualClock final : public Clock {
public:
    explicit ManualClock(time_point start = {}) : now_{start} {}

    [[nodiscard]] time_point now() const override {
        return now_;
    }

    void advance(std::chrono::seconds delta) {
        now_ += delta;
    }

    void set(time_point tp) {
        now_ = tp;
    }

private:
    time_point now_;
};

} // namespace cvault
