#ifndef CIRCUITRY_TESTS_MOCKS_MANUAL_CLOCK_HPP
#define CIRCUITRY_TESTS_MOCKS_MANUAL_CLOCK_HPP

#include "circuitry/core/clock.hpp"

#include <chrono>
#include <memory>
#include <mutex>

namespace circuitry::testing {

// ─────────────────────────────────────────────────────────────────────────────
// ManualClock - IClock that only moves when a test advances it
// ─────────────────────────────────────────────────────────────────────────────
// Starts well away from the epoch so time-based windows see positive seconds.

class ManualClock final : public IClock {
public:
    ManualClock() : now_(TimePoint{} + std::chrono::hours(1)) {}

    [[nodiscard]] TimePoint now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(Duration by) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += by;
    }

    void set(TimePoint to) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = to;
    }

private:
    mutable std::mutex mutex_;
    TimePoint now_;
};

[[nodiscard]] inline std::shared_ptr<ManualClock> make_manual_clock() {
    return std::make_shared<ManualClock>();
}

}  // namespace circuitry::testing

#endif  // CIRCUITRY_TESTS_MOCKS_MANUAL_CLOCK_HPP
