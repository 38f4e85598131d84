#pragma once

#include <chrono>
#include <memory>

namespace circuitry {

// ─────────────────────────────────────────────────────────────────────────────
// IClock - monotonic time source
// ─────────────────────────────────────────────────────────────────────────────
// Breakers and time-based windows read time only through this interface so
// that tests can drive wait durations and bucket expiry deterministically.

class IClock {
public:
    using Duration = std::chrono::steady_clock::duration;
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~IClock() = default;

    [[nodiscard]] virtual TimePoint now() const = 0;
};

class SteadyClock final : public IClock {
public:
    [[nodiscard]] TimePoint now() const override {
        return std::chrono::steady_clock::now();
    }
};

/// Process-wide SteadyClock used when a breaker is built without a clock
[[nodiscard]] std::shared_ptr<const IClock> default_clock();

}  // namespace circuitry
