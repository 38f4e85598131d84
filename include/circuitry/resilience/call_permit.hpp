#pragma once

#include "circuitry/core/circuit_state.hpp"
#include "circuitry/core/clock.hpp"

#include <cstdint>

namespace circuitry {

class CircuitBreaker;

// ─────────────────────────────────────────────────────────────────────────────
// CallPermit - proof that permit_call() admitted a call
// ─────────────────────────────────────────────────────────────────────────────
// Move-only. Hand it back to the breaker through record_result() (or one of
// the record_* shorthands) exactly once. A permit dropped without recording
// gives its half-open slot back, so an abandoned probe call never wedges a
// breaker in HalfOpen.
//
// A permit holds a plain pointer to its breaker and must not outlive it.

class CallPermit {
public:
    CallPermit() = default;
    ~CallPermit();

    CallPermit(const CallPermit&) = delete;
    CallPermit& operator=(const CallPermit&) = delete;

    CallPermit(CallPermit&& other) noexcept;
    CallPermit& operator=(CallPermit&& other) noexcept;

    /// False once recorded, released or moved from
    [[nodiscard]] bool valid() const noexcept { return breaker_ != nullptr; }

    [[nodiscard]] CircuitState issued_in() const noexcept { return issued_in_; }
    [[nodiscard]] IClock::TimePoint issued_at() const noexcept { return issued_at_; }

    /// Give the permit back without recording an outcome
    void release() noexcept;

private:
    friend class CircuitBreaker;

    CallPermit(CircuitBreaker* breaker,
               std::uint64_t epoch,
               CircuitState issued_in,
               IClock::TimePoint issued_at) noexcept
        : breaker_(breaker)
        , epoch_(epoch)
        , issued_in_(issued_in)
        , issued_at_(issued_at)
    {}

    CircuitBreaker* breaker_{nullptr};
    std::uint64_t epoch_{0};
    CircuitState issued_in_{CircuitState::Closed};
    IClock::TimePoint issued_at_{};
};

}  // namespace circuitry
