#pragma once

#include <optional>
#include <string_view>

namespace circuitry {

// ─────────────────────────────────────────────────────────────────────────────
// Circuit State
// ─────────────────────────────────────────────────────────────────────────────
//
//   ┌─────────┐  rate >= threshold   ┌────────┐
//   │ CLOSED  │ ────────────────────▶│  OPEN  │◀──────────────┐
//   └─────────┘                      └────┬───┘               │
//        ▲                                │ wait_duration     │ rate >= threshold
//        │                                ▼                   │ or max wait
//        │   rates below thresholds  ┌──────────┐             │
//        └───────────────────────────│HALF_OPEN │─────────────┘
//                                    └──────────┘
//
// ForcedOpen, Disabled and MetricsOnly are only entered by manual command
// and never leave on their own.

enum class CircuitState {
    Closed,       ///< Calls pass; outcomes feed the closed window
    Open,         ///< Calls rejected until the wait duration elapses
    HalfOpen,     ///< A limited number of probe calls decide the next state
    ForcedOpen,   ///< Calls rejected until a manual transition
    Disabled,     ///< Calls pass; nothing is recorded
    MetricsOnly   ///< Calls pass; outcomes recorded, never transitions
};

[[nodiscard]] constexpr std::string_view to_string(CircuitState state) noexcept {
    switch (state) {
        case CircuitState::Closed:      return "closed";
        case CircuitState::Open:        return "open";
        case CircuitState::HalfOpen:    return "half-open";
        case CircuitState::ForcedOpen:  return "forced-open";
        case CircuitState::Disabled:    return "disabled";
        case CircuitState::MetricsOnly: return "metrics-only";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::optional<CircuitState> state_from_string(std::string_view text) noexcept {
    if (text == "closed")       return CircuitState::Closed;
    if (text == "open")         return CircuitState::Open;
    if (text == "half-open")    return CircuitState::HalfOpen;
    if (text == "forced-open")  return CircuitState::ForcedOpen;
    if (text == "disabled")     return CircuitState::Disabled;
    if (text == "metrics-only") return CircuitState::MetricsOnly;
    return std::nullopt;
}

/// True for states in which permit_call() can never succeed
[[nodiscard]] constexpr bool is_rejecting(CircuitState state) noexcept {
    switch (state) {
        case CircuitState::Open:
        case CircuitState::ForcedOpen:
            return true;
        case CircuitState::Closed:
        case CircuitState::HalfOpen:
        case CircuitState::Disabled:
        case CircuitState::MetricsOnly:
            return false;
    }
    return false;
}

}  // namespace circuitry
