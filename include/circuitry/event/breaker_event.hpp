#pragma once

#include "circuitry/core/call_outcome.hpp"
#include "circuitry/core/circuit_state.hpp"
#include "circuitry/event/event_bus.hpp"
#include "circuitry/event/event_filter.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace circuitry {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Breaker Event Kinds
// ─────────────────────────────────────────────────────────────────────────────

enum class BreakerEventKind {
    Success,
    Error,
    IgnoredError,
    NotPermitted,
    StateTransition,
    Reset,
    FailureRateExceeded,
    SlowCallRateExceeded
};

[[nodiscard]] constexpr std::string_view to_string(BreakerEventKind kind) noexcept {
    switch (kind) {
        case BreakerEventKind::Success:              return "success";
        case BreakerEventKind::Error:                return "error";
        case BreakerEventKind::IgnoredError:         return "ignored-error";
        case BreakerEventKind::NotPermitted:         return "not-permitted";
        case BreakerEventKind::StateTransition:      return "state-transition";
        case BreakerEventKind::Reset:                return "reset";
        case BreakerEventKind::FailureRateExceeded:  return "failure-rate-exceeded";
        case BreakerEventKind::SlowCallRateExceeded: return "slow-call-rate-exceeded";
    }
    return "unknown";
}

[[nodiscard]] std::optional<BreakerEventKind> breaker_event_kind_from_string(std::string_view text) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Payloads
// ─────────────────────────────────────────────────────────────────────────────

struct CallSucceeded {
    static constexpr BreakerEventKind kind = BreakerEventKind::Success;
    std::chrono::nanoseconds elapsed;
};

struct CallFailed {
    static constexpr BreakerEventKind kind = BreakerEventKind::Error;
    std::chrono::nanoseconds elapsed;
    ErrorInfo error;
};

struct CallIgnored {
    static constexpr BreakerEventKind kind = BreakerEventKind::IgnoredError;
    std::chrono::nanoseconds elapsed;
    ErrorInfo error;
};

struct CallNotPermitted {
    static constexpr BreakerEventKind kind = BreakerEventKind::NotPermitted;
    CircuitState state;
};

struct StateTransition {
    static constexpr BreakerEventKind kind = BreakerEventKind::StateTransition;
    CircuitState from;
    CircuitState to;
};

struct BreakerReset {
    static constexpr BreakerEventKind kind = BreakerEventKind::Reset;
};

struct FailureRateExceeded {
    static constexpr BreakerEventKind kind = BreakerEventKind::FailureRateExceeded;
    float failure_rate;
    float threshold;
};

struct SlowCallRateExceeded {
    static constexpr BreakerEventKind kind = BreakerEventKind::SlowCallRateExceeded;
    float slow_call_rate;
    float threshold;
};

// ─────────────────────────────────────────────────────────────────────────────
// BreakerEvent
// ─────────────────────────────────────────────────────────────────────────────

struct BreakerEvent {
    using Payload = std::variant<
        CallSucceeded,
        CallFailed,
        CallIgnored,
        CallNotPermitted,
        StateTransition,
        BreakerReset,
        FailureRateExceeded,
        SlowCallRateExceeded
    >;

    std::string breaker_name;
    std::chrono::system_clock::time_point creation_time;
    Payload payload;

    template <typename T>
    [[nodiscard]] static BreakerEvent make(std::string breaker_name, T payload) {
        return {std::move(breaker_name), std::chrono::system_clock::now(), Payload(std::move(payload))};
    }

    [[nodiscard]] BreakerEventKind kind() const noexcept {
        return std::visit([](const auto& p) { return std::decay_t<decltype(p)>::kind; }, payload);
    }

    /// Payload as T, or nullptr if the event holds something else
    template <typename T>
    [[nodiscard]] const T* as() const noexcept {
        return std::get_if<T>(&payload);
    }

    /// {"kind", "breaker_name", "creation_time" (ms since epoch), ...payload}
    [[nodiscard]] Json to_json() const;
};

using BreakerEventFilter = EventFilter<BreakerEventKind>;
using BreakerEventBus = EventBus<BreakerEvent>;

}  // namespace circuitry
