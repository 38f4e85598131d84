#include "circuitry/event/breaker_event.hpp"

#include <array>

namespace circuitry {

namespace {

constexpr std::array kAllKinds{
    BreakerEventKind::Success,
    BreakerEventKind::Error,
    BreakerEventKind::IgnoredError,
    BreakerEventKind::NotPermitted,
    BreakerEventKind::StateTransition,
    BreakerEventKind::Reset,
    BreakerEventKind::FailureRateExceeded,
    BreakerEventKind::SlowCallRateExceeded,
};

double as_millis(std::chrono::nanoseconds elapsed) {
    return std::chrono::duration<double, std::milli>(elapsed).count();
}

Json error_json(const ErrorInfo& error) {
    return Json{{"type", error.type}, {"message", error.message}};
}

// Adds the payload-specific members to an event object
struct PayloadWriter {
    Json& out;

    void operator()(const CallSucceeded& p) const {
        out["elapsed_ms"] = as_millis(p.elapsed);
    }

    void operator()(const CallFailed& p) const {
        out["elapsed_ms"] = as_millis(p.elapsed);
        out["error"] = error_json(p.error);
    }

    void operator()(const CallIgnored& p) const {
        out["elapsed_ms"] = as_millis(p.elapsed);
        out["error"] = error_json(p.error);
    }

    void operator()(const CallNotPermitted& p) const {
        out["state"] = std::string(to_string(p.state));
    }

    void operator()(const StateTransition& p) const {
        out["from"] = std::string(to_string(p.from));
        out["to"] = std::string(to_string(p.to));
    }

    void operator()(const BreakerReset&) const {}

    void operator()(const FailureRateExceeded& p) const {
        out["failure_rate"] = p.failure_rate;
        out["threshold"] = p.threshold;
    }

    void operator()(const SlowCallRateExceeded& p) const {
        out["slow_call_rate"] = p.slow_call_rate;
        out["threshold"] = p.threshold;
    }
};

}  // namespace

std::optional<BreakerEventKind> breaker_event_kind_from_string(std::string_view text) noexcept {
    for (const auto kind : kAllKinds) {
        if (to_string(kind) == text) {
            return kind;
        }
    }
    return std::nullopt;
}

Json BreakerEvent::to_json() const {
    Json out = {
        {"kind", std::string(to_string(kind()))},
        {"breaker_name", breaker_name},
        {"creation_time", std::chrono::duration_cast<std::chrono::milliseconds>(
            creation_time.time_since_epoch()).count()},
    };
    std::visit(PayloadWriter{out}, payload);
    return out;
}

}  // namespace circuitry
