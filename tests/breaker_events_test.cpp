#include <catch2/catch_test_macros.hpp>

#include "circuitry/event/breaker_event.hpp"
#include "circuitry/event/event_queue.hpp"
#include "circuitry/resilience/circuit_breaker.hpp"
#include "mocks/manual_clock.hpp"
#include "mocks/recording_sink.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace circuitry;
using namespace circuitry::testing;
using namespace std::chrono_literals;

namespace {

CircuitBreakerConfig tripping_config() {
    return CircuitBreakerConfig{}
        .with_sliding_window(2)
        .with_minimum_number_of_calls(2)
        .with_failure_rate_threshold(50)
        .with_wait_duration_in_open(1s)
        .with_permitted_calls_in_half_open(1);
}

void fail(CircuitBreaker& breaker) {
    auto permit = breaker.permit_call();
    REQUIRE(permit.has_value());
    breaker.record_failure(std::move(*permit), 3ms, ErrorInfo::make("io", "timeout"));
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Ordering and filtering
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Events arrive in the order the breaker committed them", "[events][breaker]") {
    auto clock = make_manual_clock();
    CircuitBreaker breaker("orders", tripping_config(), clock);
    auto recorder = std::make_shared<BreakerRecorder>();
    auto sub = breaker.events().subscribe(recorder);

    fail(breaker);
    fail(breaker);
    (void)breaker.permit_call();

    const std::vector<BreakerEventKind> expected{
        BreakerEventKind::Error,
        BreakerEventKind::Error,
        BreakerEventKind::FailureRateExceeded,
        BreakerEventKind::StateTransition,
        BreakerEventKind::NotPermitted,
    };
    REQUIRE(recorder->kinds() == expected);

    for (const auto& event : recorder->events()) {
        REQUIRE(event.breaker_name == "orders");
    }
}

TEST_CASE("A trip publishes exactly one state transition", "[events][breaker]") {
    auto clock = make_manual_clock();
    CircuitBreaker breaker("orders", tripping_config(), clock);
    auto transitions = std::make_shared<BreakerRecorder>();
    auto sub = breaker.events().subscribe(
        transitions, BreakerEventFilter::only_kinds({BreakerEventKind::StateTransition}));

    fail(breaker);
    fail(breaker);

    auto payloads = transitions->payloads<StateTransition>();
    REQUIRE(payloads.size() == 1);
    REQUIRE(payloads[0].from == CircuitState::Closed);
    REQUIRE(payloads[0].to == CircuitState::Open);
    REQUIRE(transitions->events().size() == 1);
}

TEST_CASE("A subscriber excluding transitions sees none", "[events][breaker]") {
    auto clock = make_manual_clock();
    CircuitBreaker breaker("orders", tripping_config(), clock);
    auto recorder = std::make_shared<BreakerRecorder>();
    auto sub = breaker.events().subscribe(
        recorder, BreakerEventFilter::excluding({BreakerEventKind::StateTransition}));

    fail(breaker);
    fail(breaker);
    clock->advance(1s);
    (void)breaker.permit_call();

    REQUIRE(recorder->count(BreakerEventKind::StateTransition) == 0);
    REQUIRE(recorder->count(BreakerEventKind::Error) == 2);
}

TEST_CASE("A full subscriber queue does not affect the breaker", "[events][breaker][queue]") {
    auto clock = make_manual_clock();
    CircuitBreaker breaker("orders", tripping_config(), clock);
    auto queue = std::make_shared<EventQueue<BreakerEvent>>(1);
    auto recorder = std::make_shared<BreakerRecorder>();
    auto sub_queue = breaker.events().subscribe(queue);
    auto sub_recorder = breaker.events().subscribe(recorder);

    fail(breaker);
    fail(breaker);

    REQUIRE(breaker.state() == CircuitState::Open);
    REQUIRE(queue->size() == 1);
    REQUIRE(queue->dropped() == 3);
    REQUIRE(recorder->events().size() == 4);
    REQUIRE(breaker.events().dropped() == 3);
}

TEST_CASE("A subscriber may call back into the breaker", "[events][breaker]") {
    auto clock = make_manual_clock();
    CircuitBreaker breaker("orders", tripping_config(), clock);
    std::vector<CircuitState> seen;

    auto sub = breaker.events().subscribe(
        [&](const BreakerEvent& event) {
            seen.push_back(breaker.state());
            if (const auto* t = event.as<StateTransition>(); t && t->to == CircuitState::Open) {
                // Re-entrant command from inside delivery
                breaker.force_open();
            }
        },
        BreakerEventFilter::only_kinds({BreakerEventKind::StateTransition}));

    fail(breaker);
    fail(breaker);

    REQUIRE(breaker.state() == CircuitState::ForcedOpen);
    REQUIRE(seen.size() == 2);
}

TEST_CASE("A throwing subscriber does not disturb the breaker", "[events][breaker]") {
    auto clock = make_manual_clock();
    CircuitBreaker breaker("orders", tripping_config(), clock);
    auto sub = breaker.events().subscribe([](const BreakerEvent&) {
        throw std::runtime_error("listener bug");
    });

    fail(breaker);
    fail(breaker);

    REQUIRE(breaker.state() == CircuitState::Open);
}

TEST_CASE("A subscriber throwing a non-standard exception does not stop delivery", "[events][breaker]") {
    auto clock = make_manual_clock();
    CircuitBreaker breaker("orders", tripping_config(), clock);

    int calls = 0;
    auto sub = breaker.events().subscribe([&calls](const BreakerEvent&) {
        if (++calls == 1) {
            throw 42;
        }
    });
    auto recorder = std::make_shared<BreakerRecorder>();
    auto recorded = breaker.events().subscribe(recorder);

    for (int i = 0; i < 6; ++i) {
        auto permit = breaker.permit_call();
        REQUIRE(permit.has_value());
        REQUIRE_NOTHROW(breaker.record_success(std::move(*permit), 1ms));
    }

    REQUIRE(calls == 6);
    REQUIRE(recorder->count(BreakerEventKind::Success) == 6);
}

namespace {

class ThrowingSink final : public IEventSink<BreakerEvent> {
public:
    bool offer(const BreakerEvent&) override {
        ++offers;
        if (offers % 2 == 1) {
            throw std::runtime_error("sink bug");
        }
        throw "not even an exception class";
    }

    int offers{0};
};

}  // namespace

TEST_CASE("A throwing sink counts as a drop and later events still arrive", "[events][breaker]") {
    auto clock = make_manual_clock();
    CircuitBreaker breaker("orders", tripping_config(), clock);
    auto throwing = std::make_shared<ThrowingSink>();
    auto recorder = std::make_shared<BreakerRecorder>();
    auto bad = breaker.events().subscribe(throwing);
    auto good = breaker.events().subscribe(recorder);

    REQUIRE_NOTHROW(fail(breaker));
    REQUIRE_NOTHROW(fail(breaker));
    REQUIRE(breaker.state() == CircuitState::Open);

    // error, error, failure-rate-exceeded, state-transition
    REQUIRE(throwing->offers == 4);
    REQUIRE(recorder->events().size() == 4);
    REQUIRE(recorder->count(BreakerEventKind::StateTransition) == 1);
    REQUIRE(breaker.events().dropped() == 4);

    breaker.close();
    REQUIRE(recorder->count(BreakerEventKind::StateTransition) == 2);
    REQUIRE(throwing->offers == 5);
}

// ═══════════════════════════════════════════════════════════════════════════
// Payloads
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Call events carry elapsed time and error details", "[events][breaker]") {
    auto clock = make_manual_clock();
    CircuitBreaker breaker("orders", tripping_config(), clock);
    auto recorder = std::make_shared<BreakerRecorder>();
    auto sub = breaker.events().subscribe(recorder);

    fail(breaker);

    auto failures = recorder->payloads<CallFailed>();
    REQUIRE(failures.size() == 1);
    REQUIRE(failures[0].elapsed == 3ms);
    REQUIRE(failures[0].error.type == "io");
    REQUIRE(failures[0].error.message == "timeout");
}

TEST_CASE("Event kinds round-trip through their names", "[events]") {
    for (const auto kind : {BreakerEventKind::Success, BreakerEventKind::Error,
                            BreakerEventKind::IgnoredError, BreakerEventKind::NotPermitted,
                            BreakerEventKind::StateTransition, BreakerEventKind::Reset,
                            BreakerEventKind::FailureRateExceeded,
                            BreakerEventKind::SlowCallRateExceeded}) {
        REQUIRE(breaker_event_kind_from_string(to_string(kind)) == kind);
    }
    REQUIRE_FALSE(breaker_event_kind_from_string("exploded").has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// JSON
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("BreakerEvent::to_json for a state transition", "[events][json]") {
    auto event = BreakerEvent::make("orders", StateTransition{CircuitState::HalfOpen, CircuitState::Open});
    auto json = event.to_json();

    REQUIRE(json["kind"] == "state-transition");
    REQUIRE(json["breaker_name"] == "orders");
    REQUIRE(json["from"] == "half-open");
    REQUIRE(json["to"] == "open");
    REQUIRE(json["creation_time"].is_number_integer());
}

TEST_CASE("BreakerEvent::to_json for a failed call", "[events][json]") {
    auto event = BreakerEvent::make("orders", CallFailed{1500us, ErrorInfo::make("io", "reset by peer")});
    auto json = event.to_json();

    REQUIRE(json["kind"] == "error");
    REQUIRE(json["elapsed_ms"].get<double>() == 1.5);
    REQUIRE(json["error"]["type"] == "io");
    REQUIRE(json["error"]["message"] == "reset by peer");
}

TEST_CASE("BreakerEvent::to_json for rejections and rates", "[events][json]") {
    auto rejected = BreakerEvent::make("orders", CallNotPermitted{CircuitState::ForcedOpen}).to_json();
    REQUIRE(rejected["kind"] == "not-permitted");
    REQUIRE(rejected["state"] == "forced-open");

    auto rate = BreakerEvent::make("orders", FailureRateExceeded{75.0f, 50.0f}).to_json();
    REQUIRE(rate["kind"] == "failure-rate-exceeded");
    REQUIRE(rate["failure_rate"].get<float>() == 75.0f);
    REQUIRE(rate["threshold"].get<float>() == 50.0f);

    auto reset = BreakerEvent::make("orders", BreakerReset{}).to_json();
    REQUIRE(reset["kind"] == "reset");
    REQUIRE(reset.size() == 3);
}
