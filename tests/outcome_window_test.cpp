#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "circuitry/window/metrics.hpp"
#include "circuitry/window/outcome_window.hpp"
#include "mocks/manual_clock.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

using namespace circuitry;
using namespace circuitry::testing;
using namespace std::chrono_literals;
using Catch::Matchers::WithinAbs;

namespace {

ClassifiedCall success(bool slow = false) { return {CallKind::Success, slow}; }
ClassifiedCall failure(bool slow = false) { return {CallKind::Failure, slow}; }
ClassifiedCall ignored() { return {CallKind::Ignored, false}; }

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Metrics
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Metrics::from_counts computes rates", "[window][metrics]") {
    auto m = Metrics::from_counts(8, 2, 4, 1);

    REQUIRE(m.successful_calls() == 6);
    REQUIRE(m.slow_successful_calls() == 3);
    REQUIRE_THAT(m.failure_rate, WithinAbs(25.0, 0.001));
    REQUIRE_THAT(m.slow_call_rate, WithinAbs(50.0, 0.001));
}

TEST_CASE("Metrics of an empty window have no rates", "[window][metrics]") {
    auto m = Metrics::from_counts(0, 0, 0, 0);

    REQUIRE(m.failure_rate == Metrics::kNoRate);
    REQUIRE(m.slow_call_rate == Metrics::kNoRate);
}

// ═══════════════════════════════════════════════════════════════════════════
// CountBasedWindow
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("CountBasedWindow rejects size zero", "[window][count]") {
    REQUIRE_THROWS_AS(CountBasedWindow(0), std::invalid_argument);
}

TEST_CASE("CountBasedWindow holds at most its size", "[window][count]") {
    CountBasedWindow window(5);
    REQUIRE(window.size() == 5);

    for (std::size_t n = 1; n <= 12; ++n) {
        window.record(n % 3 == 0 ? failure() : success());
        REQUIRE(window.snapshot().total_calls == std::min<std::size_t>(5, n));
    }
}

TEST_CASE("CountBasedWindow evicts the oldest call", "[window][count]") {
    CountBasedWindow window(3);

    window.record(failure(true));
    window.record(success());
    window.record(success());

    auto before = window.snapshot();
    REQUIRE(before.failed_calls == 1);
    REQUIRE(before.slow_calls == 1);
    REQUIRE(before.slow_failed_calls == 1);

    // The slow failure drops out
    window.record(success());
    auto after = window.snapshot();
    REQUIRE(after.total_calls == 3);
    REQUIRE(after.failed_calls == 0);
    REQUIRE(after.slow_calls == 0);
    REQUIRE(after.slow_failed_calls == 0);
    REQUIRE_THAT(after.failure_rate, WithinAbs(0.0, 0.001));
}

TEST_CASE("CountBasedWindow drops ignored calls", "[window][count]") {
    CountBasedWindow window(4);

    window.record(ignored());
    window.record(ignored());

    auto m = window.snapshot();
    REQUIRE(m.total_calls == 0);
    REQUIRE(m.failure_rate == Metrics::kNoRate);
}

TEST_CASE("CountBasedWindow counts slow successes and slow failures", "[window][count]") {
    CountBasedWindow window(10);

    window.record(success(true));
    window.record(success(true));
    window.record(failure(true));
    window.record(failure(false));

    auto m = window.snapshot();
    REQUIRE(m.total_calls == 4);
    REQUIRE(m.failed_calls == 2);
    REQUIRE(m.slow_calls == 3);
    REQUIRE(m.slow_failed_calls == 1);
    REQUIRE(m.slow_successful_calls() == 2);
    REQUIRE_THAT(m.slow_call_rate, WithinAbs(75.0, 0.001));
}

TEST_CASE("CountBasedWindow reset empties the ring", "[window][count]") {
    CountBasedWindow window(2);
    window.record(failure());
    window.record(failure());

    window.reset();
    REQUIRE(window.snapshot().total_calls == 0);

    window.record(success());
    auto m = window.snapshot();
    REQUIRE(m.total_calls == 1);
    REQUIRE(m.failed_calls == 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// TimeBasedWindow
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("TimeBasedWindow rejects size zero", "[window][time]") {
    REQUIRE_THROWS_AS(TimeBasedWindow(0, make_manual_clock()), std::invalid_argument);
}

TEST_CASE("TimeBasedWindow aggregates calls within the window", "[window][time]") {
    auto clock = make_manual_clock();
    TimeBasedWindow window(3, clock);

    window.record(failure());
    clock->advance(1s);
    window.record(success());
    clock->advance(1s);
    window.record(success(true));

    auto m = window.snapshot();
    REQUIRE(m.total_calls == 3);
    REQUIRE(m.failed_calls == 1);
    REQUIRE(m.slow_calls == 1);
}

TEST_CASE("TimeBasedWindow expires calls older than its size", "[window][time]") {
    auto clock = make_manual_clock();
    TimeBasedWindow window(3, clock);

    window.record(failure());
    window.record(failure());
    clock->advance(1s);
    window.record(success());

    clock->advance(2s);  // first second falls out
    auto m = window.snapshot();
    REQUIRE(m.total_calls == 1);
    REQUIRE(m.failed_calls == 0);

    clock->advance(1s);
    REQUIRE(window.snapshot().total_calls == 0);
}

TEST_CASE("TimeBasedWindow clears everything after a long pause", "[window][time]") {
    auto clock = make_manual_clock();
    TimeBasedWindow window(5, clock);

    for (int i = 0; i < 5; ++i) {
        window.record(failure());
        clock->advance(1s);
    }
    clock->advance(1h);

    REQUIRE(window.snapshot().total_calls == 0);

    window.record(success());
    REQUIRE(window.snapshot().total_calls == 1);
}

TEST_CASE("TimeBasedWindow sub-second calls share a bucket", "[window][time]") {
    auto clock = make_manual_clock();
    TimeBasedWindow window(1, clock);

    window.record(success());
    clock->advance(300ms);
    window.record(failure());
    clock->advance(300ms);

    auto m = window.snapshot();
    REQUIRE(m.total_calls == 2);
    REQUIRE(m.failed_calls == 1);

    clock->advance(500ms);
    REQUIRE(window.snapshot().total_calls == 0);
}

TEST_CASE("TimeBasedWindow drops ignored calls and resets", "[window][time]") {
    auto clock = make_manual_clock();
    TimeBasedWindow window(10, clock);

    window.record(ignored());
    window.record(failure());
    REQUIRE(window.snapshot().total_calls == 1);

    window.reset();
    REQUIRE(window.snapshot().total_calls == 0);
}

TEST_CASE("make_outcome_window picks the variant", "[window]") {
    auto clock = make_manual_clock();

    auto count = make_outcome_window(SlidingWindowType::CountBased, 7, clock);
    REQUIRE(dynamic_cast<CountBasedWindow*>(count.get()) != nullptr);
    REQUIRE(count->size() == 7);

    auto time = make_outcome_window(SlidingWindowType::TimeBased, 4, clock);
    REQUIRE(dynamic_cast<TimeBasedWindow*>(time.get()) != nullptr);
    REQUIRE(time->size() == 4);
}
