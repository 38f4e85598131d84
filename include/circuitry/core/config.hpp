#ifndef CIRCUITRY_CORE_CONFIG_HPP
#define CIRCUITRY_CORE_CONFIG_HPP

#include "circuitry/core/call_outcome.hpp"
#include "circuitry/core/error_classifier.hpp"
#include "circuitry/core/errors.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string_view>

namespace circuitry {

// ─────────────────────────────────────────────────────────────────────────────
// Sliding Window Type
// ─────────────────────────────────────────────────────────────────────────────

enum class SlidingWindowType {
    CountBased,  ///< Last N calls
    TimeBased    ///< Calls from the last N seconds
};

[[nodiscard]] constexpr std::string_view to_string(SlidingWindowType type) noexcept {
    switch (type) {
        case SlidingWindowType::CountBased: return "count_based";
        case SlidingWindowType::TimeBased:  return "time_based";
    }
    return "unknown";
}

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaker Configuration
// ─────────────────────────────────────────────────────────────────────────────
// A breaker copies its config at construction and never changes it; build a
// new breaker to apply different settings.

struct CircuitBreakerConfig {
    // ─────────────────────────────────────────────────────────────────────────
    // Thresholds
    // ─────────────────────────────────────────────────────────────────────────

    // Percentage (0-100) of failed calls at which the breaker opens.
    float failure_rate_threshold{50.0f};

    // Percentage (0-100) of slow calls at which the breaker opens.
    // 100 means only an all-slow window trips it.
    float slow_call_rate_threshold{100.0f};

    // Calls taking at least this long are slow, whether or not they failed.
    std::chrono::milliseconds slow_call_duration_threshold{60'000};

    // ─────────────────────────────────────────────────────────────────────────
    // Sliding Window
    // ─────────────────────────────────────────────────────────────────────────

    SlidingWindowType sliding_window_type{SlidingWindowType::CountBased};

    // Number of calls (count based) or seconds (time based).
    std::size_t sliding_window_size{100};

    // Rates are not evaluated until the window holds this many calls.
    std::size_t minimum_number_of_calls{10};

    // ─────────────────────────────────────────────────────────────────────────
    // Open / Half-Open
    // ─────────────────────────────────────────────────────────────────────────

    std::chrono::milliseconds wait_duration_in_open{60'000};

    // When true, a background timer moves Open to HalfOpen once the wait
    // duration has elapsed, even if no call arrives.
    bool automatic_transition_from_open_to_half_open{false};

    // Number of probe calls admitted in HalfOpen before deciding.
    std::size_t permitted_calls_in_half_open{10};

    // Longest HalfOpen may last before falling back to Open.
    // 0 = wait for all probe calls, however long they take.
    std::chrono::milliseconds max_wait_duration_in_half_open{0};

    // ─────────────────────────────────────────────────────────────────────────
    // Classification
    // ─────────────────────────────────────────────────────────────────────────

    // If null, every error is recorded as a failure.
    std::shared_ptr<const IErrorClassifier> error_classifier;

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-Style Helpers
    // ─────────────────────────────────────────────────────────────────────────
    //   config.with_failure_rate_threshold(25).with_sliding_window(20)

    CircuitBreakerConfig& with_failure_rate_threshold(float percent) {
        failure_rate_threshold = percent;
        return *this;
    }

    CircuitBreakerConfig& with_slow_call_rate_threshold(float percent) {
        slow_call_rate_threshold = percent;
        return *this;
    }

    CircuitBreakerConfig& with_slow_call_duration_threshold(std::chrono::milliseconds duration) {
        slow_call_duration_threshold = duration;
        return *this;
    }

    CircuitBreakerConfig& with_sliding_window(std::size_t size,
                                              SlidingWindowType type = SlidingWindowType::CountBased) {
        sliding_window_size = size;
        sliding_window_type = type;
        return *this;
    }

    CircuitBreakerConfig& with_minimum_number_of_calls(std::size_t calls) {
        minimum_number_of_calls = calls;
        return *this;
    }

    CircuitBreakerConfig& with_wait_duration_in_open(std::chrono::milliseconds duration) {
        wait_duration_in_open = duration;
        return *this;
    }

    CircuitBreakerConfig& with_automatic_transition(bool enable) {
        automatic_transition_from_open_to_half_open = enable;
        return *this;
    }

    CircuitBreakerConfig& with_permitted_calls_in_half_open(std::size_t calls) {
        permitted_calls_in_half_open = calls;
        return *this;
    }

    CircuitBreakerConfig& with_max_wait_duration_in_half_open(std::chrono::milliseconds duration) {
        max_wait_duration_in_half_open = duration;
        return *this;
    }

    CircuitBreakerConfig& with_error_classifier(std::shared_ptr<const IErrorClassifier> classifier) {
        error_classifier = std::move(classifier);
        return *this;
    }

    // Both predicate helpers keep the other predicate if a PredicateClassifier
    // is already installed.
    CircuitBreakerConfig& with_record_predicate(PredicateClassifier::Predicate record);
    CircuitBreakerConfig& with_ignore_predicate(PredicateClassifier::Predicate ignore);

    // ─────────────────────────────────────────────────────────────────────────
    // Evaluation
    // ─────────────────────────────────────────────────────────────────────────

    /// First invalid option, if any
    [[nodiscard]] ConfigResult<void> validate() const;

    /// Apply the classifier and slow-call threshold to a finished call
    [[nodiscard]] ClassifiedCall classify(const CallOutcome& outcome) const;

    /// Calls required before the Closed window is evaluated. A count-based
    /// window can never hold more than its size, so the minimum is capped.
    [[nodiscard]] std::size_t effective_minimum_number_of_calls() const noexcept;
};

}  // namespace circuitry

#endif  // CIRCUITRY_CORE_CONFIG_HPP
