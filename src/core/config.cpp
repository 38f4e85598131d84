#include "circuitry/core/config.hpp"

#include <algorithm>
#include <cmath>

namespace circuitry {

namespace {

bool is_percentage(float value) {
    return std::isfinite(value) && value >= 0.0f && value <= 100.0f;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Predicate helpers
// ─────────────────────────────────────────────────────────────────────────────

CircuitBreakerConfig& CircuitBreakerConfig::with_record_predicate(PredicateClassifier::Predicate record) {
    PredicateClassifier::Predicate ignore;
    if (const auto* existing = dynamic_cast<const PredicateClassifier*>(error_classifier.get())) {
        ignore = existing->ignore_predicate();
    }
    error_classifier = std::make_shared<PredicateClassifier>(std::move(record), std::move(ignore));
    return *this;
}

CircuitBreakerConfig& CircuitBreakerConfig::with_ignore_predicate(PredicateClassifier::Predicate ignore) {
    PredicateClassifier::Predicate record;
    if (const auto* existing = dynamic_cast<const PredicateClassifier*>(error_classifier.get())) {
        record = existing->record_predicate();
    }
    error_classifier = std::make_shared<PredicateClassifier>(std::move(record), std::move(ignore));
    return *this;
}

// ─────────────────────────────────────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────────────────────────────────────

ConfigResult<void> CircuitBreakerConfig::validate() const {
    if (!is_percentage(failure_rate_threshold)) {
        return tl::unexpected(ConfigError::out_of_range("failure_rate_threshold", "between 0 and 100"));
    }
    if (!is_percentage(slow_call_rate_threshold)) {
        return tl::unexpected(ConfigError::out_of_range("slow_call_rate_threshold", "between 0 and 100"));
    }
    if (slow_call_duration_threshold.count() < 0) {
        return tl::unexpected(ConfigError::out_of_range("slow_call_duration_threshold", "at least 0 ms"));
    }
    if (permitted_calls_in_half_open == 0) {
        return tl::unexpected(ConfigError::out_of_range("permitted_calls_in_half_open", "at least 1"));
    }
    if (sliding_window_size == 0) {
        return tl::unexpected(ConfigError::out_of_range("sliding_window_size", "at least 1"));
    }
    if (minimum_number_of_calls == 0) {
        return tl::unexpected(ConfigError::out_of_range("minimum_number_of_calls", "at least 1"));
    }
    if (wait_duration_in_open.count() < 0) {
        return tl::unexpected(ConfigError::out_of_range("wait_duration_in_open", "at least 0 ms"));
    }
    if (max_wait_duration_in_half_open.count() < 0) {
        return tl::unexpected(ConfigError::out_of_range("max_wait_duration_in_half_open", "at least 0 ms"));
    }
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Evaluation
// ─────────────────────────────────────────────────────────────────────────────

ClassifiedCall CircuitBreakerConfig::classify(const CallOutcome& outcome) const {
    ClassifiedCall call;
    call.slow = outcome.elapsed >= slow_call_duration_threshold;

    if (outcome.succeeded) {
        call.kind = CallKind::Success;
        return call;
    }

    // A failure reported without details still needs something to classify
    const ErrorInfo unknown = ErrorInfo::make("unknown", "");
    const ErrorInfo& error = outcome.error ? *outcome.error : unknown;

    switch (classifier_or_default(error_classifier).classify(error)) {
        case ErrorClass::Failure:    call.kind = CallKind::Failure; break;
        case ErrorClass::Ignored:    call.kind = CallKind::Ignored; break;
        case ErrorClass::NotMatched: call.kind = CallKind::Success; break;
    }
    return call;
}

std::size_t CircuitBreakerConfig::effective_minimum_number_of_calls() const noexcept {
    if (sliding_window_type == SlidingWindowType::CountBased) {
        return std::min(minimum_number_of_calls, sliding_window_size);
    }
    return minimum_number_of_calls;
}

}  // namespace circuitry
