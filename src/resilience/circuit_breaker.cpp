#include "circuitry/resilience/circuit_breaker.hpp"

#include "circuitry/log/logger.hpp"

#include <format>
#include <utility>

namespace circuitry {

namespace {

bool records_into_closed_window(CircuitState state) noexcept {
    return state == CircuitState::Closed || state == CircuitState::MetricsOnly;
}

ErrorInfo error_or_unknown(const CallOutcome& outcome) {
    if (outcome.error) {
        return *outcome.error;
    }
    return ErrorInfo::make("unknown", "");
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

CircuitBreaker::CircuitBreaker(std::string name,
                               CircuitBreakerConfig config,
                               std::shared_ptr<const IClock> clock,
                               std::shared_ptr<TransitionScheduler> scheduler)
    : name_(std::move(name))
    , config_(std::move(config))
    , clock_(clock ? std::move(clock) : default_clock())
    , scheduler_(std::move(scheduler))
    , timer_target_(std::make_shared<TimerTarget>())
{
    timer_target_->breaker = this;

    if (name_.empty()) {
        CIRCUITRY_LOG_ERROR("circuit breaker name must not be empty");
        throw ConfigurationError("circuit breaker name must not be empty");
    }

    const auto valid = config_.validate();
    if (!valid) {
        CIRCUITRY_LOG_ERROR(std::format("circuit breaker '{}': {}", name_, valid.error().to_string()));
        throw ConfigurationError(valid.error());
    }

    closed_window_ = make_outcome_window(config_.sliding_window_type, config_.sliding_window_size, clock_);
    half_open_window_ = std::make_unique<CountBasedWindow>(config_.permitted_calls_in_half_open);

    const bool needs_timer =
        config_.automatic_transition_from_open_to_half_open ||
        (config_.max_wait_duration_in_half_open.count() > 0);
    if (needs_timer && !scheduler_) {
        scheduler_ = std::make_shared<TransitionScheduler>();
    }
}

CircuitBreaker::~CircuitBreaker() {
    // Blocks while a timer callback is inside on_timer(); afterwards no
    // callback can reach this object
    {
        std::lock_guard<std::mutex> lock(timer_target_->mutex);
        timer_target_->breaker = nullptr;
    }
    timer_.cancel();
}

// ─────────────────────────────────────────────────────────────────────────────
// Call gating
// ─────────────────────────────────────────────────────────────────────────────

PermitResult CircuitBreaker::permit_call() {
    std::optional<CallPermit> permit;
    std::optional<CallRejected> rejected;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_->now();

        if (state_ == CircuitState::Open && open_wait_elapsed_locked(now)) {
            transition_locked(CircuitState::HalfOpen);
        }
        if (state_ == CircuitState::HalfOpen && half_open_expired_locked(now)) {
            CIRCUITRY_LOG_WARN(std::format(
                "circuit breaker '{}' exceeded its half-open time limit", name_));
            transition_locked(CircuitState::Open);
        }

        switch (state_) {
            case CircuitState::Closed:
            case CircuitState::Disabled:
            case CircuitState::MetricsOnly:
                permit.emplace(CallPermit(this, epoch_, state_, now));
                break;

            case CircuitState::HalfOpen:
                if (half_open_permits_issued_ < config_.permitted_calls_in_half_open) {
                    ++half_open_permits_issued_;
                    permit.emplace(CallPermit(this, epoch_, state_, now));
                } else {
                    rejected = reject_locked();
                }
                break;

            case CircuitState::Open:
            case CircuitState::ForcedOpen:
                rejected = reject_locked();
                break;
        }
    }

    drain_events();

    if (rejected) {
        return tl::unexpected(std::move(*rejected));
    }
    return std::move(*permit);
}

void CircuitBreaker::record_result(CallPermit&& permit, const CallOutcome& outcome) {
    if (permit.breaker_ != this) {
        const bool empty = (permit.breaker_ == nullptr);
        throw ProtocolViolation(std::format(
            "circuit breaker '{}': {}", name_,
            empty ? "permit is empty or was already used" : "permit was issued by another circuit breaker"));
    }

    // The classifier is user code; keep it outside the lock. If it throws,
    // the slot goes back as if the permit had been dropped.
    ClassifiedCall call;
    try {
        call = config_.classify(outcome);
    } catch (...) {
        permit.release();
        throw;
    }

    const auto epoch = permit.epoch_;
    permit.breaker_ = nullptr;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const bool same_episode = (epoch == epoch_);

        // A disabled breaker publishes transitions and resets only
        if (state_ != CircuitState::Disabled) {
            switch (call.kind) {
                case CallKind::Success:
                    enqueue_locked(CallSucceeded{outcome.elapsed});
                    break;
                case CallKind::Failure:
                    enqueue_locked(CallFailed{outcome.elapsed, error_or_unknown(outcome)});
                    break;
                case CallKind::Ignored:
                    enqueue_locked(CallIgnored{outcome.elapsed, error_or_unknown(outcome)});
                    break;
            }
        }

        switch (state_) {
            case CircuitState::Closed:
            case CircuitState::MetricsOnly:
                if (call.is_ignored() == false) {
                    closed_window_->record(call);
                    evaluate_closed_locked(state_ == CircuitState::Closed);
                }
                break;

            case CircuitState::HalfOpen:
                // Calls admitted before this half-open episode began do not
                // count towards its decision
                if (same_episode == false) {
                    break;
                }
                if (call.is_ignored()) {
                    if (half_open_permits_issued_ > 0) {
                        --half_open_permits_issued_;
                    }
                    break;
                }
                half_open_window_->record(call);
                evaluate_half_open_locked();
                break;

            case CircuitState::Open:
            case CircuitState::ForcedOpen:
            case CircuitState::Disabled:
                break;
        }
    }

    drain_events();
}

void CircuitBreaker::record_success(CallPermit&& permit, std::chrono::nanoseconds elapsed) {
    record_result(std::move(permit), CallOutcome::success(elapsed));
}

void CircuitBreaker::record_failure(CallPermit&& permit, std::chrono::nanoseconds elapsed, ErrorInfo error) {
    record_result(std::move(permit), CallOutcome::failure(elapsed, std::move(error)));
}

void CircuitBreaker::record_success(CallPermit&& permit) {
    const auto elapsed = clock_->now() - permit.issued_at();
    record_success(std::move(permit), elapsed);
}

void CircuitBreaker::record_failure(CallPermit&& permit, ErrorInfo error) {
    const auto elapsed = clock_->now() - permit.issued_at();
    record_failure(std::move(permit), elapsed, std::move(error));
}

void CircuitBreaker::release_permit(std::uint64_t epoch, CircuitState issued_in) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool same_episode = (epoch == epoch_) && (issued_in == CircuitState::HalfOpen);
    if (same_episode && state_ == CircuitState::HalfOpen && half_open_permits_issued_ > 0) {
        --half_open_permits_issued_;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Manual transitions
// ─────────────────────────────────────────────────────────────────────────────

void CircuitBreaker::close()        { manual_transition(CircuitState::Closed); }
void CircuitBreaker::open()         { manual_transition(CircuitState::Open); }
void CircuitBreaker::half_open()    { manual_transition(CircuitState::HalfOpen); }
void CircuitBreaker::force_open()   { manual_transition(CircuitState::ForcedOpen); }
void CircuitBreaker::disable()      { manual_transition(CircuitState::Disabled); }
void CircuitBreaker::metrics_only() { manual_transition(CircuitState::MetricsOnly); }

void CircuitBreaker::manual_transition(CircuitState to) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        transition_locked(to);
    }
    drain_events();
}

void CircuitBreaker::reset() {
    {
        std::lock_guard<std::mutex> lock(mutex_);

        timer_.cancel();
        timer_ = ScheduledTransition{};

        state_ = CircuitState::Closed;
        ++epoch_;
        closed_window_->reset();
        half_open_window_->reset();
        half_open_permits_issued_ = 0;
        not_permitted_calls_ = 0;
        frozen_metrics_.reset();
        failure_rate_reported_ = false;
        slow_call_rate_reported_ = false;

        enqueue_locked(BreakerReset{});
        CIRCUITRY_LOG_INFO(std::format("circuit breaker '{}' reset", name_));
    }
    drain_events();
}

// ─────────────────────────────────────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────────────────────────────────────

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

Metrics CircuitBreaker::metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);

    Metrics result;
    switch (state_) {
        case CircuitState::Closed:
        case CircuitState::MetricsOnly:
            result = masked(closed_window_->snapshot(), config_.effective_minimum_number_of_calls());
            break;
        case CircuitState::HalfOpen:
            result = masked(half_open_window_->snapshot(), config_.permitted_calls_in_half_open);
            break;
        case CircuitState::Open:
        case CircuitState::ForcedOpen:
        case CircuitState::Disabled:
            result = frozen_metrics_.value_or(Metrics{});
            break;
    }
    result.not_permitted_calls = not_permitted_calls_;
    return result;
}

bool CircuitBreaker::permitting_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = clock_->now();

    switch (state_) {
        case CircuitState::Closed:
        case CircuitState::Disabled:
        case CircuitState::MetricsOnly:
            return true;
        case CircuitState::ForcedOpen:
            return false;
        case CircuitState::Open:
            // The next permit_call() would move to a fresh HalfOpen
            return open_wait_elapsed_locked(now);
        case CircuitState::HalfOpen:
            return (half_open_expired_locked(now) == false) &&
                   (half_open_permits_issued_ < config_.permitted_calls_in_half_open);
    }
    return false;
}

// ─────────────────────────────────────────────────────────────────────────────
// State machine internals
// ─────────────────────────────────────────────────────────────────────────────

void CircuitBreaker::transition_locked(CircuitState to) {
    const auto from = state_;
    const auto now = clock_->now();

    if (records_into_closed_window(from) && (records_into_closed_window(to) == false)) {
        frozen_metrics_ = masked(closed_window_->snapshot(), config_.effective_minimum_number_of_calls());
    }

    timer_.cancel();
    timer_ = ScheduledTransition{};

    state_ = to;
    ++epoch_;
    not_permitted_calls_ = 0;
    failure_rate_reported_ = false;
    slow_call_rate_reported_ = false;
    half_open_permits_issued_ = 0;
    half_open_window_->reset();

    switch (to) {
        case CircuitState::Closed:
        case CircuitState::MetricsOnly:
            closed_window_->reset();
            frozen_metrics_.reset();
            break;

        case CircuitState::Open:
            opened_at_ = now;
            if (config_.automatic_transition_from_open_to_half_open) {
                arm_timer_locked(TimerPurpose::OpenToHalfOpen, config_.wait_duration_in_open);
            }
            break;

        case CircuitState::HalfOpen:
            half_open_entered_at_ = now;
            if (config_.max_wait_duration_in_half_open.count() > 0) {
                arm_timer_locked(TimerPurpose::HalfOpenTimeout, config_.max_wait_duration_in_half_open);
            }
            break;

        case CircuitState::ForcedOpen:
        case CircuitState::Disabled:
            break;
    }

    enqueue_locked(StateTransition{from, to});
    CIRCUITRY_LOG_INFO(std::format("circuit breaker '{}' changed state from {} to {}",
                                   name_, to_string(from), to_string(to)));
}

void CircuitBreaker::evaluate_closed_locked(bool may_transition) {
    const auto snapshot = closed_window_->snapshot();
    if (snapshot.total_calls < config_.effective_minimum_number_of_calls()) {
        return;
    }

    const bool failure_exceeded = snapshot.failure_rate >= config_.failure_rate_threshold;
    const bool slow_exceeded = snapshot.slow_call_rate >= config_.slow_call_rate_threshold;

    // MetricsOnly reports each threshold once per stay; Closed leaves on the
    // first breach so every breach is reported.
    const bool report_failure = failure_exceeded && (may_transition || (failure_rate_reported_ == false));
    const bool report_slow = slow_exceeded && (may_transition || (slow_call_rate_reported_ == false));

    if (report_failure) {
        failure_rate_reported_ = true;
        enqueue_locked(FailureRateExceeded{snapshot.failure_rate, config_.failure_rate_threshold});
        CIRCUITRY_LOG_WARN(std::format("circuit breaker '{}' failure rate {:.1f}% reached threshold {:.1f}%",
                                       name_, snapshot.failure_rate, config_.failure_rate_threshold));
    }
    if (report_slow) {
        slow_call_rate_reported_ = true;
        enqueue_locked(SlowCallRateExceeded{snapshot.slow_call_rate, config_.slow_call_rate_threshold});
        CIRCUITRY_LOG_WARN(std::format("circuit breaker '{}' slow call rate {:.1f}% reached threshold {:.1f}%",
                                       name_, snapshot.slow_call_rate, config_.slow_call_rate_threshold));
    }

    if (may_transition && (failure_exceeded || slow_exceeded)) {
        transition_locked(CircuitState::Open);
    }
}

void CircuitBreaker::evaluate_half_open_locked() {
    const auto snapshot = half_open_window_->snapshot();
    if (snapshot.total_calls < config_.permitted_calls_in_half_open) {
        return;
    }

    const bool failure_exceeded = snapshot.failure_rate >= config_.failure_rate_threshold;
    const bool slow_exceeded = snapshot.slow_call_rate >= config_.slow_call_rate_threshold;

    if (failure_exceeded) {
        enqueue_locked(FailureRateExceeded{snapshot.failure_rate, config_.failure_rate_threshold});
        CIRCUITRY_LOG_WARN(std::format("circuit breaker '{}' half-open failure rate {:.1f}% reached threshold {:.1f}%",
                                       name_, snapshot.failure_rate, config_.failure_rate_threshold));
    }
    if (slow_exceeded) {
        enqueue_locked(SlowCallRateExceeded{snapshot.slow_call_rate, config_.slow_call_rate_threshold});
        CIRCUITRY_LOG_WARN(std::format("circuit breaker '{}' half-open slow call rate {:.1f}% reached threshold {:.1f}%",
                                       name_, snapshot.slow_call_rate, config_.slow_call_rate_threshold));
    }

    transition_locked((failure_exceeded || slow_exceeded) ? CircuitState::Open : CircuitState::Closed);
}

bool CircuitBreaker::open_wait_elapsed_locked(IClock::TimePoint now) const {
    return (now - opened_at_) >= config_.wait_duration_in_open;
}

bool CircuitBreaker::half_open_expired_locked(IClock::TimePoint now) const {
    const auto limit = config_.max_wait_duration_in_half_open;
    return (limit.count() > 0) && ((now - half_open_entered_at_) >= limit);
}

CallRejected CircuitBreaker::reject_locked() {
    ++not_permitted_calls_;
    enqueue_locked(CallNotPermitted{state_});
    CIRCUITRY_LOG_TRACE(std::format("circuit breaker '{}' rejected a call while {}", name_, to_string(state_)));
    return CallRejected{name_, state_};
}

Metrics CircuitBreaker::masked(Metrics metrics, std::size_t minimum) const noexcept {
    if (metrics.total_calls < minimum) {
        metrics.failure_rate = Metrics::kNoRate;
        metrics.slow_call_rate = Metrics::kNoRate;
    }
    return metrics;
}

template <typename Payload>
void CircuitBreaker::enqueue_locked(Payload payload) {
    outbox_.push(BreakerEvent::make(name_, std::move(payload)));
}

// ─────────────────────────────────────────────────────────────────────────────
// Timers
// ─────────────────────────────────────────────────────────────────────────────

void CircuitBreaker::arm_timer_locked(TimerPurpose purpose, std::chrono::milliseconds delay) {
    if (!scheduler_) {
        return;
    }
    const auto epoch = epoch_;
    timer_ = scheduler_->schedule_after(delay, [target = timer_target_, epoch, purpose]() {
        std::lock_guard<std::mutex> lock(target->mutex);
        if (target->breaker != nullptr) {
            target->breaker->on_timer(epoch, purpose);
        }
    });
}

void CircuitBreaker::on_timer(std::uint64_t epoch, TimerPurpose purpose) {
    {
        std::lock_guard<std::mutex> lock(mutex_);

        // Any transition since arming bumps the epoch, so a stale timer
        // finds a mismatch and does nothing
        if (epoch != epoch_) {
            return;
        }

        switch (purpose) {
            case TimerPurpose::OpenToHalfOpen:
                if (state_ == CircuitState::Open) {
                    transition_locked(CircuitState::HalfOpen);
                }
                break;
            case TimerPurpose::HalfOpenTimeout:
                if (state_ == CircuitState::HalfOpen) {
                    CIRCUITRY_LOG_WARN(std::format(
                        "circuit breaker '{}' exceeded its half-open time limit", name_));
                    transition_locked(CircuitState::Open);
                }
                break;
        }
    }
    drain_events();
}

// ─────────────────────────────────────────────────────────────────────────────
// Event delivery
// ─────────────────────────────────────────────────────────────────────────────

void CircuitBreaker::drain_events() {
    outbox_.drain(events_);
}

}  // namespace circuitry
