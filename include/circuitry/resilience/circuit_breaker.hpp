#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Circuit Breaker
// ═══════════════════════════════════════════════════════════════════════════
// Gates calls to one target through a state machine driven by the failure
// and slow-call rates of a sliding window.
//
//   CLOSED ──rate >= threshold──▶ OPEN ──wait_duration──▶ HALF_OPEN
//     ▲                                                    │
//     └────────── probe calls below thresholds ────────────┤
//                                                          │
//                 probe calls at/above a threshold ────────┴──▶ OPEN
//
// Usage:
//   CircuitBreaker breaker("inventory", CircuitBreakerConfig{}
//       .with_failure_rate_threshold(25)
//       .with_sliding_window(20));
//
//   auto permit = breaker.permit_call();
//   if (!permit) {
//       return fallback(permit.error());   // CallRejected
//   }
//   try {
//       auto stock = fetch_stock();
//       breaker.record_success(std::move(*permit));
//       return stock;
//   } catch (...) {
//       breaker.record_failure(std::move(*permit),
//                              ErrorInfo::from_exception(std::current_exception()));
//       throw;
//   }
//
// execute()/try_execute() in execute.hpp wrap exactly this sequence.
//
// Threading: every public member is safe to call concurrently. One mutex
// guards state, windows and counters; events are delivered after it is
// released, in the order the changes were committed.

#include "circuitry/core/call_outcome.hpp"
#include "circuitry/core/circuit_state.hpp"
#include "circuitry/core/clock.hpp"
#include "circuitry/core/config.hpp"
#include "circuitry/core/errors.hpp"
#include "circuitry/event/breaker_event.hpp"
#include "circuitry/event/event_outbox.hpp"
#include "circuitry/resilience/call_permit.hpp"
#include "circuitry/resilience/transition_scheduler.hpp"
#include "circuitry/window/metrics.hpp"
#include "circuitry/window/outcome_window.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace circuitry {

using PermitResult = tl::expected<CallPermit, CallRejected>;

class CircuitBreaker {
public:
    /// Throws ConfigurationError for an empty name or an invalid config.
    /// A scheduler is created on demand when the config needs timed
    /// transitions and none is supplied.
    CircuitBreaker(std::string name,
                   CircuitBreakerConfig config,
                   std::shared_ptr<const IClock> clock = nullptr,
                   std::shared_ptr<TransitionScheduler> scheduler = nullptr);

    // Non-copyable, non-movable: permits and timers point at this object
    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;
    CircuitBreaker(CircuitBreaker&&) = delete;
    CircuitBreaker& operator=(CircuitBreaker&&) = delete;

    ~CircuitBreaker();

    // ─────────────────────────────────────────────────────────────────────────
    // Call gating
    // ─────────────────────────────────────────────────────────────────────────

    /// Admit or reject one call. A rejection is published as not-permitted.
    [[nodiscard]] PermitResult permit_call();

    /// Report the outcome of an admitted call. Throws ProtocolViolation if
    /// the permit is empty, already used, or belongs to another breaker.
    void record_result(CallPermit&& permit, const CallOutcome& outcome);

    void record_success(CallPermit&& permit, std::chrono::nanoseconds elapsed);
    void record_failure(CallPermit&& permit, std::chrono::nanoseconds elapsed, ErrorInfo error);

    /// Elapsed time measured from when the permit was issued
    void record_success(CallPermit&& permit);
    void record_failure(CallPermit&& permit, ErrorInfo error);

    // ─────────────────────────────────────────────────────────────────────────
    // Manual transitions
    // ─────────────────────────────────────────────────────────────────────────
    // Unconditional; each publishes a state-transition, even if the state
    // does not change.

    void close();
    void open();
    void half_open();
    void force_open();
    void disable();
    void metrics_only();

    /// Back to Closed with empty windows; publishes reset, not state-transition
    void reset();

    // ─────────────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] CircuitState state() const;
    [[nodiscard]] Metrics metrics() const;

    /// Whether permit_call() would admit a call right now. No side effects.
    [[nodiscard]] bool permitting_calls() const;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }
    [[nodiscard]] const std::shared_ptr<const IClock>& clock() const noexcept { return clock_; }

    [[nodiscard]] BreakerEventBus& events() noexcept { return events_; }

private:
    friend class CallPermit;

    enum class TimerPurpose {
        OpenToHalfOpen,
        HalfOpenTimeout
    };

    // Everything below with a _locked suffix expects mutex_ to be held

    void transition_locked(CircuitState to);
    void evaluate_closed_locked(bool may_transition);
    void evaluate_half_open_locked();
    [[nodiscard]] bool open_wait_elapsed_locked(IClock::TimePoint now) const;
    [[nodiscard]] bool half_open_expired_locked(IClock::TimePoint now) const;
    [[nodiscard]] CallRejected reject_locked();
    void arm_timer_locked(TimerPurpose purpose, std::chrono::milliseconds delay);
    [[nodiscard]] Metrics masked(Metrics metrics, std::size_t minimum) const noexcept;

    template <typename Payload>
    void enqueue_locked(Payload payload);

    void manual_transition(CircuitState to);
    void release_permit(std::uint64_t epoch, CircuitState issued_in) noexcept;
    void on_timer(std::uint64_t epoch, TimerPurpose purpose);

    /// Deliver queued events; a no-op if another thread is already delivering
    void drain_events();

    const std::string name_;
    const CircuitBreakerConfig config_;
    const std::shared_ptr<const IClock> clock_;
    std::shared_ptr<TransitionScheduler> scheduler_;

    mutable std::mutex mutex_;
    CircuitState state_{CircuitState::Closed};
    std::uint64_t epoch_{0};
    std::unique_ptr<IOutcomeWindow> closed_window_;
    std::unique_ptr<IOutcomeWindow> half_open_window_;
    std::size_t half_open_permits_issued_{0};
    std::size_t not_permitted_calls_{0};
    IClock::TimePoint opened_at_{};
    IClock::TimePoint half_open_entered_at_{};
    std::optional<Metrics> frozen_metrics_;
    bool failure_rate_reported_{false};
    bool slow_call_rate_reported_{false};
    ScheduledTransition timer_;

    // Timer callbacks reach the breaker only through this; the destructor
    // clears `breaker` under `mutex`, which waits out a running callback.
    struct TimerTarget {
        std::mutex mutex;
        CircuitBreaker* breaker{nullptr};
    };
    std::shared_ptr<TimerTarget> timer_target_;

    EventOutbox<BreakerEvent> outbox_;

    BreakerEventBus events_;
};

}  // namespace circuitry
