#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transition Scheduler
// ═══════════════════════════════════════════════════════════════════════════
// One background asio thread that fires delayed callbacks. Breakers use it
// for Open -> HalfOpen automatic transitions and for the HalfOpen time limit.
// A registry shares one scheduler among all of its breakers.
//
// cancel() never blocks and is safe under any lock, including from the
// scheduler thread. It cannot stop a callback that has already started;
// callers that need that guarantee synchronise inside the callback.

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace circuitry {

class TransitionScheduler;

// ─────────────────────────────────────────────────────────────────────────────
// ScheduledTransition - handle to one pending callback
// ─────────────────────────────────────────────────────────────────────────────
// Dropping the handle does not cancel the callback.

class ScheduledTransition {
public:
    ScheduledTransition() = default;

    void cancel() noexcept;

    /// True until the callback has run or been cancelled
    [[nodiscard]] bool pending() const noexcept;

    [[nodiscard]] explicit operator bool() const noexcept { return static_cast<bool>(state_); }

private:
    friend class TransitionScheduler;

    struct State {
        explicit State(asio::io_context& context) : io(context), timer(context) {}

        asio::io_context& io;
        asio::steady_timer timer;
        std::atomic<bool> cancelled{false};
        std::atomic<bool> done{false};
    };

    explicit ScheduledTransition(std::shared_ptr<State> state) : state_(std::move(state)) {}

    std::shared_ptr<State> state_;
};

// ─────────────────────────────────────────────────────────────────────────────
// TransitionScheduler
// ─────────────────────────────────────────────────────────────────────────────

class TransitionScheduler {
public:
    /// Starts the background thread
    TransitionScheduler();
    ~TransitionScheduler();

    TransitionScheduler(const TransitionScheduler&) = delete;
    TransitionScheduler& operator=(const TransitionScheduler&) = delete;

    void start();

    /// Stops the thread; callbacks that have not fired are discarded
    void stop();

    [[nodiscard]] bool running() const noexcept { return running_.load(); }

    /// Run `callback` on the scheduler thread after `delay`. Returns an empty
    /// handle if the scheduler is stopped.
    [[nodiscard]] ScheduledTransition schedule_after(
        std::chrono::steady_clock::duration delay,
        std::function<void()> callback
    );

    /// True when called from the scheduler thread
    [[nodiscard]] bool running_in_this_thread() noexcept;

private:
    asio::io_context io_;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
    std::thread io_thread_;
    std::atomic<bool> running_{false};
    std::mutex lifecycle_mutex_;
};

}  // namespace circuitry
