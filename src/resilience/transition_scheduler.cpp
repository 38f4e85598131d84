#include "circuitry/resilience/transition_scheduler.hpp"

#include "circuitry/log/logger.hpp"

#include <asio/error.hpp>
#include <asio/post.hpp>

#include <exception>
#include <format>

namespace circuitry {

// ─────────────────────────────────────────────────────────────────────────────
// ScheduledTransition
// ─────────────────────────────────────────────────────────────────────────────

void ScheduledTransition::cancel() noexcept {
    if (!state_) {
        return;
    }
    if (state_->cancelled.exchange(true)) {
        return;
    }

    // The timer is only touched on the scheduler thread
    auto state = state_;
    asio::post(state->io, [state]() {
        state->timer.cancel();
    });
}

bool ScheduledTransition::pending() const noexcept {
    if (!state_) {
        return false;
    }
    const bool cancelled = state_->cancelled.load();
    const bool done = state_->done.load();
    return (cancelled == false) && (done == false);
}

// ─────────────────────────────────────────────────────────────────────────────
// TransitionScheduler
// ─────────────────────────────────────────────────────────────────────────────

TransitionScheduler::TransitionScheduler() {
    start();
}

TransitionScheduler::~TransitionScheduler() {
    stop();
}

void TransitionScheduler::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_.exchange(true)) {
        return;
    }

    work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
        io_.get_executor()
    );
    io_.restart();
    io_thread_ = std::thread([this]() { io_.run(); });
}

void TransitionScheduler::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_.exchange(false) == false) {
        return;
    }

    if (work_guard_) {
        work_guard_->reset();
        work_guard_.reset();
    }
    io_.stop();

    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

bool TransitionScheduler::running_in_this_thread() noexcept {
    return io_.get_executor().running_in_this_thread();
}

ScheduledTransition TransitionScheduler::schedule_after(
    std::chrono::steady_clock::duration delay,
    std::function<void()> callback
) {
    if (running_.load() == false) {
        CIRCUITRY_LOG_WARN("transition scheduler is stopped; timed transition not scheduled");
        return ScheduledTransition{};
    }

    auto state = std::make_shared<ScheduledTransition::State>(io_);
    state->timer.expires_after(delay);
    state->timer.async_wait([state, callback = std::move(callback)](const asio::error_code& ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }

        if (state->cancelled.load()) {
            return;
        }
        state->done = true;

        // An exception escaping here would stop the io thread for everyone
        try {
            callback();
        } catch (const std::exception& e) {
            CIRCUITRY_LOG_ERROR(std::format("scheduled transition failed: {}", e.what()));
        }
    });

    return ScheduledTransition(std::move(state));
}

}  // namespace circuitry
