#include "circuitry/window/outcome_window.hpp"

#include <algorithm>
#include <stdexcept>

namespace circuitry {

namespace {

std::int64_t whole_seconds(IClock::TimePoint tp) {
    return std::chrono::floor<std::chrono::seconds>(tp.time_since_epoch()).count();
}

}  // namespace

TimeBasedWindow::TimeBasedWindow(std::size_t seconds, std::shared_ptr<const IClock> clock)
    : buckets_(seconds)
    , clock_(clock ? std::move(clock) : default_clock())
{
    if (seconds == 0) {
        throw std::invalid_argument("TimeBasedWindow: size must be at least 1 second");
    }
}

void TimeBasedWindow::record(const ClassifiedCall& call) {
    if (call.is_ignored()) {
        return;
    }

    advance();

    auto& bucket = buckets_[head_];
    const bool failed = call.is_failure();
    const bool both = failed && call.slow;

    ++bucket.total;
    ++sums_.total;
    if (failed) {
        ++bucket.failed;
        ++sums_.failed;
    }
    if (call.slow) {
        ++bucket.slow;
        ++sums_.slow;
    }
    if (both) {
        ++bucket.slow_failed;
        ++sums_.slow_failed;
    }
}

Metrics TimeBasedWindow::snapshot() {
    advance();
    return Metrics::from_counts(sums_.total, sums_.failed, sums_.slow, sums_.slow_failed);
}

void TimeBasedWindow::reset() {
    std::fill(buckets_.begin(), buckets_.end(), Bucket{});
    head_ = 0;
    head_second_.reset();
    sums_ = Bucket{};
}

void TimeBasedWindow::advance() {
    const auto now = whole_seconds(clock_->now());

    if (!head_second_) {
        head_second_ = now;
        return;
    }
    if (now <= *head_second_) {
        return;
    }

    // Every bucket between the old head and now is stale; more than one lap
    // simply clears the whole ring.
    const auto elapsed = static_cast<std::size_t>(now - *head_second_);
    const auto steps = std::min(elapsed, buckets_.size());

    for (std::size_t i = 1; i <= steps; ++i) {
        auto& bucket = buckets_[(head_ + i) % buckets_.size()];
        sums_.total -= bucket.total;
        sums_.failed -= bucket.failed;
        sums_.slow -= bucket.slow;
        sums_.slow_failed -= bucket.slow_failed;
        bucket = Bucket{};
    }

    head_ = (head_ + steps) % buckets_.size();
    head_second_ = now;
}

}  // namespace circuitry
