#include "circuitry/window/outcome_window.hpp"

#include <algorithm>
#include <stdexcept>

namespace circuitry {

CountBasedWindow::CountBasedWindow(std::size_t size)
    : slots_(size)
{
    if (size == 0) {
        throw std::invalid_argument("CountBasedWindow: size must be at least 1");
    }
}

void CountBasedWindow::record(const ClassifiedCall& call) {
    if (call.is_ignored()) {
        return;
    }

    // Full ring: the slot under the cursor is the oldest call; evict it
    if (filled_ == slots_.size()) {
        add(slots_[cursor_], -1);
    } else {
        ++filled_;
    }

    slots_[cursor_] = Slot{call.is_failure(), call.slow};
    add(slots_[cursor_], +1);
    cursor_ = (cursor_ + 1) % slots_.size();
}

Metrics CountBasedWindow::snapshot() {
    return Metrics::from_counts(filled_, failed_, slow_, slow_failed_);
}

void CountBasedWindow::reset() {
    std::fill(slots_.begin(), slots_.end(), Slot{});
    cursor_ = 0;
    filled_ = 0;
    failed_ = 0;
    slow_ = 0;
    slow_failed_ = 0;
}

void CountBasedWindow::add(const Slot& slot, int sign) noexcept {
    const auto apply = [sign](std::size_t& counter) {
        counter = sign > 0 ? counter + 1 : counter - 1;
    };
    if (slot.failed) {
        apply(failed_);
    }
    if (slot.slow) {
        apply(slow_);
    }
    if (slot.failed && slot.slow) {
        apply(slow_failed_);
    }
}

}  // namespace circuitry
