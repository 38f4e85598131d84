#pragma once

#include "circuitry/event/event_bus.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

namespace circuitry {

// ─────────────────────────────────────────────────────────────────────────────
// EventQueue - bounded, drop-on-full sink
// ─────────────────────────────────────────────────────────────────────────────
// Hands events from the publishing thread to a consumer thread. When the
// queue is at capacity, offer() drops the new event and returns false; the
// publisher is never made to wait.

template <typename Event>
class EventQueue final : public IEventSink<Event> {
public:
    explicit EventQueue(std::size_t capacity = 1024)
        : capacity_(capacity)
    {
        if (capacity == 0) {
            throw std::invalid_argument("EventQueue: capacity must be at least 1");
        }
    }

    bool offer(const Event& event) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.size() >= capacity_) {
                ++dropped_;
                return false;
            }
            queue_.push_back(event);
        }
        cv_.notify_one();
        return true;
    }

    /// Wait up to `timeout` for the next event
    [[nodiscard]] std::optional<Event> poll(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);

        const bool got_event = cv_.wait_for(lock, timeout, [this]() {
            return queue_.empty() == false;
        });
        if (got_event == false) {
            return std::nullopt;
        }

        Event event = std::move(queue_.front());
        queue_.pop_front();
        return event;
    }

    [[nodiscard]] std::optional<Event> try_poll() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        Event event = std::move(queue_.front());
        queue_.pop_front();
        return event;
    }

    /// Take everything currently queued
    [[nodiscard]] std::vector<Event> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Event> events(std::make_move_iterator(queue_.begin()),
                                  std::make_move_iterator(queue_.end()));
        queue_.clear();
        return events;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    [[nodiscard]] std::size_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

private:
    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> queue_;
    std::size_t dropped_{0};
};

}  // namespace circuitry
