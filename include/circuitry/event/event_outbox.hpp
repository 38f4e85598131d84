#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Event Outbox
// ═══════════════════════════════════════════════════════════════════════════
// Ordered hand-off from a state lock to an EventBus.
//
// Owners push() while holding their own state lock, so the outbox order is
// the commit order. After releasing that lock they call drain(). Only one
// thread drains at a time; a thread that finds a drain in progress returns
// at once and the active drainer delivers its events too. Subscribers may
// therefore call back into the owner from inside delivery.
//
// Lock order: owner state lock, then the outbox lock. drain() holds neither
// while publishing.

#include <cstddef>
#include <mutex>
#include <utility>
#include <vector>

namespace circuitry {

template <typename Event>
class EventOutbox {
public:
    EventOutbox() = default;

    EventOutbox(const EventOutbox&) = delete;
    EventOutbox& operator=(const EventOutbox&) = delete;

    void push(Event event) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push_back(std::move(event));
    }

    /// Publish everything pending to `bus`, in push order
    template <typename Bus>
    void drain(Bus& bus) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (draining_) {
            return;
        }
        draining_ = true;
        DrainingFlag flag(lock, draining_);

        while (pending_.empty() == false) {
            std::vector<Event> batch;
            batch.swap(pending_);
            lock.unlock();

            for (const auto& event : batch) {
                bus.publish(event);
            }

            lock.lock();
        }
    }

    [[nodiscard]] std::size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

private:
    // Clears the flag however the drain loop exits, so an escaping
    // exception cannot stop delivery for good
    class DrainingFlag {
    public:
        DrainingFlag(std::unique_lock<std::mutex>& lock, bool& draining) noexcept
            : lock_(lock), draining_(draining) {}

        ~DrainingFlag() {
            if (lock_.owns_lock() == false) {
                lock_.lock();
            }
            draining_ = false;
        }

        DrainingFlag(const DrainingFlag&) = delete;
        DrainingFlag& operator=(const DrainingFlag&) = delete;

    private:
        std::unique_lock<std::mutex>& lock_;
        bool& draining_;
    };

    mutable std::mutex mutex_;
    std::vector<Event> pending_;
    bool draining_{false};
};

}  // namespace circuitry
