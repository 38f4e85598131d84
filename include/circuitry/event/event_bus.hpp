#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Event Bus
// ═══════════════════════════════════════════════════════════════════════════
// Synchronous fan-out of events to filtered subscribers.
//
// Delivery contract: publish() never blocks on a subscriber. Each sink's
// offer() must return promptly; a sink that cannot take the event returns
// false and the event is dropped for that sink only. Callers that need to
// observe events from another thread should subscribe an EventQueue and
// poll it with a timeout rather than assume delivery.
//
// Usage:
//   auto queue = std::make_shared<EventQueue<BreakerEvent>>(64);
//   auto sub = breaker.events().subscribe(
//       queue, BreakerEventFilter::excluding({BreakerEventKind::Success}));
//   ...
//   auto event = queue->poll(std::chrono::milliseconds(100));

#include "circuitry/event/event_filter.hpp"
#include "circuitry/log/logger.hpp"

#include <atomic>
#include <cstdint>
#include <exception>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace circuitry {

// ─────────────────────────────────────────────────────────────────────────────
// IEventSink
// ─────────────────────────────────────────────────────────────────────────────

template <typename Event>
class IEventSink {
public:
    virtual ~IEventSink() = default;

    /// Non-blocking hand-off. Returns false if the event was dropped.
    virtual bool offer(const Event& event) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// Subscription - RAII registration handle
// ─────────────────────────────────────────────────────────────────────────────
// Unsubscribes on destruction. Safe to outlive the bus it came from.

class Subscription {
public:
    Subscription() = default;

    explicit Subscription(std::function<void()> cancel)
        : cancel_(std::move(cancel))
    {}

    ~Subscription() { unsubscribe(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept
        : cancel_(std::exchange(other.cancel_, nullptr))
    {}

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            unsubscribe();
            cancel_ = std::exchange(other.cancel_, nullptr);
        }
        return *this;
    }

    void unsubscribe() {
        if (cancel_) {
            auto cancel = std::exchange(cancel_, nullptr);
            cancel();
        }
    }

    [[nodiscard]] bool active() const noexcept { return static_cast<bool>(cancel_); }

private:
    std::function<void()> cancel_;
};

// ─────────────────────────────────────────────────────────────────────────────
// EventBus
// ─────────────────────────────────────────────────────────────────────────────

template <typename Event>
class EventBus {
public:
    using Kind = decltype(std::declval<const Event&>().kind());
    using Filter = EventFilter<Kind>;
    using Sink = IEventSink<Event>;
    using Callback = std::function<void(const Event&)>;

    EventBus() : state_(std::make_shared<State>()) {}

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Subscription
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] Subscription subscribe(std::shared_ptr<Sink> sink, Filter filter = {}) {
        if (!sink) {
            return Subscription{};
        }

        std::uint64_t id = 0;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            id = state_->next_id++;
            auto next = std::make_shared<Entries>(*state_->entries);
            next->push_back(Entry{id, std::move(filter), std::move(sink)});
            state_->entries = std::move(next);
        }

        std::weak_ptr<State> weak = state_;
        return Subscription([weak, id]() {
            if (auto state = weak.lock()) {
                remove(*state, id);
            }
        });
    }

    /// Callback subscriber. The callback runs on the publishing thread and
    /// must not block.
    [[nodiscard]] Subscription subscribe(Callback callback, Filter filter = {}) {
        return subscribe(std::make_shared<CallbackSink>(std::move(callback)), std::move(filter));
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Publishing
    // ─────────────────────────────────────────────────────────────────────────

    /// Offer the event to every matching sink; returns how many accepted it.
    std::size_t publish(const Event& event) {
        std::shared_ptr<const Entries> entries;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            entries = state_->entries;
        }

        const auto kind = event.kind();
        std::size_t delivered = 0;

        for (const auto& entry : *entries) {
            if (entry.filter.accepts(kind) == false) {
                continue;
            }
            if (offer_to(entry, event)) {
                ++delivered;
            } else {
                dropped_.fetch_add(1, std::memory_order_relaxed);
                CIRCUITRY_LOG_DEBUG(std::format("event {} dropped by subscriber {}", to_string(kind), entry.id));
            }
        }
        return delivered;
    }

    [[nodiscard]] std::size_t subscriber_count() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->entries->size();
    }

    /// Events refused by full sinks since construction
    [[nodiscard]] std::size_t dropped() const noexcept {
        return dropped_.load(std::memory_order_relaxed);
    }

private:
    struct Entry {
        std::uint64_t id;
        Filter filter;
        std::shared_ptr<Sink> sink;
    };

    using Entries = std::vector<Entry>;

    // Held by shared_ptr so Subscription handles can detect a dead bus
    struct State {
        std::mutex mutex;
        std::uint64_t next_id{1};
        std::shared_ptr<const Entries> entries{std::make_shared<const Entries>()};
    };

    class CallbackSink final : public Sink {
    public:
        explicit CallbackSink(Callback callback) : callback_(std::move(callback)) {}

        bool offer(const Event& event) override {
            // One misbehaving subscriber must not stop delivery to the rest
            try {
                callback_(event);
            } catch (const std::exception& e) {
                CIRCUITRY_LOG_ERROR(std::format("event subscriber threw: {}", e.what()));
            } catch (...) {
                CIRCUITRY_LOG_ERROR("event subscriber threw a non-standard exception");
            }
            return true;
        }

    private:
        Callback callback_;
    };

    // A sink that throws has not taken the event; it counts as a drop
    static bool offer_to(const Entry& entry, const Event& event) {
        try {
            return entry.sink->offer(event);
        } catch (const std::exception& e) {
            CIRCUITRY_LOG_ERROR(std::format("event sink {} threw: {}", entry.id, e.what()));
        } catch (...) {
            CIRCUITRY_LOG_ERROR(std::format("event sink {} threw a non-standard exception", entry.id));
        }
        return false;
    }

    static void remove(State& state, std::uint64_t id) {
        std::lock_guard<std::mutex> lock(state.mutex);
        auto next = std::make_shared<Entries>();
        next->reserve(state.entries->size());
        for (const auto& entry : *state.entries) {
            if (entry.id != id) {
                next->push_back(entry);
            }
        }
        state.entries = std::move(next);
    }

    std::shared_ptr<State> state_;
    std::atomic<std::size_t> dropped_{0};
};

}  // namespace circuitry
