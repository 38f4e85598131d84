#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Outcome Windows
// ═══════════════════════════════════════════════════════════════════════════
// Aggregate recent call outcomes into counts. Both variants keep running sums
// so record() and snapshot() never rescan the window.
//
//   CountBasedWindow - ring buffer of the last N calls
//   TimeBasedWindow  - ring of N one-second buckets, expired lazily
//
// Windows are not synchronised; the owning breaker serialises access.

#include "circuitry/core/call_outcome.hpp"
#include "circuitry/core/clock.hpp"
#include "circuitry/core/config.hpp"
#include "circuitry/window/metrics.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace circuitry {

class IOutcomeWindow {
public:
    virtual ~IOutcomeWindow() = default;

    /// Insert one call; ignored calls are dropped.
    virtual void record(const ClassifiedCall& call) = 0;

    /// Non-const: time-based windows expire old buckets on read.
    [[nodiscard]] virtual Metrics snapshot() = 0;

    virtual void reset() = 0;

    /// Configured size (calls or seconds)
    [[nodiscard]] virtual std::size_t size() const noexcept = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// CountBasedWindow
// ─────────────────────────────────────────────────────────────────────────────

class CountBasedWindow final : public IOutcomeWindow {
public:
    explicit CountBasedWindow(std::size_t size);

    void record(const ClassifiedCall& call) override;
    [[nodiscard]] Metrics snapshot() override;
    void reset() override;
    [[nodiscard]] std::size_t size() const noexcept override { return slots_.size(); }

private:
    struct Slot {
        bool failed{false};
        bool slow{false};
    };

    void add(const Slot& slot, int sign) noexcept;

    std::vector<Slot> slots_;
    std::size_t cursor_{0};
    std::size_t filled_{0};

    std::size_t failed_{0};
    std::size_t slow_{0};
    std::size_t slow_failed_{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// TimeBasedWindow
// ─────────────────────────────────────────────────────────────────────────────

class TimeBasedWindow final : public IOutcomeWindow {
public:
    TimeBasedWindow(std::size_t seconds, std::shared_ptr<const IClock> clock);

    void record(const ClassifiedCall& call) override;
    [[nodiscard]] Metrics snapshot() override;
    void reset() override;
    [[nodiscard]] std::size_t size() const noexcept override { return buckets_.size(); }

private:
    struct Bucket {
        std::size_t total{0};
        std::size_t failed{0};
        std::size_t slow{0};
        std::size_t slow_failed{0};
    };

    /// Move the head to the current second, clearing buckets that fell out
    void advance();

    std::vector<Bucket> buckets_;
    std::shared_ptr<const IClock> clock_;
    std::size_t head_{0};
    std::optional<std::int64_t> head_second_;

    Bucket sums_;
};

/// Build the window variant a config asks for
[[nodiscard]] std::unique_ptr<IOutcomeWindow> make_outcome_window(
    SlidingWindowType type,
    std::size_t size,
    std::shared_ptr<const IClock> clock
);

}  // namespace circuitry
