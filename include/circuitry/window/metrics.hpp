#pragma once

#include <cstddef>

namespace circuitry {

// ─────────────────────────────────────────────────────────────────────────────
// Metrics - point-in-time snapshot of a window
// ─────────────────────────────────────────────────────────────────────────────
// Rates are percentages. -1 means "not meaningful yet": the window is empty
// or, when read through a breaker, holds fewer calls than the state needs.

struct Metrics {
    static constexpr float kNoRate = -1.0f;

    std::size_t total_calls{0};
    std::size_t failed_calls{0};
    std::size_t slow_calls{0};
    std::size_t slow_failed_calls{0};
    std::size_t not_permitted_calls{0};  ///< Rejections since the last transition
    float failure_rate{kNoRate};
    float slow_call_rate{kNoRate};

    [[nodiscard]] std::size_t successful_calls() const noexcept {
        return total_calls - failed_calls;
    }

    [[nodiscard]] std::size_t slow_successful_calls() const noexcept {
        return slow_calls - slow_failed_calls;
    }

    [[nodiscard]] static Metrics from_counts(std::size_t total,
                                             std::size_t failed,
                                             std::size_t slow,
                                             std::size_t slow_failed) noexcept {
        Metrics m;
        m.total_calls = total;
        m.failed_calls = failed;
        m.slow_calls = slow;
        m.slow_failed_calls = slow_failed;
        if (total > 0) {
            m.failure_rate = 100.0f * static_cast<float>(failed) / static_cast<float>(total);
            m.slow_call_rate = 100.0f * static_cast<float>(slow) / static_cast<float>(total);
        }
        return m;
    }
};

}  // namespace circuitry
