#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Protected Calls
// ═══════════════════════════════════════════════════════════════════════════
// Run a callable under a breaker: acquire a permit, time the call with the
// breaker's clock, record the outcome.
//
//   try_execute - a rejection comes back as tl::unexpected(CallRejected)
//   execute     - a rejection throws CallNotPermittedError
//
// Exceptions thrown by the callable are recorded (and classified by the
// breaker's config) and then rethrown unchanged.
//
// Usage:
//   auto stock = try_execute(breaker, [&] { return inventory.lookup(sku); });
//   if (!stock) {
//       return cached_stock(sku);
//   }

#include "circuitry/core/call_outcome.hpp"
#include "circuitry/core/errors.hpp"
#include "circuitry/resilience/circuit_breaker.hpp"

#include <tl/expected.hpp>

#include <exception>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

namespace circuitry {

template <typename T>
using ExecuteResult = tl::expected<T, CallRejected>;

/// Value type produced by a protected callable; references are returned by value
template <typename Fn>
using call_result_t = std::decay_t<std::invoke_result_t<Fn&>>;

template <typename Fn>
[[nodiscard]] auto try_execute(CircuitBreaker& breaker, Fn&& fn)
    -> ExecuteResult<call_result_t<Fn>>
{
    using R = call_result_t<Fn>;

    auto permit = breaker.permit_call();
    if (!permit) {
        return tl::unexpected(std::move(permit.error()));
    }

    const auto& clock = *breaker.clock();
    const auto started = clock.now();

    if constexpr (std::is_void_v<R>) {
        try {
            std::invoke(fn);
        } catch (...) {
            breaker.record_failure(std::move(*permit), clock.now() - started,
                                   ErrorInfo::from_exception(std::current_exception()));
            throw;
        }
        breaker.record_success(std::move(*permit), clock.now() - started);
        return {};
    } else {
        std::optional<R> value;
        try {
            value.emplace(std::invoke(fn));
        } catch (...) {
            breaker.record_failure(std::move(*permit), clock.now() - started,
                                   ErrorInfo::from_exception(std::current_exception()));
            throw;
        }
        // Recorded outside the try so a throwing subscriber is not mistaken
        // for a failure of the call itself
        breaker.record_success(std::move(*permit), clock.now() - started);
        return std::move(*value);
    }
}

template <typename Fn>
auto execute(CircuitBreaker& breaker, Fn&& fn) -> call_result_t<Fn> {
    auto result = try_execute(breaker, std::forward<Fn>(fn));
    if (!result) {
        throw CallNotPermittedError(std::move(result.error()));
    }
    if constexpr (std::is_void_v<call_result_t<Fn>>) {
        return;
    } else {
        return std::move(*result);
    }
}

}  // namespace circuitry
