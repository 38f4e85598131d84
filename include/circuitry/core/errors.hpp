#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Error Types
// ═══════════════════════════════════════════════════════════════════════════
// Expected outcomes (rejections, bad config values) travel as values inside
// tl::expected; misuse of the API throws.
//
//   ConfigError           value   - first invalid option found by validate()
//   ConfigurationError    throws  - breaker/registry built from a bad config
//   CallRejected          value   - permit_call() refused by current state
//   CallNotPermittedError throws  - execute() refused by current state
//   ProtocolViolation     throws  - result recorded with an invalid permit

#include "circuitry/core/circuit_state.hpp"

#include <tl/expected.hpp>

#include <format>
#include <stdexcept>
#include <string>

namespace circuitry {

// ─────────────────────────────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────────────────────────────

struct ConfigError {
    std::string field;     ///< Option name, e.g. "failure_rate_threshold"
    std::string message;

    [[nodiscard]] static ConfigError out_of_range(std::string field, std::string_view requirement) {
        auto message = std::format("{} must be {}", field, requirement);
        return {std::move(field), std::move(message)};
    }

    [[nodiscard]] static ConfigError wrong_type(std::string field, std::string_view expected) {
        auto message = std::format("{} must be a {}", field, expected);
        return {std::move(field), std::move(message)};
    }

    [[nodiscard]] std::string to_string() const {
        return std::format("invalid configuration: {}", message);
    }
};

template <typename T>
using ConfigResult = tl::expected<T, ConfigError>;

class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const ConfigError& error)
        : std::invalid_argument(error.to_string())
        , field_(error.field)
    {}

    explicit ConfigurationError(const std::string& message)
        : std::invalid_argument(message)
    {}

    /// Offending option, empty when the error is not about a single field
    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Call gating
// ─────────────────────────────────────────────────────────────────────────────

struct CallRejected {
    std::string breaker_name;
    CircuitState state;  ///< State that refused the call

    [[nodiscard]] std::string to_string() const {
        return std::format("circuit breaker '{}' is {} and does not permit further calls",
                           breaker_name, circuitry::to_string(state));
    }
};

/// Raised by execute() so callers can tell a refusal apart from the
/// protected operation's own exceptions.
class CallNotPermittedError : public std::runtime_error {
public:
    explicit CallNotPermittedError(CallRejected rejection)
        : std::runtime_error(rejection.to_string())
        , rejection_(std::move(rejection))
    {}

    [[nodiscard]] const std::string& breaker_name() const noexcept { return rejection_.breaker_name; }
    [[nodiscard]] CircuitState state() const noexcept { return rejection_.state; }
    [[nodiscard]] const CallRejected& rejection() const noexcept { return rejection_; }

private:
    CallRejected rejection_;
};

class ProtocolViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

}  // namespace circuitry
