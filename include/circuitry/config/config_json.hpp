#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// JSON Configuration
// ═══════════════════════════════════════════════════════════════════════════
// Snake-case keys mirror CircuitBreakerConfig; durations are integer
// milliseconds with an _ms suffix. Absent keys keep their defaults, unknown
// keys are logged at debug level and skipped.
//
//   {
//     "failure_rate_threshold": 50,
//     "slow_call_rate_threshold": 100,
//     "slow_call_duration_threshold_ms": 60000,
//     "permitted_calls_in_half_open": 10,
//     "sliding_window_type": "count_based",        // or "time_based"
//     "sliding_window_size": 100,
//     "minimum_number_of_calls": 10,
//     "wait_duration_in_open_ms": 60000,
//     "automatic_transition_from_open_to_half_open": false,
//     "max_wait_duration_in_half_open_ms": 0
//   }
//
// The error classifier cannot be expressed in JSON; attach one to the
// parsed config in code.

#include "circuitry/core/config.hpp"
#include "circuitry/core/errors.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <string_view>

namespace circuitry {

using Json = nlohmann::json;

using NamedConfigs = std::map<std::string, CircuitBreakerConfig>;

/// Parse and validate one configuration object
[[nodiscard]] ConfigResult<CircuitBreakerConfig> config_from_json(const Json& json);

/// Parse JSON text; malformed text is reported as a ConfigError
[[nodiscard]] ConfigResult<CircuitBreakerConfig> config_from_json_string(std::string_view text);

/// Parse {"name": {...}, ...} into configurations for a registry. Error
/// fields are prefixed with the entry name, e.g. "payments.sliding_window_size".
[[nodiscard]] ConfigResult<NamedConfigs> configs_from_json(const Json& json);

/// Inverse of config_from_json (the classifier is not serialised)
[[nodiscard]] Json config_to_json(const CircuitBreakerConfig& config);

}  // namespace circuitry
