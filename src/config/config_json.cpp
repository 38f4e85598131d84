#include "circuitry/config/config_json.hpp"

#include "circuitry/log/logger.hpp"

#include <array>
#include <cstdint>
#include <format>

namespace circuitry {

namespace {

constexpr std::array<std::string_view, 10> kKnownKeys{
    "failure_rate_threshold",
    "slow_call_rate_threshold",
    "slow_call_duration_threshold_ms",
    "permitted_calls_in_half_open",
    "sliding_window_type",
    "sliding_window_size",
    "minimum_number_of_calls",
    "wait_duration_in_open_ms",
    "automatic_transition_from_open_to_half_open",
    "max_wait_duration_in_half_open_ms",
};

bool is_known_key(std::string_view key) {
    for (const auto known : kKnownKeys) {
        if (known == key) {
            return true;
        }
    }
    return false;
}

// Each reader leaves `out` untouched when the key is absent

ConfigResult<void> read_percentage(const Json& json, const char* key, float& out) {
    const auto it = json.find(key);
    if (it == json.end()) {
        return {};
    }
    if (it->is_number() == false) {
        return tl::unexpected(ConfigError::wrong_type(key, "number"));
    }
    out = it->get<float>();
    return {};
}

ConfigResult<void> read_count(const Json& json, const char* key, std::size_t& out) {
    const auto it = json.find(key);
    if (it == json.end()) {
        return {};
    }
    if (it->is_number_integer() == false) {
        return tl::unexpected(ConfigError::wrong_type(key, "whole number"));
    }
    const auto value = it->get<std::int64_t>();
    if (value < 1) {
        return tl::unexpected(ConfigError::out_of_range(key, "at least 1"));
    }
    out = static_cast<std::size_t>(value);
    return {};
}

ConfigResult<void> read_millis(const Json& json, const char* key, std::chrono::milliseconds& out) {
    const auto it = json.find(key);
    if (it == json.end()) {
        return {};
    }
    if (it->is_number_integer() == false) {
        return tl::unexpected(ConfigError::wrong_type(key, "whole number of milliseconds"));
    }
    const auto value = it->get<std::int64_t>();
    if (value < 0) {
        return tl::unexpected(ConfigError::out_of_range(key, "at least 0"));
    }
    out = std::chrono::milliseconds(value);
    return {};
}

ConfigResult<void> read_bool(const Json& json, const char* key, bool& out) {
    const auto it = json.find(key);
    if (it == json.end()) {
        return {};
    }
    if (it->is_boolean() == false) {
        return tl::unexpected(ConfigError::wrong_type(key, "boolean"));
    }
    out = it->get<bool>();
    return {};
}

ConfigResult<void> read_window_type(const Json& json, const char* key, SlidingWindowType& out) {
    const auto it = json.find(key);
    if (it == json.end()) {
        return {};
    }
    if (it->is_string() == false) {
        return tl::unexpected(ConfigError::wrong_type(key, "string"));
    }
    const auto& text = it->get_ref<const std::string&>();
    if (text == to_string(SlidingWindowType::CountBased)) {
        out = SlidingWindowType::CountBased;
    } else if (text == to_string(SlidingWindowType::TimeBased)) {
        out = SlidingWindowType::TimeBased;
    } else {
        return tl::unexpected(ConfigError::out_of_range(key, "\"count_based\" or \"time_based\""));
    }
    return {};
}

}  // namespace

ConfigResult<CircuitBreakerConfig> config_from_json(const Json& json) {
    if (json.is_object() == false) {
        return tl::unexpected(ConfigError{"", "configuration must be a JSON object"});
    }

    CircuitBreakerConfig config;

    const ConfigResult<void> steps[] = {
        read_percentage(json, "failure_rate_threshold", config.failure_rate_threshold),
        read_percentage(json, "slow_call_rate_threshold", config.slow_call_rate_threshold),
        read_millis(json, "slow_call_duration_threshold_ms", config.slow_call_duration_threshold),
        read_count(json, "permitted_calls_in_half_open", config.permitted_calls_in_half_open),
        read_window_type(json, "sliding_window_type", config.sliding_window_type),
        read_count(json, "sliding_window_size", config.sliding_window_size),
        read_count(json, "minimum_number_of_calls", config.minimum_number_of_calls),
        read_millis(json, "wait_duration_in_open_ms", config.wait_duration_in_open),
        read_bool(json, "automatic_transition_from_open_to_half_open",
                  config.automatic_transition_from_open_to_half_open),
        read_millis(json, "max_wait_duration_in_half_open_ms", config.max_wait_duration_in_half_open),
    };
    for (const auto& step : steps) {
        if (!step) {
            CIRCUITRY_LOG_ERROR(step.error().to_string());
            return tl::unexpected(step.error());
        }
    }

    for (const auto& item : json.items()) {
        if (is_known_key(item.key()) == false) {
            CIRCUITRY_LOG_DEBUG(std::format("ignoring unknown configuration key '{}'", item.key()));
        }
    }

    const auto valid = config.validate();
    if (!valid) {
        CIRCUITRY_LOG_ERROR(valid.error().to_string());
        return tl::unexpected(valid.error());
    }
    return config;
}

ConfigResult<CircuitBreakerConfig> config_from_json_string(std::string_view text) {
    const auto json = Json::parse(text, nullptr, false);
    if (json.is_discarded()) {
        return tl::unexpected(ConfigError{"", "configuration is not valid JSON"});
    }
    return config_from_json(json);
}

ConfigResult<NamedConfigs> configs_from_json(const Json& json) {
    if (json.is_object() == false) {
        return tl::unexpected(ConfigError{"", "configurations must be a JSON object keyed by name"});
    }

    NamedConfigs configs;
    for (const auto& item : json.items()) {
        const std::string& name = item.key();
        auto config = config_from_json(item.value());
        if (!config) {
            auto error = config.error();
            error.field = error.field.empty() ? name : std::format("{}.{}", name, error.field);
            return tl::unexpected(std::move(error));
        }
        configs.emplace(name, std::move(*config));
    }
    return configs;
}

Json config_to_json(const CircuitBreakerConfig& config) {
    return Json{
        {"failure_rate_threshold", config.failure_rate_threshold},
        {"slow_call_rate_threshold", config.slow_call_rate_threshold},
        {"slow_call_duration_threshold_ms", config.slow_call_duration_threshold.count()},
        {"permitted_calls_in_half_open", config.permitted_calls_in_half_open},
        {"sliding_window_type", std::string(to_string(config.sliding_window_type))},
        {"sliding_window_size", config.sliding_window_size},
        {"minimum_number_of_calls", config.minimum_number_of_calls},
        {"wait_duration_in_open_ms", config.wait_duration_in_open.count()},
        {"automatic_transition_from_open_to_half_open", config.automatic_transition_from_open_to_half_open},
        {"max_wait_duration_in_half_open_ms", config.max_wait_duration_in_half_open.count()},
    };
}

}  // namespace circuitry
