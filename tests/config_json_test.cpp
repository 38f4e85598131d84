#include <catch2/catch_test_macros.hpp>

#include "circuitry/config/config_json.hpp"
#include "circuitry/registry/circuit_breaker_registry.hpp"
#include "mocks/capturing_logger.hpp"

#include <chrono>
#include <string>

using namespace circuitry;
using namespace circuitry::testing;
using namespace std::chrono_literals;

TEST_CASE("config_from_json reads every option", "[config][json]") {
    auto json = Json::parse(R"({
        "failure_rate_threshold": 25,
        "slow_call_rate_threshold": 80.5,
        "slow_call_duration_threshold_ms": 1500,
        "permitted_calls_in_half_open": 3,
        "sliding_window_type": "time_based",
        "sliding_window_size": 30,
        "minimum_number_of_calls": 5,
        "wait_duration_in_open_ms": 10000,
        "automatic_transition_from_open_to_half_open": true,
        "max_wait_duration_in_half_open_ms": 2000
    })");

    auto config = config_from_json(json);
    REQUIRE(config.has_value());
    REQUIRE(config->failure_rate_threshold == 25.0f);
    REQUIRE(config->slow_call_rate_threshold == 80.5f);
    REQUIRE(config->slow_call_duration_threshold == 1500ms);
    REQUIRE(config->permitted_calls_in_half_open == 3);
    REQUIRE(config->sliding_window_type == SlidingWindowType::TimeBased);
    REQUIRE(config->sliding_window_size == 30);
    REQUIRE(config->minimum_number_of_calls == 5);
    REQUIRE(config->wait_duration_in_open == 10s);
    REQUIRE(config->automatic_transition_from_open_to_half_open);
    REQUIRE(config->max_wait_duration_in_half_open == 2s);
}

TEST_CASE("config_from_json keeps defaults for absent keys", "[config][json]") {
    auto config = config_from_json(Json::object());

    REQUIRE(config.has_value());
    REQUIRE(config->failure_rate_threshold == 50.0f);
    REQUIRE(config->sliding_window_size == 100);
    REQUIRE(config->sliding_window_type == SlidingWindowType::CountBased);
}

TEST_CASE("config_from_json reports type errors", "[config][json]") {
    SECTION("not an object") {
        auto config = config_from_json(Json::array({1, 2}));
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().field.empty());
    }

    SECTION("string where a number belongs") {
        auto config = config_from_json(Json{{"failure_rate_threshold", "fifty"}});
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().field == "failure_rate_threshold");
        REQUIRE(config.error().message == "failure_rate_threshold must be a number");
    }

    SECTION("fractional count") {
        auto config = config_from_json(Json{{"sliding_window_size", 2.5}});
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().field == "sliding_window_size");
    }

    SECTION("number where a boolean belongs") {
        auto config = config_from_json(Json{{"automatic_transition_from_open_to_half_open", 1}});
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().field == "automatic_transition_from_open_to_half_open");
    }
}

TEST_CASE("config_from_json reports range errors", "[config][json]") {
    SECTION("zero window size") {
        auto config = config_from_json(Json{{"sliding_window_size", 0}});
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().message == "sliding_window_size must be at least 1");
    }

    SECTION("negative count") {
        auto config = config_from_json(Json{{"minimum_number_of_calls", -3}});
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().field == "minimum_number_of_calls");
    }

    SECTION("negative duration") {
        auto config = config_from_json(Json{{"wait_duration_in_open_ms", -1}});
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().field == "wait_duration_in_open_ms");
    }

    SECTION("unknown window type") {
        auto config = config_from_json(Json{{"sliding_window_type", "sliding"}});
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().message.find("\"count_based\" or \"time_based\"") != std::string::npos);
    }

    SECTION("threshold caught by validation") {
        auto config = config_from_json(Json{{"slow_call_rate_threshold", 150}});
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().field == "slow_call_rate_threshold");
    }
}

TEST_CASE("config_from_json logs unknown keys at debug", "[config][json][log]") {
    ScopedCapture capture(LogLevel::Debug);

    auto config = config_from_json(Json{{"failure_rate_treshold", 10}});

    REQUIRE(config.has_value());
    REQUIRE(config->failure_rate_threshold == 50.0f);
    REQUIRE(capture.logger().count(LogLevel::Debug, "failure_rate_treshold") == 1);
}

TEST_CASE("config_from_json_string handles malformed text", "[config][json]") {
    auto bad = config_from_json_string("{ not json");
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().message == "configuration is not valid JSON");

    auto good = config_from_json_string(R"({"sliding_window_size": 12})");
    REQUIRE(good.has_value());
    REQUIRE(good->sliding_window_size == 12);
}

TEST_CASE("configs_from_json reads named configurations", "[config][json]") {
    auto json = Json::parse(R"({
        "default":  {"failure_rate_threshold": 40},
        "payments": {"failure_rate_threshold": 10, "sliding_window_size": 20}
    })");

    auto configs = configs_from_json(json);
    REQUIRE(configs.has_value());
    REQUIRE(configs->size() == 2);
    REQUIRE(configs->at("default").failure_rate_threshold == 40.0f);
    REQUIRE(configs->at("payments").sliding_window_size == 20);

    CircuitBreakerRegistry registry(*configs);
    REQUIRE(registry.circuit_breaker("inventory")->config().failure_rate_threshold == 40.0f);
    auto stripe = registry.circuit_breaker("stripe", std::string("payments"));
    REQUIRE(stripe.has_value());
    REQUIRE((*stripe)->config().failure_rate_threshold == 10.0f);
}

TEST_CASE("configs_from_json prefixes errors with the entry name", "[config][json]") {
    auto json = Json::parse(R"({"payments": {"sliding_window_size": 0}})");

    auto configs = configs_from_json(json);
    REQUIRE_FALSE(configs.has_value());
    REQUIRE(configs.error().field == "payments.sliding_window_size");

    auto not_object = configs_from_json(Json::parse(R"({"payments": 5})"));
    REQUIRE_FALSE(not_object.has_value());
    REQUIRE(not_object.error().field == "payments");
}

TEST_CASE("config_to_json is read back unchanged", "[config][json]") {
    auto original = CircuitBreakerConfig{}
        .with_failure_rate_threshold(35)
        .with_sliding_window(15, SlidingWindowType::TimeBased)
        .with_wait_duration_in_open(2500ms)
        .with_max_wait_duration_in_half_open(750ms);

    auto json = config_to_json(original);
    REQUIRE(json["sliding_window_type"] == "time_based");
    REQUIRE(json["wait_duration_in_open_ms"] == 2500);

    auto parsed = config_from_json(json);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->failure_rate_threshold == 35.0f);
    REQUIRE(parsed->sliding_window_size == 15);
    REQUIRE(parsed->sliding_window_type == SlidingWindowType::TimeBased);
    REQUIRE(parsed->wait_duration_in_open == 2500ms);
    REQUIRE(parsed->max_wait_duration_in_half_open == 750ms);
}
