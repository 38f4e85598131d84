#include <catch2/catch_test_macros.hpp>

#include "circuitry/registry/circuit_breaker_registry.hpp"
#include "mocks/manual_clock.hpp"
#include "mocks/recording_sink.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

using namespace circuitry;
using namespace circuitry::testing;
using namespace std::chrono_literals;

using RegistryRecorder = RecordingSink<RegistryEvent>;

// ═══════════════════════════════════════════════════════════════════════════
// Configurations
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Registry uses built-in defaults without a default entry", "[registry][config]") {
    CircuitBreakerRegistry registry;

    auto breaker = registry.circuit_breaker("inventory");
    REQUIRE(breaker->config().failure_rate_threshold == 50.0f);
    REQUIRE(breaker->config().sliding_window_size == 100);
}

TEST_CASE("Registry default entry overrides the defaults", "[registry][config]") {
    CircuitBreakerRegistry registry({
        {"default", CircuitBreakerConfig{}.with_failure_rate_threshold(20)},
    });

    REQUIRE(registry.default_config().failure_rate_threshold == 20.0f);
    REQUIRE(registry.circuit_breaker("inventory")->config().failure_rate_threshold == 20.0f);
}

TEST_CASE("Registry rejects invalid configurations", "[registry][config]") {
    REQUIRE_THROWS_AS(
        CircuitBreakerRegistry({{"broken", CircuitBreakerConfig{}.with_sliding_window(0)}}),
        ConfigurationError);

    CircuitBreakerRegistry registry;
    auto result = registry.add_configuration("broken", CircuitBreakerConfig{}.with_minimum_number_of_calls(0));
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == RegistryErrorCode::InvalidConfiguration);
    REQUIRE(result.error().message.find("minimum_number_of_calls") != std::string::npos);
    REQUIRE_FALSE(registry.configuration("broken").has_value());
}

TEST_CASE("Registry add_configuration stores and overwrites", "[registry][config]") {
    CircuitBreakerRegistry registry;

    REQUIRE(registry.add_configuration("payments", CircuitBreakerConfig{}.with_sliding_window(10)));
    REQUIRE(registry.configuration("payments")->sliding_window_size == 10);

    REQUIRE(registry.add_configuration("payments", CircuitBreakerConfig{}.with_sliding_window(20)));
    REQUIRE(registry.configuration("payments")->sliding_window_size == 20);

    REQUIRE(registry.add_configuration("default", CircuitBreakerConfig{}.with_sliding_window(7)));
    REQUIRE(registry.default_config().sliding_window_size == 7);
}

// ═══════════════════════════════════════════════════════════════════════════
// Breakers
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Registry returns the same breaker for the same name", "[registry]") {
    CircuitBreakerRegistry registry;

    auto first = registry.circuit_breaker("inventory");
    auto second = registry.circuit_breaker("inventory");
    REQUIRE(first == second);
    REQUIRE(first->name() == "inventory");
    REQUIRE(registry.size() == 1);
}

TEST_CASE("Registry ignores the config for an existing breaker", "[registry]") {
    CircuitBreakerRegistry registry;

    auto created = registry.circuit_breaker("inventory", CircuitBreakerConfig{}.with_sliding_window(5));
    auto existing = registry.circuit_breaker("inventory", CircuitBreakerConfig{}.with_sliding_window(50));

    REQUIRE(created == existing);
    REQUIRE(existing->config().sliding_window_size == 5);
}

TEST_CASE("Registry builds breakers from named configurations", "[registry]") {
    CircuitBreakerRegistry registry({
        {"payments", CircuitBreakerConfig{}.with_failure_rate_threshold(10)},
    });

    auto stripe = registry.circuit_breaker("stripe", std::string("payments"));
    REQUIRE(stripe.has_value());
    REQUIRE((*stripe)->config().failure_rate_threshold == 10.0f);

    auto missing = registry.circuit_breaker("adyen", std::string("nonexistent"));
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code == RegistryErrorCode::ConfigurationNotFound);
    REQUIRE(registry.find("adyen") == nullptr);
}

TEST_CASE("Registry rejects an invalid inline config", "[registry]") {
    CircuitBreakerRegistry registry;

    REQUIRE_THROWS_AS(registry.circuit_breaker("bad", CircuitBreakerConfig{}.with_failure_rate_threshold(101)),
                      ConfigurationError);
    REQUIRE(registry.size() == 0);
}

TEST_CASE("Registry find, remove and list", "[registry]") {
    CircuitBreakerRegistry registry;
    auto b = registry.circuit_breaker("b");
    auto a = registry.circuit_breaker("a");
    auto c = registry.circuit_breaker("c");

    REQUIRE(registry.find("a") == a);
    REQUIRE(registry.find("z") == nullptr);

    auto all = registry.all_circuit_breakers();
    REQUIRE(all.size() == 3);
    REQUIRE(all[0]->name() == "a");
    REQUIRE(all[1]->name() == "b");
    REQUIRE(all[2]->name() == "c");

    REQUIRE(registry.remove("b") == b);
    REQUIRE(registry.remove("b") == nullptr);
    REQUIRE(registry.size() == 2);

    // A removed name gets a fresh breaker
    REQUIRE(registry.circuit_breaker("b") != b);
}

TEST_CASE("Registry replace swaps existing entries only", "[registry]") {
    CircuitBreakerRegistry registry;
    auto original = registry.circuit_breaker("inventory");
    auto swapped = std::make_shared<CircuitBreaker>("inventory-v2", CircuitBreakerConfig{});

    REQUIRE(registry.replace("inventory", swapped) == original);
    REQUIRE(registry.find("inventory") == swapped);

    auto stranger = std::make_shared<CircuitBreaker>("stranger", CircuitBreakerConfig{});
    REQUIRE(registry.replace("unknown", stranger) == nullptr);
    REQUIRE(registry.find("unknown") == nullptr);

    REQUIRE_THROWS_AS(registry.replace("inventory", nullptr), std::invalid_argument);
}

TEST_CASE("Registry breakers share one scheduler", "[registry][auto]") {
    CircuitBreakerRegistry registry;
    auto timed = CircuitBreakerConfig{}.with_automatic_transition(true).with_wait_duration_in_open(10s);

    auto scheduler = registry.scheduler();
    REQUIRE(scheduler == registry.scheduler());
    REQUIRE(scheduler->running());

    auto first = registry.circuit_breaker("first", timed);
    auto second = registry.circuit_breaker("second", timed);
    first->open();
    second->open();
    REQUIRE(first->state() == CircuitState::Open);
    REQUIRE(second->state() == CircuitState::Open);
}

TEST_CASE("Registry breakers use the registry clock", "[registry]") {
    auto clock = make_manual_clock();
    CircuitBreakerRegistry registry({}, clock);

    auto breaker = registry.circuit_breaker("clocked", CircuitBreakerConfig{}.with_wait_duration_in_open(1s));
    REQUIRE(breaker->clock() == clock);

    breaker->open();
    REQUIRE_FALSE(breaker->permit_call().has_value());
    clock->advance(1s);
    REQUIRE(breaker->permit_call().has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// Events
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Registry publishes added, removed and replaced", "[registry][events]") {
    CircuitBreakerRegistry registry;
    auto recorder = std::make_shared<RegistryRecorder>();
    auto sub = registry.events().subscribe(recorder);

    auto created = registry.circuit_breaker("inventory");
    (void)registry.circuit_breaker("inventory");  // existing: no event
    auto replacement = std::make_shared<CircuitBreaker>("inventory-v2", CircuitBreakerConfig{});
    (void)registry.replace("inventory", replacement);
    (void)registry.remove("inventory");

    const std::vector<RegistryEventKind> expected{
        RegistryEventKind::Added,
        RegistryEventKind::Replaced,
        RegistryEventKind::Removed,
    };
    REQUIRE(recorder->kinds() == expected);

    auto added = recorder->payloads<EntryAdded>();
    REQUIRE(added[0].added == created);

    auto replaced = recorder->payloads<EntryReplaced>();
    REQUIRE(replaced[0].old_entry == created);
    REQUIRE(replaced[0].new_entry == replacement);

    auto removed = recorder->payloads<EntryRemoved>();
    REQUIRE(removed[0].removed == replacement);

    for (const auto& event : recorder->events()) {
        REQUIRE(event.entry_name == "inventory");
    }
}

TEST_CASE("Registry events filter and serialise", "[registry][events][json]") {
    CircuitBreakerRegistry registry;
    auto recorder = std::make_shared<RegistryRecorder>();
    auto sub = registry.events().subscribe(
        recorder, RegistryEventFilter::only_kinds({RegistryEventKind::Removed}));

    (void)registry.circuit_breaker("inventory");
    (void)registry.remove("inventory");

    auto events = recorder->events();
    REQUIRE(events.size() == 1);

    auto json = events[0].to_json();
    REQUIRE(json["kind"] == "removed");
    REQUIRE(json["entry_name"] == "inventory");
    REQUIRE(json["removed"]["name"] == "inventory");
    REQUIRE(json["removed"]["state"] == "closed");
}

TEST_CASE("Registry error codes have names", "[registry]") {
    REQUIRE(to_string(RegistryErrorCode::ConfigurationNotFound) == "ConfigurationNotFound");
    REQUIRE(to_string(RegistryErrorCode::InvalidConfiguration) == "InvalidConfiguration");

    auto error = RegistryError::configuration_not_found("payments");
    REQUIRE(error.message == "no configuration named 'payments'");
}
