// Example 02: Registry and Events
//
// Loads named configurations from JSON, builds breakers through a registry
// and streams breaker events to a consumer thread.

#include <circuitry/config/config_json.hpp>
#include <circuitry/event/event_queue.hpp>
#include <circuitry/log/spdlog_logger.hpp>
#include <circuitry/registry/circuit_breaker_registry.hpp>

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

using namespace circuitry;
using namespace std::chrono_literals;

namespace {

constexpr const char* kConfigs = R"({
    "default":  {"sliding_window_size": 20, "minimum_number_of_calls": 5},
    "payments": {"failure_rate_threshold": 20, "sliding_window_size": 10,
                 "minimum_number_of_calls": 5, "wait_duration_in_open_ms": 5000}
})";

}  // namespace

int main() {
    std::cout << "=== Registry and Events Example ===\n\n";

    set_logger(make_spdlog_console_logger(LogLevel::Warn));

    // 1. Parse configurations
    auto configs = configs_from_json(Json::parse(kConfigs));
    if (!configs) {
        std::cerr << "Bad configuration: " << configs.error().to_string() << "\n";
        return 1;
    }

    CircuitBreakerRegistry registry(std::move(*configs));

    // 2. Log registry membership changes
    auto registry_sub = registry.events().subscribe([](const RegistryEvent& event) {
        std::cout << "registry: " << event.to_json().dump() << "\n";
    });

    // 3. Build breakers
    auto search = registry.circuit_breaker("search");
    auto payments = registry.circuit_breaker("stripe", std::string("payments"));
    if (!payments) {
        std::cerr << payments.error().message << "\n";
        return 1;
    }
    auto stripe = *payments;

    // 4. Stream everything except successes to a consumer thread
    auto queue = std::make_shared<EventQueue<BreakerEvent>>(256);
    auto breaker_sub = stripe->events().subscribe(
        queue, BreakerEventFilter::excluding({BreakerEventKind::Success}));

    std::atomic<bool> done{false};
    std::thread consumer([&]() {
        while (done.load() == false || queue->size() > 0) {
            if (auto event = queue->poll(50ms)) {
                std::cout << "event: " << event->to_json().dump() << "\n";
            }
        }
    });

    // 5. Payment calls start failing
    for (int i = 0; i < 8; ++i) {
        auto permit = stripe->permit_call();
        if (!permit) {
            continue;
        }
        if (i % 2 == 0) {
            stripe->record_success(std::move(*permit), 12ms);
        } else {
            stripe->record_failure(std::move(*permit), 40ms, ErrorInfo::make("http-503", "service unavailable"));
        }
    }

    done = true;
    consumer.join();

    // 6. Summary
    std::cout << "\n=== Breakers ===\n";
    for (const auto& breaker : registry.all_circuit_breakers()) {
        std::cout << breaker->name() << ": " << to_string(breaker->state()) << "\n";
    }
    std::cout << "dropped events: " << queue->dropped() << "\n";

    (void)registry.remove("search");
    (void)search;

    set_logger(nullptr);
    return 0;
}
