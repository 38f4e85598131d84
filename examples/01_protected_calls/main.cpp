// Example 01: Protected Calls
//
// Guards a flaky dependency with a circuit breaker and shows the breaker
// opening, rejecting, probing and closing again.

#include <circuitry/log/spdlog_logger.hpp>
#include <circuitry/resilience/circuit_breaker.hpp>
#include <circuitry/resilience/execute.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

using namespace circuitry;
using namespace std::chrono_literals;

namespace {

// Stand-in for a remote service that can be switched between healthy and down
class FlakyInventory {
public:
    void set_healthy(bool healthy) { healthy_ = healthy; }

    int lookup(const std::string& sku) const {
        if (healthy_ == false) {
            throw std::runtime_error("inventory service unavailable");
        }
        return static_cast<int>(sku.size()) * 10;
    }

private:
    bool healthy_{true};
};

void print_metrics(const CircuitBreaker& breaker) {
    const auto m = breaker.metrics();
    std::cout << "  state=" << to_string(breaker.state())
              << " calls=" << m.total_calls
              << " failed=" << m.failed_calls
              << " rejected=" << m.not_permitted_calls
              << " failure_rate=" << m.failure_rate << "\n";
}

}  // namespace

int main() {
    std::cout << "=== Protected Calls Example ===\n\n";

    // 1. Route library logging through spdlog
    set_logger(make_spdlog_console_logger(LogLevel::Info));

    // 2. Configure a small window so the demo trips quickly
    auto config = CircuitBreakerConfig{}
        .with_failure_rate_threshold(50)
        .with_sliding_window(6)
        .with_minimum_number_of_calls(4)
        .with_wait_duration_in_open(300ms)
        .with_automatic_transition(true)
        .with_permitted_calls_in_half_open(2);

    CircuitBreaker breaker("inventory", config);
    FlakyInventory inventory;

    // 3. Watch state changes
    auto sub = breaker.events().subscribe(
        [](const BreakerEvent& event) {
            const auto* t = event.as<StateTransition>();
            std::cout << "\n*** " << event.breaker_name << ": "
                      << to_string(t->from) << " -> " << to_string(t->to) << " ***\n\n";
        },
        BreakerEventFilter::only_kinds({BreakerEventKind::StateTransition}));

    // 4. Healthy calls
    std::cout << "=== Healthy Calls ===\n";
    for (int i = 0; i < 3; ++i) {
        std::cout << "Stock: " << execute(breaker, [&] { return inventory.lookup("sku-42"); }) << "\n";
    }
    print_metrics(breaker);

    // 5. The dependency goes down
    std::cout << "\n=== Dependency Down ===\n";
    inventory.set_healthy(false);
    for (int i = 0; i < 6; ++i) {
        try {
            auto stock = try_execute(breaker, [&] { return inventory.lookup("sku-42"); });
            if (!stock) {
                std::cout << "Rejected: " << stock.error().to_string() << "\n";
            }
        } catch (const std::exception& e) {
            std::cout << "Call failed: " << e.what() << "\n";
        }
    }
    print_metrics(breaker);

    // 6. Recovery: the timer moves to half-open, probes close the breaker
    std::cout << "\n=== Recovery ===\n";
    inventory.set_healthy(true);
    std::this_thread::sleep_for(400ms);
    for (int i = 0; i < 2; ++i) {
        auto stock = try_execute(breaker, [&] { return inventory.lookup("sku-7"); });
        std::cout << "Probe " << (i + 1) << ": " << (stock ? "ok" : "rejected") << "\n";
    }
    print_metrics(breaker);

    // 7. Manual control
    std::cout << "\n=== Manual Control ===\n";
    breaker.force_open();
    try {
        execute(breaker, [&] { return inventory.lookup("sku-1"); });
    } catch (const CallNotPermittedError& e) {
        std::cout << "Blocked: " << e.what() << "\n";
    }
    breaker.reset();
    print_metrics(breaker);

    set_logger(nullptr);
    std::cout << "\nDone!\n";
    return 0;
}
