#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Circuit Breaker Registry
// ═══════════════════════════════════════════════════════════════════════════
// Named configurations plus the breakers built from them. Every breaker the
// registry creates shares one TransitionScheduler thread.
//
// There is no process-wide registry; create one where the application wires
// its dependencies and pass it to whoever needs breakers.
//
// Usage:
//   CircuitBreakerRegistry registry({
//       {"default", CircuitBreakerConfig{}},
//       {"payments", CircuitBreakerConfig{}.with_failure_rate_threshold(20)},
//   });
//   auto sub = registry.events().subscribe([](const RegistryEvent& e) { ... });
//
//   auto inventory = registry.circuit_breaker("inventory");             // default config
//   auto payments  = registry.circuit_breaker("stripe", "payments");    // named config

#include "circuitry/core/clock.hpp"
#include "circuitry/core/config.hpp"
#include "circuitry/core/errors.hpp"
#include "circuitry/event/event_outbox.hpp"
#include "circuitry/event/registry_event.hpp"
#include "circuitry/resilience/circuit_breaker.hpp"
#include "circuitry/resilience/transition_scheduler.hpp"

#include <tl/expected.hpp>

#include <format>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace circuitry {

// ─────────────────────────────────────────────────────────────────────────────
// Registry Errors
// ─────────────────────────────────────────────────────────────────────────────

enum class RegistryErrorCode {
    ConfigurationNotFound,  ///< No configuration registered under that name
    InvalidConfiguration    ///< Configuration failed validation
};

[[nodiscard]] constexpr std::string_view to_string(RegistryErrorCode code) noexcept {
    switch (code) {
        case RegistryErrorCode::ConfigurationNotFound: return "ConfigurationNotFound";
        case RegistryErrorCode::InvalidConfiguration:  return "InvalidConfiguration";
    }
    return "Unknown";
}

struct RegistryError {
    RegistryErrorCode code;
    std::string message;

    [[nodiscard]] static RegistryError configuration_not_found(std::string_view name) {
        return {RegistryErrorCode::ConfigurationNotFound,
                std::format("no configuration named '{}'", name)};
    }

    [[nodiscard]] static RegistryError invalid_configuration(std::string_view name, const ConfigError& error) {
        return {RegistryErrorCode::InvalidConfiguration,
                std::format("configuration '{}': {}", name, error.message)};
    }
};

template <typename T>
using RegistryResult = tl::expected<T, RegistryError>;

// ─────────────────────────────────────────────────────────────────────────────
// CircuitBreakerRegistry
// ─────────────────────────────────────────────────────────────────────────────

class CircuitBreakerRegistry {
public:
    using ConfigMap = std::map<std::string, CircuitBreakerConfig>;

    static constexpr std::string_view kDefaultConfigName = "default";

    /// A "default" entry replaces the built-in default config. Throws
    /// ConfigurationError if any entry is invalid.
    explicit CircuitBreakerRegistry(ConfigMap configs = {},
                                    std::shared_ptr<const IClock> clock = nullptr);

    CircuitBreakerRegistry(const CircuitBreakerRegistry&) = delete;
    CircuitBreakerRegistry& operator=(const CircuitBreakerRegistry&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Configurations
    // ─────────────────────────────────────────────────────────────────────────

    /// Validate and store (or overwrite) a named configuration
    RegistryResult<void> add_configuration(const std::string& name, CircuitBreakerConfig config);

    [[nodiscard]] std::optional<CircuitBreakerConfig> configuration(const std::string& name) const;
    [[nodiscard]] CircuitBreakerConfig default_config() const;

    // ─────────────────────────────────────────────────────────────────────────
    // Breakers
    // ─────────────────────────────────────────────────────────────────────────

    /// Existing breaker, or a new one built from the default config
    [[nodiscard]] std::shared_ptr<CircuitBreaker> circuit_breaker(const std::string& name);

    /// Existing breaker (the config is then ignored), or a new one built
    /// from `config`. Throws ConfigurationError if a new breaker's config
    /// is invalid.
    [[nodiscard]] std::shared_ptr<CircuitBreaker> circuit_breaker(const std::string& name,
                                                                  const CircuitBreakerConfig& config);

    /// Existing breaker, or a new one built from a named configuration
    [[nodiscard]] RegistryResult<std::shared_ptr<CircuitBreaker>> circuit_breaker(
        const std::string& name,
        const std::string& config_name
    );

    [[nodiscard]] std::shared_ptr<CircuitBreaker> find(const std::string& name) const;

    /// Removed breaker, or null if there was none
    std::shared_ptr<CircuitBreaker> remove(const std::string& name);

    /// Swap the breaker stored under `name`. Only existing entries are
    /// replaced; returns the previous breaker, or null (and stores nothing)
    /// if `name` was not registered. The key stays `name` even if the new
    /// breaker is named differently.
    std::shared_ptr<CircuitBreaker> replace(const std::string& name, std::shared_ptr<CircuitBreaker> breaker);

    /// All breakers, ordered by registry key
    [[nodiscard]] std::vector<std::shared_ptr<CircuitBreaker>> all_circuit_breakers() const;

    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] RegistryEventBus& events() noexcept { return events_; }

    /// Scheduler shared by timed breakers; created on first use
    [[nodiscard]] std::shared_ptr<TransitionScheduler> scheduler();

private:
    std::shared_ptr<CircuitBreaker> create_locked(const std::string& name,
                                                  const CircuitBreakerConfig& config);
    std::shared_ptr<TransitionScheduler> scheduler_locked();

    const std::shared_ptr<const IClock> clock_;

    mutable std::mutex mutex_;
    CircuitBreakerConfig default_config_;
    ConfigMap configs_;
    std::map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
    std::shared_ptr<TransitionScheduler> scheduler_;

    // Filled under mutex_ so subscribers see changes in commit order
    EventOutbox<RegistryEvent> outbox_;
    RegistryEventBus events_;
};

}  // namespace circuitry
