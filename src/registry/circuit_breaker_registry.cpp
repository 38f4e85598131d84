#include "circuitry/registry/circuit_breaker_registry.hpp"

#include "circuitry/log/logger.hpp"

#include <format>
#include <stdexcept>
#include <utility>

namespace circuitry {

namespace {

bool needs_scheduler(const CircuitBreakerConfig& config) noexcept {
    return config.automatic_transition_from_open_to_half_open ||
           (config.max_wait_duration_in_half_open.count() > 0);
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

CircuitBreakerRegistry::CircuitBreakerRegistry(ConfigMap configs, std::shared_ptr<const IClock> clock)
    : clock_(clock ? std::move(clock) : default_clock())
{
    for (auto& [name, config] : configs) {
        const auto valid = config.validate();
        if (!valid) {
            CIRCUITRY_LOG_ERROR(std::format("registry configuration '{}': {}", name, valid.error().message));
            throw ConfigurationError(valid.error());
        }
    }

    configs_ = std::move(configs);
    const auto default_entry = configs_.find(std::string(kDefaultConfigName));
    if (default_entry != configs_.end()) {
        default_config_ = default_entry->second;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Configurations
// ─────────────────────────────────────────────────────────────────────────────

RegistryResult<void> CircuitBreakerRegistry::add_configuration(const std::string& name,
                                                               CircuitBreakerConfig config) {
    const auto valid = config.validate();
    if (!valid) {
        CIRCUITRY_LOG_ERROR(std::format("registry configuration '{}': {}", name, valid.error().message));
        return tl::unexpected(RegistryError::invalid_configuration(name, valid.error()));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (name == kDefaultConfigName) {
        default_config_ = config;
    }
    configs_.insert_or_assign(name, std::move(config));
    return {};
}

std::optional<CircuitBreakerConfig> CircuitBreakerRegistry::configuration(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = configs_.find(name);
    if (it == configs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

CircuitBreakerConfig CircuitBreakerRegistry::default_config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return default_config_;
}

// ─────────────────────────────────────────────────────────────────────────────
// Breakers
// ─────────────────────────────────────────────────────────────────────────────

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::circuit_breaker(const std::string& name) {
    std::shared_ptr<CircuitBreaker> created;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = breakers_.find(name);
        if (it != breakers_.end()) {
            return it->second;
        }
        created = create_locked(name, default_config_);
    }
    outbox_.drain(events_);
    return created;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::circuit_breaker(const std::string& name,
                                                                        const CircuitBreakerConfig& config) {
    std::shared_ptr<CircuitBreaker> created;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = breakers_.find(name);
        if (it != breakers_.end()) {
            return it->second;
        }
        created = create_locked(name, config);
    }
    outbox_.drain(events_);
    return created;
}

RegistryResult<std::shared_ptr<CircuitBreaker>> CircuitBreakerRegistry::circuit_breaker(
    const std::string& name,
    const std::string& config_name
) {
    std::shared_ptr<CircuitBreaker> created;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = breakers_.find(name);
        if (it != breakers_.end()) {
            return it->second;
        }

        const auto config = configs_.find(config_name);
        if (config == configs_.end()) {
            return tl::unexpected(RegistryError::configuration_not_found(config_name));
        }
        created = create_locked(name, config->second);
    }
    outbox_.drain(events_);
    return created;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = breakers_.find(name);
    if (it == breakers_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::remove(const std::string& name) {
    std::shared_ptr<CircuitBreaker> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = breakers_.find(name);
        if (it == breakers_.end()) {
            return nullptr;
        }
        removed = std::move(it->second);
        breakers_.erase(it);
        outbox_.push(RegistryEvent::make(name, EntryRemoved{removed}));
    }
    CIRCUITRY_LOG_DEBUG(std::format("registry removed circuit breaker '{}'", name));
    outbox_.drain(events_);
    return removed;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::replace(const std::string& name,
                                                                std::shared_ptr<CircuitBreaker> breaker) {
    if (!breaker) {
        throw std::invalid_argument("CircuitBreakerRegistry::replace() requires a non-null breaker");
    }

    std::shared_ptr<CircuitBreaker> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = breakers_.find(name);
        if (it == breakers_.end()) {
            return nullptr;
        }
        previous = std::exchange(it->second, breaker);
        outbox_.push(RegistryEvent::make(name, EntryReplaced{previous, std::move(breaker)}));
    }
    CIRCUITRY_LOG_DEBUG(std::format("registry replaced circuit breaker '{}'", name));
    outbox_.drain(events_);
    return previous;
}

std::vector<std::shared_ptr<CircuitBreaker>> CircuitBreakerRegistry::all_circuit_breakers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<CircuitBreaker>> result;
    result.reserve(breakers_.size());
    for (const auto& [name, breaker] : breakers_) {
        result.push_back(breaker);
    }
    return result;
}

std::size_t CircuitBreakerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return breakers_.size();
}

std::shared_ptr<TransitionScheduler> CircuitBreakerRegistry::scheduler() {
    std::lock_guard<std::mutex> lock(mutex_);
    return scheduler_locked();
}

// ─────────────────────────────────────────────────────────────────────────────
// Internal Helpers
// ─────────────────────────────────────────────────────────────────────────────

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::create_locked(const std::string& name,
                                                                      const CircuitBreakerConfig& config) {
    auto scheduler = needs_scheduler(config) ? scheduler_locked() : nullptr;
    auto breaker = std::make_shared<CircuitBreaker>(name, config, clock_, std::move(scheduler));
    breakers_.emplace(name, breaker);
    outbox_.push(RegistryEvent::make(name, EntryAdded{breaker}));
    CIRCUITRY_LOG_DEBUG(std::format("registry created circuit breaker '{}'", name));
    return breaker;
}

std::shared_ptr<TransitionScheduler> CircuitBreakerRegistry::scheduler_locked() {
    if (!scheduler_) {
        scheduler_ = std::make_shared<TransitionScheduler>();
    }
    return scheduler_;
}

}  // namespace circuitry
