#include "circuitry/event/registry_event.hpp"

#include "circuitry/resilience/circuit_breaker.hpp"

namespace circuitry {

namespace {

Json breaker_json(const std::shared_ptr<CircuitBreaker>& breaker) {
    if (!breaker) {
        return nullptr;
    }
    return Json{
        {"name", breaker->name()},
        {"state", std::string(to_string(breaker->state()))},
    };
}

}  // namespace

Json RegistryEvent::to_json() const {
    Json out = {
        {"kind", std::string(to_string(kind()))},
        {"entry_name", entry_name},
        {"creation_time", std::chrono::duration_cast<std::chrono::milliseconds>(
            creation_time.time_since_epoch()).count()},
    };

    if (const auto* added = as<EntryAdded>()) {
        out["added"] = breaker_json(added->added);
    } else if (const auto* removed = as<EntryRemoved>()) {
        out["removed"] = breaker_json(removed->removed);
    } else if (const auto* replaced = as<EntryReplaced>()) {
        out["old_entry"] = breaker_json(replaced->old_entry);
        out["new_entry"] = breaker_json(replaced->new_entry);
    }
    return out;
}

}  // namespace circuitry
