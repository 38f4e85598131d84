#pragma once

#include "circuitry/event/event_bus.hpp"
#include "circuitry/event/event_filter.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace circuitry {

using Json = nlohmann::json;

class CircuitBreaker;

enum class RegistryEventKind {
    Added,
    Removed,
    Replaced
};

[[nodiscard]] constexpr std::string_view to_string(RegistryEventKind kind) noexcept {
    switch (kind) {
        case RegistryEventKind::Added:    return "added";
        case RegistryEventKind::Removed:  return "removed";
        case RegistryEventKind::Replaced: return "replaced";
    }
    return "unknown";
}

struct EntryAdded {
    static constexpr RegistryEventKind kind = RegistryEventKind::Added;
    std::shared_ptr<CircuitBreaker> added;
};

struct EntryRemoved {
    static constexpr RegistryEventKind kind = RegistryEventKind::Removed;
    std::shared_ptr<CircuitBreaker> removed;
};

struct EntryReplaced {
    static constexpr RegistryEventKind kind = RegistryEventKind::Replaced;
    std::shared_ptr<CircuitBreaker> old_entry;
    std::shared_ptr<CircuitBreaker> new_entry;
};

// ─────────────────────────────────────────────────────────────────────────────
// RegistryEvent
// ─────────────────────────────────────────────────────────────────────────────
// `entry_name` is the registry key, which for replace() may differ from the
// name of the breaker now stored under it.

struct RegistryEvent {
    using Payload = std::variant<EntryAdded, EntryRemoved, EntryReplaced>;

    std::string entry_name;
    std::chrono::system_clock::time_point creation_time;
    Payload payload;

    template <typename T>
    [[nodiscard]] static RegistryEvent make(std::string entry_name, T payload) {
        return {std::move(entry_name), std::chrono::system_clock::now(), Payload(std::move(payload))};
    }

    [[nodiscard]] RegistryEventKind kind() const noexcept {
        return std::visit([](const auto& p) { return std::decay_t<decltype(p)>::kind; }, payload);
    }

    template <typename T>
    [[nodiscard]] const T* as() const noexcept {
        return std::get_if<T>(&payload);
    }

    [[nodiscard]] Json to_json() const;
};

using RegistryEventFilter = EventFilter<RegistryEventKind>;
using RegistryEventBus = EventBus<RegistryEvent>;

}  // namespace circuitry
