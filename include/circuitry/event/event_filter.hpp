#pragma once

#include <initializer_list>
#include <set>

namespace circuitry {

// ─────────────────────────────────────────────────────────────────────────────
// EventFilter - per-subscriber selection of event kinds
// ─────────────────────────────────────────────────────────────────────────────
// A non-empty `only` set wins outright and `exclude` is then ignored.
// Both empty accepts everything.

template <typename Kind>
struct EventFilter {
    std::set<Kind> only;
    std::set<Kind> exclude;

    [[nodiscard]] bool accepts(Kind kind) const {
        if (only.empty() == false) {
            return only.contains(kind);
        }
        return exclude.contains(kind) == false;
    }

    [[nodiscard]] static EventFilter all() { return {}; }

    [[nodiscard]] static EventFilter only_kinds(std::initializer_list<Kind> kinds) {
        return {std::set<Kind>(kinds), {}};
    }

    [[nodiscard]] static EventFilter excluding(std::initializer_list<Kind> kinds) {
        return {{}, std::set<Kind>(kinds)};
    }
};

}  // namespace circuitry
