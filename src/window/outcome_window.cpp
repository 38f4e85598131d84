#include "circuitry/window/outcome_window.hpp"

namespace circuitry {

std::unique_ptr<IOutcomeWindow> make_outcome_window(
    SlidingWindowType type,
    std::size_t size,
    std::shared_ptr<const IClock> clock
) {
    switch (type) {
        case SlidingWindowType::CountBased:
            return std::make_unique<CountBasedWindow>(size);
        case SlidingWindowType::TimeBased:
            return std::make_unique<TimeBasedWindow>(size, std::move(clock));
    }
    return std::make_unique<CountBasedWindow>(size);
}

}  // namespace circuitry
