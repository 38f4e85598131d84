#include "circuitry/core/clock.hpp"

namespace circuitry {

std::shared_ptr<const IClock> default_clock() {
    static const std::shared_ptr<const IClock> instance = std::make_shared<SteadyClock>();
    return instance;
}

}  // namespace circuitry
