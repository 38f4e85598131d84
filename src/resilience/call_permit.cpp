#include "circuitry/resilience/call_permit.hpp"

#include "circuitry/resilience/circuit_breaker.hpp"

#include <utility>

namespace circuitry {

CallPermit::~CallPermit() {
    release();
}

CallPermit::CallPermit(CallPermit&& other) noexcept
    : breaker_(std::exchange(other.breaker_, nullptr))
    , epoch_(other.epoch_)
    , issued_in_(other.issued_in_)
    , issued_at_(other.issued_at_)
{}

CallPermit& CallPermit::operator=(CallPermit&& other) noexcept {
    if (this != &other) {
        release();
        breaker_ = std::exchange(other.breaker_, nullptr);
        epoch_ = other.epoch_;
        issued_in_ = other.issued_in_;
        issued_at_ = other.issued_at_;
    }
    return *this;
}

void CallPermit::release() noexcept {
    if (breaker_ == nullptr) {
        return;
    }
    auto* breaker = std::exchange(breaker_, nullptr);
    breaker->release_permit(epoch_, issued_in_);
}

}  // namespace circuitry
