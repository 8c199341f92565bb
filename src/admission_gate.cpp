#include "parafetch/admission_gate.hpp"

#include "parafetch/errors.hpp"

namespace parafetch {

AdmissionGate::Slot& AdmissionGate::Slot::operator=(Slot&& other) noexcept {
    if (this != &other) {
        release();
        gate_ = other.gate_;
        other.gate_ = nullptr;
    }
    return *this;
}

void AdmissionGate::Slot::release() noexcept {
    if (gate_) {
        gate_->release();
        gate_ = nullptr;
    }
}

AdmissionGate::AdmissionGate(std::size_t permits) : capacity_(permits) {
    if (permits == 0) {
        throw ConfigError("admission gate needs at least one permit");
    }
}

AdmissionGate::Slot AdmissionGate::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return in_use_ < capacity_; });
    ++in_use_;
    return Slot{this};
}

std::size_t AdmissionGate::inUse() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

void AdmissionGate::release() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --in_use_;
    }
    cv_.notify_one();
}

} // namespace parafetch
