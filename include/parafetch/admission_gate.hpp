#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace parafetch {

// Counting semaphore bounding how many transfers run at once.
class AdmissionGate {
public:
    // Returned by acquire(); gives the permit back when destroyed.
    class Slot {
    public:
        Slot() = default;
        ~Slot() { release(); }

        Slot(Slot&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
        Slot& operator=(Slot&& other) noexcept;

        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

        void release() noexcept;
        [[nodiscard]] bool held() const noexcept { return gate_ != nullptr; }

    private:
        friend class AdmissionGate;
        explicit Slot(AdmissionGate* gate) : gate_(gate) {}

        AdmissionGate* gate_{nullptr};
    };

    explicit AdmissionGate(std::size_t permits);

    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;

    // Blocks until a permit is free.
    [[nodiscard]] Slot acquire();

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] std::size_t inUse() const;

private:
    void release() noexcept;

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t in_use_{0};
};

} // namespace parafetch
