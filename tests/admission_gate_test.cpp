#include "parafetch/admission_gate.hpp"
#include "parafetch/errors.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

namespace parafetch {
namespace {

TEST(AdmissionGateTest, RejectsZeroPermits) {
    EXPECT_THROW(AdmissionGate{0}, ConfigError);
}

TEST(AdmissionGateTest, SlotReleasesOnDestruction) {
    AdmissionGate gate(2);
    EXPECT_EQ(gate.capacity(), 2u);
    {
        auto first = gate.acquire();
        auto second = gate.acquire();
        EXPECT_EQ(gate.inUse(), 2u);
        EXPECT_TRUE(first.held());
    }
    EXPECT_EQ(gate.inUse(), 0u);
}

TEST(AdmissionGateTest, MovedSlotReleasesOnce) {
    AdmissionGate gate(1);
    auto slot = gate.acquire();
    AdmissionGate::Slot moved = std::move(slot);
    EXPECT_FALSE(slot.held());
    EXPECT_TRUE(moved.held());
    moved.release();
    moved.release();
    EXPECT_EQ(gate.inUse(), 0u);
}

TEST(AdmissionGateTest, NeverAdmitsMoreThanCapacity) {
    constexpr std::size_t kPermits = 3;
    AdmissionGate gate(kPermits);
    std::atomic<std::size_t> active{0};
    std::atomic<std::size_t> peak{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 12; ++i) {
        threads.emplace_back([&] {
            auto slot = gate.acquire();
            const auto now = ++active;
            auto seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            --active;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_LE(peak.load(), kPermits);
    EXPECT_GE(peak.load(), 1u);
    EXPECT_EQ(gate.inUse(), 0u);
}

} // namespace
} // namespace parafetch
