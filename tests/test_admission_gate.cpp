#include <gtest/gtest.h>
#include "admission_gate.hpp"
#include "test_support.hpp"
#include <atomic>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

namespace thumbgrid {

class AdmissionGateTest : public ::testing::Test {
protected:
    AdmissionGate gate_{2};
};

TEST_F(AdmissionGateTest, RejectsZeroCapacity) {
    EXPECT_THROW(AdmissionGate(0), std::invalid_argument);
}

TEST_F(AdmissionGateTest, SlotsReleaseOnDestruction) {
    {
        auto a = gate_.acquire();
        auto b = gate_.acquire();
        ASSERT_TRUE(a && b);
        EXPECT_EQ(gate_.in_use(), 2);
    }
    EXPECT_EQ(gate_.in_use(), 0);
    EXPECT_EQ(gate_.total_acquired(), 2u);
    EXPECT_EQ(gate_.total_released(), 2u);
}

TEST_F(AdmissionGateTest, MovedSlotReleasesOnce) {
    auto slot = gate_.acquire();
    ASSERT_TRUE(slot);
    AdmissionGate::Slot moved = std::move(*slot);
    slot.reset();
    EXPECT_EQ(gate_.in_use(), 1);

    moved.release();
    moved.release();
    EXPECT_EQ(gate_.in_use(), 0);
    EXPECT_EQ(gate_.total_released(), 1u);
}

TEST_F(AdmissionGateTest, WaiterGetsReleasedSlot) {
    auto a = gate_.acquire();
    auto b = gate_.acquire();

    auto waiter = std::async(std::launch::async, [this] { return gate_.acquire().has_value(); });
    ASSERT_TRUE(test::wait_until([this] { return gate_.waiting() == 1; }));
    EXPECT_EQ(gate_.in_use(), 2);

    a.reset();
    EXPECT_TRUE(waiter.get());
    EXPECT_EQ(gate_.peak_in_use(), 2);
    EXPECT_EQ(gate_.waiting(), 0u);
}

TEST_F(AdmissionGateTest, WaitersAreServedInArrivalOrder) {
    AdmissionGate gate(1);
    auto held = gate.acquire();

    std::vector<int> order;
    std::mutex order_mutex;
    std::vector<std::thread> threads;
    for (int i = 0; i < 3; ++i) {
        threads.emplace_back([&, i] {
            auto slot = gate.acquire();
            std::lock_guard<std::mutex> lock(order_mutex);
            order.push_back(i);
        });
        ASSERT_TRUE(test::wait_until([&] { return gate.waiting() == static_cast<size_t>(i + 1); }));
    }

    held.reset();
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2}));
}

TEST_F(AdmissionGateTest, CancelAllReleasesWaitersWithoutSlots) {
    auto a = gate_.acquire();
    auto b = gate_.acquire();

    auto first = std::async(std::launch::async, [this] { return gate_.acquire().has_value(); });
    auto second = std::async(std::launch::async, [this] { return gate_.acquire().has_value(); });
    ASSERT_TRUE(test::wait_until([this] { return gate_.waiting() == 2; }));

    gate_.cancel_all();
    EXPECT_FALSE(first.get());
    EXPECT_FALSE(second.get());
    EXPECT_EQ(gate_.waiting(), 0u);

    // Held slots are unaffected and still release cleanly.
    EXPECT_EQ(gate_.in_use(), 2);
    a.reset();
    b.reset();
    EXPECT_EQ(gate_.in_use(), 0);

    EXPECT_FALSE(gate_.acquire().has_value());
    gate_.reset();
    EXPECT_TRUE(gate_.acquire().has_value());
}

TEST_F(AdmissionGateTest, CancelledTokenAbandonsWait) {
    auto a = gate_.acquire();
    auto b = gate_.acquire();
    CancellationToken token;

    auto waiter = std::async(std::launch::async, [&] { return gate_.acquire(token).has_value(); });
    ASSERT_TRUE(test::wait_until([this] { return gate_.waiting() == 1; }));

    token.cancel();
    gate_.interrupt();
    EXPECT_FALSE(waiter.get());
    EXPECT_EQ(gate_.waiting(), 0u);
    EXPECT_EQ(gate_.in_use(), 2);
}

TEST_F(AdmissionGateTest, ConcurrentUseNeverExceedsCapacity) {
    std::atomic<int> inside{0};
    std::atomic<int> worst{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 5; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 50; ++i) {
                auto slot = gate_.acquire();
                ASSERT_TRUE(slot.has_value());
                int now = ++inside;
                int seen = worst.load();
                while (now > seen && !worst.compare_exchange_weak(seen, now)) {
                }
                std::this_thread::yield();
                --inside;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_LE(worst.load(), 2);
    EXPECT_LE(gate_.peak_in_use(), 2);
    EXPECT_EQ(gate_.total_acquired(), 250u);
    EXPECT_EQ(gate_.total_released(), 250u);
    EXPECT_EQ(gate_.in_use(), 0);
}

} // namespace thumbgrid
