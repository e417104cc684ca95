/**
 * @file test_execution_slots.cpp
 * @brief Unit tests for the execution slot counter.
 */

#include "runner/execution_slots.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace code_sandbox;
using namespace std::chrono_literals;

TEST(ExecutionSlotsTest, AcquireUpToCapacity) {
    ExecutionSlots slots(2);
    auto a = slots.try_acquire_for(0ms);
    auto b = slots.try_acquire_for(0ms);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(slots.in_use(), 2u);
    EXPECT_FALSE(slots.try_acquire_for(0ms).has_value());
}

TEST(ExecutionSlotsTest, SlotReleasesOnDestruction) {
    ExecutionSlots slots(1);
    {
        auto held = slots.try_acquire_for(0ms);
        ASSERT_TRUE(held.has_value());
        EXPECT_EQ(slots.in_use(), 1u);
    }
    EXPECT_EQ(slots.in_use(), 0u);
    EXPECT_TRUE(slots.try_acquire_for(0ms).has_value());
}

TEST(ExecutionSlotsTest, MovedSlotReleasesOnce) {
    ExecutionSlots slots(1);
    auto first = slots.try_acquire_for(0ms);
    ASSERT_TRUE(first.has_value());
    {
        ExecutionSlots::Slot moved = std::move(*first);
        EXPECT_EQ(slots.in_use(), 1u);
    }
    EXPECT_EQ(slots.in_use(), 0u);
    first.reset();
    EXPECT_EQ(slots.in_use(), 0u);
}

TEST(ExecutionSlotsTest, TimedWaitSucceedsWhenReleased) {
    ExecutionSlots slots(1);
    auto held = slots.try_acquire_for(0ms);
    ASSERT_TRUE(held.has_value());

    std::jthread releaser([&held] {
        std::this_thread::sleep_for(20ms);
        held.reset();
    });
    auto next = slots.try_acquire_for(2000ms);
    EXPECT_TRUE(next.has_value());
}

TEST(ExecutionSlotsTest, TimedWaitGivesUp) {
    ExecutionSlots slots(1);
    auto held = slots.try_acquire_for(0ms);
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(slots.try_acquire_for(30ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 25ms);
}

TEST(ExecutionSlotsTest, AcquireReturnsNulloptOnStop) {
    ExecutionSlots slots(1);
    auto held = slots.try_acquire_for(0ms);
    std::stop_source source;

    std::jthread stopper([&source] {
        std::this_thread::sleep_for(20ms);
        source.request_stop();
    });
    EXPECT_FALSE(slots.acquire(source.get_token()).has_value());
}

TEST(ExecutionSlotsTest, ConcurrentUseNeverExceedsCapacity) {
    ExecutionSlots slots(3);
    std::atomic<int> failures{0};
    {
        std::vector<std::jthread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&slots, &failures] {
                for (int i = 0; i < 50; ++i) {
                    auto slot = slots.acquire(std::stop_token{});
                    if (!slot) ++failures;
                    std::this_thread::yield();
                }
            });
        }
    }
    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(slots.in_use(), 0u);
    EXPECT_LE(slots.peak(), 3u);
    EXPECT_GE(slots.peak(), 1u);
}
