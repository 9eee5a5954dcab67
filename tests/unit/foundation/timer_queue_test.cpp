/// @file timer_queue_test.cpp
/// @brief Unit tests for TimerQueue.

#include <gtest/gtest.h>

#include <chrono>
#include <vector>

#include "nrt/foundation/timer_queue.hpp"

using namespace nrt::foundation;
using std::chrono::milliseconds;

TEST(TimerQueueTest, RunsOnlyWhenDue) {
    TimerQueue timers;
    int fired = 0;
    timers.schedule(milliseconds(100), [&] { ++fired; });

    EXPECT_EQ(timers.advance(milliseconds(99)), 0u);
    EXPECT_EQ(fired, 0);
    EXPECT_EQ(timers.advance(milliseconds(1)), 1u);
    EXPECT_EQ(fired, 1);
    EXPECT_EQ(timers.pendingCount(), 0u);
    EXPECT_EQ(timers.now(), milliseconds(100));
}

TEST(TimerQueueTest, DueOrderThenFifo) {
    TimerQueue timers;
    std::vector<int> order;
    timers.schedule(milliseconds(50), [&] { order.push_back(3); });
    timers.schedule(milliseconds(10), [&] { order.push_back(1); });
    timers.schedule(milliseconds(10), [&] { order.push_back(2); });

    timers.advance(milliseconds(100));
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(TimerQueueTest, NegativeDelayCountsAsZero) {
    TimerQueue timers;
    bool fired = false;
    timers.schedule(milliseconds(-20), [&] { fired = true; });
    EXPECT_EQ(timers.runDue(), 1u);
    EXPECT_TRUE(fired);
}

TEST(TimerQueueTest, CancelPendingTimer) {
    TimerQueue timers;
    bool fired = false;
    auto id = timers.schedule(milliseconds(10), [&] { fired = true; });

    EXPECT_TRUE(timers.cancel(id));
    EXPECT_FALSE(timers.cancel(id));
    timers.advance(milliseconds(20));
    EXPECT_FALSE(fired);
}

TEST(TimerQueueTest, ZeroDelayScheduledFromCallbackRunsSameAdvance) {
    TimerQueue timers;
    std::vector<int> order;
    timers.schedule(milliseconds(5), [&] {
        order.push_back(1);
        timers.schedule(milliseconds(0), [&] { order.push_back(2); });
    });

    EXPECT_EQ(timers.advance(milliseconds(5)), 2u);
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST(TimerQueueTest, CallbackScheduledPastTargetWaits) {
    TimerQueue timers;
    int fired = 0;
    timers.schedule(milliseconds(5), [&] {
        timers.schedule(milliseconds(100), [&] { ++fired; });
    });

    timers.advance(milliseconds(10));
    EXPECT_EQ(fired, 0);
    EXPECT_EQ(timers.pendingCount(), 1u);

    timers.advance(milliseconds(95));
    EXPECT_EQ(fired, 1);
}

TEST(TimerQueueTest, DrainRunsEverything) {
    TimerQueue timers;
    int fired = 0;
    timers.schedule(milliseconds(1000), [&] { ++fired; });
    timers.schedule(milliseconds(5000), [&] { ++fired; });

    EXPECT_EQ(timers.drain(), 2u);
    EXPECT_EQ(fired, 2);
    EXPECT_EQ(timers.now(), milliseconds(5000));
}

TEST(TimerQueueTest, ClearDropsPending) {
    TimerQueue timers;
    timers.schedule(milliseconds(1), [] {});
    timers.schedule(milliseconds(2), [] {});
    timers.clear();
    EXPECT_EQ(timers.pendingCount(), 0u);
    EXPECT_EQ(timers.advance(milliseconds(10)), 0u);
}
