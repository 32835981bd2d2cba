/*
 * Unit tests for task handles, subscription handles and the manual test clock
 * Tests: TaskHandle, SubscriptionHandle, ManualScheduler
 */

#include <gtest/gtest.h>
#include <memory>
#include <utility>
#include <vector>
#include "RunSessionCore/capabilities.hpp"
#include "RunSessionCore/scheduler.hpp"
#include "manual_scheduler.hpp"

// ============================================================================
// Test Suite: Scheduler_TaskHandle
// ============================================================================

TEST(Scheduler_TaskHandle, DefaultHandleIsNotPending) {
    TaskHandle handle;
    EXPECT_FALSE(handle.is_pending());
    handle.cancel();  // No-op
    EXPECT_FALSE(handle.is_pending());
}

TEST(Scheduler_TaskHandle, CancelReleasesOnce) {
    auto token = std::make_shared<TaskToken>();
    int releases = 0;
    token->release = [&releases]() { ++releases; };

    TaskHandle handle(token);
    EXPECT_TRUE(handle.is_pending());

    handle.cancel();
    handle.cancel();
    EXPECT_FALSE(handle.is_pending());
    EXPECT_TRUE(token->cancelled);
    EXPECT_EQ(releases, 1);
}

TEST(Scheduler_TaskHandle, CopiesShareToken) {
    auto token = std::make_shared<TaskToken>();
    TaskHandle first(token);
    TaskHandle second = first;

    second.cancel();
    EXPECT_FALSE(first.is_pending());
}

TEST(Scheduler_TaskHandle, FinishedTaskIsNotPending) {
    auto token = std::make_shared<TaskToken>();
    TaskHandle handle(token);
    token->finished = true;
    EXPECT_FALSE(handle.is_pending());
}

// ============================================================================
// Test Suite: Scheduler_SubscriptionHandle
// ============================================================================

TEST(Scheduler_SubscriptionHandle, DestructionUnsubscribes) {
    int calls = 0;
    {
        SubscriptionHandle handle([&calls]() { ++calls; });
        EXPECT_TRUE(handle.is_active());
    }
    EXPECT_EQ(calls, 1);
}

TEST(Scheduler_SubscriptionHandle, UnsubscribeIsIdempotent) {
    int calls = 0;
    SubscriptionHandle handle([&calls]() { ++calls; });

    handle.unsubscribe();
    handle.unsubscribe();
    EXPECT_FALSE(handle.is_active());
    EXPECT_EQ(calls, 1);
}

TEST(Scheduler_SubscriptionHandle, MoveTransfersOwnership) {
    int calls = 0;
    SubscriptionHandle source([&calls]() { ++calls; });
    SubscriptionHandle moved(std::move(source));

    EXPECT_FALSE(source.is_active());
    EXPECT_TRUE(moved.is_active());

    source.unsubscribe();
    EXPECT_EQ(calls, 0);
    moved.unsubscribe();
    EXPECT_EQ(calls, 1);
}

TEST(Scheduler_SubscriptionHandle, MoveAssignmentReleasesPrevious) {
    int first_calls = 0;
    int second_calls = 0;
    SubscriptionHandle handle([&first_calls]() { ++first_calls; });

    handle = SubscriptionHandle([&second_calls]() { ++second_calls; });
    EXPECT_EQ(first_calls, 1);
    EXPECT_EQ(second_calls, 0);

    handle.unsubscribe();
    EXPECT_EQ(second_calls, 1);
}

// ============================================================================
// Test Suite: Scheduler_ManualClock
// ============================================================================

TEST(Scheduler_ManualClock, OneShotRunsOnceAtDeadline) {
    ManualScheduler scheduler(0);
    int runs = 0;
    TaskHandle handle = scheduler.schedule_once(std::chrono::milliseconds(100), [&runs]() { ++runs; });

    scheduler.advance(99);
    EXPECT_EQ(runs, 0);
    EXPECT_TRUE(handle.is_pending());

    scheduler.advance(1);
    EXPECT_EQ(runs, 1);
    EXPECT_FALSE(handle.is_pending());

    scheduler.advance(1000);
    EXPECT_EQ(runs, 1);
}

TEST(Scheduler_ManualClock, PeriodicRunsUntilCancelled) {
    ManualScheduler scheduler(0);
    std::vector<int64_t> times;
    TaskHandle handle = scheduler.schedule_periodic(std::chrono::milliseconds(50),
        [&]() { times.push_back(scheduler.now_ms()); });

    scheduler.advance(160);
    ASSERT_EQ(times.size(), 3U);
    EXPECT_EQ(times[0], 50);
    EXPECT_EQ(times[2], 150);

    handle.cancel();
    scheduler.advance(500);
    EXPECT_EQ(times.size(), 3U);
    EXPECT_EQ(scheduler.pending_count(), 0U);
}

TEST(Scheduler_ManualClock, TasksRunInDeadlineOrder) {
    ManualScheduler scheduler(0);
    std::vector<int> order;
    scheduler.schedule_once(std::chrono::milliseconds(30), [&order]() { order.push_back(3); });
    scheduler.schedule_once(std::chrono::milliseconds(10), [&order]() { order.push_back(1); });
    scheduler.schedule_once(std::chrono::milliseconds(20), [&order]() { order.push_back(2); });

    scheduler.advance(100);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}
