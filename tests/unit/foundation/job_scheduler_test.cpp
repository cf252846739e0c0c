#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "gcb/foundation/error_code.hpp"
#include "gcb/foundation/gateway_error.hpp"
#include "gcb/foundation/job_scheduler.hpp"

using namespace gcb::foundation;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// JobScheduler: one-shot jobs
// ---------------------------------------------------------------------------

TEST(JobSchedulerTest, ScheduleAndWaitSingleJob) {
    JobScheduler scheduler(2);
    std::atomic<bool> executed{false};

    auto result = scheduler.schedule([&] { executed.store(true); });
    ASSERT_TRUE(result.hasValue());

    auto waitResult = scheduler.wait(result.value());
    EXPECT_TRUE(waitResult.hasValue());
    EXPECT_TRUE(executed.load());
}

TEST(JobSchedulerTest, ManyJobsAllRunWithUniqueIds) {
    JobScheduler scheduler(4);
    constexpr int kJobs = 50;
    std::atomic<int> counter{0};

    std::set<JobScheduler::JobId> ids;
    for (int i = 0; i < kJobs; ++i) {
        auto priority = (i % 2 == 0) ? JobPriority::High : JobPriority::Low;
        auto result = scheduler.schedule([&] { counter.fetch_add(1); }, priority);
        ASSERT_TRUE(result.hasValue());
        ids.insert(result.value());
    }
    EXPECT_EQ(ids.size(), static_cast<std::size_t>(kJobs));

    for (auto id : ids) {
        EXPECT_TRUE(scheduler.wait(id).hasValue());
    }
    EXPECT_EQ(counter.load(), kJobs);
}

TEST(JobSchedulerTest, ThrowingJobSurfacesThroughWait) {
    JobScheduler scheduler(1);
    auto result = scheduler.schedule([] { throw std::runtime_error("dial exploded"); });
    ASSERT_TRUE(result.hasValue());

    auto waitResult = scheduler.wait(result.value());
    ASSERT_TRUE(waitResult.hasError());
    EXPECT_EQ(waitResult.error().code(), ErrorCode::ThreadError);
    EXPECT_NE(waitResult.error().message().find("dial exploded"), std::string::npos);
}

TEST(JobSchedulerTest, WaitOnUnknownJobIsJobNotFound) {
    JobScheduler scheduler(1);
    auto result = scheduler.wait(99999);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::JobNotFound);
    EXPECT_EQ(result.error().subsystem(), "Thread");
}

// ---------------------------------------------------------------------------
// JobScheduler: cancel
// ---------------------------------------------------------------------------

TEST(JobSchedulerTest, CancelPreventsQueuedJobFromRunning) {
    JobScheduler scheduler(1);
    std::atomic<bool> release{false};
    std::atomic<bool> targetExecuted{false};

    auto blocker = scheduler.schedule([&] {
        while (!release.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(1ms);
        }
    });
    ASSERT_TRUE(blocker.hasValue());

    auto target = scheduler.schedule([&] { targetExecuted.store(true); });
    ASSERT_TRUE(target.hasValue());
    EXPECT_TRUE(scheduler.cancel(target.value()).hasValue());

    release.store(true, std::memory_order_release);
    scheduler.wait(blocker.value());
    scheduler.wait(target.value());

    EXPECT_FALSE(targetExecuted.load());
}

TEST(JobSchedulerTest, CancelCompletedJobIsJobCancelled) {
    JobScheduler scheduler(2);
    auto result = scheduler.schedule([] {});
    ASSERT_TRUE(result.hasValue());
    scheduler.wait(result.value());

    auto cancelResult = scheduler.cancel(result.value());
    ASSERT_TRUE(cancelResult.hasError());
    EXPECT_EQ(cancelResult.error().code(), ErrorCode::JobCancelled);
}

TEST(JobSchedulerTest, CancelUnknownJobIsJobNotFound) {
    JobScheduler scheduler(2);
    auto result = scheduler.cancel(424242);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::JobNotFound);
}

// ---------------------------------------------------------------------------
// JobScheduler: tick jobs
// ---------------------------------------------------------------------------

TEST(JobSchedulerTest, TickJobFiresOncePerElapsedInterval) {
    JobScheduler scheduler(2);
    std::atomic<int> ticks{0};

    auto result = scheduler.scheduleTick(50ms, [&] { ticks.fetch_add(1); });
    ASSERT_TRUE(result.hasValue());

    for (int i = 0; i < 3; ++i) {
        scheduler.processTick(50ms);
        std::this_thread::sleep_for(30ms);
    }
    std::this_thread::sleep_for(50ms);

    EXPECT_GE(ticks.load(), 3);
}

TEST(JobSchedulerTest, TickJobDoesNotFireBeforeInterval) {
    JobScheduler scheduler(2);
    std::atomic<int> ticks{0};

    ASSERT_TRUE(scheduler.scheduleTick(100ms, [&] { ticks.fetch_add(1); }).hasValue());
    scheduler.processTick(30ms);
    std::this_thread::sleep_for(50ms);

    EXPECT_EQ(ticks.load(), 0);
}

TEST(JobSchedulerTest, NonPositiveTickIntervalIsInvalidArgument) {
    JobScheduler scheduler(1);
    auto result = scheduler.scheduleTick(0ms, [] {});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST(JobSchedulerTest, CancelledTickJobStopsFiring) {
    JobScheduler scheduler(2);
    std::atomic<int> ticks{0};

    auto result = scheduler.scheduleTick(20ms, [&] { ticks.fetch_add(1); });
    ASSERT_TRUE(result.hasValue());
    EXPECT_TRUE(scheduler.cancel(result.value()).hasValue());

    scheduler.processTick(20ms);
    scheduler.processTick(20ms);
    std::this_thread::sleep_for(50ms);

    EXPECT_EQ(ticks.load(), 0);
}

// ---------------------------------------------------------------------------
// JobScheduler: shutdown
// ---------------------------------------------------------------------------

TEST(JobSchedulerTest, ScheduleAfterShutdownFails) {
    JobScheduler scheduler(2);
    scheduler.shutdown();
    scheduler.shutdown();

    auto result = scheduler.schedule([] {});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::JobScheduleFailed);
}

TEST(JobSchedulerTest, PendingJobsCountsUnfinishedWork) {
    JobScheduler scheduler(1);
    std::atomic<bool> release{false};

    auto blocker = scheduler.schedule([&] {
        while (!release.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(1ms);
        }
    });
    ASSERT_TRUE(blocker.hasValue());
    EXPECT_GE(scheduler.pendingJobs(), 1u);

    release.store(true, std::memory_order_release);
    ASSERT_TRUE(scheduler.wait(blocker.value()).hasValue());
    EXPECT_EQ(scheduler.pendingJobs(), 0u);
}
