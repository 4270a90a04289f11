#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <thread>
#include <vector>

#include "cpr/foundation/error_code.hpp"
#include "cpr/foundation/job_scheduler.hpp"

using namespace cpr::foundation;

// ===========================================================================
// Construction
// ===========================================================================

TEST(JobSchedulerTest, CustomThreadCount) {
    JobScheduler scheduler(2);
    EXPECT_EQ(scheduler.workerCount(), 2u);
}

TEST(JobSchedulerTest, MoveConstruction) {
    JobScheduler a(1);
    JobScheduler b(std::move(a));
    EXPECT_EQ(b.workerCount(), 1u);
}

// ===========================================================================
// schedule / wait
// ===========================================================================

TEST(JobSchedulerTest, ScheduleAndWaitSingleJob) {
    JobScheduler scheduler(2);
    std::atomic<bool> ran{false};

    auto id = scheduler.schedule([&] { ran = true; });
    ASSERT_TRUE(id.hasValue());
    ASSERT_TRUE(scheduler.wait(id.value()).hasValue());
    EXPECT_TRUE(ran.load());
}

TEST(JobSchedulerTest, IdsAreUnique) {
    JobScheduler scheduler(2);
    auto a = scheduler.schedule([] {});
    auto b = scheduler.schedule([] {}, JobPriority::High);
    ASSERT_TRUE(a.hasValue());
    ASSERT_TRUE(b.hasValue());
    EXPECT_NE(a.value(), b.value());
    EXPECT_TRUE(scheduler.wait(a.value()).hasValue());
    EXPECT_TRUE(scheduler.wait(b.value()).hasValue());
}

TEST(JobSchedulerTest, WaitUnknownJobFails) {
    JobScheduler scheduler(1);
    auto r = scheduler.wait(424242);
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::JobNotFound);
}

TEST(JobSchedulerTest, ThrowingJobReportsThreadError) {
    JobScheduler scheduler(1);
    auto id = scheduler.schedule([] { throw std::runtime_error("bad manifest"); });
    ASSERT_TRUE(id.hasValue());
    auto r = scheduler.wait(id.value());
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::ThreadError);
}

// ===========================================================================
// runAll
// ===========================================================================

TEST(JobSchedulerTest, RunAllCompletesEveryJob) {
    JobScheduler scheduler(3);
    std::atomic<int> count{0};
    std::vector<JobScheduler::JobFunc> jobs;
    for (int i = 0; i < 20; ++i) {
        jobs.emplace_back([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            ++count;
        });
    }

    ASSERT_TRUE(scheduler.runAll(std::move(jobs)).hasValue());
    EXPECT_EQ(count.load(), 20);
}

TEST(JobSchedulerTest, RunAllWaitsForAllBeforeReportingFailure) {
    JobScheduler scheduler(2);
    std::atomic<int> count{0};
    std::vector<JobScheduler::JobFunc> jobs;
    jobs.emplace_back([] { throw std::runtime_error("first"); });
    for (int i = 0; i < 5; ++i) {
        jobs.emplace_back([&] { ++count; });
    }

    auto r = scheduler.runAll(std::move(jobs));
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(count.load(), 5);
}
