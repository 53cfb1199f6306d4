/**
 * @file thread_host_scheduler_test.cpp
 * @brief Unit tests for the in-process host scheduler
 *
 * Intervals are shrunk to milliseconds so periodic firings, retries and
 * network constraints can be observed in real time.
 */

#include <gtest/gtest.h>
#include <glog/logging.h>

#include <atomic>

#include "connectivity_monitor.hpp"
#include "test_doubles.hpp"
#include "thread_host_scheduler.hpp"

using namespace motium::sync;

class ThreadHostSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::init_test_logging("thread_host_scheduler_test");

        ConnectivityConfig connectivity_config;
        connectivity_config.initially_available = true;
        connectivity_ = std::make_shared<ConnectivityMonitor>(connectivity_config,
                                                              [] { return true; });

        config_.min_periodic_interval = std::chrono::milliseconds(100);
        config_.initial_backoff = std::chrono::milliseconds(20);
        config_.max_backoff = std::chrono::milliseconds(80);
        scheduler_ = std::make_shared<ThreadHostScheduler>(connectivity_, config_);
    }

    void TearDown() override {
        scheduler_->shutdown();
    }

    PeriodicJobSpec spec(int64_t interval_ms, bool requires_network = false) {
        PeriodicJobSpec result;
        result.repeat_interval = std::chrono::milliseconds(interval_ms);
        result.constraints.requires_network = requires_network;
        return result;
    }

    ThreadHostSchedulerConfig config_;
    std::atomic<int> runs_{0};
    std::atomic<int> first_{0};
    std::atomic<int> second_{0};
    std::shared_ptr<ConnectivityMonitor> connectivity_;
    std::shared_ptr<ThreadHostScheduler> scheduler_;
};

// =============================================================================
// Periodic Jobs
// =============================================================================

TEST_F(ThreadHostSchedulerTest, IntervalBelowFloorIsRejected) {
    EXPECT_FALSE(scheduler_->enqueue_unique_periodic("job", spec(99), ExistingJobPolicy::KEEP,
                                                     [] { return JobResult::SUCCESS; }));
    EXPECT_EQ(scheduler_->status("job"), JobState::NOT_SCHEDULED);
}

TEST_F(ThreadHostSchedulerTest, PeriodicJobFiresRepeatedly) {
    ASSERT_TRUE(scheduler_->enqueue_unique_periodic("job", spec(100), ExistingJobPolicy::KEEP,
                                                    [this] {
                                                        runs_++;
                                                        return JobResult::SUCCESS;
                                                    }));

    EXPECT_TRUE(test::wait_until([this] { return runs_ >= 3; }));
    EXPECT_EQ(scheduler_->last_result("job"), JobResult::SUCCESS);
    EXPECT_GE(scheduler_->run_count("job"), 3u);
}

TEST_F(ThreadHostSchedulerTest, KeepPolicyLeavesExistingSchedule) {
    scheduler_->enqueue_unique_periodic("job", spec(100), ExistingJobPolicy::KEEP, [this] {
        first_++;
        return JobResult::SUCCESS;
    });
    ASSERT_TRUE(test::wait_until([this] { return first_ >= 1; }));

    EXPECT_TRUE(scheduler_->enqueue_unique_periodic("job", spec(100), ExistingJobPolicy::KEEP,
                                                    [this] {
                                                        second_++;
                                                        return JobResult::SUCCESS;
                                                    }));
    EXPECT_TRUE(test::wait_until([this] { return first_ >= 3; }));
    EXPECT_EQ(second_.load(), 0);
}

TEST_F(ThreadHostSchedulerTest, ReplacePolicySwapsJob) {
    scheduler_->enqueue_unique_periodic("job", spec(100), ExistingJobPolicy::KEEP, [this] {
        first_++;
        return JobResult::SUCCESS;
    });
    ASSERT_TRUE(test::wait_until([this] { return first_ >= 1; }));

    scheduler_->enqueue_unique_periodic("job", spec(100), ExistingJobPolicy::REPLACE, [this] {
        second_++;
        return JobResult::SUCCESS;
    });
    EXPECT_TRUE(test::wait_until([this] { return second_ >= 2; }));
    int first_runs = first_;
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    EXPECT_EQ(first_.load(), first_runs);
}

TEST_F(ThreadHostSchedulerTest, CancelStopsFutureFirings) {
    scheduler_->enqueue_unique_periodic("job", spec(100), ExistingJobPolicy::KEEP, [this] {
        runs_++;
        return JobResult::SUCCESS;
    });
    ASSERT_TRUE(test::wait_until([this] { return runs_ >= 1; }));

    EXPECT_TRUE(scheduler_->cancel_unique("job"));
    EXPECT_TRUE(test::wait_until(
        [this] { return scheduler_->status("job") == JobState::CANCELLED; }));
    int after_cancel = runs_;
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    EXPECT_EQ(runs_.load(), after_cancel);
    EXPECT_FALSE(scheduler_->cancel_unique("unknown"));
}

// =============================================================================
// Retry and Failure
// =============================================================================

TEST_F(ThreadHostSchedulerTest, BackoffDoublesFromInitialToCap) {
    EXPECT_EQ(scheduler_->backoff_for_attempt(1).count(), 20);
    EXPECT_EQ(scheduler_->backoff_for_attempt(2).count(), 40);
    EXPECT_EQ(scheduler_->backoff_for_attempt(3).count(), 80);
    EXPECT_EQ(scheduler_->backoff_for_attempt(10).count(), 80);

    ThreadHostScheduler defaults(nullptr);
    EXPECT_EQ(defaults.backoff_for_attempt(1), std::chrono::seconds(30));
    EXPECT_EQ(defaults.backoff_for_attempt(30), std::chrono::hours(5));
}

TEST_F(ThreadHostSchedulerTest, RetryRunsAgainBeforeInterval) {
    PeriodicJobSpec slow = spec(60000);
    scheduler_->enqueue_unique_periodic("job", slow, ExistingJobPolicy::KEEP, [this] {
        return ++runs_ < 3 ? JobResult::RETRY : JobResult::SUCCESS;
    });

    // Two backoffs of 20 and 40 ms, far below the one-minute interval
    EXPECT_TRUE(test::wait_until([this] { return runs_ >= 3; }, std::chrono::seconds(2)));
    EXPECT_TRUE(test::wait_until(
        [this] { return scheduler_->last_result("job") == JobResult::SUCCESS; }));
}

TEST_F(ThreadHostSchedulerTest, ThrowingJobCountsAsFailure) {
    ASSERT_TRUE(scheduler_->enqueue_unique_one_shot("once", JobConstraints{}, []() -> JobResult {
        throw std::runtime_error("boom");
    }));

    EXPECT_TRUE(test::wait_until(
        [this] { return scheduler_->status("once") == JobState::FAILED; }));
    EXPECT_EQ(scheduler_->last_result("once"), JobResult::FAILURE);
}

// =============================================================================
// One-shot Jobs and Constraints
// =============================================================================

TEST_F(ThreadHostSchedulerTest, OneShotRunsOnce) {
    scheduler_->enqueue_unique_one_shot("once", JobConstraints{}, [this] {
        runs_++;
        return JobResult::SUCCESS;
    });

    EXPECT_TRUE(test::wait_until(
        [this] { return scheduler_->status("once") == JobState::SUCCEEDED; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(runs_.load(), 1);
}

TEST_F(ThreadHostSchedulerTest, NetworkConstraintDefersUntilOnline) {
    connectivity_->set_network_available(false);
    JobConstraints constraints;
    constraints.requires_network = true;
    scheduler_->enqueue_unique_one_shot("once", constraints, [this] {
        runs_++;
        return JobResult::SUCCESS;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    EXPECT_EQ(runs_.load(), 0);
    EXPECT_EQ(scheduler_->status("once"), JobState::ENQUEUED);

    connectivity_->set_network_available(true);
    EXPECT_TRUE(test::wait_until([this] { return runs_ == 1; }));
}

TEST_F(ThreadHostSchedulerTest, ShutdownReleasesWaitingJobs) {
    connectivity_->set_network_available(false);
    JobConstraints constraints;
    constraints.requires_network = true;
    scheduler_->enqueue_unique_one_shot("once", constraints, [] { return JobResult::SUCCESS; });

    scheduler_->shutdown();
    EXPECT_EQ(scheduler_->status("once"), JobState::CANCELLED);
    EXPECT_FALSE(scheduler_->enqueue_unique_one_shot("late", JobConstraints{},
                                                     [] { return JobResult::SUCCESS; }));
}

TEST_F(ThreadHostSchedulerTest, JobStateNames) {
    EXPECT_STREQ(job_state_to_string(JobState::ENQUEUED), "ENQUEUED");
    EXPECT_STREQ(job_result_to_string(JobResult::RETRY), "RETRY");
}
