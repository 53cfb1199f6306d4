#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "connectivity_monitor.hpp"
#include "host_scheduler.hpp"

namespace motium::sync {

struct ThreadHostSchedulerConfig {
    std::chrono::milliseconds min_periodic_interval{std::chrono::minutes(15)};
    std::chrono::milliseconds initial_backoff{30000};
    std::chrono::milliseconds max_backoff{std::chrono::hours(5)};
};

/// In-process HostScheduler: one worker thread per unique job.
///
/// Registrations live only as long as the process; a platform adapter is
/// needed for schedules that survive restarts. Network constraints wait on
/// the ConnectivityMonitor (no monitor means always satisfied).
class ThreadHostScheduler : public HostScheduler {
public:
    explicit ThreadHostScheduler(std::shared_ptr<ConnectivityMonitor> connectivity,
                                 ThreadHostSchedulerConfig config = ThreadHostSchedulerConfig{});
    ~ThreadHostScheduler() override;

    ThreadHostScheduler(const ThreadHostScheduler&) = delete;
    ThreadHostScheduler& operator=(const ThreadHostScheduler&) = delete;

    bool enqueue_unique_periodic(const std::string& name,
                                 const PeriodicJobSpec& spec,
                                 ExistingJobPolicy policy,
                                 JobFunction job) override;

    bool enqueue_unique_one_shot(const std::string& name,
                                 const JobConstraints& constraints,
                                 JobFunction job) override;

    bool cancel_unique(const std::string& name) override;

    JobState status(const std::string& name) const override;

    /// Result of the most recent firing of `name`
    std::optional<JobResult> last_result(const std::string& name) const;

    /// Number of completed firings of `name`, retries included
    uint64_t run_count(const std::string& name) const;

    std::chrono::milliseconds backoff_for_attempt(int attempt) const;

    /// Cancel everything and join the worker threads
    void shutdown();

private:
    struct Job {
        std::string name;
        bool periodic = false;
        std::chrono::milliseconds interval{0};
        JobConstraints constraints;
        JobFunction fn;

        std::atomic<JobState> state{JobState::ENQUEUED};
        std::atomic<bool> cancelled{false};
        std::atomic<bool> finished{false};
        std::atomic<uint64_t> runs{0};
        std::atomic<int> last_result{-1};

        std::mutex mutex;
        std::condition_variable cv;
        std::thread thread;
    };

    bool submit(std::shared_ptr<Job> job, ExistingJobPolicy policy);
    void run_job(const std::shared_ptr<Job>& job);
    bool wait_for_constraints(const std::shared_ptr<Job>& job);
    bool sleep_unless_cancelled(const std::shared_ptr<Job>& job,
                                std::chrono::milliseconds duration);
    JobResult invoke(const std::shared_ptr<Job>& job);
    void reap_retired();
    std::shared_ptr<Job> find(const std::string& name) const;

    std::shared_ptr<ConnectivityMonitor> connectivity_;
    ThreadHostSchedulerConfig config_;
    uint64_t listener_id_ = 0;

    mutable std::mutex jobs_mutex_;
    std::map<std::string, std::shared_ptr<Job>> jobs_;
    std::vector<std::shared_ptr<Job>> retired_;
    bool shut_down_ = false;
};

}  // namespace motium::sync
