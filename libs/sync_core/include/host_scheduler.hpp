#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace motium::sync {

/// What a job reports back to the host after a firing
enum class JobResult {
    SUCCESS = 0,
    RETRY = 1,    // transient failure, host retries with backoff
    FAILURE = 2   // give up on this firing
};

enum class JobState {
    NOT_SCHEDULED = 0,
    ENQUEUED = 1,
    RUNNING = 2,
    SUCCEEDED = 3,
    FAILED = 4,
    CANCELLED = 5
};

/// What happens when a unique job name is registered again
enum class ExistingJobPolicy {
    KEEP = 0,    // leave the existing schedule and its phase alone
    REPLACE = 1
};

struct JobConstraints {
    bool requires_network = false;
};

struct PeriodicJobSpec {
    std::chrono::milliseconds repeat_interval{0};
    JobConstraints constraints;
};

using JobFunction = std::function<JobResult()>;

const char* job_result_to_string(JobResult result);
const char* job_state_to_string(JobState state);

/// Platform scheduler for work that must run whether or not the
/// application is in the foreground. Adapters enforce their own minimum
/// periodic interval and reject anything shorter.
class HostScheduler {
public:
    virtual ~HostScheduler() = default;

    virtual bool enqueue_unique_periodic(const std::string& name,
                                         const PeriodicJobSpec& spec,
                                         ExistingJobPolicy policy,
                                         JobFunction job) = 0;

    /// Run once as soon as the constraints allow
    virtual bool enqueue_unique_one_shot(const std::string& name,
                                         const JobConstraints& constraints,
                                         JobFunction job) = 0;

    /// Cancel future firings. A firing already running completes.
    virtual bool cancel_unique(const std::string& name) = 0;

    virtual JobState status(const std::string& name) const = 0;
};

}  // namespace motium::sync
