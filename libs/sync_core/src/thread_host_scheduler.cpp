#include "thread_host_scheduler.hpp"

#include <algorithm>

#include <glog/logging.h>

namespace motium::sync {

const char* job_result_to_string(JobResult result) {
    switch (result) {
        case JobResult::SUCCESS: return "SUCCESS";
        case JobResult::RETRY: return "RETRY";
        case JobResult::FAILURE: return "FAILURE";
        default: return "UNKNOWN";
    }
}

const char* job_state_to_string(JobState state) {
    switch (state) {
        case JobState::NOT_SCHEDULED: return "NOT_SCHEDULED";
        case JobState::ENQUEUED: return "ENQUEUED";
        case JobState::RUNNING: return "RUNNING";
        case JobState::SUCCEEDED: return "SUCCEEDED";
        case JobState::FAILED: return "FAILED";
        case JobState::CANCELLED: return "CANCELLED";
        default: return "UNKNOWN";
    }
}

ThreadHostScheduler::ThreadHostScheduler(std::shared_ptr<ConnectivityMonitor> connectivity,
                                         ThreadHostSchedulerConfig config)
    : connectivity_(std::move(connectivity)), config_(config) {
    if (connectivity_) {
        listener_id_ = connectivity_->add_listener([this](bool available) {
            if (!available) {
                return;
            }
            std::vector<std::shared_ptr<Job>> waiting;
            {
                std::lock_guard<std::mutex> lock(jobs_mutex_);
                for (const auto& [name, job] : jobs_) {
                    waiting.push_back(job);
                }
            }
            for (const auto& job : waiting) {
                { std::lock_guard<std::mutex> lock(job->mutex); }
                job->cv.notify_all();
            }
        });
    }
}

ThreadHostScheduler::~ThreadHostScheduler() {
    if (connectivity_) {
        connectivity_->remove_listener(listener_id_);
    }
    shutdown();
}

bool ThreadHostScheduler::enqueue_unique_periodic(const std::string& name,
                                                  const PeriodicJobSpec& spec,
                                                  ExistingJobPolicy policy,
                                                  JobFunction fn) {
    if (spec.repeat_interval < config_.min_periodic_interval) {
        LOG(ERROR) << "Periodic job " << name << " rejected: interval "
                   << spec.repeat_interval.count() << " ms is below the "
                   << config_.min_periodic_interval.count() << " ms minimum";
        return false;
    }

    auto job = std::make_shared<Job>();
    job->name = name;
    job->periodic = true;
    job->interval = spec.repeat_interval;
    job->constraints = spec.constraints;
    job->fn = std::move(fn);
    return submit(job, policy);
}

bool ThreadHostScheduler::enqueue_unique_one_shot(const std::string& name,
                                                  const JobConstraints& constraints,
                                                  JobFunction fn) {
    auto job = std::make_shared<Job>();
    job->name = name;
    job->constraints = constraints;
    job->fn = std::move(fn);
    return submit(job, ExistingJobPolicy::KEEP);
}

bool ThreadHostScheduler::submit(std::shared_ptr<Job> job, ExistingJobPolicy policy) {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    if (shut_down_) {
        LOG(WARNING) << "Scheduler shut down, job " << job->name << " not scheduled";
        return false;
    }
    reap_retired();

    auto it = jobs_.find(job->name);
    if (it != jobs_.end()) {
        std::shared_ptr<Job> existing = it->second;
        bool active = !existing->cancelled && !existing->finished;
        if (active && policy == ExistingJobPolicy::KEEP) {
            VLOG(1) << "Job " << job->name << " already scheduled, keeping it";
            return true;
        }
        {
            std::lock_guard<std::mutex> job_lock(existing->mutex);
            existing->cancelled = true;
        }
        existing->cv.notify_all();
        retired_.push_back(existing);
    }

    jobs_[job->name] = job;
    job->thread = std::thread(&ThreadHostScheduler::run_job, this, job);
    LOG(INFO) << "Scheduled " << (job->periodic ? "periodic" : "one-shot") << " job "
              << job->name
              << (job->constraints.requires_network ? " (requires network)" : "");
    return true;
}

bool ThreadHostScheduler::cancel_unique(const std::string& name) {
    std::shared_ptr<Job> job = find(name);
    if (!job) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(job->mutex);
        job->cancelled = true;
    }
    job->cv.notify_all();
    LOG(INFO) << "Cancelled job " << name;
    return true;
}

JobState ThreadHostScheduler::status(const std::string& name) const {
    std::shared_ptr<Job> job = find(name);
    return job ? job->state.load() : JobState::NOT_SCHEDULED;
}

std::optional<JobResult> ThreadHostScheduler::last_result(const std::string& name) const {
    std::shared_ptr<Job> job = find(name);
    if (!job || job->last_result < 0) {
        return std::nullopt;
    }
    return static_cast<JobResult>(job->last_result.load());
}

uint64_t ThreadHostScheduler::run_count(const std::string& name) const {
    std::shared_ptr<Job> job = find(name);
    return job ? job->runs.load() : 0;
}

std::chrono::milliseconds ThreadHostScheduler::backoff_for_attempt(int attempt) const {
    auto backoff = config_.initial_backoff;
    for (int i = 1; i < attempt && backoff < config_.max_backoff; ++i) {
        backoff *= 2;
    }
    return std::min(backoff, config_.max_backoff);
}

void ThreadHostScheduler::run_job(const std::shared_ptr<Job>& job) {
    int attempt = 0;

    while (!job->cancelled) {
        job->state = JobState::ENQUEUED;
        if (!wait_for_constraints(job)) {
            break;
        }

        job->state = JobState::RUNNING;
        JobResult result = invoke(job);
        job->runs++;
        job->last_result = static_cast<int>(result);
        VLOG(1) << "Job " << job->name << " finished: " << job_result_to_string(result);

        if (result == JobResult::RETRY) {
            ++attempt;
            auto backoff = backoff_for_attempt(attempt);
            LOG(INFO) << "Job " << job->name << " will retry (attempt " << attempt
                      << ") in " << backoff.count() << " ms";
            job->state = JobState::ENQUEUED;
            if (!sleep_unless_cancelled(job, backoff)) {
                break;
            }
            continue;
        }
        attempt = 0;

        if (!job->periodic) {
            job->state = result == JobResult::SUCCESS ? JobState::SUCCEEDED : JobState::FAILED;
            job->finished = true;
            return;
        }

        job->state = JobState::ENQUEUED;
        if (!sleep_unless_cancelled(job, job->interval)) {
            break;
        }
    }

    job->state = JobState::CANCELLED;
    job->finished = true;
}

bool ThreadHostScheduler::wait_for_constraints(const std::shared_ptr<Job>& job) {
    if (!job->constraints.requires_network || !connectivity_) {
        return !job->cancelled;
    }

    std::unique_lock<std::mutex> lock(job->mutex);
    if (!connectivity_->is_network_available()) {
        VLOG(1) << "Job " << job->name << " deferred until network is available";
    }
    job->cv.wait(lock, [&] {
        return job->cancelled || connectivity_->is_network_available();
    });
    return !job->cancelled;
}

bool ThreadHostScheduler::sleep_unless_cancelled(const std::shared_ptr<Job>& job,
                                                 std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(job->mutex);
    job->cv.wait_for(lock, duration, [&] { return job->cancelled.load(); });
    return !job->cancelled;
}

JobResult ThreadHostScheduler::invoke(const std::shared_ptr<Job>& job) {
    try {
        return job->fn();
    } catch (const std::exception& e) {
        LOG(ERROR) << "Job " << job->name << " threw: " << e.what();
        return JobResult::FAILURE;
    }
}

void ThreadHostScheduler::reap_retired() {
    auto done = std::partition(retired_.begin(), retired_.end(),
                               [](const std::shared_ptr<Job>& job) { return !job->finished; });
    for (auto it = done; it != retired_.end(); ++it) {
        if ((*it)->thread.joinable()) {
            (*it)->thread.join();
        }
    }
    retired_.erase(done, retired_.end());
}

std::shared_ptr<ThreadHostScheduler::Job> ThreadHostScheduler::find(
    const std::string& name) const {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    auto it = jobs_.find(name);
    return it == jobs_.end() ? nullptr : it->second;
}

void ThreadHostScheduler::shutdown() {
    std::vector<std::shared_ptr<Job>> all;
    {
        std::lock_guard<std::mutex> lock(jobs_mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
        for (const auto& [name, job] : jobs_) {
            all.push_back(job);
        }
        all.insert(all.end(), retired_.begin(), retired_.end());
        retired_.clear();
    }

    for (const auto& job : all) {
        {
            std::lock_guard<std::mutex> lock(job->mutex);
            job->cancelled = true;
        }
        job->cv.notify_all();
    }
    for (const auto& job : all) {
        if (!job->thread.joinable()) {
            continue;
        }
        if (job->thread.get_id() == std::this_thread::get_id()) {
            job->thread.detach();
        } else {
            job->thread.join();
        }
    }
    LOG(INFO) << "Host scheduler stopped";
}

}  // namespace motium::sync
