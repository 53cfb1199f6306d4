#include "background_scheduler.hpp"

#include <glog/logging.h>

namespace motium::sync {

SessionRefreshJob::SessionRefreshJob(std::shared_ptr<SessionStore> session_store,
                                     std::shared_ptr<TokenRefreshCoordinator> token_coordinator,
                                     int expiring_threshold_minutes)
    : session_store_(std::move(session_store)),
      token_coordinator_(std::move(token_coordinator)),
      expiring_threshold_minutes_(expiring_threshold_minutes) {}

JobResult SessionRefreshJob::run() {
    try {
        if (!session_store_->has_session()) {
            VLOG(1) << "No session, nothing to refresh";
            return JobResult::SUCCESS;
        }

        RefreshOutcome outcome;
        if (session_store_->is_token_expired()) {
            LOG(WARNING) << "Access token expired, forcing refresh";
            outcome = token_coordinator_->refresh(/*force=*/true);
        } else if (session_store_->is_token_expiring_soon(expiring_threshold_minutes_)) {
            LOG(INFO) << "Access token expires within " << expiring_threshold_minutes_
                      << " minutes, refreshing";
            outcome = token_coordinator_->refresh(/*force=*/false);
        } else {
            VLOG(1) << "Access token still valid";
            return JobResult::SUCCESS;
        }

        switch (outcome) {
            case RefreshOutcome::REFRESHED:
            case RefreshOutcome::THROTTLED:
                if (session_store_->has_valid_session()) {
                    return JobResult::SUCCESS;
                }
                LOG(WARNING) << "Session still invalid after refresh";
                return JobResult::RETRY;
            case RefreshOutcome::FAILED_TRANSIENT:
                return JobResult::RETRY;
            case RefreshOutcome::FAILED_PERMANENT:
            default:
                LOG(ERROR) << "Background session refresh failed permanently";
                return JobResult::FAILURE;
        }
    } catch (const std::exception& e) {
        LOG(ERROR) << "Background session refresh error: " << e.what();
        return JobResult::FAILURE;
    }
}

BackgroundScheduler::BackgroundScheduler(std::shared_ptr<HostScheduler> host,
                                         std::shared_ptr<SessionRefreshJob> job,
                                         BackgroundSchedulerConfig config)
    : host_(std::move(host)), job_(std::move(job)), config_(config) {}

bool BackgroundScheduler::ensure_scheduled() {
    if (registered_.exchange(true)) {
        return true;
    }

    PeriodicJobSpec spec;
    spec.repeat_interval = config_.repeat_interval;
    spec.constraints.requires_network = config_.requires_network;

    auto job = job_;
    if (!host_->enqueue_unique_periodic(WORK_NAME, spec, ExistingJobPolicy::KEEP,
                                        [job]() { return job->run(); })) {
        registered_ = false;
        LOG(ERROR) << "Failed to schedule background session refresh";
        return false;
    }
    LOG(INFO) << "Background session refresh scheduled every "
              << std::chrono::duration_cast<std::chrono::minutes>(config_.repeat_interval).count()
              << " minutes";
    return true;
}

bool BackgroundScheduler::cancel() {
    registered_ = false;
    bool cancelled = host_->cancel_unique(WORK_NAME);
    LOG(INFO) << "Background session refresh cancelled";
    return cancelled;
}

bool BackgroundScheduler::force_refresh_now() {
    JobConstraints constraints;
    constraints.requires_network = config_.requires_network;

    auto job = job_;
    return host_->enqueue_unique_one_shot(ONE_SHOT_WORK_NAME, constraints,
                                          [job]() { return job->run(); });
}

JobState BackgroundScheduler::status() const {
    return host_->status(WORK_NAME);
}

std::string BackgroundScheduler::status_string() const {
    switch (status()) {
        case JobState::NOT_SCHEDULED: return "Not scheduled";
        case JobState::ENQUEUED: return "Enqueued";
        case JobState::RUNNING: return "Running";
        case JobState::SUCCEEDED: return "Finished";
        case JobState::FAILED: return "Failed";
        case JobState::CANCELLED: return "Cancelled";
        default: return "Unknown";
    }
}

}  // namespace motium::sync
