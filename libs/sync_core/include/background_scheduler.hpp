#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>

#include "host_scheduler.hpp"
#include "session_store.hpp"
#include "token_refresh_coordinator.hpp"

namespace motium::sync {

/// One firing of the background session refresh
class SessionRefreshJob {
public:
    SessionRefreshJob(std::shared_ptr<SessionStore> session_store,
                      std::shared_ptr<TokenRefreshCoordinator> token_coordinator,
                      int expiring_threshold_minutes = 10);

    /// SUCCESS when there is nothing to do or the session is valid after
    /// refreshing, RETRY on transient failures, FAILURE on permanent ones.
    JobResult run();

private:
    std::shared_ptr<SessionStore> session_store_;
    std::shared_ptr<TokenRefreshCoordinator> token_coordinator_;
    int expiring_threshold_minutes_;
};

struct BackgroundSchedulerConfig {
    std::chrono::milliseconds repeat_interval{std::chrono::minutes(20)};
    bool requires_network = true;
};

/// Registers the session refresh with the host scheduler so the session
/// stays fresh while the application is in the background.
class BackgroundScheduler {
public:
    static constexpr const char* WORK_NAME = "session_refresh_worker";
    static constexpr const char* ONE_SHOT_WORK_NAME = "session_refresh_now";

    BackgroundScheduler(std::shared_ptr<HostScheduler> host,
                        std::shared_ptr<SessionRefreshJob> job,
                        BackgroundSchedulerConfig config = BackgroundSchedulerConfig{});

    /// Register the periodic job once per process (KEEP policy)
    bool ensure_scheduled();

    /// Stop future firings, e.g. on logout
    bool cancel();

    /// One-shot refresh outside the periodic schedule, network still required
    bool force_refresh_now();

    JobState status() const;
    std::string status_string() const;

private:
    std::shared_ptr<HostScheduler> host_;
    std::shared_ptr<SessionRefreshJob> job_;
    BackgroundSchedulerConfig config_;
    std::atomic<bool> registered_{false};
};

}  // namespace motium::sync
