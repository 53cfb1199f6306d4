#include "token_refresh_coordinator.hpp"

#include <algorithm>

#include <glog/logging.h>

#include "call_timeout.hpp"
#include "sync_errors.hpp"

namespace motium::sync {

const char* refresh_outcome_to_string(RefreshOutcome outcome) {
    switch (outcome) {
        case RefreshOutcome::REFRESHED: return "REFRESHED";
        case RefreshOutcome::THROTTLED: return "THROTTLED";
        case RefreshOutcome::FAILED_TRANSIENT: return "FAILED_TRANSIENT";
        case RefreshOutcome::FAILED_PERMANENT: return "FAILED_PERMANENT";
        default: return "UNKNOWN";
    }
}

TokenRefreshCoordinator::TokenRefreshCoordinator(std::shared_ptr<SessionStore> session_store,
                                                 std::shared_ptr<AuthEndpoint> auth,
                                                 std::shared_ptr<Clock> clock,
                                                 TokenRefreshConfig config)
    : session_store_(std::move(session_store)),
      auth_(std::move(auth)),
      clock_(std::move(clock)),
      config_(config) {}

TokenRefreshCoordinator::~TokenRefreshCoordinator() {
    shutdown();
}

bool TokenRefreshCoordinator::refresh_if_needed(bool force) {
    RefreshOutcome outcome = refresh(force);
    return outcome == RefreshOutcome::REFRESHED || outcome == RefreshOutcome::THROTTLED;
}

RefreshOutcome TokenRefreshCoordinator::refresh(bool force) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (in_flight_) {
        // Join the refresh already running instead of issuing another one
        uint64_t flight = started_flights_;
        stats_.joined_in_flight++;
        VLOG(1) << "Refresh in flight, waiting for its outcome";
        flight_cv_.wait(lock, [&] { return completed_flights_ >= flight; });
        return last_flight_outcome_;
    }

    int64_t now = clock_->now_ms();
    if (!force && last_refresh_ms_ &&
        now - *last_refresh_ms_ < config_.min_refresh_interval.count()) {
        stats_.refreshes_throttled++;
        VLOG(1) << "Token refreshed " << (now - *last_refresh_ms_)
                << " ms ago, skipping refresh";
        return RefreshOutcome::THROTTLED;
    }

    std::optional<Session> current = session_store_->load();
    if (!current || current->refresh_token.empty()) {
        LOG(WARNING) << "No session to refresh";
        return RefreshOutcome::FAILED_PERMANENT;
    }

    in_flight_ = true;
    uint64_t flight = ++started_flights_;
    lock.unlock();

    RefreshOutcome outcome = call_remote_refresh(*current);

    lock.lock();
    if (outcome == RefreshOutcome::REFRESHED) {
        last_refresh_ms_ = clock_->now_ms();
    }
    in_flight_ = false;
    completed_flights_ = flight;
    last_flight_outcome_ = outcome;
    lock.unlock();
    flight_cv_.notify_all();

    if (outcome == RefreshOutcome::REFRESHED && config_.reschedule_after_refresh) {
        std::optional<int64_t> expires_at = session_store_->get_expires_at();
        if (expires_at) {
            int64_t delay = *expires_at - clock_->now_ms() -
                            config_.proactive_refresh_margin.count();
            if (delay > 0) {
                schedule_proactive_refresh(*expires_at);
            } else {
                LOG(WARNING) << "Refreshed token expires inside the refresh margin, "
                             << "proactive refresh not re-armed";
            }
        }
    }
    return outcome;
}

RefreshOutcome TokenRefreshCoordinator::call_remote_refresh(const Session& current) {
    stats_.remote_refreshes++;
    auto auth = auth_;

    try {
        Session fresh = call_with_timeout(
            [auth, current]() { return auth->refresh_session(current); },
            config_.refresh_timeout, "session refresh");

        if (fresh.access_token.empty()) {
            LOG(ERROR) << "Session refresh returned an empty access token";
            stats_.refreshes_failed++;
            return RefreshOutcome::FAILED_PERMANENT;
        }
        if (fresh.refresh_token.empty()) {
            fresh.refresh_token = current.refresh_token;
        }
        if (fresh.user_id.empty()) {
            fresh.user_id = current.user_id;
            fresh.user_email = current.user_email;
        }
        if (fresh.created_at_ms == 0) {
            fresh.created_at_ms = clock_->now_ms();
        }

        if (!session_store_->save(fresh)) {
            LOG(ERROR) << "Failed to persist refreshed session";
            stats_.refreshes_failed++;
            return RefreshOutcome::FAILED_TRANSIENT;
        }

        stats_.refreshes_succeeded++;
        LOG(INFO) << "Session refreshed, expires in "
                  << (fresh.expires_at_ms - clock_->now_ms()) / 1000 << " s";
        return RefreshOutcome::REFRESHED;
    } catch (const RemoteError& e) {
        stats_.refreshes_failed++;
        if (e.kind() == ErrorKind::TRANSIENT) {
            LOG(WARNING) << "Session refresh failed: " << e.what();
            return RefreshOutcome::FAILED_TRANSIENT;
        }
        LOG(ERROR) << "Session refresh rejected (" << error_kind_to_string(e.kind())
                   << "): " << e.what();
        return RefreshOutcome::FAILED_PERMANENT;
    } catch (const std::exception& e) {
        stats_.refreshes_failed++;
        LOG(ERROR) << "Session refresh failed: " << e.what();
        return RefreshOutcome::FAILED_PERMANENT;
    }
}

void TokenRefreshCoordinator::schedule_proactive_refresh(int64_t expires_at_ms) {
    int64_t delay = expires_at_ms - clock_->now_ms() -
                    config_.proactive_refresh_margin.count();

    if (delay <= 0) {
        cancel_proactive_refresh();
        LOG(INFO) << "Token expires within the refresh margin, refreshing now";
        stats_.proactive_fired++;
        RefreshOutcome outcome = refresh(/*force=*/true);
        if (outcome != RefreshOutcome::REFRESHED) {
            LOG(WARNING) << "Immediate proactive refresh: "
                         << refresh_outcome_to_string(outcome);
        }
        return;
    }

    LOG(INFO) << "Proactive refresh scheduled in " << delay / 1000 << " s";
    arm_timer(std::chrono::steady_clock::now() + std::chrono::milliseconds(delay));
}

void TokenRefreshCoordinator::arm_timer(std::chrono::steady_clock::time_point deadline) {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    if (timer_shut_down_) {
        LOG(WARNING) << "Coordinator shut down, proactive refresh not scheduled";
        return;
    }

    timer_deadline_ = deadline;
    timer_armed_ = true;
    ++timer_generation_;

    if (!timer_running_) {
        timer_running_ = true;
        timer_thread_ = std::thread(&TokenRefreshCoordinator::timer_loop, this);
    }
    timer_cv_.notify_all();
}

void TokenRefreshCoordinator::cancel_proactive_refresh() {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    if (timer_armed_) {
        VLOG(1) << "Proactive refresh cancelled";
    }
    timer_armed_ = false;
    ++timer_generation_;
    timer_cv_.notify_all();
}

bool TokenRefreshCoordinator::has_pending_proactive_refresh() const {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    return timer_armed_;
}

void TokenRefreshCoordinator::timer_loop() {
    std::unique_lock<std::mutex> lock(timer_mutex_);

    while (timer_running_) {
        if (!timer_armed_) {
            timer_cv_.wait(lock, [this] { return !timer_running_ || timer_armed_; });
            continue;
        }

        uint64_t generation = timer_generation_;
        bool superseded = timer_cv_.wait_until(lock, timer_deadline_, [&] {
            return !timer_running_ || timer_generation_ != generation;
        });
        if (superseded) {
            continue;
        }

        timer_armed_ = false;
        lock.unlock();

        stats_.proactive_fired++;
        LOG(INFO) << "Proactive token refresh firing";
        RefreshOutcome outcome = refresh(/*force=*/false);
        if (outcome == RefreshOutcome::FAILED_TRANSIENT ||
            outcome == RefreshOutcome::FAILED_PERMANENT) {
            LOG(WARNING) << "Proactive refresh failed: "
                         << refresh_outcome_to_string(outcome);
        }

        lock.lock();
    }
}

bool TokenRefreshCoordinator::is_token_expiring_soon(int threshold_minutes) const {
    return session_store_->is_token_expiring_soon(threshold_minutes);
}

std::optional<int64_t> TokenRefreshCoordinator::get_time_until_expiry_seconds() const {
    std::optional<int64_t> expires_at = session_store_->get_expires_at();
    if (!expires_at) {
        return std::nullopt;
    }
    int64_t remaining_ms = std::max<int64_t>(0, *expires_at - clock_->now_ms());
    return remaining_ms / 1000;
}

std::optional<int64_t> TokenRefreshCoordinator::last_refresh_time_ms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_refresh_ms_;
}

void TokenRefreshCoordinator::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (last_refresh_ms_) {
        VLOG(1) << "Access token rejected, next refresh bypasses the throttle";
    }
    last_refresh_ms_.reset();
}

void TokenRefreshCoordinator::shutdown() {
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        if (timer_shut_down_) {
            return;
        }
        timer_shut_down_ = true;
        timer_running_ = false;
        timer_armed_ = false;
        ++timer_generation_;
    }
    timer_cv_.notify_all();

    if (timer_thread_.joinable()) {
        if (timer_thread_.get_id() == std::this_thread::get_id()) {
            timer_thread_.detach();
        } else {
            timer_thread_.join();
        }
    }
    VLOG(1) << "Token refresh coordinator stopped";
}

}  // namespace motium::sync
