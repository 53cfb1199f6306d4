#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "auth_endpoint.hpp"
#include "clock.hpp"
#include "session_store.hpp"

namespace motium::sync {

struct TokenRefreshConfig {
    /// Non-forced refreshes closer together than this are skipped
    std::chrono::milliseconds min_refresh_interval{60000};
    /// Proactive refresh fires this long before expiry
    std::chrono::milliseconds proactive_refresh_margin{300000};
    /// Upper bound on a single remote refresh call
    std::chrono::milliseconds refresh_timeout{30000};
    /// Re-arm the proactive timer for the new expiry after each refresh
    bool reschedule_after_refresh = true;
};

enum class RefreshOutcome {
    REFRESHED = 0,
    THROTTLED = 1,         // refreshed recently, no remote call made
    FAILED_TRANSIENT = 2,  // network or timeout, worth retrying
    FAILED_PERMANENT = 3   // no session, revoked or rejected refresh token
};

const char* refresh_outcome_to_string(RefreshOutcome outcome);

struct TokenRefreshStats {
    std::atomic<uint64_t> remote_refreshes{0};
    std::atomic<uint64_t> refreshes_succeeded{0};
    std::atomic<uint64_t> refreshes_failed{0};
    std::atomic<uint64_t> refreshes_throttled{0};
    std::atomic<uint64_t> joined_in_flight{0};
    std::atomic<uint64_t> proactive_fired{0};
};

/// Single serialization point for credential renewal.
///
/// At most one remote refresh is in flight at a time; callers arriving
/// meanwhile wait for it and receive its outcome. A one-shot timer thread
/// handles proactive refresh ahead of expiry; scheduling again supersedes
/// the pending timer.
class TokenRefreshCoordinator {
public:
    TokenRefreshCoordinator(std::shared_ptr<SessionStore> session_store,
                            std::shared_ptr<AuthEndpoint> auth,
                            std::shared_ptr<Clock> clock,
                            TokenRefreshConfig config = TokenRefreshConfig{});
    ~TokenRefreshCoordinator();

    TokenRefreshCoordinator(const TokenRefreshCoordinator&) = delete;
    TokenRefreshCoordinator& operator=(const TokenRefreshCoordinator&) = delete;

    /// True on a successful or throttled refresh
    bool refresh_if_needed(bool force = false);

    RefreshOutcome refresh(bool force = false);

    /// Refresh now if expiry is inside the margin, else arm the timer
    void schedule_proactive_refresh(int64_t expires_at_ms);

    void cancel_proactive_refresh();
    bool has_pending_proactive_refresh() const;

    bool is_token_expiring_soon(int threshold_minutes) const;

    /// nullopt without a session, never negative
    std::optional<int64_t> get_time_until_expiry_seconds() const;

    std::optional<int64_t> last_refresh_time_ms() const;

    /// The backend rejected the current access token. Drops the throttle
    /// state so the next refresh_if_needed() goes to the network.
    void invalidate();

    const TokenRefreshStats& stats() const { return stats_; }
    const TokenRefreshConfig& config() const { return config_; }

    /// Stop the timer thread. Safe to call more than once.
    void shutdown();

private:
    RefreshOutcome call_remote_refresh(const Session& current);
    void arm_timer(std::chrono::steady_clock::time_point deadline);
    void timer_loop();

    std::shared_ptr<SessionStore> session_store_;
    std::shared_ptr<AuthEndpoint> auth_;
    std::shared_ptr<Clock> clock_;
    TokenRefreshConfig config_;

    // Refresh state
    mutable std::mutex mutex_;
    std::condition_variable flight_cv_;
    bool in_flight_ = false;
    uint64_t started_flights_ = 0;
    uint64_t completed_flights_ = 0;
    RefreshOutcome last_flight_outcome_ = RefreshOutcome::FAILED_TRANSIENT;
    std::optional<int64_t> last_refresh_ms_;

    // Proactive timer
    mutable std::mutex timer_mutex_;
    std::condition_variable timer_cv_;
    std::thread timer_thread_;
    bool timer_running_ = false;
    bool timer_shut_down_ = false;
    bool timer_armed_ = false;
    uint64_t timer_generation_ = 0;
    std::chrono::steady_clock::time_point timer_deadline_;

    TokenRefreshStats stats_;
};

}  // namespace motium::sync
