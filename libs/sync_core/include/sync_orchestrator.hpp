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

#include <nlohmann/json.hpp>

#include "clock.hpp"
#include "connectivity_monitor.hpp"
#include "local_store.hpp"
#include "pending_operation_queue.hpp"
#include "remote_api.hpp"
#include "session_store.hpp"
#include "sync_errors.hpp"
#include "token_refresh_coordinator.hpp"

namespace motium::sync {

enum class SyncPhase {
    IDLE = 0,
    GUARDING = 1,
    EXPORTING = 2,
    IMPORTING = 3,
    SUCCEEDED = 4,
    FAILED = 5
};

enum class SyncOutcome {
    SUCCEEDED = 0,
    FAILED = 1,
    SKIPPED_NOT_AUTHENTICATED = 2,
    SKIPPED_NO_NETWORK = 3,
    SKIPPED_ALREADY_SYNCING = 4
};

enum class SyncDirection {
    BIDIRECTIONAL = 0,  // export, then import in the same pass
    EXPORT_ONLY = 1
};

const char* sync_phase_to_string(SyncPhase phase);
const char* sync_outcome_to_string(SyncOutcome outcome);
const char* sync_direction_to_string(SyncDirection direction);

/// Result of one perform_sync() call
struct SyncResult {
    SyncOutcome outcome = SyncOutcome::FAILED;
    int operations_applied = 0;
    int operations_failed = 0;
    int operations_deferred = 0;       // still inside their retry backoff
    int operations_dead_lettered = 0;  // skipped, retry budget exhausted
    int entities_pushed = 0;
    int entities_pulled = 0;
    std::string error;

    bool succeeded() const { return outcome == SyncOutcome::SUCCEEDED; }
    bool skipped() const {
        return outcome != SyncOutcome::SUCCEEDED && outcome != SyncOutcome::FAILED;
    }
};

/// Read-only diagnostics snapshot
struct SyncStats {
    size_t pending_operations = 0;
    std::optional<int64_t> last_successful_sync_at_ms;
    bool is_syncing = false;
    bool is_network_available = false;
    size_t dead_lettered_operations = 0;
    SyncPhase phase = SyncPhase::IDLE;
    uint64_t passes_succeeded = 0;
    uint64_t passes_failed = 0;
    uint64_t passes_skipped = 0;

    nlohmann::json to_json() const;
};

struct SyncOrchestratorConfig {
    /// Cadence when nothing is waiting to be pushed
    std::chrono::milliseconds sync_interval{900000};
    /// Cadence while a backlog exists
    std::chrono::milliseconds quick_sync_interval{30000};
    /// Debounce for network-restoration triggers
    std::chrono::milliseconds min_time_since_last_sync{60000};
    /// Upper bound on every remote call inside a pass
    std::chrono::milliseconds remote_call_timeout{30000};
    /// Defer operations whose retry backoff has not elapsed
    bool honor_retry_backoff = true;
    /// Entity types walked by a pass, in order
    std::vector<EntityType> entity_types = all_entity_types();
    /// Types absent from the map sync bidirectionally
    std::map<EntityType, SyncDirection> directions;

    SyncDirection direction_for(EntityType entity_type) const;
};

/// Drives sync passes between the local store and the backend.
///
/// At most one pass runs process-wide; a trigger arriving mid-pass is
/// dropped. Triggers are the periodic thread, network restoration and
/// force_sync_now(). No exception escapes perform_sync().
class SyncOrchestrator {
public:
    SyncOrchestrator(std::shared_ptr<PendingOperationQueue> queue,
                     std::shared_ptr<TokenRefreshCoordinator> token_coordinator,
                     std::shared_ptr<SessionStore> session_store,
                     std::shared_ptr<LocalStore> local_store,
                     std::shared_ptr<RemoteApi> remote,
                     std::shared_ptr<ConnectivityMonitor> connectivity,
                     std::shared_ptr<Clock> clock,
                     SyncOrchestratorConfig config = SyncOrchestratorConfig{});
    ~SyncOrchestrator();

    SyncOrchestrator(const SyncOrchestrator&) = delete;
    SyncOrchestrator& operator=(const SyncOrchestrator&) = delete;

    SyncResult perform_sync();

    /// Skip the timer, keep the guards
    SyncResult force_sync_now();

    /// Reset every pull watermark, then run a pass that re-pulls everything
    SyncResult force_full_sync();

    /// Give every failed operation (dead-lettered ones included) a fresh
    /// retry budget and sync right away when online. Returns how many were reset.
    size_t retry_failed_operations();

    /// Quick interval while actionable operations are queued, else the normal one
    std::chrono::milliseconds select_next_interval() const;

    bool should_sync_on_network_restored() const;

    /// Connectivity edge handler, registered with the monitor on construction
    void on_network_changed(bool available);

    bool start_periodic_sync();

    /// Stops the timer. A pass already running completes first.
    void stop_periodic_sync();

    bool is_periodic_sync_running() const { return periodic_running_; }
    bool is_syncing() const { return is_syncing_; }

    SyncStats get_sync_stats() const;
    std::optional<SyncResult> last_result() const;

    const SyncOrchestratorConfig& config() const { return config_; }

private:
    bool run_pass(SyncResult& result);
    bool export_entity_type(EntityType entity_type, SyncResult& result);
    bool apply_operation(const PendingOperation& op, SyncResult& result);
    void record_failure(const PendingOperation& op, ErrorKind kind, const std::string& error,
                        const std::string& what, SyncResult& result);
    bool renew_rejected_credential(const std::string& what, SyncResult& result);
    bool push_dirty_entities(EntityType entity_type, SyncResult& result);
    bool import_entity_type(EntityType entity_type, SyncResult& result);
    size_t actionable_count() const;
    void periodic_loop();

    std::shared_ptr<PendingOperationQueue> queue_;
    std::shared_ptr<TokenRefreshCoordinator> token_coordinator_;
    std::shared_ptr<SessionStore> session_store_;
    std::shared_ptr<LocalStore> local_store_;
    std::shared_ptr<RemoteApi> remote_;
    std::shared_ptr<ConnectivityMonitor> connectivity_;
    std::shared_ptr<Clock> clock_;
    SyncOrchestratorConfig config_;

    std::atomic<bool> is_syncing_{false};
    // At most one forced renewal per pass; only touched by the pass holding is_syncing_
    bool credential_renewed_ = false;
    std::atomic<SyncPhase> phase_{SyncPhase::IDLE};
    std::atomic<int64_t> last_successful_sync_ms_{0};  // 0 = never

    std::atomic<uint64_t> passes_succeeded_{0};
    std::atomic<uint64_t> passes_failed_{0};
    std::atomic<uint64_t> passes_skipped_{0};

    mutable std::mutex result_mutex_;
    std::optional<SyncResult> last_result_;

    uint64_t listener_id_ = 0;

    std::atomic<bool> periodic_running_{false};
    std::thread periodic_thread_;
    std::mutex periodic_mutex_;
    std::condition_variable periodic_cv_;
};

}  // namespace motium::sync
