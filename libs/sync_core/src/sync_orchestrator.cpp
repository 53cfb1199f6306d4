#include "sync_orchestrator.hpp"

#include <set>
#include <system_error>

#include <glog/logging.h>

#include "call_timeout.hpp"
#include "sync_errors.hpp"

namespace motium::sync {

const char* sync_phase_to_string(SyncPhase phase) {
    switch (phase) {
        case SyncPhase::IDLE: return "IDLE";
        case SyncPhase::GUARDING: return "GUARDING";
        case SyncPhase::EXPORTING: return "EXPORTING";
        case SyncPhase::IMPORTING: return "IMPORTING";
        case SyncPhase::SUCCEEDED: return "SUCCEEDED";
        case SyncPhase::FAILED: return "FAILED";
        default: return "UNKNOWN";
    }
}

const char* sync_outcome_to_string(SyncOutcome outcome) {
    switch (outcome) {
        case SyncOutcome::SUCCEEDED: return "SUCCEEDED";
        case SyncOutcome::FAILED: return "FAILED";
        case SyncOutcome::SKIPPED_NOT_AUTHENTICATED: return "SKIPPED_NOT_AUTHENTICATED";
        case SyncOutcome::SKIPPED_NO_NETWORK: return "SKIPPED_NO_NETWORK";
        case SyncOutcome::SKIPPED_ALREADY_SYNCING: return "SKIPPED_ALREADY_SYNCING";
        default: return "UNKNOWN";
    }
}

const char* sync_direction_to_string(SyncDirection direction) {
    switch (direction) {
        case SyncDirection::BIDIRECTIONAL: return "BIDIRECTIONAL";
        case SyncDirection::EXPORT_ONLY: return "EXPORT_ONLY";
        default: return "UNKNOWN";
    }
}

nlohmann::json SyncStats::to_json() const {
    nlohmann::json j;
    j["pending_operations"] = pending_operations;
    if (last_successful_sync_at_ms) {
        j["last_successful_sync_at_ms"] = *last_successful_sync_at_ms;
    } else {
        j["last_successful_sync_at_ms"] = nullptr;
    }
    j["is_syncing"] = is_syncing;
    j["is_network_available"] = is_network_available;
    j["dead_lettered_operations"] = dead_lettered_operations;
    j["phase"] = sync_phase_to_string(phase);
    j["passes_succeeded"] = passes_succeeded;
    j["passes_failed"] = passes_failed;
    j["passes_skipped"] = passes_skipped;
    return j;
}

SyncDirection SyncOrchestratorConfig::direction_for(EntityType entity_type) const {
    auto it = directions.find(entity_type);
    return it == directions.end() ? SyncDirection::BIDIRECTIONAL : it->second;
}

namespace {

/// Clears the single-flight flag when a pass ends, however it ends
class SyncingGuard {
public:
    SyncingGuard(std::atomic<bool>& syncing, std::atomic<SyncPhase>& phase)
        : syncing_(syncing), phase_(phase) {}
    ~SyncingGuard() {
        phase_ = SyncPhase::IDLE;
        syncing_ = false;
    }

private:
    std::atomic<bool>& syncing_;
    std::atomic<SyncPhase>& phase_;
};

}  // namespace

SyncOrchestrator::SyncOrchestrator(std::shared_ptr<PendingOperationQueue> queue,
                                   std::shared_ptr<TokenRefreshCoordinator> token_coordinator,
                                   std::shared_ptr<SessionStore> session_store,
                                   std::shared_ptr<LocalStore> local_store,
                                   std::shared_ptr<RemoteApi> remote,
                                   std::shared_ptr<ConnectivityMonitor> connectivity,
                                   std::shared_ptr<Clock> clock,
                                   SyncOrchestratorConfig config)
    : queue_(std::move(queue)),
      token_coordinator_(std::move(token_coordinator)),
      session_store_(std::move(session_store)),
      local_store_(std::move(local_store)),
      remote_(std::move(remote)),
      connectivity_(std::move(connectivity)),
      clock_(std::move(clock)),
      config_(std::move(config)) {
    listener_id_ = connectivity_->add_listener(
        [this](bool available) { on_network_changed(available); });
}

SyncOrchestrator::~SyncOrchestrator() {
    stop_periodic_sync();
    connectivity_->remove_listener(listener_id_);
}

SyncResult SyncOrchestrator::perform_sync() {
    SyncResult result;

    if (!session_store_->has_session()) {
        result.outcome = SyncOutcome::SKIPPED_NOT_AUTHENTICATED;
        passes_skipped_++;
        VLOG(1) << "Sync skipped: not authenticated";
        return result;
    }
    if (!connectivity_->is_network_available()) {
        result.outcome = SyncOutcome::SKIPPED_NO_NETWORK;
        passes_skipped_++;
        VLOG(1) << "Sync skipped: network unavailable";
        return result;
    }
    bool expected = false;
    if (!is_syncing_.compare_exchange_strong(expected, true)) {
        result.outcome = SyncOutcome::SKIPPED_ALREADY_SYNCING;
        passes_skipped_++;
        VLOG(1) << "Sync skipped: a pass is already in flight";
        return result;
    }

    SyncingGuard guard(is_syncing_, phase_);
    phase_ = SyncPhase::GUARDING;
    LOG(INFO) << "Sync pass started, " << queue_->pending_count() << " pending operations";

    bool ok = false;
    try {
        ok = run_pass(result);
    } catch (const std::exception& e) {
        result.error = e.what();
        LOG(ERROR) << "Sync pass aborted: " << e.what();
    }

    if (ok) {
        result.outcome = SyncOutcome::SUCCEEDED;
        phase_ = SyncPhase::SUCCEEDED;
        last_successful_sync_ms_ = clock_->now_ms();
        passes_succeeded_++;
        LOG(INFO) << "Sync pass succeeded: applied=" << result.operations_applied
                  << " failed=" << result.operations_failed
                  << " deferred=" << result.operations_deferred
                  << " pushed=" << result.entities_pushed
                  << " pulled=" << result.entities_pulled;
    } else {
        result.outcome = SyncOutcome::FAILED;
        phase_ = SyncPhase::FAILED;
        passes_failed_++;
        LOG(WARNING) << "Sync pass failed: " << result.error;
    }

    {
        std::lock_guard<std::mutex> lock(result_mutex_);
        last_result_ = result;
    }
    return result;
}

SyncResult SyncOrchestrator::force_sync_now() {
    LOG(INFO) << "Forced sync requested";
    return perform_sync();
}

SyncResult SyncOrchestrator::force_full_sync() {
    if (!local_store_->reset_pull_watermarks()) {
        SyncResult result;
        result.outcome = SyncOutcome::FAILED;
        result.error = "could not reset pull watermarks";
        LOG(ERROR) << "Full sync not started: " << result.error;
        return result;
    }
    LOG(INFO) << "Pull watermarks reset, running a full sync";
    return perform_sync();
}

size_t SyncOrchestrator::retry_failed_operations() {
    size_t reset = queue_->reset_failed_operations();
    if (reset > 0 && connectivity_->is_network_available()) {
        perform_sync();
    }
    return reset;
}

bool SyncOrchestrator::run_pass(SyncResult& result) {
    credential_renewed_ = false;
    phase_ = SyncPhase::EXPORTING;
    for (EntityType entity_type : config_.entity_types) {
        if (!export_entity_type(entity_type, result)) {
            return false;
        }
    }

    phase_ = SyncPhase::IMPORTING;
    for (EntityType entity_type : config_.entity_types) {
        if (config_.direction_for(entity_type) != SyncDirection::BIDIRECTIONAL) {
            continue;
        }
        if (!import_entity_type(entity_type, result)) {
            return false;
        }
    }
    return true;
}

bool SyncOrchestrator::export_entity_type(EntityType entity_type, SyncResult& result) {
    if (!token_coordinator_->refresh_if_needed()) {
        result.error = "token refresh failed before exporting ";
        result.error += entity_type_to_string(entity_type);
        return false;
    }

    int64_t now = clock_->now_ms();
    for (const auto& op : queue_->list_by_entity_type(entity_type)) {
        if (queue_->is_dead_lettered(op)) {
            result.operations_dead_lettered++;
            continue;
        }
        if (config_.honor_retry_backoff && !queue_->is_ready_for_retry(op, now)) {
            result.operations_deferred++;
            VLOG(2) << "Operation " << op.id << " still backing off";
            continue;
        }
        if (!apply_operation(op, result)) {
            return false;
        }
    }

    return push_dirty_entities(entity_type, result);
}

bool SyncOrchestrator::renew_rejected_credential(const std::string& what, SyncResult& result) {
    token_coordinator_->invalidate();
    LOG(WARNING) << "Credential rejected during " << what << ", renewing it";
    if (!token_coordinator_->refresh_if_needed(/*force=*/true)) {
        result.error = "credential rejected during " + what + " and could not be renewed";
        LOG(ERROR) << result.error;
        return false;
    }
    credential_renewed_ = true;
    return true;
}

bool SyncOrchestrator::apply_operation(const PendingOperation& op, SyncResult& result) {
    auto remote = remote_;
    std::string what = std::string(operation_type_to_string(op.type)) + " " +
                       entity_type_to_string(op.entity_type) + " " + op.entity_id;

    // A rejection gets one retry with a renewed credential
    for (int attempt = 0;; ++attempt) {
        bool renewed_before = credential_renewed_;
        try {
            if (op.type == OperationType::DELETE) {
                EntityType entity_type = op.entity_type;
                std::string entity_id = op.entity_id;
                call_with_timeout(
                    [remote, entity_type, entity_id]() {
                        remote->delete_entity(entity_type, entity_id);
                    },
                    config_.remote_call_timeout, what);
                queue_->dequeue(op.id);
            } else {
                EntityRecord record;
                if (op.payload) {
                    record.entity_type = op.entity_type;
                    record.entity_id = op.entity_id;
                    record.payload = *op.payload;
                    record.updated_at_ms = op.timestamp_ms;
                } else {
                    auto local = local_store_->get(op.entity_type, op.entity_id);
                    if (!local) {
                        LOG(INFO) << "Dropping " << what << ": entity no longer exists locally";
                        queue_->dequeue(op.id);
                        return true;
                    }
                    record = *local;
                }

                call_with_timeout([remote, record]() { remote->push_entity(record); },
                                  config_.remote_call_timeout, what);
                queue_->dequeue(op.id);
                local_store_->clear_dirty(record.entity_type, record.entity_id,
                                          record.updated_at_ms);
            }
            result.operations_applied++;
            VLOG(1) << "Applied " << what;
            return true;
        } catch (const TimeoutError& e) {
            queue_->mark_failed(op.id, e.what());
            result.operations_failed++;
            result.error = e.what();
            LOG(WARNING) << "Remote call timed out, aborting pass: " << e.what();
            return false;
        } catch (const RemoteError& e) {
            if (e.kind() == ErrorKind::AUTH && attempt == 0 && !renewed_before) {
                if (!renew_rejected_credential(what, result)) {
                    return false;
                }
                continue;
            }
            record_failure(op, e.kind(), e.what(), what, result);
            return true;
        } catch (const std::exception& e) {
            record_failure(op, ErrorKind::PERMANENT, e.what(), what, result);
            return true;
        }
    }
}

void SyncOrchestrator::record_failure(const PendingOperation& op, ErrorKind kind,
                                      const std::string& error, const std::string& what,
                                      SyncResult& result) {
    queue_->mark_failed(op.id, error);
    result.operations_failed++;

    PendingOperation attempted = op;
    attempted.retry_count++;
    if (queue_->is_dead_lettered(attempted)) {
        LOG(ERROR) << what << " exhausted its retries and is dead-lettered: " << error;
    } else if (kind == ErrorKind::AUTH) {
        LOG(WARNING) << what << " rejected with a renewed credential: " << error;
    } else {
        LOG(WARNING) << what << " failed (" << error_kind_to_string(kind) << "): " << error;
    }
}

bool SyncOrchestrator::push_dirty_entities(EntityType entity_type, SyncResult& result) {
    auto remote = remote_;

    for (const auto& record : local_store_->list_dirty(entity_type)) {
        // Entities with a queued operation are pushed through that operation
        if (queue_->has_pending_operation(record.entity_id, entity_type)) {
            continue;
        }

        std::string what = std::string("push ") + entity_type_to_string(entity_type) +
                           " " + record.entity_id;
        for (int attempt = 0;; ++attempt) {
            bool renewed_before = credential_renewed_;
            try {
                if (record.deleted) {
                    std::string entity_id = record.entity_id;
                    call_with_timeout(
                        [remote, entity_type, entity_id]() {
                            remote->delete_entity(entity_type, entity_id);
                        },
                        config_.remote_call_timeout, what);
                    local_store_->remove(entity_type, record.entity_id);
                } else {
                    call_with_timeout([remote, record]() { remote->push_entity(record); },
                                      config_.remote_call_timeout, what);
                    local_store_->clear_dirty(entity_type, record.entity_id,
                                              record.updated_at_ms);
                }
                result.entities_pushed++;
            } catch (const TimeoutError& e) {
                result.error = e.what();
                LOG(WARNING) << "Remote call timed out, aborting pass: " << e.what();
                return false;
            } catch (const RemoteError& e) {
                if (e.kind() == ErrorKind::AUTH && attempt == 0 && !renewed_before) {
                    if (!renew_rejected_credential(what, result)) {
                        return false;
                    }
                    continue;
                }
                LOG(WARNING) << what << " failed, entity stays dirty: " << e.what();
            } catch (const std::exception& e) {
                LOG(WARNING) << what << " failed, entity stays dirty: " << e.what();
            }
            break;
        }
    }
    return true;
}

bool SyncOrchestrator::import_entity_type(EntityType entity_type, SyncResult& result) {
    if (!token_coordinator_->refresh_if_needed()) {
        result.error = "token refresh failed before importing ";
        result.error += entity_type_to_string(entity_type);
        return false;
    }

    auto remote = remote_;
    int64_t since = local_store_->last_pull_watermark(entity_type);
    std::string what = std::string("pull ") + entity_type_to_string(entity_type);

    PullResult pulled;
    for (int attempt = 0;; ++attempt) {
        bool renewed_before = credential_renewed_;
        try {
            pulled = call_with_timeout(
                [remote, entity_type, since]() {
                    return remote->pull_entities(entity_type, since);
                },
                config_.remote_call_timeout, what);
            break;
        } catch (const RemoteError& e) {
            if (e.kind() == ErrorKind::AUTH) {
                if (attempt == 0 && !renewed_before) {
                    if (!renew_rejected_credential(what, result)) {
                        return false;
                    }
                    continue;
                }
                token_coordinator_->invalidate();
            }
            result.error = what + " failed: " + e.what();
            LOG(WARNING) << result.error;
            return false;
        } catch (const std::exception& e) {
            result.error = what + " failed: " + e.what();
            LOG(WARNING) << result.error;
            return false;
        }
    }

    std::set<std::string> locally_pending;
    for (const auto& op : queue_->list_by_entity_type(entity_type)) {
        locally_pending.insert(op.entity_id);
    }

    for (auto& record : pulled.records) {
        record.entity_type = entity_type;
        // Unpushed local changes win until they reach the backend
        if (locally_pending.count(record.entity_id) ||
            local_store_->is_dirty(entity_type, record.entity_id)) {
            VLOG(1) << "Keeping local " << entity_type_to_string(entity_type) << " "
                    << record.entity_id << " over remote copy";
            continue;
        }

        if (record.deleted) {
            local_store_->remove(entity_type, record.entity_id);
        } else if (!local_store_->upsert(record, /*mark_dirty=*/false)) {
            result.error = "local store rejected " + record.entity_id;
            LOG(ERROR) << result.error;
            return false;
        }
        result.entities_pulled++;
    }

    if (pulled.server_time_ms > 0 &&
        !local_store_->set_last_pull_watermark(entity_type, pulled.server_time_ms)) {
        LOG(WARNING) << "Failed to advance pull watermark for "
                     << entity_type_to_string(entity_type);
    }
    VLOG(1) << what << ": " << pulled.records.size() << " records";
    return true;
}

size_t SyncOrchestrator::actionable_count() const {
    size_t pending = queue_->pending_count();
    if (pending == 0) {
        return 0;
    }
    size_t dead = queue_->dead_lettered_count();
    return pending > dead ? pending - dead : 0;
}

std::chrono::milliseconds SyncOrchestrator::select_next_interval() const {
    return actionable_count() > 0 ? config_.quick_sync_interval : config_.sync_interval;
}

bool SyncOrchestrator::should_sync_on_network_restored() const {
    int64_t since_last = clock_->now_ms() - last_successful_sync_ms_;
    return since_last > config_.min_time_since_last_sync.count() || actionable_count() > 0;
}

void SyncOrchestrator::on_network_changed(bool available) {
    if (!available) {
        VLOG(1) << "Network lost, sync passes will be skipped";
        return;
    }
    if (!should_sync_on_network_restored()) {
        VLOG(1) << "Network restored, recent sync and empty queue: skipping";
        return;
    }
    LOG(INFO) << "Network restored, syncing now";
    perform_sync();
}

bool SyncOrchestrator::start_periodic_sync() {
    if (periodic_running_.exchange(true)) {
        return true;
    }
    try {
        periodic_thread_ = std::thread(&SyncOrchestrator::periodic_loop, this);
    } catch (const std::system_error& e) {
        LOG(ERROR) << "Failed to start periodic sync: " << e.what();
        periodic_running_ = false;
        return false;
    }
    LOG(INFO) << "Periodic sync started";
    return true;
}

void SyncOrchestrator::stop_periodic_sync() {
    if (!periodic_running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(periodic_mutex_);
    }
    periodic_cv_.notify_all();
    if (periodic_thread_.joinable()) {
        periodic_thread_.join();
    }
    LOG(INFO) << "Periodic sync stopped";
}

void SyncOrchestrator::periodic_loop() {
    while (periodic_running_) {
        perform_sync();

        auto interval = select_next_interval();
        VLOG(1) << "Next sync in " << interval.count() << " ms";

        std::unique_lock<std::mutex> lock(periodic_mutex_);
        periodic_cv_.wait_for(lock, interval, [this] { return !periodic_running_; });
    }
}

SyncStats SyncOrchestrator::get_sync_stats() const {
    SyncStats stats;
    stats.pending_operations = queue_->pending_count();
    int64_t last = last_successful_sync_ms_;
    if (last > 0) {
        stats.last_successful_sync_at_ms = last;
    }
    stats.is_syncing = is_syncing_;
    stats.is_network_available = connectivity_->is_network_available();
    stats.dead_lettered_operations = queue_->dead_lettered_count();
    stats.phase = phase_;
    stats.passes_succeeded = passes_succeeded_;
    stats.passes_failed = passes_failed_;
    stats.passes_skipped = passes_skipped_;
    return stats;
}

std::optional<SyncResult> SyncOrchestrator::last_result() const {
    std::lock_guard<std::mutex> lock(result_mutex_);
    return last_result_;
}

}  // namespace motium::sync
