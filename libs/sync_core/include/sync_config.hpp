#pragma once

#include <string>

#include "background_scheduler.hpp"
#include "connectivity_monitor.hpp"
#include "pending_operation_queue.hpp"
#include "sync_orchestrator.hpp"
#include "thread_host_scheduler.hpp"
#include "token_refresh_coordinator.hpp"

namespace motium::sync {

/// Tunables for the whole sync subsystem, loaded from YAML
struct SyncDaemonConfig {
    SyncOrchestratorConfig sync;
    RetryPolicy retry;
    TokenRefreshConfig token_refresh;
    BackgroundSchedulerConfig background;
    int expiring_threshold_minutes = 10;
    ThreadHostSchedulerConfig host_scheduler;
    ConnectivityConfig connectivity;
};

/// Parse YAML text over `config`. Missing keys keep their current values.
/// On error `config` is left untouched and `error` (if given) says why.
bool parse_sync_daemon_config(const std::string& yaml_text,
                              SyncDaemonConfig& config,
                              std::string* error = nullptr);

bool load_sync_daemon_config(const std::string& path,
                             SyncDaemonConfig& config,
                             std::string* error = nullptr);

}  // namespace motium::sync
