#include <gflags/gflags.h>
#include <glog/logging.h>
#include <grpcpp/grpcpp.h>

#include <atomic>
#include <csignal>
#include <thread>

#include "background_scheduler.hpp"
#include "clock.hpp"
#include "connectivity_monitor.hpp"
#include "grpc_backend_client.hpp"
#include "pending_operation_queue.hpp"
#include "postgres_client.hpp"
#include "postgres_local_store.hpp"
#include "postgres_pending_operation_store.hpp"
#include "postgres_session_store.hpp"
#include "sync_config.hpp"
#include "sync_orchestrator.hpp"
#include "thread_host_scheduler.hpp"
#include "token_refresh_coordinator.hpp"

// Configuration
DEFINE_string(config, "", "YAML file with sync tunables (optional)");
DEFINE_bool(once, false, "Run a single forced sync pass and exit");
DEFINE_bool(full_sync, false, "With --once, reset pull watermarks and re-pull everything");

// Backend flags
DEFINE_string(backend_address, "localhost:50070", "Sync backend gRPC address");
DEFINE_int32(backend_deadline_ms, 20000, "Per-call gRPC deadline");

// Connectivity flags
DEFINE_string(probe_host, "", "Reachability probe host (default: backend host)");
DEFINE_int32(probe_port, 0, "Reachability probe port (default: backend port)");
DEFINE_bool(assume_online, false, "Skip probing and treat the network as available");

// PostgreSQL flags
DEFINE_string(postgres_host, "localhost", "PostgreSQL host");
DEFINE_int32(postgres_port, 5432, "PostgreSQL port");
DEFINE_string(postgres_db, "motium_offline", "PostgreSQL database");
DEFINE_string(postgres_user, "motium", "PostgreSQL user");
DEFINE_string(postgres_password, "motium_dev", "PostgreSQL password");

static std::atomic<bool> g_shutdown{false};

void signal_handler(int sig) {
    LOG(INFO) << "Received signal " << sig << ", shutting down...";
    g_shutdown = true;
}

namespace {

/// Split "host:port", keeping the defaults for a missing part
void split_address(const std::string& address, std::string& host, int& port) {
    auto colon = address.rfind(':');
    if (colon == std::string::npos) {
        host = address;
        return;
    }
    host = address.substr(0, colon);
    try {
        port = std::stoi(address.substr(colon + 1));
    } catch (const std::exception& e) {
        LOG(WARNING) << "Bad port in " << address << ": " << e.what();
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    google::SetStderrLogging(google::INFO);
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    namespace sync = motium::sync;
    namespace offline = motium::offline;

    sync::SyncDaemonConfig config;
    if (!FLAGS_config.empty()) {
        std::string error;
        if (!sync::load_sync_daemon_config(FLAGS_config, config, &error)) {
            LOG(ERROR) << "Invalid configuration: " << error;
            return 1;
        }
    }

    std::string backend_host = "localhost";
    int backend_port = 50070;
    split_address(FLAGS_backend_address, backend_host, backend_port);
    // Probe the backend itself unless the config names another target
    if (config.connectivity.probe_host == sync::ConnectivityConfig{}.probe_host) {
        config.connectivity.probe_host = backend_host;
        config.connectivity.probe_port = backend_port;
    }
    if (!FLAGS_probe_host.empty()) {
        config.connectivity.probe_host = FLAGS_probe_host;
    }
    if (FLAGS_probe_port > 0) {
        config.connectivity.probe_port = FLAGS_probe_port;
    }

    LOG(INFO) << "Motium sync daemon starting...";
    LOG(INFO) << "  Backend: " << FLAGS_backend_address;
    LOG(INFO) << "  PostgreSQL: " << FLAGS_postgres_host << ":" << FLAGS_postgres_port
              << "/" << FLAGS_postgres_db;
    LOG(INFO) << "  Probe: " << config.connectivity.probe_host << ":"
              << config.connectivity.probe_port;

    // Local persistence
    offline::PostgresConfig pg_config;
    pg_config.host = FLAGS_postgres_host;
    pg_config.port = FLAGS_postgres_port;
    pg_config.database = FLAGS_postgres_db;
    pg_config.user = FLAGS_postgres_user;
    pg_config.password = FLAGS_postgres_password;

    auto pg_client = std::make_shared<offline::PostgresClient>(pg_config);
    if (!pg_client->is_connected()) {
        LOG(ERROR) << "Failed to connect to PostgreSQL";
        return 1;
    }

    auto clock = std::make_shared<sync::SystemClock>();
    auto operation_store = std::make_shared<offline::PostgresPendingOperationStore>(pg_client);
    auto local_store = std::make_shared<offline::PostgresLocalStore>(pg_client);
    auto session_store = std::make_shared<offline::PostgresSessionStore>(pg_client, clock);
    if (!operation_store->ensure_schema() || !local_store->ensure_schema() ||
        !session_store->ensure_schema()) {
        LOG(ERROR) << "Failed to prepare offline store schema";
        return 1;
    }

    // Backend
    offline::BackendClientConfig backend_config;
    backend_config.address = FLAGS_backend_address;
    backend_config.call_deadline = std::chrono::milliseconds(FLAGS_backend_deadline_ms);
    auto channel = grpc::CreateChannel(FLAGS_backend_address, grpc::InsecureChannelCredentials());
    auto remote = std::make_shared<offline::GrpcRemoteApi>(channel, session_store, backend_config);
    auto auth = std::make_shared<offline::GrpcAuthEndpoint>(channel, backend_config);

    // Sync core. The first probe runs before the orchestrator subscribes, so
    // it does not count as a network restoration.
    auto connectivity = std::make_shared<sync::ConnectivityMonitor>(config.connectivity);
    if (FLAGS_assume_online) {
        connectivity->set_network_available(true);
    } else {
        connectivity->probe_once();
    }

    auto queue = std::make_shared<sync::PendingOperationQueue>(operation_store, clock, config.retry);
    auto coordinator = std::make_shared<sync::TokenRefreshCoordinator>(
        session_store, auth, clock, config.token_refresh);
    auto orchestrator = std::make_unique<sync::SyncOrchestrator>(
        queue, coordinator, session_store, local_store, remote, connectivity, clock, config.sync);

    if (FLAGS_once) {
        sync::SyncResult result = FLAGS_full_sync ? orchestrator->force_full_sync()
                                                  : orchestrator->force_sync_now();
        LOG(INFO) << "Sync result: " << sync::sync_outcome_to_string(result.outcome);
        LOG(INFO) << "Stats: " << orchestrator->get_sync_stats().to_json().dump();
        orchestrator.reset();
        coordinator->shutdown();
        return result.succeeded() ? 0 : 1;
    }

    auto host_scheduler = std::make_shared<sync::ThreadHostScheduler>(connectivity,
                                                                      config.host_scheduler);
    auto refresh_job = std::make_shared<sync::SessionRefreshJob>(
        session_store, coordinator, config.expiring_threshold_minutes);
    sync::BackgroundScheduler background(host_scheduler, refresh_job, config.background);

    if (auto expires_at = session_store->get_expires_at()) {
        coordinator->schedule_proactive_refresh(*expires_at);
    } else {
        LOG(INFO) << "No stored session, waiting for sign-in";
    }

    if (!background.ensure_scheduled()) {
        LOG(ERROR) << "Failed to register background session refresh";
        return 1;
    }
    if (!FLAGS_assume_online && !connectivity->start()) {
        return 1;
    }
    if (!orchestrator->start_periodic_sync()) {
        return 1;
    }

    LOG(INFO) << "Motium sync daemon running";

    while (!g_shutdown) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    LOG(INFO) << "Shutting down...";

    orchestrator->stop_periodic_sync();
    host_scheduler->shutdown();
    connectivity->stop();
    coordinator->shutdown();

    auto stats = orchestrator->get_sync_stats();
    const auto& refresh_stats = coordinator->stats();
    LOG(INFO) << "Final stats:";
    LOG(INFO) << "  pending_operations=" << stats.pending_operations;
    LOG(INFO) << "  dead_lettered_operations=" << stats.dead_lettered_operations;
    LOG(INFO) << "  passes_succeeded=" << stats.passes_succeeded;
    LOG(INFO) << "  passes_failed=" << stats.passes_failed;
    LOG(INFO) << "  refreshes_succeeded=" << refresh_stats.refreshes_succeeded;
    LOG(INFO) << "  refreshes_failed=" << refresh_stats.refreshes_failed;

    LOG(INFO) << "Motium sync daemon shutdown complete";
    return 0;
}
