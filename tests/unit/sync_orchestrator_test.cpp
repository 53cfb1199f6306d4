/**
 * @file sync_orchestrator_test.cpp
 * @brief Unit tests for sync passes, scheduling decisions and the offline write path
 *
 * The orchestrator runs against in-memory stores, a scripted backend and a
 * manual clock, so every pass is deterministic and synchronous.
 */

#include <gtest/gtest.h>
#include <glog/logging.h>

#include <future>

#include "connectivity_monitor.hpp"
#include "local_store.hpp"
#include "offline_repository.hpp"
#include "pending_operation_queue.hpp"
#include "session_store.hpp"
#include "sync_orchestrator.hpp"
#include "test_doubles.hpp"
#include "token_refresh_coordinator.hpp"

using namespace motium::sync;
using motium::sync::test::FakeAuthEndpoint;
using motium::sync::test::FakeRemoteApi;
using motium::sync::test::ManualClock;

namespace {
constexpr int64_t kSecond = 1000;
constexpr int64_t kMinute = 60 * kSecond;
}

class SyncOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::init_test_logging("sync_orchestrator_test");
        clock_ = std::make_shared<ManualClock>();
        session_store_ = std::make_shared<InMemorySessionStore>(clock_);
        local_store_ = std::make_shared<InMemoryLocalStore>();
        queue_ = std::make_shared<PendingOperationQueue>(
            std::make_shared<InMemoryPendingOperationStore>(), clock_);
        auth_ = std::make_shared<FakeAuthEndpoint>(clock_);
        remote_ = std::make_shared<FakeRemoteApi>();

        ConnectivityConfig connectivity_config;
        connectivity_config.initially_available = true;
        connectivity_ = std::make_shared<ConnectivityMonitor>(connectivity_config,
                                                              [] { return true; });
        repository_ = std::make_shared<OfflineRepository>(local_store_, queue_, clock_);
    }

    void TearDown() override {
        remote_->gate.open();
        auth_->gate.open();
        orchestrator_.reset();
        if (coordinator_) {
            coordinator_->shutdown();
        }
    }

    void make_orchestrator(SyncOrchestratorConfig config = SyncOrchestratorConfig{}) {
        TokenRefreshConfig token_config;
        token_config.reschedule_after_refresh = false;
        coordinator_ = std::make_shared<TokenRefreshCoordinator>(session_store_, auth_,
                                                                 clock_, token_config);
        orchestrator_ = std::make_unique<SyncOrchestrator>(queue_, coordinator_, session_store_,
                                                           local_store_, remote_, connectivity_,
                                                           clock_, config);
    }

    void sign_in() {
        Session session;
        session.access_token = "access-0";
        session.refresh_token = "refresh-0";
        session.expires_at_ms = clock_->now_ms() + 60 * kMinute;
        session.user_id = "user-42";
        session_store_->save(session);
    }

    EntityRecord trip(const std::string& id, double distance_km) {
        EntityRecord record;
        record.entity_type = EntityType::TRIP;
        record.entity_id = id;
        record.payload = {{"distance_km", distance_km}};
        return record;
    }

    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<InMemorySessionStore> session_store_;
    std::shared_ptr<InMemoryLocalStore> local_store_;
    std::shared_ptr<PendingOperationQueue> queue_;
    std::shared_ptr<FakeAuthEndpoint> auth_;
    std::shared_ptr<FakeRemoteApi> remote_;
    std::shared_ptr<ConnectivityMonitor> connectivity_;
    std::shared_ptr<OfflineRepository> repository_;
    std::shared_ptr<TokenRefreshCoordinator> coordinator_;
    std::unique_ptr<SyncOrchestrator> orchestrator_;
};

// =============================================================================
// Offline Write Path
// =============================================================================

TEST_F(SyncOrchestratorTest, SaveQueuesCreateThenUpdate) {
    ASSERT_FALSE(repository_->save(trip("t1", 10)).empty());
    clock_->advance(kSecond);
    ASSERT_FALSE(repository_->save(trip("t1", 11)).empty());

    auto pending = queue_->list_pending();
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0].type, OperationType::CREATE);
    EXPECT_EQ(pending[1].type, OperationType::UPDATE);
    EXPECT_EQ(pending[1].timestamp_ms, clock_->now_ms());

    auto local = local_store_->get(EntityType::TRIP, "t1");
    ASSERT_TRUE(local.has_value());
    EXPECT_EQ(local->updated_at_ms, clock_->now_ms());
    EXPECT_TRUE(local_store_->is_dirty(EntityType::TRIP, "t1"));
}

TEST_F(SyncOrchestratorTest, RemoveDeletesLocallyAndQueuesDelete) {
    repository_->save(trip("t1", 10));
    repository_->remove(EntityType::TRIP, "t1");

    EXPECT_FALSE(local_store_->get(EntityType::TRIP, "t1").has_value());
    auto pending = queue_->list_pending();
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[1].type, OperationType::DELETE);
}

TEST_F(SyncOrchestratorTest, DirtyMarkerSurvivesOlderPush) {
    EntityRecord record = trip("t1", 10);
    record.updated_at_ms = 2000;
    local_store_->upsert(record, /*mark_dirty=*/true);

    EXPECT_FALSE(local_store_->clear_dirty(EntityType::TRIP, "t1", 1000));
    EXPECT_TRUE(local_store_->is_dirty(EntityType::TRIP, "t1"));
    EXPECT_TRUE(local_store_->clear_dirty(EntityType::TRIP, "t1", 2000));
    EXPECT_FALSE(local_store_->is_dirty(EntityType::TRIP, "t1"));
}

// =============================================================================
// Guards
// =============================================================================

TEST_F(SyncOrchestratorTest, ColdStartWithoutSessionSkips) {
    make_orchestrator();
    repository_->save(trip("t1", 10));

    SyncResult result = orchestrator_->perform_sync();

    EXPECT_EQ(result.outcome, SyncOutcome::SKIPPED_NOT_AUTHENTICATED);
    EXPECT_TRUE(result.skipped());
    EXPECT_TRUE(remote_->calls().empty());
    EXPECT_EQ(auth_->calls.load(), 0);
    EXPECT_EQ(queue_->pending_count(), 1u);
    EXPECT_FALSE(orchestrator_->get_sync_stats().last_successful_sync_at_ms.has_value());
}

TEST_F(SyncOrchestratorTest, OfflineSkips) {
    sign_in();
    make_orchestrator();
    connectivity_->set_network_available(false);

    SyncResult result = orchestrator_->perform_sync();

    EXPECT_EQ(result.outcome, SyncOutcome::SKIPPED_NO_NETWORK);
    EXPECT_TRUE(remote_->calls().empty());
}

TEST_F(SyncOrchestratorTest, ConcurrentPassIsDropped) {
    sign_in();
    make_orchestrator();
    repository_->save(trip("t1", 10));
    remote_->gate.close();

    auto first = std::async(std::launch::async, [this] { return orchestrator_->perform_sync(); });
    ASSERT_TRUE(test::wait_until([this] { return remote_->gate.waiting() == 1; }));
    EXPECT_TRUE(orchestrator_->is_syncing());
    EXPECT_EQ(orchestrator_->get_sync_stats().phase, SyncPhase::EXPORTING);

    SyncResult second = orchestrator_->force_sync_now();
    EXPECT_EQ(second.outcome, SyncOutcome::SKIPPED_ALREADY_SYNCING);

    remote_->gate.open();
    EXPECT_TRUE(first.get().succeeded());
    EXPECT_FALSE(orchestrator_->is_syncing());
    EXPECT_EQ(remote_->count_calls("push TRIP t1"), 1);
}

// =============================================================================
// Export
// =============================================================================

TEST_F(SyncOrchestratorTest, PassPushesQueuedOperations) {
    sign_in();
    make_orchestrator();
    repository_->save(trip("t1", 10));
    repository_->save(trip("t2", 20));

    SyncResult result = orchestrator_->perform_sync();

    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ(result.operations_applied, 2);
    EXPECT_EQ(queue_->pending_count(), 0u);
    EXPECT_FALSE(local_store_->is_dirty(EntityType::TRIP, "t1"));
    ASSERT_TRUE(remote_->server_record(EntityType::TRIP, "t2").has_value());
    EXPECT_EQ(remote_->server_record(EntityType::TRIP, "t2")->payload["distance_km"], 20);

    auto stats = orchestrator_->get_sync_stats();
    EXPECT_EQ(stats.last_successful_sync_at_ms, clock_->now_ms());
    EXPECT_EQ(stats.phase, SyncPhase::IDLE);
    EXPECT_EQ(stats.passes_succeeded, 1u);
}

TEST_F(SyncOrchestratorTest, OperationsApplyInEnqueueOrder) {
    sign_in();
    make_orchestrator();
    repository_->save(trip("t1", 10));
    repository_->remove(EntityType::TRIP, "t1");

    ASSERT_TRUE(orchestrator_->perform_sync().succeeded());

    auto calls = remote_->calls();
    ASSERT_GE(calls.size(), 2u);
    EXPECT_EQ(calls[0], "push TRIP t1");
    EXPECT_EQ(calls[1], "delete TRIP t1");
    EXPECT_FALSE(remote_->server_record(EntityType::TRIP, "t1").has_value());
}

TEST_F(SyncOrchestratorTest, PartialFailureRetriesOnlyFailedOperation) {
    sign_in();
    make_orchestrator();
    repository_->save(trip("t1", 10));
    repository_->save(trip("t2", 20));
    remote_->fail_entity("t1", ErrorKind::TRANSIENT);

    SyncResult result = orchestrator_->perform_sync();

    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.operations_applied, 1);
    EXPECT_EQ(result.operations_failed, 1);
    auto pending = queue_->list_pending();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].entity_id, "t1");
    EXPECT_EQ(pending[0].retry_count, 1);
    EXPECT_TRUE(local_store_->is_dirty(EntityType::TRIP, "t1"));
}

TEST_F(SyncOrchestratorTest, FailedOperationDeferredUntilBackoffElapses) {
    sign_in();
    make_orchestrator();
    repository_->save(trip("t1", 10));
    remote_->fail_entity("t1", ErrorKind::TRANSIENT);
    orchestrator_->perform_sync();
    remote_->clear_failures();

    SyncResult deferred = orchestrator_->perform_sync();
    EXPECT_EQ(deferred.operations_deferred, 1);
    EXPECT_EQ(queue_->pending_count(), 1u);

    clock_->advance(queue_->backoff_ms(1));
    SyncResult retried = orchestrator_->perform_sync();
    EXPECT_EQ(retried.operations_applied, 1);
    EXPECT_EQ(queue_->pending_count(), 0u);
}

TEST_F(SyncOrchestratorTest, ExhaustedOperationIsDeadLettered) {
    sign_in();
    make_orchestrator();
    repository_->save(trip("t1", 10));
    remote_->fail_entity("t1", ErrorKind::PERMANENT);

    for (int i = 0; i < 5; ++i) {
        orchestrator_->perform_sync();
        clock_->advance(10 * kMinute);
    }

    SyncResult result = orchestrator_->perform_sync();
    EXPECT_EQ(result.operations_dead_lettered, 1);
    EXPECT_EQ(remote_->count_calls("push TRIP t1"), 5);
    EXPECT_EQ(orchestrator_->get_sync_stats().dead_lettered_operations, 1u);
    EXPECT_EQ(queue_->pending_count(), 1u);
}

TEST_F(SyncOrchestratorTest, RejectedCredentialIsRenewedAndOperationRetried) {
    sign_in();
    make_orchestrator();
    repository_->save(trip("t1", 10));
    remote_->fail_entity("t1", ErrorKind::AUTH, /*times=*/1);

    SyncResult result = orchestrator_->perform_sync();

    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ(result.operations_applied, 1);
    EXPECT_EQ(result.operations_failed, 0);
    EXPECT_EQ(remote_->count_calls("push TRIP t1"), 2);
    // One refresh at the start of export, one forced by the rejection
    EXPECT_EQ(auth_->calls.load(), 2);
    EXPECT_EQ(session_store_->get_access_token(), "access-2");
    EXPECT_EQ(queue_->pending_count(), 0u);
}

TEST_F(SyncOrchestratorTest, PersistentRejectionDoesNotBlockBacklog) {
    sign_in();
    make_orchestrator();
    repository_->save(trip("t1", 10));
    repository_->save(trip("t2", 20));
    remote_->fail_entity("t1", ErrorKind::AUTH);

    SyncResult first = orchestrator_->perform_sync();

    EXPECT_TRUE(first.succeeded());
    EXPECT_EQ(first.operations_applied, 1);
    EXPECT_EQ(first.operations_failed, 1);
    EXPECT_EQ(remote_->count_calls("push TRIP t2"), 1);
    EXPECT_TRUE(remote_->server_record(EntityType::TRIP, "t2").has_value());
    auto pending = queue_->list_pending();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].entity_id, "t1");
    EXPECT_EQ(pending[0].retry_count, 1);

    for (int i = 0; i < 6; ++i) {
        clock_->advance(30 * kMinute);
        orchestrator_->perform_sync();
    }

    EXPECT_EQ(queue_->dead_lettered_count(), 1u);
    EXPECT_EQ(queue_->list_pending()[0].retry_count, 5);
    EXPECT_EQ(orchestrator_->select_next_interval(), std::chrono::milliseconds(900000));
}

TEST_F(SyncOrchestratorTest, OnlyOneForcedRenewalPerPass) {
    sign_in();
    make_orchestrator();
    repository_->save(trip("t1", 10));
    repository_->save(trip("t2", 20));
    repository_->save(trip("t3", 30));
    remote_->fail_entity("t1", ErrorKind::AUTH);
    remote_->fail_entity("t2", ErrorKind::AUTH);

    SyncResult result = orchestrator_->perform_sync();

    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.operations_failed, 2);
    EXPECT_EQ(result.operations_applied, 1);
    EXPECT_EQ(auth_->calls.load(), 2);
    EXPECT_EQ(remote_->count_calls("push TRIP t1"), 2);
    EXPECT_EQ(remote_->count_calls("push TRIP t2"), 1);
}

TEST_F(SyncOrchestratorTest, FailedRenewalAbortsAndNextPassRefreshesFirst) {
    sign_in();
    make_orchestrator();
    ASSERT_TRUE(coordinator_->refresh_if_needed());
    repository_->save(trip("t1", 10));
    repository_->save(trip("t2", 20));
    remote_->fail_entity("t1", ErrorKind::AUTH, /*times=*/1);
    auth_->fail_with = ErrorKind::TRANSIENT;

    SyncResult failed = orchestrator_->perform_sync();

    EXPECT_EQ(failed.outcome, SyncOutcome::FAILED);
    EXPECT_NE(failed.error.find("could not be renewed"), std::string::npos);
    EXPECT_EQ(remote_->count_calls("push TRIP t2"), 0);
    EXPECT_EQ(queue_->list_pending()[0].retry_count, 0);
    EXPECT_EQ(auth_->calls.load(), 2);

    // Still inside the refresh throttle window of the last good refresh
    auth_->fail_with.reset();
    clock_->advance(30 * kSecond);
    SyncResult retried = orchestrator_->perform_sync();

    ASSERT_TRUE(retried.succeeded());
    EXPECT_EQ(auth_->calls.load(), 3);
    EXPECT_EQ(session_store_->get_access_token(), "access-3");
    EXPECT_EQ(remote_->count_calls("push TRIP t1"), 2);
    EXPECT_EQ(queue_->pending_count(), 0u);
}

TEST_F(SyncOrchestratorTest, RejectedDirtyEntityIsRetriedWithRenewedCredential) {
    sign_in();
    make_orchestrator();
    EntityRecord record = trip("t9", 9);
    record.updated_at_ms = clock_->now_ms();
    local_store_->upsert(record, /*mark_dirty=*/true);
    remote_->fail_entity("t9", ErrorKind::AUTH, /*times=*/1);

    SyncResult result = orchestrator_->perform_sync();

    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ(result.entities_pushed, 1);
    EXPECT_EQ(remote_->count_calls("push TRIP t9"), 2);
    EXPECT_FALSE(local_store_->is_dirty(EntityType::TRIP, "t9"));
}

TEST_F(SyncOrchestratorTest, DisabledRetryCeilingKeepsRetrying) {
    sign_in();
    RetryPolicy policy;
    policy.max_retry_count = 0;
    queue_ = std::make_shared<PendingOperationQueue>(
        std::make_shared<InMemoryPendingOperationStore>(), clock_, policy);
    repository_ = std::make_shared<OfflineRepository>(local_store_, queue_, clock_);
    make_orchestrator();
    repository_->save(trip("t1", 10));
    remote_->fail_entity("t1", ErrorKind::PERMANENT);

    for (int i = 0; i < 7; ++i) {
        SyncResult result = orchestrator_->perform_sync();
        EXPECT_EQ(result.operations_failed, 1);
        EXPECT_EQ(result.operations_dead_lettered, 0);
        clock_->advance(10 * kMinute);
    }

    EXPECT_EQ(remote_->count_calls("push TRIP t1"), 7);
    EXPECT_EQ(queue_->list_pending()[0].retry_count, 7);
    EXPECT_EQ(queue_->dead_lettered_count(), 0u);
}

TEST_F(SyncOrchestratorTest, HungRemoteCallTimesOut) {
    sign_in();
    SyncOrchestratorConfig config;
    config.remote_call_timeout = std::chrono::milliseconds(50);
    make_orchestrator(config);
    repository_->save(trip("t1", 10));
    remote_->gate.close();

    SyncResult result = orchestrator_->perform_sync();

    EXPECT_EQ(result.outcome, SyncOutcome::FAILED);
    EXPECT_EQ(queue_->list_pending()[0].retry_count, 1);
    EXPECT_FALSE(orchestrator_->is_syncing());
}

TEST_F(SyncOrchestratorTest, RefreshFailureAbortsPass) {
    sign_in();
    make_orchestrator();
    repository_->save(trip("t1", 10));
    auth_->fail_with = ErrorKind::AUTH;

    SyncResult result = orchestrator_->perform_sync();

    EXPECT_EQ(result.outcome, SyncOutcome::FAILED);
    EXPECT_NE(result.error.find("token refresh failed"), std::string::npos);
    EXPECT_TRUE(remote_->calls().empty());
    EXPECT_EQ(queue_->pending_count(), 1u);
}

TEST_F(SyncOrchestratorTest, DirtyEntityWithoutOperationIsPushed) {
    sign_in();
    make_orchestrator();
    EntityRecord record = trip("t9", 9);
    record.updated_at_ms = clock_->now_ms();
    local_store_->upsert(record, /*mark_dirty=*/true);

    SyncResult result = orchestrator_->perform_sync();

    EXPECT_EQ(result.entities_pushed, 1);
    EXPECT_FALSE(local_store_->is_dirty(EntityType::TRIP, "t9"));
    EXPECT_TRUE(remote_->server_record(EntityType::TRIP, "t9").has_value());
}

// =============================================================================
// Import
// =============================================================================

TEST_F(SyncOrchestratorTest, PullStoresRemoteRecordsAndAdvancesWatermark) {
    sign_in();
    make_orchestrator();
    EntityRecord vehicle;
    vehicle.entity_type = EntityType::VEHICLE;
    vehicle.entity_id = "v1";
    vehicle.payload = {{"plate", "AB-123"}};
    remote_->seed(vehicle);

    SyncResult result = orchestrator_->perform_sync();

    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ(result.entities_pulled, 1);
    auto local = local_store_->get(EntityType::VEHICLE, "v1");
    ASSERT_TRUE(local.has_value());
    EXPECT_EQ(local->payload["plate"].get<std::string>(), "AB-123");
    EXPECT_FALSE(local_store_->is_dirty(EntityType::VEHICLE, "v1"));
    int64_t watermark = local_store_->last_pull_watermark(EntityType::VEHICLE);
    EXPECT_GT(watermark, 0);

    orchestrator_->perform_sync();
    EXPECT_EQ(remote_->count_calls("pull VEHICLE since " + std::to_string(watermark)), 1);
}

TEST_F(SyncOrchestratorTest, UnpushedLocalChangeWinsOverRemoteCopy) {
    sign_in();
    make_orchestrator();
    remote_->seed(trip("t1", 99));
    repository_->save(trip("t1", 10));
    remote_->fail_entity("t1", ErrorKind::TRANSIENT);

    orchestrator_->perform_sync();

    auto local = local_store_->get(EntityType::TRIP, "t1");
    ASSERT_TRUE(local.has_value());
    EXPECT_EQ(local->payload["distance_km"], 10);
    EXPECT_TRUE(local_store_->is_dirty(EntityType::TRIP, "t1"));
}

TEST_F(SyncOrchestratorTest, RemoteTombstoneRemovesLocalEntity) {
    sign_in();
    make_orchestrator();
    local_store_->upsert(trip("t1", 10), /*mark_dirty=*/false);
    remote_->seed_tombstone(EntityType::TRIP, "t1");

    ASSERT_TRUE(orchestrator_->perform_sync().succeeded());
    EXPECT_FALSE(local_store_->get(EntityType::TRIP, "t1").has_value());
}

TEST_F(SyncOrchestratorTest, PullFailureFailsPass) {
    sign_in();
    make_orchestrator();
    remote_->fail_pull = ErrorKind::TRANSIENT;

    SyncResult result = orchestrator_->perform_sync();
    EXPECT_EQ(result.outcome, SyncOutcome::FAILED);
    EXPECT_EQ(local_store_->last_pull_watermark(EntityType::TRIP), 0);
}

TEST_F(SyncOrchestratorTest, ForceFullSyncPullsFromTheBeginning) {
    sign_in();
    make_orchestrator();
    EntityRecord vehicle;
    vehicle.entity_type = EntityType::VEHICLE;
    vehicle.entity_id = "v1";
    vehicle.payload = {{"plate", "AB-123"}};
    remote_->seed(vehicle);
    ASSERT_TRUE(orchestrator_->perform_sync().succeeded());

    // Local copy drifts without being marked dirty; a delta pull never sees it
    EntityRecord drifted = vehicle;
    drifted.payload = {{"plate", "ZZ-999"}};
    local_store_->upsert(drifted, /*mark_dirty=*/false);
    ASSERT_TRUE(orchestrator_->perform_sync().succeeded());
    auto local = local_store_->get(EntityType::VEHICLE, "v1");
    ASSERT_TRUE(local.has_value());
    EXPECT_EQ(local->payload["plate"].get<std::string>(), "ZZ-999");

    SyncResult full = orchestrator_->force_full_sync();

    ASSERT_TRUE(full.succeeded());
    EXPECT_EQ(remote_->count_calls("pull VEHICLE since 0"), 2);
    local = local_store_->get(EntityType::VEHICLE, "v1");
    ASSERT_TRUE(local.has_value());
    EXPECT_EQ(local->payload["plate"].get<std::string>(), "AB-123");
    EXPECT_GT(local_store_->last_pull_watermark(EntityType::VEHICLE), 0);
}

TEST_F(SyncOrchestratorTest, RetryFailedOperationsRevivesDeadLetters) {
    sign_in();
    make_orchestrator();
    repository_->save(trip("t1", 10));
    remote_->fail_entity("t1", ErrorKind::PERMANENT);
    for (int i = 0; i < 5; ++i) {
        orchestrator_->perform_sync();
        clock_->advance(10 * kMinute);
    }
    ASSERT_EQ(queue_->dead_lettered_count(), 1u);
    remote_->clear_failures();

    EXPECT_EQ(orchestrator_->retry_failed_operations(), 1u);

    EXPECT_EQ(queue_->pending_count(), 0u);
    EXPECT_EQ(remote_->count_calls("push TRIP t1"), 6);
    EXPECT_EQ(orchestrator_->retry_failed_operations(), 0u);
}

TEST_F(SyncOrchestratorTest, ExportOnlyTypeIsNeverPulled) {
    sign_in();
    SyncOrchestratorConfig config;
    config.directions[EntityType::EXPENSE] = SyncDirection::EXPORT_ONLY;
    make_orchestrator(config);

    ASSERT_TRUE(orchestrator_->perform_sync().succeeded());
    EXPECT_EQ(remote_->count_calls("pull EXPENSE"), 0);
    EXPECT_EQ(remote_->count_calls("pull TRIP"), 1);
}

// =============================================================================
// Scheduling Decisions
// =============================================================================

TEST_F(SyncOrchestratorTest, IntervalFollowsBacklog) {
    make_orchestrator();
    EXPECT_EQ(orchestrator_->select_next_interval(), std::chrono::milliseconds(900000));

    repository_->save(trip("t1", 10));
    EXPECT_EQ(orchestrator_->select_next_interval(), std::chrono::milliseconds(30000));

    queue_->clear_all();
    EXPECT_EQ(orchestrator_->select_next_interval(), std::chrono::milliseconds(900000));
}

TEST_F(SyncOrchestratorTest, DeadLetteredOperationsDoNotShortenInterval) {
    make_orchestrator();
    std::string id = queue_->enqueue(OperationType::UPDATE, EntityType::TRIP, "t1");
    for (int i = 0; i < 5; ++i) {
        queue_->mark_failed(id);
    }
    EXPECT_EQ(orchestrator_->select_next_interval(), std::chrono::milliseconds(900000));
}

TEST_F(SyncOrchestratorTest, RestoredAfterTwoMinutesSyncs) {
    sign_in();
    make_orchestrator();
    ASSERT_TRUE(orchestrator_->perform_sync().succeeded());

    connectivity_->set_network_available(false);
    clock_->advance(2 * kMinute);
    EXPECT_TRUE(orchestrator_->should_sync_on_network_restored());
    connectivity_->set_network_available(true);

    EXPECT_EQ(orchestrator_->get_sync_stats().passes_succeeded, 2u);
}

TEST_F(SyncOrchestratorTest, RestoredAfterThirtySecondsWithBacklogSyncs) {
    sign_in();
    make_orchestrator();
    ASSERT_TRUE(orchestrator_->perform_sync().succeeded());

    connectivity_->set_network_available(false);
    clock_->advance(30 * kSecond);
    repository_->save(trip("a", 1));
    repository_->save(trip("b", 2));
    repository_->save(trip("c", 3));
    EXPECT_TRUE(orchestrator_->should_sync_on_network_restored());
    connectivity_->set_network_available(true);

    EXPECT_EQ(orchestrator_->get_sync_stats().passes_succeeded, 2u);
    EXPECT_EQ(queue_->pending_count(), 0u);
}

TEST_F(SyncOrchestratorTest, RestoredAfterThirtySecondsWithoutBacklogWaits) {
    sign_in();
    make_orchestrator();
    ASSERT_TRUE(orchestrator_->perform_sync().succeeded());

    connectivity_->set_network_available(false);
    clock_->advance(30 * kSecond);
    EXPECT_FALSE(orchestrator_->should_sync_on_network_restored());
    connectivity_->set_network_available(true);

    EXPECT_EQ(orchestrator_->get_sync_stats().passes_succeeded, 1u);
}

TEST_F(SyncOrchestratorTest, ConnectivityKnownBeforeWiringIsNotARestoration) {
    sign_in();
    connectivity_->set_network_available(false);
    connectivity_->probe_once();
    make_orchestrator();

    SyncResult result = orchestrator_->force_sync_now();

    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ(orchestrator_->get_sync_stats().passes_succeeded, 1u);
    EXPECT_EQ(remote_->count_calls("pull TRIP"), 1);
}

TEST_F(SyncOrchestratorTest, NeverSyncedAlwaysSyncsOnRestore) {
    make_orchestrator();
    EXPECT_TRUE(orchestrator_->should_sync_on_network_restored());
}

// =============================================================================
// Periodic Sync and Stats
// =============================================================================

TEST_F(SyncOrchestratorTest, PeriodicSyncRunsImmediatelyAndStops) {
    sign_in();
    make_orchestrator();
    repository_->save(trip("t1", 10));

    ASSERT_TRUE(orchestrator_->start_periodic_sync());
    EXPECT_TRUE(orchestrator_->is_periodic_sync_running());
    ASSERT_TRUE(test::wait_until([this] { return queue_->pending_count() == 0u; }));

    orchestrator_->stop_periodic_sync();
    EXPECT_FALSE(orchestrator_->is_periodic_sync_running());
    orchestrator_->stop_periodic_sync();
}

TEST_F(SyncOrchestratorTest, StopLetsInFlightPassFinish) {
    sign_in();
    make_orchestrator();
    repository_->save(trip("t1", 10));
    remote_->gate.close();

    ASSERT_TRUE(orchestrator_->start_periodic_sync());
    ASSERT_TRUE(test::wait_until([this] { return remote_->gate.waiting() == 1; }));

    auto stopped = std::async(std::launch::async, [this] { orchestrator_->stop_periodic_sync(); });
    EXPECT_EQ(stopped.wait_for(std::chrono::milliseconds(100)), std::future_status::timeout);
    EXPECT_TRUE(orchestrator_->is_syncing());

    remote_->gate.open();
    stopped.get();

    EXPECT_FALSE(orchestrator_->is_periodic_sync_running());
    EXPECT_FALSE(orchestrator_->is_syncing());
    auto last = orchestrator_->last_result();
    ASSERT_TRUE(last.has_value());
    EXPECT_TRUE(last->succeeded());
    EXPECT_EQ(queue_->pending_count(), 0u);
}

TEST_F(SyncOrchestratorTest, StatsSerializeToJson) {
    sign_in();
    make_orchestrator();
    repository_->save(trip("t1", 10));

    auto json = orchestrator_->get_sync_stats().to_json();
    EXPECT_EQ(json["pending_operations"], 1);
    EXPECT_EQ(json["is_syncing"], false);
    EXPECT_EQ(json["is_network_available"], true);
    EXPECT_TRUE(json["last_successful_sync_at_ms"].is_null());
}
