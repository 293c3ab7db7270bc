/**
 * Tests for the failover orchestrator: step order, the fatal promote step,
 * best-effort steps and the single-run guarantee.
 */

#include "cluster/failover_orchestrator.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <atomic>

using namespace hacluster;
using namespace hacluster::cluster;
using namespace hacluster::testing_support;

class FailoverOrchestratorTest : public ::testing::Test {
protected:
    std::shared_ptr<InMemoryClusterStateStore> store =
        std::make_shared<InMemoryClusterStateStore>();
    std::shared_ptr<FakeHttpClient> http = std::make_shared<FakeHttpClient>();
    std::shared_ptr<FakeReplicationDriver> replication =
        std::make_shared<FakeReplicationDriver>();
    std::shared_ptr<FakeServiceController> services =
        std::make_shared<FakeServiceController>();
    std::shared_ptr<FailoverGuard> guard = std::make_shared<FailoverGuard>();
    std::shared_ptr<PeerNotifier> notifier;
    std::vector<uint64_t> ids;

    void SetUp() override {
        notifier = std::make_shared<PeerNotifier>(http, PeerNotifierOptions{});
        ids = seed_roster(*store);
        ASSERT_TRUE(store->save_config(make_config(ServerRole::SECONDARY, SECONDARY_IP,
                                                   "hw-secondary-00002"))
                        .is_ok());
        http->set_response(url_for(MAIN_IP, "/cluster/notify"), 200);
        http->set_response(url_for(THIRD_IP, "/cluster/notify"), 200);
    }

    std::shared_ptr<FailoverOrchestrator> make_orchestrator(
        const FailoverOptions& options = FailoverOptions{}) {
        return std::make_shared<FailoverOrchestrator>(store, replication, services,
                                                      notifier, guard, options);
    }

    FailoverOutcome run_held(FailoverOrchestrator& orchestrator, FailoverTrigger trigger) {
        EXPECT_TRUE(guard->try_acquire("failover"));
        return orchestrator.run(trigger);
    }
};

// ============================================================================
// Successful runs
// ============================================================================

TEST_F(FailoverOrchestratorTest, RunsStepsInOrder) {
    auto orchestrator = make_orchestrator();
    auto outcome = run_held(*orchestrator, FailoverTrigger::AUTOMATIC);

    ASSERT_TRUE(outcome.success) << outcome.error;
    EXPECT_EQ(outcome.former_main_ip, MAIN_IP);
    EXPECT_EQ(replication->calls(),
              (std::vector<std::string>{"replication_lag_seconds", "promote_to_main",
                                        "stop_cache_replication"}));
    EXPECT_EQ(outcome.peers_notified.size(), 2u);
    EXPECT_TRUE(outcome.peers_failed.empty());
    EXPECT_EQ(services->restarts(), 1);
    EXPECT_FALSE(guard->in_progress());

    auto events = store->list_events(CLUSTER_ID, 10);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[1].event_type, event_types::FAILOVER_STARTED);
    EXPECT_EQ(events[1].severity, EventSeverity::CRITICAL);
    EXPECT_EQ(events[0].event_type, event_types::FAILOVER_COMPLETED);
    EXPECT_EQ(events[0].description,
              "Failover completed: 10.0.0.2 is now main (former main 10.0.0.1)");
}

TEST_F(FailoverOrchestratorTest, PromotedNodeBecomesMain) {
    auto orchestrator = make_orchestrator();
    ASSERT_TRUE(run_held(*orchestrator, FailoverTrigger::AUTOMATIC).success);

    auto config = store->load_config().value();
    EXPECT_EQ(config.server_role, ServerRole::MAIN);
    EXPECT_EQ(config.api_role, ApiRole::ACTIVE);
    EXPECT_EQ(config.radius_role, RadiusRole::PRIMARY);
    EXPECT_EQ(config.main_server_ip, SECONDARY_IP);
    EXPECT_TRUE(config.last_heartbeat.has_value());

    EXPECT_EQ(store->find_node(ids[0])->status, NodeStatus::OFFLINE);
    EXPECT_EQ(store->find_node(ids[1])->server_role, ServerRole::MAIN);
    EXPECT_EQ(store->find_node(ids[1])->status, NodeStatus::ONLINE);
}

TEST_F(FailoverOrchestratorTest, NotifyCarriesNewMainAndSecret) {
    auto orchestrator = make_orchestrator();
    ASSERT_TRUE(run_held(*orchestrator, FailoverTrigger::AUTOMATIC).success);

    auto posts = http->posts_to(url_for(THIRD_IP, "/cluster/notify"));
    ASSERT_EQ(posts.size(), 1u);
    auto message = parse_notify_message(posts[0].body);
    ASSERT_TRUE(message.is_ok()) << message.error();
    EXPECT_EQ(message.value().event, "new_main");
    EXPECT_EQ(message.value().new_main_ip, SECONDARY_IP);
    EXPECT_EQ(message.value().cluster_secret, CLUSTER_SECRET);

    // Never to itself
    EXPECT_TRUE(http->posts_to(url_for(SECONDARY_IP, "/cluster/notify")).empty());
}

TEST_F(FailoverOrchestratorTest, SwitchoverKeepsFormerMainOnlineAsSecondary) {
    auto orchestrator = make_orchestrator();
    ASSERT_TRUE(run_held(*orchestrator, FailoverTrigger::SWITCHOVER).success);

    auto former = store->find_node(ids[0]);
    ASSERT_TRUE(former.has_value());
    EXPECT_EQ(former->server_role, ServerRole::SECONDARY);
    EXPECT_EQ(former->status, NodeStatus::ONLINE);
}

TEST_F(FailoverOrchestratorTest, HighLagOnlyWarns) {
    replication->lag_seconds = Result<int64_t>(int64_t{600});
    auto orchestrator = make_orchestrator();
    EXPECT_TRUE(run_held(*orchestrator, FailoverTrigger::AUTOMATIC).success);

    replication->lag_seconds = Result<int64_t>("psql: connection refused");
    EXPECT_TRUE(run_held(*orchestrator, FailoverTrigger::AUTOMATIC).success);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(FailoverOrchestratorTest, PromoteFailureAbortsRun) {
    replication->promote_result = Result<bool>("pg_promote did not complete within 60s");
    auto orchestrator = make_orchestrator();
    auto outcome = run_held(*orchestrator, FailoverTrigger::AUTOMATIC);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.failed_step, FailoverStep::PROMOTE_DATABASE);
    EXPECT_EQ(outcome.error, "database promotion failed: pg_promote did not complete within 60s");

    EXPECT_FALSE(replication->was_called("stop_cache_replication"));
    EXPECT_EQ(http->call_count(), 0u);
    EXPECT_EQ(services->restarts(), 0);
    EXPECT_EQ(store->load_config().value().server_role, ServerRole::SECONDARY);
    EXPECT_EQ(events_of_type(*store, event_types::FAILOVER_FAILED).size(), 1u);
    EXPECT_TRUE(events_of_type(*store, event_types::FAILOVER_COMPLETED).empty());
    EXPECT_FALSE(guard->in_progress());
}

TEST_F(FailoverOrchestratorTest, BroadcastContinuesPastUnreachablePeer) {
    http->set_unreachable(url_for(MAIN_IP, "/cluster/notify"));
    auto orchestrator = make_orchestrator();
    auto outcome = run_held(*orchestrator, FailoverTrigger::AUTOMATIC);

    ASSERT_TRUE(outcome.success);
    EXPECT_EQ(outcome.peers_failed, std::vector<std::string>{MAIN_IP});
    EXPECT_EQ(outcome.peers_notified, std::vector<std::string>{THIRD_IP});
    EXPECT_EQ(services->restarts(), 1);

    auto completed = events_of_type(*store, event_types::FAILOVER_COMPLETED);
    ASSERT_EQ(completed.size(), 1u);
    EXPECT_NE(completed[0].description.find("1 peer(s) not notified"), std::string::npos);
}

TEST_F(FailoverOrchestratorTest, BestEffortFailuresBecomeWarnings) {
    replication->stop_cache_result = Result<bool>("redis-cli: Could not connect");
    services->restart_result = Result<bool>("restart command exited with status 1");
    auto orchestrator = make_orchestrator();
    auto outcome = run_held(*orchestrator, FailoverTrigger::AUTOMATIC);

    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.warnings.size(), 2u);
    EXPECT_EQ(store->load_config().value().server_role, ServerRole::MAIN);
}

TEST_F(FailoverOrchestratorTest, MissingConfigFailsBeforeAnySideEffect) {
    ASSERT_TRUE(store->clear_config().is_ok());
    auto orchestrator = make_orchestrator();
    auto outcome = run_held(*orchestrator, FailoverTrigger::AUTOMATIC);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.failed_step, FailoverStep::LOAD_CONFIG);
    EXPECT_TRUE(replication->calls().empty());
    EXPECT_FALSE(guard->in_progress());
}

// ============================================================================
// Quorum
// ============================================================================

TEST_F(FailoverOrchestratorTest, QuorumBlocksWhenNoObserverReachable) {
    FailoverOptions options;
    options.require_quorum = true;
    auto orchestrator = make_orchestrator(options);
    auto outcome = run_held(*orchestrator, FailoverTrigger::AUTOMATIC);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.failed_step, FailoverStep::QUORUM_CHECK);
    EXPECT_EQ(outcome.error, "quorum not reached: 0 of 1 observers reachable");
    EXPECT_FALSE(replication->was_called("promote_to_main"));
}

TEST_F(FailoverOrchestratorTest, QuorumPassesWithMajority) {
    http->set_response(url_for(THIRD_IP, "/health"), 200, "{\"status\":\"ok\"}");
    http->set_response("http://10.0.0.9:8080/health", 200, "{\"status\":\"ok\"}");
    FailoverOptions options;
    options.require_quorum = true;
    options.quorum_witnesses = {"http://10.0.0.9:8080/health"};
    auto orchestrator = make_orchestrator(options);

    EXPECT_TRUE(run_held(*orchestrator, FailoverTrigger::AUTOMATIC).success);
}

TEST_F(FailoverOrchestratorTest, QuorumDoesNotApplyToRequestedPromotion) {
    FailoverOptions options;
    options.require_quorum = true;
    auto orchestrator = make_orchestrator(options);
    EXPECT_TRUE(run_held(*orchestrator, FailoverTrigger::PROMOTE_REQUEST).success);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(FailoverOrchestratorTest, TryLaunchRefusesWhileGuardHeld) {
    auto orchestrator = make_orchestrator();
    ASSERT_TRUE(guard->try_acquire("switchover"));

    EXPECT_FALSE(orchestrator->try_launch(FailoverTrigger::PROMOTE_REQUEST).has_value());
    EXPECT_EQ(orchestrator->runs_started(), 0u);
    EXPECT_EQ(guard->active_operation(), "switchover");
    guard->release();
}

TEST_F(FailoverOrchestratorTest, LaunchedRunReportsCompletion) {
    auto orchestrator = make_orchestrator();
    std::atomic<int> completions{0};
    std::atomic<bool> reported_success{false};
    orchestrator->set_completion_callback([&](const FailoverOutcome& outcome) {
        reported_success.store(outcome.success);
        completions++;
    });

    auto launched = orchestrator->try_launch(FailoverTrigger::PROMOTE_REQUEST);
    ASSERT_TRUE(launched.has_value());
    FailoverOutcome outcome = launched->get();
    orchestrator->wait_for_runs();

    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.trigger, FailoverTrigger::PROMOTE_REQUEST);
    EXPECT_EQ(completions.load(), 1);
    EXPECT_TRUE(reported_success.load());
    EXPECT_FALSE(guard->in_progress());

    // Guard free again, so a second launch is accepted
    auto second = orchestrator->try_launch(FailoverTrigger::PROMOTE_REQUEST);
    ASSERT_TRUE(second.has_value());
    second->wait();
    orchestrator->wait_for_runs();
    EXPECT_EQ(orchestrator->runs_started(), 2u);
}

TEST(FailoverUtilsTest, NamesAreStable) {
    EXPECT_EQ(failover_utils::trigger_to_string(FailoverTrigger::SWITCHOVER), "switchover");
    EXPECT_EQ(failover_utils::step_to_string(FailoverStep::PROMOTE_DATABASE),
              "promote_database");
}
