/**
 * Tests for the process-backed replication driver and service controller.
 *
 * The driver's commands go through a scripted FakeProcessRunner; the real
 * ProcessRunner is exercised separately with harmless system commands.
 */

#include "cluster/replication_driver.h"
#include "cluster/service_controller.h"
#include "common/process_runner.h"
#include "test_helpers.h"
#include <gtest/gtest.h>
#include <algorithm>

using namespace hacluster;
using namespace hacluster::cluster;
using namespace hacluster::testing_support;

namespace {

bool contains(const std::vector<std::string>& argv, const std::string& value) {
    return std::find(argv.begin(), argv.end(), value) != argv.end();
}

// The SQL statement is the last argument of every psql invocation
std::string sql_of(const FakeProcessRunner::Invocation& invocation) {
    return invocation.argv.back();
}

} // namespace

class ReplicationDriverTest : public ::testing::Test {
protected:
    common::ControllerConfig config;
    std::shared_ptr<FakeProcessRunner> runner = std::make_shared<FakeProcessRunner>();

    void SetUp() override {
        config.db_host = "127.0.0.1";
        config.db_port = 5432;
        config.db_user = "postgres";
        config.db_name = "proisp";
        config.db_password = "pg-pass";
        config.redis_password = "redis-pass";
        config.pg_data_dir = "/data/pg";
    }

    ProcessReplicationDriver make_driver() { return ProcessReplicationDriver(config, runner); }
};

TEST_F(ReplicationDriverTest, PsqlInvocationCarriesConnectionAndPassword) {
    runner->set_handler([](const std::vector<std::string>&) { return process_output(0, "f\n"); });
    auto driver = make_driver();

    auto recovery = driver.is_in_recovery();
    ASSERT_TRUE(recovery.is_ok()) << recovery.error();
    EXPECT_FALSE(recovery.value());

    ASSERT_EQ(runner->invocations().size(), 1u);
    const auto& invocation = runner->invocations()[0];
    EXPECT_EQ(invocation.argv[0], "psql");
    EXPECT_TRUE(contains(invocation.argv, "-At"));
    EXPECT_TRUE(contains(invocation.argv, "ON_ERROR_STOP=1"));
    EXPECT_EQ(sql_of(invocation), "SELECT pg_is_in_recovery()");
    EXPECT_EQ(invocation.env.at("PGPASSWORD"), "pg-pass");
    // Never on the command line
    EXPECT_FALSE(contains(invocation.argv, "pg-pass"));
}

TEST_F(ReplicationDriverTest, PromoteSkipsWhenAlreadyPrimary) {
    runner->set_handler([](const std::vector<std::string>&) { return process_output(0, "f"); });
    auto driver = make_driver();

    ASSERT_TRUE(driver.promote_to_main().is_ok());
    ASSERT_EQ(runner->invocations().size(), 1u);
}

TEST_F(ReplicationDriverTest, PromoteRunsPgPromoteAndConfirms) {
    int recovery_checks = 0;
    runner->set_handler([&recovery_checks](const std::vector<std::string>& argv) {
        const std::string& sql = argv.back();
        if (sql == "SELECT pg_is_in_recovery()") {
            return process_output(0, recovery_checks++ == 0 ? "t" : "f");
        }
        return process_output(0, "t");
    });
    auto driver = make_driver();

    auto promoted = driver.promote_to_main();
    ASSERT_TRUE(promoted.is_ok()) << promoted.error();
    ASSERT_EQ(runner->invocations().size(), 3u);
    EXPECT_EQ(sql_of(runner->invocations()[1]), "SELECT pg_promote(true, 60)");
}

TEST_F(ReplicationDriverTest, PromoteFailsWhenStillInRecovery) {
    runner->set_handler([](const std::vector<std::string>&) { return process_output(0, "t"); });
    auto driver = make_driver();

    auto promoted = driver.promote_to_main();
    ASSERT_TRUE(promoted.is_err());
    EXPECT_EQ(promoted.error(), "database is still in recovery after pg_promote");
}

TEST_F(ReplicationDriverTest, PsqlFailureSurfacesFirstLineOfOutput) {
    runner->set_handler([](const std::vector<std::string>&) {
        return process_output(2, "psql: error: connection refused\nsecond line");
    });
    auto driver = make_driver();

    auto recovery = driver.is_in_recovery();
    ASSERT_TRUE(recovery.is_err());
    EXPECT_EQ(recovery.error(), "psql exited with status 2: psql: error: connection refused");
}

TEST_F(ReplicationDriverTest, LagBytesQueriesReplicaByAddress) {
    runner->set_handler([](const std::vector<std::string>&) { return process_output(0, "2097152\n"); });
    auto driver = make_driver();

    auto lag = driver.replication_lag_bytes("10.0.0.2");
    ASSERT_TRUE(lag.is_ok()) << lag.error();
    EXPECT_EQ(lag.value(), 2097152);
    EXPECT_NE(sql_of(runner->invocations()[0]).find("client_addr = '10.0.0.2'"),
              std::string::npos);
}

TEST_F(ReplicationDriverTest, LagBytesWithoutReplicationRowIsAnError) {
    runner->set_handler([](const std::vector<std::string>&) { return process_output(0, ""); });
    auto driver = make_driver();

    auto lag = driver.replication_lag_bytes("10.0.0.2");
    ASSERT_TRUE(lag.is_err());
    EXPECT_EQ(lag.error(), "no replication connection from 10.0.0.2");
}

TEST_F(ReplicationDriverTest, ReadOnlyFenceAltersSystemAndReloads) {
    auto driver = make_driver();
    ASSERT_TRUE(driver.set_read_only(true).is_ok());
    ASSERT_TRUE(driver.set_read_only(false).is_ok());

    const auto& calls = runner->invocations();
    ASSERT_EQ(calls.size(), 4u);
    EXPECT_EQ(sql_of(calls[0]), "ALTER SYSTEM SET default_transaction_read_only = on");
    EXPECT_EQ(sql_of(calls[1]), "SELECT pg_reload_conf()");
    EXPECT_EQ(sql_of(calls[2]), "ALTER SYSTEM SET default_transaction_read_only = off");
}

TEST_F(ReplicationDriverTest, DemoteCreatesSlotConfiguresStandbyAndRestarts) {
    auto driver = make_driver();
    auto demoted = driver.demote_to_replica("10.0.0.2", "replica_hwmain0000000001");
    ASSERT_TRUE(demoted.is_ok()) << demoted.error();

    const auto& calls = runner->invocations();
    ASSERT_EQ(calls.size(), 6u);

    // Slot is created on the new primary, not locally
    EXPECT_EQ(calls[0].argv[2], "10.0.0.2");
    EXPECT_NE(sql_of(calls[0]).find("pg_create_physical_replication_slot('replica_hwmain0000000001')"),
              std::string::npos);

    EXPECT_EQ(calls[1].argv[2], "127.0.0.1");
    EXPECT_NE(sql_of(calls[1]).find("primary_conninfo"), std::string::npos);
    EXPECT_NE(sql_of(calls[1]).find("host=10.0.0.2"), std::string::npos);
    EXPECT_NE(sql_of(calls[2]).find("primary_slot_name = 'replica_hwmain0000000001'"),
              std::string::npos);
    EXPECT_EQ(sql_of(calls[3]), "ALTER SYSTEM RESET default_transaction_read_only");

    EXPECT_EQ(calls[4].argv[0], "touch");
    EXPECT_EQ(calls[4].argv[1], "/data/pg/standby.signal");

    EXPECT_EQ(calls[5].argv[0], "pg_ctl");
    EXPECT_TRUE(contains(calls[5].argv, "restart"));
    EXPECT_TRUE(contains(calls[5].argv, "/data/pg"));
}

TEST_F(ReplicationDriverTest, DemoteStopsAtFirstFailure) {
    runner->set_handler([](const std::vector<std::string>& argv) {
        if (argv[0] == "touch") {
            return process_output(1, "touch: cannot touch: Permission denied");
        }
        return process_output(0, "");
    });
    auto driver = make_driver();

    auto demoted = driver.demote_to_replica("10.0.0.2", "replica_x");
    ASSERT_TRUE(demoted.is_err());
    EXPECT_NE(demoted.error().find("standby.signal"), std::string::npos);
    EXPECT_EQ(runner->invocations().size(), 5u);
}

TEST_F(ReplicationDriverTest, CacheReplicationUsesRedisCli) {
    auto driver = make_driver();
    ASSERT_TRUE(driver.stop_cache_replication().is_ok());
    ASSERT_TRUE(driver.follow_cache_replication("10.0.0.2").is_ok());

    const auto& calls = runner->invocations();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0].argv[0], "redis-cli");
    EXPECT_TRUE(contains(calls[0].argv, "redis-pass"));
    EXPECT_EQ(calls[0].argv.back(), "ONE");
    EXPECT_EQ(calls[1].argv[calls[1].argv.size() - 2], "10.0.0.2");
    EXPECT_EQ(calls[1].argv.back(), "6379");
}

TEST_F(ReplicationDriverTest, RedisErrorReplyIsAFailure) {
    runner->set_handler([](const std::vector<std::string>&) {
        return process_output(0, "NOAUTH Authentication required.\n");
    });
    auto driver = make_driver();

    auto stopped = driver.stop_cache_replication();
    ASSERT_TRUE(stopped.is_err());
    EXPECT_EQ(stopped.error(), "redis-cli: NOAUTH Authentication required.");
}

TEST(ReplicationHelpersTest, SlotNameUsesSanitizedHardwarePrefix) {
    EXPECT_EQ(replication_slot_name("ABCD-1234-efgh-5678-ijkl"), "replica_abcd_1234_efgh_5");
    EXPECT_EQ(replication_slot_name("short"), "replica_short");
}

TEST(ReplicationHelpersTest, SqlLiteralDoublesQuotes) {
    EXPECT_EQ(sql_literal("it's"), "'it''s'");
}

// ============================================================================
// Service controller
// ============================================================================

TEST(ServiceControllerTest, RunsConfiguredRestartCommand) {
    auto runner = std::make_shared<FakeProcessRunner>();
    ProcessServiceController services({"docker", "restart", "proisp-radius"}, runner,
                                      std::chrono::milliseconds(1000));
    ASSERT_TRUE(services.restart_radius().is_ok());
    ASSERT_EQ(runner->invocations().size(), 1u);
    EXPECT_EQ(runner->invocations()[0].argv[2], "proisp-radius");
}

TEST(ServiceControllerTest, NonZeroExitIsAnError) {
    auto runner = std::make_shared<FakeProcessRunner>();
    runner->set_handler([](const std::vector<std::string>&) {
        return process_output(1, "Error: No such container");
    });
    ProcessServiceController services({"docker", "restart", "proisp-radius"}, runner,
                                      std::chrono::milliseconds(1000));
    auto restarted = services.restart_radius();
    ASSERT_TRUE(restarted.is_err());
    EXPECT_EQ(restarted.error(), "restart command exited with status 1");
}

// ============================================================================
// Real process runner
// ============================================================================

TEST(ProcessRunnerTest, CapturesOutputAndExitCode) {
    common::ProcessRunner runner;
    auto result = runner.run({"sh", "-c", "echo \"$HACLUSTER_TEST_VALUE\"; exit 3"},
                             std::chrono::milliseconds(5000),
                             {{"HACLUSTER_TEST_VALUE", "hello"}});
    ASSERT_TRUE(result.is_ok()) << result.error();
    EXPECT_EQ(result.value().exit_code, 3);
    EXPECT_EQ(result.value().output, "hello\n");
}

TEST(ProcessRunnerTest, KillsCommandAtDeadline) {
    common::ProcessRunner runner;
    auto started = std::chrono::steady_clock::now();
    auto result = runner.run({"sleep", "5"}, std::chrono::milliseconds(200));
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error(), "command timed out after 200ms");
    EXPECT_LT(elapsed, std::chrono::seconds(4));
}

TEST(ProcessRunnerTest, MissingBinaryIsReported) {
    common::ProcessRunner runner;
    auto result = runner.run({"hacluster-no-such-binary"}, std::chrono::milliseconds(2000));
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error(), "command not found: hacluster-no-such-binary");

    EXPECT_TRUE(runner.run({}, std::chrono::milliseconds(100)).is_err());
}

TEST(ProcessRunnerTest, DescribeCommandMasksPasswords) {
    EXPECT_EQ(common::describe_command({"redis-cli", "-a", "secret", "PING"}),
              "redis-cli -a **** PING");
}
