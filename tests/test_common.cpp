/**
 * Unit tests for the common layer: Result, logging, configuration loading
 * and the cluster type conversions.
 */

#include "cluster/cluster_types.h"
#include "cluster/peer_protocol.h"
#include "common/config.h"
#include "common/logging.h"
#include "common/types.h"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <vector>

using namespace hacluster;
using namespace hacluster::common;

// ============================================================================
// Result
// ============================================================================

TEST(ResultTest, CarriesValueOrError) {
    Result<int64_t> ok(int64_t{42});
    EXPECT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), 42);

    Result<int64_t> failed("boom");
    EXPECT_TRUE(failed.is_err());
    EXPECT_EQ(failed.error(), "boom");
    EXPECT_EQ(failed.value_or(7), 7);
}

TEST(ResultTest, FalseIsASuccessfulValue) {
    Result<bool> result(false);
    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value());
}

TEST(TimeTest, UnixMillisAndIsoFormatting) {
    Timestamp ts = from_unix_millis(1700000000123);
    EXPECT_EQ(to_unix_millis(ts), 1700000000123);
    EXPECT_EQ(format_iso8601(ts), "2023-11-14T22:13:20.123Z");
}

// ============================================================================
// Logging
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    std::mutex mutex;
    std::vector<std::string> lines;
    std::vector<LogLevel> levels;

    void SetUp() override {
        Logger::instance().set_sink([this](const LogEntry& entry, const std::string& line) {
            std::lock_guard<std::mutex> lock(mutex);
            lines.push_back(line);
            levels.push_back(entry.level);
        });
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        logger.set_async_logging(false);
        logger.set_sink(nullptr);
        logger.set_json_format(false);
        logger.set_level(LogLevel::INFO);
    }

    size_t captured() {
        std::lock_guard<std::mutex> lock(mutex);
        return lines.size();
    }
};

TEST_F(LoggingTest, LevelFiltersMessages) {
    Logger::instance().set_level(LogLevel::WARN);
    LOG_INFO("test", "hidden");
    LOG_DEBUG("test", "hidden");
    LOG_WARN("test", "shown ", 42);
    LOG_FAILOVER_ERROR("promotion failed");

    ASSERT_EQ(captured(), 2u);
    EXPECT_NE(lines[0].find("[WARN] [test] shown 42"), std::string::npos);
    EXPECT_EQ(levels[1], LogLevel::CRITICAL);
    EXPECT_NE(lines[1].find("[failover] promotion failed"), std::string::npos);
}

TEST_F(LoggingTest, JsonFormatCarriesErrorCodeAndContext) {
    Logger::instance().set_json_format(true);
    LOG_STRUCTURED(LogLevel::ERROR, "main", "failover did not complete", "FAILOVER_INCOMPLETE",
                   {{"trigger", "automatic"}});

    ASSERT_EQ(captured(), 1u);
    auto line = nlohmann::json::parse(lines[0], nullptr, false);
    ASSERT_TRUE(line.is_object()) << lines[0];
    EXPECT_EQ(line["level"].get<std::string>(), "ERROR");
    EXPECT_EQ(line["module"].get<std::string>(), "main");
    EXPECT_EQ(line["error_code"].get<std::string>(), "FAILOVER_INCOMPLETE");
    EXPECT_EQ(line["context"]["trigger"].get<std::string>(), "automatic");
    EXPECT_EQ(line["context"].size(), 1u);
}

TEST_F(LoggingTest, AsyncModeFlushesOnStop) {
    auto& logger = Logger::instance();
    logger.set_async_logging(true);
    for (int i = 0; i < 25; ++i) {
        LOG_INFO("test", "entry ", i);
    }
    logger.set_async_logging(false);
    EXPECT_EQ(captured(), 25u);
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(Logger::parse_level("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parse_level("warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::parse_level("nonsense"), LogLevel::INFO);
}

// ============================================================================
// Configuration
// ============================================================================

TEST(ConfigTest, DefaultsAreValid) {
    ControllerConfig config;
    EXPECT_TRUE(validate_config(config).is_ok());
    EXPECT_EQ(config.health_check_interval_ms, 30000u);
    EXPECT_EQ(config.failover_threshold_ms, 120000u);
    EXPECT_EQ(config.switchover_max_lag_bytes, 1024 * 1024);
    ASSERT_EQ(config.radius_restart_command.size(), 3u);
    EXPECT_EQ(config.radius_restart_command[2], "proisp-radius");
}

TEST(ConfigTest, JsonOverridesDefaults) {
    ControllerConfig config;
    auto applied = apply_config_json(R"({
        "bind_address": "127.0.0.1:9090",
        "failover_threshold_ms": 60000,
        "sign_peer_messages": true,
        "quorum_witnesses": ["http://10.0.0.9:8080/health"],
        "radius_restart_command": ["systemctl", "restart", "freeradius"]
    })", config);

    ASSERT_TRUE(applied.is_ok()) << applied.error();
    EXPECT_EQ(config.bind_address, "127.0.0.1:9090");
    EXPECT_EQ(config.failover_threshold_ms, 60000u);
    EXPECT_TRUE(config.sign_peer_messages);
    ASSERT_EQ(config.quorum_witnesses.size(), 1u);
    EXPECT_EQ(config.radius_restart_command[0], "systemctl");
    // Untouched keys keep their defaults
    EXPECT_EQ(config.health_check_interval_ms, 30000u);
}

TEST(ConfigTest, WrongTypesAreReported) {
    ControllerConfig config;
    auto applied = apply_config_json(R"({"health_check_interval_ms": "soon"})", config);
    ASSERT_TRUE(applied.is_err());
    EXPECT_NE(applied.error().find("health_check_interval_ms"), std::string::npos);

    applied = apply_config_json(R"({"db_port": 70000})", config);
    EXPECT_TRUE(applied.is_err());
}

TEST(ConfigTest, LoadsFromFile) {
    std::string path = ::testing::TempDir() + "hacluster_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"log_level":"debug","peer_port":9000})";
    }
    auto loaded = load_config_file(path);
    std::remove(path.c_str());

    ASSERT_TRUE(loaded.is_ok()) << loaded.error();
    EXPECT_EQ(loaded.value().log_level, "debug");
    EXPECT_EQ(loaded.value().peer_port, 9000);

    EXPECT_TRUE(load_config_file("/nonexistent/hacluster.json").is_err());
}

TEST(ConfigTest, ValidationRejectsImpossibleTimings) {
    ControllerConfig config;
    config.failover_threshold_ms = 10000;
    config.health_check_interval_ms = 30000;
    EXPECT_TRUE(validate_config(config).is_err());

    ControllerConfig no_command;
    no_command.radius_restart_command.clear();
    EXPECT_TRUE(validate_config(no_command).is_err());
}

TEST(ConfigTest, ParsesHostPort) {
    auto parsed = parse_host_port("0.0.0.0:8080");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().first, "0.0.0.0");
    EXPECT_EQ(parsed.value().second, 8080);

    EXPECT_TRUE(parse_host_port("127.0.0.1:0").is_ok());
    EXPECT_TRUE(parse_host_port("localhost").is_err());
    EXPECT_TRUE(parse_host_port("localhost:http").is_err());
    EXPECT_TRUE(parse_host_port("localhost:70000").is_err());
}

// ============================================================================
// Cluster types and peer messages
// ============================================================================

TEST(ClusterTypesTest, RoleNamesRoundTripThroughParsers) {
    using namespace hacluster::cluster;
    EXPECT_EQ(to_string(ServerRole::SECONDARY), "secondary");
    EXPECT_TRUE(parse_server_role("main") == ServerRole::MAIN);
    EXPECT_TRUE(parse_node_status("offline") == NodeStatus::OFFLINE);
    EXPECT_FALSE(parse_server_role("leader").has_value());
}

TEST(ClusterTypesTest, ErrorKindsMapToHttpStatus) {
    using namespace hacluster::cluster;
    EXPECT_EQ(http_status_for(ControllerResult::ok("fine")), 200);
    EXPECT_EQ(http_status_for(ControllerResult::fail(ErrorKind::CONFIGURATION, "x")), 400);
    EXPECT_EQ(http_status_for(ControllerResult::fail(ErrorKind::AUTHENTICATION, "x")), 401);
    EXPECT_EQ(http_status_for(ControllerResult::fail(ErrorKind::NETWORK, "x")), 502);
    EXPECT_EQ(http_status_for(ControllerResult::fail(ErrorKind::FATAL_PIPELINE, "x")), 500);
}

TEST(ClusterTypesTest, StatusJsonOmitsSecret) {
    using namespace hacluster::cluster;
    ClusterConfig config;
    config.cluster_id = "c1";
    config.cluster_secret = "top-secret";
    config.server_role = ServerRole::MAIN;

    EXPECT_EQ(to_json(config, false).find("top-secret"), std::string::npos);
    auto restored = config_from_json(to_json(config, true));
    ASSERT_TRUE(restored.is_ok()) << restored.error();
    EXPECT_EQ(restored.value().cluster_secret, "top-secret");
    EXPECT_TRUE(restored.value().server_role == ServerRole::MAIN);
    EXPECT_FALSE(restored.value().last_heartbeat.has_value());
}

TEST(ClusterTypesTest, ConfigParsingReportsBadValues) {
    using namespace hacluster::cluster;
    EXPECT_EQ(config_from_json("not json").error(), "cluster config is not valid JSON");
    EXPECT_EQ(config_from_json("[]").error(), "cluster config is not a JSON object");
    EXPECT_EQ(config_from_json(R"({"server_role":"leader"})").error(),
              "cluster config has an unknown role value");
    EXPECT_EQ(config_from_json(R"({"main_server_port":0})").error(),
              "cluster config has an invalid main_server_port");

    auto wrong_type = config_from_json(R"({"cluster_id":5})");
    ASSERT_TRUE(wrong_type.is_err());
    EXPECT_EQ(wrong_type.error().rfind("invalid cluster config: ", 0), 0u);
}

TEST(ClusterTypesTest, ConfigDefaultsApplyToMissingKeys) {
    using namespace hacluster::cluster;
    auto parsed = config_from_json(R"({"cluster_id":"c1"})");
    ASSERT_TRUE(parsed.is_ok()) << parsed.error();
    EXPECT_TRUE(parsed.value().server_role == ServerRole::STANDALONE);
    EXPECT_TRUE(parsed.value().api_role == ApiRole::ACTIVE);
    EXPECT_EQ(parsed.value().main_server_port, 8080);
    EXPECT_TRUE(parsed.value().auto_failover_enabled);
}

TEST(ClusterTypesTest, NodeValueRequiresId) {
    using namespace hacluster::cluster;
    auto missing = node_from_value(nlohmann::json::parse(R"({"server_ip":"10.0.0.1"})"));
    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(missing.error(), "cluster node is missing its id");

    auto bad_status =
        node_from_value(nlohmann::json::parse(R"({"id":7,"status":"sleeping"})"));
    ASSERT_TRUE(bad_status.is_err());
    EXPECT_EQ(bad_status.error(), "cluster node 7 has an unknown role or status");

    ClusterNode node;
    node.id = 3;
    node.server_ip = "10.0.0.3";
    auto value = to_json_value(node);
    EXPECT_TRUE(value["last_heartbeat"].is_null());
    EXPECT_EQ(value["status"].get<std::string>(), "offline");
    EXPECT_EQ(value["server_role"].get<std::string>(), "secondary");
}

TEST(ClusterTypesTest, EventKeepsEscapedTextAndDefaultsSeverity) {
    using namespace hacluster::cluster;
    ClusterEvent event;
    event.id = 12;
    event.description = "line1\nline2 \"quoted\"";
    event.severity = EventSeverity::CRITICAL;
    event.created_at = common::from_unix_millis(1700000000000);

    auto restored = event_from_json(to_json(event));
    ASSERT_TRUE(restored.is_ok()) << restored.error();
    EXPECT_EQ(restored.value().description, event.description);
    EXPECT_TRUE(restored.value().severity == EventSeverity::CRITICAL);
    EXPECT_EQ(common::to_unix_millis(restored.value().created_at), 1700000000000);

    auto bare = event_from_json(R"({"id":3,"event_type":"node_left"})");
    ASSERT_TRUE(bare.is_ok());
    EXPECT_EQ(bare.value().id, 3u);
    EXPECT_TRUE(bare.value().severity == EventSeverity::WARNING);
}

TEST(PeerProtocolTest, NotifyRequiresEvent) {
    using namespace hacluster::cluster;
    EXPECT_TRUE(parse_notify_message(R"({"new_main_ip":"10.0.0.2"})").is_err());
    EXPECT_TRUE(parse_notify_message("not json").is_err());

    auto parsed = parse_notify_message(
        R"({"event":"new_main","new_main_ip":"10.0.0.2","cluster_secret":"s"})");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().new_main_ip, "10.0.0.2");
}

TEST(PeerProtocolTest, AdminRequestRejectsNegativeTarget) {
    using namespace hacluster::cluster;
    EXPECT_TRUE(parse_admin_request(R"({"cluster_secret":"s","target_node_id":-4})").is_err());
    auto parsed = parse_admin_request(R"({"cluster_secret":"s","target_node_id":4})");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().target_node_id, 4u);
}

TEST(PeerProtocolTest, ReplyBodyCarriesOutcome) {
    using namespace hacluster::cluster;
    auto body = nlohmann::json::parse(make_reply_body(false, "secondary node not found"));
    EXPECT_FALSE(body["success"].get<bool>());
    EXPECT_EQ(body["message"].get<std::string>(), "secondary node not found");
}
