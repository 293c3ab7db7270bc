#pragma once

#include "common/types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace hacluster {
namespace common {

/**
 * @brief Runtime configuration for one controller instance
 *
 * Defaults match a production node. A JSON file (see load_config_file())
 * overrides them, CLI flags override the file, and secrets are only ever read
 * from the environment (apply_environment()).
 *
 * @note Cluster membership (cluster id, secret, roles) is not configuration;
 *       it lives in the cluster state store.
 */
struct ControllerConfig {
  // Control server and storage
  std::string bind_address = "0.0.0.0:8080";   ///< Control server listen address
  uint16_t peer_port = 8080;                   ///< Control port assumed for every peer
  std::string admin_url = "http://127.0.0.1:8080"; ///< Local daemon URL used by CLI commands
  std::string state_path = "/var/lib/hacluster/state.json"; ///< Config + roster file
  std::string events_path = "/var/lib/hacluster/events.jsonl"; ///< Append-only event log

  // Failure detection
  uint32_t health_check_interval_ms = 30000;   ///< Monitor polling period
  uint32_t failover_threshold_ms = 120000;     ///< Outage length that triggers failover
  uint32_t health_check_timeout_ms = 10000;    ///< Per-request timeout for /health
  uint32_t peer_request_timeout_ms = 30000;    ///< Timeout for notify/promote calls
  uint32_t command_timeout_ms = 60000;         ///< Timeout for psql/pg_ctl/redis-cli calls

  // Failover / switchover thresholds
  int64_t replication_lag_warning_seconds = 30;  ///< Lag that is logged as possible data loss
  int64_t switchover_max_lag_bytes = 1024 * 1024; ///< Lag that blocks a planned switchover
  uint32_t switchover_settle_ms = 5000;          ///< Drain wait after fencing

  // Dependent service
  std::vector<std::string> radius_restart_command = {"docker", "restart",
                                                     "proisp-radius"};

  // Database and cache replication
  std::string psql_path = "psql";
  std::string pg_ctl_path = "pg_ctl";
  std::string pg_data_dir = "/var/lib/postgresql/data";
  std::string db_host = "127.0.0.1";
  uint16_t db_port = 5432;
  std::string db_user = "postgres";
  std::string db_name = "proisp";
  std::string db_password;                     ///< From DB_PASSWORD only
  std::string redis_cli_path = "redis-cli";
  uint16_t redis_port = 6379;
  std::string redis_password;                  ///< From REDIS_PASSWORD only

  // Peer message hardening
  bool sign_peer_messages = false;             ///< Attach and require HMAC signatures
  uint32_t signature_window_seconds = 300;     ///< Accepted clock skew for signed messages

  // Split-brain mitigation
  bool require_quorum = false;                 ///< Confirm reachability of a peer majority before promoting
  std::vector<std::string> quorum_witnesses;   ///< Extra health URLs counted as observers

  // Logging
  std::string log_level = "info";              ///< trace/debug/info/warn/error
  bool json_logs = false;                      ///< One JSON object per log line
};

/**
 * @brief Load a JSON configuration file over the defaults
 *
 * Unknown keys are ignored; keys with the wrong type are reported as errors
 * so a typo in a duration does not silently fall back to the default.
 */
Result<ControllerConfig> load_config_file(const std::string &path);

/// Apply a JSON document (already read into memory) over @p config
Result<bool> apply_config_json(const std::string &text,
                               ControllerConfig &config);

/// Read DB_PASSWORD / REDIS_PASSWORD (and HACLUSTER_LOG_LEVEL) from the environment
void apply_environment(ControllerConfig &config);

/**
 * @brief Split "host:port" into its parts
 *
 * Port 0 is accepted and means "any free port" when binding.
 * @return error for a missing or out-of-range port
 */
Result<std::pair<std::string, uint16_t>>
parse_host_port(const std::string &address);

/// Reject combinations that cannot work (zero intervals, threshold < interval)
Result<bool> validate_config(const ControllerConfig &config);

} // namespace common
} // namespace hacluster
