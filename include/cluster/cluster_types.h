#pragma once

#include "common/types.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace hacluster {
namespace cluster {

using common::Result;
using common::Timestamp;

/// Role a node plays in the cluster
enum class ServerRole { STANDALONE, MAIN, SECONDARY, SERVER3 };

/// Whether this node's API accepts writes
enum class ApiRole { ACTIVE, STANDBY };

/// Role of the co-located RADIUS service
enum class RadiusRole { PRIMARY, BACKUP };

/// Roster health as last observed
enum class NodeStatus { ONLINE, SYNCING, OFFLINE, ERROR };

enum class EventSeverity { WARNING, CRITICAL };

/**
 * @brief Error taxonomy for controller operations
 *
 * Used by the HTTP layer to pick a status code and by callers to decide
 * whether a retry makes sense.
 */
enum class ErrorKind {
  NONE,
  CONFIGURATION,      ///< Missing config, wrong role, unknown target
  AUTHENTICATION,     ///< Secret or signature mismatch
  FATAL_PIPELINE,     ///< A step that aborts the run failed
  NON_FATAL_PIPELINE, ///< A best-effort step failed; the run continued
  NETWORK             ///< Peer unreachable or returned non-200
};

/// Event type names written to the audit log
namespace event_types {
constexpr const char *FAILOVER_STARTED = "failover_started";
constexpr const char *FAILOVER_COMPLETED = "failover_completed";
constexpr const char *FAILOVER_FAILED = "failover_failed";
constexpr const char *MANUAL_FAILOVER = "manual_failover";
constexpr const char *PROMOTION_RECEIVED = "promotion_received";
constexpr const char *SWITCHOVER_STARTED = "switchover_started";
constexpr const char *SWITCHOVER_COMPLETED = "switchover_completed";
constexpr const char *SWITCHOVER_FAILED = "switchover_failed";
constexpr const char *NEW_MAIN_ACKNOWLEDGED = "new_main_acknowledged";
constexpr const char *NODE_LEFT = "node_left";
} // namespace event_types

/**
 * @brief Local view of cluster membership, one per node
 *
 * Created at cluster setup and mutated by every role transition. Exactly one
 * node in a cluster should hold ServerRole::MAIN; nothing enforces it.
 */
struct ClusterConfig {
  std::string cluster_id;
  std::string cluster_secret;
  std::string hardware_id;
  std::string server_ip;
  std::string server_name;
  ServerRole server_role = ServerRole::STANDALONE;
  ApiRole api_role = ApiRole::ACTIVE;
  RadiusRole radius_role = RadiusRole::PRIMARY;
  std::string main_server_ip;
  uint16_t main_server_port = 8080;
  bool auto_failover_enabled = true;
  std::optional<Timestamp> last_heartbeat;
};

/// Roster row for one cluster member
struct ClusterNode {
  uint64_t id = 0;
  std::string cluster_id;
  std::string server_ip;
  std::string server_name;
  ServerRole server_role = ServerRole::SECONDARY;
  NodeStatus status = NodeStatus::OFFLINE;
  std::string hardware_id;
  std::optional<Timestamp> last_heartbeat;
};

/// Append-only audit record
struct ClusterEvent {
  uint64_t id = 0;
  std::string cluster_id;
  std::string event_type;
  uint64_t node_id = 0;
  std::string node_ip;
  std::string node_role;
  std::string description;
  EventSeverity severity = EventSeverity::WARNING;
  Timestamp created_at{};
};

/**
 * @brief Outcome of a controller facade call
 *
 * message carries the first fatal error verbatim on failure and a short
 * confirmation on success.
 */
struct ControllerResult {
  bool success = true;
  ErrorKind kind = ErrorKind::NONE;
  std::string message;

  static ControllerResult ok(const std::string &message) {
    return ControllerResult{true, ErrorKind::NONE, message};
  }
  static ControllerResult fail(ErrorKind kind, const std::string &message) {
    return ControllerResult{false, kind, message};
  }
};

// String conversions use the lower-case names stored on disk and on the wire
std::string to_string(ServerRole role);
std::string to_string(ApiRole role);
std::string to_string(RadiusRole role);
std::string to_string(NodeStatus status);
std::string to_string(EventSeverity severity);
std::string to_string(ErrorKind kind);

std::optional<ServerRole> parse_server_role(const std::string &name);
std::optional<ApiRole> parse_api_role(const std::string &name);
std::optional<RadiusRole> parse_radius_role(const std::string &name);
std::optional<NodeStatus> parse_node_status(const std::string &name);
std::optional<EventSeverity> parse_event_severity(const std::string &name);

/// HTTP status a ControllerResult maps to (200/400/401/502/500)
int http_status_for(const ControllerResult &result);

/**
 * @brief JSON (de)serialization for the state file, the event log and the
 *        status endpoint
 *
 * @param include_secret the cluster secret is written to the state file but
 *        never to the status endpoint
 */
nlohmann::json to_json_value(const ClusterConfig &config, bool include_secret);
nlohmann::json to_json_value(const ClusterNode &node);
nlohmann::json to_json_value(const ClusterEvent &event);

std::string to_json(const ClusterConfig &config, bool include_secret);
std::string to_json(const ClusterNode &node);
std::string to_json(const ClusterEvent &event);

Result<ClusterConfig> config_from_value(const nlohmann::json &j);
Result<ClusterNode> node_from_value(const nlohmann::json &j);
Result<ClusterEvent> event_from_value(const nlohmann::json &j);

Result<ClusterConfig> config_from_json(const std::string &text);
Result<ClusterEvent> event_from_json(const std::string &text);

} // namespace cluster
} // namespace hacluster
