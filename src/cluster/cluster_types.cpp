#include "cluster/cluster_types.h"

namespace hacluster {
namespace cluster {

using json = nlohmann::json;

namespace {

json optional_time(const std::optional<Timestamp> &ts) {
  if (!ts) {
    return nullptr;
  }
  return common::to_unix_millis(*ts);
}

std::optional<Timestamp> read_optional_time(const json &j,
                                            const std::string &key) {
  if (!j.contains(key) || j.at(key).is_null()) {
    return std::nullopt;
  }
  return common::from_unix_millis(j.at(key).get<int64_t>());
}

} // namespace

std::string to_string(ServerRole role) {
  switch (role) {
  case ServerRole::STANDALONE:
    return "standalone";
  case ServerRole::MAIN:
    return "main";
  case ServerRole::SECONDARY:
    return "secondary";
  case ServerRole::SERVER3:
    return "server3";
  }
  return "standalone";
}

std::string to_string(ApiRole role) {
  return role == ApiRole::ACTIVE ? "active" : "standby";
}

std::string to_string(RadiusRole role) {
  return role == RadiusRole::PRIMARY ? "primary" : "backup";
}

std::string to_string(NodeStatus status) {
  switch (status) {
  case NodeStatus::ONLINE:
    return "online";
  case NodeStatus::SYNCING:
    return "syncing";
  case NodeStatus::OFFLINE:
    return "offline";
  case NodeStatus::ERROR:
    return "error";
  }
  return "offline";
}

std::string to_string(EventSeverity severity) {
  return severity == EventSeverity::CRITICAL ? "critical" : "warning";
}

std::string to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::NONE:
    return "none";
  case ErrorKind::CONFIGURATION:
    return "configuration";
  case ErrorKind::AUTHENTICATION:
    return "authentication";
  case ErrorKind::FATAL_PIPELINE:
    return "fatal_pipeline";
  case ErrorKind::NON_FATAL_PIPELINE:
    return "non_fatal_pipeline";
  case ErrorKind::NETWORK:
    return "network";
  }
  return "none";
}

std::optional<ServerRole> parse_server_role(const std::string &name) {
  if (name == "standalone")
    return ServerRole::STANDALONE;
  if (name == "main")
    return ServerRole::MAIN;
  if (name == "secondary")
    return ServerRole::SECONDARY;
  if (name == "server3")
    return ServerRole::SERVER3;
  return std::nullopt;
}

std::optional<ApiRole> parse_api_role(const std::string &name) {
  if (name == "active")
    return ApiRole::ACTIVE;
  if (name == "standby")
    return ApiRole::STANDBY;
  return std::nullopt;
}

std::optional<RadiusRole> parse_radius_role(const std::string &name) {
  if (name == "primary")
    return RadiusRole::PRIMARY;
  if (name == "backup")
    return RadiusRole::BACKUP;
  return std::nullopt;
}

std::optional<NodeStatus> parse_node_status(const std::string &name) {
  if (name == "online")
    return NodeStatus::ONLINE;
  if (name == "syncing")
    return NodeStatus::SYNCING;
  if (name == "offline")
    return NodeStatus::OFFLINE;
  if (name == "error")
    return NodeStatus::ERROR;
  return std::nullopt;
}

std::optional<EventSeverity> parse_event_severity(const std::string &name) {
  if (name == "warning")
    return EventSeverity::WARNING;
  if (name == "critical")
    return EventSeverity::CRITICAL;
  return std::nullopt;
}

int http_status_for(const ControllerResult &result) {
  if (result.success)
    return 200;
  switch (result.kind) {
  case ErrorKind::CONFIGURATION:
    return 400;
  case ErrorKind::AUTHENTICATION:
    return 401;
  case ErrorKind::NETWORK:
    return 502;
  default:
    return 500;
  }
}

json to_json_value(const ClusterConfig &config, bool include_secret) {
  json j;
  j["cluster_id"] = config.cluster_id;
  if (include_secret) {
    j["cluster_secret"] = config.cluster_secret;
  }
  j["hardware_id"] = config.hardware_id;
  j["server_ip"] = config.server_ip;
  j["server_name"] = config.server_name;
  j["server_role"] = to_string(config.server_role);
  j["api_role"] = to_string(config.api_role);
  j["radius_role"] = to_string(config.radius_role);
  j["main_server_ip"] = config.main_server_ip;
  j["main_server_port"] = config.main_server_port;
  j["auto_failover_enabled"] = config.auto_failover_enabled;
  j["last_heartbeat"] = optional_time(config.last_heartbeat);
  return j;
}

json to_json_value(const ClusterNode &node) {
  json j;
  j["id"] = node.id;
  j["cluster_id"] = node.cluster_id;
  j["server_ip"] = node.server_ip;
  j["server_name"] = node.server_name;
  j["server_role"] = to_string(node.server_role);
  j["status"] = to_string(node.status);
  j["hardware_id"] = node.hardware_id;
  j["last_heartbeat"] = optional_time(node.last_heartbeat);
  return j;
}

json to_json_value(const ClusterEvent &event) {
  json j;
  j["id"] = event.id;
  j["cluster_id"] = event.cluster_id;
  j["event_type"] = event.event_type;
  j["node_id"] = event.node_id;
  j["node_ip"] = event.node_ip;
  j["node_role"] = event.node_role;
  j["description"] = event.description;
  j["severity"] = to_string(event.severity);
  j["created_at"] = common::to_unix_millis(event.created_at);
  return j;
}

std::string to_json(const ClusterConfig &config, bool include_secret) {
  return to_json_value(config, include_secret).dump();
}

std::string to_json(const ClusterNode &node) {
  return to_json_value(node).dump();
}

std::string to_json(const ClusterEvent &event) {
  return to_json_value(event).dump();
}

Result<ClusterConfig> config_from_value(const json &j) {
  if (!j.is_object()) {
    return Result<ClusterConfig>("cluster config is not a JSON object");
  }
  try {
    ClusterConfig config;
    config.cluster_id = j.value("cluster_id", "");
    config.cluster_secret = j.value("cluster_secret", "");
    config.hardware_id = j.value("hardware_id", "");
    config.server_ip = j.value("server_ip", "");
    config.server_name = j.value("server_name", "");
    config.main_server_ip = j.value("main_server_ip", "");

    auto role = parse_server_role(j.value("server_role", "standalone"));
    auto api = parse_api_role(j.value("api_role", "active"));
    auto radius = parse_radius_role(j.value("radius_role", "primary"));
    if (!role || !api || !radius) {
      return Result<ClusterConfig>("cluster config has an unknown role value");
    }
    config.server_role = *role;
    config.api_role = *api;
    config.radius_role = *radius;

    int64_t port = j.value("main_server_port", int64_t{8080});
    if (port <= 0 || port > 65535) {
      return Result<ClusterConfig>(
          "cluster config has an invalid main_server_port");
    }
    config.main_server_port = static_cast<uint16_t>(port);
    config.auto_failover_enabled = j.value("auto_failover_enabled", true);
    config.last_heartbeat = read_optional_time(j, "last_heartbeat");
    return Result<ClusterConfig>(config);
  } catch (const json::exception &e) {
    return Result<ClusterConfig>("invalid cluster config: " +
                                 std::string(e.what()));
  }
}

Result<ClusterNode> node_from_value(const json &j) {
  if (!j.is_object()) {
    return Result<ClusterNode>("cluster node is not a JSON object");
  }
  try {
    if (!j.contains("id") || !j.at("id").is_number_unsigned()) {
      return Result<ClusterNode>("cluster node is missing its id");
    }
    ClusterNode node;
    node.id = j.at("id").get<uint64_t>();
    node.cluster_id = j.value("cluster_id", "");
    node.server_ip = j.value("server_ip", "");
    node.server_name = j.value("server_name", "");
    node.hardware_id = j.value("hardware_id", "");

    auto role = parse_server_role(j.value("server_role", "secondary"));
    auto status = parse_node_status(j.value("status", "offline"));
    if (!role || !status) {
      return Result<ClusterNode>("cluster node " + std::to_string(node.id) +
                                 " has an unknown role or status");
    }
    node.server_role = *role;
    node.status = *status;
    node.last_heartbeat = read_optional_time(j, "last_heartbeat");
    return Result<ClusterNode>(node);
  } catch (const json::exception &e) {
    return Result<ClusterNode>("invalid cluster node: " +
                               std::string(e.what()));
  }
}

Result<ClusterEvent> event_from_value(const json &j) {
  if (!j.is_object()) {
    return Result<ClusterEvent>("cluster event is not a JSON object");
  }
  try {
    ClusterEvent event;
    event.id = j.value("id", uint64_t{0});
    event.cluster_id = j.value("cluster_id", "");
    event.event_type = j.value("event_type", "");
    event.node_id = j.value("node_id", uint64_t{0});
    event.node_ip = j.value("node_ip", "");
    event.node_role = j.value("node_role", "");
    event.description = j.value("description", "");
    event.severity = parse_event_severity(j.value("severity", "warning"))
                         .value_or(EventSeverity::WARNING);
    event.created_at =
        common::from_unix_millis(j.value("created_at", int64_t{0}));
    return Result<ClusterEvent>(event);
  } catch (const json::exception &e) {
    return Result<ClusterEvent>("invalid cluster event: " +
                                std::string(e.what()));
  }
}

Result<ClusterConfig> config_from_json(const std::string &text) {
  json j = json::parse(text, nullptr, false);
  if (j.is_discarded()) {
    return Result<ClusterConfig>("cluster config is not valid JSON");
  }
  return config_from_value(j);
}

Result<ClusterEvent> event_from_json(const std::string &text) {
  json j = json::parse(text, nullptr, false);
  if (j.is_discarded()) {
    return Result<ClusterEvent>("cluster event is not valid JSON");
  }
  return event_from_value(j);
}

} // namespace cluster
} // namespace hacluster
