#include "common/config.h"
#include <cstdlib>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>

namespace hacluster {
namespace common {

namespace {

using json = nlohmann::json;

template <typename Int>
bool read_unsigned(const json &f, const std::string &key, Int &out,
                   std::string &error) {
  auto it = f.find(key);
  if (it == f.end())
    return true;
  // Negative integers parse as number_integer, never number_unsigned
  if (!it->is_number_unsigned() ||
      it->get<uint64_t>() > std::numeric_limits<Int>::max()) {
    error = "invalid value for '" + key + "': expected non-negative integer";
    return false;
  }
  out = static_cast<Int>(it->get<uint64_t>());
  return true;
}

bool read_signed(const json &f, const std::string &key, int64_t &out,
                 std::string &error) {
  auto it = f.find(key);
  if (it == f.end())
    return true;
  if (!it->is_number_integer()) {
    error = "invalid value for '" + key + "': expected integer";
    return false;
  }
  out = it->get<int64_t>();
  return true;
}

bool read_bool(const json &f, const std::string &key, bool &out,
               std::string &error) {
  auto it = f.find(key);
  if (it == f.end())
    return true;
  if (!it->is_boolean()) {
    error = "invalid value for '" + key + "': expected boolean";
    return false;
  }
  out = it->get<bool>();
  return true;
}

bool read_string(const json &f, const std::string &key, std::string &out,
                 std::string &error) {
  auto it = f.find(key);
  if (it == f.end() || it->is_null())
    return true;
  if (!it->is_string()) {
    error = "invalid value for '" + key + "': expected string";
    return false;
  }
  out = it->get<std::string>();
  return true;
}

bool read_string_list(const json &f, const std::string &key,
                      std::vector<std::string> &out, std::string &error) {
  auto it = f.find(key);
  if (it == f.end())
    return true;
  if (!it->is_array()) {
    error = "invalid value for '" + key + "': expected array of strings";
    return false;
  }
  std::vector<std::string> values;
  for (const auto &element : *it) {
    if (!element.is_string()) {
      error = "invalid value for '" + key + "': expected array of strings";
      return false;
    }
    values.push_back(element.get<std::string>());
  }
  out = values;
  return true;
}

} // namespace

Result<bool> apply_config_json(const std::string &text,
                               ControllerConfig &config) {
  json f = json::parse(text, nullptr, false);
  if (f.is_discarded() || !f.is_object()) {
    return Result<bool>("configuration is not a JSON object");
  }
  std::string error;

  bool ok = read_string(f, "bind_address", config.bind_address, error) &&
            read_string(f, "admin_url", config.admin_url, error) &&
            read_string(f, "state_path", config.state_path, error) &&
            read_string(f, "events_path", config.events_path, error) &&
            read_string(f, "psql_path", config.psql_path, error) &&
            read_string(f, "pg_ctl_path", config.pg_ctl_path, error) &&
            read_string(f, "pg_data_dir", config.pg_data_dir, error) &&
            read_string(f, "db_host", config.db_host, error) &&
            read_string(f, "db_user", config.db_user, error) &&
            read_string(f, "db_name", config.db_name, error) &&
            read_string(f, "redis_cli_path", config.redis_cli_path, error) &&
            read_string(f, "log_level", config.log_level, error) &&
            read_unsigned(f, "peer_port", config.peer_port, error) &&
            read_unsigned(f, "health_check_interval_ms",
                          config.health_check_interval_ms, error) &&
            read_unsigned(f, "failover_threshold_ms",
                          config.failover_threshold_ms, error) &&
            read_unsigned(f, "health_check_timeout_ms",
                          config.health_check_timeout_ms, error) &&
            read_unsigned(f, "peer_request_timeout_ms",
                          config.peer_request_timeout_ms, error) &&
            read_unsigned(f, "command_timeout_ms", config.command_timeout_ms,
                          error) &&
            read_signed(f, "replication_lag_warning_seconds",
                        config.replication_lag_warning_seconds, error) &&
            read_signed(f, "switchover_max_lag_bytes",
                        config.switchover_max_lag_bytes, error) &&
            read_unsigned(f, "switchover_settle_ms",
                          config.switchover_settle_ms, error) &&
            read_unsigned(f, "db_port", config.db_port, error) &&
            read_unsigned(f, "redis_port", config.redis_port, error) &&
            read_bool(f, "sign_peer_messages", config.sign_peer_messages,
                      error) &&
            read_unsigned(f, "signature_window_seconds",
                          config.signature_window_seconds, error) &&
            read_bool(f, "require_quorum", config.require_quorum, error) &&
            read_bool(f, "json_logs", config.json_logs, error) &&
            read_string_list(f, "radius_restart_command",
                             config.radius_restart_command, error) &&
            read_string_list(f, "quorum_witnesses", config.quorum_witnesses,
                             error);

  if (!ok) {
    return Result<bool>(error);
  }
  return Result<bool>(true);
}

Result<ControllerConfig> load_config_file(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return Result<ControllerConfig>("cannot open config file: " + path);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  ControllerConfig config;
  auto applied = apply_config_json(buffer.str(), config);
  if (!applied.is_ok()) {
    return Result<ControllerConfig>(path + ": " + applied.error());
  }
  return Result<ControllerConfig>(config);
}

void apply_environment(ControllerConfig &config) {
  if (const char *db_password = std::getenv("DB_PASSWORD")) {
    config.db_password = db_password;
  }
  if (const char *redis_password = std::getenv("REDIS_PASSWORD")) {
    config.redis_password = redis_password;
  }
  if (const char *level = std::getenv("HACLUSTER_LOG_LEVEL")) {
    config.log_level = level;
  }
}

Result<std::pair<std::string, uint16_t>>
parse_host_port(const std::string &address) {
  using HostPort = std::pair<std::string, uint16_t>;

  size_t colon = address.rfind(':');
  if (colon == std::string::npos || colon + 1 >= address.size()) {
    return Result<HostPort>("missing port in address: " + address);
  }

  std::string host = address.substr(0, colon);
  std::string port_text = address.substr(colon + 1);

  char *end = nullptr;
  long port = std::strtol(port_text.c_str(), &end, 10);
  if (end != port_text.c_str() + port_text.size() || port < 0 ||
      port > 65535) {
    return Result<HostPort>("invalid port in address: " + address);
  }

  return Result<HostPort>(HostPort(host, static_cast<uint16_t>(port)));
}

Result<bool> validate_config(const ControllerConfig &config) {
  if (config.health_check_interval_ms == 0) {
    return Result<bool>("health_check_interval_ms must be positive");
  }
  if (config.failover_threshold_ms < config.health_check_interval_ms) {
    return Result<bool>(
        "failover_threshold_ms must not be shorter than health_check_interval_ms");
  }
  if (config.health_check_timeout_ms == 0 ||
      config.peer_request_timeout_ms == 0 || config.command_timeout_ms == 0) {
    return Result<bool>("timeouts must be positive");
  }
  if (config.switchover_max_lag_bytes < 0) {
    return Result<bool>("switchover_max_lag_bytes must not be negative");
  }
  if (config.radius_restart_command.empty()) {
    return Result<bool>("radius_restart_command must not be empty");
  }
  if (config.peer_port == 0) {
    return Result<bool>("peer_port must be positive");
  }

  auto bind = parse_host_port(config.bind_address);
  if (!bind.is_ok()) {
    return Result<bool>(bind.error());
  }
  return Result<bool>(true);
}

} // namespace common
} // namespace hacluster
