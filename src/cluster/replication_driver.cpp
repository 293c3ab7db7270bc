#include "cluster/replication_driver.h"
#include "common/logging.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace hacluster {
namespace cluster {

namespace {

std::string trim(const std::string &s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])))
    begin++;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
    end--;
  return s.substr(begin, end - begin);
}

std::string first_line(const std::string &s) {
  std::string trimmed = trim(s);
  size_t newline = trimmed.find('\n');
  return newline == std::string::npos ? trimmed : trimmed.substr(0, newline);
}

// libpq connection-string value: single-quoted with \ and ' escaped
std::string conninfo_value(const std::string &value) {
  std::string out = "'";
  for (char c : value) {
    if (c == '\\' || c == '\'')
      out.push_back('\\');
    out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

bool is_redis_error(const std::string &output) {
  std::string line = first_line(output);
  return line.rfind("ERR", 0) == 0 || line.rfind("NOAUTH", 0) == 0 ||
         line.rfind("WRONGPASS", 0) == 0 || line.rfind("(error)", 0) == 0 ||
         line.rfind("Could not connect", 0) == 0;
}

} // namespace

std::string sql_literal(const std::string &value) {
  std::string out = "'";
  for (char c : value) {
    if (c == '\'')
      out.push_back('\'');
    out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

std::string replication_slot_name(const std::string &hardware_id) {
  std::string suffix = hardware_id.substr(0, 16);
  for (char &c : suffix) {
    unsigned char uc = static_cast<unsigned char>(c);
    c = std::isalnum(uc) ? static_cast<char>(std::tolower(uc)) : '_';
  }
  return "replica_" + suffix;
}

ProcessReplicationDriver::ProcessReplicationDriver(
    const common::ControllerConfig &config,
    std::shared_ptr<common::IProcessRunner> runner)
    : config_(config), runner_(std::move(runner)) {}

Result<bool> ProcessReplicationDriver::run_checked(
    const std::vector<std::string> &argv, std::string &output) {
  std::map<std::string, std::string> env;
  if (!config_.db_password.empty()) {
    env["PGPASSWORD"] = config_.db_password;
  }

  auto result = runner_->run(
      argv, std::chrono::milliseconds(config_.command_timeout_ms), env);
  if (!result.is_ok()) {
    return Result<bool>(argv[0] + ": " + result.error());
  }

  output = result.value().output;
  if (result.value().exit_code != 0) {
    return Result<bool>(argv[0] + " exited with status " +
                        std::to_string(result.value().exit_code) + ": " +
                        first_line(output));
  }
  return Result<bool>(true);
}

Result<bool> ProcessReplicationDriver::run_psql(const std::string &sql,
                                                std::string &output,
                                                const std::string &host) {
  std::vector<std::string> argv = {config_.psql_path,
                                   "-h", host,
                                   "-p", std::to_string(config_.db_port),
                                   "-U", config_.db_user,
                                   "-d", config_.db_name,
                                   "-At",
                                   "-v", "ON_ERROR_STOP=1",
                                   "-c", sql};
  return run_checked(argv, output);
}

Result<bool> ProcessReplicationDriver::run_psql(const std::string &sql,
                                                std::string &output) {
  return run_psql(sql, output, config_.db_host);
}

Result<int64_t> ProcessReplicationDriver::query_int(const std::string &sql) {
  std::string output;
  auto ran = run_psql(sql, output);
  if (!ran.is_ok()) {
    return Result<int64_t>(ran.error());
  }

  std::string value = first_line(output);
  if (value.empty()) {
    return Result<int64_t>("query returned no rows");
  }
  char *end = nullptr;
  long long parsed = std::strtoll(value.c_str(), &end, 10);
  if (end == value.c_str()) {
    return Result<int64_t>("unexpected query output: " + value);
  }
  return Result<int64_t>(static_cast<int64_t>(parsed));
}

Result<bool> ProcessReplicationDriver::run_redis(
    const std::vector<std::string> &args) {
  std::vector<std::string> argv = {config_.redis_cli_path, "-p",
                                   std::to_string(config_.redis_port)};
  if (!config_.redis_password.empty()) {
    argv.push_back("-a");
    argv.push_back(config_.redis_password);
    argv.push_back("--no-auth-warning");
  }
  argv.insert(argv.end(), args.begin(), args.end());

  std::string output;
  auto ran = run_checked(argv, output);
  if (!ran.is_ok()) {
    return ran;
  }
  if (is_redis_error(output)) {
    return Result<bool>("redis-cli: " + first_line(output));
  }
  return Result<bool>(true);
}

Result<bool> ProcessReplicationDriver::is_in_recovery() {
  std::string output;
  auto ran = run_psql("SELECT pg_is_in_recovery()", output);
  if (!ran.is_ok()) {
    return ran;
  }
  std::string value = first_line(output);
  if (value == "t")
    return Result<bool>(true);
  if (value == "f")
    return Result<bool>(false);
  return Result<bool>("unexpected pg_is_in_recovery output: " + value);
}

Result<bool> ProcessReplicationDriver::promote_to_main() {
  auto recovery = is_in_recovery();
  if (!recovery.is_ok()) {
    return Result<bool>("cannot determine recovery state: " + recovery.error());
  }
  if (!recovery.value()) {
    LOG_INFO("replication", "database is already a primary, nothing to promote");
    return Result<bool>(true);
  }

  std::string output;
  auto promoted = run_psql("SELECT pg_promote(true, 60)", output);
  if (!promoted.is_ok()) {
    return promoted;
  }
  if (first_line(output) != "t") {
    return Result<bool>("pg_promote did not complete within 60s");
  }

  recovery = is_in_recovery();
  if (!recovery.is_ok()) {
    return Result<bool>("cannot confirm promotion: " + recovery.error());
  }
  if (recovery.value()) {
    return Result<bool>("database is still in recovery after pg_promote");
  }
  LOG_INFO("replication", "database promoted to primary");
  return Result<bool>(true);
}

Result<bool> ProcessReplicationDriver::demote_to_replica(
    const std::string &primary_host, const std::string &slot_name) {
  std::string output;

  // Slot on the new primary so WAL is retained until this node catches up
  std::string create_slot =
      "SELECT pg_create_physical_replication_slot(" + sql_literal(slot_name) +
      ") WHERE NOT EXISTS (SELECT 1 FROM pg_replication_slots WHERE "
      "slot_name = " +
      sql_literal(slot_name) + ")";
  auto slot = run_psql(create_slot, output, primary_host);
  if (!slot.is_ok()) {
    return Result<bool>("cannot create replication slot " + slot_name +
                        " on " + primary_host + ": " + slot.error());
  }

  std::string conninfo = "host=" + primary_host +
                         " port=" + std::to_string(config_.db_port) +
                         " user=" + config_.db_user +
                         " application_name=" + slot_name;
  if (!config_.db_password.empty()) {
    conninfo += " password=" + conninfo_value(config_.db_password);
  }

  const std::vector<std::string> statements = {
      "ALTER SYSTEM SET primary_conninfo = " + sql_literal(conninfo),
      "ALTER SYSTEM SET primary_slot_name = " + sql_literal(slot_name),
      "ALTER SYSTEM RESET default_transaction_read_only"};
  for (const auto &statement : statements) {
    auto applied = run_psql(statement, output);
    if (!applied.is_ok()) {
      return Result<bool>("cannot configure standby: " + applied.error());
    }
  }

  auto signal = run_checked({"touch", config_.pg_data_dir + "/standby.signal"},
                            output);
  if (!signal.is_ok()) {
    return Result<bool>("cannot create standby.signal: " + signal.error());
  }

  std::string wait_seconds =
      std::to_string(std::max<uint32_t>(1, config_.command_timeout_ms / 1000));
  auto restarted = run_checked({config_.pg_ctl_path, "-D", config_.pg_data_dir,
                                "restart", "-m", "fast", "-w", "-t",
                                wait_seconds},
                               output);
  if (!restarted.is_ok()) {
    return Result<bool>("database restart as replica failed: " +
                        restarted.error());
  }

  LOG_INFO("replication", "database restarted as replica of ", primary_host,
           " using slot ", slot_name);
  return Result<bool>(true);
}

Result<int64_t> ProcessReplicationDriver::replication_lag_seconds() {
  return query_int(
      "SELECT CASE WHEN pg_is_in_recovery() THEN "
      "COALESCE(EXTRACT(EPOCH FROM now() - pg_last_xact_replay_timestamp()), "
      "0)::bigint ELSE 0 END");
}

Result<int64_t>
ProcessReplicationDriver::replication_lag_bytes(const std::string &replica_ip) {
  auto lag = query_int("SELECT pg_wal_lsn_diff(sent_lsn, replay_lsn)::bigint "
                       "FROM pg_stat_replication WHERE client_addr = " +
                       sql_literal(replica_ip) + " LIMIT 1");
  if (!lag.is_ok() && lag.error() == "query returned no rows") {
    return Result<int64_t>("no replication connection from " + replica_ip);
  }
  return lag;
}

Result<bool> ProcessReplicationDriver::set_read_only(bool read_only) {
  std::string output;
  std::string statement =
      std::string("ALTER SYSTEM SET default_transaction_read_only = ") +
      (read_only ? "on" : "off");
  auto altered = run_psql(statement, output);
  if (!altered.is_ok()) {
    return altered;
  }
  auto reloaded = run_psql("SELECT pg_reload_conf()", output);
  if (!reloaded.is_ok()) {
    return reloaded;
  }
  LOG_INFO("replication", "default_transaction_read_only = ",
           read_only ? "on" : "off");
  return Result<bool>(true);
}

Result<bool> ProcessReplicationDriver::stop_cache_replication() {
  return run_redis({"REPLICAOF", "NO", "ONE"});
}

Result<bool> ProcessReplicationDriver::follow_cache_replication(
    const std::string &primary_host) {
  return run_redis(
      {"REPLICAOF", primary_host, std::to_string(config_.redis_port)});
}

} // namespace cluster
} // namespace hacluster
