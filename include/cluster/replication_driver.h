#pragma once

#include "common/config.h"
#include "common/process_runner.h"
#include "common/types.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace hacluster {
namespace cluster {

using common::Result;

/**
 * @brief Database and cache replication operations used by the orchestrators
 *
 * Every call is synchronous and bounded by the driver's command timeout.
 */
class IReplicationDriver {
public:
  virtual ~IReplicationDriver() = default;

  /// Take the local database out of recovery; error if it stays a replica
  virtual Result<bool> promote_to_main() = 0;

  /**
   * @brief Turn the local database into a streaming replica of @p primary_host
   * @param slot_name physical replication slot to create on the new primary
   */
  virtual Result<bool> demote_to_replica(const std::string &primary_host,
                                         const std::string &slot_name) = 0;

  /// Seconds since the last replayed transaction (0 on a primary)
  virtual Result<int64_t> replication_lag_seconds() = 0;

  /// Bytes between sent and replayed WAL for @p replica_ip; error if absent
  virtual Result<int64_t> replication_lag_bytes(const std::string &replica_ip) = 0;

  /// Fence (true) or unfence (false) writes cluster-wide on this server
  virtual Result<bool> set_read_only(bool read_only) = 0;

  virtual Result<bool> is_in_recovery() = 0;

  /// Detach the local cache from its upstream
  virtual Result<bool> stop_cache_replication() = 0;

  /// Make the local cache replicate from @p primary_host
  virtual Result<bool> follow_cache_replication(const std::string &primary_host) = 0;
};

/**
 * @brief Drives psql, pg_ctl and redis-cli through an IProcessRunner
 *
 * Passwords are handed to the tools through PGPASSWORD and redis-cli's -a
 * flag; neither appears in logs.
 */
class ProcessReplicationDriver : public IReplicationDriver {
private:
  common::ControllerConfig config_;
  std::shared_ptr<common::IProcessRunner> runner_;

  Result<bool> run_psql(const std::string &sql, std::string &output,
                        const std::string &host);
  Result<bool> run_psql(const std::string &sql, std::string &output);
  Result<bool> run_redis(const std::vector<std::string> &args);
  Result<bool> run_checked(const std::vector<std::string> &argv,
                           std::string &output);
  Result<int64_t> query_int(const std::string &sql);

public:
  ProcessReplicationDriver(const common::ControllerConfig &config,
                           std::shared_ptr<common::IProcessRunner> runner);

  Result<bool> promote_to_main() override;
  Result<bool> demote_to_replica(const std::string &primary_host,
                                 const std::string &slot_name) override;
  Result<int64_t> replication_lag_seconds() override;
  Result<int64_t> replication_lag_bytes(const std::string &replica_ip) override;
  Result<bool> set_read_only(bool read_only) override;
  Result<bool> is_in_recovery() override;
  Result<bool> stop_cache_replication() override;
  Result<bool> follow_cache_replication(const std::string &primary_host) override;
};

/// Quote a value as an SQL string literal
std::string sql_literal(const std::string &value);

/// Slot name derived from a node's hardware id ("replica_" + first 16 chars)
std::string replication_slot_name(const std::string &hardware_id);

} // namespace cluster
} // namespace hacluster
