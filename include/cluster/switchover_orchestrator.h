#pragma once

#include "cluster/cluster_state_store.h"
#include "cluster/failover_guard.h"
#include "cluster/peer_notifier.h"
#include "cluster/replication_driver.h"
#include <chrono>
#include <cstdint>
#include <memory>

namespace hacluster {
namespace cluster {

struct SwitchoverOptions {
  int64_t max_lag_bytes = 1024 * 1024;
  std::chrono::milliseconds settle_time{5000};
};

/**
 * @brief Planned main -> secondary role exchange, driven from the main
 *
 * The caller waits for the whole sequence. The write fence is the only step
 * that is undone on failure, and only when the target could not be asked to
 * promote itself.
 */
class SwitchoverOrchestrator {
private:
  std::shared_ptr<IClusterStateStore> store_;
  std::shared_ptr<IReplicationDriver> replication_;
  std::shared_ptr<PeerNotifier> notifier_;
  std::shared_ptr<FailoverGuard> guard_;
  SwitchoverOptions options_;

  ControllerResult execute(ClusterConfig config, const ClusterNode &target);
  ControllerResult fail_after_fence(const ClusterConfig &config,
                                    ErrorKind kind, const std::string &error);
  void record_event(const ClusterConfig &config, const std::string &type,
                    const std::string &description, EventSeverity severity);

public:
  SwitchoverOrchestrator(std::shared_ptr<IClusterStateStore> store,
                         std::shared_ptr<IReplicationDriver> replication,
                         std::shared_ptr<PeerNotifier> notifier,
                         std::shared_ptr<FailoverGuard> guard,
                         const SwitchoverOptions &options);

  /// Hand the main role to roster node @p target_node_id and follow it
  ControllerResult switchover(uint64_t target_node_id);
};

} // namespace cluster
} // namespace hacluster
