#pragma once

#include "cluster/cluster_state_store.h"
#include "cluster/failover_guard.h"
#include "cluster/failover_orchestrator.h"
#include "cluster/peer_notifier.h"
#include "cluster/replication_driver.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace hacluster {
namespace cluster {

using MonotonicClock = std::function<common::MonotonicTime()>;

struct FailoverMonitorOptions {
  std::chrono::milliseconds check_interval{30000};
  std::chrono::milliseconds failover_threshold{120000};
};

enum class TickResult {
  SKIPPED,             ///< Not a monitoring secondary any more, or no main IP
  HEALTHY,             ///< Main answered /health with 200
  WAITING,             ///< Main is down, threshold not reached
  FAILOVER_TRIGGERED,  ///< This tick launched the orchestrator
  FAILOVER_IN_PROGRESS ///< Main is down and a run already holds the guard
};

/**
 * @brief Watches the main from an eligible secondary
 *
 * One background thread polls the main's /health every check interval and
 * launches the orchestrator once the main has been unreachable for the
 * failover threshold. The loop never waits for a run to finish.
 */
class FailoverMonitor {
private:
  std::shared_ptr<IClusterStateStore> store_;
  std::shared_ptr<IReplicationDriver> replication_;
  std::shared_ptr<PeerNotifier> notifier_;
  std::shared_ptr<FailoverGuard> guard_;
  std::shared_ptr<FailoverOrchestrator> orchestrator_;
  FailoverMonitorOptions options_;
  MonotonicClock clock_;

  std::atomic<bool> running_;
  std::thread monitor_thread_;
  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;
  bool stop_requested_ = false;
  std::mutex lifecycle_mutex_;

  std::atomic<uint64_t> failovers_triggered_{0};

  // Main the outage timer refers to; empty while not watching
  std::mutex watch_mutex_;
  std::string watched_main_ip_;

  void monitor_loop();
  void watch_main(const std::string &main_ip);

public:
  FailoverMonitor(std::shared_ptr<IClusterStateStore> store,
                  std::shared_ptr<IReplicationDriver> replication,
                  std::shared_ptr<PeerNotifier> notifier,
                  std::shared_ptr<FailoverGuard> guard,
                  std::shared_ptr<FailoverOrchestrator> orchestrator,
                  const FailoverMonitorOptions &options,
                  MonotonicClock clock = nullptr);
  ~FailoverMonitor();

  FailoverMonitor(const FailoverMonitor &) = delete;
  FailoverMonitor &operator=(const FailoverMonitor &) = delete;

  /**
   * @brief Decide whether this node should monitor and start the loop
   *
   * A database in recovery makes the node a secondary whatever the stored
   * role says; the corrected role is persisted.
   *
   * @return error naming why monitoring does not apply
   */
  Result<bool> start();

  /// Returns after the loop thread has exited
  void stop();
  bool is_running() const { return running_.load(); }

  /**
   * @brief One health check and threshold evaluation
   *
   * The outage timer restarts whenever the node resumes watching a main
   * after a skipped tick, or the main address changes.
   */
  TickResult check_main_server();

  uint64_t failovers_triggered() const { return failovers_triggered_.load(); }
};

std::string tick_result_to_string(TickResult result);

} // namespace cluster
} // namespace hacluster
