#pragma once

#include "cluster/cluster_state_store.h"
#include "cluster/failover_guard.h"
#include "cluster/peer_notifier.h"
#include "cluster/replication_driver.h"
#include "cluster/service_controller.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace hacluster {
namespace cluster {

enum class FailoverTrigger {
  AUTOMATIC,       ///< Monitor saw a sustained outage of the main
  PROMOTE_REQUEST, ///< Main asked this node to take over (manual failover)
  SWITCHOVER       ///< Planned role exchange; the former main stays alive
};

enum class FailoverStep {
  NONE,
  LOAD_CONFIG,
  ASSESS_LAG,
  QUORUM_CHECK,
  PROMOTE_DATABASE,
  STOP_CACHE_REPLICATION,
  UPDATE_CONFIG,
  UPDATE_ROSTER,
  NOTIFY_PEERS,
  RESTART_SERVICES
};

struct FailoverOptions {
  int64_t lag_warning_seconds = 30;
  bool require_quorum = false;
  std::vector<std::string> quorum_witnesses; ///< Full health URLs
};

/// Result of one orchestrator run
struct FailoverOutcome {
  bool success = false;
  FailoverTrigger trigger = FailoverTrigger::AUTOMATIC;
  FailoverStep failed_step = FailoverStep::NONE;
  std::string error;
  std::string former_main_ip;
  std::vector<std::string> peers_notified;
  std::vector<std::string> peers_failed;
  std::vector<std::string> warnings; ///< Best-effort steps that failed
  std::chrono::milliseconds duration{0};
};

/**
 * @brief Promotes this node to main in a fixed sequence of steps
 *
 * Runs execute on threads owned by the orchestrator and joined in its
 * destructor. The caller must hold the FailoverGuard before launch(); the run
 * releases it on every exit path. Nothing is rolled back once the database
 * has been promoted.
 */
class FailoverOrchestrator {
public:
  using CompletionCallback = std::function<void(const FailoverOutcome &)>;

private:
  std::shared_ptr<IClusterStateStore> store_;
  std::shared_ptr<IReplicationDriver> replication_;
  std::shared_ptr<IServiceController> services_;
  std::shared_ptr<PeerNotifier> notifier_;
  std::shared_ptr<FailoverGuard> guard_;
  FailoverOptions options_;

  struct Run {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> finished;
  };
  std::mutex runs_mutex_;
  std::vector<Run> runs_;

  std::mutex callback_mutex_;
  CompletionCallback completion_callback_;

  std::atomic<uint64_t> runs_started_{0};

  FailoverOutcome execute(FailoverTrigger trigger);
  void reap_finished_runs();
  void record_event(const ClusterConfig &config, const std::string &type,
                    const std::string &description, EventSeverity severity);
  FailoverOutcome fail_run(FailoverOutcome outcome, const ClusterConfig &config,
                           FailoverStep step, const std::string &error);
  bool check_quorum(const ClusterConfig &config,
                    const std::string &former_main_ip, std::string &error);
  void update_roster(const ClusterConfig &config,
                     const std::string &former_main_ip, FailoverTrigger trigger,
                     FailoverOutcome &outcome);
  void notify_completion(const FailoverOutcome &outcome);

public:
  FailoverOrchestrator(std::shared_ptr<IClusterStateStore> store,
                       std::shared_ptr<IReplicationDriver> replication,
                       std::shared_ptr<IServiceController> services,
                       std::shared_ptr<PeerNotifier> notifier,
                       std::shared_ptr<FailoverGuard> guard,
                       const FailoverOptions &options);
  ~FailoverOrchestrator();

  FailoverOrchestrator(const FailoverOrchestrator &) = delete;
  FailoverOrchestrator &operator=(const FailoverOrchestrator &) = delete;

  /**
   * @brief Start a run on a background thread
   * @pre the caller holds the guard
   */
  std::shared_future<FailoverOutcome> launch(FailoverTrigger trigger);

  /// Acquire the guard and launch; std::nullopt if a run already holds it
  std::optional<std::shared_future<FailoverOutcome>>
  try_launch(FailoverTrigger trigger);

  /// Execute a run on the calling thread; the caller holds the guard
  FailoverOutcome run(FailoverTrigger trigger);

  void set_completion_callback(CompletionCallback callback);

  /// Block until every launched run has finished
  void wait_for_runs();

  uint64_t runs_started() const { return runs_started_.load(); }
};

namespace failover_utils {
std::string trigger_to_string(FailoverTrigger trigger);
std::string step_to_string(FailoverStep step);
} // namespace failover_utils

} // namespace cluster
} // namespace hacluster
