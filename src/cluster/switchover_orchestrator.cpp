#include "cluster/switchover_orchestrator.h"
#include "common/logging.h"
#include <thread>

namespace hacluster {
namespace cluster {

SwitchoverOrchestrator::SwitchoverOrchestrator(
    std::shared_ptr<IClusterStateStore> store,
    std::shared_ptr<IReplicationDriver> replication,
    std::shared_ptr<PeerNotifier> notifier,
    std::shared_ptr<FailoverGuard> guard, const SwitchoverOptions &options)
    : store_(std::move(store)), replication_(std::move(replication)),
      notifier_(std::move(notifier)), guard_(std::move(guard)),
      options_(options) {}

ControllerResult SwitchoverOrchestrator::switchover(uint64_t target_node_id) {
  auto loaded = store_->load_config();
  if (!loaded.is_ok()) {
    return ControllerResult::fail(ErrorKind::CONFIGURATION, loaded.error());
  }
  const ClusterConfig &config = loaded.value();
  if (config.server_role != ServerRole::MAIN) {
    return ControllerResult::fail(ErrorKind::CONFIGURATION,
                                  "can only initiate switchover from main server");
  }

  auto target = store_->find_node(target_node_id);
  if (!target || target->cluster_id != config.cluster_id) {
    return ControllerResult::fail(ErrorKind::CONFIGURATION,
                                  "secondary node not found");
  }

  if (!guard_->try_acquire("switchover")) {
    return ControllerResult::fail(
        ErrorKind::CONFIGURATION,
        "role transition already in progress (" + guard_->active_operation() +
            ")");
  }
  GuardRelease release(*guard_);

  return execute(config, *target);
}

ControllerResult SwitchoverOrchestrator::execute(ClusterConfig config,
                                                 const ClusterNode &target) {
  LOG_INFO("switchover", "=== SWITCHOVER STARTING: ", config.server_ip, " -> ",
           target.server_ip, " ===");

  // Step 1: the target must have replayed (almost) everything we wrote
  auto lag = replication_->replication_lag_bytes(target.server_ip);
  if (!lag.is_ok()) {
    LOG_SWITCHOVER_ERROR("cannot verify catch-up of " + target.server_ip +
                         ": " + lag.error());
    return ControllerResult::fail(ErrorKind::FATAL_PIPELINE,
                                  "cannot verify replication catch-up: " +
                                      lag.error());
  }
  if (lag.value() > options_.max_lag_bytes) {
    LOG_WARN("switchover", "target ", target.server_ip, " is ", lag.value(),
             " bytes behind");
    return ControllerResult::fail(
        ErrorKind::FATAL_PIPELINE,
        "replication lag too high (" + std::to_string(lag.value()) +
            " bytes), wait for sync");
  }

  record_event(config, event_types::SWITCHOVER_STARTED,
               "Switchover to " + target.server_name + " (" + target.server_ip +
                   ") started, lag " + std::to_string(lag.value()) + " bytes",
               EventSeverity::WARNING);

  // Step 2: fence writes
  LOG_INFO("switchover", "Step 2 - fencing writes on this server");
  auto fenced = replication_->set_read_only(true);
  if (!fenced.is_ok()) {
    LOG_SWITCHOVER_ERROR("cannot fence writes: " + fenced.error());
    record_event(config, event_types::SWITCHOVER_FAILED,
                 "Cannot fence writes: " + fenced.error(),
                 EventSeverity::CRITICAL);
    return ControllerResult::fail(ErrorKind::FATAL_PIPELINE,
                                  "failed to fence writes: " + fenced.error());
  }

  // Step 3: let in-flight transactions drain and replicate
  if (options_.settle_time.count() > 0) {
    LOG_INFO("switchover", "Step 3 - waiting ", options_.settle_time.count(),
             "ms for replication to settle");
    std::this_thread::sleep_for(options_.settle_time);
  }

  // Step 4: ask the target to promote itself
  LOG_INFO("switchover", "Step 4 - requesting promotion of ", target.server_ip);
  PromoteMessage message;
  message.event = peer_events::SWITCHOVER;
  message.current_main = config.server_ip;
  message.cluster_id = config.cluster_id;
  message.cluster_secret = config.cluster_secret;
  auto response = notifier_->send_promote(target.server_ip, message);
  if (!response.success) {
    std::string cause = response.status_code == 0
                            ? response.error_message
                            : "status " + std::to_string(response.status_code);
    LOG_WARN("switchover", "promotion request failed (", cause,
             "), lifting write fence");
    auto unfenced = replication_->set_read_only(false);
    if (!unfenced.is_ok()) {
      LOG_CRITICAL_FAILURE("switchover",
                           "write fence could not be lifted, database stays "
                           "read-only: " +
                               unfenced.error());
    }
    return fail_after_fence(config, ErrorKind::NETWORK,
                            "failed to contact secondary: " + cause);
  }

  // Step 5: follow the new main; no way back from here
  LOG_INFO("switchover", "Step 5 - demoting this server to replica of ",
           target.server_ip);
  auto demoted = replication_->demote_to_replica(
      target.server_ip, replication_slot_name(config.hardware_id));
  if (!demoted.is_ok()) {
    LOG_CRITICAL_FAILURE("switchover",
                         "demotion failed after the target was promoted: " +
                             demoted.error());
    return fail_after_fence(config, ErrorKind::FATAL_PIPELINE,
                            "failed to demote to replica: " + demoted.error());
  }

  auto cache = replication_->follow_cache_replication(target.server_ip);
  if (!cache.is_ok()) {
    LOG_WARN("switchover", "cannot re-point cache replication: ",
             cache.error());
  }

  // Step 6
  LOG_INFO("switchover", "Step 6 - updating cluster config");
  config.server_role = ServerRole::SECONDARY;
  config.main_server_ip = target.server_ip;
  config.api_role = ApiRole::STANDBY;
  config.radius_role = RadiusRole::BACKUP;
  auto saved = store_->save_config(config);
  if (!saved.is_ok()) {
    return fail_after_fence(config, ErrorKind::FATAL_PIPELINE,
                            "failed to update cluster config: " +
                                saved.error());
  }

  // Step 7
  record_event(config, event_types::SWITCHOVER_COMPLETED,
               "Switchover completed: " + target.server_ip +
                   " is now main, this server follows it",
               EventSeverity::WARNING);
  LOG_INFO("switchover", "=== SWITCHOVER COMPLETE ===");
  return ControllerResult::ok("switchover to " + target.server_ip +
                              " completed");
}

ControllerResult SwitchoverOrchestrator::fail_after_fence(
    const ClusterConfig &config, ErrorKind kind, const std::string &error) {
  LOG_SWITCHOVER_ERROR(error);
  record_event(config, event_types::SWITCHOVER_FAILED,
               "Switchover failed: " + error, EventSeverity::CRITICAL);
  return ControllerResult::fail(kind, error);
}

void SwitchoverOrchestrator::record_event(const ClusterConfig &config,
                                          const std::string &type,
                                          const std::string &description,
                                          EventSeverity severity) {
  auto appended =
      store_->append_event(make_event(config, type, description, severity));
  if (!appended.is_ok()) {
    LOG_ERROR("switchover", "cannot record ", type, " event: ",
              appended.error());
  }
}

} // namespace cluster
} // namespace hacluster
