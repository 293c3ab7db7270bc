#include "cluster/failover_orchestrator.h"
#include "common/logging.h"

namespace hacluster {
namespace cluster {

FailoverOrchestrator::FailoverOrchestrator(
    std::shared_ptr<IClusterStateStore> store,
    std::shared_ptr<IReplicationDriver> replication,
    std::shared_ptr<IServiceController> services,
    std::shared_ptr<PeerNotifier> notifier,
    std::shared_ptr<FailoverGuard> guard, const FailoverOptions &options)
    : store_(std::move(store)), replication_(std::move(replication)),
      services_(std::move(services)), notifier_(std::move(notifier)),
      guard_(std::move(guard)), options_(options) {}

FailoverOrchestrator::~FailoverOrchestrator() { wait_for_runs(); }

std::shared_future<FailoverOutcome>
FailoverOrchestrator::launch(FailoverTrigger trigger) {
  reap_finished_runs();

  auto promise = std::make_shared<std::promise<FailoverOutcome>>();
  std::shared_future<FailoverOutcome> future = promise->get_future().share();
  auto finished = std::make_shared<std::atomic<bool>>(false);

  std::lock_guard<std::mutex> lock(runs_mutex_);
  Run entry;
  entry.finished = finished;
  entry.thread = std::thread([this, trigger, promise, finished]() {
    promise->set_value(run(trigger));
    finished->store(true);
  });
  runs_.push_back(std::move(entry));
  return future;
}

std::optional<std::shared_future<FailoverOutcome>>
FailoverOrchestrator::try_launch(FailoverTrigger trigger) {
  if (!guard_->try_acquire("failover")) {
    LOG_INFO("failover", "failover already in progress (",
             guard_->active_operation(), "), not starting another");
    return std::nullopt;
  }
  return launch(trigger);
}

FailoverOutcome FailoverOrchestrator::run(FailoverTrigger trigger) {
  runs_started_++;
  auto started = std::chrono::steady_clock::now();

  FailoverOutcome outcome;
  try {
    outcome = execute(trigger);
  } catch (const std::exception &e) {
    outcome.trigger = trigger;
    outcome.success = false;
    outcome.error = std::string("unexpected error: ") + e.what();
    LOG_FAILOVER_ERROR("failover run aborted: " + outcome.error);
  }
  guard_->release();

  outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  notify_completion(outcome);
  return outcome;
}

FailoverOutcome FailoverOrchestrator::execute(FailoverTrigger trigger) {
  FailoverOutcome outcome;
  outcome.trigger = trigger;

  LOG_INFO("failover", "=== CLUSTER FAILOVER STARTING (",
           failover_utils::trigger_to_string(trigger), ") ===");

  auto loaded = store_->load_config();
  if (!loaded.is_ok()) {
    outcome.failed_step = FailoverStep::LOAD_CONFIG;
    outcome.error = loaded.error();
    LOG_FAILOVER_ERROR("cannot start failover: " + outcome.error);
    return outcome;
  }
  ClusterConfig config = loaded.value();
  // Captured before the config update below overwrites it with our own IP
  const std::string former_main_ip = config.main_server_ip;
  outcome.former_main_ip = former_main_ip;

  std::string reason;
  switch (trigger) {
  case FailoverTrigger::AUTOMATIC:
    reason = "Auto-failover initiated: main server " + former_main_ip +
             " unreachable";
    break;
  case FailoverTrigger::PROMOTE_REQUEST:
    reason = "Promotion to main requested by " + former_main_ip;
    break;
  case FailoverTrigger::SWITCHOVER:
    reason = "Switchover promotion requested by " + former_main_ip;
    break;
  }
  record_event(config, event_types::FAILOVER_STARTED, reason,
               EventSeverity::CRITICAL);

  // Step 1: replication lag, informational only
  LOG_INFO("failover", "Step 1 - checking replication lag");
  auto lag = replication_->replication_lag_seconds();
  if (!lag.is_ok()) {
    LOG_WARN("failover", "cannot read replication lag: ", lag.error());
  } else if (lag.value() > options_.lag_warning_seconds) {
    LOG_WARN("failover", "replication lag is ", lag.value(),
             " seconds, data loss possible");
  } else {
    LOG_INFO("failover", "replication lag ", lag.value(), "s");
  }

  if (options_.require_quorum && trigger == FailoverTrigger::AUTOMATIC) {
    LOG_INFO("failover", "Step 1b - confirming peer quorum");
    std::string quorum_error;
    if (!check_quorum(config, former_main_ip, quorum_error)) {
      return fail_run(outcome, config, FailoverStep::QUORUM_CHECK,
                      quorum_error);
    }
  }

  // Step 2: promote the database; the only fatal step
  LOG_INFO("failover", "Step 2 - promoting database to primary");
  auto promoted = replication_->promote_to_main();
  if (!promoted.is_ok()) {
    return fail_run(outcome, config, FailoverStep::PROMOTE_DATABASE,
                    "database promotion failed: " + promoted.error());
  }

  // Step 3: detach the cache from the old main
  LOG_INFO("failover", "Step 3 - stopping cache replication");
  auto cache = replication_->stop_cache_replication();
  if (!cache.is_ok()) {
    LOG_WARN("failover", "cannot stop cache replication: ", cache.error());
    outcome.warnings.push_back("stop cache replication: " + cache.error());
  }

  // Step 4: local config
  LOG_INFO("failover", "Step 4 - updating cluster config");
  config.server_role = ServerRole::MAIN;
  config.api_role = ApiRole::ACTIVE;
  config.radius_role = RadiusRole::PRIMARY;
  config.main_server_ip = config.server_ip;
  config.last_heartbeat = std::chrono::system_clock::now();
  auto saved = store_->save_config(config);
  if (!saved.is_ok()) {
    LOG_CLUSTER_ERROR("cannot persist promoted config: " + saved.error());
    outcome.warnings.push_back("update config: " + saved.error());
  }

  // Step 5: roster
  LOG_INFO("failover", "Step 5 - updating cluster roster");
  update_roster(config, former_main_ip, trigger, outcome);

  // Step 6: tell everyone else
  LOG_INFO("failover", "Step 6 - notifying peers");
  auto deliveries =
      notifier_->broadcast_new_main(config, store_->list_nodes(config.cluster_id));
  for (const auto &delivery : deliveries) {
    if (delivery.delivered) {
      outcome.peers_notified.push_back(delivery.peer_ip);
    } else {
      outcome.peers_failed.push_back(delivery.peer_ip);
    }
  }

  // Step 7: dependent services
  LOG_INFO("failover", "Step 7 - restarting RADIUS");
  auto restarted = services_->restart_radius();
  if (!restarted.is_ok()) {
    LOG_WARN("failover", "RADIUS restart failed: ", restarted.error());
    outcome.warnings.push_back("restart RADIUS: " + restarted.error());
  }

  // Step 8
  std::string summary = "Failover completed: " + config.server_ip +
                        " is now main (former main " + former_main_ip + ")";
  if (!outcome.peers_failed.empty()) {
    summary += ", " + std::to_string(outcome.peers_failed.size()) +
               " peer(s) not notified";
  }
  record_event(config, event_types::FAILOVER_COMPLETED, summary,
               EventSeverity::WARNING);
  outcome.success = true;
  LOG_INFO("failover", "=== CLUSTER FAILOVER COMPLETE ===");
  return outcome;
}

FailoverOutcome FailoverOrchestrator::fail_run(FailoverOutcome outcome,
                                               const ClusterConfig &config,
                                               FailoverStep step,
                                               const std::string &error) {
  outcome.success = false;
  outcome.failed_step = step;
  outcome.error = error;
  LOG_FAILOVER_ERROR("failover failed at " +
                     failover_utils::step_to_string(step) + ": " + error);
  record_event(config, event_types::FAILOVER_FAILED,
               "Failover failed at " + failover_utils::step_to_string(step) +
                   ": " + error,
               EventSeverity::CRITICAL);
  return outcome;
}

bool FailoverOrchestrator::check_quorum(const ClusterConfig &config,
                                        const std::string &former_main_ip,
                                        std::string &error) {
  size_t observers = 0;
  size_t reachable = 0;

  for (const auto &node : store_->list_nodes(config.cluster_id)) {
    bool is_self = node.server_ip == config.server_ip ||
                   (!config.hardware_id.empty() &&
                    node.hardware_id == config.hardware_id);
    if (is_self || node.server_ip == former_main_ip) {
      continue;
    }
    observers++;
    if (notifier_->check_health(node.server_ip,
                                notifier_->options().peer_port)) {
      reachable++;
    }
  }
  for (const auto &witness : options_.quorum_witnesses) {
    observers++;
    if (notifier_->check_health_url(witness)) {
      reachable++;
    }
  }

  if (observers == 0) {
    error = "quorum check failed: no observers available";
    return false;
  }
  if (reachable * 2 <= observers) {
    error = "quorum not reached: " + std::to_string(reachable) + " of " +
            std::to_string(observers) + " observers reachable";
    return false;
  }
  LOG_INFO("failover", "quorum confirmed: ", reachable, " of ", observers,
           " observers reachable");
  return true;
}

void FailoverOrchestrator::update_roster(const ClusterConfig &config,
                                         const std::string &former_main_ip,
                                         FailoverTrigger trigger,
                                         FailoverOutcome &outcome) {
  auto roster = store_->list_nodes(config.cluster_id);

  if (!former_main_ip.empty() && former_main_ip != config.server_ip) {
    if (trigger == FailoverTrigger::SWITCHOVER) {
      bool found = false;
      for (auto node : roster) {
        if (node.server_ip != former_main_ip)
          continue;
        found = true;
        node.server_role = ServerRole::SECONDARY;
        node.status = NodeStatus::ONLINE;
        auto updated = store_->upsert_node(node);
        if (!updated.is_ok()) {
          outcome.warnings.push_back("update former main: " + updated.error());
        }
      }
      if (!found) {
        LOG_WARN("failover", "former main ", former_main_ip,
                 " is not in the roster");
      }
    } else {
      auto updated =
          store_->update_node_status_by_ip(former_main_ip, NodeStatus::OFFLINE);
      if (!updated.is_ok()) {
        outcome.warnings.push_back("mark former main offline: " +
                                   updated.error());
      } else if (!updated.value()) {
        LOG_WARN("failover", "former main ", former_main_ip,
                 " is not in the roster");
      }
    }
  }

  bool self_found = false;
  for (auto node : roster) {
    bool is_self = (!config.hardware_id.empty() &&
                    node.hardware_id == config.hardware_id) ||
                   (config.hardware_id.empty() &&
                    node.server_ip == config.server_ip);
    if (!is_self)
      continue;
    self_found = true;
    node.server_role = ServerRole::MAIN;
    node.status = NodeStatus::ONLINE;
    auto updated = store_->upsert_node(node);
    if (!updated.is_ok()) {
      outcome.warnings.push_back("update own roster row: " + updated.error());
    }
  }
  if (!self_found) {
    LOG_WARN("failover", "this node (", config.server_ip,
             ") is not in the roster");
  }
}

void FailoverOrchestrator::record_event(const ClusterConfig &config,
                                        const std::string &type,
                                        const std::string &description,
                                        EventSeverity severity) {
  auto appended =
      store_->append_event(make_event(config, type, description, severity));
  if (!appended.is_ok()) {
    LOG_ERROR("failover", "cannot record ", type, " event: ",
              appended.error());
  }
}

void FailoverOrchestrator::notify_completion(const FailoverOutcome &outcome) {
  CompletionCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = completion_callback_;
  }
  if (callback) {
    callback(outcome);
  }
}

void FailoverOrchestrator::set_completion_callback(CompletionCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  completion_callback_ = std::move(callback);
}

void FailoverOrchestrator::reap_finished_runs() {
  std::lock_guard<std::mutex> lock(runs_mutex_);
  for (auto it = runs_.begin(); it != runs_.end();) {
    if (it->finished->load()) {
      if (it->thread.joinable())
        it->thread.join();
      it = runs_.erase(it);
    } else {
      ++it;
    }
  }
}

void FailoverOrchestrator::wait_for_runs() {
  std::vector<Run> pending;
  {
    std::lock_guard<std::mutex> lock(runs_mutex_);
    pending.swap(runs_);
  }
  for (auto &entry : pending) {
    if (entry.thread.joinable()) {
      entry.thread.join();
    }
  }
}

namespace failover_utils {

std::string trigger_to_string(FailoverTrigger trigger) {
  switch (trigger) {
  case FailoverTrigger::AUTOMATIC:
    return "automatic";
  case FailoverTrigger::PROMOTE_REQUEST:
    return "promote_request";
  case FailoverTrigger::SWITCHOVER:
    return "switchover";
  }
  return "unknown";
}

std::string step_to_string(FailoverStep step) {
  switch (step) {
  case FailoverStep::NONE:
    return "none";
  case FailoverStep::LOAD_CONFIG:
    return "load_config";
  case FailoverStep::ASSESS_LAG:
    return "assess_lag";
  case FailoverStep::QUORUM_CHECK:
    return "quorum_check";
  case FailoverStep::PROMOTE_DATABASE:
    return "promote_database";
  case FailoverStep::STOP_CACHE_REPLICATION:
    return "stop_cache_replication";
  case FailoverStep::UPDATE_CONFIG:
    return "update_config";
  case FailoverStep::UPDATE_ROSTER:
    return "update_roster";
  case FailoverStep::NOTIFY_PEERS:
    return "notify_peers";
  case FailoverStep::RESTART_SERVICES:
    return "restart_services";
  }
  return "unknown";
}

} // namespace failover_utils

} // namespace cluster
} // namespace hacluster
