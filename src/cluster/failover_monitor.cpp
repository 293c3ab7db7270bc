#include "cluster/failover_monitor.h"
#include "common/logging.h"

namespace hacluster {
namespace cluster {

FailoverMonitor::FailoverMonitor(
    std::shared_ptr<IClusterStateStore> store,
    std::shared_ptr<IReplicationDriver> replication,
    std::shared_ptr<PeerNotifier> notifier,
    std::shared_ptr<FailoverGuard> guard,
    std::shared_ptr<FailoverOrchestrator> orchestrator,
    const FailoverMonitorOptions &options, MonotonicClock clock)
    : store_(std::move(store)), replication_(std::move(replication)),
      notifier_(std::move(notifier)), guard_(std::move(guard)),
      orchestrator_(std::move(orchestrator)), options_(options),
      clock_(clock ? std::move(clock)
                   : MonotonicClock([] { return std::chrono::steady_clock::now(); })),
      running_(false) {}

FailoverMonitor::~FailoverMonitor() { stop(); }

Result<bool> FailoverMonitor::start() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  if (running_.load()) {
    return Result<bool>("failover monitor already running");
  }

  auto loaded = store_->load_config();
  if (!loaded.is_ok()) {
    LOG_INFO("monitor", "no cluster config, not starting");
    return Result<bool>(loaded.error());
  }
  ClusterConfig config = loaded.value();

  // A replica is a secondary even if a replicated config says otherwise
  auto recovery = replication_->is_in_recovery();
  if (!recovery.is_ok()) {
    LOG_DEBUG("monitor", "cannot query recovery state: ", recovery.error());
  } else if (recovery.value() && config.server_role == ServerRole::MAIN) {
    LOG_WARN("monitor", "database is in recovery mode but config says main; "
                        "treating this node as secondary");
    config.server_role = ServerRole::SECONDARY;
    auto saved = store_->save_config(config);
    if (!saved.is_ok()) {
      LOG_ERROR("monitor", "cannot persist corrected role: ", saved.error());
    }
  }

  if (config.server_role != ServerRole::SECONDARY) {
    LOG_INFO("monitor", "not a secondary server (role: ",
             to_string(config.server_role), "), not starting");
    return Result<bool>("not a secondary server (role: " +
                        to_string(config.server_role) + ")");
  }
  if (!config.auto_failover_enabled) {
    LOG_INFO("monitor", "auto-failover disabled, not starting");
    return Result<bool>("auto-failover disabled");
  }

  {
    std::lock_guard<std::mutex> lock(watch_mutex_);
    watched_main_ip_.clear();
  }
  watch_main(config.main_server_ip);
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    stop_requested_ = false;
  }
  running_.store(true);
  monitor_thread_ = std::thread(&FailoverMonitor::monitor_loop, this);

  LOG_INFO("monitor", "started monitoring main server ", config.main_server_ip,
           " (interval ", options_.check_interval.count(), "ms, threshold ",
           options_.failover_threshold.count(), "ms)");
  return Result<bool>(true);
}

void FailoverMonitor::stop() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  if (!running_.load()) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    stop_requested_ = true;
  }
  wait_cv_.notify_all();
  if (monitor_thread_.joinable()) {
    monitor_thread_.join();
  }
  running_.store(false);
  LOG_INFO("monitor", "stopped");
}

void FailoverMonitor::monitor_loop() {
  while (true) {
    {
      std::unique_lock<std::mutex> lock(wait_mutex_);
      if (wait_cv_.wait_for(lock, options_.check_interval,
                            [this] { return stop_requested_; })) {
        return;
      }
    }
    check_main_server();
  }
}

void FailoverMonitor::watch_main(const std::string &main_ip) {
  std::lock_guard<std::mutex> lock(watch_mutex_);
  if (main_ip.empty()) {
    watched_main_ip_.clear();
    return;
  }
  if (main_ip != watched_main_ip_) {
    if (!watched_main_ip_.empty()) {
      LOG_INFO("monitor", "main server changed from ", watched_main_ip_, " to ",
               main_ip, ", restarting outage timer");
    }
    watched_main_ip_ = main_ip;
    guard_->record_heartbeat(clock_());
  }
}

TickResult FailoverMonitor::check_main_server() {
  auto loaded = store_->load_config();
  if (!loaded.is_ok()) {
    watch_main("");
    return TickResult::SKIPPED;
  }
  const ClusterConfig &config = loaded.value();
  if (config.server_role != ServerRole::SECONDARY ||
      config.main_server_ip.empty()) {
    watch_main("");
    return TickResult::SKIPPED;
  }

  watch_main(config.main_server_ip);

  if (notifier_->check_health(config.main_server_ip, config.main_server_port)) {
    guard_->record_heartbeat(clock_());
    return TickResult::HEALTHY;
  }

  std::chrono::milliseconds elapsed{0};
  OutageDecision decision = guard_->evaluate_outage(
      clock_(), options_.failover_threshold, elapsed);

  switch (decision) {
  case OutageDecision::BUSY:
    LOG_DEBUG("monitor", "main server down, failover already in progress");
    return TickResult::FAILOVER_IN_PROGRESS;
  case OutageDecision::WAITING:
    LOG_WARN("monitor", "main server ", config.main_server_ip, " down for ",
             elapsed.count(), "ms (threshold ",
             options_.failover_threshold.count(), "ms)");
    return TickResult::WAITING;
  case OutageDecision::ACQUIRED:
    break;
  }

  LOG_WARN("monitor", "main server ", config.main_server_ip, " down for ",
           elapsed.count(), "ms, initiating failover");
  failovers_triggered_++;
  orchestrator_->launch(FailoverTrigger::AUTOMATIC);
  return TickResult::FAILOVER_TRIGGERED;
}

std::string tick_result_to_string(TickResult result) {
  switch (result) {
  case TickResult::SKIPPED:
    return "skipped";
  case TickResult::HEALTHY:
    return "healthy";
  case TickResult::WAITING:
    return "waiting";
  case TickResult::FAILOVER_TRIGGERED:
    return "failover_triggered";
  case TickResult::FAILOVER_IN_PROGRESS:
    return "failover_in_progress";
  }
  return "unknown";
}

} // namespace cluster
} // namespace hacluster
