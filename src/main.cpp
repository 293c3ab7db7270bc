#include "cluster/cluster_controller.h"
#include "cluster/cluster_state_store.h"
#include "cluster/failover_guard.h"
#include "cluster/failover_monitor.h"
#include "cluster/failover_orchestrator.h"
#include "cluster/peer_notifier.h"
#include "cluster/replication_driver.h"
#include "cluster/service_controller.h"
#include "cluster/switchover_orchestrator.h"
#include "common/config.h"
#include "common/logging.h"
#include "common/process_runner.h"
#include "network/control_server.h"
#include "network/http_client.h"
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <signal.h>
#include <string>
#include <thread>
#include <unordered_map>

using namespace hacluster;

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_shutdown_requested.store(true);
  }
}

void print_usage(const char *program_name) {
  std::cout << "Usage: " << program_name << " [command] [options]" << std::endl;
  std::cout << std::endl;
  std::cout << "Commands:" << std::endl;
  std::cout << "  run                        Start the controller daemon (default)"
            << std::endl;
  std::cout << "  failover --target ID       Hand the main role to node ID"
            << std::endl;
  std::cout << "  switchover --target ID     Planned role exchange with node ID"
            << std::endl;
  std::cout << "  status                     Print cluster status from the daemon"
            << std::endl;
  std::cout << "  leave                      Remove this (non-main) node from the "
               "cluster"
            << std::endl;
  std::cout << std::endl;
  std::cout << "Options:" << std::endl;
  std::cout << "  --config FILE              Path to JSON configuration file"
            << std::endl;
  std::cout << "  --log-level LEVEL          Log level (trace, debug, info, warn, "
               "error)"
            << std::endl;
  std::cout << "  --json-logs                Emit one JSON object per log line"
            << std::endl;
  std::cout << "  --bind ADDR                Control server address (default: "
               "0.0.0.0:8080)"
            << std::endl;
  std::cout << "  --admin-url URL            Daemon URL for admin commands "
               "(default: http://127.0.0.1:8080)"
            << std::endl;
  std::cout << "  --state PATH               Cluster state file" << std::endl;
  std::cout << "  --target ID                Roster id of the target node"
            << std::endl;
  std::cout << "  --help, -h                 Show this help message" << std::endl;
}

struct CommandLine {
  std::string command = "run";
  std::string config_file;
  std::string log_level;
  bool json_logs = false;
  std::string bind_address;
  std::string admin_url;
  std::string state_path;
  uint64_t target_node_id = 0;
  bool show_help = false;
};

common::Result<CommandLine> parse_arguments(int argc, char *argv[]) {
  CommandLine cli;
  int first_option = 1;
  if (argc > 1 && argv[1][0] != '-') {
    cli.command = argv[1];
    first_option = 2;
  }

  for (int i = first_option; i < argc; ++i) {
    std::string arg = argv[i];
    bool has_value = i + 1 < argc;

    if (arg == "--help" || arg == "-h") {
      cli.show_help = true;
    } else if (arg == "--json-logs") {
      cli.json_logs = true;
    } else if (arg == "--config" && has_value) {
      cli.config_file = argv[++i];
    } else if (arg == "--log-level" && has_value) {
      cli.log_level = argv[++i];
    } else if (arg == "--bind" && has_value) {
      cli.bind_address = argv[++i];
    } else if (arg == "--admin-url" && has_value) {
      cli.admin_url = argv[++i];
    } else if (arg == "--state" && has_value) {
      cli.state_path = argv[++i];
    } else if (arg == "--target" && has_value) {
      std::string value = argv[++i];
      char *end = nullptr;
      unsigned long long id = std::strtoull(value.c_str(), &end, 10);
      if (value.empty() || *end != '\0' || id == 0) {
        return common::Result<CommandLine>("invalid --target: " + value);
      }
      cli.target_node_id = id;
    } else {
      return common::Result<CommandLine>("unknown or incomplete option: " +
                                         arg);
    }
  }
  return common::Result<CommandLine>(cli);
}

common::Result<common::ControllerConfig>
build_config(const CommandLine &cli) {
  common::ControllerConfig config;
  if (!cli.config_file.empty()) {
    auto loaded = common::load_config_file(cli.config_file);
    if (!loaded.is_ok()) {
      return loaded;
    }
    config = loaded.value();
  }
  common::apply_environment(config);

  if (!cli.log_level.empty())
    config.log_level = cli.log_level;
  if (cli.json_logs)
    config.json_logs = true;
  if (!cli.bind_address.empty())
    config.bind_address = cli.bind_address;
  if (!cli.admin_url.empty())
    config.admin_url = cli.admin_url;
  if (!cli.state_path.empty())
    config.state_path = cli.state_path;

  auto valid = common::validate_config(config);
  if (!valid.is_ok()) {
    return common::Result<common::ControllerConfig>(valid.error());
  }
  return common::Result<common::ControllerConfig>(config);
}

void configure_logging(const common::ControllerConfig &config) {
  auto &logger = common::Logger::instance();
  logger.set_level(common::Logger::parse_level(config.log_level));
  logger.set_json_format(config.json_logs);
}

int run_daemon(const common::ControllerConfig &config) {
  auto store = std::make_shared<cluster::FileClusterStateStore>(
      config.state_path, config.events_path);
  auto loaded = store->load();
  if (!loaded.is_ok()) {
    LOG_ERROR("main", "cannot load cluster state: ", loaded.error());
    return 1;
  }

  // Health checks and peer requests must not block on stdout
  common::Logger::instance().set_async_logging(true);

  auto runner = std::make_shared<common::ProcessRunner>();
  auto replication =
      std::make_shared<cluster::ProcessReplicationDriver>(config, runner);
  auto services = std::make_shared<cluster::ProcessServiceController>(
      config.radius_restart_command, runner,
      std::chrono::milliseconds(config.command_timeout_ms));

  auto http = std::make_shared<network::HttpClient>();
  cluster::PeerNotifierOptions notifier_options;
  notifier_options.peer_port = config.peer_port;
  notifier_options.request_timeout =
      std::chrono::milliseconds(config.peer_request_timeout_ms);
  notifier_options.health_timeout =
      std::chrono::milliseconds(config.health_check_timeout_ms);
  notifier_options.sign_messages = config.sign_peer_messages;
  notifier_options.signature_window_seconds = config.signature_window_seconds;
  auto notifier =
      std::make_shared<cluster::PeerNotifier>(http, notifier_options);

  auto guard = std::make_shared<cluster::FailoverGuard>();

  cluster::FailoverOptions failover_options;
  failover_options.lag_warning_seconds = config.replication_lag_warning_seconds;
  failover_options.require_quorum = config.require_quorum;
  failover_options.quorum_witnesses = config.quorum_witnesses;
  auto orchestrator = std::make_shared<cluster::FailoverOrchestrator>(
      store, replication, services, notifier, guard, failover_options);
  orchestrator->set_completion_callback(
      [](const cluster::FailoverOutcome &outcome) {
        std::unordered_map<std::string, std::string> context = {
            {"trigger",
             cluster::failover_utils::trigger_to_string(outcome.trigger)},
            {"duration_ms", std::to_string(outcome.duration.count())},
            {"peers_notified", std::to_string(outcome.peers_notified.size())},
            {"peers_failed", std::to_string(outcome.peers_failed.size())}};
        if (outcome.success) {
          LOG_STRUCTURED(common::LogLevel::INFO, "main", "failover finished",
                         "", context);
        } else {
          context["failed_step"] =
              cluster::failover_utils::step_to_string(outcome.failed_step);
          LOG_STRUCTURED(common::LogLevel::ERROR, "main",
                         "failover did not complete: " + outcome.error,
                         "FAILOVER_INCOMPLETE", context);
        }
      });

  cluster::SwitchoverOptions switchover_options;
  switchover_options.max_lag_bytes = config.switchover_max_lag_bytes;
  switchover_options.settle_time =
      std::chrono::milliseconds(config.switchover_settle_ms);
  auto switchover = std::make_shared<cluster::SwitchoverOrchestrator>(
      store, replication, notifier, guard, switchover_options);

  cluster::ClusterControllerOptions controller_options;
  controller_options.verify_signatures = config.sign_peer_messages;
  controller_options.signature_window_seconds = config.signature_window_seconds;
  cluster::ClusterController controller(store, replication, notifier, guard,
                                        orchestrator, switchover,
                                        controller_options);

  network::ControlServer server(config.bind_address);
  controller.register_routes(server);
  auto started = server.start();
  if (!started.is_ok()) {
    LOG_ERROR("main", "cannot start control server: ", started.error());
    return 1;
  }
  LOG_INFO("main", "control server listening on port ", server.port());

  cluster::FailoverMonitorOptions monitor_options;
  monitor_options.check_interval =
      std::chrono::milliseconds(config.health_check_interval_ms);
  monitor_options.failover_threshold =
      std::chrono::milliseconds(config.failover_threshold_ms);
  cluster::FailoverMonitor monitor(store, replication, notifier, guard,
                                   orchestrator, monitor_options);

  auto monitoring = monitor.start();
  if (!monitoring.is_ok()) {
    LOG_INFO("main", "failover monitoring inactive: ", monitoring.error());
  }

  // A switchover or a join can turn this node into a monitoring secondary
  auto next_eligibility_check = std::chrono::steady_clock::now();
  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    auto now = std::chrono::steady_clock::now();
    if (monitor.is_running() || now < next_eligibility_check) {
      continue;
    }
    next_eligibility_check = now + monitor_options.check_interval;
    auto current = store->load_config();
    if (current.is_ok() &&
        current.value().server_role == cluster::ServerRole::SECONDARY &&
        current.value().auto_failover_enabled) {
      auto restarted = monitor.start();
      if (!restarted.is_ok()) {
        LOG_WARN("main", "cannot start failover monitoring: ",
                 restarted.error());
      }
    }
  }

  LOG_INFO("main", "shutting down");
  monitor.stop();
  server.stop();
  orchestrator->wait_for_runs();
  common::Logger::instance().set_async_logging(false);
  return 0;
}

// Admin commands read the secret from the local state file and ask the daemon
int run_admin_command(const CommandLine &cli,
                      const common::ControllerConfig &config) {
  cluster::FileClusterStateStore store(config.state_path, config.events_path);
  auto loaded = store.load();
  if (!loaded.is_ok()) {
    std::cerr << "cannot read cluster state: " << loaded.error() << std::endl;
    return 1;
  }
  auto cluster_config = store.load_config();
  if (!cluster_config.is_ok()) {
    std::cerr << cluster_config.error() << std::endl;
    return 1;
  }
  const std::string &secret = cluster_config.value().cluster_secret;

  network::HttpClient http;
  http.set_user_agent("hacluster-cli");
  auto timeout = std::chrono::milliseconds(config.peer_request_timeout_ms) +
                 std::chrono::milliseconds(config.switchover_settle_ms) +
                 std::chrono::milliseconds(config.command_timeout_ms);

  network::HttpResponse response;
  if (cli.command == "status") {
    response = http.get(config.admin_url + cluster::endpoints::STATUS,
                        {{cluster::ADMIN_SECRET_HEADER, secret}}, timeout);
  } else {
    cluster::AdminRequest request;
    request.cluster_secret = secret;
    request.target_node_id = cli.target_node_id;
    std::string path = cli.command == "failover"
                           ? cluster::endpoints::ADMIN_FAILOVER
                           : cli.command == "switchover"
                                 ? cluster::endpoints::ADMIN_SWITCHOVER
                                 : cluster::endpoints::ADMIN_LEAVE;
    response = http.post(config.admin_url + path, cluster::to_json(request),
                         {{"Content-Type", "application/json"}}, timeout);
  }

  if (response.status_code == 0) {
    std::cerr << "cannot reach daemon at " << config.admin_url << ": "
              << response.error_message << std::endl;
    return 1;
  }
  auto reply = nlohmann::json::parse(response.body, nullptr, false);
  if (cli.command == "status") {
    std::cout << (reply.is_discarded() ? response.body : reply.dump(2))
              << std::endl;
    return response.success ? 0 : 1;
  }

  std::string message = response.body;
  if (reply.is_object() && reply.contains("message") &&
      reply["message"].is_string()) {
    message = reply["message"].get<std::string>();
  }
  if (!response.success) {
    std::cerr << cli.command << " failed: " << message << std::endl;
    return 1;
  }
  std::cout << message << std::endl;
  return 0;
}

int main(int argc, char *argv[]) {
  signal(SIGINT, signal_handler);
  signal(SIGTERM, signal_handler);

  auto parsed = parse_arguments(argc, argv);
  if (!parsed.is_ok()) {
    std::cerr << parsed.error() << std::endl;
    print_usage(argv[0]);
    return 1;
  }
  const CommandLine &cli = parsed.value();
  if (cli.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  auto config = build_config(cli);
  if (!config.is_ok()) {
    std::cerr << "configuration error: " << config.error() << std::endl;
    return 1;
  }
  configure_logging(config.value());

  if (cli.command == "run") {
    return run_daemon(config.value());
  }
  if (cli.command == "failover" || cli.command == "switchover") {
    if (cli.target_node_id == 0) {
      std::cerr << cli.command << " requires --target ID" << std::endl;
      return 1;
    }
    return run_admin_command(cli, config.value());
  }
  if (cli.command == "status" || cli.command == "leave") {
    return run_admin_command(cli, config.value());
  }

  std::cerr << "unknown command: " << cli.command << std::endl;
  print_usage(argv[0]);
  return 1;
}
