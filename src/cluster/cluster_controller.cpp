#include "cluster/cluster_controller.h"
#include "common/logging.h"
#include <vector>

namespace hacluster {
namespace cluster {

using json = nlohmann::json;

namespace {

network::HttpReply reply_for(const ControllerResult &result) {
  network::HttpReply reply;
  reply.status_code = http_status_for(result);
  reply.body = make_reply_body(result.success, result.message);
  return reply;
}

bool is_self_node(const ClusterConfig &config, const ClusterNode &node) {
  if (!config.hardware_id.empty()) {
    return node.hardware_id == config.hardware_id;
  }
  return node.server_ip == config.server_ip;
}

} // namespace

ClusterController::ClusterController(
    std::shared_ptr<IClusterStateStore> store,
    std::shared_ptr<IReplicationDriver> replication,
    std::shared_ptr<PeerNotifier> notifier,
    std::shared_ptr<FailoverGuard> guard,
    std::shared_ptr<FailoverOrchestrator> orchestrator,
    std::shared_ptr<SwitchoverOrchestrator> switchover,
    const ClusterControllerOptions &options)
    : store_(std::move(store)), replication_(std::move(replication)),
      notifier_(std::move(notifier)), guard_(std::move(guard)),
      orchestrator_(std::move(orchestrator)),
      switchover_(std::move(switchover)), options_(options),
      authenticator_(options.signature_window_seconds) {}

ControllerResult ClusterController::manual_failover(uint64_t target_node_id) {
  auto loaded = store_->load_config();
  if (!loaded.is_ok()) {
    return ControllerResult::fail(ErrorKind::CONFIGURATION, loaded.error());
  }
  const ClusterConfig &config = loaded.value();

  if (config.server_role != ServerRole::MAIN) {
    return ControllerResult::fail(ErrorKind::CONFIGURATION,
                                  "can only initiate failover from main server");
  }

  auto target = store_->find_node(target_node_id);
  if (!target || target->cluster_id != config.cluster_id) {
    return ControllerResult::fail(ErrorKind::CONFIGURATION,
                                  "target node not found");
  }
  if (target->status != NodeStatus::ONLINE) {
    return ControllerResult::fail(ErrorKind::CONFIGURATION,
                                  "target node is not online");
  }

  LOG_INFO("controller", "manual failover: asking ", target->server_name, " (",
           target->server_ip, ") to take over");

  PromoteMessage message;
  message.event = peer_events::PROMOTE_TO_MAIN;
  message.current_main = config.server_ip;
  message.cluster_id = config.cluster_id;
  message.cluster_secret = config.cluster_secret;

  auto response = notifier_->send_promote(target->server_ip, message);
  if (response.status_code == 0) {
    LOG_WARN("controller", "cannot reach ", target->server_ip, ": ",
             response.error_message);
    return ControllerResult::fail(ErrorKind::NETWORK,
                                  "failed to contact target node: " +
                                      response.error_message);
  }
  if (response.status_code != 200) {
    LOG_WARN("controller", "target ", target->server_ip, " refused promotion: ",
             response.body);
    return ControllerResult::fail(ErrorKind::NETWORK,
                                  "target node returned status " +
                                      std::to_string(response.status_code));
  }

  record_event(config, event_types::MANUAL_FAILOVER,
               "Manual failover initiated to " + target->server_name + " (" +
                   target->server_ip + ")",
               EventSeverity::WARNING);
  return ControllerResult::ok("failover initiated to " + target->server_ip);
}

ControllerResult ClusterController::switchover(uint64_t target_node_id) {
  return switchover_->switchover(target_node_id);
}

ControllerResult
ClusterController::authenticate_peer(const ClusterConfig &config,
                                     const std::string &claimed_secret,
                                     const network::HttpRequest &request) {
  if (!security::secure_compare(config.cluster_secret, claimed_secret)) {
    LOG_WARN("controller", "rejected ", request.path, " from ",
             request.remote_address, ": invalid cluster secret");
    return ControllerResult::fail(ErrorKind::AUTHENTICATION,
                                  "invalid cluster secret");
  }

  if (options_.verify_signatures) {
    auto verified = authenticator_.verify(
        config.cluster_secret, request.body,
        request.header(security::TIMESTAMP_HEADER),
        request.header(security::NONCE_HEADER),
        request.header(security::SIGNATURE_HEADER),
        std::chrono::system_clock::now());
    if (!verified.is_ok()) {
      LOG_WARN("controller", "rejected ", request.path, " from ",
               request.remote_address, ": ", verified.error());
      return ControllerResult::fail(ErrorKind::AUTHENTICATION,
                                    verified.error());
    }
  }
  return ControllerResult::ok("authenticated");
}

ControllerResult
ClusterController::handle_promote(const network::HttpRequest &request) {
  auto loaded = store_->load_config();
  if (!loaded.is_ok()) {
    return ControllerResult::fail(ErrorKind::CONFIGURATION, loaded.error());
  }
  const ClusterConfig &config = loaded.value();

  auto parsed = parse_promote_message(request.body);
  if (!parsed.is_ok()) {
    return ControllerResult::fail(ErrorKind::CONFIGURATION, parsed.error());
  }
  const PromoteMessage &message = parsed.value();

  auto auth = authenticate_peer(config, message.cluster_secret, request);
  if (!auth.success) {
    return auth;
  }

  if (!message.cluster_id.empty() && message.cluster_id != config.cluster_id) {
    return ControllerResult::fail(ErrorKind::CONFIGURATION,
                                  "cluster id mismatch");
  }

  FailoverTrigger trigger;
  if (message.event == peer_events::SWITCHOVER) {
    trigger = FailoverTrigger::SWITCHOVER;
  } else if (message.event == peer_events::PROMOTE_TO_MAIN ||
             message.event.empty()) {
    trigger = FailoverTrigger::PROMOTE_REQUEST;
  } else {
    return ControllerResult::fail(ErrorKind::CONFIGURATION,
                                  "unsupported event: " + message.event);
  }

  if (config.server_role != ServerRole::SECONDARY) {
    return ControllerResult::fail(ErrorKind::CONFIGURATION,
                                  "only a secondary server can be promoted "
                                  "(role: " +
                                      to_string(config.server_role) + ")");
  }

  LOG_WARN("controller", "promotion requested by ", message.current_main,
           " (", message.event, ")");
  record_event(config, event_types::PROMOTION_RECEIVED,
               "Promotion requested by " + message.current_main + " (" +
                   failover_utils::trigger_to_string(trigger) + ")",
               EventSeverity::WARNING);

  auto launched = orchestrator_->try_launch(trigger);
  if (!launched) {
    return ControllerResult::ok("failover already in progress");
  }
  return ControllerResult::ok("promotion started");
}

ControllerResult
ClusterController::handle_notify(const network::HttpRequest &request) {
  auto loaded = store_->load_config();
  if (!loaded.is_ok()) {
    return ControllerResult::fail(ErrorKind::CONFIGURATION, loaded.error());
  }
  ClusterConfig config = loaded.value();

  auto parsed = parse_notify_message(request.body);
  if (!parsed.is_ok()) {
    return ControllerResult::fail(ErrorKind::CONFIGURATION, parsed.error());
  }
  const NotifyMessage &message = parsed.value();

  auto auth = authenticate_peer(config, message.cluster_secret, request);
  if (!auth.success) {
    return auth;
  }

  if (message.event != peer_events::NEW_MAIN) {
    LOG_INFO("controller", "ignoring notification event ", message.event);
    return ControllerResult::ok("event ignored");
  }
  if (message.new_main_ip.empty()) {
    return ControllerResult::fail(ErrorKind::CONFIGURATION,
                                  "missing new_main_ip");
  }
  if (message.new_main_ip == config.server_ip) {
    return ControllerResult::ok("this server is the new main");
  }

  if (config.server_role == ServerRole::MAIN &&
      guard_->active_operation() == "switchover") {
    // The switchover target announces itself before this node has demoted
    LOG_INFO("controller", "new main ", message.new_main_ip,
             " announced during switchover, demotion pending");
    return ControllerResult::ok("switchover in progress, demotion pending");
  }
  if (config.server_role == ServerRole::MAIN) {
    LOG_CRITICAL_FAILURE("cluster",
                         "split-brain suspected: " + message.new_main_ip +
                             " claims main while this server " +
                             config.server_ip + " is main");
    return ControllerResult::ok("split-brain suspected, keeping main role");
  }

  LOG_INFO("controller", "new main server: ", message.new_main_ip,
           " (was ", config.main_server_ip, ")");
  config.main_server_ip = message.new_main_ip;
  auto saved = store_->save_config(config);
  if (!saved.is_ok()) {
    LOG_CLUSTER_ERROR("cannot persist new main: " + saved.error());
    return ControllerResult::fail(ErrorKind::FATAL_PIPELINE,
                                  "failed to update cluster config: " +
                                      saved.error());
  }

  record_event(config, event_types::NEW_MAIN_ACKNOWLEDGED,
               "Acknowledged " + message.new_main_ip + " as new main",
               EventSeverity::WARNING);

  auto cache = replication_->follow_cache_replication(message.new_main_ip);
  if (!cache.is_ok()) {
    LOG_WARN("controller", "cannot re-point cache replication: ",
             cache.error());
  }
  return ControllerResult::ok("acknowledged");
}

ControllerResult ClusterController::leave_cluster() {
  auto loaded = store_->load_config();
  if (!loaded.is_ok()) {
    return ControllerResult::fail(ErrorKind::CONFIGURATION, loaded.error());
  }
  const ClusterConfig &config = loaded.value();
  if (config.server_role == ServerRole::MAIN) {
    return ControllerResult::fail(
        ErrorKind::CONFIGURATION,
        "main server cannot leave the cluster, switch over first");
  }
  if (guard_->in_progress()) {
    return ControllerResult::fail(ErrorKind::CONFIGURATION,
                                  "role transition in progress");
  }

  record_event(config, event_types::NODE_LEFT,
               config.server_name + " (" + config.server_ip +
                   ") left the cluster",
               EventSeverity::WARNING);

  for (const auto &node : store_->list_nodes(config.cluster_id)) {
    if (!is_self_node(config, node))
      continue;
    auto removed = store_->remove_node(node.id);
    if (!removed.is_ok()) {
      LOG_WARN("controller", "cannot remove roster row ", node.id, ": ",
               removed.error());
    }
  }

  auto cleared = store_->clear_config();
  if (!cleared.is_ok()) {
    return ControllerResult::fail(ErrorKind::FATAL_PIPELINE,
                                  "failed to clear cluster config: " +
                                      cleared.error());
  }
  LOG_INFO("controller", "left cluster ", config.cluster_id);
  return ControllerResult::ok("left cluster");
}

std::string ClusterController::status_json() const {
  json status;
  auto loaded = store_->load_config();
  if (!loaded.is_ok()) {
    status["configured"] = false;
    return status.dump();
  }
  const ClusterConfig &config = loaded.value();

  json nodes = json::array();
  for (const auto &node : store_->list_nodes(config.cluster_id)) {
    nodes.push_back(to_json_value(node));
  }
  json events = json::array();
  for (const auto &event :
       store_->list_events(config.cluster_id, options_.status_event_limit)) {
    events.push_back(to_json_value(event));
  }

  status["configured"] = true;
  status["config"] = to_json_value(config, false);
  status["nodes"] = nodes;
  status["recent_events"] = events;
  status["transition_in_progress"] = guard_->in_progress();
  status["active_operation"] = guard_->active_operation();
  return status.dump(-1, ' ', false, json::error_handler_t::replace);
}

Result<AdminRequest>
ClusterController::authenticate_admin(const network::HttpRequest &request,
                                      bool require_target,
                                      ControllerResult &failure) {
  auto loaded = store_->load_config();
  if (!loaded.is_ok()) {
    failure = ControllerResult::fail(ErrorKind::CONFIGURATION, loaded.error());
    return Result<AdminRequest>(loaded.error());
  }
  auto parsed = parse_admin_request(request.body);
  if (!parsed.is_ok()) {
    failure = ControllerResult::fail(ErrorKind::CONFIGURATION, parsed.error());
    return parsed;
  }
  if (!security::secure_compare(loaded.value().cluster_secret,
                                parsed.value().cluster_secret)) {
    LOG_WARN("controller", "rejected ", request.path, " from ",
             request.remote_address, ": invalid cluster secret");
    failure = ControllerResult::fail(ErrorKind::AUTHENTICATION,
                                     "invalid cluster secret");
    return Result<AdminRequest>(failure.message);
  }
  if (require_target && parsed.value().target_node_id == 0) {
    failure = ControllerResult::fail(ErrorKind::CONFIGURATION,
                                     "missing target_node_id");
    return Result<AdminRequest>(failure.message);
  }
  return parsed;
}

void ClusterController::register_routes(network::ControlServer &server) {
  server.add_route("GET", endpoints::HEALTH,
                   [](const network::HttpRequest &) {
                     network::HttpReply reply;
                     reply.body = "{\"status\":\"ok\"}";
                     return reply;
                   });

  server.add_route("POST", endpoints::NOTIFY,
                   [this](const network::HttpRequest &request) {
                     return reply_for(handle_notify(request));
                   });

  server.add_route("POST", endpoints::PROMOTE,
                   [this](const network::HttpRequest &request) {
                     return reply_for(handle_promote(request));
                   });

  server.add_route("GET", endpoints::STATUS,
                   [this](const network::HttpRequest &request) {
                     network::HttpReply reply;
                     auto loaded = store_->load_config();
                     if (loaded.is_ok() &&
                         !security::secure_compare(
                             loaded.value().cluster_secret,
                             request.header(ADMIN_SECRET_HEADER))) {
                       return reply_for(ControllerResult::fail(
                           ErrorKind::AUTHENTICATION,
                           "invalid cluster secret"));
                     }
                     reply.body = status_json();
                     return reply;
                   });

  server.add_route("POST", endpoints::ADMIN_FAILOVER,
                   [this](const network::HttpRequest &request) {
                     ControllerResult failure;
                     auto admin = authenticate_admin(request, true, failure);
                     if (!admin.is_ok()) {
                       return reply_for(failure);
                     }
                     return reply_for(
                         manual_failover(admin.value().target_node_id));
                   });

  server.add_route("POST", endpoints::ADMIN_SWITCHOVER,
                   [this](const network::HttpRequest &request) {
                     ControllerResult failure;
                     auto admin = authenticate_admin(request, true, failure);
                     if (!admin.is_ok()) {
                       return reply_for(failure);
                     }
                     return reply_for(
                         switchover(admin.value().target_node_id));
                   });

  server.add_route("POST", endpoints::ADMIN_LEAVE,
                   [this](const network::HttpRequest &request) {
                     ControllerResult failure;
                     auto admin = authenticate_admin(request, false, failure);
                     if (!admin.is_ok()) {
                       return reply_for(failure);
                     }
                     return reply_for(leave_cluster());
                   });
}

void ClusterController::record_event(const ClusterConfig &config,
                                     const std::string &type,
                                     const std::string &description,
                                     EventSeverity severity) {
  auto appended =
      store_->append_event(make_event(config, type, description, severity));
  if (!appended.is_ok()) {
    LOG_ERROR("controller", "cannot record ", type, " event: ",
              appended.error());
  }
}

} // namespace cluster
} // namespace hacluster
