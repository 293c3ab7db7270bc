#include "cluster/peer_protocol.h"
#include <nlohmann/json.hpp>

namespace hacluster {
namespace cluster {

using json = nlohmann::json;

std::string to_json(const NotifyMessage &message) {
  json j;
  j["event"] = message.event;
  j["new_main_ip"] = message.new_main_ip;
  j["cluster_id"] = message.cluster_id;
  j["cluster_secret"] = message.cluster_secret;
  j["timestamp"] = message.timestamp;
  return j.dump();
}

std::string to_json(const PromoteMessage &message) {
  json j;
  j["event"] = message.event;
  j["current_main"] = message.current_main;
  j["cluster_id"] = message.cluster_id;
  j["cluster_secret"] = message.cluster_secret;
  return j.dump();
}

std::string to_json(const AdminRequest &request) {
  json j;
  j["cluster_secret"] = request.cluster_secret;
  j["target_node_id"] = request.target_node_id;
  return j.dump();
}

Result<NotifyMessage> parse_notify_message(const std::string &body) {
  try {
    json j = json::parse(body);
    if (!j.is_object()) {
      return Result<NotifyMessage>("invalid request body");
    }
    NotifyMessage message;
    message.event = j.value("event", "");
    message.new_main_ip = j.value("new_main_ip", "");
    message.cluster_id = j.value("cluster_id", "");
    message.cluster_secret = j.value("cluster_secret", "");
    message.timestamp = j.value("timestamp", "");
    if (message.event.empty()) {
      return Result<NotifyMessage>("missing event");
    }
    return Result<NotifyMessage>(message);
  } catch (const json::exception &e) {
    return Result<NotifyMessage>("invalid request body: " + std::string(e.what()));
  }
}

Result<PromoteMessage> parse_promote_message(const std::string &body) {
  try {
    json j = json::parse(body);
    if (!j.is_object()) {
      return Result<PromoteMessage>("invalid request body");
    }
    PromoteMessage message;
    message.event = j.value("event", "");
    message.current_main = j.value("current_main", "");
    message.cluster_id = j.value("cluster_id", "");
    message.cluster_secret = j.value("cluster_secret", "");
    return Result<PromoteMessage>(message);
  } catch (const json::exception &e) {
    return Result<PromoteMessage>("invalid request body: " + std::string(e.what()));
  }
}

Result<AdminRequest> parse_admin_request(const std::string &body) {
  try {
    json j = json::parse(body);
    if (!j.is_object()) {
      return Result<AdminRequest>("invalid request body");
    }
    AdminRequest request;
    request.cluster_secret = j.value("cluster_secret", "");
    int64_t target = j.value("target_node_id", int64_t{0});
    if (target < 0) {
      return Result<AdminRequest>("invalid target_node_id");
    }
    request.target_node_id = static_cast<uint64_t>(target);
    return Result<AdminRequest>(request);
  } catch (const json::exception &e) {
    return Result<AdminRequest>("invalid request body: " + std::string(e.what()));
  }
}

std::string make_reply_body(bool success, const std::string &message) {
  json j;
  j["success"] = success;
  j["message"] = message;
  return j.dump();
}

} // namespace cluster
} // namespace hacluster
