#pragma once

#include "common/types.h"
#include <cstdint>
#include <string>

namespace hacluster {
namespace cluster {

using common::Result;

/// Control endpoints served by every node
namespace endpoints {
constexpr const char *HEALTH = "/health";
constexpr const char *NOTIFY = "/cluster/notify";
constexpr const char *PROMOTE = "/cluster/promote";
constexpr const char *STATUS = "/cluster/status";
constexpr const char *ADMIN_FAILOVER = "/cluster/admin/failover";
constexpr const char *ADMIN_SWITCHOVER = "/cluster/admin/switchover";
constexpr const char *ADMIN_LEAVE = "/cluster/admin/leave";
} // namespace endpoints

/// Carries the cluster secret on GET /cluster/status
constexpr const char *ADMIN_SECRET_HEADER = "X-Cluster-Secret";

namespace peer_events {
constexpr const char *NEW_MAIN = "new_main";
constexpr const char *PROMOTE_TO_MAIN = "promote_to_main";
constexpr const char *SWITCHOVER = "switchover";
} // namespace peer_events

// Body of POST /cluster/notify
struct NotifyMessage {
  std::string event;
  std::string new_main_ip;
  std::string cluster_id;
  std::string cluster_secret;
  std::string timestamp; ///< ISO 8601, informational
};

// Body of POST /cluster/promote
struct PromoteMessage {
  std::string event;
  std::string current_main;
  std::string cluster_id;
  std::string cluster_secret;
};

// Body of the authenticated admin endpoints
struct AdminRequest {
  std::string cluster_secret;
  uint64_t target_node_id = 0;
};

std::string to_json(const NotifyMessage &message);
std::string to_json(const PromoteMessage &message);
std::string to_json(const AdminRequest &request);

Result<NotifyMessage> parse_notify_message(const std::string &body);
Result<PromoteMessage> parse_promote_message(const std::string &body);
Result<AdminRequest> parse_admin_request(const std::string &body);

/// {"success":...,"message":...}
std::string make_reply_body(bool success, const std::string &message);

} // namespace cluster
} // namespace hacluster
