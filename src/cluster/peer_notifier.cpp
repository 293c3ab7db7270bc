#include "cluster/peer_notifier.h"
#include "common/logging.h"

namespace hacluster {
namespace cluster {

PeerNotifier::PeerNotifier(std::shared_ptr<network::IHttpClient> http,
                           const PeerNotifierOptions &options)
    : http_(std::move(http)), options_(options),
      signer_(options.signature_window_seconds) {}

std::string PeerNotifier::peer_url(const std::string &ip, uint16_t port,
                                   const std::string &path) const {
  return "http://" + ip + ":" + std::to_string(port) + path;
}

network::HttpResponse
PeerNotifier::post_json(const std::string &url, const std::string &body,
                        const std::string &secret,
                        std::chrono::milliseconds timeout) {
  network::HttpHeaders headers = {{"Content-Type", "application/json"}};

  if (options_.sign_messages) {
    auto signature =
        signer_.sign(secret, body, std::chrono::system_clock::now());
    if (!signature.is_ok()) {
      network::HttpResponse failed;
      failed.error_message = "cannot sign message: " + signature.error();
      return failed;
    }
    for (const auto &[name, value] : signature.value()) {
      headers[name] = value;
    }
  }

  return http_->post(url, body, headers, timeout);
}

std::vector<PeerDelivery>
PeerNotifier::broadcast_new_main(const ClusterConfig &self,
                                 const std::vector<ClusterNode> &roster) {
  NotifyMessage message;
  message.event = peer_events::NEW_MAIN;
  message.new_main_ip = self.server_ip;
  message.cluster_id = self.cluster_id;
  message.cluster_secret = self.cluster_secret;
  message.timestamp = common::format_iso8601(std::chrono::system_clock::now());
  std::string body = to_json(message);

  std::vector<PeerDelivery> deliveries;
  for (const auto &node : roster) {
    bool is_self = node.server_ip == self.server_ip ||
                   (!self.hardware_id.empty() &&
                    node.hardware_id == self.hardware_id);
    if (is_self) {
      continue;
    }

    PeerDelivery delivery;
    delivery.peer_ip = node.server_ip;
    std::string url =
        peer_url(node.server_ip, options_.peer_port, endpoints::NOTIFY);
    auto response =
        post_json(url, body, self.cluster_secret, options_.request_timeout);
    delivery.status_code = response.status_code;

    if (response.success) {
      delivery.delivered = true;
      LOG_INFO("notifier", "notified ", node.server_name, " (",
               node.server_ip, ") of new main");
    } else {
      delivery.error = response.error_message;
      LOG_WARN("notifier", "failed to notify ", node.server_name, " (",
               node.server_ip, "): ", response.error_message);
    }
    deliveries.push_back(delivery);
  }
  return deliveries;
}

network::HttpResponse PeerNotifier::send_promote(const std::string &target_ip,
                                                 const PromoteMessage &message) {
  std::string url = peer_url(target_ip, options_.peer_port, endpoints::PROMOTE);
  LOG_INFO("notifier", "sending ", message.event, " to ", url);
  return post_json(url, to_json(message), message.cluster_secret,
                   options_.request_timeout);
}

bool PeerNotifier::check_health(const std::string &ip, uint16_t port) {
  return check_health_url(peer_url(ip, port, endpoints::HEALTH));
}

bool PeerNotifier::check_health_url(const std::string &url) {
  auto response = http_->get(url, {}, options_.health_timeout);
  if (response.status_code != 200) {
    LOG_DEBUG("notifier", "health check ", url, " failed: ",
              response.error_message);
    return false;
  }
  return true;
}

} // namespace cluster
} // namespace hacluster
