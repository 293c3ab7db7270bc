#pragma once

#include "cluster/cluster_types.h"
#include "cluster/peer_protocol.h"
#include "network/http_client.h"
#include "security/message_auth.h"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace hacluster {
namespace cluster {

struct PeerNotifierOptions {
  uint16_t peer_port = 8080;
  std::chrono::milliseconds request_timeout{30000};
  std::chrono::milliseconds health_timeout{10000};
  bool sign_messages = false;
  uint32_t signature_window_seconds = 300;
};

/// Result of delivering one message to one peer
struct PeerDelivery {
  std::string peer_ip;
  bool delivered = false;
  int status_code = 0;
  std::string error;
};

/**
 * @brief Outbound side of the peer control protocol
 *
 * Every request carries the cluster secret in its body and, when signing is
 * enabled, the HMAC headers. Calls are independent; a slow or dead peer only
 * costs its own timeout.
 */
class PeerNotifier {
private:
  std::shared_ptr<network::IHttpClient> http_;
  PeerNotifierOptions options_;
  security::MessageAuthenticator signer_;

  network::HttpResponse post_json(const std::string &url,
                                  const std::string &body,
                                  const std::string &secret,
                                  std::chrono::milliseconds timeout);

public:
  PeerNotifier(std::shared_ptr<network::IHttpClient> http,
               const PeerNotifierOptions &options);

  std::string peer_url(const std::string &ip, uint16_t port,
                       const std::string &path) const;

  /**
   * @brief Send new_main to every roster member except this node
   *
   * Failures are logged per peer and do not stop the broadcast.
   */
  std::vector<PeerDelivery> broadcast_new_main(const ClusterConfig &self,
                                               const std::vector<ClusterNode> &roster);

  /// POST /cluster/promote to @p target_ip; the raw response is returned
  network::HttpResponse send_promote(const std::string &target_ip,
                                     const PromoteMessage &message);

  /// GET /health; true only for HTTP 200
  bool check_health(const std::string &ip, uint16_t port);

  /// GET an arbitrary health URL (quorum witnesses)
  bool check_health_url(const std::string &url);

  const PeerNotifierOptions &options() const { return options_; }
};

} // namespace cluster
} // namespace hacluster
