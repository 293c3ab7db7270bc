#pragma once

#include "cluster/cluster_state_store.h"
#include "cluster/failover_guard.h"
#include "cluster/failover_orchestrator.h"
#include "cluster/peer_notifier.h"
#include "cluster/replication_driver.h"
#include "cluster/switchover_orchestrator.h"
#include "network/control_server.h"
#include "security/message_auth.h"
#include <cstdint>
#include <memory>
#include <string>

namespace hacluster {
namespace cluster {

struct ClusterControllerOptions {
  bool verify_signatures = false;        ///< Require HMAC headers on peer messages
  uint32_t signature_window_seconds = 300;
  size_t status_event_limit = 20;        ///< Recent events included in status
};

/**
 * @brief Entry points for administrators and peers
 *
 * Every call validates configuration and credentials before touching the
 * network or the database, and reports the first fatal error verbatim.
 */
class ClusterController {
private:
  std::shared_ptr<IClusterStateStore> store_;
  std::shared_ptr<IReplicationDriver> replication_;
  std::shared_ptr<PeerNotifier> notifier_;
  std::shared_ptr<FailoverGuard> guard_;
  std::shared_ptr<FailoverOrchestrator> orchestrator_;
  std::shared_ptr<SwitchoverOrchestrator> switchover_;
  ClusterControllerOptions options_;
  security::MessageAuthenticator authenticator_;

  ControllerResult authenticate_peer(const ClusterConfig &config,
                                     const std::string &claimed_secret,
                                     const network::HttpRequest &request);
  Result<AdminRequest> authenticate_admin(const network::HttpRequest &request,
                                          bool require_target,
                                          ControllerResult &failure);
  void record_event(const ClusterConfig &config, const std::string &type,
                    const std::string &description, EventSeverity severity);

public:
  ClusterController(std::shared_ptr<IClusterStateStore> store,
                    std::shared_ptr<IReplicationDriver> replication,
                    std::shared_ptr<PeerNotifier> notifier,
                    std::shared_ptr<FailoverGuard> guard,
                    std::shared_ptr<FailoverOrchestrator> orchestrator,
                    std::shared_ptr<SwitchoverOrchestrator> switchover,
                    const ClusterControllerOptions &options);

  /**
   * @brief Ask roster node @p target_node_id to take over as main
   *
   * Only valid on the main. The target promotes itself asynchronously; this
   * node keeps its role until the target's new_main broadcast arrives.
   */
  ControllerResult manual_failover(uint64_t target_node_id);

  /// Planned handover; see SwitchoverOrchestrator
  ControllerResult switchover(uint64_t target_node_id);

  /**
   * @brief Inbound POST /cluster/promote
   *
   * Launches at most one orchestrator run; a request that arrives while a
   * run is active is acknowledged without starting another.
   */
  ControllerResult handle_promote(const network::HttpRequest &request);

  /// Inbound POST /cluster/notify
  ControllerResult handle_notify(const network::HttpRequest &request);

  /// Return a non-main node to standalone and drop it from the roster
  ControllerResult leave_cluster();

  /// Config (without secret), roster, recent events and the guard state
  std::string status_json() const;

  /// Install every control endpoint on @p server
  void register_routes(network::ControlServer &server);
};

} // namespace cluster
} // namespace hacluster
