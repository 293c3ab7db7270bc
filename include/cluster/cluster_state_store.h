#pragma once

#include "cluster/cluster_types.h"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hacluster {
namespace cluster {

/**
 * @brief Durable records for the local ClusterConfig, the roster and the
 *        event log
 *
 * Implementations are internally locked; every method may be called from the
 * monitor thread, orchestrator runs and HTTP handlers concurrently.
 */
class IClusterStateStore {
public:
  virtual ~IClusterStateStore() = default;

  /// @return error "cluster not configured" when no config exists
  virtual Result<ClusterConfig> load_config() const = 0;
  virtual Result<bool> save_config(const ClusterConfig &config) = 0;
  virtual Result<bool> clear_config() = 0;

  virtual std::vector<ClusterNode>
  list_nodes(const std::string &cluster_id) const = 0;
  virtual std::optional<ClusterNode> find_node(uint64_t id) const = 0;

  /// @return true if at least one row matched @p ip
  virtual Result<bool> update_node_status_by_ip(const std::string &ip,
                                                NodeStatus status) = 0;
  /// @return true if a row with @p hardware_id exists
  virtual Result<bool> update_node_by_hardware_id(const std::string &hardware_id,
                                                  ServerRole role,
                                                  NodeStatus status) = 0;
  /// Insert (id 0 assigns a new id) or replace; returns the row id
  virtual Result<uint64_t> upsert_node(const ClusterNode &node) = 0;
  virtual Result<bool> remove_node(uint64_t id) = 0;

  /// Append to the audit log; returns the assigned event id
  virtual Result<uint64_t> append_event(const ClusterEvent &event) = 0;
  /// Most recent events first, at most @p limit of them
  virtual std::vector<ClusterEvent> list_events(const std::string &cluster_id,
                                                size_t limit) const = 0;
};

/**
 * @brief Process-local store used by tests and embedding hosts
 */
class InMemoryClusterStateStore : public IClusterStateStore {
protected:
  mutable std::mutex mutex_;
  std::optional<ClusterConfig> config_;
  std::map<uint64_t, ClusterNode> nodes_;
  std::vector<ClusterEvent> events_;
  uint64_t next_node_id_ = 1;
  uint64_t next_event_id_ = 1;

public:
  Result<ClusterConfig> load_config() const override;
  Result<bool> save_config(const ClusterConfig &config) override;
  Result<bool> clear_config() override;

  std::vector<ClusterNode>
  list_nodes(const std::string &cluster_id) const override;
  std::optional<ClusterNode> find_node(uint64_t id) const override;

  Result<bool> update_node_status_by_ip(const std::string &ip,
                                        NodeStatus status) override;
  Result<bool> update_node_by_hardware_id(const std::string &hardware_id,
                                          ServerRole role,
                                          NodeStatus status) override;
  Result<uint64_t> upsert_node(const ClusterNode &node) override;
  Result<bool> remove_node(uint64_t id) override;

  Result<uint64_t> append_event(const ClusterEvent &event) override;
  std::vector<ClusterEvent> list_events(const std::string &cluster_id,
                                        size_t limit) const override;
};

/**
 * @brief File-backed store
 *
 * Config and roster live in one JSON document at @p state_path, rewritten
 * through a temporary file and rename() after every mutation. A mutation
 * whose write fails is undone in memory, so memory never runs ahead of disk.
 * Events are appended to @p events_path as one JSON object per line and never
 * rewritten.
 */
class FileClusterStateStore : public InMemoryClusterStateStore {
private:
  std::string state_path_;
  std::string events_path_;
  mutable std::mutex file_mutex_;

  struct Snapshot {
    std::optional<ClusterConfig> config;
    std::map<uint64_t, ClusterNode> nodes;
    uint64_t next_node_id = 1;
  };

  Snapshot snapshot() const;
  void restore(const Snapshot &before);

  // Callers hold file_mutex_; a failed write rolls memory back to @p before
  Result<bool> persist_state(const Snapshot &before);
  Result<bool> write_state_file();
  Result<bool> load_state_file();
  Result<bool> load_events_file();

public:
  FileClusterStateStore(const std::string &state_path,
                        const std::string &events_path);

  /// Read existing files; missing files mean an empty store
  Result<bool> load();

  Result<bool> save_config(const ClusterConfig &config) override;
  Result<bool> clear_config() override;
  Result<bool> update_node_status_by_ip(const std::string &ip,
                                        NodeStatus status) override;
  Result<bool> update_node_by_hardware_id(const std::string &hardware_id,
                                          ServerRole role,
                                          NodeStatus status) override;
  Result<uint64_t> upsert_node(const ClusterNode &node) override;
  Result<bool> remove_node(uint64_t id) override;
  Result<uint64_t> append_event(const ClusterEvent &event) override;
};

/// Event with created_at set to now; id is assigned by the store
ClusterEvent make_event(const ClusterConfig &config, const std::string &type,
                        const std::string &description,
                        EventSeverity severity);

} // namespace cluster
} // namespace hacluster
