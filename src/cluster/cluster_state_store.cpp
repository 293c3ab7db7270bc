#include "cluster/cluster_state_store.h"
#include "common/logging.h"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>

namespace hacluster {
namespace cluster {

using json = nlohmann::json;

// ---------------------------------------------------------------------------
// InMemoryClusterStateStore
// ---------------------------------------------------------------------------

Result<ClusterConfig> InMemoryClusterStateStore::load_config() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!config_) {
    return Result<ClusterConfig>("cluster not configured");
  }
  return Result<ClusterConfig>(*config_);
}

Result<bool> InMemoryClusterStateStore::save_config(const ClusterConfig &config) {
  std::lock_guard<std::mutex> lock(mutex_);
  config_ = config;
  return Result<bool>(true);
}

Result<bool> InMemoryClusterStateStore::clear_config() {
  std::lock_guard<std::mutex> lock(mutex_);
  config_.reset();
  return Result<bool>(true);
}

std::vector<ClusterNode>
InMemoryClusterStateStore::list_nodes(const std::string &cluster_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ClusterNode> result;
  for (const auto &[id, node] : nodes_) {
    if (node.cluster_id == cluster_id) {
      result.push_back(node);
    }
  }
  return result;
}

std::optional<ClusterNode> InMemoryClusterStateStore::find_node(uint64_t id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = nodes_.find(id);
  if (it == nodes_.end()) {
    return std::nullopt;
  }
  return it->second;
}

Result<bool>
InMemoryClusterStateStore::update_node_status_by_ip(const std::string &ip,
                                                    NodeStatus status) {
  std::lock_guard<std::mutex> lock(mutex_);
  bool matched = false;
  for (auto &[id, node] : nodes_) {
    if (node.server_ip == ip) {
      node.status = status;
      matched = true;
    }
  }
  return Result<bool>(matched);
}

Result<bool> InMemoryClusterStateStore::update_node_by_hardware_id(
    const std::string &hardware_id, ServerRole role, NodeStatus status) {
  std::lock_guard<std::mutex> lock(mutex_);
  bool matched = false;
  for (auto &[id, node] : nodes_) {
    if (node.hardware_id == hardware_id) {
      node.server_role = role;
      node.status = status;
      matched = true;
    }
  }
  return Result<bool>(matched);
}

Result<uint64_t> InMemoryClusterStateStore::upsert_node(const ClusterNode &node) {
  std::lock_guard<std::mutex> lock(mutex_);
  ClusterNode stored = node;
  if (stored.id == 0) {
    stored.id = next_node_id_++;
  } else if (stored.id >= next_node_id_) {
    next_node_id_ = stored.id + 1;
  }
  nodes_[stored.id] = stored;
  return Result<uint64_t>(stored.id);
}

Result<bool> InMemoryClusterStateStore::remove_node(uint64_t id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (nodes_.erase(id) == 0) {
    return Result<bool>("node " + std::to_string(id) + " not found");
  }
  return Result<bool>(true);
}

Result<uint64_t> InMemoryClusterStateStore::append_event(const ClusterEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  ClusterEvent stored = event;
  stored.id = next_event_id_++;
  if (stored.created_at.time_since_epoch().count() == 0) {
    stored.created_at = std::chrono::system_clock::now();
  }
  events_.push_back(stored);
  return Result<uint64_t>(stored.id);
}

std::vector<ClusterEvent>
InMemoryClusterStateStore::list_events(const std::string &cluster_id,
                                       size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ClusterEvent> result;
  for (auto it = events_.rbegin(); it != events_.rend() && result.size() < limit;
       ++it) {
    if (cluster_id.empty() || it->cluster_id == cluster_id) {
      result.push_back(*it);
    }
  }
  return result;
}

// ---------------------------------------------------------------------------
// FileClusterStateStore
// ---------------------------------------------------------------------------

FileClusterStateStore::FileClusterStateStore(const std::string &state_path,
                                             const std::string &events_path)
    : state_path_(state_path), events_path_(events_path) {}

Result<bool> FileClusterStateStore::load() {
  auto state = load_state_file();
  if (!state.is_ok()) {
    return state;
  }
  return load_events_file();
}

Result<bool> FileClusterStateStore::load_state_file() {
  std::ifstream file(state_path_);
  if (!file.is_open()) {
    LOG_INFO("store", "no state file at ", state_path_, ", starting empty");
    return Result<bool>(true);
  }

  std::optional<ClusterConfig> config;
  std::map<uint64_t, ClusterNode> nodes;
  uint64_t stored_next = 0;
  try {
    json document = json::parse(file);
    if (!document.is_object()) {
      return Result<bool>("state file " + state_path_ + " is not a JSON object");
    }

    if (document.contains("config") && !document["config"].is_null()) {
      auto parsed = config_from_value(document["config"]);
      if (!parsed.is_ok()) {
        return Result<bool>(state_path_ + ": " + parsed.error());
      }
      config = parsed.value();
    }

    if (document.contains("nodes")) {
      if (!document["nodes"].is_array()) {
        return Result<bool>(state_path_ + ": nodes is not an array");
      }
      for (const auto &element : document["nodes"]) {
        auto node = node_from_value(element);
        if (!node.is_ok()) {
          return Result<bool>(state_path_ + ": " + node.error());
        }
        nodes[node.value().id] = node.value();
      }
    }
    stored_next = document.value("next_node_id", uint64_t{0});
  } catch (const json::exception &e) {
    return Result<bool>("state file " + state_path_ + " is not valid JSON: " +
                        std::string(e.what()));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  config_ = config;
  nodes_ = nodes;
  next_node_id_ = 1;
  for (const auto &[id, node] : nodes_) {
    next_node_id_ = std::max(next_node_id_, id + 1);
  }
  next_node_id_ = std::max(next_node_id_, stored_next);
  return Result<bool>(true);
}

Result<bool> FileClusterStateStore::load_events_file() {
  std::ifstream file(events_path_);
  if (!file.is_open()) {
    return Result<bool>(true);
  }

  std::vector<ClusterEvent> events;
  uint64_t max_id = 0;
  std::string line;
  size_t line_number = 0;
  while (std::getline(file, line)) {
    line_number++;
    if (line.empty())
      continue;
    auto event = event_from_json(line);
    if (!event.is_ok()) {
      LOG_WARN("store", "skipping malformed event at ", events_path_, ":",
               line_number, ": ", event.error());
      continue;
    }
    max_id = std::max(max_id, event.value().id);
    events.push_back(event.value());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  events_ = events;
  next_event_id_ = max_id + 1;
  return Result<bool>(true);
}

FileClusterStateStore::Snapshot FileClusterStateStore::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return Snapshot{config_, nodes_, next_node_id_};
}

void FileClusterStateStore::restore(const Snapshot &before) {
  std::lock_guard<std::mutex> lock(mutex_);
  config_ = before.config;
  nodes_ = before.nodes;
  next_node_id_ = before.next_node_id;
}

Result<bool> FileClusterStateStore::persist_state(const Snapshot &before) {
  auto written = write_state_file();
  if (!written.is_ok()) {
    restore(before);
    LOG_ERROR("store", "state change not persisted, reverted: ",
              written.error());
  }
  return written;
}

Result<bool> FileClusterStateStore::write_state_file() {
  std::string document;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    json nodes = json::array();
    for (const auto &[id, node] : nodes_) {
      nodes.push_back(to_json_value(node));
    }
    json state;
    state["config"] =
        config_ ? to_json_value(*config_, true) : json(nullptr);
    state["nodes"] = nodes;
    state["next_node_id"] = next_node_id_;
    document = state.dump(2);
  }

  std::string tmp_path = state_path_ + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out.is_open()) {
      return Result<bool>("cannot write " + tmp_path + ": " + strerror(errno));
    }
    out << document << "\n";
    out.flush();
    if (!out.good()) {
      return Result<bool>("short write to " + tmp_path);
    }
  }

  if (std::rename(tmp_path.c_str(), state_path_.c_str()) != 0) {
    return Result<bool>("cannot replace " + state_path_ + ": " +
                        strerror(errno));
  }
  return Result<bool>(true);
}

Result<bool> FileClusterStateStore::save_config(const ClusterConfig &config) {
  std::lock_guard<std::mutex> file_lock(file_mutex_);
  Snapshot before = snapshot();
  auto saved = InMemoryClusterStateStore::save_config(config);
  if (!saved.is_ok()) {
    return saved;
  }
  return persist_state(before);
}

Result<bool> FileClusterStateStore::clear_config() {
  std::lock_guard<std::mutex> file_lock(file_mutex_);
  Snapshot before = snapshot();
  auto cleared = InMemoryClusterStateStore::clear_config();
  if (!cleared.is_ok()) {
    return cleared;
  }
  return persist_state(before);
}

Result<bool> FileClusterStateStore::update_node_status_by_ip(const std::string &ip,
                                                             NodeStatus status) {
  std::lock_guard<std::mutex> file_lock(file_mutex_);
  Snapshot before = snapshot();
  auto updated = InMemoryClusterStateStore::update_node_status_by_ip(ip, status);
  if (!updated.is_ok() || !updated.value()) {
    return updated;
  }
  auto persisted = persist_state(before);
  return persisted.is_ok() ? updated : persisted;
}

Result<bool> FileClusterStateStore::update_node_by_hardware_id(
    const std::string &hardware_id, ServerRole role, NodeStatus status) {
  std::lock_guard<std::mutex> file_lock(file_mutex_);
  Snapshot before = snapshot();
  auto updated = InMemoryClusterStateStore::update_node_by_hardware_id(
      hardware_id, role, status);
  if (!updated.is_ok() || !updated.value()) {
    return updated;
  }
  auto persisted = persist_state(before);
  return persisted.is_ok() ? updated : persisted;
}

Result<uint64_t> FileClusterStateStore::upsert_node(const ClusterNode &node) {
  std::lock_guard<std::mutex> file_lock(file_mutex_);
  Snapshot before = snapshot();
  auto id = InMemoryClusterStateStore::upsert_node(node);
  if (!id.is_ok()) {
    return id;
  }
  auto persisted = persist_state(before);
  if (!persisted.is_ok()) {
    return Result<uint64_t>(persisted.error());
  }
  return id;
}

Result<bool> FileClusterStateStore::remove_node(uint64_t id) {
  std::lock_guard<std::mutex> file_lock(file_mutex_);
  Snapshot before = snapshot();
  auto removed = InMemoryClusterStateStore::remove_node(id);
  if (!removed.is_ok()) {
    return removed;
  }
  return persist_state(before);
}

Result<uint64_t> FileClusterStateStore::append_event(const ClusterEvent &event) {
  std::lock_guard<std::mutex> file_lock(file_mutex_);

  ClusterEvent stored = event;
  if (stored.created_at.time_since_epoch().count() == 0) {
    stored.created_at = std::chrono::system_clock::now();
  }
  {
    // Appends are serialized by file_mutex_, so this id is the one assigned
    std::lock_guard<std::mutex> lock(mutex_);
    stored.id = next_event_id_;
  }

  std::ofstream out(events_path_, std::ios::app);
  if (!out.is_open()) {
    return Result<uint64_t>("cannot append to " + events_path_ + ": " +
                            strerror(errno));
  }
  out << to_json(stored) << "\n";
  out.flush();
  if (!out.good()) {
    return Result<uint64_t>("short write to " + events_path_);
  }
  return InMemoryClusterStateStore::append_event(stored);
}

ClusterEvent make_event(const ClusterConfig &config, const std::string &type,
                        const std::string &description,
                        EventSeverity severity) {
  ClusterEvent event;
  event.cluster_id = config.cluster_id;
  event.event_type = type;
  event.node_ip = config.server_ip;
  event.node_role = to_string(config.server_role);
  event.description = description;
  event.severity = severity;
  event.created_at = std::chrono::system_clock::now();
  return event;
}

} // namespace cluster
} // namespace hacluster
