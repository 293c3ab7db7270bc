#pragma once

#include "common/types.h"
#include <chrono>
#include <mutex>
#include <string>

namespace hacluster {
namespace cluster {

using common::MonotonicTime;

enum class OutageDecision {
  WAITING,  ///< Main is down but the threshold has not elapsed
  ACQUIRED, ///< Threshold elapsed; the caller now owns the guard
  BUSY      ///< A failover or switchover already holds the guard
};

/**
 * @brief Per-node in-progress flag shared by the monitor, the request
 *        handlers and both orchestrators
 *
 * At most one role transition runs at a time on a node. The last time the
 * main answered a health check lives here too, so the outage test and the
 * flag update happen under one lock.
 */
class FailoverGuard {
private:
  mutable std::mutex mutex_;
  bool in_progress_ = false;
  std::string operation_;
  MonotonicTime last_main_heartbeat_{};

public:
  /// @return false if another operation holds the guard
  bool try_acquire(const std::string &operation);
  void release();

  bool in_progress() const;
  std::string active_operation() const;

  void record_heartbeat(MonotonicTime now);
  MonotonicTime last_heartbeat() const;

  /**
   * @brief Outage check and acquisition in one step
   * @param elapsed set to the time since the last successful health check
   */
  OutageDecision evaluate_outage(MonotonicTime now,
                                 std::chrono::milliseconds threshold,
                                 std::chrono::milliseconds &elapsed);
};

// Releases a held guard when the scope ends
class GuardRelease {
private:
  FailoverGuard &guard_;

public:
  explicit GuardRelease(FailoverGuard &guard) : guard_(guard) {}
  ~GuardRelease() { guard_.release(); }
  GuardRelease(const GuardRelease &) = delete;
  GuardRelease &operator=(const GuardRelease &) = delete;
};

} // namespace cluster
} // namespace hacluster
