#include "cluster/failover_guard.h"

namespace hacluster {
namespace cluster {

bool FailoverGuard::try_acquire(const std::string &operation) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (in_progress_) {
    return false;
  }
  in_progress_ = true;
  operation_ = operation;
  return true;
}

void FailoverGuard::release() {
  std::lock_guard<std::mutex> lock(mutex_);
  in_progress_ = false;
  operation_.clear();
}

bool FailoverGuard::in_progress() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_progress_;
}

std::string FailoverGuard::active_operation() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return operation_;
}

void FailoverGuard::record_heartbeat(MonotonicTime now) {
  std::lock_guard<std::mutex> lock(mutex_);
  last_main_heartbeat_ = now;
}

MonotonicTime FailoverGuard::last_heartbeat() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_main_heartbeat_;
}

OutageDecision FailoverGuard::evaluate_outage(MonotonicTime now,
                                              std::chrono::milliseconds threshold,
                                              std::chrono::milliseconds &elapsed) {
  std::lock_guard<std::mutex> lock(mutex_);
  elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      now - last_main_heartbeat_);
  if (in_progress_) {
    return OutageDecision::BUSY;
  }
  if (elapsed < threshold) {
    return OutageDecision::WAITING;
  }
  in_progress_ = true;
  operation_ = "failover";
  return OutageDecision::ACQUIRED;
}

} // namespace cluster
} // namespace hacluster
