#include "cluster/service_controller.h"
#include "common/logging.h"

namespace hacluster {
namespace cluster {

ProcessServiceController::ProcessServiceController(
    std::vector<std::string> restart_command,
    std::shared_ptr<common::IProcessRunner> runner,
    std::chrono::milliseconds timeout)
    : restart_command_(std::move(restart_command)), runner_(std::move(runner)),
      timeout_(timeout) {}

Result<bool> ProcessServiceController::restart_radius() {
  if (restart_command_.empty()) {
    return Result<bool>("no restart command configured");
  }

  LOG_INFO("service", "restarting RADIUS: ",
           common::describe_command(restart_command_));
  auto result = runner_->run(restart_command_, timeout_);
  if (!result.is_ok()) {
    return Result<bool>(result.error());
  }
  if (result.value().exit_code != 0) {
    return Result<bool>("restart command exited with status " +
                        std::to_string(result.value().exit_code));
  }
  return Result<bool>(true);
}

} // namespace cluster
} // namespace hacluster
