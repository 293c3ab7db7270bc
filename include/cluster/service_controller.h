#pragma once

#include "common/process_runner.h"
#include "common/types.h"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace hacluster {
namespace cluster {

using common::Result;

// Restart trigger for the authentication/accounting service that follows the
// main node
class IServiceController {
public:
  virtual ~IServiceController() = default;
  virtual Result<bool> restart_radius() = 0;
};

class ProcessServiceController : public IServiceController {
private:
  std::vector<std::string> restart_command_;
  std::shared_ptr<common::IProcessRunner> runner_;
  std::chrono::milliseconds timeout_;

public:
  ProcessServiceController(std::vector<std::string> restart_command,
                           std::shared_ptr<common::IProcessRunner> runner,
                           std::chrono::milliseconds timeout);

  Result<bool> restart_radius() override;
};

} // namespace cluster
} // namespace hacluster
