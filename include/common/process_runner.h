#pragma once

#include "common/types.h"
#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace hacluster {
namespace common {

struct ProcessResult {
  int exit_code = -1;
  std::string output; ///< stdout and stderr interleaved
};

// Interface for launching external tools (psql, pg_ctl, redis-cli, docker)
class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;

  /**
   * @brief Run argv[0] with the given arguments and wait for it
   *
   * @param argv program followed by its arguments; no shell is involved
   * @param timeout the child is killed with SIGKILL once this elapses
   * @param extra_env variables added to the child's environment
   * @return error if the program could not be started or timed out; a
   *         non-zero exit code is a successful run the caller must inspect
   */
  virtual Result<ProcessResult>
  run(const std::vector<std::string> &argv, std::chrono::milliseconds timeout,
      const std::map<std::string, std::string> &extra_env = {}) = 0;
};

// fork/execvp implementation with captured output
class ProcessRunner : public IProcessRunner {
public:
  Result<ProcessResult>
  run(const std::vector<std::string> &argv, std::chrono::milliseconds timeout,
      const std::map<std::string, std::string> &extra_env = {}) override;
};

/// Render argv for logs, masking values that follow a password flag
std::string describe_command(const std::vector<std::string> &argv);

} // namespace common
} // namespace hacluster
