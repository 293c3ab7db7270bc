#include "common/process_runner.h"
#include "common/logging.h"
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sstream>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace hacluster {
namespace common {

namespace {

constexpr size_t MAX_CAPTURED_OUTPUT = 64 * 1024;

int decode_wait_status(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

} // namespace

Result<ProcessResult>
ProcessRunner::run(const std::vector<std::string> &argv,
                   std::chrono::milliseconds timeout,
                   const std::map<std::string, std::string> &extra_env) {
  if (argv.empty()) {
    return Result<ProcessResult>("empty command");
  }

  int pipe_fds[2];
  if (pipe(pipe_fds) != 0) {
    return Result<ProcessResult>(std::string("pipe failed: ") +
                                 strerror(errno));
  }

  // Build the exec arguments before forking; the child must not allocate
  std::vector<char *> exec_args;
  exec_args.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    exec_args.push_back(const_cast<char *>(arg.c_str()));
  }
  exec_args.push_back(nullptr);

  pid_t pid = fork();
  if (pid < 0) {
    int saved_errno = errno;
    close(pipe_fds[0]);
    close(pipe_fds[1]);
    return Result<ProcessResult>(std::string("fork failed: ") +
                                 strerror(saved_errno));
  }

  if (pid == 0) {
    close(pipe_fds[0]);
    dup2(pipe_fds[1], STDOUT_FILENO);
    dup2(pipe_fds[1], STDERR_FILENO);
    close(pipe_fds[1]);
    for (const auto &[key, value] : extra_env) {
      setenv(key.c_str(), value.c_str(), 1);
    }
    execvp(exec_args[0], exec_args.data());
    _exit(127);
  }

  close(pipe_fds[1]);
  int read_fd = pipe_fds[0];
  fcntl(read_fd, F_SETFL, fcntl(read_fd, F_GETFL) | O_NONBLOCK);

  ProcessResult result;
  auto deadline = std::chrono::steady_clock::now() + timeout;
  bool timed_out = false;
  char buffer[4096];

  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      timed_out = true;
      break;
    }

    pollfd pfd{};
    pfd.fd = read_fd;
    pfd.events = POLLIN;
    int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    if (ready == 0) {
      timed_out = true;
      break;
    }

    ssize_t n = read(read_fd, buffer, sizeof(buffer));
    if (n > 0) {
      if (result.output.size() < MAX_CAPTURED_OUTPUT) {
        result.output.append(buffer, static_cast<size_t>(n));
      }
      continue;
    }
    if (n == 0) {
      break; // EOF: child closed its end
    }
    if (errno != EAGAIN && errno != EINTR) {
      break;
    }
  }
  close(read_fd);

  int status = 0;
  if (timed_out) {
    kill(pid, SIGKILL);
    waitpid(pid, &status, 0);
    LOG_WARN("process", "command timed out after ", timeout.count(),
             "ms: ", describe_command(argv));
    return Result<ProcessResult>("command timed out after " +
                                 std::to_string(timeout.count()) + "ms");
  }

  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      return Result<ProcessResult>(std::string("waitpid failed: ") +
                                   strerror(errno));
    }
  }

  result.exit_code = decode_wait_status(status);
  if (result.exit_code == 127) {
    return Result<ProcessResult>("command not found: " + argv[0]);
  }

  LOG_DEBUG("process", describe_command(argv), " exited with ",
            result.exit_code);
  return Result<ProcessResult>(result);
}

std::string describe_command(const std::vector<std::string> &argv) {
  std::ostringstream oss;
  bool mask_next = false;
  for (size_t i = 0; i < argv.size(); ++i) {
    if (i > 0)
      oss << " ";
    if (mask_next) {
      oss << "****";
      mask_next = false;
      continue;
    }
    oss << argv[i];
    if (argv[i] == "-a" || argv[i] == "--pass" || argv[i] == "--password") {
      mask_next = true;
    }
  }
  return oss.str();
}

} // namespace common
} // namespace hacluster
