#include "ocrflow_core/util/command_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <thread>

#include "ocrflow_core/errors.hpp"

namespace ocrflow_core {

namespace {

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                  deadline - std::chrono::steady_clock::now())
                  .count();
  return left > 0 ? static_cast<int>(left) : 0;
}

}  // namespace

CommandResult PosixCommandRunner::run(const std::vector<std::string> &argv,
                                      std::chrono::milliseconds timeout) {
  if (argv.empty()) {
    throw std::invalid_argument("CommandRunner: argv must not be empty");
  }

  // Built before fork: the child may only make async-signal-safe calls.
  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto &arg : argv) {
    args.push_back(const_cast<char *>(arg.c_str()));
  }
  args.push_back(nullptr);

  int pipe_fds[2];
  // Close-on-exec keeps concurrent children from inheriting this job's write end.
  if (pipe2(pipe_fds, O_CLOEXEC) != 0) {
    throw ToolFailureError("Failed to create pipe for " + argv[0] + ": " + std::strerror(errno));
  }

  pid_t pid = fork();
  if (pid < 0) {
    int err = errno;
    close(pipe_fds[0]);
    close(pipe_fds[1]);
    throw ToolFailureError("Failed to fork for " + argv[0] + ": " + std::strerror(err));
  }

  if (pid == 0) {
    dup2(pipe_fds[1], STDOUT_FILENO);
    dup2(pipe_fds[1], STDERR_FILENO);
    close(pipe_fds[0]);
    close(pipe_fds[1]);
    execvp(args[0], args.data());
    _exit(127);
  }

  close(pipe_fds[1]);

  CommandResult result;
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::array<char, 4096> buffer{};

  bool eof = false;
  while (!eof) {
    int wait_ms = remaining_ms(deadline);
    if (wait_ms == 0) {
      result.timed_out = true;
      break;
    }
    pollfd pfd{pipe_fds[0], POLLIN, 0};
    int ready = poll(&pfd, 1, wait_ms);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (ready == 0) {
      result.timed_out = true;
      break;
    }
    ssize_t n = read(pipe_fds[0], buffer.data(), buffer.size());
    if (n > 0) {
      if (result.output.size() < MAX_CAPTURED_OUTPUT) {
        result.output.append(buffer.data(), static_cast<size_t>(n));
      }
    } else if (n == 0 || errno != EINTR) {
      eof = true;
    }
  }
  close(pipe_fds[0]);

  int status = 0;
  bool reaped = false;
  while (!result.timed_out && !reaped) {
    pid_t r = waitpid(pid, &status, WNOHANG);
    if (r == pid) {
      reaped = true;
    } else if (r < 0 && errno != EINTR) {
      break;
    } else if (remaining_ms(deadline) == 0) {
      result.timed_out = true;
    } else {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  }

  if (result.timed_out) {
    kill(pid, SIGKILL);
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    return result;
  }

  if (!reaped) {
    throw ToolFailureError("Failed to collect exit status of " + argv[0] + ": " +
                           std::strerror(errno));
  }
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = 128 + WTERMSIG(status);
  }
  return result;
}

}  // namespace ocrflow_core
