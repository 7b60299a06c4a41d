#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace ocrflow_core {

struct CommandResult {
  int exit_code = -1;
  bool timed_out = false;
  // Interleaved stdout and stderr, truncated to a bounded size.
  std::string output;

  bool succeeded() const {
    return !timed_out && exit_code == 0;
  }
};

/**
 * @class CommandRunner
 * @brief Runs an external tool as a child process and waits for it.
 *
 * The rasterizer and chunker only talk to poppler/qpdf through this seam so
 * tests can replace the binaries with scripted results.
 */
class CommandRunner {
 public:
  virtual ~CommandRunner() = default;

  /**
   * @brief Runs argv[0] (looked up on PATH) with the given arguments.
   * @param argv Program and arguments. Must not be empty.
   * @param timeout Wall-clock limit; on expiry the child is killed with SIGKILL
   *        and the result has timed_out set.
   * @throws ToolFailureError if the process cannot be spawned.
   */
  virtual CommandResult run(const std::vector<std::string> &argv,
                            std::chrono::milliseconds timeout) = 0;
};

class PosixCommandRunner : public CommandRunner {
 public:
  CommandResult run(const std::vector<std::string> &argv,
                    std::chrono::milliseconds timeout) override;

  static constexpr size_t MAX_CAPTURED_OUTPUT = 64 * 1024;
};

}  // namespace ocrflow_core
