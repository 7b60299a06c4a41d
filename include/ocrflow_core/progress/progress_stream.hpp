#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "ocrflow_core/types/progress.hpp"

namespace ocrflow_core {

class ProgressTracker;

struct ProgressEvent {
  ProgressSnapshot snapshot;
  int percent = 0;  // rounded percentage, the value events are coalesced on
  bool terminal = false;
};

/**
 * @class ProgressStream
 * @brief Turns a job's progress record into a coalesced event sequence.
 *
 * next() emits an event only when the whole-number percentage changes or the
 * job ends. The terminal event is emitted exactly once, after which next()
 * returns std::nullopt. Reading the completion event purges the record.
 */
class ProgressStream {
 public:
  ProgressStream(std::shared_ptr<ProgressTracker> tracker, std::string job_id,
                 std::chrono::milliseconds wait_slice = std::chrono::milliseconds(500),
                 std::chrono::milliseconds idle_timeout = std::chrono::minutes(10));

  // Blocks until the next event. std::nullopt once finished, vanished or idle too long.
  std::optional<ProgressEvent> next();

  bool finished() const {
    return finished_;
  }

 private:
  std::shared_ptr<ProgressTracker> tracker_;
  std::string job_id_;
  std::chrono::milliseconds wait_slice_;
  std::chrono::milliseconds idle_timeout_;
  int last_percent_ = -1;
  bool finished_ = false;
};

}  // namespace ocrflow_core
