#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "ocrflow_core/types/job.hpp"

namespace ocrflow_core {

struct ProgressState {
  std::string job_id;
  std::size_t total_units = 0;
  std::size_t processed_units = 0;
  JobStatus status = JobStatus::PROCESSING;
  std::chrono::steady_clock::time_point started_at;
  std::chrono::system_clock::time_point last_update;
  std::optional<std::string> error_message;
  // Highest percentage ever published; snapshots never go below it.
  double percentage = 0.0;
  std::optional<double> estimated_time_remaining;
  bool read_after_completion = false;
  std::uint64_t version = 0;
};

// Read-only copy handed to pollers and streams.
struct ProgressSnapshot {
  std::string job_id;
  std::size_t total_units = 0;
  std::size_t processed_units = 0;
  JobStatus status = JobStatus::PROCESSING;
  double percentage = 0.0;
  std::optional<double> estimated_time_remaining;
  std::optional<std::string> error_message;
  std::chrono::system_clock::time_point last_update;
  std::uint64_t version = 0;
};

}  // namespace ocrflow_core
