#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "ocrflow_core/types/chunk.hpp"

namespace ocrflow_core {

enum class JobStatus { PROCESSING, COMPLETED, ERROR };

std::string to_string(JobStatus status);
JobStatus job_status_from_string(const std::string &status);

inline bool is_terminal(JobStatus status) {
  return status != JobStatus::PROCESSING;
}

struct Job {
  std::string id;
  std::string file_name;
  std::vector<Chunk> chunks;
  std::vector<ChunkResult> results;
  JobStatus status = JobStatus::PROCESSING;
  int completed_chunks = 0;
  int total_chunks = 0;
  std::optional<std::string> error_message;
  // Directory owned by the job; removed at finalization.
  std::filesystem::path workspace;
  bool consumed = false;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point updated_at;

  // Mean chunk confidence; errored chunks count as 0.
  double confidence() const;
};

}  // namespace ocrflow_core
