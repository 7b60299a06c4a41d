#include "ocrflow_core/types/job.hpp"

#include <stdexcept>

namespace ocrflow_core {

std::string to_string(JobStatus status) {
  switch (status) {
    case JobStatus::PROCESSING: return "processing";
    case JobStatus::COMPLETED: return "completed";
    case JobStatus::ERROR: return "error";
  }
  return "unknown";
}

JobStatus job_status_from_string(const std::string &status) {
  if (status == "processing") return JobStatus::PROCESSING;
  if (status == "completed") return JobStatus::COMPLETED;
  if (status == "error") return JobStatus::ERROR;
  throw std::invalid_argument("Unknown job status: " + status);
}

double Job::confidence() const {
  if (results.empty()) {
    return 0.0;
  }
  double total = 0.0;
  for (const auto &result : results) {
    total += result.error ? 0.0 : result.confidence;
  }
  return total / static_cast<double>(results.size());
}

}  // namespace ocrflow_core
