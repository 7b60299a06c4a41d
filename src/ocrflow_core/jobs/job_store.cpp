#include "ocrflow_core/jobs/job_store.hpp"

#include <algorithm>
#include <stdexcept>

#include "ocrflow_core/errors.hpp"
#include "ocrflow_core/util/identifiers.hpp"

namespace ocrflow_core {

std::string JobStore::create(const std::string &file_name, std::vector<Chunk> chunks,
                             std::filesystem::path workspace) {
  if (chunks.empty()) {
    throw InvalidInputError("A job needs at least one chunk");
  }

  Job job;
  job.id = generate_uuid();
  job.file_name = file_name;
  job.total_chunks = static_cast<int>(chunks.size());
  job.chunks = std::move(chunks);
  job.workspace = std::move(workspace);
  job.created_at = std::chrono::system_clock::now();
  job.updated_at = job.created_at;

  std::lock_guard<std::mutex> lock(mutex_);
  std::string id = job.id;
  jobs_.emplace(id, std::move(job));
  return id;
}

std::optional<Job> JobStore::get(const std::string &job_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(job_id);
  if (it == jobs_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool JobStore::contains(const std::string &job_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.count(job_id) > 0;
}

ChunkOutcome JobStore::record_chunk_outcome(const std::string &job_id, ChunkResult result) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(job_id);
  if (it == jobs_.end()) {
    throw JobNotFoundError(job_id);
  }
  Job &job = it->second;
  if (job.completed_chunks >= job.total_chunks) {
    throw std::logic_error("All chunks of job " + job_id + " were already recorded");
  }

  if (result.error) {
    job.status = JobStatus::ERROR;
    if (!job.error_message) {
      job.error_message = "Chunk " + result.chunk_id + " (pages " +
                          std::to_string(result.start_page) + "-" +
                          std::to_string(result.end_page) + ") failed: " + *result.error;
    }
  }
  job.results.push_back(std::move(result));
  job.completed_chunks++;
  job.updated_at = std::chrono::system_clock::now();

  ChunkOutcome outcome;
  outcome.status = job.status;
  if (job.completed_chunks == job.total_chunks) {
    std::stable_sort(job.results.begin(), job.results.end(),
                     [](const ChunkResult &a, const ChunkResult &b) {
                       return a.start_page < b.start_page;
                     });
    job.status = job.error_message ? JobStatus::ERROR : JobStatus::COMPLETED;
    outcome.finalized = true;
    outcome.status = job.status;
    outcome.chunks_to_release = job.chunks;
    outcome.workspace = job.workspace;
  }
  return outcome;
}

void JobStore::mark_consumed(const std::string &job_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(job_id);
  if (it != jobs_.end() && is_terminal(it->second.status)) {
    it->second.consumed = true;
  }
}

bool JobStore::erase(const std::string &job_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.erase(job_id) > 0;
}

std::vector<Job> JobStore::evict_expired(std::chrono::minutes ttl) {
  const auto cutoff = std::chrono::system_clock::now() - ttl;
  std::vector<Job> evicted;

  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = jobs_.begin(); it != jobs_.end();) {
    const Job &job = it->second;
    // Jobs still in flight are never evicted.
    bool finished = is_terminal(job.status) && job.completed_chunks == job.total_chunks;
    if (finished && (job.consumed || job.updated_at < cutoff)) {
      evicted.push_back(std::move(it->second));
      it = jobs_.erase(it);
    } else {
      ++it;
    }
  }
  return evicted;
}

size_t JobStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.size();
}

size_t JobStore::count(JobStatus status) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<size_t>(std::count_if(jobs_.begin(), jobs_.end(), [status](const auto &entry) {
    return entry.second.status == status;
  }));
}

size_t JobStore::in_flight() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<size_t>(std::count_if(jobs_.begin(), jobs_.end(), [](const auto &entry) {
    return entry.second.completed_chunks < entry.second.total_chunks;
  }));
}

}  // namespace ocrflow_core
