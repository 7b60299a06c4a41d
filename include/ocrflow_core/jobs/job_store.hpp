#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ocrflow_core/types/job.hpp"

namespace ocrflow_core {

// What the caller must do after recording a chunk outcome.
struct ChunkOutcome {
  // True exactly once per job: for the outcome that completed the last chunk.
  bool finalized = false;
  JobStatus status = JobStatus::PROCESSING;
  // Filled when finalized; files and directory the caller should remove.
  std::vector<Chunk> chunks_to_release;
  std::filesystem::path workspace;
};

/**
 * @class JobStore
 * @brief In-memory registry of upload jobs.
 *
 * All read-modify-write sequences run under one mutex, so completion
 * detection and finalization happen atomically with the counter update.
 */
class JobStore {
 public:
  JobStore() = default;

  JobStore(const JobStore &) = delete;
  JobStore &operator=(const JobStore &) = delete;

  /**
   * @brief Registers a new processing job and returns its id (UUID v4).
   * @throws InvalidInputError if chunks is empty.
   */
  std::string create(const std::string &file_name, std::vector<Chunk> chunks,
                     std::filesystem::path workspace = {});

  std::optional<Job> get(const std::string &job_id) const;
  bool contains(const std::string &job_id) const;

  /**
   * @brief Stores one chunk's result and advances completed_chunks.
   *
   * A result carrying an error flips the job to error immediately and keeps
   * the first error message. When the last chunk lands the results are
   * sorted by start_page and the terminal status is fixed.
   *
   * @throws JobNotFoundError for an unknown job.
   * @throws std::logic_error if every chunk of the job was already recorded.
   */
  ChunkOutcome record_chunk_outcome(const std::string &job_id, ChunkResult result);

  // Flags a terminal job as read so the next eviction sweep drops it.
  void mark_consumed(const std::string &job_id);

  bool erase(const std::string &job_id);

  // Drops terminal jobs that were consumed or last updated more than ttl ago.
  std::vector<Job> evict_expired(std::chrono::minutes ttl);

  size_t size() const;
  size_t count(JobStatus status) const;
  // Jobs with chunks still outstanding, whatever their status.
  size_t in_flight() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, Job> jobs_;
};

}  // namespace ocrflow_core
