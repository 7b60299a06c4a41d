#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ocrflow_core/types/job.hpp"

namespace ocrflow_core {

class ChunkAnalyzer;
class JobStore;
class ServiceMetrics;
namespace async {
class WorkerPool;
}

struct JobStatusView {
  std::string job_id;
  JobStatus status = JobStatus::PROCESSING;
  int completed_chunks = 0;
  int total_chunks = 0;
  double percentage = 0.0;
  std::optional<std::string> error_message;
};

/**
 * @class JobOrchestrator
 * @brief Fans a job's chunks out to the chunk executor and collects results.
 *
 * Each chunk is analyzed independently. A failing chunk is recorded with its
 * error and flips the job to error; the remaining chunks still run so
 * partial results stay available. The chunk that completes the job triggers
 * finalization exactly once: sorted results, terminal status and removal of
 * the job's working files.
 */
class JobOrchestrator {
 public:
  JobOrchestrator(std::shared_ptr<JobStore> store, std::shared_ptr<ChunkAnalyzer> analyzer,
                  std::shared_ptr<async::WorkerPool> executor,
                  std::shared_ptr<ServiceMetrics> metrics);

  /**
   * @brief Registers a processing job for the given chunks.
   * @param workspace Directory owned by the job, removed at finalization.
   * @throws InvalidInputError if chunks is empty.
   */
  std::string create_job(const std::string &file_name, const std::vector<Chunk> &chunks,
                         const std::filesystem::path &workspace = {});

  /**
   * @brief Queues one chunk for analysis and returns immediately.
   * @throws JobNotFoundError for an unknown job.
   * @throws QueueFullError if the chunk executor is saturated.
   */
  void submit_chunk(const std::string &job_id, const Chunk &chunk);

  /**
   * @brief Queues every chunk of a job.
   *
   * If the executor fills up part way, the chunks that could not be queued
   * are recorded as failed so the job still finalizes, then QueueFullError
   * is rethrown.
   */
  void submit_chunks(const std::string &job_id, const std::vector<Chunk> &chunks);

  std::optional<JobStatusView> get_status(const std::string &job_id) const;
  std::optional<Job> get_result(const std::string &job_id) const;
  void mark_consumed(const std::string &job_id);

  // Analyzes one chunk on the calling thread and records the outcome.
  void process_chunk(const std::string &job_id, const Chunk &chunk);

 private:
  void record_outcome(const std::string &job_id, ChunkResult result);
  void record_failure(const std::string &job_id, const Chunk &chunk, const std::string &reason);

  std::shared_ptr<JobStore> store_;
  std::shared_ptr<ChunkAnalyzer> analyzer_;
  std::shared_ptr<async::WorkerPool> executor_;
  std::shared_ptr<ServiceMetrics> metrics_;
};

}  // namespace ocrflow_core
