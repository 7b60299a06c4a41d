#include "ocrflow_core/jobs/job_orchestrator.hpp"

#include <iostream>
#include <stdexcept>

#include "ocrflow_core/analysis/chunk_analyzer.hpp"
#include "ocrflow_core/async/worker_pool.hpp"
#include "ocrflow_core/errors.hpp"
#include "ocrflow_core/jobs/job_store.hpp"
#include "ocrflow_core/metrics/service_metrics.hpp"
#include "ocrflow_core/util/temp_workspace.hpp"

namespace ocrflow_core {

namespace fs = std::filesystem;

JobOrchestrator::JobOrchestrator(std::shared_ptr<JobStore> store,
                                 std::shared_ptr<ChunkAnalyzer> analyzer,
                                 std::shared_ptr<async::WorkerPool> executor,
                                 std::shared_ptr<ServiceMetrics> metrics)
    : store_(std::move(store)),
      analyzer_(std::move(analyzer)),
      executor_(std::move(executor)),
      metrics_(std::move(metrics)) {
  if (!store_ || !analyzer_ || !executor_ || !metrics_) {
    throw std::invalid_argument("JobOrchestrator requires a store, analyzer, executor and metrics");
  }
}

std::string JobOrchestrator::create_job(const std::string &file_name,
                                        const std::vector<Chunk> &chunks,
                                        const fs::path &workspace) {
  std::string job_id = store_->create(file_name, chunks, workspace);
  std::cout << "[JobOrchestrator] Created job " << job_id << " for " << file_name << " with "
            << chunks.size() << " chunks" << std::endl;
  return job_id;
}

void JobOrchestrator::submit_chunk(const std::string &job_id, const Chunk &chunk) {
  if (!store_->contains(job_id)) {
    throw JobNotFoundError(job_id);
  }
  executor_->try_post([this, job_id, chunk]() { process_chunk(job_id, chunk); });
}

void JobOrchestrator::submit_chunks(const std::string &job_id, const std::vector<Chunk> &chunks) {
  for (size_t i = 0; i < chunks.size(); ++i) {
    try {
      submit_chunk(job_id, chunks[i]);
    } catch (const QueueFullError &e) {
      std::cerr << "[JobOrchestrator] Job " << job_id << ": " << e.what() << "; failing "
                << (chunks.size() - i) << " undispatched chunks" << std::endl;
      for (size_t j = i; j < chunks.size(); ++j) {
        record_failure(job_id, chunks[j], std::string("not dispatched: ") + e.what());
      }
      throw;
    }
  }
}

void JobOrchestrator::process_chunk(const std::string &job_id, const Chunk &chunk) {
  ChunkContext context;
  context.job_id = job_id;
  context.chunk_id = chunk.id;
  context.start_page = chunk.start_page;
  context.end_page = chunk.end_page;
  if (auto job = store_->get(job_id)) {
    context.file_name = job->file_name;
  }

  ChunkResult result;
  result.chunk_id = chunk.id;
  result.start_page = chunk.start_page;
  result.end_page = chunk.end_page;

  try {
    ChunkAnalysis analysis = analyzer_->analyze_chunk(chunk.file_path, context);
    if (!analyzer_->validate_result(analysis)) {
      throw ToolFailureError("Invalid result from " + analyzer_->name() + " (confidence " +
                             std::to_string(analysis.confidence) + ")");
    }
    result.content = std::move(analysis.content);
    result.confidence = analysis.confidence;
  } catch (const std::exception &e) {
    std::cerr << "[JobOrchestrator] Chunk " << chunk.id << " of job " << job_id
              << " failed: " << e.what() << std::endl;
    result.content.clear();
    result.confidence = 0.0;
    result.error = e.what();
  }
  record_outcome(job_id, std::move(result));
}

void JobOrchestrator::record_failure(const std::string &job_id, const Chunk &chunk,
                                     const std::string &reason) {
  ChunkResult result;
  result.chunk_id = chunk.id;
  result.start_page = chunk.start_page;
  result.end_page = chunk.end_page;
  result.error = reason;
  record_outcome(job_id, std::move(result));
}

void JobOrchestrator::record_outcome(const std::string &job_id, ChunkResult result) {
  const bool success = !result.error.has_value();
  ChunkOutcome outcome;
  try {
    outcome = store_->record_chunk_outcome(job_id, std::move(result));
  } catch (const JobNotFoundError &e) {
    // Evicted while the chunk was running; nothing left to update.
    std::cerr << "[JobOrchestrator] " << e.what() << std::endl;
    return;
  }
  metrics_->record_chunk(success);

  if (!outcome.finalized) {
    return;
  }

  for (const auto &chunk : outcome.chunks_to_release) {
    std::error_code ec;
    fs::remove(chunk.file_path, ec);
    if (ec) {
      std::cerr << "[JobOrchestrator] Failed to remove chunk file " << chunk.file_path << ": "
                << ec.message() << std::endl;
    }
  }
  TempWorkspace::remove_quietly(outcome.workspace);

  metrics_->record_job_finished(outcome.status == JobStatus::COMPLETED);
  std::cout << "[JobOrchestrator] Job " << job_id << " finalized as " << to_string(outcome.status)
            << std::endl;
}

std::optional<JobStatusView> JobOrchestrator::get_status(const std::string &job_id) const {
  std::optional<Job> job = store_->get(job_id);
  if (!job) {
    return std::nullopt;
  }
  JobStatusView view;
  view.job_id = job->id;
  view.status = job->status;
  view.completed_chunks = job->completed_chunks;
  view.total_chunks = job->total_chunks;
  view.percentage = job->total_chunks == 0 ? 0.0
                                           : static_cast<double>(job->completed_chunks) * 100.0 /
                                                 static_cast<double>(job->total_chunks);
  view.error_message = job->error_message;
  return view;
}

std::optional<Job> JobOrchestrator::get_result(const std::string &job_id) const {
  return store_->get(job_id);
}

void JobOrchestrator::mark_consumed(const std::string &job_id) {
  store_->mark_consumed(job_id);
}

}  // namespace ocrflow_core
