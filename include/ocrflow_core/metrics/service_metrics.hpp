#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "ocrflow_core/errors.hpp"

namespace ocrflow_core {

class ChunkAnalyzer;
class CircuitBreakerRegistry;
class JobStore;
class ProgressTracker;
namespace async {
class WorkerPool;
}

/**
 * @class ServiceMetrics
 * @brief Process-wide counters plus live gauges, rendered for Prometheus.
 *
 * Counters are bumped by the pipeline. Gauges (queues, workers, breakers,
 * jobs in progress) are read from the attached components at render time.
 */
class ServiceMetrics {
 public:
  ServiceMetrics() = default;

  ServiceMetrics(const ServiceMetrics &) = delete;
  ServiceMetrics &operator=(const ServiceMetrics &) = delete;

  void record_request(const std::string &endpoint);
  void record_failure(const std::string &endpoint, ErrorKind kind);
  void record_pdf_processed(double seconds);
  void record_pdf_failed();
  void record_pages_processed(std::size_t pages);
  void record_page_failed();
  void record_chunk(bool success);
  void record_job_finished(bool success);

  void attach_pool(std::shared_ptr<async::WorkerPool> pool);
  void attach_breakers(std::shared_ptr<CircuitBreakerRegistry> breakers);
  void attach_analyzer(std::shared_ptr<ChunkAnalyzer> analyzer);
  void attach_jobs(std::shared_ptr<JobStore> jobs);
  void attach_progress(std::shared_ptr<ProgressTracker> progress);

  std::string render_prometheus() const;

  std::uint64_t pdfs_processed() const {
    return pdfs_processed_.load();
  }
  std::uint64_t pdfs_failed() const {
    return pdfs_failed_.load();
  }
  std::uint64_t pages_processed() const {
    return pages_processed_.load();
  }
  std::uint64_t jobs_completed() const {
    return jobs_completed_.load();
  }
  std::uint64_t jobs_failed() const {
    return jobs_failed_.load();
  }

 private:
  std::atomic<std::uint64_t> pdfs_processed_{0};
  std::atomic<std::uint64_t> pdfs_failed_{0};
  std::atomic<std::uint64_t> pages_processed_{0};
  std::atomic<std::uint64_t> pages_failed_{0};
  std::atomic<std::uint64_t> chunks_succeeded_{0};
  std::atomic<std::uint64_t> chunks_failed_{0};
  std::atomic<std::uint64_t> jobs_completed_{0};
  std::atomic<std::uint64_t> jobs_failed_{0};
  // Stored in milliseconds so the counter stays lock-free.
  std::atomic<std::uint64_t> pdf_processing_ms_{0};

  mutable std::mutex mutex_;
  std::map<std::string, std::uint64_t> requests_;
  std::map<std::pair<std::string, std::string>, std::uint64_t> failures_;
  std::vector<std::shared_ptr<async::WorkerPool>> pools_;
  std::shared_ptr<CircuitBreakerRegistry> breakers_;
  std::shared_ptr<ChunkAnalyzer> analyzer_;
  std::shared_ptr<JobStore> jobs_;
  std::shared_ptr<ProgressTracker> progress_;
};

}  // namespace ocrflow_core
