#include "ocrflow_core/metrics/service_metrics.hpp"

#include <sstream>

#include "ocrflow_core/analysis/chunk_analyzer.hpp"
#include "ocrflow_core/async/worker_pool.hpp"
#include "ocrflow_core/jobs/job_store.hpp"
#include "ocrflow_core/progress/progress_tracker.hpp"
#include "ocrflow_core/resilience/circuit_breaker_registry.hpp"

namespace ocrflow_core {

namespace {

void write_header(std::ostringstream &out, const std::string &name, const std::string &type,
                  const std::string &help) {
  out << "# HELP " << name << " " << help << "\n";
  out << "# TYPE " << name << " " << type << "\n";
}

}  // namespace

void ServiceMetrics::record_request(const std::string &endpoint) {
  std::lock_guard<std::mutex> lock(mutex_);
  requests_[endpoint]++;
}

void ServiceMetrics::record_failure(const std::string &endpoint, ErrorKind kind) {
  std::lock_guard<std::mutex> lock(mutex_);
  failures_[{endpoint, to_string(kind)}]++;
}

void ServiceMetrics::record_pdf_processed(double seconds) {
  pdfs_processed_++;
  pdf_processing_ms_ += static_cast<std::uint64_t>(seconds * 1000.0);
}

void ServiceMetrics::record_pdf_failed() {
  pdfs_failed_++;
}

void ServiceMetrics::record_pages_processed(std::size_t pages) {
  pages_processed_ += pages;
}

void ServiceMetrics::record_page_failed() {
  pages_failed_++;
}

void ServiceMetrics::record_chunk(bool success) {
  if (success) {
    chunks_succeeded_++;
  } else {
    chunks_failed_++;
  }
}

void ServiceMetrics::record_job_finished(bool success) {
  if (success) {
    jobs_completed_++;
  } else {
    jobs_failed_++;
  }
}

void ServiceMetrics::attach_pool(std::shared_ptr<async::WorkerPool> pool) {
  std::lock_guard<std::mutex> lock(mutex_);
  pools_.push_back(std::move(pool));
}

void ServiceMetrics::attach_breakers(std::shared_ptr<CircuitBreakerRegistry> breakers) {
  std::lock_guard<std::mutex> lock(mutex_);
  breakers_ = std::move(breakers);
}

void ServiceMetrics::attach_analyzer(std::shared_ptr<ChunkAnalyzer> analyzer) {
  std::lock_guard<std::mutex> lock(mutex_);
  analyzer_ = std::move(analyzer);
}

void ServiceMetrics::attach_jobs(std::shared_ptr<JobStore> jobs) {
  std::lock_guard<std::mutex> lock(mutex_);
  jobs_ = std::move(jobs);
}

void ServiceMetrics::attach_progress(std::shared_ptr<ProgressTracker> progress) {
  std::lock_guard<std::mutex> lock(mutex_);
  progress_ = std::move(progress);
}

std::string ServiceMetrics::render_prometheus() const {
  std::ostringstream out;
  std::lock_guard<std::mutex> lock(mutex_);

  write_header(out, "ocr_pdfs_processed_total", "counter", "Total number of PDFs processed");
  out << "ocr_pdfs_processed_total " << pdfs_processed_.load() << "\n";
  write_header(out, "ocr_pdfs_failed_total", "counter",
               "Total number of PDFs that failed processing");
  out << "ocr_pdfs_failed_total " << pdfs_failed_.load() << "\n";
  write_header(out, "ocr_pdf_processing_seconds_total", "counter",
               "Cumulative time spent processing PDFs");
  out << "ocr_pdf_processing_seconds_total " << (pdf_processing_ms_.load() / 1000.0) << "\n";
  write_header(out, "ocr_pages_processed_total", "counter", "Total number of pages processed");
  out << "ocr_pages_processed_total " << pages_processed_.load() << "\n";
  write_header(out, "ocr_pages_failed_total", "counter", "Pages whose OCR failed");
  out << "ocr_pages_failed_total " << pages_failed_.load() << "\n";

  write_header(out, "ocr_chunks_total", "counter", "Chunks analyzed, by outcome");
  out << "ocr_chunks_total{outcome=\"success\"} " << chunks_succeeded_.load() << "\n";
  out << "ocr_chunks_total{outcome=\"error\"} " << chunks_failed_.load() << "\n";
  write_header(out, "ocr_jobs_finished_total", "counter", "Upload jobs finalized, by status");
  out << "ocr_jobs_finished_total{status=\"completed\"} " << jobs_completed_.load() << "\n";
  out << "ocr_jobs_finished_total{status=\"error\"} " << jobs_failed_.load() << "\n";

  write_header(out, "ocr_jobs_in_progress", "gauge", "Number of jobs currently being processed");
  size_t in_progress = jobs_ ? jobs_->in_flight() : 0;
  if (progress_) {
    in_progress += progress_->active_count();
  }
  out << "ocr_jobs_in_progress " << in_progress << "\n";

  write_header(out, "ocr_http_requests_total", "counter", "HTTP requests by endpoint");
  for (const auto &[endpoint, count] : requests_) {
    out << "ocr_http_requests_total{endpoint=\"" << endpoint << "\"} " << count << "\n";
  }
  write_header(out, "ocr_http_failures_total", "counter", "Failed HTTP requests by error kind");
  for (const auto &[key, count] : failures_) {
    out << "ocr_http_failures_total{endpoint=\"" << key.first << "\",kind=\"" << key.second
        << "\"} " << count << "\n";
  }

  write_header(out, "ocr_queue_size", "gauge", "Number of items in the processing queue");
  for (const auto &pool : pools_) {
    out << "ocr_queue_size{pool=\"" << pool->name() << "\"} " << pool->queue_size() << "\n";
  }
  write_header(out, "ocr_active_workers", "gauge", "Number of currently busy workers");
  for (const auto &pool : pools_) {
    out << "ocr_active_workers{pool=\"" << pool->name() << "\"} " << pool->active_workers()
        << "\n";
  }
  write_header(out, "ocr_parallel_workers", "gauge", "Number of worker threads");
  for (const auto &pool : pools_) {
    out << "ocr_parallel_workers{pool=\"" << pool->name() << "\"} " << pool->worker_count()
        << "\n";
  }

  if (breakers_) {
    auto breakers = breakers_->all();
    write_header(out, "ocr_circuit_breaker_state", "gauge",
                 "Current state of each circuit breaker (1 for the active state)");
    for (const auto &breaker : breakers) {
      BreakerState current = breaker->state();
      for (BreakerState state :
           {BreakerState::CLOSED, BreakerState::OPEN, BreakerState::HALF_OPEN}) {
        out << "ocr_circuit_breaker_state{breaker=\"" << breaker->name() << "\",state=\""
            << to_string(state) << "\"} " << (state == current ? 1 : 0) << "\n";
      }
    }
    write_header(out, "ocr_circuit_breaker_trips_total", "counter",
                 "Total number of times each circuit breaker has tripped");
    for (const auto &breaker : breakers) {
      out << "ocr_circuit_breaker_trips_total{breaker=\"" << breaker->name() << "\"} "
          << breaker->trip_count() << "\n";
    }
  }

  if (analyzer_) {
    AnalyzerMetrics am = analyzer_->metrics();
    write_header(out, "ocr_analyzer_requests_total", "counter", "Chunk analyzer calls");
    out << "ocr_analyzer_requests_total{analyzer=\"" << am.analyzer << "\"} " << am.total_requests
        << "\n";
    write_header(out, "ocr_analyzer_success_rate", "gauge", "Share of successful analyzer calls");
    out << "ocr_analyzer_success_rate{analyzer=\"" << am.analyzer << "\"} " << am.success_rate()
        << "\n";
  }
  return out.str();
}

}  // namespace ocrflow_core
