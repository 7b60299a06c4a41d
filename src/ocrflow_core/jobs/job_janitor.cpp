#include "ocrflow_core/jobs/job_janitor.hpp"

#include <iostream>
#include <stdexcept>

#include "ocrflow_core/jobs/job_store.hpp"
#include "ocrflow_core/progress/progress_tracker.hpp"
#include "ocrflow_core/util/temp_workspace.hpp"

namespace ocrflow_core {

JobJanitor::JobJanitor(std::shared_ptr<JobStore> jobs, std::shared_ptr<ProgressTracker> progress,
                       std::chrono::minutes ttl, std::chrono::milliseconds sweep_interval)
    : jobs_(std::move(jobs)),
      progress_(std::move(progress)),
      ttl_(ttl),
      sweep_interval_(sweep_interval) {}

JobJanitor::~JobJanitor() {
  stop();
}

void JobJanitor::start() {
  if (thread_.joinable()) {
    throw std::runtime_error("JobJanitor is already running.");
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    should_stop_ = false;
  }
  thread_ = std::thread(&JobJanitor::run_loop, this);
}

void JobJanitor::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    should_stop_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

size_t JobJanitor::sweep() {
  std::vector<Job> evicted = jobs_->evict_expired(ttl_);
  for (const auto &job : evicted) {
    TempWorkspace::remove_quietly(job.workspace);
  }
  progress_->evict_expired(ttl_);
  if (!evicted.empty()) {
    std::cout << "[JobJanitor] Evicted " << evicted.size() << " jobs" << std::endl;
  }
  return evicted.size();
}

void JobJanitor::run_loop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!should_stop_) {
    if (cv_.wait_for(lock, sweep_interval_, [this] { return should_stop_; })) {
      break;
    }
    lock.unlock();
    try {
      sweep();
    } catch (const std::exception &e) {
      std::cerr << "[JobJanitor] Sweep failed: " << e.what() << std::endl;
    }
    lock.lock();
  }
}

}  // namespace ocrflow_core
