#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace ocrflow_core {

class JobStore;
class ProgressTracker;

/**
 * @class JobJanitor
 * @brief Background thread that reclaims finished and abandoned jobs.
 *
 * Every sweep_interval it evicts terminal jobs that were consumed or are
 * older than ttl, removing whatever working files they still hold, and
 * drops stale progress records.
 */
class JobJanitor {
 public:
  JobJanitor(std::shared_ptr<JobStore> jobs, std::shared_ptr<ProgressTracker> progress,
             std::chrono::minutes ttl,
             std::chrono::milliseconds sweep_interval = std::chrono::seconds(60));
  ~JobJanitor();

  JobJanitor(const JobJanitor &) = delete;
  JobJanitor &operator=(const JobJanitor &) = delete;

  void start();
  void stop();

  // One eviction pass on the calling thread. Returns the number of jobs evicted.
  size_t sweep();

 private:
  void run_loop();

  std::shared_ptr<JobStore> jobs_;
  std::shared_ptr<ProgressTracker> progress_;
  std::chrono::minutes ttl_;
  std::chrono::milliseconds sweep_interval_;

  std::mutex mutex_;
  std::condition_variable cv_;
  bool should_stop_ = false;
  std::thread thread_;
};

}  // namespace ocrflow_core
