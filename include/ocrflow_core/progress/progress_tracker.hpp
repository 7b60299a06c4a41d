#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "ocrflow_core/types/progress.hpp"
#include "ocrflow_core/util/clock.hpp"

namespace ocrflow_core {

/**
 * @class ProgressTracker
 * @brief Per-job progress records for synchronous extractions.
 *
 * Only the job's own processing path writes a record; pollers and streams
 * read copies. The published percentage never decreases and reaches 100
 * only once the job is completed. Writers notify a condition variable so
 * streams can wait for the next change instead of polling.
 */
class ProgressTracker {
 public:
  explicit ProgressTracker(SteadyClock clock = default_steady_clock());

  ProgressTracker(const ProgressTracker &) = delete;
  ProgressTracker &operator=(const ProgressTracker &) = delete;

  // Creates (or resets) the record for job_id. total may be 0 until known.
  void start(const std::string &job_id, std::size_t total_units);
  // Creates the record only if job_id is not tracked yet. Returns false if it is.
  bool try_start(const std::string &job_id, std::size_t total_units);
  void set_total(const std::string &job_id, std::size_t total_units);
  void add_processed(const std::string &job_id, std::size_t units);
  void mark_completed(const std::string &job_id);
  void mark_error(const std::string &job_id, const std::string &message);

  std::optional<ProgressSnapshot> snapshot(const std::string &job_id) const;

  /**
   * @brief Waits until the record's version moves past seen_version.
   * @return false on timeout or if the record no longer exists.
   */
  bool wait_for_change(const std::string &job_id, std::uint64_t seen_version,
                       std::chrono::milliseconds timeout) const;

  // Called by a stream after it delivered the completion event; purges completed records.
  void acknowledge_terminal(const std::string &job_id);

  bool release(const std::string &job_id);
  // Drops terminal records whose last update is older than ttl.
  size_t evict_expired(std::chrono::minutes ttl);

  bool contains(const std::string &job_id) const;
  size_t active_count() const;
  std::optional<std::chrono::system_clock::time_point> last_update() const;

  static double compute_percentage(std::size_t processed, std::size_t total, JobStatus status);

 private:
  ProgressState *find_locked(const std::string &job_id);
  void publish_locked(ProgressState &state);
  static ProgressSnapshot to_snapshot(const ProgressState &state);

  SteadyClock clock_;
  mutable std::mutex mutex_;
  mutable std::condition_variable changed_;
  std::map<std::string, ProgressState> records_;
  std::optional<std::chrono::system_clock::time_point> last_update_;
};

}  // namespace ocrflow_core
