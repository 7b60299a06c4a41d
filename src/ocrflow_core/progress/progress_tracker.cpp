#include "ocrflow_core/progress/progress_tracker.hpp"

#include <algorithm>
#include <iostream>

namespace ocrflow_core {

ProgressTracker::ProgressTracker(SteadyClock clock) : clock_(std::move(clock)) {}

double ProgressTracker::compute_percentage(std::size_t processed, std::size_t total,
                                           JobStatus status) {
  if (status == JobStatus::COMPLETED) {
    return 100.0;
  }
  if (total == 0) {
    return 0.0;
  }
  double percentage =
      static_cast<double>(std::min(processed, total)) / static_cast<double>(total) * 100.0;
  return std::clamp(percentage, 0.0, 99.0);
}

ProgressState *ProgressTracker::find_locked(const std::string &job_id) {
  auto it = records_.find(job_id);
  return it == records_.end() ? nullptr : &it->second;
}

void ProgressTracker::publish_locked(ProgressState &state) {
  const auto now = clock_();
  state.percentage = std::max(
      state.percentage, compute_percentage(state.processed_units, state.total_units, state.status));

  if (state.status == JobStatus::PROCESSING && state.processed_units > 0 &&
      state.total_units > state.processed_units) {
    double elapsed = std::chrono::duration<double>(now - state.started_at).count();
    double per_unit = elapsed / static_cast<double>(state.processed_units);
    state.estimated_time_remaining =
        per_unit * static_cast<double>(state.total_units - state.processed_units);
  } else {
    state.estimated_time_remaining.reset();
  }

  state.last_update = std::chrono::system_clock::now();
  state.version++;
  last_update_ = state.last_update;
  changed_.notify_all();
}

void ProgressTracker::start(const std::string &job_id, std::size_t total_units) {
  std::lock_guard<std::mutex> lock(mutex_);
  ProgressState state;
  state.job_id = job_id;
  state.total_units = total_units;
  state.started_at = clock_();
  auto previous = records_.find(job_id);
  if (previous != records_.end()) {
    state.version = previous->second.version;
  }
  records_[job_id] = state;
  publish_locked(records_[job_id]);
}

bool ProgressTracker::try_start(const std::string &job_id, std::size_t total_units) {
  std::lock_guard<std::mutex> lock(mutex_);
  ProgressState state;
  state.job_id = job_id;
  state.total_units = total_units;
  state.started_at = clock_();
  auto [it, inserted] = records_.emplace(job_id, std::move(state));
  if (!inserted) {
    return false;
  }
  publish_locked(it->second);
  return true;
}

void ProgressTracker::set_total(const std::string &job_id, std::size_t total_units) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (ProgressState *state = find_locked(job_id)) {
    state->total_units = total_units;
    publish_locked(*state);
  }
}

void ProgressTracker::add_processed(const std::string &job_id, std::size_t units) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (ProgressState *state = find_locked(job_id)) {
    if (is_terminal(state->status)) {
      return;
    }
    state->processed_units += units;
    if (state->total_units > 0) {
      state->processed_units = std::min(state->processed_units, state->total_units);
    }
    publish_locked(*state);
  }
}

void ProgressTracker::mark_completed(const std::string &job_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (ProgressState *state = find_locked(job_id)) {
    state->status = JobStatus::COMPLETED;
    state->processed_units = state->total_units;
    publish_locked(*state);
  }
}

void ProgressTracker::mark_error(const std::string &job_id, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (ProgressState *state = find_locked(job_id)) {
    if (state->status == JobStatus::COMPLETED) {
      return;
    }
    state->status = JobStatus::ERROR;
    state->error_message = message;
    publish_locked(*state);
  }
}

ProgressSnapshot ProgressTracker::to_snapshot(const ProgressState &state) {
  ProgressSnapshot snapshot;
  snapshot.job_id = state.job_id;
  snapshot.total_units = state.total_units;
  snapshot.processed_units = state.processed_units;
  snapshot.status = state.status;
  snapshot.percentage = state.percentage;
  snapshot.estimated_time_remaining = state.estimated_time_remaining;
  snapshot.error_message = state.error_message;
  snapshot.last_update = state.last_update;
  snapshot.version = state.version;
  return snapshot;
}

std::optional<ProgressSnapshot> ProgressTracker::snapshot(const std::string &job_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(job_id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return to_snapshot(it->second);
}

bool ProgressTracker::wait_for_change(const std::string &job_id, std::uint64_t seen_version,
                                      std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return changed_.wait_for(lock, timeout, [&] {
    auto it = records_.find(job_id);
    return it == records_.end() || it->second.version != seen_version;
  }) && records_.count(job_id) > 0;
}

void ProgressTracker::acknowledge_terminal(const std::string &job_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(job_id);
  if (it == records_.end()) {
    return;
  }
  it->second.read_after_completion = true;
  if (it->second.status == JobStatus::COMPLETED) {
    records_.erase(it);
    changed_.notify_all();
  }
}

bool ProgressTracker::release(const std::string &job_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  bool erased = records_.erase(job_id) > 0;
  if (erased) {
    changed_.notify_all();
  }
  return erased;
}

size_t ProgressTracker::evict_expired(std::chrono::minutes ttl) {
  const auto cutoff = std::chrono::system_clock::now() - ttl;
  std::lock_guard<std::mutex> lock(mutex_);
  size_t evicted = 0;
  for (auto it = records_.begin(); it != records_.end();) {
    if (is_terminal(it->second.status) && it->second.last_update < cutoff) {
      it = records_.erase(it);
      evicted++;
    } else {
      ++it;
    }
  }
  if (evicted > 0) {
    std::cout << "[ProgressTracker] Evicted " << evicted << " expired progress records"
              << std::endl;
    changed_.notify_all();
  }
  return evicted;
}

bool ProgressTracker::contains(const std::string &job_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.count(job_id) > 0;
}

size_t ProgressTracker::active_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<size_t>(std::count_if(records_.begin(), records_.end(), [](const auto &r) {
    return r.second.status == JobStatus::PROCESSING;
  }));
}

std::optional<std::chrono::system_clock::time_point> ProgressTracker::last_update() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_update_;
}

}  // namespace ocrflow_core
