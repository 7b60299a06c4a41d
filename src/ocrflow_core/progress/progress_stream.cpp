#include "ocrflow_core/progress/progress_stream.hpp"

#include <cmath>
#include <iostream>

#include "ocrflow_core/progress/progress_tracker.hpp"

namespace ocrflow_core {

ProgressStream::ProgressStream(std::shared_ptr<ProgressTracker> tracker, std::string job_id,
                               std::chrono::milliseconds wait_slice,
                               std::chrono::milliseconds idle_timeout)
    : tracker_(std::move(tracker)),
      job_id_(std::move(job_id)),
      wait_slice_(wait_slice),
      idle_timeout_(idle_timeout) {}

std::optional<ProgressEvent> ProgressStream::next() {
  if (finished_) {
    return std::nullopt;
  }

  auto idle_deadline = std::chrono::steady_clock::now() + idle_timeout_;
  while (true) {
    std::optional<ProgressSnapshot> snapshot = tracker_->snapshot(job_id_);
    if (!snapshot) {
      finished_ = true;
      return std::nullopt;
    }

    ProgressEvent event;
    event.percent = static_cast<int>(std::lround(snapshot->percentage));
    event.terminal = is_terminal(snapshot->status);

    if (event.terminal || event.percent != last_percent_) {
      last_percent_ = event.percent;
      event.snapshot = std::move(*snapshot);
      if (event.terminal) {
        finished_ = true;
        tracker_->acknowledge_terminal(job_id_);
      }
      return event;
    }

    if (std::chrono::steady_clock::now() >= idle_deadline) {
      std::cerr << "[ProgressStream] No progress on job " << job_id_ << " within "
                << idle_timeout_.count() << " ms, closing stream" << std::endl;
      finished_ = true;
      return std::nullopt;
    }
    tracker_->wait_for_change(job_id_, snapshot->version, wait_slice_);
  }
}

}  // namespace ocrflow_core
