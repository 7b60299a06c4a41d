#include "ocrflow_core/async/task_queue.hpp"

#include <stdexcept>

namespace ocrflow_core::async {

TaskQueue::TaskQueue(size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) {
    throw std::invalid_argument("TaskQueue capacity must be greater than 0.");
  }
}

bool TaskQueue::push(Task task) {
  std::unique_lock<std::mutex> lock(mutex_);
  not_full_.wait(lock, [this] { return closed_ || tasks_.size() < capacity_; });
  if (closed_) {
    return false;
  }
  tasks_.push_back(std::move(task));
  not_empty_.notify_one();
  return true;
}

bool TaskQueue::try_push(Task task) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_ || tasks_.size() >= capacity_) {
    return false;
  }
  tasks_.push_back(std::move(task));
  not_empty_.notify_one();
  return true;
}

std::optional<Task> TaskQueue::pop() {
  std::unique_lock<std::mutex> lock(mutex_);
  not_empty_.wait(lock, [this] { return closed_ || !tasks_.empty(); });
  if (tasks_.empty()) {
    return std::nullopt;
  }
  Task task = std::move(tasks_.front());
  tasks_.pop_front();
  not_full_.notify_one();
  return task;
}

std::optional<Task> TaskQueue::try_pop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (tasks_.empty()) {
    return std::nullopt;
  }
  Task task = std::move(tasks_.front());
  tasks_.pop_front();
  not_full_.notify_one();
  return task;
}

void TaskQueue::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

bool TaskQueue::is_closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t TaskQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

}  // namespace ocrflow_core::async
