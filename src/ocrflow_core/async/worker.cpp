#include "ocrflow_core/async/worker.hpp"

#include <iostream>
#include <stdexcept>

namespace ocrflow_core::async {

Worker::Worker(int worker_id, std::string pool_name, TaskQueue &queue,
               std::atomic<size_t> &active_counter)
    : worker_id_(worker_id),
      pool_name_(std::move(pool_name)),
      queue_(queue),
      active_counter_(active_counter) {}

Worker::~Worker() {
  join();
}

void Worker::start() {
  if (thread_.joinable()) {
    throw std::runtime_error("Worker is already running.");
  }
  thread_ = std::thread(&Worker::run_loop, this);
}

void Worker::join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void Worker::run_loop() {
  while (auto task = queue_.pop()) {
    execute(*task);
  }
  std::cout << pool_name_ << " worker [" << worker_id_ << "] run loop terminated." << std::endl;
}

bool Worker::run_one_task() {
  std::optional<Task> task = queue_.try_pop();
  if (!task) {
    return false;
  }
  execute(*task);
  return true;
}

void Worker::execute(Task &task) {
  active_counter_.fetch_add(1);
  try {
    task();
  } catch (const std::exception &e) {
    // Submitted work is wrapped in packaged_tasks; anything reaching here is a bug in a posted task.
    std::cerr << pool_name_ << " worker [" << worker_id_ << "] ERROR running task: " << e.what()
              << std::endl;
  }
  active_counter_.fetch_sub(1);
}

}  // namespace ocrflow_core::async
