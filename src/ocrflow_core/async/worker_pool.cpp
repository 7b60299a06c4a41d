#include "ocrflow_core/async/worker_pool.hpp"

#include <iostream>
#include <stdexcept>

#include "ocrflow_core/errors.hpp"

namespace ocrflow_core::async {

WorkerPool::WorkerPool(std::string name, size_t num_threads, size_t max_queue_size)
    : name_(std::move(name)), queue_(max_queue_size) {
  if (num_threads == 0) {
    throw std::invalid_argument("WorkerPool must have at least one thread.");
  }

  workers_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back(
        std::make_unique<Worker>(static_cast<int>(i), name_, queue_, active_workers_));
  }
  std::cout << "WorkerPool '" << name_ << "' created with " << num_threads
            << " workers (queue capacity " << max_queue_size << ")." << std::endl;
}

WorkerPool::~WorkerPool() {
  if (is_running_) {
    stop();
  }
}

void WorkerPool::start() {
  if (is_running_) {
    std::cerr << "Warning: WorkerPool '" << name_ << "' is already running." << std::endl;
    return;
  }
  if (queue_.is_closed()) {
    throw std::runtime_error("WorkerPool '" + name_ + "' cannot be restarted after stop.");
  }
  for (const auto &worker : workers_) {
    worker->start();
  }
  is_running_ = true;
}

void WorkerPool::stop() {
  if (!is_running_) {
    queue_.close();
    return;
  }
  std::cout << "Stopping all workers in pool '" << name_ << "'..." << std::endl;
  queue_.close();
  for (const auto &worker : workers_) {
    worker->join();
  }
  is_running_ = false;
}

void WorkerPool::post(Task task) {
  if (!queue_.push(std::move(task))) {
    throw std::runtime_error("WorkerPool '" + name_ + "' is stopped.");
  }
}

void WorkerPool::try_post(Task task) {
  if (queue_.is_closed()) {
    throw std::runtime_error("WorkerPool '" + name_ + "' is stopped.");
  }
  if (!queue_.try_push(std::move(task))) {
    throw QueueFullError("Server overloaded: " + name_ + " queue is full (" +
                         std::to_string(queue_.capacity()) + " pending)");
  }
}

}  // namespace ocrflow_core::async
