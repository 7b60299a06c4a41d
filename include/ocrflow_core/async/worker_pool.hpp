#pragma once

#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

#include "ocrflow_core/async/task_queue.hpp"
#include "ocrflow_core/async/worker.hpp"

namespace ocrflow_core::async {

/**
 * @class WorkerPool
 * @brief A fixed set of Worker threads fed from one bounded queue.
 *
 * The pool owns the whole lifecycle of its threads: it creates them, starts
 * them and joins them on stop() or destruction (RAII).
 */
class WorkerPool {
 public:
  /**
   * @brief Constructs the pool and its workers. Threads start on start().
   * @param name Pool name used in logs ("ocr", "chunks").
   * @param num_threads Number of worker threads. Must be > 0.
   * @param max_queue_size Capacity of the pending-task queue. Must be > 0.
   */
  WorkerPool(std::string name, size_t num_threads, size_t max_queue_size);

  // Stops the pool if it is running, draining queued tasks first.
  ~WorkerPool();

  void start();

  /**
   * @brief Closes the queue and waits for the workers to drain it.
   *
   * Blocks until every already-queued task has run.
   */
  void stop();

  // Blocking enqueue: waits for queue space. Throws std::runtime_error once stopped.
  void post(Task task);

  // Non-blocking enqueue. Throws QueueFullError when the queue is at capacity.
  void try_post(Task task);

  // Runs fn on a worker and returns its future. Blocks while the queue is full.
  template <typename Fn>
  auto submit(Fn &&fn) -> std::future<std::invoke_result_t<std::decay_t<Fn> &>> {
    using Result = std::invoke_result_t<std::decay_t<Fn> &>;
    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
    std::future<Result> future = task->get_future();
    post([task]() { (*task)(); });
    return future;
  }

  size_t worker_count() const {
    return workers_.size();
  }
  size_t queue_size() const {
    return queue_.size();
  }
  size_t active_workers() const {
    return active_workers_.load();
  }
  bool is_running() const {
    return is_running_;
  }
  const std::string &name() const {
    return name_;
  }

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;
  WorkerPool(WorkerPool &&) = delete;
  WorkerPool &operator=(WorkerPool &&) = delete;

 private:
  std::string name_;
  TaskQueue queue_;
  std::atomic<size_t> active_workers_{0};
  std::vector<std::unique_ptr<Worker>> workers_;
  bool is_running_ = false;
};

}  // namespace ocrflow_core::async
