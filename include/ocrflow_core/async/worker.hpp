#pragma once

#include <atomic>
#include <string>
#include <thread>

#include "ocrflow_core/async/task_queue.hpp"

namespace ocrflow_core::async {

/**
 * @class Worker
 * @brief A single background thread that runs tasks from a shared queue.
 *
 * A Worker is long-lived: it blocks on the queue, runs whatever it gets and
 * exits once the queue is closed and drained. It is managed by a WorkerPool
 * and is non-copyable and non-movable to keep ownership of the thread clear.
 */
class Worker {
 public:
  /**
   * @brief Constructs a Worker instance.
   * @param worker_id Identifier used for logging.
   * @param pool_name Name of the owning pool, used for logging.
   * @param queue The pool's shared task queue.
   * @param active_counter Incremented while this worker runs a task.
   */
  Worker(int worker_id, std::string pool_name, TaskQueue &queue,
         std::atomic<size_t> &active_counter);

  /**
   * @brief Destructor. Joins the thread if it is still running.
   *
   * The owning pool closes the queue first; otherwise this blocks until it does.
   */
  ~Worker();

  /**
   * @brief Starts the worker's loop in a new background thread.
   * @throws std::runtime_error if the worker is already running.
   */
  void start();

  // Blocks until the run loop has exited.
  void join();

  Worker(const Worker &) = delete;
  Worker &operator=(const Worker &) = delete;
  Worker(Worker &&) = delete;
  Worker &operator=(Worker &&) = delete;

  // Runs at most one queued task on the calling thread. Returns false if none was queued.
  bool run_one_task();

 private:
  void run_loop();
  void execute(Task &task);

  int worker_id_;
  std::string pool_name_;
  TaskQueue &queue_;
  std::atomic<size_t> &active_counter_;
  std::thread thread_;
};

}  // namespace ocrflow_core::async
