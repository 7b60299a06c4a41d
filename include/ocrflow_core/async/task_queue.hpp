#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

namespace ocrflow_core::async {

using Task = std::function<void()>;

/**
 * @class TaskQueue
 * @brief Bounded FIFO shared by the workers of one pool.
 *
 * After close() no new tasks are accepted; pop() keeps handing out the
 * remaining tasks and returns std::nullopt once the queue is drained.
 */
class TaskQueue {
 public:
  explicit TaskQueue(size_t capacity);

  // Blocks while full. Returns false if the queue was closed.
  bool push(Task task);
  // Never blocks. Returns false if full or closed.
  bool try_push(Task task);

  // Blocks until a task is available or the queue is closed and drained.
  std::optional<Task> pop();
  std::optional<Task> try_pop();

  void close();
  bool is_closed() const;
  size_t size() const;
  size_t capacity() const {
    return capacity_;
  }

 private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<Task> tasks_;
  bool closed_ = false;
};

}  // namespace ocrflow_core::async
