#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

namespace docqa_core::async {

using Job = std::function<void()>;

// Thread-safe FIFO shared by the workers of a pool.
class JobQueue {
 public:
  // @throw std::runtime_error once the queue is closed.
  void push(Job job);

  // Blocks up to timeout for a job. Returns nullopt on timeout or when closed and drained.
  std::optional<Job> wait_pop(std::chrono::milliseconds timeout);

  // Wakes every waiter; no further jobs are accepted.
  void close();
  bool is_closed() const;
  size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Job> jobs_;
  bool closed_ = false;
};

}  // namespace docqa_core::async
