#pragma once

#include <future>
#include <memory>
#include <type_traits>
#include <vector>

#include "docqa_core/async/job_queue.hpp"
#include "docqa_core/async/worker.hpp"

namespace docqa_core::async {

/**
 * @class WorkerPool
 * @brief Fixed set of Worker threads consuming one job queue.
 *
 * Owns the whole lifecycle of its threads: creating them, starting them, and
 * joining them when the pool is destroyed.
 */
class WorkerPool {
 public:
  explicit WorkerPool(size_t num_threads);

  /**
   * @brief Destructor. Automatically stops and joins all worker threads.
   */
  ~WorkerPool();

  void start();

  /**
   * @brief Closes the queue and signals all workers to stop.
   *
   * Jobs already running finish. Jobs still queued never run; their futures
   * report std::future_error (broken promise) once the pool is destroyed.
   * Does not block.
   */
  void stop();

  bool is_running() const {
    return m_is_running;
  }

  size_t size() const {
    return m_workers.size();
  }

  // Queues fn and returns a future for its result or exception.
  template <typename Fn>
  auto submit(Fn fn) -> std::future<std::invoke_result_t<Fn>> {
    using Result = std::invoke_result_t<Fn>;
    auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
    std::future<Result> future = task->get_future();
    m_queue->push([task]() { (*task)(); });
    return future;
  }

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

 private:
  std::shared_ptr<JobQueue> m_queue;
  std::vector<std::unique_ptr<Worker>> m_workers;
  bool m_is_running = false;
};

}  // namespace docqa_core::async
