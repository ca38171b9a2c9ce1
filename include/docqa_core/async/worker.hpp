#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include "docqa_core/async/job_queue.hpp"

namespace docqa_core {
namespace async {

/**
 * @class Worker
 * @brief A single background thread that runs jobs from a shared queue.
 *
 * This class is designed to be managed by a WorkerPool. It is non-copyable
 * and non-movable to ensure clear ownership of the underlying thread.
 */
class Worker {
 public:
  Worker(int worker_id, std::shared_ptr<JobQueue> queue);

  /**
   * @brief Destructor. Stops the worker and joins its thread.
   */
  ~Worker();

  /**
   * @brief Starts the worker's processing loop in a new background thread.
   *
   * This method will throw an exception if the worker is already running.
   */
  void start();

  /**
   * @brief Signals the worker to exit after its current job.
   *
   * Does NOT block; the destructor waits for the thread.
   */
  void stop();

  // Runs at most one queued job on the calling thread. Returns false if none was queued.
  bool run_one_job();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker(Worker&&) = delete;
  Worker& operator=(Worker&&) = delete;

 private:
  static constexpr std::chrono::milliseconds POLL_INTERVAL{200};

  void run_loop();
  void execute(Job& job);

  int worker_id_;
  std::shared_ptr<JobQueue> queue_;
  std::atomic<bool> should_stop{false};
  std::thread thread;
};

}  // namespace async
}  // namespace docqa_core
