#include "docqa_core/async/worker.hpp"

#include <iostream>
#include <stdexcept>

namespace docqa_core {
namespace async {

Worker::Worker(int worker_id, std::shared_ptr<JobQueue> queue)
    : worker_id_(worker_id), queue_(std::move(queue)) {
  if (!queue_) {
    throw std::invalid_argument("Worker requires a job queue.");
  }
}

Worker::~Worker() {
  stop();
  if (thread.joinable()) {
    thread.join();
  }
}

void Worker::start() {
  if (thread.joinable()) {
    throw std::runtime_error("Worker is already running.");
  }
  should_stop.store(false);
  thread = std::thread(&Worker::run_loop, this);
}

void Worker::stop() {
  should_stop.store(true);
}

void Worker::execute(Job& job) {
  // Jobs built by WorkerPool::submit report failures through their future
  try {
    job();
  } catch (const std::exception& e) {
    std::cerr << "Worker [" << worker_id_ << "] ERROR running job: " << e.what() << std::endl;
  }
}

void Worker::run_loop() {
  std::cout << "Worker [" << worker_id_ << "] starting run loop." << std::endl;
  while (!should_stop.load()) {
    std::optional<Job> job = queue_->wait_pop(POLL_INTERVAL);
    if (job) {
      execute(*job);
    } else if (queue_->is_closed()) {
      break;
    }
  }
  std::cout << "Worker [" << worker_id_ << "] run loop terminated." << std::endl;
}

bool Worker::run_one_job() {
  std::optional<Job> job = queue_->wait_pop(std::chrono::milliseconds(0));
  if (!job) {
    return false;
  }
  execute(*job);
  return true;
}

}  // namespace async
}  // namespace docqa_core
