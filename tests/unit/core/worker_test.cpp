#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "docqa_core/async/job_queue.hpp"
#include "docqa_core/async/worker.hpp"

namespace docqa_tests {

using docqa_core::async::JobQueue;
using docqa_core::async::Worker;

class WorkerTest : public ::testing::Test {
 protected:
  std::shared_ptr<JobQueue> queue_ = std::make_shared<JobQueue>();
};

TEST_F(WorkerTest, RequiresQueue) {
  EXPECT_THROW(Worker(1, nullptr), std::invalid_argument);
}

TEST_F(WorkerTest, RunOneJobReturnsFalseWhenQueueEmpty) {
  Worker worker(1, queue_);
  EXPECT_FALSE(worker.run_one_job());
}

TEST_F(WorkerTest, RunOneJobExecutesInFifoOrder) {
  Worker worker(1, queue_);
  std::string order;
  queue_->push([&order]() { order += "a"; });
  queue_->push([&order]() { order += "b"; });

  EXPECT_TRUE(worker.run_one_job());
  EXPECT_TRUE(worker.run_one_job());
  EXPECT_FALSE(worker.run_one_job());
  EXPECT_EQ(order, "ab");
}

TEST_F(WorkerTest, FailingJobDoesNotEscape) {
  Worker worker(1, queue_);
  queue_->push([]() { throw std::runtime_error("boom"); });
  EXPECT_NO_THROW(worker.run_one_job());
}

TEST_F(WorkerTest, BackgroundLoopDrainsQueue) {
  std::atomic<int> done{0};
  for (int i = 0; i < 5; ++i) {
    queue_->push([&done]() { done++; });
  }

  Worker worker(1, queue_);
  worker.start();
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (done.load() < 5 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  worker.stop();

  EXPECT_EQ(done.load(), 5);
  EXPECT_EQ(queue_->size(), 0u);
}

TEST_F(WorkerTest, StartTwiceThrows) {
  Worker worker(1, queue_);
  worker.start();
  EXPECT_THROW(worker.start(), std::runtime_error);
  worker.stop();
}

TEST(JobQueueTest, WaitPopTimesOutWhenEmpty) {
  JobQueue queue;
  EXPECT_FALSE(queue.wait_pop(std::chrono::milliseconds(10)).has_value());
}

TEST(JobQueueTest, ClosedQueueRejectsPushButDrains) {
  JobQueue queue;
  queue.push([]() {});
  queue.close();

  EXPECT_TRUE(queue.is_closed());
  EXPECT_THROW(queue.push([]() {}), std::runtime_error);
  EXPECT_TRUE(queue.wait_pop(std::chrono::milliseconds(0)).has_value());
  EXPECT_FALSE(queue.wait_pop(std::chrono::milliseconds(0)).has_value());
}

TEST(JobQueueTest, CloseWakesWaiters) {
  JobQueue queue;
  std::thread closer([&queue]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.close();
  });

  const auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(queue.wait_pop(std::chrono::seconds(10)).has_value());
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
  closer.join();
}

}  // namespace docqa_tests
