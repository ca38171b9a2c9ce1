#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "docqa_core/async/worker_pool.hpp"

namespace docqa_tests {

using docqa_core::async::WorkerPool;

TEST(WorkerPoolTest, ConstructorThrowsOnZeroThreads) {
  EXPECT_THROW({ WorkerPool pool(0); }, std::invalid_argument);
}

TEST(WorkerPoolTest, StopWithoutStartIsNoOp) {
  EXPECT_NO_THROW({
    WorkerPool pool(1);
    pool.stop();
  });
}

TEST(WorkerPoolTest, StartThenStopLifecycle_NoJobs) {
  EXPECT_NO_THROW({
    WorkerPool pool(2);
    pool.start();
    EXPECT_TRUE(pool.is_running());
    EXPECT_EQ(pool.size(), 2u);
    // Give the worker threads a brief moment to enter their loop
    std::this_thread::sleep_for(std::chrono::milliseconds(25));
    pool.stop();
    EXPECT_FALSE(pool.is_running());
  });
}

TEST(WorkerPoolTest, StartTwiceShowsWarningAndNoThrow) {
  WorkerPool pool(1);
  pool.start();
  EXPECT_NO_THROW(pool.start());
  pool.stop();
}

TEST(WorkerPoolTest, CannotRestartAfterStop) {
  WorkerPool pool(1);
  pool.start();
  pool.stop();
  EXPECT_THROW(pool.start(), std::runtime_error);
}

TEST(WorkerPoolTest, SubmitReturnsResult) {
  WorkerPool pool(2);
  pool.start();

  auto future = pool.submit([]() { return 6 * 7; });
  EXPECT_EQ(future.get(), 42);
  pool.stop();
}

TEST(WorkerPoolTest, SubmitPropagatesException) {
  WorkerPool pool(1);
  pool.start();

  auto future = pool.submit([]() -> int { throw std::runtime_error("job failed"); });
  EXPECT_THROW(future.get(), std::runtime_error);

  // The worker survives a failing job
  EXPECT_EQ(pool.submit([]() { return 1; }).get(), 1);
  pool.stop();
}

TEST(WorkerPoolTest, JobsRunConcurrently) {
  WorkerPool pool(2);
  pool.start();

  std::atomic<int> started{0};
  auto wait_for_peer = [&started]() {
    started++;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (started.load() < 2 && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return started.load() >= 2;
  };

  auto first = pool.submit(wait_for_peer);
  auto second = pool.submit(wait_for_peer);
  EXPECT_TRUE(first.get());
  EXPECT_TRUE(second.get());
  pool.stop();
}

TEST(WorkerPoolTest, ManyJobsAllComplete) {
  WorkerPool pool(4);
  pool.start();

  std::atomic<int> total{0};
  std::vector<std::future<void>> futures;
  for (int i = 1; i <= 100; ++i) {
    futures.push_back(pool.submit([&total, i]() { total += i; }));
  }
  for (auto& future : futures) {
    future.get();
  }
  EXPECT_EQ(total.load(), 5050);
  pool.stop();
}

TEST(WorkerPoolTest, SubmitAfterStopThrows) {
  WorkerPool pool(1);
  pool.start();
  pool.stop();
  EXPECT_THROW(pool.submit([]() { return 0; }), std::runtime_error);
}

}  // namespace docqa_tests
