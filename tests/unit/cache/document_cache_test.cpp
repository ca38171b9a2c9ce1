#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include "common/utilities_test.hpp"
#include "docqa_core/cache/document_cache.hpp"

namespace docqa_tests {

using docqa_core::DocumentCache;
using docqa_core::IndexedDocumentPtr;

namespace {

IndexedDocumentPtr make_document(const std::string& fingerprint) {
  return TestUtilities::create_document(fingerprint,
                                        {TestUtilities::create_test_vector(fingerprint, 8)},
                                        {TestUtilities::create_test_chunk("text of " + fingerprint)});
}

}  // namespace

class DocumentCacheTest : public ::testing::Test {
 protected:
  DocumentCache cache_;
  std::atomic<int> build_count_{0};

  DocumentCache::BuildFunction counting_builder(std::chrono::milliseconds delay = {}) {
    return [this, delay](const std::string& fingerprint) {
      build_count_++;
      if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
      }
      return make_document(fingerprint);
    };
  }
};

TEST_F(DocumentCacheTest, SecondRequestIsServedFromCache) {
  auto first = cache_.get_or_build("doc-a", counting_builder());
  auto second = cache_.get_or_build("doc-a", counting_builder());

  EXPECT_EQ(first, second);
  EXPECT_EQ(build_count_.load(), 1);
  EXPECT_TRUE(cache_.contains("doc-a"));
  EXPECT_EQ(cache_.size(), 1u);
}

TEST_F(DocumentCacheTest, ConcurrentRequestsShareOneBuild) {
  constexpr int kThreads = 8;
  std::vector<IndexedDocumentPtr> results(kThreads);
  std::vector<std::thread> threads;

  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([this, &results, i]() {
      results[i] = cache_.get_or_build("shared", counting_builder(std::chrono::milliseconds(100)));
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(build_count_.load(), 1);
  for (const auto& result : results) {
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(result, results[0]);
  }
}

TEST_F(DocumentCacheTest, FailedBuildIsNotCached) {
  auto failing = [this](const std::string&) -> IndexedDocumentPtr {
    build_count_++;
    throw std::runtime_error("download failed");
  };

  EXPECT_THROW(cache_.get_or_build("flaky", failing), std::runtime_error);
  EXPECT_FALSE(cache_.contains("flaky"));
  EXPECT_EQ(cache_.size(), 0u);

  auto document = cache_.get_or_build("flaky", counting_builder());
  ASSERT_NE(document, nullptr);
  EXPECT_EQ(build_count_.load(), 2);
  EXPECT_TRUE(cache_.contains("flaky"));
}

TEST_F(DocumentCacheTest, WaitersReceiveTheBuildFailure) {
  auto slow_failure = [this](const std::string&) -> IndexedDocumentPtr {
    build_count_++;
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    throw std::runtime_error("extraction failed");
  };

  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&]() {
      try {
        cache_.get_or_build("bad", slow_failure);
      } catch (const std::runtime_error&) {
        failures++;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(failures.load(), 4);
  EXPECT_EQ(build_count_.load(), 1);
  EXPECT_FALSE(cache_.contains("bad"));
}

TEST_F(DocumentCacheTest, DifferentFingerprintsBuildInParallel) {
  std::atomic<int> started{0};
  std::atomic<bool> overlapped{false};

  auto rendezvous = [&](const std::string& fingerprint) {
    started++;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (started.load() < 2 && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    if (started.load() >= 2) {
      overlapped = true;
    }
    return make_document(fingerprint);
  };

  std::thread first([&]() { cache_.get_or_build("one", rendezvous); });
  std::thread second([&]() { cache_.get_or_build("two", rendezvous); });
  first.join();
  second.join();

  EXPECT_TRUE(overlapped.load());
  EXPECT_EQ(cache_.size(), 2u);
}

TEST(DocumentCacheLruTest, EvictsLeastRecentlyUsedEntry) {
  DocumentCache cache(2);
  auto builder = [](const std::string& fingerprint) { return make_document(fingerprint); };

  cache.get_or_build("a", builder);
  cache.get_or_build("b", builder);
  cache.get_or_build("a", builder);
  cache.get_or_build("c", builder);

  EXPECT_EQ(cache.size(), 2u);
  EXPECT_TRUE(cache.contains("a"));
  EXPECT_FALSE(cache.contains("b"));
  EXPECT_TRUE(cache.contains("c"));
}

TEST_F(DocumentCacheTest, EraseAndClearForceRebuild) {
  cache_.get_or_build("x", counting_builder());
  cache_.get_or_build("y", counting_builder());

  EXPECT_TRUE(cache_.erase("x"));
  EXPECT_FALSE(cache_.erase("x"));
  EXPECT_FALSE(cache_.contains("x"));

  cache_.get_or_build("x", counting_builder());
  EXPECT_EQ(build_count_.load(), 3);

  cache_.clear();
  EXPECT_EQ(cache_.size(), 0u);
  cache_.get_or_build("y", counting_builder());
  EXPECT_EQ(build_count_.load(), 4);
}

}  // namespace docqa_tests
