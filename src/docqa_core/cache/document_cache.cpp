#include "docqa_core/cache/document_cache.hpp"

#include <iostream>

namespace docqa_core {

DocumentCache::DocumentCache(size_t max_entries) : max_entries_(max_entries) {}

IndexedDocumentPtr DocumentCache::get_or_build(const std::string &fingerprint,
                                               const BuildFunction &build) {
  std::promise<IndexedDocumentPtr> promise;
  uint64_t generation = 0;

  std::unique_lock<std::mutex> lock(mutex_);
  auto it = entries_.find(fingerprint);
  if (it != entries_.end()) {
    if (it->second.ready) {
      touch(it->second);
      return it->second.future.get();
    }
    // Another caller is building this fingerprint; wait for its outcome
    std::shared_future<IndexedDocumentPtr> pending = it->second.future;
    lock.unlock();
    return pending.get();
  }

  Entry entry;
  entry.future = promise.get_future().share();
  entry.generation = generation = next_generation_++;
  entry.lru_position = lru_.end();
  entries_.emplace(fingerprint, std::move(entry));
  lock.unlock();

  auto abandon = [&]() {
    {
      std::lock_guard<std::mutex> guard(mutex_);
      auto failed = entries_.find(fingerprint);
      if (failed != entries_.end() && failed->second.generation == generation) {
        entries_.erase(failed);
      }
    }
    promise.set_exception(std::current_exception());
  };

  IndexedDocumentPtr document;
  try {
    document = build(fingerprint);
  } catch (const std::exception &e) {
    std::cerr << "DocumentCache: build failed for " << fingerprint << ": " << e.what()
              << std::endl;
    abandon();
    throw;
  } catch (...) {
    std::cerr << "DocumentCache: build failed for " << fingerprint << std::endl;
    abandon();
    throw;
  }

  {
    std::lock_guard<std::mutex> guard(mutex_);
    auto built = entries_.find(fingerprint);
    // erase() or clear() may have dropped the pending entry meanwhile
    if (built != entries_.end() && built->second.generation == generation) {
      built->second.ready = true;
      lru_.push_front(fingerprint);
      built->second.lru_position = lru_.begin();
      evict_if_needed();
    }
  }
  promise.set_value(document);
  return document;
}

void DocumentCache::touch(Entry &entry) {
  lru_.splice(lru_.begin(), lru_, entry.lru_position);
  entry.lru_position = lru_.begin();
}

void DocumentCache::evict_if_needed() {
  if (max_entries_ == 0) {
    return;
  }
  while (lru_.size() > max_entries_) {
    const std::string victim = lru_.back();
    lru_.pop_back();
    entries_.erase(victim);
    std::cout << "DocumentCache: evicted " << victim << std::endl;
  }
}

bool DocumentCache::contains(const std::string &fingerprint) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(fingerprint);
  return it != entries_.end() && it->second.ready;
}

size_t DocumentCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return lru_.size();
}

bool DocumentCache::erase(const std::string &fingerprint) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(fingerprint);
  if (it == entries_.end()) {
    return false;
  }
  if (it->second.ready) {
    lru_.erase(it->second.lru_position);
  }
  entries_.erase(it);
  return true;
}

void DocumentCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
  lru_.clear();
}

}  // namespace docqa_core
