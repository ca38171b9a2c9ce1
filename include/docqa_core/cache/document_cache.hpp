#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "docqa_core/index/metadata_table.hpp"
#include "docqa_core/index/vector_index.hpp"

namespace docqa_core {

// A document ready for retrieval. Shared read-only between concurrent readers.
struct IndexedDocument {
  std::string fingerprint;
  std::shared_ptr<const VectorIndex> index;
  std::shared_ptr<const MetadataTable> metadata;
  std::string content_hash;
  // Embedder::model_id() of the vectors in index
  std::string embedding_model;
};

using IndexedDocumentPtr = std::shared_ptr<const IndexedDocument>;

/**
 * @class DocumentCache
 * @brief Fingerprint -> IndexedDocument map with single-flight builds.
 *
 * Concurrent first requests for one fingerprint share a single build; every
 * waiter receives its result or its exception. Failed builds are not cached.
 * No lock is held while a build runs, so different fingerprints build in
 * parallel.
 */
class DocumentCache {
 public:
  using BuildFunction = std::function<IndexedDocumentPtr(const std::string &fingerprint)>;

  // max_entries == 0 means unbounded
  explicit DocumentCache(size_t max_entries = 0);

  DocumentCache(const DocumentCache &) = delete;
  DocumentCache &operator=(const DocumentCache &) = delete;

  IndexedDocumentPtr get_or_build(const std::string &fingerprint, const BuildFunction &build);

  // True only for completed entries
  bool contains(const std::string &fingerprint) const;
  size_t size() const;
  bool erase(const std::string &fingerprint);
  void clear();

 private:
  struct Entry {
    std::shared_future<IndexedDocumentPtr> future;
    bool ready = false;
    // Distinguishes this build from a later one for the same fingerprint
    uint64_t generation = 0;
    std::list<std::string>::iterator lru_position;
  };

  size_t max_entries_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
  // Completed entries, most recently used first
  std::list<std::string> lru_;
  uint64_t next_generation_ = 1;

  void touch(Entry &entry);
  void evict_if_needed();
};

}  // namespace docqa_core
