#pragma once

#include <sqlite_modern_cpp.h>

#include <memory>
#include <mutex>
#include <string>

#include "docqa_core/cache/document_cache.hpp"

namespace docqa_core {

class SnapshotStoreError : public std::exception {
 public:
  explicit SnapshotStoreError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class SnapshotStore
 * @brief Persists indexed documents in SQLite so restarts skip re-embedding.
 *
 * One row per document holds the serialized FAISS index and the embedding
 * model that produced it; chunk metadata lives in a child table keyed by row
 * index, with zstd-compressed text. Loading re-checks that metadata rows and
 * index vectors still line up.
 */
class SnapshotStore {
 public:
  // Opens or creates the database. ":memory:" gives a private in-memory store.
  explicit SnapshotStore(const std::string &db_path);

  SnapshotStore(const SnapshotStore &) = delete;
  SnapshotStore &operator=(const SnapshotStore &) = delete;

  // Replaces any previous snapshot with the same fingerprint.
  void save(const IndexedDocument &document);

  /**
   * @param embedding_model Model id the caller will embed queries with.
   * @param dimension Expected vector dimension, or 0 when not yet known.
   * @return The stored document, or nullptr if none exists or it was embedded
   *         by a different model or at a different dimension.
   * @throw SnapshotStoreError if the stored rows are inconsistent with the index.
   */
  IndexedDocumentPtr load(const std::string &fingerprint,
                          const std::string &embedding_model,
                          size_t dimension = 0);

  bool contains(const std::string &fingerprint);
  bool remove(const std::string &fingerprint);
  size_t count();

 private:
  std::string db_path_;
  sqlite::database db_;
  std::mutex mutex_;

  void create_tables();
  void add_missing_columns();
};

using SnapshotStorePtr = std::shared_ptr<SnapshotStore>;

}  // namespace docqa_core
