#include "docqa_core/db/snapshot_store.hpp"

#include <iostream>
#include <optional>
#include <vector>

#include "docqa_core/db/sqlite_error_utils.hpp"
#include "docqa_core/db/transaction.hpp"
#include "docqa_core/errors.hpp"
#include "docqa_core/services/compression_service.hpp"

namespace docqa_core {

using db::format_db_error;

SnapshotStore::SnapshotStore(const std::string &db_path) try : db_path_(db_path), db_(db_path) {
  db_ << "PRAGMA foreign_keys = ON;";
  if (db_path_ != ":memory:") {
    db_ << "PRAGMA journal_mode = WAL;";
  }
  create_tables();
  std::cout << "SnapshotStore opened at " << db_path_ << std::endl;
} catch (const sqlite::sqlite_exception &e) {
  throw SnapshotStoreError(format_db_error("Open snapshot store " + db_path, e));
}

void SnapshotStore::create_tables() {
  db_ << R"(
    CREATE TABLE IF NOT EXISTS documents (
      id INTEGER PRIMARY KEY AUTOINCREMENT,
      fingerprint TEXT NOT NULL UNIQUE,
      content_hash TEXT NOT NULL,
      embedding_model TEXT NOT NULL DEFAULT '',
      dimension INTEGER NOT NULL,
      chunk_count INTEGER NOT NULL,
      index_blob BLOB NOT NULL,
      created_at TEXT NOT NULL DEFAULT CURRENT_TIMESTAMP
    );
  )";
  db_ << R"(
    CREATE TABLE IF NOT EXISTS chunks (
      document_id INTEGER NOT NULL REFERENCES documents(id) ON DELETE CASCADE,
      row_index INTEGER NOT NULL,
      source TEXT NOT NULL,
      page INTEGER,
      clause_number TEXT,
      content BLOB,
      PRIMARY KEY (document_id, row_index)
    );
  )";
  add_missing_columns();
}

// Snapshots written before embedding_model was recorded get '' and never match
void SnapshotStore::add_missing_columns() {
  bool has_embedding_model = false;
  db_ << "PRAGMA table_info(documents);" >>
      [&](int, std::string name, std::string, int, std::optional<std::string>, int) {
        if (name == "embedding_model") {
          has_embedding_model = true;
        }
      };
  if (!has_embedding_model) {
    db_ << "ALTER TABLE documents ADD COLUMN embedding_model TEXT NOT NULL DEFAULT '';";
  }
}

void SnapshotStore::save(const IndexedDocument &document) {
  if (!document.index || !document.metadata) {
    throw SnapshotStoreError("Cannot save " + document.fingerprint + " without index and metadata");
  }
  if (document.index->size() != document.metadata->size()) {
    throw SnapshotStoreError("Refusing to save " + document.fingerprint + ": " +
                             std::to_string(document.metadata->size()) + " metadata rows for " +
                             std::to_string(document.index->size()) + " vectors");
  }

  const std::vector<uint8_t> serialized = document.index->serialize();
  const std::vector<char> index_blob(serialized.begin(), serialized.end());

  std::lock_guard<std::mutex> lock(mutex_);
  try {
    db::Transaction tx(db_, true);
    db_ << "DELETE FROM documents WHERE fingerprint = ?;" << document.fingerprint;
    db_ << "INSERT INTO documents (fingerprint, content_hash, embedding_model, dimension, "
           "chunk_count, index_blob) VALUES (?, ?, ?, ?, ?, ?);"
        << document.fingerprint << document.content_hash << document.embedding_model
        << static_cast<int64_t>(document.index->dimension())
        << static_cast<int64_t>(document.metadata->size()) << index_blob;
    const int64_t document_id = db_.last_insert_rowid();

    const auto &rows = document.metadata->rows();
    for (size_t i = 0; i < rows.size(); ++i) {
      const Chunk &row = rows[i];
      db_ << "INSERT INTO chunks (document_id, row_index, source, page, clause_number, content) "
             "VALUES (?, ?, ?, ?, ?, ?);"
          << document_id << static_cast<int64_t>(i) << row.source << row.page << row.clause_number
          << CompressionService::compress(row.text);
    }
    tx.commit();
  } catch (const sqlite::sqlite_exception &e) {
    throw SnapshotStoreError(format_db_error("Save snapshot " + document.fingerprint, e));
  }
  std::cout << "Saved snapshot for " << document.fingerprint << " (" << document.metadata->size()
            << " chunks)" << std::endl;
}

IndexedDocumentPtr SnapshotStore::load(const std::string &fingerprint,
                                       const std::string &embedding_model,
                                       size_t expected_dimension) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::optional<int64_t> document_id;
  std::string content_hash;
  std::string stored_model;
  int64_t dimension = 0;
  int64_t chunk_count = 0;
  std::vector<char> index_blob;
  std::vector<Chunk> rows;

  try {
    db_ << "SELECT id, content_hash, embedding_model, dimension, chunk_count, index_blob "
           "FROM documents WHERE fingerprint = ?;"
        << fingerprint >>
        [&](int64_t id, std::string hash, std::string model, int64_t dim, int64_t count,
            std::vector<char> blob) {
          document_id = id;
          content_hash = std::move(hash);
          stored_model = std::move(model);
          dimension = dim;
          chunk_count = count;
          index_blob = std::move(blob);
        };
    if (!document_id) {
      return nullptr;
    }
    if (stored_model != embedding_model ||
        (expected_dimension != 0 && dimension != static_cast<int64_t>(expected_dimension))) {
      std::cout << "Snapshot for " << fingerprint << " was embedded with '" << stored_model
                << "' (dimension " << dimension << "), need '" << embedding_model << "'"
                << std::endl;
      return nullptr;
    }

    int64_t expected_row = 0;
    bool rows_contiguous = true;
    db_ << "SELECT row_index, source, page, clause_number, content FROM chunks "
           "WHERE document_id = ? ORDER BY row_index;"
        << *document_id >>
        [&](int64_t row_index, std::string source, std::optional<int> page,
            std::optional<std::string> clause_number, std::vector<char> content) {
          if (row_index != expected_row++) {
            rows_contiguous = false;
          }
          rows.push_back({CompressionService::decompress(content), std::move(source), page,
                          std::move(clause_number)});
        };
    if (!rows_contiguous) {
      throw SnapshotStoreError("Snapshot " + fingerprint + " has gaps in its chunk rows");
    }
  } catch (const sqlite::sqlite_exception &e) {
    throw SnapshotStoreError(format_db_error("Load snapshot " + fingerprint, e));
  } catch (const CompressionError &e) {
    throw SnapshotStoreError("Snapshot " + fingerprint + " has corrupt chunk text: " + e.what());
  }

  std::unique_ptr<VectorIndex> index;
  try {
    index = VectorIndex::deserialize(std::vector<uint8_t>(index_blob.begin(), index_blob.end()));
  } catch (const NotFoundError &e) {
    throw SnapshotStoreError("Snapshot " + fingerprint + " has an unreadable index: " + e.what());
  }

  if (static_cast<int64_t>(index->dimension()) != dimension) {
    throw SnapshotStoreError("Snapshot " + fingerprint + " dimension mismatch: recorded " +
                             std::to_string(dimension) + ", index has " +
                             std::to_string(index->dimension()));
  }
  if (static_cast<int64_t>(rows.size()) != chunk_count ||
      static_cast<int64_t>(index->size()) != chunk_count) {
    throw SnapshotStoreError("Snapshot " + fingerprint + " is misaligned: recorded " +
                             std::to_string(chunk_count) + " chunks, found " +
                             std::to_string(rows.size()) + " rows and " +
                             std::to_string(index->size()) + " vectors");
  }

  auto document = std::make_shared<IndexedDocument>();
  document->fingerprint = fingerprint;
  document->index = std::move(index);
  document->metadata = std::make_shared<MetadataTable>(std::move(rows));
  document->content_hash = std::move(content_hash);
  document->embedding_model = std::move(stored_model);
  return document;
}

bool SnapshotStore::contains(const std::string &fingerprint) {
  std::lock_guard<std::mutex> lock(mutex_);
  try {
    int count = 0;
    db_ << "SELECT COUNT(*) FROM documents WHERE fingerprint = ?;" << fingerprint >> count;
    return count > 0;
  } catch (const sqlite::sqlite_exception &e) {
    throw SnapshotStoreError(format_db_error("Check snapshot " + fingerprint, e));
  }
}

bool SnapshotStore::remove(const std::string &fingerprint) {
  std::lock_guard<std::mutex> lock(mutex_);
  try {
    db_ << "DELETE FROM documents WHERE fingerprint = ?;" << fingerprint;
    return db_.rows_modified() > 0;
  } catch (const sqlite::sqlite_exception &e) {
    throw SnapshotStoreError(format_db_error("Remove snapshot " + fingerprint, e));
  }
}

size_t SnapshotStore::count() {
  std::lock_guard<std::mutex> lock(mutex_);
  try {
    int64_t count = 0;
    db_ << "SELECT COUNT(*) FROM documents;" >> count;
    return static_cast<size_t>(count);
  } catch (const sqlite::sqlite_exception &e) {
    throw SnapshotStoreError(format_db_error("Count snapshots", e));
  }
}

}  // namespace docqa_core
