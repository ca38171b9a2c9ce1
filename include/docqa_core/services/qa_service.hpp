#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docqa_core/async/worker_pool.hpp"
#include "docqa_core/cache/document_cache.hpp"
#include "docqa_core/db/snapshot_store.hpp"
#include "docqa_core/llm/answer_generator.hpp"
#include "docqa_core/services/conversation.hpp"
#include "docqa_core/services/document_indexer.hpp"
#include "docqa_core/services/retrieval_service.hpp"

namespace docqa_core {

struct QaSettings {
  int top_k = 3;
  int window_exchanges = conversation::DEFAULT_WINDOW_EXCHANGES;
  // Restrict retrieval to a clause named in the question, falling back to an
  // unfiltered search when nothing matches
  bool auto_clause_filter = false;
  // Re-fetch a restored document and rebuild it when its content hash changed
  bool revalidate_snapshots = false;
};

struct QaAnswer {
  std::string question;
  std::string answer;
};

struct AskResult {
  std::string answer;
  std::vector<RetrievedChunk> sources;
  ConversationWindow history;
};

/**
 * @class QaService
 * @brief Answers questions about a document: index (cached), retrieve, generate.
 *
 * Index builds run on the worker pool when one is given and are persisted to
 * the snapshot store when one is configured.
 */
class QaService {
 public:
  static constexpr const char *NO_EVIDENCE_ANSWER =
      "I could not find relevant information in the document to answer this question.";

  QaService(std::shared_ptr<DocumentCache> cache,
            std::shared_ptr<DocumentIndexer> indexer,
            std::shared_ptr<RetrievalEngine> retrieval,
            AnswerGeneratorPtr generator,
            std::shared_ptr<async::WorkerPool> worker_pool = nullptr,
            SnapshotStorePtr snapshot_store = nullptr,
            QaSettings settings = {});

  // Cached lookup; builds (or restores from a snapshot) on a miss.
  IndexedDocumentPtr get_document(const std::string &document_url);

  /**
   * @brief Answers the questions in order, sharing one conversation window.
   *
   * If the document cannot be indexed, every answer is the indexing error.
   * @throw GenerationError if the model call fails.
   */
  std::vector<QaAnswer> answer_questions(const std::string &document_url,
                                         const std::vector<std::string> &questions);

  // Single turn against a caller-owned history. The returned history includes this exchange.
  AskResult ask(const std::string &document_url,
                const std::string &question,
                const ConversationWindow &history,
                const RetrievalFilter &filter = {});

  std::vector<RetrievedChunk> search(const std::string &document_url,
                                     const std::string &query,
                                     int k,
                                     const RetrievalFilter &filter = {});

  // "[From <source> | Page <page> | Clause <clause>]\n<text>\n\n" per chunk
  static std::string build_context(const std::vector<RetrievedChunk> &chunks);

  const QaSettings &settings() const {
    return settings_;
  }

 private:
  std::shared_ptr<DocumentCache> cache_;
  std::shared_ptr<DocumentIndexer> indexer_;
  std::shared_ptr<RetrievalEngine> retrieval_;
  AnswerGeneratorPtr generator_;
  std::shared_ptr<async::WorkerPool> worker_pool_;
  SnapshotStorePtr snapshot_store_;
  QaSettings settings_;

  IndexedDocumentPtr build_document(const std::string &fingerprint);
  IndexedDocumentPtr restore_snapshot(const std::string &fingerprint);
  bool snapshot_is_current(const IndexedDocument &restored);
  IndexedDocumentPtr build_on_pool(const std::string &fingerprint);

  std::vector<RetrievedChunk> retrieve_for_question(const std::string &question,
                                                    const IndexedDocument &document,
                                                    const RetrievalFilter &filter) const;

  std::string answer_one(const IndexedDocument &document,
                         const std::string &question,
                         const ConversationWindow &window,
                         const RetrievalFilter &filter,
                         std::vector<RetrievedChunk> &sources);
};

}  // namespace docqa_core
