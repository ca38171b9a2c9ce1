#include "docqa_core/services/qa_service.hpp"

#include <iostream>

#include "docqa_core/chunking/clause_extractor.hpp"
#include "docqa_core/errors.hpp"

namespace docqa_core {

QaService::QaService(std::shared_ptr<DocumentCache> cache,
                     std::shared_ptr<DocumentIndexer> indexer,
                     std::shared_ptr<RetrievalEngine> retrieval,
                     AnswerGeneratorPtr generator,
                     std::shared_ptr<async::WorkerPool> worker_pool,
                     SnapshotStorePtr snapshot_store,
                     QaSettings settings)
    : cache_(std::move(cache)),
      indexer_(std::move(indexer)),
      retrieval_(std::move(retrieval)),
      generator_(std::move(generator)),
      worker_pool_(std::move(worker_pool)),
      snapshot_store_(std::move(snapshot_store)),
      settings_(settings) {
  if (!cache_ || !indexer_ || !retrieval_ || !generator_) {
    throw InvalidParameterError("QaService requires a cache, indexer, retrieval engine and generator");
  }
  if (settings_.top_k < 1) {
    throw InvalidParameterError("top_k must be >= 1");
  }
}

IndexedDocumentPtr QaService::get_document(const std::string &document_url) {
  if (document_url.empty()) {
    throw DownloadError("Document URL is empty");
  }
  return cache_->get_or_build(document_url, [this](const std::string &fingerprint) {
    return worker_pool_ ? build_on_pool(fingerprint) : build_document(fingerprint);
  });
}

IndexedDocumentPtr QaService::build_on_pool(const std::string &fingerprint) {
  std::future<IndexedDocumentPtr> result =
      worker_pool_->submit([this, fingerprint]() { return build_document(fingerprint); });
  return result.get();
}

IndexedDocumentPtr QaService::restore_snapshot(const std::string &fingerprint) {
  IndexedDocumentPtr restored;
  try {
    restored = snapshot_store_->load(fingerprint, indexer_->embedding_model(),
                                     indexer_->embedding_dimension());
  } catch (const SnapshotStoreError &e) {
    std::cerr << "Warning: ignoring unusable snapshot for " << fingerprint << ": " << e.what()
              << std::endl;
    return nullptr;
  }
  if (!restored || (settings_.revalidate_snapshots && !snapshot_is_current(*restored))) {
    return nullptr;
  }
  std::cout << "Restored " << fingerprint << " from snapshot" << std::endl;
  return restored;
}

bool QaService::snapshot_is_current(const IndexedDocument &restored) {
  try {
    if (indexer_->content_hash(restored.fingerprint) == restored.content_hash) {
      return true;
    }
    std::cout << "Content of " << restored.fingerprint << " changed since its snapshot" << std::endl;
    return false;
  } catch (const DownloadError &e) {
    std::cerr << "Warning: could not revalidate " << restored.fingerprint << ", using snapshot: "
              << e.what() << std::endl;
  } catch (const ExtractionError &e) {
    std::cerr << "Warning: could not revalidate " << restored.fingerprint << ", using snapshot: "
              << e.what() << std::endl;
  }
  return true;
}

IndexedDocumentPtr QaService::build_document(const std::string &fingerprint) {
  if (snapshot_store_) {
    if (IndexedDocumentPtr restored = restore_snapshot(fingerprint)) {
      return restored;
    }
  }

  IndexedDocumentPtr document = indexer_->build(fingerprint);

  if (snapshot_store_) {
    try {
      snapshot_store_->save(*document);
    } catch (const SnapshotStoreError &e) {
      std::cerr << "Warning: could not save snapshot for " << fingerprint << ": " << e.what()
                << std::endl;
    }
  }
  return document;
}

std::vector<RetrievedChunk> QaService::retrieve_for_question(const std::string &question,
                                                             const IndexedDocument &document,
                                                             const RetrievalFilter &filter) const {
  if (!settings_.auto_clause_filter || filter.clause_number) {
    return retrieval_->retrieve(question, document, settings_.top_k, filter);
  }

  std::optional<std::string> clause = ClauseExtractor::from_query(question);
  if (!clause) {
    return retrieval_->retrieve(question, document, settings_.top_k, filter);
  }

  RetrievalFilter clause_filter = filter;
  clause_filter.clause_number = clause;
  std::vector<RetrievedChunk> chunks =
      retrieval_->retrieve(question, document, settings_.top_k, clause_filter);
  if (chunks.empty()) {
    std::cerr << "Warning: no chunks found for clause " << *clause
              << ", falling back to unfiltered retrieval" << std::endl;
    return retrieval_->retrieve(question, document, settings_.top_k, filter);
  }
  return chunks;
}

std::string QaService::answer_one(const IndexedDocument &document,
                                  const std::string &question,
                                  const ConversationWindow &window,
                                  const RetrievalFilter &filter,
                                  std::vector<RetrievedChunk> &sources) {
  sources = retrieve_for_question(question, document, filter);
  if (sources.empty()) {
    return NO_EVIDENCE_ANSWER;
  }
  return generator_->generate(window, question, build_context(sources));
}

std::vector<QaAnswer> QaService::answer_questions(const std::string &document_url,
                                                  const std::vector<std::string> &questions) {
  std::vector<QaAnswer> answers;
  answers.reserve(questions.size());

  IndexedDocumentPtr document;
  try {
    document = get_document(document_url);
  } catch (const std::exception &e) {
    std::cerr << "Failed to index " << document_url << ": " << e.what() << std::endl;
    for (const auto &question : questions) {
      answers.push_back({question, e.what()});
    }
    return answers;
  }

  ConversationWindow window;
  for (const auto &question : questions) {
    std::vector<RetrievedChunk> sources;
    std::string answer = answer_one(*document, question, window, {}, sources);
    window = conversation::record_exchange(std::move(window), question, answer,
                                           settings_.window_exchanges);
    answers.push_back({question, std::move(answer)});
  }
  return answers;
}

AskResult QaService::ask(const std::string &document_url,
                         const std::string &question,
                         const ConversationWindow &history,
                         const RetrievalFilter &filter) {
  IndexedDocumentPtr document = get_document(document_url);
  ConversationWindow window = conversation::trim(history, settings_.window_exchanges);

  AskResult result;
  result.answer = answer_one(*document, question, window, filter, result.sources);
  result.history = conversation::record_exchange(std::move(window), question, result.answer,
                                                 settings_.window_exchanges);
  return result;
}

std::vector<RetrievedChunk> QaService::search(const std::string &document_url,
                                              const std::string &query,
                                              int k,
                                              const RetrievalFilter &filter) {
  IndexedDocumentPtr document = get_document(document_url);
  return retrieval_->retrieve(query, *document, k, filter);
}

std::string QaService::build_context(const std::vector<RetrievedChunk> &chunks) {
  std::string context;
  for (const auto &chunk : chunks) {
    context += "[From " + chunk.source + " | Page " +
               (chunk.page ? std::to_string(*chunk.page) : std::string("N/A")) + " | Clause " +
               chunk.clause_number.value_or("N/A") + "]\n" + chunk.text + "\n\n";
  }
  return context;
}

}  // namespace docqa_core
