#pragma once

#include <memory>
#include <string>

#include "docqa_core/cache/document_cache.hpp"
#include "docqa_core/chunking/chunker.hpp"
#include "docqa_core/extractors/content_extractor_factory.hpp"
#include "docqa_core/io/document_fetcher.hpp"
#include "docqa_core/llm/embedder.hpp"

namespace docqa_core {

struct IndexerSettings {
  int chunk_size = Chunker::DEFAULT_CHUNK_SIZE;
  int chunk_overlap = Chunker::DEFAULT_OVERLAP;
  size_t embedding_batch_size = 64;
};

/**
 * @class DocumentIndexer
 * @brief Turns a document location into an IndexedDocument.
 *
 * fetch -> extract and clean -> chunk -> embed in batches -> build index.
 * Metadata row i is always the chunk whose embedding is vector i.
 *
 * A collection location (a local folder) becomes one corpus index. Its
 * supported files are indexed in sorted name order, each chunk tagged with
 * the file's name relative to the folder as its source.
 */
class DocumentIndexer {
 public:
  DocumentIndexer(DocumentFetcherPtr fetcher,
                  std::shared_ptr<ContentExtractorFactory> extractor_factory,
                  TokenizerPtr tokenizer,
                  EmbedderPtr embedder,
                  IndexerSettings settings = {});

  /**
   * @throw DownloadError if the document cannot be fetched.
   * @throw ExtractionError if no text remains after cleaning.
   * @throw DimensionMismatchError if the embedder returns inconsistent vectors.
   */
  IndexedDocumentPtr build(const std::string &fingerprint) const;

  // Hash of the current content without chunking or embedding. Equal to the
  // content_hash build() would record.
  std::string content_hash(const std::string &fingerprint) const;

  // Identity of the vector space new documents are embedded into
  std::string embedding_model() const;
  size_t embedding_dimension() const;

  // File name part of a URL or path, used as the chunk source
  static std::string source_name_of(const std::string &fingerprint);

 private:
  DocumentFetcherPtr fetcher_;
  std::shared_ptr<ContentExtractorFactory> extractor_factory_;
  Chunker chunker_;
  EmbedderPtr embedder_;
  IndexerSettings settings_;

  struct ExtractedFile {
    std::string source;
    ExtractionResult extraction;
  };

  struct ExtractedContent {
    std::vector<ExtractedFile> files;
    std::string content_hash;
  };

  ExtractedContent extract(const std::string &fingerprint) const;
  ExtractedContent extract_collection(const std::string &fingerprint,
                                      const std::vector<std::string> &names) const;
  std::vector<Embedding> embed_in_batches(const std::vector<Chunk> &chunks) const;
};

}  // namespace docqa_core
