#include "docqa_core/services/document_indexer.hpp"

#include <iostream>
#include <iterator>

#include "docqa_core/errors.hpp"

namespace docqa_core {

DocumentIndexer::DocumentIndexer(DocumentFetcherPtr fetcher,
                                 std::shared_ptr<ContentExtractorFactory> extractor_factory,
                                 TokenizerPtr tokenizer,
                                 EmbedderPtr embedder,
                                 IndexerSettings settings)
    : fetcher_(std::move(fetcher)),
      extractor_factory_(std::move(extractor_factory)),
      chunker_(std::move(tokenizer)),
      embedder_(std::move(embedder)),
      settings_(settings) {
  if (!fetcher_ || !extractor_factory_ || !embedder_) {
    throw InvalidParameterError("DocumentIndexer requires a fetcher, extractors and an embedder");
  }
  Chunker::validate(settings_.chunk_size, settings_.chunk_overlap);
  if (settings_.embedding_batch_size == 0) {
    throw InvalidParameterError("Embedding batch size must be greater than 0");
  }
}

std::string DocumentIndexer::source_name_of(const std::string &fingerprint) {
  std::string path = fingerprint.substr(0, fingerprint.find_first_of("?#"));
  while (!path.empty() && (path.back() == '/' || path.back() == '\\')) {
    path.pop_back();
  }
  const auto slash = path.find_last_of("/\\");
  std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
  return name.empty() ? fingerprint : name;
}

std::string DocumentIndexer::embedding_model() const {
  return embedder_->model_id();
}

size_t DocumentIndexer::embedding_dimension() const {
  return embedder_->dimension();
}

DocumentIndexer::ExtractedContent DocumentIndexer::extract(const std::string &fingerprint) const {
  if (auto names = fetcher_->list_documents(fingerprint)) {
    return extract_collection(fingerprint, *names);
  }

  const std::string raw_content = fetcher_->fetch(fingerprint);
  const ContentExtractor &extractor = extractor_factory_->get_extractor_for(fingerprint);
  ExtractionResult extraction = extractor.extract(raw_content);
  if (extraction.pages.empty()) {
    throw ExtractionError("No text could be extracted from " + fingerprint);
  }

  ExtractedContent content;
  content.content_hash = extraction.content_hash;
  content.files.push_back({source_name_of(fingerprint), std::move(extraction)});
  return content;
}

DocumentIndexer::ExtractedContent DocumentIndexer::extract_collection(
    const std::string &fingerprint, const std::vector<std::string> &names) const {
  std::string base = fingerprint;
  while (!base.empty() && (base.back() == '/' || base.back() == '\\')) {
    base.pop_back();
  }

  ExtractedContent content;
  std::string hash_input;
  for (const auto &name : names) {
    if (!extractor_factory_->supports(name)) {
      continue;
    }
    const std::string location = base + "/" + name;
    try {
      ExtractionResult extraction =
          extractor_factory_->get_extractor_for(name).extract(fetcher_->fetch(location));
      if (extraction.pages.empty()) {
        std::cerr << "Warning: skipping " << location << ": no text extracted" << std::endl;
        continue;
      }
      hash_input += name + '\n' + extraction.content_hash + '\n';
      content.files.push_back({name, std::move(extraction)});
    } catch (const ExtractionError &e) {
      std::cerr << "Warning: skipping " << location << ": " << e.what() << std::endl;
    } catch (const DownloadError &e) {
      std::cerr << "Warning: skipping " << location << ": " << e.what() << std::endl;
    }
  }

  if (content.files.empty()) {
    throw ExtractionError("No supported documents with text under " + fingerprint);
  }
  content.content_hash = ContentExtractor::compute_hash_from_content(hash_input);
  std::cout << "Collected " << content.files.size() << " documents from " << fingerprint
            << std::endl;
  return content;
}

std::string DocumentIndexer::content_hash(const std::string &fingerprint) const {
  return extract(fingerprint).content_hash;
}

IndexedDocumentPtr DocumentIndexer::build(const std::string &fingerprint) const {
  std::cout << "Indexing document: " << fingerprint << std::endl;

  // 1. Fetch and extract
  ExtractedContent content = extract(fingerprint);

  // 2. Chunk, file by file in listing order
  std::vector<Chunk> chunks;
  for (const auto &file : content.files) {
    std::vector<Chunk> file_chunks =
        chunker_.chunk_pages(file.extraction.pages, file.extraction.page_aware, file.source,
                             settings_.chunk_size, settings_.chunk_overlap);
    chunks.insert(chunks.end(), std::make_move_iterator(file_chunks.begin()),
                  std::make_move_iterator(file_chunks.end()));
  }
  if (chunks.empty()) {
    throw ExtractionError("Document " + fingerprint + " produced no chunks");
  }

  // 3. Embed
  std::vector<Embedding> embeddings = embed_in_batches(chunks);
  const size_t dimension = embeddings.front().size();

  // 4. Build
  auto document = std::make_shared<IndexedDocument>();
  document->fingerprint = fingerprint;
  document->index = VectorIndex::build(embeddings, dimension);
  document->metadata = std::make_shared<MetadataTable>(std::move(chunks));
  document->content_hash = std::move(content.content_hash);
  document->embedding_model = embedder_->model_id();

  std::cout << "Indexed " << document->metadata->size() << " chunks (dimension " << dimension
            << ") for " << fingerprint << std::endl;
  return document;
}

std::vector<Embedding> DocumentIndexer::embed_in_batches(const std::vector<Chunk> &chunks) const {
  std::vector<Embedding> embeddings;
  embeddings.reserve(chunks.size());

  std::vector<std::string> batch;
  batch.reserve(settings_.embedding_batch_size);
  auto flush = [&]() {
    std::vector<Embedding> vectors = embedder_->embed(batch);
    if (vectors.size() != batch.size()) {
      throw DimensionMismatchError("Embedder returned " + std::to_string(vectors.size()) +
                                   " vectors for " + std::to_string(batch.size()) + " chunks");
    }
    for (auto &vector : vectors) {
      if (vector.empty()) {
        throw DimensionMismatchError("Received empty embedding for a chunk");
      }
      embeddings.push_back(std::move(vector));
    }
    batch.clear();
  };

  for (size_t i = 0; i < chunks.size(); ++i) {
    batch.push_back(chunks[i].text);
    if (batch.size() >= settings_.embedding_batch_size) {
      flush();
    }
    if (i % 64 == 0) {
      std::cout << "Embedding chunk " << (i + 1) << " of " << chunks.size() << std::endl;
    }
  }
  if (!batch.empty()) {
    flush();
  }
  return embeddings;
}

}  // namespace docqa_core
