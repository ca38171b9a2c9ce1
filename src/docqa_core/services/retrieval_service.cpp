#include "docqa_core/services/retrieval_service.hpp"

#include <algorithm>

#include "docqa_core/errors.hpp"

namespace docqa_core {

RetrievalEngine::RetrievalEngine(EmbedderPtr embedder, RetrievalSettings settings)
    : embedder_(std::move(embedder)), settings_(settings) {
  if (!embedder_) {
    throw InvalidParameterError("RetrievalEngine requires an embedder");
  }
  if (settings_.overfetch_factor < 1) {
    throw InvalidParameterError("overfetch_factor must be >= 1");
  }
  if (settings_.subindex_max_fraction < 0.0 || settings_.subindex_max_fraction > 1.0) {
    throw InvalidParameterError("subindex_max_fraction must be within [0, 1]");
  }
}

std::vector<RetrievedChunk> RetrievalEngine::retrieve(const std::string &query,
                                                      const IndexedDocument &document,
                                                      int k,
                                                      const RetrievalFilter &filter) const {
  if (k < 1) {
    throw InvalidParameterError("k must be >= 1, got " + std::to_string(k));
  }
  if (query.find_first_not_of(" \t\r\n\f\v") == std::string::npos) {
    return {};
  }
  if (!document.index || !document.metadata) {
    throw NotFoundError("Document " + document.fingerprint + " has no index");
  }

  std::vector<float> query_vector = embedder_->embed_one(query);
  VectorIndex::normalize(query_vector);

  std::vector<SearchHit> hits = filter.empty()
                                    ? document.index->search(query_vector, k)
                                    : search_filtered(query_vector, document, k, filter);
  return to_chunks(hits, *document.metadata);
}

std::vector<SearchHit> RetrievalEngine::search_filtered(const std::vector<float> &query_vector,
                                                        const IndexedDocument &document,
                                                        int k,
                                                        const RetrievalFilter &filter) const {
  const VectorIndex &index = *document.index;
  const MetadataTable &metadata = *document.metadata;

  std::vector<int64_t> allowed = metadata.allowed_ids(filter);
  if (allowed.empty()) {
    return {};
  }
  if (allowed.size() == index.size()) {
    return index.search(query_vector, k);
  }

  const double fraction = static_cast<double>(allowed.size()) / static_cast<double>(index.size());
  if (fraction > settings_.subindex_max_fraction) {
    // Over-retrieve and filter in place
    const int64_t search_k =
        std::max<int64_t>(k, static_cast<int64_t>(k) * settings_.overfetch_factor);
    std::vector<SearchHit> candidates = index.search(
        query_vector, static_cast<int>(std::min<int64_t>(search_k, index.size())));

    std::vector<SearchHit> survivors;
    for (const auto &hit : candidates) {
      if (metadata.matches(hit.id, filter)) {
        survivors.push_back(hit);
        if (static_cast<int>(survivors.size()) == k) {
          return survivors;
        }
      }
    }
    // Allowed rows outside the candidate set could still rank in the top k
    if (survivors.size() == allowed.size()) {
      return survivors;
    }
  }

  return index.subset(allowed)->search(query_vector, k);
}

std::vector<RetrievedChunk> RetrievalEngine::to_chunks(const std::vector<SearchHit> &hits,
                                                       const MetadataTable &metadata) {
  std::vector<RetrievedChunk> chunks;
  chunks.reserve(hits.size());
  for (const auto &hit : hits) {
    const Chunk &row = metadata.at(hit.id);
    chunks.push_back({row.text, row.source, row.page, row.clause_number, hit.score});
  }
  return chunks;
}

}  // namespace docqa_core
