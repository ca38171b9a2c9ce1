#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docqa_core/cache/document_cache.hpp"
#include "docqa_core/index/metadata_table.hpp"
#include "docqa_core/llm/embedder.hpp"

namespace docqa_core {

struct RetrievedChunk {
  std::string text;
  std::string source;
  std::optional<int> page;
  std::optional<std::string> clause_number;
  float score;
};

struct RetrievalSettings {
  // Filtered searches over-retrieve k * overfetch_factor candidates
  int overfetch_factor = 16;
  // Filters allowing at most this share of rows search a sub-index instead
  double subindex_max_fraction = 0.25;
};

/**
 * @class RetrievalEngine
 * @brief Top-k semantic retrieval over an indexed document.
 *
 * Stateless apart from its collaborators; safe to call from many threads.
 */
class RetrievalEngine {
 public:
  RetrievalEngine(EmbedderPtr embedder, RetrievalSettings settings = {});

  /**
   * @brief Returns up to k chunks by descending similarity to the query.
   *
   * A blank query yields no results. Filtered results are exactly the top-k of
   * the allowed rows; fewer than k are returned when fewer rows match.
   *
   * @throw InvalidParameterError if k < 1.
   * @throw DimensionMismatchError if the query embedding does not fit the index.
   */
  std::vector<RetrievedChunk> retrieve(const std::string &query,
                                       const IndexedDocument &document,
                                       int k,
                                       const RetrievalFilter &filter = {}) const;

  const RetrievalSettings &settings() const {
    return settings_;
  }

 private:
  EmbedderPtr embedder_;
  RetrievalSettings settings_;

  std::vector<SearchHit> search_filtered(const std::vector<float> &query_vector,
                                         const IndexedDocument &document,
                                         int k,
                                         const RetrievalFilter &filter) const;
  static std::vector<RetrievedChunk> to_chunks(const std::vector<SearchHit> &hits,
                                               const MetadataTable &metadata);
};

}  // namespace docqa_core
