#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "docqa_core/types/chunk.hpp"

namespace docqa_core {

// Metadata constraints for retrieval. Set fields combine with AND; an unset
// field does not constrain.
struct RetrievalFilter {
  std::optional<std::string> source;
  // Inclusive page range. Either bound may be left open.
  std::optional<int> page_from;
  std::optional<int> page_to;
  std::optional<std::string> clause_number;

  bool empty() const {
    return !source && !page_from && !page_to && !clause_number;
  }
};

/**
 * @class MetadataTable
 * @brief Chunk rows aligned one-to-one with the rows of a VectorIndex.
 *
 * Row i describes vector i. Secondary indexes by source, page and clause
 * number let filters enumerate the allowed rows without a scan.
 */
class MetadataTable {
 public:
  explicit MetadataTable(std::vector<Chunk> rows);

  size_t size() const {
    return rows_.size();
  }

  // @throw NotFoundError if id is out of range.
  const Chunk &at(int64_t id) const;

  const std::vector<Chunk> &rows() const {
    return rows_;
  }

  bool matches(int64_t id, const RetrievalFilter &filter) const;

  // Ascending row ids satisfying every set field of the filter.
  std::vector<int64_t> allowed_ids(const RetrievalFilter &filter) const;

 private:
  std::vector<Chunk> rows_;
  std::unordered_map<std::string, std::vector<int64_t>> by_source_;
  std::map<int, std::vector<int64_t>> by_page_;
  std::unordered_map<std::string, std::vector<int64_t>> by_clause_;

  static std::string trim(const std::string &value);
};

}  // namespace docqa_core
