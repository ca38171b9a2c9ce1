#pragma once
#include <faiss/IndexFlat.h>

#include <cstdint>
#include <memory>
#include <vector>

namespace docqa_core {

struct SearchHit {
  int64_t id;
  // Inner product of unit vectors, i.e. cosine similarity in [-1, 1]
  float score;
};

/**
 * @class VectorIndex
 * @brief Exact inner-product similarity index over unit-normalized vectors.
 *
 * Row i holds the i-th vector passed to build(). The index is immutable after
 * construction and safe for concurrent searches.
 */
class VectorIndex {
 public:
  /**
   * @throw InvalidParameterError if dimension is 0.
   * @throw DimensionMismatchError if any vector's length differs from dimension.
   */
  static std::unique_ptr<VectorIndex> build(const std::vector<std::vector<float>> &vectors,
                                            size_t dimension);

  // Restores an index written by serialize(). Throws NotFoundError on a blob
  // that does not hold a flat inner-product index.
  static std::unique_ptr<VectorIndex> deserialize(const std::vector<uint8_t> &blob);

  ~VectorIndex();

  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;

  /**
   * @brief Returns at most k hits by descending score, ties by ascending id.
   *
   * The query is normalized before searching.
   * @throw InvalidParameterError if k < 1.
   * @throw DimensionMismatchError if the query has the wrong length.
   */
  std::vector<SearchHit> search(const std::vector<float> &query_vector, int k) const;

  // @throw NotFoundError if id is out of range.
  std::vector<float> reconstruct(int64_t id) const;

  /**
   * @brief Builds a temporary index over the given rows.
   *
   * Hits from the returned index carry the original ids. Vectors are copied via
   * reconstruct(), so scores match a search over the full index exactly.
   */
  std::unique_ptr<VectorIndex> subset(const std::vector<int64_t> &ids) const;

  std::vector<uint8_t> serialize() const;

  size_t size() const;
  size_t dimension() const {
    return dimension_;
  }

  static void normalize(std::vector<float> &vector);

 private:
  VectorIndex(std::unique_ptr<faiss::IndexFlatIP> index, size_t dimension);

  std::unique_ptr<faiss::IndexFlatIP> index_;
  size_t dimension_;
  // Set on subset indexes: row -> id in the parent index
  std::vector<int64_t> row_to_id_;

  void validate_vector_dimension(const std::vector<float> &vector) const;
};

}  // namespace docqa_core
