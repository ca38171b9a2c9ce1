#include "docqa_core/index/vector_index.hpp"

#include <faiss/impl/FaissException.h>
#include <faiss/impl/io.h>
#include <faiss/index_io.h>
#include <faiss/utils/distances.h>

#include <algorithm>

#include "docqa_core/errors.hpp"

namespace docqa_core {

VectorIndex::VectorIndex(std::unique_ptr<faiss::IndexFlatIP> index, size_t dimension)
    : index_(std::move(index)), dimension_(dimension) {}

VectorIndex::~VectorIndex() = default;

void VectorIndex::normalize(std::vector<float> &vector) {
  if (vector.empty()) {
    return;
  }
  // Zero vectors are left untouched
  faiss::fvec_renorm_L2(vector.size(), 1, vector.data());
}

std::unique_ptr<VectorIndex> VectorIndex::build(const std::vector<std::vector<float>> &vectors,
                                                size_t dimension) {
  if (dimension == 0) {
    throw InvalidParameterError("Vector index dimension must be greater than 0");
  }

  std::vector<float> all_vectors_flat;
  all_vectors_flat.reserve(vectors.size() * dimension);
  for (const auto &vector : vectors) {
    if (vector.size() != dimension) {
      throw DimensionMismatchError(dimension, vector.size());
    }
    all_vectors_flat.insert(all_vectors_flat.end(), vector.begin(), vector.end());
  }

  auto index = std::make_unique<faiss::IndexFlatIP>(static_cast<faiss::idx_t>(dimension));
  if (!vectors.empty()) {
    faiss::fvec_renorm_L2(dimension, vectors.size(), all_vectors_flat.data());
    index->add(static_cast<faiss::idx_t>(vectors.size()), all_vectors_flat.data());
  }
  return std::unique_ptr<VectorIndex>(new VectorIndex(std::move(index), dimension));
}

std::unique_ptr<VectorIndex> VectorIndex::deserialize(const std::vector<uint8_t> &blob) {
  faiss::VectorIOReader reader;
  reader.data = blob;

  std::unique_ptr<faiss::Index> raw;
  try {
    raw.reset(faiss::read_index(&reader));
  } catch (const faiss::FaissException &e) {
    throw NotFoundError("Serialized vector index could not be read: " + std::string(e.what()));
  }

  auto *flat = dynamic_cast<faiss::IndexFlatIP *>(raw.get());
  if (!flat) {
    throw NotFoundError("Serialized index is not a flat inner-product index");
  }
  raw.release();
  const auto dimension = static_cast<size_t>(flat->d);
  return std::unique_ptr<VectorIndex>(
      new VectorIndex(std::unique_ptr<faiss::IndexFlatIP>(flat), dimension));
}

std::vector<uint8_t> VectorIndex::serialize() const {
  faiss::VectorIOWriter writer;
  faiss::write_index(index_.get(), &writer);
  return std::move(writer.data);
}

size_t VectorIndex::size() const {
  return static_cast<size_t>(index_->ntotal);
}

void VectorIndex::validate_vector_dimension(const std::vector<float> &vector) const {
  if (vector.size() != dimension_) {
    throw DimensionMismatchError(dimension_, vector.size());
  }
}

std::vector<SearchHit> VectorIndex::search(const std::vector<float> &query_vector, int k) const {
  if (k < 1) {
    throw InvalidParameterError("k must be >= 1, got " + std::to_string(k));
  }
  validate_vector_dimension(query_vector);

  const auto total = static_cast<int64_t>(index_->ntotal);
  const int64_t actual_k = std::min<int64_t>(k, total);
  if (actual_k <= 0) {
    return {};
  }

  std::vector<float> query = query_vector;
  normalize(query);

  std::vector<float> distances(actual_k);
  std::vector<faiss::idx_t> labels(actual_k);
  index_->search(1, query.data(), actual_k, distances.data(), labels.data());

  std::vector<SearchHit> hits;
  hits.reserve(actual_k);
  for (int64_t i = 0; i < actual_k; ++i) {
    if (labels[i] < 0) {
      continue;
    }
    const int64_t id = row_to_id_.empty() ? labels[i] : row_to_id_[labels[i]];
    hits.push_back({id, distances[i]});
  }

  std::stable_sort(hits.begin(), hits.end(), [](const SearchHit &a, const SearchHit &b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.id < b.id;
  });
  return hits;
}

std::vector<float> VectorIndex::reconstruct(int64_t id) const {
  if (id < 0 || id >= static_cast<int64_t>(index_->ntotal)) {
    throw NotFoundError("Vector id " + std::to_string(id) + " is out of range [0, " +
                        std::to_string(index_->ntotal) + ")");
  }
  std::vector<float> vector(dimension_);
  index_->reconstruct(id, vector.data());
  return vector;
}

std::unique_ptr<VectorIndex> VectorIndex::subset(const std::vector<int64_t> &ids) const {
  std::vector<float> all_vectors_flat;
  all_vectors_flat.reserve(ids.size() * dimension_);
  std::vector<int64_t> row_to_id;
  row_to_id.reserve(ids.size());

  for (int64_t id : ids) {
    std::vector<float> vector = reconstruct(id);
    all_vectors_flat.insert(all_vectors_flat.end(), vector.begin(), vector.end());
    row_to_id.push_back(row_to_id_.empty() ? id : row_to_id_[id]);
  }

  // Stored vectors are already unit length; re-normalizing could perturb scores
  auto index = std::make_unique<faiss::IndexFlatIP>(static_cast<faiss::idx_t>(dimension_));
  if (!ids.empty()) {
    index->add(static_cast<faiss::idx_t>(ids.size()), all_vectors_flat.data());
  }
  auto sub = std::unique_ptr<VectorIndex>(new VectorIndex(std::move(index), dimension_));
  sub->row_to_id_ = std::move(row_to_id);
  return sub;
}

}  // namespace docqa_core
