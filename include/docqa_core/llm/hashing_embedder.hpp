#pragma once

#include <cstdint>
#include <string>

#include "docqa_core/llm/embedder.hpp"

namespace docqa_core {

// Hash-based bag-of-words embedder (hashing trick). Lower-cases the text,
// splits on non-alphanumeric ASCII, hashes each token into a fixed-size
// vector with FNV-1a and L2-normalizes. Needs no model server.
class HashingEmbedder : public Embedder {
 public:
  static constexpr size_t DEFAULT_DIMENSION = 1024;

  explicit HashingEmbedder(size_t dimension = DEFAULT_DIMENSION);

  std::vector<Embedding> embed(const std::vector<std::string> &texts) override;
  size_t dimension() const override {
    return dimension_;
  }
  std::string model_id() const override {
    return "hashing:" + std::to_string(dimension_);
  }

  Embedding embed_text(const std::string &text) const;

 private:
  size_t dimension_;

  static uint64_t fnv1a(const std::string &token);
};

}  // namespace docqa_core
