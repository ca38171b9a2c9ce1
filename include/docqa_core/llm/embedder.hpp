#pragma once

#include <memory>
#include <string>
#include <vector>

namespace docqa_core {

using Embedding = std::vector<float>;

/**
 * @class Embedder
 * @brief Maps text to fixed-dimension vectors.
 *
 * Implementations must be deterministic for a given model and return one
 * vector per input, all of the same dimension. Safe to call concurrently.
 */
class Embedder {
 public:
  virtual ~Embedder() = default;

  virtual std::vector<Embedding> embed(const std::vector<std::string> &texts) = 0;

  virtual Embedding embed_one(const std::string &text) {
    std::vector<Embedding> out = embed({text});
    return out.empty() ? Embedding{} : std::move(out.front());
  }

  // 0 until the dimension is known (e.g. before the first remote call)
  virtual size_t dimension() const = 0;

  // Identifies the vector space, e.g. "ollama:mxbai-embed-large". Vectors
  // from embedders with different ids must never be compared.
  virtual std::string model_id() const = 0;
};

using EmbedderPtr = std::shared_ptr<Embedder>;

}  // namespace docqa_core
