#include "docqa_core/llm/hashing_embedder.hpp"

#include <cctype>
#include <cmath>

#include "docqa_core/errors.hpp"

namespace docqa_core {

HashingEmbedder::HashingEmbedder(size_t dimension) : dimension_(dimension) {
  if (dimension_ == 0) {
    throw InvalidParameterError("HashingEmbedder dimension must be greater than 0");
  }
}

uint64_t HashingEmbedder::fnv1a(const std::string &token) {
  uint64_t hash = 14695981039346656037ULL;
  for (unsigned char c : token) {
    hash ^= c;
    hash *= 1099511628211ULL;
  }
  return hash;
}

Embedding HashingEmbedder::embed_text(const std::string &text) const {
  Embedding vec(dimension_, 0.0f);

  std::string token;
  auto flush = [&]() {
    if (!token.empty()) {
      vec[fnv1a(token) % dimension_] += 1.0f;
      token.clear();
    }
  };
  for (unsigned char c : text) {
    // Bytes of multi-byte UTF-8 sequences count as word characters
    if (std::isalnum(c) || c >= 0x80) {
      token += static_cast<char>(std::tolower(c));
    } else {
      flush();
    }
  }
  flush();

  float norm = 0.0f;
  for (float v : vec) {
    norm += v * v;
  }
  if (norm > 0.0f) {
    norm = std::sqrt(norm);
    for (float &v : vec) {
      v /= norm;
    }
  }
  return vec;
}

std::vector<Embedding> HashingEmbedder::embed(const std::vector<std::string> &texts) {
  std::vector<Embedding> out;
  out.reserve(texts.size());
  for (const auto &text : texts) {
    out.push_back(embed_text(text));
  }
  return out;
}

}  // namespace docqa_core
