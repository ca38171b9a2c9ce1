#include "docqa_core/chunking/chunker.hpp"

#include <algorithm>
#include <cctype>

#include "docqa_core/chunking/clause_extractor.hpp"
#include "docqa_core/errors.hpp"

namespace docqa_core {

namespace {

bool is_blank(const std::string& text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isspace(c); });
}

}  // namespace

Chunker::Chunker(TokenizerPtr tokenizer) : tokenizer_(std::move(tokenizer)) {
  if (!tokenizer_) {
    throw InvalidParameterError("Chunker requires a tokenizer");
  }
}

void Chunker::validate(int chunk_size, int overlap) {
  if (overlap < 0) {
    throw InvalidParameterError("overlap must be >= 0, got " + std::to_string(overlap));
  }
  if (chunk_size <= overlap) {
    // A non-advancing window would never terminate
    throw InvalidParameterError("chunk_size (" + std::to_string(chunk_size) +
                                ") must be greater than overlap (" + std::to_string(overlap) +
                                ")");
  }
}

std::vector<std::string> Chunker::chunk(const std::string& text, int chunk_size, int overlap) const {
  validate(chunk_size, overlap);

  const TokenSequence tokens = tokenizer_->encode(text);
  const size_t n = tokens.size();
  const size_t size = static_cast<size_t>(chunk_size);
  const size_t stride = static_cast<size_t>(chunk_size - overlap);

  std::vector<std::string> out;
  if (n == 0) {
    return out;
  }
  out.reserve((n + stride - 1) / stride);

  for (size_t start = 0; start < n; start += stride) {
    const size_t end = std::min(start + size, n);
    out.push_back(tokenizer_->decode(tokens.begin() + start, tokens.begin() + end));
  }
  return out;
}

std::vector<Chunk> Chunker::chunk_pages(const std::vector<std::string>& pages,
                                        bool page_aware,
                                        const std::string& source,
                                        int chunk_size,
                                        int overlap) const {
  validate(chunk_size, overlap);

  std::vector<Chunk> chunks;
  for (size_t page_index = 0; page_index < pages.size(); ++page_index) {
    for (auto& window : chunk(pages[page_index], chunk_size, overlap)) {
      if (is_blank(window)) {
        continue;
      }
      Chunk chunk;
      chunk.clause_number = ClauseExtractor::from_chunk(window);
      chunk.text = std::move(window);
      chunk.source = source;
      if (page_aware) {
        chunk.page = static_cast<int>(page_index) + 1;
      }
      chunks.push_back(std::move(chunk));
    }
  }
  return chunks;
}

}  // namespace docqa_core
