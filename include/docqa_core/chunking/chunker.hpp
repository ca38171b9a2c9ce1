#pragma once

#include <string>
#include <vector>

#include "docqa_core/chunking/tokenizer.hpp"
#include "docqa_core/types/chunk.hpp"

namespace docqa_core {

/**
 * @class Chunker
 * @brief Splits cleaned document text into overlapping token windows.
 *
 * Windows are [start, start + chunk_size) over the token sequence, with start
 * advancing by chunk_size - overlap until it reaches the end. The last window
 * may be shorter. Output is a pure function of (text, chunk_size, overlap) and
 * the tokenizer, so rebuilding an index from the same text yields the same rows.
 */
class Chunker {
 public:
  // --- Token-based defaults ---
  static constexpr int DEFAULT_CHUNK_SIZE = 512;
  static constexpr int DEFAULT_OVERLAP = 64;

  explicit Chunker(TokenizerPtr tokenizer);

  /**
   * @throw InvalidParameterError if chunk_size <= overlap or overlap < 0.
   */
  std::vector<std::string> chunk(const std::string& text, int chunk_size, int overlap) const;

  /**
   * @brief Chunks each page independently and annotates the results.
   *
   * When page_aware is true every chunk gets its 1-based page number; otherwise
   * page is left empty. Blank windows are dropped. The clause number of each
   * chunk is filled by ClauseExtractor.
   */
  std::vector<Chunk> chunk_pages(const std::vector<std::string>& pages,
                                 bool page_aware,
                                 const std::string& source,
                                 int chunk_size,
                                 int overlap) const;

  static void validate(int chunk_size, int overlap);

 private:
  TokenizerPtr tokenizer_;
};

}  // namespace docqa_core
