#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace docqa_core {

using Token = std::string;
using TokenSequence = std::vector<Token>;

/**
 * @class Tokenizer
 * @brief Splits text into model-specific token units and joins them back.
 *
 * Chunk boundaries are measured in tokens, so the same tokenizer must be used
 * every time a document is (re)indexed for chunking to stay reproducible.
 */
class Tokenizer {
 public:
  virtual ~Tokenizer() = default;

  virtual TokenSequence encode(const std::string& text) const = 0;

  // Joins the tokens in [first, last) back into text.
  virtual std::string decode(TokenSequence::const_iterator first,
                             TokenSequence::const_iterator last) const;
};

/**
 * @class Utf8WordTokenizer
 * @brief Word-level tokenizer over UTF-8 text.
 *
 * A token is a run of word code points, or a single punctuation/symbol code
 * point. Whitespace is attached to the token before it (leading whitespace
 * forms its own token), so decoding any contiguous range reproduces the
 * exact source text of that range. Invalid UTF-8 is replaced with U+FFFD.
 * Words longer than max_word_codepoints are split, roughly the way subword
 * vocabularies break up rare long strings.
 */
class Utf8WordTokenizer : public Tokenizer {
 public:
  static constexpr size_t DEFAULT_MAX_WORD_CODEPOINTS = 24;

  explicit Utf8WordTokenizer(size_t max_word_codepoints = DEFAULT_MAX_WORD_CODEPOINTS);

  TokenSequence encode(const std::string& text) const override;

 private:
  size_t max_word_codepoints_;

  static bool is_whitespace(uint32_t cp);
  static bool is_word_codepoint(uint32_t cp);
};

using TokenizerPtr = std::shared_ptr<const Tokenizer>;

}  // namespace docqa_core
