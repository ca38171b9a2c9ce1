#include "docqa_core/chunking/tokenizer.hpp"

#include <utf8.h>

#include <cctype>
#include <iterator>

#include "docqa_core/errors.hpp"

namespace docqa_core {

std::string Tokenizer::decode(TokenSequence::const_iterator first,
                              TokenSequence::const_iterator last) const {
  std::string out;
  for (auto it = first; it != last; ++it) {
    out += *it;
  }
  return out;
}

Utf8WordTokenizer::Utf8WordTokenizer(size_t max_word_codepoints)
    : max_word_codepoints_(max_word_codepoints) {
  if (max_word_codepoints_ == 0) {
    throw InvalidParameterError("max_word_codepoints must be greater than 0");
  }
}

bool Utf8WordTokenizer::is_whitespace(uint32_t cp) {
  switch (cp) {
    case ' ':
    case '\t':
    case '\n':
    case '\r':
    case '\f':
    case '\v':
    case 0x85:
    case 0xA0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
      return true;
    default:
      return cp >= 0x2000 && cp <= 0x200A;
  }
}

bool Utf8WordTokenizer::is_word_codepoint(uint32_t cp) {
  if (cp < 0x80) {
    return std::isalnum(static_cast<unsigned char>(cp)) || cp == '_';
  }
  if (is_whitespace(cp)) {
    return false;
  }
  // Latin-1 punctuation and symbols, general punctuation, arrows/math/misc
  // symbols, CJK punctuation, fullwidth ASCII punctuation, replacement char.
  if ((cp >= 0xA1 && cp <= 0xBF) || cp == 0xD7 || cp == 0xF7) {
    return false;
  }
  if ((cp >= 0x2010 && cp <= 0x2027) || (cp >= 0x2030 && cp <= 0x205E)) {
    return false;
  }
  if (cp >= 0x2190 && cp <= 0x2BFF) {
    return false;
  }
  if ((cp >= 0x3001 && cp <= 0x303F) || (cp >= 0xFF01 && cp <= 0xFF0F) || cp == 0xFFFD) {
    return false;
  }
  return true;
}

TokenSequence Utf8WordTokenizer::encode(const std::string& text) const {
  TokenSequence tokens;
  if (text.empty()) {
    return tokens;
  }

  std::string valid;
  valid.reserve(text.size());
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(valid));

  bool in_word = false;
  size_t word_length = 0;
  auto it = valid.begin();
  while (it != valid.end()) {
    auto cp_start = it;
    uint32_t cp = utf8::next(it, valid.end());

    if (is_whitespace(cp)) {
      // Leading whitespace has no previous token to attach to
      if (tokens.empty()) {
        tokens.emplace_back();
      }
      tokens.back().append(cp_start, it);
      in_word = false;
    } else if (is_word_codepoint(cp)) {
      if (in_word && word_length < max_word_codepoints_) {
        tokens.back().append(cp_start, it);
        ++word_length;
      } else {
        tokens.emplace_back(cp_start, it);
        in_word = true;
        word_length = 1;
      }
    } else {
      tokens.emplace_back(cp_start, it);
      in_word = false;
    }
  }
  return tokens;
}

}  // namespace docqa_core
