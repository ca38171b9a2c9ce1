#pragma once

#include <optional>
#include <string>

namespace docqa_core {

// Best-effort annotator for dotted clause/section numerals ("4.2", "Section 3.1.2").
// A miss or a false match is never an error.
class ClauseExtractor {
 public:
  // Headings usually sit at the start of a chunk, so that window is scanned first.
  static constexpr size_t HEADING_WINDOW_CHARS = 200;

  // Returns the first dotted numeral found in the heading window, else in the whole text.
  static std::optional<std::string> from_chunk(const std::string& text);

  // Detects a clause reference in a user question, e.g. "what does clause 4.2 say".
  static std::optional<std::string> from_query(const std::string& query);
};

}  // namespace docqa_core
