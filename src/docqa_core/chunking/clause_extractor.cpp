#include "docqa_core/chunking/clause_extractor.hpp"

#include <regex>

namespace docqa_core {

namespace {

const std::regex& chunk_clause_regex() {
  // Optional leading keyword, then a numeral with at least one dot: 3.1, 4.2.1
  static const std::regex regex(R"((?:(?:clause|section)\s*)?(\d+(?:\.\d+)+))",
                                std::regex_constants::ECMAScript | std::regex_constants::icase);
  return regex;
}

const std::regex& query_clause_regex() {
  static const std::regex regex(R"((?:\b[Cc]lause\b|\b[Ss]ection\b)?\s*:?\.?\s*(\d+(?:\.\d+)+))",
                                std::regex_constants::ECMAScript);
  return regex;
}

std::optional<std::string> first_match(const std::string& text, const std::regex& regex) {
  std::smatch match;
  if (std::regex_search(text, match, regex)) {
    return match[1].str();
  }
  return std::nullopt;
}

}  // namespace

std::optional<std::string> ClauseExtractor::from_chunk(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  const std::string head = text.substr(0, HEADING_WINDOW_CHARS);
  if (auto clause = first_match(head, chunk_clause_regex())) {
    return clause;
  }
  return first_match(text, chunk_clause_regex());
}

std::optional<std::string> ClauseExtractor::from_query(const std::string& query) {
  if (query.empty()) {
    return std::nullopt;
  }
  return first_match(query, query_clause_regex());
}

}  // namespace docqa_core
