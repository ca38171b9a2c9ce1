#include "docqa_core/extractors/markdown_extractor.hpp"

#include <regex>

namespace docqa_core {

bool MarkdownExtractor::can_handle(const std::string& source_name) const {
  const std::string extension = extension_of(source_name);
  return extension == ".md" || extension == ".markdown";
}

ExtractionResult MarkdownExtractor::extract(const std::string& raw_content) const {
  if (raw_content.empty()) {
    return {"", {}, false, DocumentType::Markdown};
  }

  // Hash the raw bytes so a markup-only edit is still a content change
  ExtractionResult result = split_and_clean(strip_markup(raw_content));
  result.content_hash = compute_hash_from_content(raw_content);
  return result;
}

DocumentType MarkdownExtractor::get_document_type() const {
  return DocumentType::Markdown;
}

std::string MarkdownExtractor::strip_markup(const std::string& content) const {
  static const std::regex fence_regex(R"(^```[^\n]*$)",
                                      std::regex_constants::ECMAScript | std::regex_constants::multiline);
  static const std::regex heading_regex(R"(^#+\s*)",
                                        std::regex_constants::ECMAScript | std::regex_constants::multiline);
  static const std::regex image_regex(R"(!\[[^\]]*\]\([^)]*\))");
  static const std::regex link_regex(R"(\[([^\]]*)\]\([^)]*\))");
  static const std::regex emphasis_regex(R"((\*\*|__|\*|`))");
  static const std::regex list_marker_regex(R"(^\s*(?:[-*+]|>)\s+)",
                                            std::regex_constants::ECMAScript | std::regex_constants::multiline);

  std::string text = std::regex_replace(content, fence_regex, "");
  text = std::regex_replace(text, heading_regex, "");
  text = std::regex_replace(text, image_regex, "");
  text = std::regex_replace(text, link_regex, "$1");
  text = std::regex_replace(text, emphasis_regex, "");
  text = std::regex_replace(text, list_marker_regex, "");
  return text;
}

}  // namespace docqa_core
