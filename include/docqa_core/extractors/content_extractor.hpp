#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docqa_core/types/document.hpp"

namespace docqa_core {

struct ExtractionResult {
  std::string content_hash;
  // Cleaned text, one entry per page. A single entry when the source has no
  // page separators.
  std::vector<std::string> pages;
  bool page_aware = false;
  DocumentType document_type = DocumentType::Unknown;
};

class ContentExtractor {
 public:
  // Form feed, as emitted between pages by PDF-to-text converters
  static constexpr char PAGE_SEPARATOR = '\f';

  virtual ~ContentExtractor() = default;

  // Checks if this extractor can handle the given source name (path or URL)
  virtual bool can_handle(const std::string& source_name) const = 0;

  // Cleans and page-splits raw document bytes
  virtual ExtractionResult extract(const std::string& raw_content) const = 0;

  virtual DocumentType get_document_type() const;

  /**
   * @brief Normalises extracted text before chunking.
   *
   * Joins words hyphenated across line breaks, collapses every whitespace run
   * (including line and paragraph breaks) to one space, and trims both ends.
   */
  static std::string clean_text(const std::string& text);

  // Lower-cased extension of the path part of a URL or file path, e.g. ".md"
  static std::string extension_of(const std::string& source_name);

  // Hex SHA-256 of the bytes
  static std::string compute_hash_from_content(const std::string& content);

 protected:
  // Splits on PAGE_SEPARATOR and cleans each page. Trailing empty pages are dropped.
  ExtractionResult split_and_clean(const std::string& content) const;
};

// Define a type for our smart pointers
using ContentExtractorPtr = std::unique_ptr<ContentExtractor>;

}  // namespace docqa_core
