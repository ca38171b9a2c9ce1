#pragma once

#include "content_extractor.hpp"

namespace docqa_core {

class MarkdownExtractor : public ContentExtractor {
 public:
  bool can_handle(const std::string& source_name) const override;

  ExtractionResult extract(const std::string& raw_content) const override;

  DocumentType get_document_type() const override;

 private:
  // Removes markup but keeps heading text, so "## 4.2 Grace Period" still
  // carries its clause number into the chunk.
  std::string strip_markup(const std::string& content) const;
};

}  // namespace docqa_core
