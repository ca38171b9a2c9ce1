#pragma once

#include "content_extractor.hpp"

namespace docqa_core {

/**
 * @class PdfExtractor
 * @brief Extracts page text from PDF bytes with poppler-cpp.
 *
 * Every PDF page becomes one page of the result, so chunks carry the real
 * page number. Pages without text stay in place as empty entries.
 */
class PdfExtractor : public ContentExtractor {
 public:
  bool can_handle(const std::string& source_name) const override;

  // @throw ExtractionError if the bytes are not a readable, unlocked PDF.
  ExtractionResult extract(const std::string& raw_content) const override;

  DocumentType get_document_type() const override;
};

}  // namespace docqa_core
