#include "docqa_core/extractors/pdf_extractor.hpp"

#include <poppler-document.h>
#include <poppler-page.h>

#include <memory>

#include "docqa_core/errors.hpp"

namespace docqa_core {

bool PdfExtractor::can_handle(const std::string& source_name) const {
  return extension_of(source_name) == ".pdf";
}

ExtractionResult PdfExtractor::extract(const std::string& raw_content) const {
  if (raw_content.empty()) {
    return {"", {}, true, DocumentType::Pdf};
  }

  std::unique_ptr<poppler::document> doc(
      poppler::document::load_from_raw_data(raw_content.data(), static_cast<int>(raw_content.size())));
  if (!doc) {
    throw ExtractionError("Content is not a readable PDF");
  }
  if (doc->is_locked()) {
    throw ExtractionError("PDF is password protected");
  }

  // Rejoin pages with the separator so cleaning and splitting match plain text
  std::string joined;
  for (int i = 0; i < doc->pages(); ++i) {
    if (i > 0) {
      joined += PAGE_SEPARATOR;
    }
    std::unique_ptr<poppler::page> page(doc->create_page(i));
    if (!page) {
      continue;
    }
    poppler::byte_array bytes = page->text().to_utf8();
    joined.append(bytes.begin(), bytes.end());
  }

  ExtractionResult result = split_and_clean(joined);
  result.content_hash = compute_hash_from_content(raw_content);
  result.page_aware = true;
  return result;
}

DocumentType PdfExtractor::get_document_type() const {
  return DocumentType::Pdf;
}

}  // namespace docqa_core
