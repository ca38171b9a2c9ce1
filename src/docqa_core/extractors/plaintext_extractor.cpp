#include "docqa_core/extractors/plaintext_extractor.hpp"

namespace docqa_core {

bool PlainTextExtractor::can_handle(const std::string& source_name) const {
    const std::string extension = extension_of(source_name);
    // Sources without an extension (e.g. bare download URLs) are read as text
    return extension.empty() || extension == ".txt" || extension == ".text";
}

/**
 * @brief Cleans plain text, splitting into pages on form feeds.
 *
 * Text produced by PDF-to-text converters separates pages with '\f', which
 * makes the result page aware. Anything else is a single page.
 */
ExtractionResult PlainTextExtractor::extract(const std::string& raw_content) const {
    if (raw_content.empty()) {
        return {"", {}, false, DocumentType::Text};
    }
    return split_and_clean(raw_content);
}

DocumentType PlainTextExtractor::get_document_type() const {
    return DocumentType::Text;
}

} // namespace docqa_core
