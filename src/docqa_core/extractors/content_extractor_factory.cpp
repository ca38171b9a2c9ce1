#include "docqa_core/extractors/content_extractor_factory.hpp"
#include "docqa_core/extractors/markdown_extractor.hpp"
#include "docqa_core/extractors/pdf_extractor.hpp"
#include "docqa_core/extractors/plaintext_extractor.hpp"
#include "docqa_core/errors.hpp"

namespace docqa_core {
ContentExtractorFactory::ContentExtractorFactory() {
    extractors.push_back(std::make_unique<MarkdownExtractor>());
    extractors.push_back(std::make_unique<PdfExtractor>());
    extractors.push_back(std::make_unique<PlainTextExtractor>());
}

const ContentExtractor& ContentExtractorFactory::get_extractor_for(
    const std::string& source_name) const {
    for (const auto& extractor : extractors) {
        if (extractor->can_handle(source_name)) {
            return *extractor;
        }
    }
    throw ExtractionError("No suitable content extractor found for " + source_name);
}

bool ContentExtractorFactory::supports(const std::string& source_name) const {
    for (const auto& extractor : extractors) {
        if (extractor->can_handle(source_name)) {
            return true;
        }
    }
    return false;
}
}
