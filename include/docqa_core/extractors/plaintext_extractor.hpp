#pragma once

#include "content_extractor.hpp"

namespace docqa_core {

class PlainTextExtractor : public ContentExtractor {
public:
    bool can_handle(const std::string& source_name) const override;

    ExtractionResult extract(const std::string& raw_content) const override;

    DocumentType get_document_type() const override;
};

}
