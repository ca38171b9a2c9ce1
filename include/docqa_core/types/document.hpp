#pragma once

#include <string>

namespace docqa_core {

enum class DocumentType { Text, Markdown, Pdf, Unknown };

// Conversion utilities
std::string to_string(DocumentType type);
DocumentType document_type_from_string(const std::string& str);

}  // namespace docqa_core
