#include "docqa_core/types.hpp"

#include <stdexcept>

namespace docqa_core {

std::string to_string(DocumentType type) {
  switch (type) {
    case DocumentType::Text:
      return "Text";
    case DocumentType::Markdown:
      return "Markdown";
    case DocumentType::Pdf:
      return "Pdf";
    default:
      return "Unknown";
  }
}

DocumentType document_type_from_string(const std::string& str) {
  if (str == "Text")
    return DocumentType::Text;
  if (str == "Markdown")
    return DocumentType::Markdown;
  if (str == "Pdf")
    return DocumentType::Pdf;
  return DocumentType::Unknown;
}

std::string to_string(Role role) {
  switch (role) {
    case Role::User:
      return "user";
    case Role::Assistant:
      return "assistant";
  }
  return "user";
}

Role role_from_string(const std::string& str) {
  if (str == "user")
    return Role::User;
  if (str == "assistant")
    return Role::Assistant;
  throw std::invalid_argument("Unknown conversation role: " + str);
}

}  // namespace docqa_core
