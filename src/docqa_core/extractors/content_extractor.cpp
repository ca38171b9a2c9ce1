#include "docqa_core/extractors/content_extractor.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <regex>
#include <sstream>

#include "docqa_core/errors.hpp"

namespace docqa_core {

DocumentType ContentExtractor::get_document_type() const {
  return DocumentType::Unknown;
}

std::string ContentExtractor::compute_hash_from_content(const std::string& content) {
  EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw ExtractionError("Failed to create EVP context for hashing");
  }

  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw ExtractionError("Failed to initialize SHA256 digest");
  }

  if (EVP_DigestUpdate(mdctx, content.data(), content.length()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw ExtractionError("Failed to update SHA256 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;
  if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw ExtractionError("Failed to finalize SHA256 digest");
  }

  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }

  return ss.str();
}

std::string ContentExtractor::clean_text(const std::string& text) {
  static const std::regex hyphen_break_regex(R"(-\r?\n)");
  static const std::regex whitespace_regex(R"(\s+)");

  std::string cleaned = std::regex_replace(text, hyphen_break_regex, "");
  cleaned = std::regex_replace(cleaned, whitespace_regex, " ");

  const auto first = cleaned.find_first_not_of(' ');
  if (first == std::string::npos) {
    return "";
  }
  const auto last = cleaned.find_last_not_of(' ');
  return cleaned.substr(first, last - first + 1);
}

std::string ContentExtractor::extension_of(const std::string& source_name) {
  std::string path_part = source_name;
  // Drop query string and fragment from URLs
  const auto cut = path_part.find_first_of("?#");
  if (cut != std::string::npos) {
    path_part.erase(cut);
  }
  const auto scheme = path_part.find("://");
  if (scheme != std::string::npos) {
    const auto path_start = path_part.find('/', scheme + 3);
    path_part = path_start == std::string::npos ? "" : path_part.substr(path_start);
  }

  std::string extension = std::filesystem::path(path_part).extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return extension;
}

ExtractionResult ContentExtractor::split_and_clean(const std::string& content) const {
  ExtractionResult result;
  result.content_hash = compute_hash_from_content(content);
  result.document_type = get_document_type();
  result.page_aware = content.find(PAGE_SEPARATOR) != std::string::npos;

  std::stringstream stream(content);
  std::string page;
  while (std::getline(stream, page, PAGE_SEPARATOR)) {
    result.pages.push_back(clean_text(page));
  }
  while (!result.pages.empty() && result.pages.back().empty()) {
    result.pages.pop_back();
  }
  return result;
}

}  // namespace docqa_core
