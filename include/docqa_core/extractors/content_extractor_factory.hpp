#pragma once
#include <memory>
#include <string>
#include <vector>

#include "content_extractor.hpp"

/**
 * @class ContentExtractorFactory
 * @brief Manages and provides the correct ContentExtractor for a document source.
 *
 * This factory holds a collection of all available content extractors.
 * It selects the first one that accepts the source's extension. This class is
 * non-copyable and non-movable.
 */
namespace docqa_core {
class ContentExtractorFactory {
 public:
  ContentExtractorFactory();
  virtual ~ContentExtractorFactory() = default;

  /**
   * @brief Finds and returns the extractor for the given source.
   *
   * @param source_name A file path or URL; only its extension is inspected.
   * @return A constant reference to the appropriate ContentExtractor.
   * @throw ExtractionError if no registered extractor accepts the source.
   */
  virtual const ContentExtractor& get_extractor_for(const std::string& source_name) const;

  // True when some registered extractor accepts the source
  bool supports(const std::string& source_name) const;

  ContentExtractorFactory(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory& operator=(const ContentExtractorFactory&) = delete;
  ContentExtractorFactory(ContentExtractorFactory&&) = delete;
  ContentExtractorFactory& operator=(ContentExtractorFactory&&) = delete;

 private:
  std::vector<std::unique_ptr<ContentExtractor>> extractors;
};
}  // namespace docqa_core
