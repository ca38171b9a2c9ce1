#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace docqa_core {

// Retrieves the raw bytes of a document named by URL or path.
class DocumentFetcher {
 public:
  virtual ~DocumentFetcher() = default;

  // @throw DownloadError when the document cannot be retrieved.
  virtual std::string fetch(const std::string &location) = 0;

  /**
   * @brief Lists the documents of a collection location, such as a folder.
   *
   * @return Names relative to the location in sorted order, or nullopt when
   *         the location names a single document.
   */
  virtual std::optional<std::vector<std::string>> list_documents(const std::string &location) {
    (void)location;
    return std::nullopt;
  }
};

using DocumentFetcherPtr = std::shared_ptr<DocumentFetcher>;

/**
 * @class CurlDocumentFetcher
 * @brief Fetches http(s) URLs with libcurl and everything else from disk.
 *
 * "file://" prefixes are stripped. Each request uses its own curl handle, so
 * one instance serves concurrent builds.
 */
class CurlDocumentFetcher : public DocumentFetcher {
 public:
  static constexpr long DEFAULT_TIMEOUT_SECONDS = 30;

  explicit CurlDocumentFetcher(long timeout_seconds = DEFAULT_TIMEOUT_SECONDS);

  std::string fetch(const std::string &location) override;

  // Local directories are collections: every regular file below them, hidden
  // entries excluded. Remote locations are always single documents.
  std::optional<std::vector<std::string>> list_documents(const std::string &location) override;

  static bool is_remote(const std::string &location);

 private:
  long timeout_seconds_;

  std::string download(const std::string &url) const;
  static std::string local_path_of(const std::string &location);
  static std::string read_file(const std::string &path);
  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
};

}  // namespace docqa_core
