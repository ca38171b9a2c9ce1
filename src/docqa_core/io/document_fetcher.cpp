#include "docqa_core/io/document_fetcher.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include "docqa_core/errors.hpp"

namespace docqa_core {

namespace {

struct CurlHandleDeleter {
  void operator()(CURL *handle) const {
    curl_easy_cleanup(handle);
  }
};

bool starts_with_icase(const std::string &value, const std::string &prefix) {
  if (value.size() < prefix.size()) {
    return false;
  }
  for (size_t i = 0; i < prefix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(value[i])) != prefix[i]) {
      return false;
    }
  }
  return true;
}

}  // namespace

CurlDocumentFetcher::CurlDocumentFetcher(long timeout_seconds) : timeout_seconds_(timeout_seconds) {
  if (timeout_seconds_ <= 0) {
    throw InvalidParameterError("Download timeout must be positive");
  }
}

bool CurlDocumentFetcher::is_remote(const std::string &location) {
  return starts_with_icase(location, "http://") || starts_with_icase(location, "https://");
}

std::string CurlDocumentFetcher::fetch(const std::string &location) {
  if (location.empty()) {
    throw DownloadError("Document location is empty");
  }
  if (is_remote(location)) {
    return download(location);
  }
  return read_file(local_path_of(location));
}

std::string CurlDocumentFetcher::local_path_of(const std::string &location) {
  return starts_with_icase(location, "file://") ? location.substr(7) : location;
}

std::optional<std::vector<std::string>> CurlDocumentFetcher::list_documents(
    const std::string &location) {
  if (location.empty() || is_remote(location)) {
    return std::nullopt;
  }
  const std::filesystem::path root(local_path_of(location));
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    return std::nullopt;
  }

  std::vector<std::string> names;
  auto it = std::filesystem::recursive_directory_iterator(
      root, std::filesystem::directory_options::skip_permission_denied, ec);
  if (ec) {
    throw DownloadError("Could not list directory " + root.string() + ": " + ec.message());
  }
  for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      throw DownloadError("Could not list directory " + root.string() + ": " + ec.message());
    }
    const std::string name = it->path().filename().string();
    if (!name.empty() && name[0] == '.') {
      if (it->is_directory(ec)) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (it->is_regular_file(ec)) {
      names.push_back(it->path().lexically_relative(root).generic_string());
    }
  }
  std::sort(names.begin(), names.end());
  std::cout << "Found " << names.size() << " files under " << root.string() << std::endl;
  return names;
}

size_t CurlDocumentFetcher::write_callback(void *contents,
                                           size_t size,
                                           size_t nmemb,
                                           std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

std::string CurlDocumentFetcher::download(const std::string &url) const {
  std::unique_ptr<CURL, CurlHandleDeleter> curl_handle(curl_easy_init());
  if (!curl_handle) {
    throw DownloadError("Failed to initialize CURL");
  }

  std::string response_buffer;
  char error_buffer[CURL_ERROR_SIZE] = {0};
  CURL *curl = curl_handle.get();
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);

  CURLcode res = curl_easy_perform(curl);
  if (res != CURLE_OK) {
    std::string detail = error_buffer[0] ? error_buffer : curl_easy_strerror(res);
    throw DownloadError("Failed to download " + url + ": " + detail);
  }

  long http_code = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code < 200 || http_code >= 300) {
    throw DownloadError("Failed to download " + url + ": HTTP status " +
                        std::to_string(http_code));
  }

  std::cout << "Downloaded " << response_buffer.size() << " bytes from " << url << std::endl;
  return response_buffer;
}

std::string CurlDocumentFetcher::read_file(const std::string &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw DownloadError("Document not found: " + path);
  }
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw DownloadError("Could not open document: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    throw DownloadError("Could not read document: " + path);
  }
  return buffer.str();
}

}  // namespace docqa_core
