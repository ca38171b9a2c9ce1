#include <gtest/gtest.h>

#include <fstream>

#include "common/utilities_test.hpp"
#include "docqa_core/errors.hpp"
#include "docqa_core/io/document_fetcher.hpp"

namespace docqa_tests {

using docqa_core::CurlDocumentFetcher;
using docqa_core::DownloadError;

class DocumentFetcherTest : public TempFileTestBase {
 protected:
  CurlDocumentFetcher fetcher_{5};
};

TEST_F(DocumentFetcherTest, ReadsLocalFile) {
  auto path = make_temp_file("Clause 1.1: local policy text\fsecond page");
  EXPECT_EQ(fetcher_.fetch(path.string()), "Clause 1.1: local policy text\fsecond page");
}

TEST_F(DocumentFetcherTest, StripsFileScheme) {
  auto path = make_temp_file("via file url");
  EXPECT_EQ(fetcher_.fetch("file://" + path.string()), "via file url");
}

TEST_F(DocumentFetcherTest, MissingFileIsADownloadError) {
  auto path = make_temp_path(".txt");
  EXPECT_THROW(fetcher_.fetch(path.string()), DownloadError);
}

TEST_F(DocumentFetcherTest, EmptyLocationIsADownloadError) {
  EXPECT_THROW(fetcher_.fetch(""), DownloadError);
}

TEST_F(DocumentFetcherTest, UnreachableHostIsADownloadError) {
  EXPECT_THROW(fetcher_.fetch("http://127.0.0.1:1/policy.txt"), DownloadError);
}

TEST_F(DocumentFetcherTest, DetectsRemoteLocations) {
  EXPECT_TRUE(CurlDocumentFetcher::is_remote("https://example.com/a.txt"));
  EXPECT_TRUE(CurlDocumentFetcher::is_remote("HTTP://EXAMPLE.COM/a.txt"));
  EXPECT_FALSE(CurlDocumentFetcher::is_remote("/tmp/a.txt"));
  EXPECT_FALSE(CurlDocumentFetcher::is_remote("file:///tmp/a.txt"));
}

TEST_F(DocumentFetcherTest, ListsDirectoryInSortedOrder) {
  const auto folder = make_temp_dir();
  std::filesystem::create_directories(folder / "sub");
  std::filesystem::create_directories(folder / ".git");
  for (const char* name : {"b.txt", "a.md", "sub/c.pdf", ".hidden.txt", ".git/config"}) {
    std::ofstream(folder / name) << "x";
  }

  auto names = fetcher_.list_documents(folder.string());

  ASSERT_TRUE(names.has_value());
  EXPECT_EQ(*names, (std::vector<std::string>{"a.md", "b.txt", "sub/c.pdf"}));
  auto via_scheme = fetcher_.list_documents("file://" + folder.string());
  ASSERT_TRUE(via_scheme.has_value());
  EXPECT_EQ(*via_scheme, *names);
  EXPECT_EQ(fetcher_.fetch(folder.string() + "/sub/c.pdf"), "x");
}

TEST_F(DocumentFetcherTest, SingleDocumentsAreNotCollections) {
  auto path = make_temp_file("single");
  EXPECT_FALSE(fetcher_.list_documents(path.string()).has_value());
  EXPECT_FALSE(fetcher_.list_documents("https://example.com/docs/").has_value());
  EXPECT_FALSE(fetcher_.list_documents(make_temp_path(".txt").string()).has_value());
}

TEST_F(DocumentFetcherTest, RejectsNonPositiveTimeout) {
  EXPECT_THROW(CurlDocumentFetcher(0), docqa_core::InvalidParameterError);
}

}  // namespace docqa_tests
