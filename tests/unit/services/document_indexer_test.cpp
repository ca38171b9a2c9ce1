#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fstream>
#include <set>

#include "common/mocks_test.hpp"
#include "common/utilities_test.hpp"
#include "docqa_core/errors.hpp"
#include "docqa_core/services/document_indexer.hpp"
#include "docqa_core/services/retrieval_service.hpp"

namespace docqa_tests {

using docqa_core::DocumentIndexer;
using docqa_core::IndexerSettings;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SizeIs;

class DocumentIndexerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    fetcher_ = std::make_shared<NiceMock<MockDocumentFetcher>>();
    embedder_ = std::make_shared<NiceMock<MockEmbedder>>(32);
  }

  std::unique_ptr<DocumentIndexer> make_indexer(IndexerSettings settings = {}) {
    return std::make_unique<DocumentIndexer>(
        fetcher_, std::make_shared<docqa_core::ContentExtractorFactory>(),
        std::make_shared<docqa_core::Utf8WordTokenizer>(), embedder_, settings);
  }

  std::shared_ptr<NiceMock<MockDocumentFetcher>> fetcher_;
  std::shared_ptr<NiceMock<MockEmbedder>> embedder_;
};

TEST_F(DocumentIndexerTest, BuildsAlignedIndexAndMetadata) {
  const std::string url = "https://example.com/docs/policy.txt?token=abc";
  EXPECT_CALL(*fetcher_, fetch(url))
      .WillOnce(Return("Clause 4.1 covers hospital stays.\fClause 4.2 covers the grace period."));

  auto document = make_indexer()->build(url);

  ASSERT_NE(document, nullptr);
  EXPECT_EQ(document->fingerprint, url);
  EXPECT_EQ(document->content_hash.size(), 64u);
  ASSERT_EQ(document->metadata->size(), 2u);
  EXPECT_EQ(document->index->size(), document->metadata->size());
  EXPECT_EQ(document->index->dimension(), 32u);

  const auto& first = document->metadata->at(0);
  EXPECT_EQ(first.source, "policy.txt");
  EXPECT_EQ(first.page, std::optional<int>(1));
  EXPECT_EQ(first.clause_number, std::optional<std::string>("4.1"));
  EXPECT_EQ(document->metadata->at(1).page, std::optional<int>(2));

  // Row i holds the embedding of chunk i
  auto hits = document->index->search(embedder_->embed_one(document->metadata->at(1).text), 1);
  ASSERT_EQ(hits.size(), 1u);
  EXPECT_EQ(hits[0].id, 1);
}

TEST_F(DocumentIndexerTest, EmbedsInBatches) {
  ON_CALL(*fetcher_, fetch(_)).WillByDefault(Return("w0 w1 w2 w3 w4 w5 w6 w7 w8 w9"));
  {
    ::testing::InSequence sequence;
    EXPECT_CALL(*embedder_, embed(SizeIs(3)));
    EXPECT_CALL(*embedder_, embed(SizeIs(1)));
  }

  IndexerSettings settings;
  settings.chunk_size = 4;
  settings.chunk_overlap = 1;
  settings.embedding_batch_size = 3;
  auto document = make_indexer(settings)->build("notes.txt");

  EXPECT_EQ(document->metadata->size(), 4u);
  EXPECT_FALSE(document->metadata->at(0).page.has_value());
}

TEST_F(DocumentIndexerTest, BlankDocumentIsAnExtractionError) {
  ON_CALL(*fetcher_, fetch(_)).WillByDefault(Return("  \n\f  "));
  EXPECT_THROW(make_indexer()->build("empty.txt"), docqa_core::ExtractionError);
}

TEST_F(DocumentIndexerTest, UnsupportedFormatIsAnExtractionError) {
  ON_CALL(*fetcher_, fetch(_)).WillByDefault(Return("PK\x03\x04"));
  EXPECT_THROW(make_indexer()->build("slides.pptx"), docqa_core::ExtractionError);
}

TEST_F(DocumentIndexerTest, CorruptPdfIsAnExtractionError) {
  ON_CALL(*fetcher_, fetch(_)).WillByDefault(Return("%PDF-1.7 truncated"));
  EXPECT_THROW(make_indexer()->build("scan.pdf"), docqa_core::ExtractionError);
}

TEST_F(DocumentIndexerTest, PdfPagesBecomeChunkPages) {
  ON_CALL(*fetcher_, fetch(_))
      .WillByDefault(Return(TestUtilities::create_test_pdf(
          {"Clause 4.1 covers hospital stays", "Clause 4.2 covers the grace period"})));

  auto document = make_indexer()->build("https://example.com/policy.pdf");

  ASSERT_EQ(document->metadata->size(), 2u);
  EXPECT_EQ(document->metadata->at(0).source, "policy.pdf");
  EXPECT_EQ(document->metadata->at(0).page, std::optional<int>(1));
  EXPECT_EQ(document->metadata->at(1).page, std::optional<int>(2));
  EXPECT_EQ(document->metadata->at(1).clause_number, std::optional<std::string>("4.2"));
}

TEST_F(DocumentIndexerTest, FetchFailurePropagates) {
  ON_CALL(*fetcher_, fetch(_)).WillByDefault([](const std::string& location) -> std::string {
    throw docqa_core::DownloadError("HTTP 404 for " + location);
  });
  EXPECT_CALL(*embedder_, embed(_)).Times(0);

  EXPECT_THROW(make_indexer()->build("https://example.com/missing.txt"), docqa_core::DownloadError);
}

TEST_F(DocumentIndexerTest, EmbedderReturningTooFewVectorsIsRejected) {
  ON_CALL(*fetcher_, fetch(_)).WillByDefault(Return("some document text"));
  ON_CALL(*embedder_, embed(_)).WillByDefault(Return(std::vector<docqa_core::Embedding>{}));

  EXPECT_THROW(make_indexer()->build("doc.txt"), docqa_core::DimensionMismatchError);
}

TEST_F(DocumentIndexerTest, InconsistentEmbeddingDimensionsAreRejected) {
  ON_CALL(*fetcher_, fetch(_)).WillByDefault(Return("w0 w1 w2 w3 w4 w5"));
  ON_CALL(*embedder_, embed(_))
      .WillByDefault(Return(std::vector<docqa_core::Embedding>{{1.0f, 0.0f}, {1.0f, 0.0f, 0.0f}}));

  IndexerSettings settings;
  settings.chunk_size = 4;
  settings.chunk_overlap = 1;
  settings.embedding_batch_size = 2;
  EXPECT_THROW(make_indexer(settings)->build("doc.txt"), docqa_core::DimensionMismatchError);
}

TEST_F(DocumentIndexerTest, ConstructorValidatesSettings) {
  IndexerSettings overlap_too_large;
  overlap_too_large.chunk_size = 4;
  overlap_too_large.chunk_overlap = 4;
  EXPECT_THROW(make_indexer(overlap_too_large), docqa_core::InvalidParameterError);

  IndexerSettings no_batch;
  no_batch.embedding_batch_size = 0;
  EXPECT_THROW(make_indexer(no_batch), docqa_core::InvalidParameterError);
}

TEST_F(DocumentIndexerTest, CollectionIndexesSupportedFilesInListingOrder) {
  const std::string folder = "/srv/policies/";
  ON_CALL(*fetcher_, list_documents(folder))
      .WillByDefault(Return(std::vector<std::string>{"a.txt", "archive.zip", "b/c.md"}));
  EXPECT_CALL(*fetcher_, fetch("/srv/policies/a.txt")).WillOnce(Return("Alpha cover text"));
  EXPECT_CALL(*fetcher_, fetch("/srv/policies/b/c.md")).WillOnce(Return("# Gamma\nGamma cover"));
  EXPECT_CALL(*fetcher_, fetch("/srv/policies/archive.zip")).Times(0);

  auto document = make_indexer()->build(folder);

  ASSERT_EQ(document->metadata->size(), 2u);
  EXPECT_EQ(document->metadata->at(0).source, "a.txt");
  EXPECT_EQ(document->metadata->at(1).source, "b/c.md");
  EXPECT_EQ(document->index->size(), 2u);
  EXPECT_EQ(document->content_hash.size(), 64u);
}

TEST_F(DocumentIndexerTest, CollectionSkipsUnreadableFiles) {
  ON_CALL(*fetcher_, list_documents("docs"))
      .WillByDefault(Return(std::vector<std::string>{"bad.pdf", "empty.txt", "good.txt"}));
  ON_CALL(*fetcher_, fetch("docs/bad.pdf")).WillByDefault(Return("not a pdf"));
  ON_CALL(*fetcher_, fetch("docs/empty.txt")).WillByDefault(Return("   "));
  ON_CALL(*fetcher_, fetch("docs/good.txt")).WillByDefault(Return("Readable text"));

  auto document = make_indexer()->build("docs");

  ASSERT_EQ(document->metadata->size(), 1u);
  EXPECT_EQ(document->metadata->at(0).source, "good.txt");
}

TEST_F(DocumentIndexerTest, CollectionWithoutSupportedFilesIsAnExtractionError) {
  ON_CALL(*fetcher_, list_documents("docs"))
      .WillByDefault(Return(std::vector<std::string>{"image.png", "slides.pptx"}));
  EXPECT_THROW(make_indexer()->build("docs"), docqa_core::ExtractionError);

  ON_CALL(*fetcher_, list_documents("empty"))
      .WillByDefault(Return(std::vector<std::string>{}));
  EXPECT_THROW(make_indexer()->build("empty"), docqa_core::ExtractionError);
}

TEST_F(DocumentIndexerTest, CollectionHashTracksEveryFile) {
  ON_CALL(*fetcher_, list_documents("docs"))
      .WillByDefault(Return(std::vector<std::string>{"a.txt", "b.txt"}));
  ON_CALL(*fetcher_, fetch("docs/a.txt")).WillByDefault(Return("first"));
  ON_CALL(*fetcher_, fetch("docs/b.txt")).WillByDefault(Return("second"));
  auto indexer = make_indexer();
  const std::string before = indexer->content_hash("docs");
  EXPECT_EQ(indexer->build("docs")->content_hash, before);

  ON_CALL(*fetcher_, fetch("docs/b.txt")).WillByDefault(Return("second, edited"));
  EXPECT_NE(indexer->content_hash("docs"), before);
}

TEST_F(DocumentIndexerTest, RecordsEmbeddingModel) {
  ON_CALL(*fetcher_, fetch(_)).WillByDefault(Return("some document text"));
  EXPECT_EQ(make_indexer()->build("doc.txt")->embedding_model, "mock:32");
}

class DocumentIndexerFolderTest : public TempFileTestBase {
 protected:
  void write(const std::filesystem::path& path, const std::string& contents) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream file(path, std::ios::binary);
    file << contents;
  }
};

TEST_F(DocumentIndexerFolderTest, SourceFilterSelectsOneFileOfTheCorpus) {
  const auto folder = make_temp_dir();
  write(folder / "health.txt",
        "Clause 4.2: A grace period of thirty days applies to premium payment.\f"
        "Clause 4.3: Hospital stays need prior approval.");
  write(folder / "motor.md", "# 2.1 Grace period\nMotor premiums have a grace period of seven days.");
  write(folder / "travel" / "terms.txt", "Trip cancellation is covered after a grace period.");
  write(folder / ".cache" / "stale.txt", "Hidden grace period text");
  write(folder / "logo.png", "\x89PNG");

  auto embedder = std::make_shared<docqa_core::HashingEmbedder>(256);
  docqa_core::IndexerSettings settings;
  settings.chunk_size = 16;
  settings.chunk_overlap = 2;
  docqa_core::DocumentIndexer indexer(std::make_shared<docqa_core::CurlDocumentFetcher>(),
                                      std::make_shared<docqa_core::ContentExtractorFactory>(),
                                      std::make_shared<docqa_core::Utf8WordTokenizer>(), embedder,
                                      settings);
  auto corpus = indexer.build(folder.string());

  std::set<std::string> sources;
  for (const auto& row : corpus->metadata->rows()) {
    sources.insert(row.source);
  }
  EXPECT_EQ(sources, (std::set<std::string>{"health.txt", "motor.md", "travel/terms.txt"}));

  docqa_core::RetrievalEngine engine(embedder);
  auto unfiltered = engine.retrieve("grace period", *corpus, 10);
  std::set<std::string> unfiltered_sources;
  for (const auto& chunk : unfiltered) {
    unfiltered_sources.insert(chunk.source);
  }
  EXPECT_GT(unfiltered_sources.size(), 1u);

  docqa_core::RetrievalFilter filter;
  filter.source = "motor.md";
  auto filtered = engine.retrieve("grace period", *corpus, 3, filter);
  ASSERT_FALSE(filtered.empty());
  for (const auto& chunk : filtered) {
    EXPECT_EQ(chunk.source, "motor.md");
  }

  filter.source = "health.txt";
  filter.page_from = 2;
  auto health_page_two = engine.retrieve("hospital approval", *corpus, 3, filter);
  ASSERT_FALSE(health_page_two.empty());
  for (const auto& chunk : health_page_two) {
    EXPECT_EQ(chunk.source, "health.txt");
    EXPECT_EQ(chunk.page, std::optional<int>(2));
  }
}

TEST(DocumentIndexerSourceNameTest, UsesFileNamePart) {
  EXPECT_EQ(DocumentIndexer::source_name_of("https://host/a/b/policy.pdf?sv=1&sig=x"), "policy.pdf");
  EXPECT_EQ(DocumentIndexer::source_name_of("/tmp/docs/notes.md"), "notes.md");
  EXPECT_EQ(DocumentIndexer::source_name_of("https://host/dir/"), "dir");
  EXPECT_EQ(DocumentIndexer::source_name_of("plain.txt"), "plain.txt");
}

}  // namespace docqa_tests
