#include <gtest/gtest.h>

#include <cmath>

#include "docqa_core/errors.hpp"
#include "docqa_core/llm/hashing_embedder.hpp"

namespace docqa_tests {

using docqa_core::HashingEmbedder;

namespace {

float dot(const std::vector<float>& a, const std::vector<float>& b) {
  float sum = 0.0f;
  for (size_t i = 0; i < a.size(); ++i) {
    sum += a[i] * b[i];
  }
  return sum;
}

}  // namespace

TEST(HashingEmbedderTest, ProducesUnitVectorsOfConfiguredDimension) {
  HashingEmbedder embedder(128);
  auto vectors = embedder.embed({"Grace period of thirty days", "Maternity cover"});

  ASSERT_EQ(vectors.size(), 2u);
  for (const auto& vector : vectors) {
    ASSERT_EQ(vector.size(), 128u);
    EXPECT_NEAR(std::sqrt(dot(vector, vector)), 1.0f, 1e-5);
  }
  EXPECT_EQ(embedder.dimension(), 128u);
}

TEST(HashingEmbedderTest, IsDeterministicAndCaseInsensitive) {
  HashingEmbedder embedder(256);
  EXPECT_EQ(embedder.embed_one("Premium Payment"), embedder.embed_one("premium payment"));
  EXPECT_EQ(embedder.embed_one("premium, payment!"), embedder.embed_one("premium payment"));
}

TEST(HashingEmbedderTest, SharedWordsRaiseSimilarity) {
  HashingEmbedder embedder(1024);
  auto query = embedder.embed_one("grace period for premium");
  auto related = embedder.embed_one("the grace period for premium payment");
  auto unrelated = embedder.embed_one("maternity expenses are covered");

  EXPECT_GT(dot(query, related), dot(query, unrelated));
}

TEST(HashingEmbedderTest, TextWithoutWordsIsZeroVector) {
  HashingEmbedder embedder(16);
  auto vector = embedder.embed_one("  ... !!");
  EXPECT_EQ(vector, std::vector<float>(16, 0.0f));
}

TEST(HashingEmbedderTest, RejectsZeroDimension) {
  EXPECT_THROW(HashingEmbedder(0), docqa_core::InvalidParameterError);
}

}  // namespace docqa_tests
