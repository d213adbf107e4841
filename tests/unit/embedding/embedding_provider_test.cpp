#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cmath>
#include <memory>

#include "common/mocks_test.hpp"
#include "docqa_core/embedding/hashing_embedding_provider.hpp"
#include "docqa_core/embedding/ollama_embedding_provider.hpp"
#include "docqa_core/errors.hpp"

namespace docqa_tests {

using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

namespace {

float dot(const std::vector<float> &a, const std::vector<float> &b) {
  float sum = 0.0f;
  for (size_t i = 0; i < a.size(); ++i) {
    sum += a[i] * b[i];
  }
  return sum;
}

}  // namespace

TEST(HashingEmbeddingProviderTest, ProducesUnitVectorsOfConfiguredDimension) {
  docqa_core::HashingEmbeddingProvider provider(64);
  auto vec = provider.embed("Vector databases store embeddings");

  ASSERT_EQ(vec.size(), 64u);
  EXPECT_NEAR(dot(vec, vec), 1.0f, 1e-5);
  EXPECT_EQ(provider.dimension(), 64u);
}

TEST(HashingEmbeddingProviderTest, IsDeterministic) {
  docqa_core::HashingEmbeddingProvider a(128);
  docqa_core::HashingEmbeddingProvider b(128);
  EXPECT_EQ(a.embed("same text, same vector"), b.embed("same text, same vector"));
}

TEST(HashingEmbeddingProviderTest, SimilarTextScoresHigherThanUnrelatedText) {
  docqa_core::HashingEmbeddingProvider provider(256);
  auto query = provider.embed("how do solar panels generate electricity");
  auto related = provider.embed("solar panels generate electricity from sunlight");
  auto unrelated = provider.embed("the recipe needs flour sugar and eggs");

  EXPECT_GT(dot(query, related), dot(query, unrelated));
}

TEST(HashingEmbeddingProviderTest, EmptyTextIsZeroVector) {
  docqa_core::HashingEmbeddingProvider provider(16);
  auto vec = provider.embed("");
  EXPECT_EQ(vec, std::vector<float>(16, 0.0f));
}

TEST(HashingEmbeddingProviderTest, EmbedManyPreservesOrder) {
  docqa_core::HashingEmbeddingProvider provider(32);
  auto batch = provider.embed_many({"first text", "second text", "third text"});

  ASSERT_EQ(batch.size(), 3u);
  EXPECT_EQ(batch[0], provider.embed("first text"));
  EXPECT_EQ(batch[2], provider.embed("third text"));
}

TEST(RetryingEmbeddingProviderTest, RetriesOnceThenSucceeds) {
  auto inner = std::make_shared<MockEmbeddingProvider>(4);
  EXPECT_CALL(*inner, embed("hello"))
      .WillOnce(Throw(docqa_core::EmbeddingUnavailableError("connection refused")))
      .WillOnce(Return(std::vector<float>{1, 0, 0, 0}));

  docqa_core::RetryingEmbeddingProvider provider(inner, std::chrono::milliseconds(1));
  EXPECT_EQ(provider.embed("hello"), (std::vector<float>{1, 0, 0, 0}));
}

TEST(RetryingEmbeddingProviderTest, SurfacesSecondFailure) {
  auto inner = std::make_shared<MockEmbeddingProvider>(4);
  EXPECT_CALL(*inner, embed(_))
      .Times(2)
      .WillRepeatedly(Throw(docqa_core::EmbeddingUnavailableError("model not loaded")));

  docqa_core::RetryingEmbeddingProvider provider(inner, std::chrono::milliseconds(1));
  EXPECT_THROW(provider.embed("hello"), docqa_core::EmbeddingUnavailableError);
}

TEST(RetryingEmbeddingProviderTest, DoesNotRetryOtherErrors) {
  auto inner = std::make_shared<MockEmbeddingProvider>(4);
  EXPECT_CALL(*inner, embed(_))
      .Times(1)
      .WillOnce(Throw(docqa_core::InvalidParametersError("bad input")));

  docqa_core::RetryingEmbeddingProvider provider(inner, std::chrono::milliseconds(1));
  EXPECT_THROW(provider.embed("hello"), docqa_core::InvalidParametersError);
}

TEST(OllamaEmbeddingProviderTest, MapsClientErrorsToEmbeddingUnavailable) {
  auto client = std::make_shared<MockOllamaClient>();
  EXPECT_CALL(*client, get_embedding("nomic-embed-text", "text"))
      .WillOnce(Throw(docqa_core::OllamaError("connection refused")));

  docqa_core::OllamaEmbeddingProvider provider(client, "nomic-embed-text", 8);
  EXPECT_THROW(provider.embed("text"), docqa_core::EmbeddingUnavailableError);
}

TEST(OllamaEmbeddingProviderTest, RejectsVectorsOfTheWrongDimension) {
  auto client = std::make_shared<MockOllamaClient>();
  EXPECT_CALL(*client, get_embedding(_, _)).WillOnce(Return(std::vector<float>(4, 0.5f)));

  docqa_core::OllamaEmbeddingProvider provider(client, "nomic-embed-text", 8);
  EXPECT_THROW(provider.embed("text"), docqa_core::EmbeddingUnavailableError);
}

TEST(OllamaEmbeddingProviderTest, ReturnsClientVector) {
  auto client = std::make_shared<MockOllamaClient>();
  docqa_core::OllamaEmbeddingProvider provider(client, "nomic-embed-text", 8);

  auto vec = provider.embed("text");
  ASSERT_EQ(vec.size(), 8u);
  EXPECT_FLOAT_EQ(vec[0], 0.5f);
  EXPECT_EQ(provider.name(), "ollama:nomic-embed-text");
}

}  // namespace docqa_tests
