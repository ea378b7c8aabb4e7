#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"
#include "ragkit_core/retrieval/semantic_reranker.hpp"

namespace ragkit_core {

using ::testing::_;
using ::testing::Return;

namespace {

RetrievalCandidate candidate(int index, const std::string &content) {
  RetrievalCandidate c;
  c.chunk = ragkit_tests::TestUtilities::create_test_chunk("t", "d", "d.txt", index, content);
  c.score = 0.5f;
  return c;
}

}  // namespace

TEST(CosineSimilarityTest, MatchesDefinition) {
  EXPECT_NEAR(cosine_similarity({1.0f, 0.0f}, {1.0f, 0.0f}), 1.0, 1e-9);
  EXPECT_NEAR(cosine_similarity({1.0f, 0.0f}, {0.0f, 1.0f}), 0.0, 1e-9);
  EXPECT_NEAR(cosine_similarity({3.0f, 4.0f}, {6.0f, 8.0f}), 1.0, 1e-9);
  // A zero vector has its norm treated as 1 rather than dividing by zero.
  EXPECT_NEAR(cosine_similarity({0.0f, 0.0f}, {1.0f, 0.0f}), 0.0, 1e-9);
}

TEST(SemanticRerankerTest, Rerank_OrdersByCosineSimilarity) {
  ragkit_tests::FakeEmbedder embedder({0.0f, 0.0f});
  embedder.set("query", {1.0f, 0.0f});
  embedder.set("far", {0.0f, 1.0f});
  embedder.set("near", {0.9f, 0.1f});
  embedder.set("middle", {0.5f, 0.5f});
  SemanticReranker reranker(embedder);

  auto ranked = reranker.rerank("query", {candidate(0, "far"), candidate(1, "near"), candidate(2, "middle")});

  ASSERT_EQ(ranked.size(), 3u);
  EXPECT_EQ(ranked[0].chunk.content, "near");
  EXPECT_EQ(ranked[1].chunk.content, "middle");
  EXPECT_EQ(ranked[2].chunk.content, "far");
  EXPECT_GT(ranked[0].score, ranked[1].score);
  EXPECT_GT(ranked[1].score, ranked[2].score);
  for (const auto &c : ranked) {
    EXPECT_EQ(c.stage, RetrievalStage::Semantic);
  }
  EXPECT_EQ(embedder.calls(), 2);
}

TEST(SemanticRerankerTest, Rerank_TiesKeepInputOrder) {
  ragkit_tests::FakeEmbedder embedder({1.0f, 0.0f});
  SemanticReranker reranker(embedder);

  auto ranked = reranker.rerank("q", {candidate(4, "a"), candidate(2, "b"), candidate(9, "c")});

  ASSERT_EQ(ranked.size(), 3u);
  EXPECT_EQ(ranked[0].chunk.chunk_index, 4);
  EXPECT_EQ(ranked[1].chunk.chunk_index, 2);
  EXPECT_EQ(ranked[2].chunk.chunk_index, 9);
}

TEST(SemanticRerankerTest, Rerank_OrdersBySimilarityFinerThanFloat) {
  ragkit_tests::FakeEmbedder embedder({0.0f, 0.0f});
  embedder.set("query", {1.0f, 0.0f});
  embedder.set("closer", {1.0f, 1e-5f});
  embedder.set("further", {1.0f, 2e-5f});
  SemanticReranker reranker(embedder);

  auto ranked = reranker.rerank("query", {candidate(0, "further"), candidate(1, "closer")});

  // Both similarities round to the same float, but the closer chunk still ranks first.
  ASSERT_EQ(ranked.size(), 2u);
  EXPECT_EQ(ranked[0].score, ranked[1].score);
  EXPECT_EQ(ranked[0].chunk.content, "closer");
  EXPECT_EQ(ranked[1].chunk.content, "further");
}

TEST(SemanticRerankerTest, Rerank_EmptyInputMakesNoEmbedderCalls) {
  ragkit_tests::MockEmbedder embedder;
  EXPECT_CALL(embedder, embed(_)).Times(0);
  SemanticReranker reranker(embedder);

  EXPECT_TRUE(reranker.rerank("query", {}).empty());
}

TEST(SemanticRerankerTest, Rerank_WrongVectorCountThrows) {
  ragkit_tests::MockEmbedder embedder;
  EXPECT_CALL(embedder, embed(_))
      .WillOnce(Return(std::vector<std::vector<float>>{{1.0f, 0.0f}}))
      .WillOnce(Return(std::vector<std::vector<float>>{{1.0f, 0.0f}}));
  SemanticReranker reranker(embedder);

  EXPECT_THROW(reranker.rerank("q", {candidate(0, "a"), candidate(1, "b")}), EmbeddingUnavailable);
}

TEST(SemanticRerankerTest, Rerank_PropagatesEmbedderFailure) {
  ragkit_tests::FakeEmbedder embedder({1.0f});
  embedder.fail_with("connection refused");
  SemanticReranker reranker(embedder);

  EXPECT_THROW(reranker.rerank("q", {candidate(0, "a")}), EmbeddingUnavailable);
}

}  // namespace ragkit_core
