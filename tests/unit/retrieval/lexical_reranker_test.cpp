#include <gtest/gtest.h>

#include "../../common/utilities_test.hpp"
#include "ragkit_core/retrieval/lexical_reranker.hpp"

namespace ragkit_core {

namespace {

RetrievalCandidate candidate(int index, const std::string &content, float dense_score) {
  RetrievalCandidate c;
  c.chunk = ragkit_tests::TestUtilities::create_test_chunk("t", "d", "d.txt", index, content);
  c.score = dense_score;
  return c;
}

}  // namespace

TEST(Bm25OkapiTest, Tokenize_SplitsOnAnyWhitespace) {
  auto tokens = Bm25Okapi::tokenize("  alpha\tbeta\n\ngamma  ");
  ASSERT_EQ(tokens.size(), 3u);
  EXPECT_EQ(tokens[0], "alpha");
  EXPECT_EQ(tokens[1], "beta");
  EXPECT_EQ(tokens[2], "gamma");
  EXPECT_TRUE(Bm25Okapi::tokenize("   ").empty());
}

TEST(Bm25OkapiTest, GetScores_RareTermScoresOnlyItsDocument) {
  Bm25Okapi bm25({"the cat sat", "the dog ran", "a bird flew"});
  auto scores = bm25.get_scores("dog");

  ASSERT_EQ(scores.size(), 3u);
  EXPECT_GT(scores[1], 0.0);
  EXPECT_DOUBLE_EQ(scores[0], 0.0);
  EXPECT_DOUBLE_EQ(scores[2], 0.0);
}

TEST(Bm25OkapiTest, GetScores_CommonTermGetsEpsilonFloorInsteadOfNegativeIdf) {
  // "the" appears in 3 of 4 documents, so its raw idf is negative.
  Bm25Okapi bm25({"the cat", "the dog", "the bird", "fish swim"});
  auto scores = bm25.get_scores("the");

  EXPECT_GT(scores[0], 0.0);
  EXPECT_DOUBLE_EQ(scores[3], 0.0);
}

TEST(Bm25OkapiTest, GetScores_IsCaseSensitive) {
  Bm25Okapi bm25({"Invoice total", "payment terms"});
  auto scores = bm25.get_scores("invoice");
  EXPECT_DOUBLE_EQ(scores[0], 0.0);
}

TEST(Bm25OkapiTest, GetScores_AllEmptyDocumentsScoreZero) {
  Bm25Okapi bm25({"", "   "});
  auto scores = bm25.get_scores("anything");
  ASSERT_EQ(scores.size(), 2u);
  EXPECT_DOUBLE_EQ(scores[0], 0.0);
  EXPECT_DOUBLE_EQ(scores[1], 0.0);
}

TEST(LexicalRerankerTest, Score_AttachesScoresWithoutReordering) {
  LexicalReranker reranker;
  std::vector<RetrievalCandidate> candidates = {
      candidate(0, "shipping policy overview", 0.9f),
      candidate(1, "refund policy refund window refund", 0.8f),
      candidate(2, "office hours", 0.7f),
  };

  auto ranking = reranker.score("refund", candidates);

  // Dense order is untouched.
  EXPECT_EQ(candidates[0].chunk.chunk_index, 0);
  EXPECT_EQ(candidates[1].chunk.chunk_index, 1);
  EXPECT_EQ(candidates[2].chunk.chunk_index, 2);
  EXPECT_FLOAT_EQ(candidates[0].score, 0.9f);

  for (const auto &c : candidates) {
    ASSERT_TRUE(c.lexical_score.has_value());
  }
  EXPECT_GT(*candidates[1].lexical_score, 0.0f);
  EXPECT_FLOAT_EQ(*candidates[0].lexical_score, 0.0f);

  ASSERT_EQ(ranking.size(), 3u);
  EXPECT_EQ(ranking[0].index, 1u);
  // Ties keep input order.
  EXPECT_EQ(ranking[1].index, 0u);
  EXPECT_EQ(ranking[2].index, 2u);
}

TEST(LexicalRerankerTest, Score_EmptyCandidatesReturnsEmptyRanking) {
  LexicalReranker reranker;
  std::vector<RetrievalCandidate> candidates;
  EXPECT_TRUE(reranker.score("query", candidates).empty());
}

}  // namespace ragkit_core
