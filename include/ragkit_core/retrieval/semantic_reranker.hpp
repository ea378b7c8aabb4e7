#pragma once

#include <string>
#include <vector>

#include "ragkit_core/llm/embedder.hpp"
#include "ragkit_core/types/chunk.hpp"

namespace ragkit_core {

// Cosine similarity with zero norms treated as 1.
double cosine_similarity(const std::vector<float> &a, const std::vector<float> &b);

/**
 * Re-embeds the query and every candidate's content and orders candidates by cosine
 * similarity, highest first. Equal scores keep their input order. Each returned candidate
 * carries its similarity as `score` and `RetrievalStage::Semantic` as its stage.
 *
 * An empty candidate list returns immediately without calling the embedder.
 * Throws EmbeddingUnavailable when the embedder fails or returns the wrong number of vectors.
 */
class SemanticReranker {
 public:
  explicit SemanticReranker(Embedder &embedder);

  std::vector<RetrievalCandidate> rerank(const std::string &query,
                                         std::vector<RetrievalCandidate> candidates);

 private:
  Embedder &embedder_;
};

}  // namespace ragkit_core
