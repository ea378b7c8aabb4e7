#include "ragkit_core/retrieval/semantic_reranker.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "ragkit_core/errors.hpp"

namespace ragkit_core {

double cosine_similarity(const std::vector<float> &a, const std::vector<float> &b) {
  const size_t n = std::min(a.size(), b.size());
  double dot = 0.0;
  for (size_t i = 0; i < n; ++i) {
    dot += static_cast<double>(a[i]) * b[i];
  }
  double norm_a = 0.0;
  for (float x : a) {
    norm_a += static_cast<double>(x) * x;
  }
  double norm_b = 0.0;
  for (float x : b) {
    norm_b += static_cast<double>(x) * x;
  }
  norm_a = std::sqrt(norm_a);
  norm_b = std::sqrt(norm_b);
  if (norm_a == 0.0) norm_a = 1.0;
  if (norm_b == 0.0) norm_b = 1.0;
  return dot / (norm_a * norm_b);
}

SemanticReranker::SemanticReranker(Embedder &embedder) : embedder_(embedder) {}

std::vector<RetrievalCandidate> SemanticReranker::rerank(const std::string &query,
                                                         std::vector<RetrievalCandidate> candidates) {
  if (candidates.empty()) {
    return candidates;
  }

  std::vector<std::vector<float>> query_vectors = embedder_.embed({query});
  if (query_vectors.size() != 1) {
    throw EmbeddingUnavailable("Embedder returned " + std::to_string(query_vectors.size()) +
                               " vectors for the query");
  }

  std::vector<std::string> contents;
  contents.reserve(candidates.size());
  for (const auto &candidate : candidates) {
    contents.push_back(candidate.chunk.content);
  }
  std::vector<std::vector<float>> document_vectors = embedder_.embed(contents);
  if (document_vectors.size() != candidates.size()) {
    throw EmbeddingUnavailable("Embedder returned " + std::to_string(document_vectors.size()) +
                               " vectors for " + std::to_string(candidates.size()) + " candidates");
  }

  std::vector<std::pair<double, RetrievalCandidate>> scored;
  scored.reserve(candidates.size());
  for (size_t i = 0; i < candidates.size(); ++i) {
    scored.emplace_back(cosine_similarity(query_vectors.front(), document_vectors[i]),
                        std::move(candidates[i]));
  }
  // Order on the double similarity; the float stored on the candidate can tie.
  std::stable_sort(scored.begin(), scored.end(),
                   [](const auto &a, const auto &b) { return a.first > b.first; });

  candidates.clear();
  for (auto &[similarity, candidate] : scored) {
    candidate.score = static_cast<float>(similarity);
    candidate.stage = RetrievalStage::Semantic;
    candidates.push_back(std::move(candidate));
  }
  return candidates;
}

}  // namespace ragkit_core
