#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "ragkit_core/types/chunk.hpp"

namespace ragkit_core {

/**
 * @class Bm25Okapi
 * @brief Okapi BM25 over a fixed document set, tokenized on whitespace.
 *
 * Corpus statistics (document frequencies, average length) come from the documents
 * passed to the constructor only, so scores from two instances are not comparable.
 * Terms whose idf would be negative (present in more than half the documents) get
 * epsilon times the average idf instead.
 */
class Bm25Okapi {
 public:
  explicit Bm25Okapi(const std::vector<std::string> &documents,
                     double k1 = 1.5,
                     double b = 0.75,
                     double epsilon = 0.25);

  // One score per document, in document order.
  std::vector<double> get_scores(const std::string &query) const;

  static std::vector<std::string> tokenize(const std::string &text);

 private:
  double k1_;
  double b_;
  double average_length_ = 0.0;
  std::vector<std::unordered_map<std::string, int>> term_frequencies_;
  std::vector<size_t> document_lengths_;
  std::unordered_map<std::string, double> idf_;
};

struct LexicalScore {
  size_t index;  // position in the candidate list that was scored
  double score;
};

class LexicalReranker {
 public:
  /**
   * @brief Scores `candidates` against `query` and attaches each score to its candidate.
   *
   * The candidate list keeps its order. The returned ranking lists candidate positions
   * by descending score, ties in input order.
   */
  std::vector<LexicalScore> score(const std::string &query,
                                  std::vector<RetrievalCandidate> &candidates) const;
};

}  // namespace ragkit_core
