#include "ragkit_core/retrieval/lexical_reranker.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <unordered_set>

namespace ragkit_core {

std::vector<std::string> Bm25Okapi::tokenize(const std::string &text) {
  std::vector<std::string> tokens;
  std::string current;
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (!current.empty()) {
        tokens.push_back(std::move(current));
        current.clear();
      }
    } else {
      current.push_back(c);
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

Bm25Okapi::Bm25Okapi(const std::vector<std::string> &documents, double k1, double b, double epsilon)
    : k1_(k1), b_(b) {
  std::unordered_map<std::string, int> document_frequency;
  size_t total_length = 0;

  term_frequencies_.reserve(documents.size());
  document_lengths_.reserve(documents.size());
  for (const auto &document : documents) {
    std::vector<std::string> tokens = tokenize(document);
    std::unordered_map<std::string, int> frequencies;
    for (const auto &token : tokens) {
      ++frequencies[token];
    }
    for (const auto &[term, count] : frequencies) {
      ++document_frequency[term];
    }
    total_length += tokens.size();
    document_lengths_.push_back(tokens.size());
    term_frequencies_.push_back(std::move(frequencies));
  }

  if (documents.empty()) {
    return;
  }
  average_length_ = static_cast<double>(total_length) / static_cast<double>(documents.size());

  const double corpus_size = static_cast<double>(documents.size());
  double idf_sum = 0.0;
  std::vector<std::string> negative_terms;
  for (const auto &[term, frequency] : document_frequency) {
    const double idf = std::log(corpus_size - frequency + 0.5) - std::log(frequency + 0.5);
    idf_[term] = idf;
    idf_sum += idf;
    if (idf < 0) {
      negative_terms.push_back(term);
    }
  }

  const double average_idf = idf_.empty() ? 0.0 : idf_sum / static_cast<double>(idf_.size());
  const double floor_idf = epsilon * average_idf;
  for (const auto &term : negative_terms) {
    idf_[term] = floor_idf;
  }
}

std::vector<double> Bm25Okapi::get_scores(const std::string &query) const {
  std::vector<double> scores(term_frequencies_.size(), 0.0);
  // All documents empty: nothing can match.
  if (average_length_ <= 0.0) {
    return scores;
  }

  for (const auto &term : tokenize(query)) {
    auto idf_it = idf_.find(term);
    if (idf_it == idf_.end()) {
      continue;
    }
    for (size_t i = 0; i < term_frequencies_.size(); ++i) {
      auto tf_it = term_frequencies_[i].find(term);
      if (tf_it == term_frequencies_[i].end()) {
        continue;
      }
      const double tf = tf_it->second;
      const double length_norm =
          1.0 - b_ + b_ * static_cast<double>(document_lengths_[i]) / average_length_;
      scores[i] += idf_it->second * (tf * (k1_ + 1.0)) / (tf + k1_ * length_norm);
    }
  }
  return scores;
}

std::vector<LexicalScore> LexicalReranker::score(const std::string &query,
                                                 std::vector<RetrievalCandidate> &candidates) const {
  if (candidates.empty()) {
    return {};
  }

  std::vector<std::string> documents;
  documents.reserve(candidates.size());
  for (const auto &candidate : candidates) {
    documents.push_back(candidate.chunk.content);
  }

  Bm25Okapi bm25(documents);
  std::vector<double> scores = bm25.get_scores(query);

  std::vector<LexicalScore> ranking;
  ranking.reserve(candidates.size());
  for (size_t i = 0; i < candidates.size(); ++i) {
    candidates[i].lexical_score = static_cast<float>(scores[i]);
    ranking.push_back({i, scores[i]});
  }
  std::stable_sort(ranking.begin(), ranking.end(),
                   [](const LexicalScore &a, const LexicalScore &b) { return a.score > b.score; });
  return ranking;
}

}  // namespace ragkit_core
