#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ragkit_core {

struct Chunk {
  // Assigned by the metadata store on append; 0 until then.
  int64_t id = 0;
  std::string tenant_id;
  std::string doc_id;
  std::string source;
  int chunk_index = 0;
  std::string content;
  std::vector<float> embedding;

  // "source#chunk_index", the key used for citations and deduplication
  std::string citation_key() const;
};

enum class RetrievalStage { Dense, Lexical, Semantic };

std::string to_string(RetrievalStage stage);

struct RetrievalCandidate {
  Chunk chunk;
  float score = 0.0f;
  RetrievalStage stage = RetrievalStage::Dense;
  // Attached by the lexical pass; never used for ordering.
  std::optional<float> lexical_score;
};

}  // namespace ragkit_core
