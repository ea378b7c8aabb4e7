#include "ragkit_core/types/chunk.hpp"

namespace ragkit_core {

std::string Chunk::citation_key() const {
  return (source.empty() ? std::string("unknown") : source) + "#" + std::to_string(chunk_index);
}

std::string to_string(RetrievalStage stage) {
  switch (stage) {
    case RetrievalStage::Dense:
      return "dense";
    case RetrievalStage::Lexical:
      return "lexical";
    case RetrievalStage::Semantic:
      return "semantic";
  }
  return "unknown";
}

}  // namespace ragkit_core
