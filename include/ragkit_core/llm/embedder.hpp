#pragma once

#include <string>
#include <vector>

namespace ragkit_core {

// Turns texts into dense vectors. Implementations throw EmbeddingUnavailable on failure.
class Embedder {
 public:
  virtual ~Embedder() = default;

  // One vector per input text, in input order.
  virtual std::vector<std::vector<float>> embed(const std::vector<std::string> &texts) = 0;
};

}  // namespace ragkit_core
