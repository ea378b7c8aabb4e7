#pragma once

#include <string>
#include <vector>

#include "ragkit_core/llm/embedder.hpp"
#include "ragkit_core/llm/generator.hpp"

namespace ragkit_core {

class OllamaClient : public Embedder, public Generator {
 public:
  OllamaClient(const std::string &ollama_url,
               const std::string &embedding_model,
               const std::string &generation_model);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<std::vector<float>> embed(const std::vector<std::string> &texts) override;

  Completion complete(const std::vector<ChatMessage> &messages,
                      int max_tokens,
                      double temperature,
                      ResponseFormat format) override;

  bool is_server_available();

  const std::string &embedding_model() const { return embedding_model_; }
  const std::string &generation_model() const { return generation_model_; }

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  std::string generation_model_;

  std::vector<float> embed_one(const std::string &text);
};

}  // namespace ragkit_core
