#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ragkit_core {

struct ChatMessage {
  std::string role;
  std::string content;
};

enum class ResponseFormat { Text, Json };

struct TokenUsage {
  std::optional<int> prompt_tokens;
  std::optional<int> completion_tokens;
  std::optional<int> total_tokens;
};

struct Completion {
  std::string text;
  std::optional<TokenUsage> usage;
};

// Chat-style text generation. Implementations throw GenerationUnavailable on failure.
class Generator {
 public:
  virtual ~Generator() = default;

  virtual Completion complete(const std::vector<ChatMessage> &messages,
                              int max_tokens,
                              double temperature,
                              ResponseFormat format) = 0;
};

}  // namespace ragkit_core
