#pragma once

#include <string>
#include <vector>

#include "ragkit_core/llm/generator.hpp"
#include "ragkit_core/request_context.hpp"

namespace ragkit_core {

class FollowupGenerator {
 public:
  static constexpr int MAX_TOKENS = 120;
  static constexpr double TEMPERATURE = 0.3;
  static constexpr size_t PREVIEW_CHARS = 800;
  static constexpr size_t MAX_FOLLOWUPS = 3;

  explicit FollowupGenerator(Generator &generator);

  // Up to three follow-up questions. Malformed model output yields an empty list.
  std::vector<std::string> generate(const RequestContext &context,
                                    const std::string &query,
                                    const std::string &answer,
                                    const std::string &context_text);

 private:
  Generator &generator_;
};

}  // namespace ragkit_core
