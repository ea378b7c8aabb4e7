#include "ragkit_core/agent/followup_generator.hpp"

#include <iostream>

#include "ragkit_core/agent/model_output.hpp"

namespace ragkit_core {

FollowupGenerator::FollowupGenerator(Generator &generator) : generator_(generator) {}

std::vector<std::string> FollowupGenerator::generate(const RequestContext &context,
                                                     const std::string &query,
                                                     const std::string &answer,
                                                     const std::string &context_text) {
  std::vector<ChatMessage> messages = {
      {"system",
       "Generate 2-3 concise follow-up questions based on the answer "
       "and missing context. Return JSON with key: follow_ups."},
      {"user", "Query: " + query + "\nAnswer: " + answer + "\nContext:\n" +
                   context_preview(context_text, PREVIEW_CHARS)}};

  Completion completion = generator_.complete(messages, MAX_TOKENS, TEMPERATURE, ResponseFormat::Json);

  std::optional<nlohmann::json> data = parse_json_object(completion.text);
  if (!data) {
    std::cerr << "Warning: [" << context.request_id
              << "] follow-up output is not a JSON object; returning none" << std::endl;
    return {};
  }
  std::vector<std::string> follow_ups = string_entries(*data, "follow_ups");
  if (follow_ups.size() > MAX_FOLLOWUPS) {
    follow_ups.resize(MAX_FOLLOWUPS);
  }
  return follow_ups;
}

}  // namespace ragkit_core
