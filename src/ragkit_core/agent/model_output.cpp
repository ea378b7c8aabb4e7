#include "ragkit_core/agent/model_output.hpp"

#include <utf8.h>

namespace ragkit_core {

std::optional<nlohmann::json> parse_json_object(const std::string &text) {
  nlohmann::json parsed = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return std::nullopt;
  }
  return parsed;
}

std::vector<std::string> string_entries(const nlohmann::json &object, const std::string &array_field) {
  std::vector<std::string> entries;
  auto it = object.find(array_field);
  if (it == object.end() || !it->is_array()) {
    return entries;
  }
  for (const auto &entry : *it) {
    if (entry.is_string()) {
      entries.push_back(entry.get<std::string>());
    }
  }
  return entries;
}

std::string context_preview(const std::string &text, size_t limit) {
  if (static_cast<size_t>(utf8::distance(text.begin(), text.end())) <= limit) {
    return text;
  }
  auto cut = text.begin();
  utf8::advance(cut, limit, text.end());
  return std::string(text.begin(), cut) + "\n...[truncated]";
}

}  // namespace ragkit_core
