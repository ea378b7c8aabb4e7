#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ragkit_core {

// Parses model output expected to be a JSON object. Anything else yields nullopt.
std::optional<nlohmann::json> parse_json_object(const std::string &text);

// The string entries of `array_field` in `object`, in order; non-strings are dropped.
std::vector<std::string> string_entries(const nlohmann::json &object, const std::string &array_field);

// First `limit` characters (code points) of `text` plus a truncation marker, or `text`
// unchanged when it fits. `text` must be valid UTF-8.
std::string context_preview(const std::string &text, size_t limit);

}  // namespace ragkit_core
