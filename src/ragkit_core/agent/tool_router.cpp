#include "ragkit_core/agent/tool_router.hpp"

#include <algorithm>
#include <iostream>
#include <regex>
#include <sstream>

#include "ragkit_core/agent/model_output.hpp"

namespace ragkit_core {

namespace {

const std::vector<ToolAction> ALL_ACTIONS = {
    ToolAction::Summarize,         ToolAction::ExtractFacts, ToolAction::Compare,
    ToolAction::GenerateChecklist, ToolAction::DraftEmail,   ToolAction::FindTables,
    ToolAction::ListDefinitions,   ToolAction::CitationsBySection, ToolAction::None};

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(line);
  }
  return lines;
}

std::string trim(const std::string &s) {
  const auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

std::string system_instruction(ToolAction action) {
  switch (action) {
    case ToolAction::Summarize:
      return "Summarize the context succinctly for the query. Keep citations.";
    case ToolAction::ExtractFacts:
      return "Extract factual statements from the context with citations.";
    case ToolAction::Compare:
      return "Compare the key entities or options in the context. Use citations.";
    case ToolAction::GenerateChecklist:
      return "Generate a checklist based on the context. Use citations.";
    case ToolAction::DraftEmail:
      return "Draft a professional email using the context. Cite sources if relevant.";
    case ToolAction::None:
    case ToolAction::FindTables:
    case ToolAction::ListDefinitions:
    case ToolAction::CitationsBySection:
      return "You are a helpful assistant.";
  }
  return "You are a helpful assistant.";
}

}  // namespace

std::string to_string(ToolAction action) {
  switch (action) {
    case ToolAction::None:
      return "none";
    case ToolAction::Summarize:
      return "summarize";
    case ToolAction::ExtractFacts:
      return "extract_facts";
    case ToolAction::Compare:
      return "compare";
    case ToolAction::GenerateChecklist:
      return "generate_checklist";
    case ToolAction::DraftEmail:
      return "draft_email";
    case ToolAction::FindTables:
      return "find_tables";
    case ToolAction::ListDefinitions:
      return "list_definitions";
    case ToolAction::CitationsBySection:
      return "citations_by_section";
  }
  return "none";
}

std::optional<ToolAction> tool_action_from_string(const std::string &name) {
  for (ToolAction action : ALL_ACTIONS) {
    if (to_string(action) == name) {
      return action;
    }
  }
  return std::nullopt;
}

bool is_document_action(ToolAction action) {
  switch (action) {
    case ToolAction::FindTables:
    case ToolAction::ListDefinitions:
    case ToolAction::CitationsBySection:
      return true;
    case ToolAction::None:
    case ToolAction::Summarize:
    case ToolAction::ExtractFacts:
    case ToolAction::Compare:
    case ToolAction::GenerateChecklist:
    case ToolAction::DraftEmail:
      return false;
  }
  return false;
}

std::vector<ToolAction> allowed_actions(bool enable_doc_actions) {
  std::vector<ToolAction> allowed;
  for (ToolAction action : ALL_ACTIONS) {
    if (!enable_doc_actions && is_document_action(action)) {
      continue;
    }
    allowed.push_back(action);
  }
  return allowed;
}

std::string find_tables(const std::string &context_text) {
  std::vector<std::string> blocks;
  std::string current;
  for (const auto &line : split_lines(context_text)) {
    if (line.find('|') != std::string::npos || line.find('\t') != std::string::npos) {
      if (!current.empty()) {
        current += "\n";
      }
      current += line;
    } else if (!current.empty()) {
      blocks.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    blocks.push_back(std::move(current));
  }
  if (blocks.empty()) {
    return "No tables found in the provided context.";
  }

  std::string out;
  for (size_t i = 0; i < blocks.size(); ++i) {
    if (i > 0) {
      out += "\n\n";
    }
    out += blocks[i];
  }
  return out;
}

std::string list_definitions(const std::string &context_text) {
  static const std::regex definition_line(R"(^\s*([A-Za-z0-9][^:]{1,60}):\s+(.+)$)");

  std::vector<std::string> results;
  for (const auto &line : split_lines(context_text)) {
    std::smatch match;
    if (std::regex_match(line, match, definition_line)) {
      results.push_back("- " + trim(match[1].str()) + ": " + trim(match[2].str()));
    }
  }
  if (results.empty()) {
    return "No definition-style lines found in the provided context.";
  }

  std::string out;
  for (size_t i = 0; i < results.size(); ++i) {
    if (i > 0) {
      out += "\n";
    }
    out += results[i];
  }
  return out;
}

std::string citations_by_section(const std::vector<RetrievalCandidate> &used) {
  if (used.empty()) {
    return "No citations available.";
  }
  std::string out;
  for (size_t i = 0; i < used.size(); ++i) {
    const Chunk &chunk = used[i].chunk;
    std::string snippet = chunk.content.substr(0, 160);
    std::replace(snippet.begin(), snippet.end(), '\n', ' ');
    if (i > 0) {
      out += "\n";
    }
    out += "[" + chunk.citation_key() + "] " + snippet;
  }
  return out;
}

ToolRouter::ToolRouter(Generator &generator) : generator_(generator) {}

ToolAction ToolRouter::select(const RequestContext &context,
                              const std::string &query,
                              const std::string &context_text,
                              bool enable_doc_actions) {
  const std::vector<ToolAction> allowed = allowed_actions(enable_doc_actions);
  std::string allowed_names;
  for (size_t i = 0; i < allowed.size(); ++i) {
    if (i > 0) {
      allowed_names += ", ";
    }
    allowed_names += to_string(allowed[i]);
  }

  std::vector<ChatMessage> messages = {
      {"system", "You are a strict tool router."},
      {"user",
       "Choose the best tool for the user query based on the context. "
       "Return JSON with keys: tool, reason. Allowed tools: " +
           allowed_names + ".\n\nQuery: " + query + "\n\nContext (preview):\n" +
           context_preview(context_text, PREVIEW_CHARS)}};

  Completion completion = generator_.complete(messages, SELECT_MAX_TOKENS, 0.0, ResponseFormat::Json);

  std::optional<nlohmann::json> data = parse_json_object(completion.text);
  if (!data) {
    std::cerr << "Warning: [" << context.request_id
              << "] tool router output is not a JSON object; using none" << std::endl;
    return ToolAction::None;
  }
  auto tool_it = data->find("tool");
  if (tool_it == data->end() || !tool_it->is_string()) {
    return ToolAction::None;
  }

  std::optional<ToolAction> action = tool_action_from_string(tool_it->get<std::string>());
  if (!action || std::find(allowed.begin(), allowed.end(), *action) == allowed.end()) {
    std::cerr << "Warning: [" << context.request_id << "] tool router chose '"
              << tool_it->get<std::string>() << "', which is not allowed; using none" << std::endl;
    return ToolAction::None;
  }
  return *action;
}

std::string ToolRouter::run(const RequestContext &context,
                            ToolAction action,
                            const std::string &query,
                            const ContextWindow &window) {
  if (action == ToolAction::None) {
    return "";
  }
  if (is_document_action(action)) {
    return run_document_action(context, action, window);
  }
  return run_generator_action(action, query, window.text);
}

std::string ToolRouter::run_document_action(const RequestContext &context,
                                            ToolAction action,
                                            const ContextWindow &window) {
  try {
    switch (action) {
      case ToolAction::FindTables:
        return find_tables(window.text);
      case ToolAction::ListDefinitions:
        return list_definitions(window.text);
      case ToolAction::CitationsBySection:
        return citations_by_section(window.used);
      case ToolAction::None:
      case ToolAction::Summarize:
      case ToolAction::ExtractFacts:
      case ToolAction::Compare:
      case ToolAction::GenerateChecklist:
      case ToolAction::DraftEmail:
        break;
    }
  } catch (const std::exception &e) {
    // std::regex can throw error_complexity/error_stack on pathological lines.
    std::cerr << "Error: [" << context.request_id << "] " << to_string(action)
              << " failed: " << e.what() << std::endl;
    return "Tool " + to_string(action) + " failed: " + e.what();
  }
  return "";
}

std::string ToolRouter::run_generator_action(ToolAction action,
                                             const std::string &query,
                                             const std::string &context_text) {
  std::vector<ChatMessage> messages = {
      {"system", system_instruction(action)},
      {"user", "Context:\n" + context_text + "\n\nTask: " + query}};
  return generator_.complete(messages, TOOL_MAX_TOKENS, TOOL_TEMPERATURE, ResponseFormat::Text).text;
}

}  // namespace ragkit_core
