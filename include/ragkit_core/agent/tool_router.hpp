#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ragkit_core/llm/generator.hpp"
#include "ragkit_core/request_context.hpp"
#include "ragkit_core/response/context_builder.hpp"

namespace ragkit_core {

enum class ToolAction {
  None,
  Summarize,
  ExtractFacts,
  Compare,
  GenerateChecklist,
  DraftEmail,
  FindTables,
  ListDefinitions,
  CitationsBySection
};

std::string to_string(ToolAction action);
std::optional<ToolAction> tool_action_from_string(const std::string &name);

// Document actions run locally over the context text and never call the generator.
bool is_document_action(ToolAction action);

// Every action the router may choose, `None` last. Document actions are left out when disabled.
std::vector<ToolAction> allowed_actions(bool enable_doc_actions);

// Document actions
std::string find_tables(const std::string &context_text);
std::string list_definitions(const std::string &context_text);
std::string citations_by_section(const std::vector<RetrievalCandidate> &used);

class ToolRouter {
 public:
  static constexpr size_t PREVIEW_CHARS = 1200;
  static constexpr int SELECT_MAX_TOKENS = 120;
  static constexpr int TOOL_MAX_TOKENS = 400;
  static constexpr double TOOL_TEMPERATURE = 0.2;

  explicit ToolRouter(Generator &generator);

  /**
   * @brief Asks the generator to pick one allowed action for the query.
   *
   * Output that is not a JSON object, lacks a `tool` string, or names an action outside
   * the allowed set yields ToolAction::None.
   * @throws GenerationUnavailable when the generator fails.
   */
  ToolAction select(const RequestContext &context,
                    const std::string &query,
                    const std::string &context_text,
                    bool enable_doc_actions);

  /**
   * @brief Runs `action` and returns its output text.
   *
   * Document action failures are reported in the returned text. Generator-backed actions
   * throw GenerationUnavailable. `None` returns an empty string.
   */
  std::string run(const RequestContext &context,
                  ToolAction action,
                  const std::string &query,
                  const ContextWindow &window);

 private:
  Generator &generator_;

  std::string run_document_action(const RequestContext &context,
                                  ToolAction action,
                                  const ContextWindow &window);
  std::string run_generator_action(ToolAction action,
                                   const std::string &query,
                                   const std::string &context_text);
};

}  // namespace ragkit_core
