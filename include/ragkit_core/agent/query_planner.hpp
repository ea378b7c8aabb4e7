#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "ragkit_core/llm/generator.hpp"
#include "ragkit_core/request_context.hpp"

namespace ragkit_core {

struct QueryPlan {
  std::string rewritten_query;
  std::vector<std::string> entities;
  std::vector<std::string> subqueries;
  // Retrieval order: the rewritten query first, then distinct subqueries. Never empty.
  std::vector<std::string> queries;

  nlohmann::json to_json() const;
};

class QueryPlanner {
 public:
  static constexpr int MAX_TOKENS = 200;
  static constexpr size_t MAX_SUBQUERIES = 3;

  explicit QueryPlanner(Generator &generator);

  // Malformed model output degrades to a plan whose only query is `query`.
  // Throws GenerationUnavailable when the generator fails.
  QueryPlan plan(const RequestContext &context,
                 const std::string &query,
                 const std::optional<std::string> &doc_id);

 private:
  Generator &generator_;
};

}  // namespace ragkit_core
