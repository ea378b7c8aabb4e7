#include "ragkit_core/agent/query_planner.hpp"

#include <iostream>

#include "ragkit_core/agent/model_output.hpp"

namespace ragkit_core {

nlohmann::json QueryPlan::to_json() const {
  return {{"rewritten_query", rewritten_query},
          {"entities", entities},
          {"subqueries", subqueries},
          {"queries", queries}};
}

QueryPlanner::QueryPlanner(Generator &generator) : generator_(generator) {}

QueryPlan QueryPlanner::plan(const RequestContext &context,
                             const std::string &query,
                             const std::optional<std::string> &doc_id) {
  std::vector<ChatMessage> messages = {
      {"system",
       "Rewrite the query and propose up to 3 targeted retrieval queries. "
       "Return JSON with keys: rewritten_query, entities, subqueries."},
      {"user", "Query: " + query + "\nDoc ID: " + (doc_id && !doc_id->empty() ? *doc_id : "none")}};

  Completion completion = generator_.complete(messages, MAX_TOKENS, 0.0, ResponseFormat::Json);

  QueryPlan plan;
  plan.rewritten_query = query;

  std::optional<nlohmann::json> data = parse_json_object(completion.text);
  if (!data) {
    std::cerr << "Warning: [" << context.request_id
              << "] planner output is not a JSON object; using the original query" << std::endl;
    plan.queries = {query};
    return plan;
  }

  auto rewritten_it = data->find("rewritten_query");
  if (rewritten_it != data->end() && rewritten_it->is_string() &&
      !rewritten_it->get<std::string>().empty()) {
    plan.rewritten_query = rewritten_it->get<std::string>();
  }
  plan.entities = string_entries(*data, "entities");
  plan.subqueries = string_entries(*data, "subqueries");
  if (plan.subqueries.size() > MAX_SUBQUERIES) {
    plan.subqueries.resize(MAX_SUBQUERIES);
  }

  plan.queries.push_back(plan.rewritten_query);
  for (const auto &subquery : plan.subqueries) {
    if (subquery != plan.rewritten_query) {
      plan.queries.push_back(subquery);
    }
  }
  return plan;
}

}  // namespace ragkit_core
