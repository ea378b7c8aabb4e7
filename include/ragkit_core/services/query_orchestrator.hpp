#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "ragkit_core/agent/followup_generator.hpp"
#include "ragkit_core/agent/query_planner.hpp"
#include "ragkit_core/agent/tool_router.hpp"
#include "ragkit_core/llm/embedder.hpp"
#include "ragkit_core/llm/generator.hpp"
#include "ragkit_core/observability/tracer.hpp"
#include "ragkit_core/request_context.hpp"
#include "ragkit_core/retrieval/lexical_reranker.hpp"
#include "ragkit_core/retrieval/semantic_reranker.hpp"
#include "ragkit_core/vector/vector_store.hpp"

namespace ragkit_core {

struct PipelineFlags {
  bool enable_planning = false;
  bool enable_tools = true;
  bool enable_doc_actions = true;
  bool enable_followups = true;
};

struct QueryRequest {
  std::string query;
  int k = 5;
  std::optional<std::string> doc_id;
  // Context budget, measured in characters of rendered context
  int max_context_tokens = 1500;
  int max_answer_tokens = 300;
  double temperature = 0.2;
  bool rerank = true;
  bool include_citations = true;
  std::optional<bool> enable_tools;
  std::optional<bool> enable_followups;
  std::optional<bool> enable_planning;

  // Throws std::invalid_argument naming the first field out of range.
  void validate() const;

  // Missing fields keep their defaults. Wrong types throw std::invalid_argument.
  static QueryRequest from_json(const nlohmann::json &body);
};

struct Citation {
  std::string source;
  int chunk_index;
};

struct QueryResponse {
  std::string query;
  std::string answer;
  std::string context;
  std::vector<Citation> citations_used;
  std::vector<Citation> citations_related;
  // Deduplicated dense candidates, dense order, lexical scores attached
  std::vector<RetrievalCandidate> results;
  std::optional<std::string> tool_used;
  std::optional<std::string> tool_output;
  std::vector<std::string> follow_ups;
  std::optional<QueryPlan> plan;
  std::optional<TokenUsage> usage;

  nlohmann::json to_json() const;
};

/**
 * @class QueryOrchestrator
 * @brief Runs one query through the retrieval and answering stages.
 *
 * Stages run strictly in order on the calling thread:
 * planning, dense retrieval with first-seen deduplication, lexical scoring, semantic
 * rerank, context building, tool routing, generation, follow-ups. Each stage reports a
 * span to the tracer.
 *
 * Lexical scores are attached to the candidates but do not change their order; the
 * semantic reranker (or the pass-through when rerank is off) receives dense order.
 *
 * A collaborator failure aborts the request with a StageError naming the stage.
 */
class QueryOrchestrator {
 public:
  static constexpr const char *SYSTEM_PROMPT = "You are an enterprise RAG assistant.";

  QueryOrchestrator(std::shared_ptr<VectorStore> vector_store,
                    std::shared_ptr<Embedder> embedder,
                    std::shared_ptr<Generator> generator,
                    std::shared_ptr<Tracer> tracer,
                    PipelineFlags defaults);

  QueryResponse run(const RequestContext &context, const QueryRequest &request);

  const PipelineFlags &defaults() const { return defaults_; }

 private:
  std::shared_ptr<VectorStore> vector_store_;
  std::shared_ptr<Embedder> embedder_;
  std::shared_ptr<Generator> generator_;
  std::shared_ptr<Tracer> tracer_;
  PipelineFlags defaults_;

  QueryPlanner planner_;
  LexicalReranker lexical_reranker_;
  SemanticReranker semantic_reranker_;
  ToolRouter tool_router_;
  FollowupGenerator followup_generator_;

  std::vector<RetrievalCandidate> retrieve_dense(const RequestContext &context,
                                                 const QueryRequest &request,
                                                 const std::vector<std::string> &queries);
};

}  // namespace ragkit_core
