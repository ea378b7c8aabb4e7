#include "ragkit_core/services/query_orchestrator.hpp"

#include <cmath>
#include <iostream>
#include <set>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include "ragkit_core/errors.hpp"
#include "ragkit_core/response/context_builder.hpp"

namespace ragkit_core {

namespace {

double round_ms(double ms) {
  return std::round(ms * 100.0) / 100.0;
}

nlohmann::json latency(const SpanHandle &span) {
  return {{"latency_ms", round_ms(span.elapsed_ms())}};
}

// Ends the span with the failure recorded, then rethrows attributed to `stage`.
[[noreturn]] void fail_stage(SpanHandle &span, const std::string &stage, const ServiceError &cause) {
  nlohmann::json metadata = latency(span);
  metadata["error"] = cause.what();
  metadata["error_kind"] = to_string(cause.kind());
  span.end(metadata, nullptr);
  throw StageError(stage, cause);
}

nlohmann::json chunk_ids(const std::vector<RetrievalCandidate> &candidates) {
  nlohmann::json ids = nlohmann::json::array();
  for (const auto &candidate : candidates) {
    ids.push_back(candidate.chunk.citation_key());
  }
  return ids;
}

nlohmann::json optional_count(const std::optional<int> &value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

template <typename T>
void read_field(const nlohmann::json &body, const char *field, T &target) {
  auto it = body.find(field);
  if (it == body.end() || it->is_null()) {
    return;
  }
  try {
    target = it->get<T>();
  } catch (const nlohmann::json::exception &) {
    throw std::invalid_argument(std::string("field '") + field + "' has the wrong type");
  }
}

template <typename T>
void read_optional_field(const nlohmann::json &body, const char *field, std::optional<T> &target) {
  auto it = body.find(field);
  if (it == body.end() || it->is_null()) {
    return;
  }
  T value{};
  read_field(body, field, value);
  target = value;
}

}  // namespace

void QueryRequest::validate() const {
  if (query.empty()) {
    throw std::invalid_argument("query must not be empty");
  }
  if (k < 1 || k > 50) {
    throw std::invalid_argument("k must be between 1 and 50");
  }
  if (max_context_tokens < 200 || max_context_tokens > 6000) {
    throw std::invalid_argument("max_context_tokens must be between 200 and 6000");
  }
  if (max_answer_tokens < 50 || max_answer_tokens > 1000) {
    throw std::invalid_argument("max_answer_tokens must be between 50 and 1000");
  }
  if (temperature < 0.0 || temperature > 1.0) {
    throw std::invalid_argument("temperature must be between 0 and 1");
  }
}

QueryRequest QueryRequest::from_json(const nlohmann::json &body) {
  if (!body.is_object()) {
    throw std::invalid_argument("request body must be a JSON object");
  }
  QueryRequest request;
  read_field(body, "query", request.query);
  read_field(body, "k", request.k);
  read_optional_field(body, "doc_id", request.doc_id);
  read_field(body, "max_context_tokens", request.max_context_tokens);
  read_field(body, "max_answer_tokens", request.max_answer_tokens);
  read_field(body, "temperature", request.temperature);
  read_field(body, "rerank", request.rerank);
  read_field(body, "include_citations", request.include_citations);
  read_optional_field(body, "enable_tools", request.enable_tools);
  read_optional_field(body, "enable_followups", request.enable_followups);
  read_optional_field(body, "enable_planning", request.enable_planning);
  return request;
}

nlohmann::json QueryResponse::to_json() const {
  auto citation_list = [](const std::vector<Citation> &citations) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto &citation : citations) {
      list.push_back({{"source", citation.source}, {"chunk_index", citation.chunk_index}});
    }
    return list;
  };

  nlohmann::json result_list = nlohmann::json::array();
  for (const auto &candidate : results) {
    const Chunk &chunk = candidate.chunk;
    result_list.push_back({{"id", chunk.id},
                           {"content", chunk.content},
                           {"tenant_id", chunk.tenant_id},
                           {"doc_id", chunk.doc_id},
                           {"source", chunk.source},
                           {"chunk_index", chunk.chunk_index},
                           {"score", candidate.score},
                           {"lexical_score", candidate.lexical_score
                                                 ? nlohmann::json(*candidate.lexical_score)
                                                 : nlohmann::json(nullptr)}});
  }

  nlohmann::json body = {{"query", query},
                         {"answer", answer},
                         {"context", context},
                         {"citations",
                          {{"used", citation_list(citations_used)},
                           {"related", citation_list(citations_related)}}},
                         {"results", result_list},
                         {"tool_used", tool_used ? nlohmann::json(*tool_used) : nlohmann::json(nullptr)},
                         {"tool_output",
                          tool_output ? nlohmann::json(*tool_output) : nlohmann::json(nullptr)},
                         {"follow_ups", follow_ups},
                         {"plan", plan ? plan->to_json() : nlohmann::json(nullptr)}};
  if (usage) {
    body["usage"] = {{"prompt_tokens", optional_count(usage->prompt_tokens)},
                     {"completion_tokens", optional_count(usage->completion_tokens)},
                     {"total_tokens", optional_count(usage->total_tokens)}};
  } else {
    body["usage"] = nullptr;
  }
  return body;
}

QueryOrchestrator::QueryOrchestrator(std::shared_ptr<VectorStore> vector_store,
                                     std::shared_ptr<Embedder> embedder,
                                     std::shared_ptr<Generator> generator,
                                     std::shared_ptr<Tracer> tracer,
                                     PipelineFlags defaults)
    : vector_store_(std::move(vector_store)),
      embedder_(std::move(embedder)),
      generator_(std::move(generator)),
      tracer_(std::move(tracer)),
      defaults_(defaults),
      planner_(*generator_),
      semantic_reranker_(*embedder_),
      tool_router_(*generator_),
      followup_generator_(*generator_) {}

std::vector<RetrievalCandidate> QueryOrchestrator::retrieve_dense(
    const RequestContext &context,
    const QueryRequest &request,
    const std::vector<std::string> &queries) {
  std::vector<std::vector<float>> query_vectors = embedder_->embed(queries);
  if (query_vectors.size() != queries.size()) {
    throw EmbeddingUnavailable("Embedder returned " + std::to_string(query_vectors.size()) +
                               " vectors for " + std::to_string(queries.size()) + " queries");
  }

  std::vector<RetrievalCandidate> merged;
  std::set<std::pair<std::string, int>> seen;
  // Planning order decides which duplicate survives.
  for (const auto &query_vector : query_vectors) {
    std::vector<ChunkSearchResult> hits;
    try {
      hits = vector_store_->search(query_vector, request.k, context.tenant_id, request.doc_id);
    } catch (const std::invalid_argument &e) {
      throw StoreUnavailable(std::string("Vector search rejected the query: ") + e.what());
    }
    for (auto &hit : hits) {
      if (!seen.insert({hit.chunk.source, hit.chunk.chunk_index}).second) {
        continue;
      }
      merged.push_back({std::move(hit.chunk), hit.score, RetrievalStage::Dense, std::nullopt});
    }
  }
  return merged;
}

QueryResponse QueryOrchestrator::run(const RequestContext &context, const QueryRequest &request) {
  request.validate();

  const PipelineFlags flags{request.enable_planning.value_or(defaults_.enable_planning),
                            request.enable_tools.value_or(defaults_.enable_tools),
                            defaults_.enable_doc_actions,
                            request.enable_followups.value_or(defaults_.enable_followups)};

  QueryResponse response;
  response.query = request.query;

  {
    auto span = tracer_->start_span(context, "query_reception",
                                    {{"query", request.query},
                                     {"tenant_id", context.tenant_id},
                                     {"doc_id", request.doc_id ? nlohmann::json(*request.doc_id)
                                                               : nlohmann::json(nullptr)}});
    span->end({{"latency_ms", 0}}, nullptr);
  }

  // Planning
  std::vector<std::string> queries = {request.query};
  if (flags.enable_planning) {
    auto span = tracer_->start_span(context, "planning", {{"query", request.query}});
    try {
      QueryPlan plan = planner_.plan(context, request.query, request.doc_id);
      if (!plan.queries.empty()) {
        queries = plan.queries;
      }
      span->end(latency(*span), plan.to_json());
      response.plan = std::move(plan);
    } catch (const ServiceError &e) {
      fail_stage(*span, "planning", e);
    }
    std::cout << "[" << context.request_id << "] planning produced " << queries.size()
              << " queries" << std::endl;
  }

  // Dense retrieval
  std::vector<RetrievalCandidate> dense;
  {
    auto span = tracer_->start_span(context, "dense_retrieval",
                                    {{"k", request.k}, {"queries", queries}});
    try {
      dense = retrieve_dense(context, request, queries);
    } catch (const ServiceError &e) {
      fail_stage(*span, "dense_retrieval", e);
    }
    span->end(latency(*span), {{"chunk_ids", chunk_ids(dense)}});
  }

  // Lexical scoring over the dense candidates; order is left as is.
  {
    auto span = tracer_->start_span(context, "bm25_retrieval", {{"query", request.query}});
    std::vector<LexicalScore> ranking = lexical_reranker_.score(request.query, dense);
    nlohmann::json ranked_ids = nlohmann::json::array();
    nlohmann::json scores = nlohmann::json::array();
    for (const auto &entry : ranking) {
      const std::string id = dense[entry.index].chunk.citation_key();
      ranked_ids.push_back(id);
      scores.push_back({{"chunk_id", id}, {"score", entry.score}});
    }
    span->end(latency(*span), {{"chunk_ids", ranked_ids}, {"scores", scores}});
  }
  response.results = dense;

  // Semantic rerank
  std::vector<RetrievalCandidate> reranked;
  {
    auto span = tracer_->start_span(context, "reranking", {{"enabled", request.rerank}});
    nlohmann::json scores = nlohmann::json::array();
    if (request.rerank) {
      try {
        reranked = semantic_reranker_.rerank(request.query, dense);
      } catch (const ServiceError &e) {
        fail_stage(*span, "reranking", e);
      }
      for (const auto &candidate : reranked) {
        scores.push_back({{"chunk_id", candidate.chunk.citation_key()}, {"score", candidate.score}});
      }
    } else {
      reranked = dense;
    }
    span->end(latency(*span), {{"scores", scores}});
  }

  // Context building
  ContextWindow window;
  {
    auto span = tracer_->start_span(context, "context_building",
                                    {{"budget", request.max_context_tokens}});
    window = build_context(reranked, static_cast<size_t>(request.max_context_tokens));
    span->end(latency(*span), {{"chunk_ids", chunk_ids(window.used)}, {"chars", window.text.size()}});
  }
  response.context = window.text;

  // Tool routing
  if (flags.enable_tools && !window.text.empty()) {
    auto span = tracer_->start_span(context, "tool_routing",
                                    {{"doc_actions", flags.enable_doc_actions}});
    ToolAction action = ToolAction::None;
    std::string output;
    try {
      action = tool_router_.select(context, request.query, window.text, flags.enable_doc_actions);
      output = tool_router_.run(context, action, request.query, window);
    } catch (const ServiceError &e) {
      fail_stage(*span, "tool_routing", e);
    }
    if (action != ToolAction::None) {
      response.tool_used = to_string(action);
      response.tool_output = output;
      std::cout << "[" << context.request_id << "] tool " << to_string(action) << " produced "
                << output.size() << " chars" << std::endl;
    }
    span->end(latency(*span), {{"tool", to_string(action)}, {"output_chars", output.size()}});
  }

  // Generation
  {
    auto span = tracer_->start_span(context, "generation",
                                    {{"max_tokens", request.max_answer_tokens},
                                     {"temperature", request.temperature}});
    std::string tool_block;
    if (response.tool_used && response.tool_output && !response.tool_output->empty()) {
      tool_block = "\n\nTool output (" + *response.tool_used + "):\n" + *response.tool_output + "\n";
    }
    std::vector<ChatMessage> messages = {
        {"system", SYSTEM_PROMPT},
        {"user", window.text + tool_block + "\n\nQuestion: " + request.query}};

    Completion completion;
    try {
      completion = generator_->complete(messages, request.max_answer_tokens, request.temperature,
                                        ResponseFormat::Text);
    } catch (const ServiceError &e) {
      fail_stage(*span, "generation", e);
    }
    response.answer = completion.text;
    response.usage = completion.usage;

    nlohmann::json metadata = latency(*span);
    if (completion.usage) {
      metadata["prompt_tokens"] = optional_count(completion.usage->prompt_tokens);
      metadata["completion_tokens"] = optional_count(completion.usage->completion_tokens);
      metadata["total_tokens"] = optional_count(completion.usage->total_tokens);
    }
    span->end(metadata, {{"answer_chars", response.answer.size()}});
  }

  // Follow-ups
  if (flags.enable_followups) {
    auto span = tracer_->start_span(context, "followups", {{"query", request.query}});
    try {
      response.follow_ups =
          followup_generator_.generate(context, request.query, response.answer, window.text);
    } catch (const ServiceError &e) {
      fail_stage(*span, "followups", e);
    }
    span->end(latency(*span), {{"follow_ups", response.follow_ups}});
  }

  if (request.include_citations) {
    std::unordered_set<int64_t> used_ids;
    for (const auto &candidate : window.used) {
      used_ids.insert(candidate.chunk.id);
      response.citations_used.push_back({candidate.chunk.source, candidate.chunk.chunk_index});
    }
    for (const auto &candidate : reranked) {
      if (used_ids.count(candidate.chunk.id) == 0) {
        response.citations_related.push_back({candidate.chunk.source, candidate.chunk.chunk_index});
      }
    }
  }

  std::cout << "[" << context.request_id << "] query completed: retrieved " << dense.size()
            << ", reranked " << reranked.size() << ", used " << window.used.size() << std::endl;
  return response;
}

}  // namespace ragkit_core
