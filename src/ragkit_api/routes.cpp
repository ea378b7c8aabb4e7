#include "ragkit_api/routes.hpp"

#include <iostream>
#include <stdexcept>

#include "ragkit_core/services/ingestion_service.hpp"
#include "ragkit_core/services/query_orchestrator.hpp"
#include "ragkit_core/vector/vector_store.hpp"

namespace ragkit_api {

Routes::Routes(std::shared_ptr<ragkit_core::QueryOrchestrator> orchestrator,
               std::shared_ptr<ragkit_core::IngestionService> ingestion_service,
               std::shared_ptr<ragkit_core::VectorStore> vector_store,
               std::shared_ptr<RateLimiter> rate_limiter,
               const Config &config)
    : orchestrator_(orchestrator),
      ingestion_service_(ingestion_service),
      vector_store_(vector_store),
      rate_limiter_(rate_limiter),
      config_(config) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  CROW_ROUTE(app, "/health")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/api/query").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_query(req);
  });

  CROW_ROUTE(app, "/api/ingest").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_ingest(req);
  });

  std::cout << "All routes registered successfully" << std::endl;
}

std::string Routes::resolve_tenant(const crow::request &req) {
  std::string tenant = req.get_header_value("X-Tenant-Id");
  if (tenant.empty()) {
    tenant = req.get_header_value("X-Session-Id");
  }
  if (tenant.empty()) {
    tenant = req.remote_ip_address;
  }
  return tenant;
}

ragkit_core::RequestContext Routes::make_context(const crow::request &req) {
  return ragkit_core::RequestContext::create(resolve_tenant(req), req.get_header_value("X-Request-Id"));
}

int Routes::status_for(ragkit_core::ErrorKind kind) {
  switch (kind) {
    case ragkit_core::ErrorKind::StoreUnavailable:
      return 503;
    case ragkit_core::ErrorKind::EmbeddingUnavailable:
    case ragkit_core::ErrorKind::GenerationUnavailable:
      return 502;
    case ragkit_core::ErrorKind::RateLimited:
      return 429;
  }
  return 500;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response;
  response["status"] = "ok";
  response["index_state"] = ragkit_core::to_string(vector_store_->state());
  response["indexed_chunks"] = vector_store_->indexed_count();
  response["dimension"] = vector_store_->dimension();
  return create_json_response(response);
}

crow::response Routes::handle_query(const crow::request &req) {
  ragkit_core::RequestContext context = make_context(req);
  try {
    rate_limiter_->check("query", context.tenant_id, config_.query_rate_limit,
                         config_.query_rate_window_seconds);

    ragkit_core::QueryRequest request = ragkit_core::QueryRequest::from_json(parse_json_body(req.body));
    std::cout << "[" << context.request_id << "] query from tenant " << context.tenant_id
              << " with k=" << request.k << std::endl;

    ragkit_core::QueryResponse response = orchestrator_->run(context, request);
    nlohmann::json body = response.to_json();
    body["request_id"] = context.request_id;
    return create_json_response(body);
  } catch (const ragkit_core::ServiceError &e) {
    return create_service_error_response(context, e);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(std::string("Invalid JSON: ") + e.what()), 400);
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_query: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::handle_ingest(const crow::request &req) {
  ragkit_core::RequestContext context = make_context(req);
  try {
    rate_limiter_->check("upload", context.tenant_id, config_.ingest_rate_limit,
                         config_.ingest_rate_window_seconds);

    if (static_cast<long long>(req.body.size()) > config_.max_ingest_bytes) {
      return create_json_response(
          create_error_response("Upload too large. Max size is " +
                                std::to_string(config_.max_ingest_bytes) + " bytes."),
          413);
    }

    nlohmann::json body = parse_json_body(req.body);
    if (!body.is_object() || !body.contains("text") || !body["text"].is_string()) {
      return create_json_response(create_error_response("Missing 'text'"), 400);
    }
    std::string source = body.value("source", std::string("uploaded.txt"));
    std::optional<std::string> doc_id;
    if (body.contains("doc_id") && body["doc_id"].is_string()) {
      doc_id = body["doc_id"].get<std::string>();
    }

    ragkit_core::IngestResult result =
        ingestion_service_->ingest_text(context, source, body["text"].get<std::string>(), doc_id);

    nlohmann::json response;
    response["doc_id"] = result.doc_id;
    response["chunks"] = result.chunk_count;
    response["source"] = source;
    response["request_id"] = context.request_id;
    return create_json_response(response);
  } catch (const ragkit_core::ServiceError &e) {
    return create_service_error_response(context, e);
  } catch (const nlohmann::json::exception &e) {
    return create_json_response(create_error_response(std::string("Invalid JSON: ") + e.what()), 400);
  } catch (const std::invalid_argument &e) {
    return create_json_response(create_error_response(e.what()), 400);
  } catch (const std::exception &e) {
    std::cerr << "Exception in handle_ingest: " << e.what() << std::endl;
    return create_json_response(create_error_response(e.what()), 500);
  }
}

crow::response Routes::create_service_error_response(const ragkit_core::RequestContext &context,
                                                     const ragkit_core::ServiceError &e) {
  std::cerr << "Error: [" << context.request_id << "] " << ragkit_core::to_string(e.kind()) << ": "
            << e.what() << std::endl;
  nlohmann::json error_response = create_error_response(e.what());
  error_response["kind"] = ragkit_core::to_string(e.kind());
  if (const auto *stage_error = dynamic_cast<const ragkit_core::StageError *>(&e)) {
    error_response["stage"] = stage_error->stage();
  }
  error_response["request_id"] = context.request_id;
  return create_json_response(error_response, status_for(e.kind()));
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  return nlohmann::json::parse(body);
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code,
                      json_data.dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

}  // namespace ragkit_api
