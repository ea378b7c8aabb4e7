#pragma once
#include <memory>
#include <nlohmann/json.hpp>

#include "ragkit_api/config.hpp"
#include "ragkit_api/rate_limiter.hpp"
#include "ragkit_api/server.hpp"
#include "ragkit_core/errors.hpp"
#include "ragkit_core/request_context.hpp"

namespace ragkit_core {
class QueryOrchestrator;
class IngestionService;
class VectorStore;
}  // namespace ragkit_core

namespace ragkit_api {

class Routes {
 public:
  Routes(std::shared_ptr<ragkit_core::QueryOrchestrator> orchestrator,
         std::shared_ptr<ragkit_core::IngestionService> ingestion_service,
         std::shared_ptr<ragkit_core::VectorStore> vector_store,
         std::shared_ptr<RateLimiter> rate_limiter,
         const Config &config);
  ~Routes() = default;

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  void register_routes(Server &server);

  // X-Tenant-Id, then X-Session-Id, then the client address
  static std::string resolve_tenant(const crow::request &req);
  static ragkit_core::RequestContext make_context(const crow::request &req);
  static int status_for(ragkit_core::ErrorKind kind);

 private:
  std::shared_ptr<ragkit_core::QueryOrchestrator> orchestrator_;
  std::shared_ptr<ragkit_core::IngestionService> ingestion_service_;
  std::shared_ptr<ragkit_core::VectorStore> vector_store_;
  std::shared_ptr<RateLimiter> rate_limiter_;
  Config config_;

  crow::response handle_health_check(const crow::request &req);
  crow::response handle_query(const crow::request &req);
  crow::response handle_ingest(const crow::request &req);

  nlohmann::json parse_json_body(const std::string &body);
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
  crow::response create_service_error_response(const ragkit_core::RequestContext &context,
                                               const ragkit_core::ServiceError &e);
};

}  // namespace ragkit_api
