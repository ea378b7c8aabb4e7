#include <atomic>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <memory>
#include <mutex>

#include "ragkit_api/config.hpp"
#include "ragkit_api/rate_limiter.hpp"
#include "ragkit_api/routes.hpp"
#include "ragkit_api/server.hpp"
#include "ragkit_core/db/database_manager.hpp"
#include "ragkit_core/db/metadata_store.hpp"
#include "ragkit_core/llm/ollama_client.hpp"
#include "ragkit_core/observability/tracer.hpp"
#include "ragkit_core/services/ingestion_service.hpp"
#include "ragkit_core/services/query_orchestrator.hpp"
#include "ragkit_core/text/text_chunker.hpp"
#include "ragkit_core/vector/vector_store.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

int main() {
  try {
    ragkit_api::Config config = ragkit_api::Config::from_file(ragkit_api::Config::default_path());

    std::cout << "Starting ragkit API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Metadata DB Path: " << config.metadata_db_path << std::endl;
    std::cout << "Index Snapshot Path: " << config.index_snapshot_path << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << std::endl;
    std::cout << "Generation Model: " << config.generation_model << std::endl;
    std::cout << "Planning: " << (config.enable_planning ? "on" : "off")
              << ", Tools: " << (config.enable_tools ? "on" : "off")
              << ", Follow-ups: " << (config.enable_followups ? "on" : "off") << std::endl;

    ragkit_core::DatabaseManager db_manager(config.metadata_db_path, config.metadata_db_key,
                                            config.db_pool_size);
    auto metadata_store = std::make_shared<ragkit_core::MetadataStore>(db_manager);
    auto vector_store =
        std::make_shared<ragkit_core::VectorStore>(metadata_store, config.index_snapshot_path);

    auto ollama_client = std::make_shared<ragkit_core::OllamaClient>(
        config.ollama_url, config.embedding_model, config.generation_model);
    std::shared_ptr<ragkit_core::Tracer> tracer;
    if (config.enable_tracing) {
      tracer = std::make_shared<ragkit_core::LogTracer>(std::cout);
    } else {
      tracer = std::make_shared<ragkit_core::NullTracer>();
    }

    auto orchestrator = std::make_shared<ragkit_core::QueryOrchestrator>(
        vector_store, ollama_client, ollama_client, tracer, config.pipeline_flags());
    auto ingestion_service = std::make_shared<ragkit_core::IngestionService>(
        vector_store, ollama_client,
        ragkit_core::TextChunker(static_cast<size_t>(config.chunk_size),
                                 static_cast<size_t>(config.chunk_overlap)));
    auto rate_limiter = std::make_shared<ragkit_api::RateLimiter>();

    ragkit_api::Server server(config.api_base_url);
    ragkit_api::Routes routes(orchestrator, ingestion_service, vector_store, rate_limiter, config);
    routes.register_routes(server);

    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "[1/2] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/2] Shutting down database connections..." << std::endl;
    db_manager.shutdown();

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
