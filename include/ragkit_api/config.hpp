#pragma once

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "ragkit_core/services/query_orchestrator.hpp"

namespace ragkit_api {

class Config {
 public:
  std::string api_base_url;
  std::string metadata_db_path;
  std::string metadata_db_key;
  int db_pool_size;
  std::string index_snapshot_path;

  std::string ollama_url;
  std::string embedding_model;
  std::string generation_model;

  // Pipeline defaults; requests may override the first four
  bool enable_planning;
  bool enable_tools;
  bool enable_followups;
  bool enable_doc_actions;
  bool enable_tracing;

  // Admission control
  int query_rate_limit;
  int query_rate_window_seconds;
  int ingest_rate_limit;
  int ingest_rate_window_seconds;

  int chunk_size;
  int chunk_overlap;
  long long max_ingest_bytes;

  static constexpr const char *DEFAULT_FILE = "ragkitrc.json";

  // RAGKIT_CONFIG if set, else ragkitrc.json in the working directory
  static std::string default_path() {
    const char *env_path = std::getenv("RAGKIT_CONFIG");
    return env_path && *env_path ? std::string(env_path) : std::string(DEFAULT_FILE);
  }

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string &filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception &e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json &json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Config must be a JSON object");
    }
    Config config;

    config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
    config.metadata_db_path = json_config.value("metadata_db_path", std::string("./data/rag.db"));
    config.metadata_db_key = json_config.value("metadata_db_key", std::string());
    if (config.metadata_db_key.empty()) {
      const char *env_key = std::getenv("RAGKIT_DB_KEY");
      if (env_key) {
        config.metadata_db_key = env_key;
      }
    }
    config.db_pool_size = int_or_default(json_config, "db_pool_size", 4);
    config.index_snapshot_path =
        json_config.value("index_snapshot_path", std::string("./data/faiss.index"));

    config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
    config.embedding_model = json_config.value("embedding_model", std::string("mxbai-embed-large"));
    config.generation_model = json_config.value("generation_model", std::string("llama3.1:8b"));

    config.enable_planning = json_config.value("enable_planning", false);
    config.enable_tools = json_config.value("enable_tools", true);
    config.enable_followups = json_config.value("enable_followups", true);
    config.enable_doc_actions = json_config.value("enable_doc_actions", true);
    config.enable_tracing = json_config.value("enable_tracing", true);

    config.query_rate_limit = int_or_default(json_config, "query_rate_limit", 10);
    config.query_rate_window_seconds = int_or_default(json_config, "query_rate_window_seconds", 3600);
    config.ingest_rate_limit = int_or_default(json_config, "ingest_rate_limit", 1);
    config.ingest_rate_window_seconds = int_or_default(json_config, "ingest_rate_window_seconds", 3600);

    config.chunk_size = int_or_default(json_config, "chunk_size", 800);
    config.chunk_overlap = int_or_default(json_config, "chunk_overlap", 100);
    config.max_ingest_bytes = int_or_default(json_config, "max_ingest_bytes", 10LL * 1024 * 1024);

    config.validate();
    return config;
  }

  ragkit_core::PipelineFlags pipeline_flags() const {
    ragkit_core::PipelineFlags flags;
    flags.enable_planning = enable_planning;
    flags.enable_tools = enable_tools;
    flags.enable_doc_actions = enable_doc_actions;
    flags.enable_followups = enable_followups;
    return flags;
  }

 private:
  // Wrong-typed values fall back to the default
  template <typename T>
  static T int_or_default(const nlohmann::json &json_config, const char *key, T fallback) {
    try {
      if (json_config.contains(key) && json_config.at(key).is_number_integer()) {
        return json_config.at(key).get<T>();
      }
    } catch (const std::exception &) {
      return fallback;
    }
    return fallback;
  }

  void validate() const {
    if (api_base_url.empty() || api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must have the form host:port");
    }
    if (metadata_db_path.empty()) {
      throw std::runtime_error("metadata_db_path cannot be empty");
    }
    if (metadata_db_key.empty()) {
      throw std::runtime_error("metadata_db_key cannot be empty (set it or RAGKIT_DB_KEY)");
    }
    if (db_pool_size <= 0) {
      throw std::runtime_error("db_pool_size must be greater than 0");
    }
    if (index_snapshot_path.empty()) {
      throw std::runtime_error("index_snapshot_path cannot be empty");
    }
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty() || generation_model.empty()) {
      throw std::runtime_error("embedding_model and generation_model cannot be empty");
    }
    if (query_rate_limit <= 0 || ingest_rate_limit <= 0) {
      throw std::runtime_error("rate limits must be greater than 0");
    }
    if (query_rate_window_seconds <= 0 || ingest_rate_window_seconds <= 0) {
      throw std::runtime_error("rate limit windows must be greater than 0");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw std::runtime_error("chunk_overlap must be at least 0 and smaller than chunk_size");
    }
    if (max_ingest_bytes <= 0) {
      throw std::runtime_error("max_ingest_bytes must be greater than 0");
    }
  }
};

}  // namespace ragkit_api
