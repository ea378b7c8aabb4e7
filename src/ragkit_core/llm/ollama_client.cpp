#include "ragkit_core/llm/ollama_client.hpp"

#include <iostream>

#include "ollama.hpp"
#include "ragkit_core/errors.hpp"

namespace ragkit_core {

namespace {

std::optional<int> read_count(const nlohmann::json &body, const char *field) {
  if (body.contains(field) && body[field].is_number_integer()) {
    return body[field].get<int>();
  }
  return std::nullopt;
}

}  // namespace

OllamaClient::OllamaClient(const std::string &ollama_url,
                           const std::string &embedding_model,
                           const std::string &generation_model)
    : ollama_url_(ollama_url),
      embedding_model_(embedding_model),
      generation_model_(generation_model) {
  ollama::setServerURL(ollama_url_);
  // Models may come up after we do; requests fail individually instead.
  if (!ollama::is_running()) {
    std::cerr << "Warning: Ollama server is not reachable at " << ollama_url_ << std::endl;
  }
}

std::vector<float> OllamaClient::embed_one(const std::string &text) {
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);
    auto json_response = response.as_json();

    if (!json_response.contains("embeddings")) {
      throw EmbeddingUnavailable("Response does not contain embeddings field");
    }

    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array() || embeddings.empty()) {
      throw EmbeddingUnavailable("Embeddings field is not a non-empty array");
    }
    // Array of arrays: one vector per input
    if (embeddings[0].is_array()) {
      return embeddings[0].get<std::vector<float>>();
    }
    return embeddings.get<std::vector<float>>();
  } catch (const ollama::exception &e) {
    throw EmbeddingUnavailable("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingUnavailable("Malformed embedding response: " + std::string(e.what()));
  }
}

std::vector<std::vector<float>> OllamaClient::embed(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(texts.size());
  for (const auto &text : texts) {
    vectors.push_back(embed_one(text));
  }
  return vectors;
}

Completion OllamaClient::complete(const std::vector<ChatMessage> &messages,
                                  int max_tokens,
                                  double temperature,
                                  ResponseFormat format) {
  ollama::messages chat_messages;
  for (const auto &message : messages) {
    chat_messages.push_back(ollama::message(message.role, message.content));
  }

  ollama::options options;
  options["temperature"] = temperature;
  options["num_predict"] = max_tokens;

  try {
    ollama::response response =
        format == ResponseFormat::Json
            ? ollama::chat(generation_model_, chat_messages, options, "json")
            : ollama::chat(generation_model_, chat_messages, options);

    Completion completion;
    completion.text = response.as_simple_string();

    auto body = response.as_json();
    TokenUsage usage;
    usage.prompt_tokens = read_count(body, "prompt_eval_count");
    usage.completion_tokens = read_count(body, "eval_count");
    if (usage.prompt_tokens && usage.completion_tokens) {
      usage.total_tokens = *usage.prompt_tokens + *usage.completion_tokens;
    }
    if (usage.prompt_tokens || usage.completion_tokens) {
      completion.usage = usage;
    }
    return completion;
  } catch (const ollama::exception &e) {
    throw GenerationUnavailable("Generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw GenerationUnavailable("Malformed generation response: " + std::string(e.what()));
  }
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

}  // namespace ragkit_core
