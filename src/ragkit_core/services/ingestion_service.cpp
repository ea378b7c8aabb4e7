#include "ragkit_core/services/ingestion_service.hpp"

#include <iostream>
#include <stdexcept>

#include "ragkit_core/errors.hpp"
#include "ragkit_core/util/id_generator.hpp"

namespace ragkit_core {

IngestionService::IngestionService(std::shared_ptr<VectorStore> vector_store,
                                   std::shared_ptr<Embedder> embedder,
                                   TextChunker chunker)
    : vector_store_(std::move(vector_store)),
      embedder_(std::move(embedder)),
      chunker_(std::move(chunker)) {}

IngestResult IngestionService::ingest_text(const RequestContext &context,
                                           const std::string &source,
                                           const std::string &text,
                                           const std::optional<std::string> &doc_id) {
  std::vector<TextChunk> pieces = chunker_.chunk(text);
  if (pieces.empty()) {
    throw std::invalid_argument("No text to ingest");
  }

  IngestResult result;
  result.doc_id = doc_id && !doc_id->empty() ? *doc_id : IdGenerator::generate_uuid();

  std::vector<std::string> texts;
  texts.reserve(pieces.size());
  for (const auto &piece : pieces) {
    texts.push_back(piece.content);
  }
  std::vector<std::vector<float>> embeddings = embedder_->embed(texts);
  if (embeddings.size() != texts.size()) {
    throw EmbeddingUnavailable("Embedder returned " + std::to_string(embeddings.size()) +
                               " vectors for " + std::to_string(texts.size()) + " chunks");
  }

  std::vector<Chunk> chunks;
  chunks.reserve(pieces.size());
  for (auto &piece : pieces) {
    Chunk chunk;
    chunk.tenant_id = context.tenant_id;
    chunk.doc_id = result.doc_id;
    chunk.source = source;
    chunk.chunk_index = piece.chunk_index;
    chunk.content = std::move(piece.content);
    chunks.push_back(std::move(chunk));
  }

  std::vector<int64_t> ids = vector_store_->add_chunks(chunks, embeddings);
  result.chunk_count = ids.size();

  std::cout << "[" << context.request_id << "] ingested " << result.chunk_count << " chunks from '"
            << source << "' as doc " << result.doc_id << std::endl;
  return result;
}

}  // namespace ragkit_core
