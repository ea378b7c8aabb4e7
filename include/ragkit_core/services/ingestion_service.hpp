#pragma once

#include <memory>
#include <optional>
#include <string>

#include "ragkit_core/llm/embedder.hpp"
#include "ragkit_core/request_context.hpp"
#include "ragkit_core/text/text_chunker.hpp"
#include "ragkit_core/vector/vector_store.hpp"

namespace ragkit_core {

struct IngestResult {
  std::string doc_id;
  size_t chunk_count = 0;
};

class IngestionService {
 public:
  IngestionService(std::shared_ptr<VectorStore> vector_store,
                   std::shared_ptr<Embedder> embedder,
                   TextChunker chunker);

  /**
   * @brief Chunks `text`, embeds every chunk in one call and stores the chunks under the
   * caller's tenant.
   *
   * A missing or empty `doc_id` is replaced by a generated one. Nothing is stored when
   * embedding fails.
   *
   * @throws std::invalid_argument for blank or non-UTF-8 text.
   * @throws EmbeddingUnavailable, StoreUnavailable from the collaborators.
   */
  IngestResult ingest_text(const RequestContext &context,
                           const std::string &source,
                           const std::string &text,
                           const std::optional<std::string> &doc_id = std::nullopt);

 private:
  std::shared_ptr<VectorStore> vector_store_;
  std::shared_ptr<Embedder> embedder_;
  TextChunker chunker_;
};

}  // namespace ragkit_core
