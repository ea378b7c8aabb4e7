#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "ragkit_core/db/metadata_store.hpp"
#include "ragkit_core/types/chunk.hpp"
#include "ragkit_core/vector/vector_index.hpp"

namespace ragkit_core {

enum class IndexState { Absent, Loaded, Rebuilding };

std::string to_string(IndexState state);

struct ChunkSearchResult {
  Chunk chunk;
  // Cosine similarity between the normalized query and chunk vectors
  float score;
};

/**
 * @class VectorStore
 * @brief Chunk storage with filtered nearest-neighbour search.
 *
 * Composes the durable MetadataStore with the in-memory VectorIndex. A single mutex covers
 * metadata appends, index mutation, search and snapshot writes. A search that starts after
 * add_chunks() returns always sees the added chunks, and a rebuild never overlaps an add.
 *
 * The index is rebuilt from a full metadata scan when the snapshot is missing, unreadable
 * or stale, and when an add arrives with a different vector dimensionality. A rebuild costs
 * O(corpus size) and blocks every other add and search while it runs; it is expected to be
 * rare (model change, crash recovery), not part of steady-state ingestion.
 */
class VectorStore {
 public:
  VectorStore(std::shared_ptr<MetadataStore> metadata_store,
              const std::filesystem::path &snapshot_path);

  VectorStore(const VectorStore &) = delete;
  VectorStore &operator=(const VectorStore &) = delete;

  /**
   * @brief Appends chunks with their embeddings and indexes them.
   *
   * Embeddings are L2-normalized before they are stored. The snapshot is rewritten before
   * the call returns. The ids, tenant and doc fields of `chunks` are taken as given except
   * `id`, which is assigned by the metadata store.
   *
   * @return The assigned ids, in input order.
   * @throws std::invalid_argument if the sizes differ or the batch mixes dimensionalities.
   * @throws StoreUnavailable if the metadata store or the snapshot cannot be written.
   */
  std::vector<int64_t> add_chunks(const std::vector<Chunk> &chunks,
                                  const std::vector<std::vector<float>> &embeddings);

  /**
   * @brief Nearest chunks to `query_vector` belonging to `tenant_id` (and `doc_id`, if set).
   *
   * Over-fetches max(5k, k) neighbours, then filters. A narrow filter over a large corpus can
   * therefore yield fewer than k results. Empty or absent index yields an empty list.
   */
  std::vector<ChunkSearchResult> search(const std::vector<float> &query_vector,
                                        int k,
                                        const std::string &tenant_id,
                                        const std::optional<std::string> &doc_id = std::nullopt);

  // Discards the in-memory index and rebuilds it from metadata for the newest dimensionality.
  void rebuild_index();

  IndexState state() const { return state_.load(); }
  int dimension() const;
  int64_t indexed_count() const;

  static constexpr int OVERFETCH_FACTOR = 5;

 private:
  void initialize();
  // Caller holds mutex_.
  void rebuild_locked(int dimension);

  std::shared_ptr<MetadataStore> metadata_store_;
  VectorIndex index_;
  mutable std::mutex mutex_;
  std::atomic<IndexState> state_{IndexState::Absent};
};

}  // namespace ragkit_core
