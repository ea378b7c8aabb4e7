#pragma once
#include <faiss/IndexFlat.h>
#include <faiss/IndexIDMap.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

#include "ragkit_core/errors.hpp"

namespace ragkit_core {

class VectorStoreError : public StoreUnavailable {
 public:
  explicit VectorStoreError(const std::string &message) : StoreUnavailable(message) {}
};

struct IndexHit {
  int64_t id;
  float score;
};

/**
 * @brief Exact inner-product index over chunk ids, backed by a FAISS IndexIDMap2 over
 *        IndexFlatIP, plus its snapshot file.
 *
 * Callers store L2-normalized vectors, so scores are cosine similarities.
 * Not thread-safe; VectorStore serializes access.
 */
class VectorIndex {
 public:
  explicit VectorIndex(std::filesystem::path snapshot_path);

  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;

  /**
   * @brief Replaces the in-memory index with the snapshot on disk.
   * @return false when the snapshot is missing or unreadable; the index is then empty.
   */
  bool load_snapshot();

  /**
   * @brief Writes the index to a temporary file and renames it over the snapshot.
   * @throws VectorStoreError on any I/O failure.
   */
  void write_snapshot() const;

  // Discards any current index and creates an empty one.
  void reset(int dimension);

  void clear();

  // `vectors` is row-major, ids.size() rows of dimension() floats.
  void add(const std::vector<int64_t> &ids, const std::vector<float> &vectors);

  // Up to k hits, best first. Requires query.size() == dimension().
  std::vector<IndexHit> search(const std::vector<float> &query, int k) const;

  bool has_index() const { return index_ != nullptr; }
  int dimension() const;
  int64_t size() const;
  const std::filesystem::path &snapshot_path() const { return snapshot_path_; }

 private:
  std::filesystem::path snapshot_path_;
  std::unique_ptr<faiss::IndexIDMap2> index_;
};

// In place; zero vectors are left unchanged.
void normalize_l2(std::vector<float> &vector);

}  // namespace ragkit_core
