#pragma once
#include <sqlite_modern_cpp.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "ragkit_core/db/database_manager.hpp"
#include "ragkit_core/errors.hpp"
#include "ragkit_core/types/chunk.hpp"

namespace ragkit_core {

enum class DbErrorKind { BusyOrLocked, Constraint, Readonly, Io, CantOpen, Full, Schema, Generic };

std::string to_string(DbErrorKind kind);

class MetadataStoreError : public StoreUnavailable {
 public:
  explicit MetadataStoreError(const std::string &message, DbErrorKind db_kind = DbErrorKind::Generic)
      : StoreUnavailable(message), db_kind_(db_kind) {}

  // "<operation> failed: (<kind>) <sqlite message> [code=..., xcode=...]"
  static MetadataStoreError from_sqlite(const std::string &operation,
                                        const sqlite::sqlite_exception &e);

  DbErrorKind db_kind() const noexcept {
    return db_kind_;
  }

 private:
  DbErrorKind db_kind_;
};

// Flat, row-major copy of the stored vectors of one dimensionality.
struct EmbeddingScan {
  int dimension = 0;
  std::vector<int64_t> ids;
  std::vector<float> vectors;
  size_t skipped = 0;
};

/*
Durable, append-only record store for chunks. Rows are never updated or deleted.
Each appended row commits on its own, so rows written before a failure stay readable.
*/
class MetadataStore {
 public:
  explicit MetadataStore(DatabaseManager &db_manager);

  MetadataStore(const MetadataStore &) = delete;
  MetadataStore &operator=(const MetadataStore &) = delete;
  MetadataStore(MetadataStore &&) = delete;
  MetadataStore &operator=(MetadataStore &&) = delete;

  // Appends in order and returns the assigned ids in the same order.
  std::vector<int64_t> append_chunks(const std::vector<Chunk> &chunks);

  std::optional<Chunk> get_chunk(int64_t id, bool with_embedding = false);

  // Missing ids are absent from the result map. Embeddings are not loaded.
  std::unordered_map<int64_t, Chunk> get_chunks(const std::vector<int64_t> &ids);

  // Every stored vector whose length equals `dimension`; other rows are counted in `skipped`.
  EmbeddingScan scan_embeddings(int dimension);

  int64_t count_chunks();
  int64_t count_chunks_with_dimension(int dimension);

  // Vector length of the newest row, if any rows exist.
  std::optional<int> latest_dimension();

 private:
  DatabaseManager &db_manager_;

  static std::string id_vector_to_comma_string(const std::vector<int64_t> &ids);
};

}  // namespace ragkit_core
