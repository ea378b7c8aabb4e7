#include "ragkit_core/db/metadata_store.hpp"

#include <cstring>
#include <iostream>
#include <sstream>

#include "ragkit_core/db/pooled_connection.hpp"

namespace ragkit_core {

namespace {

DbErrorKind classify_sqlite_code(int primary_code) {
  switch (primary_code) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return DbErrorKind::BusyOrLocked;
    case SQLITE_CONSTRAINT:
      return DbErrorKind::Constraint;
    case SQLITE_READONLY:
      return DbErrorKind::Readonly;
    case SQLITE_IOERR:
      return DbErrorKind::Io;
    case SQLITE_CANTOPEN:
      return DbErrorKind::CantOpen;
    case SQLITE_FULL:
      return DbErrorKind::Full;
    case SQLITE_ERROR:
    case SQLITE_SCHEMA:
      return DbErrorKind::Schema;
    default:
      return DbErrorKind::Generic;
  }
}

std::vector<char> to_blob(const std::vector<float> &vector) {
  std::vector<char> blob(vector.size() * sizeof(float));
  if (!blob.empty()) {
    std::memcpy(blob.data(), vector.data(), blob.size());
  }
  return blob;
}

std::vector<float> from_blob(const std::vector<char> &blob) {
  std::vector<float> vector(blob.size() / sizeof(float));
  if (!vector.empty()) {
    std::memcpy(vector.data(), blob.data(), vector.size() * sizeof(float));
  }
  return vector;
}

}  // namespace

std::string to_string(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::BusyOrLocked:
      return "busy_or_locked";
    case DbErrorKind::Constraint:
      return "constraint";
    case DbErrorKind::Readonly:
      return "readonly";
    case DbErrorKind::Io:
      return "io";
    case DbErrorKind::CantOpen:
      return "cantopen";
    case DbErrorKind::Full:
      return "full";
    case DbErrorKind::Schema:
      return "schema";
    case DbErrorKind::Generic:
      return "generic";
  }
  return "generic";
}

MetadataStoreError MetadataStoreError::from_sqlite(const std::string &operation,
                                                   const sqlite::sqlite_exception &e) {
  const int code = e.get_code();
  const int xcode = e.get_extended_code();
  const DbErrorKind kind = classify_sqlite_code(code);
  std::string msg = operation + " failed: (" + to_string(kind) + ") " + e.errstr();
  msg += " [code=" + std::to_string(code) + ", xcode=" + std::to_string(xcode) + "]";
  return MetadataStoreError(msg, kind);
}

MetadataStore::MetadataStore(DatabaseManager &db_manager) : db_manager_(db_manager) {}

std::vector<int64_t> MetadataStore::append_chunks(const std::vector<Chunk> &chunks) {
  std::vector<int64_t> ids;
  ids.reserve(chunks.size());
  if (chunks.empty()) {
    return ids;
  }

  try {
    PooledConnection conn(db_manager_);
    // No enclosing transaction: each INSERT autocommits, so a failure midway keeps the
    // rows already written.
    for (const auto &chunk : chunks) {
      *conn << "INSERT INTO chunks (tenant_id, doc_id, source, chunk_index, content, embedding) "
               "VALUES (?, ?, ?, ?, ?, ?)"
            << chunk.tenant_id << chunk.doc_id << chunk.source << chunk.chunk_index
            << chunk.content << to_blob(chunk.embedding);
      ids.push_back(static_cast<int64_t>(conn->last_insert_rowid()));
    }
  } catch (const sqlite::sqlite_exception &e) {
    if (!ids.empty()) {
      std::cerr << "MetadataStore: append aborted after " << ids.size() << " of " << chunks.size()
                << " rows; written rows remain." << std::endl;
    }
    throw MetadataStoreError::from_sqlite("append_chunks", e);
  }
  return ids;
}

std::optional<Chunk> MetadataStore::get_chunk(int64_t id, bool with_embedding) {
  try {
    std::optional<Chunk> result;
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, tenant_id, doc_id, source, chunk_index, content, embedding "
             "FROM chunks WHERE id = ?"
          << id >>
        [&](int64_t row_id, std::string tenant_id, std::string doc_id, std::string source,
            int chunk_index, std::string content, std::vector<char> embedding) {
          Chunk chunk;
          chunk.id = row_id;
          chunk.tenant_id = std::move(tenant_id);
          chunk.doc_id = std::move(doc_id);
          chunk.source = std::move(source);
          chunk.chunk_index = chunk_index;
          chunk.content = std::move(content);
          if (with_embedding) {
            chunk.embedding = from_blob(embedding);
          }
          result = std::move(chunk);
        };
    return result;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError::from_sqlite("get_chunk", e);
  }
}

std::unordered_map<int64_t, Chunk> MetadataStore::get_chunks(const std::vector<int64_t> &ids) {
  std::unordered_map<int64_t, Chunk> id_to_chunk;
  if (ids.empty()) {
    return id_to_chunk;
  }

  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, tenant_id, doc_id, source, chunk_index, content FROM chunks WHERE id IN (" +
                 id_vector_to_comma_string(ids) + ")" >>
        [&](int64_t id, std::string tenant_id, std::string doc_id, std::string source,
            int chunk_index, std::string content) {
          Chunk chunk;
          chunk.id = id;
          chunk.tenant_id = std::move(tenant_id);
          chunk.doc_id = std::move(doc_id);
          chunk.source = std::move(source);
          chunk.chunk_index = chunk_index;
          chunk.content = std::move(content);
          id_to_chunk.emplace(id, std::move(chunk));
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError::from_sqlite("get_chunks", e);
  }
  return id_to_chunk;
}

EmbeddingScan MetadataStore::scan_embeddings(int dimension) {
  EmbeddingScan scan;
  scan.dimension = dimension;
  const size_t expected_bytes = static_cast<size_t>(dimension) * sizeof(float);

  try {
    PooledConnection conn(db_manager_);
    *conn << "SELECT id, embedding FROM chunks ORDER BY id" >>
        [&](int64_t id, std::vector<char> embedding) {
          if (embedding.size() == expected_bytes) {
            scan.ids.push_back(id);
            const float *vec_ptr = reinterpret_cast<const float *>(embedding.data());
            scan.vectors.insert(scan.vectors.end(), vec_ptr, vec_ptr + dimension);
          } else {
            ++scan.skipped;
          }
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError::from_sqlite("scan_embeddings", e);
  }

  if (scan.skipped > 0) {
    std::cerr << "Warning: skipped " << scan.skipped
              << " chunk rows whose vector dimension differs from " << dimension << "."
              << std::endl;
  }
  return scan;
}

int64_t MetadataStore::count_chunks() {
  try {
    int64_t count = 0;
    PooledConnection conn(db_manager_);
    *conn << "SELECT COUNT(*) FROM chunks" >> count;
    return count;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError::from_sqlite("count_chunks", e);
  }
}

int64_t MetadataStore::count_chunks_with_dimension(int dimension) {
  try {
    int64_t count = 0;
    PooledConnection conn(db_manager_);
    *conn << "SELECT COUNT(*) FROM chunks WHERE length(embedding) = ?"
          << static_cast<int64_t>(dimension * sizeof(float)) >>
        count;
    return count;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError::from_sqlite("count_chunks_with_dimension", e);
  }
}

std::optional<int> MetadataStore::latest_dimension() {
  try {
    std::optional<int> dimension;
    PooledConnection conn(db_manager_);
    *conn << "SELECT length(embedding) FROM chunks ORDER BY id DESC LIMIT 1" >>
        [&](int64_t num_bytes) { dimension = static_cast<int>(num_bytes / sizeof(float)); };
    return dimension;
  } catch (const sqlite::sqlite_exception &e) {
    throw MetadataStoreError::from_sqlite("latest_dimension", e);
  }
}

std::string MetadataStore::id_vector_to_comma_string(const std::vector<int64_t> &ids) {
  std::stringstream ss;
  for (size_t i = 0; i < ids.size(); ++i) {
    ss << ids[i];
    if (i < ids.size() - 1)
      ss << ",";
  }
  return ss.str();
}

}  // namespace ragkit_core
