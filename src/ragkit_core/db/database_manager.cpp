#define SQLITE_HAS_CODEC 1
#define SQLCIPHER_CRYPTO_OPENSSL 1
#include <sqlcipher/sqlite3.h>

#include "ragkit_core/db/database_manager.hpp"

#include <stdexcept>

namespace ragkit_core {

DatabaseManager::DatabaseManager(const std::filesystem::path& db_path,
                                 const std::string& db_key,
                                 int pool_size)
    : db_path_(db_path) {
  if (db_key.empty()) {
    throw std::invalid_argument("Database key cannot be empty");
  }
  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  // Schema first, on its own connection, so every pooled connection sees the tables
  setup_schema(db_key);
  pool_ = std::make_unique<ConnectionPool>(db_path.string(), db_key, pool_size);
  is_running_ = true;
}

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::shutdown() {
  if (!is_running_) {
    return;
  }
  pool_->shutdown();
  is_running_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_running_) {
    throw std::runtime_error("DatabaseManager has been shut down.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_running_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema(const std::string& db_key) {
  sqlite::database db(db_path_.string());
  sqlite3* handle = db.connection().get();
  if (!handle) {
    throw std::runtime_error("Setup: Failed to get native database handle.");
  }
  if (sqlite3_key(handle, db_key.c_str(), static_cast<int>(db_key.length())) != SQLITE_OK) {
    throw std::runtime_error("Setup: Failed to key database: " +
                             std::string(sqlite3_errmsg(handle)));
  }
  db << "SELECT count(*) FROM sqlite_master;";
  db << "PRAGMA journal_mode = WAL;";

  // Append-only. `id` is the handle shared with the vector index snapshot.
  db << R"(
      CREATE TABLE IF NOT EXISTS chunks (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          tenant_id TEXT NOT NULL,
          doc_id TEXT NOT NULL,
          source TEXT NOT NULL,
          chunk_index INTEGER NOT NULL,
          content TEXT NOT NULL,
          embedding BLOB NOT NULL
      )
    )";

  db << R"(
      CREATE INDEX IF NOT EXISTS idx_chunks_tenant_doc
      ON chunks(tenant_id, doc_id)
    )";
}

}  // namespace ragkit_core
