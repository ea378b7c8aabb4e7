#define SQLITE_HAS_CODEC 1
#define SQLCIPHER_CRYPTO_OPENSSL 1
#include <sqlcipher/sqlite3.h>
#include "ragkit_core/db/connection_pool.hpp"
#include <stdexcept>

namespace ragkit_core {

ConnectionPool::ConnectionPool(const std::string& db_path, const std::string& db_key, int pool_size)
    : db_path_(db_path), db_key_(db_key) {
  if (pool_size <= 0) {
    throw std::invalid_argument("Connection pool size must be greater than 0");
  }
  for (int i = 0; i < pool_size; ++i) {
    idle_.push(open_keyed_connection());
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::open_keyed_connection() const {
  auto db = std::make_unique<sqlite::database>(db_path_);
  sqlite3* handle = db->connection().get();
  if (!handle) {
    throw std::runtime_error("Failed to get native handle for connection in pool.");
  }

  if (sqlite3_key(handle, db_key_.c_str(), static_cast<int>(db_key_.length())) != SQLITE_OK) {
    throw std::runtime_error("Failed to key database for connection in pool: " +
                             std::string(sqlite3_errmsg(handle)));
  }

  // Fails here, not on first use, when the key is wrong
  *db << "SELECT count(*) FROM sqlite_master;";

  // Concurrent appends wait for the writer lock instead of failing with SQLITE_BUSY
  sqlite3_busy_timeout(handle, 5000);

  *db << "PRAGMA foreign_keys = ON;";
  *db << "PRAGMA journal_mode = WAL;";
  // Every committed append must survive a power loss
  *db << "PRAGMA synchronous = FULL;";
  return db;
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mutex_);
  available_.wait(lock, [this] { return shutting_down_ || !idle_.empty(); });

  if (shutting_down_) {
    throw std::runtime_error("Connection pool is shut down");
  }

  std::unique_ptr<sqlite::database> connection = std::move(idle_.front());
  idle_.pop();
  return connection;
}

void ConnectionPool::return_connection(std::unique_ptr<sqlite::database> connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  // After shutdown the connection is closed here instead of requeued
  if (!shutting_down_) {
    idle_.push(std::move(connection));
  }
  available_.notify_one();
}

void ConnectionPool::shutdown() {
  std::lock_guard<std::mutex> lock(mutex_);
  shutting_down_ = true;
  idle_ = {};
  available_.notify_all();
}

}  // namespace ragkit_core
