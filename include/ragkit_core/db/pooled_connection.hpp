#pragma once
#include <sqlite_modern_cpp.h>

#include <memory>
#include <stdexcept>

#include "ragkit_core/db/database_manager.hpp"

namespace ragkit_core {

// Borrows a keyed connection from the manager's pool and hands it back on destruction.
class PooledConnection {
 public:
  explicit PooledConnection(DatabaseManager &manager)
      : manager_(manager), connection_(manager.get_connection()) {
    if (!connection_) {
      throw std::runtime_error("No database connection available: the pool is shutting down.");
    }
  }

  ~PooledConnection() {
    if (connection_) {
      manager_.return_connection(std::move(connection_));
    }
  }

  PooledConnection(const PooledConnection &) = delete;
  PooledConnection &operator=(const PooledConnection &) = delete;

  sqlite::database *operator->() const { return connection_.get(); }
  sqlite::database &operator*() const { return *connection_; }

 private:
  DatabaseManager &manager_;
  std::unique_ptr<sqlite::database> connection_;
};

}  // namespace ragkit_core
