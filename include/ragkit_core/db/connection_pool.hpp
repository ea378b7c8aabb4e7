#pragma once
#include <sqlite_modern_cpp.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace ragkit_core {

/**
 * Fixed set of SQLCipher connections, all keyed and configured (WAL, full sync, foreign
 * keys) when the pool is built.
 */
class ConnectionPool {
 public:
  // Throws std::runtime_error if any connection cannot be opened or the key is wrong.
  ConnectionPool(const std::string &db_path, const std::string &db_key, int pool_size);

  // Blocks until a connection is free. Throws std::runtime_error after shutdown().
  std::unique_ptr<sqlite::database> get_connection();

  void return_connection(std::unique_ptr<sqlite::database> connection);

  // Wakes every waiter and closes idle connections.
  void shutdown();

 private:
  std::unique_ptr<sqlite::database> open_keyed_connection() const;

  std::string db_path_;
  std::string db_key_;
  bool shutting_down_ = false;
  std::queue<std::unique_ptr<sqlite::database>> idle_;
  std::mutex mutex_;
  std::condition_variable available_;
};

}  // namespace ragkit_core
