#pragma once

#include "ragkit_core/db/connection_pool.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace ragkit_core {

// Owns the schema and the connection pool of one metadata database. Constructed once at
// startup and handed to the stores that need it.
class DatabaseManager {
public:
    DatabaseManager(const std::filesystem::path& db_path, const std::string& db_key, int pool_size);
    ~DatabaseManager();

    // These methods are used by the PooledConnection guard
    std::unique_ptr<sqlite::database> get_connection();
    void return_connection(std::unique_ptr<sqlite::database> conn);

    void shutdown();
    bool is_running() const { return is_running_; }

    const std::filesystem::path& db_path() const { return db_path_; }

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

private:
    void setup_schema(const std::string& db_key);

    std::filesystem::path db_path_;
    std::unique_ptr<ConnectionPool> pool_;
    bool is_running_ = false;
};

} // namespace ragkit_core
