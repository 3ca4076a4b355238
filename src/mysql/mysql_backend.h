/**
 * @file mysql_backend.h
 * @brief Document backend storing key records in MySQL tables
 */

#pragma once

#ifdef USE_MYSQL

#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "mysql/connection_pool.h"
#include "storage/document_backend.h"

namespace hkpdb::mysql {

/**
 * @brief Key records in InnoDB tables
 *
 * A collection `c` in database `d` is the table `d`.`c` (one row per record)
 * plus `d`.`c_keywords` (one row per record and keyword). Each session
 * borrows one pooled connection for its lifetime. Conditional updates run in
 * a transaction that locks the matching row (SELECT ... FOR UPDATE).
 */
class MySQLBackend : public storage::DocumentBackend {
 public:
  MySQLBackend(Connection::Config config, size_t pool_size,
               std::chrono::milliseconds acquire_timeout = std::chrono::seconds(5));

  Expected<std::unique_ptr<storage::BackendSession>, Error> OpenSession() override;

  [[nodiscard]] std::string Name() const override { return "mysql"; }

  /**
   * @brief Create the collection tables once per backend (idempotent)
   */
  Expected<void, Error> EnsureTables(Connection& connection, const std::string& database, const std::string& name);

  [[nodiscard]] ConnectionPool& Pool() { return pool_; }

 private:
  ConnectionPool pool_;

  std::mutex tables_mutex_;
  std::set<std::string> created_tables_;
};

}  // namespace hkpdb::mysql

#endif  // USE_MYSQL
