/**
 * @file backend_factory.cpp
 * @brief Builds the configured document backend and key store
 */

#include "app/backend_factory.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>

#include "storage/memory_backend.h"

#ifdef USE_MYSQL
#include "mysql/mysql_backend.h"
#endif

namespace hkpdb::app {

using hkp::utils::ErrorCode;
using hkp::utils::MakeError;
using hkp::utils::MakeUnexpected;

namespace {

#ifdef USE_MYSQL
constexpr int kMillisecondsPerSecond = 1000;

uint32_t ToSeconds(int milliseconds) {
  return static_cast<uint32_t>(std::max(1, milliseconds / kMillisecondsPerSecond));
}

mysql::Connection::Config MakeConnectionConfig(const config::MysqlConfig& mysql) {
  mysql::Connection::Config conn_config;
  conn_config.host = mysql.host;
  conn_config.port = static_cast<uint16_t>(mysql.port);
  conn_config.user = mysql.user;
  conn_config.password = mysql.password;
  conn_config.database = mysql.database;
  conn_config.connect_timeout = ToSeconds(mysql.connect_timeout_ms);
  conn_config.read_timeout = ToSeconds(mysql.read_timeout_ms);
  conn_config.write_timeout = ToSeconds(mysql.write_timeout_ms);
  conn_config.ssl_enable = mysql.ssl_enable;
  conn_config.ssl_ca = mysql.ssl_ca;
  conn_config.ssl_cert = mysql.ssl_cert;
  conn_config.ssl_key = mysql.ssl_key;
  conn_config.ssl_verify_server_cert = mysql.ssl_verify_server_cert;
  return conn_config;
}
#endif

}  // namespace

Expected<std::shared_ptr<storage::DocumentBackend>, Error> CreateBackend(const config::Config& config) {
  const auto& backend = config.storage.backend;

  if (backend == "memory") {
    spdlog::info("Using in-memory key store");
    return std::shared_ptr<storage::DocumentBackend>(std::make_shared<storage::MemoryBackend>());
  }

  if (backend == "mysql") {
#ifdef USE_MYSQL
    spdlog::info("Using MySQL key store at {}:{} (pool_size={})", config.mysql.host, config.mysql.port,
                 config.storage.pool_size);
    return std::shared_ptr<storage::DocumentBackend>(std::make_shared<mysql::MySQLBackend>(
        MakeConnectionConfig(config.mysql), static_cast<size_t>(config.storage.pool_size),
        std::chrono::milliseconds(config.storage.acquire_timeout_ms)));
#else
    return MakeUnexpected(
        MakeError(ErrorCode::kInvalidArgument, "MySQL backend is not available in this build (USE_MYSQL is off)"));
#endif
  }

  return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Unknown storage backend: " + backend));
}

storage::StorageOptions MakeStorageOptions(const config::Config& config) {
  storage::StorageOptions options;
  options.database = config.storage.database;
  options.collection = config.storage.collection;
  options.result_limit = static_cast<size_t>(config.query.result_limit);
  return options;
}

Expected<std::unique_ptr<storage::KeyStorage>, Error> OpenKeyStorage(const config::Config& config) {
  auto backend = CreateBackend(config);
  if (!backend) {
    return MakeUnexpected(backend.error());
  }
  return storage::KeyStorage::Create(std::move(*backend), MakeStorageOptions(config));
}

}  // namespace hkpdb::app
