/**
 * @file config.h
 * @brief Configuration structures and YAML/JSON loader
 */

#pragma once

#include <cstdint>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace hkpdb::config {

// Default values for configuration
namespace defaults {

// Storage defaults
constexpr const char* kBackend = "memory";
constexpr const char* kDatabase = "hkp";
constexpr const char* kCollection = "keys";
constexpr int kPoolSize = 4;
constexpr int kAcquireTimeoutMs = 5000;

// MySQL connection defaults
constexpr int kMysqlPort = 3306;
constexpr int kMysqlConnectTimeoutMs = 3000;
constexpr int kMysqlReadTimeoutMs = 30000;
constexpr int kMysqlWriteTimeoutMs = 30000;

// Query defaults
constexpr int kResultLimit = 100;

}  // namespace defaults

/**
 * @brief Key storage configuration
 */
struct StorageConfig {
  std::string backend = defaults::kBackend;        // "memory" or "mysql"
  std::string database = defaults::kDatabase;      // Database holding the key collection
  std::string collection = defaults::kCollection;  // Key collection (table) name
  int pool_size = defaults::kPoolSize;             // MySQL sessions
  int acquire_timeout_ms = defaults::kAcquireTimeoutMs;
};

/**
 * @brief MySQL connection configuration
 */
struct MysqlConfig {
  std::string host = "127.0.0.1";
  int port = defaults::kMysqlPort;
  std::string user;
  std::string password;
  std::string database;
  int connect_timeout_ms = defaults::kMysqlConnectTimeoutMs;
  int read_timeout_ms = defaults::kMysqlReadTimeoutMs;
  int write_timeout_ms = defaults::kMysqlWriteTimeoutMs;
  // SSL/TLS settings
  bool ssl_enable = false;
  std::string ssl_ca;
  std::string ssl_cert;
  std::string ssl_key;
  bool ssl_verify_server_cert = true;
};

/**
 * @brief Query configuration
 */
struct QueryConfig {
  /**
   * @brief Cap on keyword, modified-since and fetch results
   */
  int result_limit = defaults::kResultLimit;
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
  std::string level = "info";
  std::string file;  ///< Log file path (empty = stdout, path = file output)
};

/**
 * @brief Root configuration
 */
struct Config {
  StorageConfig storage;
  MysqlConfig mysql;
  QueryConfig query;
  LoggingConfig logging;
};

/**
 * @brief Load configuration from YAML or JSON file
 *
 * Detects the format from the extension (.yaml, .yml, .json); other
 * extensions are tried as YAML, then JSON. Every document is validated
 * against the embedded JSON Schema (or schema_path when given).
 *
 * @param path Path to configuration file (YAML or JSON)
 * @param schema_path Optional path to JSON Schema file for validation
 * @return Expected<Config, Error> with configuration or error
 */
hkp::utils::Expected<Config, hkp::utils::Error> LoadConfig(const std::string& path,
                                                           const std::string& schema_path = "");

/**
 * @brief Load configuration from YAML file
 */
hkp::utils::Expected<Config, hkp::utils::Error> LoadConfigYaml(const std::string& path,
                                                               const std::string& schema_path = "");

/**
 * @brief Load configuration from JSON file
 */
hkp::utils::Expected<Config, hkp::utils::Error> LoadConfigJson(const std::string& path,
                                                               const std::string& schema_path = "");

/**
 * @brief Validate JSON configuration against schema
 *
 * @param config_json_str JSON configuration string
 * @param schema_json_str JSON Schema string (empty = embedded schema)
 * @return Expected<void, Error> with success or validation error
 */
hkp::utils::Expected<void, hkp::utils::Error> ValidateConfigJson(const std::string& config_json_str,
                                                                 const std::string& schema_json_str);

}  // namespace hkpdb::config
