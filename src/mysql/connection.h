/**
 * @file connection.h
 * @brief MySQL connection wrapper
 */

#pragma once

#ifdef USE_MYSQL

#include <mysql.h>

#include <cstdint>
#include <memory>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace hkpdb::mysql {

using hkp::utils::Error;
using hkp::utils::ErrorCode;
using hkp::utils::Expected;
using hkp::utils::MakeError;
using hkp::utils::MakeUnexpected;

/// MySQL server error: duplicate entry for a unique key
constexpr unsigned int kErDupEntry = 1062;

/**
 * @brief RAII wrapper for MYSQL_RES* to prevent memory leaks
 *
 * Custom deleter for std::unique_ptr that calls mysql_free_result
 */
struct MySQLResultDeleter {
  void operator()(MYSQL_RES* res) const {
    if (res != nullptr) {
      mysql_free_result(res);
    }
  }
};

/// Type alias for RAII-managed MYSQL_RES*
using MySQLResult = std::unique_ptr<MYSQL_RES, MySQLResultDeleter>;

/**
 * @brief MySQL connection wrapper
 *
 * Not thread-safe: one connection serves one session at a time.
 */
class Connection {
 public:
  /**
   * @brief Connection configuration
   */
  // NOLINTBEGIN(readability-magic-numbers,cppcoreguidelines-avoid-magic-numbers) - Default MySQL
  // connection settings
  struct Config {
    std::string host = "localhost";
    uint16_t port = 3306;  // MySQL default port
    std::string user;
    std::string password;
    std::string database;
    uint32_t connect_timeout = 10;  // Default timeout in seconds
    uint32_t read_timeout = 30;     // Default timeout in seconds
    uint32_t write_timeout = 30;    // Default timeout in seconds
    // SSL/TLS settings
    bool ssl_enable = false;
    std::string ssl_ca;
    std::string ssl_cert;
    std::string ssl_key;
    bool ssl_verify_server_cert = true;
  };
  // NOLINTEND(readability-magic-numbers,cppcoreguidelines-avoid-magic-numbers)

  /**
   * @brief Construct connection (not yet connected)
   */
  explicit Connection(Config config);

  /**
   * @brief Destructor - closes connection if open
   */
  ~Connection();

  // Non-copyable
  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // Movable
  Connection(Connection&& other) noexcept;
  Connection& operator=(Connection&& other) noexcept;

  /**
   * @brief Connect to MySQL server
   * @param context Optional context label for logging (e.g., "pool#2")
   */
  Expected<void, Error> Connect(const std::string& context = "");

  /**
   * @brief Check if connection is alive
   */
  [[nodiscard]] bool IsConnected() const;

  /**
   * @brief Ping MySQL server, reconnecting once if the ping fails
   */
  Expected<void, Error> EnsureAlive();

  /**
   * @brief Close connection
   */
  void Close();

  /**
   * @brief Execute a query returning rows
   * @return RAII-managed result set (never null on success)
   */
  Expected<MySQLResult, Error> Execute(const std::string& query);

  /**
   * @brief Execute a statement without result set (INSERT/UPDATE/DDL)
   * @return Number of affected rows
   */
  Expected<uint64_t, Error> ExecuteUpdate(const std::string& query);

  /**
   * @brief AUTO_INCREMENT value generated by the last INSERT
   */
  [[nodiscard]] uint64_t LastInsertId() const;

  /**
   * @brief Quote a string as a SQL literal (including the quotes)
   */
  std::string Quote(const std::string& value);

  /**
   * @brief Last server error number (0 if none)
   */
  [[nodiscard]] unsigned int GetLastErrno() const { return last_errno_; }

  /**
   * @brief Get last error message
   */
  [[nodiscard]] const std::string& GetLastError() const { return last_error_; }

  /**
   * @brief Get connection configuration
   */
  [[nodiscard]] const Config& GetConfig() const { return config_; }

 private:
  Config config_;
  MYSQL* mysql_ = nullptr;
  std::string last_error_;
  unsigned int last_errno_ = 0;

  /**
   * @brief Set last error message from MySQL
   */
  void SetMySQLError();

  /**
   * @brief Error for the last failed statement
   */
  Error QueryError(const std::string& query) const;
};

}  // namespace hkpdb::mysql

#endif  // USE_MYSQL
