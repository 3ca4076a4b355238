/**
 * @file connection.cpp
 * @brief MySQL connection wrapper implementation
 */

#include "mysql/connection.h"

#ifdef USE_MYSQL

#include <spdlog/spdlog.h>

#include <utility>
#include <vector>

#include "utils/structured_log.h"

namespace hkpdb::mysql {

Connection::Connection(Config config) : config_(std::move(config)), mysql_(mysql_init(nullptr)) {
  if (mysql_ == nullptr) {
    last_error_ = "Failed to initialize MySQL handle";
  }
}

Connection::~Connection() {
  Close();
}

Connection::Connection(Connection&& other) noexcept
    : config_(std::move(other.config_)),
      mysql_(other.mysql_),
      last_error_(std::move(other.last_error_)),
      last_errno_(other.last_errno_) {
  other.mysql_ = nullptr;
}

Connection& Connection::operator=(Connection&& other) noexcept {
  if (this != &other) {
    Close();
    config_ = std::move(other.config_);
    mysql_ = other.mysql_;
    last_error_ = std::move(other.last_error_);
    last_errno_ = other.last_errno_;
    other.mysql_ = nullptr;
  }
  return *this;
}

Expected<void, Error> Connection::Connect(const std::string& context) {
  if (mysql_ == nullptr) {
    mysql_ = mysql_init(nullptr);
    if (mysql_ == nullptr) {
      last_error_ = "Failed to initialize MySQL handle";
      return MakeUnexpected(MakeError(ErrorCode::kMySQLConnectionFailed, last_error_));
    }
  }

  // Set connection timeouts
  mysql_options(mysql_, MYSQL_OPT_CONNECT_TIMEOUT, &config_.connect_timeout);
  mysql_options(mysql_, MYSQL_OPT_READ_TIMEOUT, &config_.read_timeout);
  mysql_options(mysql_, MYSQL_OPT_WRITE_TIMEOUT, &config_.write_timeout);

  // Configure SSL/TLS if enabled
  if (config_.ssl_enable) {
    unsigned int ssl_mode = SSL_MODE_REQUIRED;
    if (config_.ssl_verify_server_cert) {
      ssl_mode = SSL_MODE_VERIFY_CA;
    }
    mysql_options(mysql_, MYSQL_OPT_SSL_MODE, &ssl_mode);

    if (!config_.ssl_ca.empty()) {
      mysql_options(mysql_, MYSQL_OPT_SSL_CA, config_.ssl_ca.c_str());
    }
    if (!config_.ssl_cert.empty()) {
      mysql_options(mysql_, MYSQL_OPT_SSL_CERT, config_.ssl_cert.c_str());
    }
    if (!config_.ssl_key.empty()) {
      mysql_options(mysql_, MYSQL_OPT_SSL_KEY, config_.ssl_key.c_str());
    }

    spdlog::debug("SSL/TLS enabled for MySQL connection");
  }

  std::string context_prefix = context.empty() ? "" : "[" + context + "] ";

  if (mysql_real_connect(mysql_, config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                         config_.database.empty() ? nullptr : config_.database.c_str(), config_.port, nullptr,
                         0) == nullptr) {
    SetMySQLError();
    hkp::utils::LogMySQLConnectionError(config_.host, config_.port, context_prefix + last_error_);
    return MakeUnexpected(MakeError(ErrorCode::kMySQLConnectionFailed, last_error_,
                                    config_.host + ":" + std::to_string(config_.port)));
  }

  // Keywords are UTF-8 text
  mysql_set_character_set(mysql_, "utf8mb4");

  std::string db_info = config_.database.empty() ? "" : "/" + config_.database;
  std::string ssl_info = config_.ssl_enable ? " (SSL/TLS)" : "";
  spdlog::info("{}Connected to MySQL {}:{}{}{}", context_prefix, config_.host, config_.port, db_info, ssl_info);
  return {};
}

bool Connection::IsConnected() const {
  if (mysql_ == nullptr) {
    return false;
  }

  // Check if connection was established (thread_id will be 0 if not connected)
  return mysql_thread_id(mysql_) != 0;
}

Expected<void, Error> Connection::EnsureAlive() {
  if (IsConnected() && mysql_ping(mysql_) == 0) {
    return {};
  }

  if (mysql_ != nullptr) {
    SetMySQLError();
    spdlog::warn("MySQL ping failed, reconnecting to {}:{}: {}", config_.host, config_.port, last_error_);
  }

  Close();
  return Connect();
}

void Connection::Close() {
  if (mysql_ != nullptr) {
    mysql_close(mysql_);
    mysql_ = nullptr;
    spdlog::debug("MySQL connection closed");
  }
}

Expected<MySQLResult, Error> Connection::Execute(const std::string& query) {
  if (mysql_ == nullptr) {
    last_error_ = "Not connected";
    return MakeUnexpected(MakeError(ErrorCode::kMySQLDisconnected, last_error_));
  }

  spdlog::debug("Executing query: {}", query);

  if (mysql_query(mysql_, query.c_str()) != 0) {
    SetMySQLError();
    hkp::utils::LogMySQLQueryError(query, last_error_);
    return MakeUnexpected(QueryError(query));
  }

  MySQLResult result(mysql_store_result(mysql_));
  if (result == nullptr) {
    SetMySQLError();
    hkp::utils::LogMySQLQueryError(query, "no result set: " + last_error_);
    return MakeUnexpected(QueryError(query));
  }

  return std::move(result);
}

Expected<uint64_t, Error> Connection::ExecuteUpdate(const std::string& query) {
  if (mysql_ == nullptr) {
    last_error_ = "Not connected";
    return MakeUnexpected(MakeError(ErrorCode::kMySQLDisconnected, last_error_));
  }

  spdlog::debug("Executing update: {}", query);

  if (mysql_query(mysql_, query.c_str()) != 0) {
    SetMySQLError();
    // Duplicate entries are reported to the caller only
    if (last_errno_ != kErDupEntry) {
      hkp::utils::LogMySQLQueryError(query, last_error_);
    }
    return MakeUnexpected(QueryError(query));
  }

  return static_cast<uint64_t>(mysql_affected_rows(mysql_));
}

uint64_t Connection::LastInsertId() const {
  return mysql_ == nullptr ? 0 : static_cast<uint64_t>(mysql_insert_id(mysql_));
}

std::string Connection::Quote(const std::string& value) {
  std::vector<char> buffer(value.size() * 2 + 1);
  unsigned long length = 0;  // NOLINT(google-runtime-int) - MySQL C API type
  if (mysql_ != nullptr) {
    length = mysql_real_escape_string(mysql_, buffer.data(), value.c_str(), value.size());
  } else {
    length = mysql_escape_string(buffer.data(), value.c_str(), value.size());
  }
  return "'" + std::string(buffer.data(), length) + "'";
}

void Connection::SetMySQLError() {
  if (mysql_ != nullptr) {
    last_error_ = std::string(mysql_error(mysql_));
    last_errno_ = mysql_errno(mysql_);
  }
}

Error Connection::QueryError(const std::string& query) const {
  // Maximum query length kept in the error context
  constexpr size_t kMaxQueryContextLength = 200;

  ErrorCode code = last_errno_ == kErDupEntry ? ErrorCode::kMySQLDuplicateEntry : ErrorCode::kMySQLQueryFailed;
  return MakeError(code, "[" + std::to_string(last_errno_) + "] " + last_error_,
                   query.substr(0, kMaxQueryContextLength));
}

}  // namespace hkpdb::mysql

#endif  // USE_MYSQL
