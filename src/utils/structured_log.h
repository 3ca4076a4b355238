/**
 * @file structured_log.h
 * @brief Structured logging utilities for JSON-formatted logs
 *
 * Failure events are logged as one JSON object per line so they can be
 * filtered by "event" without parsing free text.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace hkp::utils {

/**
 * @brief Structured log builder for JSON-formatted logs
 *
 * Fields keep insertion order; strings are escaped and invalid UTF-8 is
 * replaced, numbers are written unquoted.
 *
 * @code
 * StructuredLog()
 *   .Event("storage_error")
 *   .Field("operation", "update")
 *   .Field("rfingerprint", rfp)
 *   .Field("error", err.to_string())
 *   .Error();
 * @endcode
 */
class StructuredLog {
 public:
  StructuredLog& Event(const std::string& event) {
    fields_["event"] = event;
    return *this;
  }

  StructuredLog& Field(const std::string& key, const std::string& value) {
    fields_[key] = value;
    return *this;
  }

  StructuredLog& Field(const std::string& key, const char* value) { return Field(key, std::string(value)); }

  StructuredLog& Field(const std::string& key, int64_t value) {
    fields_[key] = value;
    return *this;
  }

  StructuredLog& Field(const std::string& key, uint64_t value) {
    fields_[key] = value;
    return *this;
  }

  void Error() const { spdlog::error("{}", Build()); }
  void Warn() const { spdlog::warn("{}", Build()); }
  void Info() const { spdlog::info("{}", Build()); }

 private:
  std::string Build() const { return fields_.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace); }

  nlohmann::ordered_json fields_ = nlohmann::ordered_json::object();
};

/**
 * @brief Log MySQL connection error in structured format
 */
inline void LogMySQLConnectionError(const std::string& host, int port, const std::string& error_msg) {
  StructuredLog()
      .Event("mysql_connection_error")
      .Field("host", host)
      .Field("port", static_cast<int64_t>(port))
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log MySQL query error in structured format
 */
inline void LogMySQLQueryError(const std::string& query, const std::string& error_msg) {
  // Maximum query length to log (prevent log spam)
  constexpr size_t kMaxQueryLogLength = 200;

  StructuredLog()
      .Event("mysql_query_error")
      .Field("query", query.substr(0, kMaxQueryLogLength))
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log key storage operation error in structured format
 */
inline void LogStorageError(const std::string& operation, const std::string& key_id, const std::string& error_msg) {
  StructuredLog()
      .Event("storage_error")
      .Field("operation", operation)
      .Field("key", key_id)
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log a key change listener failure (the change itself is not affected)
 */
inline void LogListenerError(const std::string& change, size_t listener_index, const std::string& error_msg) {
  StructuredLog()
      .Event("key_change_listener_error")
      .Field("change", change)
      .Field("listener", static_cast<uint64_t>(listener_index))
      .Field("error", error_msg)
      .Warn();
}

}  // namespace hkp::utils
