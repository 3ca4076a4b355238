/**
 * @file error.h
 * @brief Error codes and Error value type used with Expected<T, Error>
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace hkp::utils {

/**
 * @brief Error codes grouped by module
 *
 * - 0-999: General
 * - 1000-1999: Configuration
 * - 2000-2999: MySQL
 * - 3000-3999: OpenPGP packet codec
 * - 5000-5999: Key storage
 */
enum class ErrorCode : uint16_t {
  // General
  kSuccess = 0,
  kUnknown = 1,
  kInvalidArgument = 2,
  kOutOfRange = 3,
  kNotImplemented = 4,
  kInternalError = 5,
  kIOError = 6,
  kPermissionDenied = 7,
  kNotFound = 8,
  kAlreadyExists = 9,
  kTimeout = 10,
  kCancelled = 11,

  // Configuration
  kConfigFileNotFound = 1000,
  kConfigParseError = 1001,
  kConfigValidationError = 1002,
  kConfigMissingRequired = 1003,
  kConfigInvalidValue = 1004,
  kConfigSchemaError = 1005,
  kConfigYamlError = 1006,
  kConfigJsonError = 1007,

  // MySQL
  kMySQLConnectionFailed = 2000,
  kMySQLQueryFailed = 2001,
  kMySQLDisconnected = 2002,
  kMySQLTimeout = 2003,
  kMySQLDuplicateEntry = 2004,
  kMySQLTransactionFailed = 2005,

  // OpenPGP packet codec
  kPacketMalformed = 3000,
  kPacketTruncated = 3001,
  kPacketUnsupported = 3002,
  kKeyringEmpty = 3003,
  kKeyringMultipleKeys = 3004,
  kKeyringFingerprintMismatch = 3005,
  kKeySerializationFailed = 3006,

  // Key storage
  kStorageBackendError = 5000,
  kStorageDuplicateKey = 5001,
  kStorageConflict = 5002,
  kStorageIndexFailed = 5003,
  kStorageSessionUnavailable = 5004,
  kStorageDecodeFailed = 5005,
  kStorageInvalidRecord = 5006,
};

/**
 * @brief Human-readable name of an error code
 */
const char* ErrorCodeToString(ErrorCode code);

/**
 * @brief Error value: code, message and optional context
 *
 * The context identifies where the error happened (operation, key
 * identifier or file:line when built with HKP_ERROR).
 */
class Error {
 public:
  Error() = default;

  explicit Error(ErrorCode code) : code_(code), message_(ErrorCodeToString(code)) {}

  Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

  Error(ErrorCode code, std::string message, std::string context)
      : code_(code), message_(std::move(message)), context_(std::move(context)) {}

  [[nodiscard]] ErrorCode code() const { return code_; }
  [[nodiscard]] const std::string& message() const { return message_; }
  [[nodiscard]] const std::string& context() const { return context_; }
  [[nodiscard]] bool is_error() const { return code_ != ErrorCode::kSuccess; }

  /**
   * @brief Format as "[<code name> (<code>)] <message> (context: <context>)"
   */
  [[nodiscard]] std::string to_string() const;

  // NOLINTNEXTLINE(google-explicit-constructor)
  operator std::string() const { return to_string(); }

  [[nodiscard]] const char* what() const { return message_.c_str(); }

 private:
  ErrorCode code_ = ErrorCode::kSuccess;
  std::string message_;
  std::string context_;
};

inline Error MakeError(ErrorCode code) {
  return Error(code);
}

inline Error MakeError(ErrorCode code, std::string message) {
  return {code, std::move(message)};
}

inline Error MakeError(ErrorCode code, std::string message, std::string context) {
  return {code, std::move(message), std::move(context)};
}

}  // namespace hkp::utils

#define HKP_ERROR_STRINGIFY_DETAIL(x) #x
#define HKP_ERROR_STRINGIFY(x) HKP_ERROR_STRINGIFY_DETAIL(x)

/// Build an Error whose context is the current file:line
#define HKP_ERROR(code, message) \
  ::hkp::utils::MakeError((code), (message), __FILE__ ":" HKP_ERROR_STRINGIFY(__LINE__))
