/**
 * @file error.cpp
 * @brief Error code names and formatting
 */

#include "utils/error.h"

namespace hkp::utils {

const char* ErrorCodeToString(ErrorCode code) {
  switch (code) {
    // General
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kUnknown:
      return "Unknown error";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kOutOfRange:
      return "Out of range";
    case ErrorCode::kNotImplemented:
      return "Not implemented";
    case ErrorCode::kInternalError:
      return "Internal error";
    case ErrorCode::kIOError:
      return "I/O error";
    case ErrorCode::kPermissionDenied:
      return "Permission denied";
    case ErrorCode::kNotFound:
      return "Not found";
    case ErrorCode::kAlreadyExists:
      return "Already exists";
    case ErrorCode::kTimeout:
      return "Timeout";
    case ErrorCode::kCancelled:
      return "Cancelled";

    // Configuration
    case ErrorCode::kConfigFileNotFound:
      return "Configuration file not found";
    case ErrorCode::kConfigParseError:
      return "Configuration parse error";
    case ErrorCode::kConfigValidationError:
      return "Configuration validation error";
    case ErrorCode::kConfigMissingRequired:
      return "Missing required configuration";
    case ErrorCode::kConfigInvalidValue:
      return "Invalid configuration value";
    case ErrorCode::kConfigSchemaError:
      return "JSON schema error";
    case ErrorCode::kConfigYamlError:
      return "YAML parsing error";
    case ErrorCode::kConfigJsonError:
      return "JSON parsing error";

    // MySQL
    case ErrorCode::kMySQLConnectionFailed:
      return "MySQL connection failed";
    case ErrorCode::kMySQLQueryFailed:
      return "MySQL query failed";
    case ErrorCode::kMySQLDisconnected:
      return "MySQL disconnected";
    case ErrorCode::kMySQLTimeout:
      return "MySQL timeout";
    case ErrorCode::kMySQLDuplicateEntry:
      return "MySQL duplicate entry";
    case ErrorCode::kMySQLTransactionFailed:
      return "MySQL transaction failed";

    // OpenPGP
    case ErrorCode::kPacketMalformed:
      return "Malformed packet";
    case ErrorCode::kPacketTruncated:
      return "Truncated packet";
    case ErrorCode::kPacketUnsupported:
      return "Unsupported packet";
    case ErrorCode::kKeyringEmpty:
      return "Empty keyring";
    case ErrorCode::kKeyringMultipleKeys:
      return "Multiple keys in keyring";
    case ErrorCode::kKeyringFingerprintMismatch:
      return "Fingerprint mismatch";
    case ErrorCode::kKeySerializationFailed:
      return "Key serialization failed";

    // Storage
    case ErrorCode::kStorageBackendError:
      return "Storage backend error";
    case ErrorCode::kStorageDuplicateKey:
      return "Duplicate key";
    case ErrorCode::kStorageConflict:
      return "Concurrent modification";
    case ErrorCode::kStorageIndexFailed:
      return "Index creation failed";
    case ErrorCode::kStorageSessionUnavailable:
      return "Storage session unavailable";
    case ErrorCode::kStorageDecodeFailed:
      return "Stored key decode failed";
    case ErrorCode::kStorageInvalidRecord:
      return "Invalid key record";

    default:
      return "Unknown error code";
  }
}

std::string Error::to_string() const {
  std::string result = "[";
  result += ErrorCodeToString(code_);
  result += " (";
  result += std::to_string(static_cast<int>(code_));
  result += ")] ";
  result += message_;
  if (!context_.empty()) {
    result += " (context: ";
    result += context_;
    result += ")";
  }
  return result;
}

}  // namespace hkp::utils
