/**
 * @file rnp_handle.cpp
 * @brief librnp helpers
 */

#include "openpgp/rnp_handle.h"

#include <rnp/rnp_err.h>

namespace hkpdb::openpgp {

Error RnpError(rnp_result_t result, const std::string& operation, ErrorCode fallback) {
  ErrorCode code = fallback;
  switch (result) {
    case RNP_ERROR_NOT_ENOUGH_DATA:
    case RNP_ERROR_READ:
      code = ErrorCode::kPacketTruncated;
      break;
    case RNP_ERROR_NOT_SUPPORTED:
    case RNP_ERROR_NOT_IMPLEMENTED:
      code = ErrorCode::kPacketUnsupported;
      break;
    default:
      break;
  }
  return MakeError(code, operation + " failed: " + rnp_result_to_string(result));
}

Expected<FfiPtr, Error> CreateFfi() {
  rnp_ffi_t raw = nullptr;
  const rnp_result_t result = rnp_ffi_create(&raw, RNP_KEYSTORE_GPG, RNP_KEYSTORE_GPG);
  FfiPtr ffi(raw);
  if (result != RNP_SUCCESS) {
    return MakeUnexpected(RnpError(result, "rnp_ffi_create", ErrorCode::kInternalError));
  }
  return ffi;
}

Expected<void, Error> ImportPublicKeys(rnp_ffi_t ffi, std::string_view data) {
  rnp_input_t raw = nullptr;
  rnp_result_t result =
      rnp_input_from_memory(&raw, reinterpret_cast<const uint8_t*>(data.data()), data.size(), false);
  InputPtr input(raw);
  if (result != RNP_SUCCESS) {
    return MakeUnexpected(RnpError(result, "rnp_input_from_memory", ErrorCode::kInternalError));
  }

  result = rnp_import_keys(ffi, input.get(), RNP_LOAD_SAVE_PUBLIC_KEYS, nullptr);
  if (result != RNP_SUCCESS) {
    return MakeUnexpected(RnpError(result, "rnp_import_keys"));
  }
  return {};
}

Expected<KeyHandlePtr, Error> LocateKey(rnp_ffi_t ffi, const std::string& fingerprint) {
  rnp_key_handle_t raw = nullptr;
  const rnp_result_t result = rnp_locate_key(ffi, RNP_IDENTIFIER_FINGERPRINT, fingerprint.c_str(), &raw);
  KeyHandlePtr key(raw);
  if (result != RNP_SUCCESS) {
    return MakeUnexpected(RnpError(result, "rnp_locate_key"));
  }
  if (!key) {
    return MakeUnexpected(MakeError(ErrorCode::kNotFound, "Key not found", "fingerprint=" + fingerprint));
  }
  return key;
}

Expected<std::string, Error> ExportPublicKey(rnp_key_handle_t key) {
  rnp_output_t raw = nullptr;
  rnp_result_t result = rnp_output_to_memory(&raw, 0);
  OutputPtr output(raw);
  if (result != RNP_SUCCESS) {
    return MakeUnexpected(RnpError(result, "rnp_output_to_memory", ErrorCode::kInternalError));
  }

  result = rnp_key_export(key, output.get(), RNP_KEY_EXPORT_PUBLIC | RNP_KEY_EXPORT_SUBKEYS);
  if (result != RNP_SUCCESS) {
    return MakeUnexpected(RnpError(result, "rnp_key_export", ErrorCode::kKeySerializationFailed));
  }

  uint8_t* buffer = nullptr;
  size_t length = 0;
  result = rnp_output_memory_get_buf(output.get(), &buffer, &length, false);
  if (result != RNP_SUCCESS) {
    return MakeUnexpected(RnpError(result, "rnp_output_memory_get_buf", ErrorCode::kKeySerializationFailed));
  }
  return std::string(reinterpret_cast<const char*>(buffer), length);
}

}  // namespace hkpdb::openpgp
