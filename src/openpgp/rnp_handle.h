/**
 * @file rnp_handle.h
 * @brief RAII ownership and error mapping for librnp handles
 */

#pragma once

#include <rnp/rnp.h>

#include <memory>
#include <string>
#include <string_view>

#include "utils/error.h"
#include "utils/expected.h"

namespace hkpdb::openpgp {

using hkp::utils::Error;
using hkp::utils::ErrorCode;
using hkp::utils::Expected;
using hkp::utils::MakeError;
using hkp::utils::MakeUnexpected;

struct FfiDeleter {
  void operator()(rnp_ffi_st* ffi) const { rnp_ffi_destroy(ffi); }
};

struct InputDeleter {
  void operator()(rnp_input_st* input) const { rnp_input_destroy(input); }
};

struct OutputDeleter {
  void operator()(rnp_output_st* output) const { rnp_output_destroy(output); }
};

struct KeyHandleDeleter {
  void operator()(rnp_key_handle_st* key) const { rnp_key_handle_destroy(key); }
};

struct UidHandleDeleter {
  void operator()(rnp_uid_handle_st* uid) const { rnp_uid_handle_destroy(uid); }
};

struct BufferDeleter {
  void operator()(char* buffer) const { rnp_buffer_destroy(buffer); }
};

using FfiPtr = std::unique_ptr<rnp_ffi_st, FfiDeleter>;
using InputPtr = std::unique_ptr<rnp_input_st, InputDeleter>;
using OutputPtr = std::unique_ptr<rnp_output_st, OutputDeleter>;
using KeyHandlePtr = std::unique_ptr<rnp_key_handle_st, KeyHandleDeleter>;
using UidHandlePtr = std::unique_ptr<rnp_uid_handle_st, UidHandleDeleter>;
using RnpBuffer = std::unique_ptr<char, BufferDeleter>;

/**
 * @brief Convert an rnp result into an Error
 *
 * Short reads map to kPacketTruncated, unsupported algorithms or versions to
 * kPacketUnsupported, everything else to fallback.
 *
 * @param result Non-success rnp result code
 * @param operation rnp function that failed
 * @param fallback Code used when the result has no specific mapping
 */
Error RnpError(rnp_result_t result, const std::string& operation, ErrorCode fallback = ErrorCode::kPacketMalformed);

/**
 * @brief Call an rnp getter that returns an allocated C string
 *
 * @code
 * auto fprint = ReadRnpString([&](char** out) { return rnp_key_get_fprint(key, out); }, "rnp_key_get_fprint");
 * @endcode
 */
template <typename Getter>
Expected<std::string, Error> ReadRnpString(Getter getter, const char* operation) {
  char* raw = nullptr;
  const rnp_result_t result = getter(&raw);
  RnpBuffer buffer(raw);
  if (result != RNP_SUCCESS) {
    return MakeUnexpected(RnpError(result, operation));
  }
  return std::string(buffer ? buffer.get() : "");
}

/**
 * @brief Create an FFI context with GPG-format key stores
 */
Expected<FfiPtr, Error> CreateFfi();

/**
 * @brief Import every public key found in data into ffi
 *
 * Keys already present are merged with the imported material.
 */
Expected<void, Error> ImportPublicKeys(rnp_ffi_t ffi, std::string_view data);

/**
 * @brief Find a key by fingerprint (hex, any case)
 * @return Handle or kNotFound
 */
Expected<KeyHandlePtr, Error> LocateKey(rnp_ffi_t ffi, const std::string& fingerprint);

/**
 * @brief Binary transferable public key: primary, user IDs, subkeys and their signatures
 */
Expected<std::string, Error> ExportPublicKey(rnp_key_handle_t key);

}  // namespace hkpdb::openpgp
