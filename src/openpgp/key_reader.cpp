/**
 * @file key_reader.cpp
 * @brief Keyring parsing implementation
 */

#include "openpgp/key_reader.h"

#include <rnp/rnp_err.h>

#include <nlohmann/json.hpp>

namespace hkpdb::openpgp {

namespace {

/**
 * @brief Find the primary key among the keys an import reported
 *
 * @param ffi Keyring the import went into
 * @param import_results JSON from rnp_import_keys: {"keys":[{"fingerprint":...}, ...]}
 */
Expected<KeyHandlePtr, Error> LocateImportedPrimary(rnp_ffi_t ffi, const char* import_results) {
  auto results = nlohmann::json::parse(import_results == nullptr ? "" : import_results, nullptr, false);
  if (results.is_discarded() || !results.contains("keys") || !results["keys"].is_array()) {
    return MakeUnexpected(MakeError(ErrorCode::kPacketMalformed, "Unreadable key import result"));
  }

  for (const auto& entry : results["keys"]) {
    auto handle = LocateKey(ffi, entry.value("fingerprint", ""));
    if (!handle) {
      return MakeUnexpected(handle.error());
    }
    bool primary = false;
    const rnp_result_t result = rnp_key_is_primary(handle->get(), &primary);
    if (result != RNP_SUCCESS) {
      return MakeUnexpected(RnpError(result, "rnp_key_is_primary"));
    }
    if (primary) {
      return std::move(*handle);
    }
  }
  return MakeUnexpected(MakeError(ErrorCode::kPacketMalformed, "Key does not start with a public key packet"));
}

}  // namespace

std::optional<Expected<PublicKey, Error>> KeyReader::Next() {
  if (done_ || data_.empty()) {
    return std::nullopt;
  }

  auto key = ImportNext();
  if (!key.has_value() || !*key) {
    done_ = true;
  }
  return key;
}

std::optional<Expected<PublicKey, Error>> KeyReader::ImportNext() {
  if (!input_) {
    rnp_input_t raw = nullptr;
    const rnp_result_t result =
        rnp_input_from_memory(&raw, reinterpret_cast<const uint8_t*>(data_.data()), data_.size(), false);
    input_.reset(raw);
    if (result != RNP_SUCCESS) {
      return MakeUnexpected(RnpError(result, "rnp_input_from_memory", ErrorCode::kInternalError));
    }
  }

  // Each key goes into its own keyring so repeated keys stay separate
  auto ffi = CreateFfi();
  if (!ffi) {
    return MakeUnexpected(ffi.error());
  }

  char* raw_results = nullptr;
  const rnp_result_t result =
      rnp_import_keys(ffi->get(), input_.get(), RNP_LOAD_SAVE_PUBLIC_KEYS | RNP_LOAD_SAVE_SINGLE, &raw_results);
  RnpBuffer results(raw_results);
  if (result == RNP_ERROR_EOF) {
    return std::nullopt;
  }
  if (result != RNP_SUCCESS) {
    return MakeUnexpected(RnpError(result, "rnp_import_keys"));
  }

  auto handle = LocateImportedPrimary(ffi->get(), results.get());
  if (!handle) {
    return MakeUnexpected(handle.error());
  }
  return PublicKey::FromHandle(handle->get());
}

Expected<std::vector<PublicKey>, Error> ReadKeys(std::string data) {
  std::vector<PublicKey> keys;
  KeyReader reader(std::move(data));
  while (auto next = reader.Next()) {
    if (!*next) {
      return MakeUnexpected(next->error());
    }
    keys.push_back(std::move(**next));
  }
  return keys;
}

}  // namespace hkpdb::openpgp
