/**
 * @file public_key.h
 * @brief OpenPGP transferable public key
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

typedef struct rnp_key_handle_st* rnp_key_handle_t;  // NOLINT(modernize-use-using)

namespace hkpdb::openpgp {

using hkp::utils::Error;
using hkp::utils::Expected;

/// Length of a v4 fingerprint in hex characters
constexpr size_t kFingerprintHexLength = 40;

/// Length of a 64-bit key ID in hex characters
constexpr size_t kKeyIdHexLength = 16;

/// Length of a 32-bit short key ID in hex characters
constexpr size_t kShortIdHexLength = 8;

/**
 * @brief Transferable public key: primary key with its user IDs, subkeys and signatures
 *
 * Parsing, validation and serialization go through librnp; a PublicKey keeps
 * the binary export of the key and the identity values read from it:
 * - Fingerprint(): v4 fingerprint, lowercase hex
 * - RFingerprint(): fingerprint reversed, the stored identity form; a key ID
 *   (the fingerprint's low-order hex digits) becomes a prefix of it
 * - MD5(): content digest over the sorted packet set, changes whenever
 *   packets are added
 */
class PublicKey {
 public:
  /**
   * @brief Build a key from an rnp key handle
   *
   * @return Key, kPacketMalformed if the handle is a subkey,
   *         kPacketUnsupported for key versions other than 4
   */
  static Expected<PublicKey, Error> FromHandle(rnp_key_handle_t handle);

  /**
   * @brief Binary packets of the key as exported by librnp
   */
  [[nodiscard]] const std::string& Packets() const { return packets_; }

  /**
   * @brief User ID strings in key order (user attributes excluded)
   */
  [[nodiscard]] const std::vector<std::string>& UserIds() const { return user_ids_; }

  [[nodiscard]] const std::string& Fingerprint() const { return fingerprint_; }
  [[nodiscard]] const std::string& RFingerprint() const { return rfingerprint_; }
  [[nodiscard]] const std::string& MD5() const { return md5_; }

  /**
   * @brief 64-bit key ID (last 16 hex digits of the fingerprint)
   */
  [[nodiscard]] const std::string& KeyId() const { return key_id_; }

  /// 32-bit short key ID (last 8 hex digits)
  [[nodiscard]] std::string ShortId() const { return key_id_.substr(kKeyIdHexLength - kShortIdHexLength); }

  [[nodiscard]] uint32_t CreationTime() const { return creation_time_; }

  /**
   * @brief Add the packets from other that this key does not have yet
   *
   * Both keys are imported into a scratch keyring, which merges user IDs,
   * subkeys and signatures; the merged key is exported back.
   *
   * @return true if any packet was added, kKeyringFingerprintMismatch if the
   *         keys have different fingerprints
   */
  Expected<bool, Error> Merge(const PublicKey& other);

 private:
  PublicKey() = default;

  std::string packets_;
  std::vector<std::string> user_ids_;
  std::string fingerprint_;
  std::string rfingerprint_;
  std::string key_id_;
  std::string md5_;
  uint32_t creation_time_ = 0;
};

/**
 * @brief SKS-style content digest of a binary key
 *
 * MD5 over the packets sorted by (tag, body), each hashed as a 32-bit tag, a
 * 32-bit body length and the body.
 *
 * @return Lowercase hex digest or a packet framing error
 */
Expected<std::string, Error> ContentDigest(std::string_view packets);

}  // namespace hkpdb::openpgp
