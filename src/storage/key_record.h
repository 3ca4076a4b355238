/**
 * @file key_record.h
 * @brief Persisted key record shape and the key <-> record codec
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "openpgp/public_key.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace hkpdb::storage {

using hkp::utils::Error;
using hkp::utils::ErrorCode;
using hkp::utils::Expected;
using hkp::utils::MakeError;
using hkp::utils::MakeUnexpected;

/**
 * @brief Persisted field names
 */
namespace field {
constexpr const char* kRFingerprint = "rfingerprint";
constexpr const char* kCTime = "ctime";
constexpr const char* kMTime = "mtime";
constexpr const char* kMD5 = "md5";
constexpr const char* kPackets = "packets";
constexpr const char* kKeywords = "keywords";
}  // namespace field

/**
 * @brief One stored key
 *
 * rfingerprint and md5 are unique across the collection. md5 doubles as the
 * optimistic concurrency token: it changes with every content change.
 */
struct KeyRecord {
  std::string rfingerprint;           // Reversed lowercase hex fingerprint
  int64_t ctime = 0;                  // Created (seconds since epoch)
  int64_t mtime = 0;                  // Last modified (seconds since epoch)
  std::string md5;                    // Lowercase hex content digest
  std::string packets;                // Serialized key material
  std::vector<std::string> keywords;  // Sorted, unique, lowercase

  bool operator==(const KeyRecord& other) const {
    return rfingerprint == other.rfingerprint && ctime == other.ctime && mtime == other.mtime && md5 == other.md5 &&
           packets == other.packets && keywords == other.keywords;
  }
};

/**
 * @brief Fields rewritten by a conditional update (ctime is never touched)
 */
struct RecordUpdate {
  int64_t mtime = 0;
  std::string md5;
  std::string packets;
  std::vector<std::string> keywords;
};

/**
 * @brief A decoded key with its storage timestamps
 */
struct Keyring {
  openpgp::PublicKey key;
  std::chrono::system_clock::time_point ctime;
  std::chrono::system_clock::time_point mtime;
};

/**
 * @brief Search keywords of a key
 *
 * Every user ID is split into words (see utils::SplitWords); the union is
 * returned sorted and without duplicates. Same user IDs always give the
 * same keywords.
 */
std::vector<std::string> ExtractKeywords(const openpgp::PublicKey& key);

/**
 * @brief Build a fresh record; ctime and mtime are both set to now
 */
KeyRecord NewRecord(const openpgp::PublicKey& key, int64_t now);

/**
 * @brief Build the update that replaces a record's content with key
 */
RecordUpdate NewRecordUpdate(const openpgp::PublicKey& key, int64_t now);

/**
 * @brief Decode a stored blob that must hold exactly one key
 *
 * Integrity check against storage corruption or mis-keyed records: zero keys,
 * more than one key, any codec error, or a fingerprint other than
 * rfingerprint fails with kStorageDecodeFailed.
 *
 * @param packets Stored packet blob
 * @param rfingerprint Fingerprint the record is stored under
 */
Expected<openpgp::PublicKey, Error> ReadOneKey(const std::string& packets, const std::string& rfingerprint);

}  // namespace hkpdb::storage
