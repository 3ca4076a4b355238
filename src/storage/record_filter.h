/**
 * @file record_filter.h
 * @brief Query, index and update vocabulary shared by all document backends
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "storage/key_record.h"

namespace hkpdb::storage {

/**
 * @brief Records whose md5 is any of digests
 */
struct DigestIn {
  std::vector<std::string> digests;
};

/**
 * @brief Records whose rfingerprint is any of rfingerprints
 */
struct FingerprintIn {
  std::vector<std::string> rfingerprints;
};

/**
 * @brief Records whose rfingerprint starts with any of prefixes
 */
struct FingerprintPrefix {
  std::vector<std::string> prefixes;
};

/**
 * @brief Records carrying at least one of keywords
 */
struct KeywordAny {
  std::vector<std::string> keywords;
};

/**
 * @brief Records with mtime strictly greater than mtime
 */
struct ModifiedAfter {
  int64_t mtime = 0;
};

/**
 * @brief The record stored under rfingerprint, if its md5 is still md5
 */
struct CurrentDigest {
  std::string rfingerprint;
  std::string md5;
};

using RecordFilter = std::variant<DigestIn, FingerprintIn, FingerprintPrefix, KeywordAny, ModifiedAfter, CurrentDigest>;

/**
 * @brief Options for DocumentCollection::Find
 */
struct FindOptions {
  size_t limit = 0;                // 0 = unbounded
  bool fingerprints_only = false;  // Project rfingerprint only
};

/**
 * @brief Secondary index definition
 */
struct IndexSpec {
  std::string field;
  bool unique = false;
  bool background = false;

  bool operator==(const IndexSpec& other) const {
    return field == other.field && unique == other.unique && background == other.background;
  }
};

/**
 * @brief Outcome of a conditional find-and-modify
 */
struct ModifyResult {
  size_t matched = 0;
  std::optional<KeyRecord> previous;  // Record as it was before the update
};

}  // namespace hkpdb::storage
