/**
 * @file key_query.h
 * @brief Read-side operations of the key store
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "openpgp/public_key.h"
#include "storage/storage_handle.h"

namespace hkpdb::storage {

/// Default cap on keyword, modified-since and fetch results
constexpr size_t kDefaultResultLimit = 100;

/**
 * @brief Query engine over the key collection
 *
 * Every input identifier and keyword is lowercased before querying. Inputs
 * are taken by value; callers' containers are never modified. Each call
 * acquires and releases its own backend session.
 */
class KeyQuery {
 public:
  KeyQuery(StorageHandle handle, size_t result_limit) : handle_(std::move(handle)), result_limit_(result_limit) {}

  /**
   * @brief rfingerprints of records whose md5 is in digests (unbounded)
   */
  [[nodiscard]] Expected<std::vector<std::string>, Error> MatchMD5(std::vector<std::string> digests) const;

  /**
   * @brief Expand key identifiers to full rfingerprints (unbounded)
   *
   * Identifiers (in reversed form) at least as long as a full fingerprint
   * are passed through verbatim without an existence check; shorter ones are
   * prefix-matched against stored rfingerprints. Pass-through identifiers
   * come first, in input order, followed by the prefix matches. Empty
   * identifiers are ignored.
   */
  [[nodiscard]] Expected<std::vector<std::string>, Error> Resolve(std::vector<std::string> key_ids) const;

  /**
   * @brief rfingerprints of records sharing at least one keyword (capped)
   */
  [[nodiscard]] Expected<std::vector<std::string>, Error> MatchKeyword(std::vector<std::string> keywords) const;

  /**
   * @brief rfingerprints of records modified strictly after since (capped)
   *
   * No ordering is guaranteed. Page by calling again with a later watermark.
   */
  [[nodiscard]] Expected<std::vector<std::string>, Error> ModifiedSince(
      std::chrono::system_clock::time_point since) const;

  /**
   * @brief Decode stored keys (capped); any decode failure fails the batch
   */
  [[nodiscard]] Expected<std::vector<openpgp::PublicKey>, Error> FetchKeys(
      std::vector<std::string> rfingerprints) const;

  /**
   * @brief Like FetchKeys, with each key's ctime and mtime
   */
  [[nodiscard]] Expected<std::vector<Keyring>, Error> FetchKeyrings(std::vector<std::string> rfingerprints) const;

  [[nodiscard]] size_t ResultLimit() const { return result_limit_; }

 private:
  StorageHandle handle_;
  size_t result_limit_;

  Expected<std::vector<KeyRecord>, Error> FindRecords(const RecordFilter& filter, const FindOptions& options,
                                                       const std::string& operation) const;

  Expected<std::vector<std::string>, Error> FindFingerprints(const RecordFilter& filter, size_t limit,
                                                             const std::string& operation) const;
};

}  // namespace hkpdb::storage
