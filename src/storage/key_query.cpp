/**
 * @file key_query.cpp
 * @brief Read-side operations of the key store
 */

#include "storage/key_query.h"

#include <spdlog/spdlog.h>

#include <iterator>

#include "utils/string_utils.h"
#include "utils/structured_log.h"

namespace hkpdb::storage {

namespace {

std::chrono::system_clock::time_point FromUnixSeconds(int64_t seconds) {
  return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

}  // namespace

Expected<std::vector<std::string>, Error> KeyQuery::MatchMD5(std::vector<std::string> digests) const {
  utils::LowercaseAll(digests);
  return FindFingerprints(DigestIn{std::move(digests)}, 0, "match_md5");
}

Expected<std::vector<std::string>, Error> KeyQuery::Resolve(std::vector<std::string> key_ids) const {
  std::vector<std::string> result;
  std::vector<std::string> prefixes;

  for (const auto& key_id : key_ids) {
    if (key_id.empty()) {
      continue;
    }
    std::string normalized = utils::ToLowerAscii(key_id);
    if (normalized.size() < openpgp::kFingerprintHexLength) {
      prefixes.push_back(std::move(normalized));
    } else {
      result.push_back(std::move(normalized));
    }
  }

  if (prefixes.empty()) {
    return result;
  }

  auto matches = FindFingerprints(FingerprintPrefix{std::move(prefixes)}, 0, "resolve");
  if (!matches) {
    return MakeUnexpected(matches.error());
  }
  result.insert(result.end(), std::make_move_iterator(matches->begin()), std::make_move_iterator(matches->end()));
  return result;
}

Expected<std::vector<std::string>, Error> KeyQuery::MatchKeyword(std::vector<std::string> keywords) const {
  for (auto& keyword : keywords) {
    keyword = utils::ToLowerUnicode(keyword);
  }
  return FindFingerprints(KeywordAny{std::move(keywords)}, result_limit_, "match_keyword");
}

Expected<std::vector<std::string>, Error> KeyQuery::ModifiedSince(std::chrono::system_clock::time_point since) const {
  const int64_t seconds = std::chrono::duration_cast<std::chrono::seconds>(since.time_since_epoch()).count();
  return FindFingerprints(ModifiedAfter{seconds}, result_limit_, "modified_since");
}

Expected<std::vector<openpgp::PublicKey>, Error> KeyQuery::FetchKeys(std::vector<std::string> rfingerprints) const {
  auto keyrings = FetchKeyrings(std::move(rfingerprints));
  if (!keyrings) {
    return MakeUnexpected(keyrings.error());
  }

  std::vector<openpgp::PublicKey> keys;
  keys.reserve(keyrings->size());
  for (auto& keyring : *keyrings) {
    keys.push_back(std::move(keyring.key));
  }
  return keys;
}

Expected<std::vector<Keyring>, Error> KeyQuery::FetchKeyrings(std::vector<std::string> rfingerprints) const {
  utils::LowercaseAll(rfingerprints);

  FindOptions options;
  options.limit = result_limit_;
  auto records = FindRecords(FingerprintIn{std::move(rfingerprints)}, options, "fetch_keys");
  if (!records) {
    return MakeUnexpected(records.error());
  }

  std::vector<Keyring> keyrings;
  keyrings.reserve(records->size());
  for (const auto& record : *records) {
    auto key = ReadOneKey(record.packets, record.rfingerprint);
    if (!key) {
      hkp::utils::LogStorageError("fetch_keys", record.rfingerprint, key.error().to_string());
      return MakeUnexpected(key.error());
    }
    keyrings.push_back(Keyring{std::move(*key), FromUnixSeconds(record.ctime), FromUnixSeconds(record.mtime)});
  }
  return keyrings;
}

Expected<std::vector<KeyRecord>, Error> KeyQuery::FindRecords(const RecordFilter& filter, const FindOptions& options,
                                                               const std::string& operation) const {
  auto scope = handle_.Acquire();
  if (!scope) {
    hkp::utils::LogStorageError(operation, "", scope.error().to_string());
    return MakeUnexpected(scope.error());
  }

  auto records = (*scope)->Find(filter, options);
  if (!records) {
    hkp::utils::LogStorageError(operation, "", records.error().to_string());
    return MakeUnexpected(records.error());
  }

  spdlog::debug("{}: {} record(s)", operation, records->size());
  return records;
}

Expected<std::vector<std::string>, Error> KeyQuery::FindFingerprints(const RecordFilter& filter, size_t limit,
                                                                     const std::string& operation) const {
  FindOptions options;
  options.limit = limit;
  options.fingerprints_only = true;

  auto records = FindRecords(filter, options, operation);
  if (!records) {
    return MakeUnexpected(records.error());
  }

  std::vector<std::string> rfingerprints;
  rfingerprints.reserve(records->size());
  for (auto& record : *records) {
    rfingerprints.push_back(std::move(record.rfingerprint));
  }
  return rfingerprints;
}

}  // namespace hkpdb::storage
