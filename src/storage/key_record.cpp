/**
 * @file key_record.cpp
 * @brief Key <-> record codec
 */

#include "storage/key_record.h"

#include <set>

#include "openpgp/key_reader.h"
#include "utils/string_utils.h"

namespace hkpdb::storage {

namespace {

Error DecodeError(const std::string& message, const std::string& rfingerprint) {
  return MakeError(ErrorCode::kStorageDecodeFailed, message, "rfingerprint=" + rfingerprint);
}

}  // namespace

std::vector<std::string> ExtractKeywords(const openpgp::PublicKey& key) {
  std::set<std::string> unique;
  for (const auto& user_id : key.UserIds()) {
    for (auto& word : utils::SplitWords(user_id)) {
      unique.insert(std::move(word));
    }
  }
  return {unique.begin(), unique.end()};
}

KeyRecord NewRecord(const openpgp::PublicKey& key, int64_t now) {
  KeyRecord record;
  record.rfingerprint = key.RFingerprint();
  record.ctime = now;
  record.mtime = now;
  record.md5 = key.MD5();
  record.packets = key.Packets();
  record.keywords = ExtractKeywords(key);
  return record;
}

RecordUpdate NewRecordUpdate(const openpgp::PublicKey& key, int64_t now) {
  RecordUpdate update;
  update.mtime = now;
  update.md5 = key.MD5();
  update.packets = key.Packets();
  update.keywords = ExtractKeywords(key);
  return update;
}

Expected<openpgp::PublicKey, Error> ReadOneKey(const std::string& packets, const std::string& rfingerprint) {
  openpgp::KeyReader reader(packets);

  auto first = reader.Next();
  if (!first.has_value()) {
    return MakeUnexpected(DecodeError("no key in stored keyring", rfingerprint));
  }
  if (!*first) {
    return MakeUnexpected(DecodeError(first->error().to_string(), rfingerprint));
  }

  auto second = reader.Next();
  if (second.has_value()) {
    if (!*second) {
      return MakeUnexpected(DecodeError(second->error().to_string(), rfingerprint));
    }
    return MakeUnexpected(DecodeError(
        "multiple keys in keyring: " + (*first)->Fingerprint() + ", " + (*second)->Fingerprint(), rfingerprint));
  }

  if ((*first)->RFingerprint() != rfingerprint) {
    return MakeUnexpected(
        DecodeError("rfingerprint mismatch: expected=" + rfingerprint + " got=" + (*first)->RFingerprint(),
                    rfingerprint));
  }

  return std::move(**first);
}

}  // namespace hkpdb::storage
