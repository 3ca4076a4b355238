/**
 * @file key_writer.cpp
 * @brief Write-side operations of the key store
 */

#include "storage/key_writer.h"

#include <spdlog/spdlog.h>

#include <chrono>

#include "utils/string_utils.h"
#include "utils/structured_log.h"

namespace hkpdb::storage {

int64_t SystemNow() {
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

Expected<void, Error> KeyWriter::Insert(const std::vector<openpgp::PublicKey>& keys) {
  if (keys.empty()) {
    return {};
  }

  auto scope = handle_.Acquire();
  if (!scope) {
    hkp::utils::LogStorageError("insert", "", scope.error().to_string());
    return MakeUnexpected(scope.error());
  }

  for (const auto& key : keys) {
    KeyRecord record = NewRecord(key, now_());
    auto inserted = (*scope)->Insert(record);
    if (!inserted) {
      hkp::utils::LogStorageError("insert", record.rfingerprint, inserted.error().to_string());
      return inserted;
    }

    spdlog::debug("Inserted key {}", key.Fingerprint());
    notifier_.Notify(KeyAdded{record.rfingerprint, record.md5});
  }

  return {};
}

Expected<std::string, Error> KeyWriter::Update(const openpgp::PublicKey& key, const std::string& last_md5) {
  auto scope = handle_.Acquire();
  if (!scope) {
    hkp::utils::LogStorageError("update", key.RFingerprint(), scope.error().to_string());
    return MakeUnexpected(scope.error());
  }

  const std::string expected_md5 = utils::ToLowerAscii(last_md5);
  RecordUpdate update = NewRecordUpdate(key, now_());

  auto modified = (*scope)->FindAndModify(CurrentDigest{key.RFingerprint(), expected_md5}, update);
  if (!modified) {
    hkp::utils::LogStorageError("update", key.RFingerprint(), modified.error().to_string());
    return MakeUnexpected(modified.error());
  }
  if (modified->matched == 0) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageConflict, "stored key does not have digest " + expected_md5,
                                    "operation=update rfingerprint=" + key.RFingerprint()));
  }

  spdlog::debug("Updated key {}: {} -> {}", key.Fingerprint(), expected_md5, update.md5);
  notifier_.Notify(KeyReplaced{key.RFingerprint(), expected_md5, update.md5});
  return update.md5;
}

}  // namespace hkpdb::storage
