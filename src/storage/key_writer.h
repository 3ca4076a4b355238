/**
 * @file key_writer.h
 * @brief Write-side operations of the key store
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "openpgp/public_key.h"
#include "storage/change_notifier.h"
#include "storage/storage_handle.h"

namespace hkpdb::storage {

/// Source of the current time in seconds since epoch
using NowFunction = std::function<int64_t()>;

/**
 * @brief System clock in seconds since epoch
 */
int64_t SystemNow();

/**
 * @brief Mutation pipeline: inserts and digest-guarded updates
 *
 * Successful writes are announced on the notifier before the call returns.
 */
class KeyWriter {
 public:
  KeyWriter(StorageHandle handle, ChangeNotifier& notifier, NowFunction now = SystemNow)
      : handle_(std::move(handle)), notifier_(notifier), now_(std::move(now)) {}

  /**
   * @brief Store new keys in order
   *
   * Each key is inserted and announced (KeyAdded) before the next one is
   * attempted. The first failure aborts the batch; earlier keys stay stored.
   * A key whose rfingerprint or md5 is already stored fails with
   * kStorageDuplicateKey.
   */
  Expected<void, Error> Insert(const std::vector<openpgp::PublicKey>& keys);

  /**
   * @brief Replace a stored key's content if its md5 is still last_md5
   *
   * The check and the write are one atomic backend operation. ctime is
   * preserved; mtime, md5, packets and keywords are rewritten.
   *
   * @param key New content (its rfingerprint selects the record)
   * @param last_md5 Digest the caller last read
   * @return The new digest, or kStorageConflict if no record under the
   *         key's rfingerprint carries last_md5 (nothing is written)
   */
  Expected<std::string, Error> Update(const openpgp::PublicKey& key, const std::string& last_md5);

 private:
  StorageHandle handle_;
  ChangeNotifier& notifier_;
  NowFunction now_;
};

}  // namespace hkpdb::storage
