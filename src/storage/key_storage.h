/**
 * @file key_storage.h
 * @brief Key store facade exposed to the frontend
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "storage/change_notifier.h"
#include "storage/key_query.h"
#include "storage/key_writer.h"

namespace hkpdb::storage {

/**
 * @brief Key store settings
 */
struct StorageOptions {
  std::string database = "hkp";
  std::string collection = "keys";
  size_t result_limit = kDefaultResultLimit;
  NowFunction now = SystemNow;
};

/**
 * @brief Persistent OpenPGP key store
 *
 * Owns the query engine, the mutation pipeline and the change notifier, all
 * bound to one collection. Safe for concurrent use: storage consistency is
 * left to the backend, notification delivery is serialized.
 */
class KeyStorage {
 public:
  /**
   * @brief Build a key store and ensure its indexes
   *
   * Fails if any index cannot be ensured.
   */
  static Expected<std::unique_ptr<KeyStorage>, Error> Create(std::shared_ptr<DocumentBackend> backend,
                                                             StorageOptions options = {});

  KeyStorage(const KeyStorage&) = delete;
  KeyStorage& operator=(const KeyStorage&) = delete;
  KeyStorage(KeyStorage&&) = delete;
  KeyStorage& operator=(KeyStorage&&) = delete;
  ~KeyStorage() = default;

  // Queries (see KeyQuery)
  Expected<std::vector<std::string>, Error> MatchMD5(std::vector<std::string> digests) const {
    return query_.MatchMD5(std::move(digests));
  }
  Expected<std::vector<std::string>, Error> Resolve(std::vector<std::string> key_ids) const {
    return query_.Resolve(std::move(key_ids));
  }
  Expected<std::vector<std::string>, Error> MatchKeyword(std::vector<std::string> keywords) const {
    return query_.MatchKeyword(std::move(keywords));
  }
  Expected<std::vector<std::string>, Error> ModifiedSince(std::chrono::system_clock::time_point since) const {
    return query_.ModifiedSince(since);
  }
  Expected<std::vector<openpgp::PublicKey>, Error> FetchKeys(std::vector<std::string> rfingerprints) const {
    return query_.FetchKeys(std::move(rfingerprints));
  }
  Expected<std::vector<Keyring>, Error> FetchKeyrings(std::vector<std::string> rfingerprints) const {
    return query_.FetchKeyrings(std::move(rfingerprints));
  }

  // Mutations (see KeyWriter)
  Expected<void, Error> Insert(const std::vector<openpgp::PublicKey>& keys) { return writer_.Insert(keys); }
  Expected<std::string, Error> Update(const openpgp::PublicKey& key, const std::string& last_md5) {
    return writer_.Update(key, last_md5);
  }

  // Notifications (see ChangeNotifier)
  void Subscribe(KeyChangeListener listener) { notifier_.Subscribe(std::move(listener)); }
  void Notify(const KeyChange& change) { notifier_.Notify(change); }

  [[nodiscard]] const StorageHandle& Handle() const { return handle_; }

 private:
  KeyStorage(StorageHandle handle, const StorageOptions& options);

  StorageHandle handle_;
  ChangeNotifier notifier_;
  KeyQuery query_;
  KeyWriter writer_;
};

/**
 * @brief Insert a key, or merge it into the stored copy
 *
 * Unknown keys are inserted (KeyAdded). Known keys are merged with the stored
 * material; if the merge adds anything the stored record is updated with its
 * current digest as precondition (KeyReplaced), otherwise nothing is written
 * and KeyNotChanged is returned without notifying listeners.
 */
Expected<KeyChange, Error> UpsertKey(KeyStorage& storage, const openpgp::PublicKey& key);

}  // namespace hkpdb::storage
