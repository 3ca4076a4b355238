/**
 * @file key_storage.cpp
 * @brief Key store facade exposed to the frontend
 */

#include "storage/key_storage.h"

#include <spdlog/spdlog.h>

#include "storage/index_manager.h"

namespace hkpdb::storage {

KeyStorage::KeyStorage(StorageHandle handle, const StorageOptions& options)
    : handle_(std::move(handle)),
      query_(handle_, options.result_limit),
      writer_(handle_, notifier_, options.now ? options.now : NowFunction(SystemNow)) {}

Expected<std::unique_ptr<KeyStorage>, Error> KeyStorage::Create(std::shared_ptr<DocumentBackend> backend,
                                                                StorageOptions options) {
  if (!backend) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "storage backend is required"));
  }
  if (options.result_limit == 0) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "result limit must be positive"));
  }

  const std::string backend_name = backend->Name();
  StorageHandle handle(std::move(backend), options.database, options.collection);

  auto indexed = IndexManager::EnsureIndexes(handle);
  if (!indexed) {
    return MakeUnexpected(indexed.error());
  }

  spdlog::info("Key storage ready: backend={}, collection={}.{}, result_limit={}", backend_name, options.database,
               options.collection, options.result_limit);

  // Private constructor: std::make_unique is not available here
  return std::unique_ptr<KeyStorage>(new KeyStorage(std::move(handle), options));
}

Expected<KeyChange, Error> UpsertKey(KeyStorage& storage, const openpgp::PublicKey& key) {
  auto stored = storage.FetchKeyrings({key.RFingerprint()});
  if (!stored) {
    return MakeUnexpected(stored.error());
  }

  if (stored->empty()) {
    auto inserted = storage.Insert({key});
    if (!inserted) {
      return MakeUnexpected(inserted.error());
    }
    return KeyChange(KeyAdded{key.RFingerprint(), key.MD5()});
  }

  openpgp::PublicKey merged = stored->front().key;
  const std::string last_md5 = merged.MD5();

  auto changed = merged.Merge(key);
  if (!changed) {
    return MakeUnexpected(changed.error());
  }

  if (!*changed || merged.MD5() == last_md5) {
    return KeyChange(KeyNotChanged{key.RFingerprint(), last_md5});
  }

  auto updated = storage.Update(merged, last_md5);
  if (!updated) {
    return MakeUnexpected(updated.error());
  }
  return KeyChange(KeyReplaced{key.RFingerprint(), last_md5, *updated});
}

}  // namespace hkpdb::storage
