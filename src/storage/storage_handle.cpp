/**
 * @file storage_handle.cpp
 * @brief Scoped access to the key collection
 */

#include "storage/storage_handle.h"

namespace hkpdb::storage {

Expected<CollectionScope, Error> StorageHandle::Acquire() const {
  if (!backend_) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageSessionUnavailable, "no storage backend configured"));
  }

  auto session = backend_->OpenSession();
  if (!session) {
    return MakeUnexpected(session.error());
  }

  auto collection = (*session)->Collection(database_, collection_);
  if (!collection) {
    return MakeUnexpected(collection.error());
  }

  return CollectionScope(std::move(*session), *collection);
}

}  // namespace hkpdb::storage
