/**
 * @file index_manager.h
 * @brief Secondary indexes required by the key store
 */

#pragma once

#include <vector>

#include "storage/storage_handle.h"

namespace hkpdb::storage {

/**
 * @brief Creates the key collection's indexes
 */
class IndexManager {
 public:
  /**
   * @brief Unique rfingerprint, unique md5, mtime, and keywords (background)
   */
  static const std::vector<IndexSpec>& RequiredIndexes();

  /**
   * @brief Ensure every required index exists
   *
   * Idempotent. Stops at the first failure, which is returned as-is.
   */
  static Expected<void, Error> EnsureIndexes(const StorageHandle& handle);
};

}  // namespace hkpdb::storage
