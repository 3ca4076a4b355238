/**
 * @file document_backend.h
 * @brief Abstract document database backend
 *
 * A backend hands out sessions; a session exposes named collections. The key
 * store only depends on these interfaces, so the in-memory backend and the
 * MySQL backend are interchangeable.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "storage/record_filter.h"

namespace hkpdb::storage {

/**
 * @brief One collection of key records
 *
 * Implementations must be safe for concurrent use through distinct sessions.
 */
class DocumentCollection {
 public:
  virtual ~DocumentCollection() = default;

  /**
   * @brief Create the index if it does not exist (idempotent)
   *
   * Fails with kStorageIndexFailed when a unique index cannot be built over
   * the existing records.
   */
  virtual Expected<void, Error> EnsureIndex(const IndexSpec& spec) = 0;

  /**
   * @brief Records matching filter, in storage order
   */
  virtual Expected<std::vector<KeyRecord>, Error> Find(const RecordFilter& filter, const FindOptions& options) = 0;

  /**
   * @brief Store a new record
   *
   * Fails with kStorageDuplicateKey when a unique index already holds the
   * record's rfingerprint or md5.
   */
  virtual Expected<void, Error> Insert(const KeyRecord& record) = 0;

  /**
   * @brief Atomically apply update to the first record matching filter
   *
   * A result with matched == 0 means no record matched; nothing was written.
   */
  virtual Expected<ModifyResult, Error> FindAndModify(const RecordFilter& filter, const RecordUpdate& update) = 0;
};

/**
 * @brief Scoped backend session; released on destruction
 */
class BackendSession {
 public:
  virtual ~BackendSession() = default;

  /**
   * @brief Collection name in database
   *
   * The pointer stays valid until the session is destroyed.
   */
  virtual Expected<DocumentCollection*, Error> Collection(const std::string& database, const std::string& name) = 0;
};

/**
 * @brief Factory for backend sessions
 */
class DocumentBackend {
 public:
  virtual ~DocumentBackend() = default;

  virtual Expected<std::unique_ptr<BackendSession>, Error> OpenSession() = 0;

  [[nodiscard]] virtual std::string Name() const = 0;
};

}  // namespace hkpdb::storage
