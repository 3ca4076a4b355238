/**
 * @file storage_handle.h
 * @brief Scoped access to the key collection
 */

#pragma once

#include <memory>
#include <string>

#include "storage/document_backend.h"

namespace hkpdb::storage {

/**
 * @brief A backend session bound to the key collection
 *
 * Move-only. The session is released when the scope is destroyed, on every
 * exit path.
 */
class CollectionScope {
 public:
  CollectionScope(std::unique_ptr<BackendSession> session, DocumentCollection* collection)
      : session_(std::move(session)), collection_(collection) {}

  CollectionScope(const CollectionScope&) = delete;
  CollectionScope& operator=(const CollectionScope&) = delete;
  CollectionScope(CollectionScope&&) noexcept = default;
  CollectionScope& operator=(CollectionScope&&) noexcept = default;
  ~CollectionScope() = default;

  DocumentCollection& operator*() const { return *collection_; }
  DocumentCollection* operator->() const { return collection_; }

 private:
  std::unique_ptr<BackendSession> session_;
  DocumentCollection* collection_;
};

/**
 * @brief Connection handle plus database and collection names
 *
 * Shared by every key store component; each operation acquires its own
 * scope.
 */
class StorageHandle {
 public:
  StorageHandle(std::shared_ptr<DocumentBackend> backend, std::string database, std::string collection)
      : backend_(std::move(backend)), database_(std::move(database)), collection_(std::move(collection)) {}

  /**
   * @brief Open a session and resolve the key collection
   */
  [[nodiscard]] Expected<CollectionScope, Error> Acquire() const;

  [[nodiscard]] const std::string& Database() const { return database_; }
  [[nodiscard]] const std::string& CollectionName() const { return collection_; }
  [[nodiscard]] const std::shared_ptr<DocumentBackend>& Backend() const { return backend_; }

 private:
  std::shared_ptr<DocumentBackend> backend_;
  std::string database_;
  std::string collection_;
};

}  // namespace hkpdb::storage
