/**
 * @file memory_backend.h
 * @brief In-process document backend
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "storage/document_backend.h"

namespace hkpdb::storage {

using DocId = uint32_t;

/**
 * @brief Collection kept in memory
 *
 * Thread-safety: reads take a shared lock, writes an exclusive lock.
 * Documents are returned in insertion order. Uniqueness of rfingerprint and
 * md5 is enforced only once a unique index exists on the field.
 */
class MemoryCollection : public DocumentCollection {
 public:
  MemoryCollection() = default;

  Expected<void, Error> EnsureIndex(const IndexSpec& spec) override;
  Expected<std::vector<KeyRecord>, Error> Find(const RecordFilter& filter, const FindOptions& options) override;
  Expected<void, Error> Insert(const KeyRecord& record) override;
  Expected<ModifyResult, Error> FindAndModify(const RecordFilter& filter, const RecordUpdate& update) override;

  /**
   * @brief Number of stored records
   */
  [[nodiscard]] size_t Size() const;

  /**
   * @brief Indexes ensured so far
   */
  [[nodiscard]] std::vector<IndexSpec> Indexes() const;

 private:
  mutable std::shared_mutex mutex_;

  DocId next_doc_id_ = 1;
  std::map<DocId, KeyRecord> records_;

  std::multimap<std::string, DocId> by_rfingerprint_;
  std::multimap<std::string, DocId> by_md5_;
  std::multimap<int64_t, DocId> by_mtime_;
  std::unordered_map<std::string, std::set<DocId>> by_keyword_;

  std::vector<IndexSpec> indexes_;

  /**
   * @brief Matching document IDs in ascending order (caller holds the lock)
   */
  std::set<DocId> Match(const RecordFilter& filter) const;

  bool IsUniqueField(const std::string& field_name) const;

  void AddToIndexes(DocId doc_id, const KeyRecord& record);
  void RemoveFromIndexes(DocId doc_id, const KeyRecord& record);
};

/**
 * @brief Backend holding every collection in process memory
 *
 * Collections persist for the lifetime of the backend; sessions are free.
 */
class MemoryBackend : public DocumentBackend {
 public:
  MemoryBackend() = default;

  Expected<std::unique_ptr<BackendSession>, Error> OpenSession() override;

  [[nodiscard]] std::string Name() const override { return "memory"; }

  /**
   * @brief Get or create a collection
   */
  MemoryCollection& GetCollection(const std::string& database, const std::string& name);

  /**
   * @brief Sessions currently open
   */
  [[nodiscard]] int OpenSessions() const { return open_sessions_.load(); }

 private:
  std::mutex collections_mutex_;
  std::map<std::string, std::unique_ptr<MemoryCollection>> collections_;
  std::atomic<int> open_sessions_{0};
};

}  // namespace hkpdb::storage
