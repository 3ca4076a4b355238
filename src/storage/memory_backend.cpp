/**
 * @file memory_backend.cpp
 * @brief In-process document backend implementation
 */

#include "storage/memory_backend.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <type_traits>

namespace hkpdb::storage {

namespace {

bool IsKnownField(const std::string& name) {
  return name == field::kRFingerprint || name == field::kCTime || name == field::kMTime || name == field::kMD5 ||
         name == field::kPackets || name == field::kKeywords;
}

bool StartsWith(const std::string& value, const std::string& prefix) {
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

void EraseEntry(std::multimap<std::string, DocId>& index, const std::string& key, DocId doc_id) {
  auto range = index.equal_range(key);
  for (auto iter = range.first; iter != range.second; ++iter) {
    if (iter->second == doc_id) {
      index.erase(iter);
      return;
    }
  }
}

/**
 * @brief Returns true if any key in index appears under more than one document
 */
bool HasDuplicateKeys(const std::multimap<std::string, DocId>& index) {
  for (auto iter = index.begin(); iter != index.end(); iter = index.upper_bound(iter->first)) {
    if (index.count(iter->first) > 1) {
      return true;
    }
  }
  return false;
}

/**
 * @brief Session over a MemoryBackend; tracks the open-session count
 */
class MemorySessionImpl : public BackendSession {
 public:
  explicit MemorySessionImpl(MemoryBackend& backend, std::atomic<int>& open_sessions)
      : backend_(backend), open_sessions_(open_sessions) {
    ++open_sessions_;
  }

  ~MemorySessionImpl() override { --open_sessions_; }

  MemorySessionImpl(const MemorySessionImpl&) = delete;
  MemorySessionImpl& operator=(const MemorySessionImpl&) = delete;
  MemorySessionImpl(MemorySessionImpl&&) = delete;
  MemorySessionImpl& operator=(MemorySessionImpl&&) = delete;

  Expected<DocumentCollection*, Error> Collection(const std::string& database, const std::string& name) override {
    if (database.empty() || name.empty()) {
      return MakeUnexpected(
          MakeError(ErrorCode::kInvalidArgument, "database and collection names must not be empty"));
    }
    return &backend_.GetCollection(database, name);
  }

 private:
  MemoryBackend& backend_;
  std::atomic<int>& open_sessions_;
};

}  // namespace

// --- MemoryCollection ---

Expected<void, Error> MemoryCollection::EnsureIndex(const IndexSpec& spec) {
  if (!IsKnownField(spec.field)) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageIndexFailed, "unknown field", "field=" + spec.field));
  }

  std::unique_lock lock(mutex_);

  for (const auto& existing : indexes_) {
    if (existing.field != spec.field) {
      continue;
    }
    if (existing.unique != spec.unique) {
      return MakeUnexpected(MakeError(ErrorCode::kStorageIndexFailed,
                                      "index already exists with different options", "field=" + spec.field));
    }
    return {};
  }

  if (spec.unique) {
    bool duplicates = false;
    if (spec.field == field::kRFingerprint) {
      duplicates = HasDuplicateKeys(by_rfingerprint_);
    } else if (spec.field == field::kMD5) {
      duplicates = HasDuplicateKeys(by_md5_);
    } else {
      return MakeUnexpected(MakeError(ErrorCode::kStorageIndexFailed, "unique index not supported on field",
                                      "field=" + spec.field));
    }
    if (duplicates) {
      return MakeUnexpected(MakeError(ErrorCode::kStorageIndexFailed, "duplicate values prevent unique index",
                                      "field=" + spec.field));
    }
  }

  indexes_.push_back(spec);
  spdlog::debug("Ensured index: field={}, unique={}, background={}", spec.field, spec.unique, spec.background);
  return {};
}

Expected<std::vector<KeyRecord>, Error> MemoryCollection::Find(const RecordFilter& filter, const FindOptions& options) {
  std::shared_lock lock(mutex_);

  std::vector<KeyRecord> results;
  for (DocId doc_id : Match(filter)) {
    if (options.limit > 0 && results.size() >= options.limit) {
      break;
    }
    const KeyRecord& record = records_.at(doc_id);
    if (options.fingerprints_only) {
      KeyRecord projected;
      projected.rfingerprint = record.rfingerprint;
      results.push_back(std::move(projected));
    } else {
      results.push_back(record);
    }
  }
  return results;
}

Expected<void, Error> MemoryCollection::Insert(const KeyRecord& record) {
  std::unique_lock lock(mutex_);

  if (IsUniqueField(field::kRFingerprint) && by_rfingerprint_.count(record.rfingerprint) > 0) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDuplicateKey, "duplicate key",
                                    std::string("rfingerprint=") + record.rfingerprint));
  }
  if (IsUniqueField(field::kMD5) && by_md5_.count(record.md5) > 0) {
    return MakeUnexpected(
        MakeError(ErrorCode::kStorageDuplicateKey, "duplicate key", std::string("md5=") + record.md5));
  }

  DocId doc_id = next_doc_id_++;
  records_[doc_id] = record;
  AddToIndexes(doc_id, record);

  spdlog::debug("Inserted record: DocID={}, rfingerprint={}", doc_id, record.rfingerprint);
  return {};
}

Expected<ModifyResult, Error> MemoryCollection::FindAndModify(const RecordFilter& filter, const RecordUpdate& update) {
  std::unique_lock lock(mutex_);

  ModifyResult result;
  auto matches = Match(filter);
  if (matches.empty()) {
    return result;
  }

  DocId doc_id = *matches.begin();
  KeyRecord& record = records_.at(doc_id);

  if (IsUniqueField(field::kMD5) && update.md5 != record.md5 && by_md5_.count(update.md5) > 0) {
    return MakeUnexpected(
        MakeError(ErrorCode::kStorageDuplicateKey, "duplicate key", std::string("md5=") + update.md5));
  }

  result.matched = 1;
  result.previous = record;

  RemoveFromIndexes(doc_id, record);
  record.mtime = update.mtime;
  record.md5 = update.md5;
  record.packets = update.packets;
  record.keywords = update.keywords;
  AddToIndexes(doc_id, record);

  spdlog::debug("Modified record: DocID={}, rfingerprint={}", doc_id, record.rfingerprint);
  return result;
}

size_t MemoryCollection::Size() const {
  std::shared_lock lock(mutex_);
  return records_.size();
}

std::vector<IndexSpec> MemoryCollection::Indexes() const {
  std::shared_lock lock(mutex_);
  return indexes_;
}

std::set<DocId> MemoryCollection::Match(const RecordFilter& filter) const {
  std::set<DocId> doc_ids;

  std::visit(
      [&](const auto& condition) {
        using T = std::decay_t<decltype(condition)>;
        if constexpr (std::is_same_v<T, DigestIn>) {
          for (const auto& digest : condition.digests) {
            auto range = by_md5_.equal_range(digest);
            for (auto iter = range.first; iter != range.second; ++iter) {
              doc_ids.insert(iter->second);
            }
          }
        } else if constexpr (std::is_same_v<T, FingerprintIn>) {
          for (const auto& rfingerprint : condition.rfingerprints) {
            auto range = by_rfingerprint_.equal_range(rfingerprint);
            for (auto iter = range.first; iter != range.second; ++iter) {
              doc_ids.insert(iter->second);
            }
          }
        } else if constexpr (std::is_same_v<T, FingerprintPrefix>) {
          for (const auto& prefix : condition.prefixes) {
            for (auto iter = by_rfingerprint_.lower_bound(prefix);
                 iter != by_rfingerprint_.end() && StartsWith(iter->first, prefix); ++iter) {
              doc_ids.insert(iter->second);
            }
          }
        } else if constexpr (std::is_same_v<T, KeywordAny>) {
          for (const auto& keyword : condition.keywords) {
            auto iter = by_keyword_.find(keyword);
            if (iter != by_keyword_.end()) {
              doc_ids.insert(iter->second.begin(), iter->second.end());
            }
          }
        } else if constexpr (std::is_same_v<T, ModifiedAfter>) {
          for (auto iter = by_mtime_.upper_bound(condition.mtime); iter != by_mtime_.end(); ++iter) {
            doc_ids.insert(iter->second);
          }
        } else if constexpr (std::is_same_v<T, CurrentDigest>) {
          auto range = by_md5_.equal_range(condition.md5);
          for (auto iter = range.first; iter != range.second; ++iter) {
            if (records_.at(iter->second).rfingerprint == condition.rfingerprint) {
              doc_ids.insert(iter->second);
            }
          }
        }
      },
      filter);

  return doc_ids;
}

bool MemoryCollection::IsUniqueField(const std::string& field_name) const {
  return std::any_of(indexes_.begin(), indexes_.end(),
                     [&](const IndexSpec& spec) { return spec.field == field_name && spec.unique; });
}

void MemoryCollection::AddToIndexes(DocId doc_id, const KeyRecord& record) {
  by_rfingerprint_.emplace(record.rfingerprint, doc_id);
  by_md5_.emplace(record.md5, doc_id);
  by_mtime_.emplace(record.mtime, doc_id);
  for (const auto& keyword : record.keywords) {
    by_keyword_[keyword].insert(doc_id);
  }
}

void MemoryCollection::RemoveFromIndexes(DocId doc_id, const KeyRecord& record) {
  EraseEntry(by_rfingerprint_, record.rfingerprint, doc_id);
  EraseEntry(by_md5_, record.md5, doc_id);

  auto range = by_mtime_.equal_range(record.mtime);
  for (auto iter = range.first; iter != range.second; ++iter) {
    if (iter->second == doc_id) {
      by_mtime_.erase(iter);
      break;
    }
  }

  for (const auto& keyword : record.keywords) {
    auto iter = by_keyword_.find(keyword);
    if (iter == by_keyword_.end()) {
      continue;
    }
    iter->second.erase(doc_id);
    if (iter->second.empty()) {
      by_keyword_.erase(iter);
    }
  }
}

// --- MemoryBackend ---

Expected<std::unique_ptr<BackendSession>, Error> MemoryBackend::OpenSession() {
  return std::unique_ptr<BackendSession>(std::make_unique<MemorySessionImpl>(*this, open_sessions_));
}

MemoryCollection& MemoryBackend::GetCollection(const std::string& database, const std::string& name) {
  std::lock_guard<std::mutex> lock(collections_mutex_);
  auto& collection = collections_[database + "." + name];
  if (!collection) {
    collection = std::make_unique<MemoryCollection>();
  }
  return *collection;
}

}  // namespace hkpdb::storage
