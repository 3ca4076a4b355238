/**
 * @file mysql_backend.cpp
 * @brief Document backend storing key records in MySQL tables
 */

#include "mysql/mysql_backend.h"

#ifdef USE_MYSQL

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <map>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "utils/string_utils.h"

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic) - MYSQL_ROW access

namespace hkpdb::mysql {

namespace {

constexpr const char* kKeywordTableSuffix = "_keywords";
constexpr size_t kMaxKeywordLength = 255;
constexpr const char* kRecordColumns = "id, rfingerprint, ctime, mtime, md5, packets";
constexpr const char* kFingerprintColumns = "id, rfingerprint";

/**
 * @brief Table and database names are interpolated into SQL: [A-Za-z0-9_]+ only
 */
bool IsValidIdentifier(const std::string& name) {
  return !name.empty() && std::all_of(name.begin(), name.end(), [](char chr) {
    return (chr >= 'a' && chr <= 'z') || (chr >= 'A' && chr <= 'Z') || (chr >= '0' && chr <= '9') || chr == '_';
  });
}

std::string QualifiedName(const std::string& database, const std::string& table) {
  return "`" + database + "`.`" + table + "`";
}

std::string HexLiteral(const std::string& bytes) {
  return "X'" + utils::HexEncode(bytes) + "'";
}

std::string QuoteList(Connection& connection, const std::vector<std::string>& values) {
  std::string out;
  for (const auto& value : values) {
    if (!out.empty()) {
      out += ",";
    }
    out += connection.Quote(value);
  }
  return out;
}

std::string EscapeLike(const std::string& value) {
  std::string out;
  for (char chr : value) {
    if (chr == '\\' || chr == '%' || chr == '_') {
      out += '\\';
    }
    out += chr;
  }
  return out;
}

/**
 * @brief Map a MySQL failure to the storage error family
 */
Error StorageError(const Error& error, const std::string& operation) {
  ErrorCode code = ErrorCode::kStorageBackendError;
  if (error.code() == ErrorCode::kMySQLDuplicateEntry) {
    code = ErrorCode::kStorageDuplicateKey;
  } else if (error.code() == ErrorCode::kStorageSessionUnavailable) {
    code = ErrorCode::kStorageSessionUnavailable;
  }
  return MakeError(code, operation + ": " + error.message(), error.context());
}

/**
 * @brief Rolls back on destruction unless committed
 */
class Transaction {
 public:
  explicit Transaction(Connection& connection) : connection_(connection) {}

  ~Transaction() {
    if (active_) {
      auto rolled_back = connection_.ExecuteUpdate("ROLLBACK");
      if (!rolled_back) {
        spdlog::warn("MySQL rollback failed: {}", rolled_back.error().message());
      }
    }
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;
  Transaction(Transaction&&) = delete;
  Transaction& operator=(Transaction&&) = delete;

  Expected<void, Error> Begin() {
    auto begun = connection_.ExecuteUpdate("START TRANSACTION");
    if (!begun) {
      return MakeUnexpected(begun.error());
    }
    active_ = true;
    return {};
  }

  Expected<void, Error> Commit() {
    auto committed = connection_.ExecuteUpdate("COMMIT");
    if (!committed) {
      return MakeUnexpected(committed.error());
    }
    active_ = false;
    return {};
  }

 private:
  Connection& connection_;
  bool active_ = false;
};

/**
 * @brief A fetched row: its surrogate id and the record
 */
struct RecordRow {
  uint64_t id = 0;
  storage::KeyRecord record;
};

Expected<std::vector<RecordRow>, Error> FetchRows(Connection& connection, const std::string& query, bool full) {
  auto result = connection.Execute(query);
  if (!result) {
    return MakeUnexpected(result.error());
  }

  std::vector<RecordRow> rows;
  MYSQL_ROW row = nullptr;
  while ((row = mysql_fetch_row(result->get())) != nullptr) {
    unsigned long* lengths = mysql_fetch_lengths(result->get());  // NOLINT(google-runtime-int)
    RecordRow entry;
    entry.id = std::strtoull(row[0], nullptr, 10);
    entry.record.rfingerprint.assign(row[1], lengths[1]);
    if (full) {
      entry.record.ctime = std::strtoll(row[2], nullptr, 10);
      entry.record.mtime = std::strtoll(row[3], nullptr, 10);
      entry.record.md5.assign(row[4], lengths[4]);
      if (row[5] != nullptr) {
        entry.record.packets.assign(row[5], lengths[5]);
      }
    }
    rows.push_back(std::move(entry));
  }
  return rows;
}

/**
 * @brief SQL condition for filter; std::nullopt when nothing can match
 */
std::optional<std::string> WhereClause(Connection& connection, const std::string& keyword_table,
                                       const storage::RecordFilter& filter) {
  return std::visit(
      [&](const auto& condition) -> std::optional<std::string> {
        using T = std::decay_t<decltype(condition)>;
        if constexpr (std::is_same_v<T, storage::DigestIn>) {
          if (condition.digests.empty()) {
            return std::nullopt;
          }
          return "md5 IN (" + QuoteList(connection, condition.digests) + ")";
        } else if constexpr (std::is_same_v<T, storage::FingerprintIn>) {
          if (condition.rfingerprints.empty()) {
            return std::nullopt;
          }
          return "rfingerprint IN (" + QuoteList(connection, condition.rfingerprints) + ")";
        } else if constexpr (std::is_same_v<T, storage::FingerprintPrefix>) {
          std::string clause;
          for (const auto& prefix : condition.prefixes) {
            if (!clause.empty()) {
              clause += " OR ";
            }
            clause += "rfingerprint LIKE " + connection.Quote(EscapeLike(prefix) + "%");
          }
          if (clause.empty()) {
            return std::nullopt;
          }
          return "(" + clause + ")";
        } else if constexpr (std::is_same_v<T, storage::KeywordAny>) {
          if (condition.keywords.empty()) {
            return std::nullopt;
          }
          return "id IN (SELECT doc_id FROM " + keyword_table + " WHERE keyword IN (" +
                 QuoteList(connection, condition.keywords) + "))";
        } else if constexpr (std::is_same_v<T, storage::ModifiedAfter>) {
          return "mtime > " + std::to_string(condition.mtime);
        } else {
          return "rfingerprint = " + connection.Quote(condition.rfingerprint) +
                 " AND md5 = " + connection.Quote(condition.md5);
        }
      },
      filter);
}

/**
 * @brief One collection bound to the session's connection
 */
class MySQLCollection : public storage::DocumentCollection {
 public:
  MySQLCollection(Connection& connection, const std::string& database, const std::string& name)
      : connection_(connection),
        database_(database),
        name_(name),
        table_(QualifiedName(database, name)),
        keyword_table_(QualifiedName(database, name + kKeywordTableSuffix)) {}

  Expected<void, Error> EnsureIndex(const storage::IndexSpec& spec) override {
    // The keyword table's primary key (keyword, doc_id) serves keyword lookups
    if (spec.field == storage::field::kKeywords) {
      return {};
    }
    if (spec.field != storage::field::kRFingerprint && spec.field != storage::field::kMD5 &&
        spec.field != storage::field::kMTime && spec.field != storage::field::kCTime) {
      return MakeUnexpected(
          MakeError(ErrorCode::kStorageIndexFailed, "unsupported index field", "field=" + spec.field));
    }

    const std::string index_name = "idx_" + spec.field;
    auto existing = connection_.Execute(
        "SELECT NON_UNIQUE FROM information_schema.STATISTICS WHERE TABLE_SCHEMA = " + connection_.Quote(database_) +
        " AND TABLE_NAME = " + connection_.Quote(name_) + " AND INDEX_NAME = " + connection_.Quote(index_name) +
        " LIMIT 1");
    if (!existing) {
      return MakeUnexpected(IndexError(existing.error(), spec));
    }

    MYSQL_ROW row = mysql_fetch_row(existing->get());
    if (row != nullptr) {
      bool unique = row[0] != nullptr && std::string(row[0]) == "0";
      if (unique != spec.unique) {
        return MakeUnexpected(MakeError(ErrorCode::kStorageIndexFailed,
                                        "index already exists with different options", "field=" + spec.field));
      }
      return {};
    }

    std::string ddl = "ALTER TABLE " + table_ + " ADD " + (spec.unique ? "UNIQUE " : "") + "INDEX " + index_name +
                      " (" + spec.field + ")";
    if (spec.background) {
      ddl += ", ALGORITHM=INPLACE, LOCK=NONE";
    }
    auto created = connection_.ExecuteUpdate(ddl);
    if (!created) {
      return MakeUnexpected(IndexError(created.error(), spec));
    }

    spdlog::info("Created index {} on {}", index_name, table_);
    return {};
  }

  Expected<std::vector<storage::KeyRecord>, Error> Find(const storage::RecordFilter& filter,
                                                        const storage::FindOptions& options) override {
    std::vector<storage::KeyRecord> records;
    auto where = WhereClause(connection_, keyword_table_, filter);
    if (!where) {
      return records;
    }

    std::string query = std::string("SELECT ") + (options.fingerprints_only ? kFingerprintColumns : kRecordColumns) +
                        " FROM " + table_ + " WHERE " + *where + " ORDER BY id";
    if (options.limit > 0) {
      query += " LIMIT " + std::to_string(options.limit);
    }

    auto rows = FetchRows(connection_, query, !options.fingerprints_only);
    if (!rows) {
      return MakeUnexpected(StorageError(rows.error(), "find"));
    }
    if (!options.fingerprints_only) {
      auto loaded = LoadKeywords(*rows);
      if (!loaded) {
        return MakeUnexpected(StorageError(loaded.error(), "find"));
      }
    }

    records.reserve(rows->size());
    for (auto& row : *rows) {
      records.push_back(std::move(row.record));
    }
    return records;
  }

  Expected<void, Error> Insert(const storage::KeyRecord& record) override {
    Transaction transaction(connection_);
    auto begun = transaction.Begin();
    if (!begun) {
      return MakeUnexpected(StorageError(begun.error(), "insert"));
    }

    auto inserted = connection_.ExecuteUpdate(
        "INSERT INTO " + table_ + " (rfingerprint, ctime, mtime, md5, packets) VALUES (" +
        connection_.Quote(record.rfingerprint) + ", " + std::to_string(record.ctime) + ", " +
        std::to_string(record.mtime) + ", " + connection_.Quote(record.md5) + ", " + HexLiteral(record.packets) + ")");
    if (!inserted) {
      return MakeUnexpected(StorageError(inserted.error(), "insert"));
    }

    auto keywords = WriteKeywords(connection_.LastInsertId(), record.keywords);
    if (!keywords) {
      return MakeUnexpected(StorageError(keywords.error(), "insert"));
    }

    auto committed = transaction.Commit();
    if (!committed) {
      return MakeUnexpected(StorageError(committed.error(), "insert"));
    }
    return {};
  }

  Expected<storage::ModifyResult, Error> FindAndModify(const storage::RecordFilter& filter,
                                                       const storage::RecordUpdate& update) override {
    storage::ModifyResult result;
    auto where = WhereClause(connection_, keyword_table_, filter);
    if (!where) {
      return result;
    }

    Transaction transaction(connection_);
    auto begun = transaction.Begin();
    if (!begun) {
      return MakeUnexpected(StorageError(begun.error(), "find_and_modify"));
    }

    auto rows = FetchRows(connection_,
                          std::string("SELECT ") + kRecordColumns + " FROM " + table_ + " WHERE " + *where +
                              " ORDER BY id LIMIT 1 FOR UPDATE",
                          true);
    if (!rows) {
      return MakeUnexpected(StorageError(rows.error(), "find_and_modify"));
    }
    if (rows->empty()) {
      return result;
    }
    auto loaded = LoadKeywords(*rows);
    if (!loaded) {
      return MakeUnexpected(StorageError(loaded.error(), "find_and_modify"));
    }

    const uint64_t doc_id = rows->front().id;
    auto updated = connection_.ExecuteUpdate("UPDATE " + table_ + " SET mtime = " + std::to_string(update.mtime) +
                                             ", md5 = " + connection_.Quote(update.md5) +
                                             ", packets = " + HexLiteral(update.packets) +
                                             " WHERE id = " + std::to_string(doc_id));
    if (!updated) {
      return MakeUnexpected(StorageError(updated.error(), "find_and_modify"));
    }

    auto cleared =
        connection_.ExecuteUpdate("DELETE FROM " + keyword_table_ + " WHERE doc_id = " + std::to_string(doc_id));
    if (!cleared) {
      return MakeUnexpected(StorageError(cleared.error(), "find_and_modify"));
    }
    auto keywords = WriteKeywords(doc_id, update.keywords);
    if (!keywords) {
      return MakeUnexpected(StorageError(keywords.error(), "find_and_modify"));
    }

    auto committed = transaction.Commit();
    if (!committed) {
      return MakeUnexpected(StorageError(committed.error(), "find_and_modify"));
    }

    result.matched = 1;
    result.previous = std::move(rows->front().record);
    return result;
  }

 private:
  Connection& connection_;
  std::string database_;
  std::string name_;
  std::string table_;
  std::string keyword_table_;

  static Error IndexError(const Error& error, const storage::IndexSpec& spec) {
    return MakeError(ErrorCode::kStorageIndexFailed, error.message(), "field=" + spec.field);
  }

  Expected<void, Error> WriteKeywords(uint64_t doc_id, const std::vector<std::string>& keywords) {
    std::string values;
    for (const auto& keyword : keywords) {
      if (keyword.size() > kMaxKeywordLength) {
        spdlog::debug("Skipping keyword longer than {} bytes for doc {}", kMaxKeywordLength, doc_id);
        continue;
      }
      if (!values.empty()) {
        values += ",";
      }
      values += "(" + std::to_string(doc_id) + ", " + connection_.Quote(keyword) + ")";
    }
    if (values.empty()) {
      return {};
    }

    auto inserted = connection_.ExecuteUpdate("INSERT INTO " + keyword_table_ + " (doc_id, keyword) VALUES " + values);
    if (!inserted) {
      return MakeUnexpected(inserted.error());
    }
    return {};
  }

  Expected<void, Error> LoadKeywords(std::vector<RecordRow>& rows) {
    if (rows.empty()) {
      return {};
    }

    std::unordered_map<uint64_t, size_t> positions;
    std::string ids;
    for (size_t i = 0; i < rows.size(); ++i) {
      positions[rows[i].id] = i;
      if (!ids.empty()) {
        ids += ",";
      }
      ids += std::to_string(rows[i].id);
    }

    auto result = connection_.Execute("SELECT doc_id, keyword FROM " + keyword_table_ + " WHERE doc_id IN (" + ids +
                                      ") ORDER BY doc_id, keyword");
    if (!result) {
      return MakeUnexpected(result.error());
    }

    MYSQL_ROW row = nullptr;
    while ((row = mysql_fetch_row(result->get())) != nullptr) {
      unsigned long* lengths = mysql_fetch_lengths(result->get());  // NOLINT(google-runtime-int)
      auto position = positions.find(std::strtoull(row[0], nullptr, 10));
      if (position != positions.end()) {
        rows[position->second].record.keywords.emplace_back(row[1], lengths[1]);
      }
    }
    return {};
  }
};

/**
 * @brief Session holding one pooled connection
 */
class MySQLSession : public storage::BackendSession {
 public:
  MySQLSession(MySQLBackend& backend, ConnectionPool::Lease lease) : backend_(backend), lease_(std::move(lease)) {}

  Expected<storage::DocumentCollection*, Error> Collection(const std::string& database,
                                                           const std::string& name) override {
    if (!IsValidIdentifier(database) || !IsValidIdentifier(name)) {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "invalid database or collection name",
                                      database + "." + name));
    }

    const std::string key = database + "." + name;
    auto iter = collections_.find(key);
    if (iter != collections_.end()) {
      return iter->second.get();
    }

    auto tables = backend_.EnsureTables(*lease_, database, name);
    if (!tables) {
      return MakeUnexpected(tables.error());
    }

    auto& collection = collections_[key];
    collection = std::make_unique<MySQLCollection>(*lease_, database, name);
    return collection.get();
  }

 private:
  MySQLBackend& backend_;
  ConnectionPool::Lease lease_;
  std::map<std::string, std::unique_ptr<MySQLCollection>> collections_;
};

}  // namespace

MySQLBackend::MySQLBackend(Connection::Config config, size_t pool_size, std::chrono::milliseconds acquire_timeout)
    : pool_(std::move(config), pool_size, acquire_timeout) {}

Expected<std::unique_ptr<storage::BackendSession>, Error> MySQLBackend::OpenSession() {
  auto lease = pool_.Acquire();
  if (!lease) {
    return MakeUnexpected(StorageError(lease.error(), "open_session"));
  }
  return std::unique_ptr<storage::BackendSession>(std::make_unique<MySQLSession>(*this, std::move(*lease)));
}

Expected<void, Error> MySQLBackend::EnsureTables(Connection& connection, const std::string& database,
                                                 const std::string& name) {
  std::lock_guard<std::mutex> lock(tables_mutex_);
  const std::string key = database + "." + name;
  if (created_tables_.count(key) > 0) {
    return {};
  }

  auto records = connection.ExecuteUpdate("CREATE TABLE IF NOT EXISTS " + QualifiedName(database, name) +
                                          " ("
                                          "id BIGINT UNSIGNED NOT NULL AUTO_INCREMENT PRIMARY KEY, "
                                          "rfingerprint VARCHAR(64) NOT NULL, "
                                          "ctime BIGINT NOT NULL, "
                                          "mtime BIGINT NOT NULL, "
                                          "md5 CHAR(32) NOT NULL, "
                                          "packets LONGBLOB NOT NULL"
                                          ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_bin");
  if (!records) {
    return MakeUnexpected(StorageError(records.error(), "create_table"));
  }

  auto keywords = connection.ExecuteUpdate("CREATE TABLE IF NOT EXISTS " +
                                           QualifiedName(database, name + kKeywordTableSuffix) +
                                           " ("
                                           "doc_id BIGINT UNSIGNED NOT NULL, "
                                           "keyword VARCHAR(255) NOT NULL, "
                                           "PRIMARY KEY (keyword, doc_id), "
                                           "KEY idx_doc_id (doc_id)"
                                           ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4 COLLATE=utf8mb4_bin");
  if (!keywords) {
    return MakeUnexpected(StorageError(keywords.error(), "create_table"));
  }

  created_tables_.insert(key);
  spdlog::info("Using MySQL collection {}", key);
  return {};
}

}  // namespace hkpdb::mysql

// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)

#endif  // USE_MYSQL
