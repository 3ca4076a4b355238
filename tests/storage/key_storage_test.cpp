/**
 * @file key_storage_test.cpp
 * @brief End-to-end tests of the key store over the in-memory backend
 */

#include "storage/key_storage.h"

#include <gtest/gtest.h>

#include "openpgp/test_keys.h"
#include "storage/index_manager.h"
#include "storage/memory_backend.h"

using namespace hkpdb::storage;
using namespace hkpdb::test_keys;
using hkp::utils::ErrorCode;

namespace {

std::chrono::system_clock::time_point At(int64_t seconds) {
  return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

}  // namespace

class KeyStorageTest : public ::testing::Test {
 protected:
  void SetUp() override {
    backend_ = std::make_shared<MemoryBackend>();
    StorageOptions options;
    options.now = [this] { return clock_; };
    auto created = KeyStorage::Create(backend_, options);
    ASSERT_TRUE(created) << created.error().to_string();
    storage_ = std::move(*created);

    storage_->Subscribe([this](const KeyChange& change) -> Expected<void, Error> {
      changes_.push_back(change);
      return {};
    });
  }

  std::shared_ptr<MemoryBackend> backend_;
  std::unique_ptr<KeyStorage> storage_;
  std::vector<KeyChange> changes_;
  int64_t clock_ = 1000;
};

TEST_F(KeyStorageTest, CreateEnsuresIndexes) {
  EXPECT_EQ(backend_->GetCollection("hkp", "keys").Indexes(), IndexManager::RequiredIndexes());
  EXPECT_EQ(storage_->Handle().Database(), "hkp");
  EXPECT_EQ(storage_->Handle().CollectionName(), "keys");
}

TEST_F(KeyStorageTest, CreateRejectsInvalidOptions) {
  auto no_backend = KeyStorage::Create(nullptr);
  ASSERT_FALSE(no_backend);
  EXPECT_EQ(no_backend.error().code(), ErrorCode::kInvalidArgument);

  StorageOptions options;
  options.result_limit = 0;
  auto zero_limit = KeyStorage::Create(std::make_shared<MemoryBackend>(), options);
  ASSERT_FALSE(zero_limit);
  EXPECT_EQ(zero_limit.error().code(), ErrorCode::kInvalidArgument);
}

TEST_F(KeyStorageTest, CreateFailsWhenIndexCannotBeBuilt) {
  auto backend = std::make_shared<MemoryBackend>();
  KeyRecord record;
  record.rfingerprint = "aa";
  record.md5 = "same";
  ASSERT_TRUE(backend->GetCollection("hkp", "keys").Insert(record));
  record.md5 = "other";
  ASSERT_TRUE(backend->GetCollection("hkp", "keys").Insert(record));

  auto created = KeyStorage::Create(backend);
  ASSERT_FALSE(created);
  EXPECT_EQ(created.error().code(), ErrorCode::kStorageIndexFailed);
}

TEST_F(KeyStorageTest, CustomCollectionNames) {
  auto backend = std::make_shared<MemoryBackend>();
  StorageOptions options;
  options.database = "test";
  options.collection = "pubkeys";
  auto created = KeyStorage::Create(backend, options);
  ASSERT_TRUE(created);
  ASSERT_TRUE((*created)->Insert({MakeKey("alice", {"Alice"})}));
  EXPECT_EQ(backend->GetCollection("test", "pubkeys").Size(), 1U);
  EXPECT_EQ(backend->GetCollection("hkp", "keys").Size(), 0U);
}

TEST_F(KeyStorageTest, InsertedKeyIsFoundByDigest) {
  auto alice = MakeKey("alice", {"Alice <alice@example.org>"});
  ASSERT_TRUE(storage_->Insert({alice}));

  auto matched = storage_->MatchMD5({alice.MD5()});
  ASSERT_TRUE(matched);
  EXPECT_EQ(*matched, (std::vector<std::string>{alice.RFingerprint()}));
}

TEST_F(KeyStorageTest, DuplicateInsertFails) {
  auto alice = MakeKey("alice", {"Alice"});
  ASSERT_TRUE(storage_->Insert({alice}));
  auto& collection = backend_->GetCollection("hkp", "keys");
  auto before = collection.Find(FingerprintIn{{alice.RFingerprint()}}, FindOptions{});
  ASSERT_TRUE(before);
  ASSERT_EQ(before->size(), 1U);

  // Same fingerprint, different content and a later clock
  clock_ = 7000;
  auto rival = MakeKey("alice", {"Alice", "Alicia"});
  ASSERT_NE(rival.MD5(), alice.MD5());
  auto again = storage_->Insert({rival});
  ASSERT_FALSE(again);
  EXPECT_EQ(again.error().code(), ErrorCode::kStorageDuplicateKey);
  EXPECT_EQ(collection.Size(), 1U);

  auto after = collection.Find(FingerprintIn{{alice.RFingerprint()}}, FindOptions{});
  ASSERT_TRUE(after);
  ASSERT_EQ(after->size(), 1U);
  const KeyRecord& stored = after->front();
  EXPECT_EQ(stored.md5, alice.MD5());
  EXPECT_EQ(stored.ctime, 1000);
  EXPECT_EQ(stored.packets, alice.Packets());
  EXPECT_EQ(stored, before->front());
}

TEST_F(KeyStorageTest, ResolveFullAndPartialIds) {
  auto alice = MakeKey("alice", {"Alice"});
  ASSERT_TRUE(storage_->Insert({alice}));

  auto full = storage_->Resolve({alice.RFingerprint()});
  ASSERT_TRUE(full);
  EXPECT_EQ(*full, (std::vector<std::string>{alice.RFingerprint()}));

  // A key ID is the reversed tail of the fingerprint, so a prefix of rfingerprint
  const std::string forward_id = alice.KeyId();
  std::string key_id(forward_id.rbegin(), forward_id.rend());
  auto partial = storage_->Resolve({key_id});
  ASSERT_TRUE(partial);
  EXPECT_EQ(*partial, (std::vector<std::string>{alice.RFingerprint()}));
}

TEST_F(KeyStorageTest, FetchRoundTrip) {
  auto alice = MakeKey("alice", {"Alice <alice@example.org>", "A. Example"});
  ASSERT_TRUE(storage_->Insert({alice}));

  auto keys = storage_->FetchKeys({alice.RFingerprint()});
  ASSERT_TRUE(keys);
  ASSERT_EQ(keys->size(), 1U);
  EXPECT_EQ(keys->front().MD5(), alice.MD5());
  EXPECT_EQ(keys->front().UserIds(), alice.UserIds());
}

TEST_F(KeyStorageTest, StaleUpdateConflicts) {
  auto original = MakeKey("alice", {"Alice"});
  ASSERT_TRUE(storage_->Insert({original}));

  auto writer_a = MakeKeyWithExtraUserId("alice", {"Alice"}, "Alice A");
  auto writer_b = MakeKeyWithExtraUserId("alice", {"Alice"}, "Alice B");

  ASSERT_TRUE(storage_->Update(writer_a, original.MD5()));
  auto lost = storage_->Update(writer_b, original.MD5());
  ASSERT_FALSE(lost);
  EXPECT_EQ(lost.error().code(), ErrorCode::kStorageConflict);

  auto stored = storage_->MatchMD5({writer_a.MD5()});
  ASSERT_TRUE(stored);
  EXPECT_EQ(stored->size(), 1U);
}

TEST_F(KeyStorageTest, UpdatePreservesCtime) {
  auto original = MakeKey("alice", {"Alice"});
  ASSERT_TRUE(storage_->Insert({original}));

  clock_ = 5000;
  auto extended = MakeKey("alice", {"Alice", "Alicia"});
  ASSERT_TRUE(storage_->Update(extended, original.MD5()));

  auto keyrings = storage_->FetchKeyrings({original.RFingerprint()});
  ASSERT_TRUE(keyrings);
  ASSERT_EQ(keyrings->size(), 1U);
  EXPECT_EQ(keyrings->front().ctime, At(1000));
  EXPECT_EQ(keyrings->front().mtime, At(5000));
  EXPECT_EQ(keyrings->front().key.MD5(), extended.MD5());
}

TEST_F(KeyStorageTest, KeywordSearchOverUserIds) {
  auto alice = MakeKey("alice", {"Alice Example <alice@example.org>"});
  ASSERT_TRUE(storage_->Insert({alice}));

  for (const std::string term : {"alice", "EXAMPLE", "org"}) {
    auto matched = storage_->MatchKeyword({term});
    ASSERT_TRUE(matched) << term;
    EXPECT_EQ(*matched, (std::vector<std::string>{alice.RFingerprint()})) << term;
  }

  auto missing = storage_->MatchKeyword({"ali"});
  ASSERT_TRUE(missing);
  EXPECT_TRUE(missing->empty());
}

TEST_F(KeyStorageTest, ModifiedSinceIsStrict) {
  auto alice = MakeKey("alice", {"Alice"});
  clock_ = 2000;
  ASSERT_TRUE(storage_->Insert({alice}));

  auto at_mtime = storage_->ModifiedSince(At(2000));
  ASSERT_TRUE(at_mtime);
  EXPECT_TRUE(at_mtime->empty());

  auto before = storage_->ModifiedSince(At(1999));
  ASSERT_TRUE(before);
  EXPECT_EQ(*before, (std::vector<std::string>{alice.RFingerprint()}));
}

TEST_F(KeyStorageTest, ListenersObserveMutations) {
  auto original = MakeKey("alice", {"Alice"});
  ASSERT_TRUE(storage_->Insert({original}));
  auto extended = MakeKey("alice", {"Alice", "Alicia"});
  ASSERT_TRUE(storage_->Update(extended, original.MD5()));

  ASSERT_EQ(changes_.size(), 2U);
  const auto* added = std::get_if<KeyAdded>(&changes_[0]);
  ASSERT_NE(added, nullptr);
  EXPECT_EQ(added->rfingerprint, original.RFingerprint());
  EXPECT_EQ(added->digest, original.MD5());

  const auto* replaced = std::get_if<KeyReplaced>(&changes_[1]);
  ASSERT_NE(replaced, nullptr);
  EXPECT_EQ(replaced->old_digest, original.MD5());
  EXPECT_EQ(replaced->new_digest, extended.MD5());
}

TEST_F(KeyStorageTest, ExplicitNotifyReachesListeners) {
  storage_->Notify(KeyNotChanged{"aa", "bb"});
  ASSERT_EQ(changes_.size(), 1U);
  EXPECT_EQ(ToString(changes_[0]), "key not changed: rfingerprint=aa digest=bb");
}

TEST_F(KeyStorageTest, FetchDetectsMisKeyedRecord) {
  auto alice = MakeKey("alice", {"Alice"});
  KeyRecord record = NewRecord(alice, 1000);
  record.rfingerprint = std::string(40, '0');
  record.md5 = std::string(32, '0');
  ASSERT_TRUE(backend_->GetCollection("hkp", "keys").Insert(record));

  auto keys = storage_->FetchKeys({record.rfingerprint});
  ASSERT_FALSE(keys);
  EXPECT_EQ(keys.error().code(), ErrorCode::kStorageDecodeFailed);
}
