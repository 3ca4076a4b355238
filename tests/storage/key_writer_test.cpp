/**
 * @file key_writer_test.cpp
 * @brief Unit tests for KeyWriter
 */

#include "storage/key_writer.h"

#include <gtest/gtest.h>

#include <cctype>
#include <stdexcept>

#include "openpgp/test_keys.h"
#include "storage/index_manager.h"
#include "storage/memory_backend.h"

using namespace hkpdb::storage;
using namespace hkpdb::test_keys;
using hkp::utils::ErrorCode;

class KeyWriterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    backend_ = std::make_shared<MemoryBackend>();
    ASSERT_TRUE(IndexManager::EnsureIndexes(Handle()));
    notifier_.Subscribe([this](const KeyChange& change) -> Expected<void, Error> {
      events_.push_back(ToString(change));
      return {};
    });
  }

  StorageHandle Handle() const { return StorageHandle(backend_, "hkp", "keys"); }

  KeyWriter Writer() {
    return KeyWriter(Handle(), notifier_, [this] { return clock_; });
  }

  const KeyRecord& StoredRecord(const std::string& rfingerprint) {
    auto records = backend_->GetCollection("hkp", "keys").Find(FingerprintIn{{rfingerprint}}, FindOptions{});
    EXPECT_TRUE(records);
    EXPECT_EQ(records->size(), 1U);
    last_record_ = records->front();
    return last_record_;
  }

  std::shared_ptr<MemoryBackend> backend_;
  ChangeNotifier notifier_;
  std::vector<std::string> events_;
  int64_t clock_ = 1000;
  KeyRecord last_record_;
};

TEST_F(KeyWriterTest, InsertStoresAndAnnounces) {
  auto alice = MakeKey("alice", {"Alice <alice@example.org>"});
  auto bob = MakeKey("bob", {"Bob <bob@example.org>"});

  ASSERT_TRUE(Writer().Insert({alice, bob}));

  const KeyRecord& stored = StoredRecord(alice.RFingerprint());
  EXPECT_EQ(stored.ctime, 1000);
  EXPECT_EQ(stored.mtime, 1000);
  EXPECT_EQ(stored.md5, alice.MD5());
  EXPECT_EQ(stored.keywords, (std::vector<std::string>{"alice", "example", "org"}));

  EXPECT_EQ(events_, (std::vector<std::string>{
                         "key added: rfingerprint=" + alice.RFingerprint() + " digest=" + alice.MD5(),
                         "key added: rfingerprint=" + bob.RFingerprint() + " digest=" + bob.MD5(),
                     }));
}

TEST_F(KeyWriterTest, InsertEmptyBatch) {
  ASSERT_TRUE(Writer().Insert({}));
  EXPECT_TRUE(events_.empty());
}

TEST_F(KeyWriterTest, InsertAbortsAtFirstDuplicate) {
  auto alice = MakeKey("alice", {"Alice"});
  auto bob = MakeKey("bob", {"Bob"});
  auto carol = MakeKey("carol", {"Carol"});
  ASSERT_TRUE(Writer().Insert({bob}));
  events_.clear();

  auto result = Writer().Insert({alice, bob, carol});
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kStorageDuplicateKey);

  // alice stays stored, carol was never attempted
  EXPECT_EQ(backend_->GetCollection("hkp", "keys").Size(), 2U);
  EXPECT_EQ(events_.size(), 1U);
}

TEST_F(KeyWriterTest, UpdateReplacesContentAndKeepsCtime) {
  auto original = MakeKey("alice", {"Alice <alice@example.org>"});
  ASSERT_TRUE(Writer().Insert({original}));
  events_.clear();

  auto extended = MakeKey("alice", {"Alice <alice@example.org>", "Alice Work <alice@corp.example>"});
  ASSERT_EQ(extended.RFingerprint(), original.RFingerprint());

  clock_ = 2000;
  auto new_md5 = Writer().Update(extended, original.MD5());
  ASSERT_TRUE(new_md5);
  EXPECT_EQ(*new_md5, extended.MD5());

  const KeyRecord& stored = StoredRecord(original.RFingerprint());
  EXPECT_EQ(stored.ctime, 1000);
  EXPECT_EQ(stored.mtime, 2000);
  EXPECT_EQ(stored.md5, extended.MD5());
  EXPECT_EQ(stored.keywords, (std::vector<std::string>{"alice", "corp", "example", "org", "work"}));

  EXPECT_EQ(events_, (std::vector<std::string>{"key replaced: rfingerprint=" + original.RFingerprint() +
                                               " digest=" + original.MD5() + " -> " + extended.MD5()}));
}

TEST_F(KeyWriterTest, UpdateAcceptsUppercaseDigest) {
  auto original = MakeKey("alice", {"Alice"});
  ASSERT_TRUE(Writer().Insert({original}));

  std::string upper = original.MD5();
  for (auto& chr : upper) {
    chr = static_cast<char>(std::toupper(static_cast<unsigned char>(chr)));
  }
  auto extended = MakeKey("alice", {"Alice", "Alicia"});
  EXPECT_TRUE(Writer().Update(extended, upper));
}

TEST_F(KeyWriterTest, StaleDigestConflicts) {
  auto original = MakeKey("alice", {"Alice"});
  ASSERT_TRUE(Writer().Insert({original}));
  auto first = MakeKey("alice", {"Alice", "Second"});
  ASSERT_TRUE(Writer().Update(first, original.MD5()));
  events_.clear();

  auto second = MakeKey("alice", {"Alice", "Third"});
  auto result = Writer().Update(second, original.MD5());
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kStorageConflict);
  EXPECT_EQ(result.error().context(), "operation=update rfingerprint=" + original.RFingerprint());

  EXPECT_EQ(StoredRecord(original.RFingerprint()).md5, first.MD5());
  EXPECT_TRUE(events_.empty());
}

TEST_F(KeyWriterTest, UpdateOfUnknownKeyConflicts) {
  auto unknown = MakeKey("nobody", {"Nobody"});
  auto result = Writer().Update(unknown, unknown.MD5());
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kStorageConflict);
}

TEST_F(KeyWriterTest, DigestOfOtherKeyDoesNotMatch) {
  auto alice = MakeKey("alice", {"Alice"});
  auto bob = MakeKey("bob", {"Bob"});
  ASSERT_TRUE(Writer().Insert({alice, bob}));

  auto extended = MakeKey("alice", {"Alice", "Other"});
  auto result = Writer().Update(extended, bob.MD5());
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kStorageConflict);
}

// Listeners that fail in each supported way, followed by one that records
class KeyWriterFailingListenerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    backend_ = std::make_shared<MemoryBackend>();
    ASSERT_TRUE(IndexManager::EnsureIndexes(StorageHandle(backend_, "hkp", "keys")));
    notifier_.Subscribe([](const KeyChange&) -> Expected<void, Error> {
      return MakeUnexpected(MakeError(ErrorCode::kInternalError, "listener refused"));
    });
    notifier_.Subscribe([](const KeyChange&) -> Expected<void, Error> { throw std::runtime_error("listener threw"); });
    notifier_.Subscribe([](const KeyChange&) -> Expected<void, Error> { throw 42; });
    notifier_.Subscribe([this](const KeyChange& change) -> Expected<void, Error> {
      seen_.push_back(change);
      return {};
    });
  }

  KeyWriter Writer() {
    return KeyWriter(StorageHandle(backend_, "hkp", "keys"), notifier_, [] { return int64_t{1000}; });
  }

  std::shared_ptr<MemoryBackend> backend_;
  ChangeNotifier notifier_;
  std::vector<KeyChange> seen_;
};

TEST_F(KeyWriterFailingListenerTest, InsertStoresEveryKey) {
  auto alice = MakeKey("alice", {"Alice"});
  auto bob = MakeKey("bob", {"Bob"});

  ASSERT_TRUE(Writer().Insert({alice, bob}));

  auto& collection = backend_->GetCollection("hkp", "keys");
  EXPECT_EQ(collection.Size(), 2U);
  auto stored = collection.Find(DigestIn{{alice.MD5(), bob.MD5()}}, FindOptions{});
  ASSERT_TRUE(stored);
  EXPECT_EQ(stored->size(), 2U);

  ASSERT_EQ(seen_.size(), 2U);
  const auto* first = std::get_if<KeyAdded>(&seen_[0]);
  const auto* second = std::get_if<KeyAdded>(&seen_[1]);
  ASSERT_NE(first, nullptr);
  ASSERT_NE(second, nullptr);
  EXPECT_EQ(first->rfingerprint, alice.RFingerprint());
  EXPECT_EQ(first->digest, alice.MD5());
  EXPECT_EQ(second->rfingerprint, bob.RFingerprint());
  EXPECT_EQ(second->digest, bob.MD5());
}

TEST_F(KeyWriterFailingListenerTest, UpdateReturnsNewDigest) {
  auto original = MakeKey("alice", {"Alice"});
  ASSERT_TRUE(Writer().Insert({original}));
  seen_.clear();

  auto extended = MakeKey("alice", {"Alice", "Alicia"});
  auto new_md5 = Writer().Update(extended, original.MD5());
  ASSERT_TRUE(new_md5) << new_md5.error().to_string();
  EXPECT_EQ(*new_md5, extended.MD5());

  auto stored = backend_->GetCollection("hkp", "keys").Find(FingerprintIn{{original.RFingerprint()}}, FindOptions{});
  ASSERT_TRUE(stored);
  ASSERT_EQ(stored->size(), 1U);
  EXPECT_EQ(stored->front().md5, extended.MD5());

  ASSERT_EQ(seen_.size(), 1U);
  const auto* replaced = std::get_if<KeyReplaced>(&seen_[0]);
  ASSERT_NE(replaced, nullptr);
  EXPECT_EQ(replaced->new_digest, extended.MD5());
}

TEST(SystemNowTest, ReturnsCurrentSeconds) {
  const int64_t now = SystemNow();
  EXPECT_GT(now, 1600000000);
}
