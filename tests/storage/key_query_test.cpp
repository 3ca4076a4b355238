/**
 * @file key_query_test.cpp
 * @brief Unit tests for KeyQuery
 */

#include "storage/key_query.h"

#include <gtest/gtest.h>

#include "openpgp/test_keys.h"
#include "storage/memory_backend.h"

using namespace hkpdb::storage;
using namespace hkpdb::test_keys;
using hkp::utils::ErrorCode;

namespace {

std::string Upper(std::string value) {
  for (auto& chr : value) {
    if (chr >= 'a' && chr <= 'z') {
      chr = static_cast<char>(chr - 'a' + 'A');
    }
  }
  return value;
}

std::chrono::system_clock::time_point At(int64_t seconds) {
  return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

}  // namespace

class KeyQueryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    backend_ = std::make_shared<MemoryBackend>();
    alice_ = std::make_unique<hkpdb::openpgp::PublicKey>(MakeKey("alice", {"Alice Example <alice@example.org>"}));
    bob_ = std::make_unique<hkpdb::openpgp::PublicKey>(MakeKey("bob", {"Bob <bob@example.org>"}));
    carol_ = std::make_unique<hkpdb::openpgp::PublicKey>(MakeKey("carol", {"Carol \xC3\x96zt\xC3\xBCrk <carol@x.net>"}));

    Store(*alice_, 100);
    Store(*bob_, 200);
    Store(*carol_, 300);
  }

  void Store(const hkpdb::openpgp::PublicKey& key, int64_t mtime) {
    ASSERT_TRUE(Collection().Insert(NewRecord(key, mtime)));
  }

  MemoryCollection& Collection() { return backend_->GetCollection("hkp", "keys"); }

  KeyQuery Query(size_t limit = kDefaultResultLimit) const {
    return KeyQuery(StorageHandle(backend_, "hkp", "keys"), limit);
  }

  std::shared_ptr<MemoryBackend> backend_;
  std::unique_ptr<hkpdb::openpgp::PublicKey> alice_;
  std::unique_ptr<hkpdb::openpgp::PublicKey> bob_;
  std::unique_ptr<hkpdb::openpgp::PublicKey> carol_;
};

TEST_F(KeyQueryTest, MatchMD5) {
  auto result = Query().MatchMD5({Upper(bob_->MD5()), "00000000000000000000000000000000"});
  ASSERT_TRUE(result);
  EXPECT_EQ(*result, (std::vector<std::string>{bob_->RFingerprint()}));

  auto none = Query().MatchMD5({});
  ASSERT_TRUE(none);
  EXPECT_TRUE(none->empty());
}

TEST_F(KeyQueryTest, MatchMD5IsNotCapped) {
  auto result = Query(1).MatchMD5({alice_->MD5(), bob_->MD5(), carol_->MD5()});
  ASSERT_TRUE(result);
  EXPECT_EQ(result->size(), 3U);
}

TEST_F(KeyQueryTest, MatchMD5DoesNotModifyInput) {
  std::vector<std::string> digests = {Upper(alice_->MD5())};
  const auto before = digests;
  ASSERT_TRUE(Query().MatchMD5(digests));
  EXPECT_EQ(digests, before);
}

TEST_F(KeyQueryTest, ResolvePassesFullFingerprintsThrough) {
  const std::string unknown(40, 'e');
  auto result = Query().Resolve({Upper(unknown)});
  ASSERT_TRUE(result);
  EXPECT_EQ(*result, (std::vector<std::string>{unknown}));
}

TEST_F(KeyQueryTest, ResolveExpandsPrefixes) {
  const std::string key_id = alice_->RFingerprint().substr(0, 16);
  auto result = Query().Resolve({Upper(key_id)});
  ASSERT_TRUE(result);
  EXPECT_EQ(*result, (std::vector<std::string>{alice_->RFingerprint()}));

  auto short_id = Query().Resolve({bob_->RFingerprint().substr(0, 8)});
  ASSERT_TRUE(short_id);
  EXPECT_EQ(*short_id, (std::vector<std::string>{bob_->RFingerprint()}));
}

TEST_F(KeyQueryTest, ResolveOrdersPassThroughBeforePrefixMatches) {
  const std::string full(40, 'f');
  auto result = Query().Resolve({carol_->RFingerprint().substr(0, 16), full, "", "0123"});
  ASSERT_TRUE(result);
  ASSERT_GE(result->size(), 2U);
  EXPECT_EQ((*result)[0], full);
  EXPECT_EQ((*result)[1], carol_->RFingerprint());
}

TEST_F(KeyQueryTest, ResolveIgnoresEmptyIds) {
  auto result = Query().Resolve({"", ""});
  ASSERT_TRUE(result);
  EXPECT_TRUE(result->empty());
}

TEST_F(KeyQueryTest, MatchKeyword) {
  auto result = Query().MatchKeyword({"EXAMPLE"});
  ASSERT_TRUE(result);
  EXPECT_EQ(*result, (std::vector<std::string>{alice_->RFingerprint(), bob_->RFingerprint()}));

  // Unicode lowercasing of the query term
  auto unicode = Query().MatchKeyword({"\xC3\x96ZT\xC3\x9CRK"});
  ASSERT_TRUE(unicode);
  EXPECT_EQ(*unicode, (std::vector<std::string>{carol_->RFingerprint()}));

  auto partial = Query().MatchKeyword({"exam"});
  ASSERT_TRUE(partial);
  EXPECT_TRUE(partial->empty());
}

TEST_F(KeyQueryTest, MatchKeywordIsCapped) {
  auto result = Query(1).MatchKeyword({"example"});
  ASSERT_TRUE(result);
  EXPECT_EQ(result->size(), 1U);
}

TEST_F(KeyQueryTest, ModifiedSinceIsStrict) {
  auto result = Query().ModifiedSince(At(200));
  ASSERT_TRUE(result);
  EXPECT_EQ(*result, (std::vector<std::string>{carol_->RFingerprint()}));

  auto all = Query().ModifiedSince(At(0));
  ASSERT_TRUE(all);
  EXPECT_EQ(all->size(), 3U);

  auto capped = Query(2).ModifiedSince(At(0));
  ASSERT_TRUE(capped);
  EXPECT_EQ(capped->size(), 2U);
}

TEST_F(KeyQueryTest, FetchKeysDecodesStoredMaterial) {
  auto keys = Query().FetchKeys({Upper(alice_->RFingerprint()), "missing"});
  ASSERT_TRUE(keys);
  ASSERT_EQ(keys->size(), 1U);
  EXPECT_EQ(keys->front().Fingerprint(), alice_->Fingerprint());
  EXPECT_EQ(keys->front().MD5(), alice_->MD5());
  EXPECT_EQ(keys->front().UserIds(), alice_->UserIds());
}

TEST_F(KeyQueryTest, FetchKeyringsCarriesTimestamps) {
  auto keyrings = Query().FetchKeyrings({bob_->RFingerprint()});
  ASSERT_TRUE(keyrings);
  ASSERT_EQ(keyrings->size(), 1U);
  EXPECT_EQ(keyrings->front().ctime, At(200));
  EXPECT_EQ(keyrings->front().mtime, At(200));
}

TEST_F(KeyQueryTest, FetchFailsOnCorruptRecord) {
  KeyRecord corrupt = NewRecord(*alice_, 400);
  corrupt.rfingerprint = std::string(40, 'a');
  corrupt.md5 = "corrupt";
  ASSERT_TRUE(Collection().Insert(corrupt));

  auto keys = Query().FetchKeys({alice_->RFingerprint(), corrupt.rfingerprint});
  ASSERT_FALSE(keys);
  EXPECT_EQ(keys.error().code(), ErrorCode::kStorageDecodeFailed);
}

TEST_F(KeyQueryTest, UnavailableBackend) {
  KeyQuery query(StorageHandle(nullptr, "hkp", "keys"), kDefaultResultLimit);
  auto result = query.MatchKeyword({"alice"});
  ASSERT_FALSE(result);
  EXPECT_EQ(result.error().code(), ErrorCode::kStorageSessionUnavailable);
}
