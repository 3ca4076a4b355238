/**
 * @file rnp_handle_test.cpp
 * @brief Unit tests for librnp helpers
 */

#include "openpgp/rnp_handle.h"

#include <gtest/gtest.h>
#include <rnp/rnp_err.h>

#include "openpgp/test_keys.h"

using namespace hkpdb::openpgp;
using hkp::utils::ErrorCode;

TEST(RnpHandleTest, ErrorMapping) {
  EXPECT_EQ(RnpError(RNP_ERROR_NOT_ENOUGH_DATA, "op").code(), ErrorCode::kPacketTruncated);
  EXPECT_EQ(RnpError(RNP_ERROR_NOT_SUPPORTED, "op").code(), ErrorCode::kPacketUnsupported);
  EXPECT_EQ(RnpError(RNP_ERROR_BAD_FORMAT, "op").code(), ErrorCode::kPacketMalformed);
  EXPECT_EQ(RnpError(RNP_ERROR_GENERIC, "op", ErrorCode::kInternalError).code(), ErrorCode::kInternalError);

  Error error = RnpError(RNP_ERROR_BAD_FORMAT, "rnp_import_keys");
  EXPECT_EQ(error.message().rfind("rnp_import_keys failed: ", 0), 0U);
}

TEST(RnpHandleTest, LocateMissingKey) {
  auto ffi = CreateFfi();
  ASSERT_TRUE(ffi);
  auto key = LocateKey(ffi->get(), std::string(kFingerprintHexLength, 'a'));
  ASSERT_FALSE(key);
  EXPECT_EQ(key.error().code(), ErrorCode::kNotFound);
}

TEST(RnpHandleTest, ImportLocateExport) {
  auto source = hkpdb::test_keys::MakeKey("rnp", {"Rnp <rnp@example.org>"});

  auto ffi = CreateFfi();
  ASSERT_TRUE(ffi);
  ASSERT_TRUE(ImportPublicKeys(ffi->get(), source.Packets()));

  // Fingerprint lookups accept lowercase hex
  auto handle = LocateKey(ffi->get(), source.Fingerprint());
  ASSERT_TRUE(handle) << handle.error().to_string();

  auto exported = ExportPublicKey(handle->get());
  ASSERT_TRUE(exported);
  EXPECT_EQ(*exported, source.Packets());
}

TEST(RnpHandleTest, ImportRejectsGarbage) {
  auto ffi = CreateFfi();
  ASSERT_TRUE(ffi);
  auto imported = ImportPublicKeys(ffi->get(), std::string("\x13not a key", 10));
  ASSERT_FALSE(imported);
}

TEST(RnpHandleTest, ReadRnpStringReleasesBuffer) {
  auto source = hkpdb::test_keys::MakeKey("rnp", {"Rnp <rnp@example.org>"});
  auto ffi = CreateFfi();
  ASSERT_TRUE(ffi);
  ASSERT_TRUE(ImportPublicKeys(ffi->get(), source.Packets()));
  auto handle = LocateKey(ffi->get(), source.Fingerprint());
  ASSERT_TRUE(handle);

  auto keyid = ReadRnpString([&](char** out) { return rnp_key_get_keyid(handle->get(), out); }, "rnp_key_get_keyid");
  ASSERT_TRUE(keyid);
  EXPECT_EQ(keyid->size(), kKeyIdHexLength);
}
