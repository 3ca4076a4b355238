/**
 * @file error_test.cpp
 * @brief Unit tests for Error class and error codes
 */

#include "utils/error.h"

#include <gtest/gtest.h>

using namespace hkp::utils;

// ========== Test ErrorCode enum ==========

TEST(ErrorCodeTest, ErrorCodeRanges) {
  EXPECT_EQ(static_cast<int>(ErrorCode::kSuccess), 0);
  EXPECT_EQ(static_cast<int>(ErrorCode::kUnknown), 1);
  EXPECT_EQ(static_cast<int>(ErrorCode::kConfigFileNotFound), 1000);
  EXPECT_EQ(static_cast<int>(ErrorCode::kMySQLConnectionFailed), 2000);
  EXPECT_EQ(static_cast<int>(ErrorCode::kPacketMalformed), 3000);
  EXPECT_EQ(static_cast<int>(ErrorCode::kStorageBackendError), 5000);
}

TEST(ErrorCodeTest, ErrorCodeToString) {
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kSuccess), "Success");
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kInvalidArgument), "Invalid argument");
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kConfigFileNotFound), "Configuration file not found");
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kMySQLDuplicateEntry), "MySQL duplicate entry");
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kPacketTruncated), "Truncated packet");
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kStorageConflict), "Concurrent modification");
}

TEST(ErrorCodeTest, UnknownErrorCode) {
  EXPECT_STREQ(ErrorCodeToString(static_cast<ErrorCode>(9999)), "Unknown error code");
}

// ========== Test Error class ==========

TEST(ErrorTest, DefaultConstructor) {
  Error error;
  EXPECT_EQ(error.code(), ErrorCode::kSuccess);
  EXPECT_FALSE(error.is_error());
}

TEST(ErrorTest, CodeOnlyConstructor) {
  Error error(ErrorCode::kInvalidArgument);
  EXPECT_EQ(error.code(), ErrorCode::kInvalidArgument);
  EXPECT_EQ(error.message(), "Invalid argument");
  EXPECT_TRUE(error.context().empty());
  EXPECT_TRUE(error.is_error());
}

TEST(ErrorTest, FullConstructor) {
  Error error(ErrorCode::kStorageDecodeFailed, "stored packets are not one key", "rfingerprint=abc");
  EXPECT_EQ(error.code(), ErrorCode::kStorageDecodeFailed);
  EXPECT_EQ(error.message(), "stored packets are not one key");
  EXPECT_EQ(error.context(), "rfingerprint=abc");
}

TEST(ErrorTest, ToString) {
  Error error1(ErrorCode::kInvalidArgument);
  EXPECT_EQ(error1.to_string(), "[Invalid argument (2)] Invalid argument");

  Error error2(ErrorCode::kNotFound, "Keyring not found");
  EXPECT_EQ(error2.to_string(), "[Not found (8)] Keyring not found");

  Error error3(ErrorCode::kStorageConflict, "Key changed since it was read", "operation=update rfingerprint=ab");
  EXPECT_EQ(error3.to_string(),
            "[Concurrent modification (5002)] Key changed since it was read (context: operation=update "
            "rfingerprint=ab)");
}

TEST(ErrorTest, StringConversion) {
  Error error(ErrorCode::kInvalidArgument, "Invalid input");
  std::string str = error;
  EXPECT_EQ(str, "[Invalid argument (2)] Invalid input");
}

TEST(ErrorTest, WhatMethod) {
  Error error(ErrorCode::kNotFound, "Resource not found");
  EXPECT_STREQ(error.what(), "Resource not found");
}

// ========== Test helper functions ==========

TEST(ErrorTest, MakeErrorOverloads) {
  auto code_only = MakeError(ErrorCode::kInternalError);
  EXPECT_EQ(code_only.message(), "Internal error");

  auto with_message = MakeError(ErrorCode::kIOError, "Failed to read file");
  EXPECT_EQ(with_message.message(), "Failed to read file");
  EXPECT_TRUE(with_message.context().empty());

  auto with_context = MakeError(ErrorCode::kStorageDuplicateKey, "duplicate", "md5=00");
  EXPECT_EQ(with_context.context(), "md5=00");
}

TEST(ErrorTest, HkpErrorMacro) {
  auto error = HKP_ERROR(ErrorCode::kUnknown, "Something went wrong");
  EXPECT_EQ(error.code(), ErrorCode::kUnknown);
  EXPECT_EQ(error.message(), "Something went wrong");
  EXPECT_NE(error.context().find("error_test.cpp"), std::string::npos);
}

TEST(ErrorTest, StorageErrorCodes) {
  EXPECT_EQ(Error(ErrorCode::kStorageDuplicateKey).message(), "Duplicate key");
  EXPECT_EQ(Error(ErrorCode::kStorageDecodeFailed).message(), "Stored key decode failed");
  EXPECT_EQ(Error(ErrorCode::kStorageSessionUnavailable).message(), "Storage session unavailable");
  EXPECT_EQ(Error(ErrorCode::kStorageIndexFailed).message(), "Index creation failed");
}

TEST(ErrorTest, KeyringErrorCodes) {
  EXPECT_EQ(Error(ErrorCode::kKeyringEmpty).message(), "Empty keyring");
  EXPECT_EQ(Error(ErrorCode::kKeyringMultipleKeys).message(), "Multiple keys in keyring");
  EXPECT_EQ(Error(ErrorCode::kKeyringFingerprintMismatch).message(), "Fingerprint mismatch");
}
