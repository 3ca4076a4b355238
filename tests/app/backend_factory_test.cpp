/**
 * @file backend_factory_test.cpp
 * @brief Unit tests for backend selection from configuration
 */

#include "app/backend_factory.h"

#include <gtest/gtest.h>

using namespace hkpdb::app;
using hkp::utils::ErrorCode;

TEST(BackendFactoryTest, MemoryBackendByDefault) {
  hkpdb::config::Config config;
  auto backend = CreateBackend(config);
  ASSERT_TRUE(backend) << backend.error().to_string();
  EXPECT_EQ((*backend)->Name(), "memory");
}

TEST(BackendFactoryTest, UnknownBackend) {
  hkpdb::config::Config config;
  config.storage.backend = "mongodb";
  auto backend = CreateBackend(config);
  ASSERT_FALSE(backend);
  EXPECT_EQ(backend.error().code(), ErrorCode::kInvalidArgument);
  EXPECT_NE(backend.error().message().find("mongodb"), std::string::npos);
}

#ifndef USE_MYSQL
TEST(BackendFactoryTest, MysqlUnavailableWithoutSupport) {
  hkpdb::config::Config config;
  config.storage.backend = "mysql";
  config.mysql.user = "hkp";
  auto backend = CreateBackend(config);
  ASSERT_FALSE(backend);
  EXPECT_EQ(backend.error().code(), ErrorCode::kInvalidArgument);
}
#endif

TEST(BackendFactoryTest, StorageOptionsFromConfig) {
  hkpdb::config::Config config;
  config.storage.database = "keyserver";
  config.storage.collection = "pubkeys";
  config.query.result_limit = 42;

  auto options = MakeStorageOptions(config);
  EXPECT_EQ(options.database, "keyserver");
  EXPECT_EQ(options.collection, "pubkeys");
  EXPECT_EQ(options.result_limit, 42U);
  EXPECT_TRUE(static_cast<bool>(options.now));
}

TEST(BackendFactoryTest, OpenKeyStorageEnsuresIndexes) {
  hkpdb::config::Config config;
  config.storage.collection = "pubkeys";
  auto storage = OpenKeyStorage(config);
  ASSERT_TRUE(storage) << storage.error().to_string();
  EXPECT_EQ((*storage)->Handle().CollectionName(), "pubkeys");
  EXPECT_EQ((*storage)->Handle().Backend()->Name(), "memory");
}

TEST(BackendFactoryTest, OpenKeyStoragePropagatesBackendError) {
  hkpdb::config::Config config;
  config.storage.backend = "unknown";
  auto storage = OpenKeyStorage(config);
  ASSERT_FALSE(storage);
  EXPECT_EQ(storage.error().code(), ErrorCode::kInvalidArgument);
}
