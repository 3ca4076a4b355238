/**
 * @file connection_test.cpp
 * @brief Unit tests for the MySQL connection wrapper and pool (no server needed)
 */

#include "mysql/connection.h"

#include <gtest/gtest.h>

#ifdef USE_MYSQL

#include "mysql/connection_pool.h"

using namespace hkpdb::mysql;

namespace {

/**
 * @brief Config pointing at a port nothing listens on
 */
Connection::Config UnreachableConfig() {
  Connection::Config config;
  config.host = "127.0.0.1";
  config.port = 1;
  config.user = "nobody";
  config.connect_timeout = 1;
  return config;
}

}  // namespace

TEST(MySQLConnectionTest, DefaultConfig) {
  Connection::Config config;
  EXPECT_EQ(config.host, "localhost");
  EXPECT_EQ(config.port, 3306);
  EXPECT_FALSE(config.ssl_enable);
  EXPECT_TRUE(config.ssl_verify_server_cert);
}

TEST(MySQLConnectionTest, NotConnectedInitially) {
  Connection conn(UnreachableConfig());
  EXPECT_FALSE(conn.IsConnected());
  EXPECT_EQ(conn.LastInsertId(), 0U);
  EXPECT_EQ(conn.GetConfig().port, 1);
}

TEST(MySQLConnectionTest, QueriesFailWhenDisconnected) {
  Connection conn(UnreachableConfig());

  auto rows = conn.Execute("SELECT 1");
  ASSERT_FALSE(rows);
  EXPECT_EQ(rows.error().code(), ErrorCode::kMySQLDisconnected);

  auto affected = conn.ExecuteUpdate("DELETE FROM t");
  ASSERT_FALSE(affected);
  EXPECT_EQ(affected.error().code(), ErrorCode::kMySQLDisconnected);
}

TEST(MySQLConnectionTest, ConnectFailureIsReported) {
  Connection conn(UnreachableConfig());
  auto connected = conn.Connect("test");
  ASSERT_FALSE(connected);
  EXPECT_EQ(connected.error().code(), ErrorCode::kMySQLConnectionFailed);
  EXPECT_FALSE(conn.IsConnected());
  EXPECT_FALSE(conn.GetLastError().empty());
}

TEST(MySQLConnectionTest, MoveTransfersConfig) {
  Connection original(UnreachableConfig());
  Connection moved(std::move(original));
  EXPECT_EQ(moved.GetConfig().user, "nobody");
  EXPECT_FALSE(moved.IsConnected());
}

TEST(MySQLConnectionPoolTest, ZeroSizeBecomesOne) {
  ConnectionPool pool(UnreachableConfig(), 0, std::chrono::milliseconds(10));
  EXPECT_EQ(pool.Size(), 1U);
  EXPECT_EQ(pool.Available(), 1U);
}

TEST(MySQLConnectionPoolTest, FailedConnectFreesSlot) {
  ConnectionPool pool(UnreachableConfig(), 2, std::chrono::milliseconds(10));

  auto lease = pool.Acquire();
  ASSERT_FALSE(lease);
  EXPECT_EQ(lease.error().code(), ErrorCode::kMySQLConnectionFailed);
  EXPECT_EQ(pool.Available(), 2U);

  // The slot can be retried
  auto again = pool.Acquire();
  ASSERT_FALSE(again);
  EXPECT_EQ(pool.Available(), 2U);
}

#endif  // USE_MYSQL
