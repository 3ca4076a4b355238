/**
 * @file connection_pool.h
 * @brief Fixed-size pool of MySQL connections
 */

#pragma once

#ifdef USE_MYSQL

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

#include "mysql/connection.h"

namespace hkpdb::mysql {

/**
 * @brief Bounded set of connections shared by storage sessions
 *
 * Connections are opened lazily, up to the pool size, and checked with a
 * ping before being handed out again. The pool must outlive its leases.
 */
class ConnectionPool {
 public:
  /**
   * @brief A borrowed connection, returned to the pool on destruction
   */
  class Lease {
   public:
    Lease(ConnectionPool* pool, std::unique_ptr<Connection> connection)
        : pool_(pool), connection_(std::move(connection)) {}
    ~Lease();

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;
    Lease(Lease&& other) noexcept = default;
    Lease& operator=(Lease&& other) = delete;

    Connection& operator*() const { return *connection_; }
    Connection* operator->() const { return connection_.get(); }

   private:
    ConnectionPool* pool_;
    std::unique_ptr<Connection> connection_;
  };

  ConnectionPool(Connection::Config config, size_t size, std::chrono::milliseconds acquire_timeout);

  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;
  ConnectionPool(ConnectionPool&&) = delete;
  ConnectionPool& operator=(ConnectionPool&&) = delete;
  ~ConnectionPool() = default;

  /**
   * @brief Borrow a live connection
   *
   * Waits up to the acquire timeout when every connection is in use; fails
   * with kStorageSessionUnavailable on timeout, or with the MySQL error if
   * a connection cannot be (re)established.
   */
  Expected<Lease, Error> Acquire();

  [[nodiscard]] size_t Size() const { return size_; }

  /**
   * @brief Connections not currently leased (opened or not)
   */
  [[nodiscard]] size_t Available() const;

 private:
  Connection::Config config_;
  size_t size_;
  std::chrono::milliseconds acquire_timeout_;

  mutable std::mutex mutex_;
  std::condition_variable available_cv_;
  std::vector<std::unique_ptr<Connection>> idle_;
  size_t opened_ = 0;

  void Release(std::unique_ptr<Connection> connection);
  void Discard();
};

}  // namespace hkpdb::mysql

#endif  // USE_MYSQL
