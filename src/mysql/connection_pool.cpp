/**
 * @file connection_pool.cpp
 * @brief Fixed-size pool of MySQL connections
 */

#include "mysql/connection_pool.h"

#ifdef USE_MYSQL

#include <spdlog/spdlog.h>

#include "utils/structured_log.h"

namespace hkpdb::mysql {

ConnectionPool::Lease::~Lease() {
  if (pool_ != nullptr && connection_) {
    pool_->Release(std::move(connection_));
  }
}

ConnectionPool::ConnectionPool(Connection::Config config, size_t size, std::chrono::milliseconds acquire_timeout)
    : config_(std::move(config)), size_(size == 0 ? 1 : size), acquire_timeout_(acquire_timeout) {
  hkp::utils::StructuredLog()
      .Event("mysql_pool_created")
      .Field("host", config_.host)
      .Field("size", static_cast<uint64_t>(size_))
      .Field("acquire_timeout_ms", static_cast<int64_t>(acquire_timeout_.count()))
      .Info();
}

Expected<ConnectionPool::Lease, Error> ConnectionPool::Acquire() {
  std::unique_ptr<Connection> connection;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    bool ready = available_cv_.wait_for(lock, acquire_timeout_, [this] { return !idle_.empty() || opened_ < size_; });
    if (!ready) {
      return MakeUnexpected(MakeError(ErrorCode::kStorageSessionUnavailable,
                                      "no MySQL connection available within " +
                                          std::to_string(acquire_timeout_.count()) + "ms",
                                      config_.host + ":" + std::to_string(config_.port)));
    }

    if (!idle_.empty()) {
      connection = std::move(idle_.back());
      idle_.pop_back();
    } else {
      ++opened_;
    }
  }

  if (!connection) {
    connection = std::make_unique<Connection>(config_);
    auto connected = connection->Connect("pool");
    if (!connected) {
      Discard();
      return MakeUnexpected(connected.error());
    }
    spdlog::debug("Opened pooled MySQL connection");
    return Lease(this, std::move(connection));
  }

  auto alive = connection->EnsureAlive();
  if (!alive) {
    Discard();
    return MakeUnexpected(alive.error());
  }
  return Lease(this, std::move(connection));
}

size_t ConnectionPool::Available() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_.size() + (size_ - opened_);
}

void ConnectionPool::Release(std::unique_ptr<Connection> connection) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    idle_.push_back(std::move(connection));
  }
  available_cv_.notify_one();
}

void ConnectionPool::Discard() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    --opened_;
  }
  available_cv_.notify_one();
}

}  // namespace hkpdb::mysql

#endif  // USE_MYSQL
