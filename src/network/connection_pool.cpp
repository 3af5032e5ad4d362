#include "network/connection_pool.hpp"
#include "network/tcp_connection.hpp"
#include "common/error.hpp"
#include <boost/log/trivial.hpp>

namespace fdfs {
namespace network {

Dialer make_tcp_dialer(std::chrono::milliseconds connect_timeout,
                       std::chrono::milliseconds network_timeout) {
  return [connect_timeout, network_timeout](const std::string& address) -> std::unique_ptr<Connection> {
    auto connection = std::make_unique<TCP_Connection>(address, connect_timeout, network_timeout);
    connection->connect();
    return connection;
  };
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ConnectionPool::ConnectionPool(const std::string& address, std::size_t capacity, Dialer dialer)
  : address_(address)
  , capacity_(capacity)
  , dialer_(std::move(dialer)) {

  if (capacity_ == 0) {
    BOOST_LOG_TRIVIAL(error) << "Connection pool: Invalid capacity 0 for " << address_;
    throw ConfigError("connection pool capacity must be positive");
  }
  if (!dialer_) {
    throw ConfigError("connection pool requires a dialer");
  }

  // Reject malformed addresses up front instead of on first dial
  std::string host;
  uint16_t port = 0;
  split_address(address_, host, port);

  BOOST_LOG_TRIVIAL(info) << "Connection pool: Created pool for " << address_
                          << " with capacity " << capacity_;
}

ConnectionPool::~ConnectionPool() {
  destroy();
}

//==============================================
// LENDING
//==============================================

std::unique_ptr<Connection> ConnectionPool::acquire() {
  {
    std::lock_guard<std::mutex> lock(mutex_);

    if (destroyed_) {
      BOOST_LOG_TRIVIAL(warning) << "Connection pool: Acquire on destroyed pool " << address_;
      throw PoolExhausted(address_);
    }

    // Prefer the most recently returned idle connection
    while (!idle_.empty()) {
      std::unique_ptr<Connection> connection = std::move(idle_.back());
      idle_.pop_back();
      if (connection->is_open()) {
        BOOST_LOG_TRIVIAL(debug) << "Connection pool: Reusing idle connection to " << address_;
        return connection;
      }
      --live_;
      BOOST_LOG_TRIVIAL(debug) << "Connection pool: Dropped closed idle connection to " << address_;
    }

    if (live_ >= capacity_) {
      BOOST_LOG_TRIVIAL(warning) << "Connection pool: Pool for " << address_
                                 << " exhausted at " << live_ << " connections";
      throw PoolExhausted(address_);
    }

    // Reserve the slot before dialing outside the lock
    ++live_;
  }

  try {
    std::unique_ptr<Connection> connection = dialer_(address_);
    if (!connection) {
      throw DialFailed(address_, "dialer returned no connection");
    }
    BOOST_LOG_TRIVIAL(debug) << "Connection pool: Opened new connection to " << address_;
    return connection;
  }
  catch (const DialFailed&) {
    std::lock_guard<std::mutex> lock(mutex_);
    --live_;
    throw;
  }
  catch (const std::exception& e) {
    std::lock_guard<std::mutex> lock(mutex_);
    --live_;
    throw DialFailed(address_, e.what());
  }
}

void ConnectionPool::release(std::unique_ptr<Connection> connection) {
  if (!connection) {
    BOOST_LOG_TRIVIAL(error) << "Connection pool: Attempted to release null connection";
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);

  if (destroyed_ || !connection->is_open()) {
    connection->close();
    --live_;
    BOOST_LOG_TRIVIAL(debug) << "Connection pool: Closed released connection to " << address_;
    return;
  }

  idle_.push_back(std::move(connection));
  BOOST_LOG_TRIVIAL(trace) << "Connection pool: Connection returned to " << address_
                           << " (" << idle_.size() << " idle)";
}

void ConnectionPool::discard(std::unique_ptr<Connection> connection) {
  if (!connection) {
    BOOST_LOG_TRIVIAL(error) << "Connection pool: Attempted to discard null connection";
    return;
  }

  connection->close();

  std::lock_guard<std::mutex> lock(mutex_);
  --live_;
  BOOST_LOG_TRIVIAL(debug) << "Connection pool: Discarded connection to " << address_;
}

//==============================================
// TEARDOWN
//==============================================

void ConnectionPool::destroy() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (destroyed_) {
    return;
  }
  destroyed_ = true;

  for (auto& connection : idle_) {
    connection->close();
  }
  live_ -= idle_.size();
  idle_.clear();

  BOOST_LOG_TRIVIAL(info) << "Connection pool: Destroyed pool for " << address_
                          << " (" << live_ << " connections still lent out)";
}

//==============================================
// GETTERS
//==============================================

const std::string& ConnectionPool::address() const {
  return address_;
}

std::size_t ConnectionPool::capacity() const {
  return capacity_;
}

std::size_t ConnectionPool::live_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return live_;
}

std::size_t ConnectionPool::idle_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_.size();
}

//==============================================
// POOLED CONNECTION
//==============================================

PooledConnection::PooledConnection(ConnectionPool& pool, std::unique_ptr<Connection> connection)
  : pool_(&pool)
  , connection_(std::move(connection)) {
}

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
  : pool_(other.pool_)
  , connection_(std::move(other.connection_)) {
}

PooledConnection::~PooledConnection() {
  if (connection_) {
    pool_->discard(std::move(connection_));
  }
}

void PooledConnection::release() {
  if (connection_) {
    pool_->release(std::move(connection_));
  }
}

} // namespace network
} // namespace fdfs
