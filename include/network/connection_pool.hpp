#ifndef FDFS_NETWORK_CONNECTION_POOL_HPP
#define FDFS_NETWORK_CONNECTION_POOL_HPP

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include "network/connection.hpp"

namespace fdfs {
namespace network {

// Opens a new connection to the given address, throws DialFailed on failure
using Dialer = std::function<std::unique_ptr<Connection>(const std::string& address)>;

// Default dialer producing connected TCP_Connection instances
Dialer make_tcp_dialer(std::chrono::milliseconds connect_timeout,
                       std::chrono::milliseconds network_timeout);

class ConnectionPool {
public:
  // Delete copy constructor and assignment operator
  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws ConfigError for a zero capacity or a malformed address
  ConnectionPool(const std::string& address, std::size_t capacity, Dialer dialer);
  ~ConnectionPool();


  // ---- LENDING ----
  // Hands out an idle connection or dials a new one below capacity.
  // Throws PoolExhausted at capacity or after destroy(), DialFailed when dialing fails.
  std::unique_ptr<Connection> acquire();
  // Returns a protocol-quiescent connection to the idle set
  void release(std::unique_ptr<Connection> connection);
  // Closes a connection that failed during use and frees its slot
  void discard(std::unique_ptr<Connection> connection);


  // ---- TEARDOWN ----
  // Closes all idle connections; the pool accepts no further acquisitions
  void destroy();


  // ---- GETTERS ----
  const std::string& address() const;
  std::size_t capacity() const;
  // Connections currently lent out or idle
  std::size_t live_count() const;
  std::size_t idle_count() const;

private:
  // ---- PARAMETERS ----
  std::string address_;
  std::size_t capacity_;
  Dialer dialer_;

  // Idle connections, live count and access mutex
  std::deque<std::unique_ptr<Connection>> idle_;
  std::size_t live_{0};
  bool destroyed_{false};
  mutable std::mutex mutex_;
};

// Scoped lease on a pooled connection. Unless release() is called after a
// successful exchange, the destructor discards the connection.
class PooledConnection {
public:
  PooledConnection(ConnectionPool& pool, std::unique_ptr<Connection> connection);
  ~PooledConnection();

  PooledConnection(const PooledConnection&) = delete;
  PooledConnection& operator=(const PooledConnection&) = delete;
  PooledConnection(PooledConnection&& other) noexcept;
  PooledConnection& operator=(PooledConnection&&) = delete;

  Connection& operator*() const { return *connection_; }
  Connection* operator->() const { return connection_.get(); }

  // Returns the connection to its pool for reuse
  void release();

private:
  ConnectionPool* pool_;
  std::unique_ptr<Connection> connection_;
};

} // namespace network
} // namespace fdfs

#endif // FDFS_NETWORK_CONNECTION_POOL_HPP
