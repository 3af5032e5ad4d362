#ifndef FDFS_CLIENT_CLIENT_HPP
#define FDFS_CLIENT_CLIENT_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include "client/file_accessor.hpp"
#include "config/config.hpp"
#include "network/connection_pool.hpp"
#include "protocol/tracker_task.hpp"
#include "protocol/types.hpp"

namespace fdfs {
namespace client {

// Sequences a tracker lookup and a storage exchange for every public
// operation. Safe to call from several threads at once.
class Client {
public:
  // Delete copy constructor and assignment operator
  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Creates one pool per configured tracker, dialing over TCP.
  // Throws ConfigError when the configuration is unusable.
  explicit Client(const config::Config& config);
  Client(const config::Config& config, network::Dialer dialer,
         std::shared_ptr<FileAccessor> file_accessor);
  ~Client();


  // ---- FILE OPERATIONS ----
  // Uploads a non-empty local file and returns the identifier assigned by storage
  protocol::FileId upload_by_filename(const std::string& local_filename);
  // Downloads the whole object named by "group/remote_filename"
  void download_by_file_id(const std::string& file_id, const std::string& local_filename);
  // Downloads download_bytes starting at offset, 0 meaning to the end
  void download_by_file_id(const std::string& file_id, const std::string& local_filename,
                           uint64_t offset, uint64_t download_bytes);


  // ---- POOL MANAGEMENT ----
  // Returns the pool for a storage address, creating it on first use.
  // At most one pool is ever created per address.
  network::ConnectionPool& storage_pool(const std::string& address);
  std::size_t tracker_pool_count() const;
  std::size_t storage_pool_count() const;


  // ---- TEARDOWN ----
  // Closes every tracker and storage pool; later operations fail
  void destroy();

private:
  // ---- PARAMETERS ----
  config::Config config_;
  network::Dialer dialer_;
  std::shared_ptr<FileAccessor> file_accessor_;

  // Fixed at construction, read without locking
  std::map<std::string, std::unique_ptr<network::ConnectionPool>> tracker_pools_;

  // Populated lazily, guarded by storage_pool_mutex_
  std::unordered_map<std::string, std::unique_ptr<network::ConnectionPool>> storage_pools_;
  mutable std::shared_mutex storage_pool_mutex_;


  // ---- TRACKER OPERATIONS ----
  // First tracker pool able to lend a connection wins
  network::PooledConnection get_tracker_connection();
  protocol::StorageDescriptor query_storage(protocol::TrackerTask& task);


  // ---- STORAGE OPERATIONS ----
  network::PooledConnection get_storage_connection(const protocol::StorageDescriptor& storage);
};

} // namespace client
} // namespace fdfs

#endif // FDFS_CLIENT_CLIENT_HPP
