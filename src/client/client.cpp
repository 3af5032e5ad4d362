#include "client/client.hpp"
#include "protocol/storage_task.hpp"
#include "common/error.hpp"
#include <boost/log/trivial.hpp>
#include <mutex>

namespace fdfs {
namespace client {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Client::Client(const config::Config& config)
  : Client(config,
           network::make_tcp_dialer(config.connect_timeout, config.network_timeout),
           std::make_shared<LocalFileAccessor>()) {
}

Client::Client(const config::Config& config, network::Dialer dialer,
               std::shared_ptr<FileAccessor> file_accessor)
  : config_(config)
  , dialer_(std::move(dialer))
  , file_accessor_(std::move(file_accessor)) {

  config_.validate();
  if (!file_accessor_) {
    throw ConfigError("client requires a file accessor");
  }

  for (const auto& address : config_.tracker_addrs) {
    if (tracker_pools_.count(address) != 0) {
      BOOST_LOG_TRIVIAL(warning) << "Client: Ignoring duplicate tracker address: " << address;
      continue;
    }
    tracker_pools_.emplace(address,
      std::make_unique<network::ConnectionPool>(address, config_.max_conns, dialer_));
  }

  BOOST_LOG_TRIVIAL(info) << "Client: Initialized with " << tracker_pools_.size() << " tracker pool(s)";
}

Client::~Client() {
  destroy();
}

//==============================================
// FILE OPERATIONS
//==============================================

protocol::FileId Client::upload_by_filename(const std::string& local_filename) {
  BOOST_LOG_TRIVIAL(info) << "Client: Uploading " << local_filename;

  // Owns the local stream until this function returns on any path
  FileInfo file_info = file_accessor_->open(local_filename);

  protocol::TrackerTask tracker_task(protocol::Command::TRACKER_QUERY_STORE_WITHOUT_GROUP_ONE);
  protocol::StorageDescriptor storage = query_storage(tracker_task);

  network::PooledConnection connection = get_storage_connection(storage);
  protocol::StorageUploadTask upload_task(storage.store_path_index, file_info.file_size, file_info.ext_name);
  protocol::FileId file_id = upload_task.run(*connection, *file_info.stream);
  connection.release();

  BOOST_LOG_TRIVIAL(info) << "Client: Uploaded " << local_filename << " as " << file_id;
  return file_id;
}

void Client::download_by_file_id(const std::string& file_id, const std::string& local_filename) {
  download_by_file_id(file_id, local_filename, 0, 0);
}

void Client::download_by_file_id(const std::string& file_id, const std::string& local_filename,
                                 uint64_t offset, uint64_t download_bytes) {
  BOOST_LOG_TRIVIAL(info) << "Client: Downloading " << file_id << " to " << local_filename;

  protocol::FileId id = protocol::FileId::parse(file_id);

  protocol::TrackerTask tracker_task(protocol::Command::TRACKER_QUERY_FETCH_ONE,
                                     id.group_name, id.remote_filename);
  protocol::StorageDescriptor storage = query_storage(tracker_task);

  network::PooledConnection connection = get_storage_connection(storage);
  protocol::StorageDownloadTask download_task(id.group_name, id.remote_filename, offset, download_bytes);
  uint64_t bytes = download_task.run(*connection, local_filename);
  connection.release();

  BOOST_LOG_TRIVIAL(info) << "Client: Downloaded " << bytes << " bytes of " << file_id;
}

//==============================================
// POOL MANAGEMENT
//==============================================

network::ConnectionPool& Client::storage_pool(const std::string& address) {
  {
    std::shared_lock<std::shared_mutex> lock(storage_pool_mutex_);
    auto it = storage_pools_.find(address);
    if (it != storage_pools_.end()) {
      return *it->second;
    }
  }

  // Lookup, creation and insertion form one critical section
  std::unique_lock<std::shared_mutex> lock(storage_pool_mutex_);
  auto it = storage_pools_.find(address);
  if (it != storage_pools_.end()) {
    return *it->second;
  }

  auto pool = std::make_unique<network::ConnectionPool>(address, config_.max_conns, dialer_);
  network::ConnectionPool& pool_ref = *pool;
  storage_pools_.emplace(address, std::move(pool));
  BOOST_LOG_TRIVIAL(info) << "Client: Created storage pool for " << address;
  return pool_ref;
}

std::size_t Client::tracker_pool_count() const {
  return tracker_pools_.size();
}

std::size_t Client::storage_pool_count() const {
  std::shared_lock<std::shared_mutex> lock(storage_pool_mutex_);
  return storage_pools_.size();
}

//==============================================
// TEARDOWN
//==============================================

void Client::destroy() {
  for (auto& entry : tracker_pools_) {
    entry.second->destroy();
  }

  std::unique_lock<std::shared_mutex> lock(storage_pool_mutex_);
  for (auto& entry : storage_pools_) {
    entry.second->destroy();
  }

  BOOST_LOG_TRIVIAL(debug) << "Client: All connection pools destroyed";
}

//==============================================
// TRACKER OPERATIONS
//==============================================

network::PooledConnection Client::get_tracker_connection() {
  std::string last_error = "no tracker pool could be used";

  for (auto& entry : tracker_pools_) {
    network::ConnectionPool& pool = *entry.second;
    try {
      return network::PooledConnection(pool, pool.acquire());
    }
    catch (const PoolExhausted& e) {
      BOOST_LOG_TRIVIAL(warning) << "Client: Tracker " << entry.first << " unavailable: " << e.what();
      last_error = e.what();
    }
    catch (const DialFailed& e) {
      BOOST_LOG_TRIVIAL(warning) << "Client: Tracker " << entry.first << " unavailable: " << e.what();
      last_error = e.what();
    }
  }

  BOOST_LOG_TRIVIAL(error) << "Client: No tracker available";
  throw NoTrackerAvailable(last_error);
}

protocol::StorageDescriptor Client::query_storage(protocol::TrackerTask& task) {
  network::PooledConnection connection = get_tracker_connection();
  protocol::StorageDescriptor storage = task.run(*connection);
  connection.release();
  return storage;
}

//==============================================
// STORAGE OPERATIONS
//==============================================

network::PooledConnection Client::get_storage_connection(const protocol::StorageDescriptor& storage) {
  network::ConnectionPool& pool = storage_pool(storage.address());
  return network::PooledConnection(pool, pool.acquire());
}

} // namespace client
} // namespace fdfs
