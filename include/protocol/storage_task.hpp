#ifndef FDFS_PROTOCOL_STORAGE_TASK_HPP
#define FDFS_PROTOCOL_STORAGE_TASK_HPP

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include "network/connection.hpp"
#include "protocol/protocol_header.hpp"
#include "protocol/types.hpp"

namespace fdfs {
namespace protocol {

// Chunk size used when streaming file bytes to or from a connection
constexpr std::size_t STREAM_BUFFER_SIZE = 64 * 1024;

class StorageUploadTask {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // ext_name is truncated to FILE_EXT_NAME_MAX_LEN bytes on the wire
  StorageUploadTask(uint8_t store_path_index, uint64_t file_size, const std::string& ext_name);


  // ---- EXECUTION ----
  // Sends metadata and exactly file_size bytes read from input, then parses
  // the identifier assigned by the storage node
  FileId run(network::Connection& connection, std::istream& input);

  uint64_t request_pkg_len() const;

private:
  // ---- PARAMETERS ----
  uint8_t store_path_index_;
  uint64_t file_size_;
  std::string ext_name_;


  // ---- PROTOCOL STEPS ----
  void send_header(network::Connection& connection);
  void send_file(network::Connection& connection, std::istream& input);
  FileId receive_file_id(network::Connection& connection);
};

class StorageDownloadTask {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // download_bytes of 0 reads to the end of the stored file
  StorageDownloadTask(const std::string& group_name, const std::string& remote_filename,
                      uint64_t offset = 0, uint64_t download_bytes = 0);


  // ---- EXECUTION ----
  // Truncates local_filename once the storage node accepted the request and
  // writes the returned bytes into it. Returns the number of bytes written.
  uint64_t run(network::Connection& connection, const std::string& local_filename);
  // Same exchange, streaming into an arbitrary output
  uint64_t run(network::Connection& connection, std::ostream& output);

  uint64_t request_pkg_len() const;

private:
  // ---- PARAMETERS ----
  std::string group_name_;
  std::string remote_filename_;
  uint64_t offset_;
  uint64_t download_bytes_;


  // ---- PROTOCOL STEPS ----
  void send_request(network::Connection& connection);
  uint64_t receive_header(network::Connection& connection);
  void receive_file(network::Connection& connection, std::ostream& output, uint64_t pkg_len);
};

} // namespace protocol
} // namespace fdfs

#endif // FDFS_PROTOCOL_STORAGE_TASK_HPP
