#include "protocol/storage_task.hpp"
#include "protocol/codec.hpp"
#include "common/error.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <fstream>
#include <vector>

namespace fdfs {
namespace protocol {

//==============================================
// STORAGE UPLOAD TASK
//==============================================

StorageUploadTask::StorageUploadTask(uint8_t store_path_index, uint64_t file_size, const std::string& ext_name)
  : store_path_index_(store_path_index)
  , file_size_(file_size)
  , ext_name_(ext_name.substr(0, FILE_EXT_NAME_MAX_LEN)) {
}

uint64_t StorageUploadTask::request_pkg_len() const {
  return 1 + PKG_LEN_SIZE + FILE_EXT_NAME_MAX_LEN + file_size_;
}

FileId StorageUploadTask::run(network::Connection& connection, std::istream& input) {
  BOOST_LOG_TRIVIAL(info) << "Storage upload: Uploading " << file_size_ << " bytes to "
                          << connection.address() << " (ext \"" << ext_name_ << "\")";

  send_header(connection);
  send_file(connection, input);
  FileId file_id = receive_file_id(connection);

  BOOST_LOG_TRIVIAL(info) << "Storage upload: Stored as " << file_id;
  return file_id;
}

void StorageUploadTask::send_header(network::Connection& connection) {
  Codec::write_header(connection, request_pkg_len(), Command::STORAGE_UPLOAD_FILE);

  std::vector<uint8_t> meta;
  meta.reserve(1 + PKG_LEN_SIZE + FILE_EXT_NAME_MAX_LEN);
  meta.push_back(store_path_index_);
  Codec::append_int64(meta, file_size_);
  Codec::append_fixed_string(meta, ext_name_, FILE_EXT_NAME_MAX_LEN);
  connection.write(meta.data(), meta.size());
}

void StorageUploadTask::send_file(network::Connection& connection, std::istream& input) {
  std::vector<char> buffer(STREAM_BUFFER_SIZE);
  uint64_t total_bytes_sent = 0;

  while (total_bytes_sent < file_size_) {
    std::size_t chunk_size = static_cast<std::size_t>(
      std::min<uint64_t>(buffer.size(), file_size_ - total_bytes_sent));

    input.read(buffer.data(), chunk_size);
    std::size_t bytes_read = static_cast<std::size_t>(input.gcount());
    if (bytes_read != chunk_size) {
      BOOST_LOG_TRIVIAL(error) << "Storage upload: Local file ended after " << total_bytes_sent + bytes_read
                               << " of " << file_size_ << " bytes";
      throw IOError("short read from local file");
    }

    connection.write(buffer.data(), bytes_read);
    total_bytes_sent += bytes_read;
    BOOST_LOG_TRIVIAL(trace) << "Storage upload: Sent " << total_bytes_sent << " / " << file_size_;
  }
}

FileId StorageUploadTask::receive_file_id(network::Connection& connection) {
  ProtocolHeader header = Codec::read_response_header(connection);

  if (header.pkg_len <= GROUP_NAME_MAX_LEN) {
    BOOST_LOG_TRIVIAL(error) << "Storage upload: Response body too short: " << header.pkg_len;
    throw MalformedResponse("upload response length " + std::to_string(header.pkg_len));
  }
  if (header.pkg_len > GROUP_NAME_MAX_LEN + REMOTE_FILENAME_MAX_LEN) {
    BOOST_LOG_TRIVIAL(error) << "Storage upload: Response body too long: " << header.pkg_len;
    throw MalformedResponse("upload response length " + std::to_string(header.pkg_len));
  }

  std::vector<uint8_t> body(header.pkg_len);
  connection.read(body.data(), body.size());

  FileId file_id;
  file_id.group_name = Codec::parse_fixed_string(body.data(), GROUP_NAME_MAX_LEN);
  file_id.remote_filename.assign(body.begin() + GROUP_NAME_MAX_LEN, body.end());

  if (file_id.group_name.empty()) {
    throw MalformedResponse("upload response has an empty group name");
  }
  return file_id;
}

//==============================================
// STORAGE DOWNLOAD TASK
//==============================================

StorageDownloadTask::StorageDownloadTask(const std::string& group_name, const std::string& remote_filename,
                                         uint64_t offset, uint64_t download_bytes)
  : group_name_(group_name)
  , remote_filename_(remote_filename)
  , offset_(offset)
  , download_bytes_(download_bytes) {
}

uint64_t StorageDownloadTask::request_pkg_len() const {
  return GROUP_NAME_MAX_LEN + remote_filename_.size() + 2 * PKG_LEN_SIZE;
}

uint64_t StorageDownloadTask::run(network::Connection& connection, const std::string& local_filename) {
  BOOST_LOG_TRIVIAL(info) << "Storage download: Fetching " << group_name_ << "/" << remote_filename_
                          << " from " << connection.address() << " into " << local_filename;

  send_request(connection);
  uint64_t pkg_len = receive_header(connection);

  std::ofstream output(local_filename, std::ios::binary | std::ios::trunc);
  if (!output) {
    BOOST_LOG_TRIVIAL(error) << "Storage download: Failed to create local file: " << local_filename;
    throw IOError("cannot create local file: " + local_filename);
  }

  receive_file(connection, output, pkg_len);

  output.close();
  if (output.fail()) {
    throw IOError("failed to close local file: " + local_filename);
  }
  return pkg_len;
}

uint64_t StorageDownloadTask::run(network::Connection& connection, std::ostream& output) {
  send_request(connection);
  uint64_t pkg_len = receive_header(connection);
  receive_file(connection, output, pkg_len);
  return pkg_len;
}

void StorageDownloadTask::send_request(network::Connection& connection) {
  Codec::write_header(connection, request_pkg_len(), Command::STORAGE_DOWNLOAD_FILE);

  std::vector<uint8_t> body;
  body.reserve(request_pkg_len());
  Codec::append_fixed_string(body, group_name_, GROUP_NAME_MAX_LEN);
  body.insert(body.end(), remote_filename_.begin(), remote_filename_.end());
  Codec::append_int64(body, offset_);
  Codec::append_int64(body, download_bytes_);
  connection.write(body.data(), body.size());
}

uint64_t StorageDownloadTask::receive_header(network::Connection& connection) {
  ProtocolHeader header = Codec::read_response_header(connection);
  if (download_bytes_ > 0 && header.pkg_len > download_bytes_) {
    BOOST_LOG_TRIVIAL(error) << "Storage download: Response of " << header.pkg_len
                             << " bytes exceeds the requested " << download_bytes_;
    throw MalformedResponse("download response length " + std::to_string(header.pkg_len));
  }
  BOOST_LOG_TRIVIAL(debug) << "Storage download: Expecting " << header.pkg_len << " bytes";
  return header.pkg_len;
}

void StorageDownloadTask::receive_file(network::Connection& connection, std::ostream& output, uint64_t pkg_len) {
  std::vector<char> buffer(STREAM_BUFFER_SIZE);
  uint64_t total_bytes_received = 0;

  while (total_bytes_received < pkg_len) {
    std::size_t chunk_size = static_cast<std::size_t>(
      std::min<uint64_t>(buffer.size(), pkg_len - total_bytes_received));

    connection.read(buffer.data(), chunk_size);
    if (!output.write(buffer.data(), chunk_size)) {
      BOOST_LOG_TRIVIAL(error) << "Storage download: Failed to write to local output";
      throw IOError("failed to write downloaded bytes");
    }
    total_bytes_received += chunk_size;
  }

  BOOST_LOG_TRIVIAL(info) << "Storage download: Received " << total_bytes_received << " bytes";
}

} // namespace protocol
} // namespace fdfs
