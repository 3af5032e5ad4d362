#include "protocol/tracker_task.hpp"
#include "protocol/codec.hpp"
#include "common/error.hpp"
#include <boost/log/trivial.hpp>
#include <vector>

namespace fdfs {
namespace protocol {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TrackerTask::TrackerTask(Command cmd)
  : cmd_(cmd)
  , targeted_(false) {
}

TrackerTask::TrackerTask(Command cmd, const std::string& group_name, const std::string& remote_filename)
  : cmd_(cmd)
  , group_name_(group_name)
  , remote_filename_(remote_filename)
  , targeted_(true) {
}

uint64_t TrackerTask::request_pkg_len() const {
  return targeted_ ? GROUP_NAME_MAX_LEN + remote_filename_.size() : 0;
}

//==============================================
// EXECUTION
//==============================================

StorageDescriptor TrackerTask::run(network::Connection& connection) {
  BOOST_LOG_TRIVIAL(info) << "Tracker task: Querying " << connection.address()
                          << " with cmd " << static_cast<int>(cmd_);

  try {
    send_request(connection);
    uint64_t pkg_len = receive_header(connection);
    StorageDescriptor storage = receive_storage_info(connection, pkg_len);
    state_ = State::DONE;

    BOOST_LOG_TRIVIAL(info) << "Tracker task: Got storage " << storage.address()
                            << " group=" << storage.group_name
                            << " store_path_index=" << static_cast<int>(storage.store_path_index);
    return storage;
  }
  catch (const std::exception& e) {
    state_ = State::FAILED;
    BOOST_LOG_TRIVIAL(error) << "Tracker task: Query to " << connection.address() << " failed: " << e.what();
    throw;
  }
}

//==============================================
// PROTOCOL STEPS
//==============================================

void TrackerTask::send_request(network::Connection& connection) {
  Codec::write_header(connection, request_pkg_len(), cmd_);

  if (targeted_) {
    // Group name field followed by the raw filename, its length implied by pkg_len
    std::vector<uint8_t> body;
    body.reserve(request_pkg_len());
    Codec::append_fixed_string(body, group_name_, GROUP_NAME_MAX_LEN);
    body.insert(body.end(), remote_filename_.begin(), remote_filename_.end());
    connection.write(body.data(), body.size());
  }

  state_ = State::HEADER_SENT;
}

uint64_t TrackerTask::receive_header(network::Connection& connection) {
  ProtocolHeader header = Codec::read_response_header(connection);
  state_ = State::HEADER_RECEIVED;
  return header.pkg_len;
}

StorageDescriptor TrackerTask::receive_storage_info(network::Connection& connection, uint64_t pkg_len) {
  if (pkg_len != TRACKER_QUERY_STORE_BODY_LEN && pkg_len != TRACKER_QUERY_FETCH_BODY_LEN) {
    BOOST_LOG_TRIVIAL(error) << "Tracker task: Unexpected body length " << pkg_len;
    throw MalformedResponse("tracker body length " + std::to_string(pkg_len));
  }

  std::vector<uint8_t> body(pkg_len);
  connection.read(body.data(), body.size());
  state_ = State::BODY_RECEIVED;

  const uint8_t* cursor = body.data();
  StorageDescriptor storage;
  storage.group_name = Codec::parse_fixed_string(cursor, GROUP_NAME_MAX_LEN);
  cursor += GROUP_NAME_MAX_LEN;
  storage.ip_addr = Codec::parse_fixed_string(cursor, IP_ADDRESS_SIZE - 1);
  cursor += IP_ADDRESS_SIZE - 1;

  uint64_t port = Codec::parse_int64(cursor);
  cursor += PKG_LEN_SIZE;
  if (storage.ip_addr.empty() || port == 0 || port > 65535) {
    BOOST_LOG_TRIVIAL(error) << "Tracker task: Invalid storage endpoint " << storage.ip_addr << ":" << port;
    throw MalformedResponse("invalid storage endpoint");
  }
  storage.port = static_cast<uint16_t>(port);

  // Fetch responses carry no store path index
  if (pkg_len == TRACKER_QUERY_STORE_BODY_LEN) {
    storage.store_path_index = *cursor;
  }

  return storage;
}

} // namespace protocol
} // namespace fdfs
