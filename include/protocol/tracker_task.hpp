#ifndef FDFS_PROTOCOL_TRACKER_TASK_HPP
#define FDFS_PROTOCOL_TRACKER_TASK_HPP

#include <cstdint>
#include <string>
#include "network/connection.hpp"
#include "protocol/protocol_header.hpp"
#include "protocol/types.hpp"

namespace fdfs {
namespace protocol {

// Asks a tracker which storage node should serve one operation
class TrackerTask {
public:
  enum class State {
    CREATED,
    HEADER_SENT,
    HEADER_RECEIVED,
    BODY_RECEIVED,
    DONE,
    FAILED
  };


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Query without a target, e.g. TRACKER_QUERY_STORE_WITHOUT_GROUP_ONE
  explicit TrackerTask(Command cmd);
  // Query bound to one stored object, e.g. TRACKER_QUERY_FETCH_ONE
  TrackerTask(Command cmd, const std::string& group_name, const std::string& remote_filename);


  // ---- EXECUTION ----
  // Runs the full exchange. Throws RemoteStatusError, MalformedResponse or
  // IOError; the connection must not be reused after a throw.
  StorageDescriptor run(network::Connection& connection);


  // ---- GETTERS ----
  State state() const { return state_; }
  // Payload length announced in the request header
  uint64_t request_pkg_len() const;

private:
  // ---- PARAMETERS ----
  Command cmd_;
  std::string group_name_;
  std::string remote_filename_;
  bool targeted_;
  State state_{State::CREATED};


  // ---- PROTOCOL STEPS ----
  void send_request(network::Connection& connection);
  uint64_t receive_header(network::Connection& connection);
  StorageDescriptor receive_storage_info(network::Connection& connection, uint64_t pkg_len);
};

} // namespace protocol
} // namespace fdfs

#endif // FDFS_PROTOCOL_TRACKER_TASK_HPP
