#include "protocol/types.hpp"
#include "protocol/protocol_header.hpp"
#include "common/error.hpp"

namespace fdfs {
namespace protocol {

std::string StorageDescriptor::address() const {
  return ip_addr + ":" + std::to_string(port);
}

FileId FileId::parse(const std::string& file_id) {
  std::size_t slash_pos = file_id.find('/');
  if (slash_pos == std::string::npos) {
    throw ConfigError("invalid file id, missing '/': " + file_id);
  }

  FileId result;
  result.group_name = file_id.substr(0, slash_pos);
  result.remote_filename = file_id.substr(slash_pos + 1);

  if (result.group_name.empty() || result.remote_filename.empty()) {
    throw ConfigError("invalid file id, empty group or filename: " + file_id);
  }
  if (result.group_name.size() > GROUP_NAME_MAX_LEN) {
    throw ConfigError("invalid file id, group name too long: " + result.group_name);
  }
  return result;
}

std::string FileId::to_string() const {
  return group_name + "/" + remote_filename;
}

std::ostream& operator<<(std::ostream& os, const FileId& file_id) {
  return os << file_id.to_string();
}

} // namespace protocol
} // namespace fdfs
