#ifndef FDFS_PROTOCOL_TYPES_HPP
#define FDFS_PROTOCOL_TYPES_HPP

#include <cstdint>
#include <ostream>
#include <string>

namespace fdfs {
namespace protocol {

// Storage node chosen by a tracker for a single operation
struct StorageDescriptor {
  std::string group_name;
  std::string ip_addr;
  uint16_t port{0};
  uint8_t store_path_index{0};

  // "ip:port", the key of the storage pool map
  std::string address() const;
};

// Identifier of a stored object: "<group>/<remote filename>"
struct FileId {
  std::string group_name;
  std::string remote_filename;

  // Splits at the first '/'. Throws ConfigError when the separator is
  // missing, either side is empty, or the group name exceeds 16 bytes.
  static FileId parse(const std::string& file_id);

  std::string to_string() const;

  bool operator==(const FileId& other) const {
    return group_name == other.group_name && remote_filename == other.remote_filename;
  }
};

std::ostream& operator<<(std::ostream& os, const FileId& file_id);

} // namespace protocol
} // namespace fdfs

#endif // FDFS_PROTOCOL_TYPES_HPP
