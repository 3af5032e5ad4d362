#ifndef FDFS_CONFIG_CONFIG_HPP
#define FDFS_CONFIG_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <istream>
#include <string>
#include <vector>

namespace fdfs {
namespace config {

struct Config {
  // ---- PARAMETERS ----
  // Tracker endpoints as "host:port", in file order
  std::vector<std::string> tracker_addrs;
  // Capacity of every tracker and storage connection pool
  std::size_t max_conns{10};
  std::chrono::seconds connect_timeout{5};
  // Deadline for each network read or write, zero disables it
  std::chrono::seconds network_timeout{30};
  std::string log_file{"fdfs_client.log"};
  std::string log_level{"info"};


  // ---- LOADING ----
  // Reads a client.conf style file and validates the result
  static Config from_file(const std::string& path);
  // Parses "key = value" lines; repeated tracker_server lines accumulate
  static Config parse(std::istream& input);


  // ---- VALIDATION ----
  // Throws ConfigError when no tracker is configured or max_conns is zero
  void validate() const;
};

} // namespace config
} // namespace fdfs

#endif // FDFS_CONFIG_CONFIG_HPP
