#include "config/config.hpp"
#include "common/error.hpp"
#include <boost/log/trivial.hpp>
#include <fstream>

namespace fdfs {
namespace config {

namespace {

std::string trim(const std::string& value) {
  const char* whitespace = " \t\r\n";
  std::size_t begin = value.find_first_not_of(whitespace);
  if (begin == std::string::npos) {
    return "";
  }
  std::size_t end = value.find_last_not_of(whitespace);
  return value.substr(begin, end - begin + 1);
}

long long parse_number(const std::string& key, const std::string& value, std::size_t line_no) {
  std::size_t consumed = 0;
  long long number = 0;
  try {
    number = std::stoll(value, &consumed);
  } catch (const std::exception&) {
    throw ConfigError("line " + std::to_string(line_no) + ": " + key + " is not a number: " + value);
  }
  if (consumed != value.size() || number < 0) {
    throw ConfigError("line " + std::to_string(line_no) + ": invalid " + key + ": " + value);
  }
  return number;
}

// Longest accepted connect_timeout or network_timeout, one day
constexpr long long MAX_TIMEOUT_SECONDS = 24 * 60 * 60;

std::chrono::seconds parse_timeout(const std::string& key, const std::string& value, std::size_t line_no) {
  long long seconds = parse_number(key, value, line_no);
  if (seconds > MAX_TIMEOUT_SECONDS) {
    throw ConfigError("line " + std::to_string(line_no) + ": " + key + " exceeds "
                      + std::to_string(MAX_TIMEOUT_SECONDS) + " seconds: " + value);
  }
  return std::chrono::seconds(seconds);
}

} // namespace

//==============================================
// LOADING
//==============================================

Config Config::from_file(const std::string& path) {
  BOOST_LOG_TRIVIAL(info) << "Config: Loading configuration from: " << path;

  std::ifstream file(path);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Config: Failed to open config file: " << path;
    throw ConfigError("cannot open config file: " + path);
  }

  Config config = parse(file);
  config.validate();

  BOOST_LOG_TRIVIAL(info) << "Config: Loaded " << config.tracker_addrs.size()
                          << " tracker(s), max_conns=" << config.max_conns;
  return config;
}

Config Config::parse(std::istream& input) {
  Config config;
  std::string line;
  std::size_t line_no = 0;

  while (std::getline(input, line)) {
    ++line_no;
    std::string content = trim(line);
    if (content.empty() || content[0] == '#') {
      continue;
    }

    std::size_t eq_pos = content.find('=');
    if (eq_pos == std::string::npos) {
      throw ConfigError("line " + std::to_string(line_no) + ": expected key = value");
    }

    std::string key = trim(content.substr(0, eq_pos));
    std::string value = trim(content.substr(eq_pos + 1));

    if (key == "tracker_server") {
      if (value.empty()) {
        throw ConfigError("line " + std::to_string(line_no) + ": empty tracker_server");
      }
      config.tracker_addrs.push_back(value);
    }
    else if (key == "max_conns") {
      config.max_conns = static_cast<std::size_t>(parse_number(key, value, line_no));
    }
    else if (key == "connect_timeout") {
      config.connect_timeout = parse_timeout(key, value, line_no);
    }
    else if (key == "network_timeout") {
      config.network_timeout = parse_timeout(key, value, line_no);
    }
    else if (key == "log_file") {
      config.log_file = value;
    }
    else if (key == "log_level") {
      config.log_level = value;
    }
    else {
      BOOST_LOG_TRIVIAL(debug) << "Config: Ignoring unknown key: " << key;
    }
  }

  return config;
}

//==============================================
// VALIDATION
//==============================================

void Config::validate() const {
  if (tracker_addrs.empty()) {
    throw ConfigError("no tracker_server configured");
  }
  if (max_conns == 0) {
    throw ConfigError("max_conns must be positive");
  }
}

} // namespace config
} // namespace fdfs
