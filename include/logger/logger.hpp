#ifndef FDFS_LOGGER_HPP
#define FDFS_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace fdfs::logger {

using severity_level = boost::log::trivial::severity_level;

// Installs a file sink for every record at or above min_level and a console
// sink for warnings and above. Replaces any sinks installed earlier.
void init_logging(const std::string& log_file = "fdfs_client.log",
                  severity_level min_level = severity_level::info);

// Maps "trace", "debug", "info", "warning", "error" or "fatal" to a severity.
// Throws ConfigError for anything else.
severity_level parse_severity(const std::string& name);

} // namespace fdfs::logger

#endif // FDFS_LOGGER_HPP
