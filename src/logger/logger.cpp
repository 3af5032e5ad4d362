#include "logger/logger.hpp"
#include "common/error.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <filesystem>
#include <iostream>

namespace fdfs::logger {

void init_logging(const std::string& log_file, severity_level min_level) {
  namespace logging = boost::log;
  namespace sinks = boost::log::sinks;
  namespace expr = boost::log::expressions;

  try {
    // Clear any existing sinks
    logging::core::get()->remove_all_sinks();

    auto formatter = expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << logging::trivial::severity << "]"
        << " [Thread " << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "] "
        << expr::smessage;

    // File sink receives everything that passes the core filter
    auto file_backend = boost::make_shared<sinks::text_file_backend>();
    std::filesystem::path log_path = std::filesystem::absolute(log_file);
    file_backend->set_file_name_pattern(log_path.string());
    file_backend->set_open_mode(std::ios::out | std::ios::app);
    file_backend->auto_flush(true);

    using file_sink = sinks::synchronous_sink<sinks::text_file_backend>;
    auto file_sink_ptr = boost::make_shared<file_sink>(file_backend);
    file_sink_ptr->set_formatter(formatter);
    logging::core::get()->add_sink(file_sink_ptr);

    // Console sink only carries problems the user has to see
    auto console_backend = boost::make_shared<sinks::text_ostream_backend>();
    console_backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
    console_backend->auto_flush(true);

    using console_sink = sinks::synchronous_sink<sinks::text_ostream_backend>;
    auto console_sink_ptr = boost::make_shared<console_sink>(console_backend);
    console_sink_ptr->set_formatter(formatter);
    console_sink_ptr->set_filter(logging::trivial::severity >= logging::trivial::warning);
    logging::core::get()->add_sink(console_sink_ptr);

    logging::add_common_attributes();
    logging::core::get()->set_filter(logging::trivial::severity >= min_level);
    logging::core::get()->set_logging_enabled(true);

    BOOST_LOG_TRIVIAL(info) << "Logger: Logging initialized with file: " << log_path.string();
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

severity_level parse_severity(const std::string& name) {
  severity_level level;
  if (!boost::log::trivial::from_string(name.c_str(), name.size(), level)) {
    throw ConfigError("unknown log level: " + name);
  }
  return level;
}

} // namespace fdfs::logger
