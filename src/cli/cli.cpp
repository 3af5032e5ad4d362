#include "cli/cli.hpp"
#include <sstream>
#include <boost/log/trivial.hpp>

namespace fdfs {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(client::Client& client, std::istream& input, std::ostream& output)
  : running_(false)
  , client_(client)
  , input_(input)
  , output_(output) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  output_ << "FDFS_Shell> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    std::istringstream iss(line);
    std::vector<std::string> args;
    std::string word;
    while (iss >> word) {
      args.push_back(word);
    }

    if (!args.empty() && args[0] == "quit") {
      running_ = false;
      continue;
    }
    if (!args.empty()) {
      execute(args);
    }

    if (running_) {
      output_ << "FDFS_Shell> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::execute(const std::vector<std::string>& args) {
  if (args.empty()) {
    handle_help_command();
    return false;
  }

  const std::string& command = args[0];
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() - 1 << " argument(s)";

  if (command == "upload" && args.size() == 2) {
    return handle_upload_command(args[1]);
  }
  else if (command == "download" && args.size() == 3) {
    return handle_download_command(args[1], args[2]);
  }
  else if (command == "help" && args.size() == 1) {
    handle_help_command();
    return true;
  }

  output_ << "Unknown command or invalid arguments" << std::endl;
  return false;
}


//==============================================
// COMMAND PROCESSING
//==============================================

bool CLI::handle_upload_command(const std::string& local_filename) {
  try {
    protocol::FileId file_id = client_.upload_by_filename(local_filename);
    output_ << file_id << std::endl;
    return true;
  } catch (const std::exception& e) {
    log_and_display_error("Error uploading file", e.what());
    return false;
  }
}

bool CLI::handle_download_command(const std::string& file_id, const std::string& local_filename) {
  try {
    client_.download_by_file_id(file_id, local_filename);
    output_ << "Downloaded " << file_id << " to " << local_filename << std::endl;
    return true;
  } catch (const std::exception& e) {
    log_and_display_error("Error downloading file", e.what());
    return false;
  }
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help                           Display this help message" << std::endl;
  output_ << "  upload <local_file>            Upload <local_file> and print its file id" << std::endl;
  output_ << "  download <file_id> <local>     Download <file_id> into <local>" << std::endl;
  output_ << "  quit                           Exit the FDFS shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace fdfs
