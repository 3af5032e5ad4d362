#include "cli/cli.hpp"
#include "client/client.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"
#include <iostream>
#include <string>
#include <vector>

struct ProgramOptions {
  std::string config_path;
  std::vector<std::string> command;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -c <client.conf> [command]\n"
        << "Required arguments:\n"
        << "  -c, --config  Client configuration file\n"
        << "Commands (interactive shell when omitted):\n"
        << "  upload <local_file>\n"
        << "  download <file_id> <local_file>\n"
        << "Example: " << program_name << " -c /etc/fdfs/client.conf upload photo.jpg\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  ProgramOptions options;

  int i = 1;
  while (i < argc) {
    const std::string flag(argv[i]);
    if (flag != "-c" && flag != "--config") {
      break;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    options.config_path = argv[i + 1];
    i += 2;
  }

  for (; i < argc; ++i) {
    options.command.emplace_back(argv[i]);
  }

  if (options.config_path.empty()) {
    std::cerr << "Error: A config file is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_client(const ProgramOptions& options) {
  try {
    fdfs::config::Config config = fdfs::config::Config::from_file(options.config_path);
    fdfs::logger::init_logging(config.log_file, fdfs::logger::parse_severity(config.log_level));

    fdfs::client::Client client(config);
    fdfs::cli::CLI cli(client);

    if (options.command.empty()) {
      cli.run();
      return true;
    }
    return cli.execute(options.command);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_client(options)) {
    return 1;
  }
  return 0;
}
