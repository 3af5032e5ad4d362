#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "client/client.hpp"

namespace fdfs {
namespace cli {

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(client::Client& client, std::istream& input = std::cin, std::ostream& output = std::cout);


    // ---- STARTUP ----
    // Interactive shell, returns when input ends or "quit" is entered
    void run();
    // Runs a single command given as words, returns true on success
    bool execute(const std::vector<std::string>& args);

private:
    // ---- PARAMETERS ----
    bool running_;
    // System components
    client::Client& client_;
    std::istream& input_;
    std::ostream& output_;


    // ---- COMMAND PROCESSING ----
    bool handle_upload_command(const std::string& local_filename);
    bool handle_download_command(const std::string& file_id, const std::string& local_filename);
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace fdfs
