#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "client/client.hpp"

namespace blobstore {
namespace cli {

class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CLI(client::Client& client, std::istream& input = std::cin, std::ostream& output = std::cout);


  // ---- STARTUP ----
  void run();
  // Executes one command line; returns false once the shell should stop
  bool execute(const std::string& line);

private:
  // ---- PARAMETERS ----
  client::Client& client_;
  std::istream& input_;
  std::ostream& output_;
  bool running_;


  // ---- COMMAND PROCESSING ----
  void process_command(const std::string& command, const std::vector<std::string>& args);
  void handle_put_command(const std::vector<std::string>& args);
  void handle_get_command(const std::vector<std::string>& args);
  void handle_read_command(const std::vector<std::string>& args);
  void handle_key_command();
  void handle_help_command();
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace blobstore
