#include "cli/cli.hpp"
#include <fstream>
#include <iterator>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace blobstore {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(client::Client& client, std::istream& input, std::ostream& output)
  : client_(client)
  , input_(input)
  , output_(output)
  , running_(false) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  output_ << "blobstore> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    running_ = execute(line);
    if (running_) {
      output_ << "blobstore> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command;
  if (!(iss >> command)) {
    return true;
  }
  if (command == "quit") {
    return false;
  }

  std::vector<std::string> args{std::istream_iterator<std::string>(iss), std::istream_iterator<std::string>()};
  process_command(command, args);
  return true;
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() << " arguments";

  if (command == "put") {
    handle_put_command(args);
  }
  else if (command == "get") {
    handle_get_command(args);
  }
  else if (command == "read") {
    handle_read_command(args);
  }
  else if (command == "key" && args.empty()) {
    handle_key_command();
  }
  else if (command == "help" && args.empty()) {
    handle_help_command();
  }
  else {
    output_ << "Unknown command or invalid arguments, type 'help' for usage" << std::endl;
  }
}

void CLI::handle_put_command(const std::vector<std::string>& args) {
  if (args.empty() || args.size() > 2) {
    output_ << "Usage: put <file> [public|private]" << std::endl;
    return;
  }

  types::Scope scope = types::Scope::Private;
  if (args.size() == 2) {
    if (args[1] == "public") {
      scope = types::Scope::Public;
    } else if (args[1] != "private") {
      output_ << "Invalid scope: " << args[1] << ", expected public or private" << std::endl;
      return;
    }
  }

  std::ifstream file(args[0], std::ios::binary);
  if (!file) {
    output_ << "Error opening file: " << args[0] << std::endl;
    return;
  }
  types::Bytes data{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};

  try {
    types::BlobAddress address = client_.write_to_network(data, scope);
    output_ << address.to_string() << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error storing file", e.what());
  }
}

void CLI::handle_get_command(const std::vector<std::string>& args) {
  if (args.size() != 2) {
    output_ << "Usage: get <address> <out file>" << std::endl;
    return;
  }

  try {
    types::BlobAddress address = types::BlobAddress::parse(args[0]);
    types::Bytes data = client_.read_blob(address);

    std::ofstream file(args[1], std::ios::binary | std::ios::trunc);
    if (!file) {
      output_ << "Error opening file: " << args[1] << std::endl;
      return;
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    output_ << "Wrote " << data.size() << " bytes to " << args[1] << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading blob", e.what());
  }
}

void CLI::handle_read_command(const std::vector<std::string>& args) {
  if (args.size() != 3) {
    output_ << "Usage: read <address> <position> <length>" << std::endl;
    return;
  }

  try {
    types::BlobAddress address = types::BlobAddress::parse(args[0]);
    uint64_t position = std::stoull(args[1]);
    uint64_t length = std::stoull(args[2]);

    types::Bytes data = client_.read_blob_from(address, position, length);
    output_ << types::to_hex(data.data(), data.size()) << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading range", e.what());
  }
}

void CLI::handle_key_command() {
  output_ << client_.owner_key().to_hex() << std::endl;
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help                          Display this help message" << std::endl;
  output_ << "  put <file> [public|private]   Store local <file>, private by default" << std::endl;
  output_ << "  get <address> <out file>      Retrieve a blob into <out file>" << std::endl;
  output_ << "  read <address> <pos> <len>    Print <len> bytes at <pos> as hex" << std::endl;
  output_ << "  key                           Print the owner key" << std::endl;
  output_ << "  quit                          Exit the shell" << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace blobstore
