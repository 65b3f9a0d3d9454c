#include "cli/cli.hpp"
#include "client/client.hpp"
#include "logger/logger.hpp"
#include "network/store_session.hpp"
#include <iostream>
#include <memory>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  std::string store_dir;
  std::string key_hex;
  std::string log_file{"blobstore.log"};
  size_t threads{8};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -d <store dir> [-k <key>] [-l <log file>] [-t <threads>]\n"
            << "Required arguments:\n"
            << "  -d, --dir       Directory of the local chunk store\n"
            << "Optional arguments:\n"
            << "  -k, --key       Owner key as 64 hex characters, generated when omitted\n"
            << "  -l, --log       Log file (default blobstore.log)\n"
            << "  -t, --threads   Worker threads for chunk transfers (default 8)\n"
            << "Example: " << program_name << " -d ./chunks -t 4\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> known_flags = {
    "-d", "--dir", "-k", "--key", "-l", "--log", "-t", "--threads"
  };

  ProgramOptions options;
  if (argc % 2 == 0) {
    std::cerr << "Error: Every argument needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (known_flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    if (flag == "-d" || flag == "--dir") {
      options.store_dir = value;
    } else if (flag == "-k" || flag == "--key") {
      options.key_hex = value;
    } else if (flag == "-l" || flag == "--log") {
      options.log_file = value;
    } else if (flag == "-t" || flag == "--threads") {
      try {
        options.threads = static_cast<size_t>(std::stoul(value));
      } catch (const std::exception&) {
        std::cerr << "Error: Invalid thread count\n";
        print_usage(argv[0]);
        return options;
      }
      if (options.threads == 0) {
        std::cerr << "Error: Thread count must be positive\n";
        print_usage(argv[0]);
        return options;
      }
    }
  }

  if (options.store_dir.empty()) {
    std::cerr << "Error: A store directory is required\n";
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_client(const ProgramOptions& options) {
  try {
    blobstore::logger::init_logging(options.log_file);

    blobstore::crypto::OwnerKey owner_key = options.key_hex.empty()
      ? blobstore::crypto::OwnerKey::generate()
      : blobstore::crypto::OwnerKey::from_hex(options.key_hex);
    if (options.key_hex.empty()) {
      std::cout << "Generated owner key: " << owner_key.to_hex() << '\n';
    }

    blobstore::client::ClientConfig config;
    config.worker_threads = options.threads;

    auto session = std::make_shared<blobstore::network::StoreSession>(options.store_dir);
    blobstore::client::Client client(session, owner_key, config);
    blobstore::cli::CLI cli(client);

    cli.run();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start client: " << e.what() << '\n';
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
