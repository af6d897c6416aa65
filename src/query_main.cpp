#include "cli/local_query.hpp"
#include "logger/logger.hpp"
#include <iostream>
#include <string>

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [--root <dir>] <password>\n"
            << "  --root <dir>    Store built by hashrange-build (default: dist)\n"
            << "Example: " << program_name << " --root dist hunter2\n";
}

int main(int argc, char* argv[]) {
  std::string root = "dist";
  std::string password;
  bool have_password = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg(argv[i]);
    if (arg == "--root" && i + 1 < argc) {
      root = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return 0;
    } else if (!have_password) {
      password = arg;
      have_password = true;
    } else {
      std::cerr << "Error: Unexpected argument: " << arg << '\n';
      print_usage(argv[0]);
      return 1;
    }
  }

  if (!have_password) {
    print_usage(argv[0]);
    return 1;
  }

  hashrange::logger::LogConfig logging;
  logging.min_level = boost::log::trivial::warning;
  hashrange::logger::init_logging(logging);

  try {
    hashrange::store::ShardStore store(root);
    std::uint64_t count = hashrange::cli::count_password(store, password);
    if (count > 0) {
      std::cout << "Found " << count << " times in the breach corpus\n";
    } else {
      std::cout << "Not found\n";
    }
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
}
