#include "cli/build_options.hpp"
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <unordered_set>

namespace hashrange {
namespace cli {

namespace {

bool parse_bool(const std::string& flag, const std::string& value) {
  if (value == "true") {
    return true;
  }
  if (value == "false") {
    return false;
  }
  throw std::invalid_argument("Invalid value for " + flag + ": '" + value + "' (expected true or false)");
}

unsigned parse_threads(const std::string& value) {
  if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front()))) {
    throw std::invalid_argument("Invalid thread count: '" + value + "'");
  }

  std::size_t consumed = 0;
  unsigned long threads = 0;
  try {
    threads = std::stoul(value, &consumed);
  } catch (const std::exception&) {
    throw std::invalid_argument("Invalid thread count: '" + value + "'");
  }
  if (consumed != value.size() || threads == 0 || threads > 4096) {
    throw std::invalid_argument("Invalid thread count: '" + value + "'");
  }
  return static_cast<unsigned>(threads);
}

build::FailureMode parse_failure_mode(const std::string& value) {
  if (value == "abort") {
    return build::FailureMode::AbortOnFirst;
  }
  if (value == "continue") {
    return build::FailureMode::ContinueAndCollect;
  }
  throw std::invalid_argument("Invalid value for --on-error: '" + value + "' (expected abort or continue)");
}

} // namespace

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [options]\n"
            << "Options:\n"
            << "  --hashes <dir>            Path to existing hashes (default: hashes)\n"
            << "  -o, --out <dir>           Path to output to (default: dist)\n"
            << "  --strict <true|false>     Require all 1,048,576 hash files (default: true)\n"
            << "  --json <true|false>       Generate .json files (default: true)\n"
            << "  --gzip <true|false>       Generate .json.gz files (default: true)\n"
            << "  --brotli <true|false>     Generate .json.br files (default: true)\n"
            << "  --threads <n>             Worker threads (default: hardware concurrency)\n"
            << "  --on-error <abort|continue>  Abort on the first failed shard or collect failures (default: abort)\n"
            << "  --log-level <level>       trace, debug, info, warning, error or fatal (default: info)\n"
            << "  --log-file <path>         Also log to a rotating file\n"
            << "  --help                    Show this message\n"
            << "Example: " << program_name << " --hashes hashes -o dist --strict false\n";
}

BuildCommand parse_build_options(const std::vector<std::string>& args) {
  static const std::unordered_set<std::string> value_flags = {
    "--hashes", "-o", "--out", "--strict", "--json", "--gzip", "--brotli",
    "--threads", "--on-error", "--log-level", "--log-file"
  };

  BuildCommand command;

  try {
    for (std::size_t i = 0; i < args.size(); ++i) {
      const std::string& flag = args[i];

      if (flag == "--help" || flag == "-h") {
        command.help = true;
        return command;
      }

      if (value_flags.count(flag) == 0) {
        throw std::invalid_argument("Unknown argument: " + flag);
      }
      if (i + 1 >= args.size()) {
        throw std::invalid_argument("Missing value for " + flag);
      }
      const std::string& value = args[++i];

      if (flag == "--hashes") {
        command.options.input_root = value;
      } else if (flag == "-o" || flag == "--out") {
        command.options.output_root = value;
      } else if (flag == "--strict") {
        command.options.strict = parse_bool(flag, value);
      } else if (flag == "--json") {
        command.options.outputs.json = parse_bool(flag, value);
      } else if (flag == "--gzip") {
        command.options.outputs.gzip = parse_bool(flag, value);
      } else if (flag == "--brotli") {
        command.options.outputs.brotli = parse_bool(flag, value);
      } else if (flag == "--threads") {
        command.options.threads = parse_threads(value);
      } else if (flag == "--on-error") {
        command.options.on_error = parse_failure_mode(value);
      } else if (flag == "--log-level") {
        command.logging.min_level = logger::parse_severity(value);
      } else if (flag == "--log-file") {
        command.logging.log_file = value;
      }
    }
  } catch (const std::invalid_argument& e) {
    command.error = e.what();
    return command;
  }

  command.valid = true;
  return command;
}

} // namespace cli
} // namespace hashrange
