#pragma once

#include <string>
#include <vector>
#include "build/orchestrator.hpp"
#include "logger/logger.hpp"

namespace hashrange {
namespace cli {

struct BuildCommand {
  build::BuildOptions options;
  logger::LogConfig logging;
  bool valid{false};
  bool help{false};
  // Reason the arguments were rejected
  std::string error;
};

// Parses the builder's arguments (program name excluded). Never throws:
// problems are reported through valid == false and error
BuildCommand parse_build_options(const std::vector<std::string>& args);

void print_usage(const std::string& program_name);

} // namespace cli
} // namespace hashrange
