#include "build/build_error.hpp"
#include "build/orchestrator.hpp"
#include "cli/build_options.hpp"
#include "logger/logger.hpp"
#include <boost/log/trivial.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

bool run_build(const hashrange::build::BuildOptions& options) {
  using namespace hashrange::build;

  if (!options.outputs.any()) {
    std::cerr << "Error: All of --json, --gzip and --brotli are disabled, nothing to generate\n";
    return false;
  }

  try {
    ByteTotals totals;
    std::unique_ptr<FailurePolicy> policy = make_failure_policy(options.on_error);
    Orchestrator orchestrator(options, totals, *policy);
    BuildReport report = orchestrator.run();

    std::cout << "Finished generating files in " << report.shard_phase_ms << "ms ("
              << report.total_ms << "ms total)\n";
    std::cout << "Bytes: json " << report.bytes.json
              << " | br " << report.bytes.brotli
              << " | gz " << report.bytes.gzip << '\n';

    if (!report.failed.empty()) {
      std::cerr << report.failed.size() << " of " << report.discovered << " shards failed:\n";
      for (const auto& failure : report.failed) {
        std::cerr << "  " << failure.item.string() << ": " << failure.message << '\n';
      }
      return false;
    }
    return true;
  } catch (const BuildError& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Build: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Build: Unexpected failure: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const std::vector<std::string> args(argv + 1, argv + argc);
  const auto command = hashrange::cli::parse_build_options(args);

  if (command.help) {
    hashrange::cli::print_usage(argv[0]);
    return 0;
  }
  if (!command.valid) {
    std::cerr << "Error: " << command.error << '\n';
    hashrange::cli::print_usage(argv[0]);
    return 1;
  }

  try {
    hashrange::logger::init_logging(command.logging);
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to initialize logging: " << e.what() << '\n';
    return 1;
  }

  return run_build(command.options) ? 0 : 1;
}
