#include "build/orchestrator.hpp"
#include <algorithm>
#include <chrono>
#include <map>
#include <thread>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/log/trivial.hpp>
#include "build/build_error.hpp"

namespace hashrange {
namespace build {

namespace {

std::uint64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
  return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - start).count());
}

} // namespace

//==============================================
// BYTE TOTALS
//==============================================

void ByteTotals::add(const ArtifactSizes& sizes) {
  json.fetch_add(sizes.json, std::memory_order_relaxed);
  gzip.fetch_add(sizes.gzip, std::memory_order_relaxed);
  brotli.fetch_add(sizes.brotli, std::memory_order_relaxed);
}

ArtifactSizes ByteTotals::snapshot() const {
  ArtifactSizes sizes;
  sizes.json = json.load();
  sizes.gzip = gzip.load();
  sizes.brotli = brotli.load();
  return sizes;
}


//==============================================
// CONSTRUCTOR
//==============================================

Orchestrator::Orchestrator(BuildOptions options, ByteTotals& totals, FailurePolicy& policy)
  : options_(std::move(options))
  , totals_(totals)
  , policy_(policy)
  , store_(options_.output_root)
  , transcoder_(store_, options_.outputs) {
  BOOST_LOG_TRIVIAL(info) << "Build: Input " << options_.input_root << " -> output " << options_.output_root
                          << " (strict: " << options_.strict << ", threads: " << worker_count()
                          << ", on error: " << to_string(options_.on_error) << ")";
}


//==============================================
// BUILD
//==============================================

BuildReport Orchestrator::run() {
  const auto very_start = std::chrono::steady_clock::now();
  BuildReport report;

  // [1/3] Discovery and completeness check come first so a mismatch writes nothing
  auto start = std::chrono::steady_clock::now();
  std::vector<std::filesystem::path> paths = discover();
  report.discovered = paths.size();
  BOOST_LOG_TRIVIAL(info) << "[1/3] Found " << paths.size() << " hash files in "
                          << options_.input_root.string() << " in " << elapsed_ms(start) << "ms";
  check_completeness(report.discovered);
  std::vector<std::filesystem::path> shards = select_shards(paths);
  throw_if_aborted();

  // [2/3] Directory skeleton
  start = std::chrono::steady_clock::now();
  try {
    store_.ensure_layout();
  } catch (const store::StoreError& e) {
    throw BuildError(e.what());
  }
  BOOST_LOG_TRIVIAL(info) << "[2/3] Ensured " << store::DIRECTORY_COUNT << " output directories in "
                          << elapsed_ms(start) << "ms";

  // [3/3] Shards
  BOOST_LOG_TRIVIAL(info) << "[3/3] Generating"
                          << (options_.outputs.json ? " .json" : "")
                          << (options_.outputs.brotli ? " .br" : "")
                          << (options_.outputs.gzip ? " .gz" : "") << " files";
  start = std::chrono::steady_clock::now();
  report.written = transcode_all(shards);
  report.shard_phase_ms = elapsed_ms(start);

  throw_if_aborted();

  report.failed = policy_.failures();
  report.bytes = totals_.snapshot();
  report.total_ms = elapsed_ms(very_start);

  BOOST_LOG_TRIVIAL(info) << "Build: Finished generating files in " << report.shard_phase_ms << "ms ("
                          << report.total_ms << "ms total)";
  if (!report.failed.empty()) {
    BOOST_LOG_TRIVIAL(warning) << "Build: " << report.failed.size() << " shards failed";
  }
  return report;
}


//==============================================
// PHASES
//==============================================

std::vector<std::filesystem::path> Orchestrator::discover() const {
  std::vector<std::filesystem::path> paths;
  paths.reserve(static_cast<std::size_t>(options_.expected_shard_count));

  try {
    for (const auto& entry : std::filesystem::directory_iterator(options_.input_root)) {
      if (entry.is_regular_file()) {
        paths.push_back(entry.path());
      }
    }
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Build: Failed to list input root: " << e.what();
    throw BuildError("cannot list input root " + options_.input_root.string() + ": " + e.what());
  }

  std::sort(paths.begin(), paths.end());
  return paths;
}

void Orchestrator::check_completeness(std::uint64_t count) const {
  if (!options_.strict) {
    return;
  }
  if (count != options_.expected_shard_count) {
    BOOST_LOG_TRIVIAL(error) << "Build: Strict check failed, found " << count << " hash files, expected "
                             << options_.expected_shard_count;
    throw BuildError("strict check failed: found " + std::to_string(count) + " hash files, expected " +
                     std::to_string(options_.expected_shard_count));
  }
}

std::vector<std::filesystem::path> Orchestrator::select_shards(const std::vector<std::filesystem::path>& paths) {
  std::map<store::RangeKey, std::filesystem::path> claimed;
  std::vector<std::filesystem::path> selected;
  selected.reserve(paths.size());

  for (const auto& path : paths) {
    const std::string stem = path.stem().string();
    // Invalid names are left for the worker to report
    if (!store::is_valid_key(stem)) {
      selected.push_back(path);
      continue;
    }

    auto inserted = claimed.emplace(store::decode(stem), path);
    if (!inserted.second) {
      const auto& owner = inserted.first->second;
      BOOST_LOG_TRIVIAL(warning) << "Build: " << path.filename().string() << " names range "
                                 << inserted.first->first.str() << " already provided by "
                                 << owner.filename().string();
      policy_.on_failure(path, "range " + inserted.first->first.str() + " is already provided by " +
                               owner.filename().string());
      continue;
    }
    selected.push_back(path);
  }

  return selected;
}

std::uint64_t Orchestrator::transcode_all(const std::vector<std::filesystem::path>& paths) {
  std::atomic<std::uint64_t> written{0};
  boost::asio::thread_pool pool(worker_count());

  for (const auto& path : paths) {
    boost::asio::post(pool, [this, &path, &written]() {
      if (policy_.should_stop()) {
        return;
      }
      try {
        Shard shard = parse_range_file(path);
        totals_.add(transcoder_.transcode(shard));
        written.fetch_add(1, std::memory_order_relaxed);
      } catch (const std::exception& e) {
        policy_.on_failure(path, e.what());
      }
    });
  }

  pool.join();
  return written.load();
}

unsigned Orchestrator::worker_count() const {
  if (options_.threads > 0) {
    return options_.threads;
  }
  unsigned hardware = std::thread::hardware_concurrency();
  return hardware > 0 ? hardware : 1;
}

void Orchestrator::throw_if_aborted() const {
  if (!policy_.aborted()) {
    return;
  }
  std::vector<BuildFailure> failures = policy_.failures();
  std::string reason = failures.empty()
    ? std::string("aborted")
    : failures.front().item.string() + ": " + failures.front().message;
  throw BuildError(reason);
}

} // namespace build
} // namespace hashrange
