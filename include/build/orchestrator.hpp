#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <vector>
#include "build/failure_policy.hpp"
#include "build/transcoder.hpp"
#include "store/path_codec.hpp"

namespace hashrange {
namespace build {

struct BuildOptions {
  std::filesystem::path input_root = "hashes";
  std::filesystem::path output_root = "dist";
  // Require exactly expected_shard_count input files before writing anything
  bool strict = true;
  std::uint64_t expected_shard_count = store::KEYSPACE_SIZE;
  OutputSelection outputs;
  unsigned threads = 0;  // 0 selects hardware concurrency
  FailureMode on_error = FailureMode::AbortOnFirst;
};

// Shared byte accumulators, one per representation, updated concurrently by workers
struct ByteTotals {
  std::atomic<std::uint64_t> json{0};
  std::atomic<std::uint64_t> gzip{0};
  std::atomic<std::uint64_t> brotli{0};

  void add(const ArtifactSizes& sizes);
  ArtifactSizes snapshot() const;
};

struct BuildReport {
  std::uint64_t discovered = 0;
  std::uint64_t written = 0;
  std::vector<BuildFailure> failed;
  ArtifactSizes bytes;
  std::uint64_t shard_phase_ms = 0;
  std::uint64_t total_ms = 0;
};

class Orchestrator {
public:
  // ---- CONSTRUCTOR ----
  Orchestrator(BuildOptions options, ByteTotals& totals, FailurePolicy& policy);


  // ---- BUILD ----
  // Discovery, completeness check, directory skeleton, then parallel transcoding.
  // Throws BuildError on a strict mismatch (before any output) or when the policy aborts
  BuildReport run();


  // ---- PHASES ----
  // Immediate regular-file children of the input root, sorted by path
  std::vector<std::filesystem::path> discover() const;
  // Throws BuildError if strict and count differs from the expected shard count
  void check_completeness(std::uint64_t count) const;
  // Keeps the first file for each canonical key. Later files naming the same key
  // (other case or extension) are reported to the policy and dropped
  std::vector<std::filesystem::path> select_shards(const std::vector<std::filesystem::path>& paths);
  // Transcodes every path on the worker pool, returns the number of shards written
  std::uint64_t transcode_all(const std::vector<std::filesystem::path>& paths);

  const BuildOptions& options() const { return options_; }

private:
  // ---- PARAMETERS ----
  BuildOptions options_;
  ByteTotals& totals_;
  FailurePolicy& policy_;
  store::ShardStore store_;
  Transcoder transcoder_;

  unsigned worker_count() const;
  // Throws BuildError carrying the first recorded failure if the policy aborted
  void throw_if_aborted() const;
};

} // namespace build
} // namespace hashrange
