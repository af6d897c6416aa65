#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hashrange {
namespace build {

struct BuildFailure {
  std::filesystem::path item;
  std::string message;
};

enum class FailureMode {
  AbortOnFirst,
  ContinueAndCollect
};

// Decides what a failed shard means for the rest of the batch.
// Called concurrently from worker threads.
class FailurePolicy {
public:
  virtual ~FailurePolicy() = default;

  // Records a failed unit of work
  virtual void on_failure(const std::filesystem::path& item, const std::string& message) = 0;
  // True once no further units should be started
  virtual bool should_stop() const = 0;
  // True if the batch must be reported as aborted
  virtual bool aborted() const = 0;
  // Recorded failures, sorted by item path
  virtual std::vector<BuildFailure> failures() const = 0;
};

// Default: the first failure is fatal to the whole batch
class AbortOnFirstFailure : public FailurePolicy {
public:
  void on_failure(const std::filesystem::path& item, const std::string& message) override;
  bool should_stop() const override { return stopped_.load(); }
  bool aborted() const override { return stopped_.load(); }
  std::vector<BuildFailure> failures() const override;

private:
  mutable std::mutex mutex_;
  std::optional<BuildFailure> first_;
  std::atomic<bool> stopped_{false};
};

// Isolates failures per shard and keeps going
class CollectFailures : public FailurePolicy {
public:
  void on_failure(const std::filesystem::path& item, const std::string& message) override;
  bool should_stop() const override { return false; }
  bool aborted() const override { return false; }
  std::vector<BuildFailure> failures() const override;

private:
  mutable std::mutex mutex_;
  std::vector<BuildFailure> failures_;
};

std::unique_ptr<FailurePolicy> make_failure_policy(FailureMode mode);
const char* to_string(FailureMode mode);

} // namespace build
} // namespace hashrange
