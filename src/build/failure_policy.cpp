#include "build/failure_policy.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace hashrange {
namespace build {

//==============================================
// ABORT ON FIRST FAILURE
//==============================================

void AbortOnFirstFailure::on_failure(const std::filesystem::path& item, const std::string& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  BOOST_LOG_TRIVIAL(error) << "Build: Shard " << item.string() << " failed: " << message;

  if (!first_) {
    first_ = BuildFailure{item, message};
    stopped_ = true;
    BOOST_LOG_TRIVIAL(error) << "Build: Aborting batch after first failure";
  }
}

std::vector<BuildFailure> AbortOnFirstFailure::failures() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!first_) {
    return {};
  }
  return {*first_};
}


//==============================================
// CONTINUE AND COLLECT
//==============================================

void CollectFailures::on_failure(const std::filesystem::path& item, const std::string& message) {
  std::lock_guard<std::mutex> lock(mutex_);
  BOOST_LOG_TRIVIAL(warning) << "Build: Shard " << item.string() << " failed, continuing: " << message;
  failures_.push_back(BuildFailure{item, message});
}

std::vector<BuildFailure> CollectFailures::failures() const {
  std::vector<BuildFailure> sorted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sorted = failures_;
  }
  std::sort(sorted.begin(), sorted.end(), [](const BuildFailure& a, const BuildFailure& b) {
    return a.item < b.item;
  });
  return sorted;
}


//==============================================
// FACTORY
//==============================================

std::unique_ptr<FailurePolicy> make_failure_policy(FailureMode mode) {
  switch (mode) {
    case FailureMode::ContinueAndCollect:
      return std::make_unique<CollectFailures>();
    case FailureMode::AbortOnFirst:
    default:
      return std::make_unique<AbortOnFirstFailure>();
  }
}

const char* to_string(FailureMode mode) {
  switch (mode) {
    case FailureMode::AbortOnFirst:       return "abort";
    case FailureMode::ContinueAndCollect: return "continue";
    default:                              return "unknown";
  }
}

} // namespace build
} // namespace hashrange
