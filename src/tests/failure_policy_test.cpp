#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>
#include "build/failure_policy.hpp"

using namespace hashrange::build;

TEST(FailurePolicyTest, AbortKeepsOnlyTheFirstFailure) {
  AbortOnFirstFailure policy;
  EXPECT_FALSE(policy.should_stop());
  EXPECT_FALSE(policy.aborted());
  EXPECT_TRUE(policy.failures().empty());

  policy.on_failure("hashes/ABCDE.txt", "first");
  policy.on_failure("hashes/00000.txt", "second");

  EXPECT_TRUE(policy.should_stop());
  EXPECT_TRUE(policy.aborted());
  ASSERT_EQ(policy.failures().size(), 1u);
  EXPECT_EQ(policy.failures()[0].message, "first");
}

TEST(FailurePolicyTest, CollectKeepsGoing) {
  CollectFailures policy;
  policy.on_failure("hashes/FFFFF.txt", "bad");
  policy.on_failure("hashes/00000.txt", "bad");

  EXPECT_FALSE(policy.should_stop());
  EXPECT_FALSE(policy.aborted());

  std::vector<BuildFailure> failures = policy.failures();
  ASSERT_EQ(failures.size(), 2u);
  EXPECT_EQ(failures[0].item.string(), "hashes/00000.txt");
  EXPECT_EQ(failures[1].item.string(), "hashes/FFFFF.txt");
}

TEST(FailurePolicyTest, ConcurrentFailures) {
  CollectFailures collect;
  AbortOnFirstFailure abort;

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&collect, &abort, t]() {
      for (int i = 0; i < 100; ++i) {
        std::string item = std::to_string(t) + "_" + std::to_string(i);
        collect.on_failure(item, "failed");
        abort.on_failure(item, "failed");
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(collect.failures().size(), 800u);
  EXPECT_EQ(abort.failures().size(), 1u);
}

TEST(FailurePolicyTest, Factory) {
  EXPECT_FALSE(make_failure_policy(FailureMode::AbortOnFirst)->aborted());
  EXPECT_NE(dynamic_cast<AbortOnFirstFailure*>(make_failure_policy(FailureMode::AbortOnFirst).get()), nullptr);
  EXPECT_NE(dynamic_cast<CollectFailures*>(make_failure_policy(FailureMode::ContinueAndCollect).get()), nullptr);
  EXPECT_STREQ(to_string(FailureMode::AbortOnFirst), "abort");
  EXPECT_STREQ(to_string(FailureMode::ContinueAndCollect), "continue");
}
