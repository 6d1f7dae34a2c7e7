#include <gtest/gtest.h>
#include "scheduler/retry_policy.hpp"
#include <chrono>
#include <cmath>
#include <limits>

using namespace std::chrono;

TEST(RetryPolicyTest, DefaultsStartAtFifteenSecondsAndDouble) {
  RetryPolicy policy;
  EXPECT_EQ(policy.DelayFor(1), seconds(15));
  EXPECT_EQ(policy.DelayFor(2), seconds(30));
  EXPECT_EQ(policy.DelayFor(3), seconds(60));
  EXPECT_EQ(policy.MaxRetries(), 3u);
}

TEST(RetryPolicyTest, DelayIsCapped) {
  RetryPolicy policy(seconds(10), 3.0, 10, seconds(60));
  EXPECT_EQ(policy.DelayFor(2), seconds(30));
  EXPECT_EQ(policy.DelayFor(3), seconds(60));
  EXPECT_EQ(policy.DelayFor(9), seconds(60));
}

TEST(RetryPolicyTest, RetriesAreBounded) {
  RetryPolicy policy(milliseconds(5), 2.0, 2);
  EXPECT_FALSE(policy.AllowsRetry(0));
  EXPECT_TRUE(policy.AllowsRetry(1));
  EXPECT_TRUE(policy.AllowsRetry(2));
  EXPECT_FALSE(policy.AllowsRetry(3));
}

TEST(RetryPolicyTest, ZeroRetriesDisablesRetry) {
  RetryPolicy policy(seconds(15), 2.0, 0);
  EXPECT_FALSE(policy.AllowsRetry(1));
}

TEST(RetryPolicyTest, BackoffBelowOneIsTreatedAsFixedDelay) {
  RetryPolicy policy(milliseconds(100), 0.5, 5);
  EXPECT_EQ(policy.DelayFor(4), milliseconds(100));
}

TEST(RetryPolicyTest, NonFiniteBackoffIsTreatedAsFixedDelay) {
  RetryPolicy nan_policy(seconds(15), std::nan(""), 3);
  EXPECT_EQ(nan_policy.BackoffFactor(), 1.0);
  EXPECT_EQ(nan_policy.DelayFor(2), seconds(15));
  EXPECT_EQ(nan_policy.DelayFor(3), seconds(15));

  RetryPolicy inf_policy(seconds(15), std::numeric_limits<double>::infinity(), 3);
  EXPECT_EQ(inf_policy.DelayFor(2), seconds(15));
}
