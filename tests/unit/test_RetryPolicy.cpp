#include <gtest/gtest.h>

#include "pipeline/RetryPolicy.hpp"

using namespace lc::pipeline;
using namespace std::chrono_literals;
using lc::config::BackoffConfig;

TEST(RetryPolicyTest, DelaysGrowExponentiallyUpToCap) {
    const RetryPolicy policy(BackoffConfig{10, 100ms, 1s, 2.0, 10min});

    EXPECT_EQ(policy.delayAfter(1), 100ms);
    EXPECT_EQ(policy.delayAfter(2), 200ms);
    EXPECT_EQ(policy.delayAfter(3), 400ms);
    EXPECT_EQ(policy.delayAfter(4), 800ms);
    EXPECT_EQ(policy.delayAfter(5), 1s);
    EXPECT_EQ(policy.delayAfter(9), 1s);
}

TEST(RetryPolicyTest, BoundedByAttemptCount) {
    const RetryPolicy policy(BackoffConfig{3, 1ms, 1ms, 1.0, 10min});

    EXPECT_TRUE(policy.allowsAnother(1, 0ms));
    EXPECT_TRUE(policy.allowsAnother(2, 0ms));
    EXPECT_FALSE(policy.allowsAnother(3, 0ms));
}

TEST(RetryPolicyTest, BoundedByElapsedTime) {
    const RetryPolicy policy(BackoffConfig{100, 1s, 1s, 1.0, 5s});

    EXPECT_TRUE(policy.allowsAnother(1, 3s));
    EXPECT_TRUE(policy.allowsAnother(1, 4s));
    EXPECT_FALSE(policy.allowsAnother(1, 4500ms));
}

TEST(RetryPolicyTest, SingleAttemptNeverRetries) {
    const RetryPolicy policy(BackoffConfig{1, 1ms, 1ms, 2.0, 1min});
    EXPECT_FALSE(policy.allowsAnother(1, 0ms));
}
