#include "ipc/reconnect_policy.h"
#include <gtest/gtest.h>
#include <cerrno>
#include <stdexcept>

using namespace vtctl::ipc;

// ============================================================================
// ReconnectPolicy Tests
// ============================================================================

class ReconnectPolicyTest : public ::testing::Test {
protected:
    // Schedule, fire and grow the delay the way the connection manager does
    double fireOnce(ReconnectPolicy& policy) {
        auto delay = policy.beginReconnect();
        EXPECT_TRUE(delay.has_value());
        EXPECT_TRUE(policy.completeReconnect());
        policy.advanceDelay();
        return delay ? delay->count() : -1.0;
    }
};

TEST_F(ReconnectPolicyTest, DefaultConfiguration) {
    ReconnectPolicy policy;

    EXPECT_EQ(policy.getConfig().initial_delay.count(), 1000);
    EXPECT_EQ(policy.getConfig().max_delay.count(), 30000);
    EXPECT_DOUBLE_EQ(policy.getConfig().backoff_multiplier, 1.5);
    EXPECT_TRUE(policy.shouldReconnect());
    EXPECT_FALSE(policy.isReconnecting());
    EXPECT_DOUBLE_EQ(policy.currentDelay().count(), 1.0);
}

TEST_F(ReconnectPolicyTest, DelaySequenceGrowsAndCaps) {
    ReconnectPolicy policy;

    const double expected[] = {1.0, 1.5, 2.25, 3.375, 5.0625, 7.59375,
                               11.390625, 17.0859375, 25.62890625, 30.0, 30.0};
    for (double delay : expected) {
        EXPECT_DOUBLE_EQ(fireOnce(policy), delay);
    }
}

TEST_F(ReconnectPolicyTest, CalculateDelay) {
    ReconnectPolicy policy;

    EXPECT_DOUBLE_EQ(policy.calculateDelay(0).count(), 0.0);
    EXPECT_DOUBLE_EQ(policy.calculateDelay(1).count(), 1.0);
    EXPECT_DOUBLE_EQ(policy.calculateDelay(2).count(), 1.5);
    EXPECT_DOUBLE_EQ(policy.calculateDelay(3).count(), 2.25);
    EXPECT_DOUBLE_EQ(policy.calculateDelay(9).count(), 25.62890625);
    EXPECT_DOUBLE_EQ(policy.calculateDelay(10).count(), 30.0);
    EXPECT_DOUBLE_EQ(policy.calculateDelay(50).count(), 30.0);
}

TEST_F(ReconnectPolicyTest, SuccessResetsDelay) {
    ReconnectPolicy policy;

    fireOnce(policy);
    fireOnce(policy);
    policy.recordFailure();
    policy.recordFailure();
    EXPECT_DOUBLE_EQ(policy.currentDelay().count(), 2.25);
    EXPECT_EQ(policy.consecutiveFailures(), 2u);

    policy.recordSuccess();
    EXPECT_DOUBLE_EQ(policy.currentDelay().count(), 1.0);
    EXPECT_EQ(policy.consecutiveFailures(), 0u);
    EXPECT_DOUBLE_EQ(fireOnce(policy), 1.0);
}

TEST_F(ReconnectPolicyTest, OnlyOneReconnectPending) {
    ReconnectPolicy policy;

    auto first = policy.beginReconnect();
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(policy.isReconnecting());

    auto second = policy.beginReconnect();
    EXPECT_FALSE(second.has_value());

    EXPECT_TRUE(policy.completeReconnect());
    EXPECT_FALSE(policy.isReconnecting());

    auto stats = policy.getStatistics();
    EXPECT_EQ(stats.total_scheduled, 1u);
    EXPECT_EQ(stats.total_attempts, 1u);
}

TEST_F(ReconnectPolicyTest, CancelDisablesReconnect) {
    ReconnectPolicy policy;

    ASSERT_TRUE(policy.beginReconnect().has_value());
    policy.cancel();

    EXPECT_FALSE(policy.shouldReconnect());
    EXPECT_FALSE(policy.isReconnecting());
    EXPECT_FALSE(policy.beginReconnect().has_value());
    EXPECT_FALSE(policy.completeReconnect());
    EXPECT_GE(policy.getStatistics().total_cancelled, 1u);
}

TEST_F(ReconnectPolicyTest, NewSessionReenables) {
    ReconnectPolicy policy;

    fireOnce(policy);
    fireOnce(policy);
    policy.recordFailure();
    policy.cancel();

    policy.resetForNewSession();
    EXPECT_TRUE(policy.shouldReconnect());
    EXPECT_EQ(policy.consecutiveFailures(), 0u);
    EXPECT_DOUBLE_EQ(policy.currentDelay().count(), 1.0);
    EXPECT_TRUE(policy.beginReconnect().has_value());
}

TEST_F(ReconnectPolicyTest, CustomConfiguration) {
    ReconnectConfig config;
    config.initial_delay = std::chrono::milliseconds(10);
    config.max_delay = std::chrono::milliseconds(40);
    config.backoff_multiplier = 2.0;

    ReconnectPolicy policy(config);

    EXPECT_DOUBLE_EQ(fireOnce(policy), 0.01);
    EXPECT_DOUBLE_EQ(fireOnce(policy), 0.02);
    EXPECT_DOUBLE_EQ(fireOnce(policy), 0.04);
    EXPECT_DOUBLE_EQ(fireOnce(policy), 0.04);
}

TEST_F(ReconnectPolicyTest, InvalidConfiguration) {
    ReconnectConfig config;
    config.initial_delay = std::chrono::milliseconds(5000);
    config.max_delay = std::chrono::milliseconds(1000);
    EXPECT_THROW(ReconnectPolicy{config}, std::invalid_argument);

    config = ReconnectConfig();
    config.backoff_multiplier = 0.5;
    EXPECT_THROW(ReconnectPolicy{config}, std::invalid_argument);

    config = ReconnectConfig();
    config.initial_delay = std::chrono::milliseconds(-1);
    EXPECT_THROW(ReconnectPolicy{config}, std::invalid_argument);
}

TEST_F(ReconnectPolicyTest, RetryableErrors) {
    ReconnectPolicy policy;

    EXPECT_TRUE(policy.isRetryableError(EAGAIN));
    EXPECT_TRUE(policy.isRetryableError(EINTR));
    EXPECT_TRUE(policy.isRetryableError(ECONNREFUSED));
    EXPECT_TRUE(policy.isRetryableError(ECONNRESET));
    EXPECT_TRUE(policy.isRetryableError(EPIPE));
    EXPECT_TRUE(policy.isRetryableError(ENOENT));
    EXPECT_TRUE(policy.isRetryableError(ETIMEDOUT));

    EXPECT_FALSE(policy.isRetryableError(EACCES));
    EXPECT_FALSE(policy.isRetryableError(EPERM));
    EXPECT_FALSE(policy.isRetryableError(EINVAL));
    EXPECT_FALSE(policy.isRetryableError(0));
}

TEST_F(ReconnectPolicyTest, MoveConstruction) {
    ReconnectPolicy original;
    fireOnce(original);

    ReconnectPolicy moved(std::move(original));
    EXPECT_DOUBLE_EQ(moved.currentDelay().count(), 1.5);
}
