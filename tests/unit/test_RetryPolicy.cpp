#include <gtest/gtest.h>
#include "sync/RetryPolicy.hpp"

using namespace es::sync;
using namespace std::chrono;

class RetryPolicyTest : public ::testing::Test {
protected:
    es::config::BackoffConfig cfg;
};

TEST_F(RetryPolicyTest, BaseScheduleFollowsSteps) {
    const RetryPolicy policy(cfg);
    EXPECT_EQ(policy.baseDelay(1), seconds(5));
    EXPECT_EQ(policy.baseDelay(2), seconds(10));
    EXPECT_EQ(policy.baseDelay(3), seconds(30));
    EXPECT_EQ(policy.baseDelay(4), seconds(60));
    EXPECT_EQ(policy.baseDelay(5), seconds(300));
    EXPECT_EQ(policy.baseDelay(6), seconds(600));
}

TEST_F(RetryPolicyTest, ScheduleIsCappedBeyondLastStep) {
    const RetryPolicy policy(cfg);
    EXPECT_EQ(policy.baseDelay(7), seconds(600));
    EXPECT_EQ(policy.baseDelay(50), seconds(600));
    EXPECT_EQ(policy.delay(50), seconds(600));
}

TEST_F(RetryPolicyTest, CapClampsLongSteps) {
    cfg.cap = seconds(45);
    const RetryPolicy policy(cfg);
    EXPECT_EQ(policy.baseDelay(3), seconds(30));
    EXPECT_EQ(policy.baseDelay(4), seconds(45));
    EXPECT_EQ(policy.delay(6), seconds(45));
}

TEST_F(RetryPolicyTest, JitterStaysBelowNextStep) {
    const RetryPolicy policy(cfg);
    EXPECT_EQ(policy.maxJitter(1), milliseconds(1000));   // 20% of 5s
    EXPECT_EQ(policy.maxJitter(4), milliseconds(12000));  // 20% of 60s
    EXPECT_EQ(policy.maxJitter(6), milliseconds(0));      // at the cap

    cfg.jitter_ratio = 1.0;
    const RetryPolicy wide(cfg);
    EXPECT_EQ(wide.maxJitter(1), milliseconds(5000));     // 10s - 5s
    EXPECT_EQ(wide.maxJitter(5), milliseconds(300000));   // 600s - 300s
}

TEST_F(RetryPolicyTest, ConsecutiveDelaysNeverDecrease) {
    cfg.jitter_ratio = 1.0;
    const RetryPolicy policy(cfg);

    for (int round = 0; round < 200; ++round) {
        milliseconds previous{0};
        for (unsigned int n = 1; n <= 10; ++n) {
            const auto d = policy.delay(n);
            EXPECT_GE(d, previous) << "retry " << n;
            EXPECT_GE(d, policy.baseDelay(n));
            EXPECT_LE(d, duration_cast<milliseconds>(cfg.cap));
            previous = d;
        }
    }
}

TEST_F(RetryPolicyTest, NextAttemptIsInTheFuture) {
    const RetryPolicy policy(cfg);
    const auto now = system_clock::now();
    const auto next = policy.nextAttempt(2, now);
    EXPECT_GE(next - now, seconds(10));
    EXPECT_LE(next - now, seconds(12));
}

TEST_F(RetryPolicyTest, RejectsUnusableSchedules) {
    cfg.schedule.clear();
    EXPECT_THROW(RetryPolicy{cfg}, std::invalid_argument);

    cfg.schedule = {seconds(30), seconds(10)};
    EXPECT_THROW(RetryPolicy{cfg}, std::invalid_argument);
}
