#include <gtest/gtest.h>

#include <string>

#include "gcb/service/token_bucket.hpp"

using namespace gcb::service;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// Fixture
// ---------------------------------------------------------------------------

class TokenBucketTest : public ::testing::Test {
protected:
    // 10 burst, 5 tokens/sec refill
    TokenBucket bucket{10, 5};
    Clock::time_point t0 = Clock::now();
};

TEST_F(TokenBucketTest, NewKeyStartsFull) {
    EXPECT_TRUE(bucket.enabled());
    EXPECT_EQ(bucket.available("Survival", t0), 10u);
    EXPECT_EQ(bucket.rejected("Survival"), 0u);
}

TEST_F(TokenBucketTest, ConsumeReducesTokens) {
    EXPECT_TRUE(bucket.consume("Survival", t0));
    EXPECT_EQ(bucket.available("Survival", t0), 9u);
}

TEST_F(TokenBucketTest, ExhaustedBucketRejectsAndCounts) {
    for (int i = 0; i < 10; ++i) {
        EXPECT_TRUE(bucket.consume("Survival", t0));
    }
    EXPECT_FALSE(bucket.consume("Survival", t0));
    EXPECT_FALSE(bucket.consume("Survival", t0));
    EXPECT_EQ(bucket.rejected("Survival"), 2u);
}

TEST_F(TokenBucketTest, RefillsAtSteadyRate) {
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(bucket.consume("Survival", t0));
    }
    EXPECT_EQ(bucket.available("Survival", t0 + 200ms), 1u);
    EXPECT_EQ(bucket.available("Survival", t0 + 1s), 5u);
    // Never beyond capacity.
    EXPECT_EQ(bucket.available("Survival", t0 + 1h), 10u);
}

TEST_F(TokenBucketTest, KeysAreIndependent) {
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(bucket.consume("Survival", t0));
    }
    EXPECT_FALSE(bucket.consume("Survival", t0));
    EXPECT_TRUE(bucket.consume("Creative", t0));
    EXPECT_EQ(bucket.rejected("Creative"), 0u);
}

TEST_F(TokenBucketTest, ResetAndRemoveRestoreCapacity) {
    for (int i = 0; i < 11; ++i) {
        (void)bucket.consume("Survival", t0);
    }
    bucket.reset("Survival", t0);
    EXPECT_EQ(bucket.available("Survival", t0), 10u);
    EXPECT_EQ(bucket.rejected("Survival"), 0u);

    ASSERT_TRUE(bucket.consume("Survival", t0));
    bucket.remove("Survival");
    EXPECT_EQ(bucket.available("Survival", t0), 10u);
}

TEST_F(TokenBucketTest, EarlierTimestampDoesNotRefill) {
    ASSERT_TRUE(bucket.consume("Survival", t0));
    EXPECT_EQ(bucket.available("Survival", t0 - 5s), 9u);
}

TEST(TokenBucketDisabledTest, ZeroCapacityNeverLimits) {
    TokenBucket bucket(0, 0);
    EXPECT_FALSE(bucket.enabled());
    auto now = Clock::now();
    for (int i = 0; i < 1000; ++i) {
        ASSERT_TRUE(bucket.consume("Survival", now));
    }
    EXPECT_EQ(bucket.rejected("Survival"), 0u);
}
