#include <gtest/gtest.h>
#include "peerchunk/transfer/rtt_estimator.hpp"

using namespace peerchunk::transfer;

TEST(RttEstimatorTest, InitialValues) {
    RttEstimator rtt;
    
    EXPECT_DOUBLE_EQ(rtt.estimated_rtt().count(), 0.5);
    EXPECT_DOUBLE_EQ(rtt.dev_rtt().count(), 0.25);
    EXPECT_DOUBLE_EQ(rtt.timeout_interval().count(), 1.5);
    EXPECT_FALSE(rtt.is_fixed());
}

TEST(RttEstimatorTest, SampleUsesUpdatedEstimateForDeviation) {
    RttEstimator rtt;
    
    rtt.add_sample(Seconds(1.0));
    
    EXPECT_NEAR(rtt.estimated_rtt().count(), 0.575, 1e-9);
    EXPECT_NEAR(rtt.dev_rtt().count(), 0.3025, 1e-9);
    EXPECT_NEAR(rtt.timeout_interval().count(), 1.785, 1e-9);
    EXPECT_EQ(rtt.sample_count(), 1u);
}

TEST(RttEstimatorTest, ConvergesTowardsSteadySamples) {
    RttEstimator rtt;
    
    for (int i = 0; i < 200; ++i) {
        rtt.add_sample(Seconds(0.05));
    }
    
    EXPECT_NEAR(rtt.estimated_rtt().count(), 0.05, 1e-6);
    EXPECT_NEAR(rtt.dev_rtt().count(), 0.0, 1e-6);
    EXPECT_NEAR(rtt.timeout_interval().count(), 0.05, 1e-5);
}

TEST(RttEstimatorTest, NoFloorOnTimeout) {
    RttEstimator rtt;
    
    for (int i = 0; i < 300; ++i) {
        rtt.add_sample(Seconds(0.001));
    }
    
    EXPECT_LT(rtt.timeout_interval().count(), 0.01);
}

TEST(RttEstimatorTest, FixedTimeoutIgnoresSamples) {
    RttEstimator rtt(Seconds(2.0));
    
    EXPECT_TRUE(rtt.is_fixed());
    EXPECT_DOUBLE_EQ(rtt.timeout_interval().count(), 2.0);
    
    rtt.add_sample(Seconds(0.01));
    rtt.add_sample(Seconds(0.01));
    
    EXPECT_DOUBLE_EQ(rtt.timeout_interval().count(), 2.0);
    EXPECT_LT(rtt.estimated_rtt().count(), 0.5);
}
