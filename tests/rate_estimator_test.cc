#include <core/transfer/rate_estimator.h>
#include <gtest/gtest.h>

using namespace streamfetch::core;

TEST(RateEstimatorTest, FirstSampleUsesCumulativeOverElapsed) {
    RateEstimator estimator;
    auto sample = estimator.Sample(2.0, 1000);
    EXPECT_DOUBLE_EQ(sample.instantaneous, 500.0);
    EXPECT_DOUBLE_EQ(sample.smoothed, 500.0);
}

TEST(RateEstimatorTest, FirstSampleAtTimeZeroIsFinite) {
    RateEstimator estimator;
    auto sample = estimator.Sample(0.0, 10);
    EXPECT_DOUBLE_EQ(sample.instantaneous, 10.0 / transfer::kRateEpsilon);
}

TEST(RateEstimatorTest, InstantaneousComparesAgainstNewestSample) {
    RateEstimator estimator;
    estimator.Sample(1.0, 100);
    auto sample = estimator.Sample(1.5, 600);
    EXPECT_DOUBLE_EQ(sample.instantaneous, 1000.0);
}

TEST(RateEstimatorTest, ZeroIntervalGivesZeroInstantaneous) {
    RateEstimator estimator;
    estimator.Sample(1.0, 100);
    auto sample = estimator.Sample(1.0, 200);
    EXPECT_DOUBLE_EQ(sample.instantaneous, 0.0);
}

TEST(RateEstimatorTest, SmoothedIsMeanOfIntervalRates) {
    RateEstimator estimator;
    estimator.Sample(1.0, 0);
    estimator.Sample(2.0, 100);                // 100 B/s
    auto sample = estimator.Sample(3.0, 400);  // 300 B/s
    EXPECT_DOUBLE_EQ(sample.instantaneous, 300.0);
    EXPECT_DOUBLE_EQ(sample.smoothed, 200.0);
}

TEST(RateEstimatorTest, SmoothedSkipsZeroLengthIntervals) {
    RateEstimator estimator;
    estimator.Sample(1.0, 0);
    estimator.Sample(2.0, 100);
    auto sample = estimator.Sample(2.0, 150);
    EXPECT_DOUBLE_EQ(sample.instantaneous, 0.0);
    EXPECT_DOUBLE_EQ(sample.smoothed, 100.0);
}

TEST(RateEstimatorTest, SmoothedFallsBackWhenNoUsableInterval) {
    RateEstimator estimator;
    estimator.Sample(1.0, 100);
    auto sample = estimator.Sample(1.0, 100);
    EXPECT_DOUBLE_EQ(sample.smoothed, sample.instantaneous);
}

TEST(RateEstimatorTest, WindowIsBoundedAndEvictsOldest) {
    RateEstimator estimator;
    // 1000 B/s for the first 20 seconds, then 2000 B/s
    std::uint64_t bytes = 0;
    for (int i = 0; i <= 20; ++i) {
        estimator.Sample(static_cast<double>(i), bytes);
        bytes += 1000;
    }
    EXPECT_EQ(estimator.size(), transfer::kRateWindowCapacity);

    bytes -= 1000;
    RateSample sample;
    for (int i = 21; i <= 40; ++i) {
        bytes += 2000;
        sample = estimator.Sample(static_cast<double>(i), bytes);
        EXPECT_LE(estimator.size(), transfer::kRateWindowCapacity);
    }
    // Every retained interval is from the faster phase
    EXPECT_DOUBLE_EQ(sample.smoothed, 2000.0);
}

TEST(RateEstimatorTest, CapacityIsAtLeastOne) {
    RateEstimator estimator(0);
    EXPECT_EQ(estimator.capacity(), 1u);
    estimator.Sample(1.0, 10);
    estimator.Sample(2.0, 20);
    EXPECT_EQ(estimator.size(), 1u);
}

TEST(RateEstimatorTest, ResetClearsWindow) {
    RateEstimator estimator;
    estimator.Sample(1.0, 10);
    estimator.Reset();
    EXPECT_EQ(estimator.size(), 0u);
    EXPECT_DOUBLE_EQ(estimator.Sample(2.0, 100).instantaneous, 50.0);
}

TEST(RateEstimatorTest, EtaFromSmoothedRate) {
    auto eta = RateEstimator::EstimateEta(1000, 500, 100.0);
    ASSERT_TRUE(eta.has_value());
    EXPECT_EQ(std::chrono::duration_cast<std::chrono::milliseconds>(*eta).count(), 5000);
}

TEST(RateEstimatorTest, EtaAbsentWithoutTotalOrRate) {
    EXPECT_FALSE(RateEstimator::EstimateEta(std::nullopt, 500, 100.0).has_value());
    EXPECT_FALSE(RateEstimator::EstimateEta(1000, 500, 0.0).has_value());
    EXPECT_FALSE(RateEstimator::EstimateEta(1000, 500, transfer::kRateEpsilon / 2).has_value());
}

TEST(RateEstimatorTest, EtaClampsOvershootToZero) {
    auto eta = RateEstimator::EstimateEta(1000, 1500, 100.0);
    ASSERT_TRUE(eta.has_value());
    EXPECT_EQ(eta->count(), 0);
}
