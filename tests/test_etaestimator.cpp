#include <gtest/gtest.h>

#include "Modules/Progress/etaestimator.h"

TEST(EtaEstimatorTest, NoEstimateBeforeFirstUnit) {
    EtaEstimator estimator;
    const EtaEstimator::Estimate estimate = estimator.update(20000, 5, 10, 0);
    EXPECT_FALSE(estimate.hasEta());
    EXPECT_FALSE(estimate.hasRate());
}

TEST(EtaEstimatorTest, NoEstimateDuringWarmup) {
    EtaEstimator estimator;
    EXPECT_FALSE(estimator.update(5000, 4, 10, 1000).hasEta());
    EXPECT_FALSE(estimator.update(60000, 1, 10, 1000).hasEta());
}

TEST(EtaEstimatorTest, LongHorizonRate) {
    EtaEstimator estimator;
    const EtaEstimator::Estimate estimate = estimator.update(61000, 60, 30, 1000);
    ASSERT_TRUE(estimate.hasEta());
    EXPECT_EQ(estimate.remainingSeconds, 30);
    EXPECT_DOUBLE_EQ(estimate.unitsPerMinute, 60.0);
}

TEST(EtaEstimatorTest, BlendsWindowRate) {
    EtaTuning tuning;
    tuning.windowMs = 100000;
    EtaEstimator estimator(tuning);

    estimator.update(11000, 10, 90, 1000);
    estimator.update(21000, 20, 80, 1000);
    // 长期 40/30s，窗口 30/20s，按 0.7/0.3 混合
    const EtaEstimator::Estimate estimate = estimator.update(31000, 40, 83, 1000);
    ASSERT_TRUE(estimate.hasEta());
    EXPECT_EQ(estimate.remainingSeconds, 60);
}

TEST(EtaEstimatorTest, ZeroRemaining) {
    EtaEstimator estimator;
    EXPECT_EQ(estimator.update(61000, 60, 0, 1000).remainingSeconds, 0);
}

TEST(EtaEstimatorTest, DropsSamplesOutsideWindow) {
    EtaEstimator estimator;
    estimator.update(1000, 1, 10, 0);
    estimator.update(20000, 2, 9, 0);
    estimator.update(40000, 3, 8, 0);
    EXPECT_EQ(estimator.sampleCount(), 2);

    estimator.reset();
    EXPECT_EQ(estimator.sampleCount(), 0);
}
