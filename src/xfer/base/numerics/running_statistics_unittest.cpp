#include "xfer/base/numerics/running_statistics.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <vector>

namespace xferstat {
namespace test {
namespace {

// Uniform samples in [low, high), seeded so a failure can be replayed.
RunningStatistics<double> UniformSamples(int count, double low, double high) {
    std::mt19937 gen(1234);
    std::uniform_real_distribution<double> uniform(low, high);
    RunningStatistics<double> stats;
    for (int i = 0; i < count; ++i) {
        stats.AddSample(uniform(gen));
    }
    return stats;
}
    
} // namespace

MY_TEST(RunningStatisticsTest, NoValueBeforeFirstSample) {
    RunningStatistics<double> stats;
    EXPECT_EQ(stats.sample_count(), 0);
    EXPECT_EQ(stats.cumulated_variance(), 0.0);
    EXPECT_FALSE(stats.mean());
    EXPECT_FALSE(stats.Variance());
    EXPECT_FALSE(stats.StandardDeviation());
}

MY_TEST(RunningStatisticsTest, MeanDoesNotDependOnOrder) {
    std::vector<double> ratios;
    for (int i = 0; i < 64; ++i) {
        ratios.push_back(0.25 * i);
    }
    RunningStatistics<double> ascending;
    for (double ratio : ratios) {
        ascending.AddSample(ratio);
    }
    std::reverse(ratios.begin(), ratios.end());
    RunningStatistics<double> descending;
    for (double ratio : ratios) {
        descending.AddSample(ratio);
    }
    EXPECT_EQ(ascending.sample_count(), 64);
    EXPECT_NEAR(*ascending.mean(), 7.875, 1e-12);
    EXPECT_NEAR(*descending.mean(), *ascending.mean(), 1e-12);
    EXPECT_NEAR(*descending.Variance(), *ascending.Variance(), 1e-9);
}

MY_TEST(RunningStatisticsTest, PopulationVariance) {
    // Integer samples are converted to double.
    RunningStatistics<int> stats;
    for (int sample : {4, 0, 4, 8}) {
        stats.AddSample(sample);
    }
    EXPECT_DOUBLE_EQ(*stats.mean(), 4.0);
    EXPECT_DOUBLE_EQ(stats.cumulated_variance(), 32.0);
    EXPECT_DOUBLE_EQ(*stats.Variance(), 8.0);
    EXPECT_DOUBLE_EQ(*stats.StandardDeviation(), std::sqrt(8.0));
}

MY_TEST(RunningStatisticsTest, ConstantSamplesHaveNoDeviation) {
    RunningStatistics<double> stats;
    for (int i = 0; i < 10; ++i) {
        stats.AddSample(0.5);
    }
    EXPECT_DOUBLE_EQ(*stats.mean(), 0.5);
    EXPECT_NEAR(*stats.StandardDeviation(), 0.0, 1e-12);
}

MY_TEST(RunningStatisticsTest, SkippedSamplesCountAsZero) {
    RunningStatistics<double> stats;
    // The first sample was skipped by the caller.
    stats.AddSample(0.5, 2);
    EXPECT_EQ(stats.sample_count(), 2);
    EXPECT_DOUBLE_EQ(*stats.mean(), 0.25);
    EXPECT_DOUBLE_EQ(stats.cumulated_variance(), 0.125);
    EXPECT_DOUBLE_EQ(*stats.StandardDeviation(), 0.25);

    stats.AddSample(0.25, 3);
    EXPECT_EQ(stats.sample_count(), 3);
    EXPECT_DOUBLE_EQ(*stats.mean(), 0.25);
}

MY_TEST(RunningStatisticsTest, UniformVarianceIsOneTwelfth) {
    auto stats = UniformSamples(200000, 0.0, 1.0);
    EXPECT_NEAR(*stats.mean(), 0.5, 1e-2);
    EXPECT_NEAR(*stats.Variance(), 1.0 / 12, 1e-3);
}

MY_TEST(RunningStatisticsTest, StableWithLargeOffset) {
    auto stats = UniformSamples(200000, 1e9, 1e9 + 1);
    EXPECT_NEAR(*stats.Variance(), 1.0 / 12, 1e-3);
}
 
} // namespace test
} // namespace xferstat
