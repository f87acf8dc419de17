#include "xfer/base/numerics/windowed_exp_filter.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

#include <cmath>

namespace xferstat {
namespace test {

MY_TEST(WindowedExpFilterTest, FirstSampleIsWeightedFromZero) {
    WindowedExpFilter filter(30, 0.3);
    EXPECT_DOUBLE_EQ(filter.filtered(), 0.0);
    EXPECT_DOUBLE_EQ(filter.AddSample(100.0), 30.0);
    EXPECT_DOUBLE_EQ(filter.AddSample(100.0), 51.0);
    EXPECT_EQ(filter.num_samples(), 2u);
}

MY_TEST(WindowedExpFilterTest, WindowIsBounded) {
    WindowedExpFilter filter(30, 0.3);
    for (int i = 0; i < 35; ++i) {
        filter.AddSample(100.0);
    }
    EXPECT_EQ(filter.num_samples(), 30u);
    // 100 * (1 - 0.7^30)
    EXPECT_NEAR(filter.filtered(), 100.0 * (1.0 - std::pow(0.7, 30)), 1e-9);
    EXPECT_NEAR(filter.filtered(), 99.9977, 1e-4);
}

MY_TEST(WindowedExpFilterTest, EvictedSamplesNoLongerContribute) {
    WindowedExpFilter filter(3, 0.5);
    filter.AddSample(1000.0);
    filter.AddSample(0.0);
    filter.AddSample(0.0);
    EXPECT_DOUBLE_EQ(filter.filtered(), 125.0);
    filter.AddSample(0.0);
    EXPECT_DOUBLE_EQ(filter.filtered(), 0.0);
}

MY_TEST(WindowedExpFilterTest, Reset) {
    WindowedExpFilter filter(5, 0.3);
    filter.AddSample(10.0);
    filter.Reset();
    EXPECT_EQ(filter.num_samples(), 0u);
    EXPECT_DOUBLE_EQ(filter.filtered(), 0.0);
}

} // namespace test
} // namespace xferstat
