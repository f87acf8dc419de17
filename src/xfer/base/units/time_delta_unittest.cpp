#include "xfer/base/units/time_delta.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

#include <limits>

namespace xferstat {
namespace test {

MY_TEST(TimeDeltaTest, ConstructedAtCompileTime) {
    constexpr TimeDelta kInterval = TimeDelta::Seconds(3);
    static_assert(kInterval.ms() == 3000, "");
    static_assert(kInterval > TimeDelta::Zero(), "");
    static_assert(TimeDelta::Zero().IsZero(), "");
    static_assert(TimeDelta::PlusInfinity().IsPlusInfinity(), "");
    static_assert(TimeDelta::PlusInfinity() > kInterval, "");
}

MY_TEST(TimeDeltaTest, ConvertsBetweenResolutions) {
    EXPECT_EQ(TimeDelta::Seconds(5).us(), 5'000'000);
    EXPECT_EQ(TimeDelta::Millis(-250).us(), -250'000);
    EXPECT_EQ(TimeDelta::Micros(2'500'000).seconds(), 3);
    EXPECT_EQ(TimeDelta::Micros(-1'500).ms(), -2);
    EXPECT_EQ(TimeDelta::Micros(1'499).ms(), 1);
    EXPECT_EQ(TimeDelta::Seconds(uint64_t{7}).ms(), 7000);
}

MY_TEST(TimeDeltaTest, ConvertsToAndFromDouble) {
    EXPECT_DOUBLE_EQ(TimeDelta::Micros(17017).seconds<double>(), 0.017017);
    EXPECT_DOUBLE_EQ(TimeDelta::Micros(17017).ms<double>(), 17.017);
    EXPECT_EQ(TimeDelta::Seconds(0.017017).us(), 17017);
    EXPECT_EQ(TimeDelta::Millis(2.5).us(), 2500);

    const double kInf = std::numeric_limits<double>::infinity();
    EXPECT_EQ(TimeDelta::PlusInfinity().seconds<double>(), kInf);
    EXPECT_EQ(TimeDelta::MinusInfinity().ms<double>(), -kInf);
    EXPECT_TRUE(TimeDelta::Seconds(kInf).IsPlusInfinity());
    EXPECT_TRUE(TimeDelta::Millis(-kInf).IsMinusInfinity());
}

MY_TEST(TimeDeltaTest, Arithmetic) {
    const TimeDelta a = TimeDelta::Millis(267);
    const TimeDelta b = TimeDelta::Millis(450);
    EXPECT_EQ(a + b, TimeDelta::Millis(717));
    EXPECT_EQ(a - b, TimeDelta::Millis(-183));
    EXPECT_EQ(b * 2, TimeDelta::Millis(900));
    EXPECT_EQ(b * int64_t{3}, TimeDelta::Millis(1350));
    EXPECT_EQ(b * 0.5, TimeDelta::Millis(225));

    TimeDelta sum = TimeDelta::Zero();
    sum += a;
    sum += b;
    EXPECT_EQ(sum, a + b);
}

MY_TEST(TimeDeltaTest, InfinityAbsorbsFiniteValues) {
    const TimeDelta finite = TimeDelta::Seconds(30);
    EXPECT_TRUE((TimeDelta::PlusInfinity() + finite).IsPlusInfinity());
    EXPECT_TRUE((finite - TimeDelta::MinusInfinity()).IsPlusInfinity());
    EXPECT_TRUE((finite - TimeDelta::PlusInfinity()).IsMinusInfinity());
    EXPECT_TRUE((TimeDelta::PlusInfinity() * 2).IsPlusInfinity());

    TimeDelta accumulated = finite;
    accumulated += TimeDelta::PlusInfinity();
    EXPECT_TRUE(accumulated.IsInfinite());
    EXPECT_FALSE(accumulated.IsFinite());
}
    
} // namespace test    
} // namespace xferstat
