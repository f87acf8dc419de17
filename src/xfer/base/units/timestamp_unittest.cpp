#include "xfer/base/units/timestamp.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

namespace xferstat {
namespace test {

MY_TEST(TimestampTest, ConvertsBetweenResolutions) {
    constexpr Timestamp kStart = Timestamp::Seconds(1000);
    static_assert(kStart.ms() == 1'000'000, "");
    static_assert(kStart.us() == 1'000'000'000, "");

    EXPECT_EQ(Timestamp::Millis(1500).seconds(), 2);
    EXPECT_EQ(Timestamp::Micros(1'234'567).ms(), 1235);
    EXPECT_DOUBLE_EQ(Timestamp::Micros(1'500'000).seconds<double>(), 1.5);
}

MY_TEST(TimestampTest, DifferenceIsTimeDelta) {
    const Timestamp earlier = Timestamp::Millis(267);
    const Timestamp later = Timestamp::Millis(450);
    EXPECT_EQ(later - earlier, TimeDelta::Millis(183));
    EXPECT_EQ(earlier - later, TimeDelta::Millis(-183));
    EXPECT_EQ(earlier + TimeDelta::Millis(183), later);
    EXPECT_EQ(later - TimeDelta::Millis(183), earlier);
    EXPECT_LT(earlier, later);
}

MY_TEST(TimestampTest, InfinityAbsorbsFiniteValues) {
    const Timestamp finite = Timestamp::Seconds(5);
    EXPECT_TRUE(Timestamp::PlusInfinity().IsInfinite());
    EXPECT_TRUE(finite.IsFinite());
    EXPECT_TRUE((finite + TimeDelta::PlusInfinity()).IsPlusInfinity());
    EXPECT_TRUE((Timestamp::MinusInfinity() + TimeDelta::Seconds(1)).IsMinusInfinity());
    EXPECT_TRUE((Timestamp::PlusInfinity() - finite).IsPlusInfinity());
    EXPECT_TRUE((finite - Timestamp::MinusInfinity()).IsPlusInfinity());
}
    
} // namespace test
} // namespace xferstat
