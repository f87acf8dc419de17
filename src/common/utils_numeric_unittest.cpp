#include "common/utils_numeric.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

namespace xferstat {
namespace test {

using namespace utils::numeric;

MY_TEST(NumericUtilsTest, SaturatedAdd) {
    constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
    EXPECT_EQ(saturated_add<uint64_t>(1, 2), 3u);
    EXPECT_EQ(saturated_add<uint64_t>(kMax - 1, 1), kMax);
    EXPECT_EQ(saturated_add<uint64_t>(kMax - 1, 2), kMax);
    EXPECT_EQ(saturated_add<uint64_t>(kMax, kMax), kMax);
}

MY_TEST(NumericUtilsTest, SaturatedSub) {
    EXPECT_EQ(saturated_sub<uint64_t>(5, 3), 2u);
    EXPECT_EQ(saturated_sub<uint64_t>(3, 5), 0u);
    EXPECT_EQ(saturated_sub<uint64_t>(3, 3), 0u);
}

MY_TEST(NumericUtilsTest, IsValueInRange) {
    EXPECT_TRUE((is_value_in_range<uint8_t, int>(255)));
    EXPECT_FALSE((is_value_in_range<uint8_t, int>(256)));
    EXPECT_FALSE((is_value_in_range<uint32_t, int>(-1)));
    EXPECT_FALSE((is_value_in_range<int64_t, uint64_t>(std::numeric_limits<uint64_t>::max())));
    EXPECT_TRUE((is_value_in_range<int32_t, double>(1e9)));
    EXPECT_FALSE((is_value_in_range<int32_t, double>(1e10)));
}

} // namespace test
} // namespace xferstat
