#include "base/system_time.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

namespace xferstat {
namespace test {

MY_TEST(SystemTimeTest, SystemTimeInNanos) {
    int64_t first_ns = SystemTimeInNanos();
    EXPECT_GT(first_ns, 0);
    EXPECT_GE(SystemTimeInNanos(), first_ns);
}

} // namespace test
} // namespace xferstat
