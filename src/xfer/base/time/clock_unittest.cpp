#include "xfer/base/time/clock.hpp"
#include "xfer/base/time/clock_simulated.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

#include <thread>

namespace xferstat {
namespace test {

MY_TEST(ClockTest, RealTimeClockNeverGoesBackwards) {
    auto clock = Clock::GetRealTimeClock();
    ASSERT_NE(clock, nullptr);

    Timestamp first = clock->CurrentTime();
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    Timestamp second = clock->CurrentTime();
    EXPECT_GE(second - first, TimeDelta::Millis(5));
}

MY_TEST(ClockTest, SimulatedClockOnlyMovesWhenAdvanced) {
    SimulatedClock clock(Timestamp::Seconds(1000));
    EXPECT_EQ(clock.CurrentTime(), Timestamp::Seconds(1000));
    EXPECT_EQ(clock.CurrentTime(), Timestamp::Seconds(1000));

    clock.AdvanceTime(TimeDelta::Millis(1500));
    EXPECT_EQ(clock.CurrentTime(), Timestamp::Millis(1'001'500));

    clock.AdvanceTime(TimeDelta::Micros(250));
    clock.AdvanceTime(TimeDelta::Zero());
    EXPECT_EQ(clock.CurrentTime(), Timestamp::Micros(1'001'500'250));
}

} // namespace test
} // namespace xferstat
