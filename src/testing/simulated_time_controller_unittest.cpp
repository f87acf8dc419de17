#include "testing/simulated_time_controller.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

namespace xferstat {
namespace test {
namespace {

constexpr Timestamp kStartTime = Timestamp::Seconds(1000);
    
} // namespace

MY_TEST(SimulatedTimeControllerTest, ClockFollowsAdvancedTime) {
    SimulatedTimeController time_controller(kStartTime);
    EXPECT_EQ(time_controller.GetClock()->CurrentTime(), kStartTime);
    time_controller.AdvanceTime(TimeDelta::Millis(1500));
    EXPECT_EQ(time_controller.CurrentTime(), kStartTime + TimeDelta::Millis(1500));
    EXPECT_EQ(time_controller.GetClock()->CurrentTime(), kStartTime + TimeDelta::Millis(1500));
}

MY_TEST(SimulatedTimeControllerTest, DelayedTaskRunOnTime) {
    SimulatedTimeController time_controller(kStartTime);
    auto task_queue = time_controller.CreateTaskQueue();

    Timestamp executed_at = Timestamp::MinusInfinity();
    task_queue->PostDelayed(TimeDelta::Millis(10), ToQueuedTask([&](){
        EXPECT_TRUE(task_queue->IsCurrent());
        executed_at = time_controller.GetClock()->CurrentTime();
    }));

    time_controller.AdvanceTime(TimeDelta::Zero());
    EXPECT_TRUE(executed_at.IsMinusInfinity());

    time_controller.AdvanceTime(TimeDelta::Millis(10));
    EXPECT_EQ(executed_at, kStartTime + TimeDelta::Millis(10));
}

MY_TEST(SimulatedTimeControllerTest, PostedTaskRunsOnNextAdvance) {
    SimulatedTimeController time_controller(kStartTime);
    auto task_queue = time_controller.CreateTaskQueue();
    int counter = 0;
    task_queue->Post(ToQueuedTask([&](){ ++counter; }));
    EXPECT_EQ(counter, 0);
    time_controller.AdvanceTime(TimeDelta::Zero());
    EXPECT_EQ(counter, 1);
}

} // namespace test
} // namespace xferstat
