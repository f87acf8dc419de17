#include "xfer/base/task_utils/repeating_task.hpp"
#include "xfer/base/task_utils/task_queue.hpp"
#include "xfer/base/synchronization/event.hpp"
#include "testing/simulated_time_controller.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

#include <atomic>
#include <thread>
#include <vector>

namespace xferstat {
namespace test {
namespace {

constexpr Timestamp kStartTime = Timestamp::Seconds(1000);
    
} // namespace

MY_TEST(RepeatingTaskTest, StopsWhenClosureReturnsZero) {
    SimulatedTimeController time_controller(kStartTime);
    auto task_queue = time_controller.CreateTaskQueue();
    int counter = 0;
    auto repeating_task = RepeatingTask::Start(time_controller.GetClock(), task_queue.get(), [&](){
        if (counter == 5) {
            return TimeDelta::Zero();
        }
        ++counter;
        return TimeDelta::Seconds(1);
    }, TimeDelta::Seconds(1));
    EXPECT_EQ(counter, 0);
    EXPECT_TRUE(repeating_task->Running());
    time_controller.AdvanceTime(TimeDelta::Seconds(10));
    EXPECT_EQ(counter, 5);
    EXPECT_FALSE(repeating_task->Running());
}

MY_TEST(RepeatingTaskTest, RunsAtTheReturnedInterval) {
    SimulatedTimeController time_controller(kStartTime);
    auto task_queue = time_controller.CreateTaskQueue();
    std::vector<Timestamp> run_times;
    auto repeating_task = RepeatingTask::Start(time_controller.GetClock(), task_queue.get(), [&](){
        run_times.push_back(time_controller.CurrentTime());
        return TimeDelta::Millis(300);
    });
    time_controller.AdvanceTime(TimeDelta::Millis(1000));
    ASSERT_EQ(run_times.size(), 4u);
    EXPECT_EQ(run_times[0], kStartTime);
    EXPECT_EQ(run_times[3], kStartTime + TimeDelta::Millis(900));
}

MY_TEST(RepeatingTaskTest, SlowRunDoesNotShiftTheSchedule) {
    SimulatedTimeController time_controller(kStartTime);
    auto task_queue = time_controller.CreateTaskQueue();
    std::vector<Timestamp> run_times;
    auto repeating_task = RepeatingTask::Start(time_controller.GetClock(), task_queue.get(), [&](){
        run_times.push_back(time_controller.CurrentTime());
        // Each run takes 100 ms.
        time_controller.GetClock()->AdvanceTime(TimeDelta::Millis(100));
        return TimeDelta::Seconds(1);
    });
    time_controller.AdvanceTime(TimeDelta::Millis(2500));
    ASSERT_EQ(run_times.size(), 3u);
    EXPECT_EQ(run_times[1], kStartTime + TimeDelta::Seconds(1));
    EXPECT_EQ(run_times[2], kStartTime + TimeDelta::Seconds(2));
}

MY_TEST(RepeatingTaskTest, NoRunAfterStop) {
    SimulatedTimeController time_controller(kStartTime);
    auto task_queue = time_controller.CreateTaskQueue();
    int counter = 0;
    auto repeating_task = RepeatingTask::Start(time_controller.GetClock(), task_queue.get(), [&](){
        ++counter;
        return TimeDelta::Millis(5);
    });
    time_controller.AdvanceTime(TimeDelta::Millis(12));
    EXPECT_EQ(counter, 3);

    repeating_task->Stop();
    EXPECT_FALSE(repeating_task->Running());
    time_controller.AdvanceTime(TimeDelta::Millis(50));
    EXPECT_EQ(counter, 3);
}

MY_TEST(RepeatingTaskTest, ClosureCanStopItsOwnTask) {
    SimulatedTimeController time_controller(kStartTime);
    auto task_queue = time_controller.CreateTaskQueue();
    int counter = 0;
    std::unique_ptr<RepeatingTask> repeating_task;
    repeating_task = RepeatingTask::Start(time_controller.GetClock(), task_queue.get(), [&](){
        ++counter;
        repeating_task->Stop();
        return TimeDelta::Millis(2);
    });
    time_controller.AdvanceTime(TimeDelta::Millis(10));
    EXPECT_EQ(counter, 1);
}

MY_TEST(RepeatingTaskTest, StopFromAnotherThreadWaitsForTheRunningClosure) {
    auto clock = Clock::GetRealTimeClock();
    TaskQueue task_queue("StopFromAnotherThreadWaitsForTheRunningClosure");
    Event entered;
    std::atomic<bool> in_closure(false);
    std::atomic<int> counter(0);
    auto repeating_task = RepeatingTask::Start(clock.get(), task_queue.Get(), [&](){
        in_closure = true;
        entered.Set();
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        ++counter;
        in_closure = false;
        return TimeDelta::Millis(1);
    });
    ASSERT_TRUE(entered.Wait(TimeDelta::Seconds(5)));
    repeating_task->Stop();
    EXPECT_FALSE(in_closure.load());
    const int counter_after_stop = counter.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(counter.load(), counter_after_stop);
}
    
} // namespace test
} // namespace xferstat
