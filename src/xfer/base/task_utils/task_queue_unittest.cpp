#include "xfer/base/task_utils/task_queue.hpp"
#include "xfer/base/synchronization/event.hpp"
#include "common/utils_time.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

#include <vector>

namespace xferstat {
namespace test {
namespace {

constexpr TimeDelta kTimeout = TimeDelta::Seconds(5);

} // namespace

MY_TEST(TaskQueueTest, PostedTaskRunsOnTheQueueThread) {
    TaskQueue task_queue("PostedTaskRunsOnTheQueueThread");
    Event done;
    bool on_queue = false;
    task_queue.Post([&](){
        on_queue = task_queue.IsCurrent();
        done.Set();
    });
    ASSERT_TRUE(done.Wait(kTimeout));
    EXPECT_TRUE(on_queue);
    EXPECT_FALSE(task_queue.IsCurrent());
    EXPECT_EQ(TaskQueueImpl::Current(), nullptr);
}

MY_TEST(TaskQueueTest, PostedTasksRunInOrder) {
    TaskQueue task_queue("PostedTasksRunInOrder");
    Event done;
    std::vector<int> order;
    for (int i = 0; i < 5; ++i) {
        task_queue.Post([&order, i](){ order.push_back(i); });
    }
    task_queue.Post([&done](){ done.Set(); });
    ASSERT_TRUE(done.Wait(kTimeout));
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

MY_TEST(TaskQueueTest, DelayedTaskWaitsForItsDelay) {
    TaskQueue task_queue("DelayedTaskWaitsForItsDelay");
    Event done;
    const int64_t start_ms = utils::time::TimeInMillis();
    task_queue.PostDelayed(TimeDelta::Millis(100), [&](){
        EXPECT_TRUE(task_queue.IsCurrent());
        done.Set();
    });
    ASSERT_TRUE(done.Wait(kTimeout));
    EXPECT_GE(utils::time::TimeInMillis() - start_ms, 100);
}

MY_TEST(TaskQueueTest, ImmediateTaskOvertakesDelayedOne) {
    TaskQueue task_queue("ImmediateTaskOvertakesDelayedOne");
    Event done;
    std::vector<int> order;
    task_queue.PostDelayed(TimeDelta::Millis(50), [&](){
        order.push_back(2);
        done.Set();
    });
    task_queue.Post([&](){ order.push_back(1); });
    ASSERT_TRUE(done.Wait(kTimeout));
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

MY_TEST(TaskQueueTest, DestroyingDropsPendingDelayedTasks) {
    bool executed = false;
    const int64_t start_ms = utils::time::TimeInMillis();
    {
        TaskQueue task_queue("DestroyingDropsPendingDelayedTasks");
        task_queue.PostDelayed(TimeDelta::Seconds(10), [&executed](){
            executed = true;
        });
    }
    EXPECT_FALSE(executed);
    EXPECT_LT(utils::time::TimeInMillis() - start_ms, 5000);
}

} // namespace test
} // namespace xferstat
