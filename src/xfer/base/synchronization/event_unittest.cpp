#include "xfer/base/synchronization/event.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

#include <chrono>
#include <thread>

namespace xferstat {
namespace test {

MY_TEST(EventTest, InitiallySignaled) {
    Event event(/*manual_reset=*/false, /*initially_signaled=*/true);
    EXPECT_TRUE(event.Wait(TimeDelta::Zero()));
    EXPECT_FALSE(event.Wait(TimeDelta::Zero()));
}

MY_TEST(EventTest, ManualResetStaysSignaled) {
    Event event(/*manual_reset=*/true);
    EXPECT_FALSE(event.Wait(TimeDelta::Zero()));

    event.Set();
    EXPECT_TRUE(event.Wait(TimeDelta::Zero()));
    EXPECT_TRUE(event.WaitForever());

    event.Reset();
    EXPECT_FALSE(event.Wait(TimeDelta::Millis(1)));
}

MY_TEST(EventTest, AutoResetReleasesOneWait) {
    Event event;
    event.Set();
    EXPECT_TRUE(event.Wait(TimeDelta::Zero()));
    EXPECT_FALSE(event.Wait(TimeDelta::Zero()));
}

MY_TEST(EventTest, TimesOutAfterTheGivenDelay) {
    Event event;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(event.Wait(TimeDelta::Millis(20)));
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(20));
}

MY_TEST(EventTest, SetFromAnotherThread) {
    Event event;
    std::thread signaler([&event](){
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        event.Set();
    });
    EXPECT_TRUE(event.Wait(TimeDelta::Seconds(5)));
    signaler.join();
}
    
} // namespace test
} // namespace xferstat
