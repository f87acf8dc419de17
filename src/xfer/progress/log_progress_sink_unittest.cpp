#include "xfer/progress/log_progress_sink.hpp"
#include "common/logger.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

#include <stdexcept>
#include <vector>

using ::testing::HasSubstr;

namespace xferstat {
namespace test {

MY_TEST(LogProgressSinkTest, WritesProgressLineToLog) {
    std::vector<std::string> messages;
    logging::InitLogger(logging::Level::INFO, [&messages](logging::Level level, std::string message){
        if (level == logging::Level::INFO) {
            messages.push_back(std::move(message));
        }
        return true;
    });

    ProgressReport report;
    report.percent_complete = 50.0;
    report.eta_seconds = 125;
    report.total_bytes = 1536;
    report.elapsed_seconds = 65;
    report.speed_bytes_per_sec = 2048;

    LogProgressSink sink;
    sink.OnTransferProgress(report);

    // Mute the logger before `messages` goes out of scope.
    logging::InitLogger(logging::Level::NONE, [](logging::Level, std::string){ return true; });

    ASSERT_EQ(messages.size(), 1u);
    EXPECT_THAT(messages[0], HasSubstr(report.ToString()));
}

MY_TEST(CallbackProgressSinkTest, ForwardsReports) {
    std::vector<ProgressReport> reports;
    CallbackProgressSink sink([&reports](const ProgressReport& report){
        reports.push_back(report);
    });
    ProgressReport report;
    report.percent_complete = 42.0;
    report.stalled = true;
    sink.OnTransferProgress(report);
    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].percent_complete, 42.0);
    EXPECT_TRUE(reports[0].stalled);
}

MY_TEST(CallbackProgressSinkTest, RejectsEmptyCallback) {
    EXPECT_THROW(CallbackProgressSink sink(nullptr), std::invalid_argument);
}

} // namespace test
} // namespace xferstat
