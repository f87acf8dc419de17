#include "xfer/progress/progress_report.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

namespace xferstat {
namespace test {

MY_TEST(ProgressReportTest, FormatBytes) {
    using utils::progress::FormatBytes;
    EXPECT_EQ(FormatBytes(0), "0.0 B");
    EXPECT_EQ(FormatBytes(512), "512.0 B");
    EXPECT_EQ(FormatBytes(1536), "1.5 KB");
    EXPECT_EQ(FormatBytes(1024 * 1024), "1.0 MB");
    EXPECT_EQ(FormatBytes(3.3 * 1024 * 1024 * 1024), "3.3 GB");
    EXPECT_EQ(FormatBytes(2048.0 * 1024 * 1024 * 1024 * 1024), "2048.0 TB");
}

MY_TEST(ProgressReportTest, FormatEta) {
    using utils::progress::FormatEta;
    EXPECT_EQ(FormatEta(0), "0sec");
    EXPECT_EQ(FormatEta(42), "42sec");
    EXPECT_EQ(FormatEta(125), "2min");
    EXPECT_EQ(FormatEta(3725), "1h2min");
    EXPECT_EQ(FormatEta(7200), "2h0min");
}

MY_TEST(ProgressReportTest, FormatElapsed) {
    using utils::progress::FormatElapsed;
    EXPECT_EQ(FormatElapsed(0), "00:00:00");
    EXPECT_EQ(FormatElapsed(3725), "01:02:05");
    EXPECT_EQ(FormatElapsed(100 * 3600), "100:00:00");
}

MY_TEST(ProgressReportTest, ProgressLine) {
    ProgressReport report;
    report.percent_complete = 50.0;
    report.eta_seconds = 125;
    report.total_bytes = 1536;
    report.elapsed_seconds = 65;
    report.speed_bytes_per_sec = 2048;
    report.stalled = false;
    EXPECT_EQ(report.ToString(), 
              "1.5 KB 00:01:05 [2.0 KB/s] [" + std::string(20, '=') + std::string(20, ' ') + "] 50% ETA 2min");
}

MY_TEST(ProgressReportTest, StalledProgressLine) {
    ProgressReport report;
    report.percent_complete = 12.5;
    report.eta_seconds = 3600;
    report.total_bytes = 100;
    report.elapsed_seconds = 30;
    report.speed_bytes_per_sec = 50.0;
    report.stalled = true;
    EXPECT_EQ(report.ToString(), 
              "100.0 B 00:00:30 [0.0 B/s] [" + std::string(5, '=') + std::string(35, ' ') + "] 12% ETA Stalled!");
}

MY_TEST(ProgressReportTest, CompletedProgressLine) {
    ProgressReport report;
    report.percent_complete = 100.0;
    report.total_bytes = 10 * 1024 * 1024;
    report.elapsed_seconds = 3600;
    report.speed_bytes_per_sec = 1024 * 1024;
    EXPECT_EQ(report.ToString(), 
              "10.0 MB 01:00:00 [1.0 MB/s] [" + std::string(40, '=') + "] 100% ETA 0sec");
}

} // namespace test
} // namespace xferstat
