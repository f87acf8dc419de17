#include "xfer/progress/transfer_progress_estimator.hpp"
#include "xfer/base/time/clock_simulated.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

#include <atomic>
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>
#include <thread>

namespace xferstat {
namespace test {
namespace {

constexpr Timestamp kStartTime = Timestamp::Seconds(1000);
constexpr uint64_t kNewFileBytes = 1000;

DeltaStats CreateDeltaStats(uint64_t new_file_bytes, uint64_t raw_delta_size, uint64_t changed_file_bytes = 0) {
    DeltaStats stats;
    stats.new_file_bytes = new_file_bytes;
    stats.changed_file_bytes = changed_file_bytes;
    stats.raw_delta_size = raw_delta_size;
    return stats;
}

ProgressConfiguration CreateProgressConfiguration(TimeDelta reporting_interval = TimeDelta::Seconds(1)) {
    ProgressConfiguration config;
    config.enabled = true;
    config.reporting_interval = reporting_interval;
    return config;
}
    
} // namespace

class T(TransferProgressEstimatorTest) : public ::testing::Test {
public:
    T(TransferProgressEstimatorTest)() 
        : clock_(kStartTime),
          estimator_(CreateProgressConfiguration(), &clock_) {}

    void AdvanceTime(TimeDelta delta) {
        clock_.AdvanceTime(delta);
    }

protected:
    SimulatedClock clock_;
    TransferProgressEstimator estimator_;
};

MY_TEST_F(TransferProgressEstimatorTest, NoReportWithoutEvidence) {
    EXPECT_FALSE(estimator_.HasEvidence());
    EXPECT_FALSE(estimator_.Tick(CreateDeltaStats(500, 500)).has_value());
    EXPECT_EQ(estimator_.sample_count(), 0);
    EXPECT_EQ(estimator_.TotalElapsedSeconds(), 0u);
}

MY_TEST_F(TransferProgressEstimatorTest, NoReportWhenDisabled) {
    ProgressConfiguration config = CreateProgressConfiguration();
    config.enabled = false;
    TransferProgressEstimator estimator(config, &clock_);
    EXPECT_TRUE(estimator.SetEvidence(kNewFileBytes, 0));
    EXPECT_FALSE(estimator.Tick(CreateDeltaStats(500, 500)).has_value());
    EXPECT_EQ(estimator.sample_count(), 0);
}

MY_TEST_F(TransferProgressEstimatorTest, EvidenceIsWrittenOnce) {
    EXPECT_TRUE(estimator_.SetEvidence(kNewFileBytes, 0));
    EXPECT_TRUE(estimator_.HasEvidence());
    // Ignored, the progress is still relative to the first evidence.
    EXPECT_FALSE(estimator_.SetEvidence(10 * kNewFileBytes, 0));

    estimator_.RecordBytesWritten(500);
    auto report = estimator_.Tick(CreateDeltaStats(500, 500));
    ASSERT_TRUE(report.has_value());
    EXPECT_NEAR(report->percent_complete, 50.0, 1e-9);
}

MY_TEST_F(TransferProgressEstimatorTest, WrittenBytesTelescope) {
    estimator_.RecordBytesWritten(100);
    estimator_.RecordBytesWritten(250);
    estimator_.RecordBytesWritten(250);
    estimator_.RecordBytesWritten(400);
    EXPECT_EQ(estimator_.cumulative_bytes_written(), 400u);

    // A new volume restarts from zero, the bytes of its first report are lost.
    estimator_.RecordBytesWritten(50);
    EXPECT_EQ(estimator_.cumulative_bytes_written(), 400u);
    estimator_.RecordBytesWritten(150);
    EXPECT_EQ(estimator_.cumulative_bytes_written(), 500u);
}

MY_TEST_F(TransferProgressEstimatorTest, WrittenBytesSaturate) {
    const uint64_t kMaxBytes = std::numeric_limits<uint64_t>::max();
    estimator_.RecordBytesWritten(kMaxBytes - 10);
    estimator_.RecordBytesWritten(0);
    estimator_.RecordBytesWritten(100);
    EXPECT_EQ(estimator_.cumulative_bytes_written(), kMaxBytes);
}

MY_TEST_F(TransferProgressEstimatorTest, NoChangesLeaveStateUntouched) {
    ASSERT_TRUE(estimator_.SetEvidence(kNewFileBytes, 0));
    EXPECT_FALSE(estimator_.Tick(CreateDeltaStats(0, 0)).has_value());
    EXPECT_EQ(estimator_.sample_count(), 0);
    EXPECT_EQ(estimator_.progress_fraction(), 0.0);
    EXPECT_EQ(estimator_.num_rate_samples(), 0u);
}

MY_TEST_F(TransferProgressEstimatorTest, NoReportWithEmptyEvidence) {
    ASSERT_TRUE(estimator_.SetEvidence(0, 0));
    EXPECT_FALSE(estimator_.Tick(CreateDeltaStats(500, 500)).has_value());
    EXPECT_EQ(estimator_.sample_count(), 0);
}

MY_TEST_F(TransferProgressEstimatorTest, EstimatesProgressEtaAndSpeed) {
    ASSERT_TRUE(estimator_.SetEvidence(kNewFileBytes, 0));

    estimator_.RecordBytesWritten(400);
    auto report = estimator_.Tick(CreateDeltaStats(500, 500));
    ASSERT_TRUE(report.has_value());
    // change ratio 1.0, compress ratio 0.8, half of the data processed.
    EXPECT_NEAR(report->percent_complete, 40.0, 1e-9);
    EXPECT_EQ(report->eta_seconds, 0u);
    EXPECT_EQ(report->total_bytes, 400u);
    EXPECT_EQ(report->elapsed_seconds, 0u);
    EXPECT_EQ(report->speed_bytes_per_sec, 0.0);
    EXPECT_FALSE(report->stalled);
    EXPECT_EQ(estimator_.num_rate_samples(), 0u);

    AdvanceTime(TimeDelta::Seconds(10));
    estimator_.RecordBytesWritten(800);
    report = estimator_.Tick(CreateDeltaStats(1000, 1000));
    ASSERT_TRUE(report.has_value());
    EXPECT_NEAR(report->percent_complete, 80.0, 1e-9);
    // (1 - 0.8) / 0.8 * 10s
    EXPECT_EQ(report->eta_seconds, 2u);
    EXPECT_EQ(report->total_bytes, 800u);
    EXPECT_EQ(report->elapsed_seconds, 10u);
    // 400 bytes in 10s, weighted by 0.3.
    EXPECT_NEAR(report->speed_bytes_per_sec, 12.0, 1e-9);
    EXPECT_EQ(estimator_.sample_count(), 2);
    EXPECT_EQ(estimator_.accumulated_elapsed(), TimeDelta::Seconds(10));
    EXPECT_NEAR(estimator_.change_ratio_mean(), 1.0, 1e-12);
    EXPECT_NEAR(estimator_.compress_ratio_mean(), 0.8, 1e-12);
}

MY_TEST_F(TransferProgressEstimatorTest, ConstantRatioHasNoDeviation) {
    ASSERT_TRUE(estimator_.SetEvidence(kNewFileBytes, 0));
    for (int i = 1; i <= 10; ++i) {
        AdvanceTime(TimeDelta::Seconds(1));
        estimator_.RecordBytesWritten(10 * i);
        ASSERT_TRUE(estimator_.Tick(CreateDeltaStats(0, 20 * i, 40 * i)).has_value());
    }
    EXPECT_EQ(estimator_.sample_count(), 10);
    EXPECT_NEAR(estimator_.change_ratio_mean(), 0.5, 1e-12);
    EXPECT_NEAR(estimator_.change_ratio_sigma(), 0.0, 1e-9);
    EXPECT_NEAR(estimator_.compress_ratio_mean(), 0.5, 1e-12);
    EXPECT_NEAR(estimator_.compress_ratio_sigma(), 0.0, 1e-9);
}

MY_TEST_F(TransferProgressEstimatorTest, CompressRatioSkippedWithoutDelta) {
    ASSERT_TRUE(estimator_.SetEvidence(kNewFileBytes, 0));
    estimator_.RecordBytesWritten(100);
    auto report = estimator_.Tick(CreateDeltaStats(100, 0));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(estimator_.sample_count(), 1);
    EXPECT_EQ(estimator_.change_ratio_mean(), 0.0);
    EXPECT_EQ(estimator_.compress_ratio_mean(), 0.0);
    EXPECT_EQ(report->percent_complete, 0.0);
}

MY_TEST_F(TransferProgressEstimatorTest, RatioStatisticsCountEveryTick) {
    ASSERT_TRUE(estimator_.SetEvidence(kNewFileBytes, 0));
    ASSERT_TRUE(estimator_.Tick(CreateDeltaStats(100, 0)).has_value());
    AdvanceTime(TimeDelta::Seconds(1));
    estimator_.RecordBytesWritten(200);
    auto report = estimator_.Tick(CreateDeltaStats(400, 400));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(estimator_.sample_count(), 2);
    // Change ratios 0 and 1.
    EXPECT_NEAR(estimator_.change_ratio_mean(), 0.5, 1e-12);
    EXPECT_NEAR(estimator_.change_ratio_sigma(), 0.5, 1e-12);
    // A single compress ratio of 0.5, averaged over both ticks.
    EXPECT_NEAR(estimator_.compress_ratio_mean(), 0.25, 1e-12);
    EXPECT_NEAR(estimator_.compress_ratio_sigma(), 0.25, 1e-12);
    // (0.5 * 0.25 + 0.5 + 0.25) * 400 / 1000
    EXPECT_NEAR(report->percent_complete, 35.0, 1e-9);
}

MY_TEST_F(TransferProgressEstimatorTest, EtaSaturatesWhenTooLarge) {
    ASSERT_TRUE(estimator_.SetEvidence(1000000000000000000ull, 0));
    estimator_.RecordBytesWritten(1);
    auto report = estimator_.Tick(CreateDeltaStats(1, 1));
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->eta_seconds, 0u);

    AdvanceTime(TimeDelta::Seconds(100));
    estimator_.RecordBytesWritten(2);
    report = estimator_.Tick(CreateDeltaStats(1, 1));
    ASSERT_TRUE(report.has_value());
    EXPECT_GT(report->percent_complete, 0.0);
    EXPECT_EQ(report->eta_seconds, std::numeric_limits<uint64_t>::max());
    EXPECT_EQ(estimator_.eta_seconds(), std::numeric_limits<uint64_t>::max());
}

MY_TEST(TransferProgressEstimatorThreadTest, RecordsWhileTicking) {
    constexpr uint64_t kNumWrites = 100000;
    auto clock = Clock::GetRealTimeClock();
    TransferProgressEstimator estimator(CreateProgressConfiguration(), clock.get());
    ASSERT_TRUE(estimator.SetEvidence(kNewFileBytes, 0));
    const DeltaStats delta_stats = CreateDeltaStats(100, 100);

    std::atomic<bool> done(false);
    std::thread producer([&](){
        for (uint64_t i = 1; i <= kNumWrites; ++i) {
            estimator.RecordBytesWritten(i);
        }
        done = true;
    });

    double last_percent = 0.0;
    int num_reports = 0;
    while (!done.load() || num_reports == 0) {
        auto report = estimator.Tick(delta_stats);
        if (!report) {
            continue;
        }
        ++num_reports;
        EXPECT_GE(report->percent_complete, last_percent);
        EXPECT_GE(report->percent_complete, 0.0);
        EXPECT_LE(report->percent_complete, 100.0);
        last_percent = report->percent_complete;
    }
    producer.join();

    EXPECT_EQ(estimator.cumulative_bytes_written(), kNumWrites);
    EXPECT_EQ(estimator.sample_count(), num_reports);
}

MY_TEST_F(TransferProgressEstimatorTest, ProgressNeverGoesBackwards) {
    ASSERT_TRUE(estimator_.SetEvidence(kNewFileBytes, 0));
    estimator_.RecordBytesWritten(900);
    for (int i = 0; i < 10; ++i) {
        AdvanceTime(TimeDelta::Millis(100));
        auto report = estimator_.Tick(CreateDeltaStats(900, 900));
        ASSERT_TRUE(report.has_value());
        EXPECT_NEAR(report->percent_complete, 90.0, 1e-9);
    }
    // The raw estimation drops to about 84% with less changed data.
    AdvanceTime(TimeDelta::Millis(100));
    auto report = estimator_.Tick(CreateDeltaStats(800, 800));
    ASSERT_TRUE(report.has_value());
    EXPECT_NEAR(report->percent_complete, 90.0, 1e-9);
    EXPECT_NEAR(estimator_.progress_fraction(), 0.9, 1e-12);
}

MY_TEST_F(TransferProgressEstimatorTest, ProgressStaysInRangeAndIncreases) {
    ASSERT_TRUE(estimator_.SetEvidence(40000, 60000));
    std::mt19937 gen(42);
    std::uniform_int_distribution<uint64_t> chunk(0, 3000);
    std::uniform_real_distribution<double> ratio(0.1, 2.0);
    uint64_t written = 0;
    uint64_t processed = 0;
    uint64_t raw_delta = 0;
    double last_percent = 0.0;
    for (int i = 0; i < 200; ++i) {
        AdvanceTime(TimeDelta::Millis(500));
        written += chunk(gen);
        processed += chunk(gen);
        raw_delta += static_cast<uint64_t>(chunk(gen) * ratio(gen));
        estimator_.RecordBytesWritten(written);
        const int64_t sample_count = estimator_.sample_count();
        auto report = estimator_.Tick(CreateDeltaStats(processed / 2, raw_delta, processed - processed / 2));
        if (!report) {
            EXPECT_EQ(estimator_.sample_count(), sample_count);
            continue;
        }
        EXPECT_EQ(estimator_.sample_count(), sample_count + 1);
        EXPECT_GE(report->percent_complete, 0.0);
        EXPECT_LE(report->percent_complete, 100.0);
        EXPECT_GE(report->percent_complete, last_percent);
        EXPECT_LE(estimator_.num_rate_samples(), 30u);
        last_percent = report->percent_complete;
    }
}

MY_TEST_F(TransferProgressEstimatorTest, ReportsStallWithFrozenValues) {
    ASSERT_TRUE(estimator_.SetEvidence(kNewFileBytes, 0));
    // Seeds the stall timer.
    ASSERT_TRUE(estimator_.Tick(CreateDeltaStats(500, 500)).has_value());
    EXPECT_EQ(estimator_.sample_count(), 1);

    // Not stalled until more than max(5s, 2 * 1s) without activity.
    AdvanceTime(TimeDelta::Seconds(5));
    auto report = estimator_.Tick(CreateDeltaStats(500, 500));
    ASSERT_TRUE(report.has_value());
    EXPECT_FALSE(report->stalled);
    EXPECT_EQ(estimator_.sample_count(), 2);

    AdvanceTime(TimeDelta::Seconds(1));
    const double progress = estimator_.progress_fraction();
    report = estimator_.Tick(CreateDeltaStats(600, 600));
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->stalled);
    EXPECT_EQ(report->percent_complete, 100.0 * progress);
    EXPECT_EQ(report->eta_seconds, estimator_.eta_seconds());
    EXPECT_EQ(report->total_bytes, 0u);
    EXPECT_EQ(report->elapsed_seconds, 6u);
    EXPECT_EQ(estimator_.sample_count(), 2);

    // Writing resumes the estimation.
    AdvanceTime(TimeDelta::Seconds(1));
    estimator_.RecordBytesWritten(100);
    report = estimator_.Tick(CreateDeltaStats(600, 600));
    ASSERT_TRUE(report.has_value());
    EXPECT_FALSE(report->stalled);
    EXPECT_EQ(estimator_.sample_count(), 3);
}

MY_TEST_F(TransferProgressEstimatorTest, StallTimeoutFollowsReportingInterval) {
    TransferProgressEstimator estimator(CreateProgressConfiguration(TimeDelta::Seconds(4)), &clock_);
    ASSERT_TRUE(estimator.SetEvidence(kNewFileBytes, 0));
    estimator.RecordBytesWritten(100);
    AdvanceTime(TimeDelta::Seconds(8));
    auto report = estimator.Tick(CreateDeltaStats(500, 500));
    ASSERT_TRUE(report.has_value());
    EXPECT_FALSE(report->stalled);
    AdvanceTime(TimeDelta::Millis(1));
    report = estimator.Tick(CreateDeltaStats(500, 500));
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->stalled);
}

MY_TEST_F(TransferProgressEstimatorTest, ThroughputWindowIsBounded) {
    ASSERT_TRUE(estimator_.SetEvidence(1000000, 0));
    uint64_t written = 0;
    ASSERT_TRUE(estimator_.Tick(CreateDeltaStats(1000, 1000)).has_value());
    for (int i = 1; i <= 35; ++i) {
        AdvanceTime(TimeDelta::Seconds(1));
        written += 100;
        estimator_.RecordBytesWritten(written);
        ASSERT_TRUE(estimator_.Tick(CreateDeltaStats(1000 + i, 1000 + i)).has_value());
    }
    EXPECT_EQ(estimator_.num_rate_samples(), 30u);
    EXPECT_NEAR(estimator_.throughput_bps(), 100.0 * (1.0 - std::pow(0.7, 30)), 1e-6);
    EXPECT_NEAR(estimator_.throughput_bps(), 99.9977, 1e-4);
}

MY_TEST_F(TransferProgressEstimatorTest, CompletionReport) {
    ASSERT_TRUE(estimator_.SetEvidence(kNewFileBytes, 0));
    estimator_.RecordBytesWritten(100);
    ASSERT_TRUE(estimator_.Tick(CreateDeltaStats(500, 500)).has_value());
    AdvanceTime(TimeDelta::Seconds(2));
    estimator_.RecordBytesWritten(300);
    ASSERT_TRUE(estimator_.Tick(CreateDeltaStats(600, 600)).has_value());
    AdvanceTime(TimeDelta::Millis(1900));

    ProgressReport report = estimator_.CompletionReport();
    EXPECT_EQ(report.percent_complete, 100.0);
    EXPECT_EQ(report.eta_seconds, 0u);
    EXPECT_EQ(report.total_bytes, 300u);
    EXPECT_EQ(report.elapsed_seconds, 3u);
    EXPECT_EQ(report.speed_bytes_per_sec, estimator_.throughput_bps());
    EXPECT_FALSE(report.stalled);
    EXPECT_EQ(estimator_.TotalElapsedSeconds(), 3u);
}

MY_TEST_F(TransferProgressEstimatorTest, RejectsInvalidArguments) {
    EXPECT_THROW({
        TransferProgressEstimator estimator(CreateProgressConfiguration(TimeDelta::Zero()), &clock_);
    }, std::invalid_argument);
    EXPECT_THROW({
        TransferProgressEstimator estimator(CreateProgressConfiguration(), nullptr);
    }, std::invalid_argument);
    TransferProgressEstimator::Configuration config;
    config.rate_window_length = 0;
    EXPECT_THROW({
        TransferProgressEstimator estimator(CreateProgressConfiguration(), config, &clock_);
    }, std::invalid_argument);
}

} // namespace test
} // namespace xferstat
