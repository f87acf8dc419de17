#include "xfer/progress/progress_reporter.hpp"
#include "xfer/progress/log_progress_sink.hpp"
#include "testing/simulated_time_controller.hpp"

#include <gtest/gtest.h>

#define ENABLE_UNIT_TESTS 1
#include "testing/unittest_defines.hpp"

#include <stdexcept>
#include <thread>
#include <vector>

namespace xferstat {
namespace test {
namespace {

constexpr Timestamp kStartTime = Timestamp::Seconds(1000);
constexpr TimeDelta kReportingInterval = TimeDelta::Seconds(1);

ProgressConfiguration CreateProgressConfiguration(bool enabled = true, bool dry_run = false) {
    ProgressConfiguration config;
    config.enabled = enabled;
    config.reporting_interval = kReportingInterval;
    config.dry_run = dry_run;
    return config;
}
    
} // namespace

class T(ProgressReporterTest) : public ::testing::Test {
public:
    T(ProgressReporterTest)() 
        : time_controller_(kStartTime),
          task_queue_(time_controller_.CreateTaskQueue()),
          sink_([this](const ProgressReport& report){
              reports_.push_back(report);
          }) {
        delta_stats_.new_file_bytes = 500;
        delta_stats_.raw_delta_size = 500;
    }

    std::unique_ptr<TransferProgressEstimator> CreateEstimator(const ProgressConfiguration& config, bool with_evidence = true) {
        auto estimator = std::make_unique<TransferProgressEstimator>(config, time_controller_.GetClock());
        if (with_evidence) {
            estimator->SetEvidence(1000, 0);
        }
        return estimator;
    }

    std::unique_ptr<ProgressReporter> CreateReporter(const ProgressConfiguration& config, TransferProgressEstimator* estimator) {
        return std::make_unique<ProgressReporter>(config, 
                                                  estimator, 
                                                  [this](){ return delta_stats_; },
                                                  &sink_,
                                                  time_controller_.GetClock(),
                                                  task_queue_.get());
    }

protected:
    SimulatedTimeController time_controller_;
    std::unique_ptr<TaskQueueImpl, TaskQueueImpl::Deleter> task_queue_;
    DeltaStats delta_stats_;
    std::vector<ProgressReport> reports_;
    CallbackProgressSink sink_;
};

MY_TEST_F(ProgressReporterTest, RefusesToStartWhenDisabled) {
    auto config = CreateProgressConfiguration(/*enabled=*/false);
    auto estimator = CreateEstimator(config);
    auto reporter = CreateReporter(config, estimator.get());
    EXPECT_FALSE(reporter->Start());
    EXPECT_EQ(reporter->state(), ProgressReporter::State::IDLE);
    time_controller_.AdvanceTime(kReportingInterval * 3);
    EXPECT_TRUE(reports_.empty());
}

MY_TEST_F(ProgressReporterTest, RefusesToStartInDryRun) {
    auto config = CreateProgressConfiguration(/*enabled=*/true, /*dry_run=*/true);
    auto estimator = CreateEstimator(config);
    auto reporter = CreateReporter(config, estimator.get());
    EXPECT_FALSE(reporter->Start());
    EXPECT_EQ(reporter->state(), ProgressReporter::State::IDLE);
    time_controller_.AdvanceTime(kReportingInterval * 3);
    EXPECT_TRUE(reports_.empty());
}

MY_TEST_F(ProgressReporterTest, RefusesToStartWithoutEvidence) {
    auto config = CreateProgressConfiguration();
    auto estimator = CreateEstimator(config, /*with_evidence=*/false);
    auto reporter = CreateReporter(config, estimator.get());
    EXPECT_FALSE(reporter->Start());
    EXPECT_EQ(reporter->state(), ProgressReporter::State::IDLE);
    time_controller_.AdvanceTime(kReportingInterval * 3);
    EXPECT_TRUE(reports_.empty());
}

MY_TEST_F(ProgressReporterTest, ReportsEveryInterval) {
    auto config = CreateProgressConfiguration();
    auto estimator = CreateEstimator(config);
    auto reporter = CreateReporter(config, estimator.get());
    auto transfer_callback = reporter->TransferCallback();
    ASSERT_TRUE(reporter->Start());
    EXPECT_EQ(reporter->state(), ProgressReporter::State::RUNNING);
    EXPECT_FALSE(reporter->Start());

    transfer_callback(250, 0);
    time_controller_.AdvanceTime(TimeDelta::Zero());
    ASSERT_EQ(reports_.size(), 1u);
    // change ratio 1.0, compress ratio 0.5, half of the data processed.
    EXPECT_NEAR(reports_[0].percent_complete, 25.0, 1e-9);
    EXPECT_EQ(reports_[0].total_bytes, 250u);

    for (int i = 1; i <= 3; ++i) {
        transfer_callback(250 + 100 * i, 0);
        time_controller_.AdvanceTime(kReportingInterval);
        ASSERT_EQ(reports_.size(), 1u + i);
        EXPECT_EQ(reports_.back().elapsed_seconds, static_cast<uint64_t>(i));
        EXPECT_FALSE(reports_.back().stalled);
    }
    EXPECT_EQ(estimator->sample_count(), 4);
    EXPECT_EQ(estimator->cumulative_bytes_written(), 550u);
}

MY_TEST_F(ProgressReporterTest, StopEmitsCompletionReport) {
    auto config = CreateProgressConfiguration();
    auto estimator = CreateEstimator(config);
    auto reporter = CreateReporter(config, estimator.get());
    auto transfer_callback = reporter->TransferCallback();
    ASSERT_TRUE(reporter->Start());

    transfer_callback(400, 0);
    time_controller_.AdvanceTime(kReportingInterval * 2);
    ASSERT_EQ(reports_.size(), 3u);

    reporter->Stop();
    // Stopping never blocks, the final report comes with the next iteration.
    EXPECT_EQ(reporter->state(), ProgressReporter::State::RUNNING);
    EXPECT_FALSE(reporter->WaitForStopped(TimeDelta::Zero()));

    time_controller_.AdvanceTime(kReportingInterval);
    ASSERT_EQ(reports_.size(), 4u);
    const ProgressReport& final_report = reports_.back();
    EXPECT_EQ(final_report.percent_complete, 100.0);
    EXPECT_EQ(final_report.eta_seconds, 0u);
    EXPECT_EQ(final_report.total_bytes, 400u);
    EXPECT_EQ(final_report.elapsed_seconds, 3u);
    EXPECT_EQ(final_report.speed_bytes_per_sec, estimator->throughput_bps());
    EXPECT_FALSE(final_report.stalled);
    EXPECT_EQ(reporter->state(), ProgressReporter::State::STOPPED);
    EXPECT_TRUE(reporter->WaitForStopped(TimeDelta::Zero()));

    // No more report.
    time_controller_.AdvanceTime(kReportingInterval * 5);
    EXPECT_EQ(reports_.size(), 4u);
}

MY_TEST_F(ProgressReporterTest, TransferCallbackForwardsOnlyWhileRunning) {
    auto config = CreateProgressConfiguration();
    auto estimator = CreateEstimator(config);
    auto reporter = CreateReporter(config, estimator.get());
    auto transfer_callback = reporter->TransferCallback();

    transfer_callback(100, 1000);
    EXPECT_EQ(estimator->cumulative_bytes_written(), 0u);

    ASSERT_TRUE(reporter->Start());
    transfer_callback(100, 1000);
    transfer_callback(300, 1000);
    EXPECT_EQ(estimator->cumulative_bytes_written(), 300u);

    reporter->Stop();
    time_controller_.AdvanceTime(TimeDelta::Zero());
    ASSERT_EQ(reporter->state(), ProgressReporter::State::STOPPED);
    transfer_callback(500, 1000);
    EXPECT_EQ(estimator->cumulative_bytes_written(), 300u);
}

MY_TEST_F(ProgressReporterTest, StopBeforeStart) {
    auto config = CreateProgressConfiguration();
    auto estimator = CreateEstimator(config);
    auto reporter = CreateReporter(config, estimator.get());
    reporter->Stop();
    EXPECT_EQ(reporter->state(), ProgressReporter::State::STOPPED);
    EXPECT_TRUE(reporter->WaitForStopped(TimeDelta::Zero()));
    EXPECT_FALSE(reporter->Start());
    time_controller_.AdvanceTime(kReportingInterval * 2);
    EXPECT_TRUE(reports_.empty());
}

MY_TEST_F(ProgressReporterTest, StartRacingStopEndsStopped) {
    auto config = CreateProgressConfiguration();
    for (int i = 0; i < 50; ++i) {
        reports_.clear();
        auto estimator = CreateEstimator(config);
        auto reporter = CreateReporter(config, estimator.get());
        bool started = false;
        std::thread starter([&](){ started = reporter->Start(); });
        std::thread stopper([&](){ reporter->Stop(); });
        starter.join();
        stopper.join();

        time_controller_.AdvanceTime(kReportingInterval);
        EXPECT_EQ(reporter->state(), ProgressReporter::State::STOPPED);
        EXPECT_TRUE(reporter->WaitForStopped(TimeDelta::Zero()));
        if (started) {
            // Only the completion report, stop was requested before the first run.
            ASSERT_EQ(reports_.size(), 1u);
            EXPECT_EQ(reports_.back().percent_complete, 100.0);
        } else {
            EXPECT_TRUE(reports_.empty());
        }
    }
}

MY_TEST_F(ProgressReporterTest, DestroyedWhileRunning) {
    auto config = CreateProgressConfiguration();
    auto estimator = CreateEstimator(config);
    auto reporter = CreateReporter(config, estimator.get());
    ASSERT_TRUE(reporter->Start());
    time_controller_.AdvanceTime(TimeDelta::Zero());
    ASSERT_EQ(reports_.size(), 1u);
    reporter.reset();
    time_controller_.AdvanceTime(kReportingInterval * 3);
    EXPECT_EQ(reports_.size(), 1u);
}

MY_TEST_F(ProgressReporterTest, RejectsInvalidArguments) {
    auto config = CreateProgressConfiguration();
    auto estimator = CreateEstimator(config);
    EXPECT_THROW({
        ProgressReporter reporter(config, nullptr, [this](){ return delta_stats_; }, &sink_, 
                                  time_controller_.GetClock(), task_queue_.get());
    }, std::invalid_argument);
    EXPECT_THROW({
        ProgressReporter reporter(config, estimator.get(), nullptr, &sink_, 
                                  time_controller_.GetClock(), task_queue_.get());
    }, std::invalid_argument);
    EXPECT_THROW({
        ProgressReporter reporter(config, estimator.get(), [this](){ return delta_stats_; }, nullptr, 
                                  time_controller_.GetClock(), task_queue_.get());
    }, std::invalid_argument);
}

} // namespace test
} // namespace xferstat
