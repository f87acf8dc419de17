#include "xfer/progress/progress_reporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <stdexcept>

namespace xferstat {

ProgressReporter::ProgressReporter(const ProgressConfiguration& config,
                                   TransferProgressEstimator* estimator,
                                   StatsProvider stats_provider,
                                   ProgressSink* sink,
                                   Clock* clock,
                                   TaskQueueImpl* task_queue) 
    : config_(config),
      estimator_(estimator),
      stats_provider_(std::move(stats_provider)),
      sink_(sink),
      clock_(clock),
      task_queue_(task_queue),
      state_(State::IDLE),
      stop_requested_(false),
      stopped_event_(/*manual_reset=*/true, /*initially_signaled=*/false) {
    if (!estimator_ || !stats_provider_ || !sink_ || !clock_ || !task_queue_) {
        throw std::invalid_argument("Progress reporter collaborators must not be null.");
    }
    if (config_.reporting_interval <= TimeDelta::Zero() || config_.reporting_interval.IsInfinite()) {
        throw std::invalid_argument("The reporting interval must be positive.");
    }
}

ProgressReporter::~ProgressReporter() {
    // Waits for a running iteration to return, no iteration will run after.
    if (repeating_task_) {
        repeating_task_->Stop();
    }
    if (state_.load() == State::RUNNING) {
        PLOG_WARNING << "Progress reporter destroyed before emitting the final report.";
    }
}

bool ProgressReporter::Start() {
    if (state_.load() != State::IDLE) {
        PLOG_WARNING << "Progress reporter was already started.";
        return false;
    }
    if (!config_.enabled) {
        PLOG_DEBUG << "Progress reporting is disabled.";
        return false;
    }
    if (config_.dry_run) {
        PLOG_DEBUG << "No progress to report in a dry run.";
        return false;
    }
    if (!estimator_->HasEvidence()) {
        PLOG_WARNING << "No size evidence was collected, progress can not be estimated.";
        return false;
    }
    State expected = State::IDLE;
    if (!state_.compare_exchange_strong(expected, State::RUNNING)) {
        // Stopped or started concurrently.
        PLOG_WARNING << "Progress reporter can not start from its current state.";
        return false;
    }
    repeating_task_ = RepeatingTask::Start(clock_, task_queue_, [this](){
        return ReportOnce();
    });
    PLOG_INFO << "Progress reporter started, reporting every " 
              << config_.reporting_interval.ms() << " ms.";
    return true;
}

void ProgressReporter::Stop() {
    if (stop_requested_.exchange(true)) {
        return;
    }
    State expected = State::IDLE;
    if (state_.compare_exchange_strong(expected, State::STOPPED)) {
        // Never started, nothing to report.
        PLOG_DEBUG << "Progress reporter stopped before being started.";
        stopped_event_.Set();
    }
}

bool ProgressReporter::WaitForStopped(TimeDelta timeout) {
    return stopped_event_.Wait(std::max(timeout, TimeDelta::Zero()));
}

ProgressReporter::TransferProgressCallback ProgressReporter::TransferCallback() {
    return [this](uint64_t bytecount, uint64_t /*total_bytes*/) {
        if (state_.load() == State::RUNNING) {
            estimator_->RecordBytesWritten(bytecount);
        }
    };
}

// Private methods
TimeDelta ProgressReporter::ReportOnce() {
    XFER_RUN_ON(task_queue_);
    if (stop_requested_.load()) {
        sink_->OnTransferProgress(estimator_->CompletionReport());
        state_.store(State::STOPPED);
        PLOG_INFO << "Progress reporter stopped.";
        stopped_event_.Set();
        return TimeDelta::Zero();
    }
    std::optional<ProgressReport> report = estimator_->Tick(stats_provider_());
    if (report) {
        sink_->OnTransferProgress(*report);
    }
    return config_.reporting_interval;
}

} // namespace xferstat
