#include "xfer/progress/transfer_progress_estimator.hpp"
#include "common/utils_numeric.hpp"
#include "common/utils_time.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace xferstat {
namespace {

constexpr int64_t kNoActivity = std::numeric_limits<int64_t>::min();
// 2^64, the first double not representable as uint64_t.
constexpr double kMaxEtaSeconds = 18446744073709551616.0;

const ProgressConfiguration& CheckedProgressConfiguration(const ProgressConfiguration& config) {
    if (config.reporting_interval <= TimeDelta::Zero() || config.reporting_interval.IsInfinite()) {
        throw std::invalid_argument("The reporting interval must be positive.");
    }
    return config;
}

const TransferProgressEstimator::Configuration& CheckedConfiguration(const TransferProgressEstimator::Configuration& config) {
    if (config.rate_window_length == 0) {
        throw std::invalid_argument("The rate window must hold at least one sample.");
    }
    if (!(config.smoothing_factor > 0.0 && config.smoothing_factor <= 1.0)) {
        throw std::invalid_argument("The smoothing factor must be in (0, 1].");
    }
    return config;
}

Clock* CheckedClock(Clock* clock) {
    if (clock == nullptr) {
        throw std::invalid_argument("Clock must not be null.");
    }
    return clock;
}

} // namespace

TransferProgressEstimator::TransferProgressEstimator(const ProgressConfiguration& progress_config,
                                                     Clock* clock) 
    : TransferProgressEstimator(progress_config, Configuration(), clock) {}

TransferProgressEstimator::TransferProgressEstimator(const ProgressConfiguration& progress_config,
                                                     const Configuration& config,
                                                     Clock* clock) 
    : progress_config_(CheckedProgressConfiguration(progress_config)),
      config_(CheckedConfiguration(config)),
      clock_(CheckedClock(clock)),
      cumulative_bytes_written_(0),
      bytes_written_at_last_sample_(0),
      last_activity_time_us_(kNoActivity),
      sample_count_(0),
      progress_fraction_(0.0),
      eta_seconds_(0),
      bytes_written_at_last_tick_(0),
      accumulated_elapsed_(TimeDelta::Zero()),
      throughput_filter_(config_.rate_window_length, config_.smoothing_factor),
      is_stalled_(false) {}

TransferProgressEstimator::~TransferProgressEstimator() = default;

bool TransferProgressEstimator::SetEvidence(uint64_t new_file_bytes, uint64_t changed_file_bytes) {
    SizeEvidence evidence;
    evidence.new_file_bytes = new_file_bytes;
    evidence.changed_file_bytes = changed_file_bytes;
    return SetEvidence(evidence);
}

bool TransferProgressEstimator::SetEvidence(const SizeEvidence& evidence) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (evidence_) {
        PLOG_WARNING << "Size evidence was already collected, ignoring the new one ("
                     << evidence.total() << " bytes).";
        return false;
    }
    evidence_ = evidence;
    PLOG_DEBUG << "Collected size evidence: new=" << evidence.new_file_bytes
               << " bytes, changed=" << evidence.changed_file_bytes << " bytes.";
    return true;
}

bool TransferProgressEstimator::HasEvidence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evidence_.has_value();
}

void TransferProgressEstimator::RecordBytesWritten(uint64_t cumulative_bytes) {
    // A smaller value than the previous one means a new volume has started, 
    // the bytes of that first call are not accounted.
    const uint64_t previous = bytes_written_at_last_sample_.exchange(cumulative_bytes);
    const uint64_t delta = utils::numeric::saturated_sub(cumulative_bytes, previous);
    if (delta == 0) {
        return;
    }
    uint64_t expected = cumulative_bytes_written_.load();
    while (!cumulative_bytes_written_.compare_exchange_weak(expected, utils::numeric::saturated_add(expected, delta))) {}
    last_activity_time_us_.store(clock_->CurrentTime().us());
}

std::optional<ProgressReport> TransferProgressEstimator::Tick(const DeltaStats& delta_stats) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!progress_config_.enabled || !evidence_) {
        return std::nullopt;
    }

    const Timestamp now = clock_->CurrentTime();
    const TimeDelta elapsed = last_sample_time_ ? now - *last_sample_time_ : TimeDelta::Zero();
    last_sample_time_ = now;
    if (!start_time_) {
        start_time_ = now;
    }

    // The stall timer starts with the first tick if nothing was written before.
    int64_t no_activity = kNoActivity;
    last_activity_time_us_.compare_exchange_strong(no_activity, now.us());
    const Timestamp last_activity_time = Timestamp::Micros(last_activity_time_us_.load());
    const uint64_t cumulative_bytes = cumulative_bytes_written_.load();

    if (now - last_activity_time > StallTimeout()) {
        if (!is_stalled_) {
            is_stalled_ = true;
            PLOG_WARNING << "No byte written for " << (now - last_activity_time).ms() 
                         << " ms, the transfer is stalled.";
        }
        ProgressReport report;
        report.percent_complete = 100.0 * progress_fraction_;
        report.eta_seconds = eta_seconds_;
        report.total_bytes = cumulative_bytes;
        report.elapsed_seconds = ElapsedSecondsSinceStart(now);
        report.speed_bytes_per_sec = throughput_filter_.filtered();
        report.stalled = true;
        return report;
    }
    if (is_stalled_) {
        is_stalled_ = false;
        PLOG_INFO << "The transfer resumed.";
    }

    const uint64_t changed_plus_new = delta_stats.changed_plus_new();
    const uint64_t evidence_total = evidence_->total();
    if (changed_plus_new == 0 || evidence_total == 0) {
        return std::nullopt;
    }

    ++sample_count_;
    const double last_progress_fraction = progress_fraction_;

    // Both ratios are averaged over every tick, the compress ratio is
    // skipped when there is no delta but the tick still counts.
    // Ratio of the delta size to the size of the changed data.
    change_ratio_stats_.AddSample(static_cast<double>(delta_stats.raw_delta_size) / changed_plus_new, sample_count_);
    // Ratio of the written (compressed) bytes to the delta size.
    if (delta_stats.raw_delta_size > 0) {
        compress_ratio_stats_.AddSample(static_cast<double>(cumulative_bytes) / delta_stats.raw_delta_size, sample_count_);
    }

    const double change_mean = change_ratio_stats_.mean().value_or(0.0);
    const double change_sigma = Sigma(change_ratio_stats_);
    const double compress_mean = compress_ratio_stats_.mean().value_or(0.0);
    const double compress_sigma = Sigma(compress_ratio_stats_);

    double progress = (change_mean * compress_mean + change_sigma + compress_sigma) * 
                      static_cast<double>(changed_plus_new) / static_cast<double>(evidence_total);
    if (std::isfinite(progress)) {
        progress = std::max(0.0, std::min(progress, 1.0));
    } else {
        PLOG_VERBOSE << "Ignored a non-finite progress estimation.";
        progress = last_progress_fraction;
    }
    // The progress never goes backwards.
    progress_fraction_ = std::max(progress, last_progress_fraction);

    // The remaining time is projected on a (1 - p) / p curve of the elapsed
    // time, which is summed per tick to not suffer from clock skew.
    accumulated_elapsed_ += elapsed;
    const double projection = progress_fraction_ > 0.0 ? (1.0 - progress_fraction_) / progress_fraction_ : 1.0;
    const double eta = projection * accumulated_elapsed_.seconds<double>();
    // A tiny progress over a long time does not fit.
    eta_seconds_ = eta >= kMaxEtaSeconds ? std::numeric_limits<uint64_t>::max() 
                                         : static_cast<uint64_t>(eta);

    UpdateThroughput(elapsed, cumulative_bytes);

    ProgressReport report;
    report.percent_complete = 100.0 * progress_fraction_;
    report.eta_seconds = eta_seconds_;
    report.total_bytes = cumulative_bytes;
    report.elapsed_seconds = ElapsedSecondsSinceStart(now);
    report.speed_bytes_per_sec = throughput_filter_.filtered();
    report.stalled = false;
    return report;
}

ProgressReport TransferProgressEstimator::CompletionReport() {
    const Timestamp now = clock_->CurrentTime();
    std::lock_guard<std::mutex> lock(mutex_);
    ProgressReport report;
    report.percent_complete = 100.0;
    report.eta_seconds = 0;
    report.total_bytes = cumulative_bytes_written_.load();
    report.elapsed_seconds = ElapsedSecondsSinceStart(now);
    report.speed_bytes_per_sec = throughput_filter_.filtered();
    report.stalled = false;
    return report;
}

uint64_t TransferProgressEstimator::TotalElapsedSeconds() {
    const Timestamp now = clock_->CurrentTime();
    std::lock_guard<std::mutex> lock(mutex_);
    return ElapsedSecondsSinceStart(now);
}

double TransferProgressEstimator::progress_fraction() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_fraction_;
}

uint64_t TransferProgressEstimator::eta_seconds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return eta_seconds_;
}

double TransferProgressEstimator::throughput_bps() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return throughput_filter_.filtered();
}

int64_t TransferProgressEstimator::sample_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sample_count_;
}

size_t TransferProgressEstimator::num_rate_samples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return throughput_filter_.num_samples();
}

TimeDelta TransferProgressEstimator::accumulated_elapsed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accumulated_elapsed_;
}

double TransferProgressEstimator::change_ratio_mean() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return change_ratio_stats_.mean().value_or(0.0);
}

double TransferProgressEstimator::change_ratio_sigma() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Sigma(change_ratio_stats_);
}

double TransferProgressEstimator::compress_ratio_mean() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return compress_ratio_stats_.mean().value_or(0.0);
}

double TransferProgressEstimator::compress_ratio_sigma() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Sigma(compress_ratio_stats_);
}

// Private methods
double TransferProgressEstimator::Sigma(const RunningStatistics<double>& stats) const {
    if (sample_count_ == 0) {
        return 0.0;
    }
    return std::sqrt(std::fabs(stats.cumulated_variance() / sample_count_));
}

TimeDelta TransferProgressEstimator::StallTimeout() const {
    return std::max(config_.min_stall_timeout, progress_config_.reporting_interval * 2);
}

uint64_t TransferProgressEstimator::ElapsedSecondsSinceStart(Timestamp now) const {
    if (!start_time_ || now <= *start_time_) {
        return 0;
    }
    return static_cast<uint64_t>((now - *start_time_).us() / kNumMicrosecsPerSec);
}

void TransferProgressEstimator::UpdateThroughput(TimeDelta elapsed, uint64_t cumulative_bytes) {
    if (elapsed > TimeDelta::Zero()) {
        const uint64_t bytes = utils::numeric::saturated_sub(cumulative_bytes, bytes_written_at_last_tick_);
        throughput_filter_.AddSample(static_cast<double>(bytes) / elapsed.seconds<double>());
    }
    bytes_written_at_last_tick_ = cumulative_bytes;
}

} // namespace xferstat
