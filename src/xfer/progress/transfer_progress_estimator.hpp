#ifndef _XFER_PROGRESS_TRANSFER_PROGRESS_ESTIMATOR_H_
#define _XFER_PROGRESS_TRANSFER_PROGRESS_ESTIMATOR_H_

#include "base/defines.hpp"
#include "base/thread_annotation.hpp"
#include "xfer/base/time/clock.hpp"
#include "xfer/base/numerics/running_statistics.hpp"
#include "xfer/base/numerics/windowed_exp_filter.hpp"
#include "xfer/progress/progress_configuration.hpp"
#include "xfer/progress/progress_report.hpp"
#include "xfer/progress/size_evidence.hpp"

#include <atomic>
#include <mutex>
#include <optional>

namespace xferstat {

// Estimates the completion percentage, the remaining time and the throughput 
// of a transfer whose total size is only known approximately, from the sizes
// collected by a dry-run pass.
//
// The progress is the part of the changed data processed so far, weighted by 
// the mean ratio of delta size to file size and the mean ratio of written
// bytes to delta size, plus the standard deviation of both ratios:
// p = (change_mean * compress_mean + change_sigma + compress_sigma) * 
//     changed_plus_new / evidence_total.
//
// `RecordBytesWritten` is called by the transfer path and never blocks, all 
// the other methods may be called from any thread.
class XFER_CPP_EXPORT TransferProgressEstimator {
public:
    struct Configuration {
        // The transfer is considered stalled when no byte was written for
        // max(min_stall_timeout, 2 * reporting_interval).
        TimeDelta min_stall_timeout = TimeDelta::Seconds(5);
        // Number of instantaneous rates the throughput is computed from.
        size_t rate_window_length = 30;
        // Weight of the newest rate in the throughput average.
        double smoothing_factor = 0.3;
    };
public:
    TransferProgressEstimator(const ProgressConfiguration& progress_config,
                              Clock* clock);
    TransferProgressEstimator(const ProgressConfiguration& progress_config,
                              const Configuration& config,
                              Clock* clock);
    ~TransferProgressEstimator();

    // Stores the evidence once, returns false if it was already stored.
    bool SetEvidence(uint64_t new_file_bytes, uint64_t changed_file_bytes) XFER_LOCKS_EXCLUDED(mutex_);
    bool SetEvidence(const SizeEvidence& evidence) XFER_LOCKS_EXCLUDED(mutex_);
    bool HasEvidence() const XFER_LOCKS_EXCLUDED(mutex_);

    // `cumulative_bytes` is the number of bytes written since the start of the
    // current volume, only its growth since the previous call is accounted.
    void RecordBytesWritten(uint64_t cumulative_bytes);

    // Recomputes the estimates, returns std::nullopt if there is nothing to
    // report yet.
    std::optional<ProgressReport> Tick(const DeltaStats& delta_stats) XFER_LOCKS_EXCLUDED(mutex_);

    // The report emitted when the transfer finished.
    ProgressReport CompletionReport() XFER_LOCKS_EXCLUDED(mutex_);

    // Seconds since the first tick, 0 before it.
    uint64_t TotalElapsedSeconds() XFER_LOCKS_EXCLUDED(mutex_);

    double progress_fraction() const XFER_LOCKS_EXCLUDED(mutex_);
    uint64_t eta_seconds() const XFER_LOCKS_EXCLUDED(mutex_);
    double throughput_bps() const XFER_LOCKS_EXCLUDED(mutex_);
    int64_t sample_count() const XFER_LOCKS_EXCLUDED(mutex_);
    size_t num_rate_samples() const XFER_LOCKS_EXCLUDED(mutex_);
    TimeDelta accumulated_elapsed() const XFER_LOCKS_EXCLUDED(mutex_);
    double change_ratio_mean() const XFER_LOCKS_EXCLUDED(mutex_);
    double change_ratio_sigma() const XFER_LOCKS_EXCLUDED(mutex_);
    double compress_ratio_mean() const XFER_LOCKS_EXCLUDED(mutex_);
    double compress_ratio_sigma() const XFER_LOCKS_EXCLUDED(mutex_);

    uint64_t cumulative_bytes_written() const { return cumulative_bytes_written_.load(); }

private:
    // Population standard deviation over all the ticks taken.
    double Sigma(const RunningStatistics<double>& stats) const XFER_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
    TimeDelta StallTimeout() const;
    uint64_t ElapsedSecondsSinceStart(Timestamp now) const XFER_EXCLUSIVE_LOCKS_REQUIRED(mutex_);
    void UpdateThroughput(TimeDelta elapsed, uint64_t cumulative_bytes) XFER_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

private:
    const ProgressConfiguration progress_config_;
    const Configuration config_;
    Clock* const clock_;

    // Updated by the transfer path without locking.
    std::atomic<uint64_t> cumulative_bytes_written_;
    std::atomic<uint64_t> bytes_written_at_last_sample_;
    std::atomic<int64_t> last_activity_time_us_;

    mutable std::mutex mutex_;
    std::optional<SizeEvidence> evidence_ XFER_GUARDED_BY(mutex_);
    int64_t sample_count_ XFER_GUARDED_BY(mutex_);
    RunningStatistics<double> change_ratio_stats_ XFER_GUARDED_BY(mutex_);
    RunningStatistics<double> compress_ratio_stats_ XFER_GUARDED_BY(mutex_);
    double progress_fraction_ XFER_GUARDED_BY(mutex_);
    uint64_t eta_seconds_ XFER_GUARDED_BY(mutex_);
    uint64_t bytes_written_at_last_tick_ XFER_GUARDED_BY(mutex_);
    std::optional<Timestamp> last_sample_time_ XFER_GUARDED_BY(mutex_);
    std::optional<Timestamp> start_time_ XFER_GUARDED_BY(mutex_);
    TimeDelta accumulated_elapsed_ XFER_GUARDED_BY(mutex_);
    WindowedExpFilter throughput_filter_ XFER_GUARDED_BY(mutex_);
    bool is_stalled_ XFER_GUARDED_BY(mutex_);
};

} // namespace xferstat

#endif
