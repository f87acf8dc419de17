#ifndef _XFER_PROGRESS_PROGRESS_REPORTER_H_
#define _XFER_PROGRESS_PROGRESS_REPORTER_H_

#include "base/defines.hpp"
#include "xfer/base/time/clock.hpp"
#include "xfer/base/synchronization/event.hpp"
#include "xfer/base/task_utils/repeating_task.hpp"
#include "xfer/base/task_utils/task_queue_impl.hpp"
#include "xfer/progress/progress_configuration.hpp"
#include "xfer/progress/progress_sink.hpp"
#include "xfer/progress/transfer_progress_estimator.hpp"

#include <atomic>
#include <functional>
#include <memory>

namespace xferstat {

// Drives the estimator periodically on a task queue and forwards the
// reports to a sink. Once stopped, it emits a final report of 100% 
// complete with no remaining time.
//
// The stats provider and the sink run on `task_queue` while the repeating
// task holds its lock, and destroying or stopping the reporter waits for
// that lock. They must not block on the thread owning the reporter.
class XFER_CPP_EXPORT ProgressReporter {
public:
    enum class State {
        IDLE,
        RUNNING,
        STOPPED
    };
    // Provides the sizes processed so far by the live pass.
    using StatsProvider = std::function<DeltaStats()>;
    // The signature of the callback reporting the bytes written by the
    // transfer path, `total_bytes` is not used.
    using TransferProgressCallback = std::function<void(uint64_t bytecount, uint64_t total_bytes)>;
public:
    ProgressReporter(const ProgressConfiguration& config,
                     TransferProgressEstimator* estimator,
                     StatsProvider stats_provider,
                     ProgressSink* sink,
                     Clock* clock,
                     TaskQueueImpl* task_queue);
    ~ProgressReporter();

    State state() const { return state_.load(); }

    // Starts reporting if reporting is enabled, this is not a dry run and the
    // estimator collected evidence. Returns false otherwise.
    bool Start();

    // Requests the reporter to stop, the final report is emitted by the next
    // iteration. Never blocks.
    void Stop();

    // Blocks until the final report was emitted or the `timeout` expired.
    // Returns true if the reporter stopped.
    bool WaitForStopped(TimeDelta timeout);

    // Returns a callback forwarding the written bytes to the estimator
    // while the reporter is running.
    TransferProgressCallback TransferCallback();

private:
    TimeDelta ReportOnce();

private:
    const ProgressConfiguration config_;
    TransferProgressEstimator* const estimator_;
    const StatsProvider stats_provider_;
    ProgressSink* const sink_;
    Clock* const clock_;
    TaskQueueImpl* const task_queue_;

    std::atomic<State> state_;
    std::atomic<bool> stop_requested_;
    Event stopped_event_;
    std::unique_ptr<RepeatingTask> repeating_task_;
};

} // namespace xferstat

#endif
