#ifndef _TESTING_SIMULATED_TIME_CONTROLLER_H_
#define _TESTING_SIMULATED_TIME_CONTROLLER_H_

#include "base/defines.hpp"
#include "base/thread_annotation.hpp"
#include "xfer/base/time/clock_simulated.hpp"
#include "xfer/base/task_utils/task_queue_impl.hpp"

#include <mutex>
#include <vector>

namespace xferstat {

class SimulatedTaskQueue;

// Owns a simulated clock and drives the task queues created from it.
// Time only moves in AdvanceTime, which runs the due tasks in time order
// on the calling thread.
class XFER_CPP_EXPORT SimulatedTimeController {
public:
    explicit SimulatedTimeController(Timestamp start_time);
    ~SimulatedTimeController();

    TaskQueueImplPtr CreateTaskQueue();
    SimulatedClock* GetClock() { return &clock_; }
    Timestamp CurrentTime() { return clock_.CurrentTime(); }

    void AdvanceTime(TimeDelta duration);

private:
    friend class SimulatedTaskQueue;
    void Register(SimulatedTaskQueue* task_queue) XFER_LOCKS_EXCLUDED(lock_);
    void Unregister(SimulatedTaskQueue* task_queue) XFER_LOCKS_EXCLUDED(lock_);

    Timestamp NextRunTime() const XFER_LOCKS_EXCLUDED(lock_);
    void RunDueTasks() XFER_LOCKS_EXCLUDED(lock_);

    SimulatedClock clock_;
    mutable std::mutex lock_;
    std::vector<SimulatedTaskQueue*> task_queues_ XFER_GUARDED_BY(lock_);
};
    
} // namespace xferstat

#endif
