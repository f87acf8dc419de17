#ifndef _XFER_BASE_TASK_UTILS_REPEATING_TASK_H_
#define _XFER_BASE_TASK_UTILS_REPEATING_TASK_H_

#include "base/defines.hpp"
#include "xfer/base/time/clock.hpp"
#include "xfer/base/task_utils/pending_task_safety_flag.hpp"

#include <functional>

namespace xferstat {

class TaskQueueImpl;

// Runs a closure on a task queue until stopped. The closure returns the
// delay to its next run, counted from when the current run was due so the
// schedule does not drift; a non-positive delay stops the task.
class XFER_CPP_EXPORT RepeatingTask final {
public:
    using Closure = std::function<TimeDelta()>;

    static std::unique_ptr<RepeatingTask> Start(Clock* clock,
                                                TaskQueueImpl* task_queue,
                                                Closure closure,
                                                TimeDelta first_delay = TimeDelta::Zero());
    ~RepeatingTask();

    // No run starts after this returns. Waits for a run in progress on
    // another thread, and may be called from the closure.
    void Stop();

    bool Running() const;
    
private:
    RepeatingTask(Clock* clock, TaskQueueImpl* task_queue, Closure closure);

    void ScheduleRunAt(Timestamp due_time);
    void Run(Timestamp due_time);

private:
    Clock* const clock_;
    TaskQueueImpl* const task_queue_;
    const Closure closure_;
    const std::shared_ptr<PendingTaskSafetyFlag> safety_flag_;
};
    
} // namespace xferstat

#endif
