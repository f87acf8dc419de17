#ifndef _XFER_BASE_TASK_UTILS_TASK_QUEUE_IMPL_H_
#define _XFER_BASE_TASK_UTILS_TASK_QUEUE_IMPL_H_

#include "base/defines.hpp"
#include "xfer/base/units/time_delta.hpp"
#include "xfer/base/task_utils/queued_task.hpp"

namespace xferstat {

// Runs posted tasks one at a time, immediate ones in posting order.
// Implementations manage their own lifetime and are released with Delete().
class XFER_CPP_EXPORT TaskQueueImpl {
public:
    struct Deleter {
        void operator()(TaskQueueImpl* task_queue) const { task_queue->Delete(); }
    };

    // Drops the delayed tasks that are still pending. Once it returns no
    // task is running and the queue is gone.
    virtual void Delete() = 0;

    virtual void Post(std::unique_ptr<QueuedTask> task) = 0;
    virtual void PostDelayed(TimeDelta delay, std::unique_ptr<QueuedTask> task) = 0;

    // The queue running the calling thread, or nullptr.
    static TaskQueueImpl* Current();
    bool IsCurrent() const { return Current() == this; }

protected:
    // Makes `task_queue` the current one of the calling thread for its scope.
    class ScopedCurrent {
    public:
        explicit ScopedCurrent(TaskQueueImpl* task_queue);
        ~ScopedCurrent();
        ScopedCurrent(const ScopedCurrent&) = delete;
        ScopedCurrent& operator=(const ScopedCurrent&) = delete;
    private:
        TaskQueueImpl* const outer_;
    };

    virtual ~TaskQueueImpl() = default;
};

using TaskQueueImplPtr = std::unique_ptr<TaskQueueImpl, TaskQueueImpl::Deleter>;

#define XFER_RUN_ON(x)   \
    assert((x)->IsCurrent() && "Called off its task queue.")
    
} // namespace xferstat

#endif
