#ifndef _TESTING_SIMULATED_TASK_QUEUE_H_
#define _TESTING_SIMULATED_TASK_QUEUE_H_

#include "base/defines.hpp"
#include "base/thread_annotation.hpp"
#include "xfer/base/task_utils/task_queue_impl.hpp"
#include "xfer/base/units/timestamp.hpp"

#include <mutex>
#include <deque>
#include <map>

namespace xferstat {

class SimulatedTimeController;

// A task queue without a thread. Its tasks run inside
// SimulatedTimeController::AdvanceTime, on the thread calling it.
class SimulatedTaskQueue final : public TaskQueueImpl {
public:
    explicit SimulatedTaskQueue(SimulatedTimeController* time_controller);

    // MinusInfinity when a task is ready, PlusInfinity when nothing is queued.
    Timestamp NextRunTime() const XFER_LOCKS_EXCLUDED(lock_);
    // Runs every task due at `now`, including the ones they post.
    void RunDueTasks(Timestamp now) XFER_LOCKS_EXCLUDED(lock_);

    void Delete() XFER_LOCKS_EXCLUDED(lock_) override;
    void Post(std::unique_ptr<QueuedTask> task) XFER_LOCKS_EXCLUDED(lock_) override;
    void PostDelayed(TimeDelta delay, std::unique_ptr<QueuedTask> task) XFER_LOCKS_EXCLUDED(lock_) override;

private:
    ~SimulatedTaskQueue() override;

    SimulatedTimeController* const time_controller_;

    mutable std::mutex lock_;
    std::deque<std::unique_ptr<QueuedTask>> ready_ XFER_GUARDED_BY(lock_);
    // Equal due times keep their posting order.
    std::multimap<Timestamp, std::unique_ptr<QueuedTask>> delayed_ XFER_GUARDED_BY(lock_);
};

} // namespace xferstat

#endif
