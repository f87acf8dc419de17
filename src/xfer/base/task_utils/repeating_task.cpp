#include "xfer/base/task_utils/repeating_task.hpp"
#include "xfer/base/task_utils/task_queue_impl.hpp"

#include <algorithm>

namespace xferstat {

std::unique_ptr<RepeatingTask> RepeatingTask::Start(Clock* clock,
                                                    TaskQueueImpl* task_queue,
                                                    Closure closure,
                                                    TimeDelta first_delay) {
    std::unique_ptr<RepeatingTask> task(new RepeatingTask(clock, task_queue, std::move(closure)));
    task->ScheduleRunAt(clock->CurrentTime() + first_delay);
    return task;
}

RepeatingTask::RepeatingTask(Clock* clock, TaskQueueImpl* task_queue, Closure closure) 
    : clock_(clock),
      task_queue_(task_queue),
      closure_(std::move(closure)),
      safety_flag_(PendingTaskSafetyFlag::Create()) {
    assert(clock_ != nullptr);
    assert(task_queue_ != nullptr);
    assert(closure_);
}

RepeatingTask::~RepeatingTask() {
    Stop();
}

void RepeatingTask::Stop() {
    safety_flag_->SetNotAlive();
}

bool RepeatingTask::Running() const {
    return safety_flag_->alive();
}

// Private methods
void RepeatingTask::ScheduleRunAt(Timestamp due_time) {
    auto task = ToQueuedTask(safety_flag_, [this, due_time](){
        Run(due_time);
    });
    const TimeDelta delay = due_time - clock_->CurrentTime();
    if (delay > TimeDelta::Zero()) {
        task_queue_->PostDelayed(delay, std::move(task));
    } else {
        task_queue_->Post(std::move(task));
    }
}

void RepeatingTask::Run(Timestamp due_time) {
    XFER_RUN_ON(task_queue_);
    const TimeDelta interval = closure_();
    if (interval <= TimeDelta::Zero()) {
        safety_flag_->SetNotAlive();
        return;
    }
    // A late run does not trigger a burst of runs to catch up.
    ScheduleRunAt(std::max(due_time + interval, clock_->CurrentTime()));
}
    
} // namespace xferstat
