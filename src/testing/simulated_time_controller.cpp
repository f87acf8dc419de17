#include "testing/simulated_time_controller.hpp"
#include "testing/simulated_task_queue.hpp"

#include <algorithm>

namespace xferstat {

SimulatedTimeController::SimulatedTimeController(Timestamp start_time) 
    : clock_(start_time) {}

SimulatedTimeController::~SimulatedTimeController() = default;

TaskQueueImplPtr SimulatedTimeController::CreateTaskQueue() {
    return TaskQueueImplPtr(new SimulatedTaskQueue(this));
}

void SimulatedTimeController::AdvanceTime(TimeDelta duration) {
    const Timestamp target = CurrentTime() + duration;
    RunDueTasks();
    while (true) {
        const Timestamp next = std::min(NextRunTime(), target);
        const Timestamp now = CurrentTime();
        if (next > now) {
            clock_.AdvanceTime(next - now);
        }
        RunDueTasks();
        if (next >= target) {
            break;
        }
    }
}

void SimulatedTimeController::Register(SimulatedTaskQueue* task_queue) {
    std::lock_guard<std::mutex> lock(lock_);
    task_queues_.push_back(task_queue);
}

void SimulatedTimeController::Unregister(SimulatedTaskQueue* task_queue) {
    std::lock_guard<std::mutex> lock(lock_);
    task_queues_.erase(std::remove(task_queues_.begin(), task_queues_.end(), task_queue), 
                       task_queues_.end());
}

Timestamp SimulatedTimeController::NextRunTime() const {
    std::lock_guard<std::mutex> lock(lock_);
    Timestamp next = Timestamp::PlusInfinity();
    for (const auto* task_queue : task_queues_) {
        next = std::min(next, task_queue->NextRunTime());
    }
    return next;
}

void SimulatedTimeController::RunDueTasks() {
    const Timestamp now = CurrentTime();
    while (true) {
        std::vector<SimulatedTaskQueue*> due;
        {
            std::lock_guard<std::mutex> lock(lock_);
            for (auto* task_queue : task_queues_) {
                if (task_queue->NextRunTime() <= now) {
                    due.push_back(task_queue);
                }
            }
        }
        if (due.empty()) {
            break;
        }
        for (auto* task_queue : due) {
            {
                // A task run earlier in this pass may have deleted it.
                std::lock_guard<std::mutex> lock(lock_);
                if (std::find(task_queues_.begin(), task_queues_.end(), task_queue) == task_queues_.end()) {
                    continue;
                }
            }
            task_queue->RunDueTasks(now);
        }
    }
}
    
} // namespace xferstat
