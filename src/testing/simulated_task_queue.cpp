#include "testing/simulated_task_queue.hpp"
#include "testing/simulated_time_controller.hpp"

namespace xferstat {

SimulatedTaskQueue::SimulatedTaskQueue(SimulatedTimeController* time_controller)
    : time_controller_(time_controller) {
    time_controller_->Register(this);
}

SimulatedTaskQueue::~SimulatedTaskQueue() {
    time_controller_->Unregister(this);
}

Timestamp SimulatedTaskQueue::NextRunTime() const {
    std::lock_guard<std::mutex> lock(lock_);
    if (!ready_.empty()) {
        return Timestamp::MinusInfinity();
    }
    return delayed_.empty() ? Timestamp::PlusInfinity() : delayed_.begin()->first;
}

void SimulatedTaskQueue::RunDueTasks(Timestamp now) {
    ScopedCurrent current(this);
    std::unique_lock<std::mutex> lock(lock_);
    while (true) {
        while (!delayed_.empty() && delayed_.begin()->first <= now) {
            ready_.push_back(std::move(delayed_.begin()->second));
            delayed_.erase(delayed_.begin());
        }
        if (ready_.empty()) {
            break;
        }
        std::unique_ptr<QueuedTask> task = std::move(ready_.front());
        ready_.pop_front();
        // The task may post to this queue again.
        lock.unlock();
        task->Run();
        task.reset();
        lock.lock();
    }
}

void SimulatedTaskQueue::Post(std::unique_ptr<QueuedTask> task) {
    std::lock_guard<std::mutex> lock(lock_);
    ready_.push_back(std::move(task));
}

void SimulatedTaskQueue::PostDelayed(TimeDelta delay, std::unique_ptr<QueuedTask> task) {
    const Timestamp due = time_controller_->CurrentTime() + delay;
    std::lock_guard<std::mutex> lock(lock_);
    delayed_.emplace(due, std::move(task));
}

void SimulatedTaskQueue::Delete() {
    std::deque<std::unique_ptr<QueuedTask>> ready;
    std::multimap<Timestamp, std::unique_ptr<QueuedTask>> delayed;
    {
        std::lock_guard<std::mutex> lock(lock_);
        ready.swap(ready_);
        delayed.swap(delayed_);
    }
    // Destroying a task may re-enter this queue.
    ready.clear();
    delayed.clear();
    delete this;
}

} // namespace xferstat
