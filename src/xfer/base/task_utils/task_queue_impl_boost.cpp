#include "xfer/base/task_utils/task_queue_impl_boost.hpp"
#include "common/thread_utils.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <plog/Log.h>

#include <algorithm>
#include <chrono>

namespace xferstat {

TaskQueueImplPtr TaskQueueImplBoost::Create(std::string name) {
    return TaskQueueImplPtr(new TaskQueueImplBoost(std::move(name)));
}

TaskQueueImplBoost::TaskQueueImplBoost(std::string name) 
    : name_(std::move(name)),
      work_guard_(boost::asio::make_work_guard(ioc_)),
      strand_(ioc_) {
    thread_ = boost::thread([this](){
        SetCurrentThreadName(name_.c_str());
        ScopedCurrent current(this);
        ioc_.run();
        PLOG_VERBOSE << "Task queue [" << name_ << "] stopped.";
    });
}

TaskQueueImplBoost::~TaskQueueImplBoost() = default;

void TaskQueueImplBoost::Delete() {
    assert(!IsCurrent());
    // Armed timers keep the io_context busy until they expire.
    boost::asio::post(strand_, [this](){
        deleting_ = true;
        for (const auto& timer : timers_) {
            timer->cancel();
        }
    });
    work_guard_.reset();
    thread_.join();
    delete this;
}

void TaskQueueImplBoost::Post(std::unique_ptr<QueuedTask> task) {
    boost::asio::post(strand_, [task = std::move(task)](){
        task->Run();
    });
}

void TaskQueueImplBoost::PostDelayed(TimeDelta delay, std::unique_ptr<QueuedTask> task) {
    // The deadline is taken now, the timer is armed later on the queue.
    const auto deadline = Timer::clock_type::now() + 
                          std::chrono::microseconds(std::max<int64_t>(delay.us(), 0));
    boost::asio::post(strand_, [this, deadline, task = std::move(task)]() mutable {
        StartTimer(deadline, std::move(task));
    });
}

// Private methods
void TaskQueueImplBoost::StartTimer(Timer::time_point deadline, std::unique_ptr<QueuedTask> task) {
    XFER_RUN_ON(this);
    if (deleting_) {
        PLOG_VERBOSE << "Task queue [" << name_ << "] is being deleted, dropped a delayed task.";
        return;
    }
    auto timer = std::make_shared<Timer>(ioc_, deadline);
    timers_.insert(timer);
    timer->async_wait(boost::asio::bind_executor(strand_, 
        [this, timer, task = std::move(task)](const boost::system::error_code& error) {
            timers_.erase(timer);
            if (error != boost::asio::error::operation_aborted) {
                task->Run();
            }
        }));
}
    
} // namespace xferstat
