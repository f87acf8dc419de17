#ifndef _XFER_BASE_TASK_UTILS_TASK_QUEUE_IMPL_BOOST_H_
#define _XFER_BASE_TASK_UTILS_TASK_QUEUE_IMPL_BOOST_H_

#include "base/defines.hpp"
#include "xfer/base/task_utils/task_queue_impl.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/io_context_strand.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/thread/thread.hpp>

#include <set>
#include <string>

namespace xferstat {

// Runs its tasks on a dedicated thread serving a Boost.Asio io_context.
class TaskQueueImplBoost final : public TaskQueueImpl {
public:
    static TaskQueueImplPtr Create(std::string name);

    void Delete() override;
    void Post(std::unique_ptr<QueuedTask> task) override;
    void PostDelayed(TimeDelta delay, std::unique_ptr<QueuedTask> task) override;

private:
    using Timer = boost::asio::steady_timer;

    explicit TaskQueueImplBoost(std::string name);
    ~TaskQueueImplBoost() override;

    void StartTimer(Timer::time_point deadline, std::unique_ptr<QueuedTask> task);

private:
    const std::string name_;
    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    boost::asio::io_context::strand strand_;
    boost::thread thread_;

    // Accessed on the task queue only.
    bool deleting_ = false;
    std::set<std::shared_ptr<Timer>> timers_;
};
    
} // namespace xferstat

#endif
